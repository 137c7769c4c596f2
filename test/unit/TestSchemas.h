//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Schema fixtures shared by the unit tests.
///
//===----------------------------------------------------------------------===//
#ifndef KINDGEN_TEST_UNIT_TEST_SCHEMAS_H
#define KINDGEN_TEST_UNIT_TEST_SCHEMAS_H

#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

#include "kindgen/Schema/Schema.h"
#include "kindgen/Schema/SchemaBuilder.h"
#include "kindgen/Schema/SchemaLoader.h"
#include "kindgen/Support/Diagnostics.h"
#include "kindgen/Support/Errors.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

namespace kindgen::test
{

/// @brief Parses schema JSON, prepends built-in primitives and builds it.
/// @return Schema, or nothing after printing the failure to stderr.
inline std::optional<Schema> buildTestSchema(llvm::StringRef           json,
                                             DiagnosticEngine&         diagnostics,
                                             const SchemaBuildOptions& options = {})
{
    auto document = parseSchemaText(json, "test.json");
    if (!document)
    {
        std::cerr << "fixture did not parse: " << llvm::toString(document.takeError()) << "\n";
        return std::nullopt;
    }
    prependBuiltinPrimitives(*document);
    auto schema = buildSchema(document->name, std::move(document->definitions), diagnostics, options);
    if (!schema)
    {
        std::cerr << "fixture did not build: " << llvm::toString(schema.takeError()) << "\n";
        return std::nullopt;
    }
    return std::move(*schema);
}

/// @brief Builds a schema that is expected to fail with a `SchemaError`.
/// @return Logged error text, or nothing when the build succeeded or failed otherwise.
inline std::optional<std::string> schemaBuildError(llvm::StringRef           json,
                                                   const SchemaBuildOptions& options = {})
{
    auto document = parseSchemaText(json, "test.json");
    if (!document)
    {
        llvm::consumeError(document.takeError());
        return std::nullopt;
    }
    prependBuiltinPrimitives(*document);
    DiagnosticEngine diagnostics;
    auto             schema = buildSchema(document->name, std::move(document->definitions), diagnostics, options);
    if (schema)
    {
        return std::nullopt;
    }
    std::optional<std::string> text;
    llvm::handleAllErrors(
        schema.takeError(),
        [&](const SchemaError& error) {
            std::string              out;
            llvm::raw_string_ostream os(out);
            error.log(os);
            os.flush();
            text = out;
        },
        [](const llvm::ErrorInfoBase&) {});
    return text;
}

/// @brief True when `text` contains `needle`.
inline bool contains(const std::string& text, llvm::StringRef needle)
{
    return text.find(needle.str()) != std::string::npos;
}

/// @brief Number of non-overlapping occurrences of `needle` in `text`.
inline std::size_t countOccurrences(const std::string& text, llvm::StringRef needle)
{
    std::size_t count = 0;
    for (std::size_t at = text.find(needle.str()); at != std::string::npos;
         at             = text.find(needle.str(), at + needle.size()))
    {
        ++count;
    }
    return count;
}

}  // namespace kindgen::test

#endif  // KINDGEN_TEST_UNIT_TEST_SCHEMAS_H
