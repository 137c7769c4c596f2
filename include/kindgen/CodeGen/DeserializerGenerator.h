//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Deserializer generation entry points.
///
//===----------------------------------------------------------------------===//
#ifndef KINDGEN_CODEGEN_DESERIALIZER_GENERATOR_H
#define KINDGEN_CODEGEN_DESERIALIZER_GENERATOR_H

#include <string>

#include "kindgen/CodeGen/GenerateOptions.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

namespace kindgen
{
class Schema;

/// @brief Read expression for one kind plus the helpers it calls.
struct GeneratedExpression final
{
    /// @brief Expression text evaluating to the decoded value.
    std::string expression;

    /// @brief Helper function declarations referenced by `expression`, possibly empty.
    std::string helpers;
};

/// @brief Generates the read expression of a named kind at `pos`.
/// @param[in] schema Built schema.
/// @param[in] kindName Kind to read.
/// @param[in] pos Position expression, e.g. `0` or `pos + 8`.
/// @param[in] options Generation options.
/// @return Expression and helpers, or a `CodeGenError`.
llvm::Expected<GeneratedExpression> generateDeserializerExpression(const Schema&          schema,
                                                                   llvm::StringRef        kindName,
                                                                   llvm::StringRef        pos,
                                                                   const GenerateOptions& options = {});

/// @brief Generates a complete JavaScript module with one entry per root kind.
/// @param[in] schema Built schema.
/// @param[in] options Generation options; `rootKinds` selects entries.
/// @return Module source text, or a `CodeGenError`.
llvm::Expected<std::string> generateDeserializerModule(const Schema& schema, const GenerateOptions& options = {});

}  // namespace kindgen

#endif  // KINDGEN_CODEGEN_DESERIALIZER_GENERATOR_H
