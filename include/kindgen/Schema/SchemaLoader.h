//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// JSON schema loading.
///
//===----------------------------------------------------------------------===//
#ifndef KINDGEN_SCHEMA_SCHEMA_LOADER_H
#define KINDGEN_SCHEMA_SCHEMA_LOADER_H

#include <string>
#include <vector>

#include "kindgen/Kinds/KindDefinition.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

namespace kindgen
{

/// @brief Kind definitions read from one schema input.
struct SchemaDocument final
{
    /// @brief Declared schema name, or the source file stem.
    std::string name;

    /// @brief Definitions in input order.
    std::vector<KindDefinition> definitions;
};

/// @brief Parses schema JSON.
///
/// Accepts `{"name": ..., "kinds": [...]}` or a bare array of kind objects.
/// Every kind object needs non-empty string `name` and `kind` fields.
///
/// @param[in] text JSON text.
/// @param[in] sourceName File name used in locations and as the fallback schema name.
/// @return Parsed document or a `SchemaError`.
llvm::Expected<SchemaDocument> parseSchemaText(llvm::StringRef text, llvm::StringRef sourceName);

/// @brief Reads and parses a schema file.
llvm::Expected<SchemaDocument> loadSchemaFile(llvm::StringRef path);

/// @brief Definitions for every built-in primitive.
std::vector<KindDefinition> builtinPrimitiveDefinitions();

/// @brief Puts built-in primitive definitions in front of a document.
/// @details Names the document already defines are skipped.
void prependBuiltinPrimitives(SchemaDocument& document);

}  // namespace kindgen

#endif  // KINDGEN_SCHEMA_SCHEMA_LOADER_H
