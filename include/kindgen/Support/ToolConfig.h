//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Tool configuration loaded from JSON.
///
/// Layout of a configuration file (every key optional):
/// @code
/// {
///   "build":    {"maxNestingDepth": 256},
///   "generate": {"rootKinds": [], "helperPrefix": "deserialize", "entryPrefix": "parse",
///                "arrayInlineLimit": 16, "checkConstantAlignment": true, "metadataSize": 16},
///   "output":   {"dryRun": false, "noOverwrite": false, "fileMode": "0444"},
///   "withBuiltinPrimitives": false
/// }
/// @endcode
///
//===----------------------------------------------------------------------===//
#ifndef KINDGEN_SUPPORT_TOOL_CONFIG_H
#define KINDGEN_SUPPORT_TOOL_CONFIG_H

#include "kindgen/CodeGen/EmitCommon.h"
#include "kindgen/CodeGen/GenerateOptions.h"
#include "kindgen/Schema/SchemaBuilder.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

namespace kindgen
{

/// @brief Settings shared by all `kindc` commands.
struct ToolConfig final
{
    SchemaBuildOptions build;
    GenerateOptions    generate;
    EmitWritePolicy    output;

    /// @brief Prepend the built-in primitive definitions to every schema.
    bool withBuiltinPrimitives{false};
};

/// @brief Parses configuration JSON over the defaults.
/// @param[in] text JSON text.
/// @param[in] sourceName Name used in error messages.
/// @return Parsed configuration, or an error naming the offending key.
llvm::Expected<ToolConfig> parseToolConfig(llvm::StringRef text, llvm::StringRef sourceName);

/// @brief Reads and parses a configuration file.
llvm::Expected<ToolConfig> loadToolConfig(llvm::StringRef path);

}  // namespace kindgen

#endif  // KINDGEN_SUPPORT_TOOL_CONFIG_H
