//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Output-file policy for generated modules.
///
//===----------------------------------------------------------------------===//
#ifndef KINDGEN_CODEGEN_EMIT_COMMON_H
#define KINDGEN_CODEGEN_EMIT_COMMON_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace kindgen
{

/// @brief Output-file write policy.
struct EmitWritePolicy final
{
    /// @brief Do not create or modify any files.
    bool dryRun{false};

    /// @brief Reject writes when destination file already exists.
    bool noOverwrite{false};

    /// @brief File mode applied after writing (POSIX-like bitmask).
    std::uint32_t fileMode{0444U};

    /// @brief Optional sink of generated output paths.
    std::vector<std::string>* recordedOutputs{nullptr};
};

/// @brief Converts a POSIX mode bitmask to filesystem permissions.
std::filesystem::perms permsFromMode(std::uint32_t mode);

/// @brief Path of the module generated for one schema: `<outDir>/<schema>.deserialize.js`.
/// @param[in] outDir Output directory.
/// @param[in] schemaName Schema name; characters outside `[A-Za-z0-9_.-]` become `_`.
/// @return Output file path.
std::filesystem::path moduleOutputPath(const std::filesystem::path& outDir, llvm::StringRef schemaName);

/// @brief Writes one generated file under a policy.
///
/// @details
/// When @ref EmitWritePolicy::dryRun is true, no filesystem mutation occurs.
/// In all modes, if @ref EmitWritePolicy::recordedOutputs is set, the path is
/// appended.
///
/// @param[in] path Destination file path.
/// @param[in] content File contents.
/// @param[in] policy Write policy.
/// @return Success or a descriptive I/O error.
llvm::Error writeGeneratedFile(const std::filesystem::path& path,
                               llvm::StringRef              content,
                               const EmitWritePolicy&       policy);

}  // namespace kindgen

#endif  // KINDGEN_CODEGEN_EMIT_COMMON_H
