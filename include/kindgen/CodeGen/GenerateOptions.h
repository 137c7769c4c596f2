//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Options controlling deserializer generation.
///
//===----------------------------------------------------------------------===//
#ifndef KINDGEN_CODEGEN_GENERATE_OPTIONS_H
#define KINDGEN_CODEGEN_GENERATE_OPTIONS_H

#include <cstdint>
#include <string>
#include <vector>

namespace kindgen
{

/// @brief Configuration options for deserializer generation.
struct GenerateOptions final
{
    /// @brief Kinds that get an exported entry point; empty selects unreferenced kinds.
    std::vector<std::string> rootKinds;

    /// @brief Name prefix of internal helper functions.
    std::string helperPrefix{"deserialize"};

    /// @brief Name prefix of exported entry points.
    std::string entryPrefix{"parse"};

    /// @brief Arrays with more elements are read by a looping helper.
    std::uint64_t arrayInlineLimit{16};

    /// @brief Reject literal positions that are not aligned to the read width.
    bool checkConstantAlignment{true};

    /// @brief Size of the trailing metadata block holding the root offset.
    std::uint64_t metadataSize{16};
};

}  // namespace kindgen

#endif  // KINDGEN_CODEGEN_GENERATE_OPTIONS_H
