//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements generated-file output.
///
//===----------------------------------------------------------------------===//

#include "kindgen/CodeGen/EmitCommon.h"

#include "llvm/Support/FileSystem.h"
#include "llvm/Support/raw_ostream.h"

#include <array>
#include <system_error>
#include <utility>

namespace kindgen
{

std::filesystem::perms permsFromMode(const std::uint32_t mode)
{
    using Perm = std::filesystem::perms;
    static constexpr std::array<std::pair<std::uint32_t, Perm>, 9> kBits{{
        {0400U, Perm::owner_read},
        {0200U, Perm::owner_write},
        {0100U, Perm::owner_exec},
        {0040U, Perm::group_read},
        {0020U, Perm::group_write},
        {0010U, Perm::group_exec},
        {0004U, Perm::others_read},
        {0002U, Perm::others_write},
        {0001U, Perm::others_exec},
    }};

    Perm out = Perm::none;
    for (const auto& [bit, perm] : kBits)
    {
        if ((mode & bit) != 0U)
        {
            out |= perm;
        }
    }
    return out;
}

std::filesystem::path moduleOutputPath(const std::filesystem::path& outDir, llvm::StringRef schemaName)
{
    std::string stem;
    for (const char c : schemaName)
    {
        const bool keep = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' ||
                          c == '-' || c == '.';
        stem.push_back(keep ? c : '_');
    }
    if (stem.empty())
    {
        stem = "schema";
    }
    return outDir / (stem + ".deserialize.js");
}

llvm::Error writeGeneratedFile(const std::filesystem::path& path,
                               llvm::StringRef              content,
                               const EmitWritePolicy&       policy)
{
    if (policy.recordedOutputs != nullptr)
    {
        policy.recordedOutputs->push_back(path.string());
    }
    if (policy.dryRun)
    {
        return llvm::Error::success();
    }

    std::error_code ec;

    const auto parent = path.parent_path();
    if (!parent.empty())
    {
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            return llvm::createStringError(ec, "failed to create output directory %s", parent.string().c_str());
        }
    }

    const bool exists = std::filesystem::exists(path, ec);
    if (ec)
    {
        return llvm::createStringError(ec, "failed to stat output path %s", path.string().c_str());
    }
    if (exists)
    {
        if (policy.noOverwrite)
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "refusing to overwrite existing output file: %s",
                                           path.string().c_str());
        }
        // Generated files are read-only by default; replace instead of truncating.
        const bool removed = std::filesystem::remove(path, ec);
        if (ec || !removed)
        {
            return llvm::createStringError(ec ? ec : llvm::inconvertibleErrorCode(),
                                           "failed to remove existing output file %s",
                                           path.string().c_str());
        }
    }

    {
        llvm::raw_fd_ostream os(path.string(), ec, llvm::sys::fs::OF_Text);
        if (ec)
        {
            return llvm::createStringError(ec, "failed to open %s", path.string().c_str());
        }
        os << content;
        os.close();
        if (os.has_error())
        {
            const std::error_code writeError = os.error();
            os.clear_error();
            return llvm::createStringError(writeError, "failed to write %s", path.string().c_str());
        }
    }

    std::filesystem::permissions(path, permsFromMode(policy.fileMode), std::filesystem::perm_options::replace, ec);
    if (ec)
    {
        return llvm::createStringError(ec, "failed to set mode on %s", path.string().c_str());
    }
    return llvm::Error::success();
}

}  // namespace kindgen
