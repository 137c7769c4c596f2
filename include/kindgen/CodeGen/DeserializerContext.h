//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Per-run generation state shared by all kinds: dispatch, helper functions, and names.
///
//===----------------------------------------------------------------------===//
#ifndef KINDGEN_CODEGEN_DESERIALIZER_CONTEXT_H
#define KINDGEN_CODEGEN_DESERIALIZER_CONTEXT_H

#include <cstddef>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "kindgen/CodeGen/GenerateOptions.h"
#include "kindgen/Kinds/Kind.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

namespace kindgen
{
class Schema;

/// @brief One helper function registered during generation.
struct HelperDeclaration final
{
    /// @brief Kind the helper reads.
    KindId kind{kInvalidKindId};

    /// @brief Function name.
    std::string name;

    /// @brief Statement body; the parameter is named `pos`.
    std::string body;
};

/// @brief Mutable state of one generation run over a built schema.
class DeserializerContext final
{
public:
    DeserializerContext(const Schema& schema, const GenerateOptions& options);

    [[nodiscard]] const Schema& schema() const
    {
        return schema_;
    }

    [[nodiscard]] const GenerateOptions& options() const
    {
        return options_;
    }

    /// @brief Generates the inline expression of a kind at a position.
    llvm::Expected<std::string> generate(KindId id, llvm::StringRef pos);

    /// @brief Returns a call of the kind's helper function, registering it on first use.
    /// @details The helper name is reserved before its body is generated, so a
    /// kind reachable from its own body (through a box) calls itself recursively.
    llvm::Expected<std::string> callHelper(KindId id, llvm::StringRef pos);

    /// @brief Reserves a fresh identifier derived from `base`.
    std::string reserveName(llvm::StringRef base);

    /// @brief Reserves a fresh temporary name such as `i0`.
    std::string allocateTemp(llvm::StringRef stem);

    /// @brief Helpers in registration order.
    [[nodiscard]] const std::vector<HelperDeclaration>& helpers() const
    {
        return helpers_;
    }

    /// @brief Renders every helper as a function declaration.
    [[nodiscard]] std::string renderHelpers() const;

private:
    const Schema&                           schema_;
    const GenerateOptions&                  options_;
    std::vector<HelperDeclaration>          helpers_;
    std::unordered_map<KindId, std::size_t> helperIndex_;
    std::unordered_set<std::string>         usedNames_;
    std::unordered_map<std::string, unsigned> tempCounters_;
};

}  // namespace kindgen

#endif  // KINDGEN_CODEGEN_DESERIALIZER_CONTEXT_H
