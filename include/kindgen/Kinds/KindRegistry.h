//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Registry mapping kind category tags to kind factories.
///
//===----------------------------------------------------------------------===//
#ifndef KINDGEN_KINDS_KIND_REGISTRY_H
#define KINDGEN_KINDS_KIND_REGISTRY_H

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

#include "kindgen/Kinds/Kind.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

namespace kindgen
{

/// @brief Creates one uninitialized kind.
using KindFactory = std::function<std::unique_ptr<Kind>()>;

/// @brief Category tag to factory map.
///
/// Each tag maps to exactly one factory; registering a tag twice is rejected.
class KindRegistry final
{
public:
    /// @brief Registers the factory for a category tag.
    /// @param[in] categoryTag Category tag as written in schema definitions.
    /// @param[in] factory Factory producing uninitialized kinds.
    /// @return Success, or a `SchemaError` when the tag is taken or the input is empty.
    llvm::Error registerKindClass(llvm::StringRef categoryTag, KindFactory factory);

    /// @brief Registers a default-constructible kind class.
    template <typename KindT>
    llvm::Error registerKindClass(llvm::StringRef categoryTag)
    {
        static_assert(std::is_base_of_v<Kind, KindT>, "registered kind classes must derive from kindgen::Kind");
        static_assert(std::is_default_constructible_v<KindT>, "registered kind classes must be default constructible");
        return registerKindClass(categoryTag, [] { return std::unique_ptr<Kind>(std::make_unique<KindT>()); });
    }

    /// @brief Instantiates an uninitialized kind for a category tag.
    /// @param[in] categoryTag Category tag.
    /// @param[in] kindName Name of the definition being instantiated, for error reporting.
    /// @return New kind, or a `SchemaError` for unknown tags.
    llvm::Expected<std::unique_ptr<Kind>> create(llvm::StringRef categoryTag, llvm::StringRef kindName) const;

    [[nodiscard]] bool contains(llvm::StringRef categoryTag) const;

    /// @brief Registered tags in lexical order.
    [[nodiscard]] std::vector<std::string> categories() const;

    /// @brief Process-wide registry holding the built-in kinds.
    /// @details Populated once on first use and never mutated afterwards.
    static const KindRegistry& builtin();

    /// @brief Registers the built-in categories into a registry.
    /// @param[in,out] registry Registry to populate.
    /// @return Success, or the first registration conflict.
    static llvm::Error registerBuiltinKinds(KindRegistry& registry);

private:
    std::map<std::string, KindFactory> factories_;
};

}  // namespace kindgen

#endif  // KINDGEN_KINDS_KIND_REGISTRY_H
