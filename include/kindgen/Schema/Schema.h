//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Arena owning every kind of one schema.
///
//===----------------------------------------------------------------------===//
#ifndef KINDGEN_SCHEMA_SCHEMA_H
#define KINDGEN_SCHEMA_SCHEMA_H

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "kindgen/Kinds/Kind.h"
#include "llvm/ADT/StringRef.h"

namespace kindgen
{

/// @brief All kinds of one schema, addressed by `KindId`.
///
/// Composite kinds hold member ids rather than pointers, so a kind shared by
/// several composites has a single owner. A built schema is read-only.
class Schema final
{
public:
    Schema() = default;
    explicit Schema(std::string name)
        : name_(std::move(name))
    {
    }

    Schema(Schema&&) noexcept            = default;
    Schema& operator=(Schema&&) noexcept = default;

    [[nodiscard]] const std::string& name() const
    {
        return name_;
    }

    [[nodiscard]] std::size_t size() const
    {
        return kinds_.size();
    }

    [[nodiscard]] const Kind& kind(KindId id) const
    {
        return *kinds_.at(id);
    }

    /// @brief Finds a kind by name.
    [[nodiscard]] std::optional<KindId> find(llvm::StringRef name) const;

    /// @brief Finds a kind by name, or null.
    [[nodiscard]] const Kind* lookup(llvm::StringRef name) const;

    /// @brief Ids of kinds no other kind contains, in schema order.
    /// @details References through boxes are not containment.
    [[nodiscard]] std::vector<KindId> unreferencedKinds() const;

    /// @brief Appends a kind. Used while building.
    /// @return Arena id assigned to the kind.
    KindId add(std::string name, std::unique_ptr<Kind> kind);

    /// @brief Mutable access while building.
    Kind& mutableKind(KindId id)
    {
        return *kinds_.at(id);
    }

private:
    std::string                              name_;
    std::vector<std::unique_ptr<Kind>>       kinds_;
    std::unordered_map<std::string, KindId>  index_;
};

}  // namespace kindgen

#endif  // KINDGEN_SCHEMA_SCHEMA_H
