//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Per-kind schema definition records and typed field access.
///
//===----------------------------------------------------------------------===//
#ifndef KINDGEN_KINDS_KIND_DEFINITION_H
#define KINDGEN_KINDS_KIND_DEFINITION_H

#include <cstdint>
#include <optional>
#include <string>

#include "kindgen/Support/SchemaLocation.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

namespace kindgen
{

/// @file
/// @brief Schema definition records consumed by `Kind::initFromDef`.

/// @brief One kind definition as handed over by the schema loader.
///
/// Only `name` and `category` are interpreted by the core; the remaining fields
/// are category-specific and validated by the concrete kind.
struct KindDefinition final
{
    /// @brief Unique kind name.
    std::string name;

    /// @brief Category tag selecting the kind implementation.
    std::string category;

    /// @brief Full definition object including category-specific fields.
    llvm::json::Object fields;

    /// @brief Location of the definition in its schema input.
    SchemaLocation location;
};

/// @brief Typed reader over one JSON object belonging to a definition.
///
/// Every failure is a `SchemaError` attributed to the definition's kind with the
/// `initFromDef` operation and prefixed by the reader's location.
class DefinitionFieldReader final
{
public:
    /// @brief Reads the top-level fields of a definition.
    explicit DefinitionFieldReader(const KindDefinition& def);

    /// @brief Reads a nested object of a definition.
    DefinitionFieldReader(const KindDefinition& def, const llvm::json::Object& object, SchemaLocation location);

    /// @brief Returns true when the key is present (including explicit `null`).
    [[nodiscard]] bool has(llvm::StringRef key) const;

    /// @brief Returns the raw value for a key, or null when absent.
    [[nodiscard]] const llvm::json::Value* get(llvm::StringRef key) const;

    llvm::Expected<std::string>                  requireString(llvm::StringRef key) const;
    llvm::Expected<std::optional<std::string>>   optionalString(llvm::StringRef key) const;
    llvm::Expected<std::uint64_t>                requireUnsigned(llvm::StringRef key) const;
    llvm::Expected<std::optional<std::uint64_t>> optionalUnsigned(llvm::StringRef key) const;
    llvm::Expected<const llvm::json::Array*>     requireArray(llvm::StringRef key) const;

    /// @brief Creates a `SchemaError` located at this reader.
    [[nodiscard]] llvm::Error error(const llvm::Twine& message) const;

    [[nodiscard]] const SchemaLocation& location() const
    {
        return location_;
    }

    [[nodiscard]] const KindDefinition& definition() const
    {
        return def_;
    }

private:
    const KindDefinition&     def_;
    const llvm::json::Object& object_;
    SchemaLocation            location_;
};

}  // namespace kindgen

#endif  // KINDGEN_KINDS_KIND_DEFINITION_H
