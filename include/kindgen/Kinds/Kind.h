//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Abstract kind contract shared by primitive and composite type descriptors.
///
//===----------------------------------------------------------------------===//
#ifndef KINDGEN_KINDS_KIND_H
#define KINDGEN_KINDS_KIND_H

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "kindgen/Layout/Niche.h"
#include "kindgen/Support/Errors.h"
#include "kindgen/Support/SchemaLocation.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"

namespace kindgen
{
class DeserializerContext;
class DiagnosticEngine;
class Kind;
struct KindDefinition;

/// @file
/// @brief Kind base contract.

/// @brief Stable index of a kind inside its schema arena.
using KindId = std::uint32_t;

/// @brief Sentinel for kinds not yet placed in an arena.
inline constexpr KindId kInvalidKindId = std::numeric_limits<KindId>::max();

/// @brief Concrete kind class, used for LLVM-style `isa`/`dyn_cast`.
enum class KindClass
{
    Primitive,
    Struct,
    Array,
    Enum,
    Option,
    Box,
};

/// @brief Member lookup offered to kinds while they initialize.
class KindResolver
{
public:
    virtual ~KindResolver() = default;

    /// @brief Resolves a kind whose layout the caller depends on.
    /// @details The resolved kind is initialized before this returns. Reaching a
    /// kind that is still initializing is a cycle and fails with `SchemaError`.
    /// @param[in] name Member kind name.
    /// @return Arena id of an initialized kind.
    virtual llvm::Expected<KindId> requireLayout(llvm::StringRef name) = 0;

    /// @brief Resolves a kind referenced only through indirection.
    /// @param[in] name Kind name.
    /// @return Arena id; the kind may still be uninitialized.
    virtual llvm::Expected<KindId> lookup(llvm::StringRef name) = 0;

    /// @brief Returns a kind by arena id.
    [[nodiscard]] virtual const Kind& kind(KindId id) const = 0;

    /// @brief Sink for non-fatal remarks.
    virtual DiagnosticEngine& diagnostics() = 0;
};

/// @brief Type descriptor: binary layout plus deserializer generation.
///
/// A kind starts uninitialized. `initFromDef` fixes its name, size, alignment and
/// niche exactly once; afterwards the kind is immutable and may generate
/// deserializer expressions any number of times.
class Kind
{
public:
    virtual ~Kind() = default;

    Kind(const Kind&)            = delete;
    Kind& operator=(const Kind&) = delete;

    [[nodiscard]] KindClass kindClass() const
    {
        return kindClass_;
    }

    /// @brief Category tag this kind is registered under.
    [[nodiscard]] virtual llvm::StringRef category() const = 0;

    [[nodiscard]] const std::string& name() const
    {
        return name_;
    }

    [[nodiscard]] KindId id() const
    {
        return id_;
    }

    /// @brief Places the kind in an arena slot. Called by the schema builder.
    void setId(KindId id)
    {
        id_ = id;
    }

    [[nodiscard]] std::uint64_t size() const
    {
        return size_;
    }

    [[nodiscard]] std::uint64_t alignment() const
    {
        return alignment_;
    }

    [[nodiscard]] const std::optional<Niche>& niche() const
    {
        return niche_;
    }

    [[nodiscard]] bool isInitialized() const
    {
        return initialized_;
    }

    [[nodiscard]] const SchemaLocation& location() const
    {
        return location_;
    }

    /// @brief Initializes name and layout from a schema definition.
    /// @param[in] def Category-specific definition.
    /// @param[in,out] resolver Member lookup for composite kinds.
    /// @return Success or a `SchemaError`.
    llvm::Error initFromDef(const KindDefinition& def, KindResolver& resolver);

    /// @brief Generates an expression reading a value of this kind.
    /// @param[in] pos Expression for the value's byte offset in the buffer.
    /// @param[in,out] context Generation context for nested kinds and helpers.
    /// @return Expression text or a `CodeGenError`.
    llvm::Expected<std::string> generateDeserializerCall(llvm::StringRef pos, DeserializerContext& context) const;

    /// @brief Generates the statement body of a helper function `f(pos)`.
    /// @param[in,out] context Generation context.
    /// @return Body text (without braces) or a `CodeGenError`.
    llvm::Expected<std::string> generateHelperBody(DeserializerContext& context) const;

    /// @brief Kinds this kind refers to, in declaration order.
    [[nodiscard]] virtual std::vector<KindId> references() const
    {
        return {};
    }

protected:
    explicit Kind(KindClass kindClass)
        : kindClass_(kindClass)
    {
    }

    /// @brief Category-specific layout computation.
    /// @details Must call `setLayout`; may call `setNiche`.
    virtual llvm::Error initLayout(const KindDefinition& def, KindResolver& resolver) = 0;

    /// @brief Category-specific expression emission on an initialized kind.
    virtual llvm::Expected<std::string> emitDeserializer(llvm::StringRef pos, DeserializerContext& context) const = 0;

    /// @brief Helper body; defaults to returning the inline expression at `pos`.
    virtual llvm::Expected<std::string> emitHelperBody(DeserializerContext& context) const;

    void setLayout(std::uint64_t size, std::uint64_t alignment);

    void setNiche(std::optional<Niche> niche)
    {
        niche_ = niche;
    }

    /// @brief `size` field of the definition, when present.
    [[nodiscard]] const std::optional<std::uint64_t>& declaredSize() const
    {
        return declaredSize_;
    }

    /// @brief `align` field of the definition, when present.
    [[nodiscard]] const std::optional<std::uint64_t>& declaredAlignment() const
    {
        return declaredAlignment_;
    }

    /// @brief Creates a `SchemaError` attributed to this kind.
    [[nodiscard]] llvm::Error schemaError(const llvm::Twine& message) const;

    /// @brief Creates a `CodeGenError` attributed to this kind.
    [[nodiscard]] llvm::Error codeGenError(const llvm::Twine& message) const;

private:
    KindClass                    kindClass_;
    KindId                       id_{kInvalidKindId};
    std::string                  name_;
    SchemaLocation               location_;
    std::uint64_t                size_{0};
    std::uint64_t                alignment_{1};
    std::optional<Niche>         niche_;
    std::optional<std::uint64_t> declaredSize_;
    std::optional<std::uint64_t> declaredAlignment_;
    bool                         layoutSet_{false};
    bool                         initialized_{false};
};

}  // namespace kindgen

#endif  // KINDGEN_KINDS_KIND_H
