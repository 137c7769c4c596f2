//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Scalar kinds backed by a closed table of primitive types.
///
//===----------------------------------------------------------------------===//
#ifndef KINDGEN_KINDS_PRIMITIVE_KIND_H
#define KINDGEN_KINDS_PRIMITIVE_KIND_H

#include <cstdint>
#include <optional>
#include <string>

#include "kindgen/CodeGen/BufferExpr.h"
#include "kindgen/Kinds/Kind.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"

namespace kindgen
{

/// @brief Primitive types with a built-in deserializer.
enum class PrimitiveType
{
    U8,
    U16,
    U32,
    U64,
    I8,
    I16,
    I32,
    I64,
    F32,
    F64,
    Bool,
    NonZeroU8,
    NonZeroU16,
    NonZeroU32,
    NonZeroU64,
};

/// @brief Which raw values a primitive never produces.
enum class PrimitiveNicheClass
{
    /// @brief Every bit pattern is valid.
    None,

    /// @brief Only 0 and 1 are valid.
    Boolean,

    /// @brief Zero is invalid.
    NonZero,
};

/// @brief Static description of one primitive type.
struct PrimitiveTraits final
{
    PrimitiveType       type;
    llvm::StringLiteral name;
    std::uint32_t       width;
    BufferView          view;
    PrimitiveNicheClass nicheClass;
};

/// @brief All primitive types with a built-in deserializer.
llvm::ArrayRef<PrimitiveTraits> builtinPrimitives();

/// @brief Looks up a primitive by exact name.
/// @return Table entry or null.
const PrimitiveTraits* findPrimitiveTraits(llvm::StringRef name);

/// @brief Niche implied by a primitive's niche class.
std::optional<Niche> primitiveNiche(const PrimitiveTraits& traits);

/// @brief Renders the read expression of one primitive type.
/// @param[in] type Primitive type.
/// @param[in] pos Byte position expression.
/// @return Expression text.
std::string renderPrimitiveRead(PrimitiveType type, llvm::StringRef pos);

/// @brief Scalar kind: integers, floats, booleans.
///
/// Definition fields: optional `size` and `align`; optional `niche`, either an
/// object `{offset, size, min, max}` or `null`. Names outside the built-in table
/// need an explicit `size` and cannot generate deserializers.
class PrimitiveKind final : public Kind
{
public:
    static constexpr llvm::StringLiteral kCategory{"primitive"};

    PrimitiveKind()
        : Kind(KindClass::Primitive)
    {
    }

    [[nodiscard]] llvm::StringRef category() const override
    {
        return kCategory;
    }

    /// @brief Table entry, or null for primitives without a built-in deserializer.
    [[nodiscard]] const PrimitiveTraits* traits() const
    {
        return traits_;
    }

    static bool classof(const Kind* kind)
    {
        return kind->kindClass() == KindClass::Primitive;
    }

protected:
    llvm::Error                 initLayout(const KindDefinition& def, KindResolver& resolver) override;
    llvm::Expected<std::string> emitDeserializer(llvm::StringRef pos, DeserializerContext& context) const override;

private:
    const PrimitiveTraits* traits_{nullptr};
};

}  // namespace kindgen

#endif  // KINDGEN_KINDS_PRIMITIVE_KIND_H
