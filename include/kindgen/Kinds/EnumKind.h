//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Enumerations with optional per-variant payloads.
///
/// An enum picks one of three encodings when it is laid out:
///  - fieldless: only a tag of the smallest sufficient width;
///  - niche-filling: one payload variant, the other variants stored in the
///    payload's niche so the enum is no larger than the payload;
///  - tagged: a tag at offset 0 followed by the payload area.
///
//===----------------------------------------------------------------------===//
#ifndef KINDGEN_KINDS_ENUM_KIND_H
#define KINDGEN_KINDS_ENUM_KIND_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "kindgen/Kinds/Kind.h"
#include "llvm/ADT/StringRef.h"

namespace kindgen
{

enum class EnumEncoding
{
    Fieldless,
    NicheFilling,
    Tagged,
};

/// @brief Returns "fieldless", "niche-filling" or "tagged".
llvm::StringRef enumEncodingName(EnumEncoding encoding);

/// @brief One enum alternative.
struct EnumVariant final
{
    std::string           name;
    std::optional<KindId> payload;

    /// @brief Declaration index.
    std::uint64_t discriminant{0};

    /// @brief Value stored in the tag or niche slot; unset for the niche-filling payload variant.
    std::optional<std::uint64_t> rawValue;
};

/// @brief Tagged union over named variants.
///
/// Definition fields: `variants` (array of `{name, payload?}`) and optional
/// `tagSize` (1, 2 or 4).
class EnumKind final : public Kind
{
public:
    static constexpr llvm::StringLiteral kCategory{"enum"};

    EnumKind()
        : Kind(KindClass::Enum)
    {
    }

    [[nodiscard]] llvm::StringRef category() const override
    {
        return kCategory;
    }

    [[nodiscard]] const std::vector<EnumVariant>& variants() const
    {
        return variants_;
    }

    [[nodiscard]] EnumEncoding encoding() const
    {
        return encoding_;
    }

    /// @brief Offset of the discriminant slot (tag or payload niche).
    [[nodiscard]] std::uint64_t tagOffset() const
    {
        return tagOffset_;
    }

    /// @brief Width of the discriminant slot in bytes.
    [[nodiscard]] std::uint64_t tagWidth() const
    {
        return tagWidth_;
    }

    /// @brief Offset of the payload area; 0 unless tagged.
    [[nodiscard]] std::uint64_t payloadOffset() const
    {
        return payloadOffset_;
    }

    [[nodiscard]] std::vector<KindId> references() const override;

    static bool classof(const Kind* kind)
    {
        return kind->kindClass() == KindClass::Enum;
    }

protected:
    llvm::Error                 initLayout(const KindDefinition& def, KindResolver& resolver) override;
    llvm::Expected<std::string> emitDeserializer(llvm::StringRef pos, DeserializerContext& context) const override;
    llvm::Expected<std::string> emitHelperBody(DeserializerContext& context) const override;

private:
    void layoutFieldless(std::uint64_t tagWidth);
    llvm::Error layoutTagged(std::uint64_t tagWidth, const KindResolver& resolver);
    bool tryLayoutNicheFilling(const KindResolver& resolver);

    [[nodiscard]] llvm::Expected<std::string> renderVariant(const EnumVariant& variant,
                                                            DeserializerContext& context) const;

    std::vector<EnumVariant> variants_;
    EnumEncoding             encoding_{EnumEncoding::Fieldless};
    std::uint64_t            tagOffset_{0};
    std::uint64_t            tagWidth_{1};
    std::uint64_t            payloadOffset_{0};
};

}  // namespace kindgen

#endif  // KINDGEN_KINDS_ENUM_KIND_H
