//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements enum encoding selection and switch-based generation.
///
//===----------------------------------------------------------------------===//

#include "kindgen/Kinds/EnumKind.h"

#include <algorithm>
#include <set>

#include "kindgen/CodeGen/BufferExpr.h"
#include "kindgen/CodeGen/DeserializerContext.h"
#include "kindgen/CodeGen/JsNaming.h"
#include "kindgen/Kinds/KindDefinition.h"
#include "llvm/Support/MathExtras.h"

namespace kindgen
{
namespace
{

std::uint64_t smallestTagWidth(const std::uint64_t variantCount)
{
    for (const std::uint64_t width : {1U, 2U, 4U})
    {
        if (variantCount - 1 <= maxRawValue(width))
        {
            return width;
        }
    }
    return 8;
}

/// Tag values past the last discriminant, or nothing when every value is used.
std::optional<Niche> unusedTagValues(const std::uint64_t tagWidth, const std::uint64_t variantCount)
{
    const std::uint64_t maxRaw = maxRawValue(tagWidth);
    if (variantCount > maxRaw)
    {
        return std::nullopt;
    }
    return Niche(0, tagWidth, variantCount, maxRaw);
}

}  // namespace

llvm::StringRef enumEncodingName(const EnumEncoding encoding)
{
    switch (encoding)
    {
    case EnumEncoding::Fieldless:
        return "fieldless";
    case EnumEncoding::NicheFilling:
        return "niche-filling";
    case EnumEncoding::Tagged:
        return "tagged";
    }
    return "unknown";
}

std::vector<KindId> EnumKind::references() const
{
    std::vector<KindId> out;
    for (const auto& variant : variants_)
    {
        if (variant.payload)
        {
            out.push_back(*variant.payload);
        }
    }
    return out;
}

llvm::Error EnumKind::initLayout(const KindDefinition& def, KindResolver& resolver)
{
    const DefinitionFieldReader reader(def);
    auto                        entries = reader.requireArray("variants");
    if (!entries)
    {
        return entries.takeError();
    }
    if ((*entries)->empty())
    {
        return reader.error("enum needs at least one variant");
    }
    auto tagSize = reader.optionalUnsigned("tagSize");
    if (!tagSize)
    {
        return tagSize.takeError();
    }
    if (*tagSize && **tagSize != 1 && **tagSize != 2 && **tagSize != 4)
    {
        return reader.error("tagSize must be 1, 2 or 4, got " + llvm::Twine(**tagSize));
    }

    std::set<std::string> seen;
    bool                  anyPayload = false;
    for (std::size_t i = 0; i < (*entries)->size(); ++i)
    {
        const SchemaLocation where  = def.location.child("variants[" + std::to_string(i) + "]");
        const auto*          object = (**entries)[i].getAsObject();
        if (!object)
        {
            return reader.error("variants[" + llvm::Twine(i) + "] must be an object");
        }
        const DefinitionFieldReader variantReader(def, *object, where);

        auto variantName = variantReader.requireString("name");
        if (!variantName)
        {
            return variantName.takeError();
        }
        if (!seen.insert(*variantName).second)
        {
            return variantReader.error("duplicate variant '" + *variantName + "'");
        }
        auto payloadName = variantReader.optionalString("payload");
        if (!payloadName)
        {
            return payloadName.takeError();
        }

        EnumVariant variant;
        variant.name         = std::move(*variantName);
        variant.discriminant = i;
        if (*payloadName)
        {
            auto payload = resolver.requireLayout(**payloadName);
            if (!payload)
            {
                return payload.takeError();
            }
            variant.payload = *payload;
            anyPayload      = true;
        }
        variants_.push_back(std::move(variant));
    }

    const std::uint64_t minimalWidth = smallestTagWidth(variants_.size());
    if (minimalWidth > 4)
    {
        return reader.error("too many variants (" + llvm::Twine(variants_.size()) + ") for a 32-bit tag");
    }
    if (*tagSize && variants_.size() - 1 > maxRawValue(**tagSize))
    {
        return reader.error(llvm::Twine(variants_.size()) + " variants do not fit a tag of " +
                            llvm::Twine(**tagSize) + " byte(s)");
    }

    const std::uint64_t tagWidth = tagSize->value_or(minimalWidth);
    if (!anyPayload)
    {
        layoutFieldless(tagWidth);
    }
    else if (*tagSize || !tryLayoutNicheFilling(resolver))
    {
        return layoutTagged(tagWidth, resolver);
    }
    return llvm::Error::success();
}

void EnumKind::layoutFieldless(const std::uint64_t tagWidth)
{
    encoding_      = EnumEncoding::Fieldless;
    tagOffset_     = 0;
    tagWidth_      = tagWidth;
    payloadOffset_ = 0;
    for (auto& variant : variants_)
    {
        variant.rawValue = variant.discriminant;
    }
    setLayout(tagWidth, tagWidth);
    setNiche(unusedTagValues(tagWidth, variants_.size()));
}

bool EnumKind::tryLayoutNicheFilling(const KindResolver& resolver)
{
    if (variants_.size() < 2)
    {
        return false;
    }
    const auto withPayload = std::count_if(variants_.begin(), variants_.end(), [](const EnumVariant& variant) {
        return variant.payload.has_value();
    });
    if (withPayload != 1)
    {
        return false;
    }
    const auto dataful = std::find_if(variants_.begin(), variants_.end(), [](const EnumVariant& variant) {
        return variant.payload.has_value();
    });
    const Kind& payload = resolver.kind(*dataful->payload);
    const auto& niche   = payload.niche();
    const auto  needed  = static_cast<std::uint64_t>(variants_.size() - 1);
    if (!niche || niche->available() < needed)
    {
        return false;
    }

    encoding_      = EnumEncoding::NicheFilling;
    tagOffset_     = niche->offset();
    tagWidth_      = niche->size();
    payloadOffset_ = 0;
    std::uint64_t next = niche->min();
    for (auto& variant : variants_)
    {
        if (!variant.payload)
        {
            variant.rawValue = next++;
        }
    }
    setLayout(payload.size(), payload.alignment());
    setNiche(niche->consume(needed));
    return true;
}

llvm::Error EnumKind::layoutTagged(const std::uint64_t tagWidth, const KindResolver& resolver)
{
    std::uint64_t payloadAlign = 1;
    std::uint64_t payloadSize  = 0;
    for (auto& variant : variants_)
    {
        variant.rawValue = variant.discriminant;
        if (variant.payload)
        {
            const Kind& payload = resolver.kind(*variant.payload);
            payloadAlign        = std::max(payloadAlign, payload.alignment());
            payloadSize         = std::max(payloadSize, payload.size());
        }
    }

    encoding_      = EnumEncoding::Tagged;
    tagOffset_     = 0;
    tagWidth_      = tagWidth;
    payloadOffset_ = llvm::alignTo(tagWidth, payloadAlign);

    const std::uint64_t alignment = std::max(tagWidth, payloadAlign);
    const auto          end       = checkedLayoutAdd(payloadOffset_, payloadSize);
    const auto          size      = end ? checkedAlignTo(*end, alignment) : std::nullopt;
    if (!size)
    {
        return schemaError("tagged payload of " + llvm::Twine(payloadSize) + " byte(s) overflows the enum layout");
    }
    setLayout(*size, alignment);
    setNiche(unusedTagValues(tagWidth, variants_.size()));
    return llvm::Error::success();
}

llvm::Expected<std::string> EnumKind::emitDeserializer(llvm::StringRef pos, DeserializerContext& context) const
{
    return context.callHelper(id(), pos);
}

llvm::Expected<std::string> EnumKind::renderVariant(const EnumVariant& variant, DeserializerContext& context) const
{
    if (encoding_ == EnumEncoding::Fieldless)
    {
        return renderJsString(variant.name);
    }
    if (!variant.payload)
    {
        return "{type: " + renderJsString(variant.name) + "}";
    }
    auto value = context.generate(*variant.payload, addOffset("pos", payloadOffset_));
    if (!value)
    {
        return value.takeError();
    }
    return "{type: " + renderJsString(variant.name) + ", value: " + *value + "}";
}

llvm::Expected<std::string> EnumKind::emitHelperBody(DeserializerContext& context) const
{
    const auto view = unsignedViewForWidth(tagWidth_);
    if (!view)
    {
        return codeGenError("no buffer view reads a " + llvm::Twine(tagWidth_) + "-byte discriminant");
    }

    std::string body = "const tag = " + renderViewRead(*view, addOffset("pos", tagOffset_)) + ";\n";
    body += "switch (tag) {\n";
    const EnumVariant* dataful = nullptr;
    for (const auto& variant : variants_)
    {
        if (!variant.rawValue)
        {
            dataful = &variant;
            continue;
        }
        auto value = renderVariant(variant, context);
        if (!value)
        {
            return value.takeError();
        }
        body += "  case " + renderRawLiteral(*variant.rawValue, tagWidth_) + ":\n";
        body += "    return " + *value + ";\n";
    }
    body += "  default:\n";
    if (dataful)
    {
        auto value = renderVariant(*dataful, context);
        if (!value)
        {
            return value.takeError();
        }
        body += "    return " + *value + ";\n";
    }
    else
    {
        body += "    throw new Error(" + renderJsString("invalid discriminant for enum " + name() + ": ") + " + tag);\n";
    }
    body += "}";
    return body;
}

}  // namespace kindgen
