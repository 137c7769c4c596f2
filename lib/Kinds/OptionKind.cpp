//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "kindgen/Kinds/OptionKind.h"

#include <algorithm>

#include "kindgen/CodeGen/BufferExpr.h"
#include "kindgen/CodeGen/DeserializerContext.h"
#include "kindgen/Kinds/KindDefinition.h"
#include "llvm/Support/MathExtras.h"

namespace kindgen
{

llvm::Error OptionKind::initLayout(const KindDefinition& def, KindResolver& resolver)
{
    const DefinitionFieldReader reader(def);
    auto                        innerName = reader.requireString("inner");
    if (!innerName)
    {
        return innerName.takeError();
    }
    auto inner = resolver.requireLayout(*innerName);
    if (!inner)
    {
        return inner.takeError();
    }
    inner_ = *inner;

    const Kind& innerKind = resolver.kind(inner_);
    if (const auto& niche = innerKind.niche())
    {
        absent_        = niche;
        payloadOffset_ = 0;
        setLayout(innerKind.size(), innerKind.alignment());
        setNiche(niche->consume(1));
        return llvm::Error::success();
    }

    // Presence byte, then the payload.
    absent_.reset();
    payloadOffset_ = llvm::alignTo(1, innerKind.alignment());
    const std::uint64_t alignment = std::max<std::uint64_t>(1, innerKind.alignment());
    const auto          end       = checkedLayoutAdd(payloadOffset_, innerKind.size());
    const auto          size      = end ? checkedAlignTo(*end, alignment) : std::nullopt;
    if (!size)
    {
        return schemaError("presence byte and '" + innerKind.name() + "' payload overflow the option layout");
    }
    setLayout(*size, alignment);
    setNiche(Niche(0, 1, 2, 255));
    return llvm::Error::success();
}

llvm::Expected<std::string> OptionKind::emitDeserializer(llvm::StringRef pos, DeserializerContext& context) const
{
    auto value = context.generate(inner_, addOffset(pos, payloadOffset_));
    if (!value)
    {
        return value.takeError();
    }

    if (absent_)
    {
        const auto view = unsignedViewForWidth(absent_->size());
        if (!view)
        {
            return codeGenError("no buffer view reads a " + llvm::Twine(absent_->size()) + "-byte niche");
        }
        return "(" + renderViewRead(*view, addOffset(pos, absent_->offset())) +
               " === " + renderRawLiteral(absent_->min(), absent_->size()) + " ? null : " + *value + ")";
    }
    return "(" + renderViewRead(BufferView::Uint8, pos) + " === 0 ? null : " + *value + ")";
}

}  // namespace kindgen
