//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements primitive kinds and the closed primitive deserializer table.
///
//===----------------------------------------------------------------------===//

#include "kindgen/Kinds/PrimitiveKind.h"

#include <algorithm>
#include <array>

#include "kindgen/CodeGen/DeserializerContext.h"
#include "kindgen/Kinds/KindDefinition.h"
#include "kindgen/Support/Diagnostics.h"
#include "llvm/Support/MathExtras.h"

namespace kindgen
{
namespace
{

constexpr std::array<PrimitiveTraits, 15> kPrimitiveTable = {{
    {PrimitiveType::U8, "U8", 1, BufferView::Uint8, PrimitiveNicheClass::None},
    {PrimitiveType::U16, "U16", 2, BufferView::Uint16, PrimitiveNicheClass::None},
    {PrimitiveType::U32, "U32", 4, BufferView::Uint32, PrimitiveNicheClass::None},
    {PrimitiveType::U64, "U64", 8, BufferView::BigUint64, PrimitiveNicheClass::None},
    {PrimitiveType::I8, "I8", 1, BufferView::Int8, PrimitiveNicheClass::None},
    {PrimitiveType::I16, "I16", 2, BufferView::Int16, PrimitiveNicheClass::None},
    {PrimitiveType::I32, "I32", 4, BufferView::Int32, PrimitiveNicheClass::None},
    {PrimitiveType::I64, "I64", 8, BufferView::BigInt64, PrimitiveNicheClass::None},
    {PrimitiveType::F32, "F32", 4, BufferView::Float32, PrimitiveNicheClass::None},
    {PrimitiveType::F64, "F64", 8, BufferView::Float64, PrimitiveNicheClass::None},
    {PrimitiveType::Bool, "Bool", 1, BufferView::Uint8, PrimitiveNicheClass::Boolean},
    {PrimitiveType::NonZeroU8, "NonZeroU8", 1, BufferView::Uint8, PrimitiveNicheClass::NonZero},
    {PrimitiveType::NonZeroU16, "NonZeroU16", 2, BufferView::Uint16, PrimitiveNicheClass::NonZero},
    {PrimitiveType::NonZeroU32, "NonZeroU32", 4, BufferView::Uint32, PrimitiveNicheClass::NonZero},
    {PrimitiveType::NonZeroU64, "NonZeroU64", 8, BufferView::BigUint64, PrimitiveNicheClass::NonZero},
}};

// Names that conventionally carry a niche; used only to warn about undeclared ones.
bool looksNicheCarrying(llvm::StringRef name)
{
    return name == "Bool" || name.take_front(7) == "NonZero";
}

llvm::Expected<std::optional<Niche>> parseDeclaredNiche(const DefinitionFieldReader& reader)
{
    const auto* value = reader.get("niche");
    if (value->getAsNull())
    {
        return std::optional<Niche>{};
    }
    const auto* object = value->getAsObject();
    if (!object)
    {
        return reader.error("field 'niche' must be an object or null");
    }
    const DefinitionFieldReader nicheReader(reader.definition(), *object, reader.location().child("niche"));
    auto                        offset = nicheReader.requireUnsigned("offset");
    if (!offset)
    {
        return offset.takeError();
    }
    auto size = nicheReader.requireUnsigned("size");
    if (!size)
    {
        return size.takeError();
    }
    auto min = nicheReader.requireUnsigned("min");
    if (!min)
    {
        return min.takeError();
    }
    auto max = nicheReader.requireUnsigned("max");
    if (!max)
    {
        return max.takeError();
    }
    return std::optional<Niche>(Niche(*offset, *size, *min, *max));
}

}  // namespace

llvm::ArrayRef<PrimitiveTraits> builtinPrimitives()
{
    return kPrimitiveTable;
}

const PrimitiveTraits* findPrimitiveTraits(llvm::StringRef name)
{
    for (const auto& traits : kPrimitiveTable)
    {
        if (traits.name == name)
        {
            return &traits;
        }
    }
    return nullptr;
}

std::optional<Niche> primitiveNiche(const PrimitiveTraits& traits)
{
    switch (traits.nicheClass)
    {
    case PrimitiveNicheClass::None:
        return std::nullopt;
    case PrimitiveNicheClass::Boolean:
        return Niche(0, 1, 2, 255);
    case PrimitiveNicheClass::NonZero:
        return Niche(0, traits.width, 0, 0);
    }
    return std::nullopt;
}

std::string renderPrimitiveRead(const PrimitiveType type, llvm::StringRef pos)
{
    switch (type)
    {
    case PrimitiveType::U8:
    case PrimitiveType::NonZeroU8:
        return renderViewRead(BufferView::Uint8, pos);
    case PrimitiveType::U16:
    case PrimitiveType::NonZeroU16:
        return renderViewRead(BufferView::Uint16, pos);
    case PrimitiveType::U32:
    case PrimitiveType::NonZeroU32:
        return renderViewRead(BufferView::Uint32, pos);
    case PrimitiveType::U64:
    case PrimitiveType::NonZeroU64:
        return renderViewRead(BufferView::BigUint64, pos);
    case PrimitiveType::I8:
        return renderViewRead(BufferView::Int8, pos);
    case PrimitiveType::I16:
        return renderViewRead(BufferView::Int16, pos);
    case PrimitiveType::I32:
        return renderViewRead(BufferView::Int32, pos);
    case PrimitiveType::I64:
        return renderViewRead(BufferView::BigInt64, pos);
    case PrimitiveType::F32:
        return renderViewRead(BufferView::Float32, pos);
    case PrimitiveType::F64:
        return renderViewRead(BufferView::Float64, pos);
    case PrimitiveType::Bool:
        return renderViewRead(BufferView::Uint8, pos) + " === 1";
    }
    return renderViewRead(BufferView::Uint8, pos);
}

llvm::Error PrimitiveKind::initLayout(const KindDefinition& def, KindResolver& resolver)
{
    traits_ = findPrimitiveTraits(name());
    const DefinitionFieldReader reader(def);

    std::uint64_t size = 0;
    if (traits_)
    {
        size = traits_->width;
        if (declaredSize() && *declaredSize() != size)
        {
            return schemaError("declared size " + llvm::Twine(*declaredSize()) + " does not match the " +
                               llvm::Twine(traits_->width) + "-byte width of " + name());
        }
    }
    else if (declaredSize())
    {
        size = *declaredSize();
    }
    else
    {
        return schemaError("primitive '" + name() + "' has no built-in width; declare its 'size'");
    }

    std::uint64_t alignment = 1;
    if (declaredAlignment())
    {
        // Table primitives are read through views of their own width.
        if (traits_ && *declaredAlignment() < traits_->width)
        {
            return schemaError("declared align " + llvm::Twine(*declaredAlignment()) + " is below the " +
                               llvm::Twine(traits_->width) + "-byte view width of " + name());
        }
        alignment = *declaredAlignment();
    }
    else if (llvm::isPowerOf2_64(size))
    {
        alignment = std::min<std::uint64_t>(size, 8);
    }
    setLayout(size, alignment);

    if (reader.has("niche"))
    {
        auto declared = parseDeclaredNiche(reader);
        if (!declared)
        {
            return declared.takeError();
        }
        setNiche(*declared);
    }
    else if (traits_)
    {
        setNiche(primitiveNiche(*traits_));
    }
    else if (looksNicheCarrying(name()))
    {
        resolver.diagnostics().warning(def.location,
                                       "primitive '" + name() +
                                           "' is named like a niche-carrying type but declares no 'niche'; "
                                           "it is laid out without one");
    }
    return llvm::Error::success();
}

llvm::Expected<std::string> PrimitiveKind::emitDeserializer(llvm::StringRef pos, DeserializerContext& context) const
{
    if (!traits_)
    {
        return codeGenError("no deserializer generator for kind " + name());
    }
    if (context.options().checkConstantAlignment)
    {
        if (const auto literal = parseDecimalPosition(pos))
        {
            if (*literal % traits_->width != 0)
            {
                return codeGenError("position " + llvm::Twine(*literal) + " is not a multiple of the " +
                                    llvm::Twine(traits_->width) + "-byte width of " + name());
            }
        }
    }
    return renderPrimitiveRead(traits_->type, pos);
}

}  // namespace kindgen
