//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements struct layout and record-expression generation.
///
//===----------------------------------------------------------------------===//

#include "kindgen/Kinds/StructKind.h"

#include <algorithm>
#include <set>
#include <utility>

#include "kindgen/CodeGen/BufferExpr.h"
#include "kindgen/CodeGen/DeserializerContext.h"
#include "kindgen/CodeGen/JsNaming.h"
#include "kindgen/Kinds/KindDefinition.h"
#include "kindgen/Layout/Niche.h"

namespace kindgen
{

std::vector<KindId> StructKind::references() const
{
    std::vector<KindId> out;
    out.reserve(fields_.size());
    for (const auto& field : fields_)
    {
        out.push_back(field.kind);
    }
    return out;
}

llvm::Error StructKind::initLayout(const KindDefinition& def, KindResolver& resolver)
{
    const DefinitionFieldReader reader(def);
    auto                        entries = reader.requireArray("fields");
    if (!entries)
    {
        return entries.takeError();
    }

    std::set<std::string> seen;
    std::uint64_t         offset    = 0;
    std::uint64_t         alignment = 1;
    std::optional<Niche>  niche;

    for (std::size_t i = 0; i < (*entries)->size(); ++i)
    {
        const SchemaLocation where  = def.location.child("fields[" + std::to_string(i) + "]");
        const auto*          object = (**entries)[i].getAsObject();
        if (!object)
        {
            return reader.error("fields[" + llvm::Twine(i) + "] must be an object");
        }
        const DefinitionFieldReader fieldReader(def, *object, where);

        auto fieldName = fieldReader.requireString("name");
        if (!fieldName)
        {
            return fieldName.takeError();
        }
        if (!seen.insert(*fieldName).second)
        {
            return fieldReader.error("duplicate field '" + *fieldName + "'");
        }
        auto typeName = fieldReader.requireString("type");
        if (!typeName)
        {
            return typeName.takeError();
        }
        auto member = resolver.requireLayout(*typeName);
        if (!member)
        {
            return member.takeError();
        }

        const Kind& memberKind  = resolver.kind(*member);
        const auto  fieldOffset = checkedAlignTo(offset, memberKind.alignment());
        const auto  nextOffset  = fieldOffset ? checkedLayoutAdd(*fieldOffset, memberKind.size()) : std::nullopt;
        if (!nextOffset)
        {
            return fieldReader.error("field '" + *fieldName + "' of type '" + memberKind.name() +
                                     "' overflows the struct layout");
        }
        alignment = std::max(alignment, memberKind.alignment());
        niche     = preferNiche(niche, placeNiche(memberKind.niche(), *fieldOffset));
        fields_.push_back(StructField{std::move(*fieldName), *member, *fieldOffset});
        offset = *nextOffset;
    }

    const auto size = checkedAlignTo(offset, alignment);
    if (!size)
    {
        return schemaError("struct size overflows");
    }
    setLayout(*size, alignment);
    setNiche(niche);
    return llvm::Error::success();
}

llvm::Expected<std::string> StructKind::emitDeserializer(llvm::StringRef pos, DeserializerContext& context) const
{
    if (fields_.empty())
    {
        return std::string("{}");
    }

    std::string out = "{";
    for (std::size_t i = 0; i < fields_.size(); ++i)
    {
        const auto& field = fields_[i];
        auto        value = context.generate(field.kind, addOffset(pos, field.offset));
        if (!value)
        {
            return value.takeError();
        }
        if (i > 0)
        {
            out += ", ";
        }
        out += renderJsPropertyKey(field.name) + ": " + *value;
    }
    out += "}";
    return out;
}

}  // namespace kindgen
