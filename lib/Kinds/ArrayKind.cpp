//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements fixed-array layout and element-wise generation.
///
//===----------------------------------------------------------------------===//

#include "kindgen/Kinds/ArrayKind.h"

#include <limits>

#include "kindgen/CodeGen/BufferExpr.h"
#include "kindgen/CodeGen/DeserializerContext.h"
#include "kindgen/Kinds/KindDefinition.h"

namespace kindgen
{

llvm::Error ArrayKind::initLayout(const KindDefinition& def, KindResolver& resolver)
{
    const DefinitionFieldReader reader(def);
    auto                        elementName = reader.requireString("element");
    if (!elementName)
    {
        return elementName.takeError();
    }
    auto count = reader.requireUnsigned("count");
    if (!count)
    {
        return count.takeError();
    }
    auto element = resolver.requireLayout(*elementName);
    if (!element)
    {
        return element.takeError();
    }

    const Kind& elementKind = resolver.kind(*element);
    if (elementKind.size() != 0 && *count > std::numeric_limits<std::uint64_t>::max() / elementKind.size())
    {
        return schemaError("array of " + llvm::Twine(*count) + " x " + elementKind.name() + " overflows");
    }

    element_ = *element;
    count_   = *count;
    stride_  = elementKind.size();
    setLayout(stride_ * count_, elementKind.alignment());
    if (count_ > 0)
    {
        setNiche(placeNiche(elementKind.niche(), 0));
    }
    return llvm::Error::success();
}

llvm::Expected<std::string> ArrayKind::emitDeserializer(llvm::StringRef pos, DeserializerContext& context) const
{
    if (count_ > context.options().arrayInlineLimit)
    {
        return context.callHelper(id(), pos);
    }

    std::string out = "[";
    for (std::uint64_t i = 0; i < count_; ++i)
    {
        auto value = context.generate(element_, addOffset(pos, i * stride_));
        if (!value)
        {
            return value.takeError();
        }
        if (i > 0)
        {
            out += ", ";
        }
        out += *value;
    }
    out += "]";
    return out;
}

llvm::Expected<std::string> ArrayKind::emitHelperBody(DeserializerContext& context) const
{
    if (count_ <= context.options().arrayInlineLimit)
    {
        return Kind::emitHelperBody(context);
    }

    const std::string items = context.allocateTemp("items");
    const std::string index = context.allocateTemp("i");
    auto value = context.generate(element_, "pos + " + index + " * " + std::to_string(stride_));
    if (!value)
    {
        return value.takeError();
    }
    return "const " + items + " = new Array(" + std::to_string(count_) + ");\n" + "for (let " + index + " = 0; " +
           index + " < " + std::to_string(count_) + "; " + index + "++) {\n" + "  " + items + "[" + index +
           "] = " + *value + ";\n" + "}\n" + "return " + items + ";";
}

}  // namespace kindgen
