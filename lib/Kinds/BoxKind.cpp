//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "kindgen/Kinds/BoxKind.h"

#include "kindgen/CodeGen/BufferExpr.h"
#include "kindgen/CodeGen/DeserializerContext.h"
#include "kindgen/Kinds/KindDefinition.h"

namespace kindgen
{

llvm::Error BoxKind::initLayout(const KindDefinition& def, KindResolver& resolver)
{
    const DefinitionFieldReader reader(def);
    auto                        targetName = reader.requireString("target");
    if (!targetName)
    {
        return targetName.takeError();
    }
    auto target = resolver.lookup(*targetName);
    if (!target)
    {
        return target.takeError();
    }
    target_ = *target;
    setLayout(kPointerSize, kPointerSize);
    setNiche(Niche(0, kPointerSize, 0, 0));
    return llvm::Error::success();
}

llvm::Expected<std::string> BoxKind::emitDeserializer(llvm::StringRef pos, DeserializerContext& context) const
{
    return context.callHelper(target_, renderViewRead(BufferView::Uint32, pos));
}

}  // namespace kindgen
