//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the kind category registry and the built-in registration set.
///
//===----------------------------------------------------------------------===//

#include "kindgen/Kinds/KindRegistry.h"

#include <utility>

#include "kindgen/Kinds/ArrayKind.h"
#include "kindgen/Kinds/BoxKind.h"
#include "kindgen/Kinds/EnumKind.h"
#include "kindgen/Kinds/OptionKind.h"
#include "kindgen/Kinds/PrimitiveKind.h"
#include "kindgen/Kinds/StructKind.h"
#include "kindgen/Support/Errors.h"

namespace kindgen
{

llvm::Error KindRegistry::registerKindClass(llvm::StringRef categoryTag, KindFactory factory)
{
    const KindErrorContext context{"", categoryTag.str(), "registerKindClass"};
    if (categoryTag.empty())
    {
        return makeSchemaError(context, "category tag must not be empty");
    }
    if (!factory)
    {
        return makeSchemaError(context, "no factory given for category '" + categoryTag + "'");
    }
    if (!factories_.emplace(categoryTag.str(), std::move(factory)).second)
    {
        return makeSchemaError(context, "category '" + categoryTag + "' is already registered");
    }
    return llvm::Error::success();
}

llvm::Expected<std::unique_ptr<Kind>> KindRegistry::create(llvm::StringRef categoryTag, llvm::StringRef kindName) const
{
    const auto it = factories_.find(categoryTag.str());
    if (it == factories_.end())
    {
        return makeSchemaError(KindErrorContext{kindName.str(), categoryTag.str(), "create"},
                               "unknown kind category '" + categoryTag + "'");
    }
    auto kind = it->second();
    if (!kind || kind->category() != categoryTag)
    {
        return makeSchemaError(KindErrorContext{kindName.str(), categoryTag.str(), "create"},
                               "factory for category '" + categoryTag + "' produced a mismatching kind");
    }
    return kind;
}

bool KindRegistry::contains(llvm::StringRef categoryTag) const
{
    return factories_.find(categoryTag.str()) != factories_.end();
}

std::vector<std::string> KindRegistry::categories() const
{
    std::vector<std::string> out;
    out.reserve(factories_.size());
    for (const auto& [tag, _] : factories_)
    {
        out.push_back(tag);
    }
    return out;
}

llvm::Error KindRegistry::registerBuiltinKinds(KindRegistry& registry)
{
    if (auto err = registry.registerKindClass<PrimitiveKind>(PrimitiveKind::kCategory))
    {
        return err;
    }
    if (auto err = registry.registerKindClass<StructKind>(StructKind::kCategory))
    {
        return err;
    }
    if (auto err = registry.registerKindClass<ArrayKind>(ArrayKind::kCategory))
    {
        return err;
    }
    if (auto err = registry.registerKindClass<EnumKind>(EnumKind::kCategory))
    {
        return err;
    }
    if (auto err = registry.registerKindClass<OptionKind>(OptionKind::kCategory))
    {
        return err;
    }
    return registry.registerKindClass<BoxKind>(BoxKind::kCategory);
}

const KindRegistry& KindRegistry::builtin()
{
    static const KindRegistry registry = [] {
        KindRegistry out;
        llvm::cantFail(registerBuiltinKinds(out));
        return out;
    }();
    return registry;
}

}  // namespace kindgen
