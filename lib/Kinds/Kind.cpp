//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the shared kind lifecycle: definition intake, layout checks, and guarded generation.
///
//===----------------------------------------------------------------------===//

#include "kindgen/Kinds/Kind.h"

#include <utility>

#include "kindgen/Kinds/KindDefinition.h"
#include "llvm/Support/MathExtras.h"

namespace kindgen
{
namespace
{

std::string locationPrefix(const SchemaLocation& location)
{
    if (location.file.empty() && location.path.empty())
    {
        return "";
    }
    return location.str() + ": ";
}

}  // namespace

llvm::Error Kind::initFromDef(const KindDefinition& def, KindResolver& resolver)
{
    if (initialized_)
    {
        return schemaError("kind is already initialized");
    }
    if (def.name.empty())
    {
        return makeSchemaError(KindErrorContext{"", category().str(), "initFromDef"},
                               locationPrefix(def.location) + "definition has no name");
    }
    name_     = def.name;
    location_ = def.location;

    const DefinitionFieldReader reader(def);
    auto                        declaredSize = reader.optionalUnsigned("size");
    if (!declaredSize)
    {
        return declaredSize.takeError();
    }
    auto declaredAlignment = reader.optionalUnsigned("align");
    if (!declaredAlignment)
    {
        return declaredAlignment.takeError();
    }
    if (*declaredAlignment && !llvm::isPowerOf2_64(**declaredAlignment))
    {
        return reader.error("declared alignment " + llvm::Twine(**declaredAlignment) + " is not a power of two");
    }
    declaredSize_      = *declaredSize;
    declaredAlignment_ = *declaredAlignment;

    if (auto err = initLayout(def, resolver))
    {
        return err;
    }
    if (!layoutSet_)
    {
        return schemaError("layout was not computed");
    }
    if (declaredSize_ && *declaredSize_ != size_)
    {
        return schemaError("declared size " + llvm::Twine(*declaredSize_) + " does not match computed size " +
                           llvm::Twine(size_));
    }
    if (declaredAlignment_ && *declaredAlignment_ != alignment_)
    {
        return schemaError("declared alignment " + llvm::Twine(*declaredAlignment_) +
                           " does not match computed alignment " + llvm::Twine(alignment_));
    }
    if (!llvm::isPowerOf2_64(alignment_))
    {
        return schemaError("alignment " + llvm::Twine(alignment_) + " is not a power of two");
    }
    if (size_ % alignment_ != 0)
    {
        return schemaError("size " + llvm::Twine(size_) + " is not a multiple of alignment " +
                           llvm::Twine(alignment_));
    }
    if (niche_)
    {
        if (const auto problem = checkNicheInvariants(*niche_, size_))
        {
            return schemaError(*problem);
        }
    }

    initialized_ = true;
    return llvm::Error::success();
}

llvm::Expected<std::string> Kind::generateDeserializerCall(llvm::StringRef pos, DeserializerContext& context) const
{
    if (!initialized_)
    {
        return codeGenError("kind is queried before initialization completed");
    }
    return emitDeserializer(pos, context);
}

llvm::Expected<std::string> Kind::generateHelperBody(DeserializerContext& context) const
{
    if (!initialized_)
    {
        return codeGenError("kind is queried before initialization completed");
    }
    return emitHelperBody(context);
}

llvm::Expected<std::string> Kind::emitHelperBody(DeserializerContext& context) const
{
    auto expr = emitDeserializer("pos", context);
    if (!expr)
    {
        return expr.takeError();
    }
    return "return " + *expr + ";";
}

void Kind::setLayout(const std::uint64_t size, const std::uint64_t alignment)
{
    size_      = size;
    alignment_ = alignment;
    layoutSet_ = true;
}

llvm::Error Kind::schemaError(const llvm::Twine& message) const
{
    return makeSchemaError(KindErrorContext{name_, category().str(), "initFromDef"},
                           locationPrefix(location_) + message);
}

llvm::Error Kind::codeGenError(const llvm::Twine& message) const
{
    return makeCodeGenError(KindErrorContext{name_, category().str(), "generateDeserializerCall"}, message);
}

}  // namespace kindgen
