//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements schema JSON parsing.
///
//===----------------------------------------------------------------------===//

#include "kindgen/Schema/SchemaLoader.h"

#include <iterator>
#include <set>
#include <utility>

#include "kindgen/Kinds/PrimitiveKind.h"
#include "kindgen/Support/Errors.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"

namespace kindgen
{
namespace
{

llvm::Error loadError(const SchemaLocation& location, const llvm::Twine& message)
{
    return makeSchemaError(KindErrorContext{"", "", "load"}, location.str() + ": " + message);
}

llvm::Expected<std::string> requireEntryString(const llvm::json::Object& object,
                                               llvm::StringRef           key,
                                               const SchemaLocation&     location)
{
    const auto text = object.getString(key);
    if (!text || text->empty())
    {
        return loadError(location, "kind entry needs a non-empty string '" + key + "'");
    }
    return text->str();
}

llvm::Error readKinds(const llvm::json::Array& kinds, llvm::StringRef sourceName, SchemaDocument& document)
{
    for (std::size_t i = 0; i < kinds.size(); ++i)
    {
        const SchemaLocation location{sourceName.str(), "kinds[" + std::to_string(i) + "]"};
        const auto*          object = kinds[i].getAsObject();
        if (!object)
        {
            return loadError(location, "kind entry must be an object");
        }
        auto name = requireEntryString(*object, "name", location);
        if (!name)
        {
            return name.takeError();
        }
        auto category = requireEntryString(*object, "kind", location);
        if (!category)
        {
            return category.takeError();
        }
        document.definitions.push_back(KindDefinition{std::move(*name), std::move(*category), *object, location});
    }
    return llvm::Error::success();
}

}  // namespace

llvm::Expected<SchemaDocument> parseSchemaText(llvm::StringRef text, llvm::StringRef sourceName)
{
    const SchemaLocation root{sourceName.str(), ""};
    auto                 parsed = llvm::json::parse(text);
    if (!parsed)
    {
        return loadError(root, "invalid JSON: " + llvm::toString(parsed.takeError()));
    }

    SchemaDocument document;
    document.name = llvm::sys::path::stem(sourceName).str();

    if (const auto* kinds = parsed->getAsArray())
    {
        if (auto err = readKinds(*kinds, sourceName, document))
        {
            return std::move(err);
        }
        return document;
    }

    const auto* object = parsed->getAsObject();
    if (!object)
    {
        return loadError(root, "schema must be an object or an array of kinds");
    }
    for (const auto& entry : *object)
    {
        const llvm::StringRef key = entry.first;
        if (key != "name" && key != "kinds")
        {
            return loadError(root, "unknown schema key '" + key + "'");
        }
    }
    if (const auto* nameValue = object->get("name"))
    {
        const auto name = nameValue->getAsString();
        if (!name || name->empty())
        {
            return loadError(root, "'name' must be a non-empty string");
        }
        document.name = name->str();
    }
    const auto* kinds = object->getArray("kinds");
    if (!kinds)
    {
        return loadError(root, "schema needs a 'kinds' array");
    }
    if (auto err = readKinds(*kinds, sourceName, document))
    {
        return std::move(err);
    }
    return document;
}

llvm::Expected<SchemaDocument> loadSchemaFile(llvm::StringRef path)
{
    auto buffer = llvm::MemoryBuffer::getFile(path);
    if (!buffer)
    {
        return loadError(SchemaLocation{path.str(), ""}, "cannot read schema: " + buffer.getError().message());
    }
    return parseSchemaText((*buffer)->getBuffer(), path);
}

std::vector<KindDefinition> builtinPrimitiveDefinitions()
{
    std::vector<KindDefinition> out;
    for (const auto& traits : builtinPrimitives())
    {
        llvm::json::Object fields{{"name", traits.name}, {"kind", PrimitiveKind::kCategory}};
        out.push_back(KindDefinition{traits.name.str(),
                                     PrimitiveKind::kCategory.str(),
                                     std::move(fields),
                                     SchemaLocation{"<builtin>", traits.name.str()}});
    }
    return out;
}

void prependBuiltinPrimitives(SchemaDocument& document)
{
    std::set<std::string> defined;
    for (const auto& def : document.definitions)
    {
        defined.insert(def.name);
    }

    std::vector<KindDefinition> merged;
    for (auto& def : builtinPrimitiveDefinitions())
    {
        if (!defined.contains(def.name))
        {
            merged.push_back(std::move(def));
        }
    }
    merged.insert(merged.end(),
                  std::make_move_iterator(document.definitions.begin()),
                  std::make_move_iterator(document.definitions.end()));
    document.definitions = std::move(merged);
}

}  // namespace kindgen
