//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements typed field access over kind definition objects.
///
//===----------------------------------------------------------------------===//

#include "kindgen/Kinds/KindDefinition.h"

#include <utility>

#include "kindgen/Support/Errors.h"

namespace kindgen
{

DefinitionFieldReader::DefinitionFieldReader(const KindDefinition& def)
    : def_(def)
    , object_(def.fields)
    , location_(def.location)
{
}

DefinitionFieldReader::DefinitionFieldReader(const KindDefinition&     def,
                                             const llvm::json::Object& object,
                                             SchemaLocation            location)
    : def_(def)
    , object_(object)
    , location_(std::move(location))
{
}

bool DefinitionFieldReader::has(llvm::StringRef key) const
{
    return object_.get(key) != nullptr;
}

const llvm::json::Value* DefinitionFieldReader::get(llvm::StringRef key) const
{
    return object_.get(key);
}

llvm::Error DefinitionFieldReader::error(const llvm::Twine& message) const
{
    return makeSchemaError(KindErrorContext{def_.name, def_.category, "initFromDef"},
                           location_.str() + ": " + message);
}

llvm::Expected<std::string> DefinitionFieldReader::requireString(llvm::StringRef key) const
{
    const auto* value = object_.get(key);
    if (!value)
    {
        return error("missing required field '" + key + "'");
    }
    const auto text = value->getAsString();
    if (!text)
    {
        return error("field '" + key + "' must be a string");
    }
    if (text->empty())
    {
        return error("field '" + key + "' must not be empty");
    }
    return text->str();
}

llvm::Expected<std::optional<std::string>> DefinitionFieldReader::optionalString(llvm::StringRef key) const
{
    if (!has(key))
    {
        return std::optional<std::string>{};
    }
    auto text = requireString(key);
    if (!text)
    {
        return text.takeError();
    }
    return std::optional<std::string>(std::move(*text));
}

llvm::Expected<std::uint64_t> DefinitionFieldReader::requireUnsigned(llvm::StringRef key) const
{
    const auto* value = object_.get(key);
    if (!value)
    {
        return error("missing required field '" + key + "'");
    }
    const auto number = value->getAsInteger();
    if (!number || *number < 0)
    {
        return error("field '" + key + "' must be a non-negative integer");
    }
    return static_cast<std::uint64_t>(*number);
}

llvm::Expected<std::optional<std::uint64_t>> DefinitionFieldReader::optionalUnsigned(llvm::StringRef key) const
{
    if (!has(key))
    {
        return std::optional<std::uint64_t>{};
    }
    auto number = requireUnsigned(key);
    if (!number)
    {
        return number.takeError();
    }
    return std::optional<std::uint64_t>(*number);
}

llvm::Expected<const llvm::json::Array*> DefinitionFieldReader::requireArray(llvm::StringRef key) const
{
    const auto* value = object_.get(key);
    if (!value)
    {
        return error("missing required field '" + key + "'");
    }
    const auto* array = value->getAsArray();
    if (!array)
    {
        return error("field '" + key + "' must be an array");
    }
    return array;
}

}  // namespace kindgen
