//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements tool configuration parsing.
///
//===----------------------------------------------------------------------===//

#include "kindgen/Support/ToolConfig.h"

#include <cstdint>
#include <initializer_list>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "llvm/Support/JSON.h"
#include "llvm/Support/MemoryBuffer.h"

namespace kindgen
{
namespace
{

class ConfigReader final
{
public:
    explicit ConfigReader(llvm::StringRef sourceName)
        : sourceName_(sourceName.str())
    {
    }

    llvm::Error error(llvm::StringRef key, const llvm::Twine& message) const
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "%s: '%s' %s",
                                       sourceName_.c_str(),
                                       key.str().c_str(),
                                       message.str().c_str());
    }

    llvm::Error rejectUnknownKeys(const llvm::json::Object&             object,
                                  llvm::StringRef                       section,
                                  std::initializer_list<llvm::StringRef> known) const
    {
        for (const auto& entry : object)
        {
            const llvm::StringRef key = entry.first;
            bool                  ok  = false;
            for (const llvm::StringRef candidate : known)
            {
                ok = ok || candidate == key;
            }
            if (!ok)
            {
                return error(section.empty() ? key.str() : section.str() + "." + key.str(), "is not a known setting");
            }
        }
        return llvm::Error::success();
    }

    llvm::Error readBool(const llvm::json::Object& object, llvm::StringRef key, bool& out) const
    {
        const auto* value = object.get(key);
        if (!value)
        {
            return llvm::Error::success();
        }
        const auto parsed = value->getAsBoolean();
        if (!parsed)
        {
            return error(key, "must be a boolean");
        }
        out = *parsed;
        return llvm::Error::success();
    }

    llvm::Error readString(const llvm::json::Object& object, llvm::StringRef key, std::string& out) const
    {
        const auto* value = object.get(key);
        if (!value)
        {
            return llvm::Error::success();
        }
        const auto parsed = value->getAsString();
        if (!parsed || parsed->empty())
        {
            return error(key, "must be a non-empty string");
        }
        out = parsed->str();
        return llvm::Error::success();
    }

    template <typename T>
    llvm::Error readUnsigned(const llvm::json::Object& object, llvm::StringRef key, T& out) const
    {
        const auto* value = object.get(key);
        if (!value)
        {
            return llvm::Error::success();
        }
        const auto parsed = value->getAsInteger();
        if (!parsed || *parsed < 0 ||
            static_cast<std::uint64_t>(*parsed) > static_cast<std::uint64_t>(std::numeric_limits<T>::max()))
        {
            return error(key, "must be a non-negative integer in range");
        }
        out = static_cast<T>(*parsed);
        return llvm::Error::success();
    }

    llvm::Error readStringArray(const llvm::json::Object& object,
                                llvm::StringRef           key,
                                std::vector<std::string>& out) const
    {
        const auto* value = object.get(key);
        if (!value)
        {
            return llvm::Error::success();
        }
        const auto* array = value->getAsArray();
        if (!array)
        {
            return error(key, "must be an array of strings");
        }
        std::vector<std::string> parsed;
        parsed.reserve(array->size());
        for (const llvm::json::Value& item : *array)
        {
            const auto text = item.getAsString();
            if (!text || text->empty())
            {
                return error(key, "must be an array of non-empty strings");
            }
            parsed.emplace_back(text->str());
        }
        out = std::move(parsed);
        return llvm::Error::success();
    }

    /// Accepts an integer or an octal string such as "0644".
    llvm::Error readFileMode(const llvm::json::Object& object, llvm::StringRef key, std::uint32_t& out) const
    {
        const auto* value = object.get(key);
        if (!value)
        {
            return llvm::Error::success();
        }
        if (const auto text = value->getAsString())
        {
            unsigned mode = 0;
            if (text->getAsInteger(8, mode) || mode > 07777U)
            {
                return error(key, "must be an octal mode such as \"0644\"");
            }
            out = mode;
            return llvm::Error::success();
        }
        std::uint32_t mode = 0;
        if (auto err = readUnsigned(object, key, mode))
        {
            return err;
        }
        if (mode > 07777U)
        {
            return error(key, "is not a valid file mode");
        }
        out = mode;
        return llvm::Error::success();
    }

    /// Returns the nested object under `key`, or null when absent.
    llvm::Expected<const llvm::json::Object*> section(const llvm::json::Object& root, llvm::StringRef key) const
    {
        const auto* value = root.get(key);
        if (!value)
        {
            return static_cast<const llvm::json::Object*>(nullptr);
        }
        const auto* object = value->getAsObject();
        if (!object)
        {
            return error(key, "must be an object");
        }
        return object;
    }

private:
    std::string sourceName_;
};

llvm::Error applyBuild(const ConfigReader& reader, const llvm::json::Object& object, SchemaBuildOptions& build)
{
    if (auto err = reader.rejectUnknownKeys(object, "build", {"maxNestingDepth"}))
    {
        return err;
    }
    if (auto err = reader.readUnsigned(object, "maxNestingDepth", build.maxNestingDepth))
    {
        return err;
    }
    if (build.maxNestingDepth == 0)
    {
        return reader.error("maxNestingDepth", "must be positive");
    }
    return llvm::Error::success();
}

llvm::Error applyGenerate(const ConfigReader& reader, const llvm::json::Object& object, GenerateOptions& generate)
{
    if (auto err = reader.rejectUnknownKeys(object,
                                            "generate",
                                            {"rootKinds",
                                             "helperPrefix",
                                             "entryPrefix",
                                             "arrayInlineLimit",
                                             "checkConstantAlignment",
                                             "metadataSize"}))
    {
        return err;
    }
    if (auto err = reader.readStringArray(object, "rootKinds", generate.rootKinds))
    {
        return err;
    }
    if (auto err = reader.readString(object, "helperPrefix", generate.helperPrefix))
    {
        return err;
    }
    if (auto err = reader.readString(object, "entryPrefix", generate.entryPrefix))
    {
        return err;
    }
    if (auto err = reader.readUnsigned(object, "arrayInlineLimit", generate.arrayInlineLimit))
    {
        return err;
    }
    if (auto err = reader.readBool(object, "checkConstantAlignment", generate.checkConstantAlignment))
    {
        return err;
    }
    if (auto err = reader.readUnsigned(object, "metadataSize", generate.metadataSize))
    {
        return err;
    }
    if (generate.metadataSize < 4)
    {
        return reader.error("metadataSize", "must leave room for the 32-bit root offset");
    }
    return llvm::Error::success();
}

llvm::Error applyOutput(const ConfigReader& reader, const llvm::json::Object& object, EmitWritePolicy& output)
{
    if (auto err = reader.rejectUnknownKeys(object, "output", {"dryRun", "noOverwrite", "fileMode"}))
    {
        return err;
    }
    if (auto err = reader.readBool(object, "dryRun", output.dryRun))
    {
        return err;
    }
    if (auto err = reader.readBool(object, "noOverwrite", output.noOverwrite))
    {
        return err;
    }
    return reader.readFileMode(object, "fileMode", output.fileMode);
}

}  // namespace

llvm::Expected<ToolConfig> parseToolConfig(llvm::StringRef text, llvm::StringRef sourceName)
{
    auto parsed = llvm::json::parse(text);
    if (!parsed)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "%s: invalid JSON: %s",
                                       sourceName.str().c_str(),
                                       llvm::toString(parsed.takeError()).c_str());
    }
    const auto* root = parsed->getAsObject();
    if (!root)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "%s: configuration must be a JSON object",
                                       sourceName.str().c_str());
    }

    const ConfigReader reader(sourceName);
    ToolConfig         config;
    if (auto err = reader.rejectUnknownKeys(*root, "", {"build", "generate", "output", "withBuiltinPrimitives"}))
    {
        return std::move(err);
    }
    if (auto err = reader.readBool(*root, "withBuiltinPrimitives", config.withBuiltinPrimitives))
    {
        return std::move(err);
    }

    auto build = reader.section(*root, "build");
    if (!build)
    {
        return build.takeError();
    }
    if (*build)
    {
        if (auto err = applyBuild(reader, **build, config.build))
        {
            return std::move(err);
        }
    }

    auto generate = reader.section(*root, "generate");
    if (!generate)
    {
        return generate.takeError();
    }
    if (*generate)
    {
        if (auto err = applyGenerate(reader, **generate, config.generate))
        {
            return std::move(err);
        }
    }

    auto output = reader.section(*root, "output");
    if (!output)
    {
        return output.takeError();
    }
    if (*output)
    {
        if (auto err = applyOutput(reader, **output, config.output))
        {
            return std::move(err);
        }
    }
    return config;
}

llvm::Expected<ToolConfig> loadToolConfig(llvm::StringRef path)
{
    auto buffer = llvm::MemoryBuffer::getFile(path);
    if (!buffer)
    {
        return llvm::createStringError(buffer.getError(), "cannot read configuration %s", path.str().c_str());
    }
    return parseToolConfig((*buffer)->getBuffer(), path);
}

}  // namespace kindgen
