//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>
#include <utility>

#include "kindgen/Support/ToolConfig.h"
#include "llvm/Support/Error.h"

namespace
{

bool expectRejected(const char* json, const char* needle)
{
    auto config = kindgen::parseToolConfig(json, "kindc.json");
    if (config)
    {
        std::cerr << "configuration should be rejected: " << json << "\n";
        return false;
    }
    const std::string text = llvm::toString(config.takeError());
    if (text.find(needle) == std::string::npos)
    {
        std::cerr << "expected '" << needle << "' in: " << text << "\n";
        return false;
    }
    return true;
}

}  // namespace

bool runToolConfigTests()
{
    {
        auto defaults = kindgen::parseToolConfig("{}", "kindc.json");
        if (!defaults)
        {
            std::cerr << llvm::toString(defaults.takeError()) << "\n";
            return false;
        }
        if (defaults->build.maxNestingDepth != 256 || defaults->generate.arrayInlineLimit != 16 ||
            defaults->generate.helperPrefix != "deserialize" || defaults->generate.entryPrefix != "parse" ||
            defaults->generate.metadataSize != 16 || !defaults->generate.checkConstantAlignment ||
            defaults->output.fileMode != 0444U || defaults->output.dryRun || defaults->withBuiltinPrimitives)
        {
            std::cerr << "empty configuration should keep the defaults\n";
            return false;
        }
    }

    {
        auto config = kindgen::parseToolConfig(R"({
            "withBuiltinPrimitives": true,
            "build": {"maxNestingDepth": 32},
            "generate": {"rootKinds": ["Frame", "Header"], "helperPrefix": "read", "arrayInlineLimit": 4,
                         "checkConstantAlignment": false, "metadataSize": 8},
            "output": {"dryRun": true, "noOverwrite": true, "fileMode": "0644"}
        })",
                                               "kindc.json");
        if (!config)
        {
            std::cerr << llvm::toString(config.takeError()) << "\n";
            return false;
        }
        if (!config->withBuiltinPrimitives || config->build.maxNestingDepth != 32 ||
            config->generate.rootKinds.size() != 2 || config->generate.rootKinds[1] != "Header" ||
            config->generate.helperPrefix != "read" || config->generate.arrayInlineLimit != 4 ||
            config->generate.checkConstantAlignment || config->generate.metadataSize != 8 || !config->output.dryRun ||
            !config->output.noOverwrite || config->output.fileMode != 0644U)
        {
            std::cerr << "configuration values were not applied\n";
            return false;
        }
    }

    {
        auto numeric = kindgen::parseToolConfig(R"({"output": {"fileMode": 420}})", "kindc.json");
        if (!numeric || numeric->output.fileMode != 0644U)
        {
            if (!numeric)
            {
                llvm::consumeError(numeric.takeError());
            }
            std::cerr << "numeric file mode should be accepted\n";
            return false;
        }
    }

    return expectRejected(R"({"verbose": true})", "kindc.json: 'verbose' is not a known setting") &&
           expectRejected(R"({"generate": {"inline": 3}})", "'generate.inline' is not a known setting") &&
           expectRejected(R"({"build": {"maxNestingDepth": 0}})", "maxNestingDepth") &&
           expectRejected(R"({"generate": {"metadataSize": 2}})", "metadataSize") &&
           expectRejected(R"({"generate": {"arrayInlineLimit": -1}})", "arrayInlineLimit") &&
           expectRejected(R"({"generate": {"rootKinds": "Frame"}})", "rootKinds") &&
           expectRejected(R"({"output": {"fileMode": "rw-r--r--"}})", "fileMode") &&
           expectRejected(R"({"output": []})", "'output' must be an object") &&
           expectRejected("[1, 2]", "configuration must be a JSON object") &&
           expectRejected("{", "invalid JSON");
}
