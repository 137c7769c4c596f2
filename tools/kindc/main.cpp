//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Entry point for the `kindc` command-line tool.
///
/// This tool loads JSON kind schemas, lays out every kind, and prints layout
/// reports, single read expressions, or complete JavaScript deserializer
/// modules.
///
//===----------------------------------------------------------------------===//

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "kindgen/CodeGen/DeserializerGenerator.h"
#include "kindgen/CodeGen/EmitCommon.h"
#include "kindgen/Schema/LayoutPrinter.h"
#include "kindgen/Schema/Schema.h"
#include "kindgen/Schema/SchemaBuilder.h"
#include "kindgen/Schema/SchemaLoader.h"
#include "kindgen/Support/Diagnostics.h"
#include "kindgen/Support/Errors.h"
#include "kindgen/Support/ToolConfig.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

namespace
{

/// @brief Checks whether a command token is implemented by `kindc`.
bool isKnownCommand(llvm::StringRef command)
{
    return command == "layout" || command == "expr" || command == "js";
}

bool isHelpToken(llvm::StringRef arg)
{
    return arg == "--help" || arg == "-h";
}

/// @brief Prints compact usage guidance for invalid CLI invocations.
void printUsage()
{
    llvm::errs() << "Usage: kindc <layout|expr|js> --schema <file> [options]\n"
                 << "Try: kindc --help\n";
}

/// @brief Prints the full help text and optional command-focused details.
///
/// @param[in] selectedCommand Optional command name used for focused help.
void printHelp(const std::string& selectedCommand = "")
{
    llvm::errs() << "NAME\n"
                 << "  kindc - kind layout engine and zero-copy deserializer generator\n\n"
                 << "SYNOPSIS\n"
                 << "  kindc <command> --schema <file> [--schema <file> ...] [options]\n"
                 << "  kindc --help\n"
                 << "  kindc <command> --help\n\n"
                 << "DESCRIPTION\n"
                 << "  kindc reads JSON kind schemas, computes size, alignment and niche of every kind,\n"
                 << "  and generates JavaScript that reads values in place from one little-endian buffer.\n"
                 << "  Each schema file is processed on its own; a failing schema does not stop the others.\n\n"
                 << "COMMANDS\n"
                 << "  layout  Print the layout of every kind.\n"
                 << "  expr    Print the read expression of one kind.\n"
                 << "  js      Generate one deserializer module per schema.\n\n"
                 << "COMMON OPTIONS\n"
                 << "  --schema <file>\n"
                 << "      Schema input. Repeat to process several schemas.\n"
                 << "  --config <file>\n"
                 << "      JSON tool configuration. Command-line flags override its values.\n"
                 << "  --with-builtin-primitives\n"
                 << "      Define U8..F64, Bool and NonZero* unless the schema defines them itself.\n"
                 << "  --verbose\n"
                 << "      Report the computed layout of every kind as a note.\n"
                 << "  --help, -h\n"
                 << "      Print this help text. With a command, prints command-focused guidance.\n\n"
                 << "LAYOUT OPTIONS (layout)\n"
                 << "  --format <text|json>\n"
                 << "      Report format (default: text).\n\n"
                 << "EXPRESSION OPTIONS (expr)\n"
                 << "  --kind <name>\n"
                 << "      Kind to read. Required.\n"
                 << "  --pos <expr>\n"
                 << "      Position expression (default: 0).\n\n"
                 << "MODULE OPTIONS (js)\n"
                 << "  --out-dir <dir>\n"
                 << "      Write <schema>.deserialize.js files here instead of stdout.\n"
                 << "  --root <kind>\n"
                 << "      Export an entry point for this kind. Repeat as needed. Default: every\n"
                 << "      non-primitive kind no other kind contains.\n"
                 << "  --dry-run\n"
                 << "      Do not write files.\n"
                 << "  --no-overwrite\n"
                 << "      Fail instead of replacing existing output files.\n";

    if (selectedCommand == "layout")
    {
        llvm::errs() << "\nCOMMAND DETAILS (layout)\n"
                     << "  Honors --format.\n";
    }
    else if (selectedCommand == "expr")
    {
        llvm::errs() << "\nCOMMAND DETAILS (expr)\n"
                     << "  Requires --kind. Helper functions the expression calls are printed first.\n";
    }
    else if (selectedCommand == "js")
    {
        llvm::errs() << "\nCOMMAND DETAILS (js)\n"
                     << "  Honors --out-dir, --root, --dry-run and --no-overwrite.\n";
    }
}

/// @brief Emits collected diagnostics to stderr.
void printDiagnostics(const kindgen::DiagnosticEngine& diag)
{
    for (const auto& d : diag.diagnostics())
    {
        llvm::errs() << d.location.str() << ": " << kindgen::diagnosticLevelName(d.level) << ": " << d.message
                     << "\n";
    }
}

/// @brief Reports a failed schema with the failing kind, category and operation.
void reportFailure(llvm::StringRef schemaPath, llvm::Error err)
{
    llvm::Error rest = llvm::handleErrors(
        std::move(err),
        [&](const kindgen::SchemaError& e) {
            llvm::errs() << schemaPath << ": error: ";
            e.log(llvm::errs());
            llvm::errs() << "\n";
        },
        [&](const kindgen::CodeGenError& e) {
            llvm::errs() << schemaPath << ": error: ";
            e.log(llvm::errs());
            llvm::errs() << "\n";
        });
    if (rest)
    {
        llvm::errs() << schemaPath << ": error: " << llvm::toString(std::move(rest)) << "\n";
    }
}

/// @brief Prints the post-run command summary.
void printRunSummary(llvm::StringRef                           command,
                     const std::size_t                         schemas,
                     const std::size_t                         failed,
                     const std::size_t                         generatedFiles,
                     const std::chrono::steady_clock::duration elapsed)
{
    const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    llvm::errs() << "Run summary:\n"
                 << "  command: " << command << "\n"
                 << "  schemas: " << schemas << " (" << failed << " failed)\n"
                 << "  files generated: " << generatedFiles << "\n"
                 << "  elapsed: " << elapsedMs / 1000 << ".";
    const auto fraction = elapsedMs % 1000;
    if (fraction < 100)
    {
        llvm::errs() << "0";
    }
    if (fraction < 10)
    {
        llvm::errs() << "0";
    }
    llvm::errs() << fraction << "s\n";
}

struct CommandOptions final
{
    std::string command;
    std::string format{"text"};
    std::string kind;
    std::string pos{"0"};
    std::string outDir;
    bool        verbose{false};
};

/// @brief Runs one command over one schema file.
llvm::Error runSchema(const std::string&         schemaPath,
                      const CommandOptions&      options,
                      const kindgen::ToolConfig& config,
                      kindgen::DiagnosticEngine& diagnostics)
{
    auto document = kindgen::loadSchemaFile(schemaPath);
    if (!document)
    {
        return document.takeError();
    }
    if (config.withBuiltinPrimitives)
    {
        kindgen::prependBuiltinPrimitives(*document);
    }

    auto schema =
        kindgen::buildSchema(document->name, std::move(document->definitions), diagnostics, config.build);
    if (!schema)
    {
        return schema.takeError();
    }
    if (options.verbose)
    {
        for (kindgen::KindId id = 0; id < schema->size(); ++id)
        {
            const auto& kind = schema->kind(id);
            diagnostics.note(kind.location(), kindgen::describeKindLayout(kind));
        }
    }

    if (options.command == "layout")
    {
        llvm::outs() << (options.format == "json" ? kindgen::renderLayoutJson(*schema) + "\n"
                                                  : kindgen::printLayout(*schema));
        return llvm::Error::success();
    }

    if (options.command == "expr")
    {
        auto generated =
            kindgen::generateDeserializerExpression(*schema, options.kind, options.pos, config.generate);
        if (!generated)
        {
            return generated.takeError();
        }
        llvm::outs() << generated->helpers << generated->expression << "\n";
        return llvm::Error::success();
    }

    auto generatedModule = kindgen::generateDeserializerModule(*schema, config.generate);
    if (!generatedModule)
    {
        return generatedModule.takeError();
    }
    if (options.outDir.empty())
    {
        llvm::outs() << *generatedModule;
        return llvm::Error::success();
    }
    const std::string stem = llvm::sys::path::stem(schemaPath).str();
    return kindgen::writeGeneratedFile(kindgen::moduleOutputPath(options.outDir, stem), *generatedModule, config.output);
}

}  // namespace

/// @brief Program entry point for `kindc`.
///
/// @param[in] argc Argument count.
/// @param[in] argv Argument vector.
/// @return Zero on success, non-zero on CLI errors or when any schema failed.
int main(int argc, char** argv)
{
    llvm::InitLLVM y(argc, argv);

    if (argc < 2)
    {
        printUsage();
        return 1;
    }

    CommandOptions options;
    options.command = argv[1];
    if (isHelpToken(options.command) || options.command == "help")
    {
        printHelp();
        return 0;
    }
    if (!isKnownCommand(options.command))
    {
        llvm::errs() << "Unknown command: " << options.command << "\n";
        printUsage();
        return 1;
    }

    std::vector<std::string> schemas;
    std::vector<std::string> roots;
    std::string              configPath;
    bool                     helpRequested         = false;
    bool                     withBuiltinPrimitives = false;
    bool                     dryRun                = false;
    bool                     noOverwrite           = false;

    for (int i = 2; i < argc; ++i)
    {
        const std::string arg          = argv[i];
        auto              requireValue = [&](const std::string& name) -> std::string {
            if (i + 1 >= argc)
            {
                llvm::errs() << "Missing value for " << name << "\n";
                printUsage();
                std::exit(1);
            }
            return argv[++i];
        };

        if (arg == "--schema")
        {
            schemas.push_back(requireValue(arg));
        }
        else if (isHelpToken(arg))
        {
            helpRequested = true;
        }
        else if (arg == "--config")
        {
            configPath = requireValue(arg);
        }
        else if (arg == "--format")
        {
            options.format = requireValue(arg);
            if (options.format != "text" && options.format != "json")
            {
                llvm::errs() << "Invalid --format value: " << options.format << "\n";
                printUsage();
                return 1;
            }
        }
        else if (arg == "--kind")
        {
            options.kind = requireValue(arg);
        }
        else if (arg == "--pos")
        {
            options.pos = requireValue(arg);
        }
        else if (arg == "--out-dir")
        {
            options.outDir = requireValue(arg);
        }
        else if (arg == "--root")
        {
            roots.push_back(requireValue(arg));
        }
        else if (arg == "--with-builtin-primitives")
        {
            withBuiltinPrimitives = true;
        }
        else if (arg == "--dry-run")
        {
            dryRun = true;
        }
        else if (arg == "--no-overwrite")
        {
            noOverwrite = true;
        }
        else if (arg == "--verbose")
        {
            options.verbose = true;
        }
        else
        {
            llvm::errs() << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    if (helpRequested)
    {
        printHelp(options.command);
        return 0;
    }
    if (schemas.empty())
    {
        llvm::errs() << "At least one --schema is required\n";
        return 1;
    }
    if (options.command == "expr" && options.kind.empty())
    {
        llvm::errs() << "expr requires --kind\n";
        return 1;
    }

    kindgen::ToolConfig config;
    if (!configPath.empty())
    {
        auto loaded = kindgen::loadToolConfig(configPath);
        if (!loaded)
        {
            llvm::errs() << "error: " << llvm::toString(loaded.takeError()) << "\n";
            return 1;
        }
        config = std::move(*loaded);
    }
    if (!roots.empty())
    {
        config.generate.rootKinds = roots;
    }
    config.withBuiltinPrimitives = config.withBuiltinPrimitives || withBuiltinPrimitives;
    config.output.dryRun         = config.output.dryRun || dryRun;
    config.output.noOverwrite    = config.output.noOverwrite || noOverwrite;

    std::vector<std::string> written;
    config.output.recordedOutputs = &written;

    const auto  startTime = std::chrono::steady_clock::now();
    std::size_t failed    = 0;
    for (const auto& schemaPath : schemas)
    {
        kindgen::DiagnosticEngine diagnostics;
        llvm::Error               err = runSchema(schemaPath, options, config, diagnostics);
        printDiagnostics(diagnostics);
        if (err)
        {
            ++failed;
            reportFailure(schemaPath, std::move(err));
        }
        else if (diagnostics.hasErrors())
        {
            ++failed;
        }
    }

    const std::size_t generated = config.output.dryRun ? 0 : written.size();
    printRunSummary(options.command, schemas.size(), failed, generated, std::chrono::steady_clock::now() - startTime);
    return failed > 0 ? 1 : 0;
}
