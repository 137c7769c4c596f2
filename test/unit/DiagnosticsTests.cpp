//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>
#include <utility>

#include "kindgen/Support/Diagnostics.h"
#include "kindgen/Support/Errors.h"
#include "kindgen/Support/SchemaLocation.h"
#include "llvm/Support/Error.h"

bool runDiagnosticsTests()
{
    const kindgen::SchemaLocation root{"demo.json", "kinds[2]"};
    if (root.str() != "demo.json:kinds[2]" || root.child("fields[1]").str() != "demo.json:kinds[2].fields[1]" ||
        root.child("[0]").str() != "demo.json:kinds[2][0]" || kindgen::SchemaLocation{}.str() != "<schema>")
    {
        std::cerr << "schema location formatting mismatch\n";
        return false;
    }

    kindgen::DiagnosticEngine diagnostics;
    diagnostics.note(root, "laid out");
    diagnostics.warning(root, "suspicious");
    if (diagnostics.hasErrors() || diagnostics.count(kindgen::DiagnosticLevel::Warning) != 1)
    {
        std::cerr << "warnings should not count as errors\n";
        return false;
    }
    diagnostics.error(root, "broken");
    if (!diagnostics.hasErrors() || diagnostics.diagnostics().size() != 3 ||
        diagnostics.diagnostics().back().message != "broken")
    {
        std::cerr << "error diagnostic not recorded\n";
        return false;
    }
    if (std::string(kindgen::diagnosticLevelName(kindgen::DiagnosticLevel::Warning)) != "warning")
    {
        std::cerr << "diagnostic level name mismatch\n";
        return false;
    }

    {
        llvm::Error err = kindgen::makeSchemaError(kindgen::KindErrorContext{"Pair", "struct", "initFromDef"}, "boom");
        if (!err.isA<kindgen::SchemaError>())
        {
            llvm::consumeError(std::move(err));
            std::cerr << "schema error has the wrong class\n";
            return false;
        }
        const std::string text = llvm::toString(std::move(err));
        if (text != "schema error: initFromDef failed for struct kind 'Pair': boom")
        {
            std::cerr << "unexpected schema error text: " << text << "\n";
            return false;
        }
    }
    {
        llvm::Error err = kindgen::makeCodeGenError(kindgen::KindErrorContext{"I128", "primitive", "generateDeserializerCall"},
                                                    "no generator");
        bool        sawContext = false;
        llvm::handleAllErrors(std::move(err), [&](const kindgen::CodeGenError& e) {
            sawContext = e.context().kindName == "I128" && e.context().category == "primitive" &&
                         e.context().operation == "generateDeserializerCall" && e.reason() == "no generator";
        });
        if (!sawContext)
        {
            std::cerr << "codegen error context mismatch\n";
            return false;
        }
    }
    {
        const std::string text = llvm::toString(kindgen::makeSchemaError(kindgen::KindErrorContext{}, "bare"));
        if (text != "schema error: bare")
        {
            std::cerr << "context-free error text mismatch: " << text << "\n";
            return false;
        }
    }
    return true;
}
