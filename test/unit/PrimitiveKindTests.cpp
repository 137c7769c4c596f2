//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "ExprEvaluator.h"
#include "TestSchemas.h"
#include "kindgen/CodeGen/DeserializerGenerator.h"
#include "kindgen/Kinds/PrimitiveKind.h"
#include "llvm/Support/Casting.h"

namespace
{

std::optional<std::string> expressionFor(const kindgen::Schema&          schema,
                                         llvm::StringRef                 name,
                                         llvm::StringRef                 pos,
                                         const kindgen::GenerateOptions& options = {})
{
    auto generated = kindgen::generateDeserializerExpression(schema, name, pos, options);
    if (!generated)
    {
        std::cerr << llvm::toString(generated.takeError()) << "\n";
        return std::nullopt;
    }
    return generated->expression;
}

}  // namespace

bool runPrimitiveKindTests()
{
    kindgen::DiagnosticEngine diagnostics;
    auto schema = kindgen::test::buildTestSchema(R"({"name": "prims", "kinds": [
        {"name": "I128", "kind": "primitive", "size": 16},
        {"name": "Tag", "kind": "primitive", "size": 1, "niche": {"offset": 0, "size": 1, "min": 200, "max": 255}},
        {"name": "NonZeroI32", "kind": "primitive", "size": 4}
    ]})",
                                                 diagnostics);
    if (!schema)
    {
        return false;
    }

    struct ExprCase
    {
        const char* kind;
        const char* expected;
    };
    const ExprCase cases[] = {
        {"U8", "uint8[P]"},
        {"U32", "uint32[(P) >> 2]"},
        {"F64", "float64[(P) >> 3]"},
        {"Bool", "uint8[P] === 1"},
        {"I16", "int16[(P) >> 1]"},
        {"U64", "uint64[(P) >> 3]"},
        {"F32", "float32[(P) >> 2]"},
        {"NonZeroU16", "uint16[(P) >> 1]"},
    };
    for (const auto& c : cases)
    {
        const auto expr = expressionFor(*schema, c.kind, "P");
        if (!expr || *expr != c.expected)
        {
            std::cerr << "unexpected expression for " << c.kind << ": " << expr.value_or("<error>") << "\n";
            return false;
        }
    }

    const auto* boolKind = schema->lookup("Bool");
    if (!boolKind || boolKind->size() != 1 || boolKind->alignment() != 1 ||
        boolKind->niche() != std::optional<kindgen::Niche>(kindgen::Niche(0, 1, 2, 255)))
    {
        std::cerr << "Bool layout mismatch\n";
        return false;
    }
    const auto* nonZero = schema->lookup("NonZeroU32");
    if (!nonZero || nonZero->size() != 4 || nonZero->alignment() != 4 ||
        nonZero->niche() != std::optional<kindgen::Niche>(kindgen::Niche(0, 4, 0, 0)))
    {
        std::cerr << "NonZeroU32 layout mismatch\n";
        return false;
    }
    const auto* u32 = schema->lookup("U32");
    if (!u32 || u32->niche().has_value() || !llvm::isa<kindgen::PrimitiveKind>(u32) ||
        llvm::cast<kindgen::PrimitiveKind>(u32)->traits()->type != kindgen::PrimitiveType::U32)
    {
        std::cerr << "U32 should be a niche-less table primitive\n";
        return false;
    }
    for (const auto& traits : kindgen::builtinPrimitives())
    {
        const auto* kind = schema->lookup(traits.name);
        if (!kind || kind->size() != traits.width)
        {
            std::cerr << "built-in primitive " << traits.name.str() << " missing or mis-sized\n";
            return false;
        }
        if (kind->niche() && kind->niche()->offset() + kind->niche()->size() > kind->size())
        {
            std::cerr << "niche of " << traits.name.str() << " exceeds its kind\n";
            return false;
        }
    }

    const auto* tag = schema->lookup("Tag");
    if (!tag || tag->niche() != std::optional<kindgen::Niche>(kindgen::Niche(0, 1, 200, 255)))
    {
        std::cerr << "declared niche was not applied\n";
        return false;
    }

    if (diagnostics.count(kindgen::DiagnosticLevel::Warning) != 1 ||
        !kindgen::test::contains(diagnostics.diagnostics().front().message, "NonZeroI32"))
    {
        std::cerr << "expected one warning for the undeclared NonZeroI32 niche\n";
        return false;
    }

    {
        const auto* i128 = schema->lookup("I128");
        if (!i128 || i128->size() != 16 || i128->alignment() != 8)
        {
            std::cerr << "I128 layout mismatch\n";
            return false;
        }
        auto generated = kindgen::generateDeserializerExpression(*schema, "I128", "P");
        if (generated)
        {
            std::cerr << "I128 should have no deserializer\n";
            return false;
        }
        llvm::Error err = generated.takeError();
        if (!err.isA<kindgen::CodeGenError>())
        {
            std::cerr << "I128 failure should be a CodeGenError: " << llvm::toString(std::move(err)) << "\n";
            return false;
        }
        const std::string text = llvm::toString(std::move(err));
        if (!kindgen::test::contains(text, "no deserializer generator for kind I128"))
        {
            std::cerr << "unexpected I128 failure text: " << text << "\n";
            return false;
        }
    }

    {
        auto misaligned = kindgen::generateDeserializerExpression(*schema, "U32", "2");
        if (misaligned)
        {
            std::cerr << "misaligned literal position should be rejected\n";
            return false;
        }
        llvm::consumeError(misaligned.takeError());

        kindgen::GenerateOptions relaxed;
        relaxed.checkConstantAlignment = false;
        const auto expr                = expressionFor(*schema, "U32", "2", relaxed);
        if (!expr || *expr != "uint32[(2) >> 2]")
        {
            std::cerr << "relaxed alignment should still render the read\n";
            return false;
        }
    }

    {
        const auto expr = expressionFor(*schema, "Bool", "P");
        if (!expr)
        {
            return false;
        }
        const std::vector<std::uint8_t> buffer = {1, 0};
        kindgen::test::ExprEvaluator    atZero(buffer, {{"P", 0}});
        kindgen::test::ExprEvaluator    atOne(buffer, {{"P", 1}});
        const auto                      whenOne  = atZero.evaluate(*expr);
        const auto                      whenZero = atOne.evaluate(*expr);
        if (!whenOne || whenOne->type != kindgen::test::JsValue::Type::Bool || !whenOne->boolean || !whenZero ||
            whenZero->type != kindgen::test::JsValue::Type::Bool || whenZero->boolean)
        {
            std::cerr << "Bool should read byte 1 as true and byte 0 as false\n";
            return false;
        }
    }

    if (auto error = kindgen::test::schemaBuildError(R"([{"name": "U32", "kind": "primitive", "size": 8}])"))
    {
        if (!kindgen::test::contains(*error, "declared size 8"))
        {
            std::cerr << "unexpected size mismatch text: " << *error << "\n";
            return false;
        }
    }
    else
    {
        std::cerr << "declared size mismatch should fail\n";
        return false;
    }

    if (auto error = kindgen::test::schemaBuildError(R"([{"name": "Blob", "kind": "primitive"}])"))
    {
        if (!kindgen::test::contains(*error, "declare its 'size'"))
        {
            std::cerr << "unexpected unknown primitive text: " << *error << "\n";
            return false;
        }
    }
    else
    {
        std::cerr << "primitive without width should fail\n";
        return false;
    }

    if (!kindgen::test::schemaBuildError(R"([{"name": "Odd", "kind": "primitive", "size": 4, "align": 3}])"))
    {
        std::cerr << "non power-of-two alignment should fail\n";
        return false;
    }
    if (auto error = kindgen::test::schemaBuildError(R"([{"name": "U32", "kind": "primitive", "align": 2}])"))
    {
        if (!kindgen::test::contains(*error, "declared align 2 is below the 4-byte view width of U32"))
        {
            std::cerr << "unexpected under-aligned primitive text: " << *error << "\n";
            return false;
        }
    }
    else
    {
        std::cerr << "table primitive aligned below its view width should fail\n";
        return false;
    }
    {
        kindgen::DiagnosticEngine alignedDiagnostics;
        auto aligned = kindgen::test::buildTestSchema(R"([{"name": "U32", "kind": "primitive", "align": 4}])",
                                                      alignedDiagnostics);
        if (!aligned || aligned->lookup("U32")->alignment() != 4)
        {
            std::cerr << "table primitive declaring its own width as align should build\n";
            return false;
        }
    }
    if (!kindgen::test::schemaBuildError(
            R"([{"name": "Bad", "kind": "primitive", "size": 2, "niche": {"offset": 0, "size": 4, "min": 0, "max": 0}}])"))
    {
        std::cerr << "niche larger than its kind should fail\n";
        return false;
    }

    {
        kindgen::DiagnosticEngine overrideDiagnostics;
        auto overridden = kindgen::test::buildTestSchema(R"([{"name": "NonZeroU32", "kind": "primitive", "niche": null}])",
                                                         overrideDiagnostics);
        if (!overridden || overridden->lookup("NonZeroU32")->niche().has_value())
        {
            std::cerr << "explicit null niche should remove the table niche\n";
            return false;
        }
    }

    return true;
}
