//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "ExprEvaluator.h"
#include "TestSchemas.h"
#include "kindgen/CodeGen/DeserializerGenerator.h"
#include "kindgen/Kinds/StructKind.h"
#include "llvm/Support/Casting.h"

bool runStructKindTests()
{
    kindgen::DiagnosticEngine diagnostics;
    auto schema = kindgen::test::buildTestSchema(R"({"name": "structs", "kinds": [
        {"name": "Pair", "kind": "struct", "fields": [{"name": "a", "type": "U8"}, {"name": "b", "type": "U32"}]},
        {"name": "Empty", "kind": "struct", "fields": []},
        {"name": "Flags", "kind": "struct", "fields": [{"name": "x", "type": "U16"}, {"name": "ok", "type": "Bool"}]},
        {"name": "Mixed", "kind": "struct", "fields": [{"name": "id", "type": "NonZeroU32"}, {"name": "on", "type": "Bool"}]},
        {"name": "Outer", "kind": "struct", "fields": [{"name": "head", "type": "U8"}, {"name": "pair", "type": "Pair"}]},
        {"name": "Quoted", "kind": "struct", "fields": [{"name": "default", "type": "U8"}, {"name": "x-y", "type": "U8"}]}
    ]})",
                                                 diagnostics);
    if (!schema)
    {
        return false;
    }

    const auto* pair = llvm::dyn_cast<kindgen::StructKind>(schema->lookup("Pair"));
    if (!pair || pair->size() != 8 || pair->alignment() != 4 || pair->niche().has_value() ||
        pair->fields().size() != 2 || pair->fields()[0].offset != 0 || pair->fields()[1].offset != 4)
    {
        std::cerr << "Pair layout mismatch\n";
        return false;
    }

    auto generated = kindgen::generateDeserializerExpression(*schema, "Pair", "P");
    if (!generated)
    {
        std::cerr << llvm::toString(generated.takeError()) << "\n";
        return false;
    }
    if (generated->expression != "{a: uint8[P], b: uint32[(P + 4) >> 2]}" || !generated->helpers.empty())
    {
        std::cerr << "unexpected Pair expression: " << generated->expression << "\n";
        return false;
    }

    {
        const std::vector<std::uint8_t> buffer = {0, 0, 0, 0, 9, 0xAA, 0xAA, 0xAA, 0x01, 0x02, 0, 0};
        kindgen::test::ExprEvaluator    evaluator(buffer, {{"P", 4}});
        const auto                      value = evaluator.evaluate(generated->expression);
        if (!value || !value->member("a") || value->member("a")->number != 9 || !value->member("b") ||
            value->member("b")->number != 0x0201)
        {
            std::cerr << "Pair evaluation mismatch " << evaluator.error() << "\n";
            return false;
        }
    }

    {
        auto empty = kindgen::generateDeserializerExpression(*schema, "Empty", "P");
        const auto* emptyKind = schema->lookup("Empty");
        if (!empty || empty->expression != "{}" || emptyKind->size() != 0 || emptyKind->alignment() != 1)
        {
            if (!empty)
            {
                llvm::consumeError(empty.takeError());
            }
            std::cerr << "empty struct should be a zero-sized {}\n";
            return false;
        }
    }

    const auto* flags = schema->lookup("Flags");
    if (flags->size() != 4 || flags->alignment() != 2 ||
        flags->niche() != std::optional<kindgen::Niche>(kindgen::Niche(2, 1, 2, 255)))
    {
        std::cerr << "Flags should expose the Bool niche at offset 2\n";
        return false;
    }

    const auto* mixed = schema->lookup("Mixed");
    if (mixed->size() != 8 || mixed->niche() != std::optional<kindgen::Niche>(kindgen::Niche(4, 1, 2, 255)))
    {
        std::cerr << "Mixed should prefer the member niche with more free values\n";
        return false;
    }

    {
        auto outer = kindgen::generateDeserializerExpression(*schema, "Outer", "pos + 8");
        if (!outer || outer->expression != "{head: uint8[pos + 8], pair: {a: uint8[pos + 12], b: uint32[(pos + 16) >> 2]}}")
        {
            if (!outer)
            {
                llvm::consumeError(outer.takeError());
            }
            std::cerr << "nested struct offsets should fold into the position\n";
            return false;
        }
        if (schema->lookup("Outer")->size() != 12)
        {
            std::cerr << "Outer size mismatch\n";
            return false;
        }
    }

    {
        auto quoted = kindgen::generateDeserializerExpression(*schema, "Quoted", "0");
        if (!quoted || quoted->expression != "{\"default\": uint8[0], \"x-y\": uint8[1]}")
        {
            if (!quoted)
            {
                llvm::consumeError(quoted.takeError());
            }
            std::cerr << "non-identifier field names should be quoted\n";
            return false;
        }
    }

    for (kindgen::KindId id = 0; id < schema->size(); ++id)
    {
        const auto& kind = schema->kind(id);
        if (kind.niche() && kind.niche()->offset() + kind.niche()->size() > kind.size())
        {
            std::cerr << kind.name() << " niche " << kind.niche()->str() << " exceeds its size\n";
            return false;
        }
    }

    if (auto error = kindgen::test::schemaBuildError(
            R"([{"name": "Twice", "kind": "struct", "fields": [{"name": "a", "type": "U8"}, {"name": "a", "type": "U8"}]}])"))
    {
        if (!kindgen::test::contains(*error, "duplicate field 'a'") ||
            !kindgen::test::contains(*error, "test.json:kinds[0].fields[1]"))
        {
            std::cerr << "unexpected duplicate field text: " << *error << "\n";
            return false;
        }
    }
    else
    {
        std::cerr << "duplicate field should fail\n";
        return false;
    }

    if (!kindgen::test::schemaBuildError(R"([{"name": "NoFields", "kind": "struct"}])") ||
        !kindgen::test::schemaBuildError(R"([{"name": "BadField", "kind": "struct", "fields": [3]}])") ||
        !kindgen::test::schemaBuildError(R"([{"name": "NoType", "kind": "struct", "fields": [{"name": "a"}]}])"))
    {
        std::cerr << "malformed struct definitions should fail\n";
        return false;
    }

    if (!kindgen::test::schemaBuildError(
            R"([{"name": "Sized", "kind": "struct", "size": 4, "fields": [{"name": "a", "type": "U32"}, {"name": "b", "type": "U8"}]}])"))
    {
        std::cerr << "declared struct size that disagrees with the layout should fail\n";
        return false;
    }

    if (auto error = kindgen::test::schemaBuildError(R"([
            {"name": "Big", "kind": "array", "element": "U64", "count": 1152921504606846976},
            {"name": "Huge", "kind": "struct", "fields": [
                {"name": "a", "type": "Big"}, {"name": "b", "type": "Big"}, {"name": "c", "type": "U64"}]}
        ])"))
    {
        if (!kindgen::test::contains(*error, "field 'b' of type 'Big' overflows the struct layout") ||
            !kindgen::test::contains(*error, "test.json:kinds[1].fields[1]"))
        {
            std::cerr << "unexpected struct overflow text: " << *error << "\n";
            return false;
        }
    }
    else
    {
        std::cerr << "struct whose members exceed 64-bit offsets should fail\n";
        return false;
    }

    {
        // Size 2^63 with alignment 8 still fits exactly.
        kindgen::DiagnosticEngine edgeDiagnostics;
        auto                      edge = kindgen::test::buildTestSchema(R"([
            {"name": "Big", "kind": "array", "element": "U64", "count": 1152921504606846976},
            {"name": "Edge", "kind": "struct", "fields": [{"name": "a", "type": "Big"}]}
        ])",
                                                   edgeDiagnostics);
        if (!edge || edge->lookup("Edge")->size() != (std::uint64_t{1} << 63))
        {
            std::cerr << "a struct of one 2^63-byte member should lay out\n";
            return false;
        }
    }

    return true;
}
