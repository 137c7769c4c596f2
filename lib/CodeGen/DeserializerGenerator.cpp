//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements expression and module generation over a built schema.
///
//===----------------------------------------------------------------------===//

#include "kindgen/CodeGen/DeserializerGenerator.h"

#include <sstream>
#include <utility>
#include <vector>

#include "kindgen/CodeGen/BufferExpr.h"
#include "kindgen/CodeGen/DeserializerContext.h"
#include "kindgen/Kinds/PrimitiveKind.h"
#include "kindgen/Schema/Schema.h"
#include "kindgen/Support/Errors.h"
#include "llvm/Support/Casting.h"
#include "llvm/Support/MathExtras.h"

namespace kindgen
{
namespace
{

llvm::Expected<KindId> resolveKind(const Schema& schema, llvm::StringRef kindName)
{
    if (const auto id = schema.find(kindName))
    {
        return *id;
    }
    return makeCodeGenError(KindErrorContext{kindName.str(), "", "generateDeserializerCall"},
                            "no kind named '" + kindName + "' in schema '" + schema.name() + "'");
}

llvm::Expected<std::vector<KindId>> selectRoots(const Schema& schema, const GenerateOptions& options)
{
    std::vector<KindId> roots;
    if (!options.rootKinds.empty())
    {
        for (const auto& name : options.rootKinds)
        {
            auto id = resolveKind(schema, name);
            if (!id)
            {
                return id.takeError();
            }
            roots.push_back(*id);
        }
        return roots;
    }
    for (const KindId id : schema.unreferencedKinds())
    {
        if (!llvm::isa<PrimitiveKind>(schema.kind(id)))
        {
            roots.push_back(id);
        }
    }
    return roots;
}

void writeViews(std::ostringstream& out)
{
    out << "let";
    for (std::size_t i = 0; i < kAllBufferViews.size(); ++i)
    {
        out << (i == 0 ? " " : ", ") << bufferViewName(kAllBufferViews[i]);
    }
    out << ";\n\n";

    out << "function initViews(buffer) {\n";
    for (const BufferView view : kAllBufferViews)
    {
        const unsigned shift = llvm::Log2_32(bufferViewWidth(view));
        out << "  " << bufferViewName(view) << " = new " << bufferViewConstructor(view) << "(buffer, 0, buffer.byteLength";
        if (shift > 0)
        {
            out << " >> " << shift;
        }
        out << ");\n";
    }
    out << "}\n\n";
}

}  // namespace

llvm::Expected<GeneratedExpression> generateDeserializerExpression(const Schema&          schema,
                                                                   llvm::StringRef        kindName,
                                                                   llvm::StringRef        pos,
                                                                   const GenerateOptions& options)
{
    auto id = resolveKind(schema, kindName);
    if (!id)
    {
        return id.takeError();
    }
    DeserializerContext context(schema, options);
    auto                expression = context.generate(*id, pos);
    if (!expression)
    {
        return expression.takeError();
    }
    return GeneratedExpression{std::move(*expression), context.renderHelpers()};
}

llvm::Expected<std::string> generateDeserializerModule(const Schema& schema, const GenerateOptions& options)
{
    auto roots = selectRoots(schema, options);
    if (!roots)
    {
        return roots.takeError();
    }

    DeserializerContext context(schema, options);
    std::ostringstream  entries;
    for (const KindId id : *roots)
    {
        const Kind&       kind = schema.kind(id);
        const std::string name = context.reserveName(options.entryPrefix + kind.name());
        auto              body = context.generate(id, "pos");
        if (!body)
        {
            return body.takeError();
        }
        entries << "export function " << name << "(buffer, pos) {\n";
        entries << "  initViews(buffer);\n";
        entries << "  if (pos === undefined) {\n";
        entries << "    pos = " << renderViewRead(BufferView::Uint32, "buffer.byteLength - " + std::to_string(options.metadataSize))
                << ";\n";
        entries << "  }\n";
        entries << "  return " << *body << ";\n";
        entries << "}\n\n";
    }

    std::ostringstream out;
    out << "// Generated by kindc from schema '" << schema.name() << "'. Do not edit.\n";
    out << "// Values are read in place through little-endian views over one ArrayBuffer.\n\n";
    writeViews(out);
    out << entries.str();
    out << context.renderHelpers();
    return out.str();
}

}  // namespace kindgen
