//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements generation-run state: kind dispatch, helper registration, and name allocation.
///
//===----------------------------------------------------------------------===//

#include "kindgen/CodeGen/DeserializerContext.h"

#include <utility>

#include "kindgen/CodeGen/BufferExpr.h"
#include "kindgen/CodeGen/JsNaming.h"
#include "kindgen/Schema/Schema.h"
#include "kindgen/Support/Errors.h"
#include "llvm/Support/raw_ostream.h"

namespace kindgen
{
namespace
{

void appendIndented(llvm::raw_ostream& out, llvm::StringRef body, llvm::StringRef indent)
{
    while (!body.empty())
    {
        const auto [line, rest] = body.split('\n');
        if (!line.empty())
        {
            out << indent << line;
        }
        out << '\n';
        body = rest;
    }
}

}  // namespace

DeserializerContext::DeserializerContext(const Schema& schema, const GenerateOptions& options)
    : schema_(schema)
    , options_(options)
{
    for (const BufferView view : kAllBufferViews)
    {
        usedNames_.insert(bufferViewName(view));
    }
    usedNames_.insert("initViews");
    usedNames_.insert("buffer");
    usedNames_.insert("pos");
}

llvm::Expected<std::string> DeserializerContext::generate(const KindId id, llvm::StringRef pos)
{
    if (id >= schema_.size())
    {
        return makeCodeGenError(KindErrorContext{"", "", "generateDeserializerCall"},
                                "no kind with id " + llvm::Twine(id) + " in schema '" + schema_.name() + "'");
    }
    return schema_.kind(id).generateDeserializerCall(pos, *this);
}

llvm::Expected<std::string> DeserializerContext::callHelper(const KindId id, llvm::StringRef pos)
{
    if (id >= schema_.size())
    {
        return makeCodeGenError(KindErrorContext{"", "", "generateDeserializerCall"},
                                "no kind with id " + llvm::Twine(id) + " in schema '" + schema_.name() + "'");
    }

    const std::string call = "(" + pos.trim().str() + ")";
    if (const auto it = helperIndex_.find(id); it != helperIndex_.end())
    {
        return helpers_[it->second].name + call;
    }

    // The body may register further helpers, so only the index is kept across it.
    const Kind&       kind  = schema_.kind(id);
    const std::size_t index = helpers_.size();
    helpers_.push_back(HelperDeclaration{id, reserveName(options_.helperPrefix + kind.name()), ""});
    helperIndex_.emplace(id, index);

    auto body = kind.generateHelperBody(*this);
    if (!body)
    {
        return body.takeError();
    }
    helpers_[index].body = std::move(*body);
    return helpers_[index].name + call;
}

std::string DeserializerContext::reserveName(llvm::StringRef base)
{
    const std::string stem      = sanitizeJsIdentifier(base);
    std::string       candidate = stem;
    for (unsigned suffix = 1; usedNames_.contains(candidate) || isJsKeyword(candidate); ++suffix)
    {
        candidate = stem + "_" + std::to_string(suffix);
    }
    usedNames_.insert(candidate);
    return candidate;
}

std::string DeserializerContext::allocateTemp(llvm::StringRef stem)
{
    const std::string base = sanitizeJsIdentifier(stem);
    unsigned&         next = tempCounters_[base];
    std::string       candidate;
    do
    {
        candidate = base + std::to_string(next++);
    } while (usedNames_.contains(candidate));
    usedNames_.insert(candidate);
    return candidate;
}

std::string DeserializerContext::renderHelpers() const
{
    std::string              text;
    llvm::raw_string_ostream out(text);
    for (const auto& helper : helpers_)
    {
        out << "function " << helper.name << "(pos) {\n";
        appendIndented(out, helper.body, "  ");
        out << "}\n\n";
    }
    return out.str();
}

}  // namespace kindgen
