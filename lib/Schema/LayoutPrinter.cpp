//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements layout reports.
///
//===----------------------------------------------------------------------===//

#include "kindgen/Schema/LayoutPrinter.h"

#include <sstream>
#include <utility>

#include "kindgen/Kinds/ArrayKind.h"
#include "kindgen/Kinds/BoxKind.h"
#include "kindgen/Kinds/EnumKind.h"
#include "kindgen/Kinds/OptionKind.h"
#include "kindgen/Kinds/PrimitiveKind.h"
#include "kindgen/Kinds/StructKind.h"
#include "kindgen/Schema/Schema.h"
#include "llvm/Support/Casting.h"
#include "llvm/Support/FormatVariadic.h"

namespace kindgen
{
namespace
{

llvm::json::Value nicheToJson(const std::optional<Niche>& niche)
{
    if (!niche)
    {
        return nullptr;
    }
    return llvm::json::Object{
        {"offset", niche->offset()},
        {"size", niche->size()},
        {"min", niche->min()},
        {"max", niche->max()},
    };
}

void printMembers(std::ostringstream& out, const Schema& schema, const Kind& kind)
{
    if (const auto* structKind = llvm::dyn_cast<StructKind>(&kind))
    {
        for (const auto& field : structKind->fields())
        {
            out << "    ." << field.name << " @" << field.offset << ": " << schema.kind(field.kind).name() << "\n";
        }
    }
    else if (const auto* arrayKind = llvm::dyn_cast<ArrayKind>(&kind))
    {
        out << "    [" << arrayKind->count() << "] " << schema.kind(arrayKind->element()).name() << " stride "
            << arrayKind->stride() << "\n";
    }
    else if (const auto* enumKind = llvm::dyn_cast<EnumKind>(&kind))
    {
        out << "    " << enumEncodingName(enumKind->encoding()).str() << " discriminant @" << enumKind->tagOffset()
            << " width " << enumKind->tagWidth() << "\n";
        for (const auto& variant : enumKind->variants())
        {
            out << "    " << variant.name;
            if (variant.rawValue)
            {
                out << " = " << *variant.rawValue;
            }
            if (variant.payload)
            {
                out << " (" << schema.kind(*variant.payload).name() << " @" << enumKind->payloadOffset() << ")";
            }
            out << "\n";
        }
    }
    else if (const auto* optionKind = llvm::dyn_cast<OptionKind>(&kind))
    {
        out << "    " << schema.kind(optionKind->inner()).name() << " @" << optionKind->payloadOffset()
            << (optionKind->usesInnerNiche() ? " absent in niche" : " after presence byte") << "\n";
    }
    else if (const auto* boxKind = llvm::dyn_cast<BoxKind>(&kind))
    {
        out << "    -> " << schema.kind(boxKind->target()).name() << "\n";
    }
}

llvm::json::Object kindToJson(const Schema& schema, const Kind& kind)
{
    llvm::json::Object out{
        {"name", kind.name()},
        {"kind", kind.category()},
        {"size", kind.size()},
        {"align", kind.alignment()},
        {"niche", nicheToJson(kind.niche())},
    };

    if (const auto* structKind = llvm::dyn_cast<StructKind>(&kind))
    {
        llvm::json::Array fields;
        for (const auto& field : structKind->fields())
        {
            fields.push_back(llvm::json::Object{
                {"name", field.name},
                {"type", schema.kind(field.kind).name()},
                {"offset", field.offset},
            });
        }
        out["fields"] = std::move(fields);
    }
    else if (const auto* arrayKind = llvm::dyn_cast<ArrayKind>(&kind))
    {
        out["element"] = schema.kind(arrayKind->element()).name();
        out["count"]   = arrayKind->count();
    }
    else if (const auto* enumKind = llvm::dyn_cast<EnumKind>(&kind))
    {
        out["encoding"]      = enumEncodingName(enumKind->encoding());
        out["tagOffset"]     = enumKind->tagOffset();
        out["tagSize"]       = enumKind->tagWidth();
        out["payloadOffset"] = enumKind->payloadOffset();
        llvm::json::Array variants;
        for (const auto& variant : enumKind->variants())
        {
            llvm::json::Object entry{{"name", variant.name}};
            if (variant.payload)
            {
                entry["payload"] = schema.kind(*variant.payload).name();
            }
            if (variant.rawValue)
            {
                entry["value"] = *variant.rawValue;
            }
            variants.push_back(std::move(entry));
        }
        out["variants"] = std::move(variants);
    }
    else if (const auto* optionKind = llvm::dyn_cast<OptionKind>(&kind))
    {
        out["inner"]         = schema.kind(optionKind->inner()).name();
        out["payloadOffset"] = optionKind->payloadOffset();
    }
    else if (const auto* boxKind = llvm::dyn_cast<BoxKind>(&kind))
    {
        out["target"] = schema.kind(boxKind->target()).name();
    }
    return out;
}

}  // namespace

std::string describeKindLayout(const Kind& kind)
{
    std::ostringstream out;
    out << kind.name() << " " << kind.category().str() << " size=" << kind.size() << " align=" << kind.alignment()
        << " niche=" << (kind.niche() ? kind.niche()->str() : "none");
    return out.str();
}

std::string printLayout(const Schema& schema)
{
    std::ostringstream out;
    out << "schema " << schema.name() << ": " << schema.size() << " kind(s)\n";
    for (KindId id = 0; id < schema.size(); ++id)
    {
        const Kind& kind = schema.kind(id);
        out << "  " << describeKindLayout(kind) << "\n";
        printMembers(out, schema, kind);
    }
    return out.str();
}

llvm::json::Value layoutToJson(const Schema& schema)
{
    llvm::json::Array kinds;
    for (KindId id = 0; id < schema.size(); ++id)
    {
        kinds.push_back(kindToJson(schema, schema.kind(id)));
    }
    return llvm::json::Object{
        {"schema", schema.name()},
        {"kinds", std::move(kinds)},
    };
}

std::string renderLayoutJson(const Schema& schema)
{
    return llvm::formatv("{0:2}", layoutToJson(schema)).str();
}

}  // namespace kindgen
