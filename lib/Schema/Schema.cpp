//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "kindgen/Schema/Schema.h"

#include <utility>

namespace kindgen
{

std::optional<KindId> Schema::find(llvm::StringRef name) const
{
    const auto it = index_.find(name.str());
    if (it == index_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

const Kind* Schema::lookup(llvm::StringRef name) const
{
    const auto id = find(name);
    return id ? kinds_[*id].get() : nullptr;
}

std::vector<KindId> Schema::unreferencedKinds() const
{
    std::vector<bool> referenced(kinds_.size(), false);
    for (const auto& kind : kinds_)
    {
        // A box only points at a value stored elsewhere.
        if (kind->kindClass() == KindClass::Box)
        {
            continue;
        }
        for (const KindId member : kind->references())
        {
            if (member < referenced.size() && member != kind->id())
            {
                referenced[member] = true;
            }
        }
    }

    std::vector<KindId> out;
    for (KindId id = 0; id < kinds_.size(); ++id)
    {
        if (!referenced[id])
        {
            out.push_back(id);
        }
    }
    return out;
}

KindId Schema::add(std::string name, std::unique_ptr<Kind> kind)
{
    const auto id = static_cast<KindId>(kinds_.size());
    kind->setId(id);
    index_.emplace(std::move(name), id);
    kinds_.push_back(std::move(kind));
    return id;
}

}  // namespace kindgen
