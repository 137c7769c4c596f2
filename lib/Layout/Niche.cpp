//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements niche arithmetic used by composite layouts.
///
//===----------------------------------------------------------------------===//

#include "kindgen/Layout/Niche.h"

#include <limits>
#include <sstream>

#include "llvm/Support/CheckedArithmetic.h"
#include "llvm/Support/MathExtras.h"

namespace kindgen
{

std::uint64_t Niche::available() const
{
    if (max_ < min_)
    {
        return 0;
    }
    const std::uint64_t span = max_ - min_;
    if (span == std::numeric_limits<std::uint64_t>::max())
    {
        return span;
    }
    return span + 1;
}

Niche Niche::shifted(const std::uint64_t delta) const
{
    return Niche(offset_ + delta, size_, min_, max_);
}

std::optional<Niche> Niche::consume(const std::uint64_t count) const
{
    if (count == 0)
    {
        return *this;
    }
    if (count >= available())
    {
        return std::nullopt;
    }
    return Niche(offset_, size_, min_ + count, max_);
}

std::string Niche::str() const
{
    std::ostringstream out;
    out << "{offset=" << offset_ << ", size=" << size_ << ", min=" << min_ << ", max=" << max_ << "}";
    return out.str();
}

std::uint64_t maxRawValue(const std::uint64_t byteWidth)
{
    if (byteWidth >= 8)
    {
        return std::numeric_limits<std::uint64_t>::max();
    }
    return (std::uint64_t{1} << (8 * byteWidth)) - 1;
}

bool isViewWidth(const std::uint64_t byteWidth)
{
    return byteWidth == 1 || byteWidth == 2 || byteWidth == 4 || byteWidth == 8;
}

std::optional<std::string> checkNicheInvariants(const Niche& niche, const std::uint64_t ownerSize)
{
    if (!isViewWidth(niche.size()))
    {
        return "niche size " + std::to_string(niche.size()) + " is not one of 1, 2, 4, 8";
    }
    if (niche.offset() % niche.size() != 0)
    {
        return "niche offset " + std::to_string(niche.offset()) + " is not a multiple of its size";
    }
    if (niche.offset() + niche.size() > ownerSize)
    {
        return "niche " + niche.str() + " exceeds kind size " + std::to_string(ownerSize);
    }
    if (niche.min() > niche.max())
    {
        return "niche " + niche.str() + " has min above max";
    }
    if (niche.max() > maxRawValue(niche.size()))
    {
        return "niche " + niche.str() + " has max outside its byte width";
    }
    return std::nullopt;
}

std::optional<Niche> placeNiche(const std::optional<Niche>& niche, const std::uint64_t delta)
{
    if (!niche)
    {
        return std::nullopt;
    }
    const Niche placed = niche->shifted(delta);
    if (placed.offset() % placed.size() != 0)
    {
        return std::nullopt;
    }
    return placed;
}

std::optional<Niche> preferNiche(const std::optional<Niche>& current, const std::optional<Niche>& candidate)
{
    if (!candidate)
    {
        return current;
    }
    if (!current || candidate->available() > current->available())
    {
        return candidate;
    }
    return current;
}

std::optional<std::uint64_t> checkedLayoutAdd(const std::uint64_t lhs, const std::uint64_t rhs)
{
    if (const auto sum = llvm::checkedAddUnsigned(lhs, rhs))
    {
        return *sum;
    }
    return std::nullopt;
}

std::optional<std::uint64_t> checkedAlignTo(const std::uint64_t value, const std::uint64_t alignment)
{
    if (alignment == 0 || value > std::numeric_limits<std::uint64_t>::max() - (alignment - 1))
    {
        return std::nullopt;
    }
    return llvm::alignTo(value, alignment);
}

}  // namespace kindgen
