//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Niche descriptors: raw-value ranges inside a representation that valid values never use.
///
//===----------------------------------------------------------------------===//
#ifndef KINDGEN_LAYOUT_NICHE_H
#define KINDGEN_LAYOUT_NICHE_H

#include <cstdint>
#include <optional>
#include <string>

#include "llvm/ADT/StringRef.h"

namespace kindgen
{

/// @file
/// @brief Niche model shared by every kind.

/// @brief Reserved raw-value range within a kind's bytes.
///
/// The niche covers `size` bytes at `offset`, read as one little-endian unsigned
/// integer. Raw values in `[min, max]` are never produced by a valid value of the
/// owning kind, so wrappers may reuse them as discriminants.
class Niche final
{
public:
    constexpr Niche(std::uint64_t offset, std::uint64_t size, std::uint64_t min, std::uint64_t max)
        : offset_(offset)
        , size_(size)
        , min_(min)
        , max_(max)
    {
    }

    [[nodiscard]] constexpr std::uint64_t offset() const
    {
        return offset_;
    }

    [[nodiscard]] constexpr std::uint64_t size() const
    {
        return size_;
    }

    [[nodiscard]] constexpr std::uint64_t min() const
    {
        return min_;
    }

    [[nodiscard]] constexpr std::uint64_t max() const
    {
        return max_;
    }

    /// @brief Number of free raw values, saturating at `UINT64_MAX`.
    [[nodiscard]] std::uint64_t available() const;

    /// @brief Returns the same niche seen from an enclosing kind.
    /// @param[in] delta Offset of the owning kind inside the enclosing kind.
    /// @return Niche with `offset + delta`.
    [[nodiscard]] Niche shifted(std::uint64_t delta) const;

    /// @brief Returns the niche left after the lowest `count` free values are taken.
    /// @param[in] count Number of values reserved by the caller.
    /// @return Remaining niche, or empty when no free value is left.
    [[nodiscard]] std::optional<Niche> consume(std::uint64_t count) const;

    /// @brief Formats as `{offset=O, size=S, min=A, max=B}`.
    [[nodiscard]] std::string str() const;

    bool operator==(const Niche& rhs) const = default;

private:
    std::uint64_t offset_;
    std::uint64_t size_;
    std::uint64_t min_;
    std::uint64_t max_;
};

/// @brief Largest raw value representable in `byteWidth` bytes.
/// @param[in] byteWidth One of 1, 2, 4, 8.
/// @return `2^(8*byteWidth) - 1`.
std::uint64_t maxRawValue(std::uint64_t byteWidth);

/// @brief Returns true for widths a single buffer view can read (1, 2, 4, 8).
bool isViewWidth(std::uint64_t byteWidth);

/// @brief `lhs + rhs`, or nullopt when the sum does not fit in 64 bits.
std::optional<std::uint64_t> checkedLayoutAdd(std::uint64_t lhs, std::uint64_t rhs);

/// @brief `value` rounded up to `alignment`, or nullopt when that does not fit in 64 bits.
/// @param[in] alignment A power of two.
std::optional<std::uint64_t> checkedAlignTo(std::uint64_t value, std::uint64_t alignment);

/// @brief Checks the niche invariants against the owning kind's size.
/// @param[in] niche Niche to check.
/// @param[in] ownerSize Size of the owning kind in bytes.
/// @return Empty on success, otherwise a description of the violated invariant.
std::optional<std::string> checkNicheInvariants(const Niche& niche, std::uint64_t ownerSize);

/// @brief Places a member niche inside an enclosing kind.
/// @param[in] niche Member niche, if any.
/// @param[in] delta Member offset inside the enclosing kind.
/// @return Shifted niche, or empty when the shifted niche is not aligned to its
/// own width and therefore not readable through one view.
std::optional<Niche> placeNiche(const std::optional<Niche>& niche, std::uint64_t delta);

/// @brief Chooses the niche with more free values; the first one wins ties.
/// @param[in] current Best niche so far.
/// @param[in] candidate Niche under consideration.
/// @return The preferred niche.
std::optional<Niche> preferNiche(const std::optional<Niche>& current, const std::optional<Niche>& candidate);

}  // namespace kindgen

#endif  // KINDGEN_LAYOUT_NICHE_H
