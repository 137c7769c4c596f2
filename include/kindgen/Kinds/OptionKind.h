//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Optional values.
///
//===----------------------------------------------------------------------===//
#ifndef KINDGEN_KINDS_OPTION_KIND_H
#define KINDGEN_KINDS_OPTION_KIND_H

#include <cstdint>
#include <string>
#include <vector>

#include "kindgen/Kinds/Kind.h"
#include "llvm/ADT/StringRef.h"

namespace kindgen
{

/// @brief A value of the inner kind or nothing.
///
/// When the inner kind has a niche, "absent" is stored as the niche minimum
/// and the option is as large as the inner kind. Otherwise a presence byte
/// precedes the payload.
///
/// Definition field: `inner` (kind name).
class OptionKind final : public Kind
{
public:
    static constexpr llvm::StringLiteral kCategory{"option"};

    OptionKind()
        : Kind(KindClass::Option)
    {
    }

    [[nodiscard]] llvm::StringRef category() const override
    {
        return kCategory;
    }

    [[nodiscard]] KindId inner() const
    {
        return inner_;
    }

    /// @brief True when "absent" lives in the inner niche.
    [[nodiscard]] bool usesInnerNiche() const
    {
        return absent_.has_value();
    }

    /// @brief Offset of the inner value; 0 with an inner niche.
    [[nodiscard]] std::uint64_t payloadOffset() const
    {
        return payloadOffset_;
    }

    [[nodiscard]] std::vector<KindId> references() const override
    {
        return {inner_};
    }

    static bool classof(const Kind* kind)
    {
        return kind->kindClass() == KindClass::Option;
    }

protected:
    llvm::Error                 initLayout(const KindDefinition& def, KindResolver& resolver) override;
    llvm::Expected<std::string> emitDeserializer(llvm::StringRef pos, DeserializerContext& context) const override;

private:
    KindId               inner_{kInvalidKindId};
    std::optional<Niche> absent_;
    std::uint64_t        payloadOffset_{0};
};

}  // namespace kindgen

#endif  // KINDGEN_KINDS_OPTION_KIND_H
