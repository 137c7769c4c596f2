//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Indirect references through a 32-bit buffer offset.
///
//===----------------------------------------------------------------------===//
#ifndef KINDGEN_KINDS_BOX_KIND_H
#define KINDGEN_KINDS_BOX_KIND_H

#include <cstdint>
#include <string>
#include <vector>

#include "kindgen/Kinds/Kind.h"
#include "llvm/ADT/StringRef.h"

namespace kindgen
{

/// @brief A 32-bit offset to a value of the target kind elsewhere in the buffer.
///
/// The target's layout is not needed to lay out the box, so boxes may close
/// cycles in the kind graph. Offset 0 never addresses a valid target.
///
/// Definition field: `target` (kind name).
class BoxKind final : public Kind
{
public:
    static constexpr llvm::StringLiteral kCategory{"box"};
    static constexpr std::uint64_t       kPointerSize{4};

    BoxKind()
        : Kind(KindClass::Box)
    {
    }

    [[nodiscard]] llvm::StringRef category() const override
    {
        return kCategory;
    }

    [[nodiscard]] KindId target() const
    {
        return target_;
    }

    [[nodiscard]] std::vector<KindId> references() const override
    {
        return {target_};
    }

    static bool classof(const Kind* kind)
    {
        return kind->kindClass() == KindClass::Box;
    }

protected:
    llvm::Error                 initLayout(const KindDefinition& def, KindResolver& resolver) override;
    llvm::Expected<std::string> emitDeserializer(llvm::StringRef pos, DeserializerContext& context) const override;

private:
    KindId target_{kInvalidKindId};
};

}  // namespace kindgen

#endif  // KINDGEN_KINDS_BOX_KIND_H
