//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Fixed-length array kinds.
///
//===----------------------------------------------------------------------===//
#ifndef KINDGEN_KINDS_ARRAY_KIND_H
#define KINDGEN_KINDS_ARRAY_KIND_H

#include <cstdint>
#include <string>
#include <vector>

#include "kindgen/Kinds/Kind.h"
#include "llvm/ADT/StringRef.h"

namespace kindgen
{

/// @brief `count` consecutive elements of one kind.
///
/// Definition fields: `element` (kind name) and `count`.
class ArrayKind final : public Kind
{
public:
    static constexpr llvm::StringLiteral kCategory{"array"};

    ArrayKind()
        : Kind(KindClass::Array)
    {
    }

    [[nodiscard]] llvm::StringRef category() const override
    {
        return kCategory;
    }

    [[nodiscard]] KindId element() const
    {
        return element_;
    }

    [[nodiscard]] std::uint64_t count() const
    {
        return count_;
    }

    /// @brief Distance between consecutive elements in bytes.
    [[nodiscard]] std::uint64_t stride() const
    {
        return stride_;
    }

    [[nodiscard]] std::vector<KindId> references() const override
    {
        return {element_};
    }

    static bool classof(const Kind* kind)
    {
        return kind->kindClass() == KindClass::Array;
    }

protected:
    llvm::Error                 initLayout(const KindDefinition& def, KindResolver& resolver) override;
    llvm::Expected<std::string> emitDeserializer(llvm::StringRef pos, DeserializerContext& context) const override;
    llvm::Expected<std::string> emitHelperBody(DeserializerContext& context) const override;

private:
    KindId        element_{kInvalidKindId};
    std::uint64_t count_{0};
    std::uint64_t stride_{0};
};

}  // namespace kindgen

#endif  // KINDGEN_KINDS_ARRAY_KIND_H
