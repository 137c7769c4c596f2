//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Struct kinds with sequential C-like field layout.
///
//===----------------------------------------------------------------------===//
#ifndef KINDGEN_KINDS_STRUCT_KIND_H
#define KINDGEN_KINDS_STRUCT_KIND_H

#include <cstdint>
#include <string>
#include <vector>

#include "kindgen/Kinds/Kind.h"
#include "llvm/ADT/StringRef.h"

namespace kindgen
{

/// @brief One laid-out struct field.
struct StructField final
{
    std::string   name;
    KindId        kind{kInvalidKindId};
    std::uint64_t offset{0};
};

/// @brief Record of named fields.
///
/// Definition field `fields`: array of `{name, type}` objects in layout order.
/// Each field starts at the next multiple of its own alignment; the struct is
/// aligned to its most-aligned field and padded to a multiple of that alignment.
class StructKind final : public Kind
{
public:
    static constexpr llvm::StringLiteral kCategory{"struct"};

    StructKind()
        : Kind(KindClass::Struct)
    {
    }

    [[nodiscard]] llvm::StringRef category() const override
    {
        return kCategory;
    }

    [[nodiscard]] const std::vector<StructField>& fields() const
    {
        return fields_;
    }

    [[nodiscard]] std::vector<KindId> references() const override;

    static bool classof(const Kind* kind)
    {
        return kind->kindClass() == KindClass::Struct;
    }

protected:
    llvm::Error                 initLayout(const KindDefinition& def, KindResolver& resolver) override;
    llvm::Expected<std::string> emitDeserializer(llvm::StringRef pos, DeserializerContext& context) const override;

private:
    std::vector<StructField> fields_;
};

}  // namespace kindgen

#endif  // KINDGEN_KINDS_STRUCT_KIND_H
