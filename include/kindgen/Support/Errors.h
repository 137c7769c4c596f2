//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Error payloads raised while building schemas and generating deserializers.
///
//===----------------------------------------------------------------------===//
#ifndef KINDGEN_SUPPORT_ERRORS_H
#define KINDGEN_SUPPORT_ERRORS_H

#include <string>
#include <system_error>

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

namespace kindgen
{

/// @file
/// @brief `llvm::ErrorInfo` payloads for schema and code-generation failures.

/// @brief Context shared by both error payloads.
struct KindErrorContext final
{
    /// @brief Name of the failing kind; empty when no kind is involved.
    std::string kindName;

    /// @brief Category tag of the failing kind, e.g. `struct`.
    std::string category;

    /// @brief Operation that failed, e.g. `initFromDef`.
    std::string operation;
};

/// @brief Malformed or incomplete schema: missing fields, unknown categories,
/// cyclic members, duplicate registrations.
class SchemaError final : public llvm::ErrorInfo<SchemaError>
{
public:
    static char ID;

    SchemaError(KindErrorContext context, std::string message);

    void log(llvm::raw_ostream& os) const override;

    std::error_code convertToErrorCode() const override
    {
        return llvm::inconvertibleErrorCode();
    }

    [[nodiscard]] const KindErrorContext& context() const
    {
        return context_;
    }

    [[nodiscard]] const std::string& reason() const
    {
        return message_;
    }

private:
    KindErrorContext context_;
    std::string      message_;
};

/// @brief A kind cannot produce a deserializer expression.
class CodeGenError final : public llvm::ErrorInfo<CodeGenError>
{
public:
    static char ID;

    CodeGenError(KindErrorContext context, std::string message);

    void log(llvm::raw_ostream& os) const override;

    std::error_code convertToErrorCode() const override
    {
        return llvm::inconvertibleErrorCode();
    }

    [[nodiscard]] const KindErrorContext& context() const
    {
        return context_;
    }

    [[nodiscard]] const std::string& reason() const
    {
        return message_;
    }

private:
    KindErrorContext context_;
    std::string      message_;
};

/// @brief Creates a `SchemaError`.
/// @param[in] context Failing kind and operation.
/// @param[in] message Human-readable reason.
/// @return Error holding a `SchemaError` payload.
llvm::Error makeSchemaError(KindErrorContext context, const llvm::Twine& message);

/// @brief Creates a `CodeGenError`.
/// @param[in] context Failing kind and operation.
/// @param[in] message Human-readable reason.
/// @return Error holding a `CodeGenError` payload.
llvm::Error makeCodeGenError(KindErrorContext context, const llvm::Twine& message);

}  // namespace kindgen

#endif  // KINDGEN_SUPPORT_ERRORS_H
