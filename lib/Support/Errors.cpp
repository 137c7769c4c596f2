//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "kindgen/Support/Errors.h"

#include <utility>

namespace kindgen
{
namespace
{

void logContext(llvm::raw_ostream& os, const KindErrorContext& context, llvm::StringRef message)
{
    if (!context.operation.empty())
    {
        os << context.operation << " failed";
    }
    if (!context.kindName.empty())
    {
        os << (context.operation.empty() ? "" : " for ");
        if (!context.category.empty())
        {
            os << context.category << ' ';
        }
        os << "kind '" << context.kindName << "'";
    }
    if (!context.operation.empty() || !context.kindName.empty())
    {
        os << ": ";
    }
    os << message;
}

}  // namespace

char SchemaError::ID  = 0;
char CodeGenError::ID = 0;

SchemaError::SchemaError(KindErrorContext context, std::string message)
    : context_(std::move(context))
    , message_(std::move(message))
{
}

void SchemaError::log(llvm::raw_ostream& os) const
{
    os << "schema error: ";
    logContext(os, context_, message_);
}

CodeGenError::CodeGenError(KindErrorContext context, std::string message)
    : context_(std::move(context))
    , message_(std::move(message))
{
}

void CodeGenError::log(llvm::raw_ostream& os) const
{
    os << "codegen error: ";
    logContext(os, context_, message_);
}

llvm::Error makeSchemaError(KindErrorContext context, const llvm::Twine& message)
{
    return llvm::make_error<SchemaError>(std::move(context), message.str());
}

llvm::Error makeCodeGenError(KindErrorContext context, const llvm::Twine& message)
{
    return llvm::make_error<CodeGenError>(std::move(context), message.str());
}

}  // namespace kindgen
