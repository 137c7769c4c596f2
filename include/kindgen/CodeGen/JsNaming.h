//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// JavaScript identifier and literal spelling helpers for generated deserializers.
///
//===----------------------------------------------------------------------===//
#ifndef KINDGEN_CODEGEN_JS_NAMING_H
#define KINDGEN_CODEGEN_JS_NAMING_H

#include <string>

#include "llvm/ADT/StringRef.h"

namespace kindgen
{

/// @brief Returns true for reserved words that cannot name a binding.
bool isJsKeyword(llvm::StringRef name);

/// @brief Returns true when `name` is a valid identifier that is not reserved.
bool isJsIdentifier(llvm::StringRef name);

/// @brief Maps an arbitrary kind name onto an identifier fragment.
/// @details `Option<Box<Node>>` becomes `Option_Box_Node`.
std::string sanitizeJsIdentifier(llvm::StringRef name);

/// @brief Renders a double-quoted string literal.
std::string renderJsString(llvm::StringRef text);

/// @brief Renders an object-literal key, quoting it when it is not an identifier.
std::string renderJsPropertyKey(llvm::StringRef name);

}  // namespace kindgen

#endif  // KINDGEN_CODEGEN_JS_NAMING_H
