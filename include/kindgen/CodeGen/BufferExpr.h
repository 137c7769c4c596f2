//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Typed-view read expressions and position arithmetic for generated deserializers.
///
/// Generated code addresses one `ArrayBuffer` through same-origin little-endian
/// typed-array views. A read of width `W` at byte position `P` indexes the view of
/// width `W` at `P / W`, spelled as a right shift.
///
//===----------------------------------------------------------------------===//
#ifndef KINDGEN_CODEGEN_BUFFER_EXPR_H
#define KINDGEN_CODEGEN_BUFFER_EXPR_H

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include "llvm/ADT/StringRef.h"

namespace kindgen
{

/// @brief Typed-array views declared by every generated module.
enum class BufferView
{
    Uint8,
    Int8,
    Uint16,
    Int16,
    Uint32,
    Int32,
    BigUint64,
    BigInt64,
    Float32,
    Float64,
};

/// @brief All views in declaration order.
inline constexpr std::array<BufferView, 10> kAllBufferViews = {BufferView::Uint8,
                                                               BufferView::Int8,
                                                               BufferView::Uint16,
                                                               BufferView::Int16,
                                                               BufferView::Uint32,
                                                               BufferView::Int32,
                                                               BufferView::BigUint64,
                                                               BufferView::BigInt64,
                                                               BufferView::Float32,
                                                               BufferView::Float64};

/// @brief Variable name of a view in generated code (`uint8`, `float64`, ...).
const char* bufferViewName(BufferView view);

/// @brief Typed-array constructor of a view (`Uint8Array`, ...).
const char* bufferViewConstructor(BufferView view);

/// @brief Element width of a view in bytes.
std::uint32_t bufferViewWidth(BufferView view);

/// @brief Unsigned view used for raw reads of one width.
/// @param[in] byteWidth One of 1, 2, 4, 8.
/// @return Matching unsigned view, or empty for other widths.
std::optional<BufferView> unsignedViewForWidth(std::uint64_t byteWidth);

/// @brief Renders a view read at a byte position.
/// @param[in] view View to index.
/// @param[in] pos Byte position expression.
/// @return `uint8[pos]` for byte views, otherwise `view[(pos) >> shift]`.
std::string renderViewRead(BufferView view, llvm::StringRef pos);

/// @brief Renders a raw-value literal comparable with a read of `byteWidth` bytes.
/// @details 8-byte views yield `BigInt`, so their literals carry the `n` suffix.
std::string renderRawLiteral(std::uint64_t value, std::uint64_t byteWidth);

/// @brief Returns the value of a position that is a plain decimal literal.
std::optional<std::uint64_t> parseDecimalPosition(llvm::StringRef pos);

/// @brief Returns true when `pos` needs no parentheses as the left operand of `+`.
bool isAtomicPosition(llvm::StringRef pos);

/// @brief Renders `pos + delta`, folding constants where possible.
/// @details `P` + 0 is `P`; `12` + 4 is `16`; `P + 4` + 8 is `P + 12`;
/// compound positions are parenthesized before the addition.
std::string addOffset(llvm::StringRef pos, std::uint64_t delta);

}  // namespace kindgen

#endif  // KINDGEN_CODEGEN_BUFFER_EXPR_H
