//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements typed-view read rendering and position folding.
///
//===----------------------------------------------------------------------===//

#include "kindgen/CodeGen/BufferExpr.h"

#include <cctype>

namespace kindgen
{

const char* bufferViewName(const BufferView view)
{
    switch (view)
    {
    case BufferView::Uint8:
        return "uint8";
    case BufferView::Int8:
        return "int8";
    case BufferView::Uint16:
        return "uint16";
    case BufferView::Int16:
        return "int16";
    case BufferView::Uint32:
        return "uint32";
    case BufferView::Int32:
        return "int32";
    case BufferView::BigUint64:
        return "uint64";
    case BufferView::BigInt64:
        return "int64";
    case BufferView::Float32:
        return "float32";
    case BufferView::Float64:
        return "float64";
    }
    return "uint8";
}

const char* bufferViewConstructor(const BufferView view)
{
    switch (view)
    {
    case BufferView::Uint8:
        return "Uint8Array";
    case BufferView::Int8:
        return "Int8Array";
    case BufferView::Uint16:
        return "Uint16Array";
    case BufferView::Int16:
        return "Int16Array";
    case BufferView::Uint32:
        return "Uint32Array";
    case BufferView::Int32:
        return "Int32Array";
    case BufferView::BigUint64:
        return "BigUint64Array";
    case BufferView::BigInt64:
        return "BigInt64Array";
    case BufferView::Float32:
        return "Float32Array";
    case BufferView::Float64:
        return "Float64Array";
    }
    return "Uint8Array";
}

std::uint32_t bufferViewWidth(const BufferView view)
{
    switch (view)
    {
    case BufferView::Uint8:
    case BufferView::Int8:
        return 1;
    case BufferView::Uint16:
    case BufferView::Int16:
        return 2;
    case BufferView::Uint32:
    case BufferView::Int32:
    case BufferView::Float32:
        return 4;
    case BufferView::BigUint64:
    case BufferView::BigInt64:
    case BufferView::Float64:
        return 8;
    }
    return 1;
}

std::optional<BufferView> unsignedViewForWidth(const std::uint64_t byteWidth)
{
    switch (byteWidth)
    {
    case 1:
        return BufferView::Uint8;
    case 2:
        return BufferView::Uint16;
    case 4:
        return BufferView::Uint32;
    case 8:
        return BufferView::BigUint64;
    default:
        return std::nullopt;
    }
}

std::string renderViewRead(const BufferView view, llvm::StringRef pos)
{
    const std::string name = bufferViewName(view);
    switch (bufferViewWidth(view))
    {
    case 1:
        return name + "[" + pos.str() + "]";
    case 2:
        return name + "[(" + pos.str() + ") >> 1]";
    case 4:
        return name + "[(" + pos.str() + ") >> 2]";
    default:
        return name + "[(" + pos.str() + ") >> 3]";
    }
}

std::string renderRawLiteral(const std::uint64_t value, const std::uint64_t byteWidth)
{
    std::string out = std::to_string(value);
    if (byteWidth == 8)
    {
        out.push_back('n');
    }
    return out;
}

std::optional<std::uint64_t> parseDecimalPosition(llvm::StringRef pos)
{
    pos = pos.trim();
    if (pos.empty())
    {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    if (pos.getAsInteger(10, value))
    {
        return std::nullopt;
    }
    return value;
}

bool isAtomicPosition(llvm::StringRef pos)
{
    if (pos.empty())
    {
        return false;
    }
    int depth = 0;
    for (const char c : pos)
    {
        if (c == '(' || c == '[')
        {
            ++depth;
            continue;
        }
        if (c == ')' || c == ']')
        {
            --depth;
            continue;
        }
        if (depth > 0)
        {
            continue;
        }
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$' || c == '.'))
        {
            return false;
        }
    }
    return depth == 0;
}

std::string addOffset(llvm::StringRef pos, const std::uint64_t delta)
{
    pos = pos.trim();
    if (delta == 0)
    {
        return pos.str();
    }
    if (const auto literal = parseDecimalPosition(pos))
    {
        return std::to_string(*literal + delta);
    }

    // `<atom> + <decimal>` folds into a single trailing constant.
    const std::size_t plus = pos.rfind(" + ");
    if (plus != llvm::StringRef::npos)
    {
        const llvm::StringRef base = pos.take_front(plus);
        const auto            tail = parseDecimalPosition(pos.drop_front(plus + 3));
        if (tail && isAtomicPosition(base))
        {
            return base.str() + " + " + std::to_string(*tail + delta);
        }
    }

    if (isAtomicPosition(pos))
    {
        return pos.str() + " + " + std::to_string(delta);
    }
    return "(" + pos.str() + ") + " + std::to_string(delta);
}

}  // namespace kindgen
