//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Test-only evaluator for generated read expressions.
///
/// Supports the inline subset the generator emits: numeric and BigInt
/// literals, strings, `null`, variables, view reads, `+ - * >> ===`, the
/// conditional operator, and object and array literals. Helper calls are
/// not supported.
///
//===----------------------------------------------------------------------===//
#ifndef KINDGEN_TEST_UNIT_EXPR_EVALUATOR_H
#define KINDGEN_TEST_UNIT_EXPR_EVALUATOR_H

#include <cctype>
#include <cstdint>
#include <cstring>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kindgen::test
{

struct JsValue final
{
    enum class Type
    {
        Null,
        Bool,
        Number,
        BigInt,
        String,
        Object,
        Array,
    };

    Type                     type{Type::Null};
    bool                     boolean{false};
    double                   number{0};
    std::uint64_t            bigint{0};
    std::string              text;
    std::vector<std::string> keys;
    std::vector<JsValue>     items;

    [[nodiscard]] bool isNull() const
    {
        return type == Type::Null;
    }

    /// @brief Member of an object value, or null.
    [[nodiscard]] const JsValue* member(const std::string& key) const
    {
        for (std::size_t i = 0; i < keys.size(); ++i)
        {
            if (keys[i] == key)
            {
                return &items[i];
            }
        }
        return nullptr;
    }

    static JsValue makeBool(bool value)
    {
        JsValue out;
        out.type    = Type::Bool;
        out.boolean = value;
        return out;
    }

    static JsValue makeNumber(double value)
    {
        JsValue out;
        out.type   = Type::Number;
        out.number = value;
        return out;
    }

    static JsValue makeBigInt(std::uint64_t value)
    {
        JsValue out;
        out.type   = Type::BigInt;
        out.bigint = value;
        return out;
    }

    static JsValue makeString(std::string value)
    {
        JsValue out;
        out.type = Type::String;
        out.text = std::move(value);
        return out;
    }
};

/// @brief Evaluates one expression against a little-endian byte buffer.
class ExprEvaluator final
{
public:
    ExprEvaluator(const std::vector<std::uint8_t>& buffer, std::map<std::string, double> variables)
        : buffer_(buffer)
        , variables_(std::move(variables))
    {
    }

    /// @brief Evaluates `expr`; on failure returns nothing and sets `error()`.
    std::optional<JsValue> evaluate(const std::string& expr)
    {
        text_  = expr;
        at_    = 0;
        error_.clear();
        JsValue value = parseConditional();
        skipSpace();
        if (error_.empty() && at_ != text_.size())
        {
            fail("trailing input");
        }
        if (!error_.empty())
        {
            return std::nullopt;
        }
        return value;
    }

    [[nodiscard]] const std::string& error() const
    {
        return error_;
    }

private:
    const std::vector<std::uint8_t>& buffer_;
    std::map<std::string, double>    variables_;
    std::string                      text_;
    std::size_t                      at_{0};
    std::string                      error_;

    void fail(const std::string& message)
    {
        if (error_.empty())
        {
            error_ = message + " at offset " + std::to_string(at_) + " in '" + text_ + "'";
        }
    }

    void skipSpace()
    {
        while (at_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[at_])) != 0)
        {
            ++at_;
        }
    }

    bool accept(const char* token)
    {
        skipSpace();
        const std::size_t length = std::strlen(token);
        if (text_.compare(at_, length, token) == 0)
        {
            at_ += length;
            return true;
        }
        return false;
    }

    void expect(const char* token)
    {
        if (!accept(token))
        {
            fail(std::string("expected '") + token + "'");
        }
    }

    static bool truthy(const JsValue& value)
    {
        switch (value.type)
        {
        case JsValue::Type::Null:
            return false;
        case JsValue::Type::Bool:
            return value.boolean;
        case JsValue::Type::Number:
            return value.number != 0;
        case JsValue::Type::BigInt:
            return value.bigint != 0;
        case JsValue::Type::String:
            return !value.text.empty();
        case JsValue::Type::Object:
        case JsValue::Type::Array:
            return true;
        }
        return false;
    }

    static bool strictEquals(const JsValue& lhs, const JsValue& rhs)
    {
        if (lhs.type != rhs.type)
        {
            return false;
        }
        switch (lhs.type)
        {
        case JsValue::Type::Null:
            return true;
        case JsValue::Type::Bool:
            return lhs.boolean == rhs.boolean;
        case JsValue::Type::Number:
            return lhs.number == rhs.number;
        case JsValue::Type::BigInt:
            return lhs.bigint == rhs.bigint;
        case JsValue::Type::String:
            return lhs.text == rhs.text;
        case JsValue::Type::Object:
        case JsValue::Type::Array:
            return false;
        }
        return false;
    }

    JsValue parseConditional()
    {
        JsValue condition = parseEquality();
        if (!accept("?"))
        {
            return condition;
        }
        JsValue whenTrue = parseConditional();
        expect(":");
        JsValue whenFalse = parseConditional();
        return truthy(condition) ? whenTrue : whenFalse;
    }

    JsValue parseEquality()
    {
        JsValue lhs = parseShift();
        while (accept("==="))
        {
            const JsValue rhs = parseShift();
            lhs               = JsValue::makeBool(strictEquals(lhs, rhs));
        }
        return lhs;
    }

    JsValue parseShift()
    {
        JsValue lhs = parseAdditive();
        while (accept(">>"))
        {
            const JsValue rhs = parseAdditive();
            if (lhs.type != JsValue::Type::Number || rhs.type != JsValue::Type::Number)
            {
                fail("'>>' needs numbers");
                return lhs;
            }
            const auto value = static_cast<std::int64_t>(lhs.number) >> static_cast<int>(rhs.number);
            lhs              = JsValue::makeNumber(static_cast<double>(value));
        }
        return lhs;
    }

    JsValue parseAdditive()
    {
        JsValue lhs = parseMultiplicative();
        for (;;)
        {
            const bool plus = accept("+");
            if (!plus && !acceptMinus())
            {
                return lhs;
            }
            const JsValue rhs = parseMultiplicative();
            if (lhs.type != JsValue::Type::Number || rhs.type != JsValue::Type::Number)
            {
                fail("arithmetic needs numbers");
                return lhs;
            }
            lhs = JsValue::makeNumber(plus ? lhs.number + rhs.number : lhs.number - rhs.number);
        }
    }

    bool acceptMinus()
    {
        skipSpace();
        if (at_ < text_.size() && text_[at_] == '-')
        {
            ++at_;
            return true;
        }
        return false;
    }

    JsValue parseMultiplicative()
    {
        JsValue lhs = parsePrimary();
        while (accept("*"))
        {
            const JsValue rhs = parsePrimary();
            if (lhs.type != JsValue::Type::Number || rhs.type != JsValue::Type::Number)
            {
                fail("'*' needs numbers");
                return lhs;
            }
            lhs = JsValue::makeNumber(lhs.number * rhs.number);
        }
        return lhs;
    }

    std::string parseIdentifier()
    {
        std::string out;
        while (at_ < text_.size() &&
               (std::isalnum(static_cast<unsigned char>(text_[at_])) != 0 || text_[at_] == '_' || text_[at_] == '$'))
        {
            out.push_back(text_[at_++]);
        }
        return out;
    }

    JsValue parseStringLiteral()
    {
        std::string out;
        ++at_;
        while (at_ < text_.size() && text_[at_] != '"')
        {
            if (text_[at_] == '\\' && at_ + 1 < text_.size())
            {
                ++at_;
            }
            out.push_back(text_[at_++]);
        }
        if (at_ >= text_.size())
        {
            fail("unterminated string");
            return {};
        }
        ++at_;
        return JsValue::makeString(std::move(out));
    }

    JsValue parseNumberLiteral()
    {
        std::uint64_t value = 0;
        while (at_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[at_])) != 0)
        {
            value = value * 10 + static_cast<std::uint64_t>(text_[at_++] - '0');
        }
        if (at_ < text_.size() && text_[at_] == 'n')
        {
            ++at_;
            return JsValue::makeBigInt(value);
        }
        return JsValue::makeNumber(static_cast<double>(value));
    }

    JsValue parseObjectLiteral()
    {
        JsValue out;
        out.type = JsValue::Type::Object;
        if (accept("}"))
        {
            return out;
        }
        do
        {
            skipSpace();
            std::string key;
            if (at_ < text_.size() && text_[at_] == '"')
            {
                key = parseStringLiteral().text;
            }
            else
            {
                key = parseIdentifier();
            }
            if (key.empty())
            {
                fail("expected property key");
                return out;
            }
            expect(":");
            out.keys.push_back(key);
            out.items.push_back(parseConditional());
        } while (accept(","));
        expect("}");
        return out;
    }

    JsValue parseArrayLiteral()
    {
        JsValue out;
        out.type = JsValue::Type::Array;
        if (accept("]"))
        {
            return out;
        }
        do
        {
            out.items.push_back(parseConditional());
        } while (accept(","));
        expect("]");
        return out;
    }

    JsValue readView(const std::string& view, double index)
    {
        struct ViewInfo
        {
            const char* name;
            std::size_t width;
            bool        isSigned;
            bool        isFloat;
            bool        isBigInt;
        };
        static const ViewInfo kViews[] = {
            {"uint8", 1, false, false, false},
            {"int8", 1, true, false, false},
            {"uint16", 2, false, false, false},
            {"int16", 2, true, false, false},
            {"uint32", 4, false, false, false},
            {"int32", 4, true, false, false},
            {"uint64", 8, false, false, true},
            {"int64", 8, true, false, true},
            {"float32", 4, false, true, false},
            {"float64", 8, false, true, false},
        };
        for (const auto& info : kViews)
        {
            if (view != info.name)
            {
                continue;
            }
            const auto offset = static_cast<std::size_t>(index) * info.width;
            if (index < 0 || offset + info.width > buffer_.size())
            {
                fail("read of " + view + " out of bounds");
                return {};
            }
            std::uint64_t raw = 0;
            for (std::size_t i = 0; i < info.width; ++i)
            {
                raw |= static_cast<std::uint64_t>(buffer_[offset + i]) << (8 * i);
            }
            if (info.isFloat)
            {
                if (info.width == 4)
                {
                    const auto bits  = static_cast<std::uint32_t>(raw);
                    float      value = 0;
                    std::memcpy(&value, &bits, sizeof(value));
                    return JsValue::makeNumber(value);
                }
                double value = 0;
                std::memcpy(&value, &raw, sizeof(value));
                return JsValue::makeNumber(value);
            }
            if (info.isBigInt)
            {
                return JsValue::makeBigInt(raw);
            }
            if (info.isSigned)
            {
                const std::uint64_t signBit = std::uint64_t{1} << (8 * info.width - 1);
                const auto          value   = static_cast<std::int64_t>(raw ^ signBit) - static_cast<std::int64_t>(signBit);
                return JsValue::makeNumber(static_cast<double>(value));
            }
            return JsValue::makeNumber(static_cast<double>(raw));
        }
        fail("unknown view '" + view + "'");
        return {};
    }

    JsValue parsePrimary()
    {
        skipSpace();
        if (at_ >= text_.size())
        {
            fail("unexpected end of input");
            return {};
        }
        const char c = text_[at_];
        if (c == '(')
        {
            ++at_;
            JsValue value = parseConditional();
            expect(")");
            return value;
        }
        if (c == '{')
        {
            ++at_;
            return parseObjectLiteral();
        }
        if (c == '[')
        {
            ++at_;
            return parseArrayLiteral();
        }
        if (c == '"')
        {
            return parseStringLiteral();
        }
        if (std::isdigit(static_cast<unsigned char>(c)) != 0)
        {
            return parseNumberLiteral();
        }

        const std::string name = parseIdentifier();
        if (name.empty())
        {
            fail(std::string("unexpected character '") + c + "'");
            return {};
        }
        if (name == "null")
        {
            return {};
        }
        if (name == "true" || name == "false")
        {
            return JsValue::makeBool(name == "true");
        }
        if (accept("["))
        {
            const JsValue index = parseConditional();
            expect("]");
            if (index.type != JsValue::Type::Number)
            {
                fail("view index must be a number");
                return {};
            }
            return readView(name, index.number);
        }
        if (accept("("))
        {
            fail("helper call '" + name + "' is not supported");
            return {};
        }
        const auto it = variables_.find(name);
        if (it == variables_.end())
        {
            fail("unbound variable '" + name + "'");
            return {};
        }
        return JsValue::makeNumber(it->second);
    }
};

}  // namespace kindgen::test

#endif  // KINDGEN_TEST_UNIT_EXPR_EVALUATOR_H
