//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "kindgen/CodeGen/JsNaming.h"

#include <cctype>
#include <cstdio>
#include <set>

namespace kindgen
{

bool isJsKeyword(llvm::StringRef name)
{
    static const std::set<std::string> kKeywords =
        {"break",  "case",     "catch",   "class",     "const",     "continue", "debugger",   "default",
         "delete", "do",       "else",    "enum",      "export",    "extends",  "false",      "finally",
         "for",    "function", "if",      "import",    "in",        "instanceof", "new",      "null",
         "return", "super",    "switch",  "this",      "throw",     "true",     "try",        "typeof",
         "var",    "void",     "while",   "with",      "let",       "static",   "yield",      "await",
         "implements", "interface", "package", "private", "protected", "public"};
    return kKeywords.contains(name.str());
}

bool isJsIdentifier(llvm::StringRef name)
{
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front())))
    {
        return false;
    }
    for (const char c : name)
    {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$'))
        {
            return false;
        }
    }
    return !isJsKeyword(name);
}

std::string sanitizeJsIdentifier(llvm::StringRef name)
{
    std::string out;
    out.reserve(name.size());
    bool pendingUnderscore = false;
    for (const char c : name)
    {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_')
        {
            if (pendingUnderscore && !out.empty())
            {
                out.push_back('_');
            }
            pendingUnderscore = false;
            out.push_back(c);
        }
        else
        {
            pendingUnderscore = true;
        }
    }
    if (out.empty())
    {
        return "_";
    }
    if (std::isdigit(static_cast<unsigned char>(out.front())))
    {
        out.insert(out.begin(), '_');
    }
    return out;
}

std::string renderJsString(llvm::StringRef text)
{
    std::string out = "\"";
    for (const char c : text)
    {
        switch (c)
        {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20)
            {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\x%02x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                out += buf;
            }
            else
            {
                out.push_back(c);
            }
            break;
        }
    }
    out.push_back('"');
    return out;
}

std::string renderJsPropertyKey(llvm::StringRef name)
{
    if (isJsIdentifier(name))
    {
        return name.str();
    }
    return renderJsString(name);
}

}  // namespace kindgen
