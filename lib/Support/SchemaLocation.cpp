//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "kindgen/Support/SchemaLocation.h"

#include <sstream>

namespace kindgen
{

std::string SchemaLocation::str() const
{
    std::ostringstream out;
    out << (file.empty() ? "<schema>" : file);
    if (!path.empty())
    {
        out << ':' << path;
    }
    return out.str();
}

SchemaLocation SchemaLocation::child(const std::string& component) const
{
    SchemaLocation out{file, path};
    if (!out.path.empty() && !component.empty() && component.front() != '[')
    {
        out.path.push_back('.');
    }
    out.path += component;
    return out;
}

}  // namespace kindgen
