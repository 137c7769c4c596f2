//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Location primitives identifying a definition inside a schema input.
///
//===----------------------------------------------------------------------===//
#ifndef KINDGEN_SUPPORT_SCHEMA_LOCATION_H
#define KINDGEN_SUPPORT_SCHEMA_LOCATION_H

#include <string>

namespace kindgen
{

/// @file
/// @brief Schema location primitives shared across loading and diagnostics.

/// @brief Identifies one definition (or a member of one) in a schema input.
struct SchemaLocation
{
    /// @brief Schema file path or in-memory source name.
    std::string file;

    /// @brief JSON path inside the schema, e.g. `kinds[3].fields[1]`.
    std::string path;

    /// @brief Formats this location as a human-readable string.
    /// @return Formatted location text.
    [[nodiscard]] std::string str() const;

    /// @brief Returns a location nested below this one.
    /// @param[in] component Path component appended with a `.` separator.
    /// @return Nested location.
    [[nodiscard]] SchemaLocation child(const std::string& component) const;
};

}  // namespace kindgen

#endif  // KINDGEN_SUPPORT_SCHEMA_LOCATION_H
