//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements diagnostic collection helpers.
///
/// The diagnostic engine records schema-aware notes, warnings, and errors consumed by the driver.
///
//===----------------------------------------------------------------------===//

#include "kindgen/Support/Diagnostics.h"

#include <algorithm>
#include <utility>

namespace kindgen
{

const char* diagnosticLevelName(const DiagnosticLevel level)
{
    switch (level)
    {
    case DiagnosticLevel::Note:
        return "note";
    case DiagnosticLevel::Warning:
        return "warning";
    case DiagnosticLevel::Error:
        return "error";
    }
    return "error";
}

void DiagnosticEngine::report(DiagnosticLevel level, const SchemaLocation& location, std::string message)
{
    diagnostics_.push_back(Diagnostic{level, location, std::move(message)});
}

void DiagnosticEngine::note(const SchemaLocation& location, std::string message)
{
    report(DiagnosticLevel::Note, location, std::move(message));
}

void DiagnosticEngine::warning(const SchemaLocation& location, std::string message)
{
    report(DiagnosticLevel::Warning, location, std::move(message));
}

void DiagnosticEngine::error(const SchemaLocation& location, std::string message)
{
    report(DiagnosticLevel::Error, location, std::move(message));
}

bool DiagnosticEngine::hasErrors() const
{
    return count(DiagnosticLevel::Error) > 0;
}

std::size_t DiagnosticEngine::count(const DiagnosticLevel level) const
{
    return static_cast<std::size_t>(
        std::count_if(diagnostics_.begin(), diagnostics_.end(), [level](const Diagnostic& d) {
            return d.level == level;
        }));
}

}  // namespace kindgen
