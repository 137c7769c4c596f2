//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations for diagnostic reporting interfaces used by schema building and code generation.
///
//===----------------------------------------------------------------------===//
#ifndef KINDGEN_SUPPORT_DIAGNOSTICS_H
#define KINDGEN_SUPPORT_DIAGNOSTICS_H

#include "kindgen/Support/SchemaLocation.h"

#include <cstddef>
#include <string>
#include <vector>

namespace kindgen
{

/// @file
/// @brief Diagnostic collection and reporting interfaces.

/// @brief Severity level for a diagnostic message.
enum class DiagnosticLevel
{

    /// @brief Informational note.
    Note,

    /// @brief Non-fatal warning.
    Warning,

    /// @brief Fatal error.
    Error,
};

/// @brief Single diagnostic record produced by the pipeline.
struct Diagnostic
{
    /// @brief Severity level.
    DiagnosticLevel level;

    /// @brief Schema location associated with the message.
    SchemaLocation location;

    /// @brief Human-readable message text.
    std::string message;
};

/// @brief Returns the lowercase spelling of a diagnostic level.
/// @param[in] level Severity level.
/// @return `note`, `warning` or `error`.
const char* diagnosticLevelName(DiagnosticLevel level);

/// @brief Accumulates diagnostics emitted while building and generating one schema.
///
/// Fatal conditions travel as `llvm::Error` values; the engine carries the
/// non-fatal remarks that accompany them and anything a driver wants to echo.
class DiagnosticEngine final
{
public:
    /// @brief Appends a diagnostic entry.
    /// @param[in] level Severity level.
    /// @param[in] location Schema location associated with the message.
    /// @param[in] message Human-readable message text.
    void report(DiagnosticLevel level, const SchemaLocation& location, std::string message);

    /// @brief Emits a note-level diagnostic.
    void note(const SchemaLocation& location, std::string message);

    /// @brief Emits a warning-level diagnostic.
    void warning(const SchemaLocation& location, std::string message);

    /// @brief Emits an error-level diagnostic.
    void error(const SchemaLocation& location, std::string message);

    /// @brief Indicates whether any error diagnostics were recorded.
    /// @return True when at least one error exists.
    [[nodiscard]] bool hasErrors() const;

    /// @brief Counts diagnostics of one level.
    /// @param[in] level Severity level.
    /// @return Number of matching diagnostics.
    [[nodiscard]] std::size_t count(DiagnosticLevel level) const;

    /// @brief Returns all recorded diagnostics in insertion order.
    /// @return Immutable diagnostic list.
    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const
    {
        return diagnostics_;
    }

private:
    /// @brief Backing storage for collected diagnostics.
    std::vector<Diagnostic> diagnostics_;
};

}  // namespace kindgen

#endif  // KINDGEN_SUPPORT_DIAGNOSTICS_H
