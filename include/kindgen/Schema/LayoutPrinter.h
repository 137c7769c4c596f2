//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Human- and machine-readable layout reports.
///
//===----------------------------------------------------------------------===//
#ifndef KINDGEN_SCHEMA_LAYOUT_PRINTER_H
#define KINDGEN_SCHEMA_LAYOUT_PRINTER_H

#include <string>

#include "llvm/Support/JSON.h"

namespace kindgen
{
class Kind;
class Schema;

/// @brief One-line summary: `<name> <category> size=<n> align=<n> niche=<niche|none>`.
std::string describeKindLayout(const Kind& kind);

/// @brief Text report with one summary line per kind and member offsets below it.
std::string printLayout(const Schema& schema);

/// @brief Layout report as a JSON object `{"schema": ..., "kinds": [...]}`.
llvm::json::Value layoutToJson(const Schema& schema);

/// @brief `layoutToJson` pretty-printed with two-space indentation.
std::string renderLayoutJson(const Schema& schema);

}  // namespace kindgen

#endif  // KINDGEN_SCHEMA_LAYOUT_PRINTER_H
