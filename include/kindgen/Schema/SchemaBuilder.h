//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Entry points turning kind definitions into an initialized schema.
///
//===----------------------------------------------------------------------===//
#ifndef KINDGEN_SCHEMA_SCHEMA_BUILDER_H
#define KINDGEN_SCHEMA_SCHEMA_BUILDER_H

#include <cstdint>
#include <string>
#include <vector>

#include "kindgen/Kinds/KindDefinition.h"
#include "kindgen/Schema/Schema.h"
#include "llvm/Support/Error.h"

namespace kindgen
{
class DiagnosticEngine;
class KindRegistry;

/// @brief Options that bound schema construction.
struct SchemaBuildOptions final
{
    /// @brief Maximum chain of kinds whose layouts depend on each other.
    std::uint32_t maxNestingDepth{256};
};

/// @brief Creates and initializes every definition in dependency order.
///
/// Kinds are created through `registry` in definition order, then laid out
/// depth-first on demand. A member reference back into a kind that is still
/// being laid out is a cycle and fails; references through boxes do not need
/// the target's layout and may be cyclic. The first failure aborts the build.
///
/// @param[in] name Schema name.
/// @param[in] definitions Kind definitions; names must be unique.
/// @param[in] registry Category factories.
/// @param[in,out] diagnostics Sink for warnings and notes.
/// @param[in] options Construction limits.
/// @return Read-only schema, or a `SchemaError`.
llvm::Expected<Schema> buildSchema(std::string                 name,
                                   std::vector<KindDefinition> definitions,
                                   const KindRegistry&         registry,
                                   DiagnosticEngine&           diagnostics,
                                   const SchemaBuildOptions&   options = {});

/// @brief Builds a schema with the built-in registry.
llvm::Expected<Schema> buildSchema(std::string                 name,
                                   std::vector<KindDefinition> definitions,
                                   DiagnosticEngine&           diagnostics,
                                   const SchemaBuildOptions&   options = {});

}  // namespace kindgen

#endif  // KINDGEN_SCHEMA_SCHEMA_BUILDER_H
