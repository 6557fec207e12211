// hecate/ast/json_export.hpp - JSON export of tooling data
//
// Diagnostics and pool metrics as nlohmann::json, for editors and CI
// reports. Trees themselves are rendered by external printers.
//
#pragma once

#include <nlohmann/json.hpp>

#include "hecate/ast/node_pool.hpp"
#include "hecate/basic/diagnostic.hpp"
#include "hecate/basic/span.hpp"

namespace hecate
{

/// {"source": <id or null>, "start": n, "end": n}
[[nodiscard]] nlohmann::json to_json(Span span);

/**
 * Serialize one diagnostic.
 *
 * Keys: severity, code (omitted when empty), message, labels[{span,
 * message, style}], help (omitted when absent), notes.
 */
[[nodiscard]] nlohmann::json to_json(const Diagnostic & diag);

/// Array of diagnostics in report order
[[nodiscard]] nlohmann::json to_json(const DiagnosticBag & diags);

[[nodiscard]] nlohmann::json to_json(const PoolStats & stats);
[[nodiscard]] nlohmann::json to_json(const PoolMemoryEstimate & estimate);

}  // namespace hecate
