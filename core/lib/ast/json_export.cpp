// hecate/ast/json_export.cpp - JSON export of tooling data
#include "hecate/ast/json_export.hpp"

#include <string>
#include <utility>

namespace hecate
{

using json = nlohmann::json;

json to_json(Span span)
{
  json j;
  if (span.source_id().is_valid()) {
    j["source"] = span.source_id().value();
  } else {
    j["source"] = nullptr;
  }
  j["start"] = span.start_byte();
  j["end"] = span.end_byte();
  return j;
}

json to_json(const Diagnostic & diag)
{
  json j;
  j["severity"] = std::string(to_string(diag.severity));
  if (!diag.code.empty()) {
    j["code"] = diag.code;
  }
  j["message"] = diag.message;

  json labels = json::array();
  for (const auto & label : diag.labels) {
    labels.push_back(json{
      {"span", to_json(label.span)},
      {"message", label.message},
      {"style", label.style == LabelStyle::Primary ? "primary" : "secondary"}});
  }
  j["labels"] = std::move(labels);

  if (diag.help_message) {
    j["help"] = *diag.help_message;
  }
  j["notes"] = diag.notes;
  return j;
}

json to_json(const DiagnosticBag & diags)
{
  json arr = json::array();
  for (const auto & d : diags) {
    arr.push_back(to_json(d));
  }
  return arr;
}

json to_json(const PoolStats & stats)
{
  return {
    {"hits", stats.hits},
    {"misses", stats.misses},
    {"hit_rate", stats.hit_rate},
    {"int_pool_size", stats.int_pool_size},
    {"bool_pool_size", stats.bool_pool_size},
    {"text_pool_size", stats.text_pool_size},
    {"identifier_pool_size", stats.identifier_pool_size},
  };
}

json to_json(const PoolMemoryEstimate & estimate)
{
  return {
    {"int_pool_bytes", estimate.int_pool_bytes},
    {"bool_pool_bytes", estimate.bool_pool_bytes},
    {"text_pool_bytes", estimate.text_pool_bytes},
    {"identifier_pool_bytes", estimate.identifier_pool_bytes},
    {"total_bytes", estimate.total_bytes},
  };
}

}  // namespace hecate
