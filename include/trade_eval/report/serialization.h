#pragma once
//
// Report renderings for downstream reporting
//
#include <trade_eval/report/evaluation_report.h>
#include <string>

namespace trade_eval {

/**
 * @brief JSON document keyed by category then metric
 *
 * NotComputed renders as null; a failed category renders as
 * {"error": "<reason>"}; omitted categories are absent.
 *
 * @throws std::runtime_error if the JSON writer fails
 */
std::string ToJson(EvaluationReport const &report, bool prettify = true);

// Plain text table, one section per category
std::string FormatTable(EvaluationReport const &report);

} // namespace trade_eval
