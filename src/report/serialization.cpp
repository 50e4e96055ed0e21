//
// Report serialization
//
#include <trade_eval/report/serialization.h>
#include <glaze/glaze.hpp>
#include <algorithm>
#include <format>
#include <map>
#include <stdexcept>

namespace {

// Integer leaves are written as JSON integers, never through double
using JsonLeaf = std::variant<std::nullptr_t, int64_t, double, std::string>;
using JsonSection = std::map<std::string, JsonLeaf>;
using JsonDocument = std::map<std::string, JsonSection>;

JsonLeaf ToLeaf(trade_eval::ReportValue const &value) {
  return std::visit(
      [](auto &&v) -> JsonLeaf {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, trade_eval::NotComputed>) {
          return nullptr;
        } else {
          return v;
        }
      },
      value);
}

std::string FormatValue(trade_eval::ReportValue const &value) {
  return std::visit(
      [](auto &&v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, trade_eval::NotComputed>) {
          return "n/a";
        } else if constexpr (std::is_same_v<T, int64_t>) {
          return std::format("{}", v);
        } else {
          return std::format("{:.4f}", v);
        }
      },
      value);
}

} // namespace

namespace trade_eval {

std::string ToJson(EvaluationReport const &report, bool prettify) {
  JsonDocument root;
  for (const auto &[category, entry] : report.categories()) {
    auto &section = root[epoch_core::ReportCategoryWrapper::ToString(category)];
    if (const auto *error = std::get_if<CategoryError>(&entry)) {
      section.emplace("error", error->reason);
    } else {
      for (const auto &[name, value] : std::get<MetricMap>(entry)) {
        section.emplace(name, ToLeaf(value));
      }
    }
  }

  std::string buffer;
  const auto ec = prettify ? glz::write<glz::opts{.prettify = true}>(root, buffer)
                           : glz::write_json(root, buffer);
  if (ec) {
    throw std::runtime_error("Failed to serialize evaluation report: " +
                             glz::format_error(ec, buffer));
  }
  return buffer;
}

std::string FormatTable(EvaluationReport const &report) {
  std::string out;
  for (const auto &[category, entry] : report.categories()) {
    const auto title = epoch_core::ReportCategoryWrapper::ToString(category);
    out += std::format("== {} ==\n", title);

    if (const auto *error = std::get_if<CategoryError>(&entry)) {
      out += std::format("  error: {}\n", error->reason);
      continue;
    }

    const auto &metrics = std::get<MetricMap>(entry);
    size_t width = 0;
    for (const auto &[name, _] : metrics) {
      width = std::max(width, name.size());
    }
    for (const auto &[name, value] : metrics) {
      out += std::format("  {:<{}}  {}\n", name, width, FormatValue(value));
    }
  }
  return out;
}

} // namespace trade_eval
