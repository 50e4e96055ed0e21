//
// trade_eval command line
//
// Usage: trade_eval_cli --prices <csv> [--clusters <csv>] [--anomalies <csv>]
//                       [--rules <csv>] [--config <yaml>] [--output <json>]
//                       [--table] [--log-level <level>]
//
// Loads the price series and whichever model outputs are given, evaluates
// them and writes the report as JSON (stdout unless --output is given).
//

#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include <arrow/compute/initialize.h>
#include <spdlog/spdlog.h>
#include <trade_eval/data/dataframe_adapter.h>
#include <trade_eval/evaluator.h>
#include <trade_eval/report/serialization.h>

namespace {

struct CliOptions {
  std::string prices;
  std::optional<std::string> clusters;
  std::optional<std::string> anomalies;
  std::optional<std::string> rules;
  std::optional<std::string> config;
  std::optional<std::string> output;
  bool table{false};
  std::string log_level{"info"};
};

void PrintUsage() {
  std::cerr << "Usage: trade_eval_cli --prices <csv> [options]\n";
  std::cerr << "\n";
  std::cerr << "Inputs:\n";
  std::cerr << "  --prices <csv>     Price bars with an 'index' timestamp column and 'close'\n";
  std::cerr << "  --clusters <csv>   Cluster assignments ('cluster' plus feature columns)\n";
  std::cerr << "  --anomalies <csv>  Anomaly scores ('anomaly_probability', 'anomaly_pred', 'anomaly')\n";
  std::cerr << "  --rules <csv>      Association rules ('antecedents', 'consequents', ...)\n";
  std::cerr << "  --config <yaml>    Evaluation parameters\n";
  std::cerr << "\n";
  std::cerr << "Output:\n";
  std::cerr << "  --output <json>    Write the JSON report to a file instead of stdout\n";
  std::cerr << "  --table            Also print a plain text table\n";
  std::cerr << "  --log-level <lvl>  trace, debug, info, warn, error, off (default info)\n";
}

std::optional<CliOptions> ParseArgs(int argc, char *argv[]) {
  CliOptions options;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--table") {
      options.table = true;
      continue;
    }
    if (i + 1 >= argc) {
      std::cerr << "Missing value for " << arg << "\n";
      return std::nullopt;
    }
    const std::string value = argv[++i];
    if (arg == "--prices") {
      options.prices = value;
    } else if (arg == "--clusters") {
      options.clusters = value;
    } else if (arg == "--anomalies") {
      options.anomalies = value;
    } else if (arg == "--rules") {
      options.rules = value;
    } else if (arg == "--config") {
      options.config = value;
    } else if (arg == "--output") {
      options.output = value;
    } else if (arg == "--log-level") {
      options.log_level = value;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      return std::nullopt;
    }
  }
  if (options.prices.empty()) {
    std::cerr << "--prices is required\n";
    return std::nullopt;
  }
  return options;
}

// A model output that fails to load is reported, never replaced
template <typename T, typename Convert>
trade_eval::ModelResult<T> LoadModelOutput(std::optional<std::string> const &path,
                                           bool timestamp_index, Convert convert) {
  if (!path) {
    return trade_eval::Omitted{};
  }
  try {
    return convert(trade_eval::data::ReadCsv(*path, timestamp_index));
  } catch (const std::exception &e) {
    spdlog::error("Failed to load {}: {}", *path, e.what());
    return trade_eval::ModelError{e.what()};
  }
}

void WriteToFile(const std::string &content, const std::string &path) {
  std::ofstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open file for writing: " + path);
  }
  file << content;
}

} // namespace

int main(int argc, char *argv[]) {
  const auto options = ParseArgs(argc, argv);
  if (!options) {
    PrintUsage();
    return 2;
  }

  const auto level = spdlog::level::from_str(options->log_level);
  if (level == spdlog::level::off && options->log_level != "off") {
    std::cerr << "Unknown log level: " << options->log_level << "\n";
    PrintUsage();
    return 2;
  }
  spdlog::set_level(level);

  try {
    auto arrowComputeStatus = arrow::compute::Initialize();
    if (!arrowComputeStatus.ok()) {
      throw std::runtime_error("arrow compute initialization failed: " +
                               arrowComputeStatus.ToString());
    }

    const auto config = options->config
                            ? trade_eval::LoadEvaluationConfig(*options->config)
                            : trade_eval::EvaluationConfig{};

    trade_eval::EvaluationInputs inputs{
        .prices = trade_eval::data::PriceSeriesFromDataFrame(
            trade_eval::data::ReadCsv(options->prices, true))};
    inputs.clusters = LoadModelOutput<trade_eval::ClusterSeries>(
        options->clusters, true, [](const epoch_frame::DataFrame &df) {
          return trade_eval::data::ClusterSeriesFromDataFrame(df);
        });
    inputs.anomalies = LoadModelOutput<trade_eval::AnomalySeries>(
        options->anomalies, true, trade_eval::data::AnomalySeriesFromDataFrame);
    inputs.rules = LoadModelOutput<trade_eval::RuleTable>(
        options->rules, false, trade_eval::data::RuleTableFromDataFrame);

    const trade_eval::Evaluator evaluator{config};
    const auto report = evaluator.Evaluate(inputs);

    const auto json = trade_eval::ToJson(report);
    if (options->output) {
      WriteToFile(json, *options->output);
      SPDLOG_INFO("Report written to {}", *options->output);
    } else {
      std::cout << json << "\n";
    }
    if (options->table) {
      std::cout << trade_eval::FormatTable(report);
    }
    return 0;

  } catch (const std::exception &e) {
    std::cerr << "Evaluation failed: " << e.what() << "\n";
    return 1;
  }
}
