#pragma once
//
// Shared enums and column names
//
#include <epoch_core/enum_wrapper.h>
#include <array>
#include <cstdint>

// Signal emitted by a strategy for the current tick
CREATE_ENUM(TradeSignal,
            Enter, // open a long position when flat
            Exit,  // close the open position
            Hold); // no action

// Top level report sections
CREATE_ENUM(ReportCategory, clustering, anomalies, rules, profitability);

// Predicted direction carried by a forward-return rule consequent
CREATE_ENUM(RuleDirection, up, down, neutral);

// Side of a recorded trade leg
CREATE_ENUM(TradeSide, Buy, Sell);

namespace trade_eval {

// Price columns
constexpr auto OPEN = "open";
constexpr auto HIGH = "high";
constexpr auto LOW = "low";
constexpr auto CLOSE = "close";
constexpr auto VOLUME = "volume";

// Model output columns
namespace columns {
constexpr auto INDEX = "index";
constexpr auto CLUSTER = "cluster";
constexpr auto ANOMALY_PROBABILITY = "anomaly_probability";
constexpr auto ANOMALY_PREDICTED = "anomaly_pred";
constexpr auto ANOMALY_GROUND_TRUTH = "anomaly";
constexpr auto ANTECEDENTS = "antecedents";
constexpr auto CONSEQUENTS = "consequents";
constexpr auto SUPPORT = "support";
constexpr auto CONFIDENCE = "confidence";
constexpr auto LIFT = "lift";
constexpr auto LEVERAGE = "leverage";
constexpr auto CONVICTION = "conviction";
} // namespace columns

// Separator between items of a rule antecedent/consequent cell
constexpr char RULE_ITEM_SEPARATOR = '|';

constexpr int64_t UNASSIGNED_CLUSTER = -1;

// Strategy names used as report key prefixes
namespace strategies {
constexpr auto BUY_HOLD = "buy_hold";
constexpr auto MA_CROSSOVER = "ma_crossover";
constexpr auto ANOMALY = "anomaly";
} // namespace strategies

inline constexpr std::array<epoch_core::RuleDirection, 3> RULE_DIRECTIONS{
    epoch_core::RuleDirection::up, epoch_core::RuleDirection::down,
    epoch_core::RuleDirection::neutral};

} // namespace trade_eval
