#pragma once
//
// Signal function interface
//
#include <trade_eval/alignment/feature_alignment.h>
#include <trade_eval/core/constants.h>
#include <memory>
#include <string>
#include <variant>

namespace trade_eval::strategy {

struct Flat {};

struct Long {
  double entry_price{};
  size_t entry_index{}; // window position of the entry tick
};

using Position = std::variant<Flat, Long>;

inline bool IsFlat(Position const &position) {
  return std::holds_alternative<Flat>(position);
}

/**
 * @brief Per-tick entry/exit rule plugged into the StrategySimulator
 *
 * Next is called exactly once per tick, in window order. Implementations may
 * keep state across ticks; Reset restores the state of a fresh run.
 */
struct ISignalFunction {
  virtual std::string Name() const = 0;

  virtual epoch_core::TradeSignal Next(AlignedRow const &row,
                                       Position const &position) = 0;

  virtual void Reset() = 0;

  virtual ~ISignalFunction() = default;
};

using ISignalFunctionPtr = std::unique_ptr<ISignalFunction>;

} // namespace trade_eval::strategy
