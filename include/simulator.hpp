#pragma once

#include "bar.hpp"
#include "position.hpp"
#include <optional>
#include <vector>

namespace botfarm {

/// Exit price and reason chosen for an open position on the current bar.
struct ExitFill {
    double price{0};
    ExitReason reason{ExitReason::SignalFlip};
};

/// Position state machine (FLAT / LONG / SHORT) with per-side cost accounting.
/// Equity is a multiplier starting at 1.0. Each bar accumulates a return made of:
/// the move from the previous close to the exit price (or to the close while held),
/// minus one cost unit per entry or exit on that bar.
/// Entries fill at the bar's close; a close and re-entry on one bar pays two cost units.
class Simulator {
public:
    explicit Simulator(double cost_per_side = 0.0);

    /// Reset to FLAT with equity 1.0; the first bar only seeds the curve.
    void begin(const Bar& first_bar);

    /// Stop-loss against the bar range first, then take-profit. nullopt if neither is reached.
    std::optional<ExitFill> checkStops(const Bar& bar) const;

    /// Close the open position at `exit_price` and record the trade.
    void closePosition(const Bar& bar, double exit_price, ExitReason reason);

    /// Open at the bar's close with the given stop/take.
    void openPosition(const Bar& bar, Side side, const RiskLevels& levels);

    /// Mark any position held through the bar, then book the bar's return into equity.
    void endBar(const Bar& bar);

    bool flat() const { return !position_.has_value(); }
    const std::optional<Position>& position() const { return position_; }
    double equity() const { return equity_; }
    double costPerSide() const { return cost_; }
    const std::vector<Trade>& trades() const { return trades_; }
    const std::vector<double>& equityCurve() const { return equity_curve_; }
    const std::vector<double>& returns() const { return returns_; }

    /// Wins / trades * 100, 0 without trades. A win has a positive net return.
    double winRatePct() const;

private:
    double cost_;
    std::optional<Position> position_;
    double equity_{1.0};
    double last_close_{0};
    double bar_return_{0};
    bool opened_this_bar_{false};

    std::vector<Trade> trades_;
    std::vector<double> equity_curve_;
    std::vector<double> returns_;
};

} // namespace botfarm
