#include "simulator.hpp"

namespace botfarm {

namespace {

double move(Side side, double from, double to) {
    if (from <= 0) return 0;
    return direction(side) * (to - from) / from;
}

} // namespace

Simulator::Simulator(double cost_per_side)
    : cost_(cost_per_side)
{
}

void Simulator::begin(const Bar& first_bar) {
    position_.reset();
    equity_ = 1.0;
    last_close_ = first_bar.close;
    bar_return_ = 0;
    opened_this_bar_ = false;
    trades_.clear();
    returns_.clear();
    equity_curve_.assign(1, equity_);
}

std::optional<ExitFill> Simulator::checkStops(const Bar& bar) const {
    if (!position_) return std::nullopt;
    const Position& p = *position_;

    // Stop-loss wins when both levels are inside the bar's range.
    if (p.side == Side::Long) {
        if (bar.low <= p.stop_price) return ExitFill{p.stop_price, ExitReason::StopLoss};
        if (bar.high >= p.take_price) return ExitFill{p.take_price, ExitReason::TakeProfit};
    } else {
        if (bar.high >= p.stop_price) return ExitFill{p.stop_price, ExitReason::StopLoss};
        if (bar.low <= p.take_price) return ExitFill{p.take_price, ExitReason::TakeProfit};
    }
    return std::nullopt;
}

void Simulator::closePosition(const Bar& bar, double exit_price, ExitReason reason) {
    if (!position_) return;
    const Position& p = *position_;

    bar_return_ += move(p.side, last_close_, exit_price) - cost_;

    Trade t;
    t.entry_time = p.entry_time;
    t.exit_time = bar.timestamp;
    t.side = p.side;
    t.entry_price = p.entry_price;
    t.exit_price = exit_price;
    t.stop_price = p.stop_price;
    t.take_price = p.take_price;
    t.gross_return_pct = move(p.side, p.entry_price, exit_price) * 100.0;
    t.net_return_pct = t.gross_return_pct - 2.0 * cost_ * 100.0;
    t.exit_reason = reason;
    trades_.push_back(t);

    position_.reset();
}

void Simulator::openPosition(const Bar& bar, Side side, const RiskLevels& levels) {
    Position p;
    p.side = side;
    p.entry_price = bar.close;
    p.stop_price = levels.stop_price;
    p.take_price = levels.take_price;
    p.entry_time = bar.timestamp;
    position_ = p;

    bar_return_ -= cost_;
    opened_this_bar_ = true;
}

void Simulator::endBar(const Bar& bar) {
    if (position_ && !opened_this_bar_)
        bar_return_ += move(position_->side, last_close_, bar.close);

    equity_ *= 1.0 + bar_return_;
    returns_.push_back(bar_return_);
    equity_curve_.push_back(equity_);

    last_close_ = bar.close;
    bar_return_ = 0;
    opened_this_bar_ = false;
}

double Simulator::winRatePct() const {
    if (trades_.empty()) return 0;
    std::size_t wins = 0;
    for (const auto& t : trades_)
        if (t.net_return_pct > 0) ++wins;
    return 100.0 * static_cast<double>(wins) / static_cast<double>(trades_.size());
}

} // namespace botfarm
