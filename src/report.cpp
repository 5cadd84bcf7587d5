#include "report.hpp"
#include <fstream>
#include <iomanip>

namespace botfarm {

Report::Report(const BacktestResult& result, const std::string& strategy_name)
    : result_(result), strategy_name_(strategy_name) {}

void Report::printBody(std::ostream& out) const {
    const auto& r = result_;
    if (!r.ok())
        out << "*** Backtest failed: " << r.reason << " ***\n\n";
    out << "Strategy: " << (strategy_name_.empty() ? r.strategy_id : strategy_name_);
    if (!r.params_effective.empty()) out << " (" << r.params_effective.describe() << ")";
    out << "\n";
    if (!r.dataset.path.empty())
        out << "Dataset:        " << r.dataset.path << "\n";
    out << "Market/TF:      " << r.dataset.market << " " << r.dataset.symbol << " " << r.dataset.timeframe << "\n";
    out << "Bars loaded:    " << r.bars_count << "\n";
    out << std::fixed << std::setprecision(2);
    out << "Cost per side:  " << r.cost_profile.fee_bps_per_side << " bps fee + "
        << r.cost_profile.slippage_bps_per_side << " bps slippage (" << r.cost_profile.source << ")\n";
    out << "Total return:   " << r.metrics.total_return_pct << "%\n";
    out << "Max drawdown:   " << r.metrics.max_drawdown_pct << "%\n";
    out << "Sharpe ratio:   " << std::setprecision(3) << r.metrics.sharpe << "\n";
    out << std::setprecision(2);
    out << "OOS degradation:" << r.metrics.oos_degradation_pct << "%\n";
    out << "Closed trades:  " << r.trades.size() << "\n";
    out << "Win rate:       " << r.win_rate_pct << "%\n";
    if (r.open_position) {
        out << "Open position:  " << toString(r.open_position->side)
            << " @ " << std::setprecision(5) << r.open_position->entry_price << "\n";
    }
}

void Report::printSummary(std::ostream& out) const {
    out << "\n========== Backtest Report ==========\n";
    printBody(out);
    out << "======================================\n\n";
}

namespace {
    void writeCsvQuoted(std::ostream& out, const std::string& s) {
        out << '"';
        for (char c : s) {
            if (c == '"') out << "\"\"";
            else out << c;
        }
        out << '"';
    }
}

bool Report::writeTradeLog(const std::string& filepath) const {
    std::ofstream f(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    f << "entry_time,exit_time,side,entry_price,exit_price,stop_price,take_price,gross_return_pct,net_return_pct,exit_reason\n";
    f << std::fixed << std::setprecision(6);
    for (const auto& t : result_.trades) {
        f << t.entry_time << ',' << t.exit_time << ',' << toString(t.side) << ','
          << t.entry_price << ',' << t.exit_price << ',' << t.stop_price << ',' << t.take_price << ','
          << t.gross_return_pct << ',' << t.net_return_pct << ',';
        writeCsvQuoted(f, toString(t.exit_reason));
        f << "\n";
    }
    if (!f) {
        std::cerr << "Failed to write trade log: " << filepath << "\n";
        return false;
    }
    return true;
}

bool Report::writeEquityCurve(const std::string& filepath) const {
    std::ofstream f(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    f << "bar_index,equity,bar_return\n";
    f << std::fixed << std::setprecision(8);
    const auto& curve = result_.equity_curve;
    const auto& returns = result_.returns;
    for (std::size_t i = 0; i < curve.size(); ++i) {
        // returns[i - 1] belongs to bar i; bar 0 has none.
        f << i << ',' << curve[i] << ',' << (i > 0 && i - 1 < returns.size() ? returns[i - 1] : 0.0) << "\n";
    }
    if (!f) {
        std::cerr << "Failed to write equity curve: " << filepath << "\n";
        return false;
    }
    return true;
}

bool Report::writeReport(const std::string& filepath) const {
    std::ofstream f(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    f << "Backtest Report\n";
    f << "================\n\n";
    printBody(f);
    f << "\nTrades:\n";
    f << std::setprecision(4);
    for (const auto& t : result_.trades) {
        f << "  " << t.entry_time << " -> " << t.exit_time << "  " << toString(t.side)
          << "  " << t.entry_price << " -> " << t.exit_price
          << "  net " << t.net_return_pct << "%  (" << toString(t.exit_reason) << ")\n";
    }
    if (!f) {
        std::cerr << "Failed to write report: " << filepath << "\n";
        return false;
    }
    return true;
}

} // namespace botfarm
