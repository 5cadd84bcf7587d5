#pragma once

#include "backtester.hpp"
#include <iostream>
#include <ostream>
#include <string>

namespace botfarm {

/// Console and file output for one backtest result.
class Report {
public:
    /// strategy_name is shown in the header (e.g. "EMA Cross ATR Bot").
    explicit Report(const BacktestResult& result, const std::string& strategy_name = "");

    /// Print summary to console.
    void printSummary(std::ostream& out = std::cout) const;

    /// Write trade log CSV to file. Returns false and logs to stderr on failure.
    bool writeTradeLog(const std::string& filepath) const;

    /// Write equity curve CSV (bar_index, equity, bar_return). Returns false and logs to stderr on failure.
    bool writeEquityCurve(const std::string& filepath) const;

    /// Write full report to a text file. Returns false and logs to stderr on failure.
    bool writeReport(const std::string& filepath) const;

private:
    void printBody(std::ostream& out) const;

    const BacktestResult& result_;
    std::string strategy_name_;
};

} // namespace botfarm
