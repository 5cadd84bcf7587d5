#pragma once

#include "bar.hpp"
#include <optional>
#include <string>
#include <vector>

namespace botfarm {

/// Case-insensitive dataset filters; an empty list matches everything.
struct DatasetFilter {
    std::vector<std::string> markets;
    std::vector<std::string> symbols;
    std::vector<std::string> timeframes;
};

/// A CSV file under <root>/<market>/<symbol>/<timeframe>/.
struct DatasetInfo {
    std::string path;
    std::string market;
    std::string symbol;
    std::string timeframe;
};

/// Loads OHLC bars from a CSV file.
/// CSV: header with timestamp/time/date, open, high, low, close (any order, case-insensitive).
/// Timestamps are integer seconds; 13+ digit values are taken as milliseconds.
/// Rows that do not parse are skipped.
class DataSource {
public:
    explicit DataSource(const std::string& filepath);

    /// Load bars from the CSV file. Returns false if the file cannot be opened or lacks a column.
    bool load();

    const std::vector<Bar>& bars() const { return bars_; }
    std::size_t size() const { return bars_.size(); }
    bool empty() const { return bars_.empty(); }
    const std::string& path() const { return filepath_; }

    /// Get bar at index (0-based). Throws std::out_of_range.
    const Bar& at(std::size_t i) const { return bars_.at(i); }

    /// Datasets under `root` matching the filter, sorted by path. Empty if root is missing.
    static std::vector<DatasetInfo> findDatasets(const std::string& root, const DatasetFilter& filter);

    /// Lower-case and drop '/' and '-' ("EUR/USD" -> "eurusd").
    static std::string sanitizeSymbol(const std::string& symbol);

private:
    struct Columns {
        int time{-1};
        int open{-1};
        int high{-1};
        int low{-1};
        int close{-1};
    };

    std::string filepath_;
    std::vector<Bar> bars_;

    static std::optional<Bar> parseLine(const std::string& line, const Columns& cols);
};

} // namespace botfarm
