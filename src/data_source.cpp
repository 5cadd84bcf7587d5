#include "data_source.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace botfarm {

namespace {

constexpr double MILLISECOND_TIMESTAMP_MIN = 1e12;
// [-2^63, 2^63): the doubles that convert to int64_t without overflow.
constexpr double TIMESTAMP_LOWEST = static_cast<double>(std::numeric_limits<std::int64_t>::min());
constexpr double TIMESTAMP_LIMIT = -TIMESTAMP_LOWEST;

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& line, char delim) {
    std::vector<std::string> parts;
    std::istringstream iss(line);
    std::string part;
    while (std::getline(iss, part, delim)) {
        parts.push_back(trim(part));
    }
    return parts;
}

std::string toLower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

int findColumn(const std::vector<std::string>& headers, const std::vector<std::string>& names) {
    for (const auto& name : names) {
        for (std::size_t i = 0; i < headers.size(); ++i) {
            if (headers[i] == name) return static_cast<int>(i);
        }
    }
    return -1;
}

bool matchesFilter(const std::string& value, const std::vector<std::string>& filter,
                   std::string (*normalize)(std::string)) {
    if (filter.empty()) return true;
    const std::string v = normalize(value);
    return std::any_of(filter.begin(), filter.end(),
                       [&](const std::string& f) { return normalize(f) == v; });
}

std::string symbolKey(std::string s) { return DataSource::sanitizeSymbol(s); }

std::vector<fs::path> subdirectories(const fs::path& dir) {
    std::vector<fs::path> out;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (entry.is_directory(ec)) out.push_back(entry.path());
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace

DataSource::DataSource(const std::string& filepath) : filepath_(filepath) {}

bool DataSource::load() {
    bars_.clear();
    std::ifstream f(filepath_);
    if (!f.is_open()) return false;

    std::string line;
    if (!std::getline(f, line)) return false;
    std::vector<std::string> headers = split(line, ',');
    for (auto& h : headers) h = toLower(h);

    Columns cols;
    cols.time = findColumn(headers, {"timestamp", "time", "datetime", "date"});
    cols.open = findColumn(headers, {"open", "o"});
    cols.high = findColumn(headers, {"high", "h"});
    cols.low = findColumn(headers, {"low", "l"});
    cols.close = findColumn(headers, {"close", "c"});

    if (cols.time < 0 || cols.open < 0 || cols.high < 0 || cols.low < 0 || cols.close < 0)
        return false;

    while (std::getline(f, line)) {
        auto bar = parseLine(line, cols);
        if (!bar) continue;
        bars_.push_back(*bar);
    }

    return true;
}

std::string DataSource::sanitizeSymbol(const std::string& symbol) {
    std::string out;
    for (char c : symbol) {
        if (c == '/' || c == '-') continue;
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::vector<DatasetInfo> DataSource::findDatasets(const std::string& root, const DatasetFilter& filter) {
    std::vector<DatasetInfo> found;
    std::error_code ec;
    if (!fs::is_directory(root, ec) || ec) return found;

    for (const auto& market_dir : subdirectories(root)) {
        const std::string market = market_dir.filename().string();
        if (!matchesFilter(market, filter.markets, toLower)) continue;

        for (const auto& symbol_dir : subdirectories(market_dir)) {
            const std::string symbol = symbol_dir.filename().string();
            if (!matchesFilter(symbol, filter.symbols, symbolKey)) continue;

            for (const auto& tf_dir : subdirectories(symbol_dir)) {
                const std::string timeframe = tf_dir.filename().string();
                if (!matchesFilter(timeframe, filter.timeframes, toLower)) continue;

                for (const auto& entry : fs::recursive_directory_iterator(tf_dir, ec)) {
                    if (!entry.is_regular_file(ec)) continue;
                    if (toLower(entry.path().extension().string()) != ".csv") continue;
                    found.push_back({entry.path().string(), market, symbol, timeframe});
                }
            }
        }
    }

    std::sort(found.begin(), found.end(), [](const DatasetInfo& a, const DatasetInfo& b) {
        return a.path < b.path;
    });
    return found;
}

std::optional<Bar> DataSource::parseLine(const std::string& line, const Columns& cols) {
    auto parts = split(line, ',');
    const int widest = std::max({cols.time, cols.open, cols.high, cols.low, cols.close});
    if (static_cast<int>(parts.size()) <= widest) return std::nullopt;

    Bar b;
    try {
        double ts = std::stod(parts[static_cast<std::size_t>(cols.time)]);
        if (ts >= MILLISECOND_TIMESTAMP_MIN) ts /= 1000.0;
        // std::stod accepts "nan" and "inf"; such rows are as unusable as text.
        if (!std::isfinite(ts) || ts < TIMESTAMP_LOWEST || ts >= TIMESTAMP_LIMIT) return std::nullopt;
        b.timestamp = static_cast<std::int64_t>(ts);
        b.open = std::stod(parts[static_cast<std::size_t>(cols.open)]);
        b.high = std::stod(parts[static_cast<std::size_t>(cols.high)]);
        b.low = std::stod(parts[static_cast<std::size_t>(cols.low)]);
        b.close = std::stod(parts[static_cast<std::size_t>(cols.close)]);
        if (!std::isfinite(b.open) || !std::isfinite(b.high) || !std::isfinite(b.low) || !std::isfinite(b.close))
            return std::nullopt;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    return b;
}

} // namespace botfarm
