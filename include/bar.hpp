#pragma once

#include <cstdint>
#include <vector>

namespace botfarm {

/// Single OHLC (Open, High, Low, Close) bar.
struct Bar {
    std::int64_t timestamp{0};  // seconds since epoch
    double open{0};
    double high{0};
    double low{0};
    double close{0};

    double mid_price() const { return (high + low) / 2.0; }
};

/// Column view of a bar sequence, as consumed by the indicator functions.
struct PriceColumns {
    std::vector<double> high;
    std::vector<double> low;
    std::vector<double> close;
};

inline PriceColumns columns(const std::vector<Bar>& bars) {
    PriceColumns c;
    c.high.reserve(bars.size());
    c.low.reserve(bars.size());
    c.close.reserve(bars.size());
    for (const Bar& b : bars) {
        c.high.push_back(b.high);
        c.low.push_back(b.low);
        c.close.push_back(b.close);
    }
    return c;
}

} // namespace botfarm
