#pragma once

#include <cstdint>
#include <string>

namespace botfarm {

enum class Side { Long, Short };

/// Entry decision for a bar: +1 long, -1 short, 0 none.
enum class Signal { None = 0, Long = 1, Short = -1 };

enum class ExitReason { StopLoss, TakeProfit, SignalFlip };

inline double direction(Side side) { return side == Side::Long ? 1.0 : -1.0; }

inline const char* toString(Side side) { return side == Side::Long ? "long" : "short"; }

inline const char* toString(ExitReason reason) {
    switch (reason) {
        case ExitReason::StopLoss: return "stop_loss";
        case ExitReason::TakeProfit: return "take_profit";
        case ExitReason::SignalFlip: return "signal_flip";
    }
    return "unknown";
}

/// Stop and take prices for a new position.
struct RiskLevels {
    double stop_price{0};
    double take_price{0};
};

/// Stop below and take above the entry for longs, the reverse for shorts.
inline RiskLevels bracket(Side side, double entry_price, double stop_distance, double take_distance) {
    if (side == Side::Long)
        return {entry_price - stop_distance, entry_price + take_distance};
    return {entry_price + stop_distance, entry_price - take_distance};
}

/// Open position; exists only between entry and exit.
struct Position {
    Side side{Side::Long};
    double entry_price{0};
    double stop_price{0};
    double take_price{0};
    std::int64_t entry_time{0};
};

/// Closed round trip. Returns are percentages of entry price.
struct Trade {
    std::int64_t entry_time{0};
    std::int64_t exit_time{0};
    Side side{Side::Long};
    double entry_price{0};
    double exit_price{0};
    double stop_price{0};
    double take_price{0};
    double gross_return_pct{0};
    double net_return_pct{0};   // after entry and exit cost
    ExitReason exit_reason{ExitReason::SignalFlip};
};

} // namespace botfarm
