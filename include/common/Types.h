#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace trendpilot {

using Timestamp = std::chrono::system_clock::time_point;
using Price = double;
using Volume = double;
using Amount = double;

enum class Side { LONG, SHORT };
enum class Direction { NONE, LONG, SHORT };
enum class OrderSide { BUY, SELL };

inline int sideSign(Side side) { return side == Side::LONG ? 1 : -1; }

inline Side opposite(Side side) { return side == Side::LONG ? Side::SHORT : Side::LONG; }

inline Direction toDirection(Side side) {
    return side == Side::LONG ? Direction::LONG : Direction::SHORT;
}

inline std::optional<Side> toSide(Direction direction) {
    if (direction == Direction::LONG) return Side::LONG;
    if (direction == Direction::SHORT) return Side::SHORT;
    return std::nullopt;
}

// Order side that opens (or adds to) a position of the given side
inline OrderSide entryOrderSide(Side side) {
    return side == Side::LONG ? OrderSide::BUY : OrderSide::SELL;
}

inline OrderSide exitOrderSide(Side side) {
    return side == Side::LONG ? OrderSide::SELL : OrderSide::BUY;
}

inline std::string toString(Side side) { return side == Side::LONG ? "long" : "short"; }

inline std::string toString(Direction direction) {
    switch (direction) {
        case Direction::LONG: return "long";
        case Direction::SHORT: return "short";
        case Direction::NONE: return "none";
    }
    return "none";
}

inline std::string toString(OrderSide side) { return side == OrderSide::BUY ? "buy" : "sell"; }

struct Candle {
    long long timestamp;    // bar open time, epoch ms
    double open;
    double high;
    double low;
    double close;
    double volume;
    bool closed;            // false for the bar that is still forming

    Candle() : timestamp(0), open(0), high(0), low(0), close(0), volume(0), closed(true) {}

    Candle(long long t, double o, double h, double l, double c, double v = 0.0, bool is_closed = true)
        : timestamp(t), open(o), high(h), low(l), close(c), volume(v), closed(is_closed) {}
};

// Venue-provided rounding rules for one symbol
struct MarketMetadata {
    std::string symbol;
    double tick_size = 0.0;
    double qty_step = 0.0;
    double min_qty = 0.0;

    bool isValid() const { return tick_size > 0.0 && qty_step > 0.0 && min_qty > 0.0; }
};

// Position as reported by the venue (authoritative)
struct VenuePosition {
    Side side = Side::LONG;
    double quantity = 0.0;
    double entry_price = 0.0;
    double unrealized_pnl = 0.0;
};

struct EquitySnapshot {
    double free = 0.0;
    double total = 0.0;
};

struct OrderRequest {
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    double quantity = 0.0;
    bool reduce_only = false;
    double reference_price = 0.0;   // price the decision was made at
    std::string reason;
};

struct OrderFill {
    std::string order_id;
    OrderSide side = OrderSide::BUY;
    double quantity = 0.0;
    double price = 0.0;
};

} // namespace trendpilot
