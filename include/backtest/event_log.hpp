#pragma once

#include "market/market_update.hpp"

#include <string>
#include <vector>

namespace mpmm {

struct OwnTradeRecord {
    Timestamp ts             = 0;
    double    asset_position = 0.0;
    double    usd_position   = 0.0;
    double    total_liq      = 0.0;   // notional of all executed maker orders
    double    pnl            = 0.0;   // usd + asset * mid
    double    pnl_with_liq   = 0.0;   // pnl net of maker fees on total_liq
};

struct QuoteRecord {
    Timestamp ts                 = 0;
    double    best_bid           = 0.0;
    double    best_ask           = 0.0;
    double    mid_price          = 0.0;
    double    book_spread        = 0.0;   // best_ask - best_bid
    double    bid_place          = 0.0;
    double    ask_place          = 0.0;
    double    indifference_price = 0.0;
    double    adjustment         = 0.0;
    double    my_spread          = 0.0;
    double    ask_diff           = 0.0;   // ask_place - best_ask
    double    bid_diff           = 0.0;   // bid_place - best_bid
    double    order_intensity    = 0.0;
    double    volatility         = 0.0;
};

struct IntensityWindowRecord {
    Timestamp ts          = 0;
    Timestamp window_span = 0;
};

struct RunSummary {
    double   final_pnl          = 0.0;
    double   final_pnl_with_liq = 0.0;
    double   total_liq          = 0.0;
    double   max_abs_position   = 0.0;
    double   max_drawdown       = 0.0;
    uint64_t quotes             = 0;
    uint64_t own_trades         = 0;
};

// Append-only record streams of one strategy run.
class EventLog {
public:
    void record_own_trade(const OwnTradeRecord& record) { own_trades_.push_back(record); }
    void record_quote(const QuoteRecord& record) { quotes_.push_back(record); }
    void record_intensity_window(const IntensityWindowRecord& record) { windows_.push_back(record); }

    const std::vector<OwnTradeRecord>&        own_trades() const { return own_trades_; }
    const std::vector<QuoteRecord>&           quotes() const { return quotes_; }
    const std::vector<IntensityWindowRecord>& intensity_windows() const { return windows_; }

    RunSummary summarize() const;

    // Writes <prefix>_own_trades.csv, <prefix>_quotes.csv and <prefix>_intensity.csv.
    void write_csv(const std::string& prefix) const;
    std::string generate_report() const;

private:
    std::vector<OwnTradeRecord>        own_trades_;
    std::vector<QuoteRecord>           quotes_;
    std::vector<IntensityWindowRecord> windows_;
};

} // namespace mpmm
