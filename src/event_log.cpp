#include "backtest/event_log.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace mpmm {

namespace {

std::ofstream open_out(const std::string& filename) {
    std::ofstream f(filename);
    if (!f.is_open()) {
        throw DataError("cannot write " + filename);
    }
    f << std::fixed << std::setprecision(8);
    return f;
}

} // anonymous namespace

RunSummary EventLog::summarize() const {
    RunSummary s;
    s.quotes = quotes_.size();
    s.own_trades = own_trades_.size();
    if (own_trades_.empty()) return s;

    double peak_pnl = own_trades_.front().pnl;
    for (const auto& t : own_trades_) {
        peak_pnl = std::max(peak_pnl, t.pnl);
        s.max_drawdown = std::max(s.max_drawdown, peak_pnl - t.pnl);
        s.max_abs_position = std::max(s.max_abs_position, std::abs(t.asset_position));
    }

    const auto& last = own_trades_.back();
    s.final_pnl = last.pnl;
    s.final_pnl_with_liq = last.pnl_with_liq;
    s.total_liq = last.total_liq;
    return s;
}

void EventLog::write_csv(const std::string& prefix) const {
    auto trades = open_out(prefix + "_own_trades.csv");
    trades << "ts,asset_position,usd_position,total_liq,pnl,pnl_with_liq\n";
    for (const auto& t : own_trades_) {
        trades << t.ts << ","
               << t.asset_position << ","
               << t.usd_position << ","
               << t.total_liq << ","
               << t.pnl << ","
               << t.pnl_with_liq << "\n";
    }

    auto quotes = open_out(prefix + "_quotes.csv");
    quotes << "ts,best_bid,best_ask,mid_price,book_spread,bid_place,ask_place,indiff_price,"
              "adjustment,my_spread,ask_diff,bid_diff,order_intensity,volatility\n";
    for (const auto& q : quotes_) {
        quotes << q.ts << ","
               << q.best_bid << ","
               << q.best_ask << ","
               << q.mid_price << ","
               << q.book_spread << ","
               << q.bid_place << ","
               << q.ask_place << ","
               << q.indifference_price << ","
               << q.adjustment << ","
               << q.my_spread << ","
               << q.ask_diff << ","
               << q.bid_diff << ","
               << q.order_intensity << ","
               << q.volatility << "\n";
    }

    auto windows = open_out(prefix + "_intensity.csv");
    windows << "ts,window_span\n";
    for (const auto& w : windows_) {
        windows << w.ts << "," << w.window_span << "\n";
    }
}

std::string EventLog::generate_report() const {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(6);

    auto s = summarize();
    ss << "# Micro-price Market Making Report\n\n";
    ss << "| Metric | Value |\n";
    ss << "|--------|-------|\n";
    ss << "| Final P&L | " << s.final_pnl << " |\n";
    ss << "| Final P&L with fees | " << s.final_pnl_with_liq << " |\n";
    ss << "| Total liquidity provided | " << s.total_liq << " |\n";
    ss << "| Max drawdown | " << s.max_drawdown << " |\n";
    ss << "| Max abs position | " << s.max_abs_position << " |\n";
    ss << "| Quotes | " << s.quotes << " |\n";
    ss << "| Own trades | " << s.own_trades << " |\n";

    if (!quotes_.empty()) {
        double spread_sum = 0.0;
        double adj_sum = 0.0;
        for (const auto& q : quotes_) {
            spread_sum += q.my_spread;
            adj_sum += q.adjustment;
        }
        double n = static_cast<double>(quotes_.size());
        ss << "| Avg quoted spread | " << spread_sum / n << " |\n";
        ss << "| Avg price adjustment | " << adj_sum / n << " |\n";
    }

    return ss.str();
}

} // namespace mpmm
