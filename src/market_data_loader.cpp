#include "market/market_data_loader.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

namespace mpmm {

namespace {

std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream iss(line);
    std::string token;
    while (std::getline(iss, token, ',')) {
        if (!token.empty() && token.back() == '\r') token.pop_back();
        tokens.push_back(token);
    }
    return tokens;
}

std::ifstream open_csv(const std::filesystem::path& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw DataError("cannot open " + path.string());
    }
    return f;
}

std::string where(const std::filesystem::path& path, size_t line_no) {
    return path.string() + ":" + std::to_string(line_no);
}

Side parse_side(const std::string& token, const std::filesystem::path& path, size_t line_no) {
    for (Side side : {Side::Bid, Side::Ask}) {
        std::string name = to_string(side);
        if (token == name) return side;
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (token == name) return side;
    }
    throw DataError(where(path, line_no) + ": unknown side '" + token + "'");
}

void load_lobs(const std::filesystem::path& path, std::vector<MarketUpdate>& out) {
    auto f = open_csv(path);
    std::string line;
    std::getline(f, line); // skip header

    size_t line_no = 1;
    while (std::getline(f, line)) {
        ++line_no;
        if (line.empty() || line == "\r") continue;
        auto tokens = split_csv_line(line);
        if (tokens.size() < 6) {
            throw DataError(where(path, line_no) + ": expected 6 columns");
        }
        try {
            MarketUpdate md;
            md.receive_ts  = std::stoll(tokens[0]);
            md.exchange_ts = std::stoll(tokens[1]);
            md.book = BookTop{
                .bid_price = std::stod(tokens[2]),
                .bid_size  = std::stod(tokens[3]),
                .ask_price = std::stod(tokens[4]),
                .ask_size  = std::stod(tokens[5]),
            };
            out.push_back(std::move(md));
        } catch (const std::logic_error& e) {
            throw DataError(where(path, line_no) + ": " + e.what());
        }
    }
}

void load_trades(const std::filesystem::path& path, std::vector<MarketUpdate>& out) {
    auto f = open_csv(path);
    std::string line;
    std::getline(f, line); // skip header

    size_t line_no = 1;
    while (std::getline(f, line)) {
        ++line_no;
        if (line.empty() || line == "\r") continue;
        auto tokens = split_csv_line(line);
        if (tokens.size() < 5) {
            throw DataError(where(path, line_no) + ": expected 5 columns");
        }
        Side side = parse_side(tokens[2], path, line_no);
        try {
            MarketUpdate md;
            md.receive_ts  = std::stoll(tokens[0]);
            md.exchange_ts = std::stoll(tokens[1]);
            md.trade = AnonTrade{
                .receive_ts = md.receive_ts,
                .side       = side,
                .price      = std::stod(tokens[3]),
                .size       = std::stod(tokens[4]),
            };
            out.push_back(std::move(md));
        } catch (const std::logic_error& e) {
            throw DataError(where(path, line_no) + ": " + e.what());
        }
    }
}

} // anonymous namespace

std::vector<MarketUpdate> load_market_data(const std::string& dir,
                                           std::optional<Timestamp> run_time) {
    std::filesystem::path base(dir);
    std::vector<MarketUpdate> result;

    load_lobs(base / "lobs.csv", result);
    load_trades(base / "trades.csv", result);

    std::stable_sort(result.begin(), result.end(),
                     [](const MarketUpdate& a, const MarketUpdate& b) {
                         return a.receive_ts < b.receive_ts;
                     });

    if (run_time && !result.empty()) {
        Timestamp end = result.front().receive_ts + *run_time;
        auto cut = std::find_if(result.begin(), result.end(),
                                [end](const MarketUpdate& md) { return md.receive_ts > end; });
        result.erase(cut, result.end());
    }

    logger()->info("loaded {} market updates from {}", result.size(), dir);
    return result;
}

std::pair<std::vector<MarketUpdate>, std::vector<MarketUpdate>>
split_by_time(const std::vector<MarketUpdate>& updates, Timestamp head_span) {
    if (updates.empty()) return {};

    Timestamp boundary = updates.front().receive_ts + head_span;
    auto cut = std::find_if(updates.begin(), updates.end(),
                            [boundary](const MarketUpdate& md) { return md.receive_ts >= boundary; });
    return {std::vector<MarketUpdate>(updates.begin(), cut),
            std::vector<MarketUpdate>(cut, updates.end())};
}

std::vector<MarketUpdate> generate_synthetic_market_data(const SyntheticDataParams& params) {
    std::vector<MarketUpdate> result;
    result.reserve(params.num_updates);

    std::mt19937 rng(params.seed); // fixed seed for reproducibility
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    std::exponential_distribution<double> size_dist(1.0 / params.mean_size);
    std::uniform_int_distribution<int> spread_ticks(1, std::max(1, params.max_spread_ticks));

    const double tick = params.tick_size;
    // work in half-ticks so that odd spreads keep prices on the tick grid
    long mid_half_ticks = std::lround(2.0 * params.start_price / tick);
    int spread = spread_ticks(rng);

    for (size_t i = 0; i < params.num_updates; ++i) {
        Timestamp ts = static_cast<Timestamp>(i + 1) * params.step;

        if (unit(rng) < params.price_move_prob) {
            mid_half_ticks += (unit(rng) < 0.5) ? -2 : 2;
            spread = spread_ticks(rng);
        }
        // bid = (mid - spread/2) rounded down onto the tick grid
        long bid_ticks = (mid_half_ticks - spread) / 2;
        long ask_ticks = bid_ticks + spread;

        MarketUpdate md;
        md.receive_ts  = ts;
        md.exchange_ts = ts;
        md.book = BookTop{
            .bid_price = static_cast<double>(bid_ticks) * tick,
            .bid_size  = size_dist(rng) + 0.01,
            .ask_price = static_cast<double>(ask_ticks) * tick,
            .ask_size  = size_dist(rng) + 0.01,
        };
        if (unit(rng) < params.trade_prob) {
            Side aggressor = (unit(rng) < 0.5) ? Side::Bid : Side::Ask;
            md.trade = AnonTrade{
                .receive_ts = ts,
                .side       = aggressor,
                .price      = aggressor == Side::Bid ? md.book->ask_price : md.book->bid_price,
                .size       = size_dist(rng) + 0.001,
            };
        }
        result.push_back(std::move(md));
    }

    return result;
}

} // namespace mpmm
