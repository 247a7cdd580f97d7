#include "config/config_loader.hpp"
#include "common/errors.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>

namespace mpmm {

// --- JsonValue ---

const JsonValue* JsonValue::find(const std::string& key) const {
    for (const auto& [k, v] : obj) {
        if (k == key) return &v;
    }
    return nullptr;
}

double JsonValue::get_number(const std::string& key, double def) const {
    const JsonValue* v = find(key);
    if (!v) return def;
    if (v->type != Number) throw ConfigError("'" + key + "' must be a number");
    return v->number;
}

bool JsonValue::get_bool(const std::string& key, bool def) const {
    const JsonValue* v = find(key);
    if (!v) return def;
    if (v->type != Bool) throw ConfigError("'" + key + "' must be true or false");
    return v->boolean;
}

std::string JsonValue::get_string(const std::string& key, const std::string& def) const {
    const JsonValue* v = find(key);
    if (!v) return def;
    if (v->type != String) throw ConfigError("'" + key + "' must be a string");
    return v->str;
}

const JsonValue* JsonValue::get_object(const std::string& key) const {
    const JsonValue* v = find(key);
    if (!v) return nullptr;
    if (v->type != Object) throw ConfigError("'" + key + "' must be an object");
    return v;
}

namespace {

// Recursive descent JSON parser
class JsonParser {
public:
    explicit JsonParser(const std::string& input) : input_(input), pos_(0) {}

    JsonValue parse() {
        JsonValue v = parse_value();
        skip_ws();
        if (pos_ != input_.size()) fail("trailing characters");
        return v;
    }

private:
    const std::string& input_;
    size_t pos_;

    [[noreturn]] void fail(const std::string& msg) const {
        throw ConfigError("JSON error at offset " + std::to_string(pos_) + ": " + msg);
    }

    char peek() const { return pos_ < input_.size() ? input_[pos_] : '\0'; }
    char next() {
        if (pos_ >= input_.size()) fail("unexpected end of input");
        return input_[pos_++];
    }
    void expect(char c) {
        if (next() != c) {
            --pos_;
            fail(std::string("expected '") + c + "'");
        }
    }
    void expect_word(const char* word) {
        for (const char* p = word; *p; ++p) expect(*p);
    }
    void skip_ws() {
        while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) ++pos_;
    }

    JsonValue parse_value() {
        skip_ws();
        char c = peek();
        if (c == '"') return parse_string();
        if (c == '{') return parse_object();
        if (c == '[') return parse_array();
        if (c == 'n') { expect_word("null"); return JsonValue{}; }
        if (c == 't' || c == 'f') {
            JsonValue v;
            v.type = JsonValue::Bool;
            v.boolean = (c == 't');
            expect_word(v.boolean ? "true" : "false");
            return v;
        }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number();
        fail("unexpected character");
    }

    JsonValue parse_string() {
        expect('"');
        JsonValue v;
        v.type = JsonValue::String;
        while (peek() != '"') {
            char c = next();
            if (c == '\\') {
                char esc = next();
                switch (esc) {
                    case 'n': v.str += '\n'; break;
                    case 't': v.str += '\t'; break;
                    case 'r': v.str += '\r'; break;
                    default:  v.str += esc; break;
                }
            } else {
                v.str += c;
            }
        }
        expect('"');
        return v;
    }

    JsonValue parse_number() {
        size_t start = pos_;
        if (peek() == '-') ++pos_;
        while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
        if (peek() == '.') { ++pos_; while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_; }
        if (peek() == 'e' || peek() == 'E') {
            ++pos_;
            if (peek() == '+' || peek() == '-') ++pos_;
            while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
        }
        JsonValue v;
        v.type = JsonValue::Number;
        try {
            v.number = std::stod(input_.substr(start, pos_ - start));
        } catch (const std::logic_error&) {
            pos_ = start;
            fail("malformed number");
        }
        return v;
    }

    JsonValue parse_array() {
        expect('[');
        JsonValue v;
        v.type = JsonValue::Array;
        skip_ws();
        if (peek() == ']') { ++pos_; return v; }
        while (true) {
            v.arr.push_back(parse_value());
            skip_ws();
            if (peek() != ',') break;
            ++pos_;
        }
        expect(']');
        return v;
    }

    JsonValue parse_object() {
        expect('{');
        JsonValue v;
        v.type = JsonValue::Object;
        skip_ws();
        if (peek() == '}') { ++pos_; return v; }
        while (true) {
            skip_ws();
            auto key = parse_string();
            skip_ws();
            expect(':');
            auto val = parse_value();
            v.obj.emplace_back(key.str, std::move(val));
            skip_ws();
            if (peek() != ',') break;
            ++pos_;
        }
        expect('}');
        return v;
    }
};

// Integral value of `key`; the number must be finite and fit in T.
template <class T>
T get_integral(const JsonValue& v, const std::string& key, T def) {
    double n = v.get_number(key, static_cast<double>(def));
    const double lo = static_cast<double>(std::numeric_limits<T>::min());
    const double hi = std::ldexp(1.0, std::numeric_limits<T>::digits);   // max() + 1
    if (!std::isfinite(n) || n < lo || n >= hi) {
        throw ConfigError("'" + key + "' is out of range");
    }
    return static_cast<T>(n);
}

Timestamp get_ns(const JsonValue& v, const std::string& key, Timestamp def) {
    return get_integral<Timestamp>(v, key, def);
}

size_t get_count(const JsonValue& v, const std::string& key, size_t def) {
    if (v.get_number(key, 0.0) < 0) throw ConfigError("'" + key + "' must not be negative");
    return get_integral<size_t>(v, key, def);
}

} // anonymous namespace

JsonValue parse_json(const std::string& text) {
    JsonParser parser(text);
    return parser.parse();
}

BacktestConfig config_from_json(const JsonValue& root) {
    if (root.type != JsonValue::Object) {
        throw ConfigError("configuration root must be an object");
    }

    BacktestConfig config;
    config.data_dir = root.get_string("data_dir");
    config.training_window = get_ns(root, "training_window_ns", config.training_window);
    if (root.find("run_time_ns")) {
        config.run_time = get_ns(root, "run_time_ns", 0);
    }
    config.csv_prefix = root.get_string("csv_prefix", config.csv_prefix);

    if (auto* s = root.get_object("strategy")) {
        auto& p = config.strategy;
        p.delay                       = get_ns(*s, "delay_ns", p.delay);
        p.risk_coefficient            = s->get_number("risk_coefficient", p.risk_coefficient);
        p.time_oi                     = get_ns(*s, "time_oi_ns", p.time_oi);
        p.avg_sum_oi                  = s->get_number("avg_sum_oi", p.avg_sum_oi);
        p.avg_time_oi                 = s->get_number("avg_time_oi", p.avg_time_oi);
        p.avg_volatility              = s->get_number("avg_volatility", p.avg_volatility);
        p.min_asset_value             = s->get_number("min_asset_value", p.min_asset_value);
        p.volatility_record_cooldown  = get_ns(*s, "volatility_record_cooldown_ns", p.volatility_record_cooldown);
        p.volatility_horizon          = get_count(*s, "volatility_horizon", p.volatility_horizon);
        p.order_intensity_min_samples = get_count(*s, "order_intensity_min_samples", p.order_intensity_min_samples);
        p.order_intensity_capacity    = get_count(*s, "order_intensity_capacity", p.order_intensity_capacity);
        p.future_lookahead            = get_ns(*s, "future_lookahead_ns", p.future_lookahead);
        p.order_fees                  = s->get_number("order_fees", p.order_fees);
        p.order_size                  = s->get_number("order_size", p.order_size);
    }

    if (auto* d = root.get_object("discretizer")) {
        auto& c = config.discretizer;
        c.imbalance_buckets  = get_count(*d, "imbalance_buckets", c.imbalance_buckets);
        c.spread_buckets     = get_count(*d, "spread_buckets", c.spread_buckets);
        c.spread_max         = d->get_number("spread_max", c.spread_max);
        c.price_delta_points = get_count(*d, "price_delta_points", c.price_delta_points);
        c.price_delta_range  = d->get_number("price_delta_range", c.price_delta_range);
    }

    if (auto* s = root.get_object("solver")) {
        auto& o = config.solver;
        o.iterations            = get_count(*s, "iterations", o.iterations);
        o.convergence_tolerance = s->get_number("convergence_tolerance", o.convergence_tolerance);
        o.pivot_eps             = s->get_number("pivot_eps", o.pivot_eps);
    }

    if (auto* s = root.get_object("simulator")) {
        config.simulator.execution_latency =
            get_ns(*s, "execution_latency_ns", config.simulator.execution_latency);
    }

    if (auto* s = root.get_object("synthetic")) {
        auto& g = config.synthetic;
        g.num_updates      = get_count(*s, "num_updates", g.num_updates);
        g.start_price      = s->get_number("start_price", g.start_price);
        g.tick_size        = s->get_number("tick_size", g.tick_size);
        g.step             = get_ns(*s, "step_ns", g.step);
        g.price_move_prob  = s->get_number("price_move_prob", g.price_move_prob);
        g.trade_prob       = s->get_number("trade_prob", g.trade_prob);
        g.mean_size        = s->get_number("mean_size", g.mean_size);
        g.max_spread_ticks = get_integral<int>(*s, "max_spread_ticks", g.max_spread_ticks);
        g.seed             = get_integral<uint32_t>(*s, "seed", g.seed);
    }

    validate(config.strategy);
    return config;
}

BacktestConfig load_config(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw ConfigError("cannot open config file " + path);
    }
    std::string content((std::istreambuf_iterator<char>(f)),
                         std::istreambuf_iterator<char>());
    return config_from_json(parse_json(content));
}

} // namespace mpmm
