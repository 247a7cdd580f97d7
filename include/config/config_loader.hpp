#pragma once

#include "backtest/backtest_runner.hpp"

#include <string>
#include <utility>
#include <vector>

namespace mpmm {

// Minimal JSON document model for configuration files.
struct JsonValue {
    enum Type { Null, Bool, Number, String, Array, Object };
    Type type = Null;
    bool boolean = false;
    double number = 0;
    std::string str;
    std::vector<JsonValue> arr;
    std::vector<std::pair<std::string, JsonValue>> obj;

    const JsonValue* find(const std::string& key) const;

    double get_number(const std::string& key, double def) const;
    bool get_bool(const std::string& key, bool def) const;
    std::string get_string(const std::string& key, const std::string& def = "") const;
    const JsonValue* get_object(const std::string& key) const;
};

// Throws ConfigError with the byte offset of the first syntax error.
JsonValue parse_json(const std::string& text);

// Missing keys keep their defaults. Throws ConfigError for unreadable files,
// malformed JSON, wrongly typed values, or invalid strategy parameters.
BacktestConfig load_config(const std::string& path);
BacktestConfig config_from_json(const JsonValue& root);

} // namespace mpmm
