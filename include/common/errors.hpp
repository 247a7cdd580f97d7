#pragma once

#include <stdexcept>
#include <string>

namespace mpmm {

// Invalid or inconsistent configuration (bad file, out-of-range parameter).
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Market data could not be read or parsed.
class DataError : public std::runtime_error {
public:
    explicit DataError(const std::string& what) : std::runtime_error(what) {}
};

// Historical replay too thin to populate the transition model.
class ModelEstimationError : public std::runtime_error {
public:
    explicit ModelEstimationError(const std::string& what) : std::runtime_error(what) {}
};

// Singular (I - Q) or a non-finite price adjustment.
class NumericalInstabilityError : public std::runtime_error {
public:
    explicit NumericalInstabilityError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace mpmm
