#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace afmtools {

// Error is the base of every exception raised by the afmtools libraries.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// ConfigError reports a selector or setting with an unrecognized value.
class ConfigError : public Error {
public:
    ConfigError(std::string key, std::string value)
        : Error("config: invalid value '" + value + "' for '" + key + "'"),
          key_(std::move(key)), value_(std::move(value)) {}

    ConfigError(std::string key, std::string value, const std::string& message)
        : Error("config: " + message), key_(std::move(key)), value_(std::move(value)) {}

    [[nodiscard]] const std::string& key() const { return key_; }
    [[nodiscard]] const std::string& value() const { return value_; }

private:
    std::string key_;
    std::string value_;
};

// ShapeError reports a matrix or scan line too small or degenerate for a fit.
class ShapeError : public Error {
public:
    ShapeError(const std::string& what, size_t dimension)
        : Error("shape: " + what + " (got " + std::to_string(dimension) + ")"),
          dimension_(dimension) {}

    [[nodiscard]] size_t dimension() const { return dimension_; }

private:
    size_t dimension_;
};

// SequenceError reports analysis requested before correction completed.
class SequenceError : public Error {
public:
    explicit SequenceError(const std::string& message) : Error("sequence: " + message) {}
};

} // namespace afmtools
