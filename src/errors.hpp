#pragma once

#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// Error kinds raised by the pricing, strategy and backtest layers.
// All are fail-fast: the caller of run()/optimize() receives them unchanged.
// ---------------------------------------------------------------------------

// Malformed or out-of-range numeric input (pricing arguments, config fields).
class InvalidInputError : public std::invalid_argument {
public:
    explicit InvalidInputError(const std::string& what)
        : std::invalid_argument(what) {}
};

// Volatility requested before `window` prior bars exist.
class InsufficientHistoryError : public std::runtime_error {
public:
    explicit InsufficientHistoryError(const std::string& what)
        : std::runtime_error(what) {}
};

// Price series problems: empty, bad dates, duplicates, gaps, bad rows.
class DataIntegrityError : public std::runtime_error {
public:
    explicit DataIntegrityError(const std::string& what)
        : std::runtime_error(what) {}
};
