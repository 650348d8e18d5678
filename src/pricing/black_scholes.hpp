#pragma once

#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <span>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Black-Scholes European call valuation, first-order greeks, and an implied
// volatility proxy built from realized volatility.
//
// Time is in years, rates and volatility annualized. Negative volatility or
// time is rejected with InvalidInputError. At zero time the price collapses to
// intrinsic value; at zero volatility to the discounted-forward intrinsic.
// ---------------------------------------------------------------------------
namespace bs {

inline constexpr double TRADING_DAYS_PER_YEAR = 252.0;
inline constexpr double CALENDAR_DAYS_PER_YEAR = 365.0;
inline constexpr double INV_SQRT2 = 1.0 / std::numbers::sqrt2;

inline double normal_pdf(double x) {
    return std::numbers::inv_sqrtpi * INV_SQRT2 * std::exp(-0.5 * x * x);
}

inline double normal_cdf(double x) {
    return 0.5 * std::erfc(-x * INV_SQRT2);
}

namespace detail {

inline void check_inputs(double spot, double strike, double t, double vol) {
    if (!std::isfinite(spot) || spot < 0.0) {
        throw InvalidInputError("spot must be a non-negative number");
    }
    if (!std::isfinite(strike) || strike <= 0.0) {
        throw InvalidInputError("strike must be positive");
    }
    if (!std::isfinite(t) || t < 0.0) {
        throw InvalidInputError("time to expiry must be non-negative");
    }
    if (!std::isfinite(vol) || vol < 0.0) {
        throw InvalidInputError("volatility must be non-negative");
    }
}

struct D1D2 {
    double d1 = 0.0;
    double d2 = 0.0;
};

inline D1D2 d1_d2(double spot, double strike, double t, double vol, double r) {
    double vol_sqrt_t = vol * std::sqrt(t);
    double d1 = (std::log(spot / strike) + (r + 0.5 * vol * vol) * t) / vol_sqrt_t;
    return {d1, d1 - vol_sqrt_t};
}

// Degenerate cases share one rule: the option is a forward with strike PV.
inline bool deterministic(double spot, double t, double vol) {
    return t == 0.0 || vol == 0.0 || spot == 0.0;
}

}  // namespace detail

inline double call_price(double spot, double strike, double t, double vol, double r) {
    detail::check_inputs(spot, strike, t, vol);
    if (t == 0.0) {
        return std::max(spot - strike, 0.0);
    }
    if (detail::deterministic(spot, t, vol)) {
        return std::max(spot - strike * std::exp(-r * t), 0.0);
    }
    auto d = detail::d1_d2(spot, strike, t, vol, r);
    double price = spot * normal_cdf(d.d1) - strike * std::exp(-r * t) * normal_cdf(d.d2);
    return std::max(price, 0.0);
}

inline double call_delta(double spot, double strike, double t, double vol, double r) {
    detail::check_inputs(spot, strike, t, vol);
    if (t == 0.0) {
        return spot > strike ? 1.0 : 0.0;
    }
    if (detail::deterministic(spot, t, vol)) {
        return spot > strike * std::exp(-r * t) ? 1.0 : 0.0;
    }
    return normal_cdf(detail::d1_d2(spot, strike, t, vol, r).d1);
}

// Per calendar day.
inline double call_theta(double spot, double strike, double t, double vol, double r) {
    detail::check_inputs(spot, strike, t, vol);
    if (t == 0.0) {
        return 0.0;
    }
    double discounted_strike = strike * std::exp(-r * t);
    if (detail::deterministic(spot, t, vol)) {
        double annual = (spot > discounted_strike) ? -r * discounted_strike : 0.0;
        return annual / CALENDAR_DAYS_PER_YEAR;
    }
    auto d = detail::d1_d2(spot, strike, t, vol, r);
    double annual = -spot * normal_pdf(d.d1) * vol / (2.0 * std::sqrt(t))
                    - r * discounted_strike * normal_cdf(d.d2);
    return annual / CALENDAR_DAYS_PER_YEAR;
}

// Per 1.00 (100 vol points) of volatility.
inline double call_vega(double spot, double strike, double t, double vol, double r) {
    detail::check_inputs(spot, strike, t, vol);
    if (detail::deterministic(spot, t, vol)) {
        return 0.0;
    }
    auto d = detail::d1_d2(spot, strike, t, vol, r);
    return spot * normal_pdf(d.d1) * std::sqrt(t);
}

inline double years_from_days(int calendar_days) {
    return static_cast<double>(calendar_days) / CALENDAR_DAYS_PER_YEAR;
}

// ---------------------------------------------------------------------------
// Realized volatility of log returns over the trailing `window` returns of
// `closes` (oldest first, last element is the current day), annualized by
// sqrt(252), population standard deviation.
// ---------------------------------------------------------------------------
inline double realized_volatility(std::span<const double> closes, int window) {
    if (window < 2) {
        throw InvalidInputError("volatility window must be at least 2");
    }
    size_t prior_bars = closes.empty() ? 0 : closes.size() - 1;
    if (prior_bars < static_cast<size_t>(window)) {
        throw InsufficientHistoryError(
            "volatility window of " + std::to_string(window) + " needs " +
            std::to_string(window) + " prior bars, have " + std::to_string(prior_bars));
    }

    size_t first = closes.size() - static_cast<size_t>(window) - 1;
    std::vector<double> log_returns;
    log_returns.reserve(static_cast<size_t>(window));
    for (size_t i = first + 1; i < closes.size(); ++i) {
        if (closes[i] <= 0.0 || closes[i - 1] <= 0.0) {
            throw InvalidInputError("prices must be positive for log returns");
        }
        log_returns.push_back(std::log(closes[i] / closes[i - 1]));
    }

    double n = static_cast<double>(window);
    double mean = 0.0;
    for (double lr : log_returns) mean += lr;
    mean /= n;
    double sum_sq = 0.0;
    for (double lr : log_returns) sum_sq += (lr - mean) * (lr - mean);
    return std::sqrt(sum_sq / n) * std::sqrt(TRADING_DAYS_PER_YEAR);
}

// Implied volatility proxy: realized volatility times the variance premium.
inline double estimate_volatility(std::span<const double> closes, int window,
                                  double iv_premium_multiplier) {
    if (!std::isfinite(iv_premium_multiplier) || iv_premium_multiplier <= 0.0) {
        throw InvalidInputError("IV premium multiplier must be positive");
    }
    return realized_volatility(closes, window) * iv_premium_multiplier;
}

}  // namespace bs
