#pragma once

#include "date_utils.hpp"
#include "errors.hpp"

#include <cmath>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// PriceBar — one trading day of the underlying
// ---------------------------------------------------------------------------
struct PriceBar {
    int date = 0;          // YYYYMMDD
    double open = 0.0;     // optional, 0 when the feed has no OHLC
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
};

using PriceSeries = std::vector<PriceBar>;

// ---------------------------------------------------------------------------
// Series validation
//
// Non-trading days may be absent; nothing is filled in. A calendar gap wider
// than `max_gap_days` between consecutive bars is rejected, as are empty
// series, invalid dates, non-positive closes, and duplicate or decreasing
// dates.
// ---------------------------------------------------------------------------
namespace price_series {

inline void validate(const PriceSeries& series, int max_gap_days) {
    if (series.empty()) {
        throw DataIntegrityError("Price series is empty");
    }
    for (size_t i = 0; i < series.size(); ++i) {
        const auto& bar = series[i];
        if (!date_utils::is_valid_date(bar.date)) {
            throw DataIntegrityError("Invalid date " + std::to_string(bar.date) +
                                     " at bar " + std::to_string(i));
        }
        if (!std::isfinite(bar.close) || bar.close <= 0.0) {
            throw DataIntegrityError("Non-positive close on " +
                                     date_utils::date_to_string(bar.date));
        }
        if (i == 0) continue;

        int prev = series[i - 1].date;
        int gap = date_utils::days_between(prev, bar.date);
        if (gap == 0) {
            throw DataIntegrityError("Duplicate date " +
                                     date_utils::date_to_string(bar.date));
        }
        if (gap < 0) {
            throw DataIntegrityError("Dates not increasing: " +
                                     date_utils::date_to_string(prev) + " then " +
                                     date_utils::date_to_string(bar.date));
        }
        if (gap > max_gap_days) {
            throw DataIntegrityError("Gap of " + std::to_string(gap) + " days after " +
                                     date_utils::date_to_string(prev) +
                                     " exceeds limit of " + std::to_string(max_gap_days));
        }
    }
}

// Bars dated within [start_date, end_date]. Either bound may be 0 to leave that
// side open. An empty result is returned as-is; validate() rejects it.
inline PriceSeries slice(const PriceSeries& series, int start_date, int end_date) {
    if (start_date != 0 && !date_utils::is_valid_date(start_date)) {
        throw InvalidInputError("Invalid start date " + std::to_string(start_date));
    }
    if (end_date != 0 && !date_utils::is_valid_date(end_date)) {
        throw InvalidInputError("Invalid end date " + std::to_string(end_date));
    }
    if (start_date != 0 && end_date != 0 && start_date > end_date) {
        throw InvalidInputError("Start date " + date_utils::date_to_string(start_date) +
                                " is after end date " + date_utils::date_to_string(end_date));
    }
    PriceSeries out;
    for (const auto& bar : series) {
        if (start_date != 0 && bar.date < start_date) continue;
        if (end_date != 0 && bar.date > end_date) continue;
        out.push_back(bar);
    }
    return out;
}

inline std::vector<double> closes(const PriceSeries& series) {
    std::vector<double> out;
    out.reserve(series.size());
    for (const auto& bar : series) out.push_back(bar.close);
    return out;
}

}  // namespace price_series
