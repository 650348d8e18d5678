#pragma once

#include "date_utils.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

// ---------------------------------------------------------------------------
// CashFloorEstimate — the net-cash thesis on one day
// ---------------------------------------------------------------------------
struct CashFloorEstimate {
    int date = 0;
    double price = 0.0;
    double net_cash_per_share = 0.0;
    double price_to_cash_ratio = 0.0;  // +inf once the floor is fully burned
    bool breach = false;               // ratio below the warning threshold
    bool premium_warning = false;      // price far above the floor
    bool burn_alert = false;           // floor under half its starting value
    bool thesis_intact = true;
};

// ---------------------------------------------------------------------------
// CashFloorMonitor — linear-burn model of net cash per share.
//
// The estimate is a pure function of calendar days elapsed since `start_date`,
// so any date can be sampled without replaying history. Flags are advisory;
// nothing here changes the position.
// ---------------------------------------------------------------------------
class CashFloorMonitor {
public:
    CashFloorMonitor(int start_date, double initial_net_cash_per_share,
                     double burn_per_day, double warning_threshold,
                     double premium_ratio = 1.5)
        : start_date_(start_date),
          initial_cash_(initial_net_cash_per_share),
          burn_per_day_(burn_per_day),
          warning_threshold_(warning_threshold),
          premium_ratio_(premium_ratio) {
        if (!date_utils::is_valid_date(start_date)) {
            throw InvalidInputError("cash floor start date is not a valid date");
        }
        if (!(initial_cash_ >= 0.0) || !(burn_per_day_ >= 0.0) ||
            !(warning_threshold_ >= 0.0) || !(premium_ratio_ >= 0.0)) {
            throw InvalidInputError("cash floor parameters must be non-negative");
        }
    }

    int start_date() const { return start_date_; }

    double floor_at(int date) const {
        if (!date_utils::is_valid_date(date)) {
            throw InvalidInputError("cash floor sample date is not a valid date");
        }
        int elapsed = date_utils::days_between(start_date_, date);
        if (elapsed < 0) {
            throw InvalidInputError("cash floor sampled before its start date " +
                                    date_utils::date_to_string(start_date_));
        }
        return std::max(initial_cash_ - burn_per_day_ * static_cast<double>(elapsed), 0.0);
    }

    CashFloorEstimate sample(int date, double price) const {
        if (!std::isfinite(price) || price < 0.0) {
            throw InvalidInputError("cash floor price must be non-negative");
        }
        CashFloorEstimate est{};
        est.date = date;
        est.price = price;
        est.net_cash_per_share = floor_at(date);

        if (est.net_cash_per_share > 0.0) {
            est.price_to_cash_ratio = price / est.net_cash_per_share;
            est.breach = est.price_to_cash_ratio < warning_threshold_;
            est.premium_warning = est.price_to_cash_ratio > premium_ratio_;
        } else {
            est.price_to_cash_ratio = std::numeric_limits<double>::infinity();
        }

        est.burn_alert = est.net_cash_per_share < 0.5 * initial_cash_;
        est.thesis_intact = est.net_cash_per_share > 0.0 && !est.burn_alert;
        return est;
    }

private:
    int start_date_;
    double initial_cash_;
    double burn_per_day_;
    double warning_threshold_;
    double premium_ratio_;
};
