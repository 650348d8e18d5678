#pragma once

#include "date_utils.hpp"
#include "errors.hpp"
#include "pricing/option_costs.hpp"

#include <cmath>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// StrategyConfig — immutable input to one covered-call backtest run
// ---------------------------------------------------------------------------
struct StrategyConfig {
    std::string name = "default";

    // Position sizing
    int shares = 1000;
    double contract_multiplier = 100.0;

    // Strike / expiration selection. Candidates are scanned in the order given.
    double min_strike = 2.50;
    std::vector<double> strike_candidates = {2.00, 2.50, 3.00, 3.50, 4.00, 5.00};
    int target_dte = 30;
    std::vector<int> candidate_dtes;  // empty: target_dte only
    double min_net_premium = 0.0;     // total dollars for the sale
    double delta_penalty_weight = 0.5;
    double target_delta = 0.20;

    // Roll logic
    int roll_dte_threshold = 5;
    double roll_profit_capture_fraction = 0.80;

    // Costs
    double bid_ask_spread_pct = 0.15;
    double commission_per_contract = 0.65;

    // Pricing inputs
    double risk_free_rate = 0.045;
    double iv_premium_multiplier = 1.3;
    int volatility_window = 20;
    double default_volatility = 0.50;  // warm-up days
    double iv_floor = 0.30;

    // Cash floor thesis
    double net_cash_per_share = 1.50;
    double cash_burn_per_day = 0.10 / date_utils::DAYS_PER_QUARTER;
    double cash_floor_warning_threshold = 0.8;
    double cash_floor_premium_ratio = 1.5;

    // Price series policy
    int max_calendar_gap_days = 5;

    int contracts() const {
        return static_cast<int>(static_cast<double>(shares) / contract_multiplier);
    }

    OptionCosts costs() const {
        OptionCosts c;
        c.spread_pct = bid_ask_spread_pct;
        c.commission_per_contract = commission_per_contract;
        c.contract_multiplier = contract_multiplier;
        return c;
    }

    // DTEs the strike search covers, in scan order.
    std::vector<int> dte_candidates() const {
        if (candidate_dtes.empty()) return {target_dte};
        return candidate_dtes;
    }

    // Throws InvalidInputError naming the first field out of range.
    void validate() const {
        auto fail = [this](const std::string& msg) {
            throw InvalidInputError("config '" + name + "': " + msg);
        };
        auto non_negative = [](double v) { return std::isfinite(v) && v >= 0.0; };
        auto unit_interval = [](double v) { return v >= 0.0 && v <= 1.0; };

        if (!(contract_multiplier > 0.0) || !std::isfinite(contract_multiplier))
            fail("contract_multiplier must be positive");
        if (shares <= 0) fail("shares must be positive");
        if (std::fmod(static_cast<double>(shares), contract_multiplier) != 0.0)
            fail("shares must be a whole number of contracts");
        if (!non_negative(min_strike)) fail("min_strike must be non-negative");
        if (strike_candidates.empty()) fail("strike_candidates must not be empty");
        for (double k : strike_candidates) {
            if (!(k > 0.0) || !std::isfinite(k)) fail("strike candidates must be positive");
        }
        if (target_dte <= 0) fail("target_dte must be positive");
        for (int dte : candidate_dtes) {
            if (dte <= 0) fail("candidate DTEs must be positive");
        }
        if (roll_dte_threshold < 0) fail("roll_dte_threshold must be non-negative");
        for (int dte : dte_candidates()) {
            if (roll_dte_threshold >= dte)
                fail("roll_dte_threshold must be below every candidate DTE");
        }
        if (!unit_interval(roll_profit_capture_fraction))
            fail("roll_profit_capture_fraction must be in [0, 1]");
        if (!unit_interval(bid_ask_spread_pct))
            fail("bid_ask_spread_pct must be in [0, 1]");
        if (!non_negative(commission_per_contract))
            fail("commission_per_contract must be non-negative");
        if (!non_negative(min_net_premium)) fail("min_net_premium must be non-negative");
        if (!non_negative(delta_penalty_weight))
            fail("delta_penalty_weight must be non-negative");
        if (!unit_interval(target_delta)) fail("target_delta must be in [0, 1]");
        if (!non_negative(risk_free_rate)) fail("risk_free_rate must be non-negative");
        if (!(iv_premium_multiplier > 0.0) || !std::isfinite(iv_premium_multiplier))
            fail("iv_premium_multiplier must be positive");
        if (volatility_window < 2) fail("volatility_window must be at least 2");
        if (!non_negative(default_volatility))
            fail("default_volatility must be non-negative");
        if (!non_negative(iv_floor)) fail("iv_floor must be non-negative");
        if (!non_negative(net_cash_per_share))
            fail("net_cash_per_share must be non-negative");
        if (!non_negative(cash_burn_per_day)) fail("cash_burn_per_day must be non-negative");
        if (!non_negative(cash_floor_warning_threshold))
            fail("cash_floor_warning_threshold must be non-negative");
        if (!non_negative(cash_floor_premium_ratio))
            fail("cash_floor_premium_ratio must be non-negative");
        if (max_calendar_gap_days < 1) fail("max_calendar_gap_days must be at least 1");
    }
};
