#pragma once

#include "backtest/trade_record.hpp"
#include "date_utils.hpp"
#include "errors.hpp"
#include "pricing/black_scholes.hpp"
#include "pricing/option_costs.hpp"
#include "strategy/position.hpp"
#include "strategy/premium_optimizer.hpp"
#include "strategy/strategy_config.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <optional>
#include <string>

// ---------------------------------------------------------------------------
// MarketDay — inputs the engine sees for one trading day
// ---------------------------------------------------------------------------
struct MarketDay {
    int date = 0;
    double spot = 0.0;
    double volatility = 0.0;
};

// ---------------------------------------------------------------------------
// StrikeSelection — the contract chosen for a new sale
// ---------------------------------------------------------------------------
struct StrikeSelection {
    double strike = 0.0;
    int dte = 0;
    double mid_premium = 0.0;   // per share
    double net_premium = 0.0;   // all contracts, after spread and commission
    double delta = 0.0;
    double score = 0.0;
};

// ---------------------------------------------------------------------------
// DayEvaluation — what happened to the position on one day. At most one
// resolution per day; a roll and an expiry cannot both appear.
// ---------------------------------------------------------------------------
struct DayEvaluation {
    int date = 0;
    PositionStatus resolution = PositionStatus::NONE;
    std::optional<TradeRecord> closed_trade;
    bool opened = false;
    bool open_rejected = false;       // best candidate at or below the premium floor
    double premium_collected = 0.0;   // net premium of a newly opened leg
    double buyback_cost = 0.0;        // paid to close a rolled leg
    double assignment_proceeds = 0.0; // strike * shares delivered
    int shares_delivered = 0;
};

// ---------------------------------------------------------------------------
// PositionEngine — owns the single short-call position of one run.
//
// Daily transition table:
//   NONE                   -> try open
//   OPEN, date >= expiry   -> CALLED_AWAY | EXPIRED_WORTHLESS, then try open
//   OPEN, date <  expiry   -> ROLLED (buy back, then try open) | stay OPEN
// ---------------------------------------------------------------------------
class PositionEngine {
public:
    explicit PositionEngine(const StrategyConfig& config)
        : config_(config), costs_(config.costs()), optimizer_(config) {
        config_.validate();
    }

    const Position& position() const { return position_; }
    const StrategyConfig& config() const { return config_; }

    DayEvaluation evaluate(const MarketDay& day) {
        check_day(day);
        last_date_ = day.date;

        DayEvaluation ev{};
        ev.date = day.date;

        switch (position_.status) {
            case PositionStatus::NONE:
                try_open(day, ev);
                break;
            case PositionStatus::OPEN:
                if (day.date >= position_.contract.expiration_date) {
                    resolve_expiration(day, ev);
                    try_open(day, ev);
                } else if (should_roll(day)) {
                    roll(day, ev);
                }
                break;
            case PositionStatus::EXPIRED_WORTHLESS:
            case PositionStatus::CALLED_AWAY:
            case PositionStatus::ROLLED:
                // Outcomes are reported, never stored.
                break;
        }
        return ev;
    }

    // Best contract to write today, or nullopt when no strike clears min_strike.
    std::optional<StrikeSelection> select_strike(double spot, double volatility) const {
        auto dtes = config_.dte_candidates();
        if (dtes.size() > 1) {
            auto ranked = optimizer_.optimize(spot, config_.strike_candidates, dtes, volatility);
            if (ranked.empty()) return std::nullopt;
            const auto& best = ranked.front();
            StrikeSelection sel{};
            sel.strike = best.strike;
            sel.dte = best.dte;
            sel.mid_premium = best.theoretical_premium;
            sel.net_premium = best.net_total_premium;
            sel.delta = best.delta;
            sel.score = best.score;
            return sel;
        }

        int dte = dtes.front();
        double t = bs::years_from_days(dte);
        double r = config_.risk_free_rate;
        int contracts = config_.contracts();
        double shares = static_cast<double>(contracts) * config_.contract_multiplier;

        std::optional<StrikeSelection> best;
        for (double strike : config_.strike_candidates) {
            if (strike < config_.min_strike) continue;

            StrikeSelection c{};
            c.strike = strike;
            c.dte = dte;
            c.mid_premium = bs::call_price(spot, strike, t, volatility, r);
            c.net_premium = costs_.sell_proceeds(c.mid_premium, contracts);
            c.delta = bs::call_delta(spot, strike, t, volatility, r);
            double annualized = optimizer_scoring::annualized_return(
                c.net_premium, strike, shares, dte);
            c.score = annualized - config_.delta_penalty_weight * c.delta;

            if (!best || c.score > best->score) best = c;
        }
        return best;
    }

    // Theoretical (mid) value of the open short calls; 0 when flat.
    double mark_to_market(const MarketDay& day) const {
        if (!position_.is_open()) return 0.0;
        int remaining = date_utils::days_between(day.date, position_.contract.expiration_date);
        double per_share = bs::call_price(day.spot, position_.contract.strike,
                                          bs::years_from_days(std::max(remaining, 0)),
                                          day.volatility, config_.risk_free_rate);
        return per_share * config_.contract_multiplier *
               static_cast<double>(position_.contracts);
    }

    int remaining_dte(int date) const {
        if (!position_.is_open()) return 0;
        return date_utils::days_between(date, position_.contract.expiration_date);
    }

private:
    StrategyConfig config_;
    OptionCosts costs_;
    PremiumOptimizer optimizer_;
    Position position_{};
    int last_date_ = 0;

    void check_day(const MarketDay& day) const {
        if (!date_utils::is_valid_date(day.date)) {
            throw InvalidInputError("evaluation date " + std::to_string(day.date) +
                                    " is not a valid date");
        }
        if (last_date_ != 0 && day.date <= last_date_) {
            throw InvalidInputError("days must be evaluated in increasing date order");
        }
        if (!(day.spot > 0.0) || !std::isfinite(day.spot)) {
            throw InvalidInputError("spot must be positive");
        }
        if (!(day.volatility >= 0.0) || !std::isfinite(day.volatility)) {
            throw InvalidInputError("volatility must be non-negative");
        }
    }

    void try_open(const MarketDay& day, DayEvaluation& ev) {
        auto sel = select_strike(day.spot, day.volatility);
        if (!sel || sel->net_premium <= config_.min_net_premium) {
            ev.open_rejected = true;
            return;
        }

        Position p{};
        p.contract.type = OptionType::CALL;
        p.contract.strike = sel->strike;
        p.contract.dte_at_open = sel->dte;
        p.contract.expiration_date = date_utils::add_days(day.date, sel->dte);
        p.contracts = config_.contracts();
        p.premium_received = sel->net_premium;
        p.open_date = day.date;
        p.open_spot = day.spot;
        p.open_volatility = day.volatility;
        p.status = PositionStatus::OPEN;
        position_ = p;

        ev.opened = true;
        ev.premium_collected = sel->net_premium;
    }

    TradeRecord close_record(const MarketDay& day, PositionStatus outcome,
                             double close_cost) const {
        TradeRecord t{};
        t.open_date = position_.open_date;
        t.close_date = day.date;
        t.contract = position_.contract;
        t.contracts = position_.contracts;
        t.premium_received = position_.premium_received;
        t.close_cost = close_cost;
        t.net_pnl = position_.premium_received - close_cost;
        t.open_spot = position_.open_spot;
        t.close_spot = day.spot;
        t.outcome = outcome;
        return t;
    }

    void resolve_expiration(const MarketDay& day, DayEvaluation& ev) {
        double strike = position_.contract.strike;
        double shares = static_cast<double>(position_.contracts) * config_.contract_multiplier;
        char buf[200];

        if (day.spot >= strike) {
            double intrinsic = (day.spot - strike) * shares;
            auto t = close_record(day, PositionStatus::CALLED_AWAY, intrinsic);
            std::snprintf(buf, sizeof(buf),
                          "Called away at $%.2f (stock at $%.2f), proceeds $%.2f",
                          strike, day.spot, strike * shares);
            t.details = buf;
            ev.resolution = PositionStatus::CALLED_AWAY;
            ev.assignment_proceeds = strike * shares;
            ev.shares_delivered = static_cast<int>(shares);
            ev.closed_trade = t;
        } else {
            auto t = close_record(day, PositionStatus::EXPIRED_WORTHLESS, 0.0);
            std::snprintf(buf, sizeof(buf),
                          "$%.2fC expired worthless (stock at $%.2f), premium $%.2f kept",
                          strike, day.spot, position_.premium_received);
            t.details = buf;
            ev.resolution = PositionStatus::EXPIRED_WORTHLESS;
            ev.closed_trade = t;
        }
        position_ = Position{};
    }

    double buyback_cost(const MarketDay& day) const {
        int remaining = date_utils::days_between(day.date, position_.contract.expiration_date);
        double mid = bs::call_price(day.spot, position_.contract.strike,
                                    bs::years_from_days(remaining), day.volatility,
                                    config_.risk_free_rate);
        return costs_.buyback_cost(mid, position_.contracts);
    }

    // Called only while the contract is unexpired.
    bool should_roll(const MarketDay& day) const {
        if (remaining_dte(day.date) <= config_.roll_dte_threshold) return true;
        if (position_.premium_received <= 0.0) return false;
        double captured = position_.premium_received - buyback_cost(day);
        return captured >= config_.roll_profit_capture_fraction * position_.premium_received;
    }

    void roll(const MarketDay& day, DayEvaluation& ev) {
        double cost = buyback_cost(day);
        auto t = close_record(day, PositionStatus::ROLLED, cost);
        double old_strike = position_.contract.strike;
        int contracts = position_.contracts;

        position_ = Position{};
        ev.resolution = PositionStatus::ROLLED;
        ev.buyback_cost = cost;
        try_open(day, ev);

        t.roll_net_credit = ev.premium_collected - cost;
        char buf[200];
        std::snprintf(buf, sizeof(buf),
                      "Bought back %dx $%.2fC for $%.2f, net roll credit $%.2f",
                      contracts, old_strike, cost, t.roll_net_credit);
        t.details = buf;
        ev.closed_trade = t;
    }
};
