#pragma once

#include "errors.hpp"

#include <cmath>

enum class TradeSide { SELL, BUY };

// ---------------------------------------------------------------------------
// apply_costs — dollars changing hands when `contracts` options trade at
// `mid_price` per share.
//
// SELL: mid * (1 - spread/2) * multiplier * contracts - commission * contracts
//       (proceeds received; may be negative for near-worthless options)
// BUY:  mid * (1 + spread/2) * multiplier * contracts + commission * contracts
//       (cost paid)
// ---------------------------------------------------------------------------
inline double apply_costs(TradeSide side, double mid_price, double spread_pct,
                          double commission_per_contract, int contracts,
                          double contract_multiplier) {
    if (!std::isfinite(mid_price) || mid_price < 0.0) {
        throw InvalidInputError("option mid price must be non-negative");
    }
    if (!(spread_pct >= 0.0 && spread_pct <= 1.0)) {
        throw InvalidInputError("bid-ask spread percent must be in [0, 1]");
    }
    if (!std::isfinite(commission_per_contract) || commission_per_contract < 0.0) {
        throw InvalidInputError("commission must be non-negative");
    }
    if (contracts <= 0) {
        throw InvalidInputError("contract count must be positive");
    }
    if (!std::isfinite(contract_multiplier) || contract_multiplier <= 0.0) {
        throw InvalidInputError("contract multiplier must be positive");
    }

    double n = static_cast<double>(contracts);
    double commission = commission_per_contract * n;
    if (side == TradeSide::SELL) {
        return mid_price * (1.0 - spread_pct / 2.0) * contract_multiplier * n - commission;
    }
    return mid_price * (1.0 + spread_pct / 2.0) * contract_multiplier * n + commission;
}

// ---------------------------------------------------------------------------
// OptionCosts — the cost assumptions of one strategy configuration
// ---------------------------------------------------------------------------
struct OptionCosts {
    double spread_pct = 0.15;
    double commission_per_contract = 0.65;
    double contract_multiplier = 100.0;

    // Net premium received when writing `contracts` calls at `mid_price`.
    double sell_proceeds(double mid_price, int contracts) const {
        return apply_costs(TradeSide::SELL, mid_price, spread_pct,
                           commission_per_contract, contracts, contract_multiplier);
    }

    // Cost paid to buy back `contracts` calls at `mid_price`.
    double buyback_cost(double mid_price, int contracts) const {
        return apply_costs(TradeSide::BUY, mid_price, spread_pct,
                           commission_per_contract, contracts, contract_multiplier);
    }

    // Value lost by selling and immediately buying back at the same mid.
    double round_trip_cost(double mid_price, int contracts) const {
        return buyback_cost(mid_price, contracts) - sell_proceeds(mid_price, contracts);
    }

    double commission(int contracts) const {
        return commission_per_contract * static_cast<double>(contracts);
    }
};
