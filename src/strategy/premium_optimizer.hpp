#pragma once

#include "errors.hpp"
#include "pricing/black_scholes.hpp"
#include "pricing/option_costs.hpp"
#include "strategy/strategy_config.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// StrikeAnalysis — one (strike, DTE) combination evaluated for a call sale
// ---------------------------------------------------------------------------
struct StrikeAnalysis {
    double strike = 0.0;
    int dte = 0;
    double theoretical_premium = 0.0;  // mid, per share
    double net_premium = 0.0;          // after spread, per share
    double net_total_premium = 0.0;    // after spread and commission, all contracts
    double delta = 0.0;
    double theta_daily = 0.0;
    double annualized_return = 0.0;    // net total / capital at strike, annualized
    double upside_to_strike = 0.0;     // (strike - spot) / spot
    double score = 0.0;
    int candidate_index = 0;           // position in the strike scan order
};

namespace optimizer_scoring {

constexpr double INCOME_WEIGHT = 0.5;
constexpr double DELTA_WEIGHT = 0.3;
constexpr double UPSIDE_WEIGHT = 0.2;
constexpr double DELTA_DECAY = 3.0;
constexpr double DELTA_SCORE_FLOOR = 0.1;
constexpr double FULL_UPSIDE = 0.30;

inline double delta_sweet_spot(double delta, double target_delta) {
    return std::max(1.0 - std::abs(delta - target_delta) * DELTA_DECAY, DELTA_SCORE_FLOOR);
}

inline double upside_room(double upside) {
    return std::clamp(upside / FULL_UPSIDE, 0.0, 1.0);
}

// Net premium over capital at risk (strike * shares), scaled to a year.
inline double annualized_return(double net_total_premium, double strike,
                                double shares, int dte) {
    double capital = strike * shares;
    if (capital <= 0.0 || dte <= 0) return 0.0;
    return (net_total_premium / capital) *
           (bs::CALENDAR_DAYS_PER_YEAR / static_cast<double>(dte));
}

}  // namespace optimizer_scoring

// ---------------------------------------------------------------------------
// PremiumOptimizer — grid search over strike x expiration
// ---------------------------------------------------------------------------
class PremiumOptimizer {
public:
    explicit PremiumOptimizer(const StrategyConfig& config) : config_(config) {
        config_.validate();
    }

    StrikeAnalysis analyze(double spot, double strike, int dte, double volatility) const {
        if (!(spot > 0.0) || !std::isfinite(spot)) {
            throw InvalidInputError("spot must be positive");
        }
        if (dte <= 0) {
            throw InvalidInputError("DTE must be positive");
        }
        double t = bs::years_from_days(dte);
        double r = config_.risk_free_rate;
        int contracts = config_.contracts();
        OptionCosts costs = config_.costs();

        StrikeAnalysis a{};
        a.strike = strike;
        a.dte = dte;
        a.theoretical_premium = bs::call_price(spot, strike, t, volatility, r);
        a.net_premium = a.theoretical_premium * (1.0 - costs.spread_pct / 2.0);
        a.net_total_premium = costs.sell_proceeds(a.theoretical_premium, contracts);
        a.delta = bs::call_delta(spot, strike, t, volatility, r);
        a.theta_daily = bs::call_theta(spot, strike, t, volatility, r);
        a.annualized_return = optimizer_scoring::annualized_return(
            a.net_total_premium, strike,
            static_cast<double>(contracts) * costs.contract_multiplier, dte);
        a.upside_to_strike = (strike - spot) / spot;
        return a;
    }

    // Ranked combos for every strike >= min_strike and every DTE: score
    // descending, then lower DTE, then earlier strike candidate.
    std::vector<StrikeAnalysis> optimize(double spot,
                                         const std::vector<double>& candidate_strikes,
                                         const std::vector<int>& candidate_dtes,
                                         double volatility) const {
        std::vector<StrikeAnalysis> results;
        for (size_t i = 0; i < candidate_strikes.size(); ++i) {
            double strike = candidate_strikes[i];
            if (strike < config_.min_strike) continue;
            for (int dte : candidate_dtes) {
                auto a = analyze(spot, strike, dte, volatility);
                a.candidate_index = static_cast<int>(i);
                results.push_back(a);
            }
        }

        double best_income = 0.0;
        for (const auto& a : results) {
            if (a.net_total_premium > 0.0) {
                best_income = std::max(best_income, a.annualized_return);
            }
        }

        for (auto& a : results) {
            if (a.net_total_premium <= 0.0) {
                a.score = 0.0;
                continue;
            }
            double income = best_income > 0.0 ? a.annualized_return / best_income : 0.0;
            a.score = optimizer_scoring::INCOME_WEIGHT * income +
                      optimizer_scoring::DELTA_WEIGHT *
                          optimizer_scoring::delta_sweet_spot(a.delta, config_.target_delta) +
                      optimizer_scoring::UPSIDE_WEIGHT *
                          optimizer_scoring::upside_room(a.upside_to_strike);
        }

        std::stable_sort(results.begin(), results.end(),
                         [](const StrikeAnalysis& x, const StrikeAnalysis& y) {
                             if (x.score != y.score) return x.score > y.score;
                             if (x.dte != y.dte) return x.dte < y.dte;
                             return x.candidate_index < y.candidate_index;
                         });
        return results;
    }

    // Uses the configured strike candidates and DTEs.
    std::vector<StrikeAnalysis> optimize(double spot, double volatility) const {
        return optimize(spot, config_.strike_candidates, config_.dte_candidates(), volatility);
    }

    const StrategyConfig& config() const { return config_; }

private:
    StrategyConfig config_;
};

// ---------------------------------------------------------------------------
// Fixed-width recommendation table
// ---------------------------------------------------------------------------
inline std::string format_table(double spot, double volatility,
                                const std::vector<StrikeAnalysis>& analyses,
                                size_t top_n = 10) {
    std::string out;
    char line[160];

    std::snprintf(line, sizeof(line), "Premium optimization for $%.2f (IV: %.1f%%)\n",
                  spot, volatility * 100.0);
    out += line;
    std::snprintf(line, sizeof(line), "%8s %5s %9s %9s %7s %9s %8s %7s\n",
                  "Strike", "DTE", "Premium", "Net", "Delta", "Ann.Ret", "Upside", "Score");
    out += line;
    out += std::string(72, '-') + "\n";

    size_t n = std::min(top_n, analyses.size());
    for (size_t i = 0; i < n; ++i) {
        const auto& a = analyses[i];
        std::snprintf(line, sizeof(line),
                      "$%7.2f %5d $%8.4f $%8.4f %7.3f %8.1f%% %7.1f%% %7.3f\n",
                      a.strike, a.dte, a.theoretical_premium, a.net_premium, a.delta,
                      a.annualized_return * 100.0, a.upside_to_strike * 100.0, a.score);
        out += line;
    }
    return out;
}
