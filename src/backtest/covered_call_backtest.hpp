#pragma once

#include "backtest/trade_record.hpp"
#include "data/price_bar.hpp"
#include "date_utils.hpp"
#include "errors.hpp"
#include "pricing/black_scholes.hpp"
#include "strategy/cash_floor.hpp"
#include "strategy/position_engine.hpp"
#include "strategy/strategy_config.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <functional>
#include <future>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <vector>

// ---------------------------------------------------------------------------
// EquityCurveSample — one per processed price bar
// ---------------------------------------------------------------------------
struct EquityCurveSample {
    int date = 0;
    double price = 0.0;
    double volatility = 0.0;
    double cash = 0.0;
    double stock_value = 0.0;
    double option_liability = 0.0;   // mark-to-market of open short calls
    double premium_collected = 0.0;  // net premium of legs opened today
    double buyback_cost = 0.0;       // paid today to close a rolled leg
    double equity = 0.0;
    PositionStatus resolution = PositionStatus::NONE;
    bool position_open = false;
    double open_strike = 0.0;
    int remaining_dte = 0;
};

// ---------------------------------------------------------------------------
// BacktestResult — equity curve, trade log and summary statistics of one run
// ---------------------------------------------------------------------------
struct BacktestResult {
    std::string config_name;
    std::vector<EquityCurveSample> equity_curve;
    std::vector<TradeRecord> trades;
    std::vector<CashFloorEstimate> cash_floor;
    std::vector<std::string> cash_floor_warnings;
    std::vector<double> daily_returns;

    double initial_investment = 0.0;
    double final_equity = 0.0;
    double total_return = 0.0;
    double annualized_return = 0.0;
    double stock_only_return = 0.0;
    double excess_return = 0.0;
    double sharpe = 0.0;
    double max_drawdown = 0.0;          // fraction of running peak
    double max_drawdown_dollars = 0.0;

    double total_premium_collected = 0.0;
    double total_commissions = 0.0;
    double total_buyback_cost = 0.0;
    double premium_yield = 0.0;

    int calls_sold = 0;
    int times_called_away = 0;
    int times_expired = 0;
    int times_rolled = 0;
    int skipped_opens = 0;
    int cash_floor_breach_days = 0;
    double avg_days_per_cycle = 0.0;
};

// ---------------------------------------------------------------------------
// BacktestResult utilities
// ---------------------------------------------------------------------------
namespace backtest_util {

inline void compute_daily_returns(BacktestResult& result) {
    result.daily_returns.clear();
    const auto& curve = result.equity_curve;
    for (size_t i = 1; i < curve.size(); ++i) {
        double prev = curve[i - 1].equity;
        result.daily_returns.push_back(prev > 0.0 ? curve[i].equity / prev - 1.0 : 0.0);
    }
}

inline void compute_max_drawdown(BacktestResult& result) {
    if (result.equity_curve.empty()) return;
    double peak = result.equity_curve.front().equity;
    double max_dd = 0.0;
    double max_dd_dollars = 0.0;
    for (const auto& s : result.equity_curve) {
        if (s.equity > peak) peak = s.equity;
        double dd_dollars = peak - s.equity;
        if (dd_dollars > max_dd_dollars) max_dd_dollars = dd_dollars;
        if (peak > 0.0) {
            double dd = dd_dollars / peak;
            if (dd > max_dd) max_dd = dd;
        }
    }
    result.max_drawdown = max_dd;
    result.max_drawdown_dollars = max_dd_dollars;
}

// Mean over population stdev of daily returns, annualized by sqrt(252).
inline void compute_sharpe(BacktestResult& result) {
    result.sharpe = 0.0;
    const auto& r = result.daily_returns;
    if (r.size() < 2) return;
    double n = static_cast<double>(r.size());
    double mean = 0.0;
    for (double x : r) mean += x;
    mean /= n;
    double sum_sq = 0.0;
    for (double x : r) sum_sq += (x - mean) * (x - mean);
    double stddev = std::sqrt(sum_sq / n);
    if (stddev > 0.0) {
        result.sharpe = mean / stddev * std::sqrt(bs::TRADING_DAYS_PER_YEAR);
    }
}

inline void compute_returns(BacktestResult& result) {
    const auto& curve = result.equity_curve;
    if (curve.empty() || result.initial_investment <= 0.0) return;

    result.final_equity = curve.back().equity;
    double growth = result.final_equity / result.initial_investment;
    result.total_return = growth - 1.0;
    double days = static_cast<double>(curve.size());
    result.annualized_return = growth > 0.0
        ? std::pow(growth, bs::TRADING_DAYS_PER_YEAR / days) - 1.0
        : -1.0;
    result.stock_only_return = curve.back().price / curve.front().price - 1.0;
    result.excess_return = result.total_return - result.stock_only_return;
    result.premium_yield = result.total_premium_collected / result.initial_investment;
}

inline void compute_cycle_length(BacktestResult& result, const std::vector<int>& open_dates) {
    result.avg_days_per_cycle = 0.0;
    if (open_dates.size() < 2) return;
    double total = 0.0;
    for (size_t i = 1; i < open_dates.size(); ++i) {
        total += date_utils::days_between(open_dates[i - 1], open_dates[i]);
    }
    result.avg_days_per_cycle = total / static_cast<double>(open_dates.size() - 1);
}

// Recompute every summary statistic from the equity curve and counters.
inline void recompute_derived(BacktestResult& result, const std::vector<int>& open_dates) {
    compute_daily_returns(result);
    compute_returns(result);
    compute_max_drawdown(result);
    compute_sharpe(result);
    compute_cycle_length(result, open_dates);
}

}  // namespace backtest_util

// ---------------------------------------------------------------------------
// CoveredCallBacktest — day-by-day simulation of one configuration
//
// Capital model: buy `shares` at the first close; premiums and buy-backs move
// cash; on assignment the shares are delivered at the strike and re-bought at
// the same day's close before a new call is written.
// ---------------------------------------------------------------------------
class CoveredCallBacktest {
public:
    explicit CoveredCallBacktest(const StrategyConfig& config) : config_(config) {}

    BacktestResult run(const PriceSeries& series) const {
        config_.validate();
        price_series::validate(series, config_.max_calendar_gap_days);

        BacktestResult result{};
        result.config_name = config_.name;
        result.equity_curve.reserve(series.size());
        result.cash_floor.reserve(series.size());

        PositionEngine engine(config_);
        CashFloorMonitor monitor(series.front().date, config_.net_cash_per_share,
                                 config_.cash_burn_per_day,
                                 config_.cash_floor_warning_threshold,
                                 config_.cash_floor_premium_ratio);
        OptionCosts costs = config_.costs();
        std::vector<double> closes = price_series::closes(series);
        std::vector<int> open_dates;

        double shares = static_cast<double>(config_.shares);
        int contracts = config_.contracts();
        result.initial_investment = series.front().close * shares;
        double cash = 0.0;  // all starting capital buys the shares
        CashFloorEstimate prev_floor{};

        for (size_t i = 0; i < series.size(); ++i) {
            const auto& bar = series[i];

            // (a) thesis monitor
            auto floor = monitor.sample(bar.date, bar.close);
            if (floor.breach) ++result.cash_floor_breach_days;
            record_floor_warnings(floor, prev_floor, result.cash_floor_warnings);
            prev_floor = floor;
            result.cash_floor.push_back(floor);

            // (b) volatility
            MarketDay day{bar.date, bar.close, volatility_for(closes, i)};

            // (c) position state machine
            auto ev = engine.evaluate(day);
            cash += ev.premium_collected - ev.buyback_cost;
            if (ev.resolution == PositionStatus::CALLED_AWAY) {
                cash += ev.assignment_proceeds;
                cash -= bar.close * shares;
                ++result.times_called_away;
            } else if (ev.resolution == PositionStatus::EXPIRED_WORTHLESS) {
                ++result.times_expired;
            } else if (ev.resolution == PositionStatus::ROLLED) {
                ++result.times_rolled;
                result.total_buyback_cost += ev.buyback_cost;
                result.total_commissions += costs.commission(contracts);
            }
            if (ev.closed_trade) result.trades.push_back(*ev.closed_trade);
            if (ev.opened) {
                ++result.calls_sold;
                result.total_premium_collected += ev.premium_collected;
                result.total_commissions += costs.commission(contracts);
                open_dates.push_back(bar.date);
            }
            if (ev.open_rejected) ++result.skipped_opens;

            // (d) mark to market, (e) sample
            EquityCurveSample s{};
            s.date = bar.date;
            s.price = bar.close;
            s.volatility = day.volatility;
            s.cash = cash;
            s.stock_value = bar.close * shares;
            s.option_liability = engine.mark_to_market(day);
            s.premium_collected = ev.premium_collected;
            s.buyback_cost = ev.buyback_cost;
            s.equity = s.cash + s.stock_value - s.option_liability;
            s.resolution = ev.resolution;
            s.position_open = engine.position().is_open();
            s.open_strike = s.position_open ? engine.position().contract.strike : 0.0;
            s.remaining_dte = engine.remaining_dte(bar.date);
            result.equity_curve.push_back(s);
        }

        backtest_util::recompute_derived(result, open_dates);
        return result;
    }

    // Runs over the bars dated within [start_date, end_date]; 0 leaves a bound
    // open. Warm-up volatility and the capital base start at the first bar
    // inside the window.
    BacktestResult run(const PriceSeries& series, int start_date, int end_date) const {
        return run(price_series::slice(series, start_date, end_date));
    }

    const StrategyConfig& config() const { return config_; }

private:
    StrategyConfig config_;

    // Warm-up days use the configured default until `volatility_window`
    // prior bars exist.
    double volatility_for(const std::vector<double>& closes, size_t idx) const {
        if (idx < static_cast<size_t>(config_.volatility_window)) {
            return config_.default_volatility;
        }
        std::span<const double> history(closes.data(), idx + 1);
        double iv = bs::estimate_volatility(history, config_.volatility_window,
                                            config_.iv_premium_multiplier);
        return std::max(iv, config_.iv_floor);
    }

    // Edge-triggered: one warning when a condition starts, none while it lasts.
    static void record_floor_warnings(const CashFloorEstimate& now,
                                      const CashFloorEstimate& prev,
                                      std::vector<std::string>& out) {
        char buf[240];
        std::string date = date_utils::date_to_string(now.date);
        if (now.breach && !prev.breach) {
            std::snprintf(buf, sizeof(buf),
                          "[%s] Stock ($%.2f) below %.2fx estimated cash ($%.2f)",
                          date.c_str(), now.price, now.price_to_cash_ratio,
                          now.net_cash_per_share);
            out.emplace_back(buf);
        }
        if (now.premium_warning && !prev.premium_warning) {
            std::snprintf(buf, sizeof(buf),
                          "[%s] Stock ($%.2f) trading at %.1fx estimated cash ($%.2f); "
                          "downside protection weakened",
                          date.c_str(), now.price, now.price_to_cash_ratio,
                          now.net_cash_per_share);
            out.emplace_back(buf);
        }
        if (now.burn_alert && !prev.burn_alert) {
            std::snprintf(buf, sizeof(buf),
                          "[%s] Cash burn alert: estimated cash $%.2f under half of initial",
                          date.c_str(), now.net_cash_per_share);
            out.emplace_back(buf);
        }
        if (now.net_cash_per_share <= 0.0 && prev.net_cash_per_share > 0.0) {
            std::snprintf(buf, sizeof(buf),
                          "[%s] Estimated net cash fully burned", date.c_str());
            out.emplace_back(buf);
        }
    }
};

inline BacktestResult run_backtest(const PriceSeries& series, const StrategyConfig& config) {
    return CoveredCallBacktest(config).run(series);
}

inline BacktestResult run_backtest(const PriceSeries& series, const StrategyConfig& config,
                                   int start_date, int end_date) {
    return CoveredCallBacktest(config).run(series, start_date, end_date);
}

// ---------------------------------------------------------------------------
// Head-to-head comparison
// ---------------------------------------------------------------------------
struct ComparisonRun {
    std::string config_name;
    std::optional<BacktestResult> result;
    std::string error_kind;  // "InvalidInputError", ... when the run aborted
    std::string error;

    bool ok() const { return result.has_value(); }
};

namespace backtest_detail {

inline ComparisonRun run_one(const StrategyConfig& config, const PriceSeries& series) {
    ComparisonRun run{};
    run.config_name = config.name;
    try {
        run.result = run_backtest(series, config);
    } catch (const InvalidInputError& e) {
        run.error_kind = "InvalidInputError";
        run.error = e.what();
    } catch (const InsufficientHistoryError& e) {
        run.error_kind = "InsufficientHistoryError";
        run.error = e.what();
    } catch (const DataIntegrityError& e) {
        run.error_kind = "DataIntegrityError";
        run.error = e.what();
    }
    return run;
}

}  // namespace backtest_detail

// Runs every configuration against the same series. The series is checked once
// up front (throws DataIntegrityError); a configuration that fails afterwards is
// reported in its ComparisonRun without affecting the others. Results follow
// the order of `configs` whether or not the runs execute in parallel.
// Parallel runs are bounded by std::thread::hardware_concurrency().
inline std::vector<ComparisonRun> compare(const std::vector<StrategyConfig>& configs,
                                          const PriceSeries& series,
                                          bool parallel = false) {
    if (configs.empty()) return {};
    int max_gap = 0;
    for (const auto& c : configs) max_gap = std::max(max_gap, c.max_calendar_gap_days);
    price_series::validate(series, max_gap);

    std::vector<ComparisonRun> runs;
    runs.reserve(configs.size());

    if (!parallel) {
        for (const auto& c : configs) runs.push_back(backtest_detail::run_one(c, series));
        return runs;
    }

    // At most one worker per hardware thread; batches finish before the next
    // one starts.
    size_t workers = std::max(1u, std::thread::hardware_concurrency());
    std::vector<std::future<ComparisonRun>> futures;
    futures.reserve(std::min(workers, configs.size()));
    for (size_t begin = 0; begin < configs.size(); begin += workers) {
        size_t end = std::min(begin + workers, configs.size());
        futures.clear();
        for (size_t i = begin; i < end; ++i) {
            futures.push_back(std::async(std::launch::async, backtest_detail::run_one,
                                         std::cref(configs[i]), std::cref(series)));
        }
        for (auto& f : futures) runs.push_back(f.get());
    }
    return runs;
}
