#pragma once

#include "backtest/covered_call_backtest.hpp"
#include "backtest/trade_record.hpp"
#include "date_utils.hpp"
#include "strategy/strategy_config.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace backtest_io {

// Escape a string for JSON output
inline std::string json_escape(const std::string& s) {
    std::string result;
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            default:   result += c;
        }
    }
    return result;
}

// JSON has no infinity; non-finite values are written as null.
inline std::string json_number(double v) {
    if (!std::isfinite(v)) return "null";
    std::ostringstream ss;
    ss << std::setprecision(10) << v;
    return ss.str();
}

inline std::string json_date(int date) {
    return "\"" + date_utils::date_to_string(date) + "\"";
}

inline std::string trade_to_json(const TradeRecord& t) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"open_date\":" << json_date(t.open_date);
    ss << ",\"close_date\":" << json_date(t.close_date);
    ss << ",\"strike\":" << json_number(t.contract.strike);
    ss << ",\"expiration\":" << json_date(t.contract.expiration_date);
    ss << ",\"dte_at_open\":" << t.contract.dte_at_open;
    ss << ",\"contracts\":" << t.contracts;
    ss << ",\"premium_received\":" << json_number(t.premium_received);
    ss << ",\"close_cost\":" << json_number(t.close_cost);
    ss << ",\"net_pnl\":" << json_number(t.net_pnl);
    if (t.outcome == PositionStatus::ROLLED) {
        ss << ",\"roll_net_credit\":" << json_number(t.roll_net_credit);
    }
    ss << ",\"outcome\":\"" << status_str(t.outcome) << "\"";
    ss << ",\"details\":\"" << json_escape(t.details) << "\"";
    ss << "}";
    return ss.str();
}

// Summary statistics, trade log and warnings (the equity curve goes to CSV).
inline std::string to_json(const BacktestResult& r) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"config\":\"" << json_escape(r.config_name) << "\"";
    ss << ",\"trading_days\":" << r.equity_curve.size();
    ss << ",\"initial_investment\":" << json_number(r.initial_investment);
    ss << ",\"final_equity\":" << json_number(r.final_equity);
    ss << ",\"total_return\":" << json_number(r.total_return);
    ss << ",\"annualized_return\":" << json_number(r.annualized_return);
    ss << ",\"stock_only_return\":" << json_number(r.stock_only_return);
    ss << ",\"excess_return\":" << json_number(r.excess_return);
    ss << ",\"sharpe\":" << json_number(r.sharpe);
    ss << ",\"max_drawdown\":" << json_number(r.max_drawdown);
    ss << ",\"max_drawdown_dollars\":" << json_number(r.max_drawdown_dollars);
    ss << ",\"total_premium_collected\":" << json_number(r.total_premium_collected);
    ss << ",\"total_commissions\":" << json_number(r.total_commissions);
    ss << ",\"total_buyback_cost\":" << json_number(r.total_buyback_cost);
    ss << ",\"premium_yield\":" << json_number(r.premium_yield);
    ss << ",\"calls_sold\":" << r.calls_sold;
    ss << ",\"times_called_away\":" << r.times_called_away;
    ss << ",\"times_expired\":" << r.times_expired;
    ss << ",\"times_rolled\":" << r.times_rolled;
    ss << ",\"skipped_opens\":" << r.skipped_opens;
    ss << ",\"cash_floor_breach_days\":" << r.cash_floor_breach_days;
    ss << ",\"avg_days_per_cycle\":" << json_number(r.avg_days_per_cycle);

    ss << ",\"trades\":[";
    for (size_t i = 0; i < r.trades.size(); ++i) {
        if (i > 0) ss << ",";
        ss << trade_to_json(r.trades[i]);
    }
    ss << "]";

    ss << ",\"cash_floor_warnings\":[";
    for (size_t i = 0; i < r.cash_floor_warnings.size(); ++i) {
        if (i > 0) ss << ",";
        ss << "\"" << json_escape(r.cash_floor_warnings[i]) << "\"";
    }
    ss << "]";

    ss << "}";
    return ss.str();
}

// Serialize a comparison sweep; failed runs carry their error instead of stats.
inline std::string to_json(const std::vector<ComparisonRun>& runs) {
    std::ostringstream ss;
    ss << "[";
    for (size_t i = 0; i < runs.size(); ++i) {
        if (i > 0) ss << ",";
        const auto& run = runs[i];
        if (run.ok()) {
            ss << to_json(*run.result);
        } else {
            ss << "{";
            ss << "\"config\":\"" << json_escape(run.config_name) << "\"";
            ss << ",\"error_kind\":\"" << json_escape(run.error_kind) << "\"";
            ss << ",\"error\":\"" << json_escape(run.error) << "\"";
            ss << "}";
        }
    }
    ss << "]";
    return ss.str();
}

}  // namespace backtest_io
