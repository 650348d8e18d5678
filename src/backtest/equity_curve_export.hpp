#pragma once

#include "backtest/covered_call_backtest.hpp"
#include "date_utils.hpp"
#include "strategy/position.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// EquityCurveExporter — one CSV row per EquityCurveSample
// ---------------------------------------------------------------------------
class EquityCurveExporter {
public:
    static std::vector<std::string> column_names() {
        return {"date", "price", "volatility", "cash", "stock_value",
                "option_liability", "premium_collected", "buyback_cost", "equity",
                "resolution", "position_open", "open_strike", "remaining_dte"};
    }

    std::string header_line() const {
        std::ostringstream ss;
        auto names = column_names();
        for (size_t i = 0; i < names.size(); ++i) {
            if (i > 0) ss << ",";
            ss << names[i];
        }
        return ss.str();
    }

    std::string format_row(const EquityCurveSample& s) const {
        std::ostringstream ss;
        ss << std::setprecision(12);
        ss << date_utils::date_to_string(s.date);
        ss << "," << s.price;
        ss << "," << s.volatility;
        ss << "," << s.cash;
        ss << "," << s.stock_value;
        ss << "," << s.option_liability;
        ss << "," << s.premium_collected;
        ss << "," << s.buyback_cost;
        ss << "," << s.equity;
        ss << "," << status_str(s.resolution);
        ss << "," << (s.position_open ? "true" : "false");
        ss << "," << s.open_strike;
        ss << "," << s.remaining_dte;
        return ss.str();
    }

    void export_csv(const std::vector<EquityCurveSample>& curve,
                    const std::string& output_path) const {
        auto parent = std::filesystem::path(output_path).parent_path();
        if (!parent.empty() && !std::filesystem::exists(parent)) {
            throw std::runtime_error("Output directory does not exist: " + parent.string());
        }
        std::ofstream out(output_path);
        if (!out.is_open()) {
            throw std::runtime_error("Cannot open output file: " + output_path);
        }
        out << header_line() << "\n";
        for (const auto& s : curve) {
            out << format_row(s) << "\n";
        }
    }
};
