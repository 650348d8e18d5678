// covered_call_backtest.cpp — CLI for the covered-call backtest
//
// Loads a daily price CSV, runs the configured strategy (and optionally a
// min-strike comparison sweep), prints the report, and writes the equity curve
// (.csv or .parquet) and JSON metrics.
//
// Usage: ./covered_call_backtest --prices <csv> [--output <csv|parquet>]
//            [--json <path>] [--min-strike <x>] [--target-dte <n>]
//            [--compare-min-strikes a,b,...]

#include "backtest/backtest_result_io.hpp"
#include "backtest/covered_call_backtest.hpp"
#include "backtest/equity_curve_export.hpp"
#include "data/price_series_csv.hpp"
#include "date_utils.hpp"
#include "strategy/premium_optimizer.hpp"
#include "strategy/strategy_config.hpp"

// Arrow/Parquet for Parquet output
#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/writer.h>

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

// ===========================================================================
// Parquet Writer
// ===========================================================================
bool write_parquet_file(const std::string& path, const std::vector<EquityCurveSample>& curve) {
    arrow::FieldVector fields;
    fields.push_back(arrow::field("date", arrow::utf8()));
    fields.push_back(arrow::field("price", arrow::float64()));
    fields.push_back(arrow::field("volatility", arrow::float64()));
    fields.push_back(arrow::field("cash", arrow::float64()));
    fields.push_back(arrow::field("stock_value", arrow::float64()));
    fields.push_back(arrow::field("option_liability", arrow::float64()));
    fields.push_back(arrow::field("premium_collected", arrow::float64()));
    fields.push_back(arrow::field("buyback_cost", arrow::float64()));
    fields.push_back(arrow::field("equity", arrow::float64()));
    fields.push_back(arrow::field("resolution", arrow::utf8()));
    fields.push_back(arrow::field("position_open", arrow::boolean()));
    fields.push_back(arrow::field("open_strike", arrow::float64()));
    fields.push_back(arrow::field("remaining_dte", arrow::int64()));
    auto schema = arrow::schema(fields);

    std::vector<std::shared_ptr<arrow::Array>> arrays;
    std::shared_ptr<arrow::Array> arr;
    arrow::Status st;

    auto finish = [&](arrow::ArrayBuilder& b) {
        st = b.Finish(&arr);
        if (st.ok()) arrays.push_back(arr);
        return st.ok();
    };
    auto double_column = [&](auto getter) {
        arrow::DoubleBuilder b;
        for (const auto& s : curve) {
            st = b.Append(getter(s));
            if (!st.ok()) return false;
        }
        return finish(b);
    };
    auto string_column = [&](auto getter) {
        arrow::StringBuilder b;
        for (const auto& s : curve) {
            st = b.Append(getter(s));
            if (!st.ok()) return false;
        }
        return finish(b);
    };

    using S = EquityCurveSample;
    bool ok = string_column([](const S& s) { return date_utils::date_to_string(s.date); }) &&
              double_column([](const S& s) { return s.price; }) &&
              double_column([](const S& s) { return s.volatility; }) &&
              double_column([](const S& s) { return s.cash; }) &&
              double_column([](const S& s) { return s.stock_value; }) &&
              double_column([](const S& s) { return s.option_liability; }) &&
              double_column([](const S& s) { return s.premium_collected; }) &&
              double_column([](const S& s) { return s.buyback_cost; }) &&
              double_column([](const S& s) { return s.equity; }) &&
              string_column([](const S& s) { return status_str(s.resolution); });
    if (ok) {
        arrow::BooleanBuilder b;
        for (const auto& s : curve) {
            st = b.Append(s.position_open);
            if (!st.ok()) break;
        }
        ok = st.ok() && finish(b);
    }
    ok = ok && double_column([](const S& s) { return s.open_strike; });
    if (ok) {
        arrow::Int64Builder b;
        for (const auto& s : curve) {
            st = b.Append(static_cast<int64_t>(s.remaining_dte));
            if (!st.ok()) break;
        }
        ok = st.ok() && finish(b);
    }
    if (!ok) {
        std::cerr << "Failed to build Arrow arrays: " << st.ToString() << "\n";
        return false;
    }

    auto table = arrow::Table::Make(schema, arrays);

    auto outfile_result = arrow::io::FileOutputStream::Open(path);
    if (!outfile_result.ok()) {
        std::cerr << "Cannot open Parquet output file: " << path << "\n";
        return false;
    }
    auto outfile = *outfile_result;

    auto props = parquet::WriterProperties::Builder()
        .compression(parquet::Compression::ZSTD)
        ->build();

    auto status = parquet::arrow::WriteTable(
        *table, arrow::default_memory_pool(), outfile,
        /*chunk_size=*/static_cast<int64_t>(curve.size()), props);

    if (!status.ok()) {
        std::cerr << "Failed to write Parquet: " << status.ToString() << "\n";
        return false;
    }
    return true;
}

// ===========================================================================
// Report
// ===========================================================================
void print_report(const BacktestResult& r) {
    std::printf("=== %s ===\n\n", r.config_name.c_str());
    std::printf("  Trading days:          %8zu\n", r.equity_curve.size());
    std::printf("  Total return:          %8.2f%%\n", r.total_return * 100.0);
    std::printf("  Annualized return:     %8.2f%%\n", r.annualized_return * 100.0);
    std::printf("  Stock-only return:     %8.2f%%\n", r.stock_only_return * 100.0);
    std::printf("  Excess return:         %8.2f%%\n", r.excess_return * 100.0);
    std::printf("  Sharpe:                %8.2f\n", r.sharpe);
    std::printf("  Max drawdown:          %8.2f%% ($%.2f)\n",
                r.max_drawdown * 100.0, r.max_drawdown_dollars);
    std::printf("  Premium collected:     $%10.2f\n", r.total_premium_collected);
    std::printf("  Commissions:           $%10.2f\n", r.total_commissions);
    std::printf("  Buy-back cost:         $%10.2f\n", r.total_buyback_cost);
    std::printf("  Premium yield:         %8.2f%%\n", r.premium_yield * 100.0);
    std::printf("  Calls sold:            %8d\n", r.calls_sold);
    std::printf("  Called away:           %8d\n", r.times_called_away);
    std::printf("  Expired worthless:     %8d\n", r.times_expired);
    std::printf("  Rolled:                %8d\n", r.times_rolled);
    std::printf("  Skipped opens:         %8d\n", r.skipped_opens);
    std::printf("  Avg days per cycle:    %8.1f\n", r.avg_days_per_cycle);
    std::printf("  Cash floor breach days:%8d\n\n", r.cash_floor_breach_days);

    if (!r.cash_floor_warnings.empty()) {
        std::cout << "Cash floor warnings:\n";
        for (const auto& w : r.cash_floor_warnings) std::cout << "  " << w << "\n";
        std::cout << "\n";
    }

    std::cout << "Trade log:\n";
    for (const auto& t : r.trades) {
        std::printf("  [%s -> %s] %-17s %s\n",
                    date_utils::date_to_string(t.open_date).c_str(),
                    date_utils::date_to_string(t.close_date).c_str(),
                    status_str(t.outcome).c_str(), t.details.c_str());
    }
    std::cout << "\n";
}

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " --prices <csv> [--output <path>] [--json <path>]"
                 " [--min-strike <x>] [--target-dte <n>] [--compare-min-strikes a,b,...]"
                 " [--start <date>] [--end <date>]\n"
              << "\n"
              << "  --prices               Daily price CSV with Date and Close columns\n"
              << "  --output               Equity curve output (.csv or .parquet)\n"
              << "  --json                 Metrics JSON output\n"
              << "  --min-strike           Minimum strike to write (default 2.50)\n"
              << "  --target-dte           Days to expiration for new calls (default 30)\n"
              << "  --compare-min-strikes  Comma-separated min strikes to run side by side\n"
              << "  --start                First date to simulate (YYYY-MM-DD or YYYYMMDD)\n"
              << "  --end                  Last date to simulate (YYYY-MM-DD or YYYYMMDD)\n";
}

std::vector<double> parse_list(const std::string& s) {
    std::vector<double> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) out.push_back(std::stod(item));
    }
    return out;
}

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    std::string prices_path;
    std::string output_path;
    std::string json_path;
    std::string min_strike_str;
    std::string target_dte_str;
    std::string compare_str;
    std::string start_str;
    std::string end_str;

    // Parse CLI args
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--prices" && i + 1 < argc) {
            prices_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            output_path = argv[++i];
        } else if (arg == "--json" && i + 1 < argc) {
            json_path = argv[++i];
        } else if (arg == "--min-strike" && i + 1 < argc) {
            min_strike_str = argv[++i];
        } else if (arg == "--target-dte" && i + 1 < argc) {
            target_dte_str = argv[++i];
        } else if (arg == "--compare-min-strikes" && i + 1 < argc) {
            compare_str = argv[++i];
        } else if (arg == "--start" && i + 1 < argc) {
            start_str = argv[++i];
        } else if (arg == "--end" && i + 1 < argc) {
            end_str = argv[++i];
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (prices_path.empty()) {
        std::cerr << "Missing required argument: --prices\n";
        print_usage(argv[0]);
        return 1;
    }

    bool use_parquet = false;
    if (!output_path.empty()) {
        std::string ext = std::filesystem::path(output_path).extension().string();
        if (ext == ".parquet") {
            use_parquet = true;
        } else if (ext != ".csv") {
            std::cerr << "Unsupported output format. Use .csv or .parquet extension.\n";
            return 1;
        }
    }

    int start_date = 0;
    int end_date = 0;
    if (!start_str.empty() && (start_date = date_utils::parse_date(start_str)) == 0) {
        std::cerr << "Invalid --start date: " << start_str << "\n";
        return 1;
    }
    if (!end_str.empty() && (end_date = date_utils::parse_date(end_str)) == 0) {
        std::cerr << "Invalid --end date: " << end_str << "\n";
        return 1;
    }
    if (start_date != 0 && end_date != 0 && start_date > end_date) {
        std::cerr << "--start " << start_str << " is after --end " << end_str << "\n";
        return 1;
    }

    StrategyConfig config;
    std::vector<double> compare_strikes;
    try {
        if (!min_strike_str.empty()) config.min_strike = std::stod(min_strike_str);
        if (!target_dte_str.empty()) config.target_dte = std::stoi(target_dte_str);
        if (!compare_str.empty()) compare_strikes = parse_list(compare_str);
    } catch (const std::logic_error& e) {
        std::cerr << "Invalid numeric argument: " << e.what() << "\n";
        return 1;
    }
    char name[64];
    std::snprintf(name, sizeof(name), "min_strike_%.2f", config.min_strike);
    config.name = name;

    std::cout << "=== Covered Call Backtest ===\n\n";

    PriceSeries series;
    BacktestResult result;
    try {
        series = price_series_csv::load(prices_path, config.max_calendar_gap_days);
        if (start_date != 0 || end_date != 0) {
            series = price_series::slice(series, start_date, end_date);
            price_series::validate(series, config.max_calendar_gap_days);
        }
        std::cout << "Loaded " << series.size() << " bars ("
                  << date_utils::date_to_string(series.front().date) << " to "
                  << date_utils::date_to_string(series.back().date) << ")\n\n";
        result = run_backtest(series, config);
    } catch (const std::invalid_argument& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 2;
    } catch (const std::runtime_error& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 2;
    }

    print_report(result);

    // --- Strike recommendation for the last day ---
    const auto& last = result.equity_curve.back();
    PremiumOptimizer optimizer(config);
    auto ranked = optimizer.optimize(last.price, last.volatility);
    std::cout << format_table(last.price, last.volatility, ranked) << "\n";

    // --- Comparison sweep ---
    std::vector<ComparisonRun> runs;
    if (!compare_strikes.empty()) {
        std::vector<StrategyConfig> configs;
        for (double k : compare_strikes) {
            StrategyConfig c = config;
            c.min_strike = k;
            std::snprintf(name, sizeof(name), "min_strike_%.2f", k);
            c.name = name;
            configs.push_back(c);
        }
        runs = compare(configs, series, /*parallel=*/true);

        std::cout << "=== Comparison ===\n\n";
        std::printf("  %-18s %10s %10s %8s %10s %8s\n",
                    "Config", "Return", "Annual", "Sharpe", "Premium", "Called");
        for (const auto& run : runs) {
            if (!run.ok()) {
                std::printf("  %-18s FAILED (%s): %s\n", run.config_name.c_str(),
                            run.error_kind.c_str(), run.error.c_str());
                continue;
            }
            const auto& r = *run.result;
            std::printf("  %-18s %9.2f%% %9.2f%% %8.2f %10.2f %8d\n",
                        r.config_name.c_str(), r.total_return * 100.0,
                        r.annualized_return * 100.0, r.sharpe,
                        r.total_premium_collected, r.times_called_away);
        }
        std::cout << "\n";
    }

    // --- Outputs ---
    if (!output_path.empty()) {
        if (use_parquet) {
            if (!write_parquet_file(output_path, result.equity_curve)) return 1;
        } else {
            try {
                EquityCurveExporter().export_csv(result.equity_curve, output_path);
            } catch (const std::runtime_error& e) {
                std::cerr << "ERROR: " << e.what() << "\n";
                return 1;
            }
        }
        std::cout << "Equity curve: " << output_path << "\n";
    }

    if (!json_path.empty()) {
        std::ofstream out(json_path);
        if (!out.is_open()) {
            std::cerr << "Cannot open output file: " << json_path << "\n";
            return 1;
        }
        if (runs.empty()) {
            out << backtest_io::to_json(result);
        } else {
            out << "{\"base\":" << backtest_io::to_json(result)
                << ",\"comparison\":" << backtest_io::to_json(runs) << "}";
        }
        out << "\n";
        std::cout << "Metrics: " << json_path << "\n";
    }

    return 0;
}
