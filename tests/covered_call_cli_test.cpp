// covered_call_cli_test.cpp — Integration tests for the covered_call_backtest tool
//
// Runs the built binary against a synthetic price CSV. Guarded by GTEST_SKIP
// when the tool was not built (it needs Arrow/Parquet).

#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <sys/wait.h>
#include <vector>

// ===========================================================================
// Helpers
// ===========================================================================
namespace {

// Tests run from the build directory.
const std::string BINARY_PATH = "./covered_call_backtest";

struct RunResult {
    int exit_code;
    std::string output;
};

RunResult run_command(const std::string& cmd) {
    RunResult result;
    std::string full_cmd = cmd + " 2>&1";
    FILE* pipe = popen(full_cmd.c_str(), "r");
    if (!pipe) {
        result.exit_code = -1;
        result.output = "popen failed";
        return result;
    }
    char buffer[256];
    while (fgets(buffer, sizeof(buffer), pipe)) {
        result.output += buffer;
    }
    int status = pclose(pipe);
    result.exit_code = WEXITSTATUS(status);
    return result;
}

std::string temp_path(const std::string& name) {
    return (std::filesystem::temp_directory_path() / ("covered_call_cli_test_" + name)).string();
}

std::string read_file(const std::string& path) {
    std::ifstream f(path);
    std::string content((std::istreambuf_iterator<char>(f)),
                         std::istreambuf_iterator<char>());
    return content;
}

// 60 calendar days oscillating around $2.40.
void write_prices(const std::string& path) {
    std::ofstream out(path);
    out << "Date,Open,High,Low,Close\n";
    int day = 2;
    int month = 1;
    for (int i = 0; i < 60; ++i) {
        double close = 2.40 + ((i % 6) - 3) * 0.05;
        char line[96];
        std::snprintf(line, sizeof(line), "2024-%02d-%02d,%.2f,%.2f,%.2f,%.2f\n",
                      month, day, close, close + 0.05, close - 0.05, close);
        out << line;
        ++day;
        int days_in_month = (month == 1 || month == 3) ? 31 : 29;
        if (day > days_in_month) {
            day = 1;
            ++month;
        }
    }
}

}  // anonymous namespace

// ===========================================================================
// Fixture
// ===========================================================================
class CoveredCallCliTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!std::filesystem::exists(BINARY_PATH)) {
            GTEST_SKIP() << "Binary not built yet";
        }
        prices_ = temp_path("prices.csv");
        write_prices(prices_);
        track_temp(prices_);
    }
    void TearDown() override {
        for (const auto& p : temp_files_) {
            std::filesystem::remove(p);
        }
    }
    void track_temp(const std::string& p) { temp_files_.push_back(p); }

    std::string prices_;
    std::vector<std::string> temp_files_;
};

// ===========================================================================
// Argument handling
// ===========================================================================

TEST_F(CoveredCallCliTest, NoArgsReturnsNonZeroExitCode) {
    auto r = run_command(BINARY_PATH);
    EXPECT_NE(r.exit_code, 0);
    EXPECT_NE(r.output.find("Usage"), std::string::npos);
}

TEST_F(CoveredCallCliTest, UnknownFlagRejected) {
    auto r = run_command(BINARY_PATH + " --prices " + prices_ + " --bogus 1");
    EXPECT_NE(r.exit_code, 0);
    EXPECT_NE(r.output.find("Unknown argument"), std::string::npos);
}

TEST_F(CoveredCallCliTest, UnsupportedOutputExtensionRejected) {
    auto r = run_command(BINARY_PATH + " --prices " + prices_ + " --output out.txt");
    EXPECT_NE(r.exit_code, 0);
}

TEST_F(CoveredCallCliTest, MissingPriceFileIsError) {
    auto r = run_command(BINARY_PATH + " --prices /nonexistent/prices.csv");
    EXPECT_EQ(r.exit_code, 2);
    EXPECT_NE(r.output.find("ERROR"), std::string::npos);
}

TEST_F(CoveredCallCliTest, InvalidConfigIsError) {
    auto r = run_command(BINARY_PATH + " --prices " + prices_ + " --target-dte 0");
    EXPECT_EQ(r.exit_code, 2);
}

TEST_F(CoveredCallCliTest, InvalidWindowDateRejected) {
    auto r = run_command(BINARY_PATH + " --prices " + prices_ + " --start 2024-02-30");
    EXPECT_EQ(r.exit_code, 1);
    EXPECT_NE(r.output.find("Invalid --start date"), std::string::npos);
}

TEST_F(CoveredCallCliTest, StartAfterEndRejected) {
    auto r = run_command(BINARY_PATH + " --prices " + prices_ +
                         " --start 2024-02-10 --end 2024-01-12");
    EXPECT_EQ(r.exit_code, 1);
}

TEST_F(CoveredCallCliTest, WindowOutsideDataIsError) {
    auto r = run_command(BINARY_PATH + " --prices " + prices_ + " --start 2025-01-01");
    EXPECT_EQ(r.exit_code, 2);
    EXPECT_NE(r.output.find("ERROR"), std::string::npos);
}

// ===========================================================================
// Report and outputs
// ===========================================================================

TEST_F(CoveredCallCliTest, PrintsReportAndOptimizerTable) {
    auto r = run_command(BINARY_PATH + " --prices " + prices_);
    ASSERT_EQ(r.exit_code, 0) << r.output;
    EXPECT_NE(r.output.find("Loaded 60 bars"), std::string::npos);
    EXPECT_NE(r.output.find("Total return"), std::string::npos);
    EXPECT_NE(r.output.find("Trade log"), std::string::npos);
    EXPECT_NE(r.output.find("Premium optimization"), std::string::npos);
}

TEST_F(CoveredCallCliTest, WritesCsvAndJson) {
    auto csv = temp_path("curve.csv");
    auto json = temp_path("metrics.json");
    track_temp(csv);
    track_temp(json);

    auto r = run_command(BINARY_PATH + " --prices " + prices_ + " --output " + csv +
                         " --json " + json);
    ASSERT_EQ(r.exit_code, 0) << r.output;

    auto curve = read_file(csv);
    size_t lines = 0;
    for (char c : curve) lines += (c == '\n');
    EXPECT_EQ(lines, 61u);
    EXPECT_EQ(curve.rfind("date,price,", 0), 0u);

    auto metrics = read_file(json);
    EXPECT_NE(metrics.find("\"total_return\""), std::string::npos);
    EXPECT_NE(metrics.find("\"trades\""), std::string::npos);
}

TEST_F(CoveredCallCliTest, WritesParquet) {
    auto out = temp_path("curve.parquet");
    track_temp(out);
    auto r = run_command(BINARY_PATH + " --prices " + prices_ + " --output " + out);
    ASSERT_EQ(r.exit_code, 0) << r.output;
    EXPECT_TRUE(std::filesystem::exists(out));
    EXPECT_GT(std::filesystem::file_size(out), 0u);
}

TEST_F(CoveredCallCliTest, ComparisonSweepListsEachConfig) {
    auto json = temp_path("compare.json");
    track_temp(json);
    auto r = run_command(BINARY_PATH + " --prices " + prices_ +
                         " --compare-min-strikes 2.00,2.50,3.00 --json " + json);
    ASSERT_EQ(r.exit_code, 0) << r.output;
    EXPECT_NE(r.output.find("=== Comparison ==="), std::string::npos);
    EXPECT_NE(r.output.find("min_strike_2.00"), std::string::npos);
    EXPECT_NE(r.output.find("min_strike_3.00"), std::string::npos);

    auto metrics = read_file(json);
    EXPECT_NE(metrics.find("\"comparison\":["), std::string::npos);
}

TEST_F(CoveredCallCliTest, DateWindowLimitsSimulatedBars) {
    auto csv = temp_path("window.csv");
    track_temp(csv);
    auto r = run_command(BINARY_PATH + " --prices " + prices_ +
                         " --start 2024-01-12 --end 20240210 --output " + csv);
    ASSERT_EQ(r.exit_code, 0) << r.output;
    EXPECT_NE(r.output.find("Loaded 30 bars (2024-01-12 to 2024-02-10)"), std::string::npos);

    auto curve = read_file(csv);
    size_t lines = 0;
    for (char c : curve) lines += (c == '\n');
    EXPECT_EQ(lines, 31u);
}
