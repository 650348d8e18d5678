#pragma once

#include "data/price_bar.hpp"
#include "date_utils.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <istream>
#include <sstream>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Daily price CSV loader.
//
// Requires a header row naming at least `Date` and `Close` (case-insensitive);
// `Open`, `High`, `Low` are read when present, other columns are ignored.
// Rows must already be chronological. Any malformed row is an error.
// ---------------------------------------------------------------------------
namespace price_series_csv {

namespace detail {

inline std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

inline std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline std::vector<std::string> split(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) fields.push_back(trim(field));
    if (!line.empty() && line.back() == ',') fields.emplace_back();
    return fields;
}

inline double parse_price(const std::string& s, int line_no) {
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (s.empty() || end != s.c_str() + s.size()) {
        throw DataIntegrityError("Line " + std::to_string(line_no) +
                                 ": malformed price '" + s + "'");
    }
    return v;
}

}  // namespace detail

inline PriceSeries parse(std::istream& in, int max_gap_days) {
    std::string line;
    int line_no = 0;

    std::vector<std::string> header;
    while (std::getline(in, line)) {
        ++line_no;
        if (!detail::trim(line).empty()) {
            header = detail::split(line);
            break;
        }
    }
    if (header.empty()) {
        throw DataIntegrityError("Price CSV is empty");
    }

    int date_col = -1, open_col = -1, high_col = -1, low_col = -1, close_col = -1;
    for (size_t i = 0; i < header.size(); ++i) {
        auto name = detail::lower(header[i]);
        int idx = static_cast<int>(i);
        if (name == "date") date_col = idx;
        else if (name == "open") open_col = idx;
        else if (name == "high") high_col = idx;
        else if (name == "low") low_col = idx;
        else if (name == "close") close_col = idx;
    }
    if (date_col < 0 || close_col < 0) {
        throw DataIntegrityError("Price CSV header must name Date and Close columns");
    }

    PriceSeries series;
    while (std::getline(in, line)) {
        ++line_no;
        if (detail::trim(line).empty()) continue;
        auto fields = detail::split(line);
        if (fields.size() < header.size()) {
            throw DataIntegrityError("Line " + std::to_string(line_no) +
                                     ": expected " + std::to_string(header.size()) +
                                     " fields, got " + std::to_string(fields.size()));
        }

        PriceBar bar{};
        bar.date = date_utils::parse_date(fields[date_col]);
        if (bar.date == 0) {
            throw DataIntegrityError("Line " + std::to_string(line_no) +
                                     ": invalid date '" + fields[date_col] + "'");
        }
        bar.close = detail::parse_price(fields[close_col], line_no);
        if (open_col >= 0) bar.open = detail::parse_price(fields[open_col], line_no);
        if (high_col >= 0) bar.high = detail::parse_price(fields[high_col], line_no);
        if (low_col >= 0) bar.low = detail::parse_price(fields[low_col], line_no);
        series.push_back(bar);
    }

    price_series::validate(series, max_gap_days);
    return series;
}

inline PriceSeries load(const std::string& path, int max_gap_days) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open price file: " + path);
    }
    return parse(in, max_gap_days);
}

}  // namespace price_series_csv
