#pragma once

#include "../types.hpp"

#include <fstream>
#include <istream>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace intraday {
namespace market {

/**
 * Single timestamped price observation fed to the position state machine.
 */
struct PriceTick {
    Timestamp timestamp = 0;
    Price close_price = 0;
};

/**
 * OHLCV bar as delivered by a market data provider
 *
 * open_time is the bar start (ms). The close of the most recent bar keeps
 * moving while the bar is still forming.
 */
struct PriceBar {
    Timestamp open_time = 0;
    Price open = 0;
    Price high = 0;
    Price low = 0;
    Price close = 0;
    double volume = 0;

    PriceTick tick() const { return PriceTick{open_time, close}; }
};

/**
 * Parse bars from CSV
 *
 * Expected format (header optional):
 * open_time,open,high,low,close,volume
 */
inline std::vector<PriceBar> parse_bars_csv(std::istream& in) {
    std::vector<PriceBar> bars;
    std::string line;
    bool first_line = true;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();

        // Skip header if present
        if (first_line && line.find("open_time") != std::string::npos) {
            first_line = false;
            continue;
        }
        first_line = false;

        if (line.empty()) continue;

        std::stringstream ss(line);
        std::string token;
        std::vector<std::string> tokens;

        while (std::getline(ss, token, ',')) {
            tokens.push_back(token);
        }

        if (tokens.size() < 5) {
            throw std::runtime_error("Malformed bar at line " + std::to_string(line_no) + ": " + line);
        }

        try {
            PriceBar b;
            b.open_time = std::stoull(tokens[0]);
            b.open = to_price(std::stod(tokens[1]));
            b.high = to_price(std::stod(tokens[2]));
            b.low = to_price(std::stod(tokens[3]));
            b.close = to_price(std::stod(tokens[4]));
            b.volume = (tokens.size() > 5 && !tokens[5].empty()) ? std::stod(tokens[5]) : 0;
            bars.push_back(b);
        } catch (const std::logic_error&) {
            throw std::runtime_error("Malformed bar at line " + std::to_string(line_no) + ": " + line);
        }
    }

    return bars;
}

/**
 * Load bars from CSV file
 */
inline std::vector<PriceBar> load_bars_csv(const std::string& filename) {
    std::ifstream file(filename);

    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    return parse_bars_csv(file);
}

inline void write_bars_csv(std::ostream& out, const std::vector<PriceBar>& bars) {
    out << "open_time,open,high,low,close,volume\n";

    for (const auto& b : bars) {
        out << b.open_time << ","
            << format_price(b.open) << ","
            << format_price(b.high) << ","
            << format_price(b.low) << ","
            << format_price(b.close) << ","
            << b.volume << "\n";
    }
}

/**
 * Save bars to CSV file
 */
inline void save_bars_csv(const std::string& filename, const std::vector<PriceBar>& bars) {
    std::ofstream file(filename);

    if (!file.is_open()) {
        throw std::runtime_error("Cannot create file: " + filename);
    }

    write_bars_csv(file, bars);
}

} // namespace market
} // namespace intraday
