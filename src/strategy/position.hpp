#pragma once

#include <string>

// ---------------------------------------------------------------------------
// Position lifecycle
//
//   NONE -> OPEN -> {EXPIRED_WORTHLESS, CALLED_AWAY, ROLLED} -> NONE
//
// The three terminal outcomes only ever describe how a position closed on a
// given day; a stored Position is either NONE or OPEN.
// ---------------------------------------------------------------------------
enum class PositionStatus { NONE, OPEN, EXPIRED_WORTHLESS, CALLED_AWAY, ROLLED };

enum class OptionType { CALL };

inline std::string status_str(PositionStatus s) {
    switch (s) {
        case PositionStatus::NONE:              return "NONE";
        case PositionStatus::OPEN:              return "OPEN";
        case PositionStatus::EXPIRED_WORTHLESS: return "EXPIRED_WORTHLESS";
        case PositionStatus::CALLED_AWAY:       return "CALLED_AWAY";
        case PositionStatus::ROLLED:            return "ROLLED";
        default: return "UNKNOWN";
    }
}

// Fixed for the life of one sale.
struct OptionContract {
    OptionType type = OptionType::CALL;
    double strike = 0.0;
    int expiration_date = 0;  // YYYYMMDD
    int dte_at_open = 0;      // calendar days
};

struct Position {
    OptionContract contract;
    int contracts = 0;
    double premium_received = 0.0;  // net of spread and commission, all contracts
    int open_date = 0;
    double open_spot = 0.0;
    double open_volatility = 0.0;
    PositionStatus status = PositionStatus::NONE;

    bool is_open() const { return status == PositionStatus::OPEN; }
};
