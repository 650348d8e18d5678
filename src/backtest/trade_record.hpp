#pragma once

#include "strategy/position.hpp"

#include <string>

// One closed short-call trade. Premium already reflects spread and commission
// and is never revised after close.
struct TradeRecord {
    int open_date = 0;
    int close_date = 0;
    OptionContract contract;
    int contracts = 0;
    double premium_received = 0.0;
    double close_cost = 0.0;        // buy-back cost, assignment intrinsic, or 0
    double net_pnl = 0.0;           // premium_received - close_cost
    double roll_net_credit = 0.0;   // ROLLED only: new leg premium - buy-back cost
    double open_spot = 0.0;
    double close_spot = 0.0;
    PositionStatus outcome = PositionStatus::NONE;
    std::string details;
};
