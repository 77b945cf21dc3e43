#pragma once

#include "common/Types.h"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace factorsim {
namespace portfolio {

// Open position, owned exclusively by the Ledger
struct Position {
    std::string symbol;
    Shares shares;
    Price entry_price;
    Date entry_date;
    double entry_score;      // composite at entry
    double quality_score;    // quality at entry, drives the stop tier
    Price highest_price;     // monotonically non-decreasing since entry
    Price last_price;        // last observed mark
    Amount entry_cost;       // transaction cost paid on the buy, for realized P&L

    Position()
        : shares(0), entry_price(0), entry_date(0)
        , entry_score(0), quality_score(50.0)
        , highest_price(0), last_price(0), entry_cost(0)
    {}

    void observePrice(Price price) {
        last_price = price;
        if (price > highest_price) {
            highest_price = price;
        }
    }
};

struct ClosedTrade {
    std::string symbol;
    Date exit_date;
    ExitReason exit_reason;
    Price entry_price;
    Date entry_date;
    Price exit_price;
    Shares shares;
    Amount pnl;        // net of entry and exit transaction costs
    double pnl_pct;    // price return from entry
    int holding_days;

    ClosedTrade()
        : exit_date(0), exit_reason(ExitReason::REBALANCE_EXIT)
        , entry_price(0), entry_date(0), exit_price(0), shares(0)
        , pnl(0), pnl_pct(0), holding_days(0)
    {}
};

struct ValuePoint {
    Date date;
    Amount value;
    Amount cash;
    Amount positions_value;
};

struct BuyFill {
    std::string symbol;
    Shares shares;
    Price price;
    Amount notional;
    Amount transaction_cost;
    bool scaled_down;       // cash could not fund the full target
};

struct SellFill {
    std::string symbol;
    Shares shares;
    Price price;
    Amount notional;
    Amount transaction_cost;
    bool closed;            // position fully closed (ClosedTrade appended)
    ClosedTrade trade;      // realized slice, also for partial sells
};

// Cash/position ledger. Only buy() creates a Position and only a full sell()
// destroys one; cash never goes negative.
class Ledger {
public:
    using PriceLookup = std::function<std::optional<Price>(const std::string&)>;

    Ledger(Amount initial_cash, double transaction_cost_rate);

    Amount cash() const { return cash_; }

    bool hasPosition(const std::string& symbol) const { return positions_.count(symbol) > 0; }
    const Position* position(const std::string& symbol) const;
    const std::map<std::string, Position>& positions() const { return positions_; }
    std::vector<std::string> heldSymbols() const;

    void observePrice(const std::string& symbol, Price price);

    // Spends at most target_outlay (shares * price * (1 + cost)), scaled down so
    // that cash - outlay >= reserve. Returns nothing when nothing can be bought.
    // Throws std::logic_error if the symbol is already held.
    std::optional<BuyFill> buy(
        const std::string& symbol,
        Price price,
        Amount target_outlay,
        Amount reserve,
        Date date,
        double entry_score,
        double quality_score
    );

    // Sells fraction (0, 1] of the position; fraction 1 closes it.
    // Throws std::logic_error if the symbol is not held.
    SellFill sell(
        const std::string& symbol,
        Price price,
        Date date,
        ExitReason reason,
        double fraction = 1.0
    );

    // cash + sum(shares * mark); mark falls back to the last observed price
    Amount markToMarket(const PriceLookup& lookup) const;
    Amount positionsValue(const PriceLookup& lookup) const;

    void recordValue(Date date, Amount value, Amount positions_value);
    const std::vector<ValuePoint>& valueHistory() const { return value_history_; }

    const std::vector<ClosedTrade>& closedTrades() const { return closed_trades_; }
    Amount totalTransactionCosts() const { return total_costs_; }

private:
    Amount cash_;
    double cost_rate_;
    std::map<std::string, Position> positions_;
    std::vector<ValuePoint> value_history_;
    std::vector<ClosedTrade> closed_trades_;
    Amount total_costs_;
};

} // namespace portfolio
} // namespace factorsim
