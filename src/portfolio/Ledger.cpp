#include "portfolio/Ledger.h"
#include "common/Logger.h"

#include <algorithm>
#include <stdexcept>

namespace factorsim {
namespace portfolio {

namespace {
constexpr Amount MIN_ORDER_NOTIONAL = 0.01;
constexpr double FULL_EXIT_FRACTION = 1.0 - 1e-12;
}

Ledger::Ledger(Amount initial_cash, double transaction_cost_rate)
    : cash_(initial_cash)
    , cost_rate_(transaction_cost_rate)
    , total_costs_(0.0)
{}

const Position* Ledger::position(const std::string& symbol) const {
    auto it = positions_.find(symbol);
    return it == positions_.end() ? nullptr : &it->second;
}

std::vector<std::string> Ledger::heldSymbols() const {
    std::vector<std::string> out;
    out.reserve(positions_.size());
    for (const auto& [symbol, pos] : positions_) {
        out.push_back(symbol);
    }
    return out;
}

void Ledger::observePrice(const std::string& symbol, Price price) {
    auto it = positions_.find(symbol);
    if (it != positions_.end() && price > 0.0) {
        it->second.observePrice(price);
    }
}

std::optional<BuyFill> Ledger::buy(
    const std::string& symbol,
    Price price,
    Amount target_outlay,
    Amount reserve,
    Date date,
    double entry_score,
    double quality_score
) {
    if (hasPosition(symbol)) {
        throw std::logic_error("duplicate position for " + symbol);
    }
    if (!(price > 0.0) || !(target_outlay > 0.0)) {
        return std::nullopt;
    }

    const Amount spendable = cash_ - std::max(0.0, reserve);
    if (spendable <= MIN_ORDER_NOTIONAL) {
        LOG_WARN("{} buy skipped: insufficient cash (cash {:.2f}, reserve {:.2f})", symbol, cash_, reserve);
        return std::nullopt;
    }

    Amount outlay = target_outlay;
    bool scaled_down = false;
    if (outlay > spendable) {
        LOG_WARN("{} buy scaled down: target {:.2f} > spendable {:.2f}", symbol, target_outlay, spendable);
        outlay = spendable;
        scaled_down = true;
    }

    const Shares shares = outlay / (price * (1.0 + cost_rate_));
    const Amount notional = shares * price;
    if (notional < MIN_ORDER_NOTIONAL) {
        return std::nullopt;
    }
    const Amount cost = notional * cost_rate_;

    cash_ -= notional + cost;
    if (cash_ < 0.0) {
        // floating point residue only; outlay never exceeds spendable
        cash_ = 0.0;
    }
    total_costs_ += cost;

    Position pos;
    pos.symbol = symbol;
    pos.shares = shares;
    pos.entry_price = price;
    pos.entry_date = date;
    pos.entry_score = entry_score;
    pos.quality_score = quality_score;
    pos.highest_price = price;
    pos.last_price = price;
    pos.entry_cost = cost;
    positions_.emplace(symbol, pos);

    return BuyFill{symbol, shares, price, notional, cost, scaled_down};
}

SellFill Ledger::sell(
    const std::string& symbol,
    Price price,
    Date date,
    ExitReason reason,
    double fraction
) {
    auto it = positions_.find(symbol);
    if (it == positions_.end()) {
        throw std::logic_error("no open position for " + symbol);
    }
    if (!(fraction > 0.0)) {
        throw std::invalid_argument("sell fraction must be positive");
    }

    Position& pos = it->second;
    const bool full_exit = fraction >= FULL_EXIT_FRACTION;
    const Shares sold = full_exit ? pos.shares : pos.shares * fraction;
    const double share_of_position = (pos.shares > 0.0) ? sold / pos.shares : 1.0;

    const Amount notional = sold * price;
    const Amount cost = notional * cost_rate_;
    const Amount entry_cost_share = pos.entry_cost * share_of_position;

    cash_ += notional - cost;
    total_costs_ += cost;

    ClosedTrade trade;
    trade.symbol = symbol;
    trade.exit_date = date;
    trade.exit_reason = reason;
    trade.entry_price = pos.entry_price;
    trade.entry_date = pos.entry_date;
    trade.exit_price = price;
    trade.shares = sold;
    trade.pnl = sold * (price - pos.entry_price) - cost - entry_cost_share;
    trade.pnl_pct = (pos.entry_price > 0.0) ? (price - pos.entry_price) / pos.entry_price : 0.0;
    trade.holding_days = static_cast<int>(date - pos.entry_date);
    closed_trades_.push_back(trade);

    SellFill fill{symbol, sold, price, notional, cost, full_exit, trade};

    if (full_exit) {
        positions_.erase(it);
    } else {
        pos.shares -= sold;
        pos.entry_cost -= entry_cost_share;
    }
    return fill;
}

Amount Ledger::positionsValue(const PriceLookup& lookup) const {
    Amount total = 0.0;
    for (const auto& [symbol, pos] : positions_) {
        const auto price = lookup ? lookup(symbol) : std::nullopt;
        const Price mark = (price && *price > 0.0) ? *price : pos.last_price;
        total += pos.shares * mark;
    }
    return total;
}

Amount Ledger::markToMarket(const PriceLookup& lookup) const {
    return cash_ + positionsValue(lookup);
}

void Ledger::recordValue(Date date, Amount value, Amount positions_value) {
    value_history_.push_back(ValuePoint{date, value, cash_, positions_value});
}

} // namespace portfolio
} // namespace factorsim
