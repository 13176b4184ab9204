#include "lotmatch/fifo_matcher.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>

namespace lotmatch {
namespace {

// A lot whose leftover is this small relative to its bought quantity holds
// only floating point residue.
constexpr double kResidueRatio = 1e-12;

} // namespace

double round_to_cents(double value) {
    return std::round(value * 100.0) / 100.0;
}

void LotQueue::push(OpenLot lot) {
    if (lot.remaining_quantity <= 0.0) {
        return;
    }
    if (lot.original_quantity < lot.remaining_quantity) {
        lot.original_quantity = lot.remaining_quantity;
    }
    lots_.push_back(std::move(lot));
}

double LotQueue::consume_front(double quantity) {
    OpenLot& lot = lots_.front();
    const double used = std::min(quantity, lot.remaining_quantity);
    lot.remaining_quantity -= used;
    if (lot.remaining_quantity <= lot.original_quantity * kResidueRatio) {
        lots_.pop_front();
    }
    return used;
}

double LotQueue::total_quantity() const {
    return std::accumulate(lots_.begin(), lots_.end(), 0.0, [](double sum, const OpenLot& lot) {
        return sum + lot.remaining_quantity;
    });
}

FifoMatcher::FifoMatcher(bool round_gains)
    : round_gains_(round_gains) {
}

std::optional<SaleResult> FifoMatcher::process(const Transaction& transaction) {
    if (transaction.kind == TransactionKind::Buy) {
        queue_.push(OpenLot{transaction.quantity, transaction.price, transaction.date, transaction.quantity});
        return std::nullopt;
    }
    return match_sell(transaction);
}

SaleResult FifoMatcher::match_sell(const Transaction& sell) {
    SaleResult sale;
    sale.date = sell.date;
    sale.identifier = sell.identifier;
    sale.currency = sell.currency;
    sale.sale_price = sell.price;
    sale.sale_quantity = sell.quantity;
    sale.extra_attributes = sell.extra_attributes;

    double remaining = sell.quantity;
    while (remaining > 0.0) {
        if (queue_.empty()) {
            // Nothing left to fund the sale: the rest has an unknown origin.
            MatchedLot unknown;
            unknown.used_quantity = remaining;
            unknown.sale_price = sell.price;
            sale.matched_lots.push_back(unknown);
            break;
        }

        const double cost_basis = queue_.front().unit_price;
        const auto acquired = queue_.front().acquisition_date;
        const double used = queue_.consume_front(remaining);

        double gain = used * (sell.price - cost_basis);
        if (round_gains_) {
            gain = round_to_cents(gain);
        }
        sale.total_gain += gain;

        MatchedLot lot;
        lot.used_quantity = used;
        lot.cost_basis = cost_basis;
        lot.acquisition_date = acquired;
        lot.sale_price = sell.price;
        lot.gain = gain;
        sale.matched_lots.push_back(lot);

        remaining -= used;
    }

    return sale;
}

std::vector<SaleResult> FifoMatcher::match_group(const TransactionGroup& group, bool round_gains) {
    FifoMatcher matcher(round_gains);
    std::vector<SaleResult> sales;
    for (const auto& transaction : group.transactions) {
        if (auto sale = matcher.process(transaction)) {
            sales.push_back(std::move(*sale));
        }
    }
    return sales;
}

} // namespace lotmatch
