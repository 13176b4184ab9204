#pragma once

#include "lotmatch/grouping.hpp"
#include "lotmatch/types.hpp"

#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

namespace lotmatch {

// Open lots of one (identifier, currency) group, earliest acquisition first.
class LotQueue {
public:
    void push(OpenLot lot);

    // Consumes up to `quantity` from the front lot and returns the consumed
    // amount. The front lot is popped once exhausted.
    double consume_front(double quantity);

    [[nodiscard]] bool empty() const { return lots_.empty(); }
    [[nodiscard]] std::size_t size() const { return lots_.size(); }
    [[nodiscard]] const OpenLot& front() const { return lots_.front(); }
    [[nodiscard]] double total_quantity() const;

    [[nodiscard]] auto begin() const { return lots_.begin(); }
    [[nodiscard]] auto end() const { return lots_.end(); }

private:
    std::deque<OpenLot> lots_;
};

class FifoMatcher {
public:
    explicit FifoMatcher(bool round_gains = true);

    // Buys extend the lot queue and return nothing; sells are matched against
    // the queue front to back and return their sale result.
    std::optional<SaleResult> process(const Transaction& transaction);

    [[nodiscard]] const LotQueue& open_lots() const { return queue_; }

    // Runs a fresh matcher over one chronologically ordered group.
    static std::vector<SaleResult> match_group(const TransactionGroup& group, bool round_gains);

private:
    SaleResult match_sell(const Transaction& sell);

    bool round_gains_;
    LotQueue queue_;
};

// Rounds to 2 decimal places, half away from zero.
double round_to_cents(double value);

} // namespace lotmatch
