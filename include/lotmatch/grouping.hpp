#pragma once

#include "lotmatch/types.hpp"

#include <string>
#include <tuple>
#include <vector>

namespace lotmatch {

struct GroupKey {
    std::string identifier;
    std::string currency;

    bool operator==(const GroupKey& other) const {
        return identifier == other.identifier && currency == other.currency;
    }
    bool operator<(const GroupKey& other) const {
        return std::tie(identifier, currency) < std::tie(other.identifier, other.currency);
    }
};

struct TransactionGroup {
    GroupKey key;
    std::vector<Transaction> transactions;   // chronological
};

// Stable ascending sort by date. Invalid dates go after every valid date;
// equal dates keep their input order.
std::vector<Transaction> sort_by_date(std::vector<Transaction> transactions);

// Sorts by date, then partitions by (identifier, currency). Groups appear in
// the order their first transaction is met in the sorted sequence.
std::vector<TransactionGroup> group_transactions(std::vector<Transaction> transactions);

} // namespace lotmatch
