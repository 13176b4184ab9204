#include "lotmatch/grouping.hpp"

#include <algorithm>
#include <map>
#include <utility>

namespace lotmatch {

std::vector<Transaction> sort_by_date(std::vector<Transaction> transactions) {
    std::stable_sort(transactions.begin(), transactions.end(), [](const Transaction& a, const Transaction& b) {
        if (!a.date || !b.date) {
            return a.date.has_value() && !b.date.has_value();
        }
        return *a.date < *b.date;
    });
    return transactions;
}

std::vector<TransactionGroup> group_transactions(std::vector<Transaction> transactions) {
    auto sorted = sort_by_date(std::move(transactions));

    std::vector<TransactionGroup> groups;
    std::map<GroupKey, std::size_t> slots;
    for (auto& transaction : sorted) {
        GroupKey key{transaction.identifier, transaction.currency};
        auto it = slots.find(key);
        if (it == slots.end()) {
            it = slots.emplace(key, groups.size()).first;
            groups.push_back(TransactionGroup{std::move(key), {}});
        }
        groups[it->second].transactions.push_back(std::move(transaction));
    }
    return groups;
}

} // namespace lotmatch
