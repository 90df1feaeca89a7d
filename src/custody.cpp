// =============================================================================
// custody.cpp - In-Memory Two-Phase Asset Ledger
// =============================================================================

#include "lend/custody.hpp"

namespace lend {

int32_t InMemoryCustody::prepare(uint64_t op_id,
                                 const std::vector<TransferInstruction>& transfers) {
    std::lock_guard lock(mutex_);

    if (pending_.count(op_id)) return errors::CUSTODY_REJECTED;

    // Net outflow per (party, asset) for the whole batch
    std::map<Key, I128> outflow;
    for (const auto& t : transfers) {
        if (t.amount_x18 <= 0 || t.from == t.to) return errors::CUSTODY_REJECTED;
        outflow[{t.from, t.asset_id}] += t.amount_x18;
    }

    for (const auto& [key, amount] : outflow) {
        auto bal = balances_.find(key);
        auto res = reserved_.find(key);
        I128 available = (bal == balances_.end() ? 0 : bal->second)
                       - (res == reserved_.end() ? 0 : res->second);
        if (amount > available) return errors::CUSTODY_REJECTED;
    }

    for (const auto& [key, amount] : outflow) {
        reserved_[key] += amount;
    }
    pending_[op_id] = transfers;
    return errors::OK;
}

void InMemoryCustody::commit(uint64_t op_id) {
    std::lock_guard lock(mutex_);

    auto it = pending_.find(op_id);
    if (it == pending_.end()) return;

    for (const auto& t : it->second) {
        Key from{t.from, t.asset_id};
        reserved_[from] -= t.amount_x18;
        if (reserved_[from] == 0) reserved_.erase(from);
        balances_[from] -= t.amount_x18;
        balances_[{t.to, t.asset_id}] += t.amount_x18;
        journal_.push_back(t);
    }
    pending_.erase(it);
}

void InMemoryCustody::abort(uint64_t op_id) {
    std::lock_guard lock(mutex_);

    auto it = pending_.find(op_id);
    if (it == pending_.end()) return;

    for (const auto& t : it->second) {
        Key from{t.from, t.asset_id};
        reserved_[from] -= t.amount_x18;
        if (reserved_[from] == 0) reserved_.erase(from);
    }
    pending_.erase(it);
}

void InMemoryCustody::mint(UserId party, AssetId asset_id, I128 amount_x18) {
    std::lock_guard lock(mutex_);
    balances_[{party, asset_id}] += amount_x18;
}

I128 InMemoryCustody::balance_of(UserId party, AssetId asset_id) const {
    std::lock_guard lock(mutex_);
    auto it = balances_.find({party, asset_id});
    return it == balances_.end() ? 0 : it->second;
}

std::vector<TransferInstruction> InMemoryCustody::journal() const {
    std::lock_guard lock(mutex_);
    return journal_;
}

size_t InMemoryCustody::pending_count() const {
    std::lock_guard lock(mutex_);
    return pending_.size();
}

} // namespace lend
