#ifndef LEND_CUSTODY_HPP
#define LEND_CUSTODY_HPP

#include <map>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "types.hpp"

namespace lend {

// =============================================================================
// Transfer Instruction
// =============================================================================

struct TransferInstruction {
    AssetId asset_id;
    I128 amount_x18;
    UserId from;
    UserId to;
};

// =============================================================================
// Custody Interface (Two-Phase)
// =============================================================================
//
// prepare() must either reserve every transfer in the batch or reject the
// whole batch. commit() makes a prepared batch final; abort() releases it.
// The protocol commits its own state only between a successful prepare and
// the matching commit.

class IAssetCustody {
public:
    virtual ~IAssetCustody() = default;
    virtual int32_t prepare(uint64_t op_id, const std::vector<TransferInstruction>& transfers) = 0;
    virtual void commit(uint64_t op_id) = 0;
    virtual void abort(uint64_t op_id) = 0;
};

// =============================================================================
// InMemoryCustody - Balance Ledger with Journal
// =============================================================================

class InMemoryCustody : public IAssetCustody {
public:
    InMemoryCustody() = default;

    // Non-copyable
    InMemoryCustody(const InMemoryCustody&) = delete;
    InMemoryCustody& operator=(const InMemoryCustody&) = delete;

    int32_t prepare(uint64_t op_id, const std::vector<TransferInstruction>& transfers) override;
    void commit(uint64_t op_id) override;
    void abort(uint64_t op_id) override;

    // Credits a party out of thin air (test and CLI funding)
    void mint(UserId party, AssetId asset_id, I128 amount_x18);

    // Settled balance, excluding reservations of pending batches
    I128 balance_of(UserId party, AssetId asset_id) const;

    std::vector<TransferInstruction> journal() const;
    size_t pending_count() const;

private:
    using Key = std::pair<UserId, AssetId>;

    std::map<Key, I128> balances_;
    std::map<Key, I128> reserved_;
    std::unordered_map<uint64_t, std::vector<TransferInstruction>> pending_;
    std::vector<TransferInstruction> journal_;
    mutable std::mutex mutex_;
};

} // namespace lend

#endif // LEND_CUSTODY_HPP
