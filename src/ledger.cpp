// =============================================================================
// ledger.cpp - In-Memory Token Ledger and Atomic Settlement
// =============================================================================

#include "perpcore/ledger.hpp"
#include "perpcore/errors.hpp"
#include "perpcore/fixed_point.hpp"

#include <mutex>

namespace perpcore {

namespace {

void require_non_negative(I128 amount) {
    if (amount < 0) {
        throw LedgerError("negative amount " + x18::format(amount));
    }
}

} // anonymous namespace

// =============================================================================
// TokenLedger
// =============================================================================

I128 TokenLedger::balance_of(const Address& account) const {
    std::shared_lock lock(mutex_);
    auto it = balances_.find(account);
    return it == balances_.end() ? 0 : it->second;
}

void TokenLedger::debit(const Address& account, I128 amount) {
    auto it = balances_.find(account);
    I128 balance = it == balances_.end() ? 0 : it->second;
    if (balance < amount) {
        throw LedgerError("insufficient balance for " + addresses::to_hex(account) +
                          ": has " + x18::format(balance) + ", needs " + x18::format(amount));
    }
    balances_[account] = balance - amount;
}

void TokenLedger::transfer(const Address& from, const Address& to, I128 amount) {
    require_non_negative(amount);
    std::unique_lock lock(mutex_);

    debit(from, amount);
    balances_[to] = x18::add(balances_[to], amount);
    journal_.push_back(Transfer{from, to, amount});
}

void TokenLedger::mint(const Address& to, I128 amount) {
    require_non_negative(amount);
    std::unique_lock lock(mutex_);

    total_supply_ = x18::add(total_supply_, amount);
    balances_[to] = x18::add(balances_[to], amount);
    journal_.push_back(Transfer{addresses::BURN, to, amount});
}

void TokenLedger::burn(const Address& from, I128 amount) {
    require_non_negative(amount);
    std::unique_lock lock(mutex_);

    debit(from, amount);
    total_supply_ -= amount;
    journal_.push_back(Transfer{from, addresses::BURN, amount});
}

I128 TokenLedger::total_supply() const {
    std::shared_lock lock(mutex_);
    return total_supply_;
}

std::vector<Transfer> TokenLedger::journal() const {
    std::shared_lock lock(mutex_);
    return journal_;
}

// =============================================================================
// Settlement
// =============================================================================

Settlement& Settlement::transfer(const Address& from, const Address& to, I128 amount) {
    ops_.push_back(SettlementOp{SettlementKind::TRANSFER, from, to, amount});
    return *this;
}

Settlement& Settlement::mint(const Address& to, I128 amount) {
    ops_.push_back(SettlementOp{SettlementKind::MINT, addresses::BURN, to, amount});
    return *this;
}

Settlement& Settlement::burn(const Address& from, I128 amount) {
    ops_.push_back(SettlementOp{SettlementKind::BURN, from, addresses::BURN, amount});
    return *this;
}

Settlement& Settlement::mint_or_burn(const Address& account, I128 delta) {
    if (delta > 0) return mint(account, delta);
    if (delta < 0) return burn(account, -delta);
    return *this;
}

void Settlement::execute(Ledger& ledger) const {
    // First pass: replay the batch on simulated balances
    std::unordered_map<Address, I128, AddressHash> simulated;
    auto balance = [&](const Address& account) -> I128& {
        auto it = simulated.find(account);
        if (it == simulated.end()) {
            it = simulated.emplace(account, ledger.balance_of(account)).first;
        }
        return it->second;
    };

    for (const auto& op : ops_) {
        require_non_negative(op.amount);
        if (op.amount == 0) continue;

        if (op.kind != SettlementKind::MINT) {
            I128& from = balance(op.from);
            if (from < op.amount) {
                throw LedgerError("settlement overdraws " + addresses::to_hex(op.from) +
                                  ": has " + x18::format(from) +
                                  ", needs " + x18::format(op.amount));
            }
            from -= op.amount;
        }
        if (op.kind != SettlementKind::BURN) {
            I128& to = balance(op.to);
            to = x18::add(to, op.amount);
        }
    }

    // Second pass: apply (validated above)
    for (const auto& op : ops_) {
        if (op.amount == 0) continue;
        switch (op.kind) {
            case SettlementKind::TRANSFER:
                ledger.transfer(op.from, op.to, op.amount);
                break;
            case SettlementKind::MINT:
                ledger.mint(op.to, op.amount);
                break;
            case SettlementKind::BURN:
                ledger.burn(op.from, op.amount);
                break;
        }
    }
}

} // namespace perpcore
