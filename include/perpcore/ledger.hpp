#ifndef PERPCORE_LEDGER_HPP
#define PERPCORE_LEDGER_HPP

#include "perpcore/types.hpp"

#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace perpcore {

// =============================================================================
// Ledger Interface (collateral token)
// =============================================================================

class Ledger {
public:
    virtual ~Ledger() = default;

    virtual I128 balance_of(const Address& account) const = 0;

    // All amounts X18 and non-negative; failures throw LedgerError
    virtual void transfer(const Address& from, const Address& to, I128 amount) = 0;
    virtual void mint(const Address& to, I128 amount) = 0;
    virtual void burn(const Address& from, I128 amount) = 0;
};

// Journal entry; mints come from and burns go to addresses::BURN
struct Transfer {
    Address from;
    Address to;
    I128 amount;
};

// =============================================================================
// TokenLedger - in-memory ledger
// =============================================================================

class TokenLedger : public Ledger {
public:
    TokenLedger() = default;

    // Non-copyable
    TokenLedger(const TokenLedger&) = delete;
    TokenLedger& operator=(const TokenLedger&) = delete;

    I128 balance_of(const Address& account) const override;
    void transfer(const Address& from, const Address& to, I128 amount) override;
    void mint(const Address& to, I128 amount) override;
    void burn(const Address& from, I128 amount) override;

    I128 total_supply() const;
    std::vector<Transfer> journal() const;

private:
    void debit(const Address& account, I128 amount);

    mutable std::shared_mutex mutex_;
    std::unordered_map<Address, I128, AddressHash> balances_;
    I128 total_supply_ = 0;
    std::vector<Transfer> journal_;
};

// =============================================================================
// Settlement - atomic batch of ledger instructions
//
// execute() validates every instruction against simulated balances before
// applying any, so a batch either applies whole or not at all.
// =============================================================================

enum class SettlementKind : uint8_t {
    TRANSFER = 0,
    MINT = 1,
    BURN = 2
};

struct SettlementOp {
    SettlementKind kind;
    Address from;     // BURN for mints
    Address to;       // BURN for burns
    I128 amount;
};

class Settlement {
public:
    Settlement& transfer(const Address& from, const Address& to, I128 amount);
    Settlement& mint(const Address& to, I128 amount);
    Settlement& burn(const Address& from, I128 amount);

    // Mint when positive, burn the magnitude when negative
    Settlement& mint_or_burn(const Address& account, I128 delta);

    // Throws LedgerError on a negative amount or an overdraft; nothing is
    // applied in that case. Zero-amount instructions are skipped.
    void execute(Ledger& ledger) const;

    const std::vector<SettlementOp>& ops() const { return ops_; }
    bool empty() const { return ops_.empty(); }

private:
    std::vector<SettlementOp> ops_;
};

} // namespace perpcore

#endif // PERPCORE_LEDGER_HPP
