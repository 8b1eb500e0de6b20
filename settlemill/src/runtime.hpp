#pragma once

#include "address.hpp"
#include "errors.hpp"
#include "instruction.hpp"
#include "types.hpp"

#include <functional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace settlemill {

struct Account {
    Address owner;
    Amount lamports = 0;
    Bytes data;
};

// Seeds a program presents to sign for one of its derived addresses
struct SignerSeeds {
    std::string tag;
    std::vector<Address> seeds;
};

class Runtime;

// View of the runtime handed to a program for one invocation
class InvokeContext {
public:
    InvokeContext(Runtime& runtime, const Instruction& instruction, int stackHeight, std::vector<Address> signers);

    [[nodiscard]] const Address& programId() const { return m_instruction.programId; }
    [[nodiscard]] const Instruction& instruction() const { return m_instruction; }

    // Positional account of the current instruction
    [[nodiscard]] const Address& accountAt(size_t index) const;
    [[nodiscard]] size_t accountCount() const { return m_instruction.accounts.size(); }

    // Introspection of the enclosing transaction
    [[nodiscard]] const std::vector<Instruction>& transactionInstructions() const;
    [[nodiscard]] size_t currentIndex() const;
    [[nodiscard]] int stackHeight() const { return m_stackHeight; }

    [[nodiscard]] Timestamp now() const;
    [[nodiscard]] bool isSigner(const Address& address) const;
    void requireSigner(const Address& address) const;

    [[nodiscard]] bool exists(const Address& address) const;
    [[nodiscard]] const Account& account(const Address& address) const;
    Account& account(const Address& address);

    // Missing accounts materialize as empty system-owned wallets
    Account& accountOrCreate(const Address& address);

    // Storage deposit for a record of the given size
    [[nodiscard]] Amount rentFor(size_t size) const;

    // Overwrites the data of an account owned by the calling program
    void writeData(const Address& address, Bytes data);

    // Deletes an account owned by the calling program, moving its lamports
    void closeAccount(const Address& address, const Address& refundTo);

    // Cross-program invocation; signerSeeds add derived addresses of the
    // calling program to the signer set
    void invoke(const Instruction& instruction, const std::vector<SignerSeeds>& signerSeeds = {});

    void log(const std::string& line);

private:
    Runtime& m_runtime;
    const Instruction& m_instruction;
    int m_stackHeight;
    std::vector<Address> m_signers;
};

using ProgramHandler = std::function<void(InvokeContext&)>;

// Failure of a whole transaction, carrying the failing instruction index
class TransactionError : public std::runtime_error {
public:
    TransactionError(const SettlementError& cause, size_t instructionIndex);

    [[nodiscard]] ErrorCode code() const { return m_code; }
    [[nodiscard]] size_t instructionIndex() const { return m_instructionIndex; }

private:
    ErrorCode m_code;
    size_t m_instructionIndex;
};

// In-process ledger: an account store, a program registry and a clock.
// Transactions run instruction by instruction and either commit every
// write or none.
class Runtime {
public:
    Runtime();

    void registerProgram(const Address& programId, ProgramHandler handler);
    [[nodiscard]] bool hasProgram(const Address& programId) const;

    // Executes atomically; returns the log lines. Throws TransactionError
    // after restoring the pre-transaction state.
    std::vector<std::string> execute(const Transaction& transaction);

    // Logs of the last executed transaction, including failed ones
    [[nodiscard]] const std::vector<std::string>& lastLogs() const { return m_logs; }

    // Host-side state access
    [[nodiscard]] const Account* find(const Address& address) const;
    [[nodiscard]] Amount lamports(const Address& address) const;
    void setAccount(const Address& address, Account account);
    void airdrop(const Address& address, Amount lamports);
    [[nodiscard]] size_t accountCount() const { return m_accounts.size(); }

    [[nodiscard]] Timestamp now() const { return m_now; }
    void setClock(Timestamp now) { m_now = now; }
    void advanceClock(Timestamp seconds) { m_now += seconds; }

    [[nodiscard]] Amount rentFor(size_t size) const;
    void setRentPerByte(Amount lamportsPerByte) { m_rentPerByte = lamportsPerByte; }

private:
    friend class InvokeContext;

    void dispatch(const Instruction& instruction, int stackHeight, std::vector<Address> signers);

    std::unordered_map<Address, Account, AddressHash> m_accounts;
    std::unordered_map<Address, ProgramHandler, AddressHash> m_programs;
    std::vector<std::string> m_logs;

    // Set only while a transaction executes
    const std::vector<Instruction>* m_instructions;
    size_t m_currentIndex;

    Timestamp m_now;
    Amount m_rentPerByte;
};

} // namespace settlemill
