#include "runtime.hpp"
#include "assetprograms.hpp"
#include "fraction.hpp"
#include "programids.hpp"

#include <algorithm>
#include <utility>

namespace settlemill {

namespace {

// Storage overhead charged on top of the data size
constexpr size_t kAccountStorageOverhead = 128;
constexpr Amount kDefaultRentPerByte = 6960;

void noop(InvokeContext& /*context*/) {}

} // namespace

InvokeContext::InvokeContext(Runtime& runtime, const Instruction& instruction, int stackHeight,
                             std::vector<Address> signers)
    : m_runtime(runtime), m_instruction(instruction), m_stackHeight(stackHeight), m_signers(std::move(signers))
{
}

const Address& InvokeContext::accountAt(size_t index) const
{
    if (index >= m_instruction.accounts.size()) {
        throw SettlementError(ErrorCode::InvalidAccount, "missing account #" + std::to_string(index));
    }
    return m_instruction.accounts[index];
}

const std::vector<Instruction>& InvokeContext::transactionInstructions() const { return *m_runtime.m_instructions; }

size_t InvokeContext::currentIndex() const { return m_runtime.m_currentIndex; }

Timestamp InvokeContext::now() const { return m_runtime.m_now; }

bool InvokeContext::isSigner(const Address& address) const
{
    return std::find(m_signers.begin(), m_signers.end(), address) != m_signers.end();
}

void InvokeContext::requireSigner(const Address& address) const
{
    if (!isSigner(address)) {
        throw SettlementError(ErrorCode::MissingSigner, address.shortHex());
    }
}

bool InvokeContext::exists(const Address& address) const { return m_runtime.find(address) != nullptr; }

const Account& InvokeContext::account(const Address& address) const
{
    const Account* found = m_runtime.find(address);
    if (found == nullptr) {
        throw SettlementError(ErrorCode::InvalidAccount, address.shortHex() + " does not exist");
    }
    return *found;
}

Account& InvokeContext::account(const Address& address)
{
    auto iterator = m_runtime.m_accounts.find(address);
    if (iterator == m_runtime.m_accounts.end()) {
        throw SettlementError(ErrorCode::InvalidAccount, address.shortHex() + " does not exist");
    }
    return iterator->second;
}

Account& InvokeContext::accountOrCreate(const Address& address)
{
    auto [iterator, inserted] = m_runtime.m_accounts.try_emplace(address);
    if (inserted) {
        iterator->second.owner = systemProgramId();
    }
    return iterator->second;
}

Amount InvokeContext::rentFor(size_t size) const { return m_runtime.rentFor(size); }

void InvokeContext::writeData(const Address& address, Bytes data)
{
    Account& target = account(address);
    if (target.owner != programId()) {
        throw SettlementError(ErrorCode::InvalidAccount, address.shortHex() + " is not owned by the caller");
    }
    target.data = std::move(data);
}

void InvokeContext::closeAccount(const Address& address, const Address& refundTo)
{
    Account& target = account(address);
    if (target.owner != programId()) {
        throw SettlementError(ErrorCode::InvalidAccount, address.shortHex() + " is not owned by the caller");
    }
    Amount lamports = target.lamports;
    m_runtime.m_accounts.erase(address);

    Account& refund = accountOrCreate(refundTo);
    refund.lamports = checkedAdd(refund.lamports, lamports);
}

void InvokeContext::invoke(const Instruction& instruction, const std::vector<SignerSeeds>& signerSeeds)
{
    std::vector<Address> signers = m_signers;
    for (const auto& seeds : signerSeeds) {
        signers.push_back(deriveAddress(seeds.tag, seeds.seeds, programId()));
    }
    m_runtime.dispatch(instruction, m_stackHeight + 1, std::move(signers));
}

void InvokeContext::log(const std::string& line) { m_runtime.m_logs.push_back("Program log: " + line); }

TransactionError::TransactionError(const SettlementError& cause, size_t instructionIndex)
    : std::runtime_error("Instruction " + std::to_string(instructionIndex) + " failed: " + cause.what()),
      m_code(cause.code()),
      m_instructionIndex(instructionIndex)
{
}

Runtime::Runtime() : m_instructions(nullptr), m_currentIndex(0), m_now(0), m_rentPerByte(kDefaultRentPerByte)
{
    registerProgram(systemProgramId(), native::process);
    registerProgram(tokenProgramId(), token::process);
    registerProgram(token2022ProgramId(), token::process);
    registerProgram(computeBudgetProgramId(), noop);
    registerProgram(associatedTokenProgramId(), noop);
}

void Runtime::registerProgram(const Address& programId, ProgramHandler handler)
{
    m_programs[programId] = std::move(handler);
}

bool Runtime::hasProgram(const Address& programId) const { return m_programs.count(programId) != 0; }

std::vector<std::string> Runtime::execute(const Transaction& transaction)
{
    m_logs.clear();
    auto snapshot = m_accounts;
    m_instructions = &transaction.instructions;

    for (size_t index = 0; index < transaction.instructions.size(); ++index) {
        m_currentIndex = index;
        try {
            dispatch(transaction.instructions[index], kTransactionLevelStackHeight, transaction.signers);
        } catch (const SettlementError& error) {
            m_accounts = std::move(snapshot);
            m_instructions = nullptr;
            m_logs.push_back(std::string("Program failed: ") + error.what());
            throw TransactionError(error, index);
        } catch (...) {
            m_accounts = std::move(snapshot);
            m_instructions = nullptr;
            throw;
        }
    }

    m_instructions = nullptr;
    return m_logs;
}

void Runtime::dispatch(const Instruction& instruction, int stackHeight, std::vector<Address> signers)
{
    auto iterator = m_programs.find(instruction.programId);
    if (iterator == m_programs.end()) {
        throw SettlementError(ErrorCode::UnknownProgram, instruction.programId.shortHex());
    }

    // Handlers may register programs; keep a copy of the callable
    ProgramHandler handler = iterator->second;

    m_logs.push_back("Program " + instruction.programId.shortHex() + " invoke [" + std::to_string(stackHeight) + "]");
    InvokeContext context(*this, instruction, stackHeight, std::move(signers));
    handler(context);
    m_logs.push_back("Program " + instruction.programId.shortHex() + " success");
}

const Account* Runtime::find(const Address& address) const
{
    auto iterator = m_accounts.find(address);
    if (iterator == m_accounts.end()) {
        return nullptr;
    }
    return &iterator->second;
}

Amount Runtime::lamports(const Address& address) const
{
    const Account* account = find(address);
    return account == nullptr ? 0 : account->lamports;
}

void Runtime::setAccount(const Address& address, Account account) { m_accounts[address] = std::move(account); }

void Runtime::airdrop(const Address& address, Amount lamports)
{
    auto [iterator, inserted] = m_accounts.try_emplace(address);
    if (inserted) {
        iterator->second.owner = systemProgramId();
    }
    iterator->second.lamports = checkedAdd(iterator->second.lamports, lamports);
}

Amount Runtime::rentFor(size_t size) const
{
    return mulDivCeil(static_cast<Amount>(kAccountStorageOverhead + size), m_rentPerByte, 1);
}

} // namespace settlemill
