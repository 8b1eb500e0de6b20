#include "flashverifier.hpp"
#include "errors.hpp"
#include "programids.hpp"
#include "types.hpp"

#include <algorithm>

namespace settlemill {

FlashVerifier::FlashVerifier(const std::vector<Instruction>& instructions, size_t currentIndex,
                             const Address& programId)
    : m_instructions(instructions), m_currentIndex(currentIndex), m_programId(programId)
{
    if (m_currentIndex >= m_instructions.size()) {
        throw SettlementError(ErrorCode::InvalidInstructionData, "current index out of range");
    }
}

bool FlashVerifier::isAuxiliaryProgram(const Address& programId)
{
    return programId == computeBudgetProgramId() || programId == tokenProgramId() ||
           programId == token2022ProgramId() || programId == associatedTokenProgramId();
}

const Instruction& FlashVerifier::current() const { return m_instructions[m_currentIndex]; }

bool FlashVerifier::hasDiscriminator(const Instruction& instruction, const Discriminator& discriminator)
{
    return instruction.data.size() >= discriminator.size() &&
           std::equal(discriminator.begin(), discriminator.end(), instruction.data.begin());
}

void FlashVerifier::checkPair(const Instruction& other, const Discriminator& expected) const
{
    if (!hasDiscriminator(other, expected)) {
        throw SettlementError(ErrorCode::FlashTxWithUnexpectedIxs, "paired instruction is not the expected one");
    }

    const auto& mine = current().accounts;
    if (mine.size() != other.accounts.size()) {
        throw SettlementError(ErrorCode::FlashIxsAccountMismatch, "account count differs");
    }
    for (size_t index = 0; index < mine.size(); ++index) {
        if (mine[index] != other.accounts[index]) {
            throw SettlementError(ErrorCode::FlashIxsAccountMismatch,
                                  "index " + std::to_string(index) + " " + mine[index].shortHex() +
                                      " != " + other.accounts[index].shortHex());
        }
    }
}

void FlashVerifier::ensureTopLevel(int stackHeight) const
{
    require(current().programId == m_programId, ErrorCode::CPINotAllowed);
    require(stackHeight <= kTransactionLevelStackHeight, ErrorCode::CPINotAllowed);
}

const Instruction& FlashVerifier::ensureEndFollows(const Discriminator& endDiscriminator) const
{
    for (size_t index = 0; index < m_currentIndex; ++index) {
        require(isAuxiliaryProgram(m_instructions[index].programId), ErrorCode::FlashTxWithUnexpectedIxs);
    }

    size_t index = m_currentIndex + 1;
    for (; index < m_instructions.size(); ++index) {
        if (m_instructions[index].programId == m_programId) {
            break;
        }
    }
    if (index == m_instructions.size()) {
        throw SettlementError(ErrorCode::FlashIxsNotEnded);
    }
    const Instruction& end = m_instructions[index];

    for (size_t after = index + 1; after < m_instructions.size(); ++after) {
        require(isAuxiliaryProgram(m_instructions[after].programId), ErrorCode::FlashTxWithUnexpectedIxs);
    }

    checkPair(end, endDiscriminator);
    return end;
}

const Instruction& FlashVerifier::ensureStartPrecedes(const Discriminator& startDiscriminator) const
{
    for (size_t after = m_currentIndex + 1; after < m_instructions.size(); ++after) {
        require(isAuxiliaryProgram(m_instructions[after].programId), ErrorCode::FlashTxWithUnexpectedIxs);
    }

    const Instruction* start = nullptr;
    for (size_t index = 0; index < m_currentIndex; ++index) {
        const Instruction& instruction = m_instructions[index];
        if (instruction.programId == m_programId) {
            start = &instruction;
            break;
        }
        require(isAuxiliaryProgram(instruction.programId), ErrorCode::FlashTxWithUnexpectedIxs);
    }
    if (start == nullptr) {
        throw SettlementError(ErrorCode::FlashIxsNotStarted);
    }

    checkPair(*start, startDiscriminator);
    return *start;
}

const Instruction& FlashVerifier::ensureAssertEndFollows(const Discriminator& startDiscriminator,
                                                         const Discriminator& endDiscriminator) const
{
    const Instruction* end = nullptr;
    for (size_t index = m_currentIndex + 1; index < m_instructions.size(); ++index) {
        const Instruction& instruction = m_instructions[index];
        if (instruction.programId != m_programId) {
            continue;
        }
        if (hasDiscriminator(instruction, endDiscriminator)) {
            if (end != nullptr) {
                throw SettlementError(ErrorCode::FlashTxWithUnexpectedIxs, "repeated end instruction");
            }
            end = &instruction;
        }
        if (hasDiscriminator(instruction, startDiscriminator)) {
            throw SettlementError(ErrorCode::FlashTxWithUnexpectedIxs, "repeated start instruction");
        }
    }
    if (end == nullptr) {
        throw SettlementError(ErrorCode::FlashIxsNotEnded);
    }

    checkPair(*end, endDiscriminator);
    return *end;
}

const Instruction& FlashVerifier::ensureAssertStartPrecedes(const Discriminator& startDiscriminator,
                                                            const Discriminator& endDiscriminator) const
{
    const Instruction* start = nullptr;
    for (size_t index = m_currentIndex; index-- > 0;) {
        const Instruction& instruction = m_instructions[index];
        if (instruction.programId != m_programId) {
            continue;
        }
        if (hasDiscriminator(instruction, startDiscriminator)) {
            if (start != nullptr) {
                throw SettlementError(ErrorCode::FlashTxWithUnexpectedIxs, "repeated start instruction");
            }
            start = &instruction;
        } else if (hasDiscriminator(instruction, endDiscriminator)) {
            throw SettlementError(ErrorCode::FlashTxWithUnexpectedIxs, "end instruction before start");
        }
    }
    if (start == nullptr) {
        throw SettlementError(ErrorCode::FlashIxsNotStarted);
    }

    checkPair(*start, startDiscriminator);
    return *start;
}

const Instruction& FlashVerifier::ensureSwapEndFollows(const Address& swapProgram,
                                                       const Discriminator& endDiscriminator) const
{
    bool foundSwap = false;
    const Instruction* end = nullptr;
    for (size_t index = m_currentIndex + 1; index < m_instructions.size(); ++index) {
        const Instruction& instruction = m_instructions[index];
        if (instruction.programId == m_programId) {
            end = &instruction;
            break;
        }
        if (instruction.programId != swapProgram) {
            throw SettlementError(ErrorCode::FlashTxWithUnexpectedIxs, "unexpected instruction between start and end");
        }
        if (foundSwap) {
            throw SettlementError(ErrorCode::FlashTxWithUnexpectedIxs, "more than one swap instruction");
        }
        foundSwap = true;
    }
    if (end == nullptr) {
        throw SettlementError(ErrorCode::FlashIxsNotEnded);
    }
    if (!foundSwap) {
        throw SettlementError(ErrorCode::FlashTxWithUnexpectedIxs, "no swap instruction between start and end");
    }

    checkPair(*end, endDiscriminator);
    return *end;
}

const Instruction& FlashVerifier::ensureSwapStartPrecedes(const Address& swapProgram,
                                                          const Discriminator& startDiscriminator) const
{
    bool foundSwap = false;
    const Instruction* start = nullptr;
    for (size_t index = m_currentIndex; index-- > 0;) {
        const Instruction& instruction = m_instructions[index];
        if (instruction.programId == m_programId) {
            start = &instruction;
            break;
        }
        if (instruction.programId != swapProgram) {
            throw SettlementError(ErrorCode::FlashTxWithUnexpectedIxs, "unexpected instruction between start and end");
        }
        if (foundSwap) {
            throw SettlementError(ErrorCode::FlashTxWithUnexpectedIxs, "more than one swap instruction");
        }
        foundSwap = true;
    }
    if (start == nullptr) {
        throw SettlementError(ErrorCode::FlashIxsNotStarted);
    }
    if (!foundSwap) {
        throw SettlementError(ErrorCode::FlashTxWithUnexpectedIxs, "no swap instruction between start and end");
    }

    checkPair(*start, startDiscriminator);
    return *start;
}

} // namespace settlemill
