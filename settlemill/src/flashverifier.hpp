#pragma once

#include "address.hpp"
#include "codec.hpp"
#include "instruction.hpp"

#include <vector>

namespace settlemill {

// Pairing checks for bracketing instructions, driven only by the ordered
// instruction list of the enclosing transaction and the current index.
// Every lookup returns the paired instruction so callers can decode and
// compare its arguments.
class FlashVerifier {
public:
    FlashVerifier(const std::vector<Instruction>& instructions, size_t currentIndex, const Address& programId);

    // Current instruction must be a top-level instruction of this program
    void ensureTopLevel(int stackHeight) const;

    // Flash fill, start side: auxiliary programs only before the start, the
    // next instruction of this program is the end with identical accounts,
    // auxiliary programs only after the end
    const Instruction& ensureEndFollows(const Discriminator& endDiscriminator) const;

    // Flash fill, end side (mirror of ensureEndFollows)
    const Instruction& ensureStartPrecedes(const Discriminator& startDiscriminator) const;

    // Ordering variant: exactly one end after the start and no start or
    // repeated end of this program anywhere around it
    const Instruction& ensureAssertEndFollows(const Discriminator& startDiscriminator,
                                              const Discriminator& endDiscriminator) const;
    const Instruction& ensureAssertStartPrecedes(const Discriminator& startDiscriminator,
                                                 const Discriminator& endDiscriminator) const;

    // Strict variant: exactly one instruction of swapProgram between start
    // and end, nothing else
    const Instruction& ensureSwapEndFollows(const Address& swapProgram, const Discriminator& endDiscriminator) const;
    const Instruction& ensureSwapStartPrecedes(const Address& swapProgram,
                                               const Discriminator& startDiscriminator) const;

    [[nodiscard]] static bool isAuxiliaryProgram(const Address& programId);

private:
    [[nodiscard]] const Instruction& current() const;
    [[nodiscard]] static bool hasDiscriminator(const Instruction& instruction, const Discriminator& discriminator);

    // Paired instruction must carry the expected tag and the same accounts
    void checkPair(const Instruction& other, const Discriminator& expected) const;

    const std::vector<Instruction>& m_instructions;
    size_t m_currentIndex;
    Address m_programId;
};

} // namespace settlemill
