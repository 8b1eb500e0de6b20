#pragma once

#include "address.hpp"

namespace settlemill {

// Well-known program ids of the built-in runtime programs
const Address& systemProgramId();
const Address& tokenProgramId();
const Address& token2022ProgramId();
const Address& associatedTokenProgramId();
const Address& computeBudgetProgramId();

} // namespace settlemill
