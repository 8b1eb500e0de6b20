#pragma once

#include "address.hpp"
#include "types.hpp"

#include <vector>

namespace settlemill {

// One instruction of a transaction: the program to run, its ordered
// account list and its raw argument bytes
struct Instruction {
    Address programId;
    std::vector<Address> accounts;
    Bytes data;
};

struct Transaction {
    std::vector<Instruction> instructions;
    std::vector<Address> signers;
};

} // namespace settlemill
