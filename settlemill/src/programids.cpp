#include "programids.hpp"

namespace settlemill {

const Address& systemProgramId()
{
    static const Address id = Address::fromLabel("program:system");
    return id;
}

const Address& tokenProgramId()
{
    static const Address id = Address::fromLabel("program:token");
    return id;
}

const Address& token2022ProgramId()
{
    static const Address id = Address::fromLabel("program:token-2022");
    return id;
}

const Address& associatedTokenProgramId()
{
    static const Address id = Address::fromLabel("program:associated-token");
    return id;
}

const Address& computeBudgetProgramId()
{
    static const Address id = Address::fromLabel("program:compute-budget");
    return id;
}

} // namespace settlemill
