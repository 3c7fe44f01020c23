
#pragma once
#include "status.hpp"
#include "types.hpp"
#include <vector>

// Source of check definitions and target of state write-back
class CheckRegistry {
public:
    virtual ~CheckRegistry() = default;

    virtual Result<std::vector<Check>> list_checks() = 0;

    // Writes back the mutable fields (state, last_checked) of one check
    virtual Status write_check(const Check& check) = 0;
};
