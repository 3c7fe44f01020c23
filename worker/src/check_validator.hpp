
#pragma once
#include "status.hpp"
#include "types.hpp"

// Shape checks applied to every registry record before it is probed.
// Returns a Validation failure naming the first offending field.
Status validate_check(const Check& check, int max_timeout_seconds);
