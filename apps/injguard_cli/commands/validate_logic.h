#pragma once

#include <ostream>
#include <string>

inline constexpr int kExitAccepted = 0;
inline constexpr int kExitRejected = 2;

// execute_validate prints {"accepted", "code"?, "reason"?, "verdict"} as JSON to `out`
// and returns kExitAccepted or kExitRejected. The verdict is the one a live
// classification would return for this model output.
int execute_validate(const std::string& model_output, std::ostream& out);
