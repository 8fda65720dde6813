#pragma once

#include <ostream>
#include <string>

// execute_check_key writes "OK: ..." to `out` or "INVALID: <reason>" to `err`.
// Returns 0 when the key is acceptable (including the empty key), 1 otherwise.
int execute_check_key(const std::string& key, std::ostream& out, std::ostream& err);
