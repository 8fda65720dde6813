#pragma once

// cmd_check_key: validate a prompt override key. Exit 0 when valid, 1 otherwise.
int cmd_check_key(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
