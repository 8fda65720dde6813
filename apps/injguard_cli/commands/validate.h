#pragma once

// cmd_validate: read raw model output from stdin and run the response validator.
// Exit 0 when accepted, 2 when rejected.
int cmd_validate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
