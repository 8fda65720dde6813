#pragma once

// cmd_classify: run one classification event through the full pipeline.
//   injguard_cli classify --event <file|-> [--redis <uri> | --prompt-dir <dir>]
//                         [--db <path>] [--model-backend http|stub]
int cmd_classify(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
