#pragma once

// Command line entry point
// Parses argv, opens the configured library and runs one command against it.
// Returns 0 on success, non-zero on error
int run(int argc, char* argv[]);
