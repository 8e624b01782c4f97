// Copyright 2023 Intrinsic Innovation LLC

#ifndef CLIENTBOOT_UTIL_INIT_INIT_CLIENTBOOT_H_
#define CLIENTBOOT_UTIL_INIT_INIT_CLIENTBOOT_H_

// Initializes a command line application: sets the usage message, parses the
// command-line flags and initializes logging.
void InitClientboot(const char* usage, int argc, char* argv[]);

#endif  // CLIENTBOOT_UTIL_INIT_INIT_CLIENTBOOT_H_
