// Copyright 2023 Intrinsic Innovation LLC

#include "clientboot/util/init/init_clientboot.h"

#include <cstring>

#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/initialize.h"

void InitClientboot(const char* usage, int argc, char* argv[]) {
  if (usage != nullptr && strlen(usage) > 0) {
    absl::SetProgramUsageMessage(usage);
  }
  absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();
}
