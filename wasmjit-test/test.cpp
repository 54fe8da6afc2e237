// Copyright (c)2021 Fundament Software
// For conditions of distribution and use, see copyright notice in wasmjit.h

#include "test.h"
#include <iostream>

int main(int argc, char* argv[])
{
  int log = LOG_NONE;

  std::cout << "wasmjit v" << WASMJIT_VERSION_MAJOR << "." << WASMJIT_VERSION_MINOR << "." << WASMJIT_VERSION_REVISION
            << " Test Utility" << std::endl;
  std::cout << std::endl;

  for(int i = 1; i < argc; ++i)
  {
    if(!STRICMP(argv[i], "-v"))
      log = LOG_DEBUG;
    else if(!STRICMP(argv[i], "-w"))
      log = LOG_WARNING;
  }

  TestHarness harness(log, stderr);
  size_t failures = harness.Run(stdout);
  return static_cast<int>(failures);
}
