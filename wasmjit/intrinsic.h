// Copyright (c)2019 Black Sphere Studios
// For conditions of distribution and use, see copyright notice in wasmjit.h

#ifndef WJ__INTRINSIC_H
#define WJ__INTRINSIC_H

#include "wasmjit/wasmjit.h"
#include <stdint.h>

// Helpers called directly from compiled code, they are implemented in runtime.cpp
extern "C" {
WJ_NORETURN void _wasmjit_trap(int32_t code);
int32_t _wasmjit_memory_grow(void* memory, int32_t delta);
void _wasmjit_enter(uint32_t maxdepth);
void _wasmjit_leave();
}

namespace wasmjit {
  namespace code {
    struct Intrinsic
    {
      const char* name;
      void* address;
    };

    static const Intrinsic intrinsics[] = {
      { "_wasmjit_trap", reinterpret_cast<void*>(&_wasmjit_trap) },
      { "_wasmjit_memory_grow", reinterpret_cast<void*>(&_wasmjit_memory_grow) },
      { "_wasmjit_enter", reinterpret_cast<void*>(&_wasmjit_enter) },
      { "_wasmjit_leave", reinterpret_cast<void*>(&_wasmjit_leave) },
    };
  }
}

#endif
