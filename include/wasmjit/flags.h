// Copyright (c)2020 Black Sphere Studios
// For conditions of distribution and use, see copyright notice in wasmjit.h

#ifndef WJ__FLAGS_H
#define WJ__FLAGS_H

enum WASM_ENVIRONMENT_FLAGS
{
  // Attaches the function names of the module to the generated code and verifies the LLVM module before it is handed to
  // the JIT. Optimizations still run unless ENV_OPTIMIZE_O0 is set.
  ENV_DEBUG = (1 << 0),

  // Writes the final LLVM IR of every instantiated module to the log at LOG_DEBUG level. This can be used to investigate
  // compiler bugs or unexpected behavior.
  ENV_EMIT_LLVM = (1 << 1),

  // Makes every compiled function count its call depth and trap with ERR_TRAP_STACK_OVERFLOW when it exceeds
  // Environment::maxdepth, instead of letting the native stack overflow.
  ENV_CHECK_STACK_OVERFLOW = (1 << 10),

  // Traps if a float to integer truncation would overflow the integer or the float is NaN.
  ENV_CHECK_FLOAT_TRUNC = (1 << 11),

  // Inserts memory bounds checks on all load and store operations. Required for sandboxing, but comes at a performance
  // cost.
  ENV_CHECK_MEMORY_ACCESS = (1 << 12),

  // Verifies the bounds, presence and signature of every table entry used by call_indirect.
  ENV_CHECK_INDIRECT_CALL = (1 << 13),

  // Integer division is not actually guaranteed to trap on most hardware, and is undefined behavior in LLVM. This inserts
  // checks for both division by zero and the INT_MIN / -1 overflow case.
  ENV_CHECK_INT_DIVISION = (1 << 14),

  // Enables all the checks required by the webassembly standard.
  ENV_STRICT = ENV_CHECK_STACK_OVERFLOW | ENV_CHECK_FLOAT_TRUNC | ENV_CHECK_MEMORY_ACCESS | ENV_CHECK_INDIRECT_CALL |
               ENV_CHECK_INT_DIVISION,
};

enum WASM_OPTIMIZE_FLAGS
{
  ENV_OPTIMIZE_O0    = 0,
  ENV_OPTIMIZE_O1    = 1,
  ENV_OPTIMIZE_O2    = 2,
  ENV_OPTIMIZE_O3    = 3,
  ENV_OPTIMIZE_Os    = 4,
  ENV_OPTIMIZE_OMASK = 7,
};

#endif
