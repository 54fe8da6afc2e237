// Copyright (c)2020 Black Sphere Studios
// For conditions of distribution and use, see copyright notice in wasmjit.h

#ifndef WJ__EXPORT_H
#define WJ__EXPORT_H

#include "wasmjit/schema.h"
#include "wasmjit/runtime.h"

namespace wasmjit {
  // Returns an environment with every webassembly check enabled, full optimization and warnings logged to stderr.
  Environment CreateEnvironment();

  // Default log hook, writes to env->log or stderr.
  int DefaultLog(const Environment* env, const char* format, ...);

  // Decodes a binary module without validating it.
  WJ_ERROR ParseModule(Environment& env, const uint8_t* data, size_t size, Module& out);

  // Validates a decoded module. Every problem found is appended to env.errors.
  WJ_ERROR ValidateModule(Environment& env, const Module& m);

  // Decodes and validates a binary module.
  WJ_ERROR LoadModule(Environment& env, const uint8_t* data, size_t size, Module& out);

  // Links a validated module against the host bindings and runs its start function. On failure out is left empty.
  WJ_ERROR Instantiate(Environment& env, const Module& m, const ImportMap& imports, std::shared_ptr<Instance>& out);

  // Decodes, validates and instantiates a binary module in one step.
  WJ_ERROR Compile(Environment& env, const uint8_t* data, size_t size, const ImportMap& imports,
                   std::shared_ptr<Instance>& out);

  // Returns the symbolic name of an error code, or writes the number into buf if it is unknown.
  const char* ErrorString(int err, char* buf, size_t n);
}

#endif
