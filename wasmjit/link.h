// Copyright (c)2021 Fundament Software
// For conditions of distribution and use, see copyright notice in wasmjit.h

#ifndef WJ__LINK_H
#define WJ__LINK_H

#include "wasmjit/runtime.h"
#include "constants.h"
#include "jit.h"
#include <memory>
#include <vector>

// Import keys are "module\0field\0" buffers, so both names take part in hashing and comparison
KHASH_DECLARE(importmap, const char*, size_t);
KHASH_DECLARE(exportmap, const char*, size_t);

namespace wasmjit {
  namespace internal {
    // The machine code of one instance and everything it addresses. Every compiled function holds a reference to this.
    // Tables are only reached through their shared TableData, so a table holding the instance's own functions does not
    // keep itself alive.
    struct CompiledCode
    {
      std::unique_ptr<JITContext> jit; // Destroyed last, after everything that points into it
      std::vector<std::shared_ptr<Function>> imports;
      std::vector<std::shared_ptr<TableData>> tables;
      std::vector<std::shared_ptr<Memory>> memories;
      std::vector<std::shared_ptr<Global>> globals;
    };

    // The runtime structures of one instance, owned by the Instance.
    struct Linkage
    {
      std::shared_ptr<CompiledCode> code;
      std::vector<std::shared_ptr<Function>> imports;      // Imported functions, by function index
      std::vector<std::shared_ptr<FunctionTable>> tables;  // Combined index spaces, imports first
      std::vector<std::shared_ptr<Memory>> memories;
      std::vector<std::shared_ptr<Global>> globals;
    };

    WJ_ERROR ResolveImports(Environment& env, const Module& m, const ImportMap& imports, Linkage& linkage);
    WJ_ERROR AllocateLocals(Environment& env, const Module& m, Linkage& linkage);
    WJ_ERROR CheckExports(Environment& env, const Module& m, const Linkage& linkage);
    WJ_ERROR CompileFunctions(Environment& env, const Module& m, Linkage& linkage,
                              std::vector<std::shared_ptr<Function>>& functions);
    // Segment offsets are evaluated and bounds checked for every segment before any of them is written.
    WJ_ERROR CheckElements(Environment& env, const Module& m, const Linkage& linkage, std::vector<varuint32>& offsets);
    WJ_ERROR CheckData(Environment& env, const Module& m, const Linkage& linkage, std::vector<varuint32>& offsets);
    WJ_ERROR ApplyElements(Environment& env, const Module& m, Linkage& linkage,
                           const std::vector<std::shared_ptr<Function>>& functions,
                           const std::vector<varuint32>& offsets);
    WJ_ERROR ApplyData(Environment& env, const Module& m, Linkage& linkage, const std::vector<varuint32>& offsets);

    // Evaluates a constant initializer expression against the globals allocated so far.
    WJ_ERROR EvalInitializer(const Environment& env, const Instruction& ins, const Linkage& linkage, Value& out);
  }
}

#endif
