// Copyright (c)2021 Fundament Software
// For conditions of distribution and use, see copyright notice in wasmjit.h

#ifndef WJ__OPTIMIZE_H
#define WJ__OPTIMIZE_H

#include "llvm.h"
#include "wasmjit/schema.h"

namespace wasmjit {
  WJ_ERROR OptimizeModule(const Environment& env, llvm::Module& m, llvm::TargetMachine* target);
}

#endif
