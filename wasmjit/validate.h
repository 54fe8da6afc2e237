// Copyright (c)2020 Black Sphere Studios
// For conditions of distribution and use, see copyright notice in wasmjit.h

#ifndef WJ__VALIDATE_H
#define WJ__VALIDATE_H

#include "wasmjit/schema.h"

namespace wasmjit {
  void ValidateFunctionSig(const FunctionType& sig, Environment& env, const Module& m);
  void ValidateImport(const Import& imp, Environment& env, const Module& m);
  void ValidateFunction(const FunctionDesc& decl, Environment& env, const Module& m);
  void ValidateLimits(const ResizableLimits& limits, Environment& env, const Module& m);
  void ValidateTable(const TableDesc& table, Environment& env, const Module& m);
  void ValidateMemory(const MemoryDesc& mem, Environment& env, const Module& m);
  varsint7 ValidateInitializer(const Instruction& ins, Environment& env, const Module& m);
  void ValidateGlobal(const GlobalDecl& decl, Environment& env, const Module& m);
  void ValidateExport(const Export& e, Environment& env, const Module& m);
  void ValidateTableOffset(const TableInit& init, Environment& env, const Module& m);
  void ValidateFunctionBody(const FunctionType& sig, const FunctionBody& body, Environment& env, const Module& m);
  void ValidateDataOffset(const DataInit& init, Environment& env, const Module& m);
  void ValidateModuleBody(Environment& env, const Module& m);
}

#endif
