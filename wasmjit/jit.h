// Copyright (c)2021 Fundament Software
// For conditions of distribution and use, see copyright notice in wasmjit.h

#ifndef WJ__JIT_H
#define WJ__JIT_H

#include "llvm.h"
#include "llvm/ExecutionEngine/JITSymbol.h"
#include "llvm/ExecutionEngine/Orc/CompileUtils.h"
#include "llvm/ExecutionEngine/Orc/Core.h"
#include "llvm/ExecutionEngine/Orc/ExecutionUtils.h"
#include "llvm/ExecutionEngine/Orc/ExecutorProcessControl.h"
#include "llvm/ExecutionEngine/Orc/IRCompileLayer.h"
#include "llvm/ExecutionEngine/Orc/JITTargetMachineBuilder.h"
#include "llvm/ExecutionEngine/Orc/Mangling.h"
#include "llvm/ExecutionEngine/Orc/RTDyldObjectLinkingLayer.h"
#include "llvm/ExecutionEngine/Orc/ThreadSafeModule.h"
#include "llvm/ExecutionEngine/SectionMemoryManager.h"
#include "wasmjit/schema.h"

namespace wasmjit {
  // Owns one ORC execution session. Every instance gets its own context, so destroying the context releases all of the
  // instance's machine code.
  class JITContext
  {
  public:
    JITContext(std::unique_ptr<llvm::orc::ExecutionSession> es, llvm::orc::JITDylib& dylib,
               llvm::orc::JITTargetMachineBuilder JTMB, std::unique_ptr<llvm::TargetMachine> tm, llvm::DataLayout dl,
               std::unique_ptr<llvm::LLVMContext> ctx, const Environment& env);
    ~JITContext();

    inline llvm::LLVMContext& GetContext() { return *Ctx.getContext(); }
    inline const llvm::DataLayout& GetDataLayout() const { return DL; }
    inline llvm::TargetMachine& GetTargetMachine() { return *TM; }

    llvm::Error CompileModule(std::unique_ptr<llvm::Module> m);
    llvm::Expected<llvm::JITEvaluatedSymbol> Lookup(llvm::StringRef Name);

    // Makes the runtime helpers that compiled code calls (_wasmjit_trap and friends) resolvable.
    llvm::Error DefineRuntimeSymbols();

    static llvm::Expected<std::unique_ptr<JITContext>> Create(std::unique_ptr<llvm::LLVMContext> ctx,
                                                              const Environment& env);

  protected:
    llvm::orc::JITTargetMachineBuilder jtmb;
    llvm::orc::ThreadSafeContext Ctx;
    std::unique_ptr<llvm::orc::ExecutionSession> ES;
    llvm::DataLayout DL;
    llvm::orc::RTDyldObjectLinkingLayer OLL;
    std::unique_ptr<llvm::TargetMachine> TM;
    llvm::orc::IRCompileLayer CL;
    llvm::orc::MangleAndInterner Mangler;

    llvm::orc::JITDylib& MainJD;
  };

  // Must be called once before any JITContext is created.
  void InitializeNativeTarget();
}

#endif
