// Copyright (c)2021 Fundament Software
// For conditions of distribution and use, see copyright notice in wasmjit.h

#include "llvm.h"
#include "jit.h"
#include "intrinsic.h"
#include "util.h"
#include <mutex>

using namespace wasmjit;
using namespace utility;
using namespace llvm;
using namespace orc;

JITContext::JITContext(std::unique_ptr<llvm::orc::ExecutionSession> es, llvm::orc::JITDylib& dylib,
                       JITTargetMachineBuilder JTMB, std::unique_ptr<llvm::TargetMachine> tm, llvm::DataLayout dl,
                       std::unique_ptr<LLVMContext> ctx, const Environment& env) :
  jtmb(JTMB),
  Ctx(std::move(ctx)),
  ES(std::move(es)),
  DL(std::move(dl)),
  OLL(*ES, []() { return std::make_unique<SectionMemoryManager>(); }),
  TM(std::move(tm)),
  CL(*ES, OLL, std::make_unique<SimpleCompiler>(*TM)),
  Mangler(*ES, DL),
  MainJD(dylib)
{
  if(jtmb.getTargetTriple().isOSBinFormatCOFF())
  {
    OLL.setOverrideObjectFlagsWithResponsibilityFlags(true);
    OLL.setAutoClaimResponsibilityForObjectSymbols(true);
  }

  // The session reports errors until it is destroyed, which can be long after env is gone, so it logs through its own
  // copy of the log settings.
  Environment log = { env.flags, env.optimize, env.maxdepth, env.loglevel, env.log, env.loghook, {} };
  ES->setErrorReporter([log](Error e) {
    std::string msg = toString(std::move(e));
    LogMessage(log, LOG_ERROR, "JIT Error: %s\n", msg.c_str());
  });
}

JITContext::~JITContext()
{
  if(auto Err = ES->endSession())
    ES->reportError(std::move(Err));
}

llvm::Expected<llvm::JITEvaluatedSymbol> JITContext::Lookup(llvm::StringRef Name)
{
  auto str = Name.str();
  return ES->lookup(llvm::orc::JITDylibSearchOrder({ { &MainJD, llvm::orc::JITDylibLookupFlags::MatchAllSymbols } }),
                    Mangler(str));
}

llvm::Error JITContext::DefineRuntimeSymbols()
{
  orc::SymbolMap symbols;

  for(auto& intrinsic : code::intrinsics)
    symbols[Mangler(intrinsic.name)] = JITEvaluatedSymbol(
      static_cast<JITTargetAddress>(reinterpret_cast<uintptr_t>(intrinsic.address)), JITSymbolFlags::Exported);

  return MainJD.define(absoluteSymbols(std::move(symbols)));
}

llvm::Error JITContext::CompileModule(std::unique_ptr<llvm::Module> m)
{
  auto TSM = llvm::orc::ThreadSafeModule(std::move(m), Ctx);
  if(auto Err = TSM.withModuleDo([&](llvm::Module& M) -> llvm::Error {
       if(M.getDataLayout().isDefault())
         M.setDataLayout(DL);

       if(M.getDataLayout() != DL)
         return make_error<StringError>("Added modules have incompatible data layouts: " +
                                          M.getDataLayout().getStringRepresentation() + " (module) vs " +
                                          DL.getStringRepresentation() + " (jit)",
                                        inconvertibleErrorCode());

       return llvm::Error::success();
     }))
    return Err;
  return CL.add(MainJD.getDefaultResourceTracker(), std::move(TSM));
}

llvm::Expected<std::unique_ptr<JITContext>> JITContext::Create(std::unique_ptr<llvm::LLVMContext> ctx,
                                                              const Environment& env)
{
  auto jtmb = JITTargetMachineBuilder::detectHost();
  if(!jtmb)
    return jtmb.takeError();

  auto sepc = SelfExecutorProcessControl::Create();
  if(!sepc)
    return sepc.takeError();

  auto es = std::make_unique<ExecutionSession>(std::move(*sepc));

  auto mainlib = es->createJITDylib("<+wasmjit_main>");
  if(!mainlib)
    return mainlib.takeError();

  auto dl = (*jtmb).getDefaultDataLayoutForTarget();
  if(!dl)
    return dl.takeError();

  auto tm = (*jtmb).createTargetMachine();
  if(!tm)
    return tm.takeError();

  auto jit =
    std::make_unique<JITContext>(std::move(es), *mainlib, *jtmb, std::move(*tm), std::move(*dl), std::move(ctx), env);
  if(auto Err = jit->DefineRuntimeSymbols())
    return std::move(Err);

  return std::move(jit);
}

void wasmjit::InitializeNativeTarget()
{
  static std::once_flag flag;
  std::call_once(flag, []() {
    llvm::InitializeNativeTarget();
    llvm::InitializeNativeTargetAsmPrinter();
    llvm::InitializeNativeTargetAsmParser();
  });
}
