// Copyright (c)2021 Fundament Software
// For conditions of distribution and use, see copyright notice in wasmjit.h

#include "llvm.h"
#include "optimize.h"
#include "util.h"
#pragma warning(push)
#pragma warning(disable : 4146 4267 4141 4244 4624)
#define _SCL_SECURE_NO_WARNINGS
#include "llvm/Transforms/IPO.h"
#include "llvm/Transforms/IPO/PassManagerBuilder.h"
#pragma warning(pop)

using namespace wasmjit;
using namespace utility;

WJ_ERROR wasmjit::OptimizeModule(const Environment& env, llvm::Module& m, llvm::TargetMachine* target)
{
  llvm::PassManagerBuilder builder;
  builder.OptLevel      = 0;
  builder.SizeLevel     = 0;
  builder.NewGVN        = true;
  builder.VerifyInput   = (env.flags & ENV_DEBUG) != 0;
  builder.VerifyOutput  = (env.flags & ENV_DEBUG) != 0;
  builder.PrepareForLTO = false;
  builder.LibraryInfo   = new llvm::TargetLibraryInfoImpl(target->getTargetTriple());

  switch(env.optimize & ENV_OPTIMIZE_OMASK)
  {
  case ENV_OPTIMIZE_O0: break;
  case ENV_OPTIMIZE_O1: builder.OptLevel = 1; break;
  case ENV_OPTIMIZE_O2: builder.OptLevel = 2; break;
  case ENV_OPTIMIZE_O3: builder.OptLevel = 3; break;
  case ENV_OPTIMIZE_Os:
    builder.OptLevel  = 2;
    builder.SizeLevel = 1;
    break;
  default:
    return LogErrorString(env, "%s: unknown optimization level %llu", ERR_INVALID_ARGUMENT,
                          static_cast<unsigned long long>(env.optimize & ENV_OPTIMIZE_OMASK));
  }

  if(builder.OptLevel == 0)
    return ERR_SUCCESS;

  builder.MergeFunctions = true;
  builder.Inliner        = llvm::createFunctionInliningPass(builder.OptLevel, builder.SizeLevel, false);

  target->adjustPassManager(builder);

  if(builder.OptLevel > 1)
  {
    // Allow all vectorization helpers at O2 and O3
    builder.SLPVectorize     = true;
    builder.LoopVectorize    = true;
    builder.LoopsInterleaved = true;
    builder.RerollLoops      = true;
  }

  llvm::legacy::PassManager mpm;
  mpm.add(llvm::createTargetTransformInfoWrapperPass(target->getTargetIRAnalysis()));
  builder.populateModulePassManager(mpm);
  mpm.run(m);

  return ERR_SUCCESS;
}
