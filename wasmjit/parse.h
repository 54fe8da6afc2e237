// Copyright (c)2020 Black Sphere Studios
// For conditions of distribution and use, see copyright notice in wasmjit.h

#ifndef WJ__PARSE_H
#define WJ__PARSE_H

#include "stream.h"

namespace wasmjit {
  WJ_ERROR ParseValueType(utility::Stream& s, varsint7& type);
  WJ_ERROR ParseInitializer(utility::Stream& s, Instruction& ins);
  WJ_ERROR ParseFunctionType(utility::Stream& s, FunctionType& sig);
  WJ_ERROR ParseFunctionDesc(utility::Stream& s, FunctionDesc& desc);
  WJ_ERROR ParseResizableLimits(utility::Stream& s, ResizableLimits& limits);
  WJ_ERROR ParseMemoryDesc(utility::Stream& s, MemoryDesc& mem);
  WJ_ERROR ParseTableDesc(utility::Stream& s, TableDesc& t);
  WJ_ERROR ParseGlobalDesc(utility::Stream& s, GlobalDesc& g);
  WJ_ERROR ParseGlobalDecl(utility::Stream& s, GlobalDecl& g);
  WJ_ERROR ParseImport(utility::Stream& s, Import& i);
  WJ_ERROR ParseExport(utility::Stream& s, Export& e);
  WJ_ERROR ParseInstruction(utility::Stream& s, Instruction& ins);
  WJ_ERROR ParseTableInit(utility::Stream& s, TableInit& init);
  WJ_ERROR ParseFunctionBody(utility::Stream& s, FunctionBody& f);
  WJ_ERROR ParseDataInit(utility::Stream& s, DataInit& data);
  WJ_ERROR ParseNameSection(utility::Stream& s, Module& m);
  WJ_ERROR ParseModule(utility::Stream& s, Module& m);
}

#endif
