// Copyright (c)2021 Fundament Software
// For conditions of distribution and use, see copyright notice in wasmjit.h

#include "llvm.h"
#include "compile.h"
#include "link.h"
#include "util.h"

using Func    = llvm::Function;
using FuncTy  = llvm::FunctionType;
using llvmTy  = llvm::Type;
using llvmVal = llvm::Value;
using BB      = llvm::BasicBlock;
using CInt    = llvm::ConstantInt;

using namespace wasmjit;
using namespace utility;

Compiler::Compiler(Environment& _env, const Module& _m, internal::Linkage& _linkage, llvm::LLVMContext& _ctx,
                   llvm::Module* _mod, llvm::IRBuilder<>& _builder, llvm::TargetMachine* _machine) :
  env(_env),
  m(_m),
  linkage(_linkage),
  ctx(_ctx),
  mod(_mod),
  builder(_builder),
  machine(_machine),
  current(0),
  fn_trap(0),
  fn_memgrow(0),
  fn_enter(0),
  fn_leave(0)
{
  intptrty = builder.getIntPtrTy(mod->getDataLayout());
  thunkty  = FuncTy::get(builder.getVoidTy(),
                        { builder.getInt8PtrTy(), builder.getInt64Ty()->getPointerTo(), builder.getInt64Ty()->getPointerTo() },
                        false);
  entryty  = llvm::StructType::create(ctx, { thunkty->getPointerTo(), builder.getInt8PtrTy(), builder.getInt64Ty() },
                                     "wj_entry");
  tablety  = llvm::StructType::create(ctx, { entryty->getPointerTo(), builder.getInt64Ty() }, "wj_table");
  memoryty = llvm::StructType::create(ctx, { builder.getInt8PtrTy(), builder.getInt64Ty() }, "wj_memory");
}

llvmTy* Compiler::GetLLVMType(varsint7 type)
{
  switch(type)
  {
  case TE_i32: return llvmTy::getInt32Ty(ctx);
  case TE_i64: return llvmTy::getInt64Ty(ctx);
  case TE_f32: return llvmTy::getFloatTy(ctx);
  case TE_f64: return llvmTy::getDoubleTy(ctx);
  case TE_void: return llvmTy::getVoidTy(ctx);
  }

  assert(false);
  return nullptr;
}

WASM_TYPE_ENCODING Compiler::GetTypeEncoding(llvmTy* t)
{
  if(t->isFloatTy())
    return TE_f32;
  if(t->isDoubleTy())
    return TE_f64;
  if(t->isVoidTy())
    return TE_void;
  if(t->isIntegerTy() && static_cast<llvm::IntegerType*>(t)->getBitWidth() == 32)
    return TE_i32;
  if(t->isIntegerTy() && static_cast<llvm::IntegerType*>(t)->getBitWidth() == 64)
    return TE_i64;

  return TE_NONE;
}

FuncTy* Compiler::GetFunctionType(const FunctionType& signature)
{
  llvmTy* ret = signature.returns.empty() ? GetLLVMType(TE_void) : GetLLVMType(signature.returns[0]);

  if(!signature.params.empty())
  {
    std::vector<llvmTy*> args;
    for(auto param : signature.params)
      args.push_back(GetLLVMType(param));

    return FuncTy::get(ret, args, false);
  }
  return FuncTy::get(ret, false);
}

// Runtime structures never move once they are allocated, so generated code addresses them as constants
llvm::Constant* Compiler::GetAddress(const void* p, llvmTy* ty)
{
  return llvm::ConstantExpr::getIntToPtr(CInt::get(intptrty, reinterpret_cast<uintptr_t>(p)), ty->getPointerTo(0));
}

llvm::AllocaInst* Compiler::CreateEntryAlloca(llvmTy* ty, unsigned int count, const llvm::Twine& name)
{
  BB& entry = current->getEntryBlock();
  llvm::IRBuilder<> entrybuilder(&entry, entry.begin());
  return entrybuilder.CreateAlloca(ty, (count > 1) ? builder.getInt32(count) : nullptr, name);
}

// Values cross a thunk boundary as the raw bits of the value, zero extended to 64 bits
llvmVal* Compiler::ToSlot(llvmVal* v)
{
  switch(GetTypeEncoding(v->getType()))
  {
  case TE_i32: return builder.CreateZExt(v, builder.getInt64Ty());
  case TE_f32: return builder.CreateZExt(builder.CreateBitCast(v, builder.getInt32Ty()), builder.getInt64Ty());
  case TE_f64: return builder.CreateBitCast(v, builder.getInt64Ty());
  default: return v;
  }
}

llvmVal* Compiler::FromSlot(llvmVal* slot, varsint7 type)
{
  switch(type)
  {
  case TE_i32: return builder.CreateTrunc(slot, builder.getInt32Ty());
  case TE_f32: return builder.CreateBitCast(builder.CreateTrunc(slot, builder.getInt32Ty()), builder.getFloatTy());
  case TE_f64: return builder.CreateBitCast(slot, builder.getDoubleTy());
  default: return slot;
  }
}

bool Compiler::CheckType(varsint7 ty, llvmVal* v)
{
  llvmTy* t = v->getType();
  switch(ty)
  {
  case TE_i32: return t->isIntegerTy() && static_cast<llvm::IntegerType*>(t)->getBitWidth() == 32;
  case TE_i64: return t->isIntegerTy() && static_cast<llvm::IntegerType*>(t)->getBitWidth() == 64;
  case TE_f32: return t->isFloatTy();
  case TE_f64: return t->isDoubleTy();
  case TE_void: return t->isVoidTy();
  }

  return true;
}

WJ_ERROR Compiler::PopType(varsint7 ty, llvmVal*& v, bool peek)
{
  char buf[10];
  v = nullptr;
  if(ty == TE_void)
    return ERR_SUCCESS;
  if(!values.Size())
    return LogErrorString(env, "%s: Found empty stack while trying to pop %s", ERR_INVALID_VALUE_STACK,
                          EnumToString(TYPE_ENCODING_MAP, ty, buf, sizeof(buf)));
  if(!values.Peek()) // polymorphic value
  {
    switch(ty)
    {
    case TE_i32:
    case TE_i64:
    case TE_f32:
    case TE_f64: v = llvm::Constant::getNullValue(GetLLVMType(ty)); return ERR_SUCCESS;
    default:
      return LogErrorString(env, "%s: can't pop polymorphic value of type %s", ERR_INVALID_TYPE,
                            EnumToString(TYPE_ENCODING_MAP, ty, buf, sizeof(buf)));
    }
  }
  if(!CheckType(ty, values.Peek()))
    return LogErrorString(env, "%s: Tried to pop %s", ERR_INVALID_TYPE, EnumToString(TYPE_ENCODING_MAP, ty, buf, sizeof(buf)));

  v = peek ? values.Peek() : values.Pop();
  return ERR_SUCCESS;
}

llvmVal* Compiler::MaskShiftBits(llvmVal* value)
{
  // WASM requires that a shift count greater than the bit width of the type is wrapped, which matches x86 behavior but is
  // undefined in LLVM, so we make this explicit.
  return builder.CreateAnd(value, CInt::get(value->getType(), value->getType()->getIntegerBitWidth() - 1));
}

BB* Compiler::PushLabel(const char* name, varsint7 sig, uint8_t opcode, Func* fnptr)
{
  BB* bb = BB::Create(ctx, name, fnptr);

  control.Push(Block{ bb, nullptr, values.Limit(), sig, opcode, {} });
  values.SetLimit(values.Size() + values.Limit()); // Prevent a block from popping past it's own stack frame
  return bb;
}

BB* Compiler::BindLabel(BB* block)
{
  if(block->getParent() != nullptr) // Because this always happens after a branch, even if we have nothing to bind to, we
                                    // must create a new block for LLVM
    block = BB::Create(ctx, "bind_block", nullptr);

  builder.GetInsertBlock()->getParent()->getBasicBlockList().push_back(block);
  builder.SetInsertPoint(block);
  return block;
}

// Adds the current top of the value stack to the target's results, according to the target's signature. Branches to a
// loop carry no values.
WJ_ERROR Compiler::AddBranch(Block& target)
{
  if(target.op == OP_loop || target.sig == TE_void)
    return ERR_SUCCESS;

  llvmVal* value;
  WJ_ERROR err = PopType(target.sig, value, true);
  if(err >= 0)
    target.results.push_back({ value, builder.GetInsertBlock() });
  return err;
}

// Pops a label off the control stack, verifying that the value stack matches the signature and building PHI nodes as
// necessary
WJ_ERROR Compiler::PopLabel(BB* block, llvmVal* push)
{
  Block& target = control.Peek();
  if(target.sig != TE_void)
  {
    // If there are results from other branches, perform a PHI merge. Otherwise, leave the value stack alone
    if(!target.results.empty())
    {
      llvm::PHINode* phi =
        builder.CreatePHI(push->getType(), static_cast<unsigned int>(target.results.size() + 1), "phi");
      phi->addIncoming(push, block);

      for(auto& r : target.results)
        phi->addIncoming(r.first, r.second);

      push = phi;
    }
  }
  else if(!target.results.empty())
    return LogErrorString(env, "%s: Signature has 0 results but control stack results aren't empty.",
                          ERR_INVALID_VALUE_STACK);

  if(values.Size() > 0 && !values.Peek()) // Pop at most 1 polymorphic type off the stack.
    values.Pop();
  if(values.Size() > 0) // value stack should be completely empty now
    return LogErrorString(env, "%s: Value stack should be empty but has %zu values.", ERR_INVALID_VALUE_STACK,
                          values.Size());

  values.SetLimit(target.limit);
  control.Pop();

  if(push != nullptr)
    PushReturn(push);

  return ERR_SUCCESS;
}

void Compiler::PolymorphicStack()
{
  while(values.Size() > 0)
    values.Pop();
  values.Push(nullptr);
  BB* graveyard = BB::Create(ctx, "graveyard", builder.GetInsertBlock()->getParent());
  builder.SetInsertPoint(graveyard);
}

WJ_ERROR Compiler::InsertConditionalTrap(llvmVal* cond, WJ_ERROR trap)
{
  // Define a failure block that all errors jump to via a conditional branch which simply traps
  auto trapblock = BB::Create(ctx, "trap_block", builder.GetInsertBlock()->getParent());
  auto contblock = BB::Create(ctx, "trap_continue", builder.GetInsertBlock()->getParent());

  builder.CreateCondBr(cond, trapblock, contblock);
  builder.SetInsertPoint(trapblock);
  CompileTrap(trap);

  builder.SetInsertPoint(contblock);
  return ERR_SUCCESS;
}

llvmVal* Compiler::GetMemSize()
{
  llvm::Constant* data = GetAddress(linkage.memories[0]->GetData(), memoryty);
  return builder.CreateLoad(builder.getInt64Ty(), builder.CreateStructGEP(memoryty, data, 1), "mem_size");
}

llvmVal* Compiler::GetMemPointer(llvmVal* base, llvmTy* ty, varuint32 offset)
{
  uint64_t bytes = ty->getPrimitiveSizeInBits() / 8;

  // Both the base and the offset are 32-bit, so the 64-bit sum can't overflow
  llvmVal* loc = builder.CreateAdd(builder.CreateZExt(base, builder.getInt64Ty()), builder.getInt64(offset), "", true, true);

  if(env.flags & ENV_CHECK_MEMORY_ACCESS) // In strict mode, generate a check that traps if this is an invalid memory access
    InsertConditionalTrap(builder.CreateICmpUGT(builder.CreateAdd(loc, builder.getInt64(bytes), "", true, true),
                                                GetMemSize(), "bounds_check_cond"),
                          ERR_TRAP_OUT_OF_BOUNDS_MEMORY_ACCESS);

  llvm::Constant* data = GetAddress(linkage.memories[0]->GetData(), memoryty);
  llvmVal* start       = builder.CreateLoad(builder.getInt8PtrTy(), builder.CreateStructGEP(memoryty, data, 0), "mem_base");
  llvmVal* ptr         = builder.CreateInBoundsGEP(builder.getInt8Ty(), start, loc);
  return builder.CreatePointerCast(ptr, ty->getPointerTo(0));
}

void Compiler::DumpCompilerState()
{
  (*env.loghook)(&env, "values: [");

  size_t total = values.Size() + values.Limit();
  for(size_t i = total; i-- > 0;)
  {
    if(i + 1 == values.Size())
      (*env.loghook)(&env, " |");
    if(!values[i])
      (*env.loghook)(&env, " Poly");
    else
      switch(GetTypeEncoding(values[i]->getType()))
      {
      case TE_i32: (*env.loghook)(&env, " i32"); break;
      case TE_i64: (*env.loghook)(&env, " i64"); break;
      case TE_f32: (*env.loghook)(&env, " f32"); break;
      case TE_f64: (*env.loghook)(&env, " f64"); break;
      default: (*env.loghook)(&env, " ?"); break;
      }
  }

  (*env.loghook)(&env, " ]\n");
  (*env.loghook)(&env, "control: [");

  for(size_t i = control.Size(); i-- > 0;)
  {
    switch(control[i].sig)
    {
    case TE_i32: (*env.loghook)(&env, " i32"); break;
    case TE_i64: (*env.loghook)(&env, " i64"); break;
    case TE_f32: (*env.loghook)(&env, " f32"); break;
    case TE_f64: (*env.loghook)(&env, " f64"); break;
    default: (*env.loghook)(&env, " void"); break;
    }

    (*env.loghook)(&env, ":%i", (int)control[i].op);
  }

  (*env.loghook)(&env, " ]\n\n");
}

llvm::Value* Compiler::GetLocal(varuint32 index) { return (index < locals.size()) ? locals[index] : nullptr; }

llvmVal* Compiler::GetGlobalSlot(varuint32 index)
{
  return GetAddress(linkage.globals[index]->GetSlot(), builder.getInt64Ty());
}

// Calls anything reachable through a FunctionEntry: host functions, imported functions and table slots.
llvmVal* Compiler::CallThunk(llvmVal* invoke, llvmVal* closure, const FunctionType& sig, llvm::ArrayRef<llvmVal*> args)
{
  auto argv   = CreateEntryAlloca(builder.getInt64Ty(), std::max<unsigned int>(1, static_cast<unsigned int>(args.size())),
                                "thunk_args");
  auto result = CreateEntryAlloca(builder.getInt64Ty(), 1, "thunk_result");

  for(size_t i = 0; i < args.size(); ++i)
    builder.CreateStore(ToSlot(args[i]),
                        builder.CreateInBoundsGEP(builder.getInt64Ty(), argv, builder.getInt32(static_cast<uint32_t>(i))));

  builder.CreateCall(thunkty, invoke, { closure, argv, result });

  if(sig.returns.empty())
    return nullptr;
  return FromSlot(builder.CreateLoad(builder.getInt64Ty(), result), sig.returns[0]);
}

Func* Compiler::CompileFunction(const FunctionType& signature, const llvm::Twine& name)
{
  Func* fn = Func::Create(GetFunctionType(signature),
                          ((env.flags & ENV_DEBUG) ? Func::ExternalLinkage : Func::InternalLinkage), name, mod);
  fn->setCallingConv(InternalConvention);
  return fn;
}

// Wraps a function in the generic thunk signature so the host, tables and other instances can call it without knowing
// its native signature.
Func* Compiler::CompileThunk(Func* fn, const FunctionType& signature, const llvm::Twine& name)
{
  Func* thunk = Func::Create(thunkty, Func::ExternalLinkage, name, mod);
  builder.SetInsertPoint(BB::Create(ctx, "entry", thunk));

  auto arg = thunk->arg_begin();
  ++arg; // closure is unused, compiled functions carry no state
  llvmVal* argv   = &*arg++;
  llvmVal* result = &*arg;

  std::vector<llvmVal*> params;
  for(size_t i = 0; i < signature.params.size(); ++i)
  {
    llvmVal* slot = builder.CreateLoad(
      builder.getInt64Ty(), builder.CreateInBoundsGEP(builder.getInt64Ty(), argv, builder.getInt32(static_cast<uint32_t>(i))));
    params.push_back(FromSlot(slot, signature.params[i]));
  }

  llvm::CallInst* call = builder.CreateCall(fn, params);
  call->setCallingConv(fn->getCallingConv());

  if(!signature.returns.empty())
    builder.CreateStore(ToSlot(call), result);

  builder.CreateRetVoid();
  return thunk;
}

WJ_ERROR Compiler::CompileModule()
{
  for(auto& type : m.type.functypes)
    sigids.push_back(internal::GetSignatureId(type));

  fn_trap =
    Func::Create(FuncTy::get(builder.getVoidTy(), { builder.getInt32Ty() }, false), Func::ExternalLinkage, "_wasmjit_trap", mod);
  fn_trap->setDoesNotReturn();
  fn_memgrow = Func::Create(FuncTy::get(builder.getInt32Ty(), { builder.getInt8PtrTy(), builder.getInt32Ty() }, false),
                            Func::ExternalLinkage, "_wasmjit_memory_grow", mod);
  fn_enter   = Func::Create(FuncTy::get(builder.getVoidTy(), { builder.getInt32Ty() }, false), Func::ExternalLinkage,
                          "_wasmjit_enter", mod);
  fn_leave   = Func::Create(FuncTy::get(builder.getVoidTy(), false), Func::ExternalLinkage, "_wasmjit_leave", mod);

  // Declare every local function first so calls can reference functions defined later in the module
  for(size_t i = 0; i < m.function.funcdecl.size(); ++i)
  {
    varuint32 index = m.importsection.functions + static_cast<varuint32>(i);
    auto& sig       = m.type.functypes[m.function.funcdecl[i].type_index];
    functions.push_back(CompileFunction(sig, FunctionName(index)));
  }

  for(size_t i = 0; i < functions.size(); ++i)
  {
    varuint32 index = m.importsection.functions + static_cast<varuint32>(i);
    current         = functions[i];
    thunks.push_back(CompileThunk(functions[i], m.type.functypes[m.function.funcdecl[i].type_index], InvokeName(index)));
  }

  for(size_t i = 0; i < functions.size(); ++i)
  {
    WJ_ERROR err =
      CompileFunctionBody(functions[i], m.type.functypes[m.function.funcdecl[i].type_index], m.code.funcbody[i]);
    if(err < 0)
      return err;
  }

  current = nullptr;
  return ERR_SUCCESS;
}
