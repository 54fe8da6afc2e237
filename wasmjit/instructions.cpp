// Copyright (c)2021 Fundament Software
// For conditions of distribution and use, see copyright notice in wasmjit.h

#include "llvm.h"
#include "compile.h"
#include "link.h"
#include "util.h"
#include <limits>

using namespace wasmjit;
using namespace utility;
using Func    = llvm::Function;
using FuncTy  = llvm::FunctionType;
using llvmTy  = llvm::Type;
using llvmVal = llvm::Value;
using BB      = llvm::BasicBlock;
using CInt    = llvm::ConstantInt;
using llvm::CallInst;
using llvm::ConstantFP;

// Given a pointer to the appropriate builder function, pops two binary arguments off the stack and pushes the result
template<WASM_TYPE_ENCODING Ty1, WASM_TYPE_ENCODING Ty2, WASM_TYPE_ENCODING TyR, typename... Args>
WJ_ERROR Compiler::CompileBinaryOp(llvmVal* (llvm::IRBuilderBase::*op)(llvmVal*, llvmVal*, Args...), Args... args)
{
  WJ_ERROR err;

  // Pop in reverse order
  llvmVal *val2, *val1;
  if((err = PopType(Ty2, val2)) < 0)
    return err;
  if((err = PopType(Ty1, val1)) < 0)
    return err;

  return PushReturn((builder.*op)(val1, val2, args...));
}

// Given an intrinsic function ID, pops two binary arguments off the stack and pushes the result
template<WASM_TYPE_ENCODING Ty1, WASM_TYPE_ENCODING Ty2, WASM_TYPE_ENCODING TyR>
WJ_ERROR Compiler::CompileBinaryIntrinsic(llvm::Intrinsic::ID id, const llvm::Twine& name)
{
  WJ_ERROR err;

  // Pop in reverse order
  llvmVal *val2, *val1;
  if((err = PopType(Ty2, val2)) < 0)
    return err;
  if((err = PopType(Ty1, val1)) < 0)
    return err;

  return PushReturn(builder.CreateBinaryIntrinsic(id, val1, val2, nullptr, name));
}

// Given a function pointer to the appropriate builder function, pops one unary argument off the stack and pushes the
// result
template<WASM_TYPE_ENCODING Ty1, WASM_TYPE_ENCODING TyR, typename... Args>
WJ_ERROR Compiler::CompileUnaryOp(llvmVal* (llvm::IRBuilderBase::*op)(llvmVal*, Args...), Args... args)
{
  WJ_ERROR err;

  llvmVal* val1;
  if((err = PopType(Ty1, val1)) < 0)
    return err;

  return PushReturn((builder.*op)(val1, args...));
}

// Given an intrinsic function ID, pops one unary argument off the stack and pushes the result
template<WASM_TYPE_ENCODING Ty1, WASM_TYPE_ENCODING TyR, typename... Args>
WJ_ERROR Compiler::CompileUnaryIntrinsic(llvm::Intrinsic::ID id, const llvm::Twine& name, Args... args)
{
  WJ_ERROR err;

  llvmVal* val1;
  if((err = PopType(Ty1, val1)) < 0)
    return err;

  llvmVal* operands[sizeof...(Args) + 1] = { val1, args... };

  Func* fn = llvm::Intrinsic::getDeclaration(mod, id, { val1->getType() });

  return PushReturn(builder.CreateCall(fn, operands, name));
}

WJ_ERROR Compiler::CompileSelectOp(const llvm::Twine& name)
{
  WJ_ERROR err;

  // Pop in reverse order
  llvmVal *cond, *valf, *valt;
  if((err = PopType(TE_i32, cond)) < 0)
    return err;

  if(!values.Size())
    return LogErrorString(env, "%s: can't pop value from empty stack", ERR_INVALID_VALUE_STACK);
  if(!values.Peek()) // If a polymorphic type is on the stack, the result is a polymorphic type, so just do nothing
    return ERR_SUCCESS;

  valf = values.Pop();

  if((err = PopType(GetTypeEncoding(valf->getType()), valt)) < 0)
    return err;

  return PushReturn(builder.CreateSelect(builder.CreateICmpNE(cond, builder.getInt32(0)), valt, valf, name));
}

// Rotations are funnel shifts of a value with itself, which wrap the count for us and are well defined for a count of 0
template<WASM_TYPE_ENCODING TYPE> WJ_ERROR Compiler::CompileRotationOp(llvm::Intrinsic::ID id, const char* name)
{
  WJ_ERROR err;

  // Pop in reverse order
  llvmVal *count, *value;
  if((err = PopType(TYPE, count)) < 0)
    return err;
  if((err = PopType(TYPE, value)) < 0)
    return err;

  Func* fn = llvm::Intrinsic::getDeclaration(mod, id, { value->getType() });
  return PushReturn(builder.CreateCall(fn, { value, value, count }, name));
}

// BinaryOp for shift functions which has to apply a shift mask to one operand
template<WASM_TYPE_ENCODING Ty1, WASM_TYPE_ENCODING Ty2, WASM_TYPE_ENCODING TyR, typename... Args>
WJ_ERROR Compiler::CompileBinaryShiftOp(llvmVal* (llvm::IRBuilderBase::*op)(llvmVal*, llvmVal*, Args...), Args... args)
{
  WJ_ERROR err;

  // Pop in reverse order
  llvmVal *val2, *val1;
  if((err = PopType(Ty2, val2)) < 0)
    return err;
  if((err = PopType(Ty1, val1)) < 0)
    return err;

  return PushReturn((builder.*op)(val1, MaskShiftBits(val2), args...));
}

template<WASM_TYPE_ENCODING Ty1, WASM_TYPE_ENCODING Ty2, WASM_TYPE_ENCODING TyR>
WJ_ERROR Compiler::CompileSRem(const llvm::Twine& name)
{
  WJ_ERROR err;

  // Pop in reverse order
  llvmVal *val2, *val1;
  if((err = PopType(Ty2, val2)) < 0)
    return err;
  if((err = PopType(Ty1, val1)) < 0)
    return err;

  if(env.flags & ENV_CHECK_INT_DIVISION)
    InsertConditionalTrap(builder.CreateICmpEQ(val2, CInt::get(val2->getType(), 0, true)), ERR_TRAP_DIVIDE_BY_ZERO);

  // The specific case of INT_MIN % -1 is undefined behavior in LLVM and crashes on x86, but WASM requires that it return
  // 0, so we branch on that specific case.
  llvmVal* cond = builder.CreateAnd(builder.CreateICmpEQ(val1, (val1->getType()->getIntegerBitWidth() == 32) ?
                                                                 builder.getInt32(0x80000000) :
                                                                 builder.getInt64(0x8000000000000000)),
                                    builder.CreateICmpEQ(val2, CInt::get(val2->getType(), ~0ULL, true)));
  return PushReturn(builder.CreateSRem(builder.CreateSelect(cond, CInt::get(val1->getType(), 0, true), val1), val2, name));
}

// Division traps on a zero divisor, and signed division also traps on INT_MIN / -1
template<WASM_TYPE_ENCODING Ty1, WASM_TYPE_ENCODING Ty2, WASM_TYPE_ENCODING TyR, typename... Args>
WJ_ERROR Compiler::CompileDiv(bool overflow, llvmVal* (llvm::IRBuilderBase::*op)(llvmVal*, llvmVal*, Args...), Args... args)
{
  WJ_ERROR err;

  // Pop in reverse order
  llvmVal *val2, *val1;
  if((err = PopType(Ty2, val2)) < 0)
    return err;
  if((err = PopType(Ty1, val1)) < 0)
    return err;

  if(env.flags & ENV_CHECK_INT_DIVISION)
  {
    InsertConditionalTrap(builder.CreateICmpEQ(val2, CInt::get(val2->getType(), 0, true)), ERR_TRAP_DIVIDE_BY_ZERO);

    if(overflow)
      InsertConditionalTrap(builder.CreateAnd(builder.CreateICmpEQ(val1, (val1->getType()->getIntegerBitWidth() == 32) ?
                                                                           builder.getInt32(0x80000000) :
                                                                           builder.getInt64(0x8000000000000000)),
                                              builder.CreateICmpEQ(val2, CInt::get(val2->getType(), ~0ULL, true))),
                            ERR_TRAP_INTEGER_OVERFLOW);
  }

  return PushReturn((builder.*op)(val1, val2, args...));
}

template<WASM_TYPE_ENCODING Ty1, WASM_TYPE_ENCODING Ty2, WASM_TYPE_ENCODING TyR>
WJ_ERROR Compiler::CompileFloatCmp(llvm::Intrinsic::ID id, bool min, const llvm::Twine& name)
{
  WJ_ERROR err;

  // Pop in reverse order
  llvmVal *val2, *val1;
  if((err = PopType(Ty2, val2)) < 0)
    return err;
  if((err = PopType(Ty1, val1)) < 0)
    return err;

  llvmTy* ity = builder.getIntNTy(val1->getType()->getPrimitiveSizeInBits());

  // minnum and maxnum may pick either zero when comparing -0 and +0, but WASM requires min(-0, +0) = -0 and
  // max(-0, +0) = +0. Merging the sign bits of two equal values produces the right zero and leaves any other value alone.
  llvmVal* bits1  = builder.CreateBitCast(val1, ity);
  llvmVal* bits2  = builder.CreateBitCast(val2, ity);
  llvmVal* merged = builder.CreateBitCast(min ? builder.CreateOr(bits1, bits2) : builder.CreateAnd(bits1, bits2),
                                          val1->getType());

  auto compare  = builder.CreateBinaryIntrinsic(id, val1, val2, nullptr, name);
  auto result   = builder.CreateSelect(builder.CreateFCmpOEQ(val1, val2), merged, compare);
  auto nancheck = builder.CreateFCmpUNO(val1, val2); // WASM requires we return an NaN if either operand is NaN
  return PushReturn(builder.CreateSelect(nancheck, llvm::ConstantFP::getNaN(val1->getType()), result));
}

template<bool SIGNED> WJ_ERROR Compiler::CompileLoad(varuint32 offset, const char* name, llvmTy* ext, llvmTy* ty)
{
  if(linkage.memories.empty())
    return LogErrorString(env, "%s: module has no linear memory to load from", ERR_INVALID_MEMORY_INDEX);

  llvmVal* base;
  WJ_ERROR err;
  if((err = PopType(TE_i32, base)) < 0)
    return err;

  // The alignment immediate is only a hint, so every access is emitted as unaligned
  auto memptr     = GetMemPointer(base, ty, offset);
  llvmVal* result = builder.CreateAlignedLoad(ty, memptr, llvm::Align(1), false, name);

  if(ext != nullptr)
    result = SIGNED ? builder.CreateSExt(result, ext) : builder.CreateZExt(result, ext);

  return PushReturn(result);
}

template<WASM_TYPE_ENCODING TY>
WJ_ERROR Compiler::CompileStore(varuint32 offset, const char* name, llvm::IntegerType* ext)
{
  if(linkage.memories.empty())
    return LogErrorString(env, "%s: module has no linear memory to store to", ERR_INVALID_MEMORY_INDEX);

  WJ_ERROR err;
  llvmVal *value, *base;
  if((err = PopType(TY, value)) < 0)
    return err;
  if((err = PopType(TE_i32, base)) < 0)
    return err;

  llvmTy* PtrType = !ext ? GetLLVMType(TY) : ext;

  llvmVal* ptr = GetMemPointer(base, PtrType, offset);
  builder.CreateAlignedStore(!ext ? value : builder.CreateTrunc(value, ext, name), ptr, llvm::Align(1), false);

  return ERR_SUCCESS;
}

WJ_ERROR Compiler::CompileIfBlock(varsint7 sig)
{
  WJ_ERROR err;
  llvmVal* cond;

  if((err = PopType(TE_i32, cond)) < 0)
    return err;

  llvmVal* cmp = builder.CreateICmpNE(cond, builder.getInt32(0), "if_cond");

  Func* parent          = builder.GetInsertBlock()->getParent();
  BB* tblock            = BB::Create(ctx, "if_true", parent);
  BB* fblock            = BB::Create(ctx, "if_else", parent); // Create else stub
  PushLabel("if_end", sig, OP_if, nullptr);
  control.Peek().ifelse = fblock;

  builder.CreateCondBr(cmp, tblock, fblock); // Insert branch in current block
  builder.SetInsertPoint(tblock);            // Start inserting code into true block
  return ERR_SUCCESS;
}

WJ_ERROR Compiler::CompileElseBlock()
{
  if(control.Size() == 0 || control.Peek().op != OP_if)
    return LogErrorString(env, "%s: expected matching op to be OP_if but found %hhu", ERR_IF_ELSE_MISMATCH,
                          control.Size() ? control.Peek().op : 0);

  builder.CreateBr(control.Peek().block); // Add a branch-to-merge instruction to our if_true block

  // Instead of popping and pushing a new control label, we just re-purpose the existing one. This preserves the value
  // stack results.
  if(control.Peek().sig != TE_void)
  {
    WJ_ERROR err;
    llvmVal* value;
    if((err = PopType(control.Peek().sig, value)) < 0)
      return err;
    control.Peek().results.push_back({ value, builder.GetInsertBlock() });
  }

  // Reset the value stack, any polymorphic marker belongs to the true branch
  while(values.Size() > 0)
    values.Pop();

  control.Peek().op = OP_else;               // make this block an OP_else block
  BB* fblock        = control.Peek().ifelse; // Get stored else block
  fblock->removeFromParent();                // Required for correct label binding behavior
  BindLabel(fblock);                         // Bind if_false block to current position

  return ERR_SUCCESS;
}

WJ_ERROR Compiler::CompileReturn(varsint7 sig)
{
  llvmVal* val;
  WJ_ERROR err = PopType(sig, val);
  if(err < 0)
    return err;

  if(env.flags & ENV_CHECK_STACK_OVERFLOW)
    builder.CreateCall(fn_leave);

  if(!val)
    builder.CreateRetVoid();
  else
    builder.CreateRet(val);

  return ERR_SUCCESS;
}

WJ_ERROR Compiler::CompileEndBlock()
{
  llvmVal* push;
  WJ_ERROR err = PopType(control.Peek().sig, push);
  if(err < 0)
    return err;

  BB* cur = builder.GetInsertBlock();
  if(control.Peek().block->getParent() != nullptr) // If the label wasn't bound, branch to the new one we create
  {
    BB* block = BindLabel(control.Peek().block);
    builder.SetInsertPoint(cur);
    builder.CreateBr(block);
    builder.SetInsertPoint(block);
  }
  else
  {
    builder.CreateBr(control.Peek().block);
    BindLabel(control.Peek().block);
  }

  auto op  = control.Peek().op;
  auto sig = control.Peek().sig;
  switch(op) // Verify source operation
  {
  case OP_if:
    if(sig != TE_void)
      return LogErrorString(env, "%s: An if block that produces a value must have an else branch.", ERR_IF_ELSE_MISMATCH);
    {
      BB* prev = builder.GetInsertBlock();
      builder.SetInsertPoint(control.Peek().ifelse); // An if without an else falls straight through to the end
      builder.CreateBr(control.Peek().block);
      builder.SetInsertPoint(prev);
    }
  case OP_else:
  case OP_block:
  case OP_loop:
  case OP_return: break;
  default:
    return LogErrorString(env, "%s: An end operator must end a block instruction, but found %hhu", ERR_END_MISMATCH, op);
  }

  err = PopLabel(cur, push); // Pop the label to assemble the phi node before pushing it.
  if(err >= 0 && op == OP_return)
    err = CompileReturn(sig);

  return err;
}

void Compiler::CompileTrap(WJ_ERROR trap)
{
  auto call = builder.CreateCall(fn_trap, { builder.getInt32(static_cast<uint32_t>(trap)) });
  call->setDoesNotReturn();
  builder.CreateUnreachable();
}

WJ_ERROR Compiler::CompileBranch(varuint32 depth)
{
  if(depth >= control.Size())
    return LogErrorString(env, "%s: Depth of %u greater than control stack size of %zu", ERR_INVALID_BRANCH_DEPTH, depth,
                          control.Size());

  Block& target = control[depth];

  WJ_ERROR err = AddBranch(target);
  builder.CreateBr(target.block); // Create branch AFTER AddBranch because AddBranch can emit code.
  PolymorphicStack();
  return err;
}

WJ_ERROR Compiler::CompileIfBranch(varuint32 depth)
{
  if(depth >= control.Size())
    return LogErrorString(env, "%s: Depth of %u greater than control stack size of %zu", ERR_INVALID_BRANCH_DEPTH, depth,
                          control.Size());

  WJ_ERROR err;
  llvmVal* cond;
  if((err = PopType(TE_i32, cond)) < 0)
    return err;

  llvmVal* cmp = builder.CreateICmpNE(cond, builder.getInt32(0), "br_if_cond");

  // Because llvm requires explicit branches, we have to create a new block and append it to our current one
  BB* block = BB::Create(ctx, "br_if_cont", builder.GetInsertBlock()->getParent());

  Block& target = control[depth];
  if((err = AddBranch(target)) < 0)
    return err;
  builder.CreateCondBr(cmp, target.block, block);

  // Start inserting code into continuation AFTER we add the branch, so the branch goes to the right place
  builder.SetInsertPoint(block);
  return ERR_SUCCESS;
}

WJ_ERROR Compiler::CompileBranchTable(const std::vector<varuint32>& table, varuint32 def)
{
  WJ_ERROR err;
  llvmVal* index;
  if((err = PopType(TE_i32, index)) < 0)
    return err;

  if(def >= control.Size())
    return LogErrorString(env, "%s: Depth of %u greater than control stack size of %zu", ERR_INVALID_BRANCH_DEPTH, def,
                          control.Size());

  // Every switch edge needs its own phi entry, so a target listed twice gets two results
  err                 = AddBranch(control[def]);
  llvm::SwitchInst* s = builder.CreateSwitch(index, control[def].block, static_cast<unsigned int>(table.size()));

  for(size_t i = 0; i < table.size() && err >= 0; ++i)
  {
    if(table[i] >= control.Size())
      return LogErrorString(env, "%s: branch depth %u exceeds control stack size of %zu", ERR_INVALID_BRANCH_DEPTH,
                            table[i], control.Size());

    Block& target = control[table[i]];
    err           = AddBranch(target);
    s->addCase(builder.getInt32(static_cast<uint32_t>(i)), target.block);
  }

  PolymorphicStack();
  return err;
}

WJ_ERROR Compiler::CompileCall(varuint32 index)
{
  const FunctionType* sig = ModuleFunction(m, index);
  if(!sig)
    return LogErrorString(env, "%s: function index %u greater than total functions %u", ERR_INVALID_FUNCTION_INDEX,
                          index, ModuleFunctionCount(m));

  // Pop arguments in reverse order
  WJ_ERROR err;
  std::vector<llvmVal*> args(sig->params.size());
  for(size_t i = args.size(); i-- > 0;)
  {
    if((err = PopType(sig->params[i], args[i])) < 0)
      return err;
  }

  llvmVal* result = nullptr;
  if(index < m.importsection.functions)
  {
    // Imports are already resolved, so we call through the bound function's entry directly
    llvm::Constant* entry = GetAddress(&linkage.imports[index]->Entry(), entryty);
    llvmVal* invoke = builder.CreateLoad(thunkty->getPointerTo(), builder.CreateStructGEP(entryty, entry, 0), "import_invoke");
    llvmVal* closure = builder.CreateLoad(builder.getInt8PtrTy(), builder.CreateStructGEP(entryty, entry, 1), "import_closure");
    result           = CallThunk(invoke, closure, *sig, args);
  }
  else
  {
    Func* fn       = functions[index - m.importsection.functions];
    CallInst* call = builder.CreateCall(fn, args);
    call->setCallingConv(fn->getCallingConv());
    if(!sig->returns.empty())
      result = call;
  }

  if(result != nullptr) // Only push a value if there is one to push
    return PushReturn(result);
  return ERR_SUCCESS;
}

WJ_ERROR Compiler::CompileIndirectCall(varuint32 index)
{
  if(index >= m.type.functypes.size())
    return LogErrorString(env, "%s: Type index %u exceeds number of types %zu", ERR_INVALID_TYPE_INDEX, index,
                          m.type.functypes.size());
  if(linkage.tables.empty())
    return LogErrorString(env, "%s: module has no table to call through", ERR_INVALID_TABLE_INDEX);

  WJ_ERROR err;
  const FunctionType& ftype = m.type.functypes[index];
  llvmVal* callee;
  if((err = PopType(TE_i32, callee)) < 0)
    return err;

  // Pop arguments in reverse order
  std::vector<llvmVal*> args(ftype.params.size());
  for(size_t i = args.size(); i-- > 0;)
  {
    if((err = PopType(ftype.params[i], args[i])) < 0)
      return err;
  }

  // The table can grow or be rebound between calls, so the entry array and its size are reloaded every time
  llvm::Constant* table = GetAddress(linkage.tables[0]->GetData(), tablety);
  llvmVal* entries =
    builder.CreateLoad(entryty->getPointerTo(), builder.CreateStructGEP(tablety, table, 0), "indirect_call_entries");
  llvmVal* offset = builder.CreateZExt(callee, builder.getInt64Ty());

  if(env.flags & ENV_CHECK_INDIRECT_CALL) // In strict mode, trap if index is out of bounds
  {
    llvmVal* size = builder.CreateLoad(builder.getInt64Ty(), builder.CreateStructGEP(tablety, table, 1), "indirect_call_size");
    InsertConditionalTrap(builder.CreateICmpUGE(offset, size, "indirect_call_oob_check"),
                          ERR_TRAP_OUT_OF_BOUNDS_TABLE_ACCESS);
  }

  llvmVal* entry   = builder.CreateInBoundsGEP(entryty, entries, offset);
  llvmVal* funcptr = builder.CreateLoad(thunkty->getPointerTo(), builder.CreateStructGEP(entryty, entry, 0),
                                        "indirect_call_load_func_ptr");

  if(env.flags & ENV_CHECK_INDIRECT_CALL)
  {
    // Trap if the slot is empty
    InsertConditionalTrap(builder.CreateICmpEQ(funcptr, llvm::ConstantPointerNull::get(thunkty->getPointerTo()),
                                               "indirect_call_null_check"),
                          ERR_TRAP_UNINITIALIZED_TABLE_ENTRY);

    // Trap if the expected type does not match the actual type of the function
    llvmVal* sig = builder.CreateLoad(builder.getInt64Ty(), builder.CreateStructGEP(entryty, entry, 2));
    InsertConditionalTrap(builder.CreateICmpNE(sig, builder.getInt64(sigids[index]), "indirect_call_sig_check"),
                          ERR_TRAP_INDIRECT_CALL_TYPE_MISMATCH);
  }

  llvmVal* closure = builder.CreateLoad(builder.getInt8PtrTy(), builder.CreateStructGEP(entryty, entry, 1));
  llvmVal* result  = CallThunk(funcptr, closure, ftype, args);

  if(result != nullptr) // Only push a value if there is one to push
    return PushReturn(result);
  return ERR_SUCCESS;
}

WJ_ERROR Compiler::CompileConstant(const Instruction& instruction, llvm::Constant*& constant)
{
  switch(instruction.opcode[0])
  {
  case OP_i32_const: // While we interpret this as unsigned, it is cast to a signed int.
    constant = CInt::get(ctx, llvm::APInt(32, instruction.immediates[0]._varuint32, true));
    break;
  case OP_i64_const: constant = CInt::get(ctx, llvm::APInt(64, instruction.immediates[0]._varuint64, true)); break;
  case OP_f32_const: constant = ConstantFP::get(ctx, llvm::APFloat(instruction.immediates[0]._float32)); break;
  case OP_f64_const: constant = ConstantFP::get(ctx, llvm::APFloat(instruction.immediates[0]._float64)); break;
  default:
    return LogErrorString(env, "%s: Invalid instruction %hhu", ERR_FATAL_INVALID_INITIALIZER, instruction.opcode[0]);
  }

  return ERR_SUCCESS;
}

WJ_ERROR Compiler::CompileMemGrow(const char* name)
{
  if(linkage.memories.empty())
    return LogErrorString(env, "%s: module has no linear memories, so the memgrow instruction is impossible.",
                          ERR_INVALID_MEMORY_INDEX);

  WJ_ERROR err;
  llvmVal* delta;
  if((err = PopType(TE_i32, delta)) < 0)
    return err;

  // Growing may move the memory, which is fine because every access reloads the base pointer
  CallInst* call =
    builder.CreateCall(fn_memgrow, { GetAddress(linkage.memories[0].get(), builder.getInt8Ty()), delta }, name);
  return PushReturn(call);
}

WJ_ERROR Compiler::CompileSignExtendOp(WASM_TYPE_ENCODING argTy, unsigned int valueBits, const char* name)
{
  WJ_ERROR err;

  llvmVal* value;
  if((err = PopType(argTy, value)) < 0)
    return err;

  auto dstTy   = value->getType();
  auto valueTy = builder.getIntNTy(valueBits);
  value        = builder.CreateTrunc(value, valueTy);
  value        = builder.CreateSExt(value, dstTy, name);

  return PushReturn(value);
}

// Converts a float to an integer. The bounds are the closest representable values just outside the integer range, so a
// value is convertible exactly when it lies strictly between them.
WJ_ERROR Compiler::CompileFPToInt(varsint7 from, varsint7 to, bool is_signed, bool saturating, const char* name)
{
  static const struct
  {
    double min, max;
  } FPTOINT_BOUNDS[8] = {
    { -2147483904.0, 2147483648.0 },                                 // f32 -> i32
    { -1.0, 4294967296.0 },                                          // f32 -> u32
    { -2147483649.0, 2147483648.0 },                                 // f64 -> i32
    { -1.0, 4294967296.0 },                                          // f64 -> u32
    { -9223373136366403584.0, 9223372036854775808.0 },               // f32 -> i64
    { -1.0, 18446744073709551616.0 },                                // f32 -> u64
    { -9223372036854777856.0, 9223372036854775808.0 },               // f64 -> i64
    { -1.0, 18446744073709551616.0 },                                // f64 -> u64
  };

  WJ_ERROR err;
  llvmVal* value;
  if((err = PopType(from, value)) < 0)
    return err;

  auto bounds = FPTOINT_BOUNDS[((to == TE_i64) ? 4 : 0) + ((from == TE_f64) ? 2 : 0) + (is_signed ? 0 : 1)];
  auto fTy    = GetLLVMType(from);
  auto iTy    = GetLLVMType(to);
  auto f_min  = ConstantFP::get(fTy, bounds.min);
  auto f_max  = ConstantFP::get(fTy, bounds.max);

  if(!saturating && (env.flags & ENV_CHECK_FLOAT_TRUNC))
    InsertConditionalTrap(builder.CreateOr(builder.CreateFCmpULE(value, f_min), builder.CreateFCmpUGE(value, f_max),
                                           "fptoint_range_check"),
                          ERR_TRAP_INTEGER_OVERFLOW);

  llvmVal* result = is_signed ? builder.CreateFPToSI(value, iTy, name) : builder.CreateFPToUI(value, iTy, name);

  if(!saturating)
    return PushReturn(result);

  unsigned int bits = iTy->getIntegerBitWidth();
  auto int_min      = is_signed ? CInt::get(ctx, llvm::APInt::getSignedMinValue(bits)) : CInt::get(iTy, 0);
  auto int_max      = is_signed ? CInt::get(ctx, llvm::APInt::getSignedMaxValue(bits)) :
                             CInt::get(ctx, llvm::APInt::getMaxValue(bits));

  result = builder.CreateSelect(builder.CreateFCmpOLE(value, f_min, "fptoint_sat.less"), int_min, result);
  result = builder.CreateSelect(builder.CreateFCmpOGE(value, f_max, "fptoint_sat.greater"), int_max, result);
  result = builder.CreateSelect(builder.CreateFCmpUNO(value, value, "fptoint_sat.nan"), CInt::get(iTy, 0), result);
  return PushReturn(result);
}

WJ_ERROR Compiler::CompileInstruction(const Instruction& ins)
{
  switch(ins.opcode[0])
  {
  case OP_unreachable:
    CompileTrap(ERR_TRAP_UNREACHABLE); // Automatically terminates block as unreachable
    PolymorphicStack();
    return ERR_SUCCESS;
  case OP_nop: return ERR_SUCCESS;
  case OP_block: PushLabel("block", ins.immediates[0]._varsint7, OP_block, nullptr); return ERR_SUCCESS;
  case OP_loop:
    PushLabel("loop", ins.immediates[0]._varsint7, OP_loop, nullptr);
    builder.CreateBr(control.Peek().block); // Branch into next block
    BindLabel(control.Peek().block);
    return ERR_SUCCESS;
  case OP_if: return CompileIfBlock(ins.immediates[0]._varsint7);
  case OP_else: return CompileElseBlock();
  case OP_end: return CompileEndBlock();
  case OP_br: return CompileBranch(ins.immediates[0]._varuint32);
  case OP_br_if: return CompileIfBranch(ins.immediates[0]._varuint32);
  case OP_br_table: return CompileBranchTable(ins.table, ins.immediates[0]._varuint32);
  case OP_return:
  {
    WJ_ERROR err = CompileReturn(control[control.Size() - 1].sig);
    PolymorphicStack();
    return err;
  }

  // Call operators
  case OP_call: return CompileCall(ins.immediates[0]._varuint32);
  case OP_call_indirect:
    return CompileIndirectCall(ins.immediates[0]._varuint32);

    // Parametric operators
  case OP_drop:
    if(values.Size() < 1)
      return LogErrorString(env, "%s: Can't drop anything because value stack is empty.", ERR_INVALID_VALUE_STACK);
    if(values.Peek() != nullptr)
      values.Pop(); // We do not delete the value because it could be referenced elsewhere (e.g. in a branch)
    return ERR_SUCCESS;
  case OP_select:
    return CompileSelectOp(OpName(ins));

    // Variable access
  case OP_local_get:
  {
    auto local = GetLocal(ins.immediates[0]._varuint32);
    if(!local)
      return LogErrorString(env, "%s: No local exists with index %u", ERR_INVALID_LOCAL_INDEX,
                            ins.immediates[0]._varuint32);
    return PushReturn(builder.CreateLoad(locals[ins.immediates[0]._varuint32]->getAllocatedType(), local));
  }
  case OP_local_set:
  case OP_local_tee:
  {
    auto local = GetLocal(ins.immediates[0]._varuint32);
    if(!local)
      return LogErrorString(env, "%s: No local exists with index %u", ERR_INVALID_LOCAL_INDEX,
                            ins.immediates[0]._varuint32);
    if(values.Size() < 1)
      return LogErrorString(env, "%s: Can't pop anything because the value stack is empty.", ERR_INVALID_VALUE_STACK);
    builder.CreateStore(!values.Peek() ?
                          llvm::Constant::getAllOnesValue(locals[ins.immediates[0]._varuint32]->getAllocatedType()) :
                          values.Peek(),
                        local, false);
    if(values.Peek() != nullptr &&
       ins.opcode[0] == OP_local_set) // tee_local is the same as set_local except the operand isn't popped
      values.Pop();
    return ERR_SUCCESS;
  }
  case OP_global_set:
  {
    const GlobalDesc* desc = ModuleGlobal(m, ins.immediates[0]._varuint32);
    if(!desc)
      return LogErrorString(env, "%s: global index %u exceeds number of globals %u", ERR_INVALID_GLOBAL_INDEX,
                            ins.immediates[0]._varuint32, ModuleGlobalCount(m));
    if(values.Size() < 1)
      return LogErrorString(env, "%s: Can't pop anything from an empty value stack.", ERR_INVALID_VALUE_STACK);
    llvmVal* value = !values.Peek() ? llvm::Constant::getAllOnesValue(GetLLVMType(desc->type)) : values.Pop();
    builder.CreateStore(ToSlot(value), GetGlobalSlot(ins.immediates[0]._varuint32), false);
    return ERR_SUCCESS;
  }
  case OP_global_get:
  {
    const GlobalDesc* desc = ModuleGlobal(m, ins.immediates[0]._varuint32);
    if(!desc)
      return LogErrorString(env, "%s: global index %u exceeds number of globals %u", ERR_INVALID_GLOBAL_INDEX,
                            ins.immediates[0]._varuint32, ModuleGlobalCount(m));
    return PushReturn(
      FromSlot(builder.CreateLoad(builder.getInt64Ty(), GetGlobalSlot(ins.immediates[0]._varuint32)), desc->type));
  }

    // Memory-related operators
  case OP_i32_load:
    return CompileLoad<false>(ins.immediates[1]._varuint32, OpName(ins), nullptr, builder.getInt32Ty());
  case OP_i64_load:
    return CompileLoad<false>(ins.immediates[1]._varuint32, OpName(ins), nullptr, builder.getInt64Ty());
  case OP_f32_load:
    return CompileLoad<false>(ins.immediates[1]._varuint32, OpName(ins), nullptr, builder.getFloatTy());
  case OP_f64_load:
    return CompileLoad<false>(ins.immediates[1]._varuint32, OpName(ins), nullptr, builder.getDoubleTy());
  case OP_i32_load8_s:
    return CompileLoad<true>(ins.immediates[1]._varuint32, OpName(ins), builder.getInt32Ty(), builder.getInt8Ty());
  case OP_i32_load8_u:
    return CompileLoad<false>(ins.immediates[1]._varuint32, OpName(ins), builder.getInt32Ty(), builder.getInt8Ty());
  case OP_i32_load16_s:
    return CompileLoad<true>(ins.immediates[1]._varuint32, OpName(ins), builder.getInt32Ty(), builder.getInt16Ty());
  case OP_i32_load16_u:
    return CompileLoad<false>(ins.immediates[1]._varuint32, OpName(ins), builder.getInt32Ty(), builder.getInt16Ty());
  case OP_i64_load8_s:
    return CompileLoad<true>(ins.immediates[1]._varuint32, OpName(ins), builder.getInt64Ty(), builder.getInt8Ty());
  case OP_i64_load8_u:
    return CompileLoad<false>(ins.immediates[1]._varuint32, OpName(ins), builder.getInt64Ty(), builder.getInt8Ty());
  case OP_i64_load16_s:
    return CompileLoad<true>(ins.immediates[1]._varuint32, OpName(ins), builder.getInt64Ty(), builder.getInt16Ty());
  case OP_i64_load16_u:
    return CompileLoad<false>(ins.immediates[1]._varuint32, OpName(ins), builder.getInt64Ty(), builder.getInt16Ty());
  case OP_i64_load32_s:
    return CompileLoad<true>(ins.immediates[1]._varuint32, OpName(ins), builder.getInt64Ty(), builder.getInt32Ty());
  case OP_i64_load32_u:
    return CompileLoad<false>(ins.immediates[1]._varuint32, OpName(ins), builder.getInt64Ty(), builder.getInt32Ty());
  case OP_i32_store: return CompileStore<TE_i32>(ins.immediates[1]._varuint32, OpName(ins), nullptr);
  case OP_i64_store: return CompileStore<TE_i64>(ins.immediates[1]._varuint32, OpName(ins), nullptr);
  case OP_f32_store: return CompileStore<TE_f32>(ins.immediates[1]._varuint32, OpName(ins), nullptr);
  case OP_f64_store: return CompileStore<TE_f64>(ins.immediates[1]._varuint32, OpName(ins), nullptr);
  case OP_i32_store8: return CompileStore<TE_i32>(ins.immediates[1]._varuint32, OpName(ins), builder.getInt8Ty());
  case OP_i32_store16: return CompileStore<TE_i32>(ins.immediates[1]._varuint32, OpName(ins), builder.getInt16Ty());
  case OP_i64_store8: return CompileStore<TE_i64>(ins.immediates[1]._varuint32, OpName(ins), builder.getInt8Ty());
  case OP_i64_store16: return CompileStore<TE_i64>(ins.immediates[1]._varuint32, OpName(ins), builder.getInt16Ty());
  case OP_i64_store32: return CompileStore<TE_i64>(ins.immediates[1]._varuint32, OpName(ins), builder.getInt32Ty());
  case OP_memory_size: // Memory size in pages, not bytes
    if(linkage.memories.empty())
      return LogErrorString(env, "%s: module has no linear memories.", ERR_INVALID_MEMORY_INDEX);
    return PushReturn(builder.CreateTrunc(builder.CreateLShr(GetMemSize(), 16), builder.getInt32Ty(), OpName(ins)));
  case OP_memory_grow:
    return CompileMemGrow(OpName(ins));

    // Constants
  case OP_i32_const: // While we interpret this as unsigned, it is cast to a signed int.
  case OP_i64_const:
  case OP_f32_const:
  case OP_f64_const:
  {
    llvm::Constant* constant;
    WJ_ERROR err = CompileConstant(ins, constant);
    if(err >= 0)
      PushReturn(constant);
    return err;
  }

  // Comparison operators
  case OP_i32_eqz: values.Push(builder.getInt32(0)); // Fallthrough to OP_i32_eq
  case OP_i32_eq:
    return CompileBinaryOp<TE_i32, TE_i32, TE_i32, const llvm::Twine&>(&llvm::IRBuilderBase::CreateICmpEQ, OpName(ins));
  case OP_i32_ne:
    return CompileBinaryOp<TE_i32, TE_i32, TE_i32, const llvm::Twine&>(&llvm::IRBuilderBase::CreateICmpNE, OpName(ins));
  case OP_i32_lt_s:
    return CompileBinaryOp<TE_i32, TE_i32, TE_i32, const llvm::Twine&>(&llvm::IRBuilderBase::CreateICmpSLT, OpName(ins));
  case OP_i32_lt_u:
    return CompileBinaryOp<TE_i32, TE_i32, TE_i32, const llvm::Twine&>(&llvm::IRBuilderBase::CreateICmpULT, OpName(ins));
  case OP_i32_gt_s:
    return CompileBinaryOp<TE_i32, TE_i32, TE_i32, const llvm::Twine&>(&llvm::IRBuilderBase::CreateICmpSGT, OpName(ins));
  case OP_i32_gt_u:
    return CompileBinaryOp<TE_i32, TE_i32, TE_i32, const llvm::Twine&>(&llvm::IRBuilderBase::CreateICmpUGT, OpName(ins));
  case OP_i32_le_s:
    return CompileBinaryOp<TE_i32, TE_i32, TE_i32, const llvm::Twine&>(&llvm::IRBuilderBase::CreateICmpSLE, OpName(ins));
  case OP_i32_le_u:
    return CompileBinaryOp<TE_i32, TE_i32, TE_i32, const llvm::Twine&>(&llvm::IRBuilderBase::CreateICmpULE, OpName(ins));
  case OP_i32_ge_s:
    return CompileBinaryOp<TE_i32, TE_i32, TE_i32, const llvm::Twine&>(&llvm::IRBuilderBase::CreateICmpSGE, OpName(ins));
  case OP_i32_ge_u:
    return CompileBinaryOp<TE_i32, TE_i32, TE_i32, const llvm::Twine&>(&llvm::IRBuilderBase::CreateICmpUGE, OpName(ins));
  case OP_i64_eqz: values.Push(builder.getInt64(0)); // Fallthrough to OP_i64_eq
  case OP_i64_eq:
    return CompileBinaryOp<TE_i64, TE_i64, TE_i32, const llvm::Twine&>(&llvm::IRBuilderBase::CreateICmpEQ, OpName(ins));
  case OP_i64_ne:
    return CompileBinaryOp<TE_i64, TE_i64, TE_i32, const llvm::Twine&>(&llvm::IRBuilderBase::CreateICmpNE, OpName(ins));
  case OP_i64_lt_s:
    return CompileBinaryOp<TE_i64, TE_i64, TE_i32, const llvm::Twine&>(&llvm::IRBuilderBase::CreateICmpSLT, OpName(ins));
  case OP_i64_lt_u:
    return CompileBinaryOp<TE_i64, TE_i64, TE_i32, const llvm::Twine&>(&llvm::IRBuilderBase::CreateICmpULT, OpName(ins));
  case OP_i64_gt_s:
    return CompileBinaryOp<TE_i64, TE_i64, TE_i32, const llvm::Twine&>(&llvm::IRBuilderBase::CreateICmpSGT, OpName(ins));
  case OP_i64_gt_u:
    return CompileBinaryOp<TE_i64, TE_i64, TE_i32, const llvm::Twine&>(&llvm::IRBuilderBase::CreateICmpUGT, OpName(ins));
  case OP_i64_le_s:
    return CompileBinaryOp<TE_i64, TE_i64, TE_i32, const llvm::Twine&>(&llvm::IRBuilderBase::CreateICmpSLE, OpName(ins));
  case OP_i64_le_u:
    return CompileBinaryOp<TE_i64, TE_i64, TE_i32, const llvm::Twine&>(&llvm::IRBuilderBase::CreateICmpULE, OpName(ins));
  case OP_i64_ge_s:
    return CompileBinaryOp<TE_i64, TE_i64, TE_i32, const llvm::Twine&>(&llvm::IRBuilderBase::CreateICmpSGE, OpName(ins));
  case OP_i64_ge_u:
    return CompileBinaryOp<TE_i64, TE_i64, TE_i32, const llvm::Twine&>(&llvm::IRBuilderBase::CreateICmpUGE, OpName(ins));
  case OP_f32_eq:
    return CompileBinaryOp<TE_f32, TE_f32, TE_i32, const llvm::Twine&, llvm::MDNode*>(&llvm::IRBuilderBase::CreateFCmpOEQ,
                                                                                      OpName(ins), nullptr);
  case OP_f32_ne:
    return CompileBinaryOp<TE_f32, TE_f32, TE_i32, const llvm::Twine&, llvm::MDNode*>(&llvm::IRBuilderBase::CreateFCmpUNE,
                                                                                      OpName(ins), nullptr);
  case OP_f32_lt:
    return CompileBinaryOp<TE_f32, TE_f32, TE_i32, const llvm::Twine&, llvm::MDNode*>(&llvm::IRBuilderBase::CreateFCmpOLT,
                                                                                      OpName(ins), nullptr);
  case OP_f32_gt:
    return CompileBinaryOp<TE_f32, TE_f32, TE_i32, const llvm::Twine&, llvm::MDNode*>(&llvm::IRBuilderBase::CreateFCmpOGT,
                                                                                      OpName(ins), nullptr);
  case OP_f32_le:
    return CompileBinaryOp<TE_f32, TE_f32, TE_i32, const llvm::Twine&, llvm::MDNode*>(&llvm::IRBuilderBase::CreateFCmpOLE,
                                                                                      OpName(ins), nullptr);
  case OP_f32_ge:
    return CompileBinaryOp<TE_f32, TE_f32, TE_i32, const llvm::Twine&, llvm::MDNode*>(&llvm::IRBuilderBase::CreateFCmpOGE,
                                                                                      OpName(ins), nullptr);
  case OP_f64_eq:
    return CompileBinaryOp<TE_f64, TE_f64, TE_i32, const llvm::Twine&, llvm::MDNode*>(&llvm::IRBuilderBase::CreateFCmpOEQ,
                                                                                      OpName(ins), nullptr);
  case OP_f64_ne:
    return CompileBinaryOp<TE_f64, TE_f64, TE_i32, const llvm::Twine&, llvm::MDNode*>(&llvm::IRBuilderBase::CreateFCmpUNE,
                                                                                      OpName(ins), nullptr);
  case OP_f64_lt:
    return CompileBinaryOp<TE_f64, TE_f64, TE_i32, const llvm::Twine&, llvm::MDNode*>(&llvm::IRBuilderBase::CreateFCmpOLT,
                                                                                      OpName(ins), nullptr);
  case OP_f64_gt:
    return CompileBinaryOp<TE_f64, TE_f64, TE_i32, const llvm::Twine&, llvm::MDNode*>(&llvm::IRBuilderBase::CreateFCmpOGT,
                                                                                      OpName(ins), nullptr);
  case OP_f64_le:
    return CompileBinaryOp<TE_f64, TE_f64, TE_i32, const llvm::Twine&, llvm::MDNode*>(&llvm::IRBuilderBase::CreateFCmpOLE,
                                                                                      OpName(ins), nullptr);
  case OP_f64_ge:
    return CompileBinaryOp<TE_f64, TE_f64, TE_i32, const llvm::Twine&, llvm::MDNode*>(&llvm::IRBuilderBase::CreateFCmpOGE,
                                                                                      OpName(ins), nullptr);

    // Numeric operators
  case OP_i32_clz:
    return CompileUnaryIntrinsic<TE_i32, TE_i32>(llvm::Intrinsic::ctlz, OpName(ins), builder.getInt1(false));
  case OP_i32_ctz:
    return CompileUnaryIntrinsic<TE_i32, TE_i32>(llvm::Intrinsic::cttz, OpName(ins), builder.getInt1(false));
  case OP_i32_popcnt: return CompileUnaryIntrinsic<TE_i32, TE_i32>(llvm::Intrinsic::ctpop, OpName(ins));
  case OP_i32_add:
    return CompileBinaryOp<TE_i32, TE_i32, TE_i32, const llvm::Twine&, bool, bool>(&llvm::IRBuilderBase::CreateAdd,
                                                                                   OpName(ins), false, false);
  case OP_i32_sub:
    return CompileBinaryOp<TE_i32, TE_i32, TE_i32, const llvm::Twine&, bool, bool>(&llvm::IRBuilderBase::CreateSub,
                                                                                   OpName(ins), false, false);
  case OP_i32_mul:
    return CompileBinaryOp<TE_i32, TE_i32, TE_i32, const llvm::Twine&, bool, bool>(&llvm::IRBuilderBase::CreateMul,
                                                                                   OpName(ins), false, false);
  case OP_i32_div_s:
    return CompileDiv<TE_i32, TE_i32, TE_i32, const llvm::Twine&, bool>(true, &llvm::IRBuilderBase::CreateSDiv,
                                                                        OpName(ins), false);
  case OP_i32_div_u:
    return CompileDiv<TE_i32, TE_i32, TE_i32, const llvm::Twine&, bool>(false, &llvm::IRBuilderBase::CreateUDiv,
                                                                        OpName(ins), false);
  case OP_i32_rem_s: return CompileSRem<TE_i32, TE_i32, TE_i32>(OpName(ins));
  case OP_i32_rem_u:
    return CompileDiv<TE_i32, TE_i32, TE_i32, const llvm::Twine&>(false, &llvm::IRBuilderBase::CreateURem, OpName(ins));
  case OP_i32_and:
    return CompileBinaryOp<TE_i32, TE_i32, TE_i32, const llvm::Twine&>(
      static_cast<llvm::Value* (llvm::IRBuilderBase::*)(llvm::Value*, llvm::Value*, const llvm::Twine&)>(
        &llvm::IRBuilderBase::CreateAnd),
      OpName(ins));
  case OP_i32_or:
    return CompileBinaryOp<TE_i32, TE_i32, TE_i32, const llvm::Twine&>(
      static_cast<llvm::Value* (llvm::IRBuilderBase::*)(llvm::Value*, llvm::Value*, const llvm::Twine&)>(
        &llvm::IRBuilderBase::CreateOr),
      OpName(ins));
  case OP_i32_xor:
    return CompileBinaryOp<TE_i32, TE_i32, TE_i32, const llvm::Twine&>(
      static_cast<llvm::Value* (llvm::IRBuilderBase::*)(llvm::Value*, llvm::Value*, const llvm::Twine&)>(
        &llvm::IRBuilderBase::CreateXor),
      OpName(ins));
  case OP_i32_shl:
    return CompileBinaryShiftOp<TE_i32, TE_i32, TE_i32, const llvm::Twine&, bool, bool>(
      static_cast<llvm::Value* (llvm::IRBuilderBase::*)(llvm::Value*, llvm::Value*, const llvm::Twine&, bool, bool)>(
        &llvm::IRBuilderBase::CreateShl),
      OpName(ins), false, false);
  case OP_i32_shr_s:
    return CompileBinaryShiftOp<TE_i32, TE_i32, TE_i32, const llvm::Twine&, bool>(
      static_cast<llvm::Value* (llvm::IRBuilderBase::*)(llvm::Value*, llvm::Value*, const llvm::Twine&, bool)>(
        &llvm::IRBuilderBase::CreateAShr),
      OpName(ins), false);
  case OP_i32_shr_u:
    return CompileBinaryShiftOp<TE_i32, TE_i32, TE_i32, const llvm::Twine&, bool>(
      static_cast<llvm::Value* (llvm::IRBuilderBase::*)(llvm::Value*, llvm::Value*, const llvm::Twine&, bool)>(
        &llvm::IRBuilderBase::CreateLShr),
      OpName(ins), false);
  case OP_i32_rotl: return CompileRotationOp<TE_i32>(llvm::Intrinsic::fshl, OpName(ins));
  case OP_i32_rotr: return CompileRotationOp<TE_i32>(llvm::Intrinsic::fshr, OpName(ins));
  case OP_i64_clz:
    return CompileUnaryIntrinsic<TE_i64, TE_i64>(llvm::Intrinsic::ctlz, OpName(ins), builder.getInt1(false));
  case OP_i64_ctz:
    return CompileUnaryIntrinsic<TE_i64, TE_i64>(llvm::Intrinsic::cttz, OpName(ins), builder.getInt1(false));
  case OP_i64_popcnt: return CompileUnaryIntrinsic<TE_i64, TE_i64>(llvm::Intrinsic::ctpop, OpName(ins));
  case OP_i64_add:
    return CompileBinaryOp<TE_i64, TE_i64, TE_i64, const llvm::Twine&, bool, bool>(&llvm::IRBuilderBase::CreateAdd,
                                                                                   OpName(ins), false, false);
  case OP_i64_sub:
    return CompileBinaryOp<TE_i64, TE_i64, TE_i64, const llvm::Twine&, bool, bool>(&llvm::IRBuilderBase::CreateSub,
                                                                                   OpName(ins), false, false);
  case OP_i64_mul:
    return CompileBinaryOp<TE_i64, TE_i64, TE_i64, const llvm::Twine&, bool, bool>(&llvm::IRBuilderBase::CreateMul,
                                                                                   OpName(ins), false, false);
  case OP_i64_div_s:
    return CompileDiv<TE_i64, TE_i64, TE_i64, const llvm::Twine&, bool>(true, &llvm::IRBuilderBase::CreateSDiv,
                                                                        OpName(ins), false);
  case OP_i64_div_u:
    return CompileDiv<TE_i64, TE_i64, TE_i64, const llvm::Twine&, bool>(false, &llvm::IRBuilderBase::CreateUDiv,
                                                                        OpName(ins), false);
  case OP_i64_rem_s: return CompileSRem<TE_i64, TE_i64, TE_i64>(OpName(ins));
  case OP_i64_rem_u:
    return CompileDiv<TE_i64, TE_i64, TE_i64, const llvm::Twine&>(false, &llvm::IRBuilderBase::CreateURem, OpName(ins));
  case OP_i64_and:
    return CompileBinaryOp<TE_i64, TE_i64, TE_i64, const llvm::Twine&>(
      static_cast<llvm::Value* (llvm::IRBuilderBase::*)(llvm::Value*, llvm::Value*, const llvm::Twine&)>(
        &llvm::IRBuilderBase::CreateAnd),
      OpName(ins));
  case OP_i64_or:
    return CompileBinaryOp<TE_i64, TE_i64, TE_i64, const llvm::Twine&>(
      static_cast<llvm::Value* (llvm::IRBuilderBase::*)(llvm::Value*, llvm::Value*, const llvm::Twine&)>(
        &llvm::IRBuilderBase::CreateOr),
      OpName(ins));
  case OP_i64_xor:
    return CompileBinaryOp<TE_i64, TE_i64, TE_i64, const llvm::Twine&>(
      static_cast<llvm::Value* (llvm::IRBuilderBase::*)(llvm::Value*, llvm::Value*, const llvm::Twine&)>(
        &llvm::IRBuilderBase::CreateXor),
      OpName(ins));
  case OP_i64_shl:
    return CompileBinaryShiftOp<TE_i64, TE_i64, TE_i64, const llvm::Twine&, bool, bool>(
      static_cast<llvm::Value* (llvm::IRBuilderBase::*)(llvm::Value*, llvm::Value*, const llvm::Twine&, bool, bool)>(
        &llvm::IRBuilderBase::CreateShl),
      OpName(ins), false, false);
  case OP_i64_shr_s:
    return CompileBinaryShiftOp<TE_i64, TE_i64, TE_i64, const llvm::Twine&, bool>(
      static_cast<llvm::Value* (llvm::IRBuilderBase::*)(llvm::Value*, llvm::Value*, const llvm::Twine&, bool)>(
        &llvm::IRBuilderBase::CreateAShr),
      OpName(ins), false);
  case OP_i64_shr_u:
    return CompileBinaryShiftOp<TE_i64, TE_i64, TE_i64, const llvm::Twine&, bool>(
      static_cast<llvm::Value* (llvm::IRBuilderBase::*)(llvm::Value*, llvm::Value*, const llvm::Twine&, bool)>(
        &llvm::IRBuilderBase::CreateLShr),
      OpName(ins), false);
  case OP_i64_rotl: return CompileRotationOp<TE_i64>(llvm::Intrinsic::fshl, OpName(ins));
  case OP_i64_rotr: return CompileRotationOp<TE_i64>(llvm::Intrinsic::fshr, OpName(ins));
  case OP_f32_abs: return CompileUnaryIntrinsic<TE_f32, TE_f32>(llvm::Intrinsic::fabs, OpName(ins));
  case OP_f32_neg:
    return CompileUnaryOp<TE_f32, TE_f32, const llvm::Twine&, llvm::MDNode*>(&llvm::IRBuilderBase::CreateFNeg, OpName(ins),
                                                                             nullptr);
  case OP_f32_ceil: return CompileUnaryIntrinsic<TE_f32, TE_f32>(llvm::Intrinsic::ceil, OpName(ins));
  case OP_f32_floor: return CompileUnaryIntrinsic<TE_f32, TE_f32>(llvm::Intrinsic::floor, OpName(ins));
  case OP_f32_trunc: return CompileUnaryIntrinsic<TE_f32, TE_f32>(llvm::Intrinsic::trunc, OpName(ins));
  case OP_f32_nearest: // Rounds to nearest, ties to even, under the default rounding mode
    return CompileUnaryIntrinsic<TE_f32, TE_f32>(llvm::Intrinsic::nearbyint, OpName(ins));
  case OP_f32_sqrt: return CompileUnaryIntrinsic<TE_f32, TE_f32>(llvm::Intrinsic::sqrt, OpName(ins));
  case OP_f32_add:
    return CompileBinaryOp<TE_f32, TE_f32, TE_f32, const llvm::Twine&, llvm::MDNode*>(&llvm::IRBuilderBase::CreateFAdd,
                                                                                      OpName(ins), nullptr);
  case OP_f32_sub:
    return CompileBinaryOp<TE_f32, TE_f32, TE_f32, const llvm::Twine&, llvm::MDNode*>(&llvm::IRBuilderBase::CreateFSub,
                                                                                      OpName(ins), nullptr);
  case OP_f32_mul:
    return CompileBinaryOp<TE_f32, TE_f32, TE_f32, const llvm::Twine&, llvm::MDNode*>(&llvm::IRBuilderBase::CreateFMul,
                                                                                      OpName(ins), nullptr);
  case OP_f32_div:
    return CompileBinaryOp<TE_f32, TE_f32, TE_f32, const llvm::Twine&, llvm::MDNode*>(&llvm::IRBuilderBase::CreateFDiv,
                                                                                      OpName(ins), nullptr);
  case OP_f32_min: return CompileFloatCmp<TE_f32, TE_f32, TE_f32>(llvm::Intrinsic::minnum, true, OpName(ins));
  case OP_f32_max: return CompileFloatCmp<TE_f32, TE_f32, TE_f32>(llvm::Intrinsic::maxnum, false, OpName(ins));
  case OP_f32_copysign:
    return CompileBinaryIntrinsic<TE_f32, TE_f32, TE_f32>(llvm::Intrinsic::copysign, OpName(ins));
  case OP_f64_abs: return CompileUnaryIntrinsic<TE_f64, TE_f64>(llvm::Intrinsic::fabs, OpName(ins));
  case OP_f64_neg:
    return CompileUnaryOp<TE_f64, TE_f64, const llvm::Twine&, llvm::MDNode*>(&llvm::IRBuilderBase::CreateFNeg, OpName(ins),
                                                                             nullptr);
  case OP_f64_ceil: return CompileUnaryIntrinsic<TE_f64, TE_f64>(llvm::Intrinsic::ceil, OpName(ins));
  case OP_f64_floor: return CompileUnaryIntrinsic<TE_f64, TE_f64>(llvm::Intrinsic::floor, OpName(ins));
  case OP_f64_trunc: return CompileUnaryIntrinsic<TE_f64, TE_f64>(llvm::Intrinsic::trunc, OpName(ins));
  case OP_f64_nearest: return CompileUnaryIntrinsic<TE_f64, TE_f64>(llvm::Intrinsic::nearbyint, OpName(ins));
  case OP_f64_sqrt: return CompileUnaryIntrinsic<TE_f64, TE_f64>(llvm::Intrinsic::sqrt, OpName(ins));
  case OP_f64_add:
    return CompileBinaryOp<TE_f64, TE_f64, TE_f64, const llvm::Twine&, llvm::MDNode*>(&llvm::IRBuilderBase::CreateFAdd,
                                                                                      OpName(ins), nullptr);
  case OP_f64_sub:
    return CompileBinaryOp<TE_f64, TE_f64, TE_f64, const llvm::Twine&, llvm::MDNode*>(&llvm::IRBuilderBase::CreateFSub,
                                                                                      OpName(ins), nullptr);
  case OP_f64_mul:
    return CompileBinaryOp<TE_f64, TE_f64, TE_f64, const llvm::Twine&, llvm::MDNode*>(&llvm::IRBuilderBase::CreateFMul,
                                                                                      OpName(ins), nullptr);
  case OP_f64_div:
    return CompileBinaryOp<TE_f64, TE_f64, TE_f64, const llvm::Twine&, llvm::MDNode*>(&llvm::IRBuilderBase::CreateFDiv,
                                                                                      OpName(ins), nullptr);
  case OP_f64_min: return CompileFloatCmp<TE_f64, TE_f64, TE_f64>(llvm::Intrinsic::minnum, true, OpName(ins));
  case OP_f64_max: return CompileFloatCmp<TE_f64, TE_f64, TE_f64>(llvm::Intrinsic::maxnum, false, OpName(ins));
  case OP_f64_copysign:
    return CompileBinaryIntrinsic<TE_f64, TE_f64, TE_f64>(llvm::Intrinsic::copysign, OpName(ins));

    // Conversions
  case OP_i32_wrap_i64:
    return CompileUnaryOp<TE_i64, TE_i32, llvmTy*, const llvm::Twine&>(&llvm::IRBuilderBase::CreateTrunc,
                                                                       builder.getInt32Ty(), OpName(ins));
  case OP_i32_trunc_f32_s: return CompileFPToInt(TE_f32, TE_i32, true, false, OpName(ins));
  case OP_i32_trunc_f32_u: return CompileFPToInt(TE_f32, TE_i32, false, false, OpName(ins));
  case OP_i32_trunc_f64_s: return CompileFPToInt(TE_f64, TE_i32, true, false, OpName(ins));
  case OP_i32_trunc_f64_u: return CompileFPToInt(TE_f64, TE_i32, false, false, OpName(ins));
  case OP_i64_extend_i32_s:
    return CompileUnaryOp<TE_i32, TE_i64, llvmTy*, const llvm::Twine&>(&llvm::IRBuilderBase::CreateSExt,
                                                                       builder.getInt64Ty(), OpName(ins));
  case OP_i64_extend_i32_u:
    return CompileUnaryOp<TE_i32, TE_i64, llvmTy*, const llvm::Twine&>(&llvm::IRBuilderBase::CreateZExt,
                                                                       builder.getInt64Ty(), OpName(ins));
  case OP_i64_trunc_f32_s: return CompileFPToInt(TE_f32, TE_i64, true, false, OpName(ins));
  case OP_i64_trunc_f32_u: return CompileFPToInt(TE_f32, TE_i64, false, false, OpName(ins));
  case OP_i64_trunc_f64_s: return CompileFPToInt(TE_f64, TE_i64, true, false, OpName(ins));
  case OP_i64_trunc_f64_u: return CompileFPToInt(TE_f64, TE_i64, false, false, OpName(ins));
  case OP_f32_convert_i32_s:
    return CompileUnaryOp<TE_i32, TE_f32, llvmTy*, const llvm::Twine&>(&llvm::IRBuilderBase::CreateSIToFP,
                                                                       builder.getFloatTy(), OpName(ins));
  case OP_f32_convert_i32_u:
    return CompileUnaryOp<TE_i32, TE_f32, llvmTy*, const llvm::Twine&>(&llvm::IRBuilderBase::CreateUIToFP,
                                                                       builder.getFloatTy(), OpName(ins));
  case OP_f32_convert_i64_s:
    return CompileUnaryOp<TE_i64, TE_f32, llvmTy*, const llvm::Twine&>(&llvm::IRBuilderBase::CreateSIToFP,
                                                                       builder.getFloatTy(), OpName(ins));
  case OP_f32_convert_i64_u:
    return CompileUnaryOp<TE_i64, TE_f32, llvmTy*, const llvm::Twine&>(&llvm::IRBuilderBase::CreateUIToFP,
                                                                       builder.getFloatTy(), OpName(ins));
  case OP_f32_demote_f64:
    return CompileUnaryOp<TE_f64, TE_f32, llvmTy*, const llvm::Twine&>(&llvm::IRBuilderBase::CreateFPTrunc,
                                                                       builder.getFloatTy(), OpName(ins));
  case OP_f64_convert_i32_s:
    return CompileUnaryOp<TE_i32, TE_f64, llvmTy*, const llvm::Twine&>(&llvm::IRBuilderBase::CreateSIToFP,
                                                                       builder.getDoubleTy(), OpName(ins));
  case OP_f64_convert_i32_u:
    return CompileUnaryOp<TE_i32, TE_f64, llvmTy*, const llvm::Twine&>(&llvm::IRBuilderBase::CreateUIToFP,
                                                                       builder.getDoubleTy(), OpName(ins));
  case OP_f64_convert_i64_s:
    return CompileUnaryOp<TE_i64, TE_f64, llvmTy*, const llvm::Twine&>(&llvm::IRBuilderBase::CreateSIToFP,
                                                                       builder.getDoubleTy(), OpName(ins));
  case OP_f64_convert_i64_u:
    return CompileUnaryOp<TE_i64, TE_f64, llvmTy*, const llvm::Twine&>(&llvm::IRBuilderBase::CreateUIToFP,
                                                                       builder.getDoubleTy(), OpName(ins));
  case OP_f64_promote_f32:
    return CompileUnaryOp<TE_f32, TE_f64, llvmTy*, const llvm::Twine&>(&llvm::IRBuilderBase::CreateFPExt,
                                                                       builder.getDoubleTy(), OpName(ins));

    // Reinterpretations
  case OP_i32_reinterpret_f32:
    return CompileUnaryOp<TE_f32, TE_i32, llvmTy*, const llvm::Twine&>(&llvm::IRBuilderBase::CreateBitCast,
                                                                       builder.getInt32Ty(), OpName(ins));
  case OP_i64_reinterpret_f64:
    return CompileUnaryOp<TE_f64, TE_i64, llvmTy*, const llvm::Twine&>(&llvm::IRBuilderBase::CreateBitCast,
                                                                       builder.getInt64Ty(), OpName(ins));
  case OP_f32_reinterpret_i32:
    return CompileUnaryOp<TE_i32, TE_f32, llvmTy*, const llvm::Twine&>(&llvm::IRBuilderBase::CreateBitCast,
                                                                       builder.getFloatTy(), OpName(ins));
  case OP_f64_reinterpret_i64:
    return CompileUnaryOp<TE_i64, TE_f64, llvmTy*, const llvm::Twine&>(&llvm::IRBuilderBase::CreateBitCast,
                                                                       builder.getDoubleTy(), OpName(ins));

  case OP_i32_extend8_s: return CompileSignExtendOp(TE_i32, 8, OpName(ins));
  case OP_i32_extend16_s: return CompileSignExtendOp(TE_i32, 16, OpName(ins));
  case OP_i64_extend8_s: return CompileSignExtendOp(TE_i64, 8, OpName(ins));
  case OP_i64_extend16_s: return CompileSignExtendOp(TE_i64, 16, OpName(ins));
  case OP_i64_extend32_s: return CompileSignExtendOp(TE_i64, 32, OpName(ins));

  // Miscellaneous operations
  case OP_misc_ops_prefix:
    switch(ins.opcode[1])
    {
    case OP_i32_trunc_sat_f32_s: return CompileFPToInt(TE_f32, TE_i32, true, true, OpName(ins));
    case OP_i32_trunc_sat_f32_u: return CompileFPToInt(TE_f32, TE_i32, false, true, OpName(ins));
    case OP_i32_trunc_sat_f64_s: return CompileFPToInt(TE_f64, TE_i32, true, true, OpName(ins));
    case OP_i32_trunc_sat_f64_u: return CompileFPToInt(TE_f64, TE_i32, false, true, OpName(ins));
    case OP_i64_trunc_sat_f32_s: return CompileFPToInt(TE_f32, TE_i64, true, true, OpName(ins));
    case OP_i64_trunc_sat_f32_u: return CompileFPToInt(TE_f32, TE_i64, false, true, OpName(ins));
    case OP_i64_trunc_sat_f64_s: return CompileFPToInt(TE_f64, TE_i64, true, true, OpName(ins));
    case OP_i64_trunc_sat_f64_u: return CompileFPToInt(TE_f64, TE_i64, false, true, OpName(ins));
    }
    break;
  }

  return LogErrorString(env, "%s: Unknown instruction %s at %zu", ERR_FATAL_UNKNOWN_INSTRUCTION, OpName(ins), ins.offset);
}

WJ_ERROR Compiler::CompileFunctionBody(Func* fn, const FunctionType& sig, const FunctionBody& body)
{
  current = fn;
  values.Clear();
  control.Clear();
  locals.clear();

  // The function itself is the outermost label, ending it returns from the function
  PushLabel("exit", sig.returns.empty() ? TE_void : sig.returns[0], OP_return, nullptr);
  builder.SetInsertPoint(BB::Create(ctx, "entry", fn));

  // Parameters are copied into locals so they can be assigned like any other local
  auto arg = fn->arg_begin();
  for(size_t i = 0; i < sig.params.size(); ++i, ++arg)
  {
    locals.push_back(builder.CreateAlloca(GetLLVMType(sig.params[i]), nullptr, "param" + std::to_string(i)));
    builder.CreateStore(&*arg, locals.back());
  }

  // Locals are always zero initialized
  for(auto& local : body.locals)
    for(varuint32 i = 0; i < local.count; ++i)
    {
      locals.push_back(builder.CreateAlloca(GetLLVMType(local.type), nullptr, "local" + std::to_string(locals.size())));
      builder.CreateStore(llvm::Constant::getNullValue(GetLLVMType(local.type)), locals.back());
    }

  if(env.flags & ENV_CHECK_STACK_OVERFLOW)
    builder.CreateCall(fn_enter, { builder.getInt32(env.maxdepth) });

  for(auto& ins : body.body)
  {
    WJ_ERROR err = CompileInstruction(ins);
    if(err < 0)
    {
      if(env.loglevel >= LOG_DEBUG && env.loghook != nullptr)
        DumpCompilerState();
      return err;
    }
  }

  if(control.Size() > 0 || values.Size() > 0)
    return LogErrorString(env, "%s: Function body ended with %zu labels and %zu values left on the stack",
                          ERR_END_MISMATCH, control.Size(), values.Size());

  return ERR_SUCCESS;
}
