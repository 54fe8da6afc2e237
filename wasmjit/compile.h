// Copyright (c)2020 Black Sphere Studios
// For conditions of distribution and use, see copyright notice in wasmjit.h

#ifndef WJ__COMPILE_H
#define WJ__COMPILE_H

#include "wasmjit/schema.h"
#include "constants.h"
#include "llvm.h"
#include "stack.h"
#include <vector>
#include <string>

namespace wasmjit {
  namespace internal {
    struct Linkage;
  }

  // Emits the LLVM IR for every local function of one module. Tables, memories, globals and imported functions are
  // already allocated when this runs, so their addresses are baked directly into the generated code.
  struct Compiler
  {
    struct Block
    {
      llvm::BasicBlock* block;  // Label
      llvm::BasicBlock* ifelse; // Label for else statement
      size_t limit;             // Limit of value stack
      varsint7 sig;             // Block signature
      uint8_t op;               // instruction that pushed this label
      std::vector<std::pair<llvm::Value*, llvm::BasicBlock*>> results; // Alternative branch results targeting this block
    };

    Compiler(Environment& env, const Module& m, internal::Linkage& linkage, llvm::LLVMContext& ctx, llvm::Module* mod,
             llvm::IRBuilder<>& builder, llvm::TargetMachine* machine);

    Environment& env;
    const Module& m;
    internal::Linkage& linkage;
    llvm::LLVMContext& ctx;
    llvm::Module* mod;
    llvm::IRBuilder<>& builder;
    llvm::TargetMachine* machine;
    llvm::IntegerType* intptrty;
    llvm::StructType* entryty;  // internal::FunctionEntry
    llvm::StructType* tablety;  // internal::TableData
    llvm::StructType* memoryty; // internal::MemoryData
    llvm::FunctionType* thunkty;
    Stack<llvm::Value*> values; // Tracks the current value stack
    Stack<Block> control;       // Control flow stack
    std::vector<llvm::AllocaInst*> locals;
    std::vector<llvm::Function*> functions; // Internal definitions of local functions
    std::vector<llvm::Function*> thunks;    // Invoke thunks of local functions, same indexing as functions
    std::vector<varuint32> sigids;          // Canonical signature id of each type index
    llvm::Function* current;
    llvm::Function* fn_trap;
    llvm::Function* fn_memgrow;
    llvm::Function* fn_enter;
    llvm::Function* fn_leave;

    using Func    = llvm::Function;
    using FuncTy  = llvm::FunctionType;
    using llvmTy  = llvm::Type;
    using llvmVal = llvm::Value;
    using CInt    = llvm::ConstantInt;
    using BB      = llvm::BasicBlock;

    llvmTy* GetLLVMType(varsint7 type);
    FuncTy* GetFunctionType(const FunctionType& signature);
    llvm::Constant* GetAddress(const void* p, llvmTy* ty);
    llvm::AllocaInst* CreateEntryAlloca(llvmTy* ty, unsigned int count, const llvm::Twine& name);
    llvmVal* ToSlot(llvmVal* v);
    llvmVal* FromSlot(llvmVal* slot, varsint7 type);
    WJ_ERROR InsertConditionalTrap(llvmVal* cond, WJ_ERROR trap);
    WJ_ERROR PopType(varsint7 ty, llvmVal*& v, bool peek = false);
    llvmVal* MaskShiftBits(llvmVal* value);
    BB* PushLabel(const char* name, varsint7 sig, uint8_t opcode, Func* fnptr);
    BB* BindLabel(BB* block);
    WJ_ERROR AddBranch(Block& target);
    WJ_ERROR PopLabel(BB* block, llvmVal* push);
    void PolymorphicStack();
    llvmVal* GetMemPointer(llvmVal* base, llvmTy* ty, varuint32 offset);
    llvmVal* GetMemSize();
    llvm::Value* GetLocal(varuint32 index);
    llvmVal* GetGlobalSlot(varuint32 index);
    llvmVal* CallThunk(llvmVal* invoke, llvmVal* closure, const FunctionType& sig, llvm::ArrayRef<llvmVal*> args);

    Func* CompileFunction(const FunctionType& signature, const llvm::Twine& name);
    Func* CompileThunk(Func* fn, const FunctionType& signature, const llvm::Twine& name);
    WJ_ERROR CompileIfBlock(varsint7 sig);
    WJ_ERROR CompileElseBlock();
    WJ_ERROR CompileReturn(varsint7 sig);
    WJ_ERROR CompileEndBlock();
    void CompileTrap(WJ_ERROR trap);
    WJ_ERROR CompileBranch(varuint32 depth);
    WJ_ERROR CompileIfBranch(varuint32 depth);
    WJ_ERROR CompileBranchTable(const std::vector<varuint32>& table, varuint32 def);
    WJ_ERROR CompileCall(varuint32 index);
    WJ_ERROR CompileConstant(const Instruction& instruction, llvm::Constant*& constant);
    WJ_ERROR CompileIndirectCall(varuint32 index);
    WJ_ERROR CompileSelectOp(const llvm::Twine& name);
    WJ_ERROR CompileMemGrow(const char* name);
    WJ_ERROR CompileSignExtendOp(WASM_TYPE_ENCODING argTy, unsigned int valueBits, const char* name);
    WJ_ERROR CompileFPToInt(varsint7 from, varsint7 to, bool is_signed, bool saturating, const char* name);
    void DumpCompilerState();
    WJ_ERROR CompileInstruction(const Instruction& ins);
    WJ_ERROR CompileFunctionBody(Func* fn, const FunctionType& sig, const FunctionBody& body);
    WJ_ERROR CompileModule();

    static WASM_TYPE_ENCODING GetTypeEncoding(llvm::Type* t);
    static inline std::string FunctionName(varuint32 index) { return "wj_func_" + std::to_string(index); }
    static inline std::string InvokeName(varuint32 index) { return "wj_invoke_" + std::to_string(index); }
    static bool CheckType(varsint7 ty, llvmVal* v);

    // Local functions are only ever called from code we generate, so they can use the C convention without a wrapper
    static const llvm::CallingConv::ID InternalConvention = llvm::CallingConv::C;

    inline WJ_ERROR PushReturn(llvmVal* arg)
    {
      auto ty = arg->getType();
      values.Push((ty->isIntegerTy() && ty->getIntegerBitWidth() == 1) ?
                    builder.CreateIntCast(arg, builder.getInt32Ty(), false) :
                    arg);
      return ERR_SUCCESS;
    }

  private:
    template<WASM_TYPE_ENCODING Ty1, WASM_TYPE_ENCODING Ty2, WASM_TYPE_ENCODING TyR, typename... Args>
    WJ_ERROR CompileBinaryOp(llvmVal* (llvm::IRBuilderBase::*op)(llvmVal*, llvmVal*, Args...), Args... args);
    template<WASM_TYPE_ENCODING Ty1, WASM_TYPE_ENCODING Ty2, WASM_TYPE_ENCODING TyR>
    WJ_ERROR CompileBinaryIntrinsic(llvm::Intrinsic::ID id, const llvm::Twine& name);
    template<WASM_TYPE_ENCODING Ty1, WASM_TYPE_ENCODING Ty2, WASM_TYPE_ENCODING TyR, typename... Args>
    WJ_ERROR CompileBinaryShiftOp(llvmVal* (llvm::IRBuilderBase::*op)(llvmVal*, llvmVal*, Args...), Args... args);
    template<WASM_TYPE_ENCODING Ty1, WASM_TYPE_ENCODING TyR, typename... Args>
    WJ_ERROR CompileUnaryOp(llvmVal* (llvm::IRBuilderBase::*op)(llvmVal*, Args...), Args... args);
    template<WASM_TYPE_ENCODING Ty1, WASM_TYPE_ENCODING TyR, typename... Args>
    WJ_ERROR CompileUnaryIntrinsic(llvm::Intrinsic::ID id, const llvm::Twine& name, Args... args);
    template<WASM_TYPE_ENCODING TYPE> WJ_ERROR CompileRotationOp(llvm::Intrinsic::ID id, const char* name);
    template<bool SIGNED> WJ_ERROR CompileLoad(varuint32 offset, const char* name, llvmTy* ext, llvmTy* ty);
    template<WASM_TYPE_ENCODING TY> WJ_ERROR CompileStore(varuint32 offset, const char* name, llvm::IntegerType* ext);
    template<WASM_TYPE_ENCODING Ty1, WASM_TYPE_ENCODING Ty2, WASM_TYPE_ENCODING TyR>
    WJ_ERROR CompileSRem(const llvm::Twine& name);
    template<WASM_TYPE_ENCODING Ty1, WASM_TYPE_ENCODING Ty2, WASM_TYPE_ENCODING TyR, typename... Args>
    WJ_ERROR CompileDiv(bool overflow, llvmVal* (llvm::IRBuilderBase::*op)(llvmVal*, llvmVal*, Args...), Args... args);
    template<WASM_TYPE_ENCODING Ty1, WASM_TYPE_ENCODING Ty2, WASM_TYPE_ENCODING TyR>
    WJ_ERROR CompileFloatCmp(llvm::Intrinsic::ID id, bool min, const llvm::Twine& name);
  };
}

#endif
