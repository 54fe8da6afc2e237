// Copyright (c)2020 Black Sphere Studios
// For conditions of distribution and use, see copyright notice in wasmjit.h

#include "validate.h"
#include "util.h"
#include "stack.h"
#include "wasmjit/export.h"
#include <iterator>
#include <limits>

using namespace wasmjit;
using namespace utility;

void wasmjit::ValidateFunctionSig(const FunctionType& sig, Environment& env, const Module& m)
{
  if(sig.form != TE_func)
  {
    char buf[10];
    AppendError(env, ERR_INVALID_TYPE, "Illegal function type %s encountered: only func allowed",
                EnumToString(TYPE_ENCODING_MAP, sig.form, buf, 10));
  }
  else if(sig.returns.size() > 1)
    AppendError(env, ERR_MULTIPLE_RETURN_VALUES, "Return count of %zu encountered: only 0 or 1 allowed.",
                sig.returns.size());
}

void wasmjit::ValidateImport(const Import& imp, Environment& env, const Module& m)
{
  switch(imp.kind)
  {
  case WASM_KIND_FUNCTION:
    if(imp.func_desc.type_index >= m.type.functypes.size())
      AppendError(env, ERR_INVALID_TYPE_INDEX, "Import %s.%s has invalid type index %u", imp.module_name.c_str(),
                  imp.export_name.c_str(), imp.func_desc.type_index);
    break;
  case WASM_KIND_TABLE: ValidateTable(imp.table_desc, env, m); break;
  case WASM_KIND_MEMORY: ValidateMemory(imp.mem_desc, env, m); break;
  case WASM_KIND_GLOBAL: break; // Mutable global imports are allowed
  default:
    AppendError(env, ERR_FATAL_UNKNOWN_KIND, "The %s.%s import has invalid kind %hhu", imp.module_name.c_str(),
                imp.export_name.c_str(), imp.kind);
  }
}

void wasmjit::ValidateFunction(const FunctionDesc& decl, Environment& env, const Module& m)
{
  if(decl.type_index >= m.type.functypes.size())
    AppendError(env, ERR_INVALID_TYPE_INDEX, "Invalid function declaration type index: %u", decl.type_index);
}

void wasmjit::ValidateLimits(const ResizableLimits& limits, Environment& env, const Module& m)
{
  if((limits.flags & WASM_LIMIT_HAS_MAXIMUM) && limits.maximum < limits.minimum)
    AppendError(env, ERR_INVALID_LIMITS, "Limits maximum (%u) cannot be smaller than minimum (%u)", limits.maximum,
                limits.minimum);
}

void wasmjit::ValidateTable(const TableDesc& table, Environment& env, const Module& m)
{
  if(table.element_type != TE_funcref)
  {
    char buf[10];
    AppendError(env, ERR_INVALID_TYPE, "Table element type is %s: only funcref allowed.",
                EnumToString(TYPE_ENCODING_MAP, table.element_type, buf, 10));
  }
  ValidateLimits(table.resizable, env, m);
}

void wasmjit::ValidateMemory(const MemoryDesc& mem, Environment& env, const Module& m)
{
  ValidateLimits(mem.limits, env, m);
  if(mem.limits.minimum > WASM_MAX_PAGES)
    AppendError(env, ERR_MEMORY_TOO_LARGE, "Memory minimum cannot exceed %u pages", WASM_MAX_PAGES);
  if((mem.limits.flags & WASM_LIMIT_HAS_MAXIMUM) && mem.limits.maximum > WASM_MAX_PAGES)
    AppendError(env, ERR_MEMORY_TOO_LARGE, "Memory maximum cannot exceed %u pages", WASM_MAX_PAGES);
}

namespace wasmjit {
  struct CtrlFrame
  {
    uint8_t op;
    varsint7 sig; // TE_void or the single result type of the block
    size_t height;
    bool unreachable;
  };

  struct ValidationStack
  {
    Environment& env;
    const Module& m;
    Stack<varsint7> opds;
    Stack<CtrlFrame> ctrls;

    ValidationStack(Environment& envi, const Module& mod) : env(envi), m(mod) {}

    void PushOpd(varsint7 type) { opds.Push(type); }

    // Returns TE_POLY if the frame is unreachable and the stack is exhausted, which matches any type
    varsint7 PopOpd(const Instruction& ins)
    {
      if(ctrls.Size() && opds.Size() == ctrls[0].height && ctrls[0].unreachable)
        return TE_POLY;
      else if(ctrls.Size() && opds.Size() == ctrls[0].height)
        AppendError(env, ERR_EMPTY_VALUE_STACK, "[%zu] Expected a value on the stack, but stack was empty.", ins.offset);
      else if(opds.Size())
        return opds.Pop();
      return TE_NONE;
    }

    varsint7 PopOpd(const Instruction& ins, varsint7 expected)
    {
      auto actual = PopOpd(ins);
      if(actual == TE_POLY)
        return expected;
      if(expected == TE_POLY)
        return actual;
      if(actual != TE_NONE && actual != expected)
      {
        char buf[10];
        char buf2[10];
        AppendError(env, ERR_INVALID_TYPE, "[%zu] Expected %s on the stack, but found %s.", ins.offset,
                    EnumToString(TYPE_ENCODING_MAP, expected, buf, 10), EnumToString(TYPE_ENCODING_MAP, actual, buf2, 10));
      }
      return actual;
    }

    inline void Op(const Instruction& ins, std::initializer_list<varsint7> pop, varsint7 push)
    {
      for(auto it = std::rbegin(pop); it != std::rend(pop); ++it)
        PopOpd(ins, *it);
      if(push != TE_void)
        PushOpd(push);
    }

    // In the MVP a block takes no parameters, so only the end and label types can hold a value
    static varsint7 LabelType(const CtrlFrame& frame) { return frame.op == OP_loop ? TE_void : frame.sig; }

    void PushCtrl(uint8_t op, varsint7 sig) { ctrls.Push({ op, sig, opds.Size(), false }); }

    CtrlFrame PopCtrl(const Instruction& ins)
    {
      if(ctrls.Size() < 1)
      {
        AppendError(env, ERR_END_MISMATCH, "[%zu] Invalid control stack", ins.offset);
        return { OP_block, TE_void, 0, false };
      }

      auto& frame = ctrls[0];
      if(frame.sig != TE_void)
        PopOpd(ins, frame.sig);
      if(opds.Size() != frame.height)
        AppendError(env, ERR_INVALID_VALUE_STACK, "[%zu] Block left %zu values on the stack", ins.offset,
                    opds.Size() - frame.height);
      return ctrls.Pop();
    }

    void Unreachable()
    {
      while(opds.Size() > ctrls[0].height)
        opds.Pop();
      ctrls[0].unreachable = true;
    }
  };

  template<typename T, WASM_TYPE_ENCODING PUSH>
  void ValidateLoad(const Instruction& ins, ValidationStack& vstack, Environment& env, const Module& m)
  {
    varuint32 align = ins.immediates[0]._varuint32;
    if(!ModuleMemory(m, 0))
      AppendError(env, ERR_INVALID_MEMORY_INDEX, "[%zu] No default linear memory in module.", ins.offset);
    if(align >= 32 || (1ULL << align) > sizeof(T))
      AppendError(env, ERR_INVALID_MEMORY_ALIGNMENT, "[%zu] Alignment of 2^%u exceeds number of accessed bytes %zu",
                  ins.offset, align, sizeof(T));
    vstack.Op(ins, { TE_i32 }, PUSH);
  }

  template<typename T, WASM_TYPE_ENCODING POP>
  void ValidateStore(const Instruction& ins, ValidationStack& vstack, Environment& env, const Module& m)
  {
    varuint32 align = ins.immediates[0]._varuint32;
    if(!ModuleMemory(m, 0))
      AppendError(env, ERR_INVALID_MEMORY_INDEX, "[%zu] No default linear memory in module.", ins.offset);
    if(align >= 32 || (1ULL << align) > sizeof(T))
      AppendError(env, ERR_INVALID_MEMORY_ALIGNMENT, "[%zu] Alignment of 2^%u exceeds number of accessed bytes %zu",
                  ins.offset, align, sizeof(T));
    vstack.Op(ins, { TE_i32, POP }, TE_void);
  }

  template<WASM_TYPE_ENCODING ARG1, WASM_TYPE_ENCODING RESULT>
  void ValidateUnaryOp(const Instruction& ins, ValidationStack& vstack)
  {
    vstack.Op(ins, { ARG1 }, RESULT);
  }

  template<WASM_TYPE_ENCODING ARG1, WASM_TYPE_ENCODING ARG2, WASM_TYPE_ENCODING RESULT>
  void ValidateBinaryOp(const Instruction& ins, ValidationStack& vstack)
  {
    vstack.Op(ins, { ARG1, ARG2 }, RESULT);
  }

  void ValidateCallSig(const Instruction& ins, ValidationStack& vstack, const FunctionType& sig)
  {
    for(size_t i = sig.params.size(); i-- > 0;) // Pop in reverse order
      vstack.PopOpd(ins, sig.params[i]);

    for(auto r : sig.returns)
      vstack.PushOpd(r);
  }

  void ValidateIndirectCall(const Instruction& ins, ValidationStack& vstack, varuint32 sig, Environment& env,
                            const Module& m)
  {
    if(!ModuleTable(m, 0))
      AppendError(env, ERR_INVALID_TABLE_INDEX, "[%zu] 0 is not a valid table index because there are 0 tables.",
                  ins.offset);

    vstack.PopOpd(ins, TE_i32); // Pop callee
    if(sig < m.type.functypes.size())
      ValidateCallSig(ins, vstack, m.type.functypes[sig]);
    else
      AppendError(env, ERR_INVALID_TYPE_INDEX, "[%zu] signature index was %u, which is an invalid type index.",
                  ins.offset, sig);
  }

  void ValidateCall(const Instruction& ins, ValidationStack& vstack, varuint32 callee, Environment& env,
                    const Module& m)
  {
    const FunctionType* sig = ModuleFunction(m, callee);
    if(sig)
      ValidateCallSig(ins, vstack, *sig);
    else
      AppendError(env, ERR_INVALID_FUNCTION_INDEX, "[%zu] callee was %u, which is an invalid function index.",
                  ins.offset, callee);
  }

  void ValidateBranch(const Instruction& ins, ValidationStack& vstack, varuint32 depth, Environment& env, bool cond)
  {
    if(depth >= vstack.ctrls.Size())
    {
      AppendError(env, ERR_INVALID_BRANCH_DEPTH, "[%zu] Invalid branch depth: %u exceeds %zu", ins.offset, depth,
                  vstack.ctrls.Size());
      return;
    }

    if(cond)
      vstack.PopOpd(ins, TE_i32);

    varsint7 type = ValidationStack::LabelType(vstack.ctrls[depth]);
    if(type != TE_void)
    {
      vstack.PopOpd(ins, type);
      if(cond)
        vstack.PushOpd(type);
    }

    if(!cond)
      vstack.Unreachable();
  }

  void ValidateMiscOp(const Instruction& ins, ValidationStack& vstack, Environment& env)
  {
    switch(ins.opcode[1])
    {
    case OP_i32_trunc_sat_f32_s:
    case OP_i32_trunc_sat_f32_u: ValidateUnaryOp<TE_f32, TE_i32>(ins, vstack); break;
    case OP_i32_trunc_sat_f64_s:
    case OP_i32_trunc_sat_f64_u: ValidateUnaryOp<TE_f64, TE_i32>(ins, vstack); break;
    case OP_i64_trunc_sat_f32_s:
    case OP_i64_trunc_sat_f32_u: ValidateUnaryOp<TE_f32, TE_i64>(ins, vstack); break;
    case OP_i64_trunc_sat_f64_s:
    case OP_i64_trunc_sat_f64_u: ValidateUnaryOp<TE_f64, TE_i64>(ins, vstack); break;
    default:
      AppendError(env, ERR_FATAL_UNKNOWN_INSTRUCTION, "[%zu] Unknown instruction code 0xfc %hhu", ins.offset,
                  ins.opcode[1]);
    }
  }

  void ValidateInstruction(const Instruction& ins, ValidationStack& vstack, const std::vector<varsint7>& locals,
                           Environment& env, const Module& m)
  {
    switch(ins.opcode[0])
    {
    case OP_unreachable: vstack.Unreachable(); break;
    case OP_nop: break;

    case OP_if: vstack.PopOpd(ins, TE_i32);
    case OP_block:
    case OP_loop: vstack.PushCtrl(ins.opcode[0], ins.immediates[0]._varsint7); break;
    case OP_end:
    {
      auto frame = vstack.PopCtrl(ins);
      if(frame.op == OP_if && frame.sig != TE_void)
        AppendError(env, ERR_INVALID_BLOCK_SIGNATURE, "[%zu] An if block without an else can't return a value.",
                    ins.offset);
      if(frame.sig != TE_void)
        vstack.PushOpd(frame.sig);
      break;
    }
    case OP_else:
    {
      if(!vstack.ctrls.Size() || vstack.ctrls[0].op != OP_if)
      {
        AppendError(env, ERR_IF_ELSE_MISMATCH, "[%zu] Found an else instruction outside of an if block.", ins.offset);
        break;
      }
      auto frame = vstack.PopCtrl(ins);
      vstack.PushCtrl(OP_else, frame.sig);
      break;
    }
    case OP_br: ValidateBranch(ins, vstack, ins.immediates[0]._varuint32, env, false); break;
    case OP_br_if: ValidateBranch(ins, vstack, ins.immediates[0]._varuint32, env, true); break;
    case OP_br_table:
    {
      auto depth = ins.immediates[0]._varuint32;
      if(depth >= vstack.ctrls.Size())
      {
        AppendError(env, ERR_INVALID_BRANCH_DEPTH, "[%zu] Invalid branch depth: %u exceeds %zu", ins.offset, depth,
                    vstack.ctrls.Size());
        break;
      }
      auto def_type = ValidationStack::LabelType(vstack.ctrls[depth]);
      for(auto br_depth : ins.table)
      {
        if(br_depth >= vstack.ctrls.Size())
          AppendError(env, ERR_INVALID_BRANCH_DEPTH, "[%zu] Invalid branch depth: %u exceeds %zu", ins.offset, br_depth,
                      vstack.ctrls.Size());
        else if(ValidationStack::LabelType(vstack.ctrls[br_depth]) != def_type)
        {
          char buf[10];
          char buf2[10];
          AppendError(env, ERR_INVALID_TYPE, "[%zu] Branch table target has type %s, but default branch has %s",
                      ins.offset, EnumToString(TYPE_ENCODING_MAP, ValidationStack::LabelType(vstack.ctrls[br_depth]), buf, 10),
                      EnumToString(TYPE_ENCODING_MAP, def_type, buf2, 10));
        }
      }
      vstack.PopOpd(ins, TE_i32);
      if(def_type != TE_void)
        vstack.PopOpd(ins, def_type);
      vstack.Unreachable();
      break;
    }
    case OP_return:
    {
      auto& frame = vstack.ctrls[vstack.ctrls.Size() - 1]; // Function frame
      if(frame.sig != TE_void)
        vstack.PopOpd(ins, frame.sig);
      vstack.Unreachable();
      break;
    }

    // Call operators
    case OP_call: ValidateCall(ins, vstack, ins.immediates[0]._varuint32, env, m); break;
    case OP_call_indirect:
      ValidateIndirectCall(ins, vstack, ins.immediates[0]._varuint32, env, m);
      break;

      // Parametric operators
    case OP_drop: vstack.PopOpd(ins); break;
    case OP_select:
    {
      vstack.PopOpd(ins, TE_i32);
      auto t1 = vstack.PopOpd(ins);
      auto t2 = vstack.PopOpd(ins, t1);
      vstack.PushOpd(t2);
    }
    break;

    // Variable access
    case OP_local_get:
      if(ins.immediates[0]._varuint32 >= locals.size())
        AppendError(env, ERR_INVALID_LOCAL_INDEX, "[%zu] Invalid local index %u for local.get.", ins.offset,
                    ins.immediates[0]._varuint32);
      else
        vstack.PushOpd(locals[ins.immediates[0]._varuint32]);
      break;
    case OP_local_set:
    case OP_local_tee:
      if(ins.immediates[0]._varuint32 >= locals.size())
      {
        AppendError(env, ERR_INVALID_LOCAL_INDEX, "[%zu] Invalid local index %u for %s.", ins.offset,
                    ins.immediates[0]._varuint32, OpName(ins));
        vstack.PopOpd(ins);
      }
      else
      {
        vstack.PopOpd(ins, locals[ins.immediates[0]._varuint32]);
        if(ins.opcode[0] == OP_local_tee)
          vstack.PushOpd(locals[ins.immediates[0]._varuint32]);
      }
      break;
    case OP_global_get:
    {
      const GlobalDesc* desc = ModuleGlobal(m, ins.immediates[0]._varuint32);
      if(!desc)
        AppendError(env, ERR_INVALID_GLOBAL_INDEX, "[%zu] Invalid global index %u for global.get.", ins.offset,
                    ins.immediates[0]._varuint32);
      else
        vstack.PushOpd(desc->type);
    }
    break;
    case OP_global_set:
    {
      const GlobalDesc* desc = ModuleGlobal(m, ins.immediates[0]._varuint32);
      if(!desc)
      {
        AppendError(env, ERR_INVALID_GLOBAL_INDEX, "[%zu] Invalid global index %u for global.set.", ins.offset,
                    ins.immediates[0]._varuint32);
        vstack.PopOpd(ins);
      }
      else if(!desc->mutability)
      {
        AppendError(env, ERR_IMMUTABLE_GLOBAL, "[%zu] Cannot call global.set on an immutable global.", ins.offset);
        vstack.PopOpd(ins);
      }
      else
        vstack.PopOpd(ins, desc->type);
    }
    break;

    // Memory-related operators
    case OP_i32_load: ValidateLoad<int32_t, TE_i32>(ins, vstack, env, m); break;
    case OP_i64_load: ValidateLoad<int64_t, TE_i64>(ins, vstack, env, m); break;
    case OP_f32_load: ValidateLoad<float, TE_f32>(ins, vstack, env, m); break;
    case OP_f64_load: ValidateLoad<double, TE_f64>(ins, vstack, env, m); break;
    case OP_i32_load8_s:
    case OP_i32_load8_u: ValidateLoad<int8_t, TE_i32>(ins, vstack, env, m); break;
    case OP_i32_load16_s:
    case OP_i32_load16_u: ValidateLoad<int16_t, TE_i32>(ins, vstack, env, m); break;
    case OP_i64_load8_s:
    case OP_i64_load8_u: ValidateLoad<int8_t, TE_i64>(ins, vstack, env, m); break;
    case OP_i64_load16_s:
    case OP_i64_load16_u: ValidateLoad<int16_t, TE_i64>(ins, vstack, env, m); break;
    case OP_i64_load32_s:
    case OP_i64_load32_u: ValidateLoad<int32_t, TE_i64>(ins, vstack, env, m); break;
    case OP_i32_store: ValidateStore<int32_t, TE_i32>(ins, vstack, env, m); break;
    case OP_i64_store: ValidateStore<int64_t, TE_i64>(ins, vstack, env, m); break;
    case OP_f32_store: ValidateStore<float, TE_f32>(ins, vstack, env, m); break;
    case OP_f64_store: ValidateStore<double, TE_f64>(ins, vstack, env, m); break;
    case OP_i32_store8: ValidateStore<int8_t, TE_i32>(ins, vstack, env, m); break;
    case OP_i32_store16: ValidateStore<int16_t, TE_i32>(ins, vstack, env, m); break;
    case OP_i64_store8: ValidateStore<int8_t, TE_i64>(ins, vstack, env, m); break;
    case OP_i64_store16: ValidateStore<int16_t, TE_i64>(ins, vstack, env, m); break;
    case OP_i64_store32: ValidateStore<int32_t, TE_i64>(ins, vstack, env, m); break;
    case OP_memory_size:
      if(!ModuleMemory(m, 0))
        AppendError(env, ERR_INVALID_MEMORY_INDEX, "[%zu] No default linear memory in module.", ins.offset);
      vstack.PushOpd(TE_i32);
      break;
    case OP_memory_grow:
      if(!ModuleMemory(m, 0))
        AppendError(env, ERR_INVALID_MEMORY_INDEX, "[%zu] No default linear memory in module.", ins.offset);
      vstack.Op(ins, { TE_i32 }, TE_i32);
      break;

      // Constants
    case OP_i32_const: vstack.PushOpd(TE_i32); break;
    case OP_i64_const: vstack.PushOpd(TE_i64); break;
    case OP_f32_const: vstack.PushOpd(TE_f32); break;
    case OP_f64_const:
      vstack.PushOpd(TE_f64);
      break;

      // Comparison operators
    case OP_i32_eqz: ValidateUnaryOp<TE_i32, TE_i32>(ins, vstack); break;
    case OP_i32_eq:
    case OP_i32_ne:
    case OP_i32_lt_s:
    case OP_i32_lt_u:
    case OP_i32_gt_s:
    case OP_i32_gt_u:
    case OP_i32_le_s:
    case OP_i32_le_u:
    case OP_i32_ge_s:
    case OP_i32_ge_u: ValidateBinaryOp<TE_i32, TE_i32, TE_i32>(ins, vstack); break;
    case OP_i64_eqz: ValidateUnaryOp<TE_i64, TE_i32>(ins, vstack); break;
    case OP_i64_eq:
    case OP_i64_ne:
    case OP_i64_lt_s:
    case OP_i64_lt_u:
    case OP_i64_gt_s:
    case OP_i64_gt_u:
    case OP_i64_le_s:
    case OP_i64_le_u:
    case OP_i64_ge_s:
    case OP_i64_ge_u: ValidateBinaryOp<TE_i64, TE_i64, TE_i32>(ins, vstack); break;
    case OP_f32_eq:
    case OP_f32_ne:
    case OP_f32_lt:
    case OP_f32_gt:
    case OP_f32_le:
    case OP_f32_ge: ValidateBinaryOp<TE_f32, TE_f32, TE_i32>(ins, vstack); break;
    case OP_f64_eq:
    case OP_f64_ne:
    case OP_f64_lt:
    case OP_f64_gt:
    case OP_f64_le:
    case OP_f64_ge:
      ValidateBinaryOp<TE_f64, TE_f64, TE_i32>(ins, vstack);
      break;

      // Numeric operators
    case OP_i32_clz:
    case OP_i32_ctz:
    case OP_i32_popcnt: ValidateUnaryOp<TE_i32, TE_i32>(ins, vstack); break;
    case OP_i32_add:
    case OP_i32_sub:
    case OP_i32_mul:
    case OP_i32_div_s:
    case OP_i32_div_u:
    case OP_i32_rem_s:
    case OP_i32_rem_u:
    case OP_i32_and:
    case OP_i32_or:
    case OP_i32_xor:
    case OP_i32_shl:
    case OP_i32_shr_s:
    case OP_i32_shr_u:
    case OP_i32_rotl:
    case OP_i32_rotr: ValidateBinaryOp<TE_i32, TE_i32, TE_i32>(ins, vstack); break;
    case OP_i64_clz:
    case OP_i64_ctz:
    case OP_i64_popcnt: ValidateUnaryOp<TE_i64, TE_i64>(ins, vstack); break;
    case OP_i64_add:
    case OP_i64_sub:
    case OP_i64_mul:
    case OP_i64_div_s:
    case OP_i64_div_u:
    case OP_i64_rem_s:
    case OP_i64_rem_u:
    case OP_i64_and:
    case OP_i64_or:
    case OP_i64_xor:
    case OP_i64_shl:
    case OP_i64_shr_s:
    case OP_i64_shr_u:
    case OP_i64_rotl:
    case OP_i64_rotr: ValidateBinaryOp<TE_i64, TE_i64, TE_i64>(ins, vstack); break;
    case OP_f32_abs:
    case OP_f32_neg:
    case OP_f32_ceil:
    case OP_f32_floor:
    case OP_f32_trunc:
    case OP_f32_nearest:
    case OP_f32_sqrt: ValidateUnaryOp<TE_f32, TE_f32>(ins, vstack); break;
    case OP_f32_add:
    case OP_f32_sub:
    case OP_f32_mul:
    case OP_f32_div:
    case OP_f32_min:
    case OP_f32_max:
    case OP_f32_copysign: ValidateBinaryOp<TE_f32, TE_f32, TE_f32>(ins, vstack); break;
    case OP_f64_abs:
    case OP_f64_neg:
    case OP_f64_ceil:
    case OP_f64_floor:
    case OP_f64_trunc:
    case OP_f64_nearest:
    case OP_f64_sqrt: ValidateUnaryOp<TE_f64, TE_f64>(ins, vstack); break;
    case OP_f64_add:
    case OP_f64_sub:
    case OP_f64_mul:
    case OP_f64_div:
    case OP_f64_min:
    case OP_f64_max:
    case OP_f64_copysign:
      ValidateBinaryOp<TE_f64, TE_f64, TE_f64>(ins, vstack);
      break;

      // Conversions
    case OP_i32_wrap_i64: ValidateUnaryOp<TE_i64, TE_i32>(ins, vstack); break;
    case OP_i32_trunc_f32_s:
    case OP_i32_trunc_f32_u: ValidateUnaryOp<TE_f32, TE_i32>(ins, vstack); break;
    case OP_i32_trunc_f64_s:
    case OP_i32_trunc_f64_u: ValidateUnaryOp<TE_f64, TE_i32>(ins, vstack); break;
    case OP_i64_extend_i32_s:
    case OP_i64_extend_i32_u: ValidateUnaryOp<TE_i32, TE_i64>(ins, vstack); break;
    case OP_i64_trunc_f32_s:
    case OP_i64_trunc_f32_u: ValidateUnaryOp<TE_f32, TE_i64>(ins, vstack); break;
    case OP_i64_trunc_f64_s:
    case OP_i64_trunc_f64_u: ValidateUnaryOp<TE_f64, TE_i64>(ins, vstack); break;
    case OP_f32_convert_i32_s:
    case OP_f32_convert_i32_u: ValidateUnaryOp<TE_i32, TE_f32>(ins, vstack); break;
    case OP_f32_convert_i64_s:
    case OP_f32_convert_i64_u: ValidateUnaryOp<TE_i64, TE_f32>(ins, vstack); break;
    case OP_f32_demote_f64: ValidateUnaryOp<TE_f64, TE_f32>(ins, vstack); break;
    case OP_f64_convert_i32_s:
    case OP_f64_convert_i32_u: ValidateUnaryOp<TE_i32, TE_f64>(ins, vstack); break;
    case OP_f64_convert_i64_s:
    case OP_f64_convert_i64_u: ValidateUnaryOp<TE_i64, TE_f64>(ins, vstack); break;
    case OP_f64_promote_f32:
      ValidateUnaryOp<TE_f32, TE_f64>(ins, vstack);
      break;

      // Reinterpretations
    case OP_i32_reinterpret_f32: ValidateUnaryOp<TE_f32, TE_i32>(ins, vstack); break;
    case OP_i64_reinterpret_f64: ValidateUnaryOp<TE_f64, TE_i64>(ins, vstack); break;
    case OP_f32_reinterpret_i32: ValidateUnaryOp<TE_i32, TE_f32>(ins, vstack); break;
    case OP_f64_reinterpret_i64: ValidateUnaryOp<TE_i64, TE_f64>(ins, vstack); break;

    case OP_i32_extend8_s:
    case OP_i32_extend16_s: ValidateUnaryOp<TE_i32, TE_i32>(ins, vstack); break;
    case OP_i64_extend8_s:
    case OP_i64_extend16_s:
    case OP_i64_extend32_s: ValidateUnaryOp<TE_i64, TE_i64>(ins, vstack); break;

    case OP_misc_ops_prefix: ValidateMiscOp(ins, vstack, env); break;

    default:
      AppendError(env, ERR_FATAL_UNKNOWN_INSTRUCTION, "[%zu] Unknown instruction code %hhu", ins.offset, ins.opcode[0]);
    }
  }

  template<class T, void (*VALIDATE)(const T&, Environment&, const Module&)>
  void ValidateSection(const std::vector<T>& a, Environment& env, const Module& m)
  {
    for(auto& item : a)
      VALIDATE(item, env, m);
  }
}

varsint7 wasmjit::ValidateInitializer(const Instruction& ins, Environment& env, const Module& m)
{
  switch(ins.opcode[0])
  {
  case OP_i32_const: return TE_i32;
  case OP_i64_const: return TE_i64;
  case OP_f32_const: return TE_f32;
  case OP_f64_const: return TE_f64;
  case OP_global_get:
  {
    const Import* imp = ModuleImport(m, WASM_KIND_GLOBAL, ins.immediates[0]._varuint32);
    if(!ModuleGlobal(m, ins.immediates[0]._varuint32))
      AppendError(env, ERR_INVALID_GLOBAL_INDEX, "[%zu] Invalid global index %u for global.get.", ins.offset,
                  ins.immediates[0]._varuint32);
    else if(imp != nullptr)
      return imp->global_desc.type;
    else
      AppendError(env, ERR_INVALID_GLOBAL_INITIALIZER, "[%zu] A global.get initializer must refer to an import.",
                  ins.offset);
    return TE_NONE;
  }
  }

  AppendError(env, ERR_FATAL_INVALID_INITIALIZER, "[%zu] An initializer must be a global.get or const instruction, not %s",
              ins.offset, OpName(ins));
  return TE_NONE;
}

void wasmjit::ValidateGlobal(const GlobalDecl& decl, Environment& env, const Module& m)
{
  varsint7 type = ValidateInitializer(decl.init, env, m);
  if(type != TE_NONE && type != decl.desc.type)
  {
    char buf[10];
    char buf2[10];
    AppendError(env, ERR_INVALID_INITIALIZER_TYPE,
                "The global initializer has type %s, must be the same as the description type %s.",
                EnumToString(TYPE_ENCODING_MAP, type, buf, 10), EnumToString(TYPE_ENCODING_MAP, decl.desc.type, buf2, 10));
  }
}

void wasmjit::ValidateExport(const Export& e, Environment& env, const Module& m)
{
  // An export of a kind the module has nothing of is left for instantiation to reject with ERR_MODULE_LOAD
  bool valid = true;
  switch(e.kind)
  {
  case WASM_KIND_FUNCTION: valid = !ModuleFunctionCount(m) || ModuleFunction(m, e.index) != nullptr; break;
  case WASM_KIND_TABLE: valid = !ModuleTableCount(m) || ModuleTable(m, e.index) != nullptr; break;
  case WASM_KIND_MEMORY: valid = !ModuleMemoryCount(m) || ModuleMemory(m, e.index) != nullptr; break;
  case WASM_KIND_GLOBAL: valid = !ModuleGlobalCount(m) || ModuleGlobal(m, e.index) != nullptr; break;
  default:
    AppendError(env, ERR_FATAL_UNKNOWN_KIND, "The %s export has invalid kind %hhu", e.name.c_str(), e.kind);
    return;
  }

  if(!valid)
  {
    char buf[10];
    AppendError(env, ERR_INVALID_EXPORT_INDEX, "The %s export refers to invalid %s index %u", e.name.c_str(),
                EnumToString(KIND_MAP, e.kind, buf, 10), e.index);
  }
}

void wasmjit::ValidateTableOffset(const TableInit& init, Environment& env, const Module& m)
{
  varsint7 type = ValidateInitializer(init.offset, env, m);
  if(type != TE_NONE && type != TE_i32)
  {
    char buf[10];
    AppendError(env, ERR_INVALID_INITIALIZER_TYPE, "Expected table offset instruction type of i32, got %s instead.",
                EnumToString(TYPE_ENCODING_MAP, type, buf, 10));
  }

  if(!ModuleTable(m, init.index))
    AppendError(env, ERR_INVALID_TABLE_INDEX, "Invalid table index %u", init.index);

  for(size_t i = 0; i < init.elements.size(); ++i)
    if(!ModuleFunction(m, init.elements[i]))
      AppendError(env, ERR_INVALID_FUNCTION_INDEX, "Invalid element initializer %zu function index: %u", i,
                  init.elements[i]);
}

void wasmjit::ValidateFunctionBody(const FunctionType& sig, const FunctionBody& body, Environment& env, const Module& m)
{
  ValidationStack vstack{ env, m };
  if(sig.returns.size() > 1) // Don't pollute the output with more errors.
    return;

  // Calculate function locals
  if(sig.params.size() > (std::numeric_limits<uint32_t>::max() - body.local_size))
  {
    AppendError(env, ERR_FATAL_TOO_MANY_LOCALS, "n_local + n_params exceeds the max value of uint32!");
    return;
  }

  std::vector<varsint7> locals(sig.params);
  locals.reserve(sig.params.size() + body.local_size);
  for(auto& local : body.locals)
    locals.insert(locals.end(), local.count, local.type);

  // Push the function body block with the function signature
  vstack.PushCtrl(OP_block, sig.returns.empty() ? (varsint7)TE_void : sig.returns[0]);

  for(auto& ins : body.body)
  {
    if(!vstack.ctrls.Size())
    {
      AppendError(env, ERR_END_MISMATCH, "[%zu] Found %s after the end of the function body.", ins.offset, OpName(ins));
      return;
    }
    ValidateInstruction(ins, vstack, locals, env, m);
  }

  if(vstack.ctrls.Size() > 0)
    AppendError(env, ERR_END_MISMATCH, "Control stack not fully terminated, off by %zu", vstack.ctrls.Size());

  // The final end pushed the function results back onto the stack
  for(size_t i = sig.returns.size(); i-- > 0;)
    if(vstack.opds.Size() > 0)
      vstack.opds.Pop();

  if(vstack.opds.Size() > 0)
    AppendError(env, ERR_INVALID_VALUE_STACK, "Value stack not fully empty, off by %zu", vstack.opds.Size());
}

void wasmjit::ValidateDataOffset(const DataInit& init, Environment& env, const Module& m)
{
  varsint7 type = ValidateInitializer(init.offset, env, m);
  if(type != TE_NONE && type != TE_i32)
  {
    char buf[10];
    AppendError(env, ERR_INVALID_INITIALIZER_TYPE, "Expected memory offset instruction type of i32, got %s instead.",
                EnumToString(TYPE_ENCODING_MAP, type, buf, 10));
  }

  if(!ModuleMemory(m, init.index))
    AppendError(env, ERR_INVALID_MEMORY_INDEX, "Invalid memory index %u", init.index);
}

void wasmjit::ValidateModuleBody(Environment& env, const Module& m)
{
  if(ModuleTable(m, 1) != nullptr)
    AppendError(env, ERR_MULTIPLE_TABLES, "Cannot have more than 1 table defined.");
  if(ModuleMemory(m, 1) != nullptr)
    AppendError(env, ERR_MULTIPLE_MEMORIES, "Cannot have more than 1 memory defined.");

  ValidateSection<FunctionType, &ValidateFunctionSig>(m.type.functypes, env, m);
  ValidateSection<Import, &ValidateImport>(m.importsection.imports, env, m);
  ValidateSection<FunctionDesc, &ValidateFunction>(m.function.funcdecl, env, m);

  if(m.function.funcdecl.size() != m.code.funcbody.size())
    AppendError(env, ERR_FUNCTION_BODY_MISMATCH,
                "The number of function declarations (%zu) does not equal the number of function bodies (%zu)",
                m.function.funcdecl.size(), m.code.funcbody.size());

  ValidateSection<TableDesc, &ValidateTable>(m.table.tables, env, m);
  ValidateSection<MemoryDesc, &ValidateMemory>(m.memory.memories, env, m);
  ValidateSection<GlobalDecl, &ValidateGlobal>(m.global.globals, env, m);
  ValidateSection<Export, &ValidateExport>(m.exportsection.exports, env, m);

  if(ModuleHasSection(m, WASM_SECTION_START))
  {
    const FunctionType* f = ModuleFunction(m, m.start);
    if(f)
    {
      if(f->params.size() > 0 || f->returns.size() > 0)
        AppendError(env, ERR_INVALID_START_FUNCTION,
                    "Starting function must have no parameters and no return value, instead it has %zu parameters and "
                    "%zu return values.",
                    f->params.size(), f->returns.size());
    }
    else
      AppendError(env, ERR_INVALID_FUNCTION_INDEX, "Start module function index %u does not exist.", m.start);
  }

  ValidateSection<TableInit, &ValidateTableOffset>(m.element.elements, env, m);

  for(size_t j = 0; j < m.code.funcbody.size() && j < m.function.funcdecl.size(); ++j)
  {
    if(m.function.funcdecl[j].type_index < m.type.functypes.size())
      ValidateFunctionBody(m.type.functypes[m.function.funcdecl[j].type_index], m.code.funcbody[j], env, m);
  }

  ValidateSection<DataInit, &ValidateDataOffset>(m.data.data, env, m);
}

WJ_ERROR wasmjit::ValidateModule(Environment& env, const Module& m)
{
  size_t first = env.errors.size();
  ValidateModuleBody(env, m);

  if(env.errors.size() == first)
    return ERR_SUCCESS;

  // Report the first problem found, every error is still listed in env.errors
  WJ_ERROR err = static_cast<WJ_ERROR>(env.errors[first].code);
  return LogErrorString(env, "%s: module failed validation with %zu errors, first: %s", err, env.errors.size() - first,
                        env.errors[first].error.c_str());
}
