// Copyright (c)2021 Fundament Software
// For conditions of distribution and use, see copyright notice in wasmjit.h

#include "test.h"
#include <math.h>
#include <limits>

using namespace wasmjit;

namespace {
  struct NamedOp
  {
    const char* name;
    uint8_t op;
  };

  // Exports one function per opcode, each applying the opcode to its parameters.
  void AddOps(WasmWriter& w, uint32_t type, uint32_t params, const NamedOp* ops, size_t n)
  {
    for(size_t i = 0; i < n; ++i)
    {
      Code code;
      for(uint32_t p = 0; p < params; ++p)
        code.LocalGet(p);
      code.Op(ops[i].op);
      w.Export(ops[i].name, WASM_KIND_FUNCTION, w.AddFunction(type, code));
    }
  }

  template<typename R, typename... Args>
  R CallOr(const std::shared_ptr<Instance>& inst, const char* name, R fallback, Args... args)
  {
    auto f = !inst ? nullptr : inst->GetFunction(name);
    R r;
    if(!f || f->Call(r, args...) != ERR_SUCCESS)
      return fallback;
    return r;
  }
}

void TestHarness::test_instructions()
{
  {
    static const NamedOp ops[] = {
      { "add", OP_i32_add },     { "sub", OP_i32_sub },     { "mul", OP_i32_mul },     { "div_s", OP_i32_div_s },
      { "div_u", OP_i32_div_u }, { "rem_s", OP_i32_rem_s }, { "rem_u", OP_i32_rem_u }, { "and", OP_i32_and },
      { "or", OP_i32_or },       { "xor", OP_i32_xor },     { "shl", OP_i32_shl },     { "shr_s", OP_i32_shr_s },
      { "shr_u", OP_i32_shr_u }, { "rotl", OP_i32_rotl },   { "rotr", OP_i32_rotr },   { "lt_s", OP_i32_lt_s },
      { "lt_u", OP_i32_lt_u },   { "ge_s", OP_i32_ge_s },   { "eq", OP_i32_eq },
    };
    static const NamedOp unary[] = { { "clz", OP_i32_clz },       { "ctz", OP_i32_ctz },
                                     { "popcnt", OP_i32_popcnt }, { "eqz", OP_i32_eqz },
                                     { "ext8", OP_i32_extend8_s }, { "ext16", OP_i32_extend16_s } };

    WasmWriter w;
    AddOps(w, w.AddType({ TE_i32, TE_i32 }, { TE_i32 }), 2, ops, sizeof(ops) / sizeof(NamedOp));
    AddOps(w, w.AddType({ TE_i32 }, { TE_i32 }), 1, unary, sizeof(unary) / sizeof(NamedOp));

    std::shared_ptr<Instance> inst;
    TESTERR(Instantiate(w, inst), ERR_SUCCESS);
    const int32_t X = 0x7EADBEEF;

    TEST(CallOr(inst, "add", X, 2, 3) == 5);
    TEST(CallOr(inst, "add", X, std::numeric_limits<int32_t>::max(), 1) == std::numeric_limits<int32_t>::min());
    TEST(CallOr(inst, "sub", X, 2, 5) == -3);
    TEST(CallOr(inst, "mul", X, -7, 6) == -42);
    TEST(CallOr(inst, "div_s", X, -7, 2) == -3);
    TEST(CallOr(inst, "div_u", X, -1, 2) == 0x7FFFFFFF);
    TEST(CallOr(inst, "rem_s", X, -7, 2) == -1);
    TEST(CallOr(inst, "rem_s", X, std::numeric_limits<int32_t>::min(), -1) == 0);
    TEST(CallOr(inst, "rem_u", X, -1, 10) == 5);
    TEST(CallOr(inst, "and", X, 0xF0F0, 0xFF00) == 0xF000);
    TEST(CallOr(inst, "or", X, 0xF0F0, 0x0F00) == 0xFFF0);
    TEST(CallOr(inst, "xor", X, 0xFF, 0x0F) == 0xF0);
    TEST(CallOr(inst, "shl", X, 1, 33) == 2); // Shift counts are taken modulo the bit width
    TEST(CallOr(inst, "shr_s", X, -8, 1) == -4);
    TEST(CallOr(inst, "shr_u", X, -8, 1) == 0x7FFFFFFC);
    TEST(CallOr(inst, "rotl", X, static_cast<int32_t>(0x80000001), 1) == 3);
    TEST(CallOr(inst, "rotr", X, 1, 1) == static_cast<int32_t>(0x80000000));
    TEST(CallOr(inst, "lt_s", X, -1, 0) == 1);
    TEST(CallOr(inst, "lt_u", X, -1, 0) == 0);
    TEST(CallOr(inst, "ge_s", X, 4, 4) == 1);
    TEST(CallOr(inst, "eq", X, 4, 5) == 0);
    TEST(CallOr(inst, "clz", X, 1) == 31);
    TEST(CallOr(inst, "clz", X, 0) == 32);
    TEST(CallOr(inst, "ctz", X, 0) == 32);
    TEST(CallOr(inst, "ctz", X, 8) == 3);
    TEST(CallOr(inst, "popcnt", X, 0xFF) == 8);
    TEST(CallOr(inst, "eqz", X, 0) == 1);
    TEST(CallOr(inst, "eqz", X, 9) == 0);
    TEST(CallOr(inst, "ext8", X, 0x80) == -128);
    TEST(CallOr(inst, "ext16", X, 0x7FFF) == 0x7FFF);
  }

  {
    static const NamedOp ops[] = { { "add", OP_i64_add },     { "mul", OP_i64_mul },     { "div_s", OP_i64_div_s },
                                   { "rem_u", OP_i64_rem_u }, { "shl", OP_i64_shl },     { "shr_s", OP_i64_shr_s },
                                   { "rotl", OP_i64_rotl },   { "and", OP_i64_and } };
    static const NamedOp unary[] = { { "clz", OP_i64_clz },
                                     { "popcnt", OP_i64_popcnt },
                                     { "ext32", OP_i64_extend32_s } };

    WasmWriter w;
    AddOps(w, w.AddType({ TE_i64, TE_i64 }, { TE_i64 }), 2, ops, sizeof(ops) / sizeof(NamedOp));
    AddOps(w, w.AddType({ TE_i64 }, { TE_i64 }), 1, unary, sizeof(unary) / sizeof(NamedOp));

    std::shared_ptr<Instance> inst;
    TESTERR(Instantiate(w, inst), ERR_SUCCESS);
    const int64_t X = 0x7EADBEEF;

    TEST(CallOr<int64_t>(inst, "add", X, int64_t(0xFFFFFFFF), int64_t(1)) == int64_t(0x100000000));
    TEST(CallOr<int64_t>(inst, "mul", X, int64_t(0x100000000), int64_t(0x100000000)) == 0);
    TEST(CallOr<int64_t>(inst, "div_s", X, int64_t(-9), int64_t(4)) == -2);
    TEST(CallOr<int64_t>(inst, "rem_u", X, int64_t(-1), int64_t(10)) == 5);
    TEST(CallOr<int64_t>(inst, "shl", X, int64_t(1), int64_t(65)) == 2);
    TEST(CallOr<int64_t>(inst, "shr_s", X, int64_t(-16), int64_t(2)) == -4);
    TEST(CallOr<int64_t>(inst, "rotl", X, static_cast<int64_t>(0x8000000000000001ULL), int64_t(1)) == 3);
    TEST(CallOr<int64_t>(inst, "and", X, int64_t(0x1234567890), int64_t(0xFF00)) == 0x7800);
    TEST(CallOr<int64_t>(inst, "clz", X, int64_t(1)) == 63);
    TEST(CallOr<int64_t>(inst, "popcnt", X, int64_t(-1)) == 64);
    TEST(CallOr<int64_t>(inst, "ext32", X, int64_t(0x80000000)) == int64_t(-2147483648));
  }

  {
    static const NamedOp ops[] = { { "add", OP_f64_add }, { "div", OP_f64_div }, { "min", OP_f64_min },
                                   { "max", OP_f64_max }, { "copysign", OP_f64_copysign } };
    static const NamedOp unary[] = { { "sqrt", OP_f64_sqrt },   { "nearest", OP_f64_nearest }, { "floor", OP_f64_floor },
                                     { "ceil", OP_f64_ceil },   { "trunc", OP_f64_trunc },     { "abs", OP_f64_abs },
                                     { "neg", OP_f64_neg } };
    static const NamedOp f32ops[] = { { "fmin", OP_f32_min }, { "fmul", OP_f32_mul } };

    WasmWriter w;
    AddOps(w, w.AddType({ TE_f64, TE_f64 }, { TE_f64 }), 2, ops, sizeof(ops) / sizeof(NamedOp));
    AddOps(w, w.AddType({ TE_f64 }, { TE_f64 }), 1, unary, sizeof(unary) / sizeof(NamedOp));
    AddOps(w, w.AddType({ TE_f32, TE_f32 }, { TE_f32 }), 2, f32ops, sizeof(f32ops) / sizeof(NamedOp));

    std::shared_ptr<Instance> inst;
    TESTERR(Instantiate(w, inst), ERR_SUCCESS);
    const double X = 12345.0;

    TEST(CallOr(inst, "add", X, 0.5, 0.25) == 0.75);
    TEST(isinf(CallOr(inst, "div", X, 1.0, 0.0)));
    TEST(isnan(CallOr(inst, "min", X, static_cast<double>(NAN), 1.0)));
    TEST(isnan(CallOr(inst, "max", X, 1.0, static_cast<double>(NAN))));
    TEST(CallOr(inst, "min", X, -1.0, 2.0) == -1.0);
    TEST(signbit(CallOr(inst, "min", X, -0.0, 0.0)));
    TEST(signbit(CallOr(inst, "min", X, 0.0, -0.0)));
    TEST(!signbit(CallOr(inst, "max", X, -0.0, 0.0)));
    TEST(CallOr(inst, "copysign", X, 3.0, -0.0) == -3.0);
    TEST(CallOr(inst, "sqrt", X, 2.25) == 1.5);
    TEST(CallOr(inst, "nearest", X, 2.5) == 2.0);
    TEST(CallOr(inst, "nearest", X, 3.5) == 4.0);
    TEST(CallOr(inst, "nearest", X, -0.5) == 0.0);
    TEST(CallOr(inst, "floor", X, -1.5) == -2.0);
    TEST(CallOr(inst, "ceil", X, -1.5) == -1.0);
    TEST(CallOr(inst, "trunc", X, -1.7) == -1.0);
    TEST(!signbit(CallOr(inst, "abs", X, -0.0)));
    TEST(CallOr(inst, "neg", X, 2.0) == -2.0);
    TEST(CallOr(inst, "fmul", 0.0f, 1.5f, 2.0f) == 3.0f);
    TEST(isnan(CallOr(inst, "fmin", 0.0f, 1.0f, NAN)));
  }

  {
    // Conversions
    WasmWriter w;
    auto i64_i32 = w.AddType({ TE_i64 }, { TE_i32 });
    auto i32_i64 = w.AddType({ TE_i32 }, { TE_i64 });
    auto i32_f64 = w.AddType({ TE_i32 }, { TE_f64 });
    auto f64_i32 = w.AddType({ TE_f64 }, { TE_i32 });
    auto f32_i32 = w.AddType({ TE_f32 }, { TE_i32 });
    auto f64_f32 = w.AddType({ TE_f64 }, { TE_f32 });

    w.Export("wrap", WASM_KIND_FUNCTION, w.AddFunction(i64_i32, Code().LocalGet(0).Op(OP_i32_wrap_i64)));
    w.Export("extend_s", WASM_KIND_FUNCTION, w.AddFunction(i32_i64, Code().LocalGet(0).Op(OP_i64_extend_i32_s)));
    w.Export("extend_u", WASM_KIND_FUNCTION, w.AddFunction(i32_i64, Code().LocalGet(0).Op(OP_i64_extend_i32_u)));
    w.Export("convert_u", WASM_KIND_FUNCTION, w.AddFunction(i32_f64, Code().LocalGet(0).Op(OP_f64_convert_i32_u)));
    w.Export("convert_s", WASM_KIND_FUNCTION, w.AddFunction(i32_f64, Code().LocalGet(0).Op(OP_f64_convert_i32_s)));
    w.Export("trunc_s", WASM_KIND_FUNCTION, w.AddFunction(f64_i32, Code().LocalGet(0).Op(OP_i32_trunc_f64_s)));
    w.Export("trunc_u", WASM_KIND_FUNCTION, w.AddFunction(f64_i32, Code().LocalGet(0).Op(OP_i32_trunc_f64_u)));
    w.Export("reinterpret", WASM_KIND_FUNCTION, w.AddFunction(f32_i32, Code().LocalGet(0).Op(OP_i32_reinterpret_f32)));
    w.Export("demote", WASM_KIND_FUNCTION, w.AddFunction(f64_f32, Code().LocalGet(0).Op(OP_f32_demote_f64)));
    w.Export("sat_s", WASM_KIND_FUNCTION, w.AddFunction(f64_i32, Code().LocalGet(0).Misc(OP_i32_trunc_sat_f64_s)));
    w.Export("sat_u", WASM_KIND_FUNCTION, w.AddFunction(f64_i32, Code().LocalGet(0).Misc(OP_i32_trunc_sat_f64_u)));
    w.Export("sat_f32", WASM_KIND_FUNCTION, w.AddFunction(f32_i32, Code().LocalGet(0).Misc(OP_i32_trunc_sat_f32_s)));

    std::shared_ptr<Instance> inst;
    TESTERR(Instantiate(w, inst), ERR_SUCCESS);
    const int32_t X = 0x7EADBEEF;

    TEST(CallOr(inst, "wrap", X, int64_t(0x100000005)) == 5);
    TEST(CallOr<int64_t>(inst, "extend_s", 0, -1) == -1);
    TEST(CallOr<int64_t>(inst, "extend_u", 0, -1) == int64_t(0xFFFFFFFF));
    TEST(CallOr(inst, "convert_u", 0.0, -1) == 4294967295.0);
    TEST(CallOr(inst, "convert_s", 0.0, -1) == -1.0);
    TEST(CallOr(inst, "trunc_s", X, -3.9) == -3);
    TEST(CallOr(inst, "trunc_s", X, 2147483647.9) == 2147483647);
    TEST(CallOr(inst, "trunc_u", X, 4294967295.0) == -1);
    TEST(CallOr(inst, "trunc_u", X, -0.9) == 0);
    TEST(CallOr(inst, "reinterpret", X, 1.0f) == 0x3F800000);
    TEST(CallOr(inst, "demote", 0.0f, 0.5) == 0.5f);
    TEST(CallOr(inst, "sat_s", X, 1e10) == std::numeric_limits<int32_t>::max());
    TEST(CallOr(inst, "sat_s", X, -1e10) == std::numeric_limits<int32_t>::min());
    TEST(CallOr(inst, "sat_s", X, static_cast<double>(NAN)) == 0);
    TEST(CallOr(inst, "sat_s", X, -7.5) == -7);
    TEST(CallOr(inst, "sat_u", X, -5.0) == 0);
    TEST(CallOr(inst, "sat_u", X, 1e20) == -1);
    TEST(CallOr(inst, "sat_f32", X, static_cast<float>(INFINITY)) == std::numeric_limits<int32_t>::max());
  }

  {
    // Control flow
    WasmWriter w;
    auto i64_i64 = w.AddType({ TE_i64 }, { TE_i64 });
    auto i32_i32 = w.AddType({ TE_i32 }, { TE_i32 });
    auto sel     = w.AddType({ TE_i32, TE_i32, TE_i32 }, { TE_i32 });

    // Recursive factorial, function 0
    w.Export("fac", WASM_KIND_FUNCTION,
             w.AddFunction(i64_i64, Code()
                                      .LocalGet(0)
                                      .Op(OP_i64_eqz)
                                      .Block(OP_if, TE_i64)
                                      .I64(1)
                                      .Op(OP_else)
                                      .LocalGet(0)
                                      .LocalGet(0)
                                      .I64(1)
                                      .Op(OP_i64_sub)
                                      .Call(0)
                                      .Op(OP_i64_mul)
                                      .End()));

    // Sums 1..n with a loop
    w.Export("sum", WASM_KIND_FUNCTION,
             w.AddFunction(i32_i32,
                           Code()
                             .Block(OP_block, TE_void)
                             .Block(OP_loop, TE_void)
                             .LocalGet(0)
                             .Op(OP_i32_eqz)
                             .Br(OP_br_if, 1)
                             .LocalGet(1)
                             .LocalGet(0)
                             .Op(OP_i32_add)
                             .LocalSet(1)
                             .LocalGet(0)
                             .I32(1)
                             .Op(OP_i32_sub)
                             .LocalSet(0)
                             .Br(OP_br, 0)
                             .End()
                             .End()
                             .LocalGet(1),
                           { { 1, TE_i32 } }));

    w.Export("switch", WASM_KIND_FUNCTION,
             w.AddFunction(i32_i32, Code()
                                      .Block(OP_block, TE_void)
                                      .Block(OP_block, TE_void)
                                      .Block(OP_block, TE_void)
                                      .LocalGet(0)
                                      .BrTable({ 0, 1 }, 2)
                                      .End()
                                      .I32(100)
                                      .Op(OP_return)
                                      .End()
                                      .I32(101)
                                      .Op(OP_return)
                                      .End()
                                      .I32(102)));

    // A block result carried out by a branch
    w.Export("brval", WASM_KIND_FUNCTION,
             w.AddFunction(i32_i32, Code()
                                      .Block(OP_block, TE_i32)
                                      .I32(7)
                                      .LocalGet(0)
                                      .Br(OP_br_if, 0)
                                      .Op(OP_drop)
                                      .I32(9)
                                      .End()));

    w.Export("select", WASM_KIND_FUNCTION,
             w.AddFunction(sel, Code().LocalGet(0).LocalGet(1).LocalGet(2).Op(OP_select)));

    // if without else, local.tee
    w.Export("tee", WASM_KIND_FUNCTION,
             w.AddFunction(i32_i32, Code()
                                      .LocalGet(0)
                                      .Block(OP_if, TE_void)
                                      .I32(40)
                                      .LocalSet(1)
                                      .End()
                                      .LocalGet(1)
                                      .I32(2)
                                      .Op(OP_i32_add)
                                      .LocalTee(1)
                                      .LocalGet(1)
                                      .Op(OP_i32_add),
                           { { 1, TE_i32 } }));

    std::shared_ptr<Instance> inst;
    TESTERR(Instantiate(w, inst), ERR_SUCCESS);

    TEST(CallOr<int64_t>(inst, "fac", 0, int64_t(0)) == 1);
    TEST(CallOr<int64_t>(inst, "fac", 0, int64_t(10)) == 3628800);
    TEST(CallOr<int64_t>(inst, "fac", 0, int64_t(20)) == int64_t(2432902008176640000));
    TEST(CallOr(inst, "sum", 0, 0) == 0);
    TEST(CallOr(inst, "sum", 0, 100) == 5050);
    TEST(CallOr(inst, "switch", 0, 0) == 100);
    TEST(CallOr(inst, "switch", 0, 1) == 101);
    TEST(CallOr(inst, "switch", 0, 2) == 102);
    TEST(CallOr(inst, "switch", 0, -1) == 102);
    TEST(CallOr(inst, "brval", 0, 1) == 7);
    TEST(CallOr(inst, "brval", 0, 0) == 9);
    TEST(CallOr(inst, "select", 0, 1, 2, 1) == 1);
    TEST(CallOr(inst, "select", 0, 1, 2, 0) == 2);
    TEST(CallOr(inst, "tee", 0, 1) == 84);
    TEST(CallOr(inst, "tee", 0, 0) == 4);
  }

  {
    // Globals persist between calls and are shared with the host
    WasmWriter w;
    auto v_i32 = w.AddType({}, { TE_i32 });
    w.AddGlobal(TE_i32, true, Code().I32(10));
    w.AddGlobal(TE_i64, false, Code().I64(-5));
    w.Export("inc", WASM_KIND_FUNCTION,
             w.AddFunction(v_i32, Code().GlobalGet(0).I32(1).Op(OP_i32_add).GlobalSet(0).GlobalGet(0)));
    w.Export("g", WASM_KIND_GLOBAL, 0);
    w.Export("c", WASM_KIND_GLOBAL, 1);

    std::shared_ptr<Instance> inst;
    TESTERR(Instantiate(w, inst), ERR_SUCCESS);
    TEST(CallOr(inst, "inc", 0) == 11);
    TEST(CallOr(inst, "inc", 0) == 12);

    auto g = !inst ? nullptr : inst->GetGlobal("g");
    auto c = !inst ? nullptr : inst->GetGlobal("c");
    TEST(g != nullptr);
    TEST(c != nullptr);
    if(g && c)
    {
      TEST(g->Get().i32 == 12);
      TESTERR(g->Set(Value::I32(100)), ERR_SUCCESS);
      TEST(CallOr(inst, "inc", 0) == 101);
      TEST(c->Get().type == TE_i64);
      TEST(c->Get().i64 == -5);
      TESTERR(c->Set(Value::I64(1)), ERR_IMMUTABLE_GLOBAL);
    }
  }

  {
    // Linear memory
    WasmWriter w;
    auto i32_i32  = w.AddType({ TE_i32 }, { TE_i32 });
    auto i32_i64  = w.AddType({ TE_i32 }, { TE_i64 });
    auto store    = w.AddType({ TE_i32, TE_i32 }, {});
    auto v_i32    = w.AddType({}, { TE_i32 });
    w.AddMemory(1, true, 2);
    w.Data(0, Code().I32(8), std::string("\x01\x02\x03\x04\xFF", 5));

    w.Export("load", WASM_KIND_FUNCTION, w.AddFunction(i32_i32, Code().LocalGet(0).Mem(OP_i32_load, 2, 0)));
    w.Export("load8_s", WASM_KIND_FUNCTION, w.AddFunction(i32_i32, Code().LocalGet(0).Mem(OP_i32_load8_s, 0, 0)));
    w.Export("load8_u", WASM_KIND_FUNCTION, w.AddFunction(i32_i32, Code().LocalGet(0).Mem(OP_i32_load8_u, 0, 0)));
    w.Export("load32_s", WASM_KIND_FUNCTION, w.AddFunction(i32_i64, Code().LocalGet(0).Mem(OP_i64_load32_s, 2, 0)));
    w.Export("store", WASM_KIND_FUNCTION,
             w.AddFunction(store, Code().LocalGet(0).LocalGet(1).Mem(OP_i32_store, 2, 4)));
    w.Export("size", WASM_KIND_FUNCTION, w.AddFunction(v_i32, Code().Op(OP_memory_size).Op(0)));
    w.Export("grow", WASM_KIND_FUNCTION, w.AddFunction(i32_i32, Code().LocalGet(0).Op(OP_memory_grow).Op(0)));
    w.Export("mem", WASM_KIND_MEMORY, 0);

    std::shared_ptr<Instance> inst;
    TESTERR(Instantiate(w, inst), ERR_SUCCESS);
    auto mem = !inst ? nullptr : inst->GetMemory("mem");
    TEST(mem != nullptr);

    TEST(CallOr(inst, "load", 0, 8) == 0x04030201);
    TEST(CallOr(inst, "load", 0, 9) == static_cast<int32_t>(0xFF040302)); // Unaligned access is allowed
    TEST(CallOr(inst, "load8_s", 0, 12) == -1);
    TEST(CallOr(inst, "load8_u", 0, 12) == 255);
    TEST(CallOr<int64_t>(inst, "load32_s", 0, 9) == static_cast<int32_t>(0xFF040302));

    auto fstore = !inst ? nullptr : inst->GetFunction("store");
    TEST(fstore != nullptr);
    if(fstore && mem)
    {
      Value args[2] = { Value::I32(100), Value::I32(0x11223344) };
      TESTERR(fstore->Invoke(args, 2, nullptr, 0), ERR_SUCCESS);
      uint32_t v = 0;
      TESTERR(mem->Read(104, &v, sizeof(v)), ERR_SUCCESS);
      TEST(v == 0x11223344);

      // Host writes are visible to compiled code
      uint32_t h = 0xCAFEF00D;
      TESTERR(mem->Write(200, &h, sizeof(h)), ERR_SUCCESS);
      TEST(CallOr(inst, "load", 0, 200) == static_cast<int32_t>(0xCAFEF00D));
    }

    TEST(CallOr(inst, "size", 0) == 1);
    TEST(CallOr(inst, "grow", 0, 1) == 1);
    TEST(CallOr(inst, "size", 0) == 2);
    TEST(CallOr(inst, "grow", 0, 1) == -1);
    TEST(CallOr(inst, "size", 0) == 2);
    TEST(CallOr(inst, "grow", 0, 0) == 2);
    if(mem)
    {
      TEST(mem->Size() == 2);
      TEST(mem->ByteLength() == 2 * WASM_PAGE_SIZE);
    }

    // The grown page is zeroed, and contents survive the reallocation
    TEST(CallOr(inst, "load", -1, static_cast<int32_t>(WASM_PAGE_SIZE + 16)) == 0);
    TEST(CallOr(inst, "load", 0, 8) == 0x04030201);
  }

  {
    // Calls between compiled functions and into host imports
    int calls = 0;
    auto add3 = Function::Create(std::function<int32_t(int32_t)>([&calls](int32_t x) {
      ++calls;
      return x + 3;
    }));
    auto mix = Function::Create(std::function<double(int64_t, float, double)>(
      [](int64_t a, float b, double c) { return static_cast<double>(a) * 100.0 + b * 10.0 + c; }));

    ImportMap imports;
    imports.Add("env", "add3", add3);
    imports.Add("env", "mix", mix);

    WasmWriter w;
    auto i32_i32 = w.AddType({ TE_i32 }, { TE_i32 });
    auto mixty   = w.AddType({ TE_i64, TE_f32, TE_f64 }, { TE_f64 });
    auto v_f64   = w.AddType({}, { TE_f64 });
    w.ImportFunction("env", "add3", i32_i32);
    w.ImportFunction("env", "mix", mixty);
    w.Export("twice", WASM_KIND_FUNCTION, w.AddFunction(i32_i32, Code().LocalGet(0).Call(0).Call(0)));
    w.Export("callmix", WASM_KIND_FUNCTION, w.AddFunction(v_f64, Code().I64(1).F32(2.0f).F64(3.0).Call(1)));
    w.Export("add3", WASM_KIND_FUNCTION, 0);

    std::shared_ptr<Instance> inst;
    TESTERR(Instantiate(w, imports, inst), ERR_SUCCESS);
    TEST(CallOr(inst, "twice", 0, 10) == 16);
    TEST(calls == 2);
    TEST(CallOr(inst, "callmix", 0.0) == 123.0);

    // Exporting an import hands back the same object
    TEST(inst != nullptr && inst->GetFunction("add3") == add3);

    // Argument checks on a compiled function
    auto twice = !inst ? nullptr : inst->GetFunction("twice");
    TEST(twice != nullptr);
    if(twice)
    {
      Value r;
      Value wrong = Value::I64(1);
      TESTERR(twice->Invoke(nullptr, 0, &r, 1), ERR_SIGNATURE_MISMATCH);
      TESTERR(twice->Invoke(&wrong, 1, &r, 1), ERR_SIGNATURE_MISMATCH);
      TEST(!twice->IsHost());

      std::vector<Value> args = { Value::I32(1) };
      std::vector<Value> results;
      TESTERR(twice->Invoke(args, results), ERR_SUCCESS);
      TEST(results.size() == 1 && results[0].type == TE_i32 && results[0].i32 == 7);
    }
  }
}
