// Copyright (c)2021 Fundament Software
// For conditions of distribution and use, see copyright notice in wasmjit.h

#include "test.h"

using namespace wasmjit;

namespace {
  // Returns the first validation error, or the decoding error if the binary couldn't be decoded.
  int Validate(Environment env, const WasmWriter& w, size_t* count = nullptr)
  {
    std::vector<uint8_t> bin = w.Build();
    Module m;
    int err = ParseModule(env, bin.data(), bin.size(), m);
    if(err < 0)
      return err;
    err = ValidateModule(env, m);
    if(count)
      *count = env.errors.size();
    return err;
  }

  WasmWriter Body(std::initializer_list<int8_t> params, std::initializer_list<int8_t> results, const Code& code)
  {
    WasmWriter w;
    w.AddFunction(w.AddType(params, results), code);
    return w;
  }
}

void TestHarness::test_validate()
{
  Environment env = NewEnvironment();

  {
    size_t count = 1;
    TESTERR(Validate(env, Body({ TE_i32, TE_i32 }, { TE_i32 }, Code().LocalGet(0).LocalGet(1).Op(OP_i32_add)), &count),
            ERR_SUCCESS);
    TEST(count == 0);
  }

  // Type mismatches on the value stack
  TESTERR(Validate(env, Body({ TE_i64 }, { TE_i32 }, Code().LocalGet(0))), ERR_INVALID_TYPE);
  TESTERR(Validate(env, Body({}, { TE_i32 }, Code().I32(1).I64(2).Op(OP_i32_add))), ERR_INVALID_TYPE);
  TESTERR(Validate(env, Body({}, { TE_f32 }, Code().F64(1.0))), ERR_INVALID_TYPE);
  TESTERR(Validate(env, Body({}, { TE_i32 }, Code())), ERR_EMPTY_VALUE_STACK);
  TESTERR(Validate(env, Body({}, {}, Code().I32(1))), ERR_INVALID_VALUE_STACK);
  TESTERR(Validate(env, Body({}, {}, Code().Op(OP_i32_add).Op(OP_drop))), ERR_EMPTY_VALUE_STACK);

  // Everything after unreachable is polymorphic
  TESTERR(Validate(env, Body({}, { TE_i32 }, Code().Op(OP_unreachable).Op(OP_i32_add))), ERR_SUCCESS);
  TESTERR(Validate(env, Body({}, { TE_f64 }, Code().Block(OP_block, TE_f64).Op(OP_unreachable).End())), ERR_SUCCESS);

  // Locals and globals
  TESTERR(Validate(env, Body({ TE_i32 }, {}, Code().LocalGet(1).Op(OP_drop))), ERR_INVALID_LOCAL_INDEX);
  TESTERR(Validate(env, Body({}, {}, Code().GlobalGet(0).Op(OP_drop))), ERR_INVALID_GLOBAL_INDEX);
  {
    WasmWriter w = Body({}, {}, Code().I32(3).GlobalSet(0));
    w.AddGlobal(TE_i32, false, Code().I32(0));
    TESTERR(Validate(env, w), ERR_IMMUTABLE_GLOBAL);
  }
  {
    WasmWriter w = Body({}, {}, Code().I32(3).GlobalSet(0));
    w.AddGlobal(TE_i32, true, Code().I32(0));
    TESTERR(Validate(env, w), ERR_SUCCESS);
  }
  {
    WasmWriter w;
    w.AddGlobal(TE_i32, false, Code().I64(0));
    TESTERR(Validate(env, w), ERR_INVALID_INITIALIZER_TYPE);
  }
  {
    // A global initializer may only read an imported global
    WasmWriter w;
    w.AddGlobal(TE_i32, false, Code().I32(0));
    w.AddGlobal(TE_i32, false, Code().GlobalGet(0));
    TESTERR(Validate(env, w), ERR_INVALID_GLOBAL_INITIALIZER);
  }
  {
    WasmWriter w;
    w.ImportGlobal("env", "base", TE_i32, false);
    w.AddGlobal(TE_i32, false, Code().GlobalGet(0));
    TESTERR(Validate(env, w), ERR_SUCCESS);
  }

  // Control flow
  TESTERR(Validate(env, Body({}, {}, Code().Br(OP_br, 1))), ERR_INVALID_BRANCH_DEPTH);
  TESTERR(Validate(env, Body({}, {}, Code().Block(OP_block, TE_void).Br(OP_br, 1).End())), ERR_SUCCESS);
  TESTERR(Validate(env, Body({}, {}, Code().I32(0).BrTable({ 0, 2 }, 0))), ERR_INVALID_BRANCH_DEPTH);
  TESTERR(Validate(env, Body({}, { TE_i32 }, Code().I32(1).Block(OP_if, TE_i32).I32(2).End())),
          ERR_INVALID_BLOCK_SIGNATURE);
  TESTERR(Validate(env, Body({}, {}, Code().Op(OP_else))), ERR_IF_ELSE_MISMATCH);
  TESTERR(Validate(env, Body({}, { TE_i32 }, Code().I32(1).Block(OP_if, TE_i32).I32(2).Op(OP_else).I32(3).End())),
          ERR_SUCCESS);
  TESTERR(Validate(env, Body({}, {}, Code().Block(OP_block, TE_void))), ERR_END_MISMATCH);

  // Calls
  TESTERR(Validate(env, Body({}, {}, Code().Call(5))), ERR_INVALID_FUNCTION_INDEX);
  TESTERR(Validate(env, Body({}, {}, Code().I32(0).CallIndirect(0))), ERR_INVALID_TABLE_INDEX);
  {
    WasmWriter w = Body({}, {}, Code().I32(0).CallIndirect(4));
    w.AddTable(1);
    TESTERR(Validate(env, w), ERR_INVALID_TYPE_INDEX);
  }
  {
    WasmWriter w = Body({}, {}, Code().I32(0).CallIndirect(0));
    w.AddTable(1);
    TESTERR(Validate(env, w), ERR_SUCCESS);
  }

  // Memory
  TESTERR(Validate(env, Body({}, { TE_i32 }, Code().I32(0).Mem(OP_i32_load, 2, 0))), ERR_INVALID_MEMORY_INDEX);
  {
    WasmWriter w = Body({}, { TE_i32 }, Code().I32(0).Mem(OP_i32_load, 3, 0));
    w.AddMemory(1);
    TESTERR(Validate(env, w), ERR_INVALID_MEMORY_ALIGNMENT);
  }
  {
    WasmWriter w = Body({}, { TE_i32 }, Code().I32(0).Mem(OP_i32_load8_u, 0, 4));
    w.AddMemory(1);
    TESTERR(Validate(env, w), ERR_SUCCESS);
  }
  {
    WasmWriter w;
    w.AddMemory(2, true, 1);
    TESTERR(Validate(env, w), ERR_INVALID_LIMITS);
  }
  {
    WasmWriter w;
    w.AddMemory(WASM_MAX_PAGES + 1);
    TESTERR(Validate(env, w), ERR_MEMORY_TOO_LARGE);
  }
  {
    WasmWriter w;
    w.AddTable(1);
    w.AddTable(1);
    TESTERR(Validate(env, w), ERR_MULTIPLE_TABLES);
  }
  {
    WasmWriter w;
    w.AddMemory(1);
    w.AddMemory(1);
    TESTERR(Validate(env, w), ERR_MULTIPLE_MEMORIES);
  }

  // Exports, start and segments
  {
    WasmWriter w = Body({}, {}, Code());
    w.Export("f", WASM_KIND_FUNCTION, 1);
    TESTERR(Validate(env, w), ERR_INVALID_EXPORT_INDEX);
  }
  {
    // Nothing of the kind exists at all, which instantiation reports instead
    WasmWriter w = Body({}, {}, Code());
    w.Export("t", WASM_KIND_TABLE, 0);
    TESTERR(Validate(env, w), ERR_SUCCESS);
  }
  {
    WasmWriter w = Body({ TE_i32 }, {}, Code());
    w.Start(0);
    TESTERR(Validate(env, w), ERR_INVALID_START_FUNCTION);
  }
  {
    WasmWriter w = Body({}, {}, Code());
    w.Start(3);
    TESTERR(Validate(env, w), ERR_INVALID_FUNCTION_INDEX);
  }
  {
    WasmWriter w = Body({}, {}, Code());
    w.AddTable(1);
    w.Element(0, Code().I32(0), { 7 });
    TESTERR(Validate(env, w), ERR_INVALID_FUNCTION_INDEX);
  }
  {
    WasmWriter w = Body({}, {}, Code());
    w.Element(0, Code().I32(0), { 0 });
    TESTERR(Validate(env, w), ERR_INVALID_TABLE_INDEX);
  }
  {
    WasmWriter w;
    w.AddMemory(1);
    w.Data(0, Code().I64(0), "x");
    TESTERR(Validate(env, w), ERR_INVALID_INITIALIZER_TYPE);
  }
  {
    WasmWriter w;
    w.Data(0, Code().I32(0), "x");
    TESTERR(Validate(env, w), ERR_INVALID_MEMORY_INDEX);
  }

  // Every problem is collected, not just the first
  {
    size_t count = 0;
    WasmWriter w = Body({}, {}, Code().Call(9));
    w.Export("f", WASM_KIND_FUNCTION, 4);
    w.AddMemory(3, true, 1);
    TEST(Validate(env, w, &count) < 0);
    TEST(count >= 3);
  }
}
