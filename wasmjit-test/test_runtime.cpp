// Copyright (c)2021 Fundament Software
// For conditions of distribution and use, see copyright notice in wasmjit.h

#include "test.h"
#include <math.h>

using namespace wasmjit;

void TestHarness::test_table()
{
  {
    std::shared_ptr<FunctionTable> t;
    TESTERR(FunctionTable::Create(4, t), ERR_SUCCESS);
    TEST(t != nullptr);
    TEST(t->Length() == 4);
    TEST(!t->HasMaximum());

    // Every slot of a new table is empty
    for(varuint32 i = 0; i < 4; ++i)
    {
      std::shared_ptr<Function> f = Function::Create(std::function<int32_t(int32_t)>([](int32_t x) { return x; }));
      TESTERR(t->Get(i, f), ERR_SUCCESS);
      TEST(f == nullptr);
    }

    std::shared_ptr<Function> f;
    TESTERR(t->Get(4, f), ERR_INDEX_OUT_OF_RANGE);
    TESTERR(t->Get(1000, f), ERR_INDEX_OUT_OF_RANGE);
    TESTERR(t->Set(4, nullptr), ERR_INDEX_OUT_OF_RANGE);

    auto id = Function::Create(std::function<int32_t(int32_t)>([](int32_t x) { return x; }));
    TESTERR(t->Set(2, id), ERR_SUCCESS);
    TESTERR(t->Get(2, f), ERR_SUCCESS);
    TEST(f == id);
    TEST(t->GetData()->entries[2].invoke == id->Entry().invoke);
    TEST(t->GetData()->entries[2].sig == id->Entry().sig);
    TEST(t->GetData()->entries[1].invoke == nullptr);

    TESTERR(t->Set(2, nullptr), ERR_SUCCESS);
    TESTERR(t->Get(2, f), ERR_SUCCESS);
    TEST(f == nullptr);
    TEST(t->GetData()->entries[2].invoke == nullptr);
  }

  {
    std::shared_ptr<FunctionTable> t;
    TESTERR(FunctionTable::Create(0, t), ERR_SUCCESS);
    TEST(t->Length() == 0);
    std::shared_ptr<Function> f;
    TESTERR(t->Get(0, f), ERR_INDEX_OUT_OF_RANGE);
  }

  {
    // Growth succeeds until the maximum, then fails without changing the length
    std::shared_ptr<FunctionTable> t;
    TESTERR(FunctionTable::Create(1, 4, t), ERR_SUCCESS);
    TEST(t->HasMaximum());
    TEST(t->Maximum() == 4);

    auto id = Function::Create(std::function<int32_t(int32_t)>([](int32_t x) { return x; }));
    TESTERR(t->Set(0, id), ERR_SUCCESS);

    varuint32 previous = 99;
    TESTERR(t->Grow(1, &previous), ERR_SUCCESS);
    TEST(previous == 1);
    TEST(t->Length() == 2);
    TESTERR(t->Grow(2, &previous), ERR_SUCCESS);
    TEST(previous == 2);
    TEST(t->Length() == 4);
    TESTERR(t->Grow(1, &previous), ERR_LIMIT_EXCEEDED);
    TEST(t->Length() == 4);
    TESTERR(t->Grow(0), ERR_SUCCESS);
    TEST(t->Length() == 4);
    TEST(t->GetData()->size == 4);

    // Existing references survive growth, and new slots are empty
    std::shared_ptr<Function> f;
    TESTERR(t->Get(0, f), ERR_SUCCESS);
    TEST(f == id);
    TEST(t->GetData()->entries[0].invoke == id->Entry().invoke);
    TESTERR(t->Get(3, f), ERR_SUCCESS);
    TEST(f == nullptr);
  }

  {
    std::shared_ptr<FunctionTable> t;
    TESTERR(FunctionTable::Create(5, 2, t), ERR_INVALID_ARGUMENT);
    TESTERR(FunctionTable::Create(WJ_MAX_TABLE_LENGTH + 1, t), ERR_LIMIT_EXCEEDED);
    TESTERR(FunctionTable::Create(3, 3, t), ERR_SUCCESS);
    TESTERR(t->Grow(1), ERR_LIMIT_EXCEEDED);
    TEST(t->Length() == 3);
    TESTERR(FunctionTable::Create(0, t), ERR_SUCCESS);
    TESTERR(t->Grow(0xFFFFFFFFu), ERR_LIMIT_EXCEEDED);
    TEST(t->Length() == 0);
  }

  {
    // A table holds references of any signature
    std::shared_ptr<FunctionTable> t;
    TESTERR(FunctionTable::Create(2, t), ERR_SUCCESS);
    auto a = Function::Create(std::function<int32_t(int32_t)>([](int32_t x) { return x; }));
    auto b = Function::Create(std::function<double(double, double)>([](double x, double y) { return x * y; }));
    TESTERR(t->Set(0, a), ERR_SUCCESS);
    TESTERR(t->Set(1, b), ERR_SUCCESS);
    TEST(t->GetData()->entries[0].sig != t->GetData()->entries[1].sig);

    std::shared_ptr<Function> f;
    TESTERR(t->Get(1, f), ERR_SUCCESS);
    double r = 0;
    TESTERR(f->Call(r, 3.0, 4.0), ERR_SUCCESS);
    TEST(r == 12.0);
  }
}

void TestHarness::test_memory()
{
  {
    std::shared_ptr<Memory> m;
    TESTERR(Memory::Create(1, m), ERR_SUCCESS);
    TEST(m->Size() == 1);
    TEST(m->ByteLength() == WASM_PAGE_SIZE);
    TEST(m->GetData()->size == WASM_PAGE_SIZE);
    TEST(m->Data()[0] == 0);
    TEST(m->Data()[WASM_PAGE_SIZE - 1] == 0);

    uint32_t v = 0xDEADBEEF;
    TESTERR(m->Write(WASM_PAGE_SIZE - 4, &v, 4), ERR_SUCCESS);
    TESTERR(m->Write(WASM_PAGE_SIZE - 3, &v, 4), ERR_INDEX_OUT_OF_RANGE);
    TESTERR(m->Write(WASM_PAGE_SIZE + 100, &v, 0), ERR_INDEX_OUT_OF_RANGE);
    uint32_t r = 0;
    TESTERR(m->Read(WASM_PAGE_SIZE - 4, &r, 4), ERR_SUCCESS);
    TEST(r == 0xDEADBEEF);
    TESTERR(m->Read(0xFFFFFFFFFFFFFFFFull, &r, 4), ERR_INDEX_OUT_OF_RANGE);

    varuint32 previous = 0;
    TESTERR(m->Grow(2, &previous), ERR_SUCCESS);
    TEST(previous == 1);
    TEST(m->Size() == 3);
    TEST(m->GetData()->bytes == m->Data());
    TEST(m->GetData()->size == 3 * WASM_PAGE_SIZE);
    TESTERR(m->Read(WASM_PAGE_SIZE - 4, &r, 4), ERR_SUCCESS);
    TEST(r == 0xDEADBEEF);
    TEST(m->Data()[3 * WASM_PAGE_SIZE - 1] == 0);
    TESTERR(m->Grow(WASM_MAX_PAGES), ERR_LIMIT_EXCEEDED);
    TEST(m->Size() == 3);
  }

  {
    std::shared_ptr<Memory> m;
    TESTERR(Memory::Create(0, 2, m), ERR_SUCCESS);
    TEST(m->Size() == 0);
    TEST(m->HasMaximum());
    TESTERR(m->Grow(2), ERR_SUCCESS);
    TESTERR(m->Grow(1), ERR_LIMIT_EXCEEDED);
    TEST(m->Size() == 2);

    TESTERR(Memory::Create(3, 2, m), ERR_INVALID_ARGUMENT);
    TESTERR(Memory::Create(WASM_MAX_PAGES + 1, m), ERR_LIMIT_EXCEEDED);
    TESTERR(Memory::Create(0, WASM_MAX_PAGES + 1, m), ERR_LIMIT_EXCEEDED);
  }
}

void TestHarness::test_global()
{
  std::shared_ptr<Global> g;
  TESTERR(Global::Create(Value::I32(-7), false, g), ERR_SUCCESS);
  TEST(g->Type() == TE_i32);
  TEST(!g->Mutable());
  TEST(g->Get().i32 == -7);
  TESTERR(g->Set(Value::I32(1)), ERR_IMMUTABLE_GLOBAL);
  TEST(g->Get().i32 == -7);
  TESTERR(g->Initialize(Value::I32(1)), ERR_SUCCESS);
  TEST(g->Get().i32 == 1);

  TESTERR(Global::Create(Value::F64(2.5), true, g), ERR_SUCCESS);
  TEST(g->Type() == TE_f64);
  TEST(g->Mutable());
  TESTERR(g->Set(Value::F64(-0.25)), ERR_SUCCESS);
  TEST(g->Get().f64 == -0.25);
  TESTERR(g->Set(Value::F32(1.0f)), ERR_SIGNATURE_MISMATCH);
  TEST(g->Get().f64 == -0.25);

  TESTERR(Global::Create(Value::I64(-1), true, g), ERR_SUCCESS);
  TEST(g->Get().i64 == -1);
  TEST(*g->GetSlot() == 0xFFFFFFFFFFFFFFFFull);
  TESTERR(Global::Create(Value::F32(NAN), true, g), ERR_SUCCESS);
  TEST(isnan(g->Get().f32));

  Value bad = Value::I32(0);
  bad.type  = TE_funcref;
  TESTERR(Global::Create(bad, true, g), ERR_INVALID_ARGUMENT);
}

void TestHarness::test_host()
{
  {
    int calls = 0;
    auto f    = Function::Create(std::function<int32_t(int32_t, int32_t)>([&](int32_t a, int32_t b) {
      ++calls;
      return a - b;
    }));
    TEST(f != nullptr);
    TEST(f->IsHost());
    TEST(f->Signature().params.size() == 2);
    TEST(f->Signature().returns.size() == 1);
    TEST(f->Signature().returns[0] == TE_i32);

    int32_t r = 0;
    TESTERR(f->Call(r, 10, 4), ERR_SUCCESS);
    TEST(r == 6);
    TEST(calls == 1);

    Value args[2] = { Value::I32(1), Value::I32(2) };
    Value out;
    TESTERR(f->Invoke(args, 2, &out, 1), ERR_SUCCESS);
    TEST(out.type == TE_i32);
    TEST(out.i32 == -1);
    TESTERR(f->Invoke(args, 1, &out, 1), ERR_SIGNATURE_MISMATCH);
    TESTERR(f->Invoke(args, 2, &out, 0), ERR_SIGNATURE_MISMATCH);
    args[1] = Value::I64(2);
    TESTERR(f->Invoke(args, 2, &out, 1), ERR_SIGNATURE_MISMATCH);
    TEST(calls == 2);
  }

  {
    // Generic callbacks with an explicit signature
    FunctionType sig = { TE_func, { TE_i64, TE_f32 }, { TE_f64 } };
    auto f           = Function::Create(sig, [](const Value* args, Value* results) {
      results[0] = Value::F64(static_cast<double>(args[0].i64) + args[1].f32);
    });
    TEST(f != nullptr);

    std::vector<Value> in = { Value::I64(40), Value::F32(2.5f) };
    std::vector<Value> out;
    TESTERR(f->Invoke(in, out), ERR_SUCCESS);
    TEST(out.size() == 1);
    TEST(out[0].f64 == 42.5);

    FunctionType bad = { TE_func, {}, { TE_i32, TE_i32 } };
    TEST(Function::Create(bad, [](const Value*, Value*) {}) == nullptr);
    bad = { TE_func, { TE_void }, {} };
    TEST(Function::Create(bad, [](const Value*, Value*) {}) == nullptr);
  }

  {
    int hits = 0;
    auto f   = Function::Create(std::function<void()>([&]() { ++hits; }));
    TEST(f->Signature().params.empty());
    TEST(f->Signature().returns.empty());
    TESTERR(f->Invoke(nullptr, 0, nullptr, 0), ERR_SUCCESS);
    TEST(hits == 1);
  }

  {
    // Structurally equal signatures share a signature id
    auto a = Function::Create(std::function<int64_t(float)>([](float x) { return static_cast<int64_t>(x); }));
    auto b = Function::Create(std::function<int64_t(float)>([](float x) { return static_cast<int64_t>(x) * 2; }));
    auto c = Function::Create(std::function<int64_t(double)>([](double x) { return static_cast<int64_t>(x); }));
    TEST(a->Entry().sig == b->Entry().sig);
    TEST(a->Entry().sig != c->Entry().sig);
    TEST(a->Entry().sig != 0);
  }
}

void TestHarness::test_importmap()
{
  ImportMap imports;
  TEST(imports.Size() == 0);
  TEST(imports.Find("env", "f") == nullptr);

  auto f = Function::Create(std::function<int32_t(int32_t)>([](int32_t x) { return x; }));
  std::shared_ptr<FunctionTable> t;
  TESTERR(FunctionTable::Create(1, t), ERR_SUCCESS);

  imports.Add("env", "f", Extern(f));
  imports.Add("env", "t", Extern(t));
  TEST(imports.Size() == 2);

  const Extern* e = imports.Find("env", "f");
  TEST(e != nullptr);
  TEST(e->kind == WASM_KIND_FUNCTION);
  TEST(e->func == f);
  TEST(e->get() == f.get());

  e = imports.Find("env", "t");
  TEST(e != nullptr);
  TEST(e->kind == WASM_KIND_TABLE);
  TEST(e->table == t);

  // Both halves of the key matter
  TEST(imports.Find("env", "g") == nullptr);
  TEST(imports.Find("envf", "") == nullptr);
  TEST(imports.Find("en", "vf") == nullptr);
  TEST(imports.Find("", "f") == nullptr);

  // Adding the same pair again replaces the binding
  std::shared_ptr<Memory> m;
  TESTERR(Memory::Create(1, m), ERR_SUCCESS);
  imports.Add("env", "f", Extern(m));
  TEST(imports.Size() == 2);
  e = imports.Find("env", "f");
  TEST(e != nullptr);
  TEST(e->kind == WASM_KIND_MEMORY);
  TEST(e->memory == m);

  // Many bindings force the map to rehash
  char field[16];
  for(int i = 0; i < 200; ++i)
  {
    snprintf(field, sizeof(field), "g%i", i);
    std::shared_ptr<Global> g;
    TESTERR(Global::Create(Value::I32(i), false, g), ERR_SUCCESS);
    imports.Add("spectest", field, Extern(g));
  }
  TEST(imports.Size() == 202);
  e = imports.Find("spectest", "g137");
  TEST(e != nullptr && e->kind == WASM_KIND_GLOBAL && e->global->Get().i32 == 137);
  TEST(imports.Find("env", "t")->table == t);

  // Every key still resolves to its own binding after the rehashes
  int found = 0;
  for(int i = 0; i < 200; ++i)
  {
    snprintf(field, sizeof(field), "g%i", i);
    e = imports.Find("spectest", field);
    if(e != nullptr && e->kind == WASM_KIND_GLOBAL && e->global->Get().i32 == i)
      ++found;
  }
  TEST(found == 200);

  // Replacing a binding after the rehashes keeps the count and the other bindings
  imports.Add("spectest", "g0", Extern(f));
  TEST(imports.Size() == 202);
  e = imports.Find("spectest", "g0");
  TEST(e != nullptr && e->kind == WASM_KIND_FUNCTION && e->func == f);
  e = imports.Find("spectest", "g1");
  TEST(e != nullptr && e->kind == WASM_KIND_GLOBAL && e->global->Get().i32 == 1);
}
