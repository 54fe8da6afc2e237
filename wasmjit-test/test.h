// Copyright (c)2020 Black Sphere Studios
// For conditions of distribution and use, see copyright notice in wasmjit.h

#ifndef WJ__TEST_H
#define WJ__TEST_H

#include "wasmjit/export.h"
#include "wasm.h"
#include <utility>
#include <stdint.h>
#include <stdio.h>
#include <vector>
#include <string.h>
#include <functional>

class TestHarness
{
public:
  TestHarness(int loglevel, FILE* out);
  ~TestHarness();
  size_t Run(FILE* out);
  void test_errors();
  void test_stack();
  void test_stream();
  void test_parse();
  void test_validate();
  void test_table();
  void test_memory();
  void test_global();
  void test_host();
  void test_importmap();
  void test_instructions();
  void test_traps();
  void test_link();
  void test_indirect();
  void test_exports();

  static int Log(const wasmjit::Environment* env, const char* f, ...);

  inline std::pair<uint32_t, uint32_t> Results()
  {
    auto r    = _testdata;
    _testdata = { 0, 0 };
    return r;
  }

protected:
  inline void DoTest(bool test, const char* text, const char* file, int line)
  {
    ++_testdata.second;

    const char* f = strrchr(file, '/');
    if(!f)
      f = strrchr(file, '\\');
    if(f)
      file = f + 1;

    if(test)
      ++_testdata.first;
    else
      fprintf(_target, "%s[%i]: %s\n", file, line, text);
  }

  void DoTestError(int test, const char* text, int result, const char* file, int line);

  // Returns an environment with every check enabled that logs through the harness.
  wasmjit::Environment NewEnvironment();

  // Decodes, validates and instantiates a binary built by a WasmWriter.
  int Instantiate(const WasmWriter& writer, const wasmjit::ImportMap& imports, std::shared_ptr<wasmjit::Instance>& out);
  int Instantiate(const WasmWriter& writer, std::shared_ptr<wasmjit::Instance>& out);

  std::pair<uint32_t, uint32_t> _testdata;
  FILE* _target;
  int _loglevel;
};

#define TEST(x)         DoTest(x, "" #x, __FILE__, __LINE__)
#define TESTERR(x, e)   DoTestError(x, "" #x, e, __FILE__, __LINE__)

#endif
