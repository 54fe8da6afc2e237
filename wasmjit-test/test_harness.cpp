// Copyright (c)2021 Fundament Software
// For conditions of distribution and use, see copyright notice in wasmjit.h

#include "test.h"
#include <stdio.h>
#include <stdarg.h>

using namespace wasmjit;

TestHarness::TestHarness(int loglevel, FILE* out) : _testdata(0, 0), _target(out), _loglevel(loglevel) {}

TestHarness::~TestHarness() {}

int TestHarness::Log(const Environment* env, const char* f, ...)
{
  va_list args;
  va_start(args, f);
  int len = VFPRINTF(stdout, f, args);
  va_end(args);
  return len;
}

size_t TestHarness::Run(FILE* out)
{
  std::pair<const char*, void (TestHarness::*)()> tests[] = { { "errors.h", &TestHarness::test_errors },
                                                              { "stack.h", &TestHarness::test_stack },
                                                              { "stream.h", &TestHarness::test_stream },
                                                              { "parse", &TestHarness::test_parse },
                                                              { "validate", &TestHarness::test_validate },
                                                              { "FunctionTable", &TestHarness::test_table },
                                                              { "Memory", &TestHarness::test_memory },
                                                              { "Global", &TestHarness::test_global },
                                                              { "host functions", &TestHarness::test_host },
                                                              { "ImportMap", &TestHarness::test_importmap },
                                                              { "instructions", &TestHarness::test_instructions },
                                                              { "traps", &TestHarness::test_traps },
                                                              { "link", &TestHarness::test_link },
                                                              { "indirect calls", &TestHarness::test_indirect },
                                                              { "exports", &TestHarness::test_exports } };

  static const size_t NUMTESTS    = sizeof(tests) / sizeof(decltype(tests[0]));
  static constexpr int COLUMNS[3] = { 24, 11, 8 };

  FPRINTF(out, "%-*s %-*s %-*s\n", COLUMNS[0], "Internal Tests", COLUMNS[1], "Subtests", COLUMNS[2], "Pass/Fail");
  FPRINTF(out, "%-*s %-*s %-*s\n", COLUMNS[0], "--------------", COLUMNS[1], "--------", COLUMNS[2], "---------");

  size_t failures = 0;
  for(size_t i = 0; i < NUMTESTS; ++i)
  {
    (this->*tests[i].second)();
    auto results = Results();
    failures += results.second - results.first;

    char buf[COLUMNS[1] + 1] = { 0 };
    snprintf(buf, COLUMNS[1] + 1, "%u/%u", results.first, results.second);
    FPRINTF(out, "%-*s %-*s %-*s\n", COLUMNS[0], tests[i].first, COLUMNS[1], buf, COLUMNS[2],
            (results.first == results.second) ? "PASS" : "FAIL");
  }

  FPRINTF(out, "\n");
  return failures;
}

void TestHarness::DoTestError(int test, const char* text, int result, const char* file, int line)
{
  DoTest(test == result, text, file, line);
  if(test != result)
  {
    char buf[2][32];
    FPRINTF(_target, "  Return Value: %s, expected %s\n", ErrorString(test, buf[0], sizeof(buf[0])),
            ErrorString(result, buf[1], sizeof(buf[1])));
  }
}

Environment TestHarness::NewEnvironment()
{
  Environment env = CreateEnvironment();
  env.loghook     = &TestHarness::Log;
  env.loglevel    = _loglevel;
#ifdef WJ_DEBUG
  env.flags |= ENV_DEBUG;
  env.optimize = ENV_OPTIMIZE_O0;
#endif
  return env;
}

int TestHarness::Instantiate(const WasmWriter& writer, const ImportMap& imports, std::shared_ptr<Instance>& out)
{
  Environment env          = NewEnvironment();
  std::vector<uint8_t> bin = writer.Build();
  return Compile(env, bin.data(), bin.size(), imports, out);
}

int TestHarness::Instantiate(const WasmWriter& writer, std::shared_ptr<Instance>& out)
{
  ImportMap imports;
  return Instantiate(writer, imports, out);
}
