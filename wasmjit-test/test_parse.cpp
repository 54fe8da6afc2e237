// Copyright (c)2021 Fundament Software
// For conditions of distribution and use, see copyright notice in wasmjit.h

#include "test.h"
#include "../wasmjit/util.h"

using namespace wasmjit;
using namespace utility;

namespace {
  int Parse(Environment& env, const std::vector<uint8_t>& bin, Module& m)
  {
    return ParseModule(env, bin.data(), bin.size(), m);
  }
}

void TestHarness::test_parse()
{
  Environment env = NewEnvironment();

  {
    WasmWriter w;
    uint32_t t0 = w.AddType({ TE_i32 }, { TE_i32 });
    uint32_t t1 = w.AddType({}, {});
    w.ImportGlobal("env", "g", TE_i32, false);
    w.ImportFunction("env", "f", t0);
    w.ImportTable("env", "t", 1, true, 4);
    w.ImportMemory("env", "m", 1);
    w.ImportFunction("env", "h", t1);
    w.AddFunction(t0, Code().LocalGet(0));
    w.AddGlobal(TE_i64, true, Code().I64(-5));
    w.Export("id", WASM_KIND_FUNCTION, 2);
    w.Element(0, Code().I32(0), { 2 });
    w.Data(0, Code().I32(16), "abc");

    Module m;
    TESTERR(Parse(env, w.Build(), m), ERR_SUCCESS);
    TEST(m.type.functypes.size() == 2);
    TEST(m.type.functypes[0].params.size() == 1);
    TEST(m.type.functypes[0].params[0] == TE_i32);
    TEST(m.type.functypes[0].returns[0] == TE_i32);
    TEST(m.type.functypes[1].params.empty());

    // Imports are grouped by kind but remember where they were declared
    TEST(m.importsection.imports.size() == 5);
    TEST(m.importsection.functions == 2);
    TEST(m.importsection.tables == 3);
    TEST(m.importsection.memories == 4);
    TEST(m.importsection.globals == 5);
    TEST(m.importsection.imports[0].export_name == "f");
    TEST(m.importsection.imports[0].order == 1);
    TEST(m.importsection.imports[1].export_name == "h");
    TEST(m.importsection.imports[1].order == 4);
    TEST(m.importsection.imports[2].kind == WASM_KIND_TABLE);
    TEST(m.importsection.imports[2].table_desc.resizable.maximum == 4);
    TEST(m.importsection.imports[4].kind == WASM_KIND_GLOBAL);
    TEST(m.importsection.imports[4].order == 0);

    TEST(ModuleFunctionCount(m) == 3);
    TEST(ModuleTableCount(m) == 1);
    TEST(ModuleMemoryCount(m) == 1);
    TEST(ModuleGlobalCount(m) == 2);
    TEST(ModuleFunction(m, 2) == &m.type.functypes[0]);
    TEST(ModuleFunction(m, 1) == &m.type.functypes[1]);
    TEST(ModuleFunction(m, 3) == nullptr);
    TEST(ModuleGlobal(m, 1) != nullptr && ModuleGlobal(m, 1)->type == TE_i64);
    TEST(ModuleImport(m, WASM_KIND_FUNCTION, 1) == &m.importsection.imports[1]);
    TEST(ModuleImport(m, WASM_KIND_FUNCTION, 2) == nullptr);

    TEST(m.global.globals[0].init.immediates[0]._varsint64 == -5);
    TEST(m.code.funcbody.size() == 1);
    TEST(m.code.funcbody[0].body.size() == 2);
    TEST(m.code.funcbody[0].body[0].opcode[0] == OP_local_get);
    TEST(m.code.funcbody[0].body[1].opcode[0] == OP_end);
    TEST(m.element.elements[0].elements.size() == 1);
    TEST(m.data.data[0].offset.immediates[0]._varsint32 == 16);
    TEST(m.data.data[0].data.size() == 3);
    TEST(m.exportsection.exports[0].name == "id");
    TEST(!ModuleHasSection(m, WASM_SECTION_START));
  }

  {
    WasmWriter w;
    std::vector<uint8_t> bin = w.Build();
    Module m;
    TESTERR(Parse(env, bin, m), ERR_SUCCESS);
    TEST(m.type.functypes.empty());

    bin[0] = 'X';
    TESTERR(Parse(env, bin, m), ERR_PARSE_INVALID_MAGIC_COOKIE);
    bin[0] = 0;
    bin[4] = 2;
    TESTERR(Parse(env, bin, m), ERR_PARSE_INVALID_VERSION);
    bin.resize(6);
    TESTERR(Parse(env, bin, m), ERR_PARSE_UNEXPECTED_EOF);
    TESTERR(ParseModule(env, nullptr, 0, m), ERR_INVALID_ARGUMENT);
  }

  {
    // A bad header fails the whole pipeline and produces no instance
    ImportMap imports;
    std::vector<uint8_t> bin = WasmWriter().Build();
    std::shared_ptr<Instance> inst;

    bin[1] = 'X';
    int err = Compile(env, bin.data(), bin.size(), imports, inst);
    TESTERR(err, ERR_PARSE_INVALID_MAGIC_COOKIE);
    TEST(err < 0);
    TEST(ErrorClass(err) == ERRCLASS_MALFORMED_BINARY);
    TEST(!inst);

    bin[1] = 0x61;
    bin[4] = 2;
    err = Compile(env, bin.data(), bin.size(), imports, inst);
    TESTERR(err, ERR_PARSE_INVALID_VERSION);
    TEST(err < 0);
    TEST(ErrorClass(err) == ERRCLASS_MALFORMED_BINARY);
    TEST(!inst);
  }

  {
    WasmWriter w;
    w.AddType({}, {});
    w.AddFunction(0, Code());
    std::vector<uint8_t> bin = w.Build();

    Module m;
    std::vector<uint8_t> truncated(bin.begin(), bin.end() - 1);
    TESTERR(Parse(env, truncated, m), ERR_PARSE_UNEXPECTED_EOF);

    // Sections must appear in order, and only once
    std::vector<uint8_t> swapped = { 0x00, 0x61, 0x73, 0x6d, 0x01, 0x00, 0x00, 0x00, WASM_SECTION_FUNCTION, 1, 0,
                                     WASM_SECTION_TYPE,  1, 0 };
    TESTERR(Parse(env, swapped, m), ERR_FATAL_INVALID_SECTION_ORDER);
    std::vector<uint8_t> twice = { 0x00, 0x61, 0x73, 0x6d, 0x01, 0x00, 0x00, 0x00, WASM_SECTION_TYPE, 1, 0,
                                   WASM_SECTION_TYPE, 1, 0 };
    TESTERR(Parse(env, twice, m), ERR_FATAL_DUPLICATE_SECTION);

    std::vector<uint8_t> unknown = { 0x00, 0x61, 0x73, 0x6d, 0x01, 0x00, 0x00, 0x00, 0x0C, 1, 0 };
    TESTERR(Parse(env, unknown, m), ERR_FATAL_UNKNOWN_SECTION);

    // A type section that claims one more byte than its content uses
    std::vector<uint8_t> padded = { 0x00, 0x61, 0x73, 0x6d, 0x01, 0x00, 0x00, 0x00, WASM_SECTION_TYPE, 2, 0, 0 };
    TESTERR(Parse(env, padded, m), ERR_FATAL_SECTION_SIZE_MISMATCH);

    // Custom sections may appear anywhere
    std::vector<uint8_t> custom = { 0x00, 0x61, 0x73, 0x6d, 0x01, 0x00, 0x00, 0x00, WASM_SECTION_TYPE, 1, 0,
                                    WASM_SECTION_CUSTOM, 3, 2, 'h', 'i', WASM_SECTION_FUNCTION, 1, 0 };
    TESTERR(Parse(env, custom, m), ERR_SUCCESS);
  }

  {
    // A function section without a code section
    std::vector<uint8_t> nocode = { 0x00, 0x61, 0x73, 0x6d, 0x01, 0x00, 0x00, 0x00, WASM_SECTION_TYPE, 4, 1,
                                    0x60, 0,    0,    WASM_SECTION_FUNCTION, 2, 1, 0 };
    Module m;
    TESTERR(Parse(env, nocode, m), ERR_FUNCTION_BODY_MISMATCH);
  }

  {
    WasmWriter w;
    w.AddType({}, {});
    w.AddFunction(0, Code().Op(0x06));
    Module m;
    TESTERR(Parse(env, w.Build(), m), ERR_FATAL_UNKNOWN_INSTRUCTION);
  }

  {
    WasmWriter w;
    w.AddType({}, {});
    w.AddFunction(0, Code().Misc(0x08));
    Module m;
    TESTERR(Parse(env, w.Build(), m), ERR_FATAL_UNKNOWN_INSTRUCTION);
  }

  {
    WasmWriter w;
    w.AddType({}, {});
    w.AddFunction(0, Code().Op(OP_memory_size).Op(1).Op(OP_drop));
    Module m;
    TESTERR(Parse(env, w.Build(), m), ERR_INVALID_RESERVED_VALUE);
  }

  {
    std::vector<uint8_t> bin = { 0x00, 0x61, 0x73, 0x6d, 0x01, 0x00, 0x00, 0x00, WASM_SECTION_TYPE, 5, 1,
                                 0x60, 0,    2,    0x7F, 0x7F };
    Module m;
    TESTERR(Parse(env, bin, m), ERR_PARSE_UNEXPECTED_EOF);
    std::vector<uint8_t> multi = { 0x00, 0x61, 0x73, 0x6d, 0x01, 0x00, 0x00, 0x00, WASM_SECTION_TYPE, 6, 1,
                                   0x60, 0,    2,    0x7F, 0x7F };
    TESTERR(Parse(env, multi, m), ERR_MULTIPLE_RETURN_VALUES);
  }

  {
    // Module name subsection of the custom name section
    std::vector<uint8_t> bin = { 0x00, 0x61, 0x73, 0x6d, 0x01, 0x00, 0x00, 0x00, WASM_SECTION_CUSTOM, 11, 4,
                                 'n',  'a',  'm',  'e',  0,    4,    3,    'f',  'o',  'o' };
    Module m;
    TESTERR(Parse(env, bin, m), ERR_SUCCESS);
    TEST(m.name == "foo");
  }
}
