// Copyright (c)2021 Fundament Software
// For conditions of distribution and use, see copyright notice in wasmjit.h

#ifndef WJ__TEST_WASM_H
#define WJ__TEST_WASM_H

#include "wasmjit/schema.h"
#include <initializer_list>
#include <string>
#include <vector>

// Appends instructions to a function body or initializer expression in binary form.
class Code
{
public:
  Code& Op(uint8_t op);
  Code& U32(uint32_t v);
  Code& S32(int32_t v);
  Code& S64(int64_t v);
  Code& I32(int32_t v);
  Code& I64(int64_t v);
  Code& F32(float v);
  Code& F64(double v);
  Code& LocalGet(uint32_t i) { return Op(OP_local_get).U32(i); }
  Code& LocalSet(uint32_t i) { return Op(OP_local_set).U32(i); }
  Code& LocalTee(uint32_t i) { return Op(OP_local_tee).U32(i); }
  Code& GlobalGet(uint32_t i) { return Op(OP_global_get).U32(i); }
  Code& GlobalSet(uint32_t i) { return Op(OP_global_set).U32(i); }
  Code& Call(uint32_t f) { return Op(OP_call).U32(f); }
  Code& CallIndirect(uint32_t type) { return Op(OP_call_indirect).U32(type).U32(0); }
  Code& Block(uint8_t op, int8_t sig) { return Op(op).Op(static_cast<uint8_t>(sig & 0x7F)); }
  Code& Br(uint8_t op, uint32_t depth) { return Op(op).U32(depth); }
  Code& BrTable(std::initializer_list<uint32_t> targets, uint32_t def);
  Code& Mem(uint8_t op, uint32_t align, uint32_t offset) { return Op(op).U32(align).U32(offset); }
  Code& Misc(uint8_t op) { return Op(OP_misc_ops_prefix).Op(op); }
  Code& End() { return Op(OP_end); }

  std::vector<uint8_t> bytes;
};

// Assembles a binary module. Sections are written in the order the binary format requires.
class WasmWriter
{
public:
  WasmWriter();

  uint32_t AddType(std::initializer_list<int8_t> params, std::initializer_list<int8_t> results);
  void ImportFunction(const char* module_name, const char* field, uint32_t type);
  void ImportTable(const char* module_name, const char* field, uint32_t minimum, bool has_max = false,
                   uint32_t maximum = 0);
  void ImportMemory(const char* module_name, const char* field, uint32_t minimum, bool has_max = false,
                    uint32_t maximum = 0);
  void ImportGlobal(const char* module_name, const char* field, int8_t type, bool mutability);
  // Adds a function body, the trailing end is appended automatically. Returns the function index.
  uint32_t AddFunction(uint32_t type, const Code& body, std::initializer_list<std::pair<uint32_t, int8_t>> locals = {});
  void AddTable(uint32_t minimum, bool has_max = false, uint32_t maximum = 0);
  void AddMemory(uint32_t minimum, bool has_max = false, uint32_t maximum = 0);
  void AddGlobal(int8_t type, bool mutability, const Code& init);
  void Export(const char* name, uint8_t kind, uint32_t index);
  void Start(uint32_t index);
  void Element(uint32_t table, const Code& offset, std::initializer_list<uint32_t> functions);
  void Data(uint32_t memory, const Code& offset, const std::string& bytes);

  std::vector<uint8_t> Build() const;

protected:
  static void WriteSection(std::vector<uint8_t>& out, uint8_t id, const std::vector<uint8_t>& payload, uint32_t count);
  static void WriteName(std::vector<uint8_t>& out, const char* name);
  static void WriteLimits(std::vector<uint8_t>& out, uint32_t minimum, bool has_max, uint32_t maximum);

  std::vector<uint8_t> _types, _imports, _functions, _tables, _memories, _globals, _exports, _elements, _code, _data;
  uint32_t _ntypes, _nimports, _nfunctions, _ntables, _nmemories, _nglobals, _nexports, _nelements, _ndata;
  uint32_t _nfuncimports;
  bool _hasstart;
  uint32_t _start;
};

#endif
