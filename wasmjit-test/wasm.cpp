// Copyright (c)2021 Fundament Software
// For conditions of distribution and use, see copyright notice in wasmjit.h

#include "wasm.h"
#include <string.h>

namespace {
  void WriteU32(std::vector<uint8_t>& out, uint32_t v)
  {
    do
    {
      uint8_t b = v & 0x7F;
      v >>= 7;
      if(v != 0)
        b |= 0x80;
      out.push_back(b);
    } while(v != 0);
  }

  void WriteS64(std::vector<uint8_t>& out, int64_t v)
  {
    bool more = true;
    while(more)
    {
      uint8_t b = v & 0x7F;
      v >>= 7; // arithmetic shift
      if((v == 0 && !(b & 0x40)) || (v == -1 && (b & 0x40)))
        more = false;
      else
        b |= 0x80;
      out.push_back(b);
    }
  }

  void Append(std::vector<uint8_t>& out, const std::vector<uint8_t>& in) { out.insert(out.end(), in.begin(), in.end()); }
}

Code& Code::Op(uint8_t op)
{
  bytes.push_back(op);
  return *this;
}

Code& Code::U32(uint32_t v)
{
  WriteU32(bytes, v);
  return *this;
}

Code& Code::S32(int32_t v)
{
  WriteS64(bytes, v);
  return *this;
}

Code& Code::S64(int64_t v)
{
  WriteS64(bytes, v);
  return *this;
}

Code& Code::I32(int32_t v) { return Op(OP_i32_const).S32(v); }
Code& Code::I64(int64_t v) { return Op(OP_i64_const).S64(v); }

Code& Code::F32(float v)
{
  uint8_t b[sizeof(float)];
  memcpy(b, &v, sizeof(float));
  Op(OP_f32_const);
  bytes.insert(bytes.end(), b, b + sizeof(float));
  return *this;
}

Code& Code::F64(double v)
{
  uint8_t b[sizeof(double)];
  memcpy(b, &v, sizeof(double));
  Op(OP_f64_const);
  bytes.insert(bytes.end(), b, b + sizeof(double));
  return *this;
}

Code& Code::BrTable(std::initializer_list<uint32_t> targets, uint32_t def)
{
  Op(OP_br_table).U32(static_cast<uint32_t>(targets.size()));
  for(auto t : targets)
    U32(t);
  return U32(def);
}

WasmWriter::WasmWriter() :
  _ntypes(0),
  _nimports(0),
  _nfunctions(0),
  _ntables(0),
  _nmemories(0),
  _nglobals(0),
  _nexports(0),
  _nelements(0),
  _ndata(0),
  _nfuncimports(0),
  _hasstart(false),
  _start(0)
{}

void WasmWriter::WriteName(std::vector<uint8_t>& out, const char* name)
{
  size_t len = strlen(name);
  WriteU32(out, static_cast<uint32_t>(len));
  out.insert(out.end(), name, name + len);
}

void WasmWriter::WriteLimits(std::vector<uint8_t>& out, uint32_t minimum, bool has_max, uint32_t maximum)
{
  out.push_back(has_max ? 1 : 0);
  WriteU32(out, minimum);
  if(has_max)
    WriteU32(out, maximum);
}

void WasmWriter::WriteSection(std::vector<uint8_t>& out, uint8_t id, const std::vector<uint8_t>& payload,
                              uint32_t count)
{
  std::vector<uint8_t> body;
  WriteU32(body, count);
  Append(body, payload);
  out.push_back(id);
  WriteU32(out, static_cast<uint32_t>(body.size()));
  Append(out, body);
}

uint32_t WasmWriter::AddType(std::initializer_list<int8_t> params, std::initializer_list<int8_t> results)
{
  _types.push_back(static_cast<uint8_t>(TE_func & 0x7F));
  WriteU32(_types, static_cast<uint32_t>(params.size()));
  for(auto p : params)
    _types.push_back(static_cast<uint8_t>(p & 0x7F));
  WriteU32(_types, static_cast<uint32_t>(results.size()));
  for(auto r : results)
    _types.push_back(static_cast<uint8_t>(r & 0x7F));
  return _ntypes++;
}

void WasmWriter::ImportFunction(const char* module_name, const char* field, uint32_t type)
{
  WriteName(_imports, module_name);
  WriteName(_imports, field);
  _imports.push_back(WASM_KIND_FUNCTION);
  WriteU32(_imports, type);
  ++_nimports;
  ++_nfuncimports;
}

void WasmWriter::ImportTable(const char* module_name, const char* field, uint32_t minimum, bool has_max,
                             uint32_t maximum)
{
  WriteName(_imports, module_name);
  WriteName(_imports, field);
  _imports.push_back(WASM_KIND_TABLE);
  _imports.push_back(static_cast<uint8_t>(TE_funcref & 0x7F));
  WriteLimits(_imports, minimum, has_max, maximum);
  ++_nimports;
}

void WasmWriter::ImportMemory(const char* module_name, const char* field, uint32_t minimum, bool has_max,
                              uint32_t maximum)
{
  WriteName(_imports, module_name);
  WriteName(_imports, field);
  _imports.push_back(WASM_KIND_MEMORY);
  WriteLimits(_imports, minimum, has_max, maximum);
  ++_nimports;
}

void WasmWriter::ImportGlobal(const char* module_name, const char* field, int8_t type, bool mutability)
{
  WriteName(_imports, module_name);
  WriteName(_imports, field);
  _imports.push_back(WASM_KIND_GLOBAL);
  _imports.push_back(static_cast<uint8_t>(type & 0x7F));
  _imports.push_back(mutability ? 1 : 0);
  ++_nimports;
}

uint32_t WasmWriter::AddFunction(uint32_t type, const Code& body,
                                 std::initializer_list<std::pair<uint32_t, int8_t>> locals)
{
  WriteU32(_functions, type);

  std::vector<uint8_t> func;
  WriteU32(func, static_cast<uint32_t>(locals.size()));
  for(auto& l : locals)
  {
    WriteU32(func, l.first);
    func.push_back(static_cast<uint8_t>(l.second & 0x7F));
  }
  Append(func, body.bytes);
  func.push_back(OP_end);

  WriteU32(_code, static_cast<uint32_t>(func.size()));
  Append(_code, func);
  return _nfuncimports + _nfunctions++;
}

void WasmWriter::AddTable(uint32_t minimum, bool has_max, uint32_t maximum)
{
  _tables.push_back(static_cast<uint8_t>(TE_funcref & 0x7F));
  WriteLimits(_tables, minimum, has_max, maximum);
  ++_ntables;
}

void WasmWriter::AddMemory(uint32_t minimum, bool has_max, uint32_t maximum)
{
  WriteLimits(_memories, minimum, has_max, maximum);
  ++_nmemories;
}

void WasmWriter::AddGlobal(int8_t type, bool mutability, const Code& init)
{
  _globals.push_back(static_cast<uint8_t>(type & 0x7F));
  _globals.push_back(mutability ? 1 : 0);
  Append(_globals, init.bytes);
  _globals.push_back(OP_end);
  ++_nglobals;
}

void WasmWriter::Export(const char* name, uint8_t kind, uint32_t index)
{
  WriteName(_exports, name);
  _exports.push_back(kind);
  WriteU32(_exports, index);
  ++_nexports;
}

void WasmWriter::Start(uint32_t index)
{
  _hasstart = true;
  _start    = index;
}

void WasmWriter::Element(uint32_t table, const Code& offset, std::initializer_list<uint32_t> functions)
{
  WriteU32(_elements, table);
  Append(_elements, offset.bytes);
  _elements.push_back(OP_end);
  WriteU32(_elements, static_cast<uint32_t>(functions.size()));
  for(auto f : functions)
    WriteU32(_elements, f);
  ++_nelements;
}

void WasmWriter::Data(uint32_t memory, const Code& offset, const std::string& bytes)
{
  WriteU32(_data, memory);
  Append(_data, offset.bytes);
  _data.push_back(OP_end);
  WriteU32(_data, static_cast<uint32_t>(bytes.size()));
  _data.insert(_data.end(), bytes.begin(), bytes.end());
  ++_ndata;
}

std::vector<uint8_t> WasmWriter::Build() const
{
  std::vector<uint8_t> out = { 0x00, 0x61, 0x73, 0x6d, 0x01, 0x00, 0x00, 0x00 };

  if(_ntypes)
    WriteSection(out, WASM_SECTION_TYPE, _types, _ntypes);
  if(_nimports)
    WriteSection(out, WASM_SECTION_IMPORT, _imports, _nimports);
  if(_nfunctions)
    WriteSection(out, WASM_SECTION_FUNCTION, _functions, _nfunctions);
  if(_ntables)
    WriteSection(out, WASM_SECTION_TABLE, _tables, _ntables);
  if(_nmemories)
    WriteSection(out, WASM_SECTION_MEMORY, _memories, _nmemories);
  if(_nglobals)
    WriteSection(out, WASM_SECTION_GLOBAL, _globals, _nglobals);
  if(_nexports)
    WriteSection(out, WASM_SECTION_EXPORT, _exports, _nexports);
  if(_hasstart)
  {
    std::vector<uint8_t> body;
    WriteU32(body, _start);
    out.push_back(WASM_SECTION_START);
    WriteU32(out, static_cast<uint32_t>(body.size()));
    Append(out, body);
  }
  if(_nelements)
    WriteSection(out, WASM_SECTION_ELEMENT, _elements, _nelements);
  if(_nfunctions)
    WriteSection(out, WASM_SECTION_CODE, _code, _nfunctions);
  if(_ndata)
    WriteSection(out, WASM_SECTION_DATA, _data, _ndata);

  return out;
}
