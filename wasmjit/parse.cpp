// Copyright (c)2020 Black Sphere Studios
// For conditions of distribution and use, see copyright notice in wasmjit.h

#include "parse.h"
#include "util.h"
#include "wasmjit/export.h"
#include <algorithm>
#include <limits>

using namespace wasmjit;
using namespace utility;

namespace wasmjit {
  namespace internal {
    WJ_FORCEINLINE WJ_ERROR ParseVarUInt32(Stream& s, varuint32& target)
    {
      WJ_ERROR err = ERR_SUCCESS;
      target       = s.ReadVarUInt32(err);
      return err;
    }

    template<class T, typename... Args> struct Parse
    {
      // Reads a vector count followed by that many elements. The count is checked against the remaining bytes so a
      // corrupt count can't make us reserve gigabytes.
      template<WJ_ERROR (*PARSE)(Stream&, T&, Args...)>
      static WJ_ERROR Array(Stream& s, std::vector<T>& out, Args... args)
      {
        varuint32 size;
        WJ_ERROR err = ParseVarUInt32(s, size);
        if(err < 0)
          return err;
        if(size > s.Remaining())
          return ERR_PARSE_UNEXPECTED_EOF;

        out.clear();
        out.resize(size);
        for(varuint32 i = 0; i < size && err >= 0; ++i)
          err = PARSE(s, out[i], args...);

        return err;
      }
    };

    WJ_ERROR ParseFunctionLocal(Stream& s, FunctionLocal& entry)
    {
      WJ_ERROR err = ParseVarUInt32(s, entry.count);

      if(err >= 0)
        err = ParseValueType(s, entry.type);

      return err;
    }

    // Returns the order a known section must appear in. The section ids happen to be in order for the MVP.
    inline bool ValidateSectionOrder(uint32_t sections, varuint7 opcode) { return (sections >> opcode) == 0; }
  }
}

using namespace internal;

WJ_ERROR wasmjit::ParseValueType(Stream& s, varsint7& type)
{
  WJ_ERROR err = ERR_SUCCESS;
  type         = s.ReadVarInt7(err);
  if(err < 0)
    return err;

  switch(type)
  {
  case TE_i32:
  case TE_i64:
  case TE_f32:
  case TE_f64: return ERR_SUCCESS;
  }
  return ERR_FATAL_INVALID_TYPE;
}

WJ_ERROR wasmjit::ParseInitializer(Stream& s, Instruction& ins)
{
  WJ_ERROR err = ParseInstruction(s, ins);
  Instruction end;

  if(err >= 0)
  {
    switch(ins.opcode[0])
    {
    case OP_i32_const:
    case OP_i64_const:
    case OP_f32_const:
    case OP_f64_const:
    case OP_global_get: break;
    default: return ERR_FATAL_INVALID_INITIALIZER;
    }

    err = ParseInstruction(s, end);
  }

  if(err >= 0 && end.opcode[0] != OP_end)
    err = ERR_FATAL_EXPECTED_END_INSTRUCTION;

  return err;
}

WJ_ERROR wasmjit::ParseFunctionType(Stream& s, FunctionType& sig)
{
  WJ_ERROR err = ERR_SUCCESS;
  sig.form     = s.ReadVarInt7(err);
  if(err < 0)
    return err;

  if(sig.form != TE_func)
    return ERR_FATAL_INVALID_TYPE;

  err = Parse<varsint7>::template Array<&ParseValueType>(s, sig.params);

  if(err >= 0)
    err = Parse<varsint7>::template Array<&ParseValueType>(s, sig.returns);

  if(err >= 0 && sig.returns.size() > 1)
    err = ERR_MULTIPLE_RETURN_VALUES;

  return err;
}

WJ_ERROR wasmjit::ParseResizableLimits(Stream& s, ResizableLimits& limits)
{
  limits.maximum = 0;
  WJ_ERROR err   = ParseVarUInt32(s, limits.flags);

  if(err >= 0 && (limits.flags & ~WASM_LIMIT_HAS_MAXIMUM) != 0)
    err = ERR_INVALID_LIMITS_FLAGS;

  if(err >= 0)
    err = ParseVarUInt32(s, limits.minimum);

  if(err >= 0 && (limits.flags & WASM_LIMIT_HAS_MAXIMUM) != 0)
    err = ParseVarUInt32(s, limits.maximum);

  return err;
}

WJ_ERROR wasmjit::ParseFunctionDesc(Stream& s, FunctionDesc& desc) { return ParseVarUInt32(s, desc.type_index); }

WJ_ERROR wasmjit::ParseMemoryDesc(Stream& s, MemoryDesc& mem) { return ParseResizableLimits(s, mem.limits); }

WJ_ERROR wasmjit::ParseTableDesc(Stream& s, TableDesc& t)
{
  WJ_ERROR err   = ERR_SUCCESS;
  t.element_type = s.ReadVarInt7(err);

  if(err >= 0 && t.element_type != TE_funcref)
    err = ERR_FATAL_INVALID_TYPE;

  if(err >= 0)
    err = ParseResizableLimits(s, t.resizable);

  return err;
}

WJ_ERROR wasmjit::ParseGlobalDesc(Stream& s, GlobalDesc& g)
{
  WJ_ERROR err = ParseValueType(s, g.type);

  if(err >= 0)
    g.mutability = s.ReadVarUInt1(err);

  return err;
}

WJ_ERROR wasmjit::ParseGlobalDecl(Stream& s, GlobalDecl& g)
{
  WJ_ERROR err = ParseGlobalDesc(s, g.desc);

  if(err >= 0)
    err = ParseInitializer(s, g.init);

  return err;
}

WJ_ERROR wasmjit::ParseImport(Stream& s, Import& i)
{
  WJ_ERROR err = ERR_SUCCESS;
  if(!s.ReadName(i.module_name, err) || !s.ReadName(i.export_name, err))
    return err;

  i.kind = s.ReadByte(err);
  if(err < 0)
    return err;

  switch(i.kind)
  {
  case WASM_KIND_FUNCTION: return ParseVarUInt32(s, i.func_desc.type_index);
  case WASM_KIND_TABLE: return ParseTableDesc(s, i.table_desc);
  case WASM_KIND_MEMORY: return ParseMemoryDesc(s, i.mem_desc);
  case WASM_KIND_GLOBAL: return ParseGlobalDesc(s, i.global_desc);
  }

  return ERR_FATAL_UNKNOWN_KIND;
}

WJ_ERROR wasmjit::ParseExport(Stream& s, Export& e)
{
  WJ_ERROR err = ERR_SUCCESS;
  if(!s.ReadName(e.name, err))
    return err;

  e.kind = s.ReadByte(err);

  if(err >= 0 && e.kind > WASM_KIND_GLOBAL)
    err = ERR_FATAL_UNKNOWN_KIND;

  if(err >= 0)
    err = ParseVarUInt32(s, e.index);

  return err;
}

WJ_ERROR wasmjit::ParseInstruction(Stream& s, Instruction& ins)
{
  ins.offset    = s.pos;
  ins.opcode[1] = 0;
  ins.table.clear();
  memset(ins.immediates, 0, sizeof(ins.immediates));

  WJ_ERROR err  = ERR_SUCCESS;
  ins.opcode[0] = s.ReadByte(err);
  if(err < 0)
    return err;

  switch(ins.opcode[0])
  {
  case OP_block:
  case OP_loop:
  case OP_if:
    ins.immediates[0]._varsint7 = s.ReadVarInt7(err);
    if(err >= 0)
    {
      switch(ins.immediates[0]._varsint7)
      {
      case TE_i32:
      case TE_i64:
      case TE_f32:
      case TE_f64:
      case TE_void: break;
      default: err = ERR_FATAL_INVALID_TYPE;
      }
    }
    break;
  case OP_br:
  case OP_br_if:
  case OP_local_get:
  case OP_local_set:
  case OP_local_tee:
  case OP_global_get:
  case OP_global_set:
  case OP_call: ins.immediates[0]._varuint32 = s.ReadVarUInt32(err); break;
  case OP_i32_const: ins.immediates[0]._varsint32 = s.ReadVarInt32(err); break;
  case OP_i64_const: ins.immediates[0]._varsint64 = s.ReadVarInt64(err); break;
  case OP_f32_const: ins.immediates[0]._float32 = s.ReadFloat32(err); break;
  case OP_f64_const: ins.immediates[0]._float64 = s.ReadFloat64(err); break;
  case OP_memory_grow:
  case OP_memory_size:
    ins.immediates[0]._varuint7 = s.ReadByte(err);
    if(err >= 0 && ins.immediates[0]._varuint7 != 0)
      err = ERR_INVALID_RESERVED_VALUE;
    break;
  case OP_br_table:
    err = Parse<varuint32>::template Array<&ParseVarUInt32>(s, ins.table);

    if(err >= 0)
      ins.immediates[0]._varuint32 = s.ReadVarUInt32(err);
    break;
  case OP_call_indirect:
    ins.immediates[0]._varuint32 = s.ReadVarUInt32(err);

    if(err >= 0)
    {
      ins.immediates[1]._varuint7 = s.ReadByte(err);
      if(err >= 0 && ins.immediates[1]._varuint7 != 0)
        err = ERR_INVALID_RESERVED_VALUE;
    }
    break;
  case OP_unreachable:
  case OP_nop:
  case OP_else:
  case OP_end:
  case OP_return:
  case OP_drop:
  case OP_select: break;
  case OP_misc_ops_prefix:
  {
    varuint32 code = s.ReadVarUInt32(err);
    if(err >= 0 && code >= OP_MISC_CODE_COUNT)
      err = ERR_FATAL_UNKNOWN_INSTRUCTION;
    ins.opcode[1] = static_cast<uint8_t>(code);
    break;
  }
  default:
    // Every load and store carries an alignment and an offset
    if(ins.opcode[0] >= OP_i32_load && ins.opcode[0] <= OP_i64_store32)
    {
      ins.immediates[0]._varuint32 = s.ReadVarUInt32(err);

      if(err >= 0)
        ins.immediates[1]._varuint32 = s.ReadVarUInt32(err);
    }
    else if(ins.opcode[0] < OP_i32_eqz || ins.opcode[0] >= OP_CODE_COUNT) // Numeric operators have no immediates
      err = ERR_FATAL_UNKNOWN_INSTRUCTION;
  }

  return err;
}

WJ_ERROR wasmjit::ParseTableInit(Stream& s, TableInit& init)
{
  WJ_ERROR err = ParseVarUInt32(s, init.index);

  if(err >= 0)
    err = ParseInitializer(s, init.offset);

  if(err >= 0)
    err = Parse<varuint32>::template Array<&ParseVarUInt32>(s, init.elements);

  return err;
}

WJ_ERROR wasmjit::ParseFunctionBody(Stream& s, FunctionBody& f)
{
  f.offset     = s.pos;
  WJ_ERROR err = ParseVarUInt32(s, f.body_size);
  if(err < 0)
    return err;
  if(f.body_size > s.Remaining())
    return ERR_PARSE_UNEXPECTED_EOF;

  // body_size is the size of both the local entries and the body in bytes.
  Stream body = { s.data, s.pos + f.body_size, s.pos };
  s.pos += f.body_size;

  err = Parse<FunctionLocal>::template Array<&ParseFunctionLocal>(body, f.locals);
  if(err < 0)
    return err;

  f.local_size = 0;
  for(auto& local : f.locals)
  {
    if(local.count > (std::numeric_limits<uint32_t>::max() - f.local_size))
      return ERR_FATAL_TOO_MANY_LOCALS; // Ensure we don't overflow the local count
    f.local_size += local.count;
  }

  f.body.clear();
  f.body.reserve(body.Remaining());
  while(!body.End() && err >= 0)
  {
    f.body.emplace_back();
    err = ParseInstruction(body, f.body.back());
  }

  if(err >= 0 && (f.body.empty() || f.body.back().opcode[0] != OP_end))
    err = ERR_FATAL_EXPECTED_END_INSTRUCTION;

  return err;
}

WJ_ERROR wasmjit::ParseDataInit(Stream& s, DataInit& data)
{
  WJ_ERROR err = ParseVarUInt32(s, data.index);

  if(err >= 0)
    err = ParseInitializer(s, data.offset);

  varuint32 len = 0;
  if(err >= 0)
    err = ParseVarUInt32(s, len);

  if(err >= 0)
  {
    if(len > s.Remaining())
      return ERR_PARSE_UNEXPECTED_EOF;
    data.data.assign(s.data + s.pos, s.data + s.pos + len);
    s.pos += len;
  }

  return err;
}

// Only the module name subsection is kept, the function and local names have no use without debug info.
WJ_ERROR wasmjit::ParseNameSection(Stream& s, Module& m)
{
  WJ_ERROR err = ERR_SUCCESS;

  while(!s.End() && err >= 0)
  {
    varuint7 type = s.ReadByte(err);
    varuint32 len = s.ReadVarUInt32(err);
    if(err < 0)
      return err;
    if(len > s.Remaining())
      return ERR_PARSE_UNEXPECTED_EOF;

    if(type == 0)
      s.ReadName(m.name, err);
    else
      s.pos += len;
  }

  return err;
}

WJ_ERROR wasmjit::ParseModule(Stream& s, Module& m)
{
  m = Module();

  WJ_ERROR err   = ERR_SUCCESS;
  m.magic_cookie = s.ReadUInt32(err);

  if(err < 0)
    return err;
  if(m.magic_cookie != WASMJIT_WASM_MAGIC_COOKIE)
    return ERR_PARSE_INVALID_MAGIC_COOKIE;

  m.version = s.ReadUInt32(err);

  if(err < 0)
    return err;
  if(m.version != WASMJIT_WASM_MAGIC_VERSION)
    return ERR_PARSE_INVALID_VERSION;

  m.start = (varuint32)~0;

  while(err >= 0 && !s.End())
  {
    varuint7 opcode = s.ReadByte(err);
    if(err < 0)
      break;
    varuint32 payload = s.ReadVarUInt32(err);
    if(err < 0)
      break;
    if(payload > s.Remaining())
      return ERR_PARSE_UNEXPECTED_EOF;
    if(opcode > WASM_SECTION_DATA)
      return ERR_FATAL_UNKNOWN_SECTION;

    if(opcode != WASM_SECTION_CUSTOM) // Section order only applies to known sections
    {
      if(ModuleHasSection(m, opcode))
        return ERR_FATAL_DUPLICATE_SECTION;
      if(!ValidateSectionOrder(m.knownsections, opcode))
        return ERR_FATAL_INVALID_SECTION_ORDER;
      m.knownsections |= (1 << opcode);
    }

    // Each section is decoded from a stream that ends with the section, so nothing can read past its declared size
    Stream section = { s.data, s.pos + payload, s.pos };
    s.pos += payload;

    switch(opcode)
    {
    case WASM_SECTION_TYPE: err = Parse<FunctionType>::template Array<&ParseFunctionType>(section, m.type.functypes); break;
    case WASM_SECTION_IMPORT:
    {
      if((err = Parse<Import>::template Array<&ParseImport>(section, m.importsection.imports)) < 0)
        return err;
      for(varuint32 i = 0; i < m.importsection.imports.size(); ++i)
        m.importsection.imports[i].order = i;

      std::stable_sort(m.importsection.imports.begin(), m.importsection.imports.end(),
                       [](const Import& a, const Import& b) -> bool { return a.kind < b.kind; });

      // Each count includes every kind sorted before it
      for(auto& i : m.importsection.imports)
      {
        switch(i.kind)
        {
        case WASM_KIND_FUNCTION: ++m.importsection.functions;
        case WASM_KIND_TABLE: ++m.importsection.tables;
        case WASM_KIND_MEMORY: ++m.importsection.memories;
        case WASM_KIND_GLOBAL: ++m.importsection.globals; break;
        default: return ERR_FATAL_UNKNOWN_KIND;
        }
      }
    }
    break;
    case WASM_SECTION_FUNCTION:
      err = Parse<FunctionDesc>::template Array<&ParseFunctionDesc>(section, m.function.funcdecl);
      break;
    case WASM_SECTION_TABLE: err = Parse<TableDesc>::template Array<&ParseTableDesc>(section, m.table.tables); break;
    case WASM_SECTION_MEMORY: err = Parse<MemoryDesc>::template Array<&ParseMemoryDesc>(section, m.memory.memories); break;
    case WASM_SECTION_GLOBAL: err = Parse<GlobalDecl>::template Array<&ParseGlobalDecl>(section, m.global.globals); break;
    case WASM_SECTION_EXPORT: err = Parse<Export>::template Array<&ParseExport>(section, m.exportsection.exports); break;
    case WASM_SECTION_START: m.start = section.ReadVarUInt32(err); break;
    case WASM_SECTION_ELEMENT:
      err = Parse<TableInit>::template Array<&ParseTableInit>(section, m.element.elements);
      break;
    case WASM_SECTION_CODE:
      err = Parse<FunctionBody>::template Array<&ParseFunctionBody>(section, m.code.funcbody);
      if(err >= 0 && m.code.funcbody.size() != m.function.funcdecl.size())
        return ERR_FUNCTION_BODY_MISMATCH;
      break;
    case WASM_SECTION_DATA: err = Parse<DataInit>::template Array<&ParseDataInit>(section, m.data.data); break;
    case WASM_SECTION_CUSTOM:
    {
      std::string name;
      if(!section.ReadName(name, err))
        break;
      // A malformed name section doesn't make the module malformed, we just lose the name
      if(name == "name" && ParseNameSection(section, m) < 0)
        m.name.clear();
      section.pos = section.size;
    }
    break;
    }

    if(err >= 0 && section.pos != section.size)
      err = ERR_FATAL_SECTION_SIZE_MISMATCH;
    if(err < 0)
      s.pos = section.pos;
  }

  if(err < 0)
    return err;

  if(m.code.funcbody.size() != m.function.funcdecl.size())
    return ERR_FUNCTION_BODY_MISMATCH;

  return ERR_SUCCESS;
}

WJ_ERROR wasmjit::ParseModule(Environment& env, const uint8_t* data, size_t size, Module& out)
{
  if(!data)
    return LogErrorString(env, "%s: no binary was given to decode.", ERR_INVALID_ARGUMENT);

  Stream s     = { data, size, 0 };
  WJ_ERROR err = ParseModule(s, out);
  if(err < 0)
    return LogErrorString(env, "%s: malformed binary at byte offset %zu.", err, s.pos);

  LogMessage(env, LOG_NOTICE, "Decoded module with %zu types, %zu imports, %zu functions and %zu exports.\n",
             out.type.functypes.size(), out.importsection.imports.size(), out.function.funcdecl.size(),
             out.exportsection.exports.size());
  return ERR_SUCCESS;
}
