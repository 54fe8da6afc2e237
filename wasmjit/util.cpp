// Copyright (c)2020 Black Sphere Studios
// For conditions of distribution and use, see copyright notice in wasmjit.h

#include "util.h"
#include <stdarg.h>

namespace wasmjit {
  namespace utility {
    varuint32 ModuleFunctionType(const Module& m, varuint32 index)
    {
      if(index < m.importsection.functions)
        return m.importsection.imports[index].func_desc.type_index;
      index -= m.importsection.functions;
      if(index < m.function.funcdecl.size())
        return m.function.funcdecl[index].type_index;
      return (varuint32)~0;
    }

    const FunctionType* ModuleFunction(const Module& m, varuint32 index)
    {
      varuint32 type = ModuleFunctionType(m, index);
      if(type < m.type.functypes.size())
        return &m.type.functypes[type];
      return nullptr;
    }
    const TableDesc* ModuleTable(const Module& m, varuint32 index)
    {
      size_t i = index + static_cast<size_t>(m.importsection.functions); // Shift index to table section
      if(i < m.importsection.tables)
        return &m.importsection.imports[i].table_desc;
      i -= m.importsection.tables;
      if(i < m.table.tables.size())
        return &m.table.tables[i];
      return nullptr;
    }
    const MemoryDesc* ModuleMemory(const Module& m, varuint32 index)
    {
      size_t i = index + static_cast<size_t>(m.importsection.tables); // Shift index to memory section
      if(i < m.importsection.memories)
        return &m.importsection.imports[i].mem_desc;
      i -= m.importsection.memories;
      if(i < m.memory.memories.size())
        return &m.memory.memories[i];
      return nullptr;
    }
    const GlobalDesc* ModuleGlobal(const Module& m, varuint32 index)
    {
      size_t i = index + static_cast<size_t>(m.importsection.memories); // Shift index to globals section
      if(i < m.importsection.globals)
        return &m.importsection.imports[i].global_desc;
      i -= m.importsection.globals;
      if(i < m.global.globals.size())
        return &m.global.globals[i].desc;
      return nullptr;
    }

    const Import* ModuleImport(const Module& m, varuint7 kind, varuint32 index)
    {
      size_t begin;
      size_t end;
      switch(kind)
      {
      case WASM_KIND_FUNCTION:
        begin = 0;
        end   = m.importsection.functions;
        break;
      case WASM_KIND_TABLE:
        begin = m.importsection.functions;
        end   = m.importsection.tables;
        break;
      case WASM_KIND_MEMORY:
        begin = m.importsection.tables;
        end   = m.importsection.memories;
        break;
      case WASM_KIND_GLOBAL:
        begin = m.importsection.memories;
        end   = m.importsection.globals;
        break;
      default: return nullptr;
      }

      if(begin + index < end)
        return &m.importsection.imports[begin + index];
      return nullptr;
    }

    void AppendError(Environment& env, int code, const char* fmt, ...)
    {
      va_list args;
      va_start(args, fmt);
      int len = vsnprintf(0, 0, fmt, args);
      va_end(args);

      ValidationError err;
      err.code = code;
      if(len > 0)
      {
        err.error.resize(static_cast<size_t>(len) + 1);
        va_start(args, fmt);
        vsnprintf(&err.error[0], err.error.size(), fmt, args);
        va_end(args);
        err.error.resize(static_cast<size_t>(len));
      }

      LogMessage(env, LOG_NOTICE, "Validation error %i: %s\n", code, err.error.c_str());
      env.errors.push_back(std::move(err));
    }
  }
}
