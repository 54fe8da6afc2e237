// Copyright (c)2020 Black Sphere Studios
// For conditions of distribution and use, see copyright notice in wasmjit.h

#ifndef WJ__UTIL_H
#define WJ__UTIL_H

#include "wasmjit/schema.h"
#include "constants.h"
#include <string>
#include <utility>

namespace wasmjit {
  namespace utility {
    inline bool ModuleHasSection(const Module& m, varuint7 opcode) { return (m.knownsections & (1 << opcode)) != 0; }

    // Sizes of the combined import + local index spaces
    inline varuint32 ModuleFunctionCount(const Module& m)
    {
      return m.importsection.functions + static_cast<varuint32>(m.function.funcdecl.size());
    }
    inline varuint32 ModuleTableCount(const Module& m)
    {
      return (m.importsection.tables - m.importsection.functions) + static_cast<varuint32>(m.table.tables.size());
    }
    inline varuint32 ModuleMemoryCount(const Module& m)
    {
      return (m.importsection.memories - m.importsection.tables) + static_cast<varuint32>(m.memory.memories.size());
    }
    inline varuint32 ModuleGlobalCount(const Module& m)
    {
      return (m.importsection.globals - m.importsection.memories) + static_cast<varuint32>(m.global.globals.size());
    }

    // Each of these resolves an index in the combined space of its kind, returning nullptr if it is out of range.
    varuint32 ModuleFunctionType(const Module& m, varuint32 index);
    const FunctionType* ModuleFunction(const Module& m, varuint32 index);
    const TableDesc* ModuleTable(const Module& m, varuint32 index);
    const MemoryDesc* ModuleMemory(const Module& m, varuint32 index);
    const GlobalDesc* ModuleGlobal(const Module& m, varuint32 index);

    // Returns the import backing an index of the given kind, or nullptr if the index refers to a local declaration.
    const Import* ModuleImport(const Module& m, varuint7 kind, varuint32 index);

    // Formats a message and appends it to the environment's validation error list
    void AppendError(Environment& env, int code, const char* fmt, ...);

    // Logs "<ERR_NAME>: message" at LOG_ERROR level and returns the error, the error name is always the first format
    // argument.
    template<typename... Args>
    inline WJ_ERROR LogErrorString(const Environment& env, const char* format, WJ_ERROR err, Args... args)
    {
      if(env.loglevel >= LOG_ERROR && env.loghook != nullptr)
      {
        char buf[32];
        (*env.loghook)(&env, format, EnumToString(ERR_ENUM_MAP, err, buf, sizeof(buf)), args...);
        (*env.loghook)(&env, "\n");
      }
      return err;
    }

    template<typename... Args> inline void LogMessage(const Environment& env, int level, const char* format, Args... args)
    {
      if(env.loglevel >= level && env.loghook != nullptr)
        (*env.loghook)(&env, format, args...);
    }
  }
}

#endif
