// Copyright (c)2020 Black Sphere Studios
// For conditions of distribution and use, see copyright notice in wasmjit.h

#ifndef WJ__SCHEMA_H
#define WJ__SCHEMA_H

#include "wasmjit/wasmjit.h"
#include "wasmjit/errors.h"
#include "wasmjit/opcodes.h"
#include "wasmjit/flags.h"
#include <stdint.h>
#include <stddef.h>
#include <stdio.h>
#include <string>
#include <vector>

// Maximum number of immediates used by any instruction
#define MAX_IMMEDIATES 2

// Size of a single linear memory page, and the largest number of pages a 32-bit memory can address
#define WASM_PAGE_SIZE   65536
#define WASM_MAX_PAGES   65536
#define WASM_MAX_ENTRIES 0xFFFFFFFFu

// Largest number of slots a FunctionTable may hold
#define WJ_MAX_TABLE_LENGTH 10000000u

// WASM binary type encodings, stored as a varsint7
enum WASM_TYPE_ENCODING
{
  TE_i32     = -0x01,
  TE_i64     = -0x02,
  TE_f32     = -0x03,
  TE_f64     = -0x04,
  TE_funcref = -0x10,
  TE_func    = -0x20,
  TE_void    = -0x40,

  TE_NONE = 0x71, // Internal values, never encoded
  TE_POLY = 0x72,
};

// Flags applicable to resizable limits
enum WASM_LIMIT_FLAGS
{
  WASM_LIMIT_HAS_MAXIMUM = 0x01,
};

// Known webassembly section opcodes
enum WASM_SECTION_OPCODE
{
  WASM_SECTION_CUSTOM   = 0x00,
  WASM_SECTION_TYPE     = 0x01,
  WASM_SECTION_IMPORT   = 0x02,
  WASM_SECTION_FUNCTION = 0x03,
  WASM_SECTION_TABLE    = 0x04,
  WASM_SECTION_MEMORY   = 0x05,
  WASM_SECTION_GLOBAL   = 0x06,
  WASM_SECTION_EXPORT   = 0x07,
  WASM_SECTION_START    = 0x08,
  WASM_SECTION_ELEMENT  = 0x09,
  WASM_SECTION_CODE     = 0x0A,
  WASM_SECTION_DATA     = 0x0B
};

// Export or import kind enumeration.
enum WASM_KIND
{
  WASM_KIND_FUNCTION = 0,
  WASM_KIND_TABLE    = 1,
  WASM_KIND_MEMORY   = 2,
  WASM_KIND_GLOBAL   = 3,
};

enum WJ_LOG_LEVEL
{
  LOG_NONE  = -1, // Suppress all log output no matter what
  LOG_FATAL = 0,
  LOG_ERROR,
  LOG_WARNING, // Default setting
  LOG_NOTICE,  // Verbose setting
  LOG_DEBUG,   // Only useful for library developers
};

namespace wasmjit {
  typedef uint32_t uint32;
  typedef bool varuint1;
  typedef uint8_t varuint7;
  typedef uint32_t varuint32;
  typedef uint64_t varuint64;
  typedef int8_t varsint7;
  typedef int32_t varsint32;
  typedef int64_t varsint64;
  typedef float float32;
  typedef double float64;

  // A union representing all possible scalar immediate values of a webassembly instruction.
  union Immediate
  {
    uint32 _uint32;
    varuint1 _varuint1;
    varuint7 _varuint7;
    varuint32 _varuint32;
    varuint64 _varuint64;
    varsint7 _varsint7;
    varsint32 _varsint32;
    varsint64 _varsint64;
    float32 _float32;
    float64 _float64;
  };

  // Encodes a single webassembly instruction and it's associated immediate values. br_table stores its target list in
  // table and its default target in immediates[0].
  struct Instruction
  {
    uint8_t opcode[2];
    Immediate immediates[MAX_IMMEDIATES];
    std::vector<varuint32> table;
    size_t offset; // Byte offset of the opcode in the binary
  };

  // A webassembly function type signature, encoding the form, parameters, and return values.
  struct FunctionType
  {
    varsint7 form;
    std::vector<varsint7> params;
    std::vector<varsint7> returns;

    bool operator==(const FunctionType& r) const { return form == r.form && params == r.params && returns == r.returns; }
    bool operator!=(const FunctionType& r) const { return !operator==(r); }
  };

  // The underlying resizable limits structure used by linear memories and tables.
  struct ResizableLimits
  {
    varuint32 flags; // WASM_LIMIT_FLAGS
    varuint32 minimum;
    varuint32 maximum;
  };

  // A single linear memory declaration.
  struct MemoryDesc
  {
    ResizableLimits limits;
  };

  // A single table declaration.
  struct TableDesc
  {
    varsint7 element_type;
    ResizableLimits resizable;
  };

  // A single global description.
  struct GlobalDesc
  {
    varsint7 type;
    varuint1 mutability;
  };

  // A single global declaration, which is a description plus an initialization instruction.
  struct GlobalDecl
  {
    GlobalDesc desc;
    Instruction init;
  };

  // A single function description, holding the type index of the function's signature.
  struct FunctionDesc
  {
    varuint32 type_index;
  };

  // Represents a single webassembly import definition
  struct Import
  {
    std::string module_name;
    std::string export_name;
    varuint7 kind;   // WASM_KIND
    varuint32 order; // Position of this import in the binary, before imports were grouped by kind
    union
    {
      FunctionDesc func_desc;
      TableDesc table_desc;
      MemoryDesc mem_desc;
      GlobalDesc global_desc;
    };
  };

  // Represents a single webassembly export definition
  struct Export
  {
    std::string name;
    varuint7 kind; // WASM_KIND
    varuint32 index;
  };

  // Encodes initialization data for a table
  struct TableInit
  {
    varuint32 index;
    Instruction offset;
    std::vector<varuint32> elements;
  };

  // Stores a local declaration
  struct FunctionLocal
  {
    varuint32 count;
    varsint7 type;
  };

  // Defines the locals and instructions of a webassembly function body
  struct FunctionBody
  {
    std::vector<FunctionLocal> locals;
    varuint32 local_size; // total number of individual locals (sum of all counts)
    std::vector<Instruction> body;
    varuint32 body_size; // number of bytes used by the body
    size_t offset;
  };

  // Encodes initialization data for a data section
  struct DataInit
  {
    varuint32 index;
    Instruction offset;
    std::vector<uint8_t> data;
  };

  // Represents a single decoded webassembly module. Every index space of a kind lists its imports first, followed by
  // the local declarations.
  struct Module
  {
    uint32 magic_cookie;
    uint32 version;
    uint32_t knownsections; // bit-index corresponds to that OPCODE section being loaded
    std::string name;

    struct TypeSection
    {
      std::vector<FunctionType> functypes;
    } type;

    // Imports are sorted by kind, each count holds the running total, so functions is the number of function imports,
    // tables is functions plus the number of table imports, and so on.
    struct ImportSection
    {
      varuint32 functions;
      varuint32 tables;
      varuint32 memories;
      varuint32 globals;
      std::vector<Import> imports;
    } importsection;

    struct FunctionSection
    {
      std::vector<FunctionDesc> funcdecl;
    } function;

    struct TableSection
    {
      std::vector<TableDesc> tables;
    } table;

    struct MemorySection
    {
      std::vector<MemoryDesc> memories;
    } memory;

    struct GlobalSection
    {
      std::vector<GlobalDecl> globals;
    } global;

    struct ExportSection
    {
      std::vector<Export> exports;
    } exportsection;

    varuint32 start;

    struct ElementSection
    {
      std::vector<TableInit> elements;
    } element;

    struct CodeSection
    {
      std::vector<FunctionBody> funcbody;
    } code;

    struct DataSection
    {
      std::vector<DataInit> data;
    } data;
  };

  // Represents a single validation error.
  struct ValidationError
  {
    int code;
    std::string error;
  };

  // Holds the configuration shared by every stage of the pipeline, and collects validation errors.
  struct Environment
  {
    uint64_t flags;    // WASM_ENVIRONMENT_FLAGS
    uint64_t optimize; // WASM_OPTIMIZE_FLAGS
    uint32_t maxdepth; // Maximum call depth before a compiled function traps with ERR_TRAP_STACK_OVERFLOW
    int loglevel;      // WJ_LOG_LEVEL
    FILE* log;         // Output stream for log messages
    int (*loghook)(const Environment* env, const char* format, ...);
    std::vector<ValidationError> errors; // Non-fatal validation errors that prevent proper execution.
  };
}

#endif
