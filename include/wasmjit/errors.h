// Copyright (c)2021 Fundament Software
// For conditions of distribution and use, see copyright notice in wasmjit.h

#ifndef WJ__ERRORS_H
#define WJ__ERRORS_H

// Every failure is a negative value. The ranges group the codes by the stage that produces them, see ErrorClass().
// Each group starts at the bottom of its range and counts up towards zero.
enum WJ_ERROR
{
  ERR_SUCCESS = 0,

  // Malformed binary (-0x01 to -0x3F)
  ERR_PARSE_UNEXPECTED_EOF = -0x3F,
  ERR_PARSE_INVALID_MAGIC_COOKIE,
  ERR_PARSE_INVALID_VERSION,
  ERR_PARSE_INVALID_NAME,
  ERR_FATAL_INVALID_ENCODING,
  ERR_FATAL_OVERLONG_ENCODING,
  ERR_FATAL_UNKNOWN_SECTION,
  ERR_FATAL_SECTION_SIZE_MISMATCH,
  ERR_FATAL_INVALID_SECTION_ORDER,
  ERR_FATAL_DUPLICATE_SECTION,
  ERR_FATAL_UNKNOWN_INSTRUCTION,
  ERR_FATAL_UNKNOWN_KIND,
  ERR_FATAL_INVALID_TYPE,
  ERR_FATAL_EXPECTED_END_INSTRUCTION,
  ERR_FATAL_TOO_MANY_LOCALS,
  ERR_FATAL_INVALID_INITIALIZER,
  ERR_FUNCTION_BODY_MISMATCH,
  ERR_INVALID_RESERVED_VALUE,
  ERR_INVALID_LIMITS_FLAGS,
  ERR_MULTIPLE_RETURN_VALUES,

  // Validation (-0x40 to -0x7F)
  ERR_INVALID_TYPE_INDEX = -0x7F,
  ERR_INVALID_FUNCTION_INDEX,
  ERR_INVALID_TABLE_INDEX,
  ERR_INVALID_MEMORY_INDEX,
  ERR_INVALID_GLOBAL_INDEX,
  ERR_INVALID_LOCAL_INDEX,
  ERR_INVALID_EXPORT_INDEX,
  ERR_INVALID_START_FUNCTION,
  ERR_INVALID_TYPE,
  ERR_INVALID_VALUE_STACK,
  ERR_EMPTY_VALUE_STACK,
  ERR_INVALID_BRANCH_DEPTH,
  ERR_IF_ELSE_MISMATCH,
  ERR_END_MISMATCH,
  ERR_INVALID_BLOCK_SIGNATURE,
  ERR_INVALID_MEMORY_ALIGNMENT,
  ERR_INVALID_INITIALIZER_TYPE,
  ERR_INVALID_GLOBAL_INITIALIZER,
  ERR_IMMUTABLE_GLOBAL,
  ERR_INVALID_LIMITS,
  ERR_MEMORY_TOO_LARGE,
  ERR_MULTIPLE_TABLES,
  ERR_MULTIPLE_MEMORIES,

  // Linking (-0x80 to -0xBF)
  ERR_UNRESOLVED_IMPORT = -0xBF,
  ERR_IMPORT_KIND_MISMATCH,
  ERR_IMPORT_SIGNATURE_MISMATCH,
  ERR_IMPORT_LIMITS_MISMATCH,
  ERR_MODULE_LOAD,
  ERR_RUNTIME_JIT_ERROR,

  // Traps (-0xC0 to -0xFF)
  ERR_TRAP_DIVIDE_BY_ZERO = -0xFF,
  ERR_TRAP_INTEGER_OVERFLOW,
  ERR_TRAP_OUT_OF_BOUNDS_MEMORY_ACCESS,
  ERR_TRAP_OUT_OF_BOUNDS_TABLE_ACCESS,
  ERR_TRAP_INDIRECT_CALL_TYPE_MISMATCH,
  ERR_TRAP_UNREACHABLE,
  ERR_TRAP_UNINITIALIZED_TABLE_ENTRY,
  ERR_TRAP_STACK_OVERFLOW,

  // Host API misuse (-0x100 and below)
  ERR_INVALID_ARGUMENT = -0x13F,
  ERR_SIGNATURE_MISMATCH,
  ERR_INDEX_OUT_OF_RANGE,
  ERR_LIMIT_EXCEEDED,
  ERR_UNKNOWN_EXPORT,
  ERR_AMBIGUOUS_EXPORT,
  ERR_FATAL_OUT_OF_MEMORY,
};

enum WJ_ERROR_CLASS
{
  ERRCLASS_NONE = 0,
  ERRCLASS_MALFORMED_BINARY,
  ERRCLASS_VALIDATION,
  ERRCLASS_LINK,
  ERRCLASS_TRAP,
  ERRCLASS_API,
};

inline WJ_ERROR_CLASS ErrorClass(int err)
{
  if(err >= 0)
    return ERRCLASS_NONE;
  if(err > -0x40)
    return ERRCLASS_MALFORMED_BINARY;
  if(err > -0x80)
    return ERRCLASS_VALIDATION;
  if(err > -0xC0)
    return ERRCLASS_LINK;
  if(err > -0x100)
    return ERRCLASS_TRAP;
  return ERRCLASS_API;
}

#endif
