// Copyright (c)2020 Black Sphere Studios
// For conditions of distribution and use, see copyright notice in wasmjit.h

#ifndef WJ__CONSTANTS_H
#define WJ__CONSTANTS_H

#include "wasmjit/schema.h"
#include <array>
#include <initializer_list>
#include <utility>
#include <khash.h>

#define kh_exist2(h, x) ((x < kh_end(h)) && kh_exist(h, x))

KHASH_DECLARE(mapenum, int, const char*);

namespace wasmjit {
  namespace utility {
    extern const std::array<const char*, OP_CODE_COUNT> OPNAMES;
    extern const std::array<const char*, OP_MISC_CODE_COUNT> MISC_OPNAMES;

    extern const kh_mapenum_s* ERR_ENUM_MAP;
    extern const kh_mapenum_s* TYPE_ENCODING_MAP;
    extern const kh_mapenum_s* KIND_MAP;

    kh_mapenum_s* GenMapEnum(std::initializer_list<std::pair<int, const char*>> list);
    const char* EnumToString(const kh_mapenum_s* h, int i, char* buf, size_t n);

    inline const char* OpName(const Instruction& ins)
    {
      if(ins.opcode[0] == OP_misc_ops_prefix)
        return (ins.opcode[1] < OP_MISC_CODE_COUNT) ? MISC_OPNAMES[ins.opcode[1]] : "RESERVED";
      return (ins.opcode[0] < OP_CODE_COUNT) ? OPNAMES[ins.opcode[0]] : "RESERVED";
    }
  }
}

#endif
