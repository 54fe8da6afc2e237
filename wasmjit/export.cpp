// Copyright (c)2020 Black Sphere Studios
// For conditions of distribution and use, see copyright notice in wasmjit.h

#include "wasmjit/export.h"
#include "util.h"
#include <stdarg.h>

using namespace wasmjit;
using namespace utility;

Environment wasmjit::CreateEnvironment()
{
  Environment env;
  env.flags    = ENV_STRICT;
  env.optimize = ENV_OPTIMIZE_O3;
  env.maxdepth = 16384;
  env.loglevel = LOG_WARNING;
  env.log      = stderr;
  env.loghook  = &DefaultLog;
  return env;
}

int wasmjit::DefaultLog(const Environment* env, const char* format, ...)
{
  va_list args;
  va_start(args, format);
  int len = VFPRINTF((env && env->log) ? env->log : stderr, format, args);
  va_end(args);
  return len;
}

WJ_ERROR wasmjit::LoadModule(Environment& env, const uint8_t* data, size_t size, Module& out)
{
  Module m = {};
  WJ_ERROR err;
  if((err = ParseModule(env, data, size, m)) < 0)
    return err;
  if((err = ValidateModule(env, m)) < 0)
    return err;

  out = std::move(m);
  return ERR_SUCCESS;
}

WJ_ERROR wasmjit::Compile(Environment& env, const uint8_t* data, size_t size, const ImportMap& imports,
                          std::shared_ptr<Instance>& out)
{
  Module m;
  WJ_ERROR err = LoadModule(env, data, size, m);
  if(err < 0)
    return err;
  return Instantiate(env, m, imports, out);
}

const char* wasmjit::ErrorString(int err, char* buf, size_t n) { return EnumToString(ERR_ENUM_MAP, err, buf, n); }
