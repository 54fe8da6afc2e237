// Copyright (c)2021 Fundament Software
// For conditions of distribution and use, see copyright notice in wasmjit.h

#include "llvm.h"
#include "link.h"
#include "compile.h"
#include "optimize.h"
#include "util.h"
#include "wasmjit/export.h"
#include <string.h>

using namespace wasmjit;
using namespace utility;
using namespace internal;

namespace {
  inline khint_t kh_import_hash_func(const char* key)
  {
    return kh_str_hash_func(key) * 31 + kh_str_hash_func(key + strlen(key) + 1);
  }

  inline bool kh_import_hash_equal(const char* a, const char* b)
  {
    if(strcmp(a, b) != 0)
      return false;
    return !strcmp(a + strlen(a) + 1, b + strlen(b) + 1);
  }

  // Builds a "module\0field\0" key
  std::string ImportKey(const char* module_name, const char* field)
  {
    std::string key(module_name);
    key.push_back(0);
    key.append(field);
    key.push_back(0);
    return key;
  }
}

__KHASH_IMPL(importmap, , const char*, size_t, 1, kh_import_hash_func, kh_import_hash_equal);
__KHASH_IMPL(exportmap, , const char*, size_t, 1, kh_str_hash_func, kh_str_hash_equal);

namespace wasmjit {
  namespace internal {
    template<typename... Args>
    inline WJ_ERROR LogErrorLLVM(const Environment& env, const char* format, WJ_ERROR err, llvm::Error&& llvmerr,
                                 Args... args)
    {
      if(env.loglevel < LOG_FATAL || env.loghook == nullptr)
      {
        llvm::consumeError(std::move(llvmerr));
        return err;
      }

      llvm::handleAllErrors(std::move(llvmerr), [&](const llvm::ErrorInfoBase& info) {
        char buf[32];
        (*env.loghook)(&env, format, EnumToString(ERR_ENUM_MAP, err, buf, sizeof(buf)), args...,
                       info.message().c_str());
        (*env.loghook)(&env, "\n");
      });
      return err;
    }

    inline bool LimitsSatisfy(const ResizableLimits& declared, varuint32 length, bool has_maximum, varuint32 maximum)
    {
      if(length < declared.minimum)
        return false;
      if(declared.flags & WASM_LIMIT_HAS_MAXIMUM)
        return has_maximum && maximum <= declared.maximum;
      return true;
    }
  }
}

ImportMap::ImportMap() : _map(kh_init_importmap()) {}

ImportMap::~ImportMap() { kh_destroy_importmap(_map); }

void ImportMap::Add(const char* module_name, const char* field, Extern binding)
{
  std::string key = ImportKey(module_name, field);
  khiter_t iter   = kh_get_importmap(_map, key.c_str());
  if(kh_exist2(_map, iter))
  {
    _bindings[kh_val(_map, iter)] = std::move(binding);
    return;
  }

  std::unique_ptr<char[]> buf(new char[key.size()]);
  memcpy(buf.get(), key.data(), key.size());

  // The map only ever points at keys the vectors already own
  _keys.push_back(std::move(buf));
  try
  {
    _bindings.push_back(std::move(binding));
  }
  catch(...)
  {
    _keys.pop_back();
    throw;
  }

  int r;
  iter = kh_put_importmap(_map, _keys.back().get(), &r);
  if(r < 0)
  {
    _bindings.pop_back();
    _keys.pop_back();
    throw std::bad_alloc();
  }
  kh_val(_map, iter) = _bindings.size() - 1;
}

const Extern* ImportMap::Find(const char* module_name, const char* field) const
{
  std::string key = ImportKey(module_name, field);
  khiter_t iter   = kh_get_importmap(_map, key.c_str());
  return kh_exist2(_map, iter) ? &_bindings[kh_val(_map, iter)] : nullptr;
}

Instance::Instance(std::shared_ptr<Linkage> linkage) : _linkage(std::move(linkage)), _map(kh_init_exportmap()) {}

Instance::~Instance() { kh_destroy_exportmap(_map); }

void Instance::AddExport(const std::string& name, const Extern& binding)
{
  khiter_t iter = kh_get_exportmap(_map, name.c_str());
  ExportSlot* slot;

  if(kh_exist2(_map, iter))
    slot = _exports[kh_val(_map, iter)].get();
  else
  {
    _exports.push_back(std::make_unique<ExportSlot>(
      ExportSlot{ name, {}, { false, false, false, false }, { false, false, false, false } }));
    slot = _exports.back().get();

    int r;
    iter = kh_put_exportmap(_map, slot->name.c_str(), &r);
    if(r < 0)
    {
      _exports.pop_back();
      throw std::bad_alloc();
    }
    kh_val(_map, iter) = _exports.size() - 1;
  }

  varuint7 kind = binding.kind;
  if(slot->present[kind] && slot->kinds[kind].get() != binding.get())
    slot->ambiguous[kind] = true;
  slot->kinds[kind]   = binding;
  slot->present[kind] = true;
}

WJ_ERROR Instance::GetExport(const char* name, varuint7 kind, Extern& out) const
{
  if(!name || kind > WASM_KIND_GLOBAL)
    return ERR_INVALID_ARGUMENT;

  khiter_t iter = kh_get_exportmap(_map, name);
  if(!kh_exist2(_map, iter))
    return ERR_UNKNOWN_EXPORT;

  const ExportSlot& slot = *_exports[kh_val(_map, iter)];
  if(!slot.present[kind])
    return ERR_UNKNOWN_EXPORT;
  if(slot.ambiguous[kind])
    return ERR_AMBIGUOUS_EXPORT;

  out = slot.kinds[kind];
  return ERR_SUCCESS;
}

std::shared_ptr<Function> Instance::GetFunction(const char* name) const
{
  Extern e;
  return (GetExport(name, WASM_KIND_FUNCTION, e) == ERR_SUCCESS) ? e.func : nullptr;
}

std::shared_ptr<FunctionTable> Instance::GetTable(const char* name) const
{
  Extern e;
  return (GetExport(name, WASM_KIND_TABLE, e) == ERR_SUCCESS) ? e.table : nullptr;
}

std::shared_ptr<Memory> Instance::GetMemory(const char* name) const
{
  Extern e;
  return (GetExport(name, WASM_KIND_MEMORY, e) == ERR_SUCCESS) ? e.memory : nullptr;
}

std::shared_ptr<Global> Instance::GetGlobal(const char* name) const
{
  Extern e;
  return (GetExport(name, WASM_KIND_GLOBAL, e) == ERR_SUCCESS) ? e.global : nullptr;
}

std::vector<std::string> Instance::ExportNames() const
{
  std::vector<std::string> names;
  names.reserve(_exports.size());
  for(auto& slot : _exports)
    names.push_back(slot->name);
  return names;
}

WJ_ERROR internal::EvalInitializer(const Environment& env, const Instruction& ins, const Linkage& linkage, Value& out)
{
  switch(ins.opcode[0])
  {
  case OP_i32_const: out = Value::I32(ins.immediates[0]._varsint32); break;
  case OP_i64_const: out = Value::I64(ins.immediates[0]._varsint64); break;
  case OP_f32_const: out = Value::F32(ins.immediates[0]._float32); break;
  case OP_f64_const: out = Value::F64(ins.immediates[0]._float64); break;
  case OP_global_get:
    if(ins.immediates[0]._varuint32 >= linkage.globals.size())
      return LogErrorString(env, "%s: initializer reads global %u before it exists", ERR_INVALID_GLOBAL_INDEX,
                            ins.immediates[0]._varuint32);
    out = linkage.globals[ins.immediates[0]._varuint32]->Get();
    break;
  default: return LogErrorString(env, "%s: %s is not a constant expression", ERR_FATAL_INVALID_INITIALIZER, OpName(ins));
  }
  return ERR_SUCCESS;
}

// Imports are stored grouped by kind, but they are resolved and reported in the order the binary declared them.
WJ_ERROR internal::ResolveImports(Environment& env, const Module& m, const ImportMap& imports, Linkage& linkage)
{
  const auto& list = m.importsection.imports;
  std::vector<const Import*> ordered(list.size(), nullptr);
  for(auto& imp : list)
    if(imp.order < ordered.size())
      ordered[imp.order] = &imp;

  for(auto imp : ordered)
    if(!imp)
      return LogErrorString(env, "%s: import order is corrupted", ERR_MODULE_LOAD);

  linkage.imports.resize(m.importsection.functions);
  linkage.tables.resize(m.importsection.tables - m.importsection.functions);
  linkage.memories.resize(m.importsection.memories - m.importsection.tables);
  linkage.globals.resize(m.importsection.globals - m.importsection.memories);

  for(auto imp : ordered)
  {
    const char* mod   = imp->module_name.c_str();
    const char* field = imp->export_name.c_str();
    const Extern* e   = imports.Find(mod, field);
    if(!e || !e->get())
      return LogErrorString(env, "%s: %s.%s", ERR_UNRESOLVED_IMPORT, mod, field);

    if(e->kind != imp->kind)
    {
      char buf[2][32];
      return LogErrorString(env, "%s: %s.%s expected a %s but was given a %s", ERR_IMPORT_KIND_MISMATCH, mod, field,
                            EnumToString(KIND_MAP, imp->kind, buf[0], sizeof(buf[0])),
                            EnumToString(KIND_MAP, e->kind, buf[1], sizeof(buf[1])));
    }

    // Index of this import within the imports of its kind
    varuint32 index = static_cast<varuint32>(imp - list.data());

    switch(imp->kind)
    {
    case WASM_KIND_FUNCTION:
    {
      if(imp->func_desc.type_index >= m.type.functypes.size())
        return LogErrorString(env, "%s: %s.%s has an invalid type index", ERR_INVALID_TYPE_INDEX, mod, field);
      if(e->func->Signature() != m.type.functypes[imp->func_desc.type_index])
        return LogErrorString(env, "%s: %s.%s", ERR_IMPORT_SIGNATURE_MISMATCH, mod, field);
      linkage.imports[index] = e->func;
      break;
    }
    case WASM_KIND_TABLE:
      if(!LimitsSatisfy(imp->table_desc.resizable, e->table->Length(), e->table->HasMaximum(), e->table->Maximum()))
        return LogErrorString(env, "%s: %s.%s has %u entries but needs at least %u", ERR_IMPORT_LIMITS_MISMATCH, mod,
                              field, e->table->Length(), imp->table_desc.resizable.minimum);
      linkage.tables[index - m.importsection.functions] = e->table;
      break;
    case WASM_KIND_MEMORY:
      if(!LimitsSatisfy(imp->mem_desc.limits, e->memory->Size(), e->memory->HasMaximum(), e->memory->Maximum()))
        return LogErrorString(env, "%s: %s.%s has %u pages but needs at least %u", ERR_IMPORT_LIMITS_MISMATCH, mod,
                              field, e->memory->Size(), imp->mem_desc.limits.minimum);
      linkage.memories[index - m.importsection.tables] = e->memory;
      break;
    case WASM_KIND_GLOBAL:
      if(e->global->Type() != imp->global_desc.type || e->global->Mutable() != imp->global_desc.mutability)
        return LogErrorString(env, "%s: %s.%s", ERR_IMPORT_SIGNATURE_MISMATCH, mod, field);
      linkage.globals[index - m.importsection.memories] = e->global;
      break;
    default: return LogErrorString(env, "%s: %s.%s", ERR_FATAL_UNKNOWN_KIND, mod, field);
    }
  }

  return ERR_SUCCESS;
}

WJ_ERROR internal::AllocateLocals(Environment& env, const Module& m, Linkage& linkage)
{
  WJ_ERROR err;

  for(auto& t : m.table.tables)
  {
    std::shared_ptr<FunctionTable> table;
    if(t.resizable.flags & WASM_LIMIT_HAS_MAXIMUM)
      err = FunctionTable::Create(t.resizable.minimum, t.resizable.maximum, table);
    else
      err = FunctionTable::Create(t.resizable.minimum, table);
    if(err < 0)
      return LogErrorString(env, "%s: could not allocate a table of %u entries", err, t.resizable.minimum);
    linkage.tables.push_back(std::move(table));
  }

  for(auto& mem : m.memory.memories)
  {
    std::shared_ptr<Memory> memory;
    if(mem.limits.flags & WASM_LIMIT_HAS_MAXIMUM)
      err = Memory::Create(mem.limits.minimum, mem.limits.maximum, memory);
    else
      err = Memory::Create(mem.limits.minimum, memory);
    if(err < 0)
      return LogErrorString(env, "%s: could not allocate a memory of %u pages", err, mem.limits.minimum);
    linkage.memories.push_back(std::move(memory));
  }

  for(auto& decl : m.global.globals)
  {
    Value init;
    if((err = EvalInitializer(env, decl.init, linkage, init)) < 0)
      return err;
    if(init.type != decl.desc.type)
      return LogErrorString(env, "%s: global %zu is initialized with the wrong type", ERR_INVALID_INITIALIZER_TYPE,
                            linkage.globals.size());

    std::shared_ptr<Global> global;
    if((err = Global::Create(init, decl.desc.mutability, global)) < 0)
      return LogErrorString(env, "%s: could not create global %zu", err, linkage.globals.size());
    linkage.globals.push_back(std::move(global));
  }

  return ERR_SUCCESS;
}

// An export can only be honored if something backs it, this is checked for every kind.
WJ_ERROR internal::CheckExports(Environment& env, const Module& m, const Linkage& linkage)
{
  for(auto& e : m.exportsection.exports)
  {
    size_t count = 0;
    switch(e.kind)
    {
    case WASM_KIND_FUNCTION: count = ModuleFunctionCount(m); break;
    case WASM_KIND_TABLE: count = linkage.tables.size(); break;
    case WASM_KIND_MEMORY: count = linkage.memories.size(); break;
    case WASM_KIND_GLOBAL: count = linkage.globals.size(); break;
    default: return LogErrorString(env, "%s: export %s has unknown kind %u", ERR_MODULE_LOAD, e.name.c_str(), e.kind);
    }

    if(e.index >= count)
    {
      char buf[32];
      return LogErrorString(env, "%s: export %s refers to %s %u, but the module has %zu", ERR_MODULE_LOAD,
                            e.name.c_str(), EnumToString(KIND_MAP, e.kind, buf, sizeof(buf)), e.index, count);
    }
  }

  return ERR_SUCCESS;
}

WJ_ERROR internal::CompileFunctions(Environment& env, const Module& m, Linkage& linkage,
                                    std::vector<std::shared_ptr<Function>>& functions)
{
  functions = linkage.imports;
  if(m.function.funcdecl.empty())
    return ERR_SUCCESS;

  InitializeNativeTarget();
  auto jit = JITContext::Create(std::make_unique<llvm::LLVMContext>(), env);
  if(!jit)
    return LogErrorLLVM(env, "%s: could not create JIT: %s", ERR_RUNTIME_JIT_ERROR, jit.takeError());

  auto code      = std::make_shared<CompiledCode>();
  code->jit      = std::move(*jit);
  code->imports  = linkage.imports;
  code->memories = linkage.memories;
  code->globals  = linkage.globals;
  for(auto& table : linkage.tables)
    code->tables.push_back(table->ShareData());
  linkage.code = code;

  auto mod = std::make_unique<llvm::Module>(m.name.empty() ? "wasmjit_module" : m.name, code->jit->GetContext());
  mod->setDataLayout(code->jit->GetDataLayout());
  mod->setTargetTriple(code->jit->GetTargetMachine().getTargetTriple().str());

  {
    llvm::IRBuilder<> builder(code->jit->GetContext());
    Compiler compiler(env, m, linkage, code->jit->GetContext(), mod.get(), builder, &code->jit->GetTargetMachine());

    WJ_ERROR err = compiler.CompileModule();
    if(err < 0)
      return err;
  }

  if(env.flags & ENV_DEBUG)
  {
    std::string msg;
    llvm::raw_string_ostream stream(msg);
    if(llvm::verifyModule(*mod, &stream))
      return LogErrorString(env, "%s: module failed verification: %s", ERR_RUNTIME_JIT_ERROR, stream.str().c_str());
  }

  WJ_ERROR err = OptimizeModule(env, *mod, &code->jit->GetTargetMachine());
  if(err < 0)
    return err;

  if((env.flags & ENV_EMIT_LLVM) && env.loglevel >= LOG_DEBUG)
  {
    std::string ir;
    llvm::raw_string_ostream stream(ir);
    mod->print(stream, nullptr);
    LogMessage(env, LOG_DEBUG, "%s\n", stream.str().c_str());
  }

  if(auto e = code->jit->CompileModule(std::move(mod)))
    return LogErrorLLVM(env, "%s: %s", ERR_RUNTIME_JIT_ERROR, std::move(e));

  for(varuint32 i = 0; i < m.function.funcdecl.size(); ++i)
  {
    varuint32 index = m.importsection.functions + i;
    auto sym        = code->jit->Lookup(Compiler::InvokeName(index));
    if(!sym)
      return LogErrorLLVM(env, "%s: function %u: %s", ERR_RUNTIME_JIT_ERROR, sym.takeError(), index);

    auto thunk = reinterpret_cast<InvokeThunk>(static_cast<uintptr_t>(sym->getAddress()));
    functions.push_back(
      std::make_shared<Function>(*ModuleFunction(m, index), thunk, std::static_pointer_cast<void>(code)));
  }

  return ERR_SUCCESS;
}

// Every segment is bounds checked before any of them is written, so a failed instantiation never touches a table.
WJ_ERROR internal::CheckElements(Environment& env, const Module& m, const Linkage& linkage,
                                 std::vector<varuint32>& offsets)
{
  offsets.clear();
  offsets.reserve(m.element.elements.size());

  for(auto& seg : m.element.elements)
  {
    Value offset;
    WJ_ERROR err = EvalInitializer(env, seg.offset, linkage, offset);
    if(err < 0)
      return err;
    if(offset.type != TE_i32 || seg.index >= linkage.tables.size())
      return LogErrorString(env, "%s: malformed element segment", ERR_INVALID_TABLE_INDEX);

    uint64_t end = static_cast<uint64_t>(static_cast<uint32_t>(offset.i32)) + seg.elements.size();
    if(end > linkage.tables[seg.index]->Length())
      return LogErrorString(env, "%s: element segment ends at %llu, past the table's %u entries",
                            ERR_TRAP_OUT_OF_BOUNDS_TABLE_ACCESS, static_cast<unsigned long long>(end),
                            linkage.tables[seg.index]->Length());
    offsets.push_back(static_cast<uint32_t>(offset.i32));
  }

  return ERR_SUCCESS;
}

WJ_ERROR internal::ApplyElements(Environment& env, const Module& m, Linkage& linkage,
                                 const std::vector<std::shared_ptr<Function>>& functions,
                                 const std::vector<varuint32>& offsets)
{
  for(size_t i = 0; i < m.element.elements.size(); ++i)
  {
    auto& seg = m.element.elements[i];
    for(size_t j = 0; j < seg.elements.size(); ++j)
    {
      if(seg.elements[j] >= functions.size())
        return LogErrorString(env, "%s: element refers to function %u", ERR_INVALID_FUNCTION_INDEX, seg.elements[j]);
      WJ_ERROR err = linkage.tables[seg.index]->Set(static_cast<varuint32>(offsets[i] + j), functions[seg.elements[j]]);
      if(err < 0)
        return err;
    }
  }

  return ERR_SUCCESS;
}

WJ_ERROR internal::CheckData(Environment& env, const Module& m, const Linkage& linkage, std::vector<varuint32>& offsets)
{
  offsets.clear();
  offsets.reserve(m.data.data.size());

  for(auto& seg : m.data.data)
  {
    Value offset;
    WJ_ERROR err = EvalInitializer(env, seg.offset, linkage, offset);
    if(err < 0)
      return err;
    if(offset.type != TE_i32 || seg.index >= linkage.memories.size())
      return LogErrorString(env, "%s: malformed data segment", ERR_INVALID_MEMORY_INDEX);

    uint64_t end = static_cast<uint64_t>(static_cast<uint32_t>(offset.i32)) + seg.data.size();
    if(end > linkage.memories[seg.index]->ByteLength())
      return LogErrorString(env, "%s: data segment ends at %llu, past the memory's %llu bytes",
                            ERR_TRAP_OUT_OF_BOUNDS_MEMORY_ACCESS, static_cast<unsigned long long>(end),
                            static_cast<unsigned long long>(linkage.memories[seg.index]->ByteLength()));
    offsets.push_back(static_cast<uint32_t>(offset.i32));
  }

  return ERR_SUCCESS;
}

WJ_ERROR internal::ApplyData(Environment& env, const Module& m, Linkage& linkage, const std::vector<varuint32>& offsets)
{
  for(size_t i = 0; i < m.data.data.size(); ++i)
  {
    auto& seg = m.data.data[i];
    if(seg.data.empty())
      continue;
    WJ_ERROR err = linkage.memories[seg.index]->Write(offsets[i], seg.data.data(), seg.data.size());
    if(err < 0)
      return err;
  }

  return ERR_SUCCESS;
}

WJ_ERROR wasmjit::Instantiate(Environment& env, const Module& m, const ImportMap& imports,
                              std::shared_ptr<Instance>& out)
{
  auto linkage = std::make_shared<Linkage>();
  std::vector<std::shared_ptr<Function>> functions;
  std::vector<varuint32> elem_offsets, data_offsets;
  WJ_ERROR err;

  try
  {
    if((err = ResolveImports(env, m, imports, *linkage)) < 0)
      return err;
    if((err = AllocateLocals(env, m, *linkage)) < 0)
      return err;
    if((err = CheckExports(env, m, *linkage)) < 0)
      return err;
    if((err = CompileFunctions(env, m, *linkage, functions)) < 0)
      return err;
    if((err = CheckElements(env, m, *linkage, elem_offsets)) < 0)
      return err;
    if((err = CheckData(env, m, *linkage, data_offsets)) < 0)
      return err;
    if((err = ApplyElements(env, m, *linkage, functions, elem_offsets)) < 0)
      return err;
    if((err = ApplyData(env, m, *linkage, data_offsets)) < 0)
      return err;

    if(ModuleHasSection(m, WASM_SECTION_START))
    {
      if(m.start >= functions.size())
        return LogErrorString(env, "%s: start function %u does not exist", ERR_INVALID_START_FUNCTION, m.start);
      if((err = functions[m.start]->Invoke(nullptr, 0, nullptr, 0)) < 0)
        return LogErrorString(env, "%s: start function trapped", err);
    }

    auto instance = std::make_shared<Instance>(linkage);
    for(auto& e : m.exportsection.exports)
    {
      switch(e.kind)
      {
      case WASM_KIND_FUNCTION: instance->AddExport(e.name, Extern(functions[e.index])); break;
      case WASM_KIND_TABLE: instance->AddExport(e.name, Extern(linkage->tables[e.index])); break;
      case WASM_KIND_MEMORY: instance->AddExport(e.name, Extern(linkage->memories[e.index])); break;
      case WASM_KIND_GLOBAL: instance->AddExport(e.name, Extern(linkage->globals[e.index])); break;
      }
    }

    out = std::move(instance);
  }
  catch(const std::bad_alloc&)
  {
    return LogErrorString(env, "%s: out of memory while instantiating %s", ERR_FATAL_OUT_OF_MEMORY, m.name.c_str());
  }

  return ERR_SUCCESS;
}
