// Copyright (c)2021 Fundament Software
// For conditions of distribution and use, see copyright notice in wasmjit.h

#include "wasmjit/runtime.h"
#include "util.h"
#include <setjmp.h>
#include <exception>
#include <mutex>
#include <new>

using namespace wasmjit;
using namespace internal;

namespace wasmjit {
  namespace internal {
    struct TrapFrame
    {
      jmp_buf buf;
      TrapFrame* prev;
    };

    static thread_local TrapFrame* trap_frame = nullptr;
    static thread_local uint32_t call_depth   = 0;

    static std::mutex sig_lock;
    static std::vector<FunctionType> sig_registry;

    varuint32 GetSignatureId(const FunctionType& sig)
    {
      std::lock_guard<std::mutex> lock(sig_lock);
      for(size_t i = 0; i < sig_registry.size(); ++i)
        if(sig_registry[i] == sig)
          return static_cast<varuint32>(i + 1);

      sig_registry.push_back(sig);
      return static_cast<varuint32>(sig_registry.size());
    }

    // The landing pad has to live in a frame that stays active for the whole call, so this can't be split up.
    WJ_ERROR Execute(const FunctionEntry& entry, const uint64_t* args, uint64_t* results)
    {
      TrapFrame frame;
      frame.prev     = trap_frame;
      uint32_t depth = call_depth;
      trap_frame     = &frame;

      int code = setjmp(frame.buf);
      if(code != 0)
      {
        trap_frame = frame.prev;
        call_depth = depth;
        return static_cast<WJ_ERROR>(code);
      }

      (*entry.invoke)(entry.closure, args, results);
      trap_frame = frame.prev;
      return ERR_SUCCESS;
    }

    uint64_t ToSlot(const Value& v)
    {
      uint64_t slot = 0;
      switch(v.type)
      {
      case TE_i32: slot = static_cast<uint32_t>(v.i32); break;
      case TE_i64: slot = static_cast<uint64_t>(v.i64); break;
      case TE_f32: memcpy(&slot, &v.f32, sizeof(float)); break;
      case TE_f64: memcpy(&slot, &v.f64, sizeof(double)); break;
      }
      return slot;
    }

    Value FromSlot(varsint7 type, uint64_t slot)
    {
      Value v;
      v.type = type;
      v.i64  = 0;
      switch(type)
      {
      case TE_i32: v.i32 = static_cast<int32_t>(static_cast<uint32_t>(slot)); break;
      case TE_i64: v.i64 = static_cast<int64_t>(slot); break;
      case TE_f32: memcpy(&v.f32, &slot, sizeof(float)); break;
      case TE_f64: memcpy(&v.f64, &slot, sizeof(double)); break;
      }
      return v;
    }

    inline bool IsValueType(varsint7 type) { return type == TE_i32 || type == TE_i64 || type == TE_f32 || type == TE_f64; }
  }
}

// Called by compiled code. Never returns, it unwinds to the innermost Execute() on this thread.
extern "C" WJ_NORETURN void _wasmjit_trap(int32_t code)
{
  TrapFrame* frame = trap_frame;
  if(!frame)
  {
    fprintf(stderr, "wasmjit: trap %i was raised outside of any host invocation\n", code);
    std::terminate();
  }
  longjmp(frame->buf, code);
}

extern "C" int32_t _wasmjit_memory_grow(void* memory, int32_t delta)
{
  varuint32 previous;
  if(reinterpret_cast<Memory*>(memory)->Grow(static_cast<varuint32>(delta), &previous) != ERR_SUCCESS)
    return -1;
  return static_cast<int32_t>(previous);
}

extern "C" void _wasmjit_enter(uint32_t maxdepth)
{
  if(++call_depth > maxdepth)
    _wasmjit_trap(ERR_TRAP_STACK_OVERFLOW);
}

extern "C" void _wasmjit_leave() { --call_depth; }

Function::Function(const FunctionType& sig, HostCallback host) : _sig(sig), _host(std::move(host))
{
  _entry.invoke  = &HostThunk;
  _entry.closure = this;
  _entry.sig     = GetSignatureId(_sig);
}

Function::Function(const FunctionType& sig, InvokeThunk thunk, std::shared_ptr<void> owner) :
  _sig(sig), _owner(std::move(owner))
{
  _entry.invoke  = thunk;
  _entry.closure = nullptr;
  _entry.sig     = GetSignatureId(_sig);
}

void Function::HostThunk(void* closure, const uint64_t* args, uint64_t* results)
{
  Function* self = reinterpret_cast<Function*>(closure);
  std::vector<Value> in(self->_sig.params.size());
  Value out[1];

  for(size_t i = 0; i < in.size(); ++i)
    in[i] = FromSlot(self->_sig.params[i], args[i]);

  for(size_t i = 0; i < self->_sig.returns.size(); ++i)
    out[i] = FromSlot(self->_sig.returns[i], 0);

  self->_host(in.data(), out);

  for(size_t i = 0; i < self->_sig.returns.size(); ++i)
  {
    out[i].type = self->_sig.returns[i]; // A host callback can't change the declared result type
    results[i]  = ToSlot(out[i]);
  }
}

WJ_ERROR Function::Invoke(const Value* args, size_t n_args, Value* results, size_t n_results) const
{
  if(n_args != _sig.params.size() || n_results < _sig.returns.size())
    return ERR_SIGNATURE_MISMATCH;
  if(n_args > 0 && !args)
    return ERR_INVALID_ARGUMENT;
  if(!_sig.returns.empty() && !results)
    return ERR_INVALID_ARGUMENT;

  std::vector<uint64_t> in(n_args + 1);
  uint64_t out[1] = { 0 };

  for(size_t i = 0; i < n_args; ++i)
  {
    if(args[i].type != _sig.params[i])
      return ERR_SIGNATURE_MISMATCH;
    in[i] = ToSlot(args[i]);
  }

  WJ_ERROR err = Execute(_entry, in.data(), out);
  if(err != ERR_SUCCESS)
    return err;

  for(size_t i = 0; i < _sig.returns.size(); ++i)
    results[i] = FromSlot(_sig.returns[i], out[i]);

  return ERR_SUCCESS;
}

WJ_ERROR Function::Invoke(const std::vector<Value>& args, std::vector<Value>& results) const
{
  results.resize(_sig.returns.size());
  return Invoke(args.data(), args.size(), results.data(), results.size());
}

std::shared_ptr<Function> Function::Create(const FunctionType& sig, HostCallback fn)
{
  if(sig.form != TE_func || sig.returns.size() > 1 || !fn)
    return nullptr;
  for(auto t : sig.params)
    if(!IsValueType(t))
      return nullptr;
  for(auto t : sig.returns)
    if(!IsValueType(t))
      return nullptr;

  return std::make_shared<Function>(sig, std::move(fn));
}

FunctionTable::FunctionTable(varuint32 initial, bool has_maximum, varuint32 maximum) :
  _data(std::make_shared<TableData>())
{
  _limits.flags   = has_maximum ? WASM_LIMIT_HAS_MAXIMUM : 0;
  _limits.minimum = initial;
  _limits.maximum = has_maximum ? maximum : 0;
  _refs.resize(initial);
  _entries.resize(initial, FunctionEntry{ nullptr, nullptr, 0 });
  Sync();
}

WJ_ERROR FunctionTable::Create(varuint32 initial, std::shared_ptr<FunctionTable>& out)
{
  if(initial > WJ_MAX_TABLE_LENGTH)
    return ERR_LIMIT_EXCEEDED;

  try
  {
    out = std::make_shared<FunctionTable>(initial, false, 0);
  }
  catch(const std::bad_alloc&)
  {
    return ERR_FATAL_OUT_OF_MEMORY;
  }
  return ERR_SUCCESS;
}

WJ_ERROR FunctionTable::Create(varuint32 initial, varuint32 maximum, std::shared_ptr<FunctionTable>& out)
{
  if(initial > maximum)
    return ERR_INVALID_ARGUMENT;
  if(initial > WJ_MAX_TABLE_LENGTH)
    return ERR_LIMIT_EXCEEDED;

  try
  {
    out = std::make_shared<FunctionTable>(initial, true, maximum);
  }
  catch(const std::bad_alloc&)
  {
    return ERR_FATAL_OUT_OF_MEMORY;
  }
  return ERR_SUCCESS;
}

FunctionTable::~FunctionTable()
{
  _data->entries = nullptr;
  _data->size    = 0;
}

void FunctionTable::Sync()
{
  _data->entries = _entries.data();
  _data->size    = _entries.size();
}

WJ_ERROR FunctionTable::Get(varuint32 index, std::shared_ptr<Function>& out) const
{
  if(index >= _refs.size())
    return ERR_INDEX_OUT_OF_RANGE;

  out = _refs[index];
  return ERR_SUCCESS;
}

WJ_ERROR FunctionTable::Set(varuint32 index, std::shared_ptr<Function> fn)
{
  if(index >= _refs.size())
    return ERR_INDEX_OUT_OF_RANGE;

  _entries[index] = fn ? fn->Entry() : FunctionEntry{ nullptr, nullptr, 0 };
  _refs[index]    = std::move(fn);
  return ERR_SUCCESS;
}

WJ_ERROR FunctionTable::Grow(varuint32 delta, varuint32* previous)
{
  uint64_t len    = _refs.size();
  uint64_t target = len + delta;
  uint64_t limit  = HasMaximum() ? _limits.maximum : WJ_MAX_TABLE_LENGTH;
  if(target > limit || target > WJ_MAX_TABLE_LENGTH)
    return ERR_LIMIT_EXCEEDED;

  try
  {
    _entries.resize(target, FunctionEntry{ nullptr, nullptr, 0 });
    _refs.resize(target);
  }
  catch(const std::bad_alloc&)
  {
    _entries.resize(len);
    return ERR_FATAL_OUT_OF_MEMORY;
  }

  Sync();
  if(previous)
    *previous = static_cast<varuint32>(len);
  return ERR_SUCCESS;
}

Memory::Memory(varuint32 initial, bool has_maximum, varuint32 maximum)
{
  _limits.flags   = has_maximum ? WASM_LIMIT_HAS_MAXIMUM : 0;
  _limits.minimum = initial;
  _limits.maximum = has_maximum ? maximum : 0;
  _bytes.resize(static_cast<size_t>(initial) * WASM_PAGE_SIZE, 0);
  Sync();
}

WJ_ERROR Memory::Create(varuint32 initial, std::shared_ptr<Memory>& out)
{
  if(initial > WASM_MAX_PAGES)
    return ERR_LIMIT_EXCEEDED;

  try
  {
    out = std::make_shared<Memory>(initial, false, 0);
  }
  catch(const std::bad_alloc&)
  {
    return ERR_FATAL_OUT_OF_MEMORY;
  }
  return ERR_SUCCESS;
}

WJ_ERROR Memory::Create(varuint32 initial, varuint32 maximum, std::shared_ptr<Memory>& out)
{
  if(initial > maximum)
    return ERR_INVALID_ARGUMENT;
  if(maximum > WASM_MAX_PAGES)
    return ERR_LIMIT_EXCEEDED;

  try
  {
    out = std::make_shared<Memory>(initial, true, maximum);
  }
  catch(const std::bad_alloc&)
  {
    return ERR_FATAL_OUT_OF_MEMORY;
  }
  return ERR_SUCCESS;
}

void Memory::Sync()
{
  _data.bytes = _bytes.data();
  _data.size  = _bytes.size();
}

WJ_ERROR Memory::Grow(varuint32 delta, varuint32* previous)
{
  uint64_t pages  = Size();
  uint64_t target = pages + delta;
  uint64_t limit  = HasMaximum() ? _limits.maximum : WASM_MAX_PAGES;
  if(target > limit || target > WASM_MAX_PAGES)
    return ERR_LIMIT_EXCEEDED;

  try
  {
    _bytes.resize(static_cast<size_t>(target * WASM_PAGE_SIZE), 0);
  }
  catch(const std::bad_alloc&)
  {
    return ERR_FATAL_OUT_OF_MEMORY;
  }

  Sync();
  if(previous)
    *previous = static_cast<varuint32>(pages);
  return ERR_SUCCESS;
}

WJ_ERROR Memory::Read(uint64_t offset, void* dest, size_t n) const
{
  if(offset > _bytes.size() || n > _bytes.size() - offset)
    return ERR_INDEX_OUT_OF_RANGE;
  if(n > 0)
    memcpy(dest, _bytes.data() + offset, n);
  return ERR_SUCCESS;
}

WJ_ERROR Memory::Write(uint64_t offset, const void* src, size_t n)
{
  if(offset > _bytes.size() || n > _bytes.size() - offset)
    return ERR_INDEX_OUT_OF_RANGE;
  if(n > 0)
    memcpy(_bytes.data() + offset, src, n);
  return ERR_SUCCESS;
}

Global::Global(const Value& init, bool mutability) : _slot(ToSlot(init))
{
  _desc.type       = init.type;
  _desc.mutability = mutability;
}

WJ_ERROR Global::Create(const Value& init, bool mutability, std::shared_ptr<Global>& out)
{
  if(!IsValueType(init.type))
    return ERR_INVALID_ARGUMENT;

  out = std::make_shared<Global>(init, mutability);
  return ERR_SUCCESS;
}

Value Global::Get() const { return FromSlot(_desc.type, _slot); }

WJ_ERROR Global::Set(const Value& v)
{
  if(!_desc.mutability)
    return ERR_IMMUTABLE_GLOBAL;
  return Initialize(v);
}

WJ_ERROR Global::Initialize(const Value& v)
{
  if(v.type != _desc.type)
    return ERR_SIGNATURE_MISMATCH;

  _slot = ToSlot(v);
  return ERR_SUCCESS;
}

const void* Extern::get() const
{
  switch(kind)
  {
  case WASM_KIND_FUNCTION: return func.get();
  case WASM_KIND_TABLE: return table.get();
  case WASM_KIND_MEMORY: return memory.get();
  case WASM_KIND_GLOBAL: return global.get();
  }
  return nullptr;
}
