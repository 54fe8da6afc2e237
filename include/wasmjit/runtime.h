// Copyright (c)2021 Fundament Software
// For conditions of distribution and use, see copyright notice in wasmjit.h

#ifndef WJ__RUNTIME_H
#define WJ__RUNTIME_H

#include "wasmjit/schema.h"
#include <functional>
#include <memory>
#include <utility>
#include <type_traits>
#include <string.h>

struct kh_importmap_s;
struct kh_exportmap_s;

namespace wasmjit {
  class Function;
  class FunctionTable;
  class Memory;
  class Global;

  // A single typed webassembly value as seen by the host.
  struct Value
  {
    varsint7 type; // WASM_TYPE_ENCODING
    union
    {
      int32_t i32;
      int64_t i64;
      float f32;
      double f64;
    };

    static Value I32(int32_t v)
    {
      Value r;
      r.type = TE_i32;
      r.i64  = 0;
      r.i32  = v;
      return r;
    }
    static Value I64(int64_t v)
    {
      Value r;
      r.type = TE_i64;
      r.i64  = v;
      return r;
    }
    static Value F32(float v)
    {
      Value r;
      r.type = TE_f32;
      r.i64  = 0;
      r.f32  = v;
      return r;
    }
    static Value F64(double v)
    {
      Value r;
      r.type = TE_f64;
      r.f64  = v;
      return r;
    }
  };

  namespace internal {
    // Every callable reference, compiled or host-provided, is reached through a thunk with this signature. Arguments and
    // results are passed as 64-bit slots holding the raw bits of each value.
    typedef void (*InvokeThunk)(void* closure, const uint64_t* args, uint64_t* results);

    // The following layouts are read directly by compiled code, so they must stay plain structs.
    struct FunctionEntry
    {
      InvokeThunk invoke; // nullptr for an empty table slot
      void* closure;
      uint64_t sig; // Canonical signature id, see GetSignatureId()
    };

    struct TableData
    {
      FunctionEntry* entries;
      uint64_t size;
    };

    struct MemoryData
    {
      uint8_t* bytes;
      uint64_t size; // in bytes
    };

    // Interns a function signature and returns an id that is identical for every structurally equal signature in the
    // process. Ids start at 1.
    varuint32 GetSignatureId(const FunctionType& sig);

    // Runs a thunk with a trap landing pad. Returns ERR_SUCCESS or the ERR_TRAP_* code that aborted the call.
    WJ_ERROR Execute(const FunctionEntry& entry, const uint64_t* args, uint64_t* results);

    template<typename T> struct TypeEncoding;
    template<> struct TypeEncoding<int32_t>
    {
      static constexpr varsint7 value = TE_i32;
      static Value Box(int32_t v) { return Value::I32(v); }
      static int32_t Unbox(const Value& v) { return v.i32; }
    };
    template<> struct TypeEncoding<int64_t>
    {
      static constexpr varsint7 value = TE_i64;
      static Value Box(int64_t v) { return Value::I64(v); }
      static int64_t Unbox(const Value& v) { return v.i64; }
    };
    template<> struct TypeEncoding<float>
    {
      static constexpr varsint7 value = TE_f32;
      static Value Box(float v) { return Value::F32(v); }
      static float Unbox(const Value& v) { return v.f32; }
    };
    template<> struct TypeEncoding<double>
    {
      static constexpr varsint7 value = TE_f64;
      static Value Box(double v) { return Value::F64(v); }
      static double Unbox(const Value& v) { return v.f64; }
    };

    template<typename R, typename... Args, size_t... I>
    inline void HostApply(const std::function<R(Args...)>& fn, const Value* args, Value* results,
                          std::index_sequence<I...>)
    {
      results[0] = TypeEncoding<R>::Box(fn(TypeEncoding<Args>::Unbox(args[I])...));
    }

    template<typename... Args, size_t... I>
    inline void HostApply(const std::function<void(Args...)>& fn, const Value* args, Value*, std::index_sequence<I...>)
    {
      fn(TypeEncoding<Args>::Unbox(args[I])...);
    }
  }

  // A callable reference. Compiled webassembly functions and host functions share this representation, and either can
  // be stored in a FunctionTable or passed through an ImportMap. The signature is fixed at creation.
  class Function
  {
  public:
    typedef std::function<void(const Value* args, Value* results)> HostCallback;

    Function(const FunctionType& sig, HostCallback host);
    Function(const FunctionType& sig, internal::InvokeThunk thunk, std::shared_ptr<void> owner);
    Function(const Function&) = delete;
    Function& operator=(const Function&) = delete;

    inline const FunctionType& Signature() const { return _sig; }
    inline const internal::FunctionEntry& Entry() const { return _entry; }
    inline bool IsHost() const { return static_cast<bool>(_host); }

    // Calls the function from the host. The arguments must match the signature exactly, and results must have room for
    // every return value. A trap is returned as its ERR_TRAP_* code.
    WJ_ERROR Invoke(const Value* args, size_t n_args, Value* results, size_t n_results) const;
    WJ_ERROR Invoke(const std::vector<Value>& args, std::vector<Value>& results) const;

    template<typename R, typename... Args> WJ_ERROR Call(R& result, Args... args) const
    {
      Value in[sizeof...(Args) + 1] = { internal::TypeEncoding<Args>::Box(args)... };
      Value out;
      WJ_ERROR err = Invoke(in, sizeof...(Args), &out, 1);
      if(err == ERR_SUCCESS)
        result = internal::TypeEncoding<R>::Unbox(out);
      return err;
    }

    // Creates a host function from an explicit signature and a generic callback.
    static std::shared_ptr<Function> Create(const FunctionType& sig, HostCallback fn);

    // Creates a host function whose signature is derived from the C++ parameter and return types.
    template<typename R, typename... Args> static std::shared_ptr<Function> Create(std::function<R(Args...)> fn)
    {
      FunctionType sig = { TE_func, { internal::TypeEncoding<Args>::value... }, {} };
      if(!std::is_void<R>::value)
        sig.returns.push_back(ReturnEncoding<R>());

      return Create(sig, [fn](const Value* args, Value* results) {
        internal::HostApply(fn, args, results, std::index_sequence_for<Args...>{});
      });
    }

  protected:
    template<typename R> static typename std::enable_if<!std::is_void<R>::value, varsint7>::type ReturnEncoding()
    {
      return internal::TypeEncoding<R>::value;
    }
    template<typename R> static typename std::enable_if<std::is_void<R>::value, varsint7>::type ReturnEncoding()
    {
      return TE_void;
    }

    static void HostThunk(void* closure, const uint64_t* args, uint64_t* results);

    FunctionType _sig;
    internal::FunctionEntry _entry;
    HostCallback _host;
    std::shared_ptr<void> _owner; // Keeps compiled code alive
  };

  // A growable anyfunc table. Slots are empty or hold a callable reference, whose signature is only checked when it is
  // called indirectly.
  class FunctionTable
  {
  public:
    FunctionTable(varuint32 initial, bool has_maximum, varuint32 maximum);
    ~FunctionTable();
    FunctionTable(const FunctionTable&) = delete;
    FunctionTable& operator=(const FunctionTable&) = delete;

    static WJ_ERROR Create(varuint32 initial, std::shared_ptr<FunctionTable>& out);
    static WJ_ERROR Create(varuint32 initial, varuint32 maximum, std::shared_ptr<FunctionTable>& out);

    inline varuint32 Length() const { return static_cast<varuint32>(_refs.size()); }
    inline bool HasMaximum() const { return (_limits.flags & WASM_LIMIT_HAS_MAXIMUM) != 0; }
    inline varuint32 Maximum() const { return _limits.maximum; }
    inline const ResizableLimits& Limits() const { return _limits; }

    // Retrieves the slot at index, out is set to nullptr if the slot is empty.
    WJ_ERROR Get(varuint32 index, std::shared_ptr<Function>& out) const;
    // Stores a reference in a slot, passing nullptr empties it.
    WJ_ERROR Set(varuint32 index, std::shared_ptr<Function> fn);
    // Appends delta empty slots. On failure the length is unchanged.
    WJ_ERROR Grow(varuint32 delta, varuint32* previous = nullptr);

    inline internal::TableData* GetData() { return _data.get(); }
    // Compiled code holds this instead of the table. It reads as an empty table once the table is destroyed.
    inline const std::shared_ptr<internal::TableData>& ShareData() const { return _data; }

  protected:
    void Sync();

    ResizableLimits _limits;
    std::vector<std::shared_ptr<Function>> _refs;
    std::vector<internal::FunctionEntry> _entries;
    std::shared_ptr<internal::TableData> _data;
  };

  // A linear memory, measured in pages of WASM_PAGE_SIZE bytes.
  class Memory
  {
  public:
    Memory(varuint32 initial, bool has_maximum, varuint32 maximum);
    Memory(const Memory&) = delete;
    Memory& operator=(const Memory&) = delete;

    static WJ_ERROR Create(varuint32 initial, std::shared_ptr<Memory>& out);
    static WJ_ERROR Create(varuint32 initial, varuint32 maximum, std::shared_ptr<Memory>& out);

    inline varuint32 Size() const { return static_cast<varuint32>(_bytes.size() / WASM_PAGE_SIZE); }
    inline uint64_t ByteLength() const { return _bytes.size(); }
    inline uint8_t* Data() { return _bytes.data(); }
    inline const uint8_t* Data() const { return _bytes.data(); }
    inline bool HasMaximum() const { return (_limits.flags & WASM_LIMIT_HAS_MAXIMUM) != 0; }
    inline varuint32 Maximum() const { return _limits.maximum; }
    inline const ResizableLimits& Limits() const { return _limits; }

    WJ_ERROR Grow(varuint32 delta, varuint32* previous = nullptr);
    WJ_ERROR Read(uint64_t offset, void* dest, size_t n) const;
    WJ_ERROR Write(uint64_t offset, const void* src, size_t n);

    inline internal::MemoryData* GetData() { return &_data; }

  protected:
    void Sync();

    ResizableLimits _limits;
    std::vector<uint8_t> _bytes;
    internal::MemoryData _data;
  };

  // A boxed global value.
  class Global
  {
  public:
    Global(const Value& init, bool mutability);
    Global(const Global&) = delete;
    Global& operator=(const Global&) = delete;

    static WJ_ERROR Create(const Value& init, bool mutability, std::shared_ptr<Global>& out);

    inline varsint7 Type() const { return _desc.type; }
    inline bool Mutable() const { return _desc.mutability; }
    inline const GlobalDesc& Desc() const { return _desc; }
    Value Get() const;
    WJ_ERROR Set(const Value& v);
    // Writes the value regardless of mutability, used while initializing a module
    WJ_ERROR Initialize(const Value& v);

    inline uint64_t* GetSlot() { return &_slot; }

  protected:
    GlobalDesc _desc;
    uint64_t _slot;
  };

  // Any entity that can be imported or exported, tagged by its WASM_KIND.
  struct Extern
  {
    varuint7 kind;
    std::shared_ptr<Function> func;
    std::shared_ptr<FunctionTable> table;
    std::shared_ptr<Memory> memory;
    std::shared_ptr<Global> global;

    Extern() : kind(WASM_KIND_FUNCTION) {}
    Extern(std::shared_ptr<Function> f) : kind(WASM_KIND_FUNCTION), func(std::move(f)) {}
    Extern(std::shared_ptr<FunctionTable> t) : kind(WASM_KIND_TABLE), table(std::move(t)) {}
    Extern(std::shared_ptr<Memory> m) : kind(WASM_KIND_MEMORY), memory(std::move(m)) {}
    Extern(std::shared_ptr<Global> g) : kind(WASM_KIND_GLOBAL), global(std::move(g)) {}

    // Identity of the underlying object, regardless of kind
    const void* get() const;
  };

  // Host bindings keyed by (module name, field name).
  class ImportMap
  {
  public:
    ImportMap();
    ~ImportMap();
    ImportMap(const ImportMap&) = delete;
    ImportMap& operator=(const ImportMap&) = delete;

    // Adds a binding, replacing any binding that already exists for the same (module, field) pair.
    void Add(const char* module_name, const char* field, Extern binding);
    // Returns nullptr if nothing is bound to the pair.
    const Extern* Find(const char* module_name, const char* field) const;
    inline size_t Size() const { return _bindings.size(); }

  protected:
    kh_importmap_s* _map;
    std::vector<std::unique_ptr<char[]>> _keys;
    std::vector<Extern> _bindings;
  };

  namespace internal {
    struct Linkage;
  }

  // A linked, running module. The set of export names is fixed at instantiation.
  class Instance
  {
  public:
    Instance(std::shared_ptr<internal::Linkage> linkage);
    ~Instance();
    Instance(const Instance&) = delete;
    Instance& operator=(const Instance&) = delete;

    // Looks up an export of a specific kind. Fails with ERR_UNKNOWN_EXPORT if no export of that kind has this name, or
    // ERR_AMBIGUOUS_EXPORT if the name was bound to more than one entity of that kind.
    WJ_ERROR GetExport(const char* name, varuint7 kind, Extern& out) const;

    std::shared_ptr<Function> GetFunction(const char* name) const;
    std::shared_ptr<FunctionTable> GetTable(const char* name) const;
    std::shared_ptr<Memory> GetMemory(const char* name) const;
    std::shared_ptr<Global> GetGlobal(const char* name) const;
    std::vector<std::string> ExportNames() const;

    // Adds an export while the instance is being assembled.
    void AddExport(const std::string& name, const Extern& binding);

  protected:
    struct ExportSlot
    {
      std::string name;
      Extern kinds[4];
      bool present[4];
      bool ambiguous[4];
    };

    std::shared_ptr<internal::Linkage> _linkage;
    kh_exportmap_s* _map;
    std::vector<std::unique_ptr<ExportSlot>> _exports;
  };
}

#endif
