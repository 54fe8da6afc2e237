// Copyright (c)2020 Black Sphere Studios
// For conditions of distribution and use, see copyright notice in wasmjit.h

#ifndef WJ__STACK_H
#define WJ__STACK_H

#include <assert.h>
#include <vector>
#include <utility>

namespace wasmjit {
  // A stack whose bottom can be temporarily raised with SetLimit(). Size() only counts the elements above the limit, and
  // popping below it is an error. This lets a control block treat the values pushed before it as out of reach.
  template<typename T> class Stack
  {
  public:
    Stack() : _limit(0) {}

    inline void Reserve(size_t capacity) { _array.reserve(capacity); }
    inline void Push(const T& item) { _array.push_back(item); }
    inline void Push(T&& item) { _array.push_back(std::move(item)); }
    inline T Pop()
    {
      assert(_array.size() > _limit);
      T r = std::move(_array.back());
      _array.pop_back();
      return r;
    }
    inline T& Peek()
    {
      assert(_array.size() > _limit);
      return _array.back();
    }
    inline const T& Peek() const
    {
      assert(_array.size() > _limit);
      return _array.back();
    }
    inline size_t Capacity() const { return _array.capacity(); }
    inline size_t Size() const { return _array.size() - _limit; }
    inline size_t Limit() const { return _limit; }
    inline void SetLimit(size_t limit)
    {
      assert(limit <= _array.size());
      _limit = limit;
    }
    inline void Clear()
    {
      _array.clear();
      _limit = 0;
    }

    // Indexes from the top of the stack, so [0] is the most recently pushed element. Ignores the limit.
    const T& operator[](size_t i) const
    {
      assert(i < _array.size());
      return _array[_array.size() - i - 1];
    }
    T& operator[](size_t i)
    {
      assert(i < _array.size());
      return _array[_array.size() - i - 1];
    }

  protected:
    std::vector<T> _array;
    size_t _limit;
  };
}

#endif
