// Copyright (c)2020 Black Sphere Studios
// For conditions of distribution and use, see copyright notice in wasmjit.h

#include "test.h"
#include "../wasmjit/stack.h"

using namespace wasmjit;

void TestHarness::test_stack()
{
  Stack<int> s;
  TEST(!s.Limit());
  TEST(!s.Size());

  s.Reserve(4);
  TEST(s.Capacity() >= 4);
  TEST(!s.Limit());
  TEST(!s.Size());

  s.Push(3);
  TEST(!s.Limit());
  TEST(s.Size() == 1);
  TEST(s.Peek() == 3);

  s.SetLimit(1);
  TEST(s.Limit() == 1);
  TEST(s.Size() == 0);

  s.Push(5);
  TEST(s.Limit() == 1);
  TEST(s.Size() == 1);
  TEST(s.Peek() == 5);
  TEST(s[0] == 5);
  TEST(s[1] == 3);
  TEST(s.Pop() == 5);
  TEST(s.Size() == 0);

  s.SetLimit(0);
  TEST(s.Size() == 1);
  TEST(s.Limit() == 0);
  TEST(s.Peek() == 3);
  TEST(s.Pop() == 3);

  s.Push(3);
  s.Push(5);
  s.Push(7);

  TEST(s.Size() == 3);
  TEST(s.Pop() == 7);
  TEST(s.Pop() == 5);
  TEST(s.Pop() == 3);

  s.Push(1);
  s.SetLimit(1);
  s.Clear();
  TEST(!s.Size());
  TEST(!s.Limit());
}
