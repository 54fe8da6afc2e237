// Copyright (c)2020 Black Sphere Studios
// For conditions of distribution and use, see copyright notice in wasmjit.h

#include "test.h"
#include "../wasmjit/stream.h"

using namespace wasmjit;

void TestHarness::test_stream()
{
  uint8_t buf[]     = { 1, 2, 3, 4, 5, 6, 7, 8, 0, 0, 0, 0, 0, 0, 0, 9 };
  utility::Stream s = { buf, sizeof(buf), 0 };

  TEST(!s.End());
  TEST(s.Get() == 1);
  TEST(s.Get() == 2);
  uint8_t a = 0;
  TEST(s.Read(a));
  TEST(a == 3);
  WJ_ERROR err = ERR_SUCCESS;
  TEST(s.ReadByte(err) == 4);
  TEST(s.ReadVarInt7(err) == 5);
  TEST(s.ReadVarUInt7(err) == 6);
  uint8_t target[8] = { 0 };
  TEST(s.ReadBytes(target, 2) == 2);
  TEST(target[0] == 7);
  TEST(target[1] == 8);
  TEST(target[2] == 0);
  TEST(s.ReadVarUInt1(err) == false);
  TEST(!s.End());
  TESTERR(err, ERR_SUCCESS);

  s.pos = 0;
  TEST(s.ReadVarUInt1(err) == true);
  s.pos = 0;
  TEST(s.ReadBytes(target, 8) == 8);
  for(int i = 0; i < 8; ++i)
    TEST(target[i] == buf[i]);
  TEST(s.ReadVarUInt1(err) == false);
  TEST(s.ReadBytes(target, 8) == 7);
  for(int i = 0; i < 7; ++i)
    TEST(target[i] == buf[i + 9]);
  TEST(target[7] == 8);
  TEST(s.End());
  s.pos = 15;
  int b = 99;
  TEST(!s.Read(b));
  TEST(s.End());
  TEST(b == 99);
  s.pos = 15;
  TEST(!s.End());
  TEST(s.ReadVarUInt32(err) == 9);
  TESTERR(err, ERR_SUCCESS);

  {
    uint8_t leb[] = { 0xE5, 0x8E, 0x26 };
    utility::Stream l = { leb, sizeof(leb), 0 };
    TEST(l.ReadVarUInt32(err) == 624485);
    TEST(l.End());
  }

  {
    uint8_t leb[] = { 0xC0, 0xBB, 0x78 };
    utility::Stream l = { leb, sizeof(leb), 0 };
    TEST(l.ReadVarInt32(err) == -123456);
    TESTERR(err, ERR_SUCCESS);
  }

  {
    uint8_t leb[] = { 0x7F };
    utility::Stream l = { leb, sizeof(leb), 0 };
    TEST(l.ReadVarInt7(err) == -1);
    TESTERR(err, ERR_SUCCESS);
  }

  {
    // Six bytes can never hold a 32-bit value
    uint8_t leb[] = { 0x80, 0x80, 0x80, 0x80, 0x80, 0x00 };
    utility::Stream l = { leb, sizeof(leb), 0 };
    WJ_ERROR e        = ERR_SUCCESS;
    l.ReadVarUInt32(e);
    TESTERR(e, ERR_FATAL_OVERLONG_ENCODING);
  }

  {
    // The unused high bits of the last byte must be zero
    uint8_t leb[] = { 0xFF, 0xFF, 0xFF, 0xFF, 0x7F };
    utility::Stream l = { leb, sizeof(leb), 0 };
    WJ_ERROR e        = ERR_SUCCESS;
    l.ReadVarUInt32(e);
    TESTERR(e, ERR_FATAL_INVALID_ENCODING);
  }

  {
    uint8_t leb[] = { 0x80, 0x80 };
    utility::Stream l = { leb, sizeof(leb), 0 };
    WJ_ERROR e        = ERR_SUCCESS;
    l.ReadVarUInt32(e);
    TESTERR(e, ERR_PARSE_UNEXPECTED_EOF);
  }

  {
    uint8_t name[] = { 3, 'a', 'b', 'c', 2, 0xC3, 0xA9, 2, 0xC3, 0x41 };
    utility::Stream n = { name, sizeof(name), 0 };
    WJ_ERROR e        = ERR_SUCCESS;
    std::string str;
    TEST(n.ReadName(str, e));
    TEST(str == "abc");
    TEST(n.ReadName(str, e));
    TEST(str == "\xC3\xA9");
    TEST(!n.ReadName(str, e));
    TESTERR(e, ERR_PARSE_INVALID_NAME);
  }

  {
    // Boundaries of the valid 3 and 4 byte forms
    uint8_t name[] = { 3, 0xE0, 0xA0, 0x80, 3, 0xED, 0x9F, 0xBF, 4, 0xF0, 0x90, 0x80, 0x80, 4, 0xF4, 0x8F, 0xBF, 0xBF };
    utility::Stream n = { name, sizeof(name), 0 };
    WJ_ERROR e        = ERR_SUCCESS;
    std::string str;
    TEST(n.ReadName(str, e));
    TEST(str == "\xE0\xA0\x80");
    TEST(n.ReadName(str, e));
    TEST(n.ReadName(str, e));
    TEST(n.ReadName(str, e));
    TEST(str == "\xF4\x8F\xBF\xBF");
    TESTERR(e, ERR_SUCCESS);
  }

  {
    // Overlong forms, surrogates and code points past U+10FFFF
    const uint8_t bad[][5] = {
      { 3, 0xE0, 0x80, 0x80 },       { 3, 0xE0, 0x9F, 0xBF },       { 3, 0xED, 0xA0, 0x80 },
      { 3, 0xED, 0xBF, 0xBF },       { 4, 0xF0, 0x80, 0x80, 0x80 }, { 4, 0xF0, 0x8F, 0xBF, 0xBF },
      { 4, 0xF4, 0x90, 0x80, 0x80 }, { 4, 0xF5, 0x80, 0x80, 0x80 }, { 2, 0xC0, 0x80 },
    };
    int rejected = 0;
    for(auto& b : bad)
    {
      utility::Stream n = { b, static_cast<size_t>(b[0]) + 1, 0 };
      WJ_ERROR e        = ERR_SUCCESS;
      std::string str;
      if(!n.ReadName(str, e) && e == ERR_PARSE_INVALID_NAME)
        ++rejected;
    }
    TEST(rejected == static_cast<int>(sizeof(bad) / sizeof(bad[0])));
  }
}
