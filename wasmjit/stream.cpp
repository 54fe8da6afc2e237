// Copyright (c)2020 Black Sphere Studios
// For conditions of distribution and use, see copyright notice in wasmjit.h

#include "stream.h"

using namespace wasmjit;
using namespace utility;

uint64_t Stream::DecodeLEB128(WJ_ERROR& err, unsigned int maxbits, bool sign)
{
  unsigned int shift = 0;
  int byte           = 0;
  uint64_t result    = 0;
  do
  {
    if(shift >= maxbits)
    {
      err = ERR_FATAL_OVERLONG_ENCODING;
      return 0;
    }
    byte = Get();
    if(byte == -1)
    {
      err = ERR_PARSE_UNEXPECTED_EOF;
      return 0;
    }

    result |= (static_cast<uint64_t>(byte & 0x7F) << shift);
    shift += 7;
  } while((byte & 0x80) != 0);

  int signbit = byte & 0x40;

  if(shift > maxbits)
  {
    // The final byte holds more bits than the type can represent. Those bits must all be copies of the last legal bit.
    signbit  = (1 << (maxbits + 6 - shift)) & byte;
    int bits = (~0U << (maxbits + 7 - shift)) & 0x7F;

    if(sign && signbit)
      byte = ~byte;

    if(byte & bits)
    {
      err = ERR_FATAL_INVALID_ENCODING;
      return 0;
    }
  }

  if(sign && signbit != 0 && shift < 64)
    result |= (~0ULL << shift);

  return result;
}

bool Stream::ReadName(std::string& out, WJ_ERROR& err)
{
  varuint32 len = ReadVarUInt32(err);
  if(err < 0)
    return false;
  if(len > Remaining())
  {
    err = ERR_PARSE_UNEXPECTED_EOF;
    return false;
  }

  out.assign(reinterpret_cast<const char*>(data + pos), len);
  pos += len;

  // Reject malformed UTF8 sequences
  for(size_t i = 0; i < out.size();)
  {
    uint8_t c = static_cast<uint8_t>(out[i]);
    size_t n;
    if(c < 0x80)
      n = 0;
    else if(c >= 0xC2 && c < 0xE0)
      n = 1;
    else if((c & 0xF0) == 0xE0)
      n = 2;
    else if(c >= 0xF0 && c < 0xF5)
      n = 3;
    else
    {
      err = ERR_PARSE_INVALID_NAME;
      return false;
    }

    if(i + n >= out.size())
    {
      err = ERR_PARSE_INVALID_NAME;
      return false;
    }

    // The second byte range excludes overlong forms, surrogates and anything past U+10FFFF
    uint8_t lo = 0x80, hi = 0xBF;
    switch(c)
    {
    case 0xE0: lo = 0xA0; break;
    case 0xED: hi = 0x9F; break;
    case 0xF0: lo = 0x90; break;
    case 0xF4: hi = 0x8F; break;
    }

    for(size_t j = 1; j <= n; ++j)
    {
      uint8_t b = static_cast<uint8_t>(out[i + j]);
      if(j == 1 ? (b < lo || b > hi) : (b & 0xC0) != 0x80)
      {
        err = ERR_PARSE_INVALID_NAME;
        return false;
      }
    }
    i += n + 1;
  }

  return true;
}
