// Copyright (c)2020 Black Sphere Studios
// For conditions of distribution and use, see copyright notice in wasmjit.h

#ifndef WJ__STREAM_H
#define WJ__STREAM_H

#include "wasmjit/schema.h"
#include <inttypes.h>
#include <string.h>

namespace wasmjit {
  namespace utility {
    // The whole binary is already in memory, so this is a bounded cursor over it. Read errors are reported through an
    // error reference which is only ever overwritten with a failure, so a caller may decode several fields and check once.
    struct Stream
    {
      const uint8_t* data;
      size_t size;
      size_t pos;

      // Attempts to read num bytes from the stream, returns actual number of bytes read
      inline size_t ReadBytes(uint8_t* target, size_t num) noexcept
      {
        if(!num)
          return 0;

        size_t diff = size - pos; // pos is always less than size so this never underflows
        if(diff < num)
          num = diff;

        memcpy(target, data + pos, num);
        pos += num;
        return num;
      }

      // Reads a type from the stream, returns false if EOF reached before entire type could be read.
      template<typename T> WJ_FORCEINLINE bool Read(T& t) noexcept
      {
        if(sizeof(T) > (size - pos))
        {
          pos = size; // We advance the read pointer to the end, but don't read anything
          return false;
        }

        memcpy(reinterpret_cast<void*>(&t), data + pos, sizeof(T));
        pos += sizeof(T);
        return true;
      }

      // Reads one byte from the stream, returns -1 if EOF has been reached
      WJ_FORCEINLINE int Get() noexcept
      {
        if(pos < size)
          return data[pos++];
        return -1;
      }

      WJ_FORCEINLINE bool End() const noexcept { return pos >= size; }
      WJ_FORCEINLINE size_t Remaining() const noexcept { return size - pos; }

      WJ_FORCEINLINE uint32 ReadUInt32(WJ_ERROR& err)
      {
        uint8_t b[4];
        if(ReadBytes(b, 4) != 4)
        {
          err = ERR_PARSE_UNEXPECTED_EOF;
          return 0;
        }
        return b[0] | (b[1] << 8) | (b[2] << 16) | (static_cast<uint32>(b[3]) << 24); // Always little-endian
      }

      uint64_t DecodeLEB128(WJ_ERROR& err, unsigned int maxbits, bool sign);
      WJ_FORCEINLINE varuint1 ReadVarUInt1(WJ_ERROR& err) { return DecodeLEB128(err, 1, false) != 0; }
      WJ_FORCEINLINE varuint7 ReadVarUInt7(WJ_ERROR& err) { return static_cast<varuint7>(DecodeLEB128(err, 7, false)); }
      WJ_FORCEINLINE varuint32 ReadVarUInt32(WJ_ERROR& err) { return static_cast<varuint32>(DecodeLEB128(err, 32, false)); }
      WJ_FORCEINLINE varsint7 ReadVarInt7(WJ_ERROR& err) { return static_cast<varsint7>(DecodeLEB128(err, 7, true)); }
      WJ_FORCEINLINE varsint32 ReadVarInt32(WJ_ERROR& err) { return static_cast<varsint32>(DecodeLEB128(err, 32, true)); }
      WJ_FORCEINLINE varsint64 ReadVarInt64(WJ_ERROR& err) { return static_cast<varsint64>(DecodeLEB128(err, 64, true)); }
      template<class T> inline T ReadPrimitive(WJ_ERROR& err)
      {
        T r = 0;
        if(!Read<T>(r))
          err = ERR_PARSE_UNEXPECTED_EOF;
        return r;
      }
      WJ_FORCEINLINE float64 ReadFloat64(WJ_ERROR& err) { return ReadPrimitive<float64>(err); }
      WJ_FORCEINLINE float32 ReadFloat32(WJ_ERROR& err) { return ReadPrimitive<float32>(err); }
      WJ_FORCEINLINE uint8_t ReadByte(WJ_ERROR& err) { return ReadPrimitive<uint8_t>(err); }

      // Reads a length-prefixed UTF8 name.
      bool ReadName(std::string& out, WJ_ERROR& err);
    };
  }
}

#endif
