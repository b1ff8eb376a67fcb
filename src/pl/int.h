#pragma once

/// @file pl/int.h
/// Fixed-width integer aliases used throughout PulseLED.

#include <stdint.h>
#include <stddef.h>

namespace pl {

typedef uint8_t u8;
typedef int8_t i8;
typedef uint16_t u16;
typedef int16_t i16;
typedef uint32_t u32;
typedef int32_t i32;
typedef uint64_t u64;
typedef int64_t i64;
typedef size_t size;
typedef uintptr_t uptr;

static_assert(sizeof(u8) == 1, "u8 must be 1 byte");
static_assert(sizeof(u16) == 2, "u16 must be 2 bytes");
static_assert(sizeof(u32) == 4, "u32 must be 4 bytes");

} // namespace pl
