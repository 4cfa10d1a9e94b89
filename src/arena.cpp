#include "sprig/arena.h"

#include <cstdint>
#include <cstring>

extern "C" void sprig_arena_init(SprigArena* arena, uint8_t* buffer, size_t size)
{
  if (!arena)
    return;

  arena->buffer = buffer;
  arena->size = size;
  arena->used = 0;
}

extern "C" void* sprig_arena_alloc(SprigArena* arena, size_t bytes, size_t align)
{
  if (!arena || !arena->buffer || bytes == 0)
    return nullptr;

  // Alignment must be power of 2
  if (align == 0 || (align & (align - 1)) != 0)
    return nullptr;

  // Round the address, not the offset: callers may pass any buffer.
  const uintptr_t base = reinterpret_cast<uintptr_t>(arena->buffer);
  const uintptr_t next = (base + arena->used + align - 1) & ~static_cast<uintptr_t>(align - 1);
  const size_t offset = static_cast<size_t>(next - base);
  if (offset > arena->size || bytes > arena->size - offset)
    return nullptr;

  arena->used = offset + bytes;
  return arena->buffer + offset;
}

extern "C" char* sprig_arena_strdup(SprigArena* arena, const char* s)
{
  if (!s)
    return nullptr;

  size_t len = strlen(s) + 1;
  char* dst = static_cast<char*>(sprig_arena_alloc(arena, len, 1));
  if (!dst)
    return nullptr;
  memcpy(dst, s, len);
  return dst;
}

extern "C" void sprig_arena_reset(SprigArena* arena)
{
  if (!arena)
    return;

  arena->used = 0;
}

extern "C" size_t sprig_arena_used(const SprigArena* arena)
{
  return arena ? arena->used : 0;
}

extern "C" size_t sprig_arena_available(const SprigArena* arena)
{
  return arena ? arena->size - arena->used : 0;
}
