#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /**
   * @file arena.h
   * @brief Bump allocator for compiler output
   *
   * Optional backing store for linked programs. When a SprigConfig carries
   * an arena, every item array and string of the produced SprigProgram is
   * carved out of it and sprig_program_free() releases nothing; the owner
   * reclaims the memory with sprig_arena_reset().
   */

  /** Caller-owned buffer plus a fill mark. Nothing is freed individually. */
  typedef struct SprigArena
  {
    uint8_t *buffer; /**< Start of the caller's buffer, any alignment */
    size_t size;     /**< Capacity in bytes */
    size_t used;     /**< Bytes consumed, padding included */
  } SprigArena;

  /** Point an arena at buffer[0, size) and mark it empty. NULL-safe. */
  void sprig_arena_init(SprigArena *arena, uint8_t *buffer, size_t size);

  /**
   * @brief Carve bytes out of the arena
   *
   * The returned address itself is a multiple of align, whatever the
   * alignment of the buffer. Padding up to that address counts as used.
   *
   * @param arena Pointer to arena
   * @param bytes Number of bytes, must be non-zero
   * @param align Power of two
   * @return Aligned pointer, or NULL if the request does not fit
   */
  void *sprig_arena_alloc(SprigArena *arena, size_t bytes, size_t align);

  /**
   * @brief Copy a NUL-terminated string into the arena
   *
   * @param arena Pointer to arena
   * @param s     String to copy
   * @return Arena-owned copy, or NULL if the arena is exhausted
   */
  char *sprig_arena_strdup(SprigArena *arena, const char *s);

  /**
   * @brief Forget every allocation at once
   *
   * Programs exported into the arena become invalid. Memory is not cleared.
   */
  void sprig_arena_reset(SprigArena *arena);

  /** @brief Number of bytes currently allocated. */
  size_t sprig_arena_used(const SprigArena *arena);

  /** @brief Number of bytes available for allocation. */
  size_t sprig_arena_available(const SprigArena *arena);

#ifdef __cplusplus
}
#endif
