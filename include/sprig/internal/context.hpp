#pragma once
#include <cstddef>

#include "sprig/compiler_api.h"
#include "sprig/diag.h"
#include "sprig/errors.h"

namespace sprig
{

/** Per-invocation state shared by the compiler stages. */
struct Context
{
  SprigConfig cfg;
  char* err;      /**< Caller's error buffer (may be NULL) */
  size_t err_cap;
};

/** Context with cfg copied (or defaulted when NULL). */
Context make_context(const SprigConfig* cfg, char* err, size_t err_cap);

/** Emit an INFO record. */
void diag_info(const Context* ctx, const char* stage, int index, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 4, 5)))
#endif
    ;

/**
 * Record a compile error: writes the message into the caller's buffer,
 * emits an ERROR record and returns code.
 */
sprig_err diag_fail(const Context* ctx, sprig_err code, const char* stage, int index,
                    const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 5, 6)))
#endif
    ;

}  // namespace sprig
