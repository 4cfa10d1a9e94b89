#pragma once

#include "sprig/errors.h"

// Err mirrors errors.def row for row. A translation unit may define its own
// ERR(name, val, msg) before including this header to build other tables.

#ifndef ERR
#define ERR(name, val, msg) name = val,
#endif

enum class Err : int
{
#include "sprig/errors.def"
};

#undef ERR

// Err value as the sprig_err returned across the C API
#define SPRIG_ERR(name) static_cast<sprig_err>(Err::name)

inline const char *err_str(Err e)
{
  switch (e)
  {
#define ERR(name, val, msg) \
  case Err::name:           \
    return msg;
#include "sprig/errors.def"
#undef ERR
    default:
      return "unknown error";
  }
}
