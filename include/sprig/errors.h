#pragma once

/**
 * @file errors.h
 * @brief sprig error codes for C
 *
 * C-compatible error code definitions generated from errors.def
 */

#ifdef __cplusplus
extern "C"
{
#endif

  /** Error code type. 0 = OK, negative = error. */
  typedef int sprig_err;

  /* Generate error code constants from errors.def */
#define ERR(name, val, msg) static const int SPRIG_ERR_##name = val;
#include "sprig/errors.def"
#undef ERR

#ifdef __cplusplus
}
#endif
