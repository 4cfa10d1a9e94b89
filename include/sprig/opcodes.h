#pragma once
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /** @file
   *  @brief Instruction set for C.
   *
   *  One opcode per mnemonic. Keep numeric values stable once published.
   */

  typedef enum sprig_op_t
  {
#define OP(name, val, mnem, cls) SPRIG_OP_##name = val,
#include <sprig/opcodes.def>
#undef OP
  } sprig_op_t;

#ifdef __cplusplus
}  // extern "C"
#endif
