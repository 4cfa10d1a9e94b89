#pragma once
#include <stddef.h>
#include <stdint.h>

#include "sprig/errors.h"
#include "sprig/opcodes.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /* ------------------------------------------------------------------------- */
  /* Code items                                                                */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Tag of a code item.
   *
   * Token-shaped code (input, optimizer output) holds INT, FLOAT, STR and
   * SYMBOL items, plus BOOL items produced by folding. STR text keeps its
   * quotes and SYMBOL covers both mnemonics and subroutine names.
   *
   * Linked code (compiler output) holds OP, INT, FLOAT, BOOL and unquoted
   * STR items. An INT directly before a CALL is an absolute address.
   */
  typedef enum SprigItemKind
  {
    SPRIG_ITEM_OP = 0,  /**< Resolved instruction (as.op) */
    SPRIG_ITEM_INT,     /**< 64-bit integer literal (as.i) */
    SPRIG_ITEM_FLOAT,   /**< Floating literal (as.f) */
    SPRIG_ITEM_STR,     /**< String literal (text) */
    SPRIG_ITEM_BOOL,    /**< Native boolean (as.b, 0 or 1) */
    SPRIG_ITEM_SYMBOL,  /**< Bare word: mnemonic or subroutine name (text) */
  } SprigItemKind;

  /**
   * @brief One element of a program.
   */
  typedef struct SprigItem
  {
    SprigItemKind kind;
    union
    {
      sprig_op_t op;
      int64_t i;
      double f;
      int b;
    } as;
    const char *text; /**< STR / SYMBOL payload, NULL for other kinds */
  } SprigItem;

  /* ------------------------------------------------------------------------- */
  /* Instruction set lookup and classification                                 */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Look up a mnemonic in the instruction set.
   * @param name  Mnemonic, e.g. "dup" or "+".
   * @param out   Receives the opcode (may be NULL).
   * @return 0 on success, SPRIG_ERR_UnknownInstruction otherwise.
   */
  sprig_err sprig_lookup(const char *name, sprig_op_t *out);

  /** @brief Literal of any kind, including the true/false keywords. */
  int sprig_item_is_constant(const SprigItem *item);

  /** @brief String literal. */
  int sprig_item_is_string(const SprigItem *item);

  /** @brief Integer or floating literal (booleans excluded). */
  int sprig_item_is_number(const SprigItem *item);

  /** @brief Native boolean or true/false keyword. */
  int sprig_item_is_bool(const SprigItem *item);

  /**
   * @brief Render an item in source form ("5", "\"abc\"", "dup", ...).
   * @param item  Item to format.
   * @param buf   Output buffer (NUL-terminated, truncated to cap).
   * @param cap   Buffer capacity.
   * @return Length of the full rendering, excluding the terminator.
   */
  int sprig_item_format(const SprigItem *item, char *buf, size_t cap);

#ifdef __cplusplus
} /* extern "C" */
#endif
