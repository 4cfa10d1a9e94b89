#pragma once
#include <stddef.h>
#include <stdint.h>

#include "sprig/arena.h"
#include "sprig/diag.h"
#include "sprig/errors.h"
#include "sprig/item.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /* ------------------------------------------------------------------------- */
  /* Configuration                                                             */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Compiler configuration.
   *
   * Use sprig_config_default() and override fields. Passing NULL wherever a
   * config is accepted is the same as passing the defaults.
   */
  typedef struct SprigConfig
  {
    int optimize;       /**< Constant-fold each block (default 1) */
    int strict_divzero; /**< Fail on a zero divisor instead of leaving it for runtime (default 0) */
    int verbose;        /**< printf diagnostics when no handler is set (default 0) */
    SprigDiagHandler diag; /**< Optional diagnostic handler */
    void *diag_user;       /**< User data passed to diag */
    SprigArena *arena; /**< Optional arena for output storage (NULL = malloc) */
  } SprigConfig;

  /**
   * @brief Fill a config with default values.
   * @param cfg  Config to fill (NULL-safe).
   */
  void sprig_config_default(SprigConfig *cfg);

  /* ------------------------------------------------------------------------- */
  /* Programs                                                                  */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Item sequence produced by the compiler or optimizer.
   *
   * Owns its item array and string payloads. Release with
   * sprig_program_free().
   */
  typedef struct SprigProgram
  {
    SprigItem *items;
    int count;
    SprigArena *arena; /**< Arena the storage came from, NULL = malloc */
  } SprigProgram;

  /**
   * @brief Release a program's storage and clear it.
   * @param prog  Program to free (NULL-safe, safe on an empty program).
   */
  void sprig_program_free(SprigProgram *prog);

  /* ------------------------------------------------------------------------- */
  /* Compilation                                                               */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Compile a token sequence into a linked program.
   *
   * Splits ": name ... ;" subroutine definitions from the main body, inserts
   * CALL after every subroutine reference, appends EXIT to the main body
   * when subroutines exist, optimizes every block in isolation, lays out
   * main code followed by subroutine bodies in definition order, replaces
   * references with absolute offsets, validates, and converts literals to
   * native values.
   *
   * @param tokens    Token strings, as produced by the tokenizer.
   * @param count     Number of tokens.
   * @param cfg       Configuration (may be NULL).
   * @param out       Receives the linked program. Left empty on failure.
   * @param err       Optional buffer for the error message.
   * @param err_cap   Capacity of err.
   * @return 0 on success, negative error code on failure.
   */
  sprig_err sprig_compile(const char *const *tokens, int count, const SprigConfig *cfg,
                          SprigProgram *out, char *err, size_t err_cap);

  /**
   * @brief Constant-fold a token sequence.
   *
   * The result stays in token shape: words are SYMBOL items and string
   * literals keep their quotes. Folded booleans are BOOL items.
   *
   * @return 0 on success, negative error code on failure (strict mode only).
   */
  sprig_err sprig_optimize(const char *const *tokens, int count, const SprigConfig *cfg,
                           SprigProgram *out, char *err, size_t err_cap);

  /**
   * @brief Run the static checks over an item sequence.
   *
   * Rejects unknown instructions, a string literal followed by "int", and a
   * non-boolean literal followed by "and", "or" or "not".
   *
   * @return 0 if the sequence passes, negative error code otherwise.
   */
  sprig_err sprig_validate(const SprigItem *items, int count, const SprigConfig *cfg,
                           char *err, size_t err_cap);

  /* ------------------------------------------------------------------------- */
  /* Version and error text                                                    */
  /* ------------------------------------------------------------------------- */

  /** @brief Library version number. */
  int sprig_version(void);

  /** @brief Static description of an error code. */
  const char *sprig_err_str(sprig_err code);

#ifdef __cplusplus
} /* extern "C" */
#endif
