#pragma once
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /** Severity of a diagnostic record. */
  typedef enum SprigDiagLevel
  {
    SPRIG_DIAG_INFO = 0,  /**< Optimizer rewrite trace */
    SPRIG_DIAG_ERROR = 1, /**< Compilation aborted */
  } SprigDiagLevel;

  /**
   * @brief Diagnostic record
   *
   * Passed to the registered handler once per optimizer rewrite and once
   * per compile error. Pointers are only valid during the callback.
   */
  typedef struct SprigDiagInfo
  {
    SprigDiagLevel level;
    int32_t error_code; /**< Err value, 0 for INFO records */
    int32_t index;      /**< Offending/rewritten index in the current block, -1 if none */
    const char *stage;  /**< "split", "optimize", "link", "validate", "materialize" */
    const char *message;
  } SprigDiagInfo;

  /**
   * @brief Diagnostic handler callback type
   *
   * @param user_data  User data pointer from SprigConfig::diag_user
   * @param info       Diagnostic record
   */
  typedef void (*SprigDiagHandler)(void *user_data, const SprigDiagInfo *info);

#ifdef __cplusplus
}
#endif
