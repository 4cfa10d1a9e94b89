#pragma once
#include "sprig/errors.h"
#include "sprig/internal/code.hpp"

namespace sprig
{

/**
 * @brief Minimal stack evaluator used to compute fold results.
 *
 * Runs a short slice of pure instructions from an empty stack. Control
 * flow and I/O are refused with ImpureOp. A fresh instance is used for
 * every fold attempt.
 */
struct Evaluator
{
  enum
  {
    kStackDepth = 64
  };
  Item DS[kStackDepth]; /**< Data stack (top at depth-1) */
  int depth;            /**< Number of live entries */
};

void eval_reset(Evaluator* ev);

/** Execute code[0..len). Stops at the first error. */
sprig_err eval_run(Evaluator* ev, const Item* code, int len);

/** Copy of the top of stack. */
sprig_err eval_top(const Evaluator* ev, Item* out);

}  // namespace sprig
