#include <initializer_list>
#include <string>

#include "sprig/errors.hpp"
#include "sprig/internal/code.hpp"
#include "sprig/internal/compiler.hpp"
#include "sprig/internal/context.hpp"
#include "sprig/internal/evaluator.hpp"
#include "sprig/opcodes.hpp"

namespace sprig
{

static const char* const kStage = "optimize";

// Binary operators folded by "num num op".
static bool is_foldable(Op op)
{
  switch (op)
  {
    case Op::ADD:
    case Op::SUB:
    case Op::MUL:
    case Op::DIV:
    case Op::MOD:
    case Op::BAND:
    case Op::BOR:
    case Op::BXOR:
    case Op::LT:
    case Op::GT:
    case Op::EQ:
      return true;
    default:
      return false;
  }
}

static bool is_zero(const Item& v)
{
  return (v.kind == SPRIG_ITEM_INT && v.i == 0) || (v.kind == SPRIG_ITEM_FLOAT && v.f == 0.0);
}

// Replace code[i, i+n) with items.
static void splice(Code* code, size_t i, size_t n, std::initializer_list<Item> items)
{
  code->erase(code->begin() + i, code->begin() + i + n);
  code->insert(code->begin() + i, items.begin(), items.end());
}

/* ========================================================================= */
/* Rewrite rules                                                             */
/* ========================================================================= */

/**
 * Try every rule at index i, in priority order. Sets *changed and returns
 * after the first rewrite.
 */
static sprig_err rewrite_at(Code* code, size_t i, const Context* ctx, bool* changed)
{
  const size_t n = code->size();
  const Item* a = &(*code)[i];
  const Item* b = (i + 1 < n) ? &(*code)[i + 1] : nullptr;
  const Item* c = (i + 2 < n) ? &(*code)[i + 2] : nullptr;

  // op_b stays NOP when b is a literal, so the op_b rules below cannot match it.
  Op op_b = Op::NOP, op_c = Op::NOP;
  if (b && !as_op(*b, &op_b))
    op_b = Op::NOP;
  const bool c_is_op = c && as_op(*c, &op_c);

  // <num> <num> <arith> -> <result>
  if (b && is_number(*a) && is_number(*b) && c_is_op && is_foldable(op_c))
  {
    const bool divzero = (op_c == Op::DIV || op_c == Op::MOD) && is_zero(*b);
    if (divzero && ctx->cfg.strict_divzero)
    {
      return diag_fail(ctx, SPRIG_ERR(DivByZero), kStage, static_cast<int>(i),
                       "Division by zero (index %d): %s", static_cast<int>(i),
                       format_code(*code, i, 3).c_str());
    }

    // A zero divisor is left for the runtime to report.
    if (!divzero)
    {
      Evaluator ev{};
      eval_reset(&ev);
      Item result;
      if (eval_run(&ev, a, 3) == SPRIG_ERR(OK) && eval_top(&ev, &result) == SPRIG_ERR(OK))
      {
        std::string before = format_code(*code, i, 3);
        splice(code, i, 3, {result});
        diag_info(ctx, kStage, static_cast<int>(i), "Optimizer: Constant-folded %s to %s",
                  before.c_str(), format_item(result).c_str());
        *changed = true;
        return SPRIG_ERR(OK);
      }
    }
  }

  if (!b)
    return SPRIG_ERR(OK);

  // <const> dup -> <const> <const>
  if (is_constant(*a) && op_b == Op::DUP)
  {
    std::string before = format_code(*code, i, 2);
    (*code)[i + 1] = *a;
    diag_info(ctx, kStage, static_cast<int>(i), "Optimizer: Translated %s to %s",
              before.c_str(), format_code(*code, i, 2).c_str());
    *changed = true;
    return SPRIG_ERR(OK);
  }

  // <const> drop -> (nothing)
  if (is_constant(*a) && op_b == Op::DROP)
  {
    std::string before = format_code(*code, i, 2);
    splice(code, i, 2, {});
    diag_info(ctx, kStage, static_cast<int>(i), "Optimizer: Removed dead code %s",
              before.c_str());
    *changed = true;
    return SPRIG_ERR(OK);
  }

  // <int> int, <str> str, <bool> bool -> the literal itself
  if ((a->kind == SPRIG_ITEM_INT && op_b == Op::TO_INT) ||
      (is_string(*a) && op_b == Op::TO_STR) || (is_bool(*a) && op_b == Op::TO_BOOL))
  {
    std::string before = format_code(*code, i, 2);
    splice(code, i + 1, 1, {});
    diag_info(ctx, kStage, static_cast<int>(i), "Optimizer: Translated %s to %s",
              before.c_str(), format_item((*code)[i]).c_str());
    *changed = true;
    return SPRIG_ERR(OK);
  }

  // <c1> <c2> swap -> <c2> <c1>
  if (c_is_op && op_c == Op::SWAP && is_constant(*a) && is_constant(*b))
  {
    std::string before = format_code(*code, i, 3);
    Item first = *a, second = *b;
    splice(code, i, 3, {second, first});
    diag_info(ctx, kStage, static_cast<int>(i), "Optimizer: Translated %s to %s",
              before.c_str(), format_code(*code, i, 2).c_str());
    *changed = true;
    return SPRIG_ERR(OK);
  }

  // <c1> <c2> over -> <c1> <c2> <c1>
  if (c_is_op && op_c == Op::OVER && is_constant(*a) && is_constant(*b))
  {
    std::string before = format_code(*code, i, 3);
    (*code)[i + 2] = *a;
    diag_info(ctx, kStage, static_cast<int>(i), "Optimizer: Translated %s to %s",
              before.c_str(), format_code(*code, i, 3).c_str());
    *changed = true;
    return SPRIG_ERR(OK);
  }

  // "<digits>" int -> <int>; anything else is left for the runtime
  int64_t number;
  if (is_string(*a) && op_b == Op::TO_INT && parse_int(unquote(a->text), &number))
  {
    std::string before = format_code(*code, i, 2);
    splice(code, i, 2, {Item::make_int(number)});
    diag_info(ctx, kStage, static_cast<int>(i), "Optimizer: Translated %s to %lld",
              before.c_str(), static_cast<long long>(number));
    *changed = true;
    return SPRIG_ERR(OK);
  }

  // <const> str -> "<text>"
  if (is_constant(*a) && op_b == Op::TO_STR)
  {
    std::string before = format_code(*code, i, 2);
    Item s = Item::make_str(quote(native_text(*a)));
    splice(code, i, 2, {s});
    diag_info(ctx, kStage, static_cast<int>(i), "Optimizer: Translated %s to %s",
              before.c_str(), s.text.c_str());
    *changed = true;
    return SPRIG_ERR(OK);
  }

  // <const> bool -> true/false
  if (is_constant(*a) && op_b == Op::TO_BOOL)
  {
    std::string before = format_code(*code, i, 2);
    bool v = truthy(*a);
    splice(code, i, 2, {Item::make_bool(v)});
    diag_info(ctx, kStage, static_cast<int>(i), "Optimizer: Translated %s to %s",
              before.c_str(), v ? "true" : "false");
    *changed = true;
    return SPRIG_ERR(OK);
  }

  return SPRIG_ERR(OK);
}

/* ========================================================================= */
/* Fixed-point driver                                                        */
/* ========================================================================= */

sprig_err optimize(Code* code, const Context* ctx)
{
  // An earlier fold can expose a match at an index already scanned, so every
  // rewrite restarts the scan from the beginning.
  bool changed = true;
  while (changed)
  {
    changed = false;
    for (size_t i = 0; i < code->size(); i++)
    {
      if (sprig_err e = rewrite_at(code, i, ctx, &changed))
        return e;
      if (changed)
        break;
    }
  }
  return SPRIG_ERR(OK);
}

}  // namespace sprig
