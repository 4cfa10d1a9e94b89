#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>

#include "sprig/errors.hpp"
#include "sprig/internal/code.hpp"
#include "sprig/internal/evaluator.hpp"
#include "sprig/opcodes.hpp"

namespace sprig
{

void eval_reset(Evaluator* ev)
{
  for (int k = 0; k < ev->depth; k++)
    ev->DS[k] = Item();
  ev->depth = 0;
}

/* ========================== Data stack helpers =========================== */

static inline sprig_err ds_push(Evaluator* ev, const Item& v)
{
  if (ev->depth >= Evaluator::kStackDepth)
    return SPRIG_ERR(StackOverflow);
  ev->DS[ev->depth++] = v;
  return SPRIG_ERR(OK);
}

static inline sprig_err ds_pop(Evaluator* ev, Item* out)
{
  if (ev->depth <= 0)
    return SPRIG_ERR(StackUnderflow);
  *out = ev->DS[--ev->depth];
  return SPRIG_ERR(OK);
}

static inline sprig_err ds_peek(const Evaluator* ev, int i, Item* out)
{
  if (ev->depth - 1 - i < 0)
    return SPRIG_ERR(StackUnderflow);
  *out = ev->DS[ev->depth - 1 - i];
  return SPRIG_ERR(OK);
}

/* ========================== Integer arithmetic =========================== */

static const int64_t kMin = std::numeric_limits<int64_t>::min();
static const int64_t kMax = std::numeric_limits<int64_t>::max();

static sprig_err int_add(int64_t a, int64_t b, int64_t* out)
{
  if ((b > 0 && a > kMax - b) || (b < 0 && a < kMin - b))
    return SPRIG_ERR(IntOverflow);
  *out = a + b;
  return SPRIG_ERR(OK);
}

static sprig_err int_sub(int64_t a, int64_t b, int64_t* out)
{
  if ((b < 0 && a > kMax + b) || (b > 0 && a < kMin + b))
    return SPRIG_ERR(IntOverflow);
  *out = a - b;
  return SPRIG_ERR(OK);
}

static sprig_err int_mul(int64_t a, int64_t b, int64_t* out)
{
  if (a == 0 || b == 0)
  {
    *out = 0;
    return SPRIG_ERR(OK);
  }
  if ((a == -1 && b == kMin) || (b == -1 && a == kMin))
    return SPRIG_ERR(IntOverflow);
  int64_t r = static_cast<int64_t>(static_cast<uint64_t>(a) * static_cast<uint64_t>(b));
  if (r / b != a)
    return SPRIG_ERR(IntOverflow);
  *out = r;
  return SPRIG_ERR(OK);
}

// Floor division: the quotient rounds toward negative infinity.
static sprig_err int_div(int64_t a, int64_t b, int64_t* out)
{
  if (b == 0)
    return SPRIG_ERR(DivByZero);
  if (a == kMin && b == -1)
    return SPRIG_ERR(IntOverflow);
  int64_t q = a / b;
  if (a % b != 0 && ((a < 0) != (b < 0)))
    q--;
  *out = q;
  return SPRIG_ERR(OK);
}

// Floor modulo: the remainder takes the sign of the divisor.
static sprig_err int_mod(int64_t a, int64_t b, int64_t* out)
{
  if (b == 0)
    return SPRIG_ERR(DivByZero);
  if (b == -1)
  {
    *out = 0;
    return SPRIG_ERR(OK);
  }
  int64_t r = a % b;
  if (r != 0 && ((r < 0) != (b < 0)))
    r += b;
  *out = r;
  return SPRIG_ERR(OK);
}

static double as_double(const Item& v)
{
  return v.kind == SPRIG_ITEM_INT ? static_cast<double>(v.i) : v.f;
}

/* ============================ Binary operators =========================== */

static sprig_err binary_arith(Op op, const Item& a, const Item& b, Item* out)
{
  if (!is_number(a) || !is_number(b))
    return SPRIG_ERR(TypeMismatch);

  if (a.kind == SPRIG_ITEM_INT && b.kind == SPRIG_ITEM_INT)
  {
    int64_t r = 0;
    sprig_err e = SPRIG_ERR(OK);
    switch (op)
    {
      case Op::ADD:
        e = int_add(a.i, b.i, &r);
        break;
      case Op::SUB:
        e = int_sub(a.i, b.i, &r);
        break;
      case Op::MUL:
        e = int_mul(a.i, b.i, &r);
        break;
      case Op::DIV:
        e = int_div(a.i, b.i, &r);
        break;
      case Op::MOD:
        e = int_mod(a.i, b.i, &r);
        break;
      case Op::BAND:
        r = a.i & b.i;
        break;
      case Op::BOR:
        r = a.i | b.i;
        break;
      case Op::BXOR:
        r = a.i ^ b.i;
        break;
      default:
        return SPRIG_ERR(ImpureOp);
    }
    if (e)
      return e;
    *out = Item::make_int(r);
    return SPRIG_ERR(OK);
  }

  double x = as_double(a), y = as_double(b);
  switch (op)
  {
    case Op::ADD:
      *out = Item::make_float(x + y);
      return SPRIG_ERR(OK);
    case Op::SUB:
      *out = Item::make_float(x - y);
      return SPRIG_ERR(OK);
    case Op::MUL:
      *out = Item::make_float(x * y);
      return SPRIG_ERR(OK);
    case Op::DIV:
      if (y == 0.0)
        return SPRIG_ERR(DivByZero);
      *out = Item::make_float(x / y);
      return SPRIG_ERR(OK);
    case Op::MOD:
    {
      if (y == 0.0)
        return SPRIG_ERR(DivByZero);
      double r = std::fmod(x, y);
      if (r != 0.0 && ((r < 0.0) != (y < 0.0)))
        r += y;
      *out = Item::make_float(r);
      return SPRIG_ERR(OK);
    }
    default:
      // Bitwise operators are integer-only.
      return SPRIG_ERR(TypeMismatch);
  }
}

static bool constants_equal(const Item& a, const Item& b)
{
  if (a.kind == SPRIG_ITEM_INT && b.kind == SPRIG_ITEM_INT)
    return a.i == b.i;
  if (is_number(a) && is_number(b))
    return as_double(a) == as_double(b);
  if (is_string(a) && is_string(b))
    return unquote(a.text) == unquote(b.text);
  if (is_bool(a) && is_bool(b))
    return bool_value(a) == bool_value(b);
  return false;
}

static sprig_err compare(Op op, const Item& a, const Item& b, Item* out)
{
  switch (op)
  {
    case Op::EQ:
      *out = Item::make_bool(constants_equal(a, b));
      return SPRIG_ERR(OK);
    case Op::NE:
      *out = Item::make_bool(!constants_equal(a, b));
      return SPRIG_ERR(OK);
    default:
      break;
  }

  if (!is_number(a) || !is_number(b))
    return SPRIG_ERR(TypeMismatch);

  bool r;
  if (a.kind == SPRIG_ITEM_INT && b.kind == SPRIG_ITEM_INT)
    r = (op == Op::LT) ? a.i < b.i : a.i > b.i;
  else
    r = (op == Op::LT) ? as_double(a) < as_double(b) : as_double(a) > as_double(b);
  *out = Item::make_bool(r);
  return SPRIG_ERR(OK);
}

/* ================================= Casts ================================= */

static sprig_err cast(Op op, const Item& a, Item* out)
{
  switch (op)
  {
    case Op::TO_INT:
      switch (a.kind)
      {
        case SPRIG_ITEM_INT:
          *out = a;
          return SPRIG_ERR(OK);
        case SPRIG_ITEM_FLOAT:
        {
          // Truncates toward zero.
          double t = std::trunc(a.f);
          if (!(t >= -9223372036854775808.0 && t < 9223372036854775808.0))
            return SPRIG_ERR(IntOverflow);
          *out = Item::make_int(static_cast<int64_t>(t));
          return SPRIG_ERR(OK);
        }
        case SPRIG_ITEM_STR:
        {
          int64_t v;
          if (!parse_int(unquote(a.text), &v))
            return SPRIG_ERR(TypeMismatch);
          *out = Item::make_int(v);
          return SPRIG_ERR(OK);
        }
        default:
          if (!is_bool(a))
            return SPRIG_ERR(TypeMismatch);
          *out = Item::make_int(bool_value(a) ? 1 : 0);
          return SPRIG_ERR(OK);
      }

    case Op::TO_FLOAT:
      switch (a.kind)
      {
        case SPRIG_ITEM_INT:
        case SPRIG_ITEM_FLOAT:
          *out = Item::make_float(as_double(a));
          return SPRIG_ERR(OK);
        case SPRIG_ITEM_STR:
        {
          Item parsed = classify_token(unquote(a.text).c_str());
          if (!is_number(parsed))
            return SPRIG_ERR(TypeMismatch);
          *out = Item::make_float(as_double(parsed));
          return SPRIG_ERR(OK);
        }
        default:
          if (!is_bool(a))
            return SPRIG_ERR(TypeMismatch);
          *out = Item::make_float(bool_value(a) ? 1.0 : 0.0);
          return SPRIG_ERR(OK);
      }

    case Op::TO_STR:
      *out = Item::make_str(quote(native_text(a)));
      return SPRIG_ERR(OK);

    case Op::TO_BOOL:
      *out = Item::make_bool(truthy(a));
      return SPRIG_ERR(OK);

    default:
      return SPRIG_ERR(ImpureOp);
  }
}

/* ============================ Interpreter loop =========================== */

static sprig_err exec_op(Evaluator* ev, Op op)
{
  switch (op)
  {
    /* -------- Literal markers -------- */
    case Op::LIT_TRUE:
      return ds_push(ev, Item::make_bool(true));
    case Op::LIT_FALSE:
      return ds_push(ev, Item::make_bool(false));
    case Op::NOP:
      return SPRIG_ERR(OK);

    /* -------- Stack manipulation -------- */
    case Op::DUP:
    {
      Item a;
      if (sprig_err e = ds_peek(ev, 0, &a))
        return e;
      return ds_push(ev, a);
    }

    case Op::DROP:
    {
      Item dummy;
      return ds_pop(ev, &dummy);
    }

    case Op::SWAP:
    {
      Item a, b;
      if (sprig_err e = ds_pop(ev, &a))
        return e;
      if (sprig_err e = ds_pop(ev, &b))
        return e;
      if (sprig_err e = ds_push(ev, a))
        return e;
      return ds_push(ev, b);
    }

    case Op::OVER:
    {
      Item v;
      if (sprig_err e = ds_peek(ev, 1, &v))
        return e;
      return ds_push(ev, v);
    }

    case Op::ROT:
    {
      // ( a b c -- b c a )
      Item a, b, c;
      if (sprig_err e = ds_pop(ev, &c))
        return e;
      if (sprig_err e = ds_pop(ev, &b))
        return e;
      if (sprig_err e = ds_pop(ev, &a))
        return e;
      if (sprig_err e = ds_push(ev, b))
        return e;
      if (sprig_err e = ds_push(ev, c))
        return e;
      return ds_push(ev, a);
    }

    /* -------- Arithmetic / comparison -------- */
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
    case Op::NE:
    {
      Item a, b, r;
      if (sprig_err e = ds_pop(ev, &b))
        return e;
      if (sprig_err e = ds_pop(ev, &a))
        return e;
      sprig_err e = (op_class(op) == OpClass::Compare) ? compare(op, a, b, &r)
                                                       : binary_arith(op, a, b, &r);
      if (e)
        return e;
      return ds_push(ev, r);
    }

    case Op::BNOT:
    {
      Item a;
      if (sprig_err e = ds_pop(ev, &a))
        return e;
      if (a.kind != SPRIG_ITEM_INT)
        return SPRIG_ERR(TypeMismatch);
      return ds_push(ev, Item::make_int(~a.i));
    }

    /* -------- Casts -------- */
    case Op::TO_INT:
    case Op::TO_FLOAT:
    case Op::TO_STR:
    case Op::TO_BOOL:
    {
      Item a, r;
      if (sprig_err e = ds_pop(ev, &a))
        return e;
      if (sprig_err e = cast(op, a, &r))
        return e;
      return ds_push(ev, r);
    }

    /* -------- Boolean connectives -------- */
    case Op::AND:
    case Op::OR:
    {
      Item a, b;
      if (sprig_err e = ds_pop(ev, &b))
        return e;
      if (sprig_err e = ds_pop(ev, &a))
        return e;
      if (!is_bool(a) || !is_bool(b))
        return SPRIG_ERR(TypeMismatch);
      bool r = (op == Op::AND) ? (bool_value(a) && bool_value(b))
                               : (bool_value(a) || bool_value(b));
      return ds_push(ev, Item::make_bool(r));
    }

    case Op::NOT:
    {
      Item a;
      if (sprig_err e = ds_pop(ev, &a))
        return e;
      if (!is_bool(a))
        return SPRIG_ERR(TypeMismatch);
      return ds_push(ev, Item::make_bool(!bool_value(a)));
    }

    /* -------- Control flow and I/O belong to the runtime -------- */
    case Op::CALL:
    case Op::RET:
    case Op::JMP:
    case Op::IF:
    case Op::EXIT:
    case Op::READ:
    case Op::WRITE:
    case Op::PRINT:
      return SPRIG_ERR(ImpureOp);
  }
  return SPRIG_ERR(UnknownInstruction);
}

sprig_err eval_run(Evaluator* ev, const Item* code, int len)
{
  for (int k = 0; k < len; k++)
  {
    const Item& it = code[k];
    Op op;
    if (as_op(it, &op))
    {
      if (sprig_err e = exec_op(ev, op))
        return e;
      continue;
    }

    switch (it.kind)
    {
      case SPRIG_ITEM_INT:
      case SPRIG_ITEM_FLOAT:
      case SPRIG_ITEM_STR:
      case SPRIG_ITEM_BOOL:
        if (sprig_err e = ds_push(ev, it))
          return e;
        break;
      case SPRIG_ITEM_OP:
      case SPRIG_ITEM_SYMBOL:
        return SPRIG_ERR(UnknownInstruction);
    }
  }
  return SPRIG_ERR(OK);
}

sprig_err eval_top(const Evaluator* ev, Item* out)
{
  return ds_peek(ev, 0, out);
}

}  // namespace sprig
