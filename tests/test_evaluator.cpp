#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <initializer_list>

#include "doctest.h"
#include "sprig/errors.hpp"
#include "sprig/internal/code.hpp"
#include "sprig/internal/evaluator.hpp"

using namespace sprig;

/* ------------------------------------------------------------------------- */
/* Helpers                                                                   */
/* ------------------------------------------------------------------------- */

static Code code_of(std::initializer_list<const char*> toks)
{
  Code code;
  for (const char* t : toks)
    code.push_back(classify_token(t));
  return code;
}

/**
 * @brief Fixture that owns a fresh evaluator per test
 */
struct EvalFixture
{
  Evaluator ev{};

  EvalFixture()
  {
    eval_reset(&ev);
  }

  sprig_err run(std::initializer_list<const char*> toks)
  {
    Code code = code_of(toks);
    return eval_run(&ev, code.data(), static_cast<int>(code.size()));
  }

  Item top()
  {
    Item out;
    REQUIRE(eval_top(&ev, &out) == SPRIG_ERR(OK));
    return out;
  }
};

/* ------------------------------------------------------------------------- */
/* Arithmetic                                                                */
/* ------------------------------------------------------------------------- */

TEST_CASE("integer arithmetic")
{
  EvalFixture f;
  CHECK(f.run({"2", "3", "+"}) == 0);
  CHECK(f.top() == Item::make_int(5));

  CHECK(f.run({"10", "4", "-"}) == 0);
  CHECK(f.top() == Item::make_int(6));

  CHECK(f.run({"6", "7", "*"}) == 0);
  CHECK(f.top() == Item::make_int(42));
  CHECK(f.ev.depth == 3);
}

TEST_CASE("division and modulo floor toward negative infinity")
{
  EvalFixture f;
  CHECK(f.run({"7", "2", "/"}) == 0);
  CHECK(f.top() == Item::make_int(3));

  CHECK(f.run({"-7", "2", "/"}) == 0);
  CHECK(f.top() == Item::make_int(-4));

  CHECK(f.run({"-7", "2", "%"}) == 0);
  CHECK(f.top() == Item::make_int(1));

  CHECK(f.run({"7", "-2", "%"}) == 0);
  CHECK(f.top() == Item::make_int(-1));
}

TEST_CASE("mixed operands produce floats")
{
  EvalFixture f;
  CHECK(f.run({"7.0", "2", "/"}) == 0);
  CHECK(f.top().kind == SPRIG_ITEM_FLOAT);
  CHECK(f.top().f == doctest::Approx(3.5));

  CHECK(f.run({"1", "0.5", "+"}) == 0);
  CHECK(f.top().f == doctest::Approx(1.5));

  CHECK(f.run({"-7.5", "2", "%"}) == 0);
  CHECK(f.top().f == doctest::Approx(0.5));
}

TEST_CASE("bitwise operators are integer-only")
{
  EvalFixture f;
  CHECK(f.run({"12", "10", "&"}) == 0);
  CHECK(f.top() == Item::make_int(8));
  CHECK(f.run({"12", "10", "|"}) == 0);
  CHECK(f.top() == Item::make_int(14));
  CHECK(f.run({"12", "10", "^"}) == 0);
  CHECK(f.top() == Item::make_int(6));
  CHECK(f.run({"0", "~"}) == 0);
  CHECK(f.top() == Item::make_int(-1));

  EvalFixture g;
  CHECK(g.run({"1.5", "2", "&"}) == SPRIG_ERR(TypeMismatch));
}

TEST_CASE("error: division by zero")
{
  EvalFixture f;
  CHECK(f.run({"5", "0", "/"}) == SPRIG_ERR(DivByZero));

  EvalFixture g;
  CHECK(g.run({"5", "0", "%"}) == SPRIG_ERR(DivByZero));

  EvalFixture h;
  CHECK(h.run({"5.0", "0.0", "/"}) == SPRIG_ERR(DivByZero));
}

TEST_CASE("error: integer overflow")
{
  EvalFixture f;
  CHECK(f.run({"9223372036854775807", "1", "+"}) == SPRIG_ERR(IntOverflow));

  EvalFixture g;
  CHECK(g.run({"-9223372036854775808", "-1", "/"}) == SPRIG_ERR(IntOverflow));

  EvalFixture h;
  CHECK(h.run({"4611686018427387904", "2", "*"}) == SPRIG_ERR(IntOverflow));

  EvalFixture k;
  CHECK(k.run({"-9223372036854775808", "-1", "%"}) == 0);
  CHECK(k.top() == Item::make_int(0));
}

/* ------------------------------------------------------------------------- */
/* Comparison                                                                */
/* ------------------------------------------------------------------------- */

TEST_CASE("comparisons push booleans")
{
  EvalFixture f;
  CHECK(f.run({"1", "2", "<"}) == 0);
  CHECK(f.top() == Item::make_bool(true));
  CHECK(f.run({"1", "2", ">"}) == 0);
  CHECK(f.top() == Item::make_bool(false));
  CHECK(f.run({"2", "2.0", "="}) == 0);
  CHECK(f.top() == Item::make_bool(true));
  CHECK(f.run({"\"a\"", "'a'", "="}) == 0);
  CHECK(f.top() == Item::make_bool(true));
  CHECK(f.run({"\"a\"", "1", "<>"}) == 0);
  CHECK(f.top() == Item::make_bool(true));

  EvalFixture g;
  CHECK(g.run({"\"a\"", "1", "<"}) == SPRIG_ERR(TypeMismatch));
}

/* ------------------------------------------------------------------------- */
/* Stack operations                                                          */
/* ------------------------------------------------------------------------- */

TEST_CASE("stack ops (DUP/DROP/SWAP/OVER/ROT)")
{
  EvalFixture f;
  CHECK(f.run({"1", "2", "swap", "dup", "over", "drop"}) == 0);
  REQUIRE(f.ev.depth == 3);
  CHECK(f.ev.DS[0] == Item::make_int(2));
  CHECK(f.ev.DS[1] == Item::make_int(1));
  CHECK(f.ev.DS[2] == Item::make_int(1));

  EvalFixture g;
  CHECK(g.run({"1", "2", "3", "rot"}) == 0);
  REQUIRE(g.ev.depth == 3);
  CHECK(g.ev.DS[0] == Item::make_int(2));
  CHECK(g.ev.DS[1] == Item::make_int(3));
  CHECK(g.ev.DS[2] == Item::make_int(1));
}

TEST_CASE("error: stack underflow")
{
  EvalFixture f;
  CHECK(f.run({"drop"}) == SPRIG_ERR(StackUnderflow));

  EvalFixture g;
  CHECK(g.run({"1", "over"}) == SPRIG_ERR(StackUnderflow));

  EvalFixture h;
  Item out;
  CHECK(eval_top(&h.ev, &out) == SPRIG_ERR(StackUnderflow));
}

TEST_CASE("error: stack overflow")
{
  EvalFixture f;
  Code code;
  for (int i = 0; i <= Evaluator::kStackDepth; i++)
    code.push_back(Item::make_int(i));
  CHECK(eval_run(&f.ev, code.data(), static_cast<int>(code.size())) ==
        SPRIG_ERR(StackOverflow));
}

/* ------------------------------------------------------------------------- */
/* Casts and booleans                                                        */
/* ------------------------------------------------------------------------- */

TEST_CASE("casts")
{
  EvalFixture f;
  CHECK(f.run({"\"12\"", "int"}) == 0);
  CHECK(f.top() == Item::make_int(12));
  CHECK(f.run({"2.9", "int"}) == 0);
  CHECK(f.top() == Item::make_int(2));
  CHECK(f.run({"-2.9", "int"}) == 0);
  CHECK(f.top() == Item::make_int(-2));
  CHECK(f.run({"true", "int"}) == 0);
  CHECK(f.top() == Item::make_int(1));
  CHECK(f.run({"3", "float"}) == 0);
  CHECK(f.top() == Item::make_float(3.0));
  CHECK(f.run({"\"2.5\"", "float"}) == 0);
  CHECK(f.top() == Item::make_float(2.5));
  CHECK(f.run({"7", "str"}) == 0);
  CHECK(f.top() == Item::make_str("\"7\""));
  CHECK(f.run({"\"\"", "bool"}) == 0);
  CHECK(f.top() == Item::make_bool(false));

  EvalFixture g;
  CHECK(g.run({"\"x1\"", "int"}) == SPRIG_ERR(TypeMismatch));
}

TEST_CASE("boolean connectives require booleans")
{
  EvalFixture f;
  CHECK(f.run({"true", "false", "and"}) == 0);
  CHECK(f.top() == Item::make_bool(false));
  CHECK(f.run({"true", "false", "or"}) == 0);
  CHECK(f.top() == Item::make_bool(true));
  CHECK(f.run({"false", "not"}) == 0);
  CHECK(f.top() == Item::make_bool(true));

  EvalFixture g;
  CHECK(g.run({"1", "true", "and"}) == SPRIG_ERR(TypeMismatch));
}

/* ------------------------------------------------------------------------- */
/* Refused instructions                                                      */
/* ------------------------------------------------------------------------- */

TEST_CASE("control flow and I/O are not evaluated")
{
  const char* impure[] = {"call", "return", "jmp", "if", "exit", "read", "write", "."};
  for (const char* op : impure)
  {
    EvalFixture f;
    CAPTURE(op);
    CHECK(f.run({"1", "1", op}) == SPRIG_ERR(ImpureOp));
  }

  EvalFixture n;
  CHECK(n.run({"1", "nop"}) == 0);
  CHECK(n.ev.depth == 1);
}

TEST_CASE("unknown symbols are refused")
{
  EvalFixture f;
  CHECK(f.run({"double"}) == SPRIG_ERR(UnknownInstruction));
}

TEST_CASE("eval_reset clears the stack")
{
  EvalFixture f;
  CHECK(f.run({"1", "2", "3"}) == 0);
  CHECK(f.ev.depth == 3);
  eval_reset(&f.ev);
  CHECK(f.ev.depth == 0);
}
