#pragma once
#include <string>
#include <vector>

#include "sprig/errors.h"
#include "sprig/internal/code.hpp"
#include "sprig/internal/context.hpp"

namespace sprig
{

/** Subroutine table entry. Bodies of closed definitions end with RET. */
struct Subroutine
{
  std::string name;
  Code body;
};

/** Subroutines in discovery order. */
using SubroutineTable = std::vector<Subroutine>;

/** Subroutine name to absolute offset in the linked program. */
struct Location
{
  std::string name;
  int offset;
};
using LocationTable = std::vector<Location>;

/* ------------------------------- Optimizer ------------------------------- */

/**
 * Constant-fold code to a fixed point. Each scan applies the first rule
 * match at the lowest index and restarts; a scan without a match ends the
 * loop. Fails only in strict mode on a zero divisor.
 */
sprig_err optimize(Code* code, const Context* ctx);

/* ------------------------------- Validator ------------------------------- */

sprig_err validate(const Code& code, const Context* ctx);

/* -------------------------------- Linker --------------------------------- */

sprig_err split(const Code& tokens, Code* main, SubroutineTable* subs, const Context* ctx);
void expand_calls(Code* code, const SubroutineTable& subs);
sprig_err link(Code main, SubroutineTable subs, Code* out, LocationTable* locations,
               const Context* ctx);
sprig_err materialize(const Code& code, Code* out, const Context* ctx);

/** Full pipeline: split, expand, optimize, link, validate, materialize. */
sprig_err compile(const Code& tokens, Code* out, const Context* ctx);

}  // namespace sprig
