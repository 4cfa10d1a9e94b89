#include <cstdlib>
#include <cstring>

#include "sprig/arena.h"
#include "sprig/compiler_api.h"
#include "sprig/errors.hpp"
#include "sprig/internal/code.hpp"
#include "sprig/internal/compiler.hpp"
#include "sprig/internal/context.hpp"

using namespace sprig;

// ---------------------------------------------------------------------------
// Input / output conversion
// ---------------------------------------------------------------------------

static sprig_err read_tokens(const char* const* tokens, int count, Code* out,
                             const Context* ctx)
{
  if (count < 0 || (count > 0 && !tokens))
    return diag_fail(ctx, SPRIG_ERR(InvalidArg), "input", -1, "token list is NULL");

  out->reserve(static_cast<size_t>(count));
  for (int i = 0; i < count; i++)
  {
    if (!tokens[i])
      return diag_fail(ctx, SPRIG_ERR(InvalidArg), "input", i, "token %d is NULL", i);
    out->push_back(classify_token(tokens[i]));
  }
  return SPRIG_ERR(OK);
}

static char* copy_string(SprigArena* arena, const std::string& s)
{
  if (arena)
    return sprig_arena_strdup(arena, s.c_str());

  char* dst = static_cast<char*>(malloc(s.size() + 1));
  if (dst)
    memcpy(dst, s.c_str(), s.size() + 1);
  return dst;
}

// Copy code into a SprigProgram. On failure nothing stays allocated.
static sprig_err export_program(const Code& code, SprigArena* arena, SprigProgram* out)
{
  out->items = nullptr;
  out->count = 0;
  out->arena = arena;
  if (code.empty())
    return SPRIG_ERR(OK);

  const size_t mark = arena ? arena->used : 0;
  const size_t bytes = code.size() * sizeof(SprigItem);
  SprigItem* items = arena ? static_cast<SprigItem*>(
                                 sprig_arena_alloc(arena, bytes, alignof(SprigItem)))
                           : static_cast<SprigItem*>(calloc(code.size(), sizeof(SprigItem)));
  if (!items)
    return SPRIG_ERR(OutOfMemory);
  if (arena)
    memset(items, 0, bytes);

  out->items = items;
  for (size_t k = 0; k < code.size(); k++)
  {
    const Item& it = code[k];
    SprigItem* dst = &items[k];
    dst->kind = it.kind;
    dst->text = nullptr;
    switch (it.kind)
    {
      case SPRIG_ITEM_OP:
        dst->as.op = static_cast<sprig_op_t>(it.op);
        break;
      case SPRIG_ITEM_INT:
        dst->as.i = it.i;
        break;
      case SPRIG_ITEM_FLOAT:
        dst->as.f = it.f;
        break;
      case SPRIG_ITEM_BOOL:
        dst->as.b = it.b ? 1 : 0;
        break;
      case SPRIG_ITEM_STR:
      case SPRIG_ITEM_SYMBOL:
        dst->text = copy_string(arena, it.text);
        if (!dst->text)
        {
          out->count = static_cast<int>(k);
          if (arena)
          {
            arena->used = mark;
            out->items = nullptr;
            out->count = 0;
          }
          else
          {
            sprig_program_free(out);
          }
          return SPRIG_ERR(OutOfMemory);
        }
        break;
    }
    out->count = static_cast<int>(k + 1);
  }
  return SPRIG_ERR(OK);
}

// ---------------------------------------------------------------------------
// Public C API implementations
// ---------------------------------------------------------------------------

extern "C" void sprig_config_default(SprigConfig* cfg)
{
  if (!cfg)
    return;

  cfg->optimize = 1;
  cfg->strict_divzero = 0;
  cfg->verbose = 0;
  cfg->diag = nullptr;
  cfg->diag_user = nullptr;
  cfg->arena = nullptr;
}

extern "C" int sprig_version(void)
{
  return 1;
}

extern "C" const char* sprig_err_str(sprig_err code)
{
  return err_str(static_cast<Err>(code));
}

extern "C" void sprig_program_free(SprigProgram* prog)
{
  if (!prog)
    return;

  // Arena-backed storage is reclaimed by the arena owner
  if (!prog->arena && prog->items)
  {
    for (int i = 0; i < prog->count; i++)
      free(const_cast<char*>(prog->items[i].text));
    free(prog->items);
  }
  prog->items = nullptr;
  prog->count = 0;
  prog->arena = nullptr;
}

extern "C" sprig_err sprig_compile(const char* const* tokens, int count, const SprigConfig* cfg,
                                   SprigProgram* out, char* err, size_t err_cap)
{
  Context ctx = make_context(cfg, err, err_cap);
  if (!out)
    return diag_fail(&ctx, SPRIG_ERR(InvalidArg), "input", -1, "output program is NULL");
  out->items = nullptr;
  out->count = 0;
  out->arena = nullptr;

  Code code;
  if (sprig_err e = read_tokens(tokens, count, &code, &ctx))
    return e;

  Code linked;
  if (sprig_err e = compile(code, &linked, &ctx))
    return e;

  if (sprig_err e = export_program(linked, ctx.cfg.arena, out))
    return diag_fail(&ctx, e, "output", -1, "cannot allocate %d linked items",
                     static_cast<int>(linked.size()));
  return SPRIG_ERR(OK);
}

extern "C" sprig_err sprig_optimize(const char* const* tokens, int count, const SprigConfig* cfg,
                                    SprigProgram* out, char* err, size_t err_cap)
{
  Context ctx = make_context(cfg, err, err_cap);
  if (!out)
    return diag_fail(&ctx, SPRIG_ERR(InvalidArg), "input", -1, "output program is NULL");
  out->items = nullptr;
  out->count = 0;
  out->arena = nullptr;

  Code code;
  if (sprig_err e = read_tokens(tokens, count, &code, &ctx))
    return e;

  if (sprig_err e = optimize(&code, &ctx))
    return e;

  if (sprig_err e = export_program(code, ctx.cfg.arena, out))
    return diag_fail(&ctx, e, "output", -1, "cannot allocate %d items",
                     static_cast<int>(code.size()));
  return SPRIG_ERR(OK);
}

extern "C" sprig_err sprig_validate(const SprigItem* items, int count, const SprigConfig* cfg,
                                    char* err, size_t err_cap)
{
  Context ctx = make_context(cfg, err, err_cap);
  if (count < 0 || (count > 0 && !items))
    return diag_fail(&ctx, SPRIG_ERR(InvalidArg), "input", -1, "item list is NULL");

  Code code;
  code.reserve(static_cast<size_t>(count));
  for (int i = 0; i < count; i++)
    code.push_back(from_c(items[i]));

  return validate(code, &ctx);
}
