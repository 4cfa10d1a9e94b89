#include <string>
#include <utility>

#include "sprig/errors.hpp"
#include "sprig/internal/code.hpp"
#include "sprig/internal/compiler.hpp"
#include "sprig/internal/context.hpp"
#include "sprig/opcodes.hpp"

namespace sprig
{

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static bool is_symbol(const Item& item, const char* text)
{
  return item.kind == SPRIG_ITEM_SYMBOL && item.text == text;
}

static Subroutine* find_sub(SubroutineTable* subs, const std::string& name)
{
  for (Subroutine& s : *subs)
  {
    if (s.name == name)
      return &s;
  }
  return nullptr;
}

static bool has_sub(const SubroutineTable& subs, const std::string& name)
{
  for (const Subroutine& s : subs)
  {
    if (s.name == name)
      return true;
  }
  return false;
}

static const Location* find_location(const LocationTable& locations, const std::string& name)
{
  for (const Location& loc : locations)
  {
    if (loc.name == name)
      return &loc;
  }
  return nullptr;
}

// ---------------------------------------------------------------------------
// Split: ": name body ;" definitions vs. main code
// ---------------------------------------------------------------------------

sprig_err split(const Code& tokens, Code* main, SubroutineTable* subs, const Context* ctx)
{
  size_t i = 0;
  while (i < tokens.size())
  {
    if (!is_symbol(tokens[i], kWordOpen))
    {
      main->push_back(tokens[i++]);
      continue;
    }

    // ':' as the last token defines nothing
    const int colon = static_cast<int>(i++);
    if (i >= tokens.size())
      break;

    const Item& name_tok = tokens[i++];
    if (name_tok.kind != SPRIG_ITEM_SYMBOL)
    {
      return diag_fail(ctx, SPRIG_ERR(InvalidWordName), "split", colon + 1,
                       "Invalid word name (index %d): %s", colon + 1,
                       format_item(name_tok).c_str());
    }
    const std::string& name = name_tok.text;
    if (name == kWordOpen || name == kWordClose)
    {
      return diag_fail(ctx, SPRIG_ERR(ReservedWordName), "split", colon + 1,
                       "Invalid word name '%s'.", name.c_str());
    }
    if (is_reserved(name))
    {
      return diag_fail(ctx, SPRIG_ERR(ReservedWordName), "split", colon + 1,
                       "Cannot shadow internal word definition '%s'.", name.c_str());
    }

    Code body;
    bool closed = false;
    while (i < tokens.size())
    {
      const Item& tok = tokens[i++];
      if (is_symbol(tok, kWordClose))
      {
        body.push_back(Item::make_op(Op::RET));
        closed = true;
        break;
      }
      body.push_back(tok);
    }

    // An unterminated definition keeps its truncated body, without RET.
    if (!closed)
      diag_info(ctx, "split", colon, "Linker: definition of '%s' is not terminated",
                name.c_str());

    // Redefinition shadows the earlier body in place.
    if (Subroutine* prev = find_sub(subs, name))
    {
      diag_info(ctx, "split", colon, "Linker: '%s' redefined", name.c_str());
      prev->body = std::move(body);
    }
    else
    {
      Subroutine s;
      s.name = name;
      s.body = std::move(body);
      subs->push_back(std::move(s));
    }
  }
  return SPRIG_ERR(OK);
}

// ---------------------------------------------------------------------------
// Expand: <name> -> <name> call
// ---------------------------------------------------------------------------

void expand_calls(Code* code, const SubroutineTable& subs)
{
  Code out;
  out.reserve(code->size());
  for (const Item& it : *code)
  {
    out.push_back(it);
    if (it.kind == SPRIG_ITEM_SYMBOL && has_sub(subs, it.text))
      out.push_back(Item::make_op(Op::CALL));
  }
  code->swap(out);
}

// ---------------------------------------------------------------------------
// Link: optimize blocks, lay them out, resolve references to offsets
// ---------------------------------------------------------------------------

sprig_err link(Code main, SubroutineTable subs, Code* out, LocationTable* locations,
               const Context* ctx)
{
  // Offsets depend on the optimized length of everything before them.
  if (ctx->cfg.optimize)
  {
    if (sprig_err e = optimize(&main, ctx))
      return e;
  }
  *out = std::move(main);

  for (Subroutine& s : subs)
  {
    Location loc;
    loc.name = s.name;
    loc.offset = static_cast<int>(out->size());
    locations->push_back(loc);

    if (ctx->cfg.optimize)
    {
      if (sprig_err e = optimize(&s.body, ctx))
        return e;
    }
    out->insert(out->end(), s.body.begin(), s.body.end());
    diag_info(ctx, "link", loc.offset, "Linker: '%s' at offset %d", s.name.c_str(), loc.offset);
  }

  for (Item& it : *out)
  {
    if (it.kind != SPRIG_ITEM_SYMBOL)
      continue;
    if (const Location* loc = find_location(*locations, it.text))
      it = Item::make_int(loc->offset);
  }
  return SPRIG_ERR(OK);
}

// ---------------------------------------------------------------------------
// Materialize: token-shaped literals to native values
// ---------------------------------------------------------------------------

sprig_err materialize(const Code& code, Code* out, const Context* ctx)
{
  Code result;
  result.reserve(code.size());
  for (size_t i = 0; i < code.size(); i++)
  {
    const Item& it = code[i];
    switch (it.kind)
    {
      case SPRIG_ITEM_STR:
        result.push_back(Item::make_str(unquote(it.text)));
        continue;
      case SPRIG_ITEM_INT:
      case SPRIG_ITEM_FLOAT:
      case SPRIG_ITEM_BOOL:
        result.push_back(it);
        continue;
      case SPRIG_ITEM_OP:
      case SPRIG_ITEM_SYMBOL:
        break;
    }

    if (is_bool(it))
    {
      result.push_back(Item::make_bool(bool_value(it)));
      continue;
    }

    Op op;
    if (!as_op(it, &op))
    {
      return diag_fail(ctx, SPRIG_ERR(UnknownInstruction), "materialize", static_cast<int>(i),
                       "Unknown instruction: %s", format_item(it).c_str());
    }
    result.push_back(Item::make_op(op));
  }
  out->swap(result);
  return SPRIG_ERR(OK);
}

// ---------------------------------------------------------------------------
// Full pipeline
// ---------------------------------------------------------------------------

sprig_err compile(const Code& tokens, Code* out, const Context* ctx)
{
  Code main;
  SubroutineTable subs;
  if (sprig_err e = split(tokens, &main, &subs, ctx))
    return e;

  expand_calls(&main, subs);
  for (Subroutine& s : subs)
    expand_calls(&s.body, subs);

  // Main code comes first, so it must not fall through into a body.
  if (!subs.empty())
    main.push_back(Item::make_op(Op::EXIT));

  Code linked;
  LocationTable locations;
  if (sprig_err e = link(std::move(main), std::move(subs), &linked, &locations, ctx))
    return e;

  if (sprig_err e = validate(linked, ctx))
    return e;

  return materialize(linked, out, ctx);
}

}  // namespace sprig
