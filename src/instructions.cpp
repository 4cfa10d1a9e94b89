#include <cstring>

#include "sprig/errors.hpp"
#include "sprig/internal/code.hpp"
#include "sprig/item.h"
#include "sprig/opcodes.hpp"

namespace sprig
{

/* ========================================================================= */
/* Instruction table queries                                                 */
/* ========================================================================= */

// Linear search; the table has a few dozen entries.
static const InstructionEntry* find_entry(const char* name)
{
  for (int i = 0; i < kInstructionCount; i++)
  {
    if (strcmp(kInstructionTable[i].mnemonic, name) == 0)
      return &kInstructionTable[i];
  }
  return nullptr;
}

static const InstructionEntry* find_entry(Op op)
{
  for (int i = 0; i < kInstructionCount; i++)
  {
    if (kInstructionTable[i].op == op)
      return &kInstructionTable[i];
  }
  return nullptr;
}

sprig_err lookup(const std::string& name, Op* out)
{
  const InstructionEntry* e = find_entry(name.c_str());
  if (!e)
    return SPRIG_ERR(UnknownInstruction);
  if (out)
    *out = e->op;
  return SPRIG_ERR(OK);
}

const char* mnemonic(Op op)
{
  const InstructionEntry* e = find_entry(op);
  return e ? e->mnemonic : "?";
}

OpClass op_class(Op op)
{
  const InstructionEntry* e = find_entry(op);
  return e ? e->cls : OpClass::Control;
}

bool is_reserved(const std::string& name)
{
  if (name == kWordOpen || name == kWordClose)
    return true;
  return lookup(name, nullptr) == SPRIG_ERR(OK);
}

bool as_op(const Item& item, Op* out)
{
  switch (item.kind)
  {
    case SPRIG_ITEM_OP:
      *out = item.op;
      return true;
    case SPRIG_ITEM_SYMBOL:
      return lookup(item.text, out) == SPRIG_ERR(OK);
    case SPRIG_ITEM_INT:
    case SPRIG_ITEM_FLOAT:
    case SPRIG_ITEM_STR:
    case SPRIG_ITEM_BOOL:
      return false;
  }
  return false;
}

bool is_op(const Item& item, Op op)
{
  Op found;
  return as_op(item, &found) && found == op;
}

/* ========================================================================= */
/* Literal classification                                                    */
/* ========================================================================= */

bool is_bool(const Item& item)
{
  if (item.kind == SPRIG_ITEM_BOOL)
    return true;
  return is_op(item, Op::LIT_TRUE) || is_op(item, Op::LIT_FALSE);
}

bool bool_value(const Item& item)
{
  if (item.kind == SPRIG_ITEM_BOOL)
    return item.b;
  return is_op(item, Op::LIT_TRUE);
}

bool is_string(const Item& item)
{
  return item.kind == SPRIG_ITEM_STR;
}

bool is_number(const Item& item)
{
  return item.kind == SPRIG_ITEM_INT || item.kind == SPRIG_ITEM_FLOAT;
}

bool is_constant(const Item& item)
{
  switch (item.kind)
  {
    case SPRIG_ITEM_INT:
    case SPRIG_ITEM_FLOAT:
    case SPRIG_ITEM_STR:
    case SPRIG_ITEM_BOOL:
      return true;
    case SPRIG_ITEM_OP:
    case SPRIG_ITEM_SYMBOL:
      return is_bool(item);
  }
  return false;
}

bool truthy(const Item& item)
{
  switch (item.kind)
  {
    case SPRIG_ITEM_INT:
      return item.i != 0;
    case SPRIG_ITEM_FLOAT:
      return item.f != 0.0;
    case SPRIG_ITEM_STR:
      return !unquote(item.text).empty();
    case SPRIG_ITEM_BOOL:
    case SPRIG_ITEM_OP:
    case SPRIG_ITEM_SYMBOL:
      return bool_value(item);
  }
  return false;
}

}  // namespace sprig

/* ========================================================================= */
/* C API                                                                     */
/* ========================================================================= */

extern "C" sprig_err sprig_lookup(const char* name, sprig_op_t* out)
{
  if (!name)
    return SPRIG_ERR(InvalidArg);

  sprig::Op op;
  if (sprig_err e = sprig::lookup(name, &op))
    return e;
  if (out)
    *out = static_cast<sprig_op_t>(op);
  return SPRIG_ERR(OK);
}

extern "C" int sprig_item_is_constant(const SprigItem* item)
{
  return item && sprig::is_constant(sprig::from_c(*item));
}

extern "C" int sprig_item_is_string(const SprigItem* item)
{
  return item && item->kind == SPRIG_ITEM_STR;
}

extern "C" int sprig_item_is_number(const SprigItem* item)
{
  return item && (item->kind == SPRIG_ITEM_INT || item->kind == SPRIG_ITEM_FLOAT);
}

extern "C" int sprig_item_is_bool(const SprigItem* item)
{
  return item && sprig::is_bool(sprig::from_c(*item));
}
