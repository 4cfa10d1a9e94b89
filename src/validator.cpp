#include "sprig/errors.hpp"
#include "sprig/internal/code.hpp"
#include "sprig/internal/compiler.hpp"
#include "sprig/internal/context.hpp"
#include "sprig/opcodes.hpp"

namespace sprig
{

static const char* const kStage = "validate";

static bool is_logic_op(const Item& item)
{
  Op op;
  return as_op(item, &op) && op_class(op) == OpClass::Logic;
}

sprig_err validate(const Code& code, const Context* ctx)
{
  for (size_t i = 0; i < code.size(); i++)
  {
    const Item& a = code[i];
    const Item* b = (i + 1 < code.size()) ? &code[i + 1] : nullptr;
    const int idx = static_cast<int>(i);

    // Does the instruction exist?
    Op op;
    if (!is_constant(a) && !as_op(a, &op))
    {
      return diag_fail(ctx, SPRIG_ERR(UnknownInstruction), kStage, idx,
                       "Unknown instruction (index %d): %s", idx, format_item(a).c_str());
    }

    if (!b)
      continue;

    // Rejected even when the string is all digits; see DESIGN.md.
    if (is_string(a) && is_op(*b, Op::TO_INT))
    {
      return diag_fail(ctx, SPRIG_ERR(StringToIntCast), kStage, idx,
                       "Cannot convert string to integer (index %d): %s",
                       idx, format_code(code, i, 2).c_str());
    }

    if (is_constant(a) && !is_bool(a) && is_logic_op(*b))
    {
      return diag_fail(ctx, SPRIG_ERR(NonBoolLogicOperand), kStage, idx,
                       "Can only use boolean operators on booleans (index %d): %s",
                       idx, format_code(code, i, 2).c_str());
    }
  }
  return SPRIG_ERR(OK);
}

}  // namespace sprig
