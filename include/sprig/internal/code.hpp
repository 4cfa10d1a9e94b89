#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "sprig/errors.h"
#include "sprig/item.h"
#include "sprig/opcodes.hpp"

namespace sprig
{

/**
 * @brief Internal code item (owning counterpart of SprigItem).
 *
 * Only the field selected by kind is meaningful; the others keep their
 * default values so that memberwise comparison is exact.
 */
struct Item
{
  SprigItemKind kind = SPRIG_ITEM_SYMBOL;
  Op op = Op::NOP;
  int64_t i = 0;
  double f = 0.0;
  bool b = false;
  std::string text; /**< STR (quoted until materialization) / SYMBOL name */

  static Item make_op(Op op);
  static Item make_int(int64_t v);
  static Item make_float(double v);
  static Item make_bool(bool v);
  static Item make_str(const std::string& quoted);
  static Item make_symbol(const std::string& name);
};

bool operator==(const Item& a, const Item& b);
bool operator!=(const Item& a, const Item& b);

using Code = std::vector<Item>;

/* ---------------------------- Instruction set ---------------------------- */

/** Mnemonic lookup. Returns 0 or SPRIG_ERR(UnknownInstruction). */
sprig_err lookup(const std::string& name, Op* out);

const char* mnemonic(Op op);
OpClass op_class(Op op);

/** True if name is a mnemonic or a subroutine delimiter. */
bool is_reserved(const std::string& name);

/** Instruction carried by an OP item or a SYMBOL naming a mnemonic. */
bool as_op(const Item& item, Op* out);
bool is_op(const Item& item, Op op);

/* ----------------------------- Classification ---------------------------- */

bool is_constant(const Item& item);
bool is_string(const Item& item);
bool is_number(const Item& item);
bool is_bool(const Item& item);

/** Value of a boolean literal (keyword or native). Requires is_bool(). */
bool bool_value(const Item& item);

/** Truthiness of a constant's unquoted value. Requires is_constant(). */
bool truthy(const Item& item);

/** Classify one raw token (INT, FLOAT, STR or SYMBOL). */
Item classify_token(const char* token);

/** Strict base-10 integer parse of the whole string. */
bool parse_int(const std::string& s, int64_t* out);

/* ------------------------------- Formatting ------------------------------ */

bool is_quoted(const std::string& text);
std::string unquote(const std::string& text);
std::string quote(const std::string& raw);

/** Shortest text that reads back as the same double ("2.0", "0.1"). */
std::string format_float(double v);

/** Text a to-str cast produces for a constant, without quotes. */
std::string native_text(const Item& item);

/** Source form, as sprig_item_format() renders it. */
std::string format_item(const Item& item);
std::string format_code(const Code& code, size_t first, size_t count);

/* ------------------------------ C conversion ----------------------------- */

Item from_c(const SprigItem& item);

}  // namespace sprig
