#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include "sprig/internal/code.hpp"
#include "sprig/item.h"

namespace sprig
{

/* ========================================================================= */
/* Construction and comparison                                               */
/* ========================================================================= */

Item Item::make_op(Op op)
{
  Item it;
  it.kind = SPRIG_ITEM_OP;
  it.op = op;
  return it;
}

Item Item::make_int(int64_t v)
{
  Item it;
  it.kind = SPRIG_ITEM_INT;
  it.i = v;
  return it;
}

Item Item::make_float(double v)
{
  Item it;
  it.kind = SPRIG_ITEM_FLOAT;
  it.f = v;
  return it;
}

Item Item::make_bool(bool v)
{
  Item it;
  it.kind = SPRIG_ITEM_BOOL;
  it.b = v;
  return it;
}

Item Item::make_str(const std::string& quoted)
{
  Item it;
  it.kind = SPRIG_ITEM_STR;
  it.text = quoted;
  return it;
}

Item Item::make_symbol(const std::string& name)
{
  Item it;
  it.kind = SPRIG_ITEM_SYMBOL;
  it.text = name;
  return it;
}

bool operator==(const Item& a, const Item& b)
{
  if (a.kind != b.kind)
    return false;
  switch (a.kind)
  {
    case SPRIG_ITEM_OP:
      return a.op == b.op;
    case SPRIG_ITEM_INT:
      return a.i == b.i;
    case SPRIG_ITEM_FLOAT:
      return a.f == b.f;
    case SPRIG_ITEM_BOOL:
      return a.b == b.b;
    case SPRIG_ITEM_STR:
    case SPRIG_ITEM_SYMBOL:
      return a.text == b.text;
  }
  return false;
}

bool operator!=(const Item& a, const Item& b)
{
  return !(a == b);
}

/* ========================================================================= */
/* Token classification                                                      */
/* ========================================================================= */

bool is_quoted(const std::string& text)
{
  if (text.size() < 2)
    return false;
  char q = text.front();
  return (q == '"' || q == '\'') && text.back() == q;
}

bool parse_int(const std::string& s, int64_t* out)
{
  size_t pos = 0;
  if (pos < s.size() && (s[pos] == '+' || s[pos] == '-'))
    pos++;
  if (pos == s.size())
    return false;
  for (size_t k = pos; k < s.size(); k++)
  {
    if (s[k] < '0' || s[k] > '9')
      return false;
  }

  errno = 0;
  long long v = strtoll(s.c_str(), nullptr, 10);
  if (errno == ERANGE)
    return false;
  *out = static_cast<int64_t>(v);
  return true;
}

static bool parse_float(const std::string& s, double* out)
{
  if (s.find_first_of("0123456789") == std::string::npos)
    return false;

  const char* begin = s.c_str();
  char* end = nullptr;
  double v = strtod(begin, &end);
  if (end == begin || *end != '\0')
    return false;
  *out = v;
  return true;
}

Item classify_token(const char* token)
{
  std::string text = token ? token : "";

  if (is_quoted(text))
    return Item::make_str(text);

  int64_t i;
  if (parse_int(text, &i))
    return Item::make_int(i);

  // Integers too wide for 64 bits land here as floats.
  double f;
  if (parse_float(text, &f))
    return Item::make_float(f);

  return Item::make_symbol(text);
}

/* ========================================================================= */
/* Formatting                                                                */
/* ========================================================================= */

std::string unquote(const std::string& text)
{
  if (!is_quoted(text))
    return text;
  return text.substr(1, text.size() - 2);
}

std::string quote(const std::string& raw)
{
  return "\"" + raw + "\"";
}

std::string format_float(double v)
{
  if (std::isnan(v))
    return "nan";
  if (std::isinf(v))
    return v < 0 ? "-inf" : "inf";

  char buf[32];
  for (int prec = 1; prec <= 17; prec++)
  {
    snprintf(buf, sizeof(buf), "%.*g", prec, v);
    if (strtod(buf, nullptr) == v)
      break;
  }

  std::string s = buf;
  if (s.find_first_of(".eE") == std::string::npos)
    s += ".0";
  return s;
}

std::string native_text(const Item& item)
{
  switch (item.kind)
  {
    case SPRIG_ITEM_INT:
      return std::to_string(item.i);
    case SPRIG_ITEM_FLOAT:
      return format_float(item.f);
    case SPRIG_ITEM_STR:
      return unquote(item.text);
    case SPRIG_ITEM_BOOL:
    case SPRIG_ITEM_OP:
    case SPRIG_ITEM_SYMBOL:
      if (is_bool(item))
        return bool_value(item) ? "true" : "false";
      return format_item(item);
  }
  return std::string();
}

std::string format_item(const Item& item)
{
  switch (item.kind)
  {
    case SPRIG_ITEM_OP:
      return mnemonic(item.op);
    case SPRIG_ITEM_INT:
      return std::to_string(item.i);
    case SPRIG_ITEM_FLOAT:
      return format_float(item.f);
    case SPRIG_ITEM_STR:
      return is_quoted(item.text) ? item.text : quote(item.text);
    case SPRIG_ITEM_BOOL:
      return item.b ? "true" : "false";
    case SPRIG_ITEM_SYMBOL:
      return item.text;
  }
  return std::string();
}

std::string format_code(const Code& code, size_t first, size_t count)
{
  std::string out;
  for (size_t k = first; k < first + count && k < code.size(); k++)
  {
    if (!out.empty())
      out += ' ';
    out += format_item(code[k]);
  }
  return out;
}

/* ========================================================================= */
/* C conversion                                                              */
/* ========================================================================= */

Item from_c(const SprigItem& item)
{
  switch (item.kind)
  {
    case SPRIG_ITEM_OP:
      return Item::make_op(static_cast<Op>(item.as.op));
    case SPRIG_ITEM_INT:
      return Item::make_int(item.as.i);
    case SPRIG_ITEM_FLOAT:
      return Item::make_float(item.as.f);
    case SPRIG_ITEM_BOOL:
      return Item::make_bool(item.as.b != 0);
    case SPRIG_ITEM_STR:
      return Item::make_str(item.text ? item.text : "");
    case SPRIG_ITEM_SYMBOL:
      return Item::make_symbol(item.text ? item.text : "");
  }
  return Item::make_symbol("");
}

}  // namespace sprig

extern "C" int sprig_item_format(const SprigItem* item, char* buf, size_t cap)
{
  if (!item)
    return 0;

  std::string s = sprig::format_item(sprig::from_c(*item));
  if (buf && cap > 0)
  {
    size_t len = s.size() < cap ? s.size() : cap - 1;
    memcpy(buf, s.data(), len);
    buf[len] = '\0';
  }
  return static_cast<int>(s.size());
}
