#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

#include "doctest.h"
#include "sprig/compiler_api.h"
#include "sprig/diag.hpp"
#include "sprig/errors.hpp"

// Test helper: records every diagnostic; strings are only valid inside the callback
struct Record
{
  SprigDiagLevel level;
  int error_code;
  int index;
  std::string stage;
  std::string message;
};

static std::vector<Record> g_records;
static void *g_user_data = nullptr;

static void record_handler(void *user_data, const SprigDiagInfo *info)
{
  g_user_data = user_data;
  if (info)
  {
    Record r;
    r.level = info->level;
    r.error_code = info->error_code;
    r.index = info->index;
    r.stage = info->stage ? info->stage : "";
    r.message = info->message ? info->message : "";
    g_records.push_back(r);
  }
}

static SprigConfig recording_config(void *user = nullptr)
{
  g_records.clear();
  g_user_data = nullptr;
  SprigConfig cfg;
  sprig_config_default(&cfg);
  sprig::set_diag_handler(&cfg, record_handler, user);
  return cfg;
}

TEST_CASE("Diagnostics: optimizer rewrites are traced")
{
  int user_value = 42;
  SprigConfig cfg = recording_config(&user_value);

  const char *toks[] = {"2", "3", "+", "7", "drop"};
  SprigProgram prog;
  REQUIRE(sprig_optimize(toks, 5, &cfg, &prog, nullptr, 0) == SPRIG_ERR_OK);
  sprig_program_free(&prog);

  CHECK(g_user_data == &user_value);
  REQUIRE(g_records.size() == 2);
  CHECK(g_records[0].level == SPRIG_DIAG_INFO);
  CHECK(g_records[0].error_code == 0);
  CHECK(g_records[0].stage == "optimize");
  CHECK(g_records[0].index == 0);
  CHECK(g_records[0].message == "Optimizer: Constant-folded 2 3 + to 5");
  CHECK(g_records[1].index == 1);
  CHECK(g_records[1].message == "Optimizer: Removed dead code 7 drop");
}

TEST_CASE("Diagnostics: rewrite messages")
{
  SprigConfig cfg = recording_config();

  const char *toks[] = {"\"9\"", "int", "1", "2", "swap", "0", "bool", "4", "str"};
  SprigProgram prog;
  REQUIRE(sprig_optimize(toks, 9, &cfg, &prog, nullptr, 0) == SPRIG_ERR_OK);
  sprig_program_free(&prog);

  REQUIRE(g_records.size() == 4);
  CHECK(g_records[0].message == "Optimizer: Translated \"9\" int to 9");
  CHECK(g_records[1].message == "Optimizer: Translated 1 2 swap to 2 1");
  CHECK(g_records[2].message == "Optimizer: Translated 0 bool to false");
  CHECK(g_records[3].message == "Optimizer: Translated 4 str to \"4\"");
}

TEST_CASE("Diagnostics: linker reports subroutine offsets")
{
  SprigConfig cfg = recording_config();

  const char *toks[] = {":", "a", "1", ";", ":", "b", "2", ";", "a", "b"};
  SprigProgram prog;
  REQUIRE(sprig_compile(toks, 10, &cfg, &prog, nullptr, 0) == SPRIG_ERR_OK);
  sprig_program_free(&prog);

  std::vector<std::string> link_msgs;
  for (const Record &r : g_records)
  {
    if (r.stage == "link")
      link_msgs.push_back(r.message);
  }
  REQUIRE(link_msgs.size() == 2);
  CHECK(link_msgs[0] == "Linker: 'a' at offset 5");
  CHECK(link_msgs[1] == "Linker: 'b' at offset 7");
}

TEST_CASE("Diagnostics: a failed compile emits one error record")
{
  SprigConfig cfg = recording_config();

  char err[128];
  const char *toks[] = {"1", "2", "mystery"};
  SprigProgram prog;
  CHECK(sprig_compile(toks, 3, &cfg, &prog, err, sizeof(err)) ==
        static_cast<sprig_err>(Err::UnknownInstruction));

  int errors = 0;
  const Record *last = nullptr;
  for (const Record &r : g_records)
  {
    if (r.level == SPRIG_DIAG_ERROR)
    {
      errors++;
      last = &r;
    }
  }
  REQUIRE(errors == 1);
  CHECK(last->error_code == static_cast<int>(Err::UnknownInstruction));
  CHECK(last->stage == "validate");
  CHECK(last->index == 2);
  CHECK(last->message == err);
}

TEST_CASE("Diagnostics: split errors carry the name index")
{
  SprigConfig cfg = recording_config();

  const char *toks[] = {"1", ":", "swap", "2", ";"};
  SprigProgram prog;
  CHECK(sprig_compile(toks, 5, &cfg, &prog, nullptr, 0) ==
        static_cast<sprig_err>(Err::ReservedWordName));
  REQUIRE(g_records.size() == 1);
  CHECK(g_records[0].stage == "split");
  CHECK(g_records[0].index == 2);
  CHECK(g_records[0].message == "Cannot shadow internal word definition 'swap'.");
}

TEST_CASE("Diagnostics: error buffer is truncated to its capacity")
{
  char err[8];
  const char *toks[] = {"mystery"};
  SprigProgram prog;
  CHECK(sprig_compile(toks, 1, nullptr, &prog, err, sizeof(err)) ==
        static_cast<sprig_err>(Err::UnknownInstruction));
  CHECK(strlen(err) == 7);
  CHECK(std::string(err) == "Unknown");
}

TEST_CASE("Diagnostics: handler can be removed")
{
  SprigConfig cfg = recording_config();
  sprig::set_diag_handler(&cfg, nullptr);

  const char *toks[] = {"2", "3", "+"};
  SprigProgram prog;
  REQUIRE(sprig_optimize(toks, 3, &cfg, &prog, nullptr, 0) == SPRIG_ERR_OK);
  sprig_program_free(&prog);
  CHECK(g_records.empty());
}

TEST_CASE("Diagnostics: verbose mode prints without a handler")
{
  SprigConfig cfg;
  sprig_config_default(&cfg);
  cfg.verbose = 1;

  // Output goes to stdout; only check that compilation is unaffected
  const char *toks[] = {"1", "2", "+", "bad"};
  SprigProgram prog;
  CHECK(sprig_compile(toks, 4, &cfg, &prog, nullptr, 0) ==
        static_cast<sprig_err>(Err::UnknownInstruction));
  CHECK(prog.items == nullptr);
  fflush(stdout);
}

TEST_CASE("Error strings")
{
  CHECK(std::string(err_str(Err::DivByZero)) == "division by zero");
  CHECK(std::string(sprig_err_str(SPRIG_ERR_StackUnderflow)) == "stack underflow");
  CHECK(std::string(sprig_err_str(-999)) == "unknown error");
}
