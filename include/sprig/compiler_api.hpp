/**
 * @file compiler_api.hpp
 * @brief sprig C++ API wrapper
 *
 * SPDX-License-Identifier: MIT OR Apache-2.0
 */

#pragma once

#include <cstddef>

#include "sprig/compiler_api.h"

namespace sprig
{

/**
 * @brief Owning wrapper around SprigProgram
 *
 * Frees the held program on destruction and before every new
 * compile()/optimize().
 */
class Program
{
public:
  Program() : prog_{nullptr, 0, nullptr} {}
  ~Program()
  {
    sprig_program_free(&prog_);
  }

  Program(const Program &) = delete;
  Program &operator=(const Program &) = delete;

  /**
   * @brief Compile tokens into a linked program (see sprig_compile)
   * @param tokens   Token strings
   * @param count    Number of tokens
   * @param cfg      Configuration, nullptr for defaults
   * @param err      Optional error message buffer
   * @param err_cap  Capacity of err
   * @return 0 on success, negative error code on failure
   */
  sprig_err compile(const char *const *tokens, int count, const SprigConfig *cfg = nullptr,
                    char *err = nullptr, size_t err_cap = 0)
  {
    sprig_program_free(&prog_);
    return sprig_compile(tokens, count, cfg, &prog_, err, err_cap);
  }

  /**
   * @brief Constant-fold tokens without linking (see sprig_optimize)
   */
  sprig_err optimize(const char *const *tokens, int count, const SprigConfig *cfg = nullptr,
                     char *err = nullptr, size_t err_cap = 0)
  {
    sprig_program_free(&prog_);
    return sprig_optimize(tokens, count, cfg, &prog_, err, err_cap);
  }

  int size() const
  {
    return prog_.count;
  }

  const SprigItem &operator[](int i) const
  {
    return prog_.items[i];
  }

  const SprigItem *data() const
  {
    return prog_.items;
  }

private:
  SprigProgram prog_;
};

}  // namespace sprig
