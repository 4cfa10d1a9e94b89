/**
 * @file diag.hpp
 * @brief sprig diagnostic handler C++ wrapper
 *
 * SPDX-License-Identifier: MIT OR Apache-2.0
 */

#pragma once

#include "sprig/compiler_api.h"
#include "sprig/diag.h"

namespace sprig
{

/**
 * @brief C++ wrapper for SprigDiagInfo
 */
using DiagInfo = SprigDiagInfo;

/**
 * @brief C++ wrapper for SprigDiagHandler
 */
using DiagHandler = SprigDiagHandler;

/**
 * @brief Install a diagnostic handler on a config
 *
 * @param cfg        Configuration to modify
 * @param handler    Diagnostic callback (nullptr to disable)
 * @param user_data  User data passed to handler
 */
inline void set_diag_handler(SprigConfig *cfg, DiagHandler handler, void *user_data = nullptr)
{
  cfg->diag = handler;
  cfg->diag_user = user_data;
}

}  // namespace sprig
