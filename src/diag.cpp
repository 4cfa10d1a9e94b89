#include <cstdarg>
#include <cstdio>
#include <cstring>

#include "sprig/compiler_api.h"
#include "sprig/diag.h"
#include "sprig/errors.hpp"
#include "sprig/internal/context.hpp"

namespace sprig
{

Context make_context(const SprigConfig* cfg, char* err, size_t err_cap)
{
  Context ctx;
  if (cfg)
    ctx.cfg = *cfg;
  else
    sprig_config_default(&ctx.cfg);
  ctx.err = err;
  ctx.err_cap = err_cap;
  if (err && err_cap > 0)
    err[0] = '\0';
  return ctx;
}

// Deliver a record to the handler, or print it when verbose.
static void dispatch(const Context* ctx, const SprigDiagInfo* info)
{
  if (ctx->cfg.diag)
  {
    ctx->cfg.diag(ctx->cfg.diag_user, info);
    return;
  }
  if (!ctx->cfg.verbose)
    return;

  if (info->level == SPRIG_DIAG_ERROR)
  {
    Err err = static_cast<Err>(info->error_code);
    printf("sprig: error: %s (code=%d, stage=%s, index=%d)\n", err_str(err),
           static_cast<int>(info->error_code), info->stage, static_cast<int>(info->index));
    printf("sprig:   %s\n", info->message);
  }
  else
  {
    printf("sprig: %s\n", info->message);
  }
}

void diag_info(const Context* ctx, const char* stage, int index, const char* fmt, ...)
{
  if (!ctx->cfg.diag && !ctx->cfg.verbose)
    return;

  char msg[512];
  va_list ap;
  va_start(ap, fmt);
  vsnprintf(msg, sizeof(msg), fmt, ap);
  va_end(ap);

  SprigDiagInfo info;
  info.level = SPRIG_DIAG_INFO;
  info.error_code = 0;
  info.index = index;
  info.stage = stage;
  info.message = msg;
  dispatch(ctx, &info);
}

sprig_err diag_fail(const Context* ctx, sprig_err code, const char* stage, int index,
                    const char* fmt, ...)
{
  char msg[512];
  va_list ap;
  va_start(ap, fmt);
  vsnprintf(msg, sizeof(msg), fmt, ap);
  va_end(ap);

  if (ctx->err && ctx->err_cap > 0)
  {
    size_t len = strlen(msg);
    if (len >= ctx->err_cap)
      len = ctx->err_cap - 1;
    memcpy(ctx->err, msg, len);
    ctx->err[len] = '\0';
  }

  SprigDiagInfo info;
  info.level = SPRIG_DIAG_ERROR;
  info.error_code = code;
  info.index = index;
  info.stage = stage;
  info.message = msg;
  dispatch(ctx, &info);

  return code;
}

}  // namespace sprig
