#pragma once

/**
 * @file errors.h
 * @brief RVI error codes for C
 *
 * C-compatible error code definitions generated from errors.def
 */

#ifdef __cplusplus
extern "C"
{
#endif

  /* Generate error code constants from errors.def */
#define ERR(name, val, msg) static const int RVI_ERR_##name = val;
#include "rvi/errors.def"
#undef ERR

  /**
   * @brief Get a human-readable message for an error code.
   * @return Static string, "unknown error" for codes not in errors.def.
   */
  const char *rvi_err_str(int code);

#ifdef __cplusplus
}
#endif
