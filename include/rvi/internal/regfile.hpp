#pragma once
#include "rvi/hart_api.h"
#include "rvi/internal/hart.h"

/**
 * Core register file helpers used by the execute functions and the public
 * API wrappers.
 *  - 32 registers, x0 hard-wired to zero
 *  - Out-of-range indices reported as InvalidRegister (-3)
 */

rvi_err rvi_reg_read_core(const Hart *hart, rvi_u32 index, rvi_u32 *out);
rvi_err rvi_reg_write_core(Hart *hart, rvi_u32 index, rvi_u32 value);

/* Range check. Returns 0 or -3 (InvalidRegister). */
static inline rvi_err rvi_is_valid_reg(rvi_u32 index)
{
  return index < RVI_NUM_REGS ? 0 : -3;
}
