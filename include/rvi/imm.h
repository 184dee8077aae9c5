#pragma once
#include <stdbool.h>

#include "rvi/hart_api.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /**
   * @file imm.h
   * @brief Immediate sign-extension helpers
   *
   * The execute functions take immediates as full 32-bit values. A driver
   * decoding I-type instructions extends the 12-bit field with these helpers
   * before calling hart_exec().
   */

  /**
   * @brief Sign-extend a 12-bit immediate field.
   *
   * Bit 11 is replicated into bits 12..31. Bits 12..31 of the input are
   * ignored.
   *
   * @param raw  Value whose low 12 bits hold the field.
   * @return 32-bit sign-extended immediate.
   */
  rvi_u32 rvi_sign_extend12(rvi_u32 raw);

  /**
   * @brief Sign-extend the low `bits` bits of a value.
   *
   * @param value  Value whose low `bits` bits hold the field.
   * @param bits   Field width (1..32). Other widths return value unchanged.
   * @return 32-bit sign-extended value.
   */
  rvi_u32 rvi_sign_extend(rvi_u32 value, int bits);

  /**
   * @brief Check whether a value is encodable as a 12-bit signed immediate.
   */
  bool rvi_imm12_fits(rvi_i32 value);

#ifdef __cplusplus
}
#endif
