#include "rvi/imm.h"

extern "C" rvi_u32 rvi_sign_extend12(rvi_u32 raw)
{
  return rvi_sign_extend(raw, 12);
}

extern "C" rvi_u32 rvi_sign_extend(rvi_u32 value, int bits)
{
  if (bits <= 0 || bits >= 32)
    return value;

  const rvi_u32 mask = (1u << bits) - 1u;
  const rvi_u32 sign = 1u << (bits - 1);
  value &= mask;
  // (v ^ sign) - sign copies bit (bits - 1) into every higher bit
  return (value ^ sign) - sign;
}

extern "C" bool rvi_imm12_fits(rvi_i32 value)
{
  return value >= -2048 && value <= 2047;
}
