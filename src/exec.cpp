#include <cstdint>

#include "rvi/errors.hpp"
#include "rvi/hart_api.h"
#include "rvi/imm.h"
#include "rvi/internal/hart.h"
#include "rvi/internal/regfile.hpp"
#include "rvi/opcodes.hpp"

// SLTI and SRAI rely on two's-complement u32 -> i32 conversion and an
// arithmetic right shift of negative values (implementation-defined before C++20).
static_assert((-1 >> 1) == -1, "arithmetic right shift required");
static_assert((int32_t)UINT32_C(0x80000000) == INT32_MIN, "two's-complement conversion required");

/* ============================ Shift amount =============================== */

static inline rvi_err shift_amount(const Hart* hart, rvi_u32 imm, rvi_u32* out)
{
  if (hart->shamt_policy == RVI_SHAMT_STRICT && imm > 31u)
    return RVI_ERR(ShamtOutOfRange);
  *out = imm & 0x1Fu;
  return RVI_ERR(OK);
}

/* ======================== OP-IMM execute core ============================ */

/*
 * Reads rs1, computes the result and writes rd. Both indices are checked
 * before anything is written, so an error leaves the hart untouched.
 */
static rvi_err exec_core(Hart* hart, rvi::Op op, rvi_u32 rd, rvi_u32 rs1, rvi_u32 imm)
{
  if (rvi_err e = rvi_is_valid_reg(rd))
    return e;

  rvi_u32 a;
  if (rvi_err e = rvi_reg_read_core(hart, rs1, &a))
    return e;

  rvi_u32 result;
  switch (op)
  {
    /* -------- Arithmetic -------- */
    case rvi::Op::ADDI:
      // Unsigned addition: signed overflow wraps modulo 2^32
      result = a + imm;
      break;

    /* -------- Comparison -------- */
    case rvi::Op::SLTI:
      result = ((rvi_i32)a < (rvi_i32)imm) ? 1u : 0u;
      break;

    case rvi::Op::SLTIU:
      result = (a < imm) ? 1u : 0u;
      break;

    /* -------- Bitwise -------- */
    case rvi::Op::XORI:
      result = a ^ imm;
      break;

    case rvi::Op::ORI:
      result = a | imm;
      break;

    case rvi::Op::ANDI:
      result = a & imm;
      break;

    /* -------- Shifts -------- */
    case rvi::Op::SLLI:
    {
      rvi_u32 shamt;
      if (rvi_err e = shift_amount(hart, imm, &shamt))
        return e;
      result = a << shamt;
      break;
    }

    case rvi::Op::SRLI:
    {
      rvi_u32 shamt;
      if (rvi_err e = shift_amount(hart, imm, &shamt))
        return e;
      result = a >> shamt;
      break;
    }

    case rvi::Op::SRAI:
    {
      rvi_u32 shamt;
      if (rvi_err e = shift_amount(hart, imm, &shamt))
        return e;
      result = (rvi_u32)((rvi_i32)a >> shamt);
      break;
    }

    default:
      return RVI_ERR(UnknownOp);
  }

  if (rvi_err e = rvi_reg_write_core(hart, rd, result))
    return e;

  hart->last_op = static_cast<int>(op);
  return RVI_ERR(OK);
}

/* =========================== Public API entry ============================ */

extern "C" rvi_err hart_exec(Hart* hart, int op, rvi_u32 rd, rvi_u32 rs1, rvi_u32 imm)
{
  if (!hart)
    return RVI_ERR(InvalidArg);

  rvi_err e;
  if (op < 0 || op >= rvi::kOpCount)
    e = RVI_ERR(UnknownOp);
  else
    e = exec_core(hart, static_cast<rvi::Op>(op), rd, rs1, imm);

  hart->last_err = e;
  return e;
}

extern "C" rvi_err hart_exec_name(Hart* hart, const char* mnemonic, rvi_u32 rd, rvi_u32 rs1,
                                  rvi_u32 imm)
{
  if (!hart || !mnemonic)
    return RVI_ERR(InvalidArg);

  int op = rvi_find_op(mnemonic);
  if (op < 0)
    return hart->last_err = RVI_ERR(UnknownOp);

  return hart_exec(hart, op, rd, rs1, imm);
}

extern "C" rvi_err hart_addi(Hart* hart, rvi_u32 rd, rvi_u32 rs1, rvi_u32 imm)
{
  return hart_exec(hart, RVI_OP_ADDI, rd, rs1, imm);
}

extern "C" rvi_err hart_slti(Hart* hart, rvi_u32 rd, rvi_u32 rs1, rvi_u32 imm)
{
  return hart_exec(hart, RVI_OP_SLTI, rd, rs1, imm);
}

extern "C" rvi_err hart_sltiu(Hart* hart, rvi_u32 rd, rvi_u32 rs1, rvi_u32 imm)
{
  return hart_exec(hart, RVI_OP_SLTIU, rd, rs1, imm);
}

extern "C" rvi_err hart_andi(Hart* hart, rvi_u32 rd, rvi_u32 rs1, rvi_u32 imm)
{
  return hart_exec(hart, RVI_OP_ANDI, rd, rs1, imm);
}

extern "C" rvi_err hart_ori(Hart* hart, rvi_u32 rd, rvi_u32 rs1, rvi_u32 imm)
{
  return hart_exec(hart, RVI_OP_ORI, rd, rs1, imm);
}

extern "C" rvi_err hart_xori(Hart* hart, rvi_u32 rd, rvi_u32 rs1, rvi_u32 imm)
{
  return hart_exec(hart, RVI_OP_XORI, rd, rs1, imm);
}

extern "C" rvi_err hart_slli(Hart* hart, rvi_u32 rd, rvi_u32 rs1, rvi_u32 shamt)
{
  return hart_exec(hart, RVI_OP_SLLI, rd, rs1, shamt);
}

extern "C" rvi_err hart_srli(Hart* hart, rvi_u32 rd, rvi_u32 rs1, rvi_u32 shamt)
{
  return hart_exec(hart, RVI_OP_SRLI, rd, rs1, shamt);
}

extern "C" rvi_err hart_srai(Hart* hart, rvi_u32 rd, rvi_u32 rs1, rvi_u32 shamt)
{
  return hart_exec(hart, RVI_OP_SRAI, rd, rs1, shamt);
}

/* ========================= Pseudo-instructions =========================== */

extern "C" rvi_err hart_nop(Hart* hart)
{
  return hart_addi(hart, 0, 0, 0);
}

extern "C" rvi_err hart_mv(Hart* hart, rvi_u32 rd, rvi_u32 rs)
{
  return hart_addi(hart, rd, rs, 0);
}

extern "C" rvi_err hart_not(Hart* hart, rvi_u32 rd, rvi_u32 rs)
{
  return hart_xori(hart, rd, rs, rvi_sign_extend12(0xFFFu));
}

extern "C" rvi_err hart_seqz(Hart* hart, rvi_u32 rd, rvi_u32 rs)
{
  return hart_sltiu(hart, rd, rs, 1u);
}

extern "C" rvi_err hart_li(Hart* hart, rvi_u32 rd, rvi_i32 value)
{
  if (!hart)
    return RVI_ERR(InvalidArg);
  if (!rvi_imm12_fits(value))
    return hart->last_err = RVI_ERR(ImmOutOfRange);

  return hart_addi(hart, rd, 0, (rvi_u32)value);
}
