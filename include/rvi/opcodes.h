#pragma once
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /** @file
   *  @brief RV32I OP-IMM operation tags for C.
   *
   *  Tags are internal to this library and are not the instruction
   *  encoding's funct3 values. Keep numeric values stable once published.
   */

  typedef enum rvi_op_t
  {
#define OP(name, val, _) RVI_OP_##name = val,
#include "rvi/opcodes.def"
#undef OP
  } rvi_op_t;

  /**
   * @brief Look an operation up by mnemonic (case-insensitive).
   * @param name  Mnemonic such as "addi" or "SRAI".
   * @return Operation tag, or -1 if not found.
   */
  int rvi_find_op(const char *name);

  /**
   * @brief Get the upper-case mnemonic of an operation tag.
   * @return Static string, or NULL for an unknown tag.
   */
  const char *rvi_op_name(int op);

#ifdef __cplusplus
}  // extern "C"
#endif
