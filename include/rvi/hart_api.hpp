/**
 * @file hart_api.hpp
 * @brief RVI C++ API wrapper
 *
 * SPDX-License-Identifier: MIT OR Apache-2.0
 */

#pragma once

#include "rvi/hart_api.h"
#include "rvi/opcodes.hpp"

namespace rvi
{

/**
 * @brief C++ wrapper for HartConfig
 */
using Config = HartConfig;

/**
 * @brief Execute one operation by tag (C++ wrapper)
 *
 * @param hart  Hart instance
 * @param op    Operation
 * @param rd    Destination register index
 * @param rs1   Source register index
 * @param imm   Immediate (already sign-extended) or shift amount
 * @return 0 on success, negative rvi_err on failure
 */
inline rvi_err exec(struct ::Hart *hart, Op op, rvi_u32 rd, rvi_u32 rs1, rvi_u32 imm)
{
  return hart_exec(hart, static_cast<int>(op), rd, rs1, imm);
}

/**
 * @brief C++ wrapper for register accessors
 */
class Regs
{
public:
  /**
   * @brief Read a register
   * @param hart   Hart instance
   * @param index  Register index
   * @return Register value, or 0 if the index is invalid
   */
  static rvi_u32 get(struct ::Hart *hart, rvi_u32 index)
  {
    rvi_u32 v = 0;
    if (hart_reg_read(hart, index, &v) != 0)
      return 0;
    return v;
  }

  /**
   * @brief Write a register
   * @param hart   Hart instance
   * @param index  Register index
   * @param value  Value to store
   * @return 0 on success, negative rvi_err on failure
   */
  static rvi_err set(struct ::Hart *hart, rvi_u32 index, rvi_u32 value)
  {
    return hart_reg_write(hart, index, value);
  }
};

}  // namespace rvi
