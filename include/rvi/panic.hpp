/**
 * @file panic.hpp
 * @brief C++ aliases for the hart panic hook
 *
 * hart_panic() prints the register dump to stdout and then forwards the
 * same data (error code, last OP-IMM tag, non-zero count, x0..x31) to the
 * handler installed here.
 *
 * SPDX-License-Identifier: MIT OR Apache-2.0
 */

#pragma once

#include "rvi/panic.h"

namespace rvi
{

/** Diagnostics snapshot; regs[0] is always zero. */
using PanicInfo = RviPanicInfo;

/** Called after the dump is printed; NULL disables the hook. */
using PanicHandler = RviPanicHandler;

/**
 * @brief Install the panic hook for one hart.
 *
 * The handler survives hart_reset().
 *
 * @param hart       Hart instance (NULL is ignored)
 * @param handler    Callback, or nullptr to disable
 * @param user_data  Passed back unchanged as the first argument
 */
inline void set_panic_handler(struct ::Hart *hart, PanicHandler handler,
                              void *user_data = nullptr)
{
  hart_set_panic_handler(hart, handler, user_data);
}

}  // namespace rvi
