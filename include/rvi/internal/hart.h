#pragma once
#include <stdint.h>

#include "rvi/hart_api.h"
#include "rvi/panic.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /**
   * @brief Internal hart structure (not part of the public API).
   *        Visible only for unit tests or tightly coupled components.
   *
   * `Hart h{}; hart_reset(&h);` gives a usable default hart on the stack.
   */
  typedef struct Hart
  {
    rvi_u32 x[RVI_NUM_REGS]; /**< Integer registers; x[0] is never written */

    /* Execution state */
    int last_err; /**< Last error code (0 = OK) */
    int last_op;  /**< Last executed operation tag (-1 = none) */

    /* Configuration */
    RviShamtPolicy shamt_policy;

    /* Panic handler */
    RviPanicHandler panic_handler;
    void *panic_user_data;
  } Hart;

#ifdef __cplusplus
} /* extern "C" */
#endif
