#include "rvi/panic.h"

#include <inttypes.h>
#include <stdio.h>
#include <string.h>

#include "rvi/errors.hpp"
#include "rvi/hart_api.h"
#include "rvi/internal/hart.h"  // For Hart struct definition
#include "rvi/opcodes.h"
#include "rvi/panic.hpp"

extern "C"
{
  void hart_set_panic_handler(struct Hart *hart, RviPanicHandler handler, void *user_data)
  {
    if (!hart)
      return;

    hart->panic_handler = handler;
    hart->panic_user_data = user_data;
  }

  rvi_err hart_panic(struct Hart *hart, rvi_err error_code)
  {
    using namespace rvi;

    if (!hart)
      return error_code;

    // Collect panic information
    RviPanicInfo info;
    ::memset(&info, 0, sizeof(info));
    info.error_code = error_code;
    info.last_op = hart->last_op;
    hart_reg_copy_to_array(hart, info.regs, RVI_NUM_REGS);

    for (int i = 0; i < RVI_NUM_REGS; ++i)
    {
      if (info.regs[i] != 0)
        ++info.nonzero_count;
    }

    // Output diagnostic information
    printf("\n");
    printf("========== RVI PANIC ==========\n");

    // Error information
    Err err = static_cast<Err>(error_code);
    printf("Error: %s (code=%d)\n", err_str(err), error_code);

    // Last executed operation
    const char *op_name = rvi_op_name(info.last_op);
    printf("Last op: %s\n", op_name ? op_name : "none");

    // Register file (x0 is always zero and never listed)
    printf("Registers (non-zero): [%d]\n", info.nonzero_count);
    for (int i = 1; i < RVI_NUM_REGS; ++i)
    {
      if (info.regs[i] != 0)
      {
        printf("  x%d = 0x%08" PRIX32 "\n", i, info.regs[i]);
      }
    }

    printf("===============================\n");
    printf("\n");

    // Call custom panic handler if registered
    if (hart->panic_handler)
    {
      hart->panic_handler(hart->panic_user_data, &info);
    }

    return error_code;
  }

}  // extern "C"
