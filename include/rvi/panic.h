#pragma once
#include <stdint.h>

#include "rvi/hart_api.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /**
   * @brief Hart panic diagnostic information
   *
   * Structure holding diagnostic information when a hart enters an error
   * state. Collected by hart_panic() and used for diagnostic output.
   */
  typedef struct RviPanicInfo
  {
    int32_t error_code;           /**< Error code (Err enumeration value) */
    int32_t last_op;              /**< Last executed operation tag, -1 if none */
    uint8_t nonzero_count;        /**< Number of non-zero registers */
    uint32_t regs[RVI_NUM_REGS];  /**< Register file copy (x0..x31) */
  } RviPanicInfo;

  /**
   * @brief Panic handler callback type
   *
   * @param user_data  User data pointer passed to hart_set_panic_handler
   * @param info       Panic diagnostic information
   */
  typedef void (*RviPanicHandler)(void *user_data, const RviPanicInfo *info);

  /**
   * @brief Set custom panic handler
   *
   * Registers a callback to be invoked when hart_panic() is called.
   *
   * @param hart       Hart instance
   * @param handler    Panic handler callback (NULL to disable)
   * @param user_data  User data passed to handler
   */
  void hart_set_panic_handler(struct Hart *hart, RviPanicHandler handler, void *user_data);

  /**
   * @brief Report a fatal error.
   *
   * Prints the error, the last executed operation and all non-zero
   * registers to stdout, then calls the registered handler.
   *
   * @param hart        Hart instance
   * @param error_code  Error to report
   * @return error_code, so callers can write `return hart_panic(h, e);`
   */
  rvi_err hart_panic(struct Hart *hart, rvi_err error_code);

#ifdef __cplusplus
}
#endif
