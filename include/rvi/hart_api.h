#pragma once
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /* ------------------------------------------------------------------------- */
  /* Basic typedefs                                                            */
  /* ------------------------------------------------------------------------- */

  /** 32-bit signed integer (signed view of a register). */
  typedef int32_t rvi_i32;
  /** 32-bit unsigned integer (register and immediate storage). */
  typedef uint32_t rvi_u32;
  /** Error code type. 0 = OK, negative = error. */
  typedef int rvi_err;

/** Number of architectural integer registers (x0..x31). */
#define RVI_NUM_REGS 32

  /* ------------------------------------------------------------------------- */
  /* Hart configuration                                                        */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Handling of shift amounts above 31 in SLLI/SRLI/SRAI.
   */
  typedef enum RviShamtPolicy
  {
    RVI_SHAMT_MASK = 0,   /**< Use the low 5 bits of the immediate (architectural) */
    RVI_SHAMT_STRICT = 1, /**< Reject immediates > 31 with ShamtOutOfRange */
  } RviShamtPolicy;

  /**
   * @brief Configuration structure used when creating a hart.
   *
   * A zero-initialised HartConfig yields an all-zero register file with the
   * masking shift policy.
   */
  typedef struct HartConfig
  {
    const rvi_u32 *init_regs;    /**< Initial values for x0.. (can be NULL) */
    int init_count;              /**< Entries in init_regs (clamped to 32) */
    RviShamtPolicy shamt_policy; /**< Shift amount policy */
  } HartConfig;

  /* Forward declarations for opaque structures. */
  struct Hart;
  struct RegSnapshot;

  /* ------------------------------------------------------------------------- */
  /* Lifecycle                                                                 */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Create a new hart.
   *
   * Initial register values from cfg->init_regs go through the normal write
   * rule, so a value supplied for x0 is discarded.
   *
   * @param cfg  Configuration, or NULL for defaults.
   * @return Pointer to the new hart, or NULL on allocation failure.
   */
  struct Hart *hart_create(const HartConfig *cfg);

  /**
   * @brief Zero all registers and clear last_err / last_op.
   *
   * Configuration and the panic handler are preserved.
   * @param hart  Hart instance.
   */
  void hart_reset(struct Hart *hart);

  /**
   * @brief Destroy a hart created by hart_create().
   * @param hart  Hart instance (NULL is ignored).
   */
  void hart_destroy(struct Hart *hart);

  /* ------------------------------------------------------------------------- */
  /* Register file                                                             */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Read an integer register.
   *
   * x0 always reads as zero.
   *
   * @param hart   Hart instance.
   * @param index  Register index (0..31).
   * @param out    Output value pointer (unchanged on error).
   * @return 0 on success, InvalidRegister for index > 31, InvalidArg for NULL
   *         pointers.
   */
  rvi_err hart_reg_read(struct Hart *hart, rvi_u32 index, rvi_u32 *out);

  /**
   * @brief Write an integer register.
   *
   * Writes to x0 are discarded and return 0.
   *
   * @param hart   Hart instance.
   * @param index  Register index (0..31).
   * @param value  Value to store.
   * @return 0 on success, InvalidRegister for index > 31, InvalidArg for a
   *         NULL hart.
   */
  rvi_err hart_reg_write(struct Hart *hart, rvi_u32 index, rvi_u32 value);

  /**
   * @brief Copy x0..x(n-1) to an array, n = min(32, max_count).
   * @return Number of registers copied.
   */
  int hart_reg_copy_to_array(struct Hart *hart, rvi_u32 *out_array, int max_count);

  /* ------------------------------------------------------------------------- */
  /* Register snapshot API                                                     */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Register file snapshot.
   */
  typedef struct RegSnapshot
  {
    rvi_u32 *data; /**< Register values x0..x31 (dynamically allocated) */
    int count;     /**< Number of registers held (always 32) */
  } RegSnapshot;

  /**
   * @brief Capture the register file.
   * @return Snapshot (release with hart_reg_snapshot_free), or NULL.
   */
  struct RegSnapshot *hart_reg_snapshot(struct Hart *hart);

  /**
   * @brief Restore the register file from a snapshot. x0 stays zero.
   * @return 0 on success, InvalidArg for NULL arguments.
   */
  rvi_err hart_reg_restore(struct Hart *hart, const struct RegSnapshot *snapshot);

  /**
   * @brief Free a snapshot (NULL is ignored).
   */
  void hart_reg_snapshot_free(struct RegSnapshot *snapshot);

  /* ------------------------------------------------------------------------- */
  /* Instruction execution                                                     */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Execute one OP-IMM instruction with already-decoded fields.
   *
   * The immediate is used as given; callers sign-extend 12-bit fields with
   * rvi_sign_extend12() first. Register indices are validated before the
   * destination is written, so a failing call leaves the hart unchanged.
   *
   * @param hart  Hart instance.
   * @param op    Operation tag (rvi_op_t).
   * @param rd    Destination register index.
   * @param rs1   Source register index.
   * @param imm   Immediate (sign-extended) or shift amount.
   * @return 0 on success, negative rvi_err on failure.
   */
  rvi_err hart_exec(struct Hart *hart, int op, rvi_u32 rd, rvi_u32 rs1, rvi_u32 imm);

  /**
   * @brief Execute by mnemonic ("addi", "SRAI", ...).
   * @return UnknownOp if the mnemonic is not an OP-IMM instruction.
   */
  rvi_err hart_exec_name(struct Hart *hart, const char *mnemonic, rvi_u32 rd, rvi_u32 rs1,
                         rvi_u32 imm);

  rvi_err hart_addi(struct Hart *hart, rvi_u32 rd, rvi_u32 rs1, rvi_u32 imm);
  rvi_err hart_slti(struct Hart *hart, rvi_u32 rd, rvi_u32 rs1, rvi_u32 imm);
  rvi_err hart_sltiu(struct Hart *hart, rvi_u32 rd, rvi_u32 rs1, rvi_u32 imm);
  rvi_err hart_andi(struct Hart *hart, rvi_u32 rd, rvi_u32 rs1, rvi_u32 imm);
  rvi_err hart_ori(struct Hart *hart, rvi_u32 rd, rvi_u32 rs1, rvi_u32 imm);
  rvi_err hart_xori(struct Hart *hart, rvi_u32 rd, rvi_u32 rs1, rvi_u32 imm);
  rvi_err hart_slli(struct Hart *hart, rvi_u32 rd, rvi_u32 rs1, rvi_u32 shamt);
  rvi_err hart_srli(struct Hart *hart, rvi_u32 rd, rvi_u32 rs1, rvi_u32 shamt);
  rvi_err hart_srai(struct Hart *hart, rvi_u32 rd, rvi_u32 rs1, rvi_u32 shamt);

  /* ------------------------------------------------------------------------- */
  /* Pseudo-instructions                                                       */
  /* ------------------------------------------------------------------------- */

  /** NOP = ADDI x0, x0, 0 */
  rvi_err hart_nop(struct Hart *hart);
  /** MV rd, rs = ADDI rd, rs, 0 */
  rvi_err hart_mv(struct Hart *hart, rvi_u32 rd, rvi_u32 rs);
  /** NOT rd, rs = XORI rd, rs, -1 */
  rvi_err hart_not(struct Hart *hart, rvi_u32 rd, rvi_u32 rs);
  /** SEQZ rd, rs = SLTIU rd, rs, 1 */
  rvi_err hart_seqz(struct Hart *hart, rvi_u32 rd, rvi_u32 rs);
  /**
   * LI rd, value = ADDI rd, x0, value
   * @return ImmOutOfRange unless -2048 <= value <= 2047.
   */
  rvi_err hart_li(struct Hart *hart, rvi_u32 rd, rvi_i32 value);

  /* ------------------------------------------------------------------------- */
  /* Execution state                                                           */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Status recorded by the most recent register or execute call.
   */
  rvi_err hart_last_err(const struct Hart *hart);

  /**
   * @brief Tag of the most recently executed operation, or -1 if none.
   */
  int hart_last_op(const struct Hart *hart);

  /**
   * @brief Get the current version of the library.
   * @return major * 10000 + minor * 100 + patch of the project version
   *         (0.1.0 -> 100).
   */
  int rvi_version(void);

  /*
   * All public APIs return 0 on success and a negative rvi_err on failure.
   */

#ifdef __cplusplus
} /* extern "C" */
#endif
