// src/regfile.cpp — register file core + public API wrappers, lifecycle, snapshots
#include "rvi/internal/regfile.hpp"  // rvi_is_valid_reg + prototypes

#include <stdlib.h>
#include <string.h>

#include "rvi/errors.hpp"
#include "rvi/internal/hart.h"
#include "rvi/hart_api.h"

/* ---- core accessors (used by execute functions and public API) ---- */
rvi_err rvi_reg_read_core(const Hart *hart, rvi_u32 index, rvi_u32 *out)
{
  if (rvi_err e = rvi_is_valid_reg(index))
    return e;

  // x0 is hard-wired to zero
  *out = (index == 0) ? 0u : hart->x[index];
  return 0;
}

rvi_err rvi_reg_write_core(Hart *hart, rvi_u32 index, rvi_u32 value)
{
  if (rvi_err e = rvi_is_valid_reg(index))
    return e;

  // Writes to x0 are discarded
  if (index != 0)
    hart->x[index] = value;
  return 0;
}

/* ---- public API: register access ---- */
extern "C" rvi_err hart_reg_read(struct Hart *hart, rvi_u32 index, rvi_u32 *out)
{
  if (!hart)
    return RVI_ERR(InvalidArg);
  if (!out)
    return hart->last_err = RVI_ERR(InvalidArg);

  rvi_err e = rvi_reg_read_core(hart, index, out);
  hart->last_err = e;
  return e;
}

extern "C" rvi_err hart_reg_write(struct Hart *hart, rvi_u32 index, rvi_u32 value)
{
  if (!hart)
    return RVI_ERR(InvalidArg);

  rvi_err e = rvi_reg_write_core(hart, index, value);
  hart->last_err = e;
  return e;
}

extern "C" int hart_reg_copy_to_array(struct Hart *hart, rvi_u32 *out_array, int max_count)
{
  if (!hart || !out_array || max_count <= 0)
    return 0;

  int copy_count = (max_count < RVI_NUM_REGS) ? max_count : RVI_NUM_REGS;
  ::memcpy(out_array, hart->x, copy_count * sizeof(rvi_u32));
  out_array[0] = 0;

  return copy_count;
}

/* ---- public API: lifecycle ---- */
extern "C" void hart_reset(struct Hart *hart)
{
  if (!hart)
    return;

  ::memset(hart->x, 0, sizeof(hart->x));
  hart->last_err = 0;
  hart->last_op = -1;
}

extern "C" struct Hart *hart_create(const HartConfig *cfg)
{
  Hart *hart = (Hart *)::malloc(sizeof(Hart));
  if (!hart)
    return nullptr;
  ::memset(hart, 0, sizeof(Hart));

  hart_reset(hart);
  hart->shamt_policy = RVI_SHAMT_MASK;

  if (!cfg)
    return hart;

  hart->shamt_policy = cfg->shamt_policy;

  // Initial register values; init_regs[0] is discarded like any write to x0
  if (cfg->init_regs && cfg->init_count > 0)
  {
    const int n = (cfg->init_count <= RVI_NUM_REGS) ? cfg->init_count : RVI_NUM_REGS;
    for (int i = 1; i < n; ++i)
      hart->x[i] = cfg->init_regs[i];
  }

  return hart;
}

extern "C" void hart_destroy(struct Hart *hart)
{
  if (!hart)
    return;
  ::free(hart);
}

/* ---- public API: snapshots ---- */
extern "C" struct RegSnapshot *hart_reg_snapshot(struct Hart *hart)
{
  if (!hart)
    return nullptr;

  RegSnapshot *snap = (RegSnapshot *)::malloc(sizeof(RegSnapshot));
  if (!snap)
    return nullptr;

  snap->data = (rvi_u32 *)::malloc(RVI_NUM_REGS * sizeof(rvi_u32));
  if (!snap->data)
  {
    ::free(snap);
    return nullptr;
  }

  snap->count = hart_reg_copy_to_array(hart, snap->data, RVI_NUM_REGS);
  return snap;
}

extern "C" rvi_err hart_reg_restore(struct Hart *hart, const struct RegSnapshot *snapshot)
{
  if (!hart || !snapshot || !snapshot->data)
    return RVI_ERR(InvalidArg);

  const int n = (snapshot->count < RVI_NUM_REGS) ? snapshot->count : RVI_NUM_REGS;
  ::memset(hart->x, 0, sizeof(hart->x));
  for (int i = 1; i < n; ++i)
    hart->x[i] = snapshot->data[i];

  return RVI_ERR(OK);
}

extern "C" void hart_reg_snapshot_free(struct RegSnapshot *snapshot)
{
  if (!snapshot)
    return;

  if (snapshot->data)
    ::free(snapshot->data);
  ::free(snapshot);
}

/* ---- public API: execution state ---- */
extern "C" rvi_err hart_last_err(const struct Hart *hart)
{
  if (!hart)
    return RVI_ERR(InvalidArg);
  return hart->last_err;
}

extern "C" int hart_last_op(const struct Hart *hart)
{
  if (!hart)
    return -1;
  return hart->last_op;
}

extern "C" int rvi_version(void)
{
  return RVI_VERSION_MAJOR * 10000 + RVI_VERSION_MINOR * 100 + RVI_VERSION_PATCH;
}
