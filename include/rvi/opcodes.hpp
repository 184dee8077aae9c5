#pragma once
#include <cstdint>

#include "rvi/opcodes.h"

namespace rvi
{

/** RV32I OP-IMM operation set. Tags are dense and start at zero. */
enum class Op : std::uint8_t
{
#define OP(name, val, _) name = val,
#include "rvi/opcodes.def"
#undef OP
};

// -----------------------------------------------------------------------------
// Immediate kind classification for front-end table-driven dispatch
// -----------------------------------------------------------------------------
enum class ImmKind : uint8_t
{
  Imm12,   // ADDI, SLTI, ... (12-bit field, sign-extended by the caller)
  Shamt5,  // SLLI, SRLI, SRAI (low 5 bits of the immediate)
};

// -----------------------------------------------------------------------------
// Primitive entry definition
// -----------------------------------------------------------------------------
struct PrimitiveEntry
{
  const char *name;
  uint8_t opcode;
  ImmKind kind;
};

#define RVI_IMM_KIND_IMM12 ImmKind::Imm12
#define RVI_IMM_KIND_SHAMT5 ImmKind::Shamt5

// -----------------------------------------------------------------------------
// Primitive table (generated from opcodes.def), indexed by opcode
// -----------------------------------------------------------------------------
static constexpr PrimitiveEntry kPrimitiveTable[] = {
#define OP(name, val, kind) {#name, val, RVI_IMM_KIND_##kind},
#include "rvi/opcodes.def"
#undef OP
};

static constexpr int kOpCount =
    static_cast<int>(sizeof(kPrimitiveTable) / sizeof(kPrimitiveTable[0]));

}  // namespace rvi
