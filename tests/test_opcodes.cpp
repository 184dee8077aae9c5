#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <cstring>

#include "doctest.h"
#include "rvi/errors.h"
#include "rvi/errors.hpp"
#include "rvi/opcodes.h"
#include "rvi/opcodes.hpp"

TEST_CASE("Primitive table is dense and ordered by opcode")
{
  CHECK(rvi::kOpCount == 9);
  for (int i = 0; i < rvi::kOpCount; ++i)
  {
    CAPTURE(i);
    CHECK(rvi::kPrimitiveTable[i].opcode == i);
  }
}

TEST_CASE("Immediate kinds")
{
  using rvi::ImmKind;
  CHECK(rvi::kPrimitiveTable[RVI_OP_ADDI].kind == ImmKind::Imm12);
  CHECK(rvi::kPrimitiveTable[RVI_OP_SLTIU].kind == ImmKind::Imm12);
  CHECK(rvi::kPrimitiveTable[RVI_OP_ANDI].kind == ImmKind::Imm12);
  CHECK(rvi::kPrimitiveTable[RVI_OP_SLLI].kind == ImmKind::Shamt5);
  CHECK(rvi::kPrimitiveTable[RVI_OP_SRLI].kind == ImmKind::Shamt5);
  CHECK(rvi::kPrimitiveTable[RVI_OP_SRAI].kind == ImmKind::Shamt5);
}

TEST_CASE("C and C++ tags agree")
{
  CHECK(static_cast<int>(rvi::Op::ADDI) == RVI_OP_ADDI);
  CHECK(static_cast<int>(rvi::Op::XORI) == RVI_OP_XORI);
  CHECK(static_cast<int>(rvi::Op::SRAI) == RVI_OP_SRAI);
}

TEST_CASE("Lookup by mnemonic")
{
  CHECK(rvi_find_op("ADDI") == RVI_OP_ADDI);
  CHECK(rvi_find_op("addi") == RVI_OP_ADDI);
  CHECK(rvi_find_op("SltIu") == RVI_OP_SLTIU);
  CHECK(rvi_find_op("srai") == RVI_OP_SRAI);

  CHECK(rvi_find_op("add") == -1);
  CHECK(rvi_find_op("addiw") == -1);
  CHECK(rvi_find_op("") == -1);
  CHECK(rvi_find_op(nullptr) == -1);
}

TEST_CASE("Mnemonic by tag")
{
  CHECK(std::strcmp(rvi_op_name(RVI_OP_ORI), "ORI") == 0);
  CHECK(std::strcmp(rvi_op_name(RVI_OP_SRLI), "SRLI") == 0);
  CHECK(rvi_op_name(-1) == nullptr);
  CHECK(rvi_op_name(rvi::kOpCount) == nullptr);

  for (int i = 0; i < rvi::kOpCount; ++i)
    CHECK(rvi_find_op(rvi_op_name(i)) == i);
}

TEST_CASE("Error messages")
{
  CHECK(RVI_ERR_OK == 0);
  CHECK(RVI_ERR_InvalidRegister == -3);
  CHECK(std::strcmp(rvi::err_str(rvi::Err::InvalidRegister), "register index out of range") == 0);
  CHECK(std::strcmp(rvi_err_str(RVI_ERR_ShamtOutOfRange), "shift amount out of range") == 0);
  CHECK(std::strcmp(rvi_err_str(-100), "unknown error") == 0);
}
