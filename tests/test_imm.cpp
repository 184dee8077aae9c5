#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <cstdint>

#include "doctest.h"
#include "rvi/imm.h"

TEST_CASE("12-bit sign extension")
{
  CHECK(rvi_sign_extend12(0x000) == 0x00000000u);
  CHECK(rvi_sign_extend12(0x001) == 0x00000001u);
  CHECK(rvi_sign_extend12(0x7ff) == 0x000007ffu);
  CHECK(rvi_sign_extend12(0x800) == 0xfffff800u);
  CHECK(rvi_sign_extend12(0xfff) == 0xffffffffu);
  CHECK(rvi_sign_extend12(0xf0f) == 0xffffff0fu);
}

TEST_CASE("12-bit sign extension ignores bits above the field")
{
  CHECK(rvi_sign_extend12(0x12345123u) == 0x00000123u);
  CHECK(rvi_sign_extend12(0xfffff7ffu) == 0x000007ffu);
  CHECK(rvi_sign_extend12(0x00001800u) == 0xfffff800u);
}

TEST_CASE("General sign extension")
{
  CHECK(rvi_sign_extend(0x1u, 1) == 0xffffffffu);
  CHECK(rvi_sign_extend(0x0u, 1) == 0x00000000u);
  CHECK(rvi_sign_extend(0x10u, 5) == 0xfffffff0u);
  CHECK(rvi_sign_extend(0x0fu, 5) == 0x0000000fu);
  CHECK(rvi_sign_extend(0x8000u, 16) == 0xffff8000u);
  CHECK(rvi_sign_extend(0x80000u, 20) == 0xfff80000u);
  CHECK(rvi_sign_extend(0x800u, 12) == rvi_sign_extend12(0x800u));
}

TEST_CASE("General sign extension with degenerate widths")
{
  CHECK(rvi_sign_extend(0x80000000u, 32) == 0x80000000u);
  CHECK(rvi_sign_extend(0x1234u, 0) == 0x1234u);
  CHECK(rvi_sign_extend(0x1234u, -3) == 0x1234u);
  CHECK(rvi_sign_extend(0x1234u, 40) == 0x1234u);
}

TEST_CASE("12-bit immediate range")
{
  CHECK(rvi_imm12_fits(0));
  CHECK(rvi_imm12_fits(2047));
  CHECK(rvi_imm12_fits(-2048));
  CHECK_FALSE(rvi_imm12_fits(2048));
  CHECK_FALSE(rvi_imm12_fits(-2049));
  CHECK_FALSE(rvi_imm12_fits(INT32_MIN));
}
