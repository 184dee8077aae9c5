#include "rvi/opcodes.hpp"

#include <ctype.h>

#include "rvi/errors.h"
#include "rvi/errors.hpp"
#include "rvi/opcodes.h"

static bool name_equals(const char* a, const char* b)
{
  for (; *a && *b; ++a, ++b)
  {
    if (toupper((unsigned char)*a) != toupper((unsigned char)*b))
      return false;
  }
  return *a == *b;
}

extern "C" int rvi_find_op(const char* name)
{
  if (!name)
    return -1;

  for (const rvi::PrimitiveEntry& e : rvi::kPrimitiveTable)
  {
    if (name_equals(name, e.name))
      return e.opcode;
  }

  return -1;  // Not found
}

extern "C" const char* rvi_op_name(int op)
{
  if (op < 0 || op >= rvi::kOpCount)
    return nullptr;
  return rvi::kPrimitiveTable[op].name;
}

extern "C" const char* rvi_err_str(int code)
{
  return rvi::err_str(static_cast<rvi::Err>(code));
}
