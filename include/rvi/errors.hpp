#pragma once

// rvi::Err mirrors the negative status codes every hart_* call returns.
// errors.def is an X-macro table shared with errors.h; define ERR(name, val, msg)
// before including it to generate other mappings.

#ifndef ERR
#define ERR(name, val, msg) name = val,
#endif

namespace rvi
{

enum class Err : int
{
#include "rvi/errors.def"
};

#undef ERR

inline const char *err_str(Err e)
{
  switch (e)
  {
#define ERR(name, val, msg) \
  case Err::name:           \
    return msg;
#include "rvi/errors.def"
#undef ERR
    default:
      return "unknown error";
  }
}

}  // namespace rvi

// Typed rvi::Err name as the plain rvi_err the C API returns
#define RVI_ERR(name) static_cast<rvi_err>(::rvi::Err::name)
