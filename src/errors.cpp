/**
 * @file errors.cpp
 * @brief Error message table
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "file2afsk/protocol.hpp"

namespace file2afsk
{

const char* error_message(ErrorCode code)
{
  switch (code)
  {
#define ERR(name, val, msg) \
  case ErrorCode::name:     \
    return msg;
#include "file2afsk/errors.def"
#undef ERR
    default:
      return "unknown error";
  }
}

}  // namespace file2afsk
