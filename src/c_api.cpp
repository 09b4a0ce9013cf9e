/**
 * @file c_api.cpp
 * @brief file2afsk C API implementation
 *
 * C wrapper for the C++ KISS codec.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include <cstring>
#include <new>
#include <vector>

#include "file2afsk/file2afsk.h"
#include "file2afsk/kiss.hpp"

using namespace file2afsk;

/* ========================================================================= */
/* Internal wrapper structure                                                */
/* ========================================================================= */

struct File2afskDecoder
{
  KissDecoder* cpp_decoder;
  void* user;
  file2afsk_frame_fn on_frame;

  File2afskDecoder(file2afsk_frame_fn frame_fn, void* user_ctx, size_t max_frame_size)
      : cpp_decoder(nullptr), user(user_ctx), on_frame(frame_fn)
  {
    // Create C++ decoder with lambda that wraps the C callback
    cpp_decoder = new (std::nothrow) KissDecoder(
        [this](uint8_t port, const uint8_t* data, size_t len)
        {
          if (on_frame)
          {
            on_frame(user, port, data, len);
          }
        },
        max_frame_size);
  }

  ~File2afskDecoder()
  {
    delete cpp_decoder;
  }
};

/* ========================================================================= */
/* Error message strings                                                     */
/* ========================================================================= */

const char* file2afsk_strerror(file2afsk_error_t err)
{
  return error_message(static_cast<ErrorCode>(err));
}

/* ========================================================================= */
/* KISS encoding                                                             */
/* ========================================================================= */

file2afsk_error_t file2afsk_kiss_encode(const uint8_t* data, size_t len, uint8_t port,
                                        uint8_t* out, size_t out_cap, size_t* out_len)
{
  if ((data == nullptr && len > 0) || out == nullptr || out_len == nullptr)
  {
    return FILE2AFSK_ERR_INVALID_ARGUMENT;
  }

  std::vector<uint8_t> encoded;
  kiss_encode(data, len, port, encoded);

  if (encoded.size() > out_cap)
  {
    return FILE2AFSK_ERR_PAYLOAD_TOO_LARGE;
  }

  std::memcpy(out, encoded.data(), encoded.size());
  *out_len = encoded.size();
  return FILE2AFSK_ERR_OK;
}

/* ========================================================================= */
/* Decoder lifecycle                                                         */
/* ========================================================================= */

File2afskDecoder* file2afsk_decoder_create(file2afsk_frame_fn on_frame, void* user,
                                           size_t max_frame_size)
{
  if (on_frame == nullptr)
  {
    return nullptr;
  }

  if (max_frame_size == 0)
  {
    max_frame_size = FILE2AFSK_KISS_MAX_FRAME_SIZE;
  }

  File2afskDecoder* decoder = new (std::nothrow) File2afskDecoder(on_frame, user, max_frame_size);
  if (decoder == nullptr || decoder->cpp_decoder == nullptr)
  {
    delete decoder;
    return nullptr;
  }

  return decoder;
}

void file2afsk_decoder_destroy(File2afskDecoder* decoder)
{
  delete decoder;
}

/* ========================================================================= */
/* Decoder operations                                                        */
/* ========================================================================= */

void file2afsk_decoder_feed_byte(File2afskDecoder* decoder, uint8_t byte)
{
  if (decoder && decoder->cpp_decoder)
  {
    decoder->cpp_decoder->feed_byte(byte);
  }
}

void file2afsk_decoder_reset(File2afskDecoder* decoder)
{
  if (decoder && decoder->cpp_decoder)
  {
    decoder->cpp_decoder->reset();
  }
}

size_t file2afsk_decoder_dropped(const File2afskDecoder* decoder)
{
  if (decoder && decoder->cpp_decoder)
  {
    return decoder->cpp_decoder->dropped_frames();
  }
  return 0;
}
