/**
 * @file file2afsk.h
 * @brief file2afsk C API
 *
 * C-compatible interface to the KISS encoder and decoder.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /* ========================================================================= */
  /* Protocol constants                                                        */
  /* ========================================================================= */

#define FILE2AFSK_FEND 0xC0
#define FILE2AFSK_FESC 0xDB
#define FILE2AFSK_TFEND 0xDC
#define FILE2AFSK_TFESC 0xDD

  /** @brief Largest frame accepted by the decoder */
#define FILE2AFSK_KISS_MAX_FRAME_SIZE 2048

  /* ========================================================================= */
  /* Error codes                                                               */
  /* ========================================================================= */

  typedef enum
  {
#define ERR(name, val, msg) FILE2AFSK_ERR_##name = val,
#include "file2afsk/errors.def"
#undef ERR
  } file2afsk_error_t;

  /**
   * @brief Get error message string
   * @param err Error code
   * @return Error message (static string)
   */
  const char* file2afsk_strerror(file2afsk_error_t err);

  /* ========================================================================= */
  /* KISS encoding                                                             */
  /* ========================================================================= */

  /**
   * @brief Wrap a frame as a KISS data frame
   *
   * Worst case output size is 2 * len + 3.
   *
   * @param data    Raw AX.25 frame
   * @param len     Frame length
   * @param port    TNC port (0-15)
   * @param out     Output buffer
   * @param out_cap Output buffer capacity
   * @param out_len Receives the encoded length
   * @return FILE2AFSK_ERR_OK, FILE2AFSK_ERR_INVALID_ARGUMENT on NULL
   *         pointers, FILE2AFSK_ERR_PAYLOAD_TOO_LARGE if out is too small
   */
  file2afsk_error_t file2afsk_kiss_encode(const uint8_t* data, size_t len, uint8_t port,
                                          uint8_t* out, size_t out_cap, size_t* out_len);

  /* ========================================================================= */
  /* KISS decoder handle                                                       */
  /* ========================================================================= */

  /** @brief Opaque handle to a KISS decoder */
  typedef struct File2afskDecoder File2afskDecoder;

  /**
   * @brief Frame callback function type
   *
   * @param user User-defined context pointer
   * @param port TNC port
   * @param data De-escaped frame (valid only during the call)
   * @param len  Frame length
   */
  typedef void (*file2afsk_frame_fn)(void* user, uint8_t port, const uint8_t* data, size_t len);

  /**
   * @brief Create a KISS decoder
   *
   * @param on_frame       Frame callback
   * @param user           User context pointer (passed to on_frame)
   * @param max_frame_size Oversize limit (0 selects FILE2AFSK_KISS_MAX_FRAME_SIZE)
   * @return Decoder handle, or NULL on allocation failure or NULL callback
   */
  File2afskDecoder* file2afsk_decoder_create(file2afsk_frame_fn on_frame, void* user,
                                             size_t max_frame_size);

  /**
   * @brief Destroy decoder and free resources
   * @param decoder Decoder handle (NULL-safe)
   */
  void file2afsk_decoder_destroy(File2afskDecoder* decoder);

  /**
   * @brief Process one received byte
   */
  void file2afsk_decoder_feed_byte(File2afskDecoder* decoder, uint8_t byte);

  /**
   * @brief Discard any partial frame
   */
  void file2afsk_decoder_reset(File2afskDecoder* decoder);

  /**
   * @brief Number of frames dropped as corrupt, oversized or non-data
   */
  size_t file2afsk_decoder_dropped(const File2afskDecoder* decoder);

#ifdef __cplusplus
} /* extern "C" */
#endif
