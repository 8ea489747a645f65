#pragma once
/**
 * @file pb_util.hpp
 * @brief Thin helpers around nanopb's buffer streams.
 *
 * Decoding never aborts: a truncated or invalid buffer returns false with
 * nanopb's reason string in @p err.
 */

#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>

#include <pb.h>
#include <pb_decode.h>
#include <pb_encode.h>

namespace meshview {

inline bool pb_decode_bytes(const uint8_t* buf, size_t len, const pb_msgdesc_t* fields,
                            void* dest, std::string& err) {
  pb_istream_t stream = pb_istream_from_buffer(buf, len);
  if (!pb_decode(&stream, fields, dest)) {
    err = PB_GET_ERROR(&stream);
    return false;
  }
  return true;
}

/// Encode into a growable buffer; sizes with pb_get_encoded_size first.
inline bool pb_encode_bytes(const pb_msgdesc_t* fields, const void* src,
                            std::vector<uint8_t>& out, std::string& err) {
  size_t size = 0;
  if (!pb_get_encoded_size(&size, fields, src)) {
    err = "cannot size message";
    return false;
  }
  out.assign(size, 0);
  pb_ostream_t stream = pb_ostream_from_buffer(out.data(), out.size());
  if (!pb_encode(&stream, fields, src)) {
    err = PB_GET_ERROR(&stream);
    out.clear();
    return false;
  }
  out.resize(stream.bytes_written);
  return true;
}

} // namespace meshview
