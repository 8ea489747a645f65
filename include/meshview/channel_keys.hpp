/**
 * @page mv-channel-keys Channel Keys
 * @file channel_keys.hpp
 * @brief Per-channel pre-shared keys and AES-CTR payload decryption.
 *
 * @details
 * PURPOSE
 * -------
 * Mesh packets published with an `encrypted` payload can only be decoded
 * when the channel's pre-shared key (PSK) is known. This registry maps a
 * channel name to its key and performs the counter-mode transform.
 *
 * KEY FORMS
 * ---------
 * | PSK length | meaning                                                   |
 * |------------|-----------------------------------------------------------|
 * | 0          | channel is unencrypted (nothing to decrypt)               |
 * | 1, `0x00`  | same as 0                                                 |
 * | 1, `n`     | well-known default key, last byte incremented by `n - 1`  |
 * | 16         | AES-128                                                   |
 * | 32         | AES-256                                                   |
 *
 * Any other length is rejected at configuration time.
 *
 * IV LAYOUT (16 bytes)
 * --------------------
 * @code
 *   [0..7]   packet id, uint64 little endian
 *   [8..11]  sender node number, uint32 little endian
 *   [12..15] zero (block counter)
 * @endcode
 *
 * OPERATIONAL NOTES
 * -----------------
 * - CTR is symmetric; `crypt()` both encrypts and decrypts.
 * - The registry is populated once at startup and read concurrently
 *   afterwards without locking.
 */

#ifndef MESHVIEW_CHANNEL_KEYS_HPP
#define MESHVIEW_CHANNEL_KEYS_HPP

#include <stdint.h>
#include <stddef.h>
#include <array>
#include <map>
#include <string>
#include <vector>

#include "meshview/types.hpp"

namespace meshview {

struct ChannelKey {
  std::array<uint8_t, 32> bytes{};
  uint8_t length{0};                  ///< 0 = no encryption, else 16 or 32

  bool usable() const { return length == 16 || length == 32; }
};

class ChannelKeys {
public:
  /// Register a key from raw PSK bytes (any form in the table above).
  bool add(const std::string& channel, const std::vector<uint8_t>& psk, std::string& err);

  /// Register a key given as base64 text (the form used in config files).
  bool add_base64(const std::string& channel, const std::string& psk_b64, std::string& err);

  /// nullptr when the channel has no configured key.
  const ChannelKey* find(const std::string& channel) const;

  size_t size() const { return keys_.size(); }

  /**
   * @brief AES-CTR transform of @p in into @p out using the mesh IV layout.
   * @return false when the key is not usable or OpenSSL reports an error.
   */
  static bool crypt(const ChannelKey& key, PacketId packet_id, NodeNum from,
                    const uint8_t* in, size_t len, std::vector<uint8_t>& out);

private:
  std::map<std::string, ChannelKey> keys_;
};

/// Decode standard base64 (padding optional). False on any invalid character.
bool base64_decode(const std::string& in, std::vector<uint8_t>& out);

} // namespace meshview

#endif // MESHVIEW_CHANNEL_KEYS_HPP
