// ============================================================================
// channel_keys.cpp — implementation for meshview/channel_keys.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================
#include "meshview/channel_keys.hpp"

#include <openssl/evp.h>    // EVP_CIPHER_CTX, EVP_aes_*_ctr, EVP_DecodeBlock

#include <cstring>
#include <memory>

namespace meshview {

// Well-known default channel key ("AQ==" in client apps).
static constexpr uint8_t DEFAULT_PSK[16] = {
  0xd4, 0xf1, 0xbb, 0x3a, 0x20, 0x29, 0x07, 0x59,
  0xf0, 0xbc, 0xff, 0xab, 0xcf, 0x4e, 0x69, 0x01
};

bool ChannelKeys::add(const std::string& channel, const std::vector<uint8_t>& psk, std::string& err) {
  if (channel.empty()) { err = "empty channel name"; return false; }

  ChannelKey key;
  if (psk.empty() || (psk.size() == 1 && psk[0] == 0)) {
    key.length = 0;                                   // explicit "no encryption"
  } else if (psk.size() == 1) {
    std::memcpy(key.bytes.data(), DEFAULT_PSK, sizeof(DEFAULT_PSK));
    key.bytes[15] = static_cast<uint8_t>(key.bytes[15] + (psk[0] - 1));  // index n -> default + (n-1)
    key.length = 16;
  } else if (psk.size() == 16 || psk.size() == 32) {
    std::memcpy(key.bytes.data(), psk.data(), psk.size());
    key.length = static_cast<uint8_t>(psk.size());
  } else {
    err = "psk for channel '" + channel + "' must be 0, 1, 16 or 32 bytes (got "
        + std::to_string(psk.size()) + ")";
    return false;
  }

  keys_[channel] = key;
  return true;
}

bool ChannelKeys::add_base64(const std::string& channel, const std::string& psk_b64, std::string& err) {
  std::vector<uint8_t> raw;
  if (!base64_decode(psk_b64, raw)) {
    err = "psk for channel '" + channel + "' is not valid base64";
    return false;
  }
  return add(channel, raw, err);
}

const ChannelKey* ChannelKeys::find(const std::string& channel) const {
  auto it = keys_.find(channel);
  return it == keys_.end() ? nullptr : &it->second;
}

/*
 * crypt()
 * -------
 * One-shot AES-CTR over the whole buffer.
 *
 * PRE:  key.usable()
 * OUT:  out.size() == len on success
 * NOTE: a fresh EVP context per call keeps this safe to call from any worker.
 */
bool ChannelKeys::crypt(const ChannelKey& key, PacketId packet_id, NodeNum from,
                        const uint8_t* in, size_t len, std::vector<uint8_t>& out) {
  if (!key.usable()) return false;

  uint8_t iv[16] = {0};
  const uint64_t id64 = packet_id;
  for (int i = 0; i < 8; ++i) iv[i]     = static_cast<uint8_t>(id64 >> (8 * i));  // LE packet id
  for (int i = 0; i < 4; ++i) iv[8 + i] = static_cast<uint8_t>(from >> (8 * i));  // LE sender

  std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>
      ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
  if (!ctx) return false;

  const EVP_CIPHER* cipher = (key.length == 16) ? EVP_aes_128_ctr() : EVP_aes_256_ctr();
  if (EVP_EncryptInit_ex(ctx.get(), cipher, nullptr, key.bytes.data(), iv) != 1) return false;

  out.assign(len, 0);
  if (len == 0) return true;

  int outl = 0;
  if (EVP_EncryptUpdate(ctx.get(), out.data(), &outl, in, static_cast<int>(len)) != 1) return false;
  int finl = 0;
  if (EVP_EncryptFinal_ex(ctx.get(), out.data() + outl, &finl) != 1) return false;  // CTR: no tail
  out.resize(static_cast<size_t>(outl + finl));
  return out.size() == len;
}

// base64_decode() — EVP_DecodeBlock wants padded input and reports padding as zero bytes.
bool base64_decode(const std::string& in, std::vector<uint8_t>& out) {
  std::string s;
  s.reserve(in.size() + 3);
  for (char c : in) {
    if (c == '\n' || c == '\r' || c == ' ') continue;
    const bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                    (c >= '0' && c <= '9') || c == '+' || c == '/' || c == '=';
    if (!ok) return false;
    s += c;
  }
  out.clear();
  if (s.empty()) return true;

  while (s.size() % 4 != 0) s += '=';

  size_t pad = 0;
  if (s[s.size() - 1] == '=') ++pad;
  if (s[s.size() - 2] == '=') ++pad;
  if (s.find('=') < s.size() - pad) return false;   // '=' only allowed as trailing padding

  out.resize(s.size() / 4 * 3);
  const int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(s.data()),
                                static_cast<int>(s.size()));
  if (n < 0) { out.clear(); return false; }
  out.resize(static_cast<size_t>(n) - pad);
  return true;
}

} // namespace meshview
