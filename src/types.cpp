// ============================================================================
// types.cpp — implementation for meshview/types.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================
#include "meshview/types.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace meshview {

std::string node_id_to_hex(NodeNum n) {
  char buf[12];
  std::snprintf(buf, sizeof(buf), "!%08x", static_cast<unsigned>(n));
  return std::string(buf);
}

// parse_node_id() — accept "!hex", "0xhex" or plain decimal; reject trailing junk.
std::optional<NodeNum> parse_node_id(const std::string& s) {
  if (s.empty()) return std::nullopt;

  const char* p = s.c_str();
  int base = 10;
  if (p[0] == '!') { ++p; base = 16; }
  else if (s.size() > 2 && p[0] == '0' && (p[1] == 'x' || p[1] == 'X')) { p += 2; base = 16; }

  if (*p == '\0') return std::nullopt;           // prefix with no digits
  for (const char* q = p; *q; ++q) {
    const bool ok = (base == 16) ? std::isxdigit(static_cast<unsigned char>(*q))
                                 : std::isdigit(static_cast<unsigned char>(*q));
    if (!ok) return std::nullopt;
  }

  char* end = nullptr;
  const unsigned long long v = std::strtoull(p, &end, base);
  if (end == p || *end != '\0' || v > 0xFFFFFFFFull) return std::nullopt;
  return static_cast<NodeNum>(v);
}

} // namespace meshview
