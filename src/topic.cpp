// ============================================================================
// topic.cpp — implementation for meshview/topic.hpp
// ============================================================================
#include "meshview/topic.hpp"

#include <cctype>
#include <vector>

namespace meshview {

static constexpr size_t TOPIC_MIN_SEGMENTS = 6;

static std::vector<std::string> split_slash(const std::string& s) {
  std::vector<std::string> parts;
  size_t start = 0;
  for (;;) {
    const size_t pos = s.find('/', start);
    if (pos == std::string::npos) {
      parts.push_back(s.substr(start));
      break;
    }
    parts.push_back(s.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

// parse_gateway() — "!" + 1..8 hex digits, nothing else.
static bool parse_gateway(const std::string& seg, NodeNum& out) {
  if (seg.size() < 2 || seg.size() > 9 || seg[0] != '!') return false;
  NodeNum v = 0;
  for (size_t i = 1; i < seg.size(); ++i) {
    const char c = seg[i];
    if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    const NodeNum d = std::isdigit(static_cast<unsigned char>(c))
                        ? static_cast<NodeNum>(c - '0')
                        : static_cast<NodeNum>(std::tolower(static_cast<unsigned char>(c)) - 'a' + 10);
    v = (v << 4) | d;
  }
  out = v;
  return true;
}

bool parse_topic(const std::string& topic, TopicInfo& out) {
  const auto seg = split_slash(topic);
  const size_t n = seg.size();
  if (n < TOPIC_MIN_SEGMENTS) return false;

  const std::string& version = seg[n - 4];
  const std::string& enc     = seg[n - 3];
  const std::string& channel = seg[n - 2];
  const std::string& gateway = seg[n - 1];

  if (version != "2") return false;
  if (enc != "e" && enc != "c") return false;             // json/map/stat fail closed
  if (channel.empty() || channel.size() > ChannelStr::MAX_SIZE) return false;

  NodeNum gw = 0;
  if (!parse_gateway(gateway, gw)) return false;

  // root and region must be present and non-empty
  for (size_t i = 0; i + 4 < n; ++i) {
    if (seg[i].empty()) return false;
  }

  TopicInfo info;
  info.gateway = gw;
  info.channel.assign(channel.c_str(), channel.size());
  for (size_t i = 1; i + 4 < n; ++i) {
    if (!info.region.empty()) info.region += '/';
    info.region += seg[i];
  }
  out = info;
  return true;
}

} // namespace meshview
