/**
 * @file topic.hpp
 * @brief Parse mesh uplink topics into {gateway, channel}.
 *
 * @details
 * EXPECTED LAYOUT
 * ---------------
 * @code
 *   <root>/<region>[/<subregion>...]/2/<enc>/<channel>/<gateway>
 *   msh/US/bayarea/2/e/LongFast/!a1b2c3d4
 * @endcode
 *
 * Segments are counted from the end so any depth of region nesting works:
 *
 * | index | meaning             | rule                                  |
 * |-------|---------------------|---------------------------------------|
 * | [-1]  | gateway node id     | `!` followed by 1..8 hex digits       |
 * | [-2]  | channel name        | non-empty, fits a 64-byte field       |
 * | [-3]  | envelope encoding   | `e` or `c` (protobuf ServiceEnvelope) |
 * | [-4]  | protocol version    | literal `2`                           |
 *
 * At least 6 segments are required (root, region, and the four above).
 * Anything else (`json`, `map`, `stat` topics, short topics, bad gateway ids)
 * fails closed.
 */

#ifndef MESHVIEW_TOPIC_HPP
#define MESHVIEW_TOPIC_HPP

#include <string>

#include "meshview/types.hpp"

namespace meshview {

struct TopicInfo {
  NodeNum    gateway{0};
  ChannelStr channel;
  std::string region;     ///< segments between root and version, joined with '/'
};

/// Returns false (and leaves @p out untouched) when the topic is not a protobuf uplink topic.
bool parse_topic(const std::string& topic, TopicInfo& out);

} // namespace meshview

#endif // MESHVIEW_TOPIC_HPP
