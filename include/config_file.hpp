#pragma once
/**
 * @file config_file.hpp
 * @brief Load meshview::Config from JSON (nlohmann/json) and build channel keys.
 *
 * Every key is optional; missing keys keep the defaults in config.hpp.
 * Unknown keys are ignored. Type errors, bad log levels and unreadable files
 * are reported through @p err with a short reason; the daemon prints it as
 * `status=error reason=...` and exits non-zero.
 */

#include <string>

#include "meshview/channel_keys.hpp"
#include "meshview/config.hpp"

namespace meshview {

/// Overlay the JSON document in @p text onto @p cfg.
bool parse_config(const std::string& text, Config& cfg, std::string& err);

/// Read @p path and overlay it onto @p cfg.
bool load_config_file(const std::string& path, Config& cfg, std::string& err);

/// Register every `channels` entry of @p cfg into @p keys.
bool build_channel_keys(const Config& cfg, ChannelKeys& keys, std::string& err);

} // namespace meshview
