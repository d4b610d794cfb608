#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace superagent::utils {

auto generate_id(std::size_t length = 16) -> std::string;
auto trim(std::string_view s) -> std::string;
auto to_lower(std::string_view s) -> std::string;

/// Clip `s` to at most `max_bytes` bytes without splitting a UTF-8 sequence.
/// A `max_bytes` of 0 means no limit.
auto truncate_utf8(std::string_view s, std::size_t max_bytes) -> std::string;

} // namespace superagent::utils
