#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace bbdown {

enum class tab_width_error : unsigned char
{
    empty,
    not_a_number,
    out_of_range
};

[[nodiscard]] std::string_view tab_width_error_str(
    const tab_width_error error) noexcept;

// Parses a decimal tab width within [0, 255]. `output` is only written on
// success.
[[nodiscard]] std::optional<tab_width_error> parse_tab_width(
    const std::string_view text, std::uint8_t& output) noexcept;

} // namespace bbdown
