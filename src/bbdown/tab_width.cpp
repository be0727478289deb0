#include "tab_width.hpp"

#include <charconv>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>
#include <system_error>

namespace bbdown {

std::string_view tab_width_error_str(const tab_width_error error) noexcept
{
    switch (error)
    {
        case tab_width_error::empty: return "empty value";
        case tab_width_error::not_a_number: return "not a number";
        case tab_width_error::out_of_range: return "out of range";
    }

    return "unknown";
}

std::optional<tab_width_error> parse_tab_width(
    const std::string_view text, std::uint8_t& output) noexcept
{
    if (text.empty())
    {
        return tab_width_error::empty;
    }

    unsigned int value = 0;
    const char* const end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);

    if (ec == std::errc::result_out_of_range)
    {
        return tab_width_error::out_of_range;
    }

    if (ec != std::errc{} || ptr != end)
    {
        return tab_width_error::not_a_number;
    }

    if (value > std::numeric_limits<std::uint8_t>::max())
    {
        return tab_width_error::out_of_range;
    }

    output = static_cast<std::uint8_t>(value);
    return std::nullopt;
}

} // namespace bbdown
