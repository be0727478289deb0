#pragma once

#include <string_view>

namespace bbdown {

// Closed set of tags the renderers know how to convert. Adding a built-in
// conversion means adding a case here and an entry in the lookup table.
enum class element_kind : unsigned char
{
    bold,
    italic,
    link,
    email,
    code,
    horizontal_rule,
    blockquote,
    list,
    list_item,
    underline,
    unrecognized
};

[[nodiscard]] std::string_view element_kind_str(const element_kind kind) noexcept;

// Case-sensitive lookup by tag name. Unknown names map to `unrecognized`.
[[nodiscard]] element_kind classify_element(const std::string_view name) noexcept;

// Closed implicitly by the next sibling of the same kind or by the end tag
// of an enclosing element.
[[nodiscard]] bool is_implicitly_closed(const element_kind kind) noexcept;

// Never has content nor a matching end tag.
[[nodiscard]] bool is_void_element(const element_kind kind) noexcept;

} // namespace bbdown
