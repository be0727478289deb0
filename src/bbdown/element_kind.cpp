#include "element_kind.hpp"

#include <array>
#include <string_view>
#include <utility>

namespace bbdown {

namespace {

using namespace std::string_view_literals;

constexpr std::array<std::pair<std::string_view, element_kind>, 11>
    element_table{{
        {"b"sv, element_kind::bold},
        {"i"sv, element_kind::italic},
        {"url"sv, element_kind::link},
        {"email"sv, element_kind::email},
        {"code"sv, element_kind::code},
        {"line"sv, element_kind::horizontal_rule},
        {"hr"sv, element_kind::horizontal_rule},
        {"quote"sv, element_kind::blockquote},
        {"list"sv, element_kind::list},
        {"*"sv, element_kind::list_item},
        {"u"sv, element_kind::underline} //
    }};

} // namespace

std::string_view element_kind_str(const element_kind kind) noexcept
{
    switch (kind)
    {
        case element_kind::bold: return "bold";
        case element_kind::italic: return "italic";
        case element_kind::link: return "link";
        case element_kind::email: return "email";
        case element_kind::code: return "code";
        case element_kind::horizontal_rule: return "horizontal_rule";
        case element_kind::blockquote: return "blockquote";
        case element_kind::list: return "list";
        case element_kind::list_item: return "list_item";
        case element_kind::underline: return "underline";
        case element_kind::unrecognized: return "unrecognized";
    }

    return "unknown";
}

element_kind classify_element(const std::string_view name) noexcept
{
    for (const auto& [tag_name, kind] : element_table)
    {
        if (tag_name == name)
        {
            return kind;
        }
    }

    return element_kind::unrecognized;
}

bool is_implicitly_closed(const element_kind kind) noexcept
{
    return kind == element_kind::list_item;
}

bool is_void_element(const element_kind kind) noexcept
{
    return kind == element_kind::horizontal_rule;
}

} // namespace bbdown
