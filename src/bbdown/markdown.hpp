#pragma once

#include "document.hpp"
#include "element_kind.hpp"

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string_view>

namespace bbdown {

enum class handler_result : unsigned char
{
    handled,     // the handler wrote the node (and its children, if wanted)
    use_default, // apply the built-in conversion
    failed       // abort rendering
};

struct render_context;

// Per-node override, invoked before any built-in conversion.
using element_handler =
    std::function<handler_result(const node&, const render_context&)>;

struct render_context
{
    std::ostream& _sink;
    std::ostream& _err_stream;
    const document& _document;
    element_handler _write_element_fn;
    void* _user_data;
    std::optional<std::uint8_t> _convert_tab_size;
};

struct markdown_options
{
    element_handler write_element_fn{};
    void* user_data = nullptr;
    std::optional<std::uint8_t> convert_tab_size{};
};

[[nodiscard]] bool render_document(const document& doc, std::ostream& sink,
    std::ostream& err_stream, const markdown_options& options = {});

// Renders the children of `root`, in order.
[[nodiscard]] bool render(const node& root, const render_context& ctx);

[[nodiscard]] bool write_element(
    const node& n, const element_kind kind, const render_context& ctx);

[[nodiscard]] bool write_text_element(const node& n, const render_context& ctx);

} // namespace bbdown
