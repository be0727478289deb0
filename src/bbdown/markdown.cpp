#include "markdown.hpp"

#include "document.hpp"
#include "element_kind.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <cstddef>

namespace bbdown {

namespace {

[[nodiscard]] bool check_sink(const render_context& ctx)
{
    if (ctx._sink)
    {
        return true;
    }

    ctx._err_stream << "((IO ERROR)): Failed writing markdown output\n\n";
    return false;
}

// Doubles every newline (when requested) and expands tabs to
// `convert_tab_size` spaces, in that order.
[[nodiscard]] std::string convert_text(const std::string_view text,
    const bool double_newlines,
    const std::optional<std::uint8_t> convert_tab_size)
{
    std::string result;
    result.reserve(text.size());

    for (const char c : text)
    {
        if (c == '\n' && double_newlines)
        {
            result.append(2, '\n');
            continue;
        }

        if (c == '\t' && convert_tab_size.has_value())
        {
            result.append(*convert_tab_size, ' ');
            continue;
        }

        result.append(1, c);
    }

    return result;
}

void write_all_children_text(const node& n, const render_context& ctx)
{
    n.walk(
        [&](const node& child)
        {
            if (child.is_text())
            {
                ctx._sink << convert_text(
                    child.name(), false, ctx._convert_tab_size);
            }
        });
}

[[nodiscard]] bool write_link_element(
    const node& n, const std::string_view scheme, const render_context& ctx)
{
    if (const std::optional<std::string_view> value = n.value();
        value.has_value())
    {
        ctx._sink << '[';
        write_all_children_text(n, ctx);
        ctx._sink << "](" << scheme << *value << ')';
    }
    else
    {
        const std::string text = n.text();
        ctx._sink << '[' << text << "](" << scheme << text << ')';
    }

    return check_sink(ctx);
}

[[nodiscard]] bool write_horizontal_rule_element(const render_context& ctx)
{
    ctx._sink << "\n---\n";
    return check_sink(ctx);
}

// `[*]` has no end tag, so items may end up nested into each other depending
// on how the source was written. Walking the whole subtree in pre-order and
// numbering items as they are met flattens any such nesting.
[[nodiscard]] bool write_list_element(const node& n, const render_context& ctx)
{
    std::size_t n_items = 0;
    bool ok = true;

    n.walk(
        [&](const node& child)
        {
            if (!ok)
            {
                return;
            }

            if (child.is_element() &&
                classify_element(child.name()) == element_kind::list_item)
            {
                ++n_items;
                ctx._sink << n_items << ". ";
                return;
            }

            if (child.is_text())
            {
                ok = write_text_element(child, ctx);

                if (ok && !child.name().ends_with('\n'))
                {
                    ctx._sink << '\n';
                }
            }
        });

    return ok && check_sink(ctx);
}

enum class element_step : unsigned char
{
    done,    // fully written, children included
    descend, // render the children, then close the element
    failed
};

[[nodiscard]] element_step to_step(const bool ok) noexcept
{
    return ok ? element_step::done : element_step::failed;
}

[[nodiscard]] element_step open_element(
    const node& n, const element_kind kind, const render_context& ctx)
{
    switch (kind)
    {
        case element_kind::bold: ctx._sink << "**"; break;
        case element_kind::italic: ctx._sink << '*'; break;
        case element_kind::code: ctx._sink << '`'; break;
        case element_kind::blockquote: ctx._sink << "> "; break;
        case element_kind::unrecognized: ctx._sink << n.raw(); break;

        case element_kind::list_item:
        case element_kind::underline: break;

        case element_kind::link:
            return to_step(write_link_element(n, "", ctx));
        case element_kind::email:
            return to_step(write_link_element(n, "mailto:", ctx));
        case element_kind::horizontal_rule:
            return to_step(write_horizontal_rule_element(ctx));
        case element_kind::list: return to_step(write_list_element(n, ctx));
    }

    return element_step::descend;
}

[[nodiscard]] bool close_element(
    const node& n, const element_kind kind, const render_context& ctx)
{
    switch (kind)
    {
        case element_kind::bold: ctx._sink << "**"; break;
        case element_kind::italic: ctx._sink << '*'; break;
        case element_kind::code: ctx._sink << '`'; break;

        case element_kind::unrecognized:
            ctx._err_stream << "((BBDOWN WARNING)): Unsupported bbcode tag: "
                            << n.raw() << '\n';
            break;

        default: break;
    }

    return check_sink(ctx);
}

struct render_frame
{
    const node* _node;
    std::size_t _next_child;
    bool _close; // false for the node `render` was called on
};

// Depth-first over the children of `start._node`, with an explicit stack so
// that nesting depth is not bounded by the call stack.
[[nodiscard]] bool render_frames(
    const render_frame& start, const render_context& ctx)
{
    std::vector<render_frame> frames{start};

    while (!frames.empty())
    {
        render_frame& top = frames.back();
        const node& parent = *top._node;

        if (top._next_child == parent.children().size())
        {
            const bool close = top._close;
            frames.pop_back();

            if (close && !close_element(
                             parent, classify_element(parent.name()), ctx))
            {
                return false;
            }

            continue;
        }

        const node& n = *parent.children()[top._next_child++];

        if (ctx._write_element_fn)
        {
            const handler_result result = ctx._write_element_fn(n, ctx);

            if (result == handler_result::failed)
            {
                return false;
            }

            if (result == handler_result::handled)
            {
                if (!check_sink(ctx))
                {
                    return false;
                }

                continue;
            }
        }

        switch (n.type())
        {
            case node_type::element:
                switch (open_element(n, classify_element(n.name()), ctx))
                {
                    case element_step::done: break;
                    case element_step::failed: return false;
                    case element_step::descend:
                        frames.push_back(render_frame{
                            ._node = &n, ._next_child = 0, ._close = true});
                        break;
                }
                break;

            case node_type::text:
                if (!write_text_element(n, ctx))
                {
                    return false;
                }
                break;

            case node_type::document: break;
        }
    }

    return true;
}

} // namespace

// ----------------------------------------------------------------------------

bool write_text_element(const node& n, const render_context& ctx)
{
    ctx._sink << convert_text(n.name(), true, ctx._convert_tab_size);
    ctx._sink.flush();

    return check_sink(ctx);
}

bool write_element(
    const node& n, const element_kind kind, const render_context& ctx)
{
    switch (open_element(n, kind, ctx))
    {
        case element_step::done: return true;
        case element_step::failed: return false;
        case element_step::descend: break;
    }

    return render_frames(
        render_frame{._node = &n, ._next_child = 0, ._close = true}, ctx);
}

bool render(const node& root, const render_context& ctx)
{
    return render_frames(
        render_frame{._node = &root, ._next_child = 0, ._close = false}, ctx);
}

bool render_document(const document& doc, std::ostream& sink,
    std::ostream& err_stream, const markdown_options& options)
{
    const render_context ctx{
        ._sink = sink,
        ._err_stream = err_stream,
        ._document = doc,
        ._write_element_fn = options.write_element_fn,
        ._user_data = options.user_data,
        ._convert_tab_size = options.convert_tab_size //
    };

    if (!render(doc.root(), ctx))
    {
        return false;
    }

    sink.flush();
    return check_sink(ctx);
}

} // namespace bbdown
