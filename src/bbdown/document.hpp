#pragma once

#include "tokenizer.hpp"

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bbdown {

enum class node_type : unsigned char
{
    document,
    element,
    text
};

[[nodiscard]] std::string_view node_type_str(const node_type type) noexcept;

class node
{
private:
    friend class tree_builder;

    node_type _type;
    token _token; // empty for the document root
    node* _parent;
    std::vector<std::unique_ptr<node>> _children;

    node* append_child(std::unique_ptr<node> child);

public:
    [[nodiscard]] explicit node(
        const node_type type, const token& source_token = {}) noexcept;

    node(const node&) = delete;
    node& operator=(const node&) = delete;

    // Tears the subtree down iteratively, so depth is not bounded by the
    // call stack.
    ~node();

    [[nodiscard]] node_type type() const noexcept
    {
        return _type;
    }

    [[nodiscard]] bool is_element() const noexcept
    {
        return _type == node_type::element;
    }

    [[nodiscard]] bool is_text() const noexcept
    {
        return _type == node_type::text;
    }

    // Tag name for elements, content for text nodes, empty for the root.
    [[nodiscard]] std::string_view name() const noexcept
    {
        return _token._name;
    }

    [[nodiscard]] std::optional<std::string_view> value() const noexcept
    {
        return _token._value;
    }

    // Exact source bytes of the opening tag (or of the text).
    [[nodiscard]] std::string_view raw() const noexcept
    {
        return _token._raw;
    }

    [[nodiscard]] const node* parent() const noexcept
    {
        return _parent;
    }

    [[nodiscard]] const std::vector<std::unique_ptr<node>>& children()
        const noexcept
    {
        return _children;
    }

    // Content of a text node, or the concatenation of every descendant text
    // node otherwise.
    [[nodiscard]] std::string text() const;

    // Pre-order, starting with `*this`.
    template <typename F>
    void walk(F&& f) const
    {
        std::vector<const node*> pending{this};

        while (!pending.empty())
        {
            const node* const n = pending.back();
            pending.pop_back();

            f(*n);

            for (auto it = n->_children.rbegin(); it != n->_children.rend();
                 ++it)
            {
                pending.push_back(it->get());
            }
        }
    }
};

// Owns the token result its nodes point into, so a document can be moved
// around freely without invalidating any node span.
class document
{
private:
    std::unique_ptr<token_result> _tokens;
    std::unique_ptr<node> _root;

public:
    [[nodiscard]] document();
    [[nodiscard]] explicit document(token_result&& tokens);

    document(document&&) noexcept = default;
    document& operator=(document&&) noexcept = default;

    [[nodiscard]] const node& root() const noexcept
    {
        return *_root;
    }

    [[nodiscard]] const token_result& tokens() const noexcept
    {
        return *_tokens;
    }
};

[[nodiscard]] bool load_document(const tokenizer_config& cfg, document& output,
    std::istream& source, std::ostream& err_stream);

[[nodiscard]] document load_document(
    const tokenizer_config& cfg, const std::string_view source);

void print_tree(const node& root, std::ostream& os);

} // namespace bbdown
