#include "document.hpp"

#include "element_kind.hpp"
#include "tokenizer.hpp"

#include <iterator>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <cassert>
#include <cstddef>

namespace bbdown {

std::string_view node_type_str(const node_type type) noexcept
{
    switch (type)
    {
        case node_type::document: return "document";
        case node_type::element: return "element";
        case node_type::text: return "text";
    }

    return "unknown";
}

node::node(const node_type type, const token& source_token) noexcept
    : _type{type}, _token{source_token}, _parent{nullptr}
{}

node::~node()
{
    std::vector<std::unique_ptr<node>> pending = std::move(_children);

    while (!pending.empty())
    {
        std::unique_ptr<node> n = std::move(pending.back());
        pending.pop_back();

        for (std::unique_ptr<node>& child : n->_children)
        {
            pending.push_back(std::move(child));
        }

        n->_children.clear();
    }
}

node* node::append_child(std::unique_ptr<node> child)
{
    assert(_type != node_type::text);

    child->_parent = this;
    _children.push_back(std::move(child));

    return _children.back().get();
}

std::string node::text() const
{
    if (_type == node_type::text)
    {
        return std::string{_token._name};
    }

    std::string result;

    walk(
        [&](const node& n)
        {
            if (n.is_text())
            {
                result.append(n.name());
            }
        });

    return result;
}

// ----------------------------------------------------------------------------

// Turns the flat token sequence into a tree. Mismatched end tags are ignored,
// and elements still open at the end of input are closed by the document end.
class tree_builder
{
private:
    node& _root;
    std::vector<node*> _open_elements;

    [[nodiscard]] node& current_node() noexcept
    {
        return _open_elements.empty() ? _root : *_open_elements.back();
    }

    void generate_implied_end_tags()
    {
        while (!_open_elements.empty() &&
               is_implicitly_closed(
                   classify_element(_open_elements.back()->name())))
        {
            _open_elements.pop_back();
        }
    }

    void insert_text(const token& t)
    {
        current_node().append_child(
            std::make_unique<node>(node_type::text, t));
    }

    void insert_element(const token& t)
    {
        const element_kind kind = classify_element(t._name);

        // `[*]` has no end tag: a new item closes the previous one.
        if (is_implicitly_closed(kind))
        {
            generate_implied_end_tags();
        }

        node* const element = current_node().append_child(
            std::make_unique<node>(node_type::element, t));

        if (!is_void_element(kind))
        {
            _open_elements.push_back(element);
        }
    }

    void close_element(const token& t)
    {
        auto it = _open_elements.rbegin();

        while (it != _open_elements.rend() && (*it)->name() != t._name &&
               is_implicitly_closed(classify_element((*it)->name())))
        {
            ++it;
        }

        if (it == _open_elements.rend() || (*it)->name() != t._name)
        {
            return;
        }

        _open_elements.erase(std::prev(it.base()), _open_elements.end());
    }

public:
    [[nodiscard]] explicit tree_builder(node& root) noexcept : _root{root}
    {}

    void process_token(const token& t)
    {
        switch (t._type)
        {
            case token_type::text: insert_text(t); break;
            case token_type::element: insert_element(t); break;
            case token_type::closing_element: close_element(t); break;
        }
    }
};

// ----------------------------------------------------------------------------

document::document()
    : _tokens{std::make_unique<token_result>()},
      _root{std::make_unique<node>(node_type::document)}
{}

document::document(token_result&& tokens) : document{}
{
    *_tokens = std::move(tokens);

    tree_builder builder{*_root};
    for (std::size_t i = 0; i < _tokens->size(); ++i)
    {
        builder.process_token(_tokens->at(i));
    }
}

bool load_document(const tokenizer_config& cfg, document& output,
    std::istream& source, std::ostream& err_stream)
{
    token_result tokens;
    if (!tokenize(cfg, tokens, source, err_stream))
    {
        return false;
    }

    output = document{std::move(tokens)};
    return true;
}

document load_document(
    const tokenizer_config& cfg, const std::string_view source)
{
    token_result tokens;
    const bool ok = tokenize(cfg, tokens, source);

    assert(ok); // in-memory sources cannot fail
    (void)ok;

    return document{std::move(tokens)};
}

void print_tree(const node& root, std::ostream& os)
{
    std::vector<std::pair<const node*, std::size_t>> pending{{&root, 0}};

    while (!pending.empty())
    {
        const auto [n, depth] = pending.back();
        pending.pop_back();

        os << std::string(depth * 2, ' ') << node_type_str(n->type());

        if (n->type() != node_type::document)
        {
            os << " \"" << n->name() << '"';
        }

        if (n->is_element())
        {
            os << " (" << element_kind_str(classify_element(n->name())) << ')';
        }

        if (const auto value = n->value(); value.has_value())
        {
            os << " = \"" << *value << '"';
        }

        os << '\n';

        const std::vector<std::unique_ptr<node>>& children = n->children();
        for (auto it = children.rbegin(); it != children.rend(); ++it)
        {
            pending.emplace_back(it->get(), depth + 1);
        }
    }
}

} // namespace bbdown
