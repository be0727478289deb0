#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <cstddef>

namespace bbdown {

struct tokenizer_config
{
    // Tags whose content is never split into nested elements.
    std::vector<std::string> verbatim_tags{"code"};

    // When `false`, `[tag param]` is accepted alongside `[tag=param]`.
    bool equals_required_in_parameters = true;
};

enum class token_type : unsigned char
{
    text,
    element,
    closing_element
};

[[nodiscard]] std::string_view token_type_str(const token_type type) noexcept;

struct location
{
    std::size_t _start;
    std::size_t _end;

    [[nodiscard]] std::size_t size() const noexcept
    {
        return _end - _start;
    }
};

struct token_location
{
    location _base;
    token_type _type;
    std::optional<location> _parameter; // only set for `element`
};

// Decoded view of a token location. All views point into the buffer of the
// `token_result` that produced the token.
struct token
{
    token_type _type;
    std::string_view _name;
    std::optional<std::string_view> _value;
    std::string_view _raw;
};

class token_result
{
private:
    template <typename>
    friend class tokenizer_pass;

    std::string _buffer;
    std::vector<token_location> _locations;

public:
    [[nodiscard]] const std::string& buffer() const noexcept
    {
        return _buffer;
    }

    [[nodiscard]] const std::vector<token_location>& locations() const noexcept
    {
        return _locations;
    }

    [[nodiscard]] std::size_t size() const noexcept
    {
        return _locations.size();
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return _locations.empty();
    }

    [[nodiscard]] token at(const std::size_t i) const;

    void reserve(const std::size_t n_bytes)
    {
        _buffer.reserve(n_bytes);
    }

    void clear() noexcept;
};

// Extracts the tag name out of a bracketed slice such as `[/url]` or
// `[url=x]`. Returns an empty view for `[]`.
[[nodiscard]] std::string_view get_tag_name(const std::string_view tag) noexcept;

[[nodiscard]] bool tokenize(const tokenizer_config& cfg, token_result& output,
    std::istream& source, std::ostream& err_stream);

[[nodiscard]] bool tokenize(const tokenizer_config& cfg, token_result& output,
    const std::string_view source);

void print_tokens(const token_result& tokens, std::ostream& os);

} // namespace bbdown
