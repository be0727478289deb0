#include "tokenizer.hpp"

#include <algorithm>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <cassert>
#include <cstddef>

namespace bbdown {

std::string_view token_type_str(const token_type type) noexcept
{
    switch (type)
    {
        case token_type::text: return "text";
        case token_type::element: return "element";
        case token_type::closing_element: return "closing_element";
    }

    return "unknown";
}

std::string_view get_tag_name(const std::string_view tag) noexcept
{
    if (tag.size() <= 2)
    {
        return {};
    }

    const std::size_t tn_start = tag[1] == '/' ? 2 : 1;

    const std::size_t tn_end = [&]
    {
        const std::size_t sep = tag.find_first_of(" =", tn_start + 1);
        return sep == std::string_view::npos ? tag.size() - 1 : sep;
    }();

    if (tn_end <= tn_start)
    {
        return {};
    }

    return tag.substr(tn_start, tn_end - tn_start);
}

token token_result::at(const std::size_t i) const
{
    assert(i < _locations.size());

    const token_location& loc = _locations[i];
    const std::string_view buffer{_buffer};
    const std::string_view raw =
        buffer.substr(loc._base._start, loc._base.size());

    if (loc._type == token_type::text)
    {
        return token{._type = loc._type,
            ._name = raw,
            ._value = std::nullopt,
            ._raw = raw};
    }

    std::optional<std::string_view> value;
    if (loc._parameter.has_value())
    {
        value = buffer.substr(loc._parameter->_start, loc._parameter->size());
    }

    return token{._type = loc._type,
        ._name = get_tag_name(raw),
        ._value = value,
        ._raw = raw};
}

void token_result::clear() noexcept
{
    _buffer.clear();
    _locations.clear();
}

// ----------------------------------------------------------------------------

namespace {

class istream_source
{
private:
    std::istream& _is;

public:
    [[nodiscard]] explicit istream_source(std::istream& is) noexcept : _is{is}
    {}

    [[nodiscard]] std::optional<char> take_byte()
    {
        char c;
        if (!_is.get(c))
        {
            return std::nullopt;
        }

        return c;
    }

    [[nodiscard]] bool failed() const noexcept
    {
        return _is.bad();
    }
};

class buffer_source
{
private:
    const std::string_view _source;
    std::size_t _curr_idx;

public:
    [[nodiscard]] explicit buffer_source(const std::string_view source) noexcept
        : _source{source}, _curr_idx{0}
    {}

    [[nodiscard]] std::optional<char> take_byte() noexcept
    {
        if (_curr_idx >= _source.size())
        {
            return std::nullopt;
        }

        return _source[_curr_idx++];
    }

    [[nodiscard]] bool failed() const noexcept
    {
        return false;
    }
};

[[nodiscard]] bool can_be_escaped(const char c) noexcept
{
    return c == '[' || c == ']' || c == '=' || c == ' ';
}

} // namespace

// ----------------------------------------------------------------------------

template <typename Source>
class tokenizer_pass
{
private:
    enum class state : unsigned char
    {
        text,
        element,
        closing_element,
        element_with_parameter
    };

    const tokenizer_config& _cfg;
    Source& _source;
    token_result& _output;

    state _state;
    std::size_t _start;
    std::optional<std::size_t> _param_start;
    std::optional<std::string> _verbatim_tag;

    [[nodiscard]] std::string& get_buffer() noexcept
    {
        return _output._buffer;
    }

    [[nodiscard]] bool is_verbatim_tag(const std::string_view tag_name) const
    {
        return std::find(_cfg.verbatim_tags.begin(), _cfg.verbatim_tags.end(),
                   tag_name) != _cfg.verbatim_tags.end();
    }

    [[nodiscard]] bool is_element_valid(const std::string_view slice) const
    {
        if (_verbatim_tag.has_value() && *_verbatim_tag != get_tag_name(slice))
        {
            return false;
        }

        if (_cfg.equals_required_in_parameters &&
            slice.find(' ') != std::string_view::npos &&
            slice.find('=') == std::string_view::npos)
        {
            return false;
        }

        return slice.size() >= 3;
    }

    void push_text(const std::size_t end_idx)
    {
        if (end_idx <= _start)
        {
            return;
        }

        _output._locations.push_back(token_location{
            ._base = {._start = _start, ._end = end_idx},
            ._type = token_type::text,
            ._parameter = std::nullopt //
        });
    }

    void enter_parameter(const std::size_t curr_idx) noexcept
    {
        _param_start = curr_idx + 1;
        _state = state::element_with_parameter;
    }

    void process_open_bracket(const std::size_t curr_idx)
    {
        if (_state != state::text)
        {
            return;
        }

        push_text(curr_idx);

        _state = state::element;
        _start = curr_idx;
    }

    void process_close_bracket(const std::size_t curr_idx)
    {
        if (_state == state::text)
        {
            return;
        }

        const std::string_view slice =
            std::string_view{get_buffer()}.substr(_start, curr_idx + 1 - _start);

        // An invalid slice stays part of the pending text: `_start` is left
        // untouched so the next text location swallows it.
        if (is_element_valid(slice))
        {
            const std::string_view tag_name = get_tag_name(slice);
            const bool closing = _state == state::closing_element;

            if (is_verbatim_tag(tag_name))
            {
                if (closing)
                {
                    _verbatim_tag.reset();
                }
                else
                {
                    _verbatim_tag.emplace(tag_name);
                }
            }

            std::optional<location> parameter;
            if (!closing && _param_start.has_value())
            {
                parameter = location{._start = *_param_start, ._end = curr_idx};
            }

            _output._locations.push_back(token_location{
                ._base = {._start = _start, ._end = curr_idx + 1},
                ._type =
                    closing ? token_type::closing_element : token_type::element,
                ._parameter = parameter //
            });

            _start = curr_idx + 1;
        }

        _state = state::text;
        _param_start.reset();
    }

    void process_byte(const char c, const std::size_t curr_idx)
    {
        switch (c)
        {
            case '[': process_open_bracket(curr_idx); break;

            case ']': process_close_bracket(curr_idx); break;

            case ' ':
                if (_state == state::element &&
                    !_cfg.equals_required_in_parameters)
                {
                    enter_parameter(curr_idx);
                }
                break;

            case '=':
                if (_state == state::element)
                {
                    enter_parameter(curr_idx);
                }
                break;

            case '/':
                if (_state == state::element && curr_idx == _start + 1)
                {
                    _state = state::closing_element;
                }
                break;

            default: break;
        }
    }

    // Merges runs of adjacent text locations into the first one of the run.
    void compact_text_tokens() noexcept
    {
        std::vector<token_location>& locations = _output._locations;

        std::size_t write_idx = 0;
        for (std::size_t read_idx = 0; read_idx < locations.size();
             ++read_idx, ++write_idx)
        {
            token_location current = locations[read_idx];

            if (current._type == token_type::text)
            {
                while (read_idx + 1 < locations.size() &&
                       locations[read_idx + 1]._type == token_type::text)
                {
                    ++read_idx;
                    current._base._end = locations[read_idx]._base._end;
                }
            }

            locations[write_idx] = current;
        }

        locations.resize(write_idx);
    }

public:
    [[nodiscard]] explicit tokenizer_pass(
        const tokenizer_config& cfg, Source& source, token_result& output)
        : _cfg{cfg},
          _source{source},
          _output{output},
          _state{state::text},
          _start{0}
    {}

    [[nodiscard]] bool tokenize()
    {
        std::string& buffer = get_buffer();

        while (const std::optional<char> byte = _source.take_byte())
        {
            char c = *byte;
            bool escaped = false;

            if (c == '\\')
            {
                const std::optional<char> next = _source.take_byte();
                if (!next.has_value())
                {
                    buffer.append(1, c);
                    break;
                }

                if (can_be_escaped(*next))
                {
                    escaped = true;
                }
                else
                {
                    buffer.append(1, c);
                }

                c = *next;
            }

            const std::size_t curr_idx = buffer.size();
            buffer.append(1, c);

            if (!escaped)
            {
                process_byte(c, curr_idx);
            }
        }

        if (_source.failed())
        {
            return false;
        }

        push_text(buffer.size());
        compact_text_tokens();

        return true;
    }
};

// ----------------------------------------------------------------------------

bool tokenize(const tokenizer_config& cfg, token_result& output,
    std::istream& source, std::ostream& err_stream)
{
    output.clear();

    istream_source is_source{source};
    if (!tokenizer_pass<istream_source>{cfg, is_source, output}.tokenize())
    {
        err_stream << "((IO ERROR)): Failed reading bbcode source\n\n";
        output.clear();
        return false;
    }

    return true;
}

bool tokenize(const tokenizer_config& cfg, token_result& output,
    const std::string_view source)
{
    output.clear();
    output.reserve(source.size());

    buffer_source buf_source{source};
    return tokenizer_pass<buffer_source>{cfg, buf_source, output}.tokenize();
}

void print_tokens(const token_result& tokens, std::ostream& os)
{
    os << "token_result:\n";

    os << "  buffer:\n" << tokens.buffer() << "\n\n";

    os << "  locations:\n";
    for (std::size_t i = 0; i < tokens.size(); ++i)
    {
        const token_location& loc = tokens.locations()[i];

        os << "    [" << i << "]: start=" << loc._base._start
           << " end=" << loc._base._end << " type=" << token_type_str(loc._type);

        if (loc._parameter.has_value())
        {
            os << " p_start=" << loc._parameter->_start
               << " p_end=" << loc._parameter->_end;
        }

        os << '\n';
    }
    os << "\n\n";

    os << "  tokens:\n";
    for (std::size_t i = 0; i < tokens.size(); ++i)
    {
        const token t = tokens.at(i);

        os << "    [" << i << "]: " << token_type_str(t._type) << " \""
           << t._name << "\" " << t._value.value_or("") << '\n';
    }
}

} // namespace bbdown
