#include "converter.hpp"

#include "document.hpp"
#include "markdown.hpp"
#include "tokenizer.hpp"

#include <istream>
#include <memory>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace bbdown {

class converter::state
{
public:
    std::ostream& _err_stream;
    element_handler _element_handler;

    [[nodiscard]] explicit state(std::ostream& err_stream) noexcept
        : _err_stream{err_stream}
    {}

    [[nodiscard]] bool render(
        const config& cfg, std::ostream& sink, const document& doc)
    {
        if (cfg.verbose)
        {
            print_tokens(doc.tokens(), _err_stream);
            print_tree(doc.root(), _err_stream);
        }

        return render_document(doc, sink, _err_stream,
            markdown_options{
                .write_element_fn = _element_handler,
                .user_data = nullptr,
                .convert_tab_size = cfg.convert_tab_size //
            });
    }
};

converter::converter(std::ostream& err_stream)
    : _state{std::make_unique<state>(err_stream)}
{}

converter::~converter() = default;

void converter::set_element_handler(element_handler handler)
{
    _state->_element_handler = std::move(handler);
}

bool converter::convert(const config& cfg, std::string& output_buffer,
    const std::string_view source)
{
    const document doc = load_document(cfg.tokenizer, source);

    std::ostringstream oss;
    if (!_state->render(cfg, oss, doc))
    {
        return false;
    }

    output_buffer.append(oss.view());
    return true;
}

bool converter::convert(
    const config& cfg, std::ostream& sink, std::istream& source)
{
    document doc;
    if (!load_document(cfg.tokenizer, doc, source, _state->_err_stream))
    {
        return false;
    }

    return _state->render(cfg, sink, doc);
}

} // namespace bbdown
