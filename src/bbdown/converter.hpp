#pragma once

#include "markdown.hpp"
#include "tokenizer.hpp"

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace bbdown {

class converter
{
private:
    class state;

    std::unique_ptr<state> _state;

public:
    struct config
    {
        tokenizer_config tokenizer{};
        std::optional<std::uint8_t> convert_tab_size{};
        bool verbose = false;
    };

    [[nodiscard]] explicit converter(std::ostream& err_stream);
    ~converter();

    void set_element_handler(element_handler handler);

    [[nodiscard]] bool convert(const config& cfg, std::string& output_buffer,
        const std::string_view source);

    [[nodiscard]] bool convert(
        const config& cfg, std::ostream& sink, std::istream& source);
};

} // namespace bbdown
