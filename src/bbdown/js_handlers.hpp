#pragma once

#include "document.hpp"
#include "markdown.hpp"

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string_view>

namespace bbdown {

// Element handlers written in JavaScript. A script registers functions on the
// global `bbdown.handlers` object, keyed by tag name:
//
//     bbdown.handlers.spoiler = (el) => `||${el.text}||`;
//
// A handler receives `{name, value, text, raw}` and returns the string to
// write, or `undefined` to fall back to the built-in conversion.
class js_handlers
{
private:
    struct impl;
    std::unique_ptr<impl> _impl;

public:
    struct error
    {
        std::size_t _line;
    };

    [[nodiscard]] explicit js_handlers(std::ostream& err_stream);
    ~js_handlers();

    [[nodiscard]] std::optional<error> load_script(
        const std::string_view source) noexcept;

    [[nodiscard]] std::optional<error> load_file(
        const std::string_view path) noexcept;

    [[nodiscard]] bool has_handler(const std::string_view name);

    [[nodiscard]] handler_result write_element(
        const node& n, std::ostream& sink);

    // The returned handler refers to `*this`, which must outlive it.
    [[nodiscard]] element_handler as_element_handler();
};

} // namespace bbdown
