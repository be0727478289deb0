#pragma once

#include <bbdown/converter.hpp>

#include <iosfwd>
#include <optional>
#include <string>

namespace bbdown {

struct cli_config
{
    std::optional<std::string> input;
    std::optional<std::string> output;
    std::optional<std::string> script;
    converter::config converter_cfg;
};

void print_usage(std::ostream& os);

// Parses `--input`, `--output`, `--convert_tab_size`, `--script`,
// `--verbatim` (repeatable), `--no-equals-required` and `--verbose`. Values
// are accepted both as `--opt value` and `--opt=value`. Reports problems to
// `err_stream` and returns `false` on the first one.
[[nodiscard]] bool parse_cli_args(
    const int argc, char** argv, cli_config& cfg, std::ostream& err_stream);

} // namespace bbdown
