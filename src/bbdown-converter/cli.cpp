#include "cli.hpp"

#include <bbdown/tab_width.hpp>

#include <getopt.h>

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace bbdown {

namespace {

enum option_id : int
{
    opt_input = 1,
    opt_output,
    opt_convert_tab_size,
    opt_script,
    opt_verbatim,
    opt_no_equals_required,
    opt_verbose
};

constexpr option long_options[] = {
    {"input", required_argument, nullptr, opt_input},
    {"output", required_argument, nullptr, opt_output},
    {"convert_tab_size", required_argument, nullptr, opt_convert_tab_size},
    {"script", required_argument, nullptr, opt_script},
    {"verbatim", required_argument, nullptr, opt_verbatim},
    {"no-equals-required", no_argument, nullptr, opt_no_equals_required},
    {"verbose", no_argument, nullptr, opt_verbose},
    {nullptr, 0, nullptr, 0} //
};

} // namespace

void print_usage(std::ostream& os)
{
    os << "usage: bbdown-converter [--input <file>] [--output <file>]\n"
          "                        [--convert_tab_size <0-255>]\n"
          "                        [--script <file.js>] [--verbatim <tag>]...\n"
          "                        [--no-equals-required] [--verbose]\n";
}

bool parse_cli_args(
    const int argc, char** argv, cli_config& cfg, std::ostream& err_stream)
{
    bool verbatim_overridden = false;

    // Zero makes glibc reinitialize its scanning state.
    optind = 0;
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, ":", long_options, nullptr)) != -1)
    {
        switch (opt)
        {
            case opt_input: cfg.input = optarg; break;
            case opt_output: cfg.output = optarg; break;
            case opt_script: cfg.script = optarg; break;

            case opt_convert_tab_size:
            {
                std::uint8_t tab_size = 0;
                if (parse_tab_width(optarg, tab_size).has_value())
                {
                    err_stream << "((BBDOWN ERROR)): convert_tab_size must be "
                                  "an integer in range of [0, 255]\n\n";

                    return false;
                }

                cfg.converter_cfg.convert_tab_size = tab_size;
                break;
            }

            case opt_verbatim:
            {
                std::vector<std::string>& tags =
                    cfg.converter_cfg.tokenizer.verbatim_tags;

                if (!verbatim_overridden)
                {
                    tags.clear();
                    verbatim_overridden = true;
                }

                tags.emplace_back(optarg);
                break;
            }

            case opt_no_equals_required:
                cfg.converter_cfg.tokenizer.equals_required_in_parameters =
                    false;
                break;

            case opt_verbose: cfg.converter_cfg.verbose = true; break;

            case ':':
                err_stream << "((BBDOWN ERROR)): Missing value for '"
                           << argv[optind - 1] << "'\n\n";

                return false;

            default:
                err_stream << "((BBDOWN ERROR)): Unknown argument '"
                           << argv[optind - 1] << "'\n\n";

                print_usage(err_stream);
                return false;
        }
    }

    if (optind < argc)
    {
        err_stream << "((BBDOWN ERROR)): Unexpected argument '" << argv[optind]
                   << "'\n\n";

        print_usage(err_stream);
        return false;
    }

    return true;
}

} // namespace bbdown
