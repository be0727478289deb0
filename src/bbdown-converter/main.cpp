#include "cli.hpp"

#include <bbdown/converter.hpp>
#include <bbdown/js_handlers.hpp>

#include <fstream>
#include <iostream>
#include <memory>

int main(int argc, char** argv)
{
    std::ios_base::sync_with_stdio(false);
    std::cin.tie(nullptr);

    bbdown::cli_config cfg;
    if (!bbdown::parse_cli_args(argc, argv, cfg, std::cerr))
    {
        return 1;
    }

    std::ifstream input_file;
    if (cfg.input.has_value())
    {
        input_file.open(*cfg.input, std::ios::binary);
        if (!input_file)
        {
            std::cerr << "((IO ERROR)): Failed to open input file '"
                      << *cfg.input << "'\n\n";

            return 1;
        }
    }

    std::ofstream output_file;
    if (cfg.output.has_value())
    {
        output_file.open(*cfg.output, std::ios::binary | std::ios::trunc);
        if (!output_file)
        {
            std::cerr << "((IO ERROR)): Failed to open output file '"
                      << *cfg.output << "'\n\n";

            return 1;
        }
    }

    std::istream& source = cfg.input.has_value() ? input_file : std::cin;
    std::ostream& sink = cfg.output.has_value() ? output_file : std::cout;

    std::unique_ptr<bbdown::js_handlers> handlers;
    bbdown::converter converter{std::cerr};

    if (cfg.script.has_value())
    {
        handlers = std::make_unique<bbdown::js_handlers>(std::cerr);

        if (handlers->load_file(*cfg.script).has_value())
        {
            return 1;
        }

        converter.set_element_handler(handlers->as_element_handler());
    }

    if (!converter.convert(cfg.converter_cfg, sink, source))
    {
        std::cerr << "((BBDOWN ERROR)): Fatal error during bbcode "
                     "conversion process\n"
                  << std::endl;

        return 2;
    }

    return 0;
}
