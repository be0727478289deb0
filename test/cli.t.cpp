#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <bbdown-converter/cli.hpp>

#include <initializer_list>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace {

// Owns mutable copies of the arguments, as `getopt_long` may permute them.
class arg_list
{
private:
    std::vector<std::string> _storage;
    std::vector<char*> _argv;

public:
    [[nodiscard]] explicit arg_list(
        const std::initializer_list<std::string_view> args)
    {
        _storage.emplace_back("bbdown-converter");

        for (const std::string_view arg : args)
        {
            _storage.emplace_back(arg);
        }

        for (std::string& arg : _storage)
        {
            _argv.push_back(arg.data());
        }

        _argv.push_back(nullptr);
    }

    [[nodiscard]] int argc() const noexcept
    {
        return static_cast<int>(_storage.size());
    }

    [[nodiscard]] char** argv() noexcept
    {
        return _argv.data();
    }
};

[[nodiscard]] bool do_parse(const std::initializer_list<std::string_view> args,
    bbdown::cli_config& cfg, std::ostream& err_stream)
{
    arg_list list{args};
    return bbdown::parse_cli_args(list.argc(), list.argv(), cfg, err_stream);
}

[[nodiscard]] bool diagnostic_contains(
    const std::ostringstream& oss, const std::string_view needle)
{
    return oss.view().find(needle) != std::string_view::npos;
}

} // namespace

TEST_CASE("cli no arguments")
{
    bbdown::cli_config cfg;
    std::ostringstream err;

    REQUIRE(do_parse({}, cfg, err));

    CHECK(!cfg.input.has_value());
    CHECK(!cfg.output.has_value());
    CHECK(!cfg.script.has_value());
    CHECK(!cfg.converter_cfg.convert_tab_size.has_value());
    CHECK(!cfg.converter_cfg.verbose);
    CHECK(cfg.converter_cfg.tokenizer.equals_required_in_parameters);
    REQUIRE(cfg.converter_cfg.tokenizer.verbatim_tags.size() == 1);
    CHECK(cfg.converter_cfg.tokenizer.verbatim_tags[0] == "code");
    CHECK(err.str().empty());
}

TEST_CASE("cli separate and attached values")
{
    bbdown::cli_config cfg;
    std::ostringstream err;

    REQUIRE(do_parse({"--input", "in.bbcode", "--output=out.md",
                         "--script=handlers.js", "--convert_tab_size", "4"},
        cfg, err));

    CHECK(cfg.input == "in.bbcode");
    CHECK(cfg.output == "out.md");
    CHECK(cfg.script == "handlers.js");
    CHECK(cfg.converter_cfg.convert_tab_size == 4);
}

TEST_CASE("cli flags")
{
    bbdown::cli_config cfg;
    std::ostringstream err;

    REQUIRE(do_parse({"--no-equals-required", "--verbose"}, cfg, err));

    CHECK(!cfg.converter_cfg.tokenizer.equals_required_in_parameters);
    CHECK(cfg.converter_cfg.verbose);
}

TEST_CASE("cli verbatim tags replace the default")
{
    bbdown::cli_config cfg;
    std::ostringstream err;

    REQUIRE(do_parse(
        {"--verbatim", "noparse", "--verbatim=pre", "--verbatim", "code"}, cfg,
        err));

    const std::vector<std::string>& tags =
        cfg.converter_cfg.tokenizer.verbatim_tags;

    REQUIRE(tags.size() == 3);
    CHECK(tags[0] == "noparse");
    CHECK(tags[1] == "pre");
    CHECK(tags[2] == "code");
}

TEST_CASE("cli invalid tab size")
{
    for (const std::string_view value : {"256", "-1", "four", ""})
    {
        bbdown::cli_config cfg;
        std::ostringstream err;

        const std::string arg = "--convert_tab_size=" + std::string{value};
        REQUIRE(!do_parse({arg}, cfg, err));

        CHECK(diagnostic_contains(err,
            "convert_tab_size must be an integer in range of [0, 255]"));
        CHECK(!cfg.converter_cfg.convert_tab_size.has_value());
    }
}

TEST_CASE("cli missing value")
{
    bbdown::cli_config cfg;
    std::ostringstream err;

    REQUIRE(!do_parse({"--input"}, cfg, err));
    CHECK(diagnostic_contains(err, "((BBDOWN ERROR)): Missing value for"));
}

TEST_CASE("cli unknown option")
{
    bbdown::cli_config cfg;
    std::ostringstream err;

    REQUIRE(!do_parse({"--frobnicate"}, cfg, err));
    CHECK(diagnostic_contains(err, "((BBDOWN ERROR)): Unknown argument"));
    CHECK(diagnostic_contains(err, "usage: bbdown-converter"));
}

TEST_CASE("cli positional argument")
{
    bbdown::cli_config cfg;
    std::ostringstream err;

    REQUIRE(!do_parse({"file.bbcode"}, cfg, err));
    CHECK(diagnostic_contains(
        err, "((BBDOWN ERROR)): Unexpected argument 'file.bbcode'"));
}

TEST_CASE("cli parses repeatedly")
{
    std::ostringstream err;

    bbdown::cli_config first;
    REQUIRE(do_parse({"--input", "a"}, first, err));
    CHECK(first.input == "a");

    bbdown::cli_config second;
    REQUIRE(do_parse({"--output", "b"}, second, err));
    CHECK(!second.input.has_value());
    CHECK(second.output == "b");
}
