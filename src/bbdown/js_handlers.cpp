#include "js_handlers.hpp"

#include "document.hpp"
#include "markdown.hpp"

#include <quickjs.h>

#include <charconv>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

#include <cassert>
#include <cstddef>

namespace bbdown {

[[nodiscard]] static std::ostream*& get_tl_err_stream() noexcept
{
    thread_local std::ostream* err_stream{nullptr};
    return err_stream;
}

// ----------------------------------------------------------------------------

template <auto FPtr>
struct tl_guard
{
    using type = std::remove_reference_t<decltype(FPtr())>;
    const type _prev;

    explicit tl_guard(const type& obj) : _prev{std::exchange(FPtr(), obj)}
    {}

    ~tl_guard()
    {
        FPtr() = std::move(_prev);
    }
};

// ----------------------------------------------------------------------------

constexpr auto js_runtime_deleter = [](JSRuntime* ptr)
{
    JS_RunGC(ptr);
    JS_FreeRuntime(ptr);
};

constexpr auto js_context_deleter = [](JSContext* ptr) { JS_FreeContext(ptr); };

using js_runtime_uptr =
    std::unique_ptr<JSRuntime, decltype(js_runtime_deleter)>;

using js_context_uptr =
    std::unique_ptr<JSContext, decltype(js_context_deleter)>;

struct raii_js_value
{
    JSContext* _context;
    JSValue _value;

    explicit raii_js_value(JSContext* context, JSValue&& value) noexcept
        : _context{context}, _value{std::move(value)}
    {}

    raii_js_value(const raii_js_value&) = delete;
    raii_js_value& operator=(const raii_js_value&) = delete;

    raii_js_value(raii_js_value&& rhs)
        : _context{std::exchange(rhs._context, nullptr)},
          _value{std::move(rhs._value)}
    {}

    raii_js_value& operator=(raii_js_value&& rhs)
    {
        if (_context != nullptr)
        {
            JS_FreeValue(_context, _value);
        }

        _context = std::exchange(rhs._context, nullptr);
        _value = std::move(rhs._value);

        return *this;
    }

    ~raii_js_value()
    {
        if (_context != nullptr)
        {
            JS_FreeValue(_context, _value);
        }
    }
};

// ----------------------------------------------------------------------------

static constexpr std::string_view script_filename = "<bbdownScript>";

static constexpr std::string_view prelude_source =
    "globalThis.bbdown = { handlers: {} };";

// `source` must be null-terminated.
static raii_js_value eval_impl(
    JSContext* context, const std::string_view source) noexcept
{
    return raii_js_value{context, JS_Eval(context, source.data(), source.size(),
                                      script_filename.data(),
                                      JS_EVAL_TYPE_GLOBAL)};
}

[[nodiscard]] static std::string to_std_string(
    JSContext* context, JSValueConst value)
{
    std::size_t len = 0;
    const char* str = JS_ToCStringLen(context, &len, value);

    if (str == nullptr)
    {
        return {};
    }

    std::string result{str, len};
    JS_FreeCString(context, str);

    return result;
}

[[nodiscard]] static std::ostream& error_diagnostic_stream(const char* type)
{
    return (*get_tl_err_stream()) << "((" << type << " ERROR)): ";
}

static void warn(JSContext* context, JSValueConst* argv)
{
    (*get_tl_err_stream()) << "((JS WARNING)): "
                           << to_std_string(context, argv[0]) << '\n';
}

[[nodiscard]] static bool read_file_in_buffer(
    const std::string_view path, std::string& buffer)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
    {
        error_diagnostic_stream("IO")
            << "'" << path << "' is not a regular file\n\n";

        return false;
    }

    std::ifstream ifs(std::string{path}, std::ios::binary | std::ios::ate);
    if (!ifs)
    {
        error_diagnostic_stream("IO")
            << "Failed to open file '" << path << "'\n\n";

        return false;
    }

    const std::streamoff end_pos = ifs.tellg();
    if (end_pos < 0)
    {
        error_diagnostic_stream("IO")
            << "Failed to get the size of file '" << path << "'\n\n";

        return false;
    }

    const auto size = static_cast<std::streamsize>(end_pos);
    ifs.seekg(0, std::ios::beg);

    buffer.clear();
    buffer.resize(size);

    if (!ifs.read(buffer.data(), size))
    {
        error_diagnostic_stream("IO")
            << "Failed to read file '" << path << "'\n\n";

        return false;
    }

    return true;
}

static void set_string_property(JSContext* context, JSValueConst obj,
    const char* name, const std::string_view value)
{
    JS_SetPropertyStr(
        context, obj, name, JS_NewStringLen(context, value.data(), value.size()));
}

// ----------------------------------------------------------------------------

struct js_handlers::impl
{
private:
    tl_guard<&get_tl_err_stream> _err_stream_tl_guard;
    js_runtime_uptr _runtime;
    js_context_uptr _context;

    template <auto FPtr>
    void bind_function(const std::string_view name, const int n_args) noexcept
    {
        auto func = [](JSContext* context, JSValueConst this_val, int argc,
                        JSValueConst* argv) -> JSValue
        {
            (void)this_val;

            if (argc < 1)
            {
                return JS_UNDEFINED;
            }

            FPtr(context, argv);
            return JS_UNDEFINED;
        };

        JSContext* ctx = _context.get();

        const raii_js_value global_obj{ctx, JS_GetGlobalObject(ctx)};

        const JSValue js_func =
            JS_NewCFunction(ctx, +func, name.data(), n_args);

        JS_SetPropertyStr(ctx, global_obj._value, name.data(), js_func);
    }

    [[nodiscard]] std::optional<error> check_js_errors(const JSValue& js_value)
    {
        JSContext* ctx = _context.get();

        if (!JS_IsException(js_value))
        {
            return std::nullopt;
        }

        const raii_js_value js_exception{ctx, JS_GetException(ctx)};

        const raii_js_value js_stack_trace{
            ctx, JS_GetPropertyStr(ctx, js_exception._value, "stack")};

        const std::string js_stack_trace_str =
            to_std_string(ctx, js_stack_trace._value);

        const auto js_stack_trace_line_num = [&]() -> std::optional<std::size_t>
        {
            using namespace std::string_view_literals;

            const std::string_view stack_trace{js_stack_trace_str};
            const auto needle = "(<bbdownScript>:"sv;
            const auto n_begin = stack_trace.find(needle);

            if (n_begin == std::string_view::npos)
            {
                return std::nullopt;
            }

            const auto extr_begin = n_begin + needle.size();
            const char* const first = stack_trace.data() + extr_begin;
            const char* const last = stack_trace.data() + stack_trace.size();

            std::size_t line = 0;
            if (std::from_chars(first, last, line).ec != std::errc{})
            {
                return std::nullopt;
            }

            return line;
        }();

        error_diagnostic_stream("JS")
            << to_std_string(ctx, js_exception._value) << "\n\n"
            << js_stack_trace_str << "\n\n"
            << "Script line: '" << js_stack_trace_line_num.value_or(1)
            << "'\n";

        return error{._line = js_stack_trace_line_num.value_or(1)};
    }

    [[nodiscard]] raii_js_value get_handler(const std::string& name)
    {
        JSContext* ctx = _context.get();

        const raii_js_value global_obj{ctx, JS_GetGlobalObject(ctx)};

        const raii_js_value bbdown_obj{
            ctx, JS_GetPropertyStr(ctx, global_obj._value, "bbdown")};

        const raii_js_value handlers_obj{
            ctx, JS_GetPropertyStr(ctx, bbdown_obj._value, "handlers")};

        return raii_js_value{
            ctx, JS_GetPropertyStr(ctx, handlers_obj._value, name.c_str())};
    }

    [[nodiscard]] raii_js_value make_element_object(const node& n)
    {
        JSContext* ctx = _context.get();

        raii_js_value obj{ctx, JS_NewObject(ctx)};

        set_string_property(ctx, obj._value, "name", n.name());
        set_string_property(ctx, obj._value, "text", n.text());
        set_string_property(ctx, obj._value, "raw", n.raw());

        if (const auto value = n.value(); value.has_value())
        {
            set_string_property(ctx, obj._value, "value", *value);
        }
        else
        {
            JS_SetPropertyStr(ctx, obj._value, "value", JS_NULL);
        }

        return obj;
    }

public:
    [[nodiscard]] explicit impl(std::ostream& err_stream) noexcept
        : _err_stream_tl_guard{&err_stream},
          _runtime{JS_NewRuntime()},
          _context{JS_NewContext(_runtime.get())}
    {
        bind_function<&warn>("bbdown_warn", 1);

        const std::optional<error> prelude_error =
            check_js_errors(eval_impl(_context.get(), prelude_source)._value);

        assert(!prelude_error.has_value());
        (void)prelude_error;
    }

    [[nodiscard]] std::optional<error> load_script(
        const std::string& source) noexcept
    {
        return check_js_errors(eval_impl(_context.get(), source)._value);
    }

    [[nodiscard]] bool has_handler(const std::string& name)
    {
        return JS_IsFunction(_context.get(), get_handler(name)._value);
    }

    [[nodiscard]] handler_result write_element(
        const node& n, std::ostream& sink)
    {
        JSContext* ctx = _context.get();

        const raii_js_value handler = get_handler(std::string{n.name()});
        if (!JS_IsFunction(ctx, handler._value))
        {
            return handler_result::use_default;
        }

        raii_js_value arg = make_element_object(n);

        const raii_js_value result{
            ctx, JS_Call(ctx, handler._value, JS_UNDEFINED, 1, &arg._value)};

        if (check_js_errors(result._value).has_value())
        {
            return handler_result::failed;
        }

        if (JS_IsUndefined(result._value))
        {
            return handler_result::use_default;
        }

        sink << to_std_string(ctx, result._value);
        return handler_result::handled;
    }
};

// ----------------------------------------------------------------------------

js_handlers::js_handlers(std::ostream& err_stream)
    : _impl{std::make_unique<impl>(err_stream)}
{}

js_handlers::~js_handlers() = default;

std::optional<js_handlers::error> js_handlers::load_script(
    const std::string_view source) noexcept
{
    // QuickJS requires null-terminated sources.
    return _impl->load_script(std::string{source});
}

std::optional<js_handlers::error> js_handlers::load_file(
    const std::string_view path) noexcept
{
    std::string buffer;
    if (!read_file_in_buffer(path, buffer))
    {
        return error{._line = 0};
    }

    return _impl->load_script(buffer);
}

bool js_handlers::has_handler(const std::string_view name)
{
    return _impl->has_handler(std::string{name});
}

handler_result js_handlers::write_element(const node& n, std::ostream& sink)
{
    return _impl->write_element(n, sink);
}

element_handler js_handlers::as_element_handler()
{
    return [this](const node& n, const render_context& ctx) -> handler_result
    {
        if (!n.is_element())
        {
            return handler_result::use_default;
        }

        return write_element(n, ctx._sink);
    };
}

} // namespace bbdown
