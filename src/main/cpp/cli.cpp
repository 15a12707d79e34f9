#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#define ARGS_NOEXCEPT
#include "args.hxx"

#include "titlecase/util/ansi.hpp"
#include "titlecase/util/io.hpp"
#include "titlecase/util/result.hpp"
#include "titlecase/util/severity.hpp"
#include "titlecase/util/strings.hpp"
#include "titlecase/util/tty.hpp"

#include "titlecase/diagnostic.hpp"
#include "titlecase/lexicon.hpp"
#include "titlecase/services.hpp"
#include "titlecase/settings.hpp"
#include "titlecase/title_case.hpp"

namespace titlecase {
namespace {

[[nodiscard]]
std::u8string_view severity_highlight(Severity severity)
{
    return severity <= Severity::trace     ? ansi::black
        : severity <= Severity::debug        ? ansi::h_black
        : severity <= Severity::info         ? ansi::blue
        : severity <= Severity::soft_warning ? ansi::green
        : severity <= Severity::warning      ? ansi::h_yellow
        : severity <= Severity::error        ? ansi::h_red
        : severity <= Severity::fatal        ? ansi::red
                                             : ansi::magenta;
}

std::ostream& operator<<(std::ostream& out, std::u8string_view str)
{
    return out << as_string_view(str);
}

struct Stderr_Logger final : Logger {
    bool any_errors = false;

    [[nodiscard]]
    explicit Stderr_Logger(Severity min_severity)
        : Logger { min_severity }
    {
    }

    void operator()(const Diagnostic diagnostic) final
    {
        any_errors |= diagnostic.severity >= Severity::error;

        if (is_stderr_tty) {
            std::cerr << severity_highlight(diagnostic.severity);
        }
        std::cerr << severity_tag(diagnostic.severity);
        if (is_stderr_tty) {
            std::cerr << ansi::reset;
        }
        std::cerr << ": " << diagnostic.message;
        if (is_stderr_tty) {
            std::cerr << ansi::h_black;
        }
        std::cerr << " [" << diagnostic.id << ']';
        if (is_stderr_tty) {
            std::cerr << ansi::reset;
        }
        std::cerr << '\n';
    }
};

[[nodiscard]]
std::u8string_view lexicon_error_id(Lexicon_Error_Code code)
{
    switch (code) {
    case Lexicon_Error_Code::empty_entry: return diagnostic::lexicon_empty;
    case Lexicon_Error_Code::bad_phrase_pattern: return diagnostic::lexicon_bad_pattern;
    case Lexicon_Error_Code::not_a_word:
    case Lexicon_Error_Code::bad_max_length: return diagnostic::cli_args;
    }
    return diagnostic::cli_args;
}

[[nodiscard]]
std::u8string lexicon_error_message(const Lexicon_Error& error)
{
    if (error.code == Lexicon_Error_Code::bad_max_length) {
        std::u8string message = u8"The maximum function word length must be between 1 and ";
        message += decimal_string(max_max_function_word_length);
        message += u8".";
        return message;
    }
    std::u8string message = u8"Invalid lexicon (";
    message += lexicon_error_code_name(error.code);
    message += u8"): \"";
    message += error.entry;
    message += u8"\"";
    return message;
}

int main(int argc, const char* const* const argv)
{
    static const std::unordered_map<std::string, Severity> severity_arg_map {
        { "min", Severity::min },
        { "trace", Severity::trace },
        { "debug", Severity::debug },
        { "info", Severity::info },
        { "soft_warning", Severity::soft_warning },
        { "warning", Severity::warning },
        { "error", Severity::error },
        { "fatal", Severity::fatal },
        { "none", Severity::none },
    };

    args::ArgumentParser parser {
        "Converts lines of text to title case. "
        "Without words, lines are read from standard input or from the input file."
    };
    parser.helpParams.width = 100;
    parser.helpParams.addChoices = true;
    args::PositionalList<std::string> words_arg {
        parser,
        "words",
        "Words of a single title to convert",
    };
    args::ValueFlag<std::string> input_arg {
        parser,
        "file",
        "Read lines from a UTF-8 file instead of standard input",
        { 'i', "input" },
    };
    args::ValueFlag<std::size_t> max_length_arg {
        parser,
        "n",
        "Maximum number of letters in a lowercased function word",
        { 'm', "max-length" },
        default_max_function_word_length,
    };
    args::MapFlag<std::string, Severity> severity_arg {
        parser,
        "severity",
        "Minimum (>=) severity for log messages",
        { 'l', "severity" },
        severity_arg_map,
        Severity::warning,
    };
    args::Flag version_arg {
        parser,
        "version",
        "Display the version and exit",
        { 'V', "version" },
    };
    args::HelpFlag help_arg {
        parser, "help", "Display this help menu", { 'h', "help" }, args::Options::Global
    };

    const bool parsed = parser.ParseCLI(argc, argv);
    if (parser.GetError() == args::Error::Help || help_arg.Matched()) {
        parser.Help(std::cout);
        return EXIT_SUCCESS;
    }
    if (!parsed || parser.GetError() != args::Error::None) {
        std::cerr << parser.GetErrorMsg() << '\n';
        return EXIT_FAILURE;
    }
    if (version_arg.Matched()) {
        std::cout << "titlecase " << version_string << '\n';
        return EXIT_SUCCESS;
    }

    Stderr_Logger logger { severity_arg.Get() };

    const Lexicon_Options lexicon_options { .max_function_word_length = max_length_arg.Get() };
    Result<Lexicon, Lexicon_Error> lexicon = Lexicon::make(lexicon_options, logger);
    if (!lexicon) {
        const std::u8string message = lexicon_error_message(lexicon.error());
        logger.log(Severity::fatal, lexicon_error_id(lexicon.error().code), message);
        return EXIT_FAILURE;
    }

    std::u8string buffer;
    if (!words_arg.Get().empty()) {
        if (input_arg.Matched()) {
            logger.log(
                Severity::warning, diagnostic::cli_args,
                u8"Both words and an input file were given. The input file is ignored."
            );
        }
        std::u8string title;
        for (const std::string& word : words_arg.Get()) {
            if (!title.empty()) {
                title += u8' ';
            }
            title += as_u8string_view(word);
        }
        title_case_line(buffer, title, 1, *lexicon, logger);
        std::cout << std::u8string_view { buffer };
    }
    else if (input_arg.Matched()) {
        const std::string& path = input_arg.Get();
        std::vector<char8_t> text;
        if (const Result<void, IO_Error_Code> r = load_utf8_file(text, as_u8string_view(path));
            !r) {
            std::u8string message { as_u8string_view(path) };
            message += u8": ";
            message += io_error_code_message(r.error());
            logger.log(Severity::fatal, diagnostic::io_read, message);
            return EXIT_FAILURE;
        }
        title_case_lines(buffer, as_u8string_view(text), *lexicon, logger);
        std::cout << std::u8string_view { buffer };
    }
    else {
        std::string line;
        std::size_t line_number = 0;
        while (std::getline(std::cin, line)) {
            buffer.clear();
            title_case_line(buffer, as_u8string_view(line), ++line_number, *lexicon, logger);
            std::cout << std::u8string_view { buffer };
        }
    }

    std::cout.flush();
    return logger.any_errors ? EXIT_FAILURE : EXIT_SUCCESS;
}

} // namespace
} // namespace titlecase

// NOLINTNEXTLINE(bugprone-exception-escape)
int main(int argc, const char* const* argv)
{
    return titlecase::main(argc, argv);
}
