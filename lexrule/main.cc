#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <lexrule/config.hh>
#include <lexrule/grammar/grammar.hh>
#include <lexrule/lines.hh>
#include <lexrule/pretty.hh>
#include <lexrule/scanner/scanner.hh>
#include <lexrule/try.hh>
#include <lexrule/ui/program_arguments.hh>
#include <lexrule/unicode.hh>
#include <lexrule/user_directory.hh>
#include <lexrule/version.hh>
#include <span>

#include <replxx.hxx>

namespace fs = std::filesystem;

bool enable_repl = false;
bool lenient_mode = false;
bool rules_only_mode = false;
bool trace_mode = false;
Unit scan_unit = Unit::Rune;
std::optional<std::string_view> grammar_path = std::nullopt;

unsigned repl_line_number = 1;

void print_repl_help()
{
	std::cout <<
		"List of all available commands of lexrule interactive mode:\n"
		":exit    - quit interactive mode\n"
		":quit    - quit interactive mode\n"
		":help    - prints this help message\n"
		":grammar - prints rule tree of the active grammar\n"
		":version - prints version\n"
		;
}

/// All source code through life of the program should stay allocated, since
/// errors and tokens only view into it
std::deque<std::string> eternal_sources;

/// Loads grammar provided by user, from user configuration or the builtin one
static Result<Rule<Token>> load_grammar()
{
	if (grammar_path) {
		auto const sections = Try(config::from_file(fs::path(*grammar_path)));
		return grammar::build(sections);
	}

	if (auto const path = config::location(); fs::exists(path)) {
		auto const sections = Try(config::from_file(path));
		return grammar::build(sections);
	}

	return grammar::builtin();
}

/// Prints tokens of the source, one per line as `offset:kind "text"`
static std::optional<Error> print_tokens(Rule<Token> const& rule, std::string_view source, std::string_view filename)
{
	Scan_Options options {
		.unit = scan_unit,
		.filename = filename,
		.allow_trailing = lenient_mode,
	};

	if (trace_mode) {
		options.trace = [](Trace const& trace) {
			std::cerr << pretty::begin_comment << trace << pretty::end << '\n';
		};
	}

	Scanner<Token> scanner(rule, source, std::move(options));

	for (;;) {
		auto const token_start = scanner.start;
		auto result = scanner.step();
		if (result.holds_error<errors::End_Of_Input>()) {
			break;
		}
		auto const token = Try(std::move(result));
		if (token) {
			std::cout << token_start << ':' << pretty::begin_token_kind << token->kind << pretty::end
				<< ' ' << std::quoted(token->source) << '\n';
		}
	}
	std::cout << std::flush;

	if (auto const unmatched = scanner.unmatched(); not unmatched.empty() && not lenient_mode) {
		return Error {
			.details = errors::Unrecognized_Token { .text = std::string(unmatched), .offset = scanner.start },
			.file = File_Range { filename, scanner.start, unsigned(source.size()) },
		};
	}

	return std::nullopt;
}

/// Handles commands inside REPL session (those starting with ':')
///
/// Returns if one of command matched
static bool handle_repl_session_commands(std::string_view input, Rule<Token> const& rule)
{
	using Handler = void(*)(Rule<Token> const& rule);
	using Command = std::pair<std::string_view, Handler>;

	static constexpr auto Commands = std::array {
		Command { "exit",    +[](Rule<Token> const&) { std::exit(0); } },
		Command { "quit",    +[](Rule<Token> const&) { std::exit(0); } },
		Command { "help",    +[](Rule<Token> const&) { print_repl_help(); } },
		Command { "grammar", +[](Rule<Token> const& rule) { std::cout << rule << std::endl; } },
		Command { "version", +[](Rule<Token> const&) { std::cout << Lexrule_Version << std::endl; } },
	};

	auto const provided_command = input.substr(0, input.find_first_of(" \t\n"));

	for (auto [command_name, handler] : Commands) {
		if (provided_command == command_name) {
			handler(rule);
			return true;
		}
	}

	return false;
}

/// Fancy main that supports Result forwarding on error (Try macro)
[[maybe_unused]]
static std::optional<Error> Main(std::span<char const*> args)
{
	enable_repl = args.empty();

	if (ui::program_arguments::is_tty() && getenv("NO_COLOR") == nullptr) {
		pretty::terminal_mode();
	}

	std::vector<ui::program_arguments::Run> runnables;

	while (args.size()) if (auto failed = ui::program_arguments::accept_commandline_argument(runnables, args)) {
		std::cerr << pretty::begin_error << "lexrule: error:" << pretty::end;
		std::cerr << " Failed to recognize parameter " << std::quoted(*failed) << std::endl;
		ui::program_arguments::print_close_matches(args.front());
		std::exit(1);
	}

	auto const rule = Try(load_grammar());

	if (rules_only_mode) {
		std::cout << rule << std::endl;
		return {};
	}

	for (auto const& [type, argument] : runnables) {
		if (type == ui::program_arguments::Run::Argument) {
			Lines::the.add_file("<arguments>", argument);
			Try(print_tokens(rule, argument, "<arguments>"));
			continue;
		}

		auto path = argument;
		if (path == "-") {
			eternal_sources.emplace_back(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
		} else {
			std::ifstream source_file{fs::path(path)};
			if (not source_file.is_open()) {
				return Error { .details = errors::Missing_File { .path = std::string(path) } };
			}
			eternal_sources.emplace_back(std::istreambuf_iterator<char>(source_file), std::istreambuf_iterator<char>());
		}

		Lines::the.add_file(std::string(path), eternal_sources.back());
		Try(print_tokens(rule, eternal_sources.back(), path));
	}

	if (enable_repl) {
		replxx::Replxx repl;

		auto const history_path = (user_directory::data_home() / "history").string();

		repl.set_max_history_size(2048);
		repl.set_max_hint_rows(3);
		repl.history_load(history_path);

		for (;;) {
			char const* input = nullptr;
			do input = repl.input("> "); while((input == nullptr) && (errno == EAGAIN));

			if (input == nullptr) {
				break;
			}

			// Raw input line used for tokenization
			std::string_view raw = input;

			// Used to recognize REPL commands
			std::string_view command = raw;
			trim(command);

			if (command.empty()) {
				continue;
			}

			repl.history_add(std::string(command));
			repl.history_save(history_path);

			if (command.starts_with(':')) {
				command.remove_prefix(1);
				if (!handle_repl_session_commands(command, rule)) {
					std::cerr << pretty::begin_error << "lexrule: error:" << pretty::end;
					std::cerr << " unrecognized REPL command '" << command << '\'' << std::endl;
				}
				continue;
			}

			// replxx reuses its input buffer, tokens and errors must outlive it
			eternal_sources.emplace_back(raw);
			auto const filename = "<repl:" + std::to_string(repl_line_number++) + ">";
			Lines::the.add_file(filename, eternal_sources.back());

			if (auto error = print_tokens(rule, eternal_sources.back(), filename)) {
				std::cout << std::flush;
				std::cerr << *error << std::flush;
			}
		}
	}

	return {};
}

#ifndef LEXRULE_UNIT_TESTING

int main(int argc, char const** argv)
{
	auto const args = std::span(argv, argc).subspan(1);
	auto const result = Main(args);
	if (result.has_value()) {
		std::cerr << result.value() << std::flush;
		return 1;
	}
	return 0;
}

#endif // LEXRULE_UNIT_TESTING
