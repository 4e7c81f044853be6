#include <algorithm>
#include <array>
#include <cstdio>
#include <cstdlib>
#include <edit_distance.hh>
#include <iomanip>
#include <iostream>
#include <lexrule/common.hh>
#include <lexrule/errors.hh>
#include <lexrule/pretty.hh>
#include <lexrule/scanner/scanner.hh>
#include <lexrule/ui/program_arguments.hh>
#include <lexrule/version.hh>
#include <variant>

#ifdef _WIN32
extern "C" {
#include <io.h>
}
#else
#include <unistd.h>
#endif

using namespace ui::program_arguments;

// from lexrule/main.cc:
extern bool enable_repl;
extern bool lenient_mode;
extern bool rules_only_mode;
extern bool trace_mode;
extern Unit scan_unit;
extern std::optional<std::string_view> grammar_path;

using Empty_Argument    = void(*)();
using Requires_Argument = void(*)(std::string_view);
using Defines_Code      = Run(*)(std::string_view);
using Handler           = std::variant<Empty_Argument, Requires_Argument, Defines_Code>;

static Run provide_file(std::string_view path)        { return { .type = Run::File,     .argument = path }; }
static Run provide_inline_code(std::string_view code) { return { .type = Run::Argument, .argument = code }; }

static void set_grammar(std::string_view path) { grammar_path = path; }

static void set_interactive_mode() { enable_repl = true; }
static void set_trace_mode()       { trace_mode = true; }
static void set_lenient_mode()     { lenient_mode = true; }
static void set_rules_only_mode()  { rules_only_mode = true; }
static void set_byte_units()       { scan_unit = Unit::Byte; }

static void print_version()
{
	std::cout << Lexrule_Version << std::endl;
	std::exit(0);
}

/// Command line option with all of its spellings
struct Option
{
	/// Canonical name first, unused spellings are left empty
	std::array<std::string_view, 3> names;
	Handler handler;
	std::string_view documentation;

	bool has_name(std::string_view name) const
	{
		return not name.empty() && std::find(names.begin(), names.end(), name) != names.end();
	}

	bool requires_argument() const
	{
		return not std::holds_alternative<Empty_Argument>(handler);
	}
};

static auto const options = std::array {
	Option { { "run", "r", "file" },           provide_file,          "tokenize given file, '-' reads standard input" },
	Option { { "inline", "c", "code" },        provide_inline_code,   "tokenize text from an argument" },
	Option { { "grammar", "g" },               set_grammar,           "load grammar from INI file instead of the builtin one" },
	Option { { "repl", "i", "interactive" },   set_interactive_mode,  "enable interactive mode" },
	Option { { "trace", "t" },                 set_trace_mode,        "print classification of every window to standard error" },
	Option { { "lenient" },                    set_lenient_mode,      "don't report unmatched text at the end of input" },
	Option { { "bytes" },                      set_byte_units,        "grow windows by bytes instead of UTF-8 code points" },
	Option { { "rules" },                      set_rules_only_mode,   "print rule tree of the grammar" },
	Option { { "help", "h", "?" },             usage,                 "print help" },
	Option { { "version", "v" },               print_version,         "print version information" },
};

static Option const* find_option(std::string_view name)
{
	auto const it = std::find_if(options.begin(), options.end(), [name](Option const& o) { return o.has_name(name); });
	return it == options.end() ? nullptr : &*it;
}

[[noreturn]] static void missing_argument(std::string_view name)
{
	std::cerr << pretty::begin_error << "lexrule: error:" << pretty::end;
	std::cerr << " option " << std::quoted(name) << " requires an argument" << std::endl;
	std::exit(1);
}

// Accepted spellings, where `run` takes an argument and `trace` doesn't:
//   trace  -trace  --trace
//   run x  -run x  --run x  --run=x
std::optional<std::string_view> ui::program_arguments::accept_commandline_argument(std::vector<Run> &runnables, std::span<char const*> &args)
{
	if (args.empty()) {
		return std::nullopt;
	}

	std::string_view name = args.front();
	if (name.starts_with("--")) {
		name.remove_prefix(2);
	} else if (name.starts_with('-') && name.size() > 1) {
		name.remove_prefix(1);
	}

	std::optional<std::string_view> packed_value;
	if (auto const eq = name.find('='); eq != std::string_view::npos) {
		packed_value = name.substr(eq + 1);
		name = name.substr(0, eq);
	}

	auto const option = find_option(name);
	if (option == nullptr) {
		return name;
	}

	auto const take_value = [&]() -> std::string_view {
		if (packed_value) {
			args = args.subspan(1);
			return *packed_value;
		}
		if (args.size() < 2) {
			missing_argument(name);
		}
		std::string_view const value = args[1];
		args = args.subspan(2);
		return value;
	};

	std::visit(Overloaded {
		[&](Empty_Argument handler)    { args = args.subspan(1); handler(); },
		[&](Requires_Argument handler) { handler(take_value()); },
		[&](Defines_Code handler)      { runnables.push_back(handler(take_value())); },
	}, option->handler);

	return std::nullopt;
}

void ui::program_arguments::print_close_matches(std::string_view arg)
{
	struct Candidate
	{
		std::string_view name;
		Option const* option;
		int distance;
	};

	std::vector<Candidate> candidates;
	for (auto const& option : options) {
		for (auto const name : option.names) {
			if (not name.empty()) {
				candidates.push_back({ name, &option, int(edit_distance(arg, name)) });
			}
		}
	}

	std::stable_sort(candidates.begin(), candidates.end(),
		[](Candidate const& lhs, Candidate const& rhs) { return lhs.distance < rhs.distance; });

	// Show each option once, under its closest spelling
	std::vector<Candidate> closest;
	for (auto const& candidate : candidates) {
		if (closest.size() == 3 || candidate.distance > 3) {
			break;
		}
		if (std::none_of(closest.begin(), closest.end(), [&](Candidate const& c) { return c.option == candidate.option; })) {
			closest.push_back(candidate);
		}
	}

	if (closest.empty()) {
		std::cout << "Available subcommands are:\n";
		for (auto const& option : options) {
			std::cout << "  " << option.names.front() << " - " << option.documentation << '\n';
		}
	} else {
		std::cout << "The most similar commands are:\n";
		for (auto const& candidate : closest) {
			std::cout << "  " << candidate.name << " - " << candidate.option->documentation << '\n';
		}
	}

	std::cout << "\nInvoke 'lexrule help' to read more about available commands\n";
}

void ui::program_arguments::usage()
{
	std::cerr << "usage: " << pretty::begin_bold << "lexrule" << pretty::end << " [subcommand]...\n";
	std::cerr << "  where available subcommands are:\n";

	for (auto const& option : options) {
		std::cerr << "    " << pretty::begin_bold << option.names.front() << pretty::end;
		for (auto const name : std::span(option.names).subspan(1)) {
			if (not name.empty()) {
				std::cerr << ", " << name;
			}
		}
		std::cerr << (option.requires_argument() ? " ARG\n" : "\n");
		std::cerr << "      " << option.documentation << "\n\n";
	}

	std::exit(2);
}

bool ui::program_arguments::is_tty()
{
#ifdef _WIN32
	return _isatty(STDOUT_FILENO);
#else
	return isatty(fileno(stdout));
#endif
}
