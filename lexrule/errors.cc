#include <lexrule/errors.hh>
#include <lexrule/lines.hh>
#include <lexrule/pretty.hh>

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>

template<typename T, typename ...Params>
concept Callable = requires(T t, Params ...params) { t(params...); };

template<typename Lambda, typename ...T>
concept Visitor = (Callable<Lambda, T> && ...);

/// Custom visit function for better C++ compilation error messages
template<typename V, typename ...T>
static auto visit(V &&visitor, std::variant<T...> const& variant)
{
	static_assert(Visitor<V, T...>, "visitor must cover all types");
	if constexpr (Visitor<V, T...>) {
		return std::visit(std::forward<V>(visitor), variant);
	}
}

Error Error::with(File_Range range) &&
{
	file = range;
	return std::move(*this);
}

/// Prints heading like `ERROR Unrecognized token at file:1:2` underlined with dashes.
///
/// Underline length ignores color escape sequences.
static std::ostream& error_heading(
		std::ostream &os,
		std::string_view kind,
		std::string_view short_description,
		std::string_view where = {})
{
	os << pretty::begin_error << kind << ' ' << pretty::end << short_description;
	if (not where.empty()) {
		os << " at " << pretty::begin_path << where << pretty::end;
	}
	os << '\n';

	auto const length = kind.size() + 1 + short_description.size() + (where.empty() ? 0 : where.size() + 4);
	std::fill_n(std::ostreambuf_iterator<char>(os), length, '-');
	return os << '\n';
}

template<typename Position>
static std::string format_position(Position const& position)
{
	std::stringstream ss;
	ss << position;
	return std::move(ss).str();
}

/// Reports broken invariant of the library itself and terminates
[[noreturn]] static void report_bug(std::string_view short_description, std::string_view message, Location loc)
{
	error_heading(std::cerr, "IMPLEMENTATION BUG", short_description, format_position(loc));

	if (not message.empty()) {
		std::cerr << message << std::endl;
	}

	std::cerr << pretty::begin_comment << "\n"
		"Tokenizer got in state that was not expected by it's developers.\n"
		"Contact them and provide input that coused this error and\n"
		"error message above to resolve this trouble\n"
		<< pretty::end << std::flush;

	std::exit(42);
}

void ensure(bool condition, std::string message, Location loc)
{
	if (condition) return;
#if Debug
	throw std::runtime_error(message);
#else
	report_bug("Assertion in tokenizer", message, loc);
#endif
}

void unimplemented(std::string_view message, Location loc)
{
	report_bug("This part of tokenizer was not implemented yet", message, loc);
}

void unreachable(Location loc)
{
	report_bug("Reached unreachable state", {}, loc);
}

std::ostream& operator<<(std::ostream& os, Error const& err)
{
	std::string_view short_description = visit(Overloaded {
		[](errors::End_Of_Input const&)       { return "Unexpected end of input"; },
		[](errors::Invalid_Grammar const&)    { return "Invalid grammar"; },
		[](errors::Missing_File const&)       { return "Cannot read file"; },
		[](errors::No_Signal const&)          { return "Unknown failure"; },
		[](errors::Unrecognized_Token const&) { return "Unrecognized token"; },
	}, err.details);

	// Line and column are known only for sources registered in Lines,
	// otherwise byte range is the best we can show
	std::optional<Location> loc;
	std::string where;
	if (err.file && *err.file) {
		auto const filename = std::string(err.file->filename);
		if (auto const source = Lines::the.source(filename); not source.empty()) {
			loc = Location::of(err.file->filename, source, err.file->start);
			where = format_position(*loc);
		} else {
			where = format_position(*err.file);
		}
	}

	error_heading(os, "ERROR", short_description, where);

	auto const print_error_line = [&] {
		if (loc) {
			Lines::the.print(os, std::string(loc->filename), loc->line, loc->line);
			os << '\n';
		}
	};

	visit(Overloaded {
		[&](errors::End_Of_Input const& err) {
			os << "I reached the end of the input while the last window was still unresolved.\n";
			if (not err.unmatched.empty()) {
				os << "  Unresolved text: '" << err.unmatched << "' at byte " << err.offset << '\n';
			}
			os << '\n';
			print_error_line();
		},
		[&](errors::Invalid_Grammar const& err) {
			os << "I cannot build rules from grammar section [" << err.section << ']';
			if (not err.key.empty()) {
				os << " entry '" << err.key << '\'';
			}
			os << ":\n  " << err.reason << "\n\n";

			os << pretty::begin_comment;
			os << "Keywords are written as `Kind = literal, alternative`,\n";
			os << "classes as `Kind = alphabetic`, `numeric`, `whitespace` or `ends_with:<suffix>`\n";
			os << pretty::end;
		},
		[&](errors::Missing_File const& err) {
			os << "I tried to read " << pretty::begin_path << err.path << pretty::end << " but I couldn't open it.\n";
		},
		[&](errors::No_Signal const&) {
			os << "Operation failed without providing any specific reason.\n";
		},
		[&](errors::Unrecognized_Token const& err) {
			os << "I reached the end of the input but the text at its end didn't match any rule.\n";
			os << "  Unrecognized text: '" << err.text << "' at byte " << err.offset << "\n\n";

			print_error_line();

			os << pretty::begin_comment;
			os << "Tokens are emitted only for text that some rule matches completely.\n";
			os << "Check if the grammar has rule for this text or pass `lenient` to ignore it\n";
			os << pretty::end;
		},
	}, err.details);

	return os;
}
