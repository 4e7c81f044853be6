#ifndef LEXRULE_SCANNER_HH
#define LEXRULE_SCANNER_HH

#include <lexrule/result.hh>
#include <lexrule/rule/rule.hh>

#include <functional>
#include <iterator>
#include <optional>
#include <utility>
#include <vector>

/// Step by which scanner window grows
enum class Unit : u8
{
	Rune, ///< one UTF-8 encoded code point, malformed byte counts as one unit
	Byte, ///< one byte
};

/// Returns size in bytes of the unit starting at offset
unsigned unit_length(std::string_view buffer, unsigned offset, Unit unit);

/// Single window classification reported to trace hook
struct Trace
{
	unsigned start;
	unsigned stop;
	std::string_view window;
	Match match;
};

/// Trace debug printing
std::ostream& operator<<(std::ostream& os, Trace const& trace);

/// Options shared by Scanner and tokenize
struct Scan_Options
{
	/// Step by which window grows
	Unit unit = Unit::Rune;

	/// Name of scanned source, used in error ranges
	std::string_view filename = "<input>";

	/// Don't report text left unmatched at the end of buffer as an error (tokenize only)
	bool allow_trailing = false;

	/// Called after each window classification
	std::function<void(Trace const&)> trace{};
};

/// Scanner segments buffer into tokens using borrowed rule tree
///
/// On each call to step() window is grown by one unit and classified.
/// Full match consumes the window and yields its value, anything else
/// yields nothing and lets the window grow on the next call.
template<typename T>
struct Scanner
{
	/// Rules that are used to classify windows
	Rule<T> const& rule;

	/// Source that is beeing scanned
	std::string_view buffer{};

	/// Offset of the window start, equal to the end of the last consumed token
	unsigned start = 0;

	/// Offset of the window end
	unsigned end = 0;

	Scan_Options options{};

	explicit Scanner(Rule<T> const& rule, std::string_view buffer = {}, Scan_Options options = {})
		: rule(rule), buffer(buffer), options(std::move(options))
	{
	}

	/// Rule tree must outlive the scanner
	Scanner(Rule<T> const&&, std::string_view = {}, Scan_Options = {}) = delete;

	/// Bind new buffer and move window to its begining
	void reset(std::string_view new_buffer)
	{
		buffer = new_buffer;
		start = end = 0;
	}

	/// Current window
	std::string_view current() const
	{
		return buffer.substr(start, end - start);
	}

	/// Offsets of the current window, [start, end)
	std::pair<unsigned, unsigned> window() const
	{
		return { start, end };
	}

	/// Text left unresolved after whole buffer was scanned, empty otherwise
	std::string_view unmatched() const
	{
		return end == buffer.size() ? buffer.substr(start) : std::string_view{};
	}

	/// Grows window and classifies it
	///
	/// Returns token value on full match (or nullopt when rule didn't produce any)
	/// and nullopt when window is not conclusive yet. When window cannot grow
	/// returns errors::End_Of_Input with text left without conclusive match.
	Result<std::optional<T>> step()
	{
		if (end >= buffer.size()) {
			return Error {
				.details = errors::End_Of_Input { .unmatched = buffer.substr(start), .offset = start },
				.file = File_Range { options.filename, start, unsigned(buffer.size()) },
			};
		}

		end += unit_length(buffer, end, options.unit);

		auto result = rule.matches(current());

		if (options.trace) {
			options.trace(Trace { .start = start, .stop = end, .window = current(), .match = result.type });
		}

		if (not result.is_match()) {
			return std::optional<T>{};
		}

		start = end;
		return std::move(result.value);
	}

	/// Single pass sequence of step() results ending on end of input
	struct Tokens
	{
		struct Sentinel {};

		struct Iterator
		{
			using value_type = std::optional<T>;
			using difference_type = std::ptrdiff_t;

			Scanner *scanner = nullptr;
			std::optional<T> token = std::nullopt;
			bool done = true;

			value_type const& operator*() const { return token; }
			value_type const* operator->() const { return &token; }

			Iterator& operator++()
			{
				if (auto result = scanner->step(); result.has_value()) {
					token = std::move(*result);
				} else {
					token = std::nullopt;
					done = true;
				}
				return *this;
			}

			void operator++(int) { ++*this; }

			bool operator==(Sentinel) const { return done; }
		};

		Scanner *scanner;

		Iterator begin()
		{
			Iterator it { .scanner = scanner, .done = false };
			return ++it;
		}

		Sentinel end() const { return {}; }
	};

	/// Lazy sequence of optional tokens, restartable only via reset()
	Tokens tokens() { return Tokens { this }; }
};

/// Scans whole text collecting produced values.
///
/// Text left without conclusive match at the end is reported as errors::Unrecognized_Token
/// unless options.allow_trailing is set.
template<typename T>
Result<std::vector<T>> tokenize(Rule<T> const& rule, std::string_view text, Scan_Options options = {})
{
	auto const allow_trailing = options.allow_trailing;
	Scanner<T> scanner(rule, text, std::move(options));
	std::vector<T> tokens;

	for (auto const& token : scanner.tokens()) {
		if (token) {
			tokens.push_back(*token);
		}
	}

	if (auto const unmatched = scanner.unmatched(); not unmatched.empty() && not allow_trailing) {
		return Error {
			.details = errors::Unrecognized_Token { .text = std::string(unmatched), .offset = scanner.start },
			.file = File_Range { scanner.options.filename, scanner.start, unsigned(text.size()) },
		};
	}

	return tokens;
}

#endif // LEXRULE_SCANNER_HH
