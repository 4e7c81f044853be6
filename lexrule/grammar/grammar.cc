#include <lexrule/grammar/grammar.hh>
#include <lexrule/try.hh>
#include <lexrule/unicode.hh>

#include <algorithm>
#include <array>

static constexpr std::string_view Builtin_Grammar = R"ini(
[lexer]
ignore = whitespace

[keywords]
And      = and
Break    = break
Do       = do
Else     = else
ElseIf   = elseif
End      = end
False    = false
For      = for
Function = function, func
If       = if
In       = in
Local    = local
Nil      = nil
Not      = not
Or       = or
Repeat   = repeat
Return   = return
Then     = then
True     = true
Until    = until
While    = while

[classes]
Identifier = alphabetic
Number     = numeric
)ini";

constexpr auto Known_Sections = std::array {
	""sv,
	"lexer"sv,
	"keywords"sv,
	"classes"sv,
};

/// Splits text on separator, trimming each part
static std::vector<std::string_view> split(std::string_view text, char separator)
{
	std::vector<std::string_view> parts;
	for (;;) {
		auto const pos = text.find(separator);
		auto part = text.substr(0, pos);
		trim(part);
		parts.push_back(part);
		if (pos == std::string_view::npos) {
			return parts;
		}
		text.remove_prefix(pos + 1);
	}
}

static Rule<Token>::Extractor produce(std::string kind)
{
	return [kind = std::move(kind)](std::string_view source) {
		return Token { .kind = kind, .source = std::string(source) };
	};
}

std::string_view grammar::builtin_source()
{
	return Builtin_Grammar;
}

Rule<Token> grammar::builtin()
{
	auto rule = build(config::parse(Builtin_Grammar));
	ensure(rule.has_value(), "Builtin grammar must be valid");
	return std::move(rule).value();
}

Result<std::vector<Rule<Token>>> grammar::class_terms(std::string_view expression)
{
	std::vector<Rule<Token>> terms;

	for (auto term : split(expression, '&')) {
		bool negated = false;
		while (term.starts_with('!')) {
			negated = !negated;
			term.remove_prefix(1);
			trim(term);
		}

		Rule<Token> rule = Rule<Token>::numeric();
		if (term == "alphabetic") {
			rule = Rule<Token>::alphabetic();
		} else if (term == "numeric") {
			rule = Rule<Token>::numeric();
		} else if (term == "whitespace") {
			rule = Rule<Token>::whitespace();
		} else if (term.starts_with("ends_with:") && term.size() > "ends_with:"sv.size()) {
			rule = Rule<Token>::ends_with(std::string(term.substr("ends_with:"sv.size())));
		} else {
			return errors::Invalid_Grammar {
				.reason = term.empty()
					? "empty term in class expression"
					: "unknown class '" + std::string(term) + "'",
			};
		}

		terms.push_back(negated ? Rule<Token>::negate(std::move(rule)) : std::move(rule));
	}

	return terms;
}

/// Adds section and key to the grammar error that doesn't have them yet
static Error in_entry(Error error, std::string_view section, std::string_view key)
{
	if (auto grammar_error = std::get_if<errors::Invalid_Grammar>(&error.details)) {
		if (grammar_error->section.empty()) grammar_error->section = section;
		if (grammar_error->key.empty())     grammar_error->key = key;
	}
	return error;
}

Result<Rule<Token>> grammar::build(config::Sections const& sections)
{
	for (auto const& [name, entries] : sections) {
		if (std::find(Known_Sections.begin(), Known_Sections.end(), name) == Known_Sections.end()) {
			return errors::Invalid_Grammar { .section = name, .reason = "unknown section" };
		}
		if (name.empty() && not entries.empty()) {
			return errors::Invalid_Grammar { .key = entries.front().first, .reason = "entry outside of any section" };
		}
	}

	std::vector<Rule<Token>> rules;

	if (auto lexer = config::find(sections, "lexer")) {
		for (auto const& [key, value] : *lexer) {
			if (key != "ignore") {
				return errors::Invalid_Grammar { .section = "lexer", .key = key, .reason = "unknown option" };
			}

			for (auto expression : split(value, ',')) {
				auto terms = class_terms(expression);
				if (not terms.has_value()) {
					return in_entry(std::move(terms.error()), "lexer", key);
				}

				auto ignored = std::move(terms->back());
				terms->pop_back();
				while (not terms->empty()) {
					ignored = Rule<Token>::both(std::move(terms->back()), std::move(ignored));
					terms->pop_back();
				}
				rules.push_back(Rule<Token>::ignore(std::move(ignored)));
			}
		}
	}

	if (auto keywords = config::find(sections, "keywords")) {
		for (auto const& [kind, value] : *keywords) {
			auto alternatives = split(value, ',');
			if (std::any_of(alternatives.begin(), alternatives.end(), [](auto a) { return a.empty(); })) {
				return errors::Invalid_Grammar { .section = "keywords", .key = kind, .reason = "empty literal" };
			}

			// Right nested either keeps earlier alternatives preferred
			auto literal = Rule<Token>::literal(std::string(alternatives.back()));
			for (auto it = std::next(alternatives.rbegin()); it != alternatives.rend(); ++it) {
				literal = Rule<Token>::either(Rule<Token>::literal(std::string(*it)), std::move(literal));
			}

			rules.push_back(Rule<Token>::value(std::move(literal), produce(kind)));
		}
	}

	if (auto classes = config::find(sections, "classes")) {
		for (auto const& [kind, expression] : *classes) {
			auto terms = class_terms(expression);
			if (not terms.has_value()) {
				return in_entry(std::move(terms.error()), "classes", kind);
			}

			if (terms->size() == 1) {
				rules.push_back(Rule<Token>::value(std::move(terms->front()), produce(kind)));
			} else {
				rules.push_back(Rule<Token>::all(std::move(*terms), produce(kind)));
			}
		}
	}

	if (rules.empty()) {
		return errors::Invalid_Grammar { .reason = "grammar doesn't define any rules" };
	}

	return Rule<Token>::any(std::move(rules));
}
