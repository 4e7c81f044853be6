#include <lexrule/scanner/scanner.hh>
#include <lexrule/unicode.hh>

#include <iomanip>

unsigned unit_length(std::string_view buffer, unsigned offset, Unit unit)
{
	switch (unit) {
	case Unit::Byte:
		return 1;

	case Unit::Rune:
		{
			// Malformed sequence is left unchanged by decode and counts as a single byte
			auto const rest = buffer.substr(offset);
			auto const [rune, after] = utf8::decode(rest);
			return after.size() == rest.size() ? 1 : unsigned(rest.size() - after.size());
		}
	}
	unreachable();
}

std::ostream& operator<<(std::ostream& os, Trace const& trace)
{
	return os << '[' << trace.start << ", " << trace.stop << ") "
		<< std::quoted(trace.window) << ": " << trace.match;
}
