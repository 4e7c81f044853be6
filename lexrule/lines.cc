#include <lexrule/lines.hh>

#include <iomanip>

Lines Lines::the;

void Lines::add_file(std::string filename, std::string_view source)
{
	sources[filename] = source;

	auto &lines_in_file = lines[std::move(filename)];
	lines_in_file.clear();

	while (not source.empty()) {
		auto end = source.find('\n');
		if (end == std::string_view::npos) {
			lines_in_file.push_back(source);
			break;
		} else {
			lines_in_file.push_back(source.substr(0, end));
			source.remove_prefix(end+1);
		}
	}
}

std::string_view Lines::source(std::string const& filename) const
{
	if (auto it = sources.find(filename); it != sources.end()) {
		return it->second;
	}
	return {};
}

void Lines::print(std::ostream &os, std::string const& filename, unsigned first_line, unsigned last_line) const
{
	auto const it = lines.find(filename);
	if (it == lines.end()) {
		return;
	}

	auto const& file = it->second;
	for (auto i = first_line; i <= last_line && i <= file.size(); ++i) {
		os << std::setw(3) << std::right << i << " | " << file[i-1] << '\n';
	}
	os << std::flush;
}
