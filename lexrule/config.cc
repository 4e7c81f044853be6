#include <fstream>
#include <iterator>
#include <algorithm>
#include <lexrule/config.hh>
#include <lexrule/errors.hh>
#include <lexrule/unicode.hh>
#include <lexrule/user_directory.hh>

config::Sections config::parse(std::string_view source)
{
	Sections sections;
	sections.emplace_back("", Key_Value{});

	while (not source.empty()) {
		auto const newline = source.find('\n');
		std::string_view line = source.substr(0, newline);
		source = newline == std::string_view::npos ? std::string_view{} : source.substr(newline+1);

		if (auto comment = line.find('#'); comment != std::string_view::npos) {
			line = line.substr(0, comment);
		}
		trim(line);

		if (line.starts_with('[') && line.ends_with(']')) {
			auto name = line.substr(1, line.size() - 2);
			trim(name);
			auto it = std::find_if(sections.begin(), sections.end(), [&](auto const& s) { return s.first == name; });
			if (it == sections.end()) {
				sections.emplace_back(std::string(name), Key_Value{});
			} else {
				// Reopened section continues at its end
				std::rotate(it, std::next(it), sections.end());
			}
			continue;
		}

		if (auto split = line.find('='); split != std::string_view::npos) {
			auto key = line.substr(0, split);
			auto val = line.substr(split+1);
			trim(key);
			trim(val);

			auto &kv = sections.back().second;
			if (auto it = std::find_if(kv.begin(), kv.end(), [&](auto const& e) { return e.first == key; }); it != kv.end()) {
				it->second = std::string(val);
			} else {
				kv.emplace_back(std::string(key), std::string(val));
			}
		}
	}

	return sections;
}

Result<config::Sections> config::from_file(std::filesystem::path const& path)
{
	std::ifstream in(path);
	if (not in.is_open()) {
		return errors::Missing_File { .path = path.string() };
	}

	std::string const source(std::istreambuf_iterator<char>(in), {});
	return parse(source);
}

config::Key_Value const* config::find(Sections const& sections, std::string_view section)
{
	auto it = std::find_if(sections.begin(), sections.end(), [&](auto const& s) { return s.first == section; });
	return it == sections.end() ? nullptr : &it->second;
}

std::optional<std::string_view> config::find(Key_Value const& kv, std::string_view key)
{
	auto it = std::find_if(kv.begin(), kv.end(), [&](auto const& e) { return e.first == key; });
	if (it == kv.end()) {
		return std::nullopt;
	}
	return it->second;
}

std::filesystem::path config::location()
{
	return user_directory::config_home() / "grammar.ini";
}
