#include "pricecast/data/csv_loader.hpp"
#include "pricecast/utils/logging.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace pricecast::data {

namespace {

std::vector<std::string> parseLine(const std::string &line) {
	std::vector<std::string> result;
	std::string current;
	bool in_quotes = false;
	for (std::size_t i = 0; i < line.size(); i++) {
		char c = line[i];
		if (c == '"') {
			if (in_quotes && i + 1 < line.size() && line[i + 1] == '"') {
				current.push_back('"');
				i++;
			} else {
				in_quotes = !in_quotes;
			}
		} else if (c == ',' && !in_quotes) {
			result.push_back(current);
			current.clear();
		} else if ((c == '\r' || c == '\n') && !in_quotes) {
			continue;
		} else {
			current.push_back(c);
		}
	}
	result.push_back(current);
	return result;
}

std::string trim(const std::string &text) {
	const auto first = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
	const auto last = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) { return std::isspace(c); });
	return first < last.base() ? std::string(first, last.base()) : std::string();
}

std::string lower(std::string text) {
	std::transform(text.begin(), text.end(), text.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return text;
}

bool tryParseDouble(const std::string &input, double &result) {
	if (input.empty()) {
		return false;
	}
	char *end = nullptr;
	result = std::strtod(input.c_str(), &end);
	return end == input.c_str() + input.size();
}

} // namespace

std::vector<core::Bar> CsvSeriesLoader::parse(std::istream &input, const std::string &source) {
	std::string line;
	if (!std::getline(input, line)) {
		throw std::runtime_error(source + ": empty CSV input.");
	}

	enum Field { Date, Open, High, Low, Close, Volume, FieldCount };
	const std::array<std::string, FieldCount> names{"date", "open", "high", "low", "close", "volume"};
	std::array<std::optional<std::size_t>, FieldCount> index;

	const auto headers = parseLine(line);
	for (std::size_t i = 0; i < headers.size(); ++i) {
		const auto header = lower(trim(headers[i]));
		for (std::size_t f = 0; f < names.size(); ++f) {
			if (header == names[f] && !index[f]) {
				index[f] = i;
			}
		}
	}
	for (std::size_t f = 0; f < Volume; ++f) {
		if (!index[f]) {
			throw std::runtime_error(source + ": header has no '" + names[f] + "' column.");
		}
	}

	std::vector<core::Bar> bars;
	std::size_t line_number = 1;
	while (std::getline(input, line)) {
		++line_number;
		if (trim(line).empty()) {
			continue;
		}
		const auto fields = parseLine(line);
		auto field = [&](Field f) -> std::string {
			const auto i = *index[f];
			if (i >= fields.size()) {
				throw std::runtime_error(source + ":" + std::to_string(line_number) + ": missing '" + names[f] +
				                         "' value.");
			}
			return trim(fields[i]);
		};
		auto number = [&](Field f) {
			const auto text = field(f);
			double value = 0.0;
			if (!tryParseDouble(text, value)) {
				throw std::runtime_error(source + ":" + std::to_string(line_number) + ": invalid " + names[f] +
				                         " value '" + text + "'.");
			}
			return value;
		};

		core::Bar bar;
		try {
			bar.date = core::parseDate(field(Date));
		} catch (const std::invalid_argument &e) {
			throw std::runtime_error(source + ":" + std::to_string(line_number) + ": " + e.what());
		}
		bar.open = number(Open);
		bar.high = number(High);
		bar.low = number(Low);
		bar.close = number(Close);
		bar.volume = index[Volume] ? number(Volume) : 0.0;
		bars.push_back(bar);
	}
	return bars;
}

core::PriceSeries CsvSeriesLoader::load(const std::string &path, bool sanitize) {
	std::ifstream file(path);
	if (!file) {
		throw std::runtime_error("Cannot open '" + path + "'.");
	}
	auto bars = parse(file, path);
	PRICECAST_INFO("Read {} bars from '{}'.", bars.size(), path);
	if (sanitize) {
		return core::PriceSeries::sanitize(std::move(bars));
	}
	return core::PriceSeries(bars);
}

} // namespace pricecast::data
