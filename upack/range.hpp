// upack - Unicode break property table packer in C++
// Copyright (c) 2017-2025 Jesse W. Towner

#ifndef UPACK_INCLUDE_UPACK_RANGE_HPP
#define UPACK_INCLUDE_UPACK_RANGE_HPP

#include <upack/detail.hpp>
#include <upack/enum.hpp>
#include <upack/error.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace upack {

inline constexpr char32_t max_codepoint = 0x10FFFFU;

// Codepoint range [start, end] tagged with a property owned by an enum_registry
struct unicode_range
{
	char32_t start;
	char32_t end;
	enum_value const* property;

	[[nodiscard]] bool is_single() const noexcept { return start == end; }
	[[nodiscard]] bool overlaps(unicode_range const& other) const noexcept { return start <= other.end && end >= other.start; }

	// True if next immediately follows this range and carries the same property
	[[nodiscard]] bool is_adjacent(unicode_range const& next) const noexcept
	{
		return next.start == end + 1 && property == next.property;
	}

	void extend(unicode_range const& extension) noexcept { end = extension.end; }
};

using normalization_table = std::map<std::string_view, std::string_view>;

// Line break properties that behave identically to another property in the
// absence of ICU data and language dictionaries (see UAX #14, LB1).
inline normalization_table const line_break_normalizations =
{
	{ "NL", "BK" },
	{ "AI", "AL" },
	{ "SA", "AL" },
	{ "SG", "AL" },
	{ "XX", "AL" },
	{ "CJ", "NS" }
};

[[nodiscard]] constexpr std::string_view remove_comment(std::string_view line) noexcept
{
	auto const pound = line.find('#');
	return pound == std::string_view::npos ? line : line.substr(0, pound);
}

[[nodiscard]] constexpr bool is_blank_line(std::string_view line) noexcept
{
	return detail::trim(remove_comment(line)).empty();
}

namespace detail {

[[nodiscard]] inline char32_t parse_codepoint(std::string_view text)
{
	auto const value = parse_hex(detail::trim(text));
	if (!value)
		throw bad_range_line{"invalid codepoint '" + std::string{text} + "'"};
	return checked_cast<char32_t, bad_codepoint>(*value, 0U, max_codepoint);
}

} // namespace detail

// Parses "<start>[..<end>] ; <property> [# comment]" into a range, registering
// the property (or its normalized replacement) in registry.
//
//   00C0..00D6    ; ALetter # L&  [23] LATIN CAPITAL LETTER A WITH GRAVE..
//   037F          ; ALetter # L&       GREEK CAPITAL LETTER YOT
[[nodiscard]] inline unicode_range parse_range_line(std::string_view line, enum_registry& registry, normalization_table const* normalizations = nullptr)
{
	auto const data = remove_comment(line);
	auto const semicolon = data.find(';');
	if (semicolon == std::string_view::npos)
		throw bad_range_line{"expected ';' between range and property"};

	auto const range_text = detail::trim(data.substr(0, semicolon));
	auto const property_text = detail::trim(data.substr(semicolon + 1));
	if (property_text.empty())
		throw bad_range_line{"missing property name"};

	unicode_range range{};
	if (auto const dots = range_text.find(".."); dots != std::string_view::npos) {
		range.start = detail::parse_codepoint(range_text.substr(0, dots));
		range.end = detail::parse_codepoint(range_text.substr(dots + 2));
	} else {
		range.start = range.end = detail::parse_codepoint(range_text);
	}
	if (range.start > range.end)
		throw bad_range_line{"range start exceeds range end"};

	if (normalizations != nullptr) {
		if (auto const normal = normalizations->find(property_text); normal != normalizations->end()) {
			range.property = &registry.add(normal->second, property_text);
			return range;
		}
	}
	range.property = &registry.add(property_text);
	return range;
}

// Parses every data line from first_line on, skipping lines that are blank once
// comments are removed. Errors report 1-based line numbers.
[[nodiscard]] inline std::vector<unicode_range> parse_range_lines(std::vector<std::string> const& lines, enum_registry& registry,
		normalization_table const* normalizations = nullptr, std::size_t first_line = 0)
{
	std::vector<unicode_range> ranges;
	for (std::size_t i = first_line, n = lines.size(); i < n; ++i) {
		if (is_blank_line(lines[i]))
			continue;
		try {
			ranges.push_back(parse_range_line(lines[i], registry, normalizations));
		} catch (bad_range_line const& e) {
			throw bad_range_line{"line " + std::to_string(i + 1) + ": " + e.what()};
		}
	}
	return ranges;
}

} // namespace upack

#endif
