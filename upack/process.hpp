// upack - Unicode break property table packer in C++
// Copyright (c) 2017-2025 Jesse W. Towner

#ifndef UPACK_INCLUDE_UPACK_PROCESS_HPP
#define UPACK_INCLUDE_UPACK_PROCESS_HPP

#include <upack/range.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace upack {

// Two ranges whose spans intersect, in sorted order
struct range_overlap
{
	unicode_range previous;
	unicode_range next;

	[[nodiscard]] std::string message() const
	{
		std::ostringstream out;
		out << std::uppercase << std::hex << std::setfill('0')
			<< "data contains overlapping ranges: "
			<< std::setw(4) << static_cast<std::uint_least32_t>(previous.start) << ".."
			<< std::setw(4) << static_cast<std::uint_least32_t>(previous.end) << " and "
			<< std::setw(4) << static_cast<std::uint_least32_t>(next.start) << ".."
			<< std::setw(4) << static_cast<std::uint_least32_t>(next.end);
		return out.str();
	}
};

using process_result = std::variant<std::vector<unicode_range>, range_overlap>;

inline void sort_ranges(std::vector<unicode_range>& ranges)
{
	std::stable_sort(ranges.begin(), ranges.end(), [](auto const& x, auto const& y) { return x.start < y.start; });
}

// Expects ranges sorted by start
[[nodiscard]] inline std::optional<range_overlap> verify_no_overlapping_ranges(std::vector<unicode_range> const& ranges)
{
	for (std::size_t i = 1, n = ranges.size(); i < n; ++i)
		if (ranges[i].overlaps(ranges[i - 1]))
			return range_overlap{ranges[i - 1], ranges[i]};
	return std::nullopt;
}

// Combines sorted, non-overlapping ranges into the fewest equivalent ranges.
//
//   01C4..0293; ALetter
//   0294..0294; ALetter      =>   01C4..02AF; ALetter
//   0295..02AF; ALetter
//
// Codepoints in a gap carry the default property, so two default property
// ranges separated by a gap are combined as well.
[[nodiscard]] inline std::vector<unicode_range> combine_adjacent_ranges(std::vector<unicode_range> const& ranges, std::string_view default_property)
{
	std::vector<unicode_range> result;
	if (ranges.empty())
		return result;
	result.push_back(ranges.front());
	for (std::size_t i = 1, n = ranges.size(); i < n; ++i) {
		auto& prev = result.back();
		auto const& next = ranges[i];
		if (prev.is_adjacent(next))
			prev.extend(next);
		else if (prev.property == next.property && prev.property->name() == default_property)
			prev.extend(next);
		else
			result.push_back(next);
	}
	return result;
}

// Sorts, validates and merges parsed ranges into their canonical minimal form
[[nodiscard]] inline process_result process_ranges(std::vector<unicode_range> ranges, std::string_view default_property)
{
	sort_ranges(ranges);
	if (auto overlap = verify_no_overlapping_ranges(ranges); overlap)
		return *overlap;
	return combine_adjacent_ranges(ranges, default_property);
}

} // namespace upack

#endif
