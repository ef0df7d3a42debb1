// upack - Unicode break property table packer in C++
// Copyright (c) 2017-2025 Jesse W. Towner

#ifndef UPACK_INCLUDE_UPACK_PACK_HPP
#define UPACK_INCLUDE_UPACK_PACK_HPP

#include <upack/detail.hpp>
#include <upack/enum.hpp>
#include <upack/error.hpp>
#include <upack/range.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace upack {

// Each record is <start><end or '!'><code>, numbers as 4 base-36 digits
inline constexpr std::size_t packed_field_width = 4;
inline constexpr std::uint_least32_t packed_field_limit = 36U * 36U * 36U * 36U - 1U;
inline constexpr char packed_single_marker = '!';

struct packed_properties
{
	std::string data;
	std::size_t single_ranges = 0;
	std::size_t property_count = 0;
};

// Record recovered from packed data
struct packed_range
{
	char32_t start;
	char32_t end;
	std::size_t property_index;

	[[nodiscard]] friend bool operator==(packed_range const& x, packed_range const& y) noexcept
	{
		return x.start == y.start && x.end == y.end && x.property_index == y.property_index;
	}

	[[nodiscard]] friend bool operator!=(packed_range const& x, packed_range const& y) noexcept
	{
		return !(x == y);
	}
};

[[nodiscard]] inline std::string pack_codepoint(char32_t codepoint)
{
	detail::assure_in_range<bad_codepoint>(static_cast<std::uint_least32_t>(codepoint), 0U, packed_field_limit);
	return detail::to_base36(static_cast<std::uint_least32_t>(codepoint), packed_field_width);
}

inline void pack_range(std::string& out, unicode_range const& range)
{
	out += pack_codepoint(range.start);
	if (range.is_single())
		out += packed_single_marker;
	else
		out += pack_codepoint(range.end);
	out += range.property->serialized();
}

[[nodiscard]] inline std::size_t count_single_ranges(std::vector<unicode_range> const& ranges)
{
	return static_cast<std::size_t>(std::count_if(ranges.begin(), ranges.end(), [](auto const& r) { return r.is_single(); }));
}

[[nodiscard]] inline packed_properties pack_properties(std::vector<unicode_range> const& ranges, enum_registry const& registry)
{
	if (registry.size() > max_enum_values)
		throw bad_enum_capacity{};
	packed_properties packed;
	packed.data.reserve(ranges.size() * (packed_field_width * 2 + 1));
	for (auto const& range : ranges)
		pack_range(packed.data, range);
	packed.single_ranges = count_single_ranges(ranges);
	packed.property_count = registry.size();
	return packed;
}

namespace detail {

[[nodiscard]] inline char32_t unpack_codepoint(std::string_view data, std::size_t offset)
{
	if (data.size() - offset < packed_field_width)
		throw bad_packed_data{"truncated record at offset " + std::to_string(offset)};
	auto const value = parse_base36(data.substr(offset, packed_field_width));
	if (!value)
		throw bad_packed_data{"invalid base-36 number at offset " + std::to_string(offset)};
	return static_cast<char32_t>(*value);
}

} // namespace detail

[[nodiscard]] inline std::size_t deserialize_property_index(char code)
{
	auto const index = deserialize_enum_index(code);
	if (!index)
		throw bad_packed_data{std::string{"invalid property code '"} + code + "'"};
	return *index;
}

// Decodes packed data back into its sequence of records
[[nodiscard]] inline std::vector<packed_range> unpack_ranges(std::string_view data)
{
	std::vector<packed_range> ranges;
	std::size_t offset = 0;
	while (offset < data.size()) {
		packed_range range{};
		range.start = detail::unpack_codepoint(data, offset);
		offset += packed_field_width;
		if (offset < data.size() && data[offset] == packed_single_marker) {
			range.end = range.start;
			++offset;
		} else {
			range.end = detail::unpack_codepoint(data, offset);
			offset += packed_field_width;
		}
		if (offset >= data.size())
			throw bad_packed_data{"missing property code at offset " + std::to_string(offset)};
		range.property_index = deserialize_property_index(data[offset++]);
		ranges.push_back(range);
	}
	return ranges;
}

} // namespace upack

#endif
