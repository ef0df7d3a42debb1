// upack - Unicode break property table packer in C++
// Copyright (c) 2017-2025 Jesse W. Towner

#ifndef UPACK_INCLUDE_UPACK_PROPERTY_SET_HPP
#define UPACK_INCLUDE_UPACK_PROPERTY_SET_HPP

#include <upack/detail.hpp>
#include <upack/enum.hpp>
#include <upack/error.hpp>
#include <upack/pack.hpp>
#include <upack/process.hpp>
#include <upack/range.hpp>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <iterator>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace upack {

// Parameters that distinguish one property family from another
struct property_family
{
	std::string_view name;
	std::string_view prefix;
	std::string_view default_property;
	std::string_view doc_link;
	normalization_table const* normalizations;
};

inline property_family const word_break_family
{
	"word break", "word", "Unknown",
	"http://unicode.org/reports/tr29/#Table_Word_Break_Property_Values",
	nullptr
};

inline property_family const line_break_family
{
	"line break", "line", "AL",
	"https://www.unicode.org/reports/tr14/tr14-45.html#DescriptionOfProperties",
	&line_break_normalizations
};

// Header, property values and merged ranges of one source table
struct property_collection
{
	std::vector<std::string> header;
	enum_registry registry;
	std::vector<unicode_range> ranges;
};

// Number of leading lines forming the header block, including the blank or
// comment-only line that terminates it. A data line ends the header as well.
[[nodiscard]] inline std::size_t header_length(std::vector<std::string> const& lines)
{
	for (std::size_t i = 0, n = lines.size(); i < n; ++i) {
		auto const line = detail::trim(lines[i]);
		if (line.empty() || line == "#")
			return i + 1;
		if (line.front() != '#')
			return i;
	}
	return lines.size();
}

[[nodiscard]] inline std::vector<std::string> extract_header(std::vector<std::string> const& lines)
{
	std::vector<std::string> header;
	for (auto const& line : lines) {
		auto const trimmed = detail::trim(line);
		if (trimmed.empty() || trimmed == "#" || trimmed.front() != '#')
			break;
		header.push_back(line);
	}
	return header;
}

[[nodiscard]] inline property_collection build_property_collection(std::vector<std::string> const& lines, property_family const& family)
{
	property_collection collection;
	collection.header = extract_header(lines);
	auto parsed = parse_range_lines(lines, collection.registry, family.normalizations, header_length(lines));
	collection.registry.seed(family.default_property);
	auto result = process_ranges(std::move(parsed), family.default_property);
	if (auto const* overlap = std::get_if<range_overlap>(&result); overlap != nullptr)
		throw bad_range_overlap{overlap->message()};
	collection.ranges = std::get<std::vector<unicode_range>>(std::move(result));
	return collection;
}

// Decodes packed data and checks it reproduces ranges exactly
inline void verify_packed_properties(packed_properties const& packed, std::vector<unicode_range> const& ranges)
{
	auto const unpacked = unpack_ranges(packed.data);
	auto const matches = std::equal(unpacked.begin(), unpacked.end(), ranges.begin(), ranges.end(),
		[](packed_range const& x, unicode_range const& y) {
			return x.start == y.start && x.end == y.end && x.property_index == y.property->index();
		});
	if (!matches)
		throw bad_packed_data{"packed data does not decode to the processed ranges"};
	if (count_single_ranges(ranges) != packed.single_ranges)
		throw bad_packed_data{"single range count does not match packed data"};
}

namespace detail {

[[nodiscard]] inline std::string to_upper(std::string_view s)
{
	std::string upper;
	upper.reserve(s.size());
	std::transform(s.begin(), s.end(), std::back_inserter(upper), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
	return upper;
}

class enum_values_printer
{
	enum_registry const& registry_;

public:
	explicit enum_values_printer(enum_registry const& registry)
		: registry_{registry} {}

	friend std::ostream& operator<<(std::ostream& out, enum_values_printer const& p)
	{
		for (auto const& value : p.registry_) {
			auto const& normalized = value.normalized_from();
			if (!normalized.empty()) {
				out << "\t// Normalized from: ";
				for (std::size_t i = 0, n = normalized.size(); i < n; ++i)
					out << (i > 0 ? ", " : "") << normalized[i];
				out << "\n";
			}
			out << "\t" << value.identifier() << ", // serialized as \"" << value.serialized() << "\"\n";
		}
		return out;
	}
};

// Splits the packed data into adjacent string literals no wider than columnlen
class packed_string_printer
{
	std::string_view data_;
	std::size_t columnlen_;

public:
	packed_string_printer(std::string_view data, std::size_t columnlen)
		: data_{data}, columnlen_{columnlen} {}

	friend std::ostream& operator<<(std::ostream& out, packed_string_printer const& p)
	{
		if (p.data_.empty())
			return out << "\t\"\"";
		for (std::size_t offset = 0; offset < p.data_.size(); offset += p.columnlen_) {
			if (offset > 0)
				out << "\n";
			out << "\t\"" << p.data_.substr(offset, p.columnlen_) << "\"";
		}
		return out;
	}
};

} // namespace detail

// Renders the generated C++ header embedding the packed properties
[[nodiscard]] inline std::string generate_source(property_family const& family, property_collection const& collection, packed_properties const& packed)
{
	auto const prefix = std::string{family.prefix};
	auto const guard = "UPACK_GENERATED_" + detail::to_upper(family.prefix) + "_BREAK_PROPERTIES_HPP";
	auto const enum_name = prefix + "_char_property";
	auto const* default_value = collection.registry.find(family.default_property);
	if (default_value == nullptr)
		throw upack_error{"default property " + std::string{family.default_property} + " is not registered"};

	std::ostringstream out;
	out << "// This header file is generated by the unicodesync tool program.\n"
		<< "// Do not modify this file by hand. Instead, modify and run the\n"
		<< "// tool to regenerate this file.\n"
		<< "//\n"
		<< "// Source:\n";
	for (auto const& line : collection.header)
		out << "// " << line << "\n";
	out << "\n"
		<< "#ifndef " << guard << "\n"
		<< "#define " << guard << "\n"
		<< "\n"
		<< "#include <cstddef>\n"
		<< "#include <cstdint>\n"
		<< "#include <string_view>\n"
		<< "\n"
		<< "namespace upack::generated {\n"
		<< "\n"
		<< "// For an explanation of these enum values, see:\n"
		<< "//\n"
		<< "// * " << family.doc_link << "\n"
		<< "enum class " << enum_name << " : std::uint_least8_t\n"
		<< "{\n"
		<< detail::enum_values_printer{collection.registry}
		<< "};\n"
		<< "\n"
		<< "inline constexpr std::string_view packed_" << prefix << "_break_properties =\n"
		<< detail::packed_string_printer{packed.data, 112} << ";\n"
		<< "\n"
		<< "inline constexpr std::size_t " << prefix << "_single_ranges_count = " << packed.single_ranges << ";\n"
		<< "inline constexpr std::size_t " << prefix << "_property_count = " << packed.property_count << ";\n"
		<< "inline constexpr " << enum_name << " " << prefix << "_default_property = "
		<< enum_name << "::" << default_value->identifier() << ";\n"
		<< "\n"
		<< "} // namespace upack::generated\n"
		<< "\n"
		<< "#endif\n";
	return out.str();
}

// Runs the whole pipeline over the lines of a source table and returns the generated header
[[nodiscard]] inline std::string sync_properties(std::vector<std::string> const& lines, property_family const& family)
{
	auto const collection = build_property_collection(lines, family);
	auto const packed = pack_properties(collection.ranges, collection.registry);
	verify_packed_properties(packed, collection.ranges);
	return generate_source(family, collection, packed);
}

} // namespace upack

#endif
