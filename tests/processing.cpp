// upack - Unicode break property table packer in C++
// Copyright (c) 2017-2025 Jesse W. Towner

#include <upack/upack.hpp>
#include <iostream>

#undef NDEBUG
#include <cassert>

using upack::unicode_range;

std::vector<unicode_range> expect_ranges(upack::process_result const& result)
{
	assert(std::holds_alternative<std::vector<unicode_range>>(result));
	return std::get<std::vector<unicode_range>>(result);
}

void assert_canonical(std::vector<unicode_range> const& ranges)
{
	for (std::size_t i = 1; i < ranges.size(); ++i) {
		assert(ranges[i - 1].start <= ranges[i - 1].end);
		assert(ranges[i - 1].end < ranges[i].start);
		assert(!ranges[i - 1].is_adjacent(ranges[i]));
	}
}

void test_merge_adjacent()
{
	upack::enum_registry registry;
	auto const& p = registry.add("P");
	auto const& d = registry.add("D");
	auto const ranges = expect_ranges(upack::process_ranges({{21, 30, &p}, {10, 20, &p}}, d.name()));
	assert(ranges.size() == 1);
	assert(ranges[0].start == 10);
	assert(ranges[0].end == 30);
	assert(ranges[0].property == &p);
}

void test_merge_default_gap()
{
	upack::enum_registry registry;
	auto const& p = registry.add("P");
	auto const ranges = expect_ranges(upack::process_ranges({{10, 20, &p}, {25, 30, &p}}, "P"));
	assert(ranges.size() == 1);
	assert(ranges[0].start == 10);
	assert(ranges[0].end == 30);
}

void test_no_merge_non_default_gap()
{
	upack::enum_registry registry;
	auto const& p = registry.add("P");
	(void)registry.add("D");
	auto const ranges = expect_ranges(upack::process_ranges({{10, 20, &p}, {25, 30, &p}}, "D"));
	assert(ranges.size() == 2);
	assert(ranges[0].start == 10 && ranges[0].end == 20);
	assert(ranges[1].start == 25 && ranges[1].end == 30);
}

void test_no_merge_different_properties()
{
	upack::enum_registry registry;
	auto const& p = registry.add("P");
	auto const& q = registry.add("Q");
	auto const ranges = expect_ranges(upack::process_ranges({{10, 20, &p}, {21, 30, &q}, {31, 40, &p}}, "Q"));
	assert(ranges.size() == 3);
	assert(ranges[0].property == &p);
	assert(ranges[1].property == &q);
	assert(ranges[2].property == &p);
	assert_canonical(ranges);
}

void test_default_gap_does_not_skip_other_property()
{
	upack::enum_registry registry;
	auto const& d = registry.add("D");
	auto const& q = registry.add("Q");
	auto const ranges = expect_ranges(upack::process_ranges({{0, 9, &d}, {20, 29, &q}, {40, 49, &d}}, "D"));
	assert(ranges.size() == 3);
	assert_canonical(ranges);
}

void test_sort_and_merge_chain()
{
	upack::enum_registry registry;
	auto const& a = registry.add("ALetter");
	auto const& n = registry.add("Numeric");
	(void)registry.add("Unknown");
	std::vector<unicode_range> input = {
		{0x0295, 0x02AF, &a},
		{0x0030, 0x0039, &n},
		{0x01C4, 0x0293, &a},
		{0x0294, 0x0294, &a},
		{0x0041, 0x005A, &a},
		{0x0061, 0x007A, &a},
	};
	auto const ranges = expect_ranges(upack::process_ranges(input, "Unknown"));
	assert(ranges.size() == 4);
	assert(ranges[0].start == 0x30 && ranges[0].end == 0x39 && ranges[0].property == &n);
	assert(ranges[1].start == 0x41 && ranges[1].end == 0x5A);
	assert(ranges[2].start == 0x61 && ranges[2].end == 0x7A);
	assert(ranges[3].start == 0x01C4 && ranges[3].end == 0x02AF && ranges[3].property == &a);
	assert_canonical(ranges);
}

void test_overlap_detected()
{
	upack::enum_registry registry;
	auto const& p = registry.add("P");
	auto const& q = registry.add("Q");
	auto const result = upack::process_ranges({{10, 20, &p}, {30, 40, &p}, {20, 25, &q}}, "P");
	assert(std::holds_alternative<upack::range_overlap>(result));
	auto const& overlap = std::get<upack::range_overlap>(result);
	assert(overlap.previous.start == 10 && overlap.previous.end == 20);
	assert(overlap.next.start == 20 && overlap.next.end == 25);
	assert(overlap.message() == "data contains overlapping ranges: 000A..0014 and 0014..0019");
}

void test_overlap_same_start()
{
	upack::enum_registry registry;
	auto const& p = registry.add("P");
	auto const result = upack::process_ranges({{5, 5, &p}, {5, 5, &p}}, "Q");
	assert(std::holds_alternative<upack::range_overlap>(result));
}

void test_verify_no_overlapping_ranges()
{
	upack::enum_registry registry;
	auto const& p = registry.add("P");
	assert(!upack::verify_no_overlapping_ranges({}));
	assert(!upack::verify_no_overlapping_ranges({{0, 0, &p}, {1, 1, &p}, {5, 9, &p}}));
	assert(upack::verify_no_overlapping_ranges({{0, 4, &p}, {2, 3, &p}}));
}

void test_empty_input()
{
	auto const ranges = expect_ranges(upack::process_ranges({}, "AL"));
	assert(ranges.empty());
}

void test_concrete_scenario()
{
	upack::enum_registry registry;
	auto parsed = upack::parse_range_lines({"0041..005A;AL", "005B..007A;AL"}, registry, &upack::line_break_normalizations);
	(void)registry.seed("AL");
	auto const ranges = expect_ranges(upack::process_ranges(std::move(parsed), "AL"));
	assert(ranges.size() == 1);
	assert(ranges[0].start == 0x41);
	assert(ranges[0].end == 0x7A);
	assert(ranges[0].property->name() == "AL");
	assert(registry.size() == 1);
}

int main()
{
	try {
		test_merge_adjacent();
		test_merge_default_gap();
		test_no_merge_non_default_gap();
		test_no_merge_different_properties();
		test_default_gap_does_not_skip_other_property();
		test_sort_and_merge_chain();
		test_overlap_detected();
		test_overlap_same_start();
		test_verify_no_overlapping_ranges();
		test_empty_input();
		test_concrete_scenario();
	} catch (std::exception const& e) {
		std::cerr << "Error: " << e.what() << "\n";
		return -1;
	} catch (...) {
		std::cerr << "Unknown Error\n";
		return -1;
	}
	return 0;
}
