// upack - Unicode break property table packer in C++
// Copyright (c) 2017-2025 Jesse W. Towner

#include <upack/upack.hpp>
#include <iostream>

#undef NDEBUG
#include <cassert>

void test_add_is_idempotent()
{
	upack::enum_registry registry;
	auto const& a = registry.add("ALetter");
	auto const& b = registry.add("ALetter");
	assert(&a == &b);
	assert(registry.size() == 1);
	assert(a.index() == 0);
	assert(a.name() == "ALetter");
	assert(a.normalized_from().empty());
}

void test_indices_are_contiguous()
{
	upack::enum_registry registry;
	for (auto name : { "CR", "LF", "CR", "Newline", "LF", "Extend", "ZWJ", "Newline" })
		(void)registry.add(name);
	assert(registry.size() == 5);
	std::size_t expected = 0;
	for (auto const& value : registry)
		assert(value.index() == expected++);
	assert(registry.at(0).name() == "CR");
	assert(registry.at(1).name() == "LF");
	assert(registry.at(2).name() == "Newline");
	assert(registry.at(3).name() == "Extend");
	assert(registry.at(4).name() == "ZWJ");
}

void test_normalized_from()
{
	upack::enum_registry registry;
	auto const& al = registry.add("AL", "AI");
	(void)registry.add("AL", "SA");
	(void)registry.add("AL", "AI");
	(void)registry.add("AL");
	assert(registry.size() == 1);
	assert(al.normalized_from().size() == 2);
	assert(al.normalized_from()[0] == "AI");
	assert(al.normalized_from()[1] == "SA");
}

void test_seed()
{
	upack::enum_registry registry;
	(void)registry.add("BK");
	(void)registry.add("AL");
	auto const& al = registry.seed("AL");
	assert(al.index() == 1);
	assert(registry.size() == 2);
	auto const& unknown = registry.seed("Unknown");
	assert(unknown.index() == 2);
	assert(registry.size() == 3);
	assert(&registry.seed("Unknown") == &unknown);
	assert(registry.size() == 3);
}

void test_find()
{
	upack::enum_registry registry;
	(void)registry.add("Numeric");
	assert(registry.find("Numeric") != nullptr);
	assert(registry.find("Numeric")->index() == 0);
	assert(registry.find("Katakana") == nullptr);
	assert(registry.find("") == nullptr);
}

void test_addresses_are_stable()
{
	upack::enum_registry registry;
	auto const* first = &registry.add("P0");
	for (int i = 1; i < 52; ++i)
		(void)registry.add("P" + std::to_string(i));
	assert(first == registry.find("P0"));
	assert(first->name() == "P0");
}

void test_find_agrees_with_index()
{
	upack::enum_registry registry;
	for (auto name : { "CR", "LF", "CR", "Extend", "LF", "ZWJ", "Extend" })
		(void)registry.add(name, "raw_" + std::string{name});
	assert(registry.size() == 4);
	for (auto const& value : registry) {
		assert(registry.find(value.name()) == &value);
		assert(&registry.at(value.index()) == &value);
		assert(value.normalized_from().size() == 1);
	}
	assert(registry.find("raw_CR") == nullptr);
}

void test_identifier()
{
	upack::enum_registry registry;
	assert(registry.add("Extend_NumLet").identifier() == "ExtendNumLet");
	assert(registry.add("Regional_Indicator").identifier() == "RegionalIndicator");
	assert(registry.add("ALetter").identifier() == "ALetter");
}

void test_serialized()
{
	upack::enum_registry registry;
	for (int i = 0; i < 52; ++i)
		(void)registry.add("P" + std::to_string(i));
	assert(registry.at(0).serialized() == 'A');
	assert(registry.at(25).serialized() == 'Z');
	assert(registry.at(26).serialized() == 'a');
	assert(registry.at(51).serialized() == 'z');
	assert(upack::deserialize_enum_index('A') == 0U);
	assert(upack::deserialize_enum_index('Z') == 25U);
	assert(upack::deserialize_enum_index('a') == 26U);
	assert(upack::deserialize_enum_index('z') == 51U);
	assert(!upack::deserialize_enum_index('!'));
	assert(!upack::deserialize_enum_index('0'));
}

void test_serialized_capacity()
{
	upack::enum_registry registry;
	for (int i = 0; i < 53; ++i)
		(void)registry.add("P" + std::to_string(i));
	assert(registry.size() == 53);
	bool thrown = false;
	try {
		(void)registry.at(52).serialized();
	} catch (upack::bad_enum_capacity const&) {
		thrown = true;
	}
	assert(thrown);
}

int main()
{
	try {
		test_add_is_idempotent();
		test_indices_are_contiguous();
		test_normalized_from();
		test_seed();
		test_find();
		test_addresses_are_stable();
		test_find_agrees_with_index();
		test_identifier();
		test_serialized();
		test_serialized_capacity();
	} catch (std::exception const& e) {
		std::cerr << "Error: " << e.what() << "\n";
		return -1;
	} catch (...) {
		std::cerr << "Unknown Error\n";
		return -1;
	}
	return 0;
}
