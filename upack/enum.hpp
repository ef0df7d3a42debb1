// upack - Unicode break property table packer in C++
// Copyright (c) 2017-2025 Jesse W. Towner

#ifndef UPACK_INCLUDE_UPACK_ENUM_HPP
#define UPACK_INCLUDE_UPACK_ENUM_HPP

#include <upack/detail.hpp>
#include <upack/error.hpp>

#include <algorithm>
#include <cstddef>
#include <deque>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace upack {

// Uppercase letters for the first 26 values, lowercase letters for the rest
inline constexpr std::size_t max_enum_values = 52;

[[nodiscard]] inline char serialize_enum_index(std::size_t index)
{
	if (index >= max_enum_values)
		throw bad_enum_capacity{};
	if (index < 26)
		return static_cast<char>('A' + index);
	return static_cast<char>('a' + (index - 26));
}

[[nodiscard]] inline std::optional<std::size_t> deserialize_enum_index(char code) noexcept
{
	if (code >= 'A' && code <= 'Z')
		return static_cast<std::size_t>(code - 'A');
	if (code >= 'a' && code <= 'z')
		return static_cast<std::size_t>(code - 'a') + 26;
	return std::nullopt;
}

class enum_value
{
	friend class enum_registry;

	std::size_t index_;
	std::string name_;
	std::vector<std::string> normalized_from_;

	void add_normalized_from(std::string_view raw)
	{
		if (std::find(normalized_from_.begin(), normalized_from_.end(), raw) == normalized_from_.end())
			normalized_from_.emplace_back(raw);
	}

public:
	enum_value(std::size_t index, std::string name)
		: index_{index}, name_{std::move(name)} {}

	[[nodiscard]] std::size_t index() const noexcept { return index_; }
	[[nodiscard]] std::string const& name() const noexcept { return name_; }

	// Source names that were normalized into this value, in the order first seen
	[[nodiscard]] std::vector<std::string> const& normalized_from() const noexcept { return normalized_from_; }

	// One character code used in the packed encoding
	[[nodiscard]] char serialized() const { return serialize_enum_index(index_); }

	// Name usable as a generated enumerator, e.g. "Extend_NumLet" becomes "ExtendNumLet"
	[[nodiscard]] std::string identifier() const
	{
		std::string id;
		id.reserve(name_.size());
		std::copy_if(name_.begin(), name_.end(), std::back_inserter(id), [](char c) { return c != '_'; });
		return id;
	}
};

// Append-only collection of enum values, indexed in first-seen order.
// Values keep their addresses for the lifetime of the registry, so ranges
// may refer to them by pointer.
class enum_registry
{
	std::deque<enum_value> values_;
	std::unordered_map<std::string, std::size_t> indices_;

public:
	using const_iterator = std::deque<enum_value>::const_iterator;

	enum_registry() = default;
	enum_registry(enum_registry const&) = delete;
	enum_registry(enum_registry&&) = default;
	enum_registry& operator=(enum_registry const&) = delete;
	enum_registry& operator=(enum_registry&&) = default;
	~enum_registry() = default;

	enum_value const& add(std::string_view name, std::optional<std::string_view> normalized_from = std::nullopt)
	{
		std::string key{name};
		auto index = indices_.find(key);
		if (index == indices_.end()) {
			values_.emplace_back(values_.size(), key);
			detail::scope_fail rollback{[this] { values_.pop_back(); }};
			index = indices_.emplace(std::move(key), values_.size() - 1).first;
		}
		auto& value = values_[index->second];
		if (normalized_from)
			value.add_normalized_from(*normalized_from);
		return value;
	}

	// Registers name if it is not already present
	enum_value const& seed(std::string_view name)
	{
		if (auto const* value = find(name); value != nullptr)
			return *value;
		return add(name);
	}

	[[nodiscard]] enum_value const* find(std::string_view name) const
	{
		auto const index = indices_.find(std::string{name});
		return index != indices_.end() ? &values_[index->second] : nullptr;
	}

	[[nodiscard]] enum_value const& at(std::size_t index) const { return values_.at(index); }
	[[nodiscard]] std::size_t size() const noexcept { return values_.size(); }
	[[nodiscard]] bool empty() const noexcept { return values_.empty(); }
	[[nodiscard]] const_iterator begin() const noexcept { return values_.begin(); }
	[[nodiscard]] const_iterator end() const noexcept { return values_.end(); }
};

} // namespace upack

#endif
