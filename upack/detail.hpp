// upack - Unicode break property table packer in C++
// Copyright (c) 2017-2025 Jesse W. Towner

#ifndef UPACK_INCLUDE_UPACK_DETAIL_HPP
#define UPACK_INCLUDE_UPACK_DETAIL_HPP

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <exception>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace upack::detail {

inline constexpr std::string_view whitespace_chars = " \t\n\r\f\v";
inline constexpr std::string_view base36_digits = "0123456789abcdefghijklmnopqrstuvwxyz";

[[nodiscard]] constexpr std::string_view trim(std::string_view s) noexcept
{
	auto const first = s.find_first_not_of(whitespace_chars);
	if (first == std::string_view::npos)
		return {};
	auto const last = s.find_last_not_of(whitespace_chars);
	return s.substr(first, last - first + 1);
}

template <class Error, class T, class U, class V, class = std::enable_if_t<std::is_integral_v<T> && std::is_integral_v<U> && std::is_integral_v<V>>>
constexpr void assure_in_range(T x, U minval, V maxval)
{
	if (!((minval <= x) && (x <= maxval)))
		throw Error();
}

template <class T, class Error, class S, class U, class V, class = std::enable_if_t<std::is_integral_v<T> && std::is_integral_v<S> && std::is_integral_v<U> && std::is_integral_v<V>>>
[[nodiscard]] constexpr T checked_cast(S x, U minval, V maxval)
{
	detail::assure_in_range<Error>(x, minval, maxval);
	return static_cast<T>(x);
}

// Parses an unsigned integer in the given radix, rejecting signs, blanks and trailing junk
[[nodiscard]] inline std::optional<std::uint_least32_t> parse_unsigned(std::string_view s, int radix) noexcept
{
	std::uint_least32_t value = 0;
	if (s.empty())
		return std::nullopt;
	auto const [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value, radix);
	if (ec != std::errc{} || ptr != s.data() + s.size())
		return std::nullopt;
	return value;
}

[[nodiscard]] inline std::optional<std::uint_least32_t> parse_hex(std::string_view s) noexcept
{
	return parse_unsigned(s, 16);
}

// Lowercase digits only, matching the alphabet written by to_base36
[[nodiscard]] inline std::optional<std::uint_least32_t> parse_base36(std::string_view s) noexcept
{
	if (std::any_of(s.begin(), s.end(), [](char c) { return base36_digits.find(c) == std::string_view::npos; }))
		return std::nullopt;
	return parse_unsigned(s, 36);
}

// Renders value in lowercase base-36, left-padded with '0' up to width characters
[[nodiscard]] inline std::string to_base36(std::uint_least32_t value, std::size_t width)
{
	std::string result;
	do {
		result.push_back(base36_digits[value % 36U]);
		value /= 36U;
	} while (value != 0);
	if (result.size() < width)
		result.append(width - result.size(), '0');
	std::reverse(result.begin(), result.end());
	return result;
}

template <class EF>
class scope_fail
{
	static_assert(std::is_invocable_v<EF>);

	EF destructor_;
	int uncaught_on_construction_;

public:
	template <class Fn, class = std::enable_if_t<std::is_constructible_v<EF, Fn&&>>>
	constexpr explicit scope_fail( Fn&& fn ) noexcept(std::is_nothrow_constructible_v<EF, Fn&&>)
		: destructor_{std::forward<Fn>(fn)}
		, uncaught_on_construction_(std::uncaught_exceptions())
	{}

	~scope_fail()
	{
		if (std::uncaught_exceptions() > uncaught_on_construction_)
			destructor_();
	}

	void release() noexcept
	{
		uncaught_on_construction_ = (std::numeric_limits<int>::max)();
	}

	scope_fail(scope_fail const&) = delete;
	scope_fail(scope_fail&&) = delete;
	scope_fail& operator=(scope_fail const&) = delete;
	scope_fail& operator=(scope_fail&&) = delete;
};

template <class Fn, class = std::enable_if_t<std::is_invocable_v<Fn>>>
scope_fail(Fn) -> scope_fail<std::decay_t<Fn>>;

} // namespace upack::detail

#endif
