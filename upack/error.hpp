// upack - Unicode break property table packer in C++
// Copyright (c) 2017-2025 Jesse W. Towner

#ifndef UPACK_INCLUDE_UPACK_ERROR_HPP
#define UPACK_INCLUDE_UPACK_ERROR_HPP

#include <stdexcept>
#include <string>

namespace upack {

class upack_error : public std::runtime_error { using std::runtime_error::runtime_error; };
class bad_range_line : public upack_error { public: explicit bad_range_line(std::string const& s = "malformed range line") : upack_error{s} {} };
class bad_range_overlap : public upack_error { public: explicit bad_range_overlap(std::string const& s = "data contains overlapping ranges") : upack_error{s} {} };
class bad_enum_capacity : public upack_error { public: bad_enum_capacity() : upack_error{"number of property values exceeds the single character serialization limit"} {} };
class bad_codepoint : public bad_range_line { public: bad_codepoint() : bad_range_line{"codepoint exceeds unicode limit"} {} };
class bad_packed_data : public upack_error { public: explicit bad_packed_data(std::string const& s = "invalid or truncated packed data") : upack_error{s} {} };

} // namespace upack

#endif
