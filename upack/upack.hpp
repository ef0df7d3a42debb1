// upack - Unicode break property table packer in C++
// Copyright (c) 2017-2025 Jesse W. Towner

#ifndef UPACK_INCLUDE_UPACK_UPACK_HPP
#define UPACK_INCLUDE_UPACK_UPACK_HPP

#include <upack/error.hpp>
#include <upack/detail.hpp>
#include <upack/enum.hpp>
#include <upack/range.hpp>
#include <upack/process.hpp>
#include <upack/pack.hpp>
#include <upack/property_set.hpp>

#endif
