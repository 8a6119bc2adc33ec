// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <algorithm>
#include <array>
#include <sstream>

#include <cstddef>

#include "../core/error.hpp"

namespace aqsense::detail {

// Reject a write argument outside its documented set, before any I/O
template <typename T, size_t N>
void require_one_of(const T& value, const std::array<T, N>& allowed, const char* argument) {
    if (std::find(allowed.begin(), allowed.end(), value) != allowed.end()) {
        return;
    }
    std::ostringstream os;
    os << argument << " must be one of {";
    for (size_t i = 0; i < N; ++i) {
        os << (i == 0 ? "" : ", ") << allowed[i];
    }
    os << "}, got " << value;
    throw ValidationError(os.str());
}

} // namespace aqsense::detail
