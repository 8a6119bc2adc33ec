// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#define AQSENSE_VERSION_MAJOR 0
#define AQSENSE_VERSION_MINOR 1
#define AQSENSE_VERSION_PATCH 0

namespace aqsense {

inline constexpr int version_major = AQSENSE_VERSION_MAJOR;
inline constexpr int version_minor = AQSENSE_VERSION_MINOR;
inline constexpr int version_patch = AQSENSE_VERSION_PATCH;

inline constexpr const char* version_string = "0.1.0";

} // namespace aqsense
