#pragma once

#include <string>

namespace apiproxy::plugins {

/// Current UTC time as 2026-01-31T16:51:25Z.
std::string now_iso();

/// Current UTC date as 20260131.
std::string today_compact();

} // namespace apiproxy::plugins
