#pragma once

// Unified include for std::expected (C++23). Fails early with a readable
// message when the standard library does not ship it.

#include <version>

#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202202L
#  include <expected>
#else
#  error "faultline requires std::expected (C++23 standard library)"
#endif
