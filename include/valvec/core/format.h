#pragma once

// Compatibility header for std::format
// Uses std::format when available, falls back to the fmt library bundled with spdlog

#if VALVEC_HAS_STD_FORMAT
#include <format>
namespace valvec {
using std::format;
using std::format_to;
using std::vformat;
} // namespace valvec
#else
#include <spdlog/fmt/fmt.h>

namespace valvec {
using fmt::format;
using fmt::format_to;
using fmt::vformat;
} // namespace valvec
#endif
