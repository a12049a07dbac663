#pragma once

#include <string>

namespace Json
{
class Value;
}

namespace shotform
{
// Defined on the library target, from the CMake build type
#ifdef DEBUG_BUILD
constexpr bool k_is_debug_build = true;
#else
constexpr bool k_is_debug_build = false;
#endif

#ifdef RELEASE_BUILD
constexpr bool k_is_release_build = true;
#else
constexpr bool k_is_release_build = false;
#endif

constexpr const char* k_version = SHOTFORM_VERSION;

// Must be called before any of the functions below
void load_environment_variables() noexcept;

// NOT thread safe
void set_environment_variables(const Json::Value o) noexcept;

bool shotform_trace_mode() noexcept;
bool shotform_strict_config() noexcept;
int shotform_log_level() noexcept;

std::string environment_info() noexcept;

} // namespace shotform
