#pragma once

#include <string>
#include <string_view>
#include <system_error>

namespace shotform
{
using std::error_code;

// ------------------------------------------------------- file-get/put-contents

error_code file_get_contents(const std::string_view fname,
                             std::string& out) noexcept;

// Throws std::runtime_error if the file cannot be read.
std::string file_get_contents(const std::string_view fname) noexcept(false);

error_code file_put_contents(const std::string_view fname,
                             const std::string_view dat) noexcept;

// ----------------------------------------------------------- is-file/directory

bool is_regular_file(const std::string_view filename) noexcept;
bool is_directory(const std::string_view filename) noexcept;

// -------------------------------------------------------------------- basename

std::string basename(const std::string_view filename,
                     const bool strip_extension = false) noexcept;

// ----------------------------------------------------------------------- mkdir

// Returns TRUE if the directory exists after the call
bool mkdir_p(const std::string_view dname) noexcept;

} // namespace shotform
