#include "file-system.hpp"

#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <functional>
#include <memory>
#include <stdexcept>

#include "fmt/format.h"

namespace shotform
{
namespace fs = std::filesystem;

bool is_regular_file(const std::string_view filename) noexcept
{
   std::error_code ec;
   return fs::is_regular_file(fs::path(filename), ec);
}

bool is_directory(const std::string_view filename) noexcept
{
   std::error_code ec;
   return fs::is_directory(fs::path(filename), ec);
}

// ----------------------------------------------------------- file-get-contents

error_code file_get_contents(const std::string_view fname,
                             std::string& data) noexcept
{
   const std::string fname_s(fname);
   std::unique_ptr<FILE, std::function<void(FILE*)>> fp(
       fopen(fname_s.c_str(), "rb"), [](FILE* ptr) {
          if(ptr) fclose(ptr);
       });

   if(fp == nullptr) return std::make_error_code(std::errc(errno));

   if(fseek(fp.get(), 0, SEEK_END) == -1)
      return std::make_error_code(std::errc(errno));

   auto fpos = ftell(fp.get());
   if(fpos == -1) return std::make_error_code(std::errc(errno));

   auto sz = size_t(fpos < 0 ? 0 : fpos);

   try {
      data.resize(sz);
   } catch(std::length_error&) {
      return std::make_error_code(std::errc::invalid_argument);
   } catch(std::bad_alloc&) {
      return std::make_error_code(std::errc::not_enough_memory);
   }

   if(fseek(fp.get(), 0, SEEK_SET) == -1)
      return std::make_error_code(std::errc(errno));

   if(sz > 0 and data.size() != fread(&data[0], 1, data.size(), fp.get())) {
      if(ferror(fp.get())) return std::make_error_code(std::errc(errno));
      return std::make_error_code(std::errc::io_error);
   }

   if(FILE* ptr = fp.release(); fclose(ptr) != 0)
      return std::make_error_code(std::errc(errno));

   return {};
}

std::string file_get_contents(const std::string_view fname) noexcept(false)
{
   std::string out;
   const auto ec = file_get_contents(fname, out);
   if(ec)
      throw std::runtime_error(
          fmt::format("failed to read file '{}': {}", fname, ec.message()));
   return out;
}

// ----------------------------------------------------------- file-put-contents

error_code file_put_contents(const std::string_view filename,
                             const std::string_view dat) noexcept
{
   const std::string fname_s(filename);
   FILE* fp = fopen(fname_s.c_str(), "wb");
   if(fp == nullptr) return std::make_error_code(std::errc(errno));

   error_code ec = {};

   auto sz = fwrite(dat.data(), 1, dat.size(), fp);
   if(sz != dat.size()) {
      if(ferror(fp))
         ec = std::make_error_code(std::errc(errno));
      else
         ec = std::make_error_code(std::errc::io_error);
   }
   if(fclose(fp) != 0)
      if(!ec) ec = std::make_error_code(std::errc(errno));

   return ec;
}

// -------------------------------------------------------------------- basename

std::string basename(const std::string_view filename,
                     const bool strip_extension) noexcept
{
   const auto p = fs::path(filename);
   return strip_extension ? p.stem().string() : p.filename().string();
}

// --------------------------------------------------------------------- mkdir-p

bool mkdir_p(const std::string_view dname) noexcept
{
   std::error_code ec;
   fs::create_directories(fs::path(dname), ec);
   return !ec and is_directory(dname);
}

} // namespace shotform
