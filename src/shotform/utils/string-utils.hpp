#pragma once

#include <algorithm>
#include <concepts>
#include <functional>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "fmt/format.h"

namespace shotform
{
using std::string;
using std::string_view;

// -------------------------------------------------------------------- str shim

inline string& str(string& s) { return s; }
inline const string& str(const string& s) { return s; }
inline string str(string_view s) { return string(s); }
inline string str(const char* p) { return string(p); }
inline string str(bool v) { return v ? "true" : "false"; }

template<std::integral T> string str(T v) { return fmt::format("{}", v); }
template<std::floating_point T> string str(T v)
{
   return fmt::format("{:f}", v);
}

// ---------------------------------------------------------------------- Indent

inline std::string indent(const string& s, int level)
{
   const std::string indent_s(size_t(level), char(' '));
   std::stringstream ss{""};
   std::istringstream input{s};
   for(string line; std::getline(input, line);)
      ss << indent_s << line << std::endl;
   string ret = ss.str();
   // Remove endl character if 's' doesn't have one
   if(s.size() > 0 && s.back() != '\n' && !ret.empty()) ret.pop_back();
   return ret;
}

// --------------------------------------------------------------------- Implode

template<typename InputIt, typename F>
string implode(InputIt first, InputIt last, const std::string_view glue, F f)
{
   std::stringstream stream("");
   bool start = true;
   while(first != last) {
      if(start)
         start = false;
      else
         stream << glue;
      stream << str(f(*first++));
   }
   return stream.str();
}

template<typename InputIt>
string implode(InputIt first, InputIt last, const std::string_view glue)
{
   auto f = [](const decltype(*first)& v) -> std::string { return str(v); };
   return implode(first, last, glue, f);
}

namespace rng
{
   template<typename Range, typename F>
   string implode(const Range& rng, const std::string_view glue, F f)
   {
      return ::shotform::implode(std::cbegin(rng), std::cend(rng), glue, f);
   }

   template<typename Range>
   string implode(const Range& rng, const std::string_view glue)
   {
      return ::shotform::implode(std::cbegin(rng), std::cend(rng), glue);
   }

} // namespace rng

// --------------------------------------------------------- synchronized output

inline void sync_write(std::function<void()> thunk)
{
   static std::mutex padlock;
   std::lock_guard<decltype(padlock)> lock(padlock);
   thunk();
}

// ------------------------------------------------------------------- lowercase

string string_to_lowercase(const std::string_view s) noexcept;

// ---------------------------------------------------------- fixed-decimals-str
// Renders `v` with exactly `decimals` digits after the decimal point.
// Non-finite values render as "-".
string fixed_decimals_str(double v, int decimals) noexcept;

// Renders `v` as a percentage, ie. 0.05 => "5.0%"
string percent_str(double v, int decimals = 1) noexcept;

} // namespace shotform
