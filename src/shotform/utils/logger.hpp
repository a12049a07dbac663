#pragma once

#include "fmt/format.h"
#include "string-utils.hpp"

#include <iostream>
#include <mutex>

#define SHOTFORM_ANSI_RED "\x1b[31m"
#define SHOTFORM_ANSI_YELLOW "\x1b[33m"
#define SHOTFORM_ANSI_BLUE "\x1b[34m"
#define SHOTFORM_ANSI_CYAN "\x1b[36m"
#define SHOTFORM_ANSI_GREY "\x1b[37m"
#define SHOTFORM_ANSI_WHITE "\x1b[97m"
#define SHOTFORM_ANSI_GREEN_BG "\x1b[42m"
#define SHOTFORM_ANSI_RESET "\x1b[0m"

#ifdef DEBUG_BUILD
#define DLOG(m) \
   ::shotform::Logger::report(0, __FILE__, __LINE__, ::shotform::str(m))
#else
#define DLOG(m)
#endif

#define INFO(m)                         \
   if(::shotform::get_log_level() <= 1) \
   ::shotform::Logger::report(1, __FILE__, __LINE__, ::shotform::str(m))
#define WARN(m)                         \
   if(::shotform::get_log_level() <= 2) \
   ::shotform::Logger::report(2, __FILE__, __LINE__, ::shotform::str(m))
#define LOG_ERR(m)                      \
   if(::shotform::get_log_level() <= 3) \
   ::shotform::Logger::report(3, __FILE__, __LINE__, ::shotform::str(m))
#define FATAL(m) \
   ::shotform::Logger::report(4, __FILE__, __LINE__, ::shotform::str(m))
#define TRACE(m)                         \
   if(::shotform::shotform_trace_mode()) \
   ::shotform::Logger::report(5, __FILE__, __LINE__, ::shotform::str(m))

namespace shotform
{
using fmt::format;
using std::string;

bool shotform_trace_mode() noexcept;

inline void logger_enable_colours(bool value);

inline int get_log_level();
inline void set_log_info();  // 1
inline void set_log_warn();  // 2
inline void set_log_error(); // 3
// Fatal is always logged

class Logger;

} // namespace shotform

// -------------------------------------------------------------- Implementation

namespace shotform
{
class Logger
{
 private:
   static Logger* instance()
   {
      static Logger instance_;
      return &instance_;
   }

   static const char* level_to_string(int level)
   {
      if(colours_enabled()) {
         switch(level) {
         case 0: return SHOTFORM_ANSI_CYAN "DEBUG" SHOTFORM_ANSI_RESET;
         case 1: return SHOTFORM_ANSI_BLUE "INFO " SHOTFORM_ANSI_RESET;
         case 2: return SHOTFORM_ANSI_YELLOW "WARN " SHOTFORM_ANSI_RESET;
         case 3: return SHOTFORM_ANSI_RED "ERROR" SHOTFORM_ANSI_RESET;
         case 4: return SHOTFORM_ANSI_RED "FATAL" SHOTFORM_ANSI_RESET;
         case 5:
            return SHOTFORM_ANSI_GREEN_BG SHOTFORM_ANSI_WHITE
                "TRACE" SHOTFORM_ANSI_RESET;
         default: break;
         }
      } else {
         switch(level) {
         case 0: return "DEBUG";
         case 1: return "INFO ";
         case 2: return "WARN ";
         case 3: return "ERROR";
         case 4: return "FATAL";
         case 5: return "TRACE";
         default: break;
         }
      }
      return "?";
   }

   bool colours_   = true;
   int log_level_  = 0;

   Logger()  = default;
   ~Logger() = default;

 public:
   // Reports go to stderr, so that stdout stays clean for reports
   // written by the front-ends.
   static void
   report(int level, const char* file, int lineno, const string& msg)
   {
      if((level >= log_level() && level <= 5) || level == 0) {
         std::ostream& out = std::cerr;
         const bool c = colours_enabled();
         sync_write([&]() {
            out << level_to_string(level) << " "
                << (c ? SHOTFORM_ANSI_GREY : "") << file << ":" << lineno
                << (c ? SHOTFORM_ANSI_RESET : "") << " " << msg << "\n";
         });
         if(level == 4) {
            exit(1); // Die on fatal
         }
      }
   }

   static int log_level() { return instance()->log_level_; }

   static void set_log_level(int level)
   {
      if(level > 0 && level <= 5)
         instance()->log_level_ = level;
      else
         report(
             2, __FILE__, __LINE__, format("Invalid log level: {}", level));
   }

   static bool colours_enabled() { return instance()->colours_; }

   static void enable_colours(bool value) { instance()->colours_ = value; }
};

} // namespace shotform

inline int ::shotform::get_log_level()
{
   return ::shotform::Logger::log_level();
}
inline void ::shotform::set_log_info() { ::shotform::Logger::set_log_level(1); }
inline void ::shotform::set_log_warn() { ::shotform::Logger::set_log_level(2); }
inline void ::shotform::set_log_error()
{
   ::shotform::Logger::set_log_level(3);
}

inline void ::shotform::logger_enable_colours(bool value)
{
   ::shotform::Logger::enable_colours(value);
}
