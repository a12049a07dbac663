#include "config.hpp"

#include "stdinc.hpp"

#include "json/json.h"

#include <stdlib.h>

#include <mutex>

#include <boost/lexical_cast.hpp>

namespace shotform
{
struct EnvironmentVariables
{
   bool trace_mode    = false;
   bool strict_config = false;
   int log_level      = 1;

   string make_config_info_str();
   void init_config(const Json::Value& o);
};

static EnvironmentVariables env_vars_;

static void init_instance(const Json::Value& o) noexcept
{
   env_vars_.init_config(o);
}

// Trace and log-level queries happen inside the logging macros, so they must
// work (with defaults) before `load_environment_variables()` is called.
static const EnvironmentVariables& instance() noexcept { return env_vars_; }

// -------------------------------------------------------- make config info str
//
string EnvironmentVariables::make_config_info_str()
{
   const auto build_str = k_is_debug_build     ? "debug"
                          : k_is_release_build ? "release"
                                               : "unspecified";

   return format(R"V0G0N(
   k-shotform-version            = '{}'
   build-configuration           =  {}
   SHOTFORM_TRACE_MODE           =  {}
   SHOTFORM_STRICT_CONFIG        =  {}
   SHOTFORM_LOG_LEVEL            =  {}
)V0G0N",
                 k_version,
                 build_str,
                 str(trace_mode),
                 str(strict_config),
                 log_level);
}

// -------------------------------------------------------------------- read-env
//
static Json::Value read_env()
{
   Json::Value o{Json::objectValue};

   auto get_w_default
       = [&o](const std::string_view name,
              const std::string_view default_value) -> std::string {
      const char* ss = getenv(name.data());
      const auto ret
          = (ss == nullptr) ? std::string(default_value) : std::string(ss);
      o[string(name)] = ret;
      return ret;
   };

   auto get_bool_w_default = [&](const std::string_view name) -> bool {
      const auto val  = get_w_default(name, "");
      const auto ret  = (val == std::string("1") or val == std::string("true"));
      o[string(name)] = ret;
      return ret;
   };

   auto get_int_w_default = [&](const std::string_view name, int def) -> int {
      const auto s = get_w_default(name, "");
      int ret      = def;
      if(s.size() > 0) {
         using boost::bad_lexical_cast;
         using boost::lexical_cast;
         try {
            ret = lexical_cast<int>(s);
         } catch(bad_lexical_cast&) {
            WARN(format("bad lexical cast reading environment variable {}='{}' "
                        "as an integer, using default value {}",
                        name,
                        s,
                        def));
         }
      }
      o[string(name)] = ret;
      return ret;
   };

   get_bool_w_default("SHOTFORM_TRACE_MODE");
   get_bool_w_default("SHOTFORM_STRICT_CONFIG");
   get_int_w_default("SHOTFORM_LOG_LEVEL", 1);

   return o;
}

const Json::Value& get_env_data()
{
   static std::mutex padlock_;
   static bool first_run_ = true;
   static Json::Value env_data_;
   {
      std::lock_guard<decltype(padlock_)> lock(padlock_);
      if(first_run_) {
         env_data_  = read_env();
         first_run_ = false;
      }
   }

   return env_data_;
}

// ----------------------------------------------------------------- init config
//
void EnvironmentVariables::init_config(const Json::Value& o)
{
   auto get_bool = [&o](const char* key) {
      return o.isMember(key) and o[key].isBool() and o[key].asBool();
   };

   trace_mode    = get_bool("SHOTFORM_TRACE_MODE");
   strict_config = get_bool("SHOTFORM_STRICT_CONFIG");
   log_level     = (o.isMember("SHOTFORM_LOG_LEVEL")
                and o["SHOTFORM_LOG_LEVEL"].isInt())
                       ? o["SHOTFORM_LOG_LEVEL"].asInt()
                       : 1;

   if(log_level >= 1 and log_level <= 3) Logger::set_log_level(log_level);
}

// -------------------------------------------------- load environment variables
//
void load_environment_variables() noexcept { init_instance(get_env_data()); }

void set_environment_variables(const Json::Value o) noexcept
{
   init_instance(o);
}

// --------------------------------------------------------------------- getters
//
bool shotform_trace_mode() noexcept { return instance().trace_mode; }

bool shotform_strict_config() noexcept { return instance().strict_config; }

int shotform_log_level() noexcept { return instance().log_level; }

string environment_info() noexcept
{
   return env_vars_.make_config_info_str();
}

} // namespace shotform
