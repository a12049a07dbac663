#include "struct-meta.hpp"

#include "shotform/io/json-io.hpp"
#include "shotform/utils/math.hpp"

#define This MemberMetaData

namespace shotform
{
const MetaCompatible& This::cobject(const void* o) const noexcept(false)
{
   Expects(cobject_ != nullptr);
   return *cobject_(o);
}

MetaCompatible& This::object(void* o) const noexcept(false)
{
   Expects(object_ != nullptr);
   return *object_(o);
}

// -------------------------------------------------------------------------- eq
//
bool This::eq(const void* u, const void* v) const noexcept(false)
{
   if(!important_in_eq_) return true;
#define CASE_1(TYPE, t)                          \
   case meta_type::TYPE:                         \
      return std::any_cast<t>(getter_(u)) == std::any_cast<t>(getter_(v))

   switch(type_) {
      CASE_1(BOOL, bool);
      CASE_1(INT, int);
      CASE_1(UNSIGNED, unsigned);
      CASE_1(STRING, string);
      CASE_1(JSON_VALUE, Json::Value);
   case meta_type::REAL:
      return float_is_same<real>(std::any_cast<real>(getter_(u)),
                                 std::any_cast<real>(getter_(v)));
   case meta_type::COMPATIBLE_OBJECT: return cobject(u) == cobject(v);
   }

#undef CASE_1
   return false;
}

// --------------------------------------------------------------------- to_json
//
Json::Value This::to_json(const void* x) const noexcept(false)
{
#define CASE(TYPE, t) \
   case meta_type::TYPE: return json_save(std::any_cast<t>(getter_(x)))

   switch(type_) {
      CASE(BOOL, bool);
      CASE(INT, int);
      CASE(UNSIGNED, unsigned);
      CASE(REAL, real);
      CASE(STRING, string);
   case meta_type::JSON_VALUE: return std::any_cast<Json::Value>(getter_(x));
   case meta_type::COMPATIBLE_OBJECT: return cobject(x).to_json();
   }
#undef CASE
   Expects(false);
   return Json::Value{Json::nullValue};
}

// ------------------------------------------------------------------- read_json
//
template<typename T> T load_T(const Json::Value& node)
{
   T x;
   json_load(node, x);
   return x;
}

void This::read(void* x, const Json::Value& o) const noexcept(false)
{
   if(type_ == meta_type::COMPATIBLE_OBJECT)
      object(x).read(o);
   else
      read2(x, o, nullptr, ""s, false);
}

void This::read2(void* x,
                 const Json::Value& o,
                 const void* defaults,
                 const string_view path,
                 const bool print_warnings) const noexcept(false)
{
#define CASE(TYPE, t) \
   case meta_type::TYPE: setter_(x, std::any(load_T<t>(o))); break;

   switch(type_) {
      CASE(BOOL, bool);
      CASE(INT, int);
      CASE(UNSIGNED, unsigned);
      CASE(REAL, real);
      CASE(STRING, string);
   case meta_type::JSON_VALUE: setter_(x, std::any(o)); break;
   case meta_type::COMPATIBLE_OBJECT:
      object(x).read_with_defaults(o,
                                   defaults ? &cobject(defaults) : nullptr,
                                   print_warnings,
                                   path);
      break;
   }

#undef CASE
}

// ----------------------------------------------------- MetaCompatible::to-json
//
namespace detail
{
   bool eq_with_meta(const vector<MemberMetaData>& meta_data,
                     const void* a,
                     const void* b) noexcept
   {
      if(a == b) return true;
      try {
         for(const auto& m : meta_data)
            if(!m.eq(a, b)) return false;
         return true;
      } catch(std::exception& e) {
         LOG_ERR(format("exception comparing structs: {}", e.what()));
      }
      return false;
   }

   Json::Value to_json_with_meta(const vector<MemberMetaData>& meta_data,
                                 const void* x) noexcept
   {
      try {
         Json::Value o{Json::objectValue};
         for(const auto& m : meta_data) {
            Expects(!has_key(o, m.name()));
            o[m.name()] = m.to_json(x);
         }
         return o;
      } catch(std::exception& e) {
         LOG_ERR(format("exception serializing struct: {}", e.what()));
      }
      return Json::Value{Json::nullValue};
   }

   void read_json_with_meta(const vector<MemberMetaData>& meta_data,
                            void* x,
                            const Json::Value& o) noexcept(false)
   {
      if(!o.isObject())
         throw std::runtime_error("expected a JSON object");
      for(const auto& m : meta_data) {
         if(!has_key(o, m.name()))
            throw std::runtime_error(
                format("failed to find key '{}'", m.name()));
         try {
            m.read(x, o[m.name()]);
         } catch(std::runtime_error& e) {
            throw std::runtime_error(
                format("error reading key '{}': {}", m.name(), e.what()));
         }
      }
   }

   void
   read_json_with_meta_and_defaults(const vector<MemberMetaData>& meta_data,
                                    void* x,
                                    const Json::Value& o,
                                    const void* defaults,
                                    const string_view path,
                                    const bool print_warnings)
   {
      auto get_path = [&](const string_view name) {
         const char* delim = (path.size() == 0) ? "" : ".";
         return format("{}{}{}", path, delim, name);
      };

      if(!o.isObject())
         throw std::runtime_error(format("expected a JSON object at '{}'",
                                         path.empty() ? "<root>"s
                                                      : string(path)));

      for(const auto& m : meta_data) {
         if(has_key(o, m.name())) {
            try {
               m.read2(x,
                       o[m.name()],
                       defaults,
                       get_path(m.name()),
                       print_warnings);
            } catch(std::runtime_error& e) {
               throw std::runtime_error(format(
                   "error reading key '{}': {}", get_path(m.name()), e.what()));
            }
            continue;
         }

         if(defaults == nullptr)
            throw std::runtime_error(
                format("failed to find key '{}'", get_path(m.name())));

         m.read(x, m.to_json(defaults));

         if(print_warnings) {
            WARN(format("using default value for '{}'", get_path(m.name())));
         }
      }
   }

} // namespace detail

// -------------------------------------------------- MetaCompatible::operator==
//
bool MetaCompatible::operator==(const MetaCompatible& o) const noexcept
{
   if(this == &o) return true;
   const auto& A = meta_data();
   const auto& B = o.meta_data();
   if(&A != &B) return false;
   return detail::eq_with_meta(A, this, &o);
}

bool MetaCompatible::operator!=(const MetaCompatible& o) const noexcept
{
   return !(*this == o);
}

string MetaCompatible::to_json_string() const noexcept
{
   return json_encode_pretty(to_json());
}

string MetaCompatible::to_string() const noexcept { return to_json_string(); }

Json::Value MetaCompatible::to_json() const noexcept
{
   return detail::to_json_with_meta(this->meta_data(), this);
}

void MetaCompatible::read(const Json::Value& val) noexcept(false)
{
   detail::read_json_with_meta(this->meta_data(), this, val);
}

void MetaCompatible::read_with_defaults(const Json::Value& val,
                                        const MetaCompatible* defaults,
                                        const bool print_warnings,
                                        const string_view path)
{
   detail::read_json_with_meta_and_defaults(
       this->meta_data(), this, val, defaults, path, print_warnings);
}

} // namespace shotform
