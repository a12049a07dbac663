#pragma once

#include <any>

#include "shotform/io/json-io.hpp"
#include "shotform/utils/file-system.hpp"
#include "shotform/utils/string-utils.hpp"
#include "json/json.h"

/**
 * Example Usage

struct TypeA final : public MetaCompatible
{
   virtual ~TypeA() {}
   const vector<MemberMetaData>& meta_data() const noexcept override;

   int x   = -1;
   bool y  = false;
   real z  = 1.0;
};

//
// In cpp file
//
const vector<MemberMetaData>& TypeA::meta_data() const noexcept
{
   auto make_it = []() {
      vector<MemberMetaData> M;
      M.push_back(MAKE_META(TypeA, INT, x, true));
      M.push_back(MAKE_META(TypeA, BOOL, y, true));
      M.push_back(MAKE_META(TypeA, REAL, z, true));
      return M;
   };
   static vector<MemberMetaData> meta = make_it();
   return meta;
}

//
// Now we have:
//
void some_fun()
{
   TypeA x;
   Json::Value o = x.to_json();
   cout << str(x) << endl;
   x.read(o);
}

// @see `struct-meta_tc.cpp` for more examples

*/

namespace shotform
{
// ------------------------------------------------------------------- meta-type
//
enum class meta_type : int {
   BOOL = 0,
   INT,
   UNSIGNED,
   REAL,
   STRING,
   JSON_VALUE,
   COMPATIBLE_OBJECT
};

struct MetaCompatible;

// -------------------------------------------------------------- MemberMetaData
//
// Type-erased accessors for one member of a struct. Scalar members go
// through `std::any` getters/setters. Nested `MetaCompatible` members are
// reached through `object_` accessors instead.
struct MemberMetaData
{
   using get_fun  = std::function<std::any(const void*)>;
   using set_fun  = std::function<void(void*, const std::any&)>;
   using cobj_fun = std::function<const MetaCompatible*(const void*)>;
   using obj_fun  = std::function<MetaCompatible*(void*)>;

 private:
   meta_type type_       = meta_type::BOOL;
   get_fun getter_       = nullptr;
   set_fun setter_       = nullptr;
   cobj_fun cobject_     = nullptr;
   obj_fun object_       = nullptr;
   std::string name_     = ""s;
   bool important_in_eq_ = true;

   const MetaCompatible& cobject(const void* o) const noexcept(false);
   MetaCompatible& object(void* o) const noexcept(false);

 public:
   MemberMetaData(meta_type t, string name, bool eq, get_fun gf, set_fun sf)
       : type_(t)
       , getter_(std::move(gf))
       , setter_(std::move(sf))
       , name_(std::move(name))
       , important_in_eq_(eq)
   {
      Expects(type_ != meta_type::COMPATIBLE_OBJECT);
      Expects(getter_ != nullptr and setter_ != nullptr);
   }

   template<typename T1, typename T2>
   MemberMetaData(meta_type t, string name, bool eq, T1 T2::*member)
       : type_(t)
       , name_(std::move(name))
       , important_in_eq_(eq)
   {
      if constexpr(std::is_base_of<MetaCompatible, T1>::value) {
         Expects(type_ == meta_type::COMPATIBLE_OBJECT);
         cobject_ = [member](const void* o) -> const MetaCompatible* {
            return &(static_cast<const T2*>(o)->*member);
         };
         object_ = [member](void* o) -> MetaCompatible* {
            return &(static_cast<T2*>(o)->*member);
         };
      } else {
         Expects(type_ != meta_type::COMPATIBLE_OBJECT);
         getter_ = [member](const void* o) -> std::any {
            return std::any(static_cast<const T2*>(o)->*member);
         };
         setter_ = [member](void* o, const std::any& val) {
            static_cast<T2*>(o)->*member = std::any_cast<T1>(val);
         };
      }
   }

   // Getters
   meta_type type() const noexcept { return type_; }
   const string& name() const noexcept { return name_; }
   bool important_in_eq() const noexcept { return important_in_eq_; }

   // Operations
   bool eq(const void* u, const void* v) const noexcept(false);
   Json::Value to_json(const void* u) const noexcept(false);
   void read(void* x, const Json::Value& o) const noexcept(false);
   void read2(void* x,
              const Json::Value& o,
              const void* defaults,
              const string_view path,
              const bool print_warnings) const noexcept(false);
};

#define MAKE_META(clazz, type, member, eq)            \
   {                                                  \
      meta_type::type, #member##s, eq, &clazz::member \
   }

// ------------------------------------------------------------- Meta Compatible
//
struct MetaCompatible
{
 public:
   virtual ~MetaCompatible() {}

   virtual const vector<MemberMetaData>& meta_data() const noexcept = 0;

   bool operator==(const MetaCompatible& o) const noexcept;
   bool operator!=(const MetaCompatible& o) const noexcept;
   string to_string() const noexcept;
   string to_json_string() const noexcept;
   Json::Value to_json() const noexcept;

   // Every key must be present.
   void read(const Json::Value& val) noexcept(false);

   // Missing keys take the value in `defaults` (with a warning). Keys that
   // are present but malformed throw `std::runtime_error`.
   void read_with_defaults(const Json::Value& val,
                           const MetaCompatible* defaults,
                           const bool print_warnings = true,
                           const string_view path    = ""s);

   // read_with_defaults<Params>(json_object);
   template<typename T>
   void read_with_defaults(const Json::Value& val,
                           const bool print_warnings = true,
                           const string_view path    = ""s)
   {
      T defaults;
      read_with_defaults(val, &defaults, print_warnings, path);
   }

   friend string str(const MetaCompatible& o) noexcept { return o.to_string(); }
};

#define META_READ_WRITE_LOAD_SAVE(TYPE_)                                    \
   inline void read(TYPE_& data, const Json::Value& node) noexcept(false)   \
   {                                                                        \
      TYPE_ defaults;                                                       \
      data.read_with_defaults(node, &defaults);                             \
   }                                                                        \
   inline void read(TYPE_& data, const std::string& in) noexcept(false)     \
   {                                                                        \
      read(data, parse_json(in));                                           \
   }                                                                        \
   inline void write(const TYPE_& data, std::string& out) noexcept(false)   \
   {                                                                        \
      out = data.to_json_string();                                          \
   }                                                                        \
   inline void write(const TYPE_& data, Json::Value& node) noexcept(false)  \
   {                                                                        \
      node = data.to_json();                                                \
   }                                                                        \
   inline void load(TYPE_& data, const string& fname) noexcept(false)       \
   {                                                                        \
      read(data, file_get_contents(fname));                                 \
   }                                                                        \
   inline void save(const TYPE_& data, const string& fname) noexcept(false) \
   {                                                                        \
      std::string s;                                                        \
      write(data, s);                                                       \
      const auto ec = file_put_contents(fname, s);                          \
      if(ec)                                                                \
         throw std::runtime_error(format(                                   \
             "failed to write '{}': {}", fname, ec.message()));             \
   }

} // namespace shotform
