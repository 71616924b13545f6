#pragma once

#include <string>
#include <string_view>
#include <system_error>

namespace p11uri
{
   // Failures that depend only on the URI text
   enum class parse_error
   {
      malformed_uri = 1,
      wrong_scheme,
      unexpected_authority,
      bad_path_shape,
      malformed_attribute,
      unknown_attribute,
      duplicate_attribute,
      invalid_value,
   };

   // Failures that depend on the state of the module
   enum class resolve_error
   {
      no_module = 1,
      no_slot,
      ambiguous_slot,
      no_object,
      ambiguous_object,
      login_failed,
      pin_unavailable,
      unsupported_pin_source,
      module_call_failed,
   };

   const std::error_category& parse_category();
   const std::error_category& resolve_category();
   std::error_code            make_error_code(parse_error e);
   std::error_code            make_error_code(resolve_error e);
}  // namespace p11uri

namespace std
{
   template <>
   struct is_error_code_enum<::p11uri::parse_error>
   {
      static constexpr bool value = true;
   };
   template <>
   struct is_error_code_enum<::p11uri::resolve_error>
   {
      static constexpr bool value = true;
   };
}  // namespace std

namespace p11uri
{
   class ParseError : public std::system_error
   {
     public:
      ParseError(parse_error e, std::string_view what);
      ParseError(parse_error e, std::string_view key, std::string_view rawValue);

      /// The attribute name involved, if any
      const std::string& key() const { return key_; }
      /// The undecoded attribute value that was rejected, if any
      const std::string& rawValue() const { return rawValue_; }

     private:
      std::string key_;
      std::string rawValue_;
   };

   class ResolutionError : public std::system_error
   {
     public:
      ResolutionError(resolve_error e, std::string_view what);
      ResolutionError(resolve_error e, std::error_code underlying, std::string_view what);

      /// The module error that caused this failure. Empty unless the
      /// failure came from a module call.
      std::error_code underlying() const { return underlying_; }

     private:
      std::error_code underlying_;
   };
}  // namespace p11uri
