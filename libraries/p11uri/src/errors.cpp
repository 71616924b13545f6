#include <p11uri/errors.hpp>

namespace p11uri
{
   namespace
   {
      class parse_error_category : public std::error_category
      {
         const char* name() const noexcept override { return "pkcs11-uri"; }
         std::string message(int condition) const override
         {
            switch (parse_error(condition))
            {
               case parse_error::malformed_uri:
                  return "malformed URI";
               case parse_error::wrong_scheme:
                  return "URI should have pkcs11 scheme";
               case parse_error::unexpected_authority:
                  return "URI should not have an authority";
               case parse_error::bad_path_shape:
                  return "URI should have exactly one path segment";
               case parse_error::malformed_attribute:
                  return "expected attribute of the form name=value";
               case parse_error::unknown_attribute:
                  return "unknown attribute";
               case parse_error::duplicate_attribute:
                  return "duplicate attribute";
               case parse_error::invalid_value:
                  return "invalid attribute value";
               default:
                  return "unknown parse error";
            }
         }
      };

      class resolve_error_category : public std::error_category
      {
         const char* name() const noexcept override { return "pkcs11-resolve"; }
         std::string message(int condition) const override
         {
            switch (resolve_error(condition))
            {
               case resolve_error::no_module:
                  return "no PKCS #11 module specified";
               case resolve_error::no_slot:
                  return "no token matches URI";
               case resolve_error::ambiguous_slot:
                  return "multiple tokens match URI";
               case resolve_error::no_object:
                  return "no object matches URI";
               case resolve_error::ambiguous_object:
                  return "multiple objects match URI";
               case resolve_error::login_failed:
                  return "login failed";
               case resolve_error::pin_unavailable:
                  return "pin unavailable";
               case resolve_error::unsupported_pin_source:
                  return "unsupported pin-source";
               case resolve_error::module_call_failed:
                  return "module call failed";
               default:
                  return "unknown resolution error";
            }
         }
      };

      std::string describe(std::string_view key, std::string_view rawValue)
      {
         std::string result(key);
         if (!rawValue.empty())
         {
            result += '=';
            result += rawValue;
         }
         return result;
      }
   }  // namespace

   const std::error_category& parse_category()
   {
      static parse_error_category result;
      return result;
   }

   const std::error_category& resolve_category()
   {
      static resolve_error_category result;
      return result;
   }

   std::error_code make_error_code(parse_error e)
   {
      return std::error_code(static_cast<int>(e), parse_category());
   }

   std::error_code make_error_code(resolve_error e)
   {
      return std::error_code(static_cast<int>(e), resolve_category());
   }

   ParseError::ParseError(parse_error e, std::string_view what)
       : std::system_error(make_error_code(e), std::string(what))
   {
   }

   ParseError::ParseError(parse_error e, std::string_view key, std::string_view rawValue)
       : std::system_error(make_error_code(e), describe(key, rawValue)),
         key_(key),
         rawValue_(rawValue)
   {
   }

   ResolutionError::ResolutionError(resolve_error e, std::string_view what)
       : std::system_error(make_error_code(e), std::string(what))
   {
   }

   ResolutionError::ResolutionError(resolve_error    e,
                                    std::error_code  underlying,
                                    std::string_view what)
       : std::system_error(make_error_code(e), std::string(what) + ": " + underlying.message()),
         underlying_(underlying)
   {
   }
}  // namespace p11uri
