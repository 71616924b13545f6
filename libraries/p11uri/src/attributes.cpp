#include <p11uri/attributes.hpp>

#include <p11uri/errors.hpp>
#include <p11uri/percent.hpp>

#include <algorithm>
#include <charconv>
#include <ostream>

namespace p11uri
{
   namespace
   {
      template <typename T>
      std::optional<T> parseInt(std::string_view raw)
      {
         T    result = 0;
         auto end    = raw.data() + raw.size();
         auto err    = std::from_chars(raw.data(), end, result);
         if (err.ec == std::errc{} && err.ptr == end)
            return result;
         return {};
      }

      std::optional<std::string> parseText(std::string_view raw)
      {
         return decodeString(raw);
      }

      std::optional<std::vector<unsigned char>> parseId(std::string_view raw)
      {
         return decodeBytes(raw);
      }

      template <typename Attrs, typename T>
      AttributeRule<Attrs> rule(std::string_view name,
                                std::optional<T> Attrs::*field,
                                std::optional<T> (*parse)(std::string_view))
      {
         using result = typename AttributeRule<Attrs>::result;
         return {name, [field, parse](Attrs& attrs, std::string_view raw)
                 {
                    auto value = parse(raw);
                    if (!value)
                       return result::invalid;
                    if (attrs.*field)
                       return result::duplicate;
                    attrs.*field = std::move(*value);
                    return result::ok;
                 }};
      }

      template <typename Attrs>
      Attrs parseAttributes(std::string_view              input,
                            char                          delimiter,
                            const AttributeTable<Attrs>& table)
      {
         using result = typename AttributeRule<Attrs>::result;
         Attrs out;
         if (input.empty())
            return out;
         while (true)
         {
            auto pos       = input.find(delimiter);
            auto component = input.substr(0, pos);
            auto eq        = component.find('=');
            if (eq == std::string_view::npos)
               throw ParseError(parse_error::malformed_attribute, component, "");
            auto key       = component.substr(0, eq);
            auto raw       = component.substr(eq + 1);
            auto entry = std::find_if(table.begin(), table.end(),
                                      [&](const auto& r) { return r.name == key; });
            if (entry == table.end())
               throw ParseError(parse_error::unknown_attribute, key, "");
            switch (entry->apply(out, raw))
            {
               case result::ok:
                  break;
               case result::invalid:
                  throw ParseError(parse_error::invalid_value, key, raw);
               case result::duplicate:
                  throw ParseError(parse_error::duplicate_attribute, key, "");
            }
            if (pos == std::string_view::npos)
               break;
            input = input.substr(pos + 1);
         }
         return out;
      }
   }  // namespace

   std::ostream& operator<<(std::ostream& os, const Version& v)
   {
      return os << static_cast<unsigned>(v.major) << '.' << static_cast<unsigned>(v.minor);
   }

   std::string_view to_string(ObjectClass c)
   {
      switch (c)
      {
         case ObjectClass::Certificate:
            return "cert";
         case ObjectClass::Data:
            return "data";
         case ObjectClass::PrivateKey:
            return "private";
         case ObjectClass::PublicKey:
            return "public";
         case ObjectClass::SecretKey:
            return "secret-key";
      }
      return "unknown";
   }

   std::ostream& operator<<(std::ostream& os, ObjectClass c)
   {
      return os << to_string(c);
   }

   SerialNumber padSerial(std::string_view s)
   {
      SerialNumber result;
      result.fill(' ');
      std::copy_n(s.begin(), std::min(s.size(), result.size()), result.begin());
      return result;
   }

   std::optional<unsigned long> parseSlotId(std::string_view raw)
   {
      return parseInt<unsigned long>(raw);
   }

   std::optional<Version> parseVersion(std::string_view raw)
   {
      auto dot   = raw.find('.');
      auto major = parseInt<std::uint8_t>(raw.substr(0, dot));
      if (!major)
         return {};
      if (dot == std::string_view::npos)
         return Version{*major, 0};
      auto minor = parseInt<std::uint8_t>(raw.substr(dot + 1));
      if (!minor)
         return {};
      return Version{*major, *minor};
   }

   std::optional<SerialNumber> parseSerial(std::string_view raw)
   {
      auto         bytes = decodeBytes(raw);
      SerialNumber result;
      if (bytes.size() > result.size())
         return {};
      result.fill(' ');
      std::copy(bytes.begin(), bytes.end(), result.begin());
      return result;
   }

   std::optional<ObjectClass> parseObjectClass(std::string_view raw)
   {
      if (raw == "cert")
         return ObjectClass::Certificate;
      else if (raw == "data")
         return ObjectClass::Data;
      else if (raw == "private")
         return ObjectClass::PrivateKey;
      else if (raw == "public")
         return ObjectClass::PublicKey;
      else if (raw == "secret-key")
         return ObjectClass::SecretKey;
      else
         return {};
   }

   const AttributeTable<PathAttributes>& pathAttributeTable()
   {
      using P = PathAttributes;
      static const AttributeTable<P> table{
          rule("library-description", &P::libraryDescription, &parseText),
          rule("library-manufacturer", &P::libraryManufacturer, &parseText),
          rule("library-version", &P::libraryVersion, &parseVersion),
          rule("slot-description", &P::slotDescription, &parseText),
          rule("slot-id", &P::slotId, &parseSlotId),
          rule("slot-manufacturer", &P::slotManufacturer, &parseText),
          rule("manufacturer", &P::manufacturer, &parseText),
          rule("model", &P::model, &parseText),
          rule("token", &P::token, &parseText),
          rule("serial", &P::serial, &parseSerial),
          rule("type", &P::type, &parseObjectClass),
          rule("id", &P::id, &parseId),
          rule("object", &P::object, &parseText),
      };
      return table;
   }

   const AttributeTable<QueryAttributes>& queryAttributeTable()
   {
      using Q = QueryAttributes;
      static const AttributeTable<Q> table{
          rule("pin-source", &Q::pinSource, &parseText),
          rule("pin-value", &Q::pinValue, &parseText),
          rule("module-name", &Q::moduleName, &parseText),
          rule("module-path", &Q::modulePath, &parseText),
      };
      return table;
   }

   PathAttributes parsePathAttributes(std::string_view input)
   {
      return parseAttributes(input, ';', pathAttributeTable());
   }

   QueryAttributes parseQueryAttributes(std::string_view input)
   {
      return parseAttributes(input, '&', queryAttributeTable());
   }
}  // namespace p11uri
