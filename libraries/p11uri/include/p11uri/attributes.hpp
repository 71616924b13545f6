#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace p11uri
{
   struct Version
   {
      std::uint8_t major = 0;
      std::uint8_t minor = 0;
      friend bool  operator==(const Version&, const Version&) = default;
   };
   std::ostream& operator<<(std::ostream& os, const Version& v);

   enum class ObjectClass
   {
      Certificate,
      Data,
      PrivateKey,
      PublicKey,
      SecretKey,
   };
   std::ostream&    operator<<(std::ostream& os, ObjectClass c);
   std::string_view to_string(ObjectClass c);

   // CK_TOKEN_INFO.serialNumber: blank padded, not null terminated
   using SerialNumber = std::array<unsigned char, 16>;

   SerialNumber padSerial(std::string_view s);

   // Typed value parsers. Each returns nullopt if the raw value is not acceptable.
   std::optional<unsigned long> parseSlotId(std::string_view raw);
   std::optional<Version>       parseVersion(std::string_view raw);
   std::optional<SerialNumber>  parseSerial(std::string_view raw);
   std::optional<ObjectClass>   parseObjectClass(std::string_view raw);

   struct PathAttributes
   {
      std::optional<std::string>                libraryDescription;
      std::optional<std::string>                libraryManufacturer;
      std::optional<Version>                    libraryVersion;
      std::optional<std::string>                slotDescription;
      std::optional<unsigned long>              slotId;
      std::optional<std::string>                slotManufacturer;
      std::optional<std::string>                manufacturer;
      std::optional<std::string>                model;
      std::optional<std::string>                token;
      std::optional<SerialNumber>               serial;
      std::optional<ObjectClass>                type;
      std::optional<std::vector<unsigned char>> id;
      std::optional<std::string>                object;

      friend bool operator==(const PathAttributes&, const PathAttributes&) = default;
   };

   struct QueryAttributes
   {
      std::optional<std::string> pinSource;
      std::optional<std::string> pinValue;
      std::optional<std::string> moduleName;
      std::optional<std::string> modulePath;

      friend bool operator==(const QueryAttributes&, const QueryAttributes&) = default;
   };

   // One row of an attribute table. `apply` decodes the raw value into its
   // destination field, reporting whether the value was accepted and whether
   // the field had already been set.
   template <typename Attrs>
   struct AttributeRule
   {
      enum class result
      {
         ok,
         invalid,
         duplicate,
      };
      std::string_view                                   name;
      std::function<result(Attrs&, std::string_view raw)> apply;
   };

   template <typename Attrs>
   using AttributeTable = std::vector<AttributeRule<Attrs>>;

   const AttributeTable<PathAttributes>&  pathAttributeTable();
   const AttributeTable<QueryAttributes>& queryAttributeTable();

   // Parses a `delimiter` separated list of name=value pairs. Throws ParseError.
   PathAttributes  parsePathAttributes(std::string_view input);
   QueryAttributes parseQueryAttributes(std::string_view input);
}  // namespace p11uri
