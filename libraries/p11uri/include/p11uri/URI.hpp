#pragma once

#include <p11uri/attributes.hpp>

#include <iosfwd>
#include <string>
#include <string_view>

namespace p11uri
{
   // A parsed RFC 7512 URI. Construction validates the whole text and throws
   // ParseError on failure. The value never changes after construction.
   class URI
   {
     public:
      explicit URI(std::string_view text);

      const PathAttributes&  path() const { return path_; }
      const QueryAttributes& query() const { return query_; }
      /// The input with all whitespace removed
      const std::string& text() const { return text_; }

      /// Two URIs are equal when they carry the same attributes,
      /// regardless of how the values were encoded.
      friend bool operator==(const URI& lhs, const URI& rhs)
      {
         return lhs.path_ == rhs.path_ && lhs.query_ == rhs.query_;
      }

     private:
      PathAttributes  path_;
      QueryAttributes query_;
      std::string     text_;
   };

   // Renders the attributes in a fixed order. Parsing the result yields a URI
   // equal to `uri`.
   std::string   to_string(const URI& uri);
   std::ostream& operator<<(std::ostream& os, const URI& uri);
}  // namespace p11uri
