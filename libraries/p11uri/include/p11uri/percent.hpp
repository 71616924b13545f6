#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace p11uri
{
   constexpr bool unreserved(char ch)
   {
      if ('a' <= ch && ch <= 'z')
         return true;
      if ('A' <= ch && ch <= 'Z')
         return true;
      if ('0' <= ch && ch <= '9')
         return true;
      if (ch == '-' || ch == '.' || ch == '_' || ch == '~')
         return true;
      return false;
   }

   constexpr bool pchar(char ch)
   {
      return unreserved(ch) || ch == ':' || ch == '[' || ch == ']' || ch == '@' || ch == '!' ||
             ch == '$' || ch == '\'' || ch == '(' || ch == ')' || ch == '*' || ch == '+' ||
             ch == ',' || ch == '=' || ch == ';' || ch == '&';
   }

   constexpr int unhexChar(char ch)
   {
      if (ch >= '0' && ch <= '9')
         return ch - '0';
      else if (ch >= 'a' && ch <= 'f')
         return ch - 'a' + 10;
      else if (ch >= 'A' && ch <= 'F')
         return ch - 'A' + 10;
      else
         return -1;
   }

   // Percent-decodes `s`. A '%' that does not introduce two hex digits is
   // kept literally. Fails if the result is not valid UTF-8.
   std::optional<std::string> decodeString(std::string_view s);

   // Percent-decodes `s` without any constraint on the resulting bytes
   std::vector<unsigned char> decodeBytes(std::string_view s);

   bool validUtf8(std::string_view s);

   // Characters that may appear unencoded in an attribute value
   enum class component
   {
      path,
      query,
   };

   std::string encodeString(std::string_view s, component where);
   std::string encodeBytes(const std::vector<unsigned char>& bytes, component where);
}  // namespace p11uri
