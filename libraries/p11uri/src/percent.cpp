#include <p11uri/percent.hpp>

#include <cstdint>

namespace p11uri
{
   namespace
   {
      template <typename Out>
      void decodeInto(std::string_view s, Out& out)
      {
         for (std::size_t i = 0; i < s.size(); ++i)
         {
            int hi = -1, lo = -1;
            if (s[i] == '%' && s.size() - i >= 3)
            {
               hi = unhexChar(s[i + 1]);
               lo = unhexChar(s[i + 2]);
            }
            if (hi >= 0 && lo >= 0)
            {
               out.push_back(static_cast<typename Out::value_type>((hi << 4) | lo));
               i += 2;
            }
            else
            {
               out.push_back(static_cast<typename Out::value_type>(s[i]));
            }
         }
      }

      // Sub-delimiters that RFC 7512 leaves unencoded inside attribute values
      bool valueChar(char ch, component where)
      {
         if (unreserved(ch))
            return true;
         switch (ch)
         {
            case ':':
            case '[':
            case ']':
            case '@':
            case '!':
            case '$':
            case '\'':
            case '(':
            case ')':
            case '*':
            case '+':
            case ',':
               return true;
            case '&':
               return where == component::path;
            case '/':
            case '?':
            case '|':
            case ';':
               return where == component::query;
            default:
               return false;
         }
      }

      template <typename Range>
      std::string encode(const Range& r, component where)
      {
         constexpr const char* xdigits = "0123456789ABCDEF";
         std::string           result;
         for (auto byte : r)
         {
            char ch = static_cast<char>(byte);
            if (valueChar(ch, where))
            {
               result.push_back(ch);
            }
            else
            {
               auto u = static_cast<unsigned char>(byte);
               result.push_back('%');
               result.push_back(xdigits[(u >> 4) & 0x0F]);
               result.push_back(xdigits[u & 0x0F]);
            }
         }
         return result;
      }
   }  // namespace

   bool validUtf8(std::string_view s)
   {
      std::size_t i = 0;
      while (i < s.size())
      {
         auto          c = static_cast<unsigned char>(s[i]);
         std::size_t   n;
         std::uint32_t cp;
         if (c < 0x80)
         {
            ++i;
            continue;
         }
         else if ((c & 0xE0) == 0xC0)
         {
            n  = 1;
            cp = c & 0x1F;
         }
         else if ((c & 0xF0) == 0xE0)
         {
            n  = 2;
            cp = c & 0x0F;
         }
         else if ((c & 0xF8) == 0xF0)
         {
            n  = 3;
            cp = c & 0x07;
         }
         else
         {
            return false;
         }
         if (s.size() - i <= n)
            return false;
         for (std::size_t j = 1; j <= n; ++j)
         {
            auto cc = static_cast<unsigned char>(s[i + j]);
            if ((cc & 0xC0) != 0x80)
               return false;
            cp = (cp << 6) | (cc & 0x3F);
         }
         // overlong encodings, surrogates, and values beyond U+10FFFF
         if ((n == 1 && cp < 0x80) || (n == 2 && cp < 0x800) || (n == 3 && cp < 0x10000))
            return false;
         if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
            return false;
         i += n + 1;
      }
      return true;
   }

   std::optional<std::string> decodeString(std::string_view s)
   {
      std::string result;
      decodeInto(s, result);
      if (!validUtf8(result))
         return {};
      return result;
   }

   std::vector<unsigned char> decodeBytes(std::string_view s)
   {
      std::vector<unsigned char> result;
      decodeInto(s, result);
      return result;
   }

   std::string encodeString(std::string_view s, component where)
   {
      return encode(s, where);
   }

   std::string encodeBytes(const std::vector<unsigned char>& bytes, component where)
   {
      return encode(bytes, where);
   }
}  // namespace p11uri
