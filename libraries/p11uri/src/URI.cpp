#include <p11uri/URI.hpp>

#include <p11uri/errors.hpp>
#include <p11uri/percent.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <ostream>

namespace p11uri
{
   namespace
   {
      bool parseLiteral(std::string_view& uri, std::string_view prefix)
      {
         if (uri.starts_with(prefix))
         {
            uri = uri.substr(prefix.size());
            return true;
         }
         else
         {
            return false;
         }
      }

      std::string stripWhitespace(std::string_view text)
      {
         std::string result;
         std::copy_if(text.begin(), text.end(), std::back_inserter(result),
                      [](unsigned char ch) { return !std::isspace(ch); });
         return result;
      }

      bool schemeChar(char ch)
      {
         return std::isalnum(static_cast<unsigned char>(ch)) || ch == '+' || ch == '-' ||
                ch == '.';
      }

      // scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
      std::string_view parseScheme(std::string_view& uri)
      {
         auto end = uri.find_first_of(":/?#");
         if (end == std::string_view::npos || uri[end] != ':')
            return {};
         auto scheme = uri.substr(0, end);
         if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme.front())) ||
             !std::all_of(scheme.begin(), scheme.end(), schemeChar))
            throw ParseError(parse_error::malformed_uri, "invalid scheme");
         uri = uri.substr(end + 1);
         return scheme;
      }

      // Checks the characters of a hierarchical part or query, including the
      // form of percent escapes.
      void checkChars(std::string_view s, bool query)
      {
         for (std::size_t i = 0; i < s.size(); ++i)
         {
            char ch = s[i];
            if (ch == '%')
            {
               if (s.size() - i < 3 || unhexChar(s[i + 1]) < 0 || unhexChar(s[i + 2]) < 0)
                  throw ParseError(parse_error::malformed_uri, "invalid percent encoding");
               i += 2;
            }
            else if (pchar(ch) || ch == '/')
            {
            }
            else if (query && (ch == '?' || ch == '|'))
            {
            }
            else
            {
               throw ParseError(parse_error::malformed_uri,
                                "unexpected character '" + std::string(1, ch) + "'");
            }
         }
      }

      bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs)
      {
         return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
                           [](unsigned char a, unsigned char b)
                           { return std::tolower(a) == std::tolower(b); });
      }

      std::string_view trimBlanks(const SerialNumber& serial)
      {
         std::string_view result{reinterpret_cast<const char*>(serial.data()), serial.size()};
         auto             pos = result.find_last_not_of(' ');
         if (pos == std::string_view::npos)
            return {};
         return result.substr(0, pos + 1);
      }

      void appendAttr(std::string&     out,
                      char             delimiter,
                      std::string_view name,
                      std::string_view encoded)
      {
         if (!out.empty())
            out.push_back(delimiter);
         out += name;
         out.push_back('=');
         out += encoded;
      }
   }  // namespace

   URI::URI(std::string_view input) : text_(stripWhitespace(input))
   {
      std::string_view uri = text_;

      auto scheme = parseScheme(uri);
      if (uri.find('#') != std::string_view::npos)
         throw ParseError(parse_error::malformed_uri, "unexpected fragment");
      auto qpos  = uri.find('?');
      auto hier  = uri.substr(0, qpos);
      auto query = qpos == std::string_view::npos ? std::string_view{} : uri.substr(qpos + 1);
      checkChars(hier, false);
      checkChars(query, true);

      if (!equalsIgnoreCase(scheme, "pkcs11"))
         throw ParseError(parse_error::wrong_scheme,
                          "expected 'pkcs11:...', got: '" + text_ + "'");
      if (parseLiteral(hier, "//"))
         throw ParseError(parse_error::unexpected_authority, "unexpected authority");
      if (hier.find('/') != std::string_view::npos)
         throw ParseError(parse_error::bad_path_shape, "expected a single path segment");

      path_  = parsePathAttributes(hier);
      query_ = parseQueryAttributes(query);
   }

   std::string to_string(const URI& uri)
   {
      const auto& p = uri.path();
      std::string path;
      constexpr auto pc = component::path;
      if (p.libraryDescription)
         appendAttr(path, ';', "library-description", encodeString(*p.libraryDescription, pc));
      if (p.libraryManufacturer)
         appendAttr(path, ';', "library-manufacturer", encodeString(*p.libraryManufacturer, pc));
      if (p.libraryVersion)
         appendAttr(path, ';', "library-version",
                    std::to_string(p.libraryVersion->major) + "." +
                        std::to_string(p.libraryVersion->minor));
      if (p.slotDescription)
         appendAttr(path, ';', "slot-description", encodeString(*p.slotDescription, pc));
      if (p.slotId)
         appendAttr(path, ';', "slot-id", std::to_string(*p.slotId));
      if (p.slotManufacturer)
         appendAttr(path, ';', "slot-manufacturer", encodeString(*p.slotManufacturer, pc));
      if (p.manufacturer)
         appendAttr(path, ';', "manufacturer", encodeString(*p.manufacturer, pc));
      if (p.model)
         appendAttr(path, ';', "model", encodeString(*p.model, pc));
      if (p.token)
         appendAttr(path, ';', "token", encodeString(*p.token, pc));
      if (p.serial)
         appendAttr(path, ';', "serial", encodeString(trimBlanks(*p.serial), pc));
      if (p.type)
         appendAttr(path, ';', "type", to_string(*p.type));
      if (p.id)
         appendAttr(path, ';', "id", encodeBytes(*p.id, pc));
      if (p.object)
         appendAttr(path, ';', "object", encodeString(*p.object, pc));

      const auto&    q = uri.query();
      std::string    query;
      constexpr auto qc = component::query;
      if (q.pinSource)
         appendAttr(query, '&', "pin-source", encodeString(*q.pinSource, qc));
      if (q.pinValue)
         appendAttr(query, '&', "pin-value", encodeString(*q.pinValue, qc));
      if (q.moduleName)
         appendAttr(query, '&', "module-name", encodeString(*q.moduleName, qc));
      if (q.modulePath)
         appendAttr(query, '&', "module-path", encodeString(*q.modulePath, qc));

      std::string result = "pkcs11:" + path;
      if (!query.empty())
      {
         result += '?';
         result += query;
      }
      return result;
   }

   std::ostream& operator<<(std::ostream& os, const URI& uri)
   {
      return os << to_string(uri);
   }
}  // namespace p11uri
