#include <p11uri/pin.hpp>

#include <p11uri/errors.hpp>

#include <openssl/crypto.h>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iterator>

namespace p11uri
{
   SecureString::SecureString(SecureString&& other) : data_(other.data_)
   {
      other.wipe();
   }

   SecureString& SecureString::operator=(SecureString&& other)
   {
      if (this != &other)
      {
         wipe();
         data_ = other.data_;
         other.wipe();
      }
      return *this;
   }

   SecureString::~SecureString()
   {
      wipe();
   }

   void SecureString::wipe()
   {
      data_.resize(data_.capacity());
      OPENSSL_cleanse(data_.data(), data_.size());
      data_.clear();
   }

   void SecureString::trimTrailingWhitespace()
   {
      auto n = data_.size();
      while (n > 0 && std::isspace(static_cast<unsigned char>(data_[n - 1])))
         --n;
      OPENSSL_cleanse(data_.data() + n, data_.size() - n);
      data_.resize(n);
   }

   std::optional<SecureString> SystemEnvironment::getenv(const std::string& name) const
   {
      if (const char* value = std::getenv(name.c_str()))
         return SecureString{value};
      return {};
   }

   std::optional<SecureString> SystemEnvironment::readFile(const std::string& path) const
   {
      std::ifstream in(path, std::ios_base::binary);
      if (!in)
         return {};
      SecureString result;
      {
         std::string contents{std::istreambuf_iterator<char>(in),
                              std::istreambuf_iterator<char>()};
         if (in.bad())
         {
            OPENSSL_cleanse(contents.data(), contents.size());
            return {};
         }
         result = SecureString{contents};
         OPENSSL_cleanse(contents.data(), contents.size());
      }
      return result;
   }

   std::optional<PinSpec> pinSpec(const QueryAttributes& query)
   {
      if (query.pinValue)
         return PinLiteral{SecureString{*query.pinValue}};
      if (!query.pinSource)
         return {};

      std::string_view source = *query.pinSource;
      auto             colon  = source.find(':');
      if (colon == std::string_view::npos)
         throw ResolutionError(resolve_error::unsupported_pin_source,
                               "pin-source should be env:NAME or file:PATH");
      auto scheme = source.substr(0, colon);
      auto rest   = source.substr(colon + 1);
      if (scheme == "env" && !rest.empty())
      {
         return PinEnv{std::string(rest)};
      }
      else if (scheme == "file" && !rest.empty())
      {
         // Only local files: file:///path or file://localhost/path
         if (rest.starts_with("//"))
         {
            auto slash     = rest.find('/', 2);
            auto authority = rest.substr(2, slash == std::string_view::npos ? rest.npos : slash - 2);
            if (slash == std::string_view::npos || (!authority.empty() && authority != "localhost"))
               throw ResolutionError(resolve_error::unsupported_pin_source,
                                     "pin-source file URI must name a local path");
            rest = rest.substr(slash);
         }
         return PinFile{std::string(rest)};
      }
      throw ResolutionError(resolve_error::unsupported_pin_source,
                            "unsupported pin-source scheme: " + std::string(scheme));
   }

   SecureString resolvePin(const PinSpec& spec, const Environment& env)
   {
      if (auto* literal = std::get_if<PinLiteral>(&spec))
      {
         return SecureString{literal->value.view()};
      }
      else if (auto* var = std::get_if<PinEnv>(&spec))
      {
         auto value = env.getenv(var->name);
         if (!value)
            throw ResolutionError(resolve_error::pin_unavailable,
                                  "environment variable " + var->name + " is not set");
         return std::move(*value);
      }
      else
      {
         const auto& file  = std::get<PinFile>(spec);
         auto        value = env.readFile(file.path);
         if (!value)
            throw ResolutionError(resolve_error::pin_unavailable,
                                  "cannot read pin file " + file.path);
         value->trimTrailingWhitespace();
         return std::move(*value);
      }
   }
}  // namespace p11uri
