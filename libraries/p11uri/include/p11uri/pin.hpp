#pragma once

#include <p11uri/attributes.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace p11uri
{
   // Owns secret text. The buffer is wiped on destruction and when moved from.
   class SecureString
   {
     public:
      SecureString() = default;
      explicit SecureString(std::string_view s) : data_(s) {}
      SecureString(const SecureString&) = delete;
      SecureString(SecureString&& other);
      SecureString& operator=(const SecureString&) = delete;
      SecureString& operator=(SecureString&& other);
      ~SecureString();

      std::string_view view() const { return data_; }
      std::size_t      size() const { return data_.size(); }
      bool             empty() const { return data_.empty(); }

      void wipe();
      void trimTrailingWhitespace();

     private:
      std::string data_;
   };

   // Access to the process environment, injected so that PIN resolution
   // can be tested without touching the real environment or filesystem.
   class Environment
   {
     public:
      virtual ~Environment() = default;
      virtual std::optional<SecureString> getenv(const std::string& name) const     = 0;
      virtual std::optional<SecureString> readFile(const std::string& path) const = 0;
   };

   class SystemEnvironment : public Environment
   {
     public:
      std::optional<SecureString> getenv(const std::string& name) const override;
      std::optional<SecureString> readFile(const std::string& path) const override;
   };

   struct PinLiteral
   {
      SecureString value;
   };

   struct PinEnv
   {
      std::string name;
   };

   struct PinFile
   {
      std::string path;
   };

   using PinSpec = std::variant<PinLiteral, PinEnv, PinFile>;

   // pin-value wins over pin-source. Returns nullopt when the URI carries
   // neither. Throws ResolutionError(unsupported_pin_source) for a
   // pin-source that is not `env:NAME` or `file:PATH`.
   std::optional<PinSpec> pinSpec(const QueryAttributes& query);

   // Throws ResolutionError(pin_unavailable) if the variable is unset or the
   // file cannot be read. File contents lose trailing whitespace.
   SecureString resolvePin(const PinSpec& spec, const Environment& env);
}  // namespace p11uri
