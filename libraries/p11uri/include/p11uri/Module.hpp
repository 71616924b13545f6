#pragma once

#include <p11uri/attributes.hpp>
#include <p11uri/config.hpp>
#include <p11uri/pkcs11.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace p11uri
{
   class URI;

   // Strings have their blank padding removed
   struct LibraryDescription
   {
      std::string manufacturer;
      std::string description;
      Version     version;
   };

   struct SlotDescription
   {
      std::string description;
      std::string manufacturer;
   };

   struct TokenDescription
   {
      std::string  manufacturer;
      std::string  model;
      std::string  label;
      SerialNumber serial;
   };

   // Restricts an object search. Absent fields match any object.
   struct ObjectTemplate
   {
      std::optional<std::string>                label;
      std::optional<std::vector<unsigned char>> id;
      std::optional<ObjectClass>                type;
   };

   // The operations of a PKCS #11 module used to resolve a URI.
   // Implementations report failures by throwing std::system_error,
   // normally with a pkcs11::error code.
   class Module
   {
     public:
      virtual ~Module() = default;

      virtual LibraryDescription             libraryInfo()                     = 0;
      virtual std::vector<pkcs11::slot_id_t> listSlots(bool tokenPresent)      = 0;
      virtual SlotDescription                slotInfo(pkcs11::slot_id_t slot)  = 0;
      virtual TokenDescription               tokenInfo(pkcs11::slot_id_t slot) = 0;

      virtual pkcs11::session_handle openSession(pkcs11::slot_id_t     slot,
                                                 pkcs11::session_flags flags) = 0;
      virtual void                   closeSession(pkcs11::session_handle session) = 0;
      virtual void                   login(pkcs11::session_handle session,
                                           pkcs11::user_type      type,
                                           std::string_view       pin)      = 0;
      virtual void                   logout(pkcs11::session_handle session) = 0;

      virtual std::vector<pkcs11::object_handle> findObjects(pkcs11::session_handle session,
                                                             const ObjectTemplate&  tmpl,
                                                             unsigned long          max) = 0;
      virtual std::optional<ObjectClass> objectClass(pkcs11::session_handle session,
                                                     pkcs11::object_handle  obj) = 0;
      virtual std::optional<std::string> objectLabel(pkcs11::session_handle session,
                                                     pkcs11::object_handle  obj) = 0;
   };

   // A module loaded from a shared library
   class PKCS11Module : public Module
   {
     public:
      explicit PKCS11Module(const std::string& path);

      const std::string& path() const { return path_; }

      LibraryDescription                 libraryInfo() override;
      std::vector<pkcs11::slot_id_t>     listSlots(bool tokenPresent) override;
      SlotDescription                    slotInfo(pkcs11::slot_id_t slot) override;
      TokenDescription                   tokenInfo(pkcs11::slot_id_t slot) override;
      pkcs11::session_handle             openSession(pkcs11::slot_id_t     slot,
                                                     pkcs11::session_flags flags) override;
      void                               closeSession(pkcs11::session_handle session) override;
      void                               login(pkcs11::session_handle session,
                                               pkcs11::user_type      type,
                                               std::string_view       pin) override;
      void                               logout(pkcs11::session_handle session) override;
      std::vector<pkcs11::object_handle> findObjects(pkcs11::session_handle session,
                                                     const ObjectTemplate&  tmpl,
                                                     unsigned long          max) override;
      std::optional<ObjectClass>         objectClass(pkcs11::session_handle session,
                                                     pkcs11::object_handle  obj) override;
      std::optional<std::string>         objectLabel(pkcs11::session_handle session,
                                                     pkcs11::object_handle  obj) override;

     private:
      std::string                      path_;
      std::unique_ptr<pkcs11::library> lib_;
   };

   // Chooses the shared library for `uri`: module-path, then module-name
   // looked up in the configured directories, then the configured default.
   // Throws ResolutionError(no_module) if none applies.
   std::string findModule(const URI& uri, const ResolverConfig& config);

   // Loads the module chosen by findModule. Load failures are reported as
   // ResolutionError(module_call_failed).
   std::shared_ptr<Module> loadModule(const URI& uri, const ResolverConfig& config);

   // Renders a URI that identifies the token
   std::string makeURI(const TokenDescription& token);
}  // namespace p11uri
