#pragma once

#include <p11uri/Module.hpp>
#include <p11uri/URI.hpp>
#include <p11uri/config.hpp>
#include <p11uri/pin.hpp>

#include <memory>
#include <optional>

namespace p11uri
{
   // An open session. Logs out (if this session logged in) and closes the
   // session on destruction.
   class Session
   {
     public:
      Session(std::shared_ptr<Module> module, pkcs11::session_handle handle);
      Session(const Session&) = delete;
      Session(Session&& other);
      Session& operator=(const Session&) = delete;
      Session& operator=(Session&& other);
      ~Session();

      // CKR_USER_ALREADY_LOGGED_IN counts as success. In that case the
      // session does not log out when it is released.
      void login(pkcs11::user_type type, std::string_view pin);

      Module&                module() const { return *module_; }
      pkcs11::session_handle handle() const { return *handle_; }
      bool                   loggedIn() const { return loggedIn_; }

     private:
      void release();

      std::shared_ptr<Module>               module_;
      std::optional<pkcs11::session_handle> handle_;
      bool                                  loggedIn_ = false;
   };

   struct ResolvedObject
   {
      std::shared_ptr<Module> module;
      pkcs11::slot_id_t       slot;
      Session                 session;
      pkcs11::object_handle   object;
   };

   // Returns the only slot whose library, slot, and token match the URI.
   // Throws ResolutionError(no_slot) or ResolutionError(ambiguous_slot).
   pkcs11::slot_id_t selectSlot(const URI& uri, Module& module);

   // Finds the single object identified by `uri`, logging in if the URI
   // provides a PIN. Any session opened along the way is closed before an
   // exception leaves this function.
   ResolvedObject resolve(const URI&              uri,
                          std::shared_ptr<Module> module,
                          const Environment&      env,
                          const ResolverConfig&   config);

   // Loads the module named by the URI or the config and resolves against
   // the process environment
   ResolvedObject resolve(const URI& uri, const ResolverConfig& config);
}  // namespace p11uri
