#include <p11uri/resolve.hpp>

#include <p11uri/errors.hpp>
#include <p11uri/log.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace p11uri
{
   namespace
   {
      template <typename F>
      auto moduleCall(std::string_view what, F&& f) -> decltype(f())
      {
         try
         {
            return f();
         }
         catch (std::system_error& e)
         {
            throw ResolutionError(resolve_error::module_call_failed, e.code(), what);
         }
      }

      bool hasLibraryAttributes(const PathAttributes& path)
      {
         return path.libraryDescription || path.libraryManufacturer || path.libraryVersion;
      }

      bool matches(const PathAttributes& path, const LibraryDescription& info)
      {
         if (path.libraryDescription && *path.libraryDescription != info.description)
         {
            return false;
         }
         if (path.libraryManufacturer && *path.libraryManufacturer != info.manufacturer)
         {
            return false;
         }
         if (path.libraryVersion && *path.libraryVersion != info.version)
         {
            return false;
         }
         return true;
      }

      bool hasSlotAttributes(const PathAttributes& path)
      {
         return path.slotDescription || path.slotManufacturer;
      }

      bool matches(const PathAttributes& path, const SlotDescription& info)
      {
         if (path.slotManufacturer && *path.slotManufacturer != info.manufacturer)
         {
            return false;
         }
         if (path.slotDescription && *path.slotDescription != info.description)
         {
            return false;
         }
         return true;
      }

      bool matches(const PathAttributes& path, const TokenDescription& info)
      {
         if (path.token && *path.token != info.label)
         {
            return false;
         }
         if (path.serial && *path.serial != info.serial)
         {
            return false;
         }
         if (path.manufacturer && *path.manufacturer != info.manufacturer)
         {
            return false;
         }
         if (path.model && *path.model != info.model)
         {
            return false;
         }
         return true;
      }

      ObjectTemplate makeTemplate(const PathAttributes& path)
      {
         return {path.object, path.id, path.type};
      }
   }  // namespace

   Session::Session(std::shared_ptr<Module> module, pkcs11::session_handle handle)
       : module_(std::move(module)), handle_(handle)
   {
   }

   Session::Session(Session&& other)
       : module_(std::move(other.module_)),
         handle_(std::exchange(other.handle_, std::nullopt)),
         loggedIn_(std::exchange(other.loggedIn_, false))
   {
   }

   Session& Session::operator=(Session&& other)
   {
      if (this != &other)
      {
         release();
         module_   = std::move(other.module_);
         handle_   = std::exchange(other.handle_, std::nullopt);
         loggedIn_ = std::exchange(other.loggedIn_, false);
      }
      return *this;
   }

   Session::~Session()
   {
      release();
   }

   void Session::login(pkcs11::user_type type, std::string_view pin)
   {
      try
      {
         module_->login(*handle_, type, pin);
         loggedIn_ = true;
      }
      catch (std::system_error& e)
      {
         if (e.code() != pkcs11::error::user_already_logged_in)
            throw;
         P11URI_LOG(loggers::generic::get(), debug) << "Token is already logged in";
      }
   }

   void Session::release()
   {
      if (!handle_)
         return;
      auto handle = *handle_;
      handle_.reset();
      if (loggedIn_)
      {
         loggedIn_ = false;
         try
         {
            module_->logout(handle);
         }
         catch (std::system_error& e)
         {
            P11URI_LOG(loggers::generic::get(), warning) << "Logout failed: " << e.what();
         }
      }
      try
      {
         module_->closeSession(handle);
      }
      catch (std::system_error& e)
      {
         P11URI_LOG(loggers::generic::get(), warning) << "Closing session failed: " << e.what();
      }
   }

   pkcs11::slot_id_t selectSlot(const URI& uri, Module& module)
   {
      const auto& path = uri.path();
      if (hasLibraryAttributes(path))
      {
         auto info = moduleCall("C_GetInfo", [&] { return module.libraryInfo(); });
         if (!matches(path, info))
         {
            P11URI_LOG(loggers::generic::get(), debug)
                << "Library " << info.manufacturer << " " << info.description << " "
                << info.version << " does not match";
            throw ResolutionError(resolve_error::no_slot, "no token matches URI");
         }
      }

      std::optional<pkcs11::slot_id_t> found;
      auto slots = moduleCall("C_GetSlotList", [&] { return module.listSlots(true); });
      for (auto slot : slots)
      {
         if (path.slotId && *path.slotId != slot)
         {
            P11URI_LOG(loggers::generic::get(), debug) << "Slot " << slot << ": slot-id differs";
            continue;
         }
         if (hasSlotAttributes(path) &&
             !matches(path, moduleCall("C_GetSlotInfo", [&] { return module.slotInfo(slot); })))
         {
            P11URI_LOG(loggers::generic::get(), debug)
                << "Slot " << slot << ": slot description does not match";
            continue;
         }
         if (!matches(path, moduleCall("C_GetTokenInfo", [&] { return module.tokenInfo(slot); })))
         {
            P11URI_LOG(loggers::generic::get(), debug)
                << "Slot " << slot << ": token does not match";
            continue;
         }
         if (found)
            throw ResolutionError(resolve_error::ambiguous_slot, "multiple tokens match URI");
         found = slot;
      }
      if (!found)
         throw ResolutionError(resolve_error::no_slot, "no token matches URI");
      P11URI_LOG(loggers::generic::get(), info) << "Selected slot " << *found;
      return *found;
   }

   ResolvedObject resolve(const URI&              uri,
                          std::shared_ptr<Module> module,
                          const Environment&      env,
                          const ResolverConfig&   config)
   {
      auto slot = selectSlot(uri, *module);

      std::optional<SecureString> pin;
      if (auto spec = pinSpec(uri.query()))
         pin = resolvePin(*spec, env);

      auto flags =
          static_cast<pkcs11::session_flags>(pkcs11::rw_session | pkcs11::serial_session);
      auto handle = moduleCall("C_OpenSession", [&] { return module->openSession(slot, flags); });
      Session session{module, handle};

      if (pin)
      {
         try
         {
            session.login(config.userType, pin->view());
         }
         catch (std::system_error& e)
         {
            throw ResolutionError(resolve_error::login_failed, e.code(),
                                  "login to slot " + std::to_string(slot) + " failed");
         }
         pin.reset();
      }
      else
      {
         P11URI_LOG(loggers::generic::get(), debug) << "No PIN given, using a public session";
      }

      // Two handles are enough to tell a unique match from an ambiguous one
      auto tmpl    = makeTemplate(uri.path());
      auto max     = std::max(config.maxObjects, 2ul);
      auto objects = moduleCall("C_FindObjects",
                                [&] { return module->findObjects(handle, tmpl, max); });
      if (objects.empty())
         throw ResolutionError(resolve_error::no_object, "no object matches URI");
      if (objects.size() > 1)
         throw ResolutionError(resolve_error::ambiguous_object, "multiple objects match URI");

      P11URI_LOG(loggers::generic::get(), info)
          << "Found object " << static_cast<unsigned long>(objects.front()) << " in slot " << slot;
      return {std::move(module), slot, std::move(session), objects.front()};
   }

   ResolvedObject resolve(const URI& uri, const ResolverConfig& config)
   {
      SystemEnvironment env;
      return resolve(uri, loadModule(uri, config), env, config);
   }
}  // namespace p11uri
