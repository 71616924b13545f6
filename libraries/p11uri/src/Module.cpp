#include <p11uri/Module.hpp>

#include <p11uri/URI.hpp>
#include <p11uri/errors.hpp>
#include <p11uri/log.hpp>
#include <p11uri/percent.hpp>

#include <algorithm>
#include <filesystem>

namespace p11uri
{
   namespace
   {
      std::optional<ObjectClass> fromObjectClass(pkcs11::object_class c)
      {
         switch (c)
         {
            case pkcs11::object_class::certificate:
               return ObjectClass::Certificate;
            case pkcs11::object_class::data:
               return ObjectClass::Data;
            case pkcs11::object_class::private_key:
               return ObjectClass::PrivateKey;
            case pkcs11::object_class::public_key:
               return ObjectClass::PublicKey;
            case pkcs11::object_class::secret_key:
               return ObjectClass::SecretKey;
            default:
               return {};
         }
      }

      std::string_view trimSerial(const SerialNumber& serial)
      {
         return pkcs11::getString(reinterpret_cast<const char*>(serial.data()), serial.size());
      }
   }  // namespace

   PKCS11Module::PKCS11Module(const std::string& path)
       : path_(path), lib_(std::make_unique<pkcs11::library>(path.c_str()))
   {
   }

   LibraryDescription PKCS11Module::libraryInfo()
   {
      auto info = lib_->GetInfo();
      return {std::string(pkcs11::getString(info.manufacturerID)),
              std::string(pkcs11::getString(info.libraryDescription)), info.libraryVersion};
   }

   std::vector<pkcs11::slot_id_t> PKCS11Module::listSlots(bool tokenPresent)
   {
      return lib_->GetSlotList(tokenPresent);
   }

   SlotDescription PKCS11Module::slotInfo(pkcs11::slot_id_t slot)
   {
      auto info = lib_->GetSlotInfo(slot);
      return {std::string(pkcs11::getString(info.slotDescription)),
              std::string(pkcs11::getString(info.manufacturerID))};
   }

   TokenDescription PKCS11Module::tokenInfo(pkcs11::slot_id_t slot)
   {
      auto             info = lib_->GetTokenInfo(slot);
      TokenDescription result{std::string(pkcs11::getString(info.manufacturerID)),
                              std::string(pkcs11::getString(info.model)),
                              std::string(pkcs11::getString(info.label)),
                              {}};
      std::copy_n(info.serialNumber, result.serial.size(), result.serial.begin());
      return result;
   }

   pkcs11::session_handle PKCS11Module::openSession(pkcs11::slot_id_t     slot,
                                                    pkcs11::session_flags flags)
   {
      return lib_->OpenSession(slot, flags);
   }

   void PKCS11Module::closeSession(pkcs11::session_handle session)
   {
      lib_->CloseSession(session);
   }

   void PKCS11Module::login(pkcs11::session_handle session,
                            pkcs11::user_type      type,
                            std::string_view       pin)
   {
      lib_->Login(session, type, pin);
   }

   void PKCS11Module::logout(pkcs11::session_handle session)
   {
      lib_->Logout(session);
   }

   std::vector<pkcs11::object_handle> PKCS11Module::findObjects(pkcs11::session_handle session,
                                                                const ObjectTemplate&  tmpl,
                                                                unsigned long          max)
   {
      std::vector<pkcs11::attribute> attrs;
      pkcs11::object_class           class_{};
      std::string                    label;
      std::vector<unsigned char>     id;
      if (tmpl.type)
      {
         class_ = pkcs11::toObjectClass(*tmpl.type);
         attrs.push_back({pkcs11::attribute_type::class_, &class_, sizeof(class_)});
      }
      if (tmpl.label)
      {
         label = *tmpl.label;
         attrs.push_back({pkcs11::attribute_type::label, label.data(), label.size()});
      }
      if (tmpl.id)
      {
         id = *tmpl.id;
         attrs.push_back({pkcs11::attribute_type::id, id.data(), id.size()});
      }
      return lib_->FindObjects(session, attrs.data(), attrs.size(), max);
   }

   std::optional<ObjectClass> PKCS11Module::objectClass(pkcs11::session_handle session,
                                                        pkcs11::object_handle  obj)
   {
      if (auto c = lib_->TryGetClass(session, obj))
         return fromObjectClass(*c);
      return {};
   }

   std::optional<std::string> PKCS11Module::objectLabel(pkcs11::session_handle session,
                                                        pkcs11::object_handle  obj)
   {
      return lib_->TryGetLabel(session, obj);
   }

   std::string findModule(const URI& uri, const ResolverConfig& config)
   {
      const auto& query = uri.query();
      if (query.modulePath)
         return *query.modulePath;
      if (query.moduleName)
      {
         const std::string candidates[] = {*query.moduleName + ".so",
                                           "lib" + *query.moduleName + ".so"};
         for (const auto& dir : config.moduleDirectories)
         {
            for (const auto& filename : candidates)
            {
               auto path = std::filesystem::path(dir) / filename;
               if (std::filesystem::is_regular_file(path))
                  return path.string();
            }
         }
         throw ResolutionError(resolve_error::no_module,
                               "module " + *query.moduleName + " not found");
      }
      if (!config.defaultModule.empty())
         return config.defaultModule;
      throw ResolutionError(resolve_error::no_module,
                            "URI has no module-path or module-name and no default is configured");
   }

   std::shared_ptr<Module> loadModule(const URI& uri, const ResolverConfig& config)
   {
      auto path = findModule(uri, config);
      P11URI_LOG(loggers::generic::get(), debug) << "Loading PKCS #11 module " << path;
      try
      {
         return std::make_shared<PKCS11Module>(path);
      }
      catch (std::system_error& e)
      {
         throw ResolutionError(resolve_error::module_call_failed, e.code(),
                               "cannot initialize " + path);
      }
      catch (std::runtime_error& e)
      {
         throw ResolutionError(resolve_error::module_call_failed, e.what());
      }
   }

   std::string makeURI(const TokenDescription& token)
   {
      constexpr auto pc = component::path;
      std::string    result;
      result += "pkcs11:";
      result += "token=";
      result += encodeString(token.label, pc);
      result += ";manufacturer=";
      result += encodeString(token.manufacturer, pc);
      result += ";model=";
      result += encodeString(token.model, pc);
      result += ";serial=";
      result += encodeString(trimSerial(token.serial), pc);
      return result;
   }
}  // namespace p11uri
