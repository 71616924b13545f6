#pragma once

#include <p11uri/Module.hpp>
#include <p11uri/pin.hpp>

#include <map>
#include <set>
#include <string>
#include <system_error>
#include <vector>

namespace p11uri::test
{
   // Runs f and returns the code of the std::system_error it throws
   template <typename F>
   std::error_code errorOf(F&& f)
   {
      try
      {
         f();
      }
      catch (std::system_error& e)
      {
         return e.code();
      }
      return {};
   }

   struct FakeEnvironment : Environment
   {
      std::optional<SecureString> getenv(const std::string& name) const override
      {
         if (auto pos = vars.find(name); pos != vars.end())
            return SecureString{pos->second};
         return {};
      }
      std::optional<SecureString> readFile(const std::string& path) const override
      {
         if (auto pos = files.find(path); pos != files.end())
            return SecureString{pos->second};
         return {};
      }
      std::map<std::string, std::string> vars;
      std::map<std::string, std::string> files;
   };

   struct FakeSlot
   {
      pkcs11::slot_id_t                  id;
      SlotDescription                    slot;
      TokenDescription                   token;
      std::vector<pkcs11::object_handle> objects;
   };

   // An in-memory module. Every object of a slot matches every search.
   struct FakeModule : Module
   {
      LibraryDescription    library{"Example Corp", "Fake module", {2, 40}};
      std::vector<FakeSlot> slots;

      std::optional<std::string>   pin;
      std::optional<pkcs11::error> loginError;
      std::optional<pkcs11::error> slotListError;

      unsigned long                              nextSession = 1;
      std::map<unsigned long, pkcs11::slot_id_t> openSessions;
      std::vector<unsigned long>                 closedSessions;
      std::vector<std::string>                   logins;
      std::set<unsigned long>                    loggedInSessions;
      std::vector<unsigned long>                 logouts;
      std::optional<ObjectTemplate>              lastTemplate;
      unsigned long                              lastMax = 0;

      FakeSlot& addSlot(pkcs11::slot_id_t id, std::string label, std::size_t numObjects = 1)
      {
         FakeSlot slot{id,
                       {"Slot " + std::to_string(id), "Example Corp"},
                       {"Example Corp", "Fake", std::move(label), padSerial(std::to_string(id))},
                       {}};
         for (std::size_t i = 0; i < numObjects; ++i)
            slot.objects.push_back(static_cast<pkcs11::object_handle>(100 * id + i));
         slots.push_back(std::move(slot));
         return slots.back();
      }

      const FakeSlot& findSlot(pkcs11::slot_id_t id)
      {
         for (const auto& slot : slots)
         {
            if (slot.id == id)
               return slot;
         }
         throw std::system_error(pkcs11::error::slot_id_invalid);
      }

      pkcs11::slot_id_t sessionSlot(pkcs11::session_handle session)
      {
         auto pos = openSessions.find(static_cast<unsigned long>(session));
         if (pos == openSessions.end())
            throw std::system_error(pkcs11::error::session_handle_invalid);
         return pos->second;
      }

      LibraryDescription libraryInfo() override { return library; }

      std::vector<pkcs11::slot_id_t> listSlots(bool) override
      {
         if (slotListError)
            throw std::system_error(*slotListError);
         std::vector<pkcs11::slot_id_t> result;
         for (const auto& slot : slots)
            result.push_back(slot.id);
         return result;
      }

      SlotDescription  slotInfo(pkcs11::slot_id_t slot) override { return findSlot(slot).slot; }
      TokenDescription tokenInfo(pkcs11::slot_id_t slot) override { return findSlot(slot).token; }

      pkcs11::session_handle openSession(pkcs11::slot_id_t slot, pkcs11::session_flags) override
      {
         findSlot(slot);
         auto id          = nextSession++;
         openSessions[id] = slot;
         return static_cast<pkcs11::session_handle>(id);
      }

      void closeSession(pkcs11::session_handle session) override
      {
         sessionSlot(session);
         openSessions.erase(static_cast<unsigned long>(session));
         closedSessions.push_back(static_cast<unsigned long>(session));
      }

      void login(pkcs11::session_handle session, pkcs11::user_type, std::string_view value) override
      {
         sessionSlot(session);
         logins.push_back(std::string(value));
         if (loginError)
            throw std::system_error(*loginError);
         if (pin && *pin != value)
            throw std::system_error(pkcs11::error::pin_incorrect);
         loggedInSessions.insert(static_cast<unsigned long>(session));
      }

      void logout(pkcs11::session_handle session) override
      {
         sessionSlot(session);
         logouts.push_back(static_cast<unsigned long>(session));
      }

      std::vector<pkcs11::object_handle> findObjects(pkcs11::session_handle session,
                                                     const ObjectTemplate&  tmpl,
                                                     unsigned long          max) override
      {
         lastTemplate = tmpl;
         lastMax      = max;
         auto result  = findSlot(sessionSlot(session)).objects;
         if (result.size() > max)
            result.resize(max);
         return result;
      }

      std::optional<ObjectClass> objectClass(pkcs11::session_handle session,
                                             pkcs11::object_handle) override
      {
         sessionSlot(session);
         return ObjectClass::PrivateKey;
      }

      std::optional<std::string> objectLabel(pkcs11::session_handle session,
                                             pkcs11::object_handle) override
      {
         sessionSlot(session);
         return {};
      }
   };
}  // namespace p11uri::test
