#include <p11uri/pkcs11.hpp>

#include <algorithm>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

#include <dlfcn.h>

namespace p11uri::pkcs11
{
   namespace
   {
      constexpr std::pair<error, const char*> errorNames[] = {
          {error::ok, "ok"},
          {error::cancel, "cancel"},
          {error::host_memory, "host memory"},
          {error::slot_id_invalid, "slot id invalid"},
          {error::general_error, "general error"},
          {error::function_failed, "function failed"},
          {error::arguments_bad, "arguments bad"},
          {error::cant_lock, "cant lock"},
          {error::attribute_sensitive, "attribute sensitive"},
          {error::attribute_type_invalid, "attribute type invalid"},
          {error::attribute_value_invalid, "attribute value invalid"},
          {error::device_error, "device error"},
          {error::device_memory, "device memory"},
          {error::device_removed, "device removed"},
          {error::function_canceled, "function canceled"},
          {error::function_not_supported, "function not supported"},
          {error::object_handle_invalid, "object handle invalid"},
          {error::operation_active, "operation active"},
          {error::operation_not_initialized, "operation not initialized"},
          {error::pin_incorrect, "pin incorrect"},
          {error::pin_invalid, "pin invalid"},
          {error::pin_len_range, "pin len range"},
          {error::pin_expired, "pin expired"},
          {error::pin_locked, "pin locked"},
          {error::session_closed, "session closed"},
          {error::session_count, "session count"},
          {error::session_handle_invalid, "session handle invalid"},
          {error::session_parallel_not_supported, "session parallel not supported"},
          {error::session_read_only, "session read only"},
          {error::session_exists, "session exists"},
          {error::session_read_only_exists, "session read only exists"},
          {error::session_read_write_so_exists, "session read write so exists"},
          {error::template_incomplete, "template incomplete"},
          {error::template_inconsistent, "template inconsistent"},
          {error::token_not_present, "token not present"},
          {error::token_not_recognized, "token not recognized"},
          {error::token_write_protected, "token write protected"},
          {error::user_already_logged_in, "user already logged in"},
          {error::user_not_logged_in, "user not logged in"},
          {error::user_pin_not_initialized, "user pin not initialized"},
          {error::user_type_invalid, "user type invalid"},
          {error::user_another_already_logged_in, "user another already logged in"},
          {error::user_too_many_types, "user too many types"},
          {error::buffer_too_small, "buffer too small"},
          {error::cryptoki_not_initialized, "cryptoki not initialized"},
          {error::cryptoki_already_initialized, "cryptoki already initialized"},
          {error::function_rejected, "function rejected"},
      };

      class pkcs11_error_category : public std::error_category
      {
         std::string message(int condition) const override
         {
            auto code = static_cast<error>(static_cast<unsigned int>(condition));
            for (const auto& [e, name] : errorNames)
            {
               if (e == code)
                  return name;
            }
            if (code & error::vendor_defined)
               return "Vendor defined PKCS #11 error: " +
                      std::to_string(static_cast<unsigned int>(condition));
            return "Unknown PKCS #11 error: " + std::to_string(condition);
         }
         const char* name() const noexcept override { return "pkcs11"; }
      };

      // Runs a C_FindObjectsInit / C_FindObjectsFinal pair
      struct finder
      {
         finder(library* self, session_handle session, const attribute* attrs, unsigned long count)
             : self(self), session(session)
         {
            handle_error(self->functions->C_FindObjectsInit(session, attrs, count));
         }
         ~finder() { self->functions->C_FindObjectsFinal(session); }
         library*       self;
         session_handle session;
      };

      template <typename T>
      std::optional<T> tryGetFixed(library*       self,
                                   session_handle session,
                                   object_handle  obj,
                                   attribute_type type)
      {
         T         result;
         attribute template_[1] = {{type, &result, sizeof(result)}};
         auto      err          = self->functions->C_GetAttributeValue(session, obj, template_, 1);
         if (err == error::attribute_sensitive || err == error::attribute_type_invalid)
            return {};
         handle_error(err);
         return result;
      }
   }  // namespace

   const std::error_category& pkcs11_category()
   {
      static const pkcs11_error_category result;
      return result;
   }

   std::error_code make_error_code(error e)
   {
      return std::error_code(static_cast<int>(e), pkcs11_category());
   }

   void handle_error(error err)
   {
      if (err != error::ok)
      {
         throw std::system_error(err);
      }
   }

   std::string_view getString(const char* s, std::size_t n)
   {
      std::string_view result{s, n};
      auto             pos = result.find_last_not_of(' ');
      if (pos == std::string::npos)
      {
         return {};
      }
      return result.substr(0, pos + 1);
   }

   std::ostream& operator<<(std::ostream& os, user_type type)
   {
      switch (type)
      {
         case user_type::so:
            return os << "so";
         case user_type::user:
            return os << "user";
         case user_type::context_specific:
            return os << "context-specific";
         default:
            return os << static_cast<unsigned long>(type);
      }
   }

   std::istream& operator>>(std::istream& is, user_type& type)
   {
      std::string s;
      if (is >> s)
      {
         if (s == "so")
            type = user_type::so;
         else if (s == "user")
            type = user_type::user;
         else if (s == "context-specific")
            type = user_type::context_specific;
         else
            is.setstate(std::ios_base::failbit);
      }
      return is;
   }

   object_class toObjectClass(ObjectClass c)
   {
      switch (c)
      {
         case ObjectClass::Certificate:
            return object_class::certificate;
         case ObjectClass::Data:
            return object_class::data;
         case ObjectClass::PrivateKey:
            return object_class::private_key;
         case ObjectClass::PublicKey:
            return object_class::public_key;
         case ObjectClass::SecretKey:
            return object_class::secret_key;
      }
      throw std::invalid_argument("invalid object class");
   }

   std::ostream& operator<<(std::ostream& os, object_class c)
   {
      switch (c)
      {
         case object_class::data:
            os << "CKO_DATA";
            break;
         case object_class::certificate:
            os << "CKO_CERTIFICATE";
            break;
         case object_class::public_key:
            os << "CKO_PUBLIC_KEY";
            break;
         case object_class::private_key:
            os << "CKO_PRIVATE_KEY";
            break;
         case object_class::secret_key:
            os << "CKO_SECRET_KEY";
            break;
         default:
            os << static_cast<unsigned long>(c);
            break;
      }
      return os;
   }

   shared_library::shared_library(const char* filename)
   {
      handle = ::dlopen(filename, RTLD_NOW | RTLD_LOCAL);
      if (handle == nullptr)
      {
         throw std::runtime_error(::dlerror());
      }
   }
   shared_library::~shared_library()
   {
      if (handle)
      {
         ::dlclose(handle);
      }
   }

   library::library(const char* filename) : lib(filename)
   {
      auto get_function_list =
          reinterpret_cast<error (*)(function_list**)>(::dlsym(lib.handle, "C_GetFunctionList"));
      if (!get_function_list)
      {
         throw std::runtime_error(std::string(filename) + ": missing C_GetFunctionList");
      }
      handle_error(get_function_list(&functions));
      initialize_args args;
      auto            err = functions->C_Initialize(&args);
      if (err != error::cryptoki_already_initialized)
      {
         handle_error(err);
         initialized = true;
      }
   }
   info library::GetInfo()
   {
      info result;
      handle_error(functions->C_GetInfo(&result));
      return result;
   }
   std::vector<slot_id_t> library::GetSlotList(bool tokenPresent)
   {
      unsigned long n = 0;
      handle_error(functions->C_GetSlotList(tokenPresent, nullptr, &n));
      std::vector<slot_id_t> result(n);
      while (true)
      {
         auto err = functions->C_GetSlotList(tokenPresent, result.data(), &n);
         if (err == error::ok)
         {
            result.resize(n);
            return result;
         }
         else if (err == error::buffer_too_small)
         {
            result.resize(n);
         }
         else
         {
            throw std::system_error(err);
         }
      }
   }
   slot_info library::GetSlotInfo(slot_id_t slot)
   {
      slot_info result;
      handle_error(functions->C_GetSlotInfo(slot, &result));
      return result;
   }
   token_info library::GetTokenInfo(slot_id_t slot)
   {
      token_info result;
      handle_error(functions->C_GetTokenInfo(slot, &result));
      return result;
   }
   session_handle library::OpenSession(slot_id_t slot, session_flags flags)
   {
      session_handle result;
      handle_error(functions->C_OpenSession(slot, flags, nullptr, nullptr, &result));
      return result;
   }
   void library::CloseSession(session_handle session)
   {
      handle_error(functions->C_CloseSession(session));
   }
   void library::Login(session_handle session, user_type type, std::string_view pin)
   {
      handle_error(functions->C_Login(session, type, reinterpret_cast<const char8_t*>(pin.data()),
                                      pin.size()));
   }
   void library::Logout(session_handle session)
   {
      handle_error(functions->C_Logout(session));
   }
   std::vector<object_handle> library::FindObjects(session_handle   session,
                                                   const attribute* attrs,
                                                   unsigned long    count,
                                                   unsigned long    max)
   {
      finder                     cleanup(this, session, attrs, count);
      std::vector<object_handle> result(max);
      unsigned long              found = 0;
      handle_error(functions->C_FindObjects(session, result.data(), max, &found));
      result.resize(std::min(found, max));
      return result;
   }
   std::optional<object_class> library::TryGetClass(session_handle session, object_handle obj)
   {
      return tryGetFixed<object_class>(this, session, obj, attribute_type::class_);
   }
   std::optional<std::string> library::TryGetLabel(session_handle session, object_handle obj)
   {
      attribute template_[1] = {{attribute_type::label, nullptr, 0}};
      auto      err          = functions->C_GetAttributeValue(session, obj, template_, 1);
      if (err == error::attribute_sensitive || err == error::attribute_type_invalid)
         return {};
      handle_error(err);
      std::string result(template_[0].valueLen, '\0');
      template_[0].value = result.data();
      handle_error(functions->C_GetAttributeValue(session, obj, template_, 1));
      result.resize(template_[0].valueLen);
      return result;
   }
   library::~library()
   {
      // Leave a module initialized elsewhere in the process alone
      if (initialized)
         functions->C_Finalize(nullptr);
   }
}  // namespace p11uri::pkcs11
