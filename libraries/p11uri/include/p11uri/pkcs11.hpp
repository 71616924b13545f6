#pragma once

#include <p11uri/attributes.hpp>

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace p11uri::pkcs11
{
   // CK_RV values that the resolver can act on or report by name. Other
   // values still flow through pkcs11_category() as numbers.
   enum error : unsigned long
   {
      ok                             = 0,
      cancel                         = 0x1,
      host_memory                    = 0x2,
      slot_id_invalid                = 0x3,
      general_error                  = 0x5,
      function_failed                = 0x6,
      arguments_bad                  = 0x7,
      cant_lock                      = 0xa,
      attribute_sensitive            = 0x11,
      attribute_type_invalid         = 0x12,
      attribute_value_invalid        = 0x13,
      device_error                   = 0x30,
      device_memory                  = 0x31,
      device_removed                 = 0x32,
      function_canceled              = 0x50,
      function_not_supported         = 0x54,
      object_handle_invalid          = 0x82,
      operation_active               = 0x90,
      operation_not_initialized      = 0x91,
      pin_incorrect                  = 0xa0,
      pin_invalid                    = 0xa1,
      pin_len_range                  = 0xa2,
      pin_expired                    = 0xa3,
      pin_locked                     = 0xa4,
      session_closed                 = 0xb0,
      session_count                  = 0xb1,
      session_handle_invalid         = 0xb3,
      session_parallel_not_supported = 0xb4,
      session_read_only              = 0xb5,
      session_exists                 = 0xb6,
      session_read_only_exists       = 0xb7,
      session_read_write_so_exists   = 0xb8,
      template_incomplete            = 0xd0,
      template_inconsistent          = 0xd1,
      token_not_present              = 0xe0,
      token_not_recognized           = 0xe1,
      token_write_protected          = 0xe2,
      user_already_logged_in         = 0x100,
      user_not_logged_in             = 0x101,
      user_pin_not_initialized       = 0x102,
      user_type_invalid              = 0x103,
      user_another_already_logged_in = 0x104,
      user_too_many_types            = 0x105,
      buffer_too_small               = 0x150,
      cryptoki_not_initialized       = 0x190,
      cryptoki_already_initialized   = 0x191,
      function_rejected              = 0x200,
      vendor_defined                 = 0x80000000,
   };

   const std::error_category& pkcs11_category();
   std::error_code            make_error_code(error e);

   void handle_error(error err);
}  // namespace p11uri::pkcs11

namespace std
{
   template <>
   struct is_error_code_enum<::p11uri::pkcs11::error>
   {
      static constexpr bool value = true;
   };
}  // namespace std

namespace p11uri::pkcs11
{
   enum class flags_t : unsigned long
   {
      os_locking_ok = 2
   };

   using slot_id_t = unsigned long;

   enum session_flags : unsigned long
   {
      rw_session     = 2,
      serial_session = 4,
   };

   enum slot_flags : unsigned long
   {
      token_present    = 1,
      removable_device = 2,
      hw_slot          = 4,
   };

   // CK_VERSION has the same layout
   using version_t = Version;

   struct info
   {
      version_t     cryptokiVersion;
      char8_t       manufacturerID[32];
      unsigned long flags;
      char8_t       libraryDescription[32];
      version_t     libraryVersion;
   };

   struct slot_info
   {
      char8_t    slotDescription[64];
      char8_t    manufacturerID[32];
      slot_flags flags;
      version_t  hardwareVersion;
      version_t  firmwareVersion;
   };

   enum token_flags : unsigned long
   {
      write_protected               = 0x2,
      login_required                = 0x4,
      user_pin_initialized          = 0x8,
      protected_authentication_path = 0x100,
      token_initialized             = 0x400,
   };

   // Strings in PKCS #11 structs are padded with trailing spaces
   // This function removes the padding
   std::string_view getString(const char*, std::size_t);
   template <std::size_t N>
   std::string_view getString(const char8_t (&a)[N])
   {
      return getString(reinterpret_cast<const char*>(a), N);
   }
   template <std::size_t N>
   std::string_view getString(const char (&a)[N])
   {
      return getString(a, N);
   }

   struct token_info
   {
      char8_t       label[32];
      char8_t       manufacturerID[32];
      char8_t       model[16];
      char          serialNumber[16];
      token_flags   flags;
      unsigned long maxSessionCount;
      unsigned long sessionCount;
      unsigned long maxRwSessionCount;
      unsigned long rwSessionCount;
      unsigned long maxPinLen;
      unsigned long minPinLen;
      unsigned long totalPublicMemory;
      unsigned long freePublicMemory;
      unsigned long totalPrivateMemory;
      unsigned long freePrivateMemory;
      version_t     hardwareVersion;
      version_t     firmwareVersion;
      char          utcTime[16];
   };

   enum class session_handle : unsigned long
   {
      invalid = 0
   };

   enum class user_type : unsigned long
   {
      so               = 0,
      user             = 1,
      context_specific = 2,
   };
   std::ostream& operator<<(std::ostream& os, user_type type);
   std::istream& operator>>(std::istream& is, user_type& type);

   struct initialize_args
   {
      error (*CreateMutex)(void**) = nullptr;
      error (*DestroyMutex)(void*) = nullptr;
      error (*LockMutex)(void*)    = nullptr;
      error (*UnlockMutex)(void*)  = nullptr;
      flags_t flags                = flags_t::os_locking_ok;
      void*   pReserved            = nullptr;
   };

   enum class object_handle : unsigned long
   {
   };

   enum class object_class : unsigned long
   {
      data        = 0x0,
      certificate = 0x1,
      public_key  = 0x2,
      private_key = 0x3,
      secret_key  = 0x4,
   };

   object_class  toObjectClass(ObjectClass c);
   std::ostream& operator<<(std::ostream& os, object_class c);

   enum class attribute_type : unsigned long
   {
      class_ = 0x0,
      label  = 0x3,
      id     = 0x102,
   };

   struct attribute
   {
      attribute_type type;
      void*          value;
      unsigned long  valueLen;
   };

   using unused_func_t = void (*)(void);

   struct function_list
   {
      version_t version;
      error (*C_Initialize)(const initialize_args*);
      error (*C_Finalize)(void*);
      error (*C_GetInfo)(info*);
      error (*C_GetFunctionList)(function_list**);
      error (*C_GetSlotList)(bool tokenPresent, slot_id_t* slots, unsigned long* count);
      error (*C_GetSlotInfo)(slot_id_t, slot_info*);
      error (*C_GetTokenInfo)(slot_id_t, token_info*);
      unused_func_t C_GetMechanismList;
      unused_func_t C_GetMechanismInfo;
      unused_func_t C_InitToken;
      unused_func_t C_InitPIN;
      unused_func_t C_SetPIN;
      error (*C_OpenSession)(slot_id_t,
                             session_flags,
                             void*,
                             error (*notify)(session_handle, unsigned long, void*),
                             session_handle*);
      error (*C_CloseSession)(session_handle);
      unused_func_t C_CloseAllSessions;
      unused_func_t C_GetSessionInfo;
      unused_func_t C_GetOperationState;
      unused_func_t C_SetOperationState;
      error (*C_Login)(session_handle, user_type, const char8_t* pin, unsigned long pinLen);
      error (*C_Logout)(session_handle);
      unused_func_t C_CreateObject;
      unused_func_t C_CopyObject;
      unused_func_t C_DestroyObject;
      unused_func_t C_GetObjectSize;
      error (*C_GetAttributeValue)(session_handle, object_handle, attribute*, unsigned long);
      unused_func_t C_SetAttributeValue;
      error (*C_FindObjectsInit)(session_handle, const attribute*, unsigned long);
      error (*C_FindObjects)(session_handle, object_handle*, unsigned long, unsigned long*);
      error (*C_FindObjectsFinal)(session_handle);
      // The remaining entries (encryption, signing, key management, random,
      // slot events) are never called.
   };

   struct shared_library
   {
      explicit shared_library(const char* filename);
      shared_library(const shared_library&)            = delete;
      shared_library& operator=(const shared_library&) = delete;
      ~shared_library();
      void* handle;
   };

   // A loaded and initialized PKCS #11 module. All member functions throw
   // std::system_error with a pkcs11_category() code on failure.
   struct library
   {
      explicit library(const char* filename);
      info                       GetInfo();
      std::vector<slot_id_t>     GetSlotList(bool tokenPresent);
      slot_info                  GetSlotInfo(slot_id_t slot);
      token_info                 GetTokenInfo(slot_id_t slot);
      session_handle             OpenSession(slot_id_t slot, session_flags flags);
      void                       CloseSession(session_handle session);
      void                       Login(session_handle session, user_type type, std::string_view pin);
      void                       Logout(session_handle session);
      std::vector<object_handle> FindObjects(session_handle   session,
                                             const attribute* attrs,
                                             unsigned long    count,
                                             unsigned long    max);
      // Returns nullopt if the attribute is not present or not extractable
      std::optional<object_class> TryGetClass(session_handle session, object_handle obj);
      std::optional<std::string>  TryGetLabel(session_handle session, object_handle obj);
      ~library();
      shared_library lib;
      function_list* functions;
      bool           initialized = false;
   };
}  // namespace p11uri::pkcs11
