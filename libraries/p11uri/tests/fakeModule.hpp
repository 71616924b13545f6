#pragma once

#include <p11uri/pkcs11.hpp>

// Loadable module that only implements C_Initialize and C_Finalize.
// Tests read its state through dlsym.
struct FakeModuleState
{
   bool          initialized     = false;
   unsigned long initializeCount = 0;
   unsigned long finalizeCount   = 0;
};

extern "C"
{
   extern FakeModuleState fakeModuleState;
   p11uri::pkcs11::error C_GetFunctionList(p11uri::pkcs11::function_list** result);
}
