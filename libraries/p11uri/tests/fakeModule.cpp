#include "fakeModule.hpp"

using namespace p11uri::pkcs11;

namespace
{
   error initialize(const initialize_args*)
   {
      if (fakeModuleState.initialized)
         return error::cryptoki_already_initialized;
      fakeModuleState.initialized = true;
      ++fakeModuleState.initializeCount;
      return error::ok;
   }

   error finalize(void*)
   {
      if (!fakeModuleState.initialized)
         return error::cryptoki_not_initialized;
      fakeModuleState.initialized = false;
      ++fakeModuleState.finalizeCount;
      return error::ok;
   }

   function_list makeFunctions()
   {
      function_list result{};
      result.version      = {2, 40};
      result.C_Initialize = &initialize;
      result.C_Finalize   = &finalize;
      return result;
   }

   function_list functions = makeFunctions();
}  // namespace

extern "C"
{
   FakeModuleState fakeModuleState;

   error C_GetFunctionList(function_list** result)
   {
      *result = &functions;
      return error::ok;
   }
}
