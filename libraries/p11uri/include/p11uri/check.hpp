#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace p11uri
{
   /// Abort with `message`
   [[noreturn]] inline void abortMessage(std::string_view message)
   {
      throw std::runtime_error((std::string)message);
   }

   /// Abort with message if `!cond`
   inline void check(bool cond, std::string_view message)
   {
      if (!cond)
         abortMessage(message);
   }
}  // namespace p11uri
