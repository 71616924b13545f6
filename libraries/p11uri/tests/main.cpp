#include <p11uri/log.hpp>

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <iostream>
#include <sstream>

using namespace p11uri;

int main(int argc, char* argv[])
{
   Catch::Session session;
   std::string    logLevel = "critical";

   using Catch::clara::Opt;
   auto cli = session.cli() |
              Opt(logLevel, "level")["--log-level"]("The minimum severity of log messages");
   session.cli(cli);

   if (int res = session.applyCommandLine(argc, argv))
      return res;

   loggers::level     threshold;
   std::istringstream ss(logLevel);
   if (!(ss >> threshold))
   {
      std::cerr << "Invalid log level: " << logLevel << std::endl;
      return 1;
   }
   loggers::configure(threshold);

   return session.run();
}
