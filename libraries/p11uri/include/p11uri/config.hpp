#pragma once

#include <p11uri/pkcs11.hpp>

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>

#include <string>
#include <vector>

namespace p11uri
{
   struct ResolverConfig
   {
      // At most this many object handles are requested from one search
      unsigned long maxObjects = 10;
      // Searched for `module-name` as <name>.so and lib<name>.so
      std::vector<std::string> moduleDirectories;
      // Used when the URI names no module
      std::string       defaultModule;
      pkcs11::user_type userType = pkcs11::user_type::user;
   };

   // Options that fill `config` when the variables_map is notified. Also
   // declares log-level.
   boost::program_options::options_description resolverOptions(ResolverConfig& config);

   // Stores the options from an INI-style config file. Options given on the
   // command line take precedence if they were stored first.
   void loadConfigFile(const std::string&                                 path,
                       const boost::program_options::options_description& desc,
                       boost::program_options::variables_map&             vm);

   // Throws std::runtime_error if the config cannot be used for resolution
   void validate(const ResolverConfig& config);
}  // namespace p11uri
