#include <p11uri/config.hpp>

#include <p11uri/check.hpp>
#include <p11uri/log.hpp>

#include <boost/program_options/parsers.hpp>
#include <boost/program_options/value_semantic.hpp>

#include <fstream>

namespace po = boost::program_options;

namespace p11uri
{
   po::options_description resolverOptions(ResolverConfig& config)
   {
      po::options_description desc("Resolver");
      auto                    opt = desc.add_options();
      opt("module-dir",
          po::value(&config.moduleDirectories)->composing()->default_value({}, "")->value_name(
              "path"),
          "Directory searched for modules named by module-name");
      opt("module,m", po::value(&config.defaultModule)->default_value("")->value_name("path"),
          "PKCS #11 module to load when the URI does not name one");
      opt("max-objects", po::value(&config.maxObjects)->default_value(10)->value_name("num"),
          "The maximum number of objects requested from a single search");
      opt("user-type",
          po::value(&config.userType)->default_value(pkcs11::user_type::user)->value_name("type"),
          "The user type to log in as: user, so, or context-specific");
      opt("log-level",
          po::value<loggers::level>()->default_value(loggers::level::info)->value_name("level"),
          "Minimum severity that is logged: debug, info, notice, warning, error, or critical");
      return desc;
   }

   void loadConfigFile(const std::string&             path,
                       const po::options_description& desc,
                       po::variables_map&             vm)
   {
      std::ifstream in(path);
      check(!!in, "Cannot open config file: " + path);
      po::store(po::parse_config_file(in, desc), vm);
   }

   void validate(const ResolverConfig& config)
   {
      // Ambiguity can only be detected if at least two handles are requested
      check(config.maxObjects >= 2, "max-objects must be at least 2");
   }
}  // namespace p11uri
