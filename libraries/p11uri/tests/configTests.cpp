#include <p11uri/config.hpp>
#include <p11uri/log.hpp>

#include <boost/program_options/parsers.hpp>

#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>

using namespace p11uri;

namespace po = boost::program_options;

TEST_CASE("resolver options")
{
   ResolverConfig          config;
   po::options_description desc = resolverOptions(config);
   const char*             argv[] = {"test",          "--module-dir", "/a",      "--module-dir",
                                     "/b",            "--module",     "/p11.so", "--max-objects",
                                     "4",             "--user-type",  "so",      "--log-level",
                                     "debug"};
   po::variables_map       vm;
   po::store(po::parse_command_line(std::size(argv), argv, desc), vm);
   po::notify(vm);
   CHECK(config.moduleDirectories == std::vector<std::string>{"/a", "/b"});
   CHECK(config.defaultModule == "/p11.so");
   CHECK(config.maxObjects == 4u);
   CHECK(config.userType == pkcs11::user_type::so);
   CHECK(vm["log-level"].as<loggers::level>() == loggers::level::debug);
}

TEST_CASE("resolver defaults")
{
   ResolverConfig          config;
   po::options_description desc = resolverOptions(config);
   const char*             argv[] = {"test"};
   po::variables_map       vm;
   po::store(po::parse_command_line(std::size(argv), argv, desc), vm);
   po::notify(vm);
   CHECK(config.moduleDirectories.empty());
   CHECK(config.defaultModule == "");
   CHECK(config.maxObjects == 10u);
   CHECK(config.userType == pkcs11::user_type::user);
   CHECK(vm["log-level"].as<loggers::level>() == loggers::level::info);
}

TEST_CASE("invalid option values")
{
   ResolverConfig          config;
   po::options_description desc = resolverOptions(config);
   po::variables_map       vm;
   const char*             badUser[] = {"test", "--user-type", "admin"};
   CHECK_THROWS(po::store(po::parse_command_line(std::size(badUser), badUser, desc), vm));
   const char* badLevel[] = {"test", "--log-level", "loud"};
   CHECK_THROWS(po::store(po::parse_command_line(std::size(badLevel), badLevel, desc), vm));
}

TEST_CASE("config file")
{
   auto path = std::filesystem::temp_directory_path() / "p11uri-config-test.ini";
   {
      std::ofstream out(path);
      out << "module = /etc/p11.so\n";
      out << "module-dir = /x\n";
      out << "max-objects = 5\n";
   }
   ResolverConfig          config;
   po::options_description desc = resolverOptions(config);
   po::variables_map       vm;
   loadConfigFile(path.string(), desc, vm);
   po::notify(vm);
   std::filesystem::remove(path);
   CHECK(config.defaultModule == "/etc/p11.so");
   CHECK(config.moduleDirectories == std::vector<std::string>{"/x"});
   CHECK(config.maxObjects == 5u);

   CHECK_THROWS_AS(loadConfigFile("/nonexistent/p11uri.ini", desc, vm), std::runtime_error);
}

TEST_CASE("validate")
{
   ResolverConfig config;
   CHECK_NOTHROW(validate(config));
   config.maxObjects = 1;
   CHECK_THROWS_AS(validate(config), std::runtime_error);
}
