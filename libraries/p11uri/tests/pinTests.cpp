#include <p11uri/errors.hpp>
#include <p11uri/pin.hpp>

#include "test_util.hpp"

#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>

using namespace p11uri;
using p11uri::test::errorOf;
using p11uri::test::FakeEnvironment;

namespace
{
   QueryAttributes pinQuery(std::optional<std::string> source, std::optional<std::string> value)
   {
      QueryAttributes result;
      result.pinSource = std::move(source);
      result.pinValue  = std::move(value);
      return result;
   }
}  // namespace

TEST_CASE("pin spec")
{
   CHECK(!pinSpec(QueryAttributes{}));

   auto literal = pinSpec(pinQuery({}, "1234"));
   REQUIRE(literal);
   REQUIRE(std::holds_alternative<PinLiteral>(*literal));
   CHECK(std::get<PinLiteral>(*literal).value.view() == "1234");

   auto env = pinSpec(pinQuery("env:TOKEN_PIN", {}));
   REQUIRE(env);
   REQUIRE(std::holds_alternative<PinEnv>(*env));
   CHECK(std::get<PinEnv>(*env).name == "TOKEN_PIN");

   auto file = pinSpec(pinQuery("file:/etc/token", {}));
   REQUIRE(file);
   REQUIRE(std::holds_alternative<PinFile>(*file));
   CHECK(std::get<PinFile>(*file).path == "/etc/token");

   auto relative = pinSpec(pinQuery("file:pin.txt", {}));
   REQUIRE(relative);
   CHECK(std::get<PinFile>(*relative).path == "pin.txt");

   auto fileUri = pinSpec(pinQuery("file:///etc/token", {}));
   REQUIRE(fileUri);
   CHECK(std::get<PinFile>(*fileUri).path == "/etc/token");

   auto localhost = pinSpec(pinQuery("file://localhost/etc/token", {}));
   REQUIRE(localhost);
   CHECK(std::get<PinFile>(*localhost).path == "/etc/token");
}

TEST_CASE("pin-value takes precedence over pin-source")
{
   auto spec = pinSpec(pinQuery("env:TOKEN_PIN", "1234"));
   REQUIRE(spec);
   CHECK(std::holds_alternative<PinLiteral>(*spec));
}

TEST_CASE("unsupported pin-source")
{
   for (auto source : {"|/usr/bin/pinentry", "http://example.com/pin", "env:", "file:", "PIN",
                       "ENV:PIN", "", "file://host/etc/pin", "file://", "file://localhost"})
   {
      INFO(source);
      CHECK(errorOf([&] { pinSpec(pinQuery(source, {})); }) ==
            resolve_error::unsupported_pin_source);
   }
}

TEST_CASE("resolve pin")
{
   FakeEnvironment env;
   env.vars["TOKEN_PIN"]   = "env-pin";
   env.files["/etc/token"] = "file-pin\n\t \r\n";
   env.files["/etc/inner"] = " in ner ";

   CHECK(resolvePin(PinLiteral{SecureString{"lit"}}, env).view() == "lit");
   CHECK(resolvePin(PinEnv{"TOKEN_PIN"}, env).view() == "env-pin");
   CHECK(resolvePin(PinFile{"/etc/token"}, env).view() == "file-pin");
   CHECK(resolvePin(PinFile{"/etc/inner"}, env).view() == " in ner");

   CHECK(errorOf([&] { resolvePin(PinEnv{"MISSING"}, env); }) == resolve_error::pin_unavailable);
   CHECK(errorOf([&] { resolvePin(PinFile{"/missing"}, env); }) ==
         resolve_error::pin_unavailable);
}

TEST_CASE("system environment")
{
   SystemEnvironment env;
   auto              path = std::filesystem::temp_directory_path() / "p11uri-pin-test";
   {
      std::ofstream out(path);
      out << "4321\n";
   }
   auto pin = env.readFile(path.string());
   std::filesystem::remove(path);
   REQUIRE(pin);
   CHECK(pin->view() == "4321\n");
   CHECK(!env.readFile(path.string()));
   CHECK(!env.getenv("P11URI_TEST_VARIABLE_THAT_IS_NOT_SET"));
}

TEST_CASE("SecureString")
{
   SecureString a{"secret"};
   SecureString b{std::move(a)};
   CHECK(b.view() == "secret");
   CHECK(a.empty());

   SecureString c;
   c = std::move(b);
   CHECK(c.view() == "secret");
   CHECK(b.empty());

   SecureString d{"pin \n"};
   d.trimTrailingWhitespace();
   CHECK(d.view() == "pin");
   d.wipe();
   CHECK(d.empty());
}
