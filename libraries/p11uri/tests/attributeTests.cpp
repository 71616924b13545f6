#include <p11uri/attributes.hpp>
#include <p11uri/errors.hpp>

#include "test_util.hpp"

#include <catch2/catch.hpp>

using namespace p11uri;
using p11uri::test::errorOf;

TEST_CASE("slot id")
{
   CHECK(parseSlotId("0") == 0ul);
   CHECK(parseSlotId("42") == 42ul);
   CHECK(!parseSlotId(""));
   CHECK(!parseSlotId("4a"));
   CHECK(!parseSlotId("-1"));
   CHECK(!parseSlotId("+1"));
   CHECK(!parseSlotId("0x10"));
   CHECK(!parseSlotId(" 1"));
   CHECK(!parseSlotId("123456789012345678901234567890"));
}

TEST_CASE("version")
{
   CHECK(parseVersion("3") == Version{3, 0});
   CHECK(parseVersion("3.1") == Version{3, 1});
   CHECK(parseVersion("0.255") == Version{0, 255});
   CHECK(!parseVersion("3.1.2"));
   CHECK(!parseVersion("256"));
   CHECK(!parseVersion(""));
   CHECK(!parseVersion("."));
   CHECK(!parseVersion("3."));
   CHECK(!parseVersion(".1"));
   CHECK(!parseVersion("v3"));
}

TEST_CASE("serial")
{
   SerialNumber expected;
   expected.fill(' ');
   expected[0] = 'X';
   CHECK(parseSerial("X") == expected);
   CHECK(parseSerial("%58") == expected);

   expected.fill(' ');
   CHECK(parseSerial("") == expected);

   auto full = parseSerial("0123456789abcdef");
   REQUIRE(full);
   CHECK(std::string(full->begin(), full->end()) == "0123456789abcdef");

   CHECK(!parseSerial("0123456789abcdefg"));
   CHECK(!parseSerial("%00%00%00%00%00%00%00%00%00%00%00%00%00%00%00%00%00"));
   CHECK(padSerial("DECC0401648") == *parseSerial("DECC0401648"));
}

TEST_CASE("object class")
{
   CHECK(parseObjectClass("cert") == ObjectClass::Certificate);
   CHECK(parseObjectClass("data") == ObjectClass::Data);
   CHECK(parseObjectClass("private") == ObjectClass::PrivateKey);
   CHECK(parseObjectClass("public") == ObjectClass::PublicKey);
   CHECK(parseObjectClass("secret-key") == ObjectClass::SecretKey);
   CHECK(!parseObjectClass("Private"));
   CHECK(!parseObjectClass("secret"));
   CHECK(!parseObjectClass(""));
   for (auto c : {ObjectClass::Certificate, ObjectClass::Data, ObjectClass::PrivateKey,
                  ObjectClass::PublicKey, ObjectClass::SecretKey})
   {
      CHECK(parseObjectClass(to_string(c)) == c);
   }
}

TEST_CASE("path attributes")
{
   auto attrs = parsePathAttributes(
       "library-description=Soft%20HSM;library-manufacturer=Example;library-version=2.6;"
       "slot-description=Slot%200;slot-id=7;slot-manufacturer=Example;manufacturer=ACME;"
       "model=M1;token=Alpha;serial=123;type=cert;id=%01%02;object=my%3Bkey");
   CHECK(attrs.libraryDescription == "Soft HSM");
   CHECK(attrs.libraryManufacturer == "Example");
   CHECK(attrs.libraryVersion == Version{2, 6});
   CHECK(attrs.slotDescription == "Slot 0");
   CHECK(attrs.slotId == 7ul);
   CHECK(attrs.slotManufacturer == "Example");
   CHECK(attrs.manufacturer == "ACME");
   CHECK(attrs.model == "M1");
   CHECK(attrs.token == "Alpha");
   CHECK(attrs.serial == padSerial("123"));
   CHECK(attrs.type == ObjectClass::Certificate);
   CHECK(attrs.id == std::vector<unsigned char>{1, 2});
   CHECK(attrs.object == "my;key");
}

TEST_CASE("empty attribute list")
{
   CHECK(parsePathAttributes("") == PathAttributes{});
   CHECK(parseQueryAttributes("") == QueryAttributes{});
}

TEST_CASE("value may contain =")
{
   CHECK(parsePathAttributes("object=a=b").object == "a=b");
   CHECK(parsePathAttributes("object=").object == "");
}

TEST_CASE("query attributes")
{
   auto attrs = parseQueryAttributes(
       "pin-source=file:/etc/token&pin-value=12%2034&module-name=softhsm2&module-path=/usr/"
       "lib/softhsm/libsofthsm2.so");
   CHECK(attrs.pinSource == "file:/etc/token");
   CHECK(attrs.pinValue == "12 34");
   CHECK(attrs.moduleName == "softhsm2");
   CHECK(attrs.modulePath == "/usr/lib/softhsm/libsofthsm2.so");
}

TEST_CASE("duplicate attributes")
{
   CHECK(errorOf([] { parsePathAttributes("object=a;object=b"); }) ==
         parse_error::duplicate_attribute);
   CHECK(errorOf([] { parsePathAttributes("object=a;object=a"); }) ==
         parse_error::duplicate_attribute);
   CHECK(errorOf([] { parsePathAttributes("slot-id=1;type=cert;slot-id=1"); }) ==
         parse_error::duplicate_attribute);
   CHECK(errorOf([] { parseQueryAttributes("pin-value=1&pin-value=2"); }) ==
         parse_error::duplicate_attribute);
   // The value is checked before the duplicate
   CHECK(errorOf([] { parsePathAttributes("type=cert;type=bogus"); }) ==
         parse_error::invalid_value);
}

TEST_CASE("unknown attributes")
{
   for (auto input : {"x-vendor=1", "x-vendor=1;object=a", "object=a;x-vendor=1",
                      "object=a;x-vendor=1;type=cert", "Object=a", "=a"})
   {
      INFO(input);
      CHECK(errorOf([&] { parsePathAttributes(input); }) == parse_error::unknown_attribute);
   }
   for (auto input : {"x-vendor=1", "pin-value=1&x-vendor=1", "x-vendor=1&pin-value=1"})
   {
      INFO(input);
      CHECK(errorOf([&] { parseQueryAttributes(input); }) == parse_error::unknown_attribute);
   }
   // query keys are not path keys and vice versa
   CHECK(errorOf([] { parsePathAttributes("pin-value=1"); }) == parse_error::unknown_attribute);
   CHECK(errorOf([] { parseQueryAttributes("object=a"); }) == parse_error::unknown_attribute);
}

TEST_CASE("malformed attributes")
{
   for (auto input : {"object", "object=a;", ";object=a", "object=a;;type=cert", ";"})
   {
      INFO(input);
      CHECK(errorOf([&] { parsePathAttributes(input); }) == parse_error::malformed_attribute);
   }
   CHECK(errorOf([] { parseQueryAttributes("pin-value=1&"); }) ==
         parse_error::malformed_attribute);
}

TEST_CASE("invalid values")
{
   try
   {
      parsePathAttributes("object=a;library-version=1.2.3");
      FAIL("expected ParseError");
   }
   catch (ParseError& e)
   {
      CHECK(e.code() == parse_error::invalid_value);
      CHECK(e.key() == "library-version");
      CHECK(e.rawValue() == "1.2.3");
   }
   CHECK(errorOf([] { parsePathAttributes("slot-id=abc"); }) == parse_error::invalid_value);
   CHECK(errorOf([] { parsePathAttributes("type=key"); }) == parse_error::invalid_value);
   CHECK(errorOf([] { parsePathAttributes("serial=01234567890123456"); }) ==
         parse_error::invalid_value);
   CHECK(errorOf([] { parsePathAttributes("object=%FF"); }) == parse_error::invalid_value);
   CHECK(errorOf([] { parseQueryAttributes("pin-source=%C3"); }) == parse_error::invalid_value);
   // id is binary
   CHECK(parsePathAttributes("id=%FF").id == std::vector<unsigned char>{0xff});
}
