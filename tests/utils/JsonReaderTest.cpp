/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE JsonReaderTest
#include "utils/JsonReader.hpp"
#include <boost/test/unit_test.hpp>
#include <filesystem>
#include <fstream>
#include <string>

using namespace CosmicEngine;

BOOST_AUTO_TEST_SUITE(JsonValueTests)

BOOST_AUTO_TEST_CASE(TestBasicTypes) {
  JsonValue nullVal;
  BOOST_CHECK(nullVal.isNull());
  BOOST_CHECK_EQUAL(nullVal.size(), 0u);

  JsonValue trueVal(true);
  BOOST_CHECK(trueVal.isBool());
  BOOST_CHECK_EQUAL(trueVal.asBool(), true);

  JsonValue number(3.14);
  BOOST_CHECK(number.isNumber());
  BOOST_CHECK_CLOSE(number.asNumber(), 3.14, 0.001);

  JsonValue text(std::string("hello"));
  BOOST_CHECK(text.isString());
  BOOST_CHECK_EQUAL(text.asString(), "hello");
}

BOOST_AUTO_TEST_CASE(TestContainerAccess) {
  JsonArray arr;
  arr.push_back(JsonValue(1.0));
  arr.push_back(JsonValue(std::string("test")));
  JsonValue arrayVal(arr);
  BOOST_CHECK(arrayVal.isArray());
  BOOST_CHECK_EQUAL(arrayVal.size(), 2u);
  BOOST_CHECK_EQUAL(arrayVal[0].asNumber(), 1.0);
  BOOST_CHECK_EQUAL(arrayVal[1].asString(), "test");
  BOOST_CHECK(arrayVal[5].isNull());

  JsonObject obj;
  obj["name"] = JsonValue(std::string("crate"));
  obj["mass"] = JsonValue(2.5);
  JsonValue objectVal(obj);
  BOOST_CHECK(objectVal.isObject());
  BOOST_CHECK(objectVal.hasKey("name"));
  BOOST_CHECK(!objectVal.hasKey("missing"));
  BOOST_CHECK_EQUAL(objectVal["mass"].asNumber(), 2.5);
  BOOST_CHECK(objectVal["missing"].isNull());
  BOOST_CHECK(objectVal["missing"]["deeper"].isNull());
}

BOOST_AUTO_TEST_CASE(TestSafeAccessors) {
  JsonValue number(7.0);
  BOOST_CHECK(number.tryAsNumber().has_value());
  BOOST_CHECK(!number.tryAsBool().has_value());
  BOOST_CHECK(!number.tryAsString().has_value());
  BOOST_CHECK(number.tryAsObject() == nullptr);

  JsonValue text(std::string("x"));
  BOOST_CHECK_EQUAL(*text.tryAsString(), "x");
  BOOST_CHECK_THROW(text.asNumber(), std::bad_variant_access);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderParsingTests)

BOOST_AUTO_TEST_CASE(TestBasicParsing) {
  JsonReader reader;

  BOOST_REQUIRE(reader.parse("null"));
  BOOST_CHECK(reader.getRoot().isNull());

  BOOST_REQUIRE(reader.parse("false"));
  BOOST_CHECK_EQUAL(reader.getRoot().asBool(), false);

  BOOST_REQUIRE(reader.parse("-12.5e1"));
  BOOST_CHECK_CLOSE(reader.getRoot().asNumber(), -125.0, 0.001);

  BOOST_REQUIRE(reader.parse("0"));
  BOOST_CHECK_EQUAL(reader.getRoot().asNumber(), 0.0);

  BOOST_REQUIRE(reader.parse("\"plain\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "plain");
  BOOST_CHECK(reader.getLastError().empty());
}

BOOST_AUTO_TEST_CASE(TestStringEscapes) {
  JsonReader reader;

  BOOST_REQUIRE(reader.parse(R"("a\"b\\c\/d\n\t")"));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "a\"b\\c/d\n\t");

  BOOST_REQUIRE(reader.parse(R"("\u00e9")"));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "\xC3\xA9");

  // U+1F600 as a surrogate pair
  BOOST_REQUIRE(reader.parse(R"("\ud83d\ude00")"));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "\xF0\x9F\x98\x80");
}

BOOST_AUTO_TEST_CASE(TestNestedStructures) {
  JsonReader reader;
  const std::string json = R"({
    "collision": {
      "cellSize": 32,
      "layers": ["player", "enemy", "wall"],
      "debug": { "enabled": true, "color": null }
    },
    "empty": {},
    "none": []
  })";

  BOOST_REQUIRE(reader.parse(json));
  const JsonValue &root = reader.getRoot();
  BOOST_CHECK_EQUAL(root.size(), 3u);
  BOOST_CHECK_EQUAL(root["collision"]["cellSize"].asNumber(), 32.0);
  BOOST_CHECK_EQUAL(root["collision"]["layers"].size(), 3u);
  BOOST_CHECK_EQUAL(root["collision"]["layers"][2].asString(), "wall");
  BOOST_CHECK(root["collision"]["debug"]["enabled"].asBool());
  BOOST_CHECK(root["collision"]["debug"]["color"].isNull());
  BOOST_CHECK(root["empty"].isObject());
  BOOST_CHECK_EQUAL(root["none"].size(), 0u);
}

BOOST_AUTO_TEST_CASE(TestDuplicateKeysLastWins) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse(R"({"a": 1, "a": 2})"));
  BOOST_CHECK_EQUAL(reader.getRoot()["a"].asNumber(), 2.0);
  BOOST_CHECK_EQUAL(reader.getRoot().size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestWhitespace) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse(" \t\r\n[ 1 ,\n 2 ] \n"));
  BOOST_CHECK_EQUAL(reader.getRoot().size(), 2u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderErrorTests)

BOOST_AUTO_TEST_CASE(TestInvalidJSON) {
  JsonReader reader;

  BOOST_CHECK(!reader.parse(""));
  BOOST_CHECK(reader.getLastError().find("Empty JSON input") != std::string::npos);

  BOOST_CHECK(!reader.parse("   "));
  BOOST_CHECK(!reader.parse("{"));
  BOOST_CHECK(!reader.parse("[1, 2"));
  BOOST_CHECK(!reader.parse("\"unterminated"));
  BOOST_CHECK(!reader.parse("tru"));
  BOOST_CHECK(!reader.parse("01"));
  BOOST_CHECK(!reader.parse("1."));
  BOOST_CHECK(!reader.parse("1e"));
  BOOST_CHECK(!reader.parse("1e999"));
}

BOOST_AUTO_TEST_CASE(TestMalformedStructures) {
  JsonReader reader;

  BOOST_CHECK(!reader.parse("[1, 2,]"));
  BOOST_CHECK(!reader.parse(R"({"a": 1,})"));
  BOOST_CHECK(!reader.parse(R"({"a" 1})"));
  BOOST_CHECK(!reader.parse(R"({a: 1})"));
  BOOST_CHECK(!reader.parse("{} {}"));
  BOOST_CHECK(!reader.parse(R"("bad \q escape")"));
  BOOST_CHECK(!reader.parse("\"tab\there\""));
}

BOOST_AUTO_TEST_CASE(TestErrorReportsPosition) {
  JsonReader reader;
  BOOST_CHECK(!reader.parse("{\n  \"a\": @\n}"));
  BOOST_CHECK(reader.getLastError().find("line 2") != std::string::npos);
  BOOST_CHECK(reader.getLastError().find("column 8") != std::string::npos);
  BOOST_CHECK(reader.getRoot().isNull());
}

BOOST_AUTO_TEST_CASE(TestNestingLimit) {
  JsonReader reader;
  const std::string deep = std::string(200, '[') + std::string(200, ']');
  BOOST_CHECK(!reader.parse(deep));

  const std::string shallow = std::string(10, '[') + std::string(10, ']');
  BOOST_CHECK(reader.parse(shallow));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderFileTests)

BOOST_AUTO_TEST_CASE(TestFileLoading) {
  const std::filesystem::path path =
      std::filesystem::temp_directory_path() / "cosmic_json_reader_test.json";
  {
    std::ofstream file(path);
    file << R"({"collision": {"cellSize": 48}})";
  }

  JsonReader reader;
  BOOST_REQUIRE(reader.loadFromFile(path.string()));
  BOOST_CHECK_EQUAL(reader.getRoot()["collision"]["cellSize"].asNumber(), 48.0);

  std::filesystem::remove(path);
}

BOOST_AUTO_TEST_CASE(TestNonExistentFile) {
  JsonReader reader;
  BOOST_CHECK(!reader.loadFromFile("does_not_exist_12345.json"));
  BOOST_CHECK(reader.getLastError().find("Could not open file") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
