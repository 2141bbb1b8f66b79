/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE JsonReaderTest
#include "utils/JsonReader.hpp"
#include <boost/test/unit_test.hpp>
#include <filesystem>
#include <fstream>
#include <limits>

using namespace Driftwood;

BOOST_AUTO_TEST_SUITE(JsonValueTests)

BOOST_AUTO_TEST_CASE(TestBasicTypes) {
  // Null
  JsonValue nullVal;
  BOOST_CHECK(nullVal.isNull());
  BOOST_CHECK_EQUAL(nullVal.getType(), JsonType::Null);
  BOOST_CHECK_EQUAL(nullVal.toString(), "null");

  // Boolean
  JsonValue trueVal(true);
  JsonValue falseVal(false);
  BOOST_CHECK(trueVal.isBool());
  BOOST_CHECK_EQUAL(trueVal.asBool(), true);
  BOOST_CHECK_EQUAL(falseVal.asBool(), false);
  BOOST_CHECK_EQUAL(trueVal.toString(), "true");
  BOOST_CHECK_EQUAL(falseVal.toString(), "false");

  // Number
  JsonValue intVal(42);
  JsonValue floatVal(0.25f);
  JsonValue doubleVal(3.14);
  BOOST_CHECK(intVal.isNumber());
  BOOST_CHECK_EQUAL(intVal.asInt(), 42);
  BOOST_CHECK_EQUAL(intVal.toString(), "42");
  BOOST_CHECK_CLOSE(floatVal.asFloat(), 0.25f, 0.001f);
  BOOST_CHECK_EQUAL(floatVal.toString(), "0.25");
  BOOST_CHECK_CLOSE(doubleVal.asNumber(), 3.14, 0.001);

  // String
  JsonValue stringVal("plank");
  BOOST_CHECK(stringVal.isString());
  BOOST_CHECK_EQUAL(stringVal.asString(), "plank");
  BOOST_CHECK_EQUAL(stringVal.toString(), "\"plank\"");
}

BOOST_AUTO_TEST_CASE(TestArrayOperations) {
  JsonArray arr;
  arr.push_back(JsonValue(1));
  arr.push_back(JsonValue("rope"));
  arr.push_back(JsonValue(true));

  JsonValue arrayVal(arr);
  BOOST_CHECK(arrayVal.isArray());
  BOOST_CHECK_EQUAL(arrayVal.size(), 3u);
  BOOST_CHECK_EQUAL(arrayVal[0].asInt(), 1);
  BOOST_CHECK_EQUAL(arrayVal[1].asString(), "rope");
  BOOST_CHECK_EQUAL(arrayVal[2].asBool(), true);

  // Out of range reads give null on a const value
  const JsonValue &constArray = arrayVal;
  BOOST_CHECK(constArray[10].isNull());

  // push turns a null value into an array
  JsonValue built;
  built.push(JsonValue(4));
  built.push(JsonValue(-2));
  BOOST_CHECK(built.isArray());
  BOOST_CHECK_EQUAL(built.toString(), "[4,-2]");
}

BOOST_AUTO_TEST_CASE(TestObjectOperations) {
  JsonObject obj;
  obj["id"] = JsonValue("foundation");
  obj["max_health"] = JsonValue(100);
  obj["walkable"] = JsonValue(true);

  JsonValue objectVal(obj);
  BOOST_CHECK(objectVal.isObject());
  BOOST_CHECK_EQUAL(objectVal.size(), 3u);
  BOOST_CHECK(objectVal.hasKey("id"));
  BOOST_CHECK(objectVal.hasKey("max_health"));
  BOOST_CHECK(!objectVal.hasKey("missing"));
  BOOST_CHECK_EQUAL(objectVal["id"].asString(), "foundation");
  BOOST_CHECK_EQUAL(objectVal["max_health"].asInt(), 100);
  BOOST_CHECK_EQUAL(objectVal["walkable"].asBool(), true);

  // Mutable key lookup turns a null value into an object
  JsonValue built;
  built["column"] = JsonValue(3);
  BOOST_CHECK(built.isObject());
  BOOST_CHECK_EQUAL(built["column"].asInt(), 3);
}

BOOST_AUTO_TEST_CASE(TestSafeAccessors) {
  JsonValue stringVal("test");
  JsonValue numberVal(42);

  // Valid conversions
  BOOST_CHECK(stringVal.tryAsString().has_value());
  BOOST_CHECK_EQUAL(stringVal.tryAsString().value(), "test");
  BOOST_CHECK(numberVal.tryAsInt().has_value());
  BOOST_CHECK_EQUAL(numberVal.tryAsInt().value(), 42);
  BOOST_CHECK(numberVal.tryAsFloat().has_value());

  // Invalid conversions
  BOOST_CHECK(!stringVal.tryAsInt().has_value());
  BOOST_CHECK(!stringVal.tryAsBool().has_value());
  BOOST_CHECK(!numberVal.tryAsString().has_value());
  BOOST_CHECK(numberVal.tryAsArray() == nullptr);
  BOOST_CHECK(numberVal.tryAsObject() == nullptr);

  // Throwing accessors
  BOOST_CHECK_THROW(stringVal.asNumber(), std::bad_variant_access);
  BOOST_CHECK_THROW(numberVal.asString(), std::bad_variant_access);
}

BOOST_AUTO_TEST_CASE(TestTypedLookupWithFallback) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse(
      R"({"seed": 7, "cell_size": 1.5, "realtime": false, "path": "saves"})"));
  const JsonValue &root = reader.getRoot();

  BOOST_CHECK_EQUAL(root.getInt("seed", 0), 7);
  BOOST_CHECK_CLOSE(root.getFloat("cell_size", 0.0f), 1.5f, 0.001f);
  BOOST_CHECK_EQUAL(root.getBool("realtime", true), false);
  BOOST_CHECK_EQUAL(root.getString("path", ""), "saves");

  // Missing keys
  BOOST_CHECK_EQUAL(root.getInt("missing", -1), -1);
  BOOST_CHECK_EQUAL(root.getString("missing", "fallback"), "fallback");

  // Mistyped keys
  BOOST_CHECK_EQUAL(root.getInt("path", 9), 9);
  BOOST_CHECK_EQUAL(root.getBool("seed", true), true);
  BOOST_CHECK_EQUAL(root.getString("cell_size", "x"), "x");

  // Lookup on a non-object
  JsonValue number(5);
  BOOST_CHECK_EQUAL(number.getInt("seed", 11), 11);
}

BOOST_AUTO_TEST_CASE(TestIntConversionOutOfRange) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse(
      R"({"x": 1e12, "y": -1e12, "z": 2147483647, "w": -2147483648})"));
  const JsonValue &root = reader.getRoot();

  // Values that do not fit an int take the fallback
  BOOST_CHECK(!root["x"].tryAsInt().has_value());
  BOOST_CHECK_EQUAL(root.getInt("x", 0), 0);
  BOOST_CHECK_EQUAL(root.getInt("y", 3), 3);

  // Range endpoints still convert
  BOOST_CHECK_EQUAL(root.getInt("z", 0), std::numeric_limits<int>::max());
  BOOST_CHECK_EQUAL(root.getInt("w", 0), std::numeric_limits<int>::min());

  // Non-finite numbers never convert
  JsonValue infinite(std::numeric_limits<double>::infinity());
  JsonValue notANumber(std::numeric_limits<double>::quiet_NaN());
  BOOST_CHECK(!infinite.tryAsInt().has_value());
  BOOST_CHECK(!notANumber.tryAsInt().has_value());

  // The throwing accessor saturates
  BOOST_CHECK_EQUAL(root["x"].asInt(), std::numeric_limits<int>::max());
  BOOST_CHECK_EQUAL(root["y"].asInt(), std::numeric_limits<int>::min());
  BOOST_CHECK_EQUAL(notANumber.asInt(), 0);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderTests)

BOOST_AUTO_TEST_CASE(TestSimpleParsing) {
  JsonReader reader;

  BOOST_CHECK(reader.parse("null"));
  BOOST_CHECK(reader.getRoot().isNull());

  BOOST_CHECK(reader.parse("true"));
  BOOST_CHECK_EQUAL(reader.getRoot().asBool(), true);

  BOOST_CHECK(reader.parse("false"));
  BOOST_CHECK_EQUAL(reader.getRoot().asBool(), false);

  BOOST_CHECK(reader.parse("42"));
  BOOST_CHECK_EQUAL(reader.getRoot().asInt(), 42);

  BOOST_CHECK(reader.parse("-3.5"));
  BOOST_CHECK_CLOSE(reader.getRoot().asNumber(), -3.5, 0.001);

  BOOST_CHECK(reader.parse("1.25e2"));
  BOOST_CHECK_CLOSE(reader.getRoot().asNumber(), 125.0, 0.001);

  BOOST_CHECK(reader.parse("\"hello world\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "hello world");
}

BOOST_AUTO_TEST_CASE(TestArrayParsing) {
  JsonReader reader;

  BOOST_CHECK(reader.parse("[]"));
  BOOST_CHECK(reader.getRoot().isArray());
  BOOST_CHECK_EQUAL(reader.getRoot().size(), 0u);

  BOOST_CHECK(reader.parse("[1, 2, 3]"));
  const JsonValue &root = reader.getRoot();
  BOOST_CHECK_EQUAL(root.size(), 3u);
  BOOST_CHECK_EQUAL(root[0].asInt(), 1);
  BOOST_CHECK_EQUAL(root[2].asInt(), 3);

  BOOST_CHECK(reader.parse(R"([1, "two", true, null])"));
  const JsonValue &mixed = reader.getRoot();
  BOOST_CHECK_EQUAL(mixed.size(), 4u);
  BOOST_CHECK_EQUAL(mixed[1].asString(), "two");
  BOOST_CHECK(mixed[3].isNull());
}

BOOST_AUTO_TEST_CASE(TestObjectParsing) {
  JsonReader reader;

  BOOST_CHECK(reader.parse("{}"));
  BOOST_CHECK(reader.getRoot().isObject());
  BOOST_CHECK_EQUAL(reader.getRoot().size(), 0u);

  BOOST_CHECK(reader.parse(R"({"id": "engine", "max_health": 150})"));
  const JsonValue &root = reader.getRoot();
  BOOST_CHECK_EQUAL(root.size(), 2u);
  BOOST_CHECK_EQUAL(root["id"].asString(), "engine");
  BOOST_CHECK_EQUAL(root["max_health"].asInt(), 150);
}

BOOST_AUTO_TEST_CASE(TestNestedStructures) {
  JsonReader reader;
  const std::string json = R"({
    "raft": {
      "heading": 0.5,
      "tiles": [
        {"item": "foundation", "column": 0, "row": 0},
        {"item": "engine", "column": 1, "row": 0}
      ]
    }
  })";

  BOOST_REQUIRE(reader.parse(json));
  const JsonValue &tiles = reader.getRoot()["raft"]["tiles"];
  BOOST_REQUIRE(tiles.isArray());
  BOOST_CHECK_EQUAL(tiles.size(), 2u);
  BOOST_CHECK_EQUAL(tiles[1]["item"].asString(), "engine");
  BOOST_CHECK_EQUAL(tiles[1]["column"].asInt(), 1);
  BOOST_CHECK_CLOSE(reader.getRoot()["raft"]["heading"].asNumber(), 0.5, 0.001);

  // Missing intermediate keys read as null
  BOOST_CHECK(reader.getRoot()["raft"]["missing"]["deeper"].isNull());
}

BOOST_AUTO_TEST_CASE(TestEscapeSequences) {
  JsonReader reader;

  BOOST_CHECK(reader.parse(R"("line\nbreak\ttab \"quoted\" back\\slash \/")"));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(),
                    "line\nbreak\ttab \"quoted\" back\\slash /");

  BOOST_CHECK(reader.parse(R"("A\u00e9")"));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "A\xC3\xA9");

  // Surrogate pair encodes one four-byte character
  BOOST_CHECK(reader.parse(R"("\ud83c\udf0a")"));
  BOOST_CHECK_EQUAL(reader.getRoot().asString().size(), 4u);

  // Escapes survive a write
  JsonValue text(std::string("a\"b\nc"));
  BOOST_CHECK_EQUAL(text.toString(), "\"a\\\"b\\nc\"");
}

BOOST_AUTO_TEST_CASE(TestWhitespaceHandling) {
  JsonReader reader;

  BOOST_CHECK(reader.parse("  \t\n  42  \r\n "));
  BOOST_CHECK_EQUAL(reader.getRoot().asInt(), 42);

  BOOST_CHECK(reader.parse("\n{\n  \"a\" :\t[ 1 ,2 ]\n}\n"));
  BOOST_CHECK_EQUAL(reader.getRoot()["a"].size(), 2u);
}

BOOST_AUTO_TEST_CASE(TestErrorHandling) {
  JsonReader reader;

  BOOST_CHECK(!reader.parse(""));
  BOOST_CHECK(!reader.getLastError().empty());

  BOOST_CHECK(!reader.parse("{"));
  BOOST_CHECK(!reader.parse("[1, 2"));
  BOOST_CHECK(!reader.parse(R"({"key" "value"})"));
  BOOST_CHECK(!reader.parse(R"({key: 1})"));
  BOOST_CHECK(!reader.parse("[1,]x"));
  BOOST_CHECK(!reader.parse("\"unterminated"));
  BOOST_CHECK(!reader.parse("\"bad \\q escape\""));
  BOOST_CHECK(!reader.parse("tru"));
  BOOST_CHECK(!reader.parse("01x"));
  BOOST_CHECK(!reader.parse("1."));
  BOOST_CHECK(!reader.parse("2e"));
  BOOST_CHECK(!reader.parse("-"));
  BOOST_CHECK(!reader.parse("1 2"));

  // A successful parse clears the previous error
  BOOST_CHECK(reader.parse("1"));
  BOOST_CHECK(reader.getLastError().empty());
}

BOOST_AUTO_TEST_CASE(TestErrorReportsLineAndColumn) {
  JsonReader reader;

  BOOST_CHECK(!reader.parse("{\n  \"deck\": 1,\n  \"rope\" 2\n}"));
  const std::string &error = reader.getLastError();
  BOOST_CHECK(error.find("Line 3") != std::string::npos);
  BOOST_CHECK(error.find("Column") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(TestNestingLimit) {
  JsonReader reader;
  std::string deep(300, '[');
  deep += std::string(300, ']');

  BOOST_CHECK(!reader.parse(deep));
  BOOST_CHECK(reader.getLastError().find("Nesting too deep") != std::string::npos);

  std::string shallow(100, '[');
  shallow += std::string(100, ']');
  BOOST_CHECK(reader.parse(shallow));
}

BOOST_AUTO_TEST_CASE(TestFileLoading) {
  const std::string testFile = "tests/test_data/json_reader_test.json";
  std::filesystem::create_directories("tests/test_data");
  {
    std::ofstream file(testFile);
    file << R"({"fallback_item": "foundation", "items": [{"id": "rudder"}]})";
  }

  JsonReader reader;
  BOOST_CHECK(reader.loadFromFile(testFile));
  BOOST_CHECK_EQUAL(reader.getRoot()["fallback_item"].asString(), "foundation");
  BOOST_CHECK_EQUAL(reader.getRoot()["items"][0]["id"].asString(), "rudder");

  std::error_code ec;
  std::filesystem::remove(testFile, ec);

  BOOST_CHECK(!reader.loadFromFile("tests/test_data/does_not_exist.json"));
  BOOST_CHECK(reader.getLastError().find("Could not open file") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonWriterTests)

BOOST_AUTO_TEST_CASE(TestCompactOutputSortsKeys) {
  JsonValue tile;
  tile["row"] = JsonValue(-1);
  tile["item"] = JsonValue("engine");
  tile["column"] = JsonValue(2);
  tile["health"] = JsonValue(37.5);

  BOOST_CHECK_EQUAL(tile.toString(),
                    R"({"column":2,"health":37.5,"item":"engine","row":-1})");
}

BOOST_AUTO_TEST_CASE(TestStyledOutput) {
  JsonValue doc;
  doc["version"] = JsonValue(1);
  doc["tiles"].push(JsonValue(1));
  doc["empty"] = JsonValue(JsonArray{});

  const std::string expected = "{\n"
                               "  \"empty\": [],\n"
                               "  \"tiles\": [\n"
                               "    1\n"
                               "  ],\n"
                               "  \"version\": 1\n"
                               "}\n";
  BOOST_CHECK_EQUAL(doc.toStyledString(), expected);
}

BOOST_AUTO_TEST_CASE(TestNonFiniteNumbersWriteAsNull) {
  JsonValue value(std::numeric_limits<double>::infinity());
  BOOST_CHECK_EQUAL(value.toString(), "null");
}

BOOST_AUTO_TEST_CASE(TestWrittenDocumentParsesBack) {
  JsonValue raft;
  raft["position"].push(JsonValue(1.5));
  raft["position"].push(JsonValue(0.3));
  raft["position"].push(JsonValue(-8.0));
  raft["name"] = JsonValue("Driftwood \"One\"");
  raft["anchored"] = JsonValue(false);

  JsonReader reader;
  BOOST_REQUIRE(reader.parse(raft.toStyledString()));
  const JsonValue &root = reader.getRoot();
  BOOST_CHECK_EQUAL(root["name"].asString(), "Driftwood \"One\"");
  BOOST_CHECK_EQUAL(root["anchored"].asBool(), false);
  BOOST_CHECK_CLOSE(root["position"][2].asNumber(), -8.0, 0.001);
  BOOST_CHECK_EQUAL(root.toString(), raft.toString());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(CatalogDocumentTests)

BOOST_AUTO_TEST_CASE(TestConstructionItemDocument) {
  JsonReader reader;
  const std::string json = R"({
    "fallback_item": "foundation",
    "items": [
      {
        "id": "foundation",
        "name": "Foundation",
        "category": "Foundation",
        "footprint": [1, 1],
        "walkable": true,
        "max_health": 100,
        "cost": {"plank": 4, "rope": 1}
      },
      {
        "id": "engine",
        "name": "Engine",
        "category": "Engine",
        "footprint": [1, 1],
        "walkable": false,
        "max_health": 150,
        "cost": {"plank": 6, "scrap": 8}
      }
    ]
  })";

  BOOST_REQUIRE(reader.parse(json));
  const JsonValue &root = reader.getRoot();
  BOOST_CHECK_EQUAL(root.getString("fallback_item", ""), "foundation");

  const JsonArray *items = root["items"].tryAsArray();
  BOOST_REQUIRE(items != nullptr);
  BOOST_REQUIRE_EQUAL(items->size(), 2u);

  const JsonValue &engine = (*items)[1];
  BOOST_CHECK_EQUAL(engine.getString("category", ""), "Engine");
  BOOST_CHECK_EQUAL(engine.getBool("walkable", true), false);
  BOOST_CHECK_EQUAL(engine["footprint"][0].asInt(), 1);

  const JsonObject *cost = engine["cost"].tryAsObject();
  BOOST_REQUIRE(cost != nullptr);
  int total = 0;
  for (const auto &[resource, amount] : *cost) {
    BOOST_CHECK(!resource.empty());
    total += amount.asInt();
  }
  BOOST_CHECK_EQUAL(total, 14);
}

BOOST_AUTO_TEST_SUITE_END()
