#include "core/json_utils.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

TEST_CASE("JsonWriter pretty output matches indent-2 layout", "[core][json]") {
  netstack::core::JsonWriter out;
  out.BeginObject()
      .StringField("VpcId", "vpc-1")
      .Key("Tags")
      .BeginArray()
      .EndArray()
      .Key("State")
      .BeginObject()
      .EndObject()
      .BoolField("Main", true)
      .UIntField("Count", 3)
      .EndObject();

  REQUIRE(out.str() == "{\n"
                       "  \"VpcId\": \"vpc-1\",\n"
                       "  \"Tags\": [],\n"
                       "  \"State\": {},\n"
                       "  \"Main\": true,\n"
                       "  \"Count\": 3\n"
                       "}");
}

TEST_CASE("JsonWriter nests arrays of objects", "[core][json]") {
  netstack::core::JsonWriter out;
  out.BeginObject().Key("Subnets").BeginArray();
  out.BeginObject().StringField("SubnetId", "subnet-a").EndObject();
  out.BeginObject().StringField("SubnetId", "subnet-b").EndObject();
  out.EndArray().EndObject();

  REQUIRE(out.str() == "{\n"
                       "  \"Subnets\": [\n"
                       "    {\n"
                       "      \"SubnetId\": \"subnet-a\"\n"
                       "    },\n"
                       "    {\n"
                       "      \"SubnetId\": \"subnet-b\"\n"
                       "    }\n"
                       "  ]\n"
                       "}");
}

TEST_CASE("JsonWriter compact mode emits a single line", "[core][json]") {
  netstack::core::JsonWriter out(0);
  out.BeginObject()
      .StringArrayField("ids", {"i-1", "i-2"})
      .IntField("delta", -4)
      .Key("vpc_id")
      .Null()
      .EndObject();

  REQUIRE(out.str() == R"({"ids":["i-1","i-2"],"delta":-4,"vpc_id":null})");
}

TEST_CASE("EscapeJson escapes quotes, backslashes and control characters", "[core][json]") {
  REQUIRE(netstack::core::EscapeJson("plain") == "plain");
  REQUIRE(netstack::core::EscapeJson("a\"b") == "a\\\"b");
  REQUIRE(netstack::core::EscapeJson("C:\\dir") == "C:\\\\dir");
  REQUIRE(netstack::core::EscapeJson("#!/bin/bash\nyum update -y") ==
          "#!/bin/bash\\nyum update -y");
  REQUIRE(netstack::core::EscapeJson(std::string("\x01", 1)) == "\\u0001");
}
