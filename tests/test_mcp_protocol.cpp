#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include "mcp_protocol.h"

using namespace ftr::server;
using json = nlohmann::json;

TEST_CASE("parse_request reads a full request", "[mcp][protocol]") {
  const auto request = parse_request(
      R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"list_disputes"}})");
  REQUIRE(request.has_value());
  CHECK(request->jsonrpc == "2.0");
  REQUIRE(request->id.has_value());
  CHECK(*request->id == 7);
  CHECK(request->method == "tools/call");
  CHECK(request->params["name"] == "list_disputes");
  CHECK_FALSE(request->is_notification());
}

TEST_CASE("parse_request keeps string ids as sent", "[mcp][protocol]") {
  const auto request = parse_request(R"({"jsonrpc":"2.0","id":"abc-1","method":"initialize"})");
  REQUIRE(request.has_value());
  REQUIRE(request->id.has_value());
  CHECK(request->id->is_string());
  CHECK(*request->id == "abc-1");
  CHECK(request->params.is_object());
  CHECK(request->params.empty());
}

TEST_CASE("parse_request treats a missing id as a notification", "[mcp][protocol]") {
  const auto request = parse_request(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
  REQUIRE(request.has_value());
  CHECK(request->is_notification());
}

TEST_CASE("parse_request rejects malformed input", "[mcp][protocol]") {
  CHECK_FALSE(parse_request("{not json").has_value());
  CHECK_FALSE(parse_request("[1,2,3]").has_value());
  CHECK_FALSE(parse_request("").has_value());
}

TEST_CASE("make_response echoes the id", "[mcp][protocol]") {
  const json response = json::parse(make_response(json("req-9"), {{"ok", true}}));
  CHECK(response["jsonrpc"] == "2.0");
  CHECK(response["id"] == "req-9");
  CHECK(response["result"]["ok"] == true);
  CHECK_FALSE(response.contains("error"));
}

TEST_CASE("make_error_response carries code, message and data", "[mcp][protocol]") {
  const json response = json::parse(
      make_error_response(json(3), kMethodNotFound, "Unknown method: nope", {{"hint", "x"}}));
  CHECK(response["id"] == 3);
  CHECK(response["error"]["code"] == kMethodNotFound);
  CHECK(response["error"]["message"] == "Unknown method: nope");
  CHECK(response["error"]["data"]["hint"] == "x");

  const json no_id = json::parse(make_error_response(std::nullopt, kParseError, "Invalid JSON"));
  CHECK(no_id["id"].is_null());
  CHECK(no_id["error"]["data"].is_object());
}
