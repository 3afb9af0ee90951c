#include <algorithm>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <hiredis/hiredis.h>
#include <nlohmann/json.hpp>

#include "mcp/jsonrpc.hpp"
#include "mcp/server.hpp"
#include "mcp/tools.hpp"
#include "model/reading.hpp"
#include "sinks/csv_log.hpp"

using kth::mcp::Server;
using kth::mcp::ToolSettings;
using kth::mcp::build_tool_registry;
using kth::mcp::parse_request;
using kth::mcp::parse_window_ms;
using kth_logger::model::Reading;
using kth_logger::sinks::CsvLogSink;

namespace {

constexpr std::int64_t kBase = 1'700'000'000'000'000;
constexpr std::int64_t kSecond = 1'000'000;

struct RedisMockState {
  std::vector<std::string> commands{};
};

RedisMockState g_redis_mock{};

redisReply* make_reply(int type) {
  auto* reply = static_cast<redisReply*>(std::calloc(1, sizeof(redisReply)));
  reply->type = type;
  return reply;
}

redisReply* make_string_reply(const char* text) {
  auto* reply = make_reply(REDIS_REPLY_STRING);
  reply->len = std::strlen(text);
  reply->str = static_cast<char*>(std::calloc(reply->len + 1, 1));
  std::memcpy(reply->str, text, reply->len);
  return reply;
}

redisReply* make_array_reply(std::size_t elements) {
  auto* reply = make_reply(REDIS_REPLY_ARRAY);
  reply->elements = elements;
  reply->element = static_cast<redisReply**>(std::calloc(elements == 0 ? 1 : elements, sizeof(redisReply*)));
  return reply;
}

// Two samples per key: 1000 -> 20.5 and 2000 -> 21.5.
redisReply* make_range_reply() {
  auto* range = make_array_reply(2);
  const char* values[] = {"20.5", "21.5"};
  for (std::size_t i = 0; i < 2; ++i) {
    auto* sample = make_array_reply(2);
    sample->element[0] = make_reply(REDIS_REPLY_INTEGER);
    sample->element[0]->integer = static_cast<long long>((i + 1) * 1000);
    sample->element[1] = make_string_reply(values[i]);
    range->element[i] = sample;
  }
  return range;
}

extern "C" {

redisContext* redisConnectWithTimeout(const char*, int, const struct timeval) {
  auto* context = static_cast<redisContext*>(std::calloc(1, sizeof(redisContext)));
  context->err = REDIS_OK;
  return context;
}

redisContext* redisConnectUnixWithTimeout(const char*, const struct timeval) {
  auto* context = static_cast<redisContext*>(std::calloc(1, sizeof(redisContext)));
  context->err = REDIS_OK;
  return context;
}

void redisFree(redisContext* c) { std::free(c); }

void* redisvCommand(redisContext*, const char* format, va_list ap) {
  char buffer[256]{};
  std::vsnprintf(buffer, sizeof(buffer), format, ap);
  g_redis_mock.commands.emplace_back(buffer);
  if (std::strncmp(buffer, "TS.RANGE", 8) == 0) {
    return make_range_reply();
  }
  return make_reply(REDIS_REPLY_STATUS);
}

void* redisCommand(redisContext*, const char*, ...) { return make_reply(REDIS_REPLY_STATUS); }

void* redisCommandArgv(redisContext*, int, const char**, const size_t*) { return make_reply(REDIS_REPLY_STATUS); }

void freeReplyObject(void* reply) {
  auto* r = static_cast<redisReply*>(reply);
  if (r == nullptr) {
    return;
  }
  for (std::size_t i = 0; i < r->elements; ++i) {
    freeReplyObject(r->element[i]);
  }
  std::free(r->element);
  std::free(r->str);
  std::free(r);
}

}  // extern "C"

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

std::filesystem::path write_sample_log(const std::string& name) {
  const auto path = std::filesystem::temp_directory_path() / name;
  std::filesystem::remove(path);
  CsvLogSink sink(path.string());
  sink.append({Reading{kBase, "TC1", "T", 20.0}, Reading{kBase, "TC2", "T", 28.0}});
  sink.append({Reading{kBase + (10 * kSecond), "TC1", "T", 22.0}});
  sink.append({Reading{kBase + (20 * kSecond), "TC1", "T", 24.0}, Reading{kBase + (20 * kSecond), "TC2", "T", 30.0},
               Reading{kBase + (20 * kSecond), "VDD", "uV", 3300000.0}});
  return path;
}

nlohmann::json call(const Server& server, const std::string& line) {
  std::ostringstream err;
  return server.handle_line(line, err);
}

nlohmann::json call_tool(const Server& server, const std::string& name, const nlohmann::json& arguments) {
  const nlohmann::json request{{"jsonrpc", "2.0"},
                               {"id", 7},
                               {"method", "tools/call"},
                               {"params", {{"name", name}, {"arguments", arguments}}}};
  return call(server, request.dump());
}

int test_parse_window_ms() {
  if (parse_window_ms("250ms") != 250 || parse_window_ms("30s") != 30'000 || parse_window_ms("5m") != 300'000 ||
      parse_window_ms("2h") != 7'200'000 || parse_window_ms("42") != 42) {
    return fail("test_parse_window_ms", "window suffixes mismatch");
  }

  if (parse_window_ms("2562047788h") != 9'223'372'036'800'000) {
    return fail("test_parse_window_ms", "largest hour window mismatch");
  }

  for (const char* bad : {"", "s", "10d", "-5s", "1.5s", "10000000000000m", "2562047789h", "9223372036854776ms",
                          "99999999999999999999999s"}) {
    bool threw = false;
    try {
      (void)parse_window_ms(bad);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    if (!threw) {
      return fail("test_parse_window_ms", "malformed window should throw");
    }
  }
  return 0;
}

int test_jsonrpc_envelope_validation() {
  const auto parsed = parse_request(nlohmann::json::parse(R"({"jsonrpc":"2.0","id":"a","method":"ping"})"));
  if (parsed.method != "ping" || parsed.is_notification() || !parsed.params.is_object()) {
    return fail("test_jsonrpc_envelope_validation", "valid request mismatch");
  }

  for (const char* bad : {R"([1,2])", R"({"jsonrpc":"1.0","method":"ping"})", R"({"jsonrpc":"2.0","method":""})",
                          R"({"jsonrpc":"2.0","method":"ping","params":[1]})",
                          R"({"jsonrpc":"2.0","method":"ping","id":1.5})", R"({"jsonrpc":2,"method":"ping","id":1})",
                          R"({"method":"ping","id":1})"}) {
    bool threw = false;
    try {
      (void)parse_request(nlohmann::json::parse(bad));
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    if (!threw) {
      return fail("test_jsonrpc_envelope_validation", "malformed envelope should throw");
    }
  }
  return 0;
}

int test_server_protocol_methods() {
  const Server server(build_tool_registry(ToolSettings{}));

  auto init = call(server, R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})");
  if (init["result"]["serverInfo"]["name"] != "kth-logger-mcp") {
    return fail("test_server_protocol_methods", "initialize should name the server");
  }

  auto tools = call(server, R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})");
  if (tools["result"]["tools"].size() != 3) {
    return fail("test_server_protocol_methods", "expected three tools");
  }

  auto unknown = call(server, R"({"jsonrpc":"2.0","id":3,"method":"metrics/everything"})");
  if (unknown["error"]["code"] != kth::mcp::kMethodNotFound || unknown["id"] != 3) {
    return fail("test_server_protocol_methods", "unknown method should be -32601");
  }

  auto numeric_version = call(server, R"({"jsonrpc":2,"id":4,"method":"ping"})");
  if (numeric_version["error"]["code"] != kth::mcp::kInvalidRequest) {
    return fail("test_server_protocol_methods", "non-string jsonrpc should be -32600");
  }

  auto garbage = call(server, "{not json");
  if (garbage["error"]["code"] != kth::mcp::kParseError || !garbage["id"].is_null()) {
    return fail("test_server_protocol_methods", "unparsable line should be -32700");
  }

  if (!call(server, R"({"jsonrpc":"2.0","method":"notifications/initialized"})").is_null()) {
    return fail("test_server_protocol_methods", "notifications get no response");
  }

  auto registers =
      call(server, R"({"jsonrpc":"2.0","id":4,"method":"resources/read","params":{"uri":"kth://registers"}})");
  auto table = nlohmann::json::parse(registers["result"]["contents"][0]["text"].get<std::string>());
  if (table["registers"].size() != 5 || table["registers"][2]["id"] != "VDD" || table["registers"][2]["width"] != 4) {
    return fail("test_server_protocol_methods", "register resource mismatch");
  }

  auto bad_uri =
      call(server, R"({"jsonrpc":"2.0","id":5,"method":"resources/read","params":{"uri":"kth://nope"}})");
  if (bad_uri["error"]["code"] != kth::mcp::kInvalidParams) {
    return fail("test_server_protocol_methods", "unknown resource should be -32602");
  }

  std::istringstream in(R"({"jsonrpc":"2.0","id":1,"method":"ping"})"
                        "\n\n"
                        R"({"jsonrpc":"2.0","method":"notifications/initialized"})"
                        "\n");
  std::ostringstream out;
  std::ostringstream err;
  const int rc = server.run(in, out, err);
  const std::string written = out.str();
  if (rc != 0 || std::count(written.begin(), written.end(), '\n') != 1) {
    return fail("test_server_protocol_methods", "run should answer one line per request");
  }

  return 0;
}

int test_readings_latest_and_summary() {
  const auto path = write_sample_log("kth_logger_mcp_tools.csv");
  ToolSettings settings;
  settings.csv_path = path.string();
  const Server server(build_tool_registry(settings));

  auto latest = call_tool(server, "readings.latest", nlohmann::json::object());
  const auto& readings = latest["result"]["structuredContent"]["readings"];
  if (readings.size() != 3 || readings[0]["id"] != "TC1" || readings[0]["value"] != 24.0 ||
      readings[0]["timestamp"] != "2023-11-14T22:13:40.000000Z") {
    std::filesystem::remove(path);
    return fail("test_readings_latest_and_summary", "latest reading per sensor mismatch");
  }

  auto summary = call_tool(server, "readings.summary", {{"window", "15s"}});
  const auto& series = summary["result"]["structuredContent"]["series"];
  if (series.size() != 3 || series[0]["id"] != "TC1" || series[0]["count"] != 2 || series[0]["min"] != 22.0 ||
      series[0]["max"] != 24.0 || series[0]["avg"] != 23.0) {
    std::filesystem::remove(path);
    return fail("test_readings_latest_and_summary", "window should end at the newest logged reading");
  }

  auto filtered =
      call_tool(server, "readings.summary", {{"window", "1h"}, {"sensors", nlohmann::json::array({"TC2"})}});
  const auto& tc2 = filtered["result"]["structuredContent"]["series"];
  if (tc2.size() != 1 || tc2[0]["count"] != 2 || tc2[0]["avg"] != 29.0 || tc2[0]["unit"] != "T") {
    std::filesystem::remove(path);
    return fail("test_readings_latest_and_summary", "sensor filter mismatch");
  }

  auto bad_sensor =
      call_tool(server, "readings.summary", {{"window", "1h"}, {"sensors", nlohmann::json::array({"TC9"})}});
  auto missing_window = call_tool(server, "readings.summary", nlohmann::json::object());
  std::filesystem::remove(path);
  if (bad_sensor["error"]["code"] != kth::mcp::kInvalidParams ||
      missing_window["error"]["code"] != kth::mcp::kInvalidParams) {
    return fail("test_readings_latest_and_summary", "bad arguments should be -32602");
  }

  auto no_log = call_tool(server, "readings.latest", nlohmann::json::object());
  if (no_log["error"]["code"] != kth::mcp::kInternalError) {
    return fail("test_readings_latest_and_summary", "missing log should be an internal error");
  }

  return 0;
}

int test_readings_timeseries_query() {
  g_redis_mock = {};
  ToolSettings settings;
  settings.redis_key_prefix = "kth:mcp";
  const Server server(build_tool_registry(settings));

  auto response = call_tool(server, "readings.timeseries.query",
                            {{"window", "5m"}, {"sensors", nlohmann::json::array({"TC1", "TC2"})}});
  const auto& result = response["result"]["structuredContent"];
  if (result["series"].size() != 2 || result["series"][1]["key"] != "kth:mcp:TC2" ||
      result["series"][0]["sample_count"] != 2 || result["series"][0]["avg"] != 21.0) {
    return fail("test_readings_timeseries_query", "TS.RANGE results mismatch");
  }
  if (result["to"].get<std::int64_t>() - result["from"].get<std::int64_t>() != 300'000) {
    return fail("test_readings_timeseries_query", "window should cover five minutes");
  }
  if (g_redis_mock.commands.size() != 2 || g_redis_mock.commands[0].rfind("TS.RANGE kth:mcp:TC1 ", 0) != 0) {
    return fail("test_readings_timeseries_query", "expected one TS.RANGE per sensor");
  }

  return 0;
}

}  // namespace

int main() {
  if (int rc = test_parse_window_ms(); rc != 0) return rc;
  if (int rc = test_jsonrpc_envelope_validation(); rc != 0) return rc;
  if (int rc = test_server_protocol_methods(); rc != 0) return rc;
  if (int rc = test_readings_latest_and_summary(); rc != 0) return rc;
  if (int rc = test_readings_timeseries_query(); rc != 0) return rc;

  std::cout << "[PASS] mcp unit tests\n";
  return 0;
}
