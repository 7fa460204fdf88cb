#include "PlatformPaths.hpp"
#include "TestFixtures.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <sstream>
#include <vector>

using namespace bridgesrv;
using namespace bridgesrv::test;
using nlohmann::json;

struct ModuleCase {
  const char *label;
  std::filesystem::path path;
  const char *counting_hook;
};

static void PrintTo(const ModuleCase &c, std::ostream *os) { *os << c.label; }

static std::vector<ModuleCase> module_cases() {
  return {{"lua", get_fixture_path("registry_module.lua"),
           "hooks.before_each"},
          {"native", get_test_module_path("mock_module"), "hooks.before_all"}};
}

/// The same protocol behaviour is expected whichever module kind serves it
class ProtocolLoopTest : public ProtocolTest,
                         public ::testing::WithParamInterface<ModuleCase> {
protected:
  void SetUp() override {
    ProtocolTest::SetUp();
    if (!std::filesystem::exists(GetParam().path)) {
      GTEST_SKIP() << "Module not found: " << GetParam().path;
    }
    load(GetParam().path);
  }

  std::string counting_hook_name() const {
    std::string key = GetParam().counting_hook;
    return key.substr(key.find('.') + 1);
  }
};

TEST_P(ProtocolLoopTest, BlankLinesProduceNoResponse) {
  EXPECT_FALSE(loop_->handle_line("").has_value());
  EXPECT_FALSE(loop_->handle_line("   \t ").has_value());
  EXPECT_FALSE(loop_->handle_line("\r").has_value());
}

TEST_P(ProtocolLoopTest, CarriageReturnIsStripped) {
  json response = send_line(
      R"({"jsonrpc":"2.0","id":4,"method":"ctx.get","params":{"key":"k"}})"
      "\r");
  EXPECT_EQ(response["id"], 4);
  EXPECT_TRUE(response["result"]["value"].is_null());
}

TEST_P(ProtocolLoopTest, ParseErrorHasNullId) {
  json response = send_line("{not json");
  EXPECT_EQ(response["jsonrpc"], "2.0");
  EXPECT_TRUE(response["id"].is_null());
  EXPECT_EQ(response["error"]["code"], -32700);
  EXPECT_EQ(response["error"]["message"].get<std::string>().rfind("Parse error", 0),
            0u);
}

TEST_P(ProtocolLoopTest, EnvelopeErrors) {
  json not_object = send_line("[1, 2, 3]");
  EXPECT_EQ(not_object["error"]["code"], -32600);
  EXPECT_TRUE(not_object["id"].is_null());

  json no_method = send_line(R"({"jsonrpc":"2.0","id":7})");
  EXPECT_EQ(no_method["error"]["code"], -32600);
  EXPECT_EQ(no_method["id"], 7);

  json bad_params =
      send_line(R"({"jsonrpc":"2.0","id":8,"method":"ctx.get","params":[1]})");
  EXPECT_EQ(bad_params["error"]["code"], -32602);
  EXPECT_EQ(bad_params["id"], 8);
}

TEST_P(ProtocolLoopTest, DeeplyNestedRequestIsRejected) {
  const size_t depth = 100000;
  std::string line =
      R"({"jsonrpc":"2.0","id":5,"method":"ctx.set","params":{"key":"deep","value":)";
  line += std::string(depth, '[') + std::string(depth, ']') + "}}";

  json rejected = send_line(line);
  EXPECT_TRUE(rejected["id"].is_null());
  EXPECT_EQ(rejected["error"]["code"], -32700);
  EXPECT_NE(rejected["error"]["message"].get<std::string>().find("nesting"),
            std::string::npos);
  EXPECT_FALSE(context_.contains("deep"));

  json response =
      request("fn.call", {{"name", "add"}, {"args", {{"a", 4}, {"b", 5}}}});
  EXPECT_EQ(response["result"]["result"], 9);
}

TEST_P(ProtocolLoopTest, ModerateNestingIsAccepted) {
  std::string value = std::string(100, '[') + std::string(100, ']');
  json response = send_line(
      R"({"jsonrpc":"2.0","id":6,"method":"ctx.set","params":{"key":"nested","value":)" +
      value + "}}");
  EXPECT_EQ(response["id"], 6);
  EXPECT_TRUE(response.contains("result"));
  EXPECT_TRUE(context_.contains("nested"));
}

TEST_P(ProtocolLoopTest, MissingParamsAreEmpty) {
  json response = send_line(R"({"jsonrpc":"2.0","id":2,"method":"ctx.clear"})");
  EXPECT_EQ(response["result"], json({{"cleared", 0}}));
}

TEST_P(ProtocolLoopTest, MissingRequiredParam) {
  json response = request("fn.call");
  EXPECT_EQ(response["error"]["code"], -32602);
  EXPECT_EQ(response["error"]["message"], "Invalid params: missing 'name'");
}

TEST_P(ProtocolLoopTest, UnknownMethod) {
  json response = request("nope.nothing", json::object(), 11);
  EXPECT_EQ(response["id"], 11);
  EXPECT_EQ(response["error"]["code"], -32601);
  EXPECT_EQ(response["error"]["message"], "Method not found: nope.nothing");
}

TEST_P(ProtocolLoopTest, IdIsEchoedVerbatim) {
  EXPECT_EQ(request("ctx.clear", json::object(), "abc-1")["id"], "abc-1");
  EXPECT_TRUE(request("ctx.clear", json::object(), nullptr)["id"].is_null());

  json absent = send_line(R"({"jsonrpc":"2.0","method":"ctx.clear"})");
  ASSERT_TRUE(absent.contains("id"));
  EXPECT_TRUE(absent["id"].is_null());
  EXPECT_TRUE(absent.contains("result"));
}

TEST_P(ProtocolLoopTest, EnvelopeKeyOrder) {
  auto raw = loop_->handle_line(
      R"({"method":"ctx.clear","id":3,"jsonrpc":"2.0"})");
  ASSERT_TRUE(raw.has_value());
  EXPECT_EQ(*raw, R"({"jsonrpc":"2.0","id":3,"result":{"cleared":0}})");
}

TEST_P(ProtocolLoopTest, FunctionCall) {
  json response =
      request("fn.call", {{"name", "add"}, {"args", {{"a", 2}, {"b", 3}}}});
  EXPECT_EQ(response["result"], json({{"result", 5}}));

  EXPECT_EQ(request("fn.call", {{"name", "shadowed"}})["result"]["result"],
            "from table");
}

TEST_P(ProtocolLoopTest, FunctionErrorsAreServerErrors) {
  json failed = request("fn.call", {{"name", "fail"}});
  EXPECT_EQ(failed["error"]["code"], -32000);
  EXPECT_NE(failed["error"]["message"].get<std::string>().find("failure"),
            std::string::npos);

  json unknown = request("fn.call", {{"name", "ghost"}});
  EXPECT_EQ(unknown["error"]["code"], -32000);
  EXPECT_EQ(unknown["error"]["message"].get<std::string>().rfind(
                "Function not found: ghost. Available: ", 0),
            0u);
}

TEST_P(ProtocolLoopTest, LoopSurvivesFailures) {
  request("fn.call", {{"name", "fail"}});
  send_line("garbage");
  json response =
      request("fn.call", {{"name", "add"}, {"args", {{"a", 1}, {"b", 1}}}});
  EXPECT_EQ(response["result"]["result"], 2);
}

TEST_P(ProtocolLoopTest, ContextFlowsThroughFunctions) {
  request("fn.call",
          {{"name", "store"}, {"args", {{"key", "user_1"}, {"value", "a"}}}});
  request("ctx.set", {{"key", "user_2"}, {"value", {{"b", 2}}}});

  EXPECT_EQ(request("ctx.get", {{"key", "user_1"}})["result"]["value"], "a");
  EXPECT_EQ(request("fn.call", {{"name", "read"}, {"args", {{"key", "user_2"}}}})
                ["result"]["result"],
            json({{"b", 2}}));

  EXPECT_EQ(request("ctx.clear", {{"pattern", "user_*"}})["result"]["cleared"],
            2);
  EXPECT_TRUE(request("ctx.get", {{"key", "user_1"}})["result"]["value"].is_null());
}

TEST_P(ProtocolLoopTest, Assertions) {
  json passed = request("assert.custom",
                        {{"name", "equals"},
                         {"params", {{"actual", 1}, {"expected", 1}}}});
  EXPECT_EQ(passed["result"]["success"], true);

  json failed = request("assert.custom",
                        {{"name", "equals"},
                         {"params", {{"actual", 1}, {"expected", 2}}}});
  EXPECT_EQ(failed["result"]["success"], false);
  EXPECT_EQ(failed["result"]["actual"], 1);
  EXPECT_EQ(failed["result"]["expected"], 2);

  // A throwing assertion is a failed outcome, not a protocol error
  json exploded = request("assert.custom", {{"name", "explodes"}});
  ASSERT_TRUE(exploded.contains("result"));
  EXPECT_EQ(exploded["result"]["success"], false);

  json missing = request("assert.custom", {{"name", "missing"}});
  EXPECT_EQ(missing["result"]["success"], false);
  EXPECT_EQ(missing["result"]["message"].get<std::string>().rfind(
                "Assertion not found: missing", 0),
            0u);
}

TEST_P(ProtocolLoopTest, Hooks) {
  request("hook.call", {{"hook", counting_hook_name()}});
  request("hook.call", {{"hook", counting_hook_name()}});
  EXPECT_EQ(request("ctx.get", {{"key", GetParam().counting_hook}})["result"]
                   ["value"],
            2);

  json unknown = request("hook.call", {{"hook", "not_registered"}});
  EXPECT_EQ(unknown["result"], json::object());
}

TEST_P(ProtocolLoopTest, ExecutionInfoAndStepOutputs) {
  request("ctx.setExecutionInfo",
          {{"runId", "run-1"}, {"jobName", "build"}, {"stepName", "compile"}});
  EXPECT_EQ(context_.run_id(), "run-1");
  EXPECT_EQ(context_.step_name(), "compile");

  request("ctx.syncStepOutputs",
          {{"stepId", "checkout"}, {"outputs", {{"sha", "abc123"}, {"n", 4}}}});
  json sha = request("fn.call", {{"name", "step_output"},
                                 {"args", {{"step", "checkout"}, {"name", "sha"}}}});
  EXPECT_EQ(sha["result"]["result"], "abc123");
  json n = request("fn.call", {{"name", "step_output"},
                               {"args", {{"step", "checkout"}, {"name", "n"}}}});
  EXPECT_EQ(n["result"]["result"], "4");
}

TEST_P(ProtocolLoopTest, MocksShadowFunctions) {
  request("mock.set", {{"target", "add"}, {"value", {{"mocked", true}}}});
  EXPECT_EQ(request("fn.call", {{"name", "add"}})["result"]["result"],
            json({{"mocked", true}}));

  request("mock.clear");
  EXPECT_EQ(request("fn.call",
                    {{"name", "add"}, {"args", {{"a", 4}, {"b", 5}}}})["result"]
                   ["result"],
            9);
}

TEST_P(ProtocolLoopTest, RegistryInfoAndListings) {
  json info = request("registry.info")["result"];
  EXPECT_NE(std::find(info["functions"].begin(), info["functions"].end(), "add"),
            info["functions"].end());
  EXPECT_NE(
      std::find(info["assertions"].begin(), info["assertions"].end(), "equals"),
      info["assertions"].end());
  EXPECT_FALSE(info["hooks"].empty());

  json functions = request("list_functions")["result"]["functions"];
  ASSERT_TRUE(functions.is_array());
  for (const auto &entry : functions) {
    EXPECT_TRUE(entry.contains("name"));
    EXPECT_TRUE(entry.contains("description"));
  }

  json assertions = request("list_assertions")["result"]["assertions"];
  EXPECT_EQ(assertions.size(), info["assertions"].size());
}

TEST_P(ProtocolLoopTest, RunServesEveryLine) {
  std::istringstream in(
      R"({"jsonrpc":"2.0","id":1,"method":"ctx.set","params":{"key":"a","value":1}})"
      "\n"
      "\n"
      R"({"jsonrpc":"2.0","id":2,"method":"ctx.get","params":{"key":"a"}})"
      "\r\n"
      "not json\n"
      R"({"jsonrpc":"2.0","id":3,"method":"fn.call","params":{"name":"fail"}})");
  std::ostringstream out;

  EXPECT_EQ(loop_->run(in, out), 4u);

  std::istringstream responses(out.str());
  std::vector<json> lines;
  std::string line;
  while (std::getline(responses, line)) {
    lines.push_back(json::parse(line));
  }
  ASSERT_EQ(lines.size(), 4u);
  EXPECT_EQ(lines[0]["result"], json::object());
  EXPECT_EQ(lines[1]["result"]["value"], 1);
  EXPECT_EQ(lines[2]["error"]["code"], -32700);
  EXPECT_EQ(lines[3]["id"], 3);
  EXPECT_EQ(lines[3]["error"]["code"], -32000);
}

INSTANTIATE_TEST_SUITE_P(Modules, ProtocolLoopTest,
                         ::testing::ValuesIn(module_cases()),
                         [](const ::testing::TestParamInfo<ModuleCase> &info) {
                           return std::string(info.param.label);
                         });

class NativeProtocolTest : public ProtocolTest {
protected:
  void SetUp() override {
    ProtocolTest::SetUp();
    auto path = get_test_module_path("mock_module");
    if (!std::filesystem::exists(path)) {
      GTEST_SKIP() << "Mock module not found";
    }
    load(path);
  }
};

TEST_F(NativeProtocolTest, HookFailureIsServerError) {
  json response = request("hook.call", {{"hook", "explode"}}, 12);
  EXPECT_EQ(response["id"], 12);
  EXPECT_EQ(response["error"]["code"], -32000);
  EXPECT_EQ(response["error"]["message"], "hook exploded");
}

TEST_F(NativeProtocolTest, ClockDrivesModuleTime) {
  request("clock.sync", {{"virtual_time_ms", 1700000000000}, {"frozen", true}});
  EXPECT_EQ(request("fn.call", {{"name", "now"}})["result"]["result"],
            1700000000000);

  request("clock.sync", {{"virtualTimeMs", 0}});
  EXPECT_EQ(request("fn.call", {{"name", "now"}})["result"]["result"], 0);
}

TEST_F(NativeProtocolTest, ExecutionInfoVisibleToModule) {
  request("ctx.setExecutionInfo", {{"runId", "r"}, {"jobName", "j"}});
  EXPECT_EQ(request("fn.call", {{"name", "execution_info"}})["result"]["result"],
            json({{"run_id", "r"}, {"job_name", "j"}, {"step_name", ""}}));
}
