#include "PlatformPaths.hpp"
#include "TestFixtures.hpp"
#include "bridge-server/plugin/LuaBindings.hpp"
#include "bridge-server/plugin/LuaModule.hpp"

#include <gtest/gtest.h>

using namespace bridgesrv;
using namespace bridgesrv::plugin;
using namespace bridgesrv::test;
using nlohmann::json;

class LuaModuleTest : public BridgeTest {
protected:
  void SetUp() override {
    BridgeTest::SetUp();
    module_path_ = get_fixture_path("registry_module.lua");
    if (!std::filesystem::exists(module_path_)) {
      GTEST_SKIP() << "Lua fixture not found";
    }
    module_ = std::make_unique<LuaModule>(module_path_.string());
  }

  json call(const std::string &name, const json &args = nullptr) {
    const FunctionEntry *entry = module_->registry().find_function(name);
    if (!entry) {
      throw std::runtime_error("missing function " + name);
    }
    return entry->fn(args, context_);
  }

  std::filesystem::path module_path_;
  std::unique_ptr<LuaModule> module_;
};

TEST_F(LuaModuleTest, HarvestsRegistryAndContainers) {
  const CallableRegistry &registry = module_->registry();

  EXPECT_NE(registry.find_function("add"), nullptr);
  EXPECT_NE(registry.find_function("greet"), nullptr);
  EXPECT_NE(registry.find_assertion("equals"), nullptr);
  EXPECT_NE(registry.find_assertion("returns_nil"), nullptr);
  EXPECT_NE(registry.find_hook("before_each"), nullptr);
  EXPECT_NE(registry.find_hook("after_each"), nullptr);

  EXPECT_EQ(registry.find_function("greet")->description,
            "Greet someone by name");
  EXPECT_EQ(registry.find_function("add")->description, "Add two numbers");
}

TEST_F(LuaModuleTest, ContainerOverridesRegistryObject) {
  EXPECT_EQ(call("shadowed"), "from table");
}

TEST_F(LuaModuleTest, CallsWithArguments) {
  EXPECT_EQ(call("add", {{"a", 2}, {"b", 3}}), 5);
  EXPECT_EQ(call("greet", {{"name", "World"}}), "Hello, World!");
}

TEST_F(LuaModuleTest, IntegersAndFloatsStayDistinct) {
  json sum = call("add", {{"a", 2}, {"b", 3}});
  EXPECT_TRUE(sum.is_number_integer());

  json quotient = call("divide", {{"a", 3}, {"b", 2}});
  EXPECT_TRUE(quotient.is_number_float());
  EXPECT_DOUBLE_EQ(quotient.get<double>(), 1.5);
}

TEST_F(LuaModuleTest, TablesConvertToArraysAndObjects) {
  json shape = call("shape");
  EXPECT_EQ(shape["list"], json::array({1, 2, 3}));
  EXPECT_EQ(shape["empty"], json::object());
  EXPECT_EQ(shape["nested"], json({{"ok", true}}));
}

TEST_F(LuaModuleTest, ArraysSurviveAnUntouchedTrip) {
  json args = {{"holes", {1, nullptr, 3}},
               {"trailing", {1, nullptr}},
               {"empty", json::array()},
               {"nested", {json::array(), {nullptr}}}};
  EXPECT_EQ(call("echo", args), args);
  EXPECT_EQ(call("echo", json::array()), json::array());
}

TEST_F(LuaModuleTest, ArraysGrownInLuaStayArrays) {
  EXPECT_EQ(call("append", {{"list", json::array()}, {"item", "x"}}),
            json::array({"x"}));
  EXPECT_EQ(call("append", {{"list", {1, 2}}, {"item", 3}}),
            json::array({1, 2, 3}));
}

TEST_F(LuaModuleTest, NoReturnValueIsNull) {
  EXPECT_TRUE(call("nothing").is_null());
}

TEST_F(LuaModuleTest, LuaErrorsBecomeExceptions) {
  try {
    call("fail");
    FAIL() << "expected exception";
  } catch (const std::runtime_error &e) {
    EXPECT_NE(std::string(e.what()).find("lua failure"), std::string::npos);
  }
}

TEST_F(LuaModuleTest, UnconvertibleResultThrows) {
  EXPECT_THROW(call("returns_function"), std::runtime_error);
}

TEST_F(LuaModuleTest, ContextAccess) {
  call("store", {{"key", "answer"}, {"value", {{"n", 42}}}});
  EXPECT_EQ(context_.get("answer").value(), json({{"n", 42}}));

  EXPECT_EQ(call("read", {{"key", "answer"}}), json({{"n", 42}}));
  EXPECT_TRUE(call("read", {{"key", "missing"}}).is_null());

  context_.set("user_1", 1);
  context_.set("user_2", 2);
  EXPECT_EQ(call("clear", {{"pattern", "user_*"}}), 2);
}

TEST_F(LuaModuleTest, ContextInfoAndClock) {
  context_.set_execution_info({"run-9", "job", "step"});
  ClockState clock;
  clock.virtual_time_ms = 1234;
  context_.set_clock(clock);

  json info = call("info");
  EXPECT_EQ(info["run_id"], "run-9");
  EXPECT_EQ(info["job_name"], "job");
  EXPECT_EQ(info["step_name"], "step");
  EXPECT_EQ(info["mocked"], true);
  EXPECT_EQ(info["now"], 1234);
}

TEST_F(LuaModuleTest, StepOutputs) {
  context_.sync_step_outputs("build", {{"artifact", "app.tar"}});
  EXPECT_EQ(call("step_output", {{"step", "build"}, {"name", "artifact"}}),
            "app.tar");
  EXPECT_TRUE(
      call("step_output", {{"step", "build"}, {"name", "nope"}}).is_null());
}

TEST_F(LuaModuleTest, PrintGoesToLog) {
  EXPECT_EQ(call("shout", {{"text", "hi"}}), "HI");
}

TEST_F(LuaModuleTest, AssertionNormalization) {
  const CallableRegistry &registry = module_->registry();

  EXPECT_TRUE(registry
                  .evaluate_assertion("equals", {{"actual", 1}, {"expected", 1}},
                                      context_)
                  .success);

  auto differ = registry.evaluate_assertion(
      "equals", {{"actual", 1}, {"expected", 2}}, context_);
  EXPECT_FALSE(differ.success);
  EXPECT_EQ(differ.message.value(), "Values differ");
  EXPECT_EQ(differ.actual.value(), 1);
  EXPECT_EQ(differ.expected.value(), 2);

  EXPECT_FALSE(
      registry.evaluate_assertion("returns_nil", json::object(), context_)
          .success);
  // Any non-nil, non-false value passes, including 0
  EXPECT_TRUE(
      registry.evaluate_assertion("returns_number", json::object(), context_)
          .success);

  auto exploded =
      registry.evaluate_assertion("explodes", json::object(), context_);
  EXPECT_FALSE(exploded.success);
  EXPECT_NE(exploded.message.value().find("assertion exploded"),
            std::string::npos);
}

TEST_F(LuaModuleTest, Hooks) {
  const CallableRegistry &registry = module_->registry();
  (*registry.find_hook("before_each"))(context_);
  (*registry.find_hook("before_each"))(context_);
  EXPECT_EQ(context_.get("hooks.before_each").value(), 2);

  context_.set("scratch", true);
  (*registry.find_hook("after_each"))(context_);
  EXPECT_FALSE(context_.contains("scratch"));
}

class LuaModuleLoadTest : public BridgeTest {};

TEST_F(LuaModuleLoadTest, ReplacedRegistryIsUsed) {
  LuaModule module(get_fixture_path("custom_registry.lua").string());
  const FunctionEntry *ping = module.registry().find_function("ping");
  ASSERT_NE(ping, nullptr);
  EXPECT_EQ(ping->fn(json(), context_), "pong");
  EXPECT_EQ(ping->description, "Liveness check");
}

TEST_F(LuaModuleLoadTest, SyntaxErrorIsFatal) {
  EXPECT_THROW(LuaModule(get_fixture_path("syntax_error.lua").string()),
               ModuleLoadError);
}

TEST_F(LuaModuleLoadTest, RuntimeErrorIsFatal) {
  try {
    LuaModule module(get_fixture_path("runtime_error.lua").string());
    FAIL() << "expected ModuleLoadError";
  } catch (const ModuleLoadError &e) {
    EXPECT_NE(std::string(e.what()).find("module refused to load"),
              std::string::npos);
  }
}

TEST_F(LuaModuleLoadTest, InvalidContainerEntryIsFatal) {
  EXPECT_THROW(LuaModule(get_fixture_path("bad_container.lua").string()),
               ModuleLoadError);
}

TEST_F(LuaModuleLoadTest, LibrariesFollowOptions) {
  auto path = get_fixture_path("uses_io.lua").string();

  LuaModule restricted(path);
  EXPECT_EQ(restricted.registry().find_function("has_io")->fn(json(), context_),
            false);

  ModuleOptions options;
  options.lua_libraries = {"base", "io"};
  LuaModule with_io(path, options);
  EXPECT_EQ(with_io.registry().find_function("has_io")->fn(json(), context_),
            true);
}

TEST_F(LuaModuleLoadTest, UnknownLibraryIsFatal) {
  ModuleOptions options;
  options.lua_libraries = {"base", "sockets"};
  EXPECT_THROW(
      LuaModule(get_fixture_path("custom_registry.lua").string(), options),
      ModuleLoadError);
}

TEST_F(LuaModuleLoadTest, LoadModuleSelectsLuaByExtension) {
  auto module = load_module(get_fixture_path("custom_registry.lua").string());
  EXPECT_EQ(module->kind(), ModuleKind::Lua);
  EXPECT_STREQ(to_string(module->kind()), "lua");
}

TEST(LuaJsonConversion, RoundTripsNestedValues) {
  sol::state lua;
  json value = {{"list", {1, 2.5, "three", false}},
                {"object", {{"inner", {{"deep", nullptr}}}}},
                {"empty", json::object()}};

  json back = lua_to_json(json_to_lua(lua, value));
  EXPECT_EQ(back["list"], value["list"]);
  EXPECT_EQ(back["empty"], json::object());
  // nil fields vanish from Lua tables
  EXPECT_EQ(back["object"], json({{"inner", json::object()}}));
}

TEST(LuaJsonConversion, ArraysKeepLengthAndNulls) {
  sol::state lua;
  for (const json &value :
       {json::array(), json::array({nullptr}), json::array({1, nullptr, 3}),
        json::array({json::array(), json::object()})}) {
    EXPECT_EQ(lua_to_json(json_to_lua(lua, value)), value) << value.dump();
  }
}

TEST(LuaJsonConversion, ArrayGivenStringKeysBecomesObject) {
  sol::state lua;
  sol::table tbl = json_to_lua(lua, json::array({1, 2})).as<sol::table>();
  tbl["name"] = "x";
  EXPECT_EQ(lua_to_json(tbl), json({{"1", 1}, {"2", 2}, {"name", "x"}}));
}

TEST(LuaJsonConversion, RejectsDeepNesting) {
  sol::state lua;
  lua.open_libraries(sol::lib::base);
  sol::object deep = lua.script(R"(
    local t = {}
    local cur = t
    for i = 1, 100 do
      cur.next = {}
      cur = cur.next
    end
    return t
  )");
  EXPECT_THROW(lua_to_json(deep), std::runtime_error);
}

TEST(LuaJsonConversion, NumericKeysBecomeStrings) {
  sol::state lua;
  sol::object sparse = lua.script("return {[1] = 'a', [3] = 'c'}");
  EXPECT_EQ(lua_to_json(sparse), json({{"1", "a"}, {"3", "c"}}));
}
