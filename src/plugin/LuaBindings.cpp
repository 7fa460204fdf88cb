#include "bridge-server/plugin/LuaBindings.hpp"
#include "bridge-server/Logger.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace bridgesrv {
namespace plugin {

using json = nlohmann::json;

namespace {

// True (and out set) if value is a number with the integer subtype
bool as_lua_integer(const sol::object &value, lua_Integer &out) {
  if (value.get_type() != sol::type::number) {
    return false;
  }
  lua_State *L = value.lua_state();
  value.push();
  bool is_int = lua_isinteger(L, -1) != 0;
  if (is_int) {
    out = lua_tointeger(L, -1);
  }
  lua_pop(L, 1);
  return is_int;
}

std::string table_key(const sol::object &key) {
  switch (key.get_type()) {
  case sol::type::string:
    return key.as<std::string>();
  case sol::type::number: {
    lua_Integer i = 0;
    if (as_lua_integer(key, i)) {
      return std::to_string(i);
    }
    return fmt::format("{}", key.as<double>());
  }
  default:
    throw std::runtime_error(
        fmt::format("Cannot convert Lua table key of type {} to JSON",
                    sol::type_name(key.lua_state(), key.get_type())));
  }
}

// Metatable field recording the length of a table built from a JSON array,
// so empty arrays and trailing nulls survive the trip back
constexpr const char *kArrayLengthField = "__bridge_array_length";

void mark_array(sol::state_view lua, sol::table &tbl, std::size_t length) {
  sol::table mt = lua.create_table(0, 1);
  mt[kArrayLengthField] = static_cast<lua_Integer>(length);
  tbl[sol::metatable_key] = mt;
}

// Recorded array length, or -1 if the table was not built from an array
lua_Integer array_mark(const sol::table &tbl) {
  lua_State *L = tbl.lua_state();
  lua_Integer length = -1;
  tbl.push();
  if (lua_getmetatable(L, -1)) {
    lua_pushstring(L, kArrayLengthField);
    lua_rawget(L, -2);
    if (lua_isinteger(L, -1)) {
      length = lua_tointeger(L, -1);
    }
    lua_pop(L, 2);
  }
  lua_pop(L, 1);
  return length;
}

void raise_on_error(const sol::protected_function_result &result) {
  if (!result.valid()) {
    sol::error err = result;
    throw std::runtime_error(err.what());
  }
}

} // namespace

json lua_to_json(const sol::object &value, int depth) {
  if (depth > kMaxLuaNestingDepth) {
    throw std::runtime_error(fmt::format(
        "Lua value nested deeper than {} levels", kMaxLuaNestingDepth));
  }

  switch (value.get_type()) {
  case sol::type::none:
  case sol::type::lua_nil:
    return nullptr;
  case sol::type::boolean:
    return value.as<bool>();
  case sol::type::number: {
    lua_Integer i = 0;
    if (as_lua_integer(value, i)) {
      return static_cast<int64_t>(i);
    }
    return value.as<double>();
  }
  case sol::type::string:
    return value.as<std::string>();
  case sol::type::table:
    break;
  default:
    throw std::runtime_error(
        fmt::format("Cannot convert Lua {} to JSON",
                    sol::type_name(value.lua_state(), value.get_type())));
  }

  sol::table tbl = value.as<sol::table>();

  // A table is a sequence iff its keys are exactly 1..n
  std::size_t count = 0;
  lua_Integer max_index = 0;
  bool sequence = true;
  for (const auto &kv : tbl) {
    ++count;
    lua_Integer index = 0;
    if (sequence && as_lua_integer(kv.first, index) && index >= 1) {
      if (index > max_index) {
        max_index = index;
      }
    } else {
      sequence = false;
    }
  }

  lua_Integer length = -1;
  lua_Integer marked = sequence ? array_mark(tbl) : -1;
  if (marked >= 0) {
    length = std::max(marked, max_index);
  } else if (count > 0 && sequence &&
             static_cast<std::size_t>(max_index) == count) {
    length = max_index;
  }

  if (length >= 0) {
    json arr = json::array();
    for (lua_Integer i = 1; i <= length; ++i) {
      arr.push_back(lua_to_json(tbl.raw_get<sol::object>(i), depth + 1));
    }
    return arr;
  }

  json obj = json::object();
  for (const auto &kv : tbl) {
    obj[table_key(kv.first)] = lua_to_json(kv.second, depth + 1);
  }
  return obj;
}

sol::object json_to_lua(sol::state_view lua, const json &value, int depth) {
  if (depth > kMaxLuaNestingDepth) {
    throw std::runtime_error(fmt::format(
        "JSON value nested deeper than {} levels", kMaxLuaNestingDepth));
  }

  switch (value.type()) {
  case json::value_t::null:
  case json::value_t::discarded:
    return sol::nil;
  case json::value_t::boolean:
    return sol::make_object(lua, value.get<bool>());
  case json::value_t::number_integer:
    return sol::make_object(lua, value.get<int64_t>());
  case json::value_t::number_unsigned: {
    auto u = value.get<uint64_t>();
    if (u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      return sol::make_object(lua, static_cast<int64_t>(u));
    }
    return sol::make_object(lua, static_cast<double>(u));
  }
  case json::value_t::number_float:
    return sol::make_object(lua, value.get<double>());
  case json::value_t::string:
    return sol::make_object(lua, value.get<std::string>());
  case json::value_t::array: {
    sol::table tbl = lua.create_table(static_cast<int>(value.size()), 0);
    for (std::size_t i = 0; i < value.size(); ++i) {
      tbl[i + 1] = json_to_lua(lua, value[i], depth + 1);
    }
    mark_array(lua, tbl, value.size());
    return tbl;
  }
  case json::value_t::object: {
    sol::table tbl = lua.create_table(0, static_cast<int>(value.size()));
    for (auto it = value.begin(); it != value.end(); ++it) {
      tbl[it.key()] = json_to_lua(lua, it.value(), depth + 1);
    }
    return tbl;
  }
  case json::value_t::binary:
    break;
  }
  throw std::runtime_error("Cannot convert binary JSON value to Lua");
}

AssertionOutcome lua_assertion_outcome(const sol::object &value) {
  switch (value.get_type()) {
  case sol::type::table:
    return AssertionOutcome::from_value(lua_to_json(value));
  case sol::type::boolean: {
    AssertionOutcome outcome;
    outcome.success = value.as<bool>();
    return outcome;
  }
  case sol::type::none:
  case sol::type::lua_nil:
    return AssertionOutcome{};
  default:
    return AssertionOutcome::passed();
  }
}

FunctionCallable wrap_lua_function(sol::protected_function fn) {
  return [fn](const json &args, ExecutionContext &ctx) -> json {
    sol::state_view lua(fn.lua_state());
    sol::protected_function_result result = fn(json_to_lua(lua, args), &ctx);
    raise_on_error(result);
    if (result.return_count() == 0) {
      return nullptr;
    }
    return lua_to_json(result.get<sol::object>());
  };
}

AssertionCallable wrap_lua_assertion(sol::protected_function fn) {
  return [fn](const json &params, ExecutionContext &ctx) {
    sol::state_view lua(fn.lua_state());
    sol::protected_function_result result = fn(json_to_lua(lua, params), &ctx);
    raise_on_error(result);
    if (result.return_count() == 0) {
      return AssertionOutcome{};
    }
    return lua_assertion_outcome(result.get<sol::object>());
  };
}

HookCallable wrap_lua_hook(sol::protected_function fn) {
  return [fn](ExecutionContext &ctx) {
    sol::protected_function_result result = fn(&ctx);
    raise_on_error(result);
  };
}

void LuaRegistryHandle::register_function(
    const std::string &name, sol::protected_function fn,
    sol::optional<std::string> description) {
  registry_->register_function(name, wrap_lua_function(std::move(fn)),
                               description.value_or(""));
}

void LuaRegistryHandle::register_assertion(
    const std::string &name, sol::protected_function fn,
    sol::optional<std::string> description) {
  registry_->register_assertion(name, wrap_lua_assertion(std::move(fn)),
                                description.value_or(""));
}

void LuaRegistryHandle::register_hook(const std::string &name,
                                      sol::protected_function fn) {
  registry_->register_hook(name, wrap_lua_hook(std::move(fn)));
}

void bind_lua_api(sol::state &lua) {
  // Context
  lua.new_usertype<ExecutionContext>(
      "Context", sol::no_constructor, "get",
      [](ExecutionContext &self, const std::string &key,
         sol::this_state s) -> sol::object {
        auto value = self.get(key);
        if (!value) {
          return sol::nil;
        }
        return json_to_lua(sol::state_view(s), *value);
      },
      "set",
      [](ExecutionContext &self, const std::string &key, sol::object value) {
        self.set(key, lua_to_json(value));
      },
      "remove", &ExecutionContext::remove, "clear",
      [](ExecutionContext &self, sol::optional<std::string> pattern) {
        return static_cast<lua_Integer>(self.clear(pattern.value_or("*")));
      },
      "step_output",
      [](ExecutionContext &self, const std::string &step_id,
         const std::string &name, sol::this_state s) -> sol::object {
        auto value = self.get_step_output(step_id, name);
        if (!value) {
          return sol::nil;
        }
        return sol::make_object(s, *value);
      },
      "now_ms", &ExecutionContext::now_ms, "is_clock_mocked",
      &ExecutionContext::is_clock_mocked, "log",
      [](ExecutionContext &, const std::string &msg) {
        LOG_INFO("LUA", "CONTEXT", "{}", msg);
      },
      "run_id", sol::readonly_property(&ExecutionContext::run_id), "job_name",
      sol::readonly_property(&ExecutionContext::job_name), "step_name",
      sol::readonly_property(&ExecutionContext::step_name));

  // Registry
  lua.new_usertype<LuaRegistryHandle>(
      "Registry", sol::constructors<LuaRegistryHandle()>(),
      "register_function", &LuaRegistryHandle::register_function,
      "register_assertion", &LuaRegistryHandle::register_assertion,
      "register_hook", &LuaRegistryHandle::register_hook);

  // print() goes to the log; stdout carries protocol envelopes only
  lua.set_function("print", [](sol::variadic_args args, sol::this_state s) {
    lua_State *L = s;
    std::string line;
    for (std::size_t i = 0; i < args.size(); ++i) {
      if (i > 0) {
        line += '\t';
      }
      std::size_t len = 0;
      int index = args.stack_index() + static_cast<int>(i);
      const char *text = luaL_tolstring(L, index, &len);
      line.append(text, len);
      lua_pop(L, 1);
    }
    LOG_INFO("LUA", "PRINT", "{}", line);
  });
}

} // namespace plugin
} // namespace bridgesrv
