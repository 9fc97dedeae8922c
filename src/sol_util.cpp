#include "sol_util.h"

#include <stdexcept>
#include <unordered_set>

namespace rtpack {

namespace {

// Instructions a document may execute before evaluation is aborted.
constexpr int kDocumentInstructionLimit{ 10'000'000 };

void instruction_limit_hook(lua_State *L, lua_Debug *) {
  luaL_error(L, "document exceeded %d instructions", kDocumentInstructionLimit);
}

struct scoped_instruction_limit {
  explicit scoped_instruction_limit(lua_State *L) : L_{ L } {
    lua_sethook(L_, instruction_limit_hook, LUA_MASKCOUNT, kDocumentInstructionLimit);
  }
  ~scoped_instruction_limit() { lua_sethook(L_, nullptr, 0, 0); }

  scoped_instruction_limit(scoped_instruction_limit const &) = delete;
  scoped_instruction_limit &operator=(scoped_instruction_limit const &) = delete;

 private:
  lua_State *L_;
};

bool contains_function(sol::object const &val, std::unordered_set<void const *> &visited) {
  if (val.get_type() == sol::type::function) { return true; }
  if (val.get_type() == sol::type::table) {
    sol::table tbl{ val.as<sol::table>() };
    if (!visited.insert(tbl.pointer()).second) { return false; }
    for (auto const &[key, nested_val] : tbl) {
      if (contains_function(sol::object(key), visited) ||
          contains_function(sol::object(nested_val), visited)) {
        return true;
      }
    }
  }
  return false;
}

}  // namespace

sol_state_ptr sol_util_make_lua_state() {
  auto lua{ std::make_unique<sol::state>() };
  lua->open_libraries(sol::lib::base,
                      sol::lib::string,
                      sol::lib::math,
                      sol::lib::table,
                      sol::lib::debug);

  // Override error() and assert() to automatically include stack traces
  lua->script(R"lua(
do
  local orig_error = error
  local orig_assert = assert

  _G.error = function(message, level)
    level = (level or 1) + 1
    return orig_error(debug.traceback(tostring(message), level), 0)
  end

  _G.assert = function(condition, message, ...)
    if not condition then
      message = message or "assertion failed"
      return orig_assert(false, debug.traceback(tostring(message), 2))
    end
    return condition, message, ...
  end
end
)lua");

  return lua;
}

sol::table sol_util_eval_document(sol::state &lua,
                                  std::string_view script,
                                  std::string const &origin,
                                  char const *global_name) {
  {
    scoped_instruction_limit const limit{ lua.lua_state() };
    if (sol::protected_function_result const result{
            lua.safe_script(script, sol::script_pass_on_error, origin) };
        !result.valid()) {
      sol::error err = result;
      throw std::runtime_error(origin + ": failed to evaluate document: " + err.what());
    }
  }

  sol::object obj{ lua[global_name] };
  if (!obj.valid() || obj.get_type() != sol::type::table) {
    throw std::runtime_error(origin + ": document must define '" +
                             std::string{ global_name } + "' global as a table");
  }

  return obj.as<sol::table>();
}

bool sol_util_contains_function(sol::object const &val) {
  std::unordered_set<void const *> visited;
  return contains_function(val, visited);
}

bool sol_util_is_array(sol::table const &table) {
  std::size_t count{ 0 };
  for (auto const &[key, value] : table) {
    if (key.get_type() != sol::type::number) { return false; }
    ++count;
  }
  return count == table.size();
}

}  // namespace rtpack
