#include <lunajudge/sandbox/capabilities.hpp>
#include <lunajudge/sandbox/lua_convert.hpp>
#include <lunajudge/sandbox/sandbox_environment.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>
#include <lua.hpp>
#include <sol/sol.hpp>

#include <cstddef>
#include <cstdlib>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace lunajudge::sandbox {

void* MemoryBudget::allocate(void* userdata, void* ptr, std::size_t old_size, std::size_t new_size) noexcept {
    auto* budget = static_cast<MemoryBudget*>(userdata);

    // For a fresh allocation, old_size encodes the kind of object instead of a size
    const std::size_t current_size = ptr == nullptr ? 0 : old_size;

    if (new_size == 0) {
        std::free(ptr); // NOLINT(*-no-malloc,*-owning-memory)
        budget->used_ -= current_size;
        return nullptr;
    }

    if (budget->limit_ != 0 && new_size > current_size && budget->used_ - current_size + new_size > budget->limit_) {
        return nullptr;
    }

    void* res = std::realloc(ptr, new_size); // NOLINT(*-no-malloc,*-owning-memory)

    if (res == nullptr) {
        return nullptr;
    }

    budget->used_ = budget->used_ - current_size + new_size;

    return res;
}

namespace {

std::optional<sol::table> metatable_of(const sol::object& obj) {
    lua_State* lua = obj.lua_state();

    obj.push(lua);

    if (lua_getmetatable(lua, -1) == 0) {
        lua_pop(lua, 1);
        return std::nullopt;
    }

    sol::table meta{lua, -1};
    lua_pop(lua, 2);

    return meta;
}

/// The exception type of an exception instance
std::optional<sol::table> exception_type_of(const sol::object& obj) {
    if (obj.get_type() != sol::type::table) {
        return std::nullopt;
    }

    std::optional<sol::table> meta = metatable_of(obj);
    if (!meta) {
        return std::nullopt;
    }

    auto type = meta->raw_get<sol::optional<sol::table>>("__index");
    if (!type || !is_exception_type(*type)) {
        return std::nullopt;
    }

    // Only tables whose metatable is the type's own instance metatable count
    if (!raw_equal(*meta, type->raw_get<sol::table>("__instance"))) {
        return std::nullopt;
    }

    return *type;
}

std::string exception_to_string(const sol::table& self) {
    auto name = self.get<std::string>("__name");
    auto message = self.get_or<std::string>("message", std::string{});

    if (message.empty()) {
        return name;
    }

    return fmt::format("{}: {}", name, message);
}

/// ``__call`` of an exception type: ``ValueError("msg")``. The message is optional
sol::table construct_exception(const sol::table& type, sol::variadic_args args, sol::this_state state) {
    sol::state_view lua{state};
    sol::table instance = lua.create_table();

    std::string message;
    if (args.size() > 0) {
        auto arg = args.get<sol::object>(0);
        if (arg.get_type() != sol::type::lua_nil) {
            message = describe(arg);
        }
    }

    instance["message"] = message;
    instance[sol::metatable_key] = type.raw_get<sol::table>("__instance");

    return instance;
}

sol::table make_exception_type(sol::state& lua, std::string_view name, const std::optional<sol::table>& base) {
    sol::table type = lua.create_table();
    sol::table instance_meta = lua.create_table();
    sol::table type_meta = lua.create_table();

    type["__name"] = name;
    type["__instance"] = instance_meta;

    instance_meta["__index"] = type;
    instance_meta["__name"] = name;
    instance_meta.set_function("__tostring", &exception_to_string);

    type_meta.set_function("__call", &construct_exception);

    if (base) {
        type["__base"] = *base;
        type_meta["__index"] = *base;
    }

    type[sol::metatable_key] = type_meta;

    return type;
}

bool isinstance(const sol::object& value, const sol::object& kind) {
    if (kind.get_type() == sol::type::string) {
        auto name = kind.as<std::string>();
        sol::type type = value.get_type();

        if (name == "number") {
            return type == sol::type::number;
        }
        if (name == "integer") {
            return is_integer(value);
        }
        if (name == "float") {
            return type == sol::type::number && !is_integer(value);
        }
        if (name == "nil") {
            return type == sol::type::lua_nil || type == sol::type::none;
        }
        if (name == "boolean") {
            return type == sol::type::boolean;
        }
        if (name == "string") {
            return type == sol::type::string;
        }
        if (name == "table") {
            return type == sol::type::table;
        }
        if (name == "function") {
            return type == sol::type::function;
        }

        throw std::invalid_argument(fmt::format("bad argument #2 to 'isinstance' (unknown type name '{}')", name));
    }

    if (is_exception_type(kind)) {
        return is_exception_instance(value, kind.as<sol::table>());
    }

    throw std::invalid_argument("bad argument #2 to 'isinstance' (type name or exception type expected)");
}

bool hasattr(const sol::object& value, const sol::object& key) {
    sol::type type = value.get_type();

    // Strings index into the string library through their metatable
    if ((type != sol::type::table && type != sol::type::string) || key.get_type() == sol::type::lua_nil ||
        !key.valid()) {
        return false;
    }

    lua_State* lua = value.lua_state();

    value.push(lua);
    key.push(lua);
    lua_gettable(lua, -2);
    bool present = !lua_isnil(lua, -1);
    lua_pop(lua, 2);

    return present;
}

} // namespace

SandboxEnvironment::SandboxEnvironment(std::size_t memory_limit_bytes)
    : budget_{memory_limit_bytes}
    , lua_{sol::default_at_panic, &MemoryBudget::allocate, &budget_}
    , scope_{lua_, sol::create} {
    lua_.open_libraries(sol::lib::base, sol::lib::math, sol::lib::string, sol::lib::table, sol::lib::utf8);

    bind_base_functions();
    bind_libraries();
    bind_host_builtins();
    bind_exception_types();
}

void SandboxEnvironment::bind_base_functions() {
    for (std::string_view name : CAPABILITIES.base_functions) {
        auto func = lua_.get<sol::object>(name);
        DEBUG_ASSERT(func.get_type() == sol::type::function, "base function missing from a fresh state", name);

        scope_[name] = func;
    }
}

void SandboxEnvironment::bind_libraries() {
    for (const LibraryGrant& grant : CAPABILITIES.libraries) {
        auto full = lua_.get<sol::table>(grant.name);
        sol::table restricted = lua_.create_table();

        for (std::string_view member : grant.members) {
            auto obj = full.get<sol::object>(member);
            DEBUG_ASSERT(obj.valid() && obj.get_type() != sol::type::lua_nil, "library member missing", grant.name,
                         member);

            restricted[member] = obj;
        }

        scope_[grant.name] = restricted;
    }

    for (const AliasGrant& alias : CAPABILITIES.aliases) {
        auto library = scope_.get<sol::table>(alias.library);
        scope_[alias.name] = library.get<sol::object>(alias.member);
    }

    // Method syntax on strings ("abc"):upper() goes through the string metatable, which would
    // otherwise still lead to the full string library
    lua_State* lua = lua_.lua_state();
    auto restricted_string = scope_.get<sol::table>("string");

    lua_pushliteral(lua, "");
    lua_getmetatable(lua, -1);
    restricted_string.push(lua);
    lua_setfield(lua, -2, "__index");
    lua_pop(lua, 2);
}

void SandboxEnvironment::bind_host_builtins() {
    for (std::string_view name : CAPABILITIES.host_builtins) {
        if (name == "isinstance") {
            scope_.set_function(name, &isinstance);
        } else if (name == "hasattr") {
            scope_.set_function(name, &hasattr);
        } else {
            UNREACHABLE("host builtin has no implementation", name);
        }
    }
}

void SandboxEnvironment::bind_exception_types() {
    for (const ExceptionGrant& grant : CAPABILITIES.exception_types) {
        std::optional<sol::table> base;

        if (!grant.base.empty()) {
            base = scope_.get<sol::table>(grant.base);
        }

        scope_[grant.name] = make_exception_type(lua_, grant.name, base);
    }
}

std::unique_ptr<SandboxEnvironment> build_sandbox_context(std::size_t memory_limit_bytes) {
    return std::make_unique<SandboxEnvironment>(memory_limit_bytes);
}

bool is_exception_type(const sol::object& obj) {
    if (obj.get_type() != sol::type::table) {
        return false;
    }

    auto table = obj.as<sol::table>();

    return table.raw_get<sol::object>("__instance").get_type() == sol::type::table &&
           table.raw_get<sol::object>("__name").get_type() == sol::type::string;
}

bool is_exception_instance(const sol::object& value, const sol::table& type) {
    std::optional<sol::table> current = exception_type_of(value);

    while (current) {
        if (raw_equal(*current, type)) {
            return true;
        }

        auto base = current->raw_get<sol::optional<sol::table>>("__base");
        current = base ? std::optional<sol::table>{*base} : std::nullopt;
    }

    return false;
}

std::optional<std::string> describe_exception(const sol::object& obj) {
    if (!exception_type_of(obj)) {
        return std::nullopt;
    }

    return exception_to_string(obj.as<sol::table>());
}

} // namespace lunajudge::sandbox
