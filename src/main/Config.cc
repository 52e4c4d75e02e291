#include "main/Config.hh"

#include "IoUtility.hh"
#include "Utility.hh"

#include <array>
#include <cerrno>
#include <cstring>
#include <exception>
#include <iostream>
#include <new>
#include <stdexcept>
#include <string>

#include <boost/format.hpp>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

namespace BidEngine {
namespace Main {

using namespace std::string_view_literals;

namespace {

constexpr auto SYSTEM = "system"sv;
constexpr auto DEALER = "dealer"sv;
constexpr auto LOG_LEVEL = "log_level"sv;

class LuaPopGuard {
public:
    LuaPopGuard(lua_State* lua);
    ~LuaPopGuard();
private:
    lua_State* lua;
};

LuaPopGuard::LuaPopGuard(lua_State* lua) :
    lua {lua}
{
}

LuaPopGuard::~LuaPopGuard()
{
    lua_pop(lua, 1);
}

constexpr auto READ_CHUNK_SIZE = 4096;
struct LuaStreamReaderArgs {
    LuaStreamReaderArgs(std::istream& in) : in {in}, buf {} {};
    std::istream& in;
    std::array<char, READ_CHUNK_SIZE> buf;
};

extern "C"
const char* config_lua_reader(
    lua_State*, void* data, std::size_t* size)
{
    auto& args = *static_cast<LuaStreamReaderArgs*>(data);
    if (args.in) {
        errno = 0;
        args.in.read(args.buf.data(), args.buf.size());
        if (args.in.bad()) {
            // Exceptions must not cross the Lua library
            log(LogLevel::WARNING, "Failed to read config: %s", strerror(errno));
        } else {
            *size = args.in.gcount();
            return args.buf.data();
        }
    }
    *size = 0;
    return nullptr;
}

void loadAndExecuteFromStream(lua_State* lua, std::istream& in)
{
    std::istream::sentry s {in, true};
    if (s) {
        const auto reader_args = std::make_unique<LuaStreamReaderArgs>(in);
        auto error = lua_load(
            lua, config_lua_reader, reader_args.get(), "config", nullptr);
        if (!error) {
            // The Lua library cannot recover from failing allocations thrown
            // as exceptions
            const auto out_of_memory_handler =
                std::set_new_handler(std::terminate);
            error = lua_pcall(lua, 0, 0, 0);
            std::set_new_handler(out_of_memory_handler);
        }
        if (error) {
            log(LogLevel::ERROR, "Error while running config script: %s",
                lua_tostring(lua, -1));
            throw std::runtime_error {"Could not process config"};
        }
    } else {
        log(LogLevel::ERROR, "Bad stream while reading config: %s", strerror(errno));
        throw std::runtime_error {"Failed to read config"};
    }
}

std::optional<std::string> getString(lua_State* lua, std::string_view key)
{
    lua_getglobal(lua, key.data());
    LuaPopGuard guard {lua};
    if (lua_type(lua, -1) == LUA_TSTRING) {
        return lua_tostring(lua, -1);
    } else if (!lua_isnoneornil(lua, -1)) {
        throw std::runtime_error {
            boost::str(boost::format("Expected string: %s") % key)};
    }
    return std::nullopt;
}

}

class Config::Impl {
public:

    Impl();
    Impl(std::istream& in);

    std::optional<std::string_view> getSystemPath() const;
    Position getDealer() const;
    std::optional<LogLevel> getLogLevel() const;

private:

    std::optional<std::string> systemPath {};
    Position dealer {Positions::NORTH};
    std::optional<LogLevel> logLevel {};
};

Config::Impl::Impl() = default;

Config::Impl::Impl(std::istream& in)
{
    log(LogLevel::INFO, "Reading configs");

    const auto& closer = lua_close;
    const auto lua = std::unique_ptr<lua_State, decltype(closer)> {
        luaL_newstate(), closer};
    if (!lua) {
        throw std::bad_alloc {};
    }
    luaL_openlibs(lua.get());

    loadAndExecuteFromStream(lua.get(), in);

    systemPath = getString(lua.get(), SYSTEM);
    if (const auto dealer_name = getString(lua.get(), DEALER)) {
        if (const auto position = positionFromString(*dealer_name)) {
            dealer = *position;
        } else {
            throw std::runtime_error {
                boost::str(
                    boost::format("Invalid dealer: %s") % *dealer_name)};
        }
    }
    if (const auto level_name = getString(lua.get(), LOG_LEVEL)) {
        logLevel = logLevelFromString(*level_name);
        if (!logLevel) {
            throw std::runtime_error {
                boost::str(
                    boost::format("Invalid log level: %s") % *level_name)};
        }
    }

    log(LogLevel::INFO, "Reading configs completed");
}

std::optional<std::string_view> Config::Impl::getSystemPath() const
{
    return systemPath;
}

Position Config::Impl::getDealer() const
{
    return dealer;
}

std::optional<LogLevel> Config::Impl::getLogLevel() const
{
    return logLevel;
}

Config::Config() :
    impl {std::make_unique<Impl>()}
{
}

Config::Config(std::istream& in) :
    impl {std::make_unique<Impl>(in)}
{
}

Config::Config(Config&&) = default;

Config::~Config() = default;

Config& Config::operator=(Config&&) = default;

std::optional<std::string_view> Config::getSystemPath() const
{
    return dereference(impl).getSystemPath();
}

Position Config::getDealer() const
{
    return dereference(impl).getDealer();
}

std::optional<LogLevel> Config::getLogLevel() const
{
    return dereference(impl).getLogLevel();
}

Config configFromPath(const std::string_view path)
{
    if (path.empty()) {
        return {};
    } else {
        errno = 0;
        return processStreamFromPath(
            path, [](auto& in) { return Config {in}; });
    }
}

}
}
