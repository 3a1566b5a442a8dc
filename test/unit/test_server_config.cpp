#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "../../emberkv/config/server_config.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace
{
    // argv storage for the flag parsers
    struct args
    {
        std::vector<std::string> storage;
        std::vector<char*> ptrs;

        args(std::initializer_list<const char*> list)
        {
            storage.emplace_back("emberkv");
            for (const char* s : list)
                storage.emplace_back(s);
            for (auto& s : storage)
                ptrs.push_back(s.data());
            ptrs.push_back(nullptr);
        }

        int argc() const { return static_cast<int>(storage.size()); }
        char** argv() { return ptrs.data(); }
    };

    struct lua_file
    {
        std::string path;

        explicit lua_file(const std::string& body)
        {
            static int counter = 0;
            path = (fs::temp_directory_path() /
                    ("emberkv_config_test_" + std::to_string(::getpid()) + "_" +
                     std::to_string(counter++) + ".lua")).string();
            std::ofstream(path, std::ios::trunc) << body;
        }

        ~lua_file()
        {
            std::error_code ec;
            fs::remove(path, ec);
        }
    };
}

TEST_CASE("parse_memory_size")
{
    size_t out = 0;
    CHECK(parse_memory_size("0", out));
    CHECK(out == 0);
    CHECK(parse_memory_size("1048576", out));
    CHECK(out == 1048576);
    CHECK(parse_memory_size("512b", out));
    CHECK(out == 512);
    CHECK(parse_memory_size("64kb", out));
    CHECK(out == 64 * 1024);
    CHECK(parse_memory_size("64K", out));
    CHECK(out == 64 * 1024);
    CHECK(parse_memory_size("100mb", out));
    CHECK(out == 100ULL * 1024 * 1024);
    CHECK(parse_memory_size("2GB", out));
    CHECK(out == 2ULL * 1024 * 1024 * 1024);
    CHECK(parse_memory_size("1g", out));
    CHECK(out == 1024ULL * 1024 * 1024);

    CHECK_FALSE(parse_memory_size("", out));
    CHECK_FALSE(parse_memory_size("mb", out));
    CHECK_FALSE(parse_memory_size("10tb", out));
    CHECK_FALSE(parse_memory_size("-5mb", out));
    CHECK_FALSE(parse_memory_size("1.5mb", out));
    CHECK_FALSE(parse_memory_size("99999999999999999999gb", out));
}

TEST_CASE("config defaults")
{
    server_config cfg;
    CHECK(cfg.bind == "127.0.0.1");
    CHECK(cfg.port == 6379);
    CHECK(cfg.requirepass.empty());
    CHECK(cfg.dbfilename == "dump.ekv");
    CHECK(cfg.save_interval == 60);
    CHECK(cfg.maxmemory == 0);
    CHECK(cfg.maxmemory_policy == evict_none);
    CHECK(cfg.level == log_info);
}

TEST_CASE("apply_config_flags")
{
    server_config cfg;
    std::string error;

    SUBCASE("every setting")
    {
        args a{"--bind", "0.0.0.0", "--port", "7000", "--requirepass", "pw",
               "--dbfilename", "/tmp/x.ekv", "--save-interval", "0",
               "--maxmemory", "64mb", "--maxmemory-policy", "allkeys-lru",
               "--log-level", "debug", "--max-connections", "100"};
        REQUIRE(apply_config_flags(a.argc(), a.argv(), cfg, error));
        CHECK(cfg.bind == "0.0.0.0");
        CHECK(cfg.port == 7000);
        CHECK(cfg.requirepass == "pw");
        CHECK(cfg.dbfilename == "/tmp/x.ekv");
        CHECK(cfg.save_interval == 0);
        CHECK(cfg.maxmemory == 64ULL * 1024 * 1024);
        CHECK(cfg.maxmemory_policy == evict_allkeys_lru);
        CHECK(cfg.level == log_debug);
        CHECK(cfg.max_connections == 100);
    }

    SUBCASE("help")
    {
        args a{"-h"};
        REQUIRE(apply_config_flags(a.argc(), a.argv(), cfg, error));
        CHECK(cfg.show_help);
    }

    SUBCASE("unknown flag")
    {
        args a{"--colour", "red"};
        CHECK_FALSE(apply_config_flags(a.argc(), a.argv(), cfg, error));
        CHECK(error == "unknown flag '--colour'");
    }

    SUBCASE("missing value")
    {
        args a{"--port"};
        CHECK_FALSE(apply_config_flags(a.argc(), a.argv(), cfg, error));
        CHECK(error == "--port requires a value");
    }

    SUBCASE("bare argument")
    {
        args a{"stray"};
        CHECK_FALSE(apply_config_flags(a.argc(), a.argv(), cfg, error));
        CHECK(error == "unexpected argument 'stray'");
    }

    SUBCASE("bad values")
    {
        args port{"--port", "70000"};
        CHECK_FALSE(apply_config_flags(port.argc(), port.argv(), cfg, error));
        CHECK(error == "invalid port '70000'");

        args policy{"--maxmemory-policy", "lru"};
        CHECK_FALSE(apply_config_flags(policy.argc(), policy.argv(), cfg, error));
        CHECK(error == "unknown eviction policy 'lru'");

        args level{"--log-level", "loud"};
        CHECK_FALSE(apply_config_flags(level.argc(), level.argv(), cfg, error));

        args mem{"--maxmemory", "lots"};
        CHECK_FALSE(apply_config_flags(mem.argc(), mem.argv(), cfg, error));
    }
}

TEST_CASE("load_config_file")
{
    server_config cfg;
    std::string error;

    SUBCASE("string and integer values")
    {
        lua_file f(
            "config = {\n"
            "    port = 7001,\n"
            "    maxmemory = \"128mb\",\n"
            "    maxmemory_policy = \"volatile-lfu\",\n"
            "    save_interval = 30,\n"
            "    requirepass = \"hunter2\",\n"
            "}\n");
        REQUIRE(load_config_file(f.path, cfg, error));
        CHECK(cfg.port == 7001);
        CHECK(cfg.maxmemory == 128ULL * 1024 * 1024);
        CHECK(cfg.maxmemory_policy == evict_volatile_lfu);
        CHECK(cfg.save_interval == 30);
        CHECK(cfg.requirepass == "hunter2");
        // Untouched keys keep their value
        CHECK(cfg.bind == "127.0.0.1");
    }

    SUBCASE("script logic runs before the table is read")
    {
        lua_file f(
            "local mb = 1024 * 1024\n"
            "config = { maxmemory = 16 * mb }\n");
        REQUIRE(load_config_file(f.path, cfg, error));
        CHECK(cfg.maxmemory == 16ULL * 1024 * 1024);
    }

    SUBCASE("no config table keeps defaults")
    {
        lua_file f("x = 1\n");
        REQUIRE(load_config_file(f.path, cfg, error));
        CHECK(cfg.port == 6379);
    }

    SUBCASE("unknown key is an error")
    {
        lua_file f("config = { colour = \"red\" }\n");
        CHECK_FALSE(load_config_file(f.path, cfg, error));
        CHECK(error.find("unknown setting 'colour'") != std::string::npos);
    }

    SUBCASE("wrong value types")
    {
        lua_file neg("config = { port = -1 }\n");
        CHECK_FALSE(load_config_file(neg.path, cfg, error));

        lua_file frac("config = { save_interval = 1.5 }\n");
        CHECK_FALSE(load_config_file(frac.path, cfg, error));

        lua_file tbl("config = { bind = {} }\n");
        CHECK_FALSE(load_config_file(tbl.path, cfg, error));
    }

    SUBCASE("syntax error")
    {
        lua_file f("config = {\n");
        CHECK_FALSE(load_config_file(f.path, cfg, error));
        CHECK(error.find("error loading") == 0);
    }

    SUBCASE("missing file")
    {
        CHECK_FALSE(load_config_file("/nonexistent/emberkv.lua", cfg, error));
        CHECK(error == "cannot open config file /nonexistent/emberkv.lua");
    }
}

TEST_CASE("load_server_config precedence")
{
    lua_file f("config = { port = 7100, bind = \"0.0.0.0\" }\n");
    server_config cfg;
    std::string error;

    SUBCASE("flags override the file")
    {
        ::unsetenv("EMBERKV_CONFIG");
        args a{"--port", "7200", "--config", f.path.c_str()};
        REQUIRE(load_server_config(a.argc(), a.argv(), cfg, error));
        CHECK(cfg.config_path == f.path);
        CHECK(cfg.port == 7200);
        CHECK(cfg.bind == "0.0.0.0");
    }

    SUBCASE("environment names the file")
    {
        ::setenv("EMBERKV_CONFIG", f.path.c_str(), 1);
        args a{};
        REQUIRE(load_server_config(a.argc(), a.argv(), cfg, error));
        CHECK(cfg.port == 7100);
        ::unsetenv("EMBERKV_CONFIG");
    }

    SUBCASE("--config beats the environment")
    {
        ::setenv("EMBERKV_CONFIG", "/nonexistent/other.lua", 1);
        args a{"--config", f.path.c_str()};
        REQUIRE(load_server_config(a.argc(), a.argv(), cfg, error));
        CHECK(cfg.port == 7100);
        ::unsetenv("EMBERKV_CONFIG");
    }

    SUBCASE("state is reset between loads")
    {
        ::unsetenv("EMBERKV_CONFIG");
        cfg.port = 1;
        args a{};
        REQUIRE(load_server_config(a.argc(), a.argv(), cfg, error));
        CHECK(cfg.port == 6379);
    }
}
