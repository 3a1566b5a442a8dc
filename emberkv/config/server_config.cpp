#include "server_config.h"
#include "../shared/command_hashing.h"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <optional>
#include <sol/sol.hpp>

namespace
{
    bool parse_uint(std::string_view sv, uint64_t max, uint64_t& out)
    {
        if (sv.empty())
            return false;
        auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
        return ec == std::errc{} && ptr == sv.data() + sv.size() && out <= max;
    }

    bool set_port(std::string_view sv, server_config& cfg, std::string& error)
    {
        uint64_t v;
        if (!parse_uint(sv, 65535, v))
        {
            error = "invalid port '" + std::string(sv) + "'";
            return false;
        }
        cfg.port = static_cast<uint16_t>(v);
        return true;
    }

    bool set_policy(std::string_view sv, server_config& cfg, std::string& error)
    {
        auto policy = parse_eviction_policy(sv);
        if (!policy)
        {
            error = "unknown eviction policy '" + std::string(sv) + "'";
            return false;
        }
        cfg.maxmemory_policy = *policy;
        return true;
    }

    bool set_log_level(std::string_view sv, server_config& cfg, std::string& error)
    {
        if (!parse_log_level(sv, cfg.level))
        {
            error = "unknown log level '" + std::string(sv) + "'";
            return false;
        }
        return true;
    }

    bool set_maxmemory(std::string_view sv, server_config& cfg, std::string& error)
    {
        if (!parse_memory_size(sv, cfg.maxmemory))
        {
            error = "invalid maxmemory '" + std::string(sv) + "' (use kb/mb/gb suffix)";
            return false;
        }
        return true;
    }

    bool set_u32(std::string_view name, std::string_view sv, uint32_t& out, std::string& error)
    {
        uint64_t v;
        if (!parse_uint(sv, std::numeric_limits<uint32_t>::max(), v))
        {
            error = "invalid " + std::string(name) + " '" + std::string(sv) + "'";
            return false;
        }
        out = static_cast<uint32_t>(v);
        return true;
    }

    // Numbers in the Lua table are accepted where a string would be
    std::optional<std::string> as_text(const sol::object& obj)
    {
        switch (obj.get_type())
        {
            case sol::type::string:
                return obj.as<std::string>();
            case sol::type::number:
            {
                double d = obj.as<double>();
                if (d < 0 || d != static_cast<double>(static_cast<uint64_t>(d)))
                    return std::nullopt;
                return std::to_string(static_cast<uint64_t>(d));
            }
            default:
                return std::nullopt;
        }
    }

    bool apply_setting(std::string_view key, std::string_view val, server_config& cfg, std::string& error)
    {
        switch (fnv1a(key))
        {
            case fnv1a("bind"):             cfg.bind = val; return true;
            case fnv1a("port"):             return set_port(val, cfg, error);
            case fnv1a("requirepass"):      cfg.requirepass = val; return true;
            case fnv1a("dbfilename"):       cfg.dbfilename = val; return true;
            case fnv1a("save_interval"):    return set_u32(key, val, cfg.save_interval, error);
            case fnv1a("maxmemory"):        return set_maxmemory(val, cfg, error);
            case fnv1a("maxmemory_policy"): return set_policy(val, cfg, error);
            case fnv1a("log_level"):        return set_log_level(val, cfg, error);
            case fnv1a("max_connections"):  return set_u32(key, val, cfg.max_connections, error);
            default:
                error = "unknown setting '" + std::string(key) + "'";
                return false;
        }
    }
}

bool parse_memory_size(std::string_view sv, size_t& out)
{
    if (sv.empty())
        return false;

    std::string suffix;
    while (!sv.empty() && !(sv.back() >= '0' && sv.back() <= '9'))
    {
        suffix.insert(suffix.begin(), ascii_lower(sv.back()));
        sv.remove_suffix(1);
    }

    uint64_t multiplier;
    switch (fnv1a(suffix))
    {
        case fnv1a(""):
        case fnv1a("b"):  multiplier = 1; break;
        case fnv1a("k"):
        case fnv1a("kb"): multiplier = 1024; break;
        case fnv1a("m"):
        case fnv1a("mb"): multiplier = 1024 * 1024; break;
        case fnv1a("g"):
        case fnv1a("gb"): multiplier = 1024ULL * 1024 * 1024; break;
        default:
            return false;
    }

    uint64_t val;
    if (!parse_uint(sv, std::numeric_limits<uint64_t>::max() / multiplier, val))
        return false;
    out = static_cast<size_t>(val * multiplier);
    return true;
}

bool load_config_file(const std::string& path, server_config& cfg, std::string& error)
{
    std::ifstream check(path);
    if (!check.good())
    {
        error = "cannot open config file " + path;
        return false;
    }
    check.close();

    sol::state lua;
    lua.open_libraries(sol::lib::base, sol::lib::string, sol::lib::math);

    auto result = lua.safe_script_file(path, sol::script_pass_on_error);
    if (!result.valid())
    {
        sol::error err = result;
        error = "error loading " + path + ": " + err.what();
        return false;
    }

    sol::optional<sol::table> config = lua["config"];
    if (!config)
    {
        LOG_WARN(path + " defines no config table, using defaults");
        return true;
    }

    for (const auto& [k, v] : *config)
    {
        if (k.get_type() != sol::type::string)
        {
            error = path + ": config keys must be strings";
            return false;
        }
        std::string key = k.as<std::string>();

        auto text = as_text(v);
        if (!text)
        {
            error = path + ": config." + key + " must be a string or a non-negative integer";
            return false;
        }
        if (!apply_setting(key, *text, cfg, error))
        {
            error = path + ": " + error;
            return false;
        }
    }
    return true;
}

bool apply_config_flags(int argc, char** argv, server_config& cfg, std::string& error)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];

        if (arg == "--help" || arg == "-h")
        {
            cfg.show_help = true;
            continue;
        }

        if (arg.size() < 3 || arg.substr(0, 2) != "--")
        {
            error = "unexpected argument '" + std::string(arg) + "'";
            return false;
        }
        if (i + 1 >= argc)
        {
            error = std::string(arg) + " requires a value";
            return false;
        }
        std::string_view val = argv[++i];

        // Read before the other flags by load_server_config
        if (arg == "--config")
            continue;

        std::string key(arg.substr(2));
        for (auto& c : key)
            if (c == '-')
                c = '_';

        if (!apply_setting(key, val, cfg, error))
        {
            if (error.rfind("unknown setting", 0) == 0)
                error = "unknown flag '" + std::string(arg) + "'";
            return false;
        }
    }
    return true;
}

bool load_server_config(int argc, char** argv, server_config& cfg, std::string& error)
{
    cfg = server_config{};

    const char* env = std::getenv("EMBERKV_CONFIG");
    if (env && env[0])
        cfg.config_path = env;

    for (int i = 1; i + 1 < argc; ++i)
    {
        if (std::string_view(argv[i]) == "--config")
            cfg.config_path = argv[i + 1];
    }

    if (!cfg.config_path.empty() && !load_config_file(cfg.config_path, cfg, error))
        return false;

    return apply_config_flags(argc, argv, cfg, error);
}

const char* config_usage()
{
    return
        "usage: emberkv [options]\n"
        "  --config <path>            Lua file defining a `config` table\n"
        "  --bind <addr>              listen address (127.0.0.1)\n"
        "  --port <n>                 listen port (6379)\n"
        "  --requirepass <pw>         require AUTH before other commands\n"
        "  --dbfilename <path>        snapshot file (dump.ekv)\n"
        "  --save-interval <sec>      background snapshot period, 0 disables (60)\n"
        "  --maxmemory <size>         memory budget, e.g. 64mb; 0 is unlimited\n"
        "  --maxmemory-policy <name>  noeviction, allkeys-lru, allkeys-lfu, volatile-lru,\n"
        "                             volatile-lfu, allkeys-random, volatile-random\n"
        "  --log-level <level>        debug, info, warn, error (info)\n"
        "  --max-connections <n>      0 is unlimited\n";
}
