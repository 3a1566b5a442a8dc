#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>

#include "../engine/memory_manager.h"
#include "../shared/logging.h"

struct server_config
{
    std::string bind{"127.0.0.1"};
    uint16_t port{6379};
    // Empty disables AUTH
    std::string requirepass;
    std::string dbfilename{"dump.ekv"};
    // Seconds between background snapshots; 0 disables them
    uint32_t save_interval{60};
    // Bytes; 0 means unlimited
    size_t maxmemory{0};
    eviction_policy maxmemory_policy{evict_none};
    log_level level{log_info};
    // 0 means unlimited
    uint32_t max_connections{0};

    std::string config_path;
    bool show_help{false};
};

// "1048576", "512kb", "64mb", "2gb" (also b/k/m/g, any case)
bool parse_memory_size(std::string_view sv, size_t& out);

// Reads the `config` table of a Lua script into cfg. Keys left out keep
// their current value.
bool load_config_file(const std::string& path, server_config& cfg, std::string& error);

// Applies --flag value pairs over cfg
bool apply_config_flags(int argc, char** argv, server_config& cfg, std::string& error);

// Defaults, then the config file (--config or EMBERKV_CONFIG), then flags
bool load_server_config(int argc, char** argv, server_config& cfg, std::string& error);

const char* config_usage();
