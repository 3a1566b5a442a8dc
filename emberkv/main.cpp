#include "config/server_config.h"
#include "engine/keyspace.h"
#include "engine/pubsub.h"
#include "engine/snapshot.h"
#include "server/dispatcher.h"
#include "server/server_instance.h"
#include "server/snapshot_scheduler.h"
#include "shared/event_loop.h"
#include "shared/logging.h"

#include <csignal>
#include <iostream>
#include <memory>
#include <mutex>
#include <chrono>
#include <string>
#include <unistd.h>

static int g_signal_write_fd = -1;

static void signal_handler(int)
{
    if (g_signal_write_fd >= 0)
    {
        char c = 1;
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-result"
        write(g_signal_write_fd, &c, 1);
#pragma GCC diagnostic pop
    }
}

int main(int argc, char** argv)
{
    server_config cfg;
    std::string error;
    if (!load_server_config(argc, argv, cfg, error))
    {
        LOG_ERROR("config: " + error);
        std::cerr << config_usage();
        return 1;
    }
    if (cfg.show_help)
    {
        std::cout << config_usage();
        return 0;
    }

    logger::g_level = cfg.level;

    auto ks = make_shared_keyspace();
    ks->store.memory().set_max_memory(cfg.maxmemory);
    ks->store.memory().set_eviction(cfg.maxmemory_policy);

    auto snap = std::make_shared<snapshot>(cfg.dbfilename);
    {
        std::unique_lock lock(ks->mutex);
        load_outcome outcome = snap->load(ks->store);
        LOG_INFO(std::string("keyspace loaded (") + load_outcome_name(outcome) + ", " +
                 std::to_string(ks->store.size()) + " keys)");
    }

    auto pubsub = std::make_shared<pubsub_registry>();
    dispatcher disp(ks, pubsub, snap, cfg.requirepass);

    event_loop loop;
    if (!loop.init())
    {
        LOG_ERROR("failed to init event loop");
        return 1;
    }

    server_instance server(disp, cfg.bind, cfg.port);
    server.set_max_connections(cfg.max_connections);
    if (!server.setup(loop))
        return 1;

    snapshot_scheduler scheduler(ks, snap, std::chrono::seconds(cfg.save_interval));
    scheduler.start();

    g_signal_write_fd = loop.get_signal_write_fd();

    // Broken pipes surface as -EPIPE in write completions instead
    signal(SIGPIPE, SIG_IGN);

    struct sigaction sa{};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);

    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    LOG_INFO(std::string("emberkv ") + EMBERKV_VERSION + " started (maxmemory " +
             (cfg.maxmemory ? format_bytes(cfg.maxmemory) : std::string("unlimited")) +
             ", policy " + policy_name(cfg.maxmemory_policy) + ")");

    loop.run();

    g_signal_write_fd = -1;

    server.teardown(loop);
    // Joins the background thread and writes the final snapshot
    scheduler.stop();

    LOG_INFO("emberkv stopped");
    return 0;
}
