#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "../engine/keyspace.h"
#include "../engine/snapshot.h"

// Background thread that snapshots the keyspace every interval. The image
// is encoded under the shared lock; the file write happens after release.
class snapshot_scheduler
{
public:
    snapshot_scheduler(keyspace_handle ks, std::shared_ptr<snapshot> snap,
                       std::chrono::seconds interval);
    ~snapshot_scheduler();

    snapshot_scheduler(const snapshot_scheduler&) = delete;
    snapshot_scheduler& operator=(const snapshot_scheduler&) = delete;

    // No-op for a zero interval
    void start();
    // Wakes and joins the thread, then writes one last snapshot
    void stop();

    // One encode + write cycle; false on a failed write
    bool save_now();

    bool running() const { return m_running.load(std::memory_order_acquire); }
    uint64_t completed_saves() const { return m_saves.load(std::memory_order_relaxed); }

private:
    void run_loop();

    keyspace_handle m_keyspace;
    std::shared_ptr<snapshot> m_snapshot;
    std::chrono::seconds m_interval;

    std::atomic<bool> m_running{false};
    std::atomic<uint64_t> m_saves{0};
    std::mutex m_wake_mutex;
    std::condition_variable m_wake;
    std::thread m_thread;
};
