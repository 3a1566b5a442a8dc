#include "snapshot_scheduler.h"
#include "../shared/logging.h"

#include <shared_mutex>
#include <string>

snapshot_scheduler::snapshot_scheduler(keyspace_handle ks, std::shared_ptr<snapshot> snap,
                                       std::chrono::seconds interval)
    : m_keyspace(std::move(ks))
    , m_snapshot(std::move(snap))
    , m_interval(interval)
{
}

snapshot_scheduler::~snapshot_scheduler()
{
    bool was = m_running.exchange(false, std::memory_order_acq_rel);
    m_wake.notify_all();
    if (was && m_thread.joinable())
        m_thread.join();
}

void snapshot_scheduler::start()
{
    if (m_interval.count() <= 0 || !m_snapshot)
        return;
    if (m_running.exchange(true, std::memory_order_acq_rel))
        return;

    m_thread = std::thread(&snapshot_scheduler::run_loop, this);
    LOG_INFO("snapshot scheduler started (every " + std::to_string(m_interval.count()) + "s)");
}

void snapshot_scheduler::stop()
{
    bool was = m_running.exchange(false, std::memory_order_acq_rel);
    {
        std::lock_guard lock(m_wake_mutex);
    }
    m_wake.notify_all();
    if (was && m_thread.joinable())
        m_thread.join();

    if (m_snapshot)
        save_now();
}

bool snapshot_scheduler::save_now()
{
    if (!m_snapshot)
        return false;

    std::string bytes;
    size_t keys = 0;
    {
        std::shared_lock lock(m_keyspace->mutex);
        bytes = snapshot::encode(m_keyspace->store);
        keys = m_keyspace->store.size();
    }

    snapshot_error err = m_snapshot->write_atomic(bytes);
    if (err != snap_none)
    {
        LOG_ERROR(std::string("snapshot save failed: ") + snapshot_error_name(err));
        return false;
    }

    m_saves.fetch_add(1, std::memory_order_relaxed);
    LOG_INFO("snapshot saved (" + std::to_string(keys) + " keys)");
    return true;
}

void snapshot_scheduler::run_loop()
{
    std::unique_lock lock(m_wake_mutex);
    while (m_running.load(std::memory_order_acquire))
    {
        m_wake.wait_for(lock, m_interval, [this]
        {
            return !m_running.load(std::memory_order_acquire);
        });
        if (!m_running.load(std::memory_order_acquire))
            break;

        lock.unlock();
        save_now();
        lock.lock();
    }
}
