#include "snapshot.h"
#include "keyspace.h"
#include "../shared/logging.h"
#include "../shared/scoped_fd.h"

#include <openssl/sha.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <shared_mutex>
#include <vector>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

const char* snapshot_error_name(snapshot_error err)
{
    switch (err)
    {
        case snap_none:                return "ok";
        case snap_io:                  return "i/o error";
        case snap_truncated:           return "truncated";
        case snap_bad_magic:           return "bad magic";
        case snap_unsupported_version: return "unsupported version";
        case snap_checksum_mismatch:   return "checksum mismatch";
        case snap_malformed:           return "malformed";
    }
    return "unknown";
}

const char* load_outcome_name(load_outcome outcome)
{
    switch (outcome)
    {
        case load_from_primary: return "primary";
        case load_from_backup:  return "backup";
        case load_fresh:        return "fresh";
        case load_degraded:     return "degraded";
    }
    return "unknown";
}

namespace
{
    void put_u8(std::string& out, uint8_t v)
    {
        out.push_back(static_cast<char>(v));
    }

    void put_u32(std::string& out, uint32_t v)
    {
        out.append(reinterpret_cast<const char*>(&v), sizeof(v));
    }

    void put_i64(std::string& out, int64_t v)
    {
        out.append(reinterpret_cast<const char*>(&v), sizeof(v));
    }

    void put_str(std::string& out, std::string_view s)
    {
        put_u32(out, static_cast<uint32_t>(s.size()));
        out.append(s.data(), s.size());
    }

    void put_value(std::string& out, const value& v)
    {
        switch (type_of(v))
        {
            case type_string:
                put_str(out, std::get<std::string>(v));
                break;
            case type_integer:
                put_i64(out, std::get<int64_t>(v));
                break;
            case type_list:
            {
                const auto& list = std::get<list_value>(v);
                put_u32(out, static_cast<uint32_t>(list.size()));
                for (const auto& e : list)
                    put_str(out, e);
                break;
            }
            case type_set:
            {
                const auto& set = std::get<set_value>(v);
                put_u32(out, static_cast<uint32_t>(set.size()));
                for (const auto& m : set)
                    put_str(out, m);
                break;
            }
            case type_hash:
            {
                const auto& hash = std::get<hash_value>(v);
                put_u32(out, static_cast<uint32_t>(hash.size()));
                for (const auto& [field, val] : hash)
                {
                    put_str(out, field);
                    put_str(out, val);
                }
                break;
            }
        }
    }

    // Bounds-checked cursor over an image; every getter fails on a short read
    struct reader
    {
        std::string_view buf;
        size_t pos = 0;

        bool u8(uint8_t& v)
        {
            if (buf.size() - pos < 1)
                return false;
            v = static_cast<uint8_t>(buf[pos++]);
            return true;
        }

        bool u32(uint32_t& v)
        {
            if (buf.size() - pos < sizeof(v))
                return false;
            std::memcpy(&v, buf.data() + pos, sizeof(v));
            pos += sizeof(v);
            return true;
        }

        bool i64(int64_t& v)
        {
            if (buf.size() - pos < sizeof(v))
                return false;
            std::memcpy(&v, buf.data() + pos, sizeof(v));
            pos += sizeof(v);
            return true;
        }

        bool str(std::string& s)
        {
            uint32_t len;
            if (!u32(len) || buf.size() - pos < len)
                return false;
            s.assign(buf.data() + pos, len);
            pos += len;
            return true;
        }
    };

    snapshot_error read_value(reader& r, uint8_t type, value& out)
    {
        switch (type)
        {
            case type_string:
            {
                std::string s;
                if (!r.str(s))
                    return snap_truncated;
                out = std::move(s);
                return snap_none;
            }
            case type_integer:
            {
                int64_t i;
                if (!r.i64(i))
                    return snap_truncated;
                out = i;
                return snap_none;
            }
            case type_list:
            {
                uint32_t count;
                if (!r.u32(count))
                    return snap_truncated;
                list_value list;
                for (uint32_t i = 0; i < count; ++i)
                {
                    std::string e;
                    if (!r.str(e))
                        return snap_truncated;
                    list.push_back(std::move(e));
                }
                out = std::move(list);
                return snap_none;
            }
            case type_set:
            {
                uint32_t count;
                if (!r.u32(count))
                    return snap_truncated;
                set_value set;
                for (uint32_t i = 0; i < count; ++i)
                {
                    std::string m;
                    if (!r.str(m))
                        return snap_truncated;
                    set.insert(std::move(m));
                }
                out = std::move(set);
                return snap_none;
            }
            case type_hash:
            {
                uint32_t count;
                if (!r.u32(count))
                    return snap_truncated;
                hash_value hash;
                for (uint32_t i = 0; i < count; ++i)
                {
                    std::string field, val;
                    if (!r.str(field) || !r.str(val))
                        return snap_truncated;
                    hash.insert_or_assign(std::move(field), std::move(val));
                }
                out = std::move(hash);
                return snap_none;
            }
            default:
                return snap_malformed;
        }
    }

    int64_t epoch_seconds_now()
    {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
}

snapshot::snapshot(std::string path)
    : m_path(std::move(path))
    , m_backup_path(m_path + ".bak")
    , m_temp_path(m_path + ".tmp")
{
}

std::string snapshot::checksum(std::string_view payload)
{
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(payload.data()), payload.size(), digest);

    static constexpr char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(SHA256_DIGEST_LENGTH * 2);
    for (unsigned char b : digest)
    {
        out.push_back(hex[b >> 4]);
        out.push_back(hex[b & 0x0f]);
    }
    return out;
}

// --- Serialization ---

std::string snapshot::encode(const keyspace& ks, bool with_checksum)
{
    auto now = ks.now();
    int64_t epoch_now = epoch_seconds_now();

    auto live = [&](const std::string& key) -> bool {
        auto eit = ks.expiries().find(key);
        return eit == ks.expiries().end() || now < eit->second;
    };

    std::vector<const data_map::value_type*> entries;
    entries.reserve(ks.size());
    for (const auto& entry : ks.data())
        if (live(entry.first))
            entries.push_back(&entry);

    std::string out;
    out.append(MAGIC, sizeof(MAGIC));
    put_u32(out, VERSION);

    put_u32(out, static_cast<uint32_t>(entries.size()));
    for (const auto* entry : entries)
    {
        put_u8(out, type_of(entry->second));
        put_str(out, entry->first);
        put_value(out, entry->second);
    }

    std::vector<std::pair<const std::string*, int64_t>> deadlines;
    for (const auto& [key, deadline] : ks.expiries())
    {
        if (deadline <= now)
            continue;
        // Round up so a key with a sub-second remainder still survives a reload
        auto remaining = std::chrono::ceil<std::chrono::seconds>(deadline - now).count();
        deadlines.emplace_back(&key, epoch_now + remaining);
    }

    put_u32(out, static_cast<uint32_t>(deadlines.size()));
    for (const auto& [key, epoch] : deadlines)
    {
        put_str(out, *key);
        put_i64(out, epoch);
    }

    size_t payload_end = out.size();
    put_u8(out, with_checksum ? 1 : 0);
    if (with_checksum)
        put_str(out, checksum(std::string_view(out.data(), payload_end)));

    return out;
}

snapshot_error snapshot::decode(std::string_view bytes, engine_clock::time_point now,
                                data_map& data, expiry_map& expiries, bool& had_checksum)
{
    had_checksum = false;
    data.clear();
    expiries.clear();

    if (bytes.empty())
        return snap_none;

    reader r{bytes};
    if (bytes.size() < sizeof(MAGIC))
        return snap_truncated;
    if (std::memcmp(bytes.data(), MAGIC, sizeof(MAGIC)) != 0)
        return snap_bad_magic;
    r.pos = sizeof(MAGIC);

    uint32_t version;
    if (!r.u32(version))
        return snap_truncated;
    if (version > VERSION)
        return snap_unsupported_version;

    data_map loaded;
    uint32_t entry_count;
    if (!r.u32(entry_count))
        return snap_truncated;
    for (uint32_t i = 0; i < entry_count; ++i)
    {
        uint8_t type;
        std::string key;
        if (!r.u8(type) || !r.str(key))
            return snap_truncated;

        value v;
        snapshot_error err = read_value(r, type, v);
        if (err != snap_none)
            return err;
        loaded.insert_or_assign(std::move(key), std::move(v));
    }

    std::vector<std::pair<std::string, int64_t>> deadlines;
    uint32_t expiry_count;
    if (!r.u32(expiry_count))
        return snap_truncated;
    for (uint32_t i = 0; i < expiry_count; ++i)
    {
        std::string key;
        int64_t epoch;
        if (!r.str(key) || !r.i64(epoch))
            return snap_truncated;
        deadlines.emplace_back(std::move(key), epoch);
    }

    size_t payload_end = r.pos;
    uint8_t has_checksum;
    if (!r.u8(has_checksum))
        return snap_truncated;
    if (has_checksum > 1)
        return snap_malformed;

    if (has_checksum)
    {
        std::string stored;
        if (!r.str(stored))
            return snap_truncated;
        if (stored != checksum(bytes.substr(0, payload_end)))
            return snap_checksum_mismatch;
        had_checksum = true;
    }

    if (r.pos != bytes.size())
        return snap_malformed;

    int64_t epoch_now = epoch_seconds_now();
    expiry_map loaded_expiry;
    for (auto& [key, epoch] : deadlines)
    {
        auto it = loaded.find(key);
        if (it == loaded.end())
            continue;

        int64_t remaining = epoch - epoch_now;
        if (remaining <= 0)
        {
            loaded.erase(it);
            continue;
        }
        loaded_expiry.insert_or_assign(std::move(key), now + std::chrono::seconds(remaining));
    }

    data = std::move(loaded);
    expiries = std::move(loaded_expiry);
    return snap_none;
}

// --- Files ---

snapshot_error snapshot::read_file(const std::string& file_path, std::string& out)
{
    std::ifstream file(file_path, std::ios::binary);
    if (!file)
        return snap_io;

    out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    if (file.bad())
        return snap_io;
    return snap_none;
}

snapshot_error snapshot::write_atomic(std::string_view bytes, bool backup_previous)
{
    std::lock_guard<std::mutex> lock(m_write_mutex);
    std::error_code ec;

    if (backup_previous && fs::exists(m_path, ec))
    {
        fs::copy_file(m_path, m_backup_path, fs::copy_options::overwrite_existing, ec);
        if (ec)
            LOG_WARN("snapshot: backup of " + m_path + " failed: " + ec.message());
    }

    scoped_fd fd(::open(m_temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (!fd)
    {
        LOG_ERROR("snapshot: cannot open " + m_temp_path + ": " + std::strerror(errno));
        return snap_io;
    }

    size_t written = 0;
    while (written < bytes.size())
    {
        ssize_t n = ::write(fd.get(), bytes.data() + written, bytes.size() - written);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            LOG_ERROR("snapshot: write to " + m_temp_path + " failed: " + std::strerror(errno));
            ::unlink(m_temp_path.c_str());
            return snap_io;
        }
        written += static_cast<size_t>(n);
    }

    if (::fsync(fd.get()) != 0)
    {
        LOG_ERROR("snapshot: fsync of " + m_temp_path + " failed: " + std::strerror(errno));
        ::unlink(m_temp_path.c_str());
        return snap_io;
    }
    if (fd.close() != 0)
    {
        LOG_ERROR("snapshot: close of " + m_temp_path + " failed: " + std::strerror(errno));
        ::unlink(m_temp_path.c_str());
        return snap_io;
    }

    if (::rename(m_temp_path.c_str(), m_path.c_str()) != 0)
    {
        LOG_ERROR("snapshot: rename to " + m_path + " failed: " + std::strerror(errno));
        ::unlink(m_temp_path.c_str());
        return snap_io;
    }

    // Make the rename itself durable
    fs::path dir = fs::path(m_path).parent_path();
    if (dir.empty())
        dir = ".";
    scoped_fd dir_fd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (!dir_fd || ::fsync(dir_fd.get()) != 0)
        LOG_DEBUG("snapshot: directory fsync of " + dir.string() + " failed");

    LOG_DEBUG("snapshot: wrote " + std::to_string(bytes.size()) + " bytes to " + m_path);
    return snap_none;
}

snapshot_error snapshot::save(const keyspace& ks)
{
    snapshot_error err = write_atomic(encode(ks));
    if (err == snap_none)
        LOG_INFO("snapshot saved (" + std::to_string(ks.size()) + " keys)");
    return err;
}

snapshot_error snapshot::load_file(const std::string& file_path, keyspace& ks) const
{
    std::string bytes;
    snapshot_error err = read_file(file_path, bytes);
    if (err != snap_none)
        return err;

    data_map data;
    expiry_map expiries;
    bool had_checksum;
    err = decode(bytes, ks.now(), data, expiries, had_checksum);
    if (err != snap_none)
        return err;

    ks.restore(std::move(data), std::move(expiries));
    return snap_none;
}

load_outcome snapshot::load(keyspace& ks)
{
    std::error_code ec;
    if (fs::remove(m_temp_path, ec))
        LOG_WARN("snapshot: removed stale " + m_temp_path + " from an interrupted save");

    bool has_primary = fs::exists(m_path, ec);
    bool has_backup = fs::exists(m_backup_path, ec);

    if (!has_primary && !has_backup)
    {
        ks.clear();
        LOG_INFO("snapshot: no " + m_path + ", starting with an empty keyspace");
        return load_fresh;
    }

    if (has_primary)
    {
        snapshot_error err = load_file(m_path, ks);
        if (err == snap_none)
        {
            LOG_INFO("snapshot: loaded " + std::to_string(ks.size()) + " keys from " + m_path);
            return load_from_primary;
        }
        if (err == snap_checksum_mismatch)
            LOG_ERROR("snapshot: checksum mismatch in " + m_path);
        else
            LOG_ERROR("snapshot: " + m_path + " unusable (" + snapshot_error_name(err) + ")");
    }
    else
    {
        LOG_WARN("snapshot: " + m_path + " missing, trying backup");
    }

    if (has_backup)
    {
        snapshot_error err = recover_from_backup(ks);
        if (err == snap_none)
            return load_from_backup;
        LOG_ERROR("snapshot: backup " + m_backup_path + " unusable (" + snapshot_error_name(err) + ")");
    }

    ks.clear();
    LOG_ERROR("snapshot: no usable snapshot, continuing with an EMPTY keyspace; persisted data was lost");
    return load_degraded;
}

snapshot_error snapshot::read_backup(engine_clock::time_point now, std::string& bytes,
                                     data_map& data, expiry_map& expiries) const
{
    snapshot_error err = read_file(m_backup_path, bytes);
    if (err != snap_none)
        return err;

    bool had_checksum;
    return decode(bytes, now, data, expiries, had_checksum);
}

// The backup image already passed decode, so its bytes become the primary as-is
void snapshot::promote_backup(std::string_view bytes)
{
    // Never copy the bad primary over the good backup
    snapshot_error err = write_atomic(bytes, false);
    if (err != snap_none)
        LOG_ERROR("snapshot: could not promote backup to " + m_path + " (" + snapshot_error_name(err) + ")");
    else
        LOG_INFO("snapshot: backup promoted to " + m_path);
}

snapshot_error snapshot::recover_from_backup(keyspace& ks)
{
    std::string bytes;
    data_map data;
    expiry_map expiries;
    snapshot_error err = read_backup(ks.now(), bytes, data, expiries);
    if (err != snap_none)
        return err;

    ks.restore(std::move(data), std::move(expiries));
    LOG_WARN("snapshot: recovered " + std::to_string(ks.size()) + " keys from " + m_backup_path);

    promote_backup(bytes);
    return snap_none;
}

snapshot_error snapshot::recover_from_backup(shared_keyspace& shared)
{
    engine_clock::time_point now;
    {
        std::shared_lock lock(shared.mutex);
        now = shared.store.now();
    }

    std::string bytes;
    data_map data;
    expiry_map expiries;
    snapshot_error err = read_backup(now, bytes, data, expiries);
    if (err != snap_none)
        return err;

    size_t keys = data.size();
    {
        std::unique_lock lock(shared.mutex);
        shared.store.restore(std::move(data), std::move(expiries));
    }
    LOG_WARN("snapshot: recovered " + std::to_string(keys) + " keys from " + m_backup_path);

    promote_backup(bytes);
    return snap_none;
}

bool snapshot::verify_integrity() const
{
    std::string bytes;
    if (read_file(m_path, bytes) != snap_none)
        return false;

    data_map data;
    expiry_map expiries;
    bool had_checksum;
    return decode(bytes, engine_clock::now(), data, expiries, had_checksum) == snap_none && had_checksum;
}
