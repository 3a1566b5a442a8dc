#pragma once
#include <string>
#include <string_view>
#include <mutex>
#include <cstdint>

#include "value.h"

class keyspace;
struct shared_keyspace;

enum snapshot_error : uint8_t
{
    snap_none                = 0,
    snap_io                  = 1,
    snap_truncated           = 2,
    snap_bad_magic           = 3,
    snap_unsupported_version = 4,
    snap_checksum_mismatch   = 5,
    snap_malformed           = 6
};

const char* snapshot_error_name(snapshot_error err);

enum load_outcome : uint8_t
{
    load_from_primary = 0,
    load_from_backup  = 1,
    load_fresh        = 2,   // nothing on disk
    load_degraded     = 3    // primary and backup both unusable
};

const char* load_outcome_name(load_outcome outcome);

// On-disk keyspace image at <path>, with <path>.bak holding the previous
// image and <path>.tmp as the in-progress write.
//
// Layout (host byte order):
//   "EKVS" | u32 version
//   u32 entry_count  | { u8 type, str key, value }
//   u32 expiry_count | { str key, i64 epoch_seconds }
//   u8 has_checksum  | [ str hex sha256 of every byte before has_checksum ]
// str = u32 length + bytes
class snapshot
{
public:
    static constexpr char MAGIC[4] = {'E', 'K', 'V', 'S'};
    static constexpr uint32_t VERSION = 1;

    explicit snapshot(std::string path);

    const std::string& path() const { return m_path; }
    const std::string& backup_path() const { return m_backup_path; }
    const std::string& temp_path() const { return m_temp_path; }

    // Serializes the live keys; deadlines already passed are dropped along
    // with their keys. Only reads the keyspace, so a shared lock suffices.
    static std::string encode(const keyspace& ks, bool with_checksum = true);

    // Parses an image into fresh maps. Deadlines are converted back to
    // steady-clock time relative to `now`; keys whose deadline has passed
    // are dropped. An empty buffer decodes to an empty keyspace.
    static snapshot_error decode(std::string_view bytes, engine_clock::time_point now,
                                 data_map& data, expiry_map& expiries, bool& had_checksum);

    static std::string checksum(std::string_view payload);

    // Backs up the current primary (unless told not to), writes the temp
    // file, fsyncs it, renames it over the primary and fsyncs the directory.
    snapshot_error write_atomic(std::string_view bytes, bool backup_previous = true);

    // encode + write_atomic; the caller holds the keyspace lock
    snapshot_error save(const keyspace& ks);

    // Startup path: clears a stale temp file, loads the primary, falls
    // back to the backup (promoting it on success), and as a last resort
    // leaves the keyspace empty.
    load_outcome load(keyspace& ks);

    snapshot_error recover_from_backup(keyspace& ks);
    // Reads, checks and promotes the backup without holding the keyspace
    // lock; the writer lock is taken only to swap the decoded maps in.
    snapshot_error recover_from_backup(shared_keyspace& shared);

    // Re-derives the primary's checksum; false if the file is missing,
    // unparseable, carries no checksum, or disagrees.
    bool verify_integrity() const;

private:
    snapshot_error load_file(const std::string& file_path, keyspace& ks) const;
    static snapshot_error read_file(const std::string& file_path, std::string& out);
    snapshot_error read_backup(engine_clock::time_point now, std::string& bytes,
                               data_map& data, expiry_map& expiries) const;
    void promote_backup(std::string_view bytes);

    std::string m_path;
    std::string m_backup_path;
    std::string m_temp_path;
    // The scheduler thread and SAVE may write concurrently
    std::mutex m_write_mutex;
};
