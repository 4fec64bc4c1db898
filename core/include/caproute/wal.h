#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace caproute {

// Segment rotation and retention limits.
struct WalPolicy {
    int64_t max_segment_bytes{16 * 1024 * 1024};
    int max_segment_age_sec{3600};
    int max_segments{10};                          // including the active segment
    int64_t max_total_bytes{256 * 1024 * 1024};
};

// Wal: append-only JSONL file with segment rotation.
//
// Active segment is <path>; rotated segments are <stem>.<epoch_ms>.jsonl in
// the same directory. Retention runs after every rotation.
// Thread-safe; optional fsync per append.
class Wal {
public:
    explicit Wal(std::filesystem::path path, WalPolicy policy = {});
    ~Wal();

    Wal(const Wal&) = delete;
    Wal& operator=(const Wal&) = delete;

    void set_fsync(bool enable);

    // Creates parent dirs and opens the active segment. Returns "" on success.
    std::string open();
    bool is_open() const;

    // Appends json + '\n', rotating first when a limit is reached. Returns "" on success.
    std::string append_json_line(const std::string& json);

    std::string rotate_now();
    int enforce_retention();

    // Rotated segments oldest first, then the active one.
    std::vector<std::filesystem::path> list_segments() const;

    // Every line of every segment, oldest first. Blank lines skipped.
    std::vector<std::string> read_lines() const;

    const std::filesystem::path& path() const { return path_; }
    uint64_t lines_appended() const;

private:
    std::string open_locked();
    std::string rotate_locked();
    bool needs_rotation_locked() const;
    int enforce_retention_locked();
    std::vector<std::filesystem::path> rotated_segments_locked() const;

    std::filesystem::path path_;
    WalPolicy policy_;
    int fd_{-1};
    bool fsync_{false};
    mutable std::mutex mu_;
    int64_t segment_open_sec_{0};
    int64_t current_size_{0};
    uint64_t appended_{0};
};

} // namespace caproute
