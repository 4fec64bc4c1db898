#include "caproute/wal.h"
#include "caproute/util.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace caproute {

namespace fs = std::filesystem;

Wal::Wal(fs::path path, WalPolicy policy) : path_(std::move(path)), policy_(policy) {}

Wal::~Wal() {
    std::lock_guard<std::mutex> lk(mu_);
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void Wal::set_fsync(bool enable) {
    std::lock_guard<std::mutex> lk(mu_);
    fsync_ = enable;
}

std::string Wal::open_locked() {
    if (fd_ >= 0) return "";
    std::error_code ec;
    auto parent = path_.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) return std::string("create_directories: ") + ec.message();
    }
    fd_ = ::open(path_.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
    if (fd_ < 0) return std::string("open: ") + std::strerror(errno);

    segment_open_sec_ = now_ms_wall() / 1000;
    struct stat st{};
    current_size_ = (::fstat(fd_, &st) == 0) ? (int64_t)st.st_size : 0;
    return "";
}

std::string Wal::open() {
    std::lock_guard<std::mutex> lk(mu_);
    return open_locked();
}

bool Wal::is_open() const {
    std::lock_guard<std::mutex> lk(mu_);
    return fd_ >= 0;
}

uint64_t Wal::lines_appended() const {
    std::lock_guard<std::mutex> lk(mu_);
    return appended_;
}

bool Wal::needs_rotation_locked() const {
    if (current_size_ == 0) return false;
    if (policy_.max_segment_bytes > 0 && current_size_ >= policy_.max_segment_bytes) return true;
    if (policy_.max_segment_age_sec > 0 && segment_open_sec_ > 0 &&
        now_ms_wall() / 1000 - segment_open_sec_ >= policy_.max_segment_age_sec)
        return true;
    return false;
}

std::string Wal::append_json_line(const std::string& json) {
    std::lock_guard<std::mutex> lk(mu_);
    std::string err = open_locked();
    if (!err.empty()) return err;

    if (needs_rotation_locked()) {
        err = rotate_locked();
        // Keep writing to whatever segment is open.
        if (!err.empty()) std::cerr << "[wal] rotation failed for " << path_.string() << ": " << err << "\n";
        if (fd_ < 0) return err;
    }

    std::string line = json;
    if (line.empty() || line.back() != '\n') line.push_back('\n');

    size_t off = 0;
    while (off < line.size()) {
        ssize_t w = ::write(fd_, line.data() + off, line.size() - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            return std::string("write: ") + std::strerror(errno);
        }
        off += (size_t)w;
    }
    current_size_ += (int64_t)line.size();
    appended_++;

    if (fsync_ && ::fsync(fd_) != 0) return std::string("fsync: ") + std::strerror(errno);
    return "";
}

std::string Wal::rotate_locked() {
    if (fd_ < 0) return "";
    ::close(fd_);
    fd_ = -1;

    auto parent = path_.parent_path();
    std::error_code ec;
    int64_t stamp = now_ms_wall();
    auto rotated = parent / (path_.stem().string() + "." + std::to_string(stamp) + ".jsonl");
    while (fs::exists(rotated, ec)) {
        rotated = parent / (path_.stem().string() + "." + std::to_string(++stamp) + ".jsonl");
    }
    fs::rename(path_, rotated, ec);
    if (ec) {
        std::string reopen = open_locked();
        return "rotate rename: " + ec.message() + (reopen.empty() ? "" : "; " + reopen);
    }

    int dir_fd = ::open(parent.empty() ? "." : parent.c_str(), O_RDONLY | O_DIRECTORY);
    if (dir_fd >= 0) {
        (void)::fsync(dir_fd);
        ::close(dir_fd);
    }

    std::string err = open_locked();
    if (!err.empty()) return "rotate reopen: " + err;
    enforce_retention_locked();
    return "";
}

std::string Wal::rotate_now() {
    std::lock_guard<std::mutex> lk(mu_);
    return rotate_locked();
}

std::vector<fs::path> Wal::rotated_segments_locked() const {
    std::vector<fs::path> out;
    auto parent = path_.parent_path();
    if (parent.empty()) parent = ".";
    const std::string stem = path_.stem().string();
    const std::string active = path_.filename().string();

    std::error_code ec;
    for (fs::directory_iterator it(parent, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file()) continue;
        const std::string fname = it->path().filename().string();
        if (fname == active) continue;
        if (!fname.starts_with(stem + ".") || !fname.ends_with(".jsonl")) continue;
        const std::string mid = fname.substr(stem.size() + 1, fname.size() - stem.size() - 1 - 6);
        if (mid.empty() || !std::all_of(mid.begin(), mid.end(), [](char c) { return c >= '0' && c <= '9'; }))
            continue;
        out.push_back(it->path());
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<fs::path> Wal::list_segments() const {
    std::lock_guard<std::mutex> lk(mu_);
    auto out = rotated_segments_locked();
    std::error_code ec;
    if (fs::exists(path_, ec)) out.push_back(path_);
    return out;
}

int Wal::enforce_retention_locked() {
    auto rotated = rotated_segments_locked();
    int deleted = 0;
    std::error_code ec;

    while (policy_.max_segments > 0 && (int)(rotated.size() + 1) > policy_.max_segments && !rotated.empty()) {
        fs::remove(rotated.front(), ec);
        rotated.erase(rotated.begin());
        deleted++;
    }
    if (policy_.max_total_bytes > 0) {
        int64_t total = current_size_;
        std::vector<int64_t> sizes;
        for (const auto& p : rotated) {
            int64_t s = (int64_t)fs::file_size(p, ec);
            if (ec) s = 0;
            sizes.push_back(s);
            total += s;
        }
        size_t i = 0;
        while (total > policy_.max_total_bytes && i < rotated.size()) {
            fs::remove(rotated[i], ec);
            total -= sizes[i];
            i++;
            deleted++;
        }
    }
    return deleted;
}

int Wal::enforce_retention() {
    std::lock_guard<std::mutex> lk(mu_);
    return enforce_retention_locked();
}

std::vector<std::string> Wal::read_lines() const {
    std::vector<std::string> out;
    for (const auto& seg : list_segments()) {
        std::ifstream f(seg, std::ios::binary);
        std::string line;
        while (std::getline(f, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (!line.empty()) out.push_back(std::move(line));
        }
    }
    return out;
}

} // namespace caproute
