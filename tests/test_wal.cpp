#include "test_common.h"

#include "caproute/wal.h"

#include <filesystem>
#include <fstream>

using caproute::Wal;
using caproute::WalPolicy;

int main() {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "caproute_test_wal";
    std::error_code ec;
    fs::remove_all(dir, ec);

    // Test 1: open creates parent dirs, appends read back in order
    {
        Wal wal(dir / "nested" / "a.jsonl");
        std::string err = wal.open();
        expect_true(err.empty(), "wal open should succeed: " + err);
        expect_true(wal.is_open(), "open");
        expect_true(wal.append_json_line("{\"x\":1}").empty(), "append 1");
        expect_true(wal.append_json_line("{\"x\":2}\n").empty(), "append 2 with trailing newline");
        auto lines = wal.read_lines();
        expect_eq_ll((long long)lines.size(), 2, "two lines");
        expect_true(lines[0] == "{\"x\":1}" && lines[1] == "{\"x\":2}", "order and no doubled newline");
        expect_eq_ll((long long)wal.lines_appended(), 2, "counter");
    }

    // Test 2: size-based rotation keeps every line readable
    {
        WalPolicy pol;
        pol.max_segment_bytes = 32;
        pol.max_segments = 100;
        Wal wal(dir / "b.jsonl", pol);
        for (int i = 0; i < 10; i++) {
            expect_true(wal.append_json_line("{\"i\":" + std::to_string(i) + ",\"pad\":\"xxxxxxxx\"}").empty(), "append");
        }
        auto segs = wal.list_segments();
        expect_true(segs.size() > 1, "rotated at least once");
        expect_true(segs.back() == dir / "b.jsonl", "active segment last");
        auto lines = wal.read_lines();
        expect_eq_ll((long long)lines.size(), 10, "nothing lost across segments");
        expect_true(lines.front().find("\"i\":0") != std::string::npos, "oldest first");
        expect_true(lines.back().find("\"i\":9") != std::string::npos, "newest last");
    }

    // Test 3: retention by segment count
    {
        WalPolicy pol;
        pol.max_segment_bytes = 0;
        pol.max_segment_age_sec = 0;
        pol.max_segments = 3;
        Wal wal(dir / "c.jsonl", pol);
        for (int i = 0; i < 6; i++) {
            expect_true(wal.append_json_line("{\"i\":" + std::to_string(i) + "}").empty(), "append");
            expect_true(wal.rotate_now().empty(), "rotate");
        }
        expect_true(wal.append_json_line("{\"i\":6}").empty(), "append after rotations");
        auto segs = wal.list_segments();
        expect_eq_ll((long long)segs.size(), 3, "two rotated plus active");
        auto lines = wal.read_lines();
        expect_eq_ll((long long)lines.size(), 3, "oldest segments dropped");
        expect_true(lines.back() == "{\"i\":6}", "active content kept");
    }

    // Test 4: retention by total bytes
    {
        WalPolicy pol;
        pol.max_segment_bytes = 0;
        pol.max_segment_age_sec = 0;
        pol.max_segments = 0;
        pol.max_total_bytes = 40;
        Wal wal(dir / "d.jsonl", pol);
        for (int i = 0; i < 5; i++) {
            expect_true(wal.append_json_line("{\"payload\":\"0123456789\"}").empty(), "append");
            expect_true(wal.rotate_now().empty(), "rotate");
        }
        long long total = 0;
        for (const auto& s : wal.list_segments()) total += (long long)fs::file_size(s, ec);
        expect_true(total <= 40, "total bytes bounded");
    }

    // Test 5: unrelated files in the directory are not segments
    {
        std::ofstream(dir / "b.notes.jsonl") << "{}\n";
        std::ofstream(dir / "b.123abc.jsonl") << "{}\n";
        Wal wal(dir / "b.jsonl");
        for (const auto& s : wal.list_segments()) {
            const std::string f = s.filename().string();
            expect_true(f != "b.notes.jsonl" && f != "b.123abc.jsonl", "foreign file ignored");
        }
    }

    fs::remove_all(dir, ec);
    std::cerr << "test_wal: ALL PASSED" << std::endl;
    return 0;
}
