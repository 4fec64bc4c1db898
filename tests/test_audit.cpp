#include "test_common.h"

#include "caproute/audit.h"
#include "caproute/crypto.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

using namespace caproute;

static std::vector<std::string> read_all(const std::string& path) {
    std::ifstream in(path);
    std::vector<std::string> out;
    std::string line;
    while (std::getline(in, line)) out.push_back(line);
    return out;
}

static void write_all(const std::string& path, const std::vector<std::string>& lines) {
    std::ofstream out(path, std::ios::trunc);
    for (const auto& l : lines) out << l << "\n";
}

int main() {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "caproute_test_audit";
    std::error_code ec;
    fs::remove_all(dir, ec);
    const std::string path = (dir / "audit.jsonl").string();

    // Test 1: chained records verify
    {
        AuditLog log(path, "inst_test");
        log.event("select", "{\"capability\":\"service_restart\",\"tool\":\"systemctl\"}");
        log.event("approval_issued", "{\"scope\":\"deploy_pipeline\"}");
        log.event("note", "not json at all");
        expect_eq_ll((long long)log.seq(), 3, "three events");
        expect_true(log.last_hash().size() == 64, "hash is hex sha256");
        expect_true(verify_audit_chain(path).empty(), "chain intact");

        auto lines = read_all(path);
        expect_eq_ll((long long)lines.size(), 3, "one line per event");
        expect_true(lines[0].find("\"chain_prev\":\"" + std::string(64, '0') + "\"") != std::string::npos,
                    "genesis link");
        expect_true(lines[2].find("\"payload\":\"not json at all\"") != std::string::npos, "non-object payload kept");
        expect_true(lines[1].find("\"instance_id\":\"inst_test\"") != std::string::npos, "instance id recorded");
    }

    // Test 2: reopening continues the chain
    {
        AuditLog log(path, "inst_second");
        expect_eq_ll((long long)log.seq(), 3, "sequence resumed");
        log.event("execute", "{\"planId\":\"p1\"}");
        expect_true(verify_audit_chain(path).empty(), "chain intact across restarts");
    }

    // Test 3: tampering is detected at the edited line
    {
        auto lines = read_all(path);
        auto edited = lines;
        const size_t pos = edited[1].find("deploy_pipeline");
        expect_true(pos != std::string::npos, "fixture text present");
        edited[1].replace(pos, 15, "other_pipeline_");
        write_all(path, edited);
        std::string err = verify_audit_chain(path);
        expect_true(err.find("line 2") != std::string::npos && err.find("mismatch") != std::string::npos,
                    "edited payload detected: " + err);

        auto dropped = lines;
        dropped.erase(dropped.begin() + 1);
        write_all(path, dropped);
        err = verify_audit_chain(path);
        expect_true(err.find("line 2") != std::string::npos && err.find("chain_prev") != std::string::npos,
                    "deleted line detected: " + err);

        write_all(path, lines);
        expect_true(verify_audit_chain(path).empty(), "restored file verifies");
        expect_true(!verify_audit_chain((dir / "missing.jsonl").string()).empty(), "missing file reported");
    }

    // Test 4: hash primitives match published vectors
    {
        expect_true(sha256_hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855", "empty");
        expect_true(sha256_hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", "abc");
        const std::string two_blocks = "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq";
        expect_true(sha256_hex(two_blocks) == "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1",
                    "padding spills into a second block");
        Sha256 streamed;
        for (char c : two_blocks) streamed.update(std::string(1, c));
        expect_true(streamed.hex_digest() == sha256_hex(two_blocks), "byte-at-a-time matches one-shot");
        expect_true(hmac_sha256_hex("Jefe", "what do ya want for nothing?") ==
                        "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843",
                    "hmac vector");
        expect_true(hmac_sha256_hex(std::string(131, '\xaa'), "Test Using Larger Than Block-Size Key - Hash Key First") ==
                        "60e431591ee0b67f0d8a26aacbf5b77f8e0bc6213728c5140546040f0ee37f54",
                    "long key hashed first");
        expect_true(constant_time_eq("abc", "abc") && !constant_time_eq("abc", "abd") && !constant_time_eq("abc", "ab"),
                    "constant time compare");
        const std::string r = random_hex(5);
        expect_eq_ll((long long)r.size(), 10, "two hex digits per byte");
    }

    fs::remove_all(dir, ec);
    std::cerr << "test_audit: ALL PASSED" << std::endl;
    return 0;
}
