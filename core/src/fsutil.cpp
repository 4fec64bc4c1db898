#include "caproute/fsutil.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace caproute {

std::string slurp(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open: " + path);
    std::stringstream ss; ss << f.rdbuf();
    return ss.str();
}

std::string write_atomic_file(const std::filesystem::path& dst, const std::string& body) {
    std::error_code ec;
    if (dst.has_parent_path()) std::filesystem::create_directories(dst.parent_path(), ec);
    auto tmp = dst;
    tmp += ".tmp";
    {
        std::ofstream f(tmp.string(), std::ios::binary | std::ios::trunc);
        if (!f) return "cannot write " + tmp.string();
        f << body;
        f.flush();
        if (!f) return "short write " + tmp.string();
    }
    std::filesystem::rename(tmp, dst, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        return "rename failed: " + dst.string();
    }
    return "";
}

} // namespace caproute
