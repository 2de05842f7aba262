#include "update/process_table.hpp"

#include "util/path_utils.hpp"

#include <cctype>
#include <cerrno>
#include <charconv>
#include <dirent.h>
#include <fstream>
#include <iterator>
#include <memory>
#include <unistd.h>

namespace selfupdate {

namespace {

struct DirCloser {
    void operator()(DIR* d) const {
        if (d) ::closedir(d);
    }
};

bool ParsePid(const char* name, pid_t& out) {
    const char* end = name;
    while (*end) {
        if (!std::isdigit(static_cast<unsigned char>(*end))) return false;
        ++end;
    }
    if (end == name) return false;
    auto [ptr, ec] = std::from_chars(name, end, out);
    return ec == std::errc{} && ptr == end && out > 0;
}

bool ReadWholeFile(const std::string& path, std::string& out) {
    std::ifstream is(path, std::ios::binary);
    if (!is.is_open()) return false;
    out.assign(std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>());
    return true;
}

std::string ReadLink(const std::string& path) {
    std::string buf(4096, '\0');
    const ssize_t len = ::readlink(path.c_str(), buf.data(), buf.size() - 1);
    if (len <= 0) return {};
    buf.resize(static_cast<size_t>(len));
    return buf;
}

} // namespace

ProcFsProcessTable::ProcFsProcessTable(std::string proc_root) : proc_root_(std::move(proc_root)) {}

std::vector<ProcessInfo> ProcFsProcessTable::Snapshot() const {
    std::vector<ProcessInfo> out;

    std::unique_ptr<DIR, DirCloser> dir(::opendir(proc_root_.c_str()));
    if (!dir) return out;

    while (const dirent* entry = ::readdir(dir.get())) {
        ProcessInfo info;
        if (!ParsePid(entry->d_name, info.pid)) continue;

        const std::string base = proc_root_ + "/" + entry->d_name + "/";

        // comm is the only field readable for every process; no comm means it exited.
        if (!ReadWholeFile(base + "comm", info.comm)) continue;
        if (!info.comm.empty() && info.comm.back() == '\n') info.comm.pop_back();

        // exe is only readable for our own processes; that is enough for a same-user app.
        info.exe_path = std::string(StripDeletedSuffix(ReadLink(base + "exe")));

        std::string cmdline;
        if (ReadWholeFile(base + "cmdline", cmdline)) {
            info.argv0 = cmdline.substr(0, cmdline.find('\0'));
        }

        out.push_back(std::move(info));
    }
    return out;
}

bool MatchesImageName(const ProcessInfo& proc, std::string_view image_name) {
    if (image_name.empty()) return false;

    if (!proc.exe_path.empty() && EqualsIgnoreAsciiCase(ImageBaseName(proc.exe_path), image_name)) {
        return true;
    }
    if (!proc.argv0.empty() && EqualsIgnoreAsciiCase(ImageBaseName(proc.argv0), image_name)) {
        return true;
    }
    // comm is a 15-byte prefix at best; only trust it when nothing better was readable.
    if (!proc.exe_path.empty() || !proc.argv0.empty()) return false;
    if (proc.comm.empty()) return false;
    if (image_name.size() > kCommMaxLen && proc.comm.size() == kCommMaxLen) {
        return EqualsIgnoreAsciiCase(proc.comm, image_name.substr(0, kCommMaxLen));
    }
    return EqualsIgnoreAsciiCase(proc.comm, image_name);
}

std::optional<ProcessInfo> FindByImageName(const std::vector<ProcessInfo>& snapshot,
                                           std::string_view image_name,
                                           pid_t exclude_pid) {
    for (const auto& proc : snapshot) {
        if (proc.pid == exclude_pid) continue;
        if (MatchesImageName(proc, image_name)) return proc;
    }
    return std::nullopt;
}

} // namespace selfupdate
