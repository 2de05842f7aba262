#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <vector>

namespace selfupdate {

struct ProcessInfo {
    pid_t pid = 0;
    std::string comm;
    std::string exe_path;
    std::string argv0;
};

class IProcessTable {
public:
    virtual ~IProcessTable() = default;
    // Point-in-time listing. Processes that vanish mid-scan are skipped.
    virtual std::vector<ProcessInfo> Snapshot() const = 0;
};

// Reads <proc_root>/<pid>/{comm,exe,cmdline}.
class ProcFsProcessTable final : public IProcessTable {
public:
    explicit ProcFsProcessTable(std::string proc_root = "/proc");

    std::vector<ProcessInfo> Snapshot() const override;

private:
    std::string proc_root_;
};

// Linux truncates comm to TASK_COMM_LEN - 1 bytes.
inline constexpr size_t kCommMaxLen = 15;

// comm is consulted only when neither exe_path nor argv0 is known.
bool MatchesImageName(const ProcessInfo& proc, std::string_view image_name);

std::optional<ProcessInfo> FindByImageName(const std::vector<ProcessInfo>& snapshot,
                                           std::string_view image_name,
                                           pid_t exclude_pid);

} // namespace selfupdate
