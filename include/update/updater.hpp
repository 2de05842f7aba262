#pragma once

#include "update/console.hpp"
#include "update/process_launcher.hpp"
#include "update/process_table.hpp"
#include "util/result.hpp"
#include "util/updater_config.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <sys/types.h>
#include <vector>

namespace selfupdate {

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitAppRunning = 1;
inline constexpr int kExitStepFailed = 2;
inline constexpr int kExitConfigError = 3;

enum class UpdaterState {
    Start,
    Wait,
    CheckProcess,
    Blocked,
    VerifyStaging,
    CopyDocument,
    CopyExecutable,
    CheckIntegrity,
    Cleanup,
    Launch,
    Done,
    Failed,
};

const char* ToString(UpdaterState state);

// Replaces the installed executable and document with the staged copies once the
// old process is gone, then starts the new executable.
//
//   START -> WAIT -> CHECK_PROCESS -> BLOCKED
//                                  -> VERIFY_STAGING -> COPY_DOCUMENT -> COPY_EXECUTABLE
//                                     -> CHECK_INTEGRITY -> CLEANUP -> LAUNCH -> DONE
//
// Under ErrorPolicy::FailFast any step after CHECK_PROCESS except CLEANUP can end in
// FAILED. There is no edge back to CHECK_PROCESS.
class Updater {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    // Null members are replaced with the real implementations.
    struct Dependencies {
        std::shared_ptr<const IProcessTable> process_table;
        std::shared_ptr<const IProcessLauncher> launcher;
        std::shared_ptr<IConsole> console;
        Sleeper sleep;
        // Excluded from the liveness check. 0 selects getpid().
        pid_t self_pid = 0;
    };

    explicit Updater(UpdaterConfig config);
    Updater(UpdaterConfig config, Dependencies deps);

    // Returns the process exit code (kExit*).
    int Run();

    UpdaterState State() const { return state_; }
    const std::vector<std::string>& Failures() const { return failures_; }
    const UpdaterConfig& Config() const { return config_; }

private:
    struct CopyOutcome;

    void Transition(UpdaterState next);
    // Records a failed step. True when the policy says to stop.
    bool StepFailed(const char* step, const Result& r);
    int Abort();

    bool IsTargetRunning();
    Result VerifyCopy(const std::string& target, const CopyOutcome& copy, bool require_content) const;

    UpdaterConfig config_;
    Dependencies deps_;
    UpdaterState state_ = UpdaterState::Start;
    std::vector<std::string> failures_;
};

} // namespace selfupdate
