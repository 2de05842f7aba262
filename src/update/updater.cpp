#include "update/updater.hpp"

#include "crypto/sha256.hpp"
#include "update/file_replacer.hpp"
#include "update/staging_manifest.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <thread>
#include <unistd.h>
#include <utility>

namespace fs = std::filesystem;

namespace selfupdate {

namespace {

constexpr const char* kPressAnyKeyPrompt = "Press any key to exit...";

void DefaultSleep(std::chrono::milliseconds d) {
    std::this_thread::sleep_for(d);
}

std::string LaunchDirectoryOf(const std::string& executable) {
    const fs::path parent = fs::path(executable).parent_path();
    return parent.empty() ? std::string(".") : parent.string();
}

} // namespace

struct Updater::CopyOutcome {
    std::string staged_path;
    std::optional<std::string> expected_sha256;
    ReplaceReport report;
    bool copied = false;
};

const char* ToString(UpdaterState state) {
    switch (state) {
        case UpdaterState::Start:          return "START";
        case UpdaterState::Wait:           return "WAIT";
        case UpdaterState::CheckProcess:   return "CHECK_PROCESS";
        case UpdaterState::Blocked:        return "BLOCKED";
        case UpdaterState::VerifyStaging:  return "VERIFY_STAGING";
        case UpdaterState::CopyDocument:   return "COPY_DOCUMENT";
        case UpdaterState::CopyExecutable: return "COPY_EXECUTABLE";
        case UpdaterState::CheckIntegrity: return "CHECK_INTEGRITY";
        case UpdaterState::Cleanup:        return "CLEANUP";
        case UpdaterState::Launch:         return "LAUNCH";
        case UpdaterState::Done:           return "DONE";
        case UpdaterState::Failed:         return "FAILED";
    }
    return "UNKNOWN";
}

Updater::Updater(UpdaterConfig config) : Updater(std::move(config), Dependencies{}) {}

Updater::Updater(UpdaterConfig config, Dependencies deps)
    : config_(std::move(config)), deps_(std::move(deps)) {
    if (!deps_.process_table) deps_.process_table = std::make_shared<ProcFsProcessTable>();
    if (!deps_.launcher) deps_.launcher = std::make_shared<PosixProcessLauncher>();
    if (!deps_.console) deps_.console = std::make_shared<TerminalConsole>();
    if (!deps_.sleep) deps_.sleep = DefaultSleep;
    if (deps_.self_pid == 0) deps_.self_pid = ::getpid();
}

void Updater::Transition(UpdaterState next) {
    LogDebug("state %s -> %s", ToString(state_), ToString(next));
    state_ = next;
}

bool Updater::StepFailed(const char* step, const Result& r) {
    failures_.push_back(std::string(step) + ": " + r.msg);
    if (config_.error_policy == ErrorPolicy::FailFast) {
        LogError("%s failed: %s", step, r.msg.c_str());
        return true;
    }
    LogWarn("%s failed, continuing: %s", step, r.msg.c_str());
    return false;
}

int Updater::Abort() {
    Transition(UpdaterState::Failed);
    LogError("Update aborted; staged files were left in %s", config_.staging_dir.c_str());
    return kExitStepFailed;
}

bool Updater::IsTargetRunning() {
    const auto snapshot = deps_.process_table->Snapshot();
    LogDebug("Process snapshot: %zu entries", snapshot.size());

    const auto match = FindByImageName(snapshot, config_.process_name, deps_.self_pid);
    if (!match) return false;

    LogWarn("%s is still running (pid %d)", config_.process_name.c_str(), static_cast<int>(match->pid));
    return true;
}

Result Updater::VerifyCopy(const std::string& target, const CopyOutcome& copy, bool require_content) const {
    if (require_content && copy.report.bytes == 0) {
        return Result::Fail(-1, "copied file is empty: " + target);
    }
    if (copy.expected_sha256 && !Sha256HexEquals(copy.report.sha256, *copy.expected_sha256)) {
        return Result::Fail(-1, "sha256 mismatch for " + target + ": expected=" + *copy.expected_sha256 +
                                    " copied=" + copy.report.sha256);
    }

    std::string actual;
    auto r = Sha256HexFile(target, actual);
    if (!r.is_ok()) return r;
    if (!Sha256HexEquals(actual, copy.report.sha256)) {
        return Result::Fail(-1, "sha256 mismatch for " + target + ": staged=" + copy.report.sha256 +
                                    " installed=" + actual);
    }
    return Result::Ok();
}

int Updater::Run() {
    state_ = UpdaterState::Start;
    failures_.clear();

    const std::string target_exe = config_.TargetExecutablePath();
    const std::string target_doc = config_.TargetDocumentPath();

    Transition(UpdaterState::Wait);
    if (config_.grace_delay.count() > 0) {
        LogInfo("Waiting %lld ms for %s to exit",
                static_cast<long long>(config_.grace_delay.count()), config_.process_name.c_str());
        deps_.sleep(config_.grace_delay);
    }

    Transition(UpdaterState::CheckProcess);
    if (IsTargetRunning()) {
        deps_.console->ShowMessage(config_.process_name +
                                   " is still running. Close it and run the updater again.");
        deps_.console->WaitForAnyKey(kPressAnyKeyPrompt);
        Transition(UpdaterState::Blocked);
        return kExitAppRunning;
    }

    CopyOutcome doc;
    doc.staged_path = config_.StagedDocumentPath();
    CopyOutcome exe;
    exe.staged_path = config_.StagedExecutablePath();

    Transition(UpdaterState::VerifyStaging);
    {
        StagingManifest manifest;
        auto r = StagingManifest::LoadFromFile(config_.manifest_file, manifest);
        if (!r.is_ok() && r.err == ENOENT) {
            LogDebug("No staging manifest at %s", config_.manifest_file.c_str());
        } else if (!r.is_ok()) {
            if (StepFailed("load manifest", r)) return Abort();
        } else {
            LogInfo("Staging manifest version %s", manifest.version.empty() ? "-" : manifest.version.c_str());
            doc.expected_sha256 = manifest.ExpectedSha256(config_.staged_document);
            exe.expected_sha256 = manifest.ExpectedSha256(config_.app_executable);
            for (CopyOutcome* item : {&doc, &exe}) {
                if (!item->expected_sha256) {
                    LogWarn("%s is not listed in the staging manifest", item->staged_path.c_str());
                    continue;
                }
                auto vr = StagingManifest::VerifyFile(item->staged_path, *item->expected_sha256);
                if (!vr.is_ok() && StepFailed("verify staged file", vr)) return Abort();
            }
        }
    }

    Transition(UpdaterState::CopyDocument);
    if (auto r = FileReplacer::Replace(doc.staged_path, target_doc, doc.report); r.is_ok()) {
        doc.copied = true;
        LogInfo("Installed %s", target_doc.c_str());
    } else if (StepFailed("copy document", r)) {
        return Abort();
    }

    Transition(UpdaterState::CopyExecutable);
    if (auto r = FileReplacer::Replace(exe.staged_path, target_exe, exe.report); r.is_ok()) {
        exe.copied = true;
        LogInfo("Installed %s", target_exe.c_str());
    } else if (StepFailed("copy executable", r)) {
        return Abort();
    }

    Transition(UpdaterState::CheckIntegrity);
    if (config_.verify_integrity) {
        const std::pair<const std::string*, CopyOutcome*> installed[] = {{&target_doc, &doc}, {&target_exe, &exe}};
        for (const auto& [target, copy] : installed) {
            if (!copy->copied) continue;
            // An empty document is a valid payload; an empty executable is not.
            auto r = VerifyCopy(*target, *copy, copy == &exe);
            if (r.is_ok()) continue;
            copy->copied = false;
            if (StepFailed("integrity check", r)) return Abort();
        }
    }

    Transition(UpdaterState::Cleanup);
    for (const CopyOutcome* item : {&doc, &exe}) {
        if (!item->copied) {
            LogWarn("Keeping %s: it was not installed", item->staged_path.c_str());
            continue;
        }
        if (auto r = FileReplacer::RemoveIfExists(item->staged_path); !r.is_ok()) {
            LogWarn("Cleanup: %s", r.msg.c_str());
        }
    }
    if (doc.copied && exe.copied) {
        if (auto r = FileReplacer::RemoveIfExists(config_.manifest_file); !r.is_ok()) {
            LogWarn("Cleanup: %s", r.msg.c_str());
        }
    }

    Transition(UpdaterState::Launch);
    if (auto r = deps_.launcher->LaunchDetached(target_exe, LaunchDirectoryOf(target_exe)); !r.is_ok()) {
        if (StepFailed("launch", r)) return Abort();
    }

    Transition(UpdaterState::Done);
    if (failures_.empty()) {
        LogInfo("Update complete");
    } else {
        LogWarn("Update finished with %zu failed step(s)", failures_.size());
    }
    return kExitSuccess;
}

} // namespace selfupdate
