#pragma once

#include "util/result.hpp"

#include <string>

namespace selfupdate {

class IProcessLauncher {
public:
    virtual ~IProcessLauncher() = default;
    virtual Result LaunchDetached(const std::string& executable, const std::string& working_dir) const = 0;
};

// Double fork + setsid: the launched program is reparented to init (or the nearest
// subreaper) and survives the launcher. Returns once the program has been exec'd,
// or with the errno of the failed chdir/exec.
class PosixProcessLauncher final : public IProcessLauncher {
public:
    Result LaunchDetached(const std::string& executable, const std::string& working_dir) const override;
};

} // namespace selfupdate
