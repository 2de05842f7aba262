#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace selfupdate {

// Last path component. Both '/' and '\' count as separators so that
// Windows-style argv[0] values ("C:\Games\App.exe") reduce to "App.exe".
inline std::string_view ImageBaseName(std::string_view path) {
    const auto pos = path.find_last_of("/\\");
    if (pos == std::string_view::npos) return path;
    return path.substr(pos + 1);
}

inline char AsciiLower(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

inline bool EqualsIgnoreAsciiCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (AsciiLower(a[i]) != AsciiLower(b[i])) return false;
    }
    return true;
}

// The kernel appends " (deleted)" to /proc/<pid>/exe once the binary is unlinked.
inline std::string_view StripDeletedSuffix(std::string_view exe_path) {
    constexpr std::string_view kSuffix = " (deleted)";
    if (exe_path.size() >= kSuffix.size() &&
        exe_path.compare(exe_path.size() - kSuffix.size(), kSuffix.size(), kSuffix) == 0) {
        exe_path.remove_suffix(kSuffix.size());
    }
    return exe_path;
}

inline std::string JoinPath(std::string_view dir, std::string_view name) {
    if (dir.empty() || dir == ".") return std::string(name);
    std::string out(dir);
    if (out.back() != '/') out.push_back('/');
    out.append(name);
    return out;
}

} // namespace selfupdate
