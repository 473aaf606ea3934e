// src/Utils/PathSafety.cpp
#include <JdkManager/Utils/PathSafety.hpp>

#include <string_view>

namespace JdkManager::Utils {

bool isSafeRelativePath(const std::string& entryName) {
    if (entryName.empty()) return false;
    if (entryName.front() == '/' || entryName.front() == '\\') return false;
    if (entryName.size() > 1 && entryName[1] == ':') return false; // C:\...

    std::string_view sv(entryName);
    while (!sv.empty()) {
        auto pos = sv.find_first_of("/\\");
        auto seg = sv.substr(0, pos);
        if (seg == "..") return false;
        if (pos == std::string_view::npos) break;
        sv.remove_prefix(pos + 1);
    }
    return true;
}

} // namespace JdkManager::Utils
