// include/JdkManager/Utils/PathSafety.hpp
#ifndef JDKM_PATH_SAFETY_HPP
#define JDKM_PATH_SAFETY_HPP

#include <string>

namespace JdkManager::Utils {

    // Archive entry names must be relative and must not climb with "..".
    bool isSafeRelativePath(const std::string& entryName);

} // namespace JdkManager::Utils

#endif // JDKM_PATH_SAFETY_HPP
