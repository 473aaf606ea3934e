// src/InstalledRuntime.cpp
#include <JdkManager/Types/InstalledRuntime.hpp>

namespace JdkManager {

bool InstalledRuntime::operator==(const InstalledRuntime& other) const {
    return featureVersion == other.featureVersion &&
           folderName == other.folderName &&
           installRoot == other.installRoot &&
           binDir == other.binDir &&
           executablePath == other.executablePath &&
           arch == other.arch &&
           os == other.os &&
           isValid == other.isValid;
}

json InstalledRuntime::to_json() const {
    return json{
        {"featureVersion", featureVersion},
        {"folderName", folderName},
        {"installRoot", installRoot.string()},
        {"binDir", binDir.string()},
        {"executablePath", executablePath.string()},
        {"arch", arch},
        {"os", os},
        {"isValid", isValid}
    };
}

} // namespace JdkManager
