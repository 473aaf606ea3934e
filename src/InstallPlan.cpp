// src/InstallPlan.cpp
#include <JdkManager/Types/InstallPlan.hpp>

namespace JdkManager {

json InstallPlan::to_json() const {
    if (isTermux) {
        return json{
            {"isTermux", true},
            {"version", version},
            {"packageName", packageName},
            {"installCmd", installCommand},
            {"javaPath", javaPath.string()},
            {"installed", installed}
        };
    }
    return json{
        {"isTermux", false},
        {"version", version},
        {"url", url},
        {"filename", fileName},
        {"downloadPath", downloadPath.string()},
        {"unpackPath", unpackPath.string()},
        {"javaBinPath", javaBinPath.string()}
    };
}

} // namespace JdkManager
