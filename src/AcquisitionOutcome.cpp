// src/AcquisitionOutcome.cpp
#include <JdkManager/Types/AcquisitionOutcome.hpp>
#include <JdkManager/Errors.hpp>

namespace JdkManager {

void AcquisitionOutcome::throwIfFailed() const {
    if (succeeded()) {
        return;
    }
    if (!verdict.passed && error.empty()) {
        throw IntegrityVerificationError("Verification of " + artifactPath.filename().string() + " failed: " + verdict.reason);
    }
    throw JdkManagerError("Acquisition of " + release.releaseName + " failed: " + (error.empty() ? verdict.reason : error));
}

json AcquisitionOutcome::to_json() const {
    json j{
        {"release", release.to_json()},
        {"artifactPath", artifactPath.string()},
        {"verified", verdict.passed},
        {"reason", verdict.reason},
        {"succeeded", succeeded()}
    };
    if (extractionDestination) {
        j["extractionDestination"] = extractionDestination->string();
    }
    if (!error.empty()) {
        j["error"] = error;
    }
    return j;
}

} // namespace JdkManager
