// include/JdkManager/Types/AcquisitionOutcome.hpp
#ifndef JDKM_ACQUISITION_OUTCOME_HPP
#define JDKM_ACQUISITION_OUTCOME_HPP

#include <JdkManager/Types/RemoteRelease.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace JdkManager {

    struct VerificationVerdict {
        bool passed = false;
        std::string reason; // empty when passed

        static VerificationVerdict pass() { return {true, ""}; }
        static VerificationVerdict fail(std::string why) { return {false, std::move(why)}; }
    };

    // Result of one download + verify + extract cycle.
    struct AcquisitionOutcome {
        RemoteRelease release;
        std::filesystem::path artifactPath;
        VerificationVerdict verdict;
        // Set only when verification passed and extraction finished
        std::optional<std::filesystem::path> extractionDestination;
        // Download or extraction failure, empty otherwise
        std::string error;

        bool succeeded() const { return verdict.passed && extractionDestination.has_value(); }

        // Throws IntegrityVerificationError on a failed verdict, JdkManagerError on any other failure.
        void throwIfFailed() const;

        json to_json() const;
    };
}

#endif // JDKM_ACQUISITION_OUTCOME_HPP
