// include/JdkManager/FolderNameRules.hpp
#ifndef JDKM_FOLDER_NAME_RULES_HPP
#define JDKM_FOLDER_NAME_RULES_HPP

#include <JdkManager/PlatformProfile.hpp>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace JdkManager {

    struct FolderNameRule {
        std::string name;
        std::regex pattern; // capture group 1 holds the feature version
    };

    // Ordered table of vendor folder-name conventions. Rules are tried in insertion
    // order and the first one that matches decides the feature version.
    class FolderNameRules {
    public:
        FolderNameRules() = default;

        // jdk-<N>, <N>_..., java-<N>-..., openjdk-<N>, <N>
        static const FolderNameRules& defaults();

        // Appends a rule with the lowest priority. Throws std::regex_error on a bad pattern.
        void addRule(const std::string& name, const std::string& pattern);

        std::optional<unsigned int> extractFeatureVersion(const std::string& folderName) const;

        // Name of the rule that would decide this folder, empty if none
        std::string matchingRule(const std::string& folderName) const;

    private:
        std::vector<FolderNameRule> m_rules;
    };

    struct FolderTraits {
        std::string arch; // folder vocabulary
        std::string os;   // windows | linux | mac | android
    };

    // Architecture and OS tokens found in a folder name, falling back to the profile.
    FolderTraits extractArchAndOS(const std::string& folderName, const PlatformProfile& fallback);

} // namespace JdkManager

#endif // JDKM_FOLDER_NAME_RULES_HPP
