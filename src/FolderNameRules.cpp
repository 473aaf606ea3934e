// src/FolderNameRules.cpp
#include <JdkManager/FolderNameRules.hpp>

#include <algorithm>
#include <cctype>
#include <limits>

namespace JdkManager {

namespace {
    std::string toLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    bool contains(const std::string& haystack, const char* needle) {
        return haystack.find(needle) != std::string::npos;
    }

    FolderNameRules buildDefaults() {
        FolderNameRules rules;
        rules.addRule("jdk", R"(jdk-?(\d+)(?:u\d+)?(?:\.[\d.]+)?(?:\+\d+)?)"); // jdk-8u452+09, jdk-21.0.3+9
        rules.addRule("leading-number", R"(^(\d+)_)");                         // 8_x86_64_windows
        rules.addRule("java-dash", R"(java-(\d+)-)");                          // java-11-openjdk
        rules.addRule("openjdk", R"(openjdk-?(\d+))");                         // openjdk-17, openjdk17
        rules.addRule("bare-number", R"(^(\d+)$)");                            // 8, 11, 17
        return rules;
    }
}

const FolderNameRules& FolderNameRules::defaults() {
    static const FolderNameRules s_defaults = buildDefaults();
    return s_defaults;
}

void FolderNameRules::addRule(const std::string& name, const std::string& pattern) {
    m_rules.push_back({name, std::regex(pattern, std::regex::ECMAScript | std::regex::icase)});
}

std::optional<unsigned int> FolderNameRules::extractFeatureVersion(const std::string& folderName) const {
    for (const auto& rule : m_rules) {
        std::smatch match;
        if (!std::regex_search(folderName, match, rule.pattern) || match.size() < 2) {
            continue;
        }
        try {
            unsigned long value = std::stoul(match[1].str());
            if (value > std::numeric_limits<unsigned int>::max()) {
                continue;
            }
            return static_cast<unsigned int>(value);
        } catch (const std::exception&) {
            // Digits too long for an unsigned long; let the next rule have a go.
            continue;
        }
    }
    return std::nullopt;
}

std::string FolderNameRules::matchingRule(const std::string& folderName) const {
    for (const auto& rule : m_rules) {
        if (std::regex_search(folderName, rule.pattern)) {
            return rule.name;
        }
    }
    return "";
}

FolderTraits extractArchAndOS(const std::string& folderName, const PlatformProfile& fallback) {
    const std::string lowerName = toLower(folderName);
    FolderTraits traits{fallback.cpuArch, fallback.osFamily};

    // x86_64 before x86, arm64 before arm: the longer token contains the shorter one.
    if (contains(lowerName, "x64") || contains(lowerName, "x86_64")) {
        traits.arch = "x86_64";
    } else if (contains(lowerName, "x32") || contains(lowerName, "x86")) {
        traits.arch = "x86";
    } else if (contains(lowerName, "aarch64") || contains(lowerName, "arm64")) {
        traits.arch = "aarch64";
    } else if (contains(lowerName, "arm")) {
        traits.arch = "arm";
    }

    // "darwin" contains "win"
    if (contains(lowerName, "windows") || (contains(lowerName, "win") && !contains(lowerName, "darwin"))) {
        traits.os = "windows";
    } else if (contains(lowerName, "linux")) {
        traits.os = "linux";
    } else if (contains(lowerName, "mac") || contains(lowerName, "darwin")) {
        traits.os = "mac";
    } else if (contains(lowerName, "android")) {
        traits.os = "android";
    }
    return traits;
}

} // namespace JdkManager
