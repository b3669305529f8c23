#include "docprint/config.h"
#include "docprint/errors.h"
#include <algorithm>
#include <cctype>

namespace docprint {

PageConfig pageConfigFor(PageProfile profile) {
    PageConfig config;
    switch (profile) {
        case PageProfile::A4:
        case PageProfile::Custom:
            config.pageWidthMm = 210.0f;
            config.pageHeightMm = 297.0f;
            break;
        case PageProfile::A5:
            config.pageWidthMm = 148.0f;
            config.pageHeightMm = 210.0f;
            break;
        case PageProfile::Letter:
            config.pageWidthMm = 215.9f;
            config.pageHeightMm = 279.4f;
            break;
        case PageProfile::Legal:
            config.pageWidthMm = 215.9f;
            config.pageHeightMm = 355.6f;
            break;
    }
    return config;
}

std::optional<PageProfile> parsePageProfile(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "a4") return PageProfile::A4;
    if (lower == "a5") return PageProfile::A5;
    if (lower == "letter") return PageProfile::Letter;
    if (lower == "legal") return PageProfile::Legal;
    return std::nullopt;
}

void validatePageConfig(const PageConfig& config) {
    // Negated comparisons also reject NaN
    if (!(config.pageWidthMm > 0)) {
        throw ConfigurationError("page width must be positive, got " +
                                 std::to_string(config.pageWidthMm));
    }
    if (!(config.pageHeightMm > 0)) {
        throw ConfigurationError("page height must be positive, got " +
                                 std::to_string(config.pageHeightMm));
    }
    if (!(config.marginMm >= 0)) {
        throw ConfigurationError("margin must not be negative, got " +
                                 std::to_string(config.marginMm));
    }
    if (!(config.contentWidth() > 0) || !(config.pageHeightMm - 2.0f * config.marginMm > 0)) {
        throw ConfigurationError("margin " + std::to_string(config.marginMm) +
                                 " leaves no content area");
    }
    if (!(config.lineSpacingMultiplier > 0)) {
        throw ConfigurationError("line spacing must be positive, got " +
                                 std::to_string(config.lineSpacingMultiplier));
    }
}

} // namespace docprint
