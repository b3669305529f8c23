#include "docprint/run_resolver.h"
#include "docprint/log.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace docprint {

namespace {

/// Trim whitespace from both ends
std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

/// Split "12.5px" into 12.5 and "px". Fails if there is no leading number.
bool parseNumericValue(const std::string& val, float& number, std::string& unit) {
    if (val.empty()) return false;

    size_t numEnd = 0;
    bool hasDigit = false;
    bool hasDot = false;
    if (val[numEnd] == '-' || val[numEnd] == '+') ++numEnd;
    while (numEnd < val.size()) {
        if (std::isdigit(static_cast<unsigned char>(val[numEnd]))) {
            hasDigit = true;
            ++numEnd;
        } else if (val[numEnd] == '.' && !hasDot) {
            hasDot = true;
            ++numEnd;
        } else {
            break;
        }
    }

    if (!hasDigit) return false;

    number = std::strtof(val.substr(0, numEnd).c_str(), nullptr);
    unit = toLower(trim(val.substr(numEnd)));
    return true;
}

/// Fixed lookup table from CSS family names to output families
struct FamilyEntry {
    const char* name;
    FontFamily family;
};

const FamilyEntry kFamilyTable[] = {
    {"helvetica", FontFamily::Helvetica},
    {"arial", FontFamily::Helvetica},
    {"inter", FontFamily::Helvetica},
    {"verdana", FontFamily::Helvetica},
    {"roboto", FontFamily::Helvetica},
    {"comic sans ms", FontFamily::Helvetica},
    {"sans-serif", FontFamily::Helvetica},
    {"times", FontFamily::Times},
    {"times new roman", FontFamily::Times},
    {"georgia", FontFamily::Times},
    {"garamond", FontFamily::Times},
    {"serif", FontFamily::Times},
    {"courier", FontFamily::Courier},
    {"courier new", FontFamily::Courier},
    {"consolas", FontFamily::Courier},
    {"monaco", FontFamily::Courier},
    {"monospace", FontFamily::Courier},
};

struct NamedColor {
    const char* name;
    Rgb rgb;
};

const NamedColor kNamedColors[] = {
    {"black", {0, 0, 0}},
    {"white", {255, 255, 255}},
    {"red", {255, 0, 0}},
    {"green", {0, 128, 0}},
    {"blue", {0, 0, 255}},
    {"yellow", {255, 255, 0}},
    {"gray", {128, 128, 128}},
    {"grey", {128, 128, 128}},
    {"orange", {255, 165, 0}},
    {"purple", {128, 0, 128}},
};

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

std::optional<Rgb> parseHexColor(const std::string& hex) {
    std::vector<int> digits;
    for (char c : hex) {
        int d = hexDigit(c);
        if (d < 0) return std::nullopt;
        digits.push_back(d);
    }
    if (digits.size() == 3) {
        return Rgb{static_cast<uint8_t>(digits[0] * 17),
                   static_cast<uint8_t>(digits[1] * 17),
                   static_cast<uint8_t>(digits[2] * 17)};
    }
    if (digits.size() == 6) {
        return Rgb{static_cast<uint8_t>(digits[0] * 16 + digits[1]),
                   static_cast<uint8_t>(digits[2] * 16 + digits[3]),
                   static_cast<uint8_t>(digits[4] * 16 + digits[5])};
    }
    return std::nullopt;
}

/// "rgb(12, 34, 56)"; components outside 0..255 are rejected
std::optional<Rgb> parseRgbFunction(const std::string& value) {
    auto open = value.find('(');
    auto close = value.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        return std::nullopt;
    }
    std::istringstream iss(value.substr(open + 1, close - open - 1));
    std::string part;
    int components[3];
    int count = 0;
    while (std::getline(iss, part, ',')) {
        if (count >= 3) return std::nullopt;
        float number = 0;
        std::string unit;
        if (!parseNumericValue(trim(part), number, unit) || !unit.empty()) {
            return std::nullopt;
        }
        if (number < 0 || number > 255) return std::nullopt;
        components[count++] = static_cast<int>(number);
    }
    if (count != 3) return std::nullopt;
    return Rgb{static_cast<uint8_t>(components[0]),
               static_cast<uint8_t>(components[1]),
               static_cast<uint8_t>(components[2])};
}

} // anonymous namespace

std::optional<FontFamily> lookupFontFamily(const std::string& cssFamily) {
    // Only the first entry of the family list is considered
    std::string first = cssFamily.substr(0, cssFamily.find(','));
    first = trim(first);
    if (first.size() >= 2 && (first.front() == '"' || first.front() == '\'') &&
        first.back() == first.front()) {
        first = first.substr(1, first.size() - 2);
    }
    first = toLower(trim(first));
    for (const auto& entry : kFamilyTable) {
        if (first == entry.name) return entry.family;
    }
    return std::nullopt;
}

std::optional<float> parseFontSize(const std::string& size) {
    float number = 0;
    std::string unit;
    if (!parseNumericValue(trim(size), number, unit)) return std::nullopt;
    if (number <= 0) return std::nullopt;
    if (unit.empty() || unit == "pt") return number;
    if (unit == "px") return number * 0.75f;
    return std::nullopt;
}

std::optional<Rgb> parseColor(const std::string& color) {
    std::string value = toLower(trim(color));
    if (value.empty()) return std::nullopt;
    if (value[0] == '#') return parseHexColor(value.substr(1));
    if (value.compare(0, 4, "rgb(") == 0) return parseRgbFunction(value);
    for (const auto& named : kNamedColors) {
        if (value == named.name) return named.rgb;
    }
    return std::nullopt;
}

FontFamily resolveFamily(FontFamily inherited, const std::optional<std::string>& override) {
    if (!override) return inherited;
    auto family = lookupFontFamily(*override);
    if (!family) {
        DP_LOGD("resolveFamily: no mapping for '%s', keeping %s",
                override->c_str(), familyName(inherited));
        return inherited;
    }
    return *family;
}

float resolveSize(float inherited, const std::optional<std::string>& override) {
    if (!override) return inherited;
    auto size = parseFontSize(*override);
    if (!size) {
        DP_LOGW("resolveSize: ignoring malformed font size '%s'", override->c_str());
        return inherited;
    }
    return *size;
}

Rgb resolveColor(const Rgb& inherited, const std::optional<std::string>& override) {
    if (!override) return inherited;
    auto rgb = parseColor(*override);
    if (!rgb) {
        DP_LOGW("resolveColor: ignoring malformed color '%s'", override->c_str());
        return inherited;
    }
    return *rgb;
}

RunStyle merge(const RunStyle& inherited, const InlineRun& run) {
    RunStyle style = inherited;
    style.family = resolveFamily(inherited.family, run.fontFamily);
    style.sizePt = resolveSize(inherited.sizePt, run.fontSize);
    style.bold = inherited.bold || run.bold;
    style.italic = inherited.italic || run.italic;
    style.underline = inherited.underline || run.underline;
    style.strike = inherited.strike || run.strike;
    if (run.superscript) {
        style.script = Script::Super;
    } else if (run.subscript) {
        style.script = Script::Sub;
    }
    style.color = resolveColor(inherited.color, run.color);
    if (run.highlight) {
        auto rgb = parseColor(*run.highlight);
        if (rgb) {
            style.highlighted = true;
            style.highlight = *rgb;
        } else {
            DP_LOGW("merge: ignoring malformed highlight '%s'", run.highlight->c_str());
        }
    }
    return style;
}

RunResolver::RunResolver(const BlockDefaults& defaults)
    : defaults_(defaults) {
    base_.family = defaults.forceMonospace ? FontFamily::Courier : defaults.family;
    base_.sizePt = defaults.sizePt;
    base_.bold = defaults.forceBold;
    base_.italic = defaults.forceItalic;
}

std::vector<ResolvedRun> RunResolver::resolve(const std::vector<InlineRun>& inlines) const {
    std::vector<ResolvedRun> runs;
    runs.reserve(inlines.size());

    for (const auto& inl : inlines) {
        if (inl.text.empty()) continue;

        RunStyle style = merge(base_, inl);
        if (defaults_.forceMonospace) style.family = FontFamily::Courier;

        if (!runs.empty() && runs.back().style == style) {
            runs.back().text += inl.text;
        } else {
            runs.push_back({inl.text, style});
        }
    }

    return runs;
}

} // namespace docprint
