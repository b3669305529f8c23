#include "docprint/engine.h"
#include "docprint/errors.h"
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace {

void printUsage(const char* argv0) {
    std::fprintf(stderr,
                 "usage: %s <document.json> [--page a4|a5|letter|legal] [--title TEXT]\n"
                 "          [--margin MM] [--spacing N] [--font-size PT] [-o FILE]\n",
                 argv0);
}

bool parseFloat(const char* text, float& out) {
    char* end = nullptr;
    out = std::strtof(text, &end);
    return end != text && *end == '\0';
}

bool readFile(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

} // anonymous namespace

int main(int argc, char** argv) {
    std::string inputPath;
    std::string outputPath;
    std::string profileName = "a4";
    docprint::RenderOptions options;
    float margin = -1;
    float spacing = -1;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        bool hasValue = i + 1 < argc;
        if ((std::strcmp(arg, "-o") == 0 || std::strcmp(arg, "--output") == 0) && hasValue) {
            outputPath = argv[++i];
        } else if (std::strcmp(arg, "--page") == 0 && hasValue) {
            profileName = argv[++i];
        } else if (std::strcmp(arg, "--title") == 0 && hasValue) {
            options.title = argv[++i];
        } else if (std::strcmp(arg, "--margin") == 0 && hasValue) {
            if (!parseFloat(argv[++i], margin)) {
                std::fprintf(stderr, "invalid margin '%s'\n", argv[i]);
                return 2;
            }
        } else if (std::strcmp(arg, "--spacing") == 0 && hasValue) {
            if (!parseFloat(argv[++i], spacing)) {
                std::fprintf(stderr, "invalid line spacing '%s'\n", argv[i]);
                return 2;
            }
        } else if (std::strcmp(arg, "--font-size") == 0 && hasValue) {
            if (!parseFloat(argv[++i], options.baseFontSizePt)) {
                std::fprintf(stderr, "invalid font size '%s'\n", argv[i]);
                return 2;
            }
        } else if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (arg[0] != '-' && inputPath.empty()) {
            inputPath = arg;
        } else {
            printUsage(argv[0]);
            return 2;
        }
    }

    if (inputPath.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    auto profile = docprint::parsePageProfile(profileName);
    if (!profile) {
        std::fprintf(stderr, "unknown page profile '%s'\n", profileName.c_str());
        return 2;
    }
    docprint::PageConfig config = docprint::pageConfigFor(*profile);
    if (margin >= 0) config.marginMm = margin;
    if (spacing >= 0) config.lineSpacingMultiplier = spacing;

    std::string json;
    if (!readFile(inputPath, json)) {
        std::fprintf(stderr, "cannot read '%s'\n", inputPath.c_str());
        return 1;
    }

    docprint::DocumentTree tree;
    try {
        tree = docprint::parseDocumentJson(json);
    } catch (const docprint::InvalidDocumentError& e) {
        std::fprintf(stderr, "%s: %s\n", inputPath.c_str(), e.what());
        return 1;
    }

    auto result = docprint::render(tree, config, options);
    if (!result.ok()) {
        std::fprintf(stderr, "render failed: %s\n", result.error->message.c_str());
        return 1;
    }

    if (outputPath.empty()) outputPath = docprint::exportFileName(options.title);
    std::ofstream out(outputPath, std::ios::binary);
    if (!out) {
        std::fprintf(stderr, "cannot write '%s'\n", outputPath.c_str());
        return 1;
    }
    docprint::writePdf(*result.artifact, out, options.title);
    out.close();
    if (!out) {
        std::fprintf(stderr, "error writing '%s'\n", outputPath.c_str());
        return 1;
    }

    auto stats = docprint::documentStats(tree);
    std::printf("%s: %zu page(s), %d words, %d characters\n", outputPath.c_str(),
                result.artifact->pages.size(), stats.words, stats.characters);
    return 0;
}
