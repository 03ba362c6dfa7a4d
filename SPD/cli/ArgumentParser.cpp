#include "ArgumentParser.h"
#include <cstdlib>
#include <cerrno>

namespace {
std::string deriveOutputFromUrl(const std::string& url) {
    // Get file name from url
    std::string name = url;

    auto special = name.find_first_of("?#");
    if (special != std::string::npos)
        name = name.substr(0, special);

    auto slash = name.find_last_of('/');
    if (slash != std::string::npos)
        name = name.substr(slash + 1);

    if (name.empty())
        name = "download";

    return name;
}

bool parseWorkerCount(const char* text, int& out) {
    char* end = nullptr;
    errno = 0;
    long value = std::strtol(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0' || value < 1 || value > 1024)
        return false;

    out = static_cast<int>(value);
    return true;
}
}

ArgumentParser::ArgumentParser(std::ostream& usageOut)
    : usage(usageOut) {
}

bool ArgumentParser::parse(int argc, char* argv[], DownloadJob& out) {
    if (argc < 2) {
        printUsage();
        return false;
    }

    out = DownloadJob{};
    out.url = argv[1];

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-o" && i + 1 < argc) {
            out.outputPath = argv[++i];
        }
        else if (arg == "-t" && i + 1 < argc) {
            if (!parseWorkerCount(argv[++i], out.workerCount)) {
                printUsage();
                return false;
            }
        }
        else if (arg == "-x" && i + 1 < argc) {
            out.proxy = std::string(argv[++i]);
        }
        else if (arg == "-H" && i + 1 < argc) {
            std::string header = argv[++i];
            if (header.find(':') == std::string::npos) {
                printUsage();
                return false;
            }
            out.headers.push_back(header);
        }
        else {
            printUsage();
            return false;
        }
    }

    if (out.outputPath.empty())
        out.outputPath = deriveOutputFromUrl(out.url);

    return true;
}

void ArgumentParser::printUsage() const {
    usage <<
        "Usage:\n"
        "  spd <url> [-o <output>] [options]\n\n"
        "Options:\n"
        "  -o <file>        Output file path (default: name from url)\n"
        "  -t <workers>     Parallel connections (default: 4)\n"
        "  -x <proxy>       Proxy url, e.g. http://host:3128\n"
        "  -H <header>      Extra request header \"Name: value\" (repeatable)\n";
}
