#include <iostream>
#include <csignal>
#include <curl/curl.h>
#include "cli/ArgumentParser.h"
#include "core/DownloadCoordinator.h"

namespace {
volatile std::sig_atomic_t gStopRequested = 0;

void handleSignal(int) {
    gStopRequested = 1;
}
}

int main(int argc, char* argv[]) {
    DownloadJob job;
    ArgumentParser parser;

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    if (!parser.parse(argc, argv, job))
        return 1;

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::cerr << "spd: libcurl initialisation failed" << std::endl;
        return 2;
    }

    DownloadCoordinator coordinator(job, &gStopRequested);
    DownloadResult result = coordinator.run();

    curl_global_cleanup();

    if (!result.ok()) {
        std::cerr << "spd: " << toString(result.status.kind) << ": " << result.status.message << std::endl;
        if (result.status.kind != ErrorKind::InvalidConfiguration)
            std::cerr << "spd: part files kept next to " << job.outputPath << ", rerun to resume" << std::endl;
        return 2;
    }

    std::cout << result.outputPath << " (" << result.bytesTransferred << " bytes)" << std::endl;
    return 0;
}
