#pragma once
#include <string>
#include <iostream>
#include "../core/utils.h"

class ArgumentParser {
public:
    explicit ArgumentParser(std::ostream& usageOut = std::cout);

    bool parse(int argc, char* argv[], DownloadJob& out);

private:
    void printUsage() const;

private:
    std::ostream& usage;
};
