#pragma once
#include <string>
#include <ostream>
#include "../core/utils.h"

class ArgumentParser {
public:
    bool parse(int argc, char* argv[], DownloadConfig& out);

    void printUsage(std::ostream& os) const;

    static std::string deriveOutputFromUrl(const std::string& url);

private:
    void printUsage() const;
};
