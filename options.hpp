#ifndef __OPTIONS_H__
#define __OPTIONS_H__

#include "etag.hpp"

#include <boost/log/trivial.hpp>

#include <cstdint>
#include <string>
#include <vector>

const int64_t DEFAULT_BLOCK_SIZE = 8 << 20;

typedef struct cli_options {
    bool help;
    int64_t block_size;
    EtagOptions etag;
    std::string verify_tag;     // empty: compute mode
    std::vector<std::string> files;
    boost::log::trivial::severity_level log_level;
    std::string usage;
} CliOptions;

// "8388608", "8M", "8MB", "8MiB", "512k" ... Suffixes are binary multiples.
int64_t parseByteSize(const std::string& text);

// Core filter for the trivial logger; records below level are dropped.
void setLogLevel(boost::log::trivial::severity_level level);

// Throws InvalidInput on bad usage.
CliOptions parseCommandLine(int argc, const char* const argv[]);

#endif  //__OPTIONS_H__
