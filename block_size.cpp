#include "block_size.hpp"
#include "chunk_planner.hpp"
#include "errors.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/log/trivial.hpp>

#include <limits>

ParsedTag parseTag(const std::string& tag) {
    std::string t = boost::algorithm::trim_copy(tag);
    if (t.size() >= 2 && t.front() == '"' && t.back() == '"') {
        t = t.substr(1, t.size() - 2);
    }
    if (t.empty()) {
        throw InvalidTag(tag, "empty tag");
    }

    ParsedTag parsed;
    parsed.parts = 0;
    std::string::size_type sep = t.rfind('-');
    parsed.hex = t.substr(0, sep);
    if (parsed.hex.size() != 32 || !boost::algorithm::all(parsed.hex, boost::algorithm::is_xdigit())) {
        throw InvalidTag(tag, "expected 32 hex digits");
    }
    boost::algorithm::to_lower(parsed.hex);

    if (sep != std::string::npos) {
        std::string suffix = t.substr(sep + 1);
        if (suffix.empty() || !boost::algorithm::all(suffix, boost::algorithm::is_digit())) {
            throw InvalidTag(tag, "part count is not an integer");
        }
        try {
            parsed.parts = boost::lexical_cast<size_t>(suffix);
        }
        catch (const boost::bad_lexical_cast&) {
            throw InvalidTag(tag, "part count out of range");
        }
        if (parsed.parts == 0) {
            throw InvalidTag(tag, "part count must be positive");
        }
    }
    return parsed;
}

std::string normalizeTag(const std::string& tag) {
    ParsedTag parsed = parseTag(tag);
    if (!parsed.parts) {
        return parsed.hex;
    }
    return parsed.hex + "-" + std::to_string(parsed.parts);
}

int64_t inferBlockSize(int64_t file_length, const std::string& tag) {
    ParsedTag parsed = parseTag(tag);
    if (!parsed.parts) {
        BOOST_LOG_TRIVIAL(debug) << "BlockSize: Single part tag, whole file is one block";
        return file_length + 1;
    }

    int64_t block_size = INFERENCE_START_BLOCK_SIZE;
    while (blockCount(file_length, block_size) > parsed.parts) {
        if (block_size > std::numeric_limits<int64_t>::max() / 2) {
            throw InvalidTag(tag, "no block size yields " + std::to_string(parsed.parts) + " parts");
        }
        block_size *= 2;
    }
    BOOST_LOG_TRIVIAL(debug) << "BlockSize: Inferred " << block_size << " for " << parsed.parts
                             << " parts of " << file_length << " bytes";
    return block_size;
}
