#include "chunk_planner.hpp"
#include "errors.hpp"

#include <boost/log/trivial.hpp>

#include <algorithm>
#include <string>

namespace {

void checkArguments(int64_t file_length, int64_t block_size) {
    if (block_size <= 0) {
        throw InvalidInput("Block size must be positive, got " + std::to_string(block_size));
    }
    if (file_length < 0) {
        throw InvalidInput("File length must not be negative, got " + std::to_string(file_length));
    }
}

}

size_t blockCount(int64_t file_length, int64_t block_size) {
    checkArguments(file_length, block_size);
    if (file_length == 0) {
        return 1;
    }
    return static_cast<size_t>(file_length / block_size + (file_length % block_size != 0 ? 1 : 0));
}

std::vector<ByteRange> planBlocks(int64_t file_length, int64_t block_size) {
    size_t count = blockCount(file_length, block_size);
    std::vector<ByteRange> ranges;
    ranges.reserve(count);
    if (file_length == 0) {
        ByteRange empty = {0, -1};
        ranges.push_back(empty);
        return ranges;
    }
    int64_t start = 0;
    for (size_t i = 0; i < count; i++) {
        ByteRange r;
        r.start = start;
        r.end = std::min(file_length - start, block_size) + start - 1;
        ranges.push_back(r);
        start = r.end + 1;
    }
    return ranges;
}

std::vector<SuperRange> planSuperRanges(int64_t file_length, int64_t block_size, unsigned int workers) {
    size_t blocks = blockCount(file_length, block_size);
    size_t w = std::max<size_t>(1, std::min<size_t>(workers, blocks));
    std::vector<SuperRange> plan;
    plan.reserve(w);

    if (file_length == 0) {
        SuperRange sr;
        sr.range.start = 0;
        sr.range.end = -1;
        sr.first_block = 0;
        sr.block_count = 1;
        plan.push_back(sr);
        return plan;
    }

    // Spread the remainder over the leading workers so shares differ by at most one block.
    size_t base = blocks / w;
    size_t extra = blocks % w;
    size_t first = 0;
    for (size_t i = 0; i < w; i++) {
        SuperRange sr;
        sr.first_block = first;
        sr.block_count = base + (i < extra ? 1 : 0);
        sr.range.start = static_cast<int64_t>(first) * block_size;
        if (i + 1 == w) {
            sr.range.end = file_length - 1;
        } else {
            sr.range.end = sr.range.start + static_cast<int64_t>(sr.block_count) * block_size - 1;
        }
        BOOST_LOG_TRIVIAL(trace) << "Planner: worker " << i << " bytes [" << sr.range.start << ", "
                                 << sr.range.end << "] blocks " << sr.first_block << "+" << sr.block_count;
        plan.push_back(sr);
        first += sr.block_count;
    }
    return plan;
}

unsigned int workerCountFor(int64_t file_length, int64_t block_size, unsigned int max_workers, bool sequential) {
    size_t blocks = blockCount(file_length, block_size);
    if (sequential || max_workers <= 1) {
        return 1;
    }
    return static_cast<unsigned int>(std::min<size_t>(max_workers, blocks));
}
