#ifndef __CHUNK_PLANNER_H__
#define __CHUNK_PLANNER_H__

#include <cstddef>
#include <cstdint>
#include <vector>

// Inclusive byte range; {0, -1} is the empty range of a zero-length file.
typedef struct byte_range {
    int64_t start;
    int64_t end;
    int64_t size(void) const { return end - start + 1; }
} ByteRange;

// One worker's share of the file.
typedef struct super_range {
    ByteRange range;
    size_t first_block;
    size_t block_count;
} SuperRange;

size_t blockCount(int64_t file_length, int64_t block_size);

std::vector<ByteRange> planBlocks(int64_t file_length, int64_t block_size);

std::vector<SuperRange> planSuperRanges(int64_t file_length, int64_t block_size, unsigned int workers);

unsigned int workerCountFor(int64_t file_length, int64_t block_size, unsigned int max_workers, bool sequential);

#endif  //__CHUNK_PLANNER_H__
