#ifndef __PARALLEL_EXECUTOR_H__
#define __PARALLEL_EXECUTOR_H__

#include "chunk_planner.hpp"
#include "file_handle.hpp"
#include "md5.hpp"

#include <vector>

// Runs one worker thread per super-range and returns digests in block order.
class ParallelExecutor {
  public:
    explicit ParallelExecutor(unsigned int max_workers);
    DigestList execute(const FileHandle& file, const std::vector<SuperRange>& shares, int64_t block_size);
  private:
    unsigned int max_workers;
};

#endif  //__PARALLEL_EXECUTOR_H__
