#ifndef __BLOCK_HASHER_H__
#define __BLOCK_HASHER_H__

#include "chunk_planner.hpp"
#include "file_handle.hpp"
#include "md5.hpp"

#include <atomic>
#include <vector>

const size_t READ_CHUNK_SIZE = 1 << 20;

class BlockHasher {
  public:
    BlockHasher();

    // MD5 of exactly the bytes of one range.
    Digest hash(const FileHandle& file, const ByteRange& range);

    // Hashes every block_size block of a super-range into out[first_block...].
    // Returns false when stopped early through cancel.
    bool hashBlocks(const FileHandle& file, const SuperRange& share, int64_t block_size, DigestList& out,
                    const std::atomic<bool>* cancel = nullptr);

    // Sequential variant for sources without a known length.
    DigestList hashStream(FileHandle& file, int64_t block_size);

  private:
    char* buffer(size_t want);

    Md5 md5;
    std::vector<char> buf;
};

#endif  //__BLOCK_HASHER_H__
