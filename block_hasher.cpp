#include "block_hasher.hpp"
#include "errors.hpp"

#include <boost/log/trivial.hpp>

#include <algorithm>
#include <string>

BlockHasher::BlockHasher() {  }

char* BlockHasher::buffer(size_t want) {
    if (this->buf.size() < want) {
        this->buf.resize(want);
    }
    return this->buf.data();
}

Digest BlockHasher::hash(const FileHandle& file, const ByteRange& range) {
    int64_t remaining = range.size();
    if (remaining < 0) {
        throw InvalidInput("Invalid byte range [" + std::to_string(range.start) + ", " + std::to_string(range.end) + "]");
    }
    char* b = this->buffer(static_cast<size_t>(std::min<int64_t>(READ_CHUNK_SIZE, std::max<int64_t>(remaining, 1))));
    int64_t offset = range.start;

    this->md5.reset();
    while (remaining > 0) {
        size_t want = static_cast<size_t>(std::min<int64_t>(READ_CHUNK_SIZE, remaining));
        size_t got = file.readAt(offset, b, want);
        if (got != want) {
            throw RangeError("Short read on '" + file.path() + "': expected " + std::to_string(want) +
                             " bytes at offset " + std::to_string(offset) + ", got " + std::to_string(got));
        }
        this->md5.update(b, got);
        offset += static_cast<int64_t>(got);
        remaining -= static_cast<int64_t>(got);
    }
    Digest d = this->md5.finish();
    BOOST_LOG_TRIVIAL(trace) << "BlockHasher: [" << range.start << ", " << range.end << "] " << toHex(d);
    return d;
}

bool BlockHasher::hashBlocks(const FileHandle& file, const SuperRange& share, int64_t block_size, DigestList& out,
                             const std::atomic<bool>* cancel) {
    if (block_size <= 0) {
        throw InvalidInput("Block size must be positive, got " + std::to_string(block_size));
    }
    if (share.first_block + share.block_count > out.size()) {
        throw InvalidInput("Digest list too small for blocks " + std::to_string(share.first_block) + "+" +
                           std::to_string(share.block_count));
    }

    ByteRange block;
    block.start = share.range.start;
    for (size_t i = 0; i < share.block_count; i++) {
        if (cancel && cancel->load()) {
            BOOST_LOG_TRIVIAL(debug) << "BlockHasher: Cancelled at block " << share.first_block + i;
            return false;
        }
        block.end = std::min(share.range.end, block.start + block_size - 1);
        out[share.first_block + i] = this->hash(file, block);
        block.start = block.end + 1;
    }
    return true;
}

DigestList BlockHasher::hashStream(FileHandle& file, int64_t block_size) {
    if (block_size <= 0) {
        throw InvalidInput("Block size must be positive, got " + std::to_string(block_size));
    }
    char* b = this->buffer(static_cast<size_t>(std::min<int64_t>(READ_CHUNK_SIZE, block_size)));
    DigestList digests;

    this->md5.reset();
    while (true) {
        int64_t got = 0;
        bool eof = false;
        while (got < block_size) {
            size_t want = static_cast<size_t>(std::min<int64_t>(READ_CHUNK_SIZE, block_size - got));
            size_t n = file.readSome(b, want);
            this->md5.update(b, n);
            got += static_cast<int64_t>(n);
            if (n < want) {
                eof = true;
                break;
            }
        }
        // Exact multiple of block_size: no trailing empty block
        if (got == 0 && !digests.empty()) {
            break;
        }
        digests.push_back(this->md5.finish());
        BOOST_LOG_TRIVIAL(trace) << "BlockHasher: Stream block " << digests.size() - 1 << " of " << got << " bytes";
        if (eof) {
            break;
        }
    }
    return digests;
}
