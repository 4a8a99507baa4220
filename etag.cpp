#include "etag.hpp"
#include "block_hasher.hpp"
#include "block_size.hpp"
#include "chunk_planner.hpp"
#include "digest_combiner.hpp"
#include "errors.hpp"
#include "file_handle.hpp"
#include "parallel_executor.hpp"

#include "boost/thread.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/log/trivial.hpp>

namespace {

FileHandle openInput(const std::string& path) {
    if (path == "-") {
        return FileHandle::standardInput();
    }
    return FileHandle(path);
}

}

unsigned int defaultWorkerCount(void) {
    unsigned int threads = boost::thread::hardware_concurrency();
    if (!threads) {
        threads = boost::thread::physical_concurrency();
    }
    return threads > 1 ? threads - 1 : 1;
}

etag_options::etag_options() : max_workers(defaultWorkerCount()), sequential(false) {  }

EtagHasher::EtagHasher() {
    BOOST_LOG_TRIVIAL(debug) << "EtagHasher.max_workers: " << this->options.max_workers;
}

EtagHasher::EtagHasher(const EtagOptions& opts) : options(opts) {
    if (!this->options.max_workers) {
        throw InvalidInput("Worker count must be positive");
    }
    BOOST_LOG_TRIVIAL(debug) << "EtagHasher.max_workers: " << this->options.max_workers
                             << " sequential: " << this->options.sequential;
}

std::string EtagHasher::computeTag(const std::string& path, int64_t block_size) {
    FileHandle file = openInput(path);
    return this->computeTag(file, block_size);
}

std::string EtagHasher::computeTag(FileHandle& file, int64_t block_size) {
    if (block_size <= 0) {
        throw InvalidInput("Block size must be positive, got " + std::to_string(block_size));
    }

    DigestList digests;
    if (!file.seekable()) {
        BOOST_LOG_TRIVIAL(debug) << "EtagHasher: " << file.path() << " is not seekable, streaming";
        BlockHasher hasher;
        digests = hasher.hashStream(file, block_size);
    } else {
        unsigned int workers = workerCountFor(file.size(), block_size, this->options.max_workers,
                                              this->options.sequential || !file.reopenable());
        BOOST_LOG_TRIVIAL(debug) << "EtagHasher: " << file.path() << " size=" << file.size()
                                 << " block_size=" << block_size << " workers=" << workers;
        std::vector<SuperRange> shares = planSuperRanges(file.size(), block_size, workers);
        ParallelExecutor executor(workers);
        digests = executor.execute(file, shares, block_size);
    }
    return combineDigests(digests);
}

bool EtagHasher::verifyTag(const std::string& path, const std::string& reference_tag) {
    FileHandle file = openInput(path);
    return this->verifyTag(file, reference_tag);
}

bool EtagHasher::verifyTag(FileHandle& file, const std::string& reference_tag) {
    std::string expected = normalizeTag(reference_tag);
    if (!file.seekable()) {
        throw InvalidInput("Cannot verify '" + file.path() + "': block size inference needs the file length");
    }
    int64_t block_size = inferBlockSize(file.size(), expected);
    std::string computed = this->computeTag(file, block_size);
    bool match = boost::algorithm::iequals(computed, expected);
    BOOST_LOG_TRIVIAL(debug) << "EtagHasher: " << file.path() << " computed " << computed << " expected " << expected
                             << (match ? " (match)" : " (mismatch)");
    return match;
}

std::string computeTag(const std::string& path, int64_t block_size, const EtagOptions& options) {
    EtagHasher hasher(options);
    return hasher.computeTag(path, block_size);
}

bool verifyTag(const std::string& path, const std::string& reference_tag, const EtagOptions& options) {
    EtagHasher hasher(options);
    return hasher.verifyTag(path, reference_tag);
}
