#include "parallel_executor.hpp"
#include "block_hasher.hpp"
#include "errors.hpp"

#include "boost/thread.hpp"
#include <boost/log/trivial.hpp>
using namespace boost;

#include <atomic>
#include <exception>

class RangeHashWorker {
  public:
    RangeHashWorker(unsigned int i, const FileHandle& f, const SuperRange& s, int64_t bs, DigestList& d,
                    std::exception_ptr& e, std::atomic<bool>& c)
        : index(i), file(f), share(s), block_size(bs), digests(d), error(e), cancel(c) {  }
    void operator() () {
        BOOST_LOG_TRIVIAL(debug) << "RangeHashWorker " << this->index << ": Start, blocks "
                                 << this->share.first_block << "+" << this->share.block_count;
        try {
            // Own descriptor per worker, no shared file state
            FileHandle own = this->file.reopen();
            BlockHasher hasher;
            if (!hasher.hashBlocks(own, this->share, this->block_size, this->digests, &this->cancel)) {
                BOOST_LOG_TRIVIAL(debug) << "RangeHashWorker " << this->index << ": Cancelled";
                return;
            }
        }
        catch (const std::exception& ex) {
            BOOST_LOG_TRIVIAL(debug) << "RangeHashWorker " << this->index << ": Failed: " << ex.what();
            this->error = std::current_exception();
            this->cancel = true;
            return;
        }
        BOOST_LOG_TRIVIAL(debug) << "RangeHashWorker " << this->index << ": Done";
    }
  private:
    unsigned int index;
    const FileHandle& file;
    SuperRange share;
    int64_t block_size;
    DigestList& digests;
    std::exception_ptr& error;
    std::atomic<bool>& cancel;
};

ParallelExecutor::ParallelExecutor(unsigned int workers) : max_workers(workers) {
    if (!this->max_workers) {
        throw InvalidInput("Worker count must be positive");
    }
}

DigestList ParallelExecutor::execute(const FileHandle& file, const std::vector<SuperRange>& shares, int64_t block_size) {
    if (shares.empty()) {
        throw InvalidInput("Nothing to hash: empty range plan");
    }
    if (shares.size() > this->max_workers) {
        throw InvalidInput("Plan needs " + std::to_string(shares.size()) + " workers, limit is " +
                           std::to_string(this->max_workers));
    }
    size_t total = 0;
    for (const SuperRange& s : shares) {
        if (s.first_block != total) {
            throw InvalidInput("Range plan is not contiguous at block " + std::to_string(total));
        }
        total += s.block_count;
    }

    // Pre-sized, indexed by block; workers write disjoint slots
    DigestList digests(total);

    if (shares.size() == 1) {
        BOOST_LOG_TRIVIAL(debug) << "ParallelExecutor: Single share, hashing inline";
        BlockHasher hasher;
        hasher.hashBlocks(file, shares.front(), block_size, digests);
        return digests;
    }

    std::vector<std::exception_ptr> errors(shares.size());
    std::atomic<bool> cancel{false};
    thread_group worker_threads;
    try {
        for (unsigned int i = 0; i < shares.size(); i++) {
            worker_threads.create_thread(RangeHashWorker{i, file, shares[i], block_size, digests, errors[i], cancel});
        }
    }
    catch (const std::exception& ex) {
        BOOST_LOG_TRIVIAL(debug) << "ParallelExecutor: Unable to start workers: " << ex.what();
        cancel = true;
        worker_threads.join_all();
        throw;
    }
    BOOST_LOG_TRIVIAL(debug) << "ParallelExecutor: Started " << shares.size() << " workers for " << total << " blocks";
    worker_threads.join_all();

    for (unsigned int i = 0; i < errors.size(); i++) {
        if (errors[i]) {
            throw WorkerError(i, errors[i]);
        }
    }
    return digests;
}
