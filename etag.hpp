#ifndef __ETAG_H__
#define __ETAG_H__

#include <cstdint>
#include <string>

class FileHandle;

typedef struct etag_options {
    unsigned int max_workers;   // default: available parallelism - 1, at least 1
    bool sequential;            // single-threaded ordered reads
    etag_options();
} EtagOptions;

unsigned int defaultWorkerCount(void);

class EtagHasher {
  public:
    EtagHasher();
    explicit EtagHasher(const EtagOptions& options);

    std::string computeTag(const std::string& path, int64_t block_size);
    std::string computeTag(FileHandle& file, int64_t block_size);

    // Infers the block size from reference_tag and recomputes. A mismatch
    // returns false; read failures are thrown, never reported as a mismatch.
    bool verifyTag(const std::string& path, const std::string& reference_tag);
    bool verifyTag(FileHandle& file, const std::string& reference_tag);

  private:
    EtagOptions options;
};

std::string computeTag(const std::string& path, int64_t block_size, const EtagOptions& options = EtagOptions());

bool verifyTag(const std::string& path, const std::string& reference_tag, const EtagOptions& options = EtagOptions());

#endif  //__ETAG_H__
