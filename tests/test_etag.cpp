#include <gtest/gtest.h>

#include "errors.hpp"
#include "etag.hpp"
#include "file_handle.hpp"
#include "test_util.hpp"

#include <boost/algorithm/string/case_conv.hpp>

#include <fcntl.h>
#include <unistd.h>

namespace {

EtagOptions withWorkers(unsigned int workers, bool sequential) {
    EtagOptions options;
    options.max_workers = workers;
    options.sequential = sequential;
    return options;
}

bool isSinglePartTag(const std::string& tag) {
    if (tag.size() != 32) {
        return false;
    }
    for (char c : tag) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
            return false;
        }
    }
    return true;
}

// Read end of a pipe already holding content, seen as /dev/fd/N.
class PipeSource {
  public:
    explicit PipeSource(const std::string& content) {
        if (::pipe(this->fds) != 0) {
            throw std::runtime_error("pipe failed");
        }
        if (::write(this->fds[1], content.data(), content.size()) != static_cast<ssize_t>(content.size())) {
            throw std::runtime_error("pipe write failed");
        }
        ::close(this->fds[1]);
    }
    ~PipeSource() {
        ::close(this->fds[0]);
    }
    std::string path(void) const { return "/dev/fd/" + std::to_string(this->fds[0]); }
  private:
    int fds[2];
};

std::string suffixOf(const std::string& tag) {
    std::string::size_type sep = tag.rfind('-');
    return sep == std::string::npos ? std::string() : tag.substr(sep + 1);
}

}

TEST(ComputeTag, EmptyFile) {
    TempFile f("");
    EXPECT_EQ("d41d8cd98f00b204e9800998ecf8427e", computeTag(f.path(), 16));
    EXPECT_EQ("d41d8cd98f00b204e9800998ecf8427e", computeTag(f.path(), 16, withWorkers(8, false)));
    EXPECT_EQ("d41d8cd98f00b204e9800998ecf8427e", computeTag(f.path(), 16, withWorkers(1, true)));
}

TEST(ComputeTag, SmallerThanBlockHasNoSuffix) {
    for (size_t n = 0; n < 16; n++) {
        TempFile f(pattern(n));
        std::string tag = computeTag(f.path(), 16, withWorkers(4, false));
        EXPECT_TRUE(isSinglePartTag(tag)) << tag;
    }
}

TEST(ComputeTag, ExactlyOneBlockHasNoSuffix) {
    TempFile f("0123456789");
    EXPECT_EQ("781e5e245d69b566979b86e28d23f2c7", computeTag(f.path(), 10));
}

TEST(ComputeTag, LargerThanBlockCountsParts) {
    TempFile f("0123456789");
    EXPECT_EQ("61e3716e3a7767581863b67c4e785584-3", computeTag(f.path(), 4));
    EXPECT_EQ("9a6dbec798b1bfe66cc7659d2bb41720-2", computeTag(f.path(), 5));

    const size_t sizes[] = {17, 31, 32, 33, 100};
    for (size_t n : sizes) {
        TempFile g(pattern(n));
        std::string tag = computeTag(g.path(), 16, withWorkers(3, false));
        EXPECT_EQ(std::to_string((n + 15) / 16), suffixOf(tag)) << "n=" << n;
        EXPECT_EQ(32u, tag.find('-'));
    }
}

TEST(ComputeTag, SameTagForAnyWorkerCount) {
    TempFile f(pattern(3 * MiB + 5));
    const unsigned int workers[] = {1, 2, 3, 4, 7, 16};
    for (unsigned int w : workers) {
        EXPECT_EQ("5d83f2370faef922b78573a4638c7a46-4", computeTag(f.path(), MiB, withWorkers(w, false)));
        EXPECT_EQ("44c619afa532b424964befb925e8f4aa-2", computeTag(f.path(), 2 * MiB, withWorkers(w, false)));
        EXPECT_EQ("0f4118c422bd74bd6ea87897eea96d1c", computeTag(f.path(), 8 * MiB, withWorkers(w, false)));
    }
    EXPECT_EQ("5d83f2370faef922b78573a4638c7a46-4", computeTag(f.path(), MiB, withWorkers(8, true)));
}

TEST(ComputeTag, Idempotent) {
    TempFile f(pattern(100000));
    EtagHasher hasher(withWorkers(4, false));
    std::string first = hasher.computeTag(f.path(), 4096);
    EXPECT_EQ(first, hasher.computeTag(f.path(), 4096));
}

TEST(ComputeTag, IdenticalBlocksAndOneByteChange) {
    const size_t block = 1024;
    std::string half = pattern(block);
    TempFile f(half + half);
    std::string before = computeTag(f.path(), block);
    EXPECT_EQ("2", suffixOf(before));

    std::string changed = half + half;
    changed[block + 10] ^= 0x01;
    f.write(changed);
    std::string after = computeTag(f.path(), block);
    EXPECT_EQ("2", suffixOf(after));
    EXPECT_NE(before.substr(0, 32), after.substr(0, 32));
}

TEST(ComputeTag, RejectsBadArguments) {
    TempFile f("0123456789");
    EXPECT_THROW(computeTag(f.path(), 0), InvalidInput);
    EXPECT_THROW(computeTag(f.path(), -1), InvalidInput);
    EXPECT_THROW(EtagHasher(withWorkers(0, false)), InvalidInput);
    EXPECT_THROW(computeTag("/nonexistent/s3etag/input", 16), IOError);
}

TEST(ComputeTag, PipeMatchesRegularFile) {
    int fds[2];
    ASSERT_EQ(0, ::pipe(fds));
    std::string data = "0123456789";
    ASSERT_EQ(static_cast<ssize_t>(data.size()), ::write(fds[1], data.data(), data.size()));
    ::close(fds[1]);
    std::string tag = computeTag("/dev/fd/" + std::to_string(fds[0]), 4, withWorkers(4, false));
    ::close(fds[0]);
    EXPECT_EQ("61e3716e3a7767581863b67c4e785584-3", tag);
}

TEST(VerifyTag, MultipartTagRoundTrips) {
    TempFile f(pattern(3 * MiB + 5));
    EXPECT_TRUE(verifyTag(f.path(), "5d83f2370faef922b78573a4638c7a46-4"));
    EXPECT_TRUE(verifyTag(f.path(), "44c619afa532b424964befb925e8f4aa-2"));
    EXPECT_TRUE(verifyTag(f.path(), "0f4118c422bd74bd6ea87897eea96d1c"));
}

TEST(VerifyTag, ComputedTagsVerify) {
    TempFile f(pattern(5 * MiB + 17));
    EtagHasher hasher(withWorkers(3, false));
    const int64_t blocks[] = {MiB, 2 * MiB, 4 * MiB, 8 * MiB};
    for (int64_t b : blocks) {
        std::string tag = hasher.computeTag(f.path(), b);
        EXPECT_TRUE(hasher.verifyTag(f.path(), tag)) << tag;
    }
}

TEST(VerifyTag, CaseInsensitiveAndQuoted) {
    TempFile f(pattern(3 * MiB + 5));
    EXPECT_TRUE(verifyTag(f.path(), "5D83F2370FAEF922B78573A4638C7A46-4"));
    EXPECT_TRUE(verifyTag(f.path(), "\"5d83f2370faef922b78573a4638c7a46-4\""));
}

TEST(VerifyTag, WrongPartCountIsMismatch) {
    TempFile f(pattern(3 * MiB + 5));
    EXPECT_FALSE(verifyTag(f.path(), "5d83f2370faef922b78573a4638c7a46-2"));
}

TEST(VerifyTag, GrownFileIsMismatchNotError) {
    TempFile f("0123456789");
    std::string tag = computeTag(f.path(), 16);
    EXPECT_TRUE(verifyTag(f.path(), tag));
    f.write("0123456789X");
    EXPECT_FALSE(verifyTag(f.path(), tag));
}

TEST(VerifyTag, AgreesWithComputeTag) {
    TempFile f(pattern(3 * MiB + 5));
    std::string tag = computeTag(f.path(), MiB);
    EXPECT_TRUE(verifyTag(f.path(), boost::algorithm::to_upper_copy(tag)));
    std::string other = tag;
    other[0] = other[0] == '0' ? '1' : '0';
    EXPECT_FALSE(verifyTag(f.path(), other));
}

TEST(VerifyTag, ErrorsAreNotMismatches) {
    EXPECT_THROW(verifyTag("/nonexistent/s3etag/input", "d41d8cd98f00b204e9800998ecf8427e"), IOError);
    TempFile f("0123456789");
    EXPECT_THROW(verifyTag(f.path(), ""), InvalidTag);
    EXPECT_THROW(verifyTag(f.path(), "d41d8cd98f00b204e9800998ecf8427e-x"), InvalidTag);
}

TEST(ComputeTag, PipeIgnoresWorkerOptions) {
    const unsigned int workers[] = {1, 2, 8};
    for (unsigned int w : workers) {
        for (int sequential = 0; sequential < 2; sequential++) {
            PipeSource pipe("0123456789");
            EXPECT_EQ("61e3716e3a7767581863b67c4e785584-3",
                      computeTag(pipe.path(), 4, withWorkers(w, sequential != 0)))
                << "workers " << w << " sequential " << sequential;
        }
    }
}

TEST(ComputeTag, InheritedDescriptorStartsAtCurrentOffset) {
    TempFile f("0123456789");
    int fd = ::open(f.path().c_str(), O_RDONLY);
    ASSERT_GE(fd, 0);
    ASSERT_EQ(4, ::lseek(fd, 4, SEEK_SET));
    FileHandle handle = FileHandle::fromDescriptor(fd, "-");
    ::close(fd);

    EXPECT_EQ(6, handle.size());
    EXPECT_FALSE(handle.reopenable());
    EtagHasher hasher(withWorkers(4, false));
    EXPECT_EQ("e35cf7b66449df565f93c607d5a81d09", hasher.computeTag(handle, 16));
    EXPECT_EQ("c3c4fb1252fb6cd8fcfdd4bb3ec05df1-2", hasher.computeTag(handle, 4));
    EXPECT_TRUE(hasher.verifyTag(handle, "e35cf7b66449df565f93c607d5a81d09"));
}

TEST(VerifyTag, PipeIsInvalidInputNotMismatch) {
    PipeSource pipe("0123456789");
    EXPECT_THROW(verifyTag(pipe.path(), "781e5e245d69b566979b86e28d23f2c7"), InvalidInput);

    PipeSource other("0123456789");
    FileHandle handle(other.path());
    EtagHasher hasher;
    EXPECT_THROW(hasher.verifyTag(handle, "781e5e245d69b566979b86e28d23f2c7"), InvalidInput);
}

TEST(VerifyTag, HandleOverloadNormalizesTag) {
    TempFile f(pattern(3 * MiB + 5));
    FileHandle handle(f.path());
    EtagHasher hasher(withWorkers(3, false));
    EXPECT_TRUE(hasher.verifyTag(handle, " \"5D83F2370FAEF922B78573A4638C7A46-4\" "));
    EXPECT_THROW(hasher.verifyTag(handle, "\"\""), InvalidTag);
}
