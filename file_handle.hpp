#ifndef __FILE_HANDLE_H__
#define __FILE_HANDLE_H__

#include <cstddef>
#include <cstdint>
#include <string>

// Read-only file descriptor, closed on destruction.
class FileHandle {
  public:
    explicit FileHandle(const std::string& path);
    ~FileHandle();
    FileHandle(FileHandle&& other) noexcept;
    FileHandle& operator=(FileHandle&& other) noexcept;
    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;

    // Duplicates an inherited descriptor. A regular file is read from its
    // current offset, so bytes already consumed by the parent are skipped.
    static FileHandle fromDescriptor(int fd, const std::string& name);
    // Wraps standard input ("-")
    static FileHandle standardInput(void);

    const std::string& path(void) const { return this->file_path; }
    int64_t size(void) const { return this->file_size; }
    bool seekable(void) const { return this->is_seekable; }
    // False for inherited descriptors such as standard input
    bool reopenable(void) const { return this->is_reopenable; }

    // Positioned read; short only at end of file.
    size_t readAt(int64_t offset, char* buf, size_t n) const;
    // Sequential read for pipes; short only at end of file.
    size_t readSome(char* buf, size_t n);

    // Independent descriptor on the same file, for use by another thread.
    FileHandle reopen(void) const;

  private:
    FileHandle(int fd, const std::string& path);
    void stat(void);
    void close(void) noexcept;

    int fd;
    std::string file_path;
    int64_t file_size;
    int64_t base_offset;
    bool is_seekable;
    bool is_reopenable;
};

#endif  //__FILE_HANDLE_H__
