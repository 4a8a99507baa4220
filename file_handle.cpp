#include "file_handle.hpp"
#include "errors.hpp"

#include <boost/log/trivial.hpp>

#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

FileHandle::FileHandle(const std::string& path)
    : fd(-1), file_path(path), file_size(0), base_offset(0), is_seekable(false), is_reopenable(true) {
    do {
        this->fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    } while (this->fd < 0 && errno == EINTR);
    if (this->fd < 0) {
        int err = errno;
        BOOST_LOG_TRIVIAL(debug) << "FileHandle: Unable to open " << path;
        throw IOError("Unable to open input file '" + path + "'", err);
    }
    try {
        this->stat();
    }
    catch (...) {
        this->close();
        throw;
    }
}

FileHandle::FileHandle(int d, const std::string& path)
    : fd(d), file_path(path), file_size(0), base_offset(0), is_seekable(false), is_reopenable(false) {
    this->stat();
    if (this->is_seekable) {
        off_t pos = ::lseek(this->fd, 0, SEEK_CUR);
        if (pos < 0) {
            int err = errno;
            throw IOError("Unable to query offset of '" + this->file_path + "'", err);
        }
        this->base_offset = std::min<int64_t>(pos, this->file_size);
        this->file_size -= this->base_offset;
        BOOST_LOG_TRIVIAL(trace) << "FileHandle: " << this->file_path << " starts at offset " << this->base_offset;
    }
}

FileHandle FileHandle::fromDescriptor(int source, const std::string& name) {
    int d = ::dup(source);
    if (d < 0) {
        int err = errno;
        throw IOError("Unable to duplicate descriptor of '" + name + "'", err);
    }
    try {
        return FileHandle(d, name);
    }
    catch (...) {
        ::close(d);
        throw;
    }
}

FileHandle FileHandle::standardInput(void) {
    return fromDescriptor(STDIN_FILENO, "-");
}

FileHandle::~FileHandle() {
    this->close();
}

FileHandle::FileHandle(FileHandle&& other) noexcept
    : fd(other.fd), file_path(std::move(other.file_path)), file_size(other.file_size),
      base_offset(other.base_offset), is_seekable(other.is_seekable), is_reopenable(other.is_reopenable) {
    other.fd = -1;
}

FileHandle& FileHandle::operator=(FileHandle&& other) noexcept {
    if (this != &other) {
        this->close();
        this->fd = other.fd;
        this->file_path = std::move(other.file_path);
        this->file_size = other.file_size;
        this->base_offset = other.base_offset;
        this->is_seekable = other.is_seekable;
        this->is_reopenable = other.is_reopenable;
        other.fd = -1;
    }
    return *this;
}

void FileHandle::stat(void) {
    struct stat st;
    if (::fstat(this->fd, &st) != 0) {
        int err = errno;
        throw IOError("Unable to stat '" + this->file_path + "'", err);
    }
    this->is_seekable = S_ISREG(st.st_mode);
    this->file_size = this->is_seekable ? static_cast<int64_t>(st.st_size) : 0;
    BOOST_LOG_TRIVIAL(trace) << "FileHandle: " << this->file_path << " size=" << this->file_size
                             << " seekable=" << this->is_seekable;
}

void FileHandle::close(void) noexcept {
    if (this->fd >= 0) {
        ::close(this->fd);
        this->fd = -1;
    }
}

size_t FileHandle::readAt(int64_t offset, char* buf, size_t n) const {
    size_t done = 0;
    while (done < n) {
        ssize_t r = ::pread(this->fd, buf + done, n - done, static_cast<off_t>(this->base_offset + offset + done));
        if (r < 0) {
            int err = errno;
            if (err == EINTR) continue;
            throw IOError("Read failed on '" + this->file_path + "' at offset " + std::to_string(offset + done), err);
        }
        if (r == 0) break;  // EOF
        done += static_cast<size_t>(r);
    }
    return done;
}

size_t FileHandle::readSome(char* buf, size_t n) {
    size_t done = 0;
    while (done < n) {
        ssize_t r = ::read(this->fd, buf + done, n - done);
        if (r < 0) {
            int err = errno;
            if (err == EINTR) continue;
            throw IOError("Read failed on '" + this->file_path + "'", err);
        }
        if (r == 0) break;  // EOF
        done += static_cast<size_t>(r);
    }
    return done;
}

FileHandle FileHandle::reopen(void) const {
    if (!this->is_reopenable) {
        throw InvalidInput("'" + this->file_path + "' cannot be reopened");
    }
    FileHandle other(this->file_path);
    if (other.size() != this->file_size) {
        throw RangeError("File '" + this->file_path + "' changed size from " + std::to_string(this->file_size) +
                         " to " + std::to_string(other.size()) + " while hashing");
    }
    return other;
}
