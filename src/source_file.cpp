#include "include/source_file.hpp"

#include <cerrno>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

SourceFile::SourceFile(const std::string& path) : path_(path), fd_(-1), size_(0) {
    // Open the input file in read-only mode
    fd_ = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0)
        throw std::system_error(errno, std::generic_category(), "cannot open " + path);

    struct stat st;
    if (fstat(fd_, &st) < 0) {
        int err = errno;
        close(fd_);
        throw std::system_error(err, std::generic_category(), "fstat failed on " + path);
    }
    if (!S_ISREG(st.st_mode)) {
        close(fd_);
        throw std::system_error(EINVAL, std::generic_category(), path + " is not a regular file");
    }
    size_ = static_cast<uint64_t>(st.st_size);
}

SourceFile::~SourceFile() {
    if (fd_ >= 0) close(fd_);
}

size_t SourceFile::read_at(uint64_t offset, void* buf, size_t len) const {
    auto* out = static_cast<char*>(buf);
    size_t done = 0;
    while (done < len) {
        ssize_t n = pread(fd_, out + done, len - done, static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(),
                                    "pread failed on " + path_ + " at offset " + std::to_string(offset + done));
        }
        if (n == 0) break; // EOF
        done += static_cast<size_t>(n);
    }
    return done;
}
