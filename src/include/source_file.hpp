#ifndef SLICECAP_SOURCE_FILE_HPP
#define SLICECAP_SOURCE_FILE_HPP

#include <cstddef>
#include <cstdint>
#include <string>

// Read-only handle on the capture being sliced.
//
// All access goes through positioned reads, so one SourceFile can be shared
// by every worker slot without a shared cursor.
class SourceFile {
public:
    explicit SourceFile(const std::string& path);
    ~SourceFile();

    SourceFile(const SourceFile&) = delete;
    SourceFile& operator=(const SourceFile&) = delete;

    const std::string& path() const { return path_; }
    uint64_t size() const { return size_; }

    // Read up to `len` bytes at `offset`. Returns the number of bytes read,
    // which is short only at end of file. Throws std::system_error on I/O errors.
    size_t read_at(uint64_t offset, void* buf, size_t len) const;

private:
    std::string path_;
    int fd_;
    uint64_t size_;
};

#endif // SLICECAP_SOURCE_FILE_HPP
