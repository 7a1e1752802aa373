#pragma once
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

#include "include/pcap_header.hpp"
#include "include/source_file.hpp"

// Fresh directory under $TMPDIR, removed with everything in it
class TempDir {
public:
    TempDir() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "slicecap_test_XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (!mkdtemp(buf.data())) throw std::runtime_error("mkdtemp failed");
        path_ = buf.data();
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    std::string file(const std::string& name) const { return (path_ / name).string(); }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline std::vector<char> read_all(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<char>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline void write_all(const std::string& path, const std::vector<char>& data) {
    std::ofstream out(path, std::ios::binary);
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
}

// A capture opened for slicing: the source file plus its parsed global header
struct OpenedCapture {
    SourceFile file;
    GlobalHeader gh;

    explicit OpenedCapture(const std::string& path) : file(path), gh(read_header(file)) {}

    uint64_t region_start() const { return GLOBAL_HEADER_SIZE; }
    uint64_t region_end() const { return file.size(); }

private:
    static GlobalHeader read_header(const SourceFile& f) {
        uint8_t buf[GLOBAL_HEADER_SIZE];
        size_t got = f.read_at(0, buf, sizeof(buf));
        return parse_global_header(buf, got);
    }
};
