#include "pcapgen.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <random>
#include <stdexcept>

#include "../chunking/record_chain.hpp"
#include "../include/errors.hpp"
#include "../include/source_file.hpp"

GeneratedCapture CaptureGenerator::generate(const std::string& filename, const CaptureSpec& spec) {
    if (spec.payload_len > spec.snaplen && spec.snaplen != 0) {
        throw std::invalid_argument("payload length " + std::to_string(spec.payload_len) +
                                    " exceeds snaplen " + std::to_string(spec.snaplen));
    }

    std::ofstream out(filename, std::ios::binary);
    if (!out) {
        throw std::runtime_error("Failed to create file: " + filename);
    }

    auto gh = encode_global_header(spec.order, spec.resolution, spec.snaplen, spec.network);
    out.write(reinterpret_cast<const char*>(gh.data()), gh.size());

    std::mt19937 rng(spec.seed);
    uint32_t len_max = std::max(spec.payload_len, spec.payload_len_max);
    std::uniform_int_distribution<uint32_t> len_dist(spec.payload_len, len_max);

    GeneratedCapture result;
    result.record_offsets.reserve(spec.num_records);

    const int64_t start_ns = static_cast<int64_t>(spec.start_sec) * 1000000000LL;
    const int64_t frac_unit = spec.resolution == TsResolution::Nano ? 1 : 1000;
    int64_t shift_ns = 0;
    uint64_t offset = GLOBAL_HEADER_SIZE;
    std::vector<char> payload;

    for (size_t i = 0; i < spec.num_records; ++i) {
        for (const auto& jump : spec.jumps) {
            if (jump.before_record == i) shift_ns += jump.delta_ns;
        }
        int64_t ts = start_ns + static_cast<int64_t>(i * spec.spacing_ns) + shift_ns;
        if (ts < 0) throw std::invalid_argument("time jump moves the clock before the epoch");

        RecordHeader rh;
        rh.ts_sec = static_cast<uint32_t>(ts / 1000000000LL);
        rh.ts_frac = static_cast<uint32_t>((ts % 1000000000LL) / frac_unit);
        rh.caplen = spec.payload_len_max > spec.payload_len ? len_dist(rng) : spec.payload_len;
        rh.origlen = rh.caplen;

        auto hdr = encode_record_header(rh, spec.order);
        out.write(reinterpret_cast<const char*>(hdr.data()), hdr.size());
        payload.assign(rh.caplen, static_cast<char>(spec.fill));
        out.write(payload.data(), payload.size());

        result.record_offsets.push_back(offset);
        offset += rh.total_size();
    }

    out.close();
    if (!out) throw std::runtime_error("Failed to write file: " + filename);

    result.file_size = offset;
    if (spec.truncate_bytes > 0) {
        result.file_size = spec.truncate_bytes >= offset ? 0 : offset - spec.truncate_bytes;
        std::filesystem::resize_file(filename, result.file_size);
    }
    return result;
}

uint64_t verify_pcap_file(const std::string& filename) {
    SourceFile file(filename);

    uint8_t buf[GLOBAL_HEADER_SIZE];
    size_t got = file.read_at(0, buf, sizeof(buf));
    GlobalHeader gh = parse_global_header(buf, got);

    return verify_record_chain(file, gh, GLOBAL_HEADER_SIZE, file.size());
}

/**
 * Byte-for-byte comparison of two files. Prints where they first differ.
 */
bool compare_files(const std::string& file1, const std::string& file2) {
    std::ifstream f1(file1, std::ios::binary), f2(file2, std::ios::binary);
    if (!f1 || !f2) {
        std::cerr << "Failed to open one of the files." << std::endl;
        return false;
    }

    std::istreambuf_iterator<char> it1(f1), it2(f2), end;
    size_t pos = 0;
    while (it1 != end && it2 != end) {
        if (*it1 != *it2) {
            std::cerr << "Files differ at byte " << pos << std::endl;
            return false;
        }
        ++it1;
        ++it2;
        ++pos;
    }
    if (it1 != end || it2 != end) {
        std::cerr << "Files differ in length after " << pos << " bytes" << std::endl;
        return false;
    }
    return true;
}
