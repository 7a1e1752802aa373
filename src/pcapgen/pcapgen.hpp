#ifndef PCAPGEN_HPP
#define PCAPGEN_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "../include/pcap_header.hpp"

// Extra time inserted on the capture clock before a given record.
// A negative delta makes the clock jump backwards.
struct TimeJump {
    size_t before_record;
    int64_t delta_ns;
};

struct CaptureSpec {
    size_t num_records;
    uint32_t payload_len;        // captured bytes per record
    uint32_t payload_len_max;    // > payload_len: lengths drawn from [payload_len, payload_len_max]
    uint32_t start_sec;
    uint64_t spacing_ns;         // clock step between consecutive records
    std::vector<TimeJump> jumps;
    ByteOrder order;
    TsResolution resolution;
    uint32_t snaplen;
    uint32_t network;
    uint8_t fill;                // payload byte
    uint64_t truncate_bytes;     // chopped off the end after writing
    unsigned seed;

    CaptureSpec()
        : num_records(1000)
        , payload_len(64)
        , payload_len_max(0)
        , start_sec(1700000000)
        , spacing_ns(1000000)     // 1 ms
        , order(ByteOrder::Little)
        , resolution(TsResolution::Micro)
        , snaplen(65535)
        , network(1)              // Ethernet
        , fill(0xee)
        , truncate_bytes(0)
        , seed(42) {}
};

struct GeneratedCapture {
    std::vector<uint64_t> record_offsets;  // absolute file offset of each record header
    uint64_t file_size = 0;
};

class CaptureGenerator {
public:
    /**
     * Write a synthetic pcap capture.
     *
     * Record i is stamped start_sec + i * spacing_ns plus every jump at or
     * before i. Output is deterministic for a given spec.
     *
     * @return Offsets of every record written (before any truncation).
     */
    GeneratedCapture generate(const std::string& filename, const CaptureSpec& spec);
};

/**
 * Parse a pcap file from its global header through its last record.
 *
 * @return Number of records.
 * @throws FormatError on the first problem found.
 */
uint64_t verify_pcap_file(const std::string& filename);

bool compare_files(const std::string& file1, const std::string& file2);

#endif // PCAPGEN_HPP
