#ifndef RECORD_CHAIN_HPP
#define RECORD_CHAIN_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

#include "../include/pcap_header.hpp"
#include "../include/source_file.hpp"

// Block-buffered access to record headers inside the record region.
// Scanning forward one byte at a time only costs a pread per block.
class RecordReader {
public:
    RecordReader(const SourceFile& file, const GlobalHeader& gh, uint64_t region_end,
                 size_t block_size = 256 * 1024);

    // Decode the 16 bytes at `offset`. Returns false when a full header
    // does not fit before the region end.
    bool header_at(uint64_t offset, RecordHeader& out);

    uint64_t region_end() const { return region_end_; }
    const GlobalHeader& global_header() const { return gh_; }

private:
    const SourceFile& file_;
    const GlobalHeader& gh_;
    uint64_t region_end_;
    size_t block_size_;
    std::vector<uint8_t> buf_;
    uint64_t buf_off_ = 0;
};

enum class ChainStatus {
    Consistent,   // candidate and its followers parse, or the chain ends exactly at the region end
    Implausible,  // a header in the chain violates the length/timestamp invariants
    Truncated     // a header or its captured bytes are cut off by the region end
};

/**
 * Check whether `offset` looks like the start of a record by parsing the
 * header there and up to `lookahead` following headers.
 */
ChainStatus check_chain(RecordReader& reader, uint64_t offset, int lookahead);

/**
 * Walk every record header from `start` to `end`.
 *
 * @return Number of records in the region.
 * @throws FormatError TruncatedRead or CorruptRecord at the first bad record.
 */
uint64_t verify_record_chain(const SourceFile& file, const GlobalHeader& gh, uint64_t start, uint64_t end);

#endif // RECORD_CHAIN_HPP
