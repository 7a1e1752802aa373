#include "record_chain.hpp"

#include <algorithm>
#include <string>

#include "../include/errors.hpp"

RecordReader::RecordReader(const SourceFile& file, const GlobalHeader& gh, uint64_t region_end,
                           size_t block_size)
    : file_(file), gh_(gh), region_end_(region_end),
      block_size_(std::max<size_t>(block_size, RECORD_HEADER_SIZE)) {}

bool RecordReader::header_at(uint64_t offset, RecordHeader& out) {
    if (offset + RECORD_HEADER_SIZE > region_end_) return false;

    // Refill when the header is not entirely inside the current block
    if (buf_.empty() || offset < buf_off_ || offset + RECORD_HEADER_SIZE > buf_off_ + buf_.size()) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(block_size_, region_end_ - offset));
        buf_.resize(want);
        buf_off_ = offset;
        size_t got = file_.read_at(offset, buf_.data(), want);
        buf_.resize(got);
        if (got < RECORD_HEADER_SIZE) {
            // the file shrank under us
            buf_.clear();
            throw FormatError(FormatErrorKind::TruncatedRead,
                              "short read at offset " + std::to_string(offset) + " of " + file_.path());
        }
    }

    out = parse_record_header(buf_.data() + (offset - buf_off_), RECORD_HEADER_SIZE, gh_.order);
    return true;
}

ChainStatus check_chain(RecordReader& reader, uint64_t offset, int lookahead) {
    const uint64_t end = reader.region_end();
    uint64_t off = offset;

    for (int i = 0; i <= lookahead; ++i) {
        // a follower landing exactly on the region end closes the chain
        if (i > 0 && off == end) return ChainStatus::Consistent;

        RecordHeader rh;
        if (!reader.header_at(off, rh)) return ChainStatus::Truncated;
        if (!rh.plausible(reader.global_header())) return ChainStatus::Implausible;

        uint64_t next = off + rh.total_size();
        if (next > end) return ChainStatus::Truncated;
        off = next;
    }
    return ChainStatus::Consistent;
}

uint64_t verify_record_chain(const SourceFile& file, const GlobalHeader& gh, uint64_t start, uint64_t end) {
    RecordReader reader(file, gh, end);
    uint64_t count = 0;
    uint64_t off = start;

    while (off < end) {
        RecordHeader rh;
        if (!reader.header_at(off, rh)) {
            throw FormatError(FormatErrorKind::TruncatedRead,
                              "record header at offset " + std::to_string(off) + " is cut off by end of file (" +
                              std::to_string(end - off) + " bytes left)");
        }
        if (!rh.plausible(gh)) {
            throw FormatError(FormatErrorKind::CorruptRecord,
                              "implausible record header at offset " + std::to_string(off) +
                              " (caplen=" + std::to_string(rh.caplen) + ", len=" + std::to_string(rh.origlen) + ")");
        }
        uint64_t next = off + rh.total_size();
        if (next > end) {
            throw FormatError(FormatErrorKind::TruncatedRead,
                              "record at offset " + std::to_string(off) + " needs " +
                              std::to_string(rh.caplen) + " captured bytes, only " +
                              std::to_string(end - off - RECORD_HEADER_SIZE) + " left");
        }
        off = next;
        ++count;
    }
    return count;
}
