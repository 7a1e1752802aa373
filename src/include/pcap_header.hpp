#pragma once
#include <array>
#include <cstddef>
#include <cstdint>

#include "errors.hpp"

constexpr size_t GLOBAL_HEADER_SIZE = 24;
constexpr size_t RECORD_HEADER_SIZE = 16;

// Used for record validation when the capture declares snaplen 0
constexpr uint32_t DEFAULT_SNAPLEN = 9000;

enum class ByteOrder { Little, Big };

enum class TsResolution { Micro, Nano };

// Sub-second units per second for a resolution (1e6 or 1e9)
inline uint32_t ticks_per_second(TsResolution res) {
    return res == TsResolution::Nano ? 1000000000u : 1000000u;
}

// the pcap global header, kept together with its raw bytes so it can be
// replayed verbatim in front of every slice
struct GlobalHeader {
    uint32_t magic;          // as decoded in the file's own byte order
    uint16_t version_major;
    uint16_t version_minor;
    int32_t  thiszone;
    uint32_t sigfigs;
    uint32_t snaplen;
    uint32_t network;        // link-layer type

    ByteOrder order;
    TsResolution resolution;

    std::array<uint8_t, GLOBAL_HEADER_SIZE> raw;

    // snaplen used for validating records (never 0)
    uint32_t effective_snaplen() const {
        return snaplen == 0 ? DEFAULT_SNAPLEN : snaplen;
    }
};

// the 16 byte per-record header
struct RecordHeader {
    uint32_t ts_sec;
    uint32_t ts_frac;   // microseconds or nanoseconds, see TsResolution
    uint32_t caplen;    // bytes stored in the file
    uint32_t origlen;   // bytes on the wire

    // Timestamp in nanoseconds since the epoch
    int64_t timestamp_ns(TsResolution res) const {
        int64_t frac = res == TsResolution::Nano ? ts_frac : static_cast<int64_t>(ts_frac) * 1000;
        return static_cast<int64_t>(ts_sec) * 1000000000LL + frac;
    }

    // Total size of the record in the file (header + captured bytes)
    uint64_t total_size() const {
        return RECORD_HEADER_SIZE + static_cast<uint64_t>(caplen);
    }

    // Whether these 16 bytes can be a real record header of a capture
    // described by `gh`. A zero original length or an out-of-range
    // sub-second field never occurs in a well-formed capture.
    bool plausible(const GlobalHeader& gh) const {
        if (caplen > gh.effective_snaplen()) return false;
        if (caplen > origlen) return false;
        if (origlen == 0) return false;
        return ts_frac < ticks_per_second(gh.resolution);
    }
};

/**
 * Parse the 24 byte pcap global header.
 *
 * @param data Pointer to the header bytes.
 * @param len Number of bytes available at `data`.
 * @return The decoded header, with byte order and timestamp resolution.
 * @throws FormatError ShortFile if fewer than 24 bytes are available,
 *         InvalidMagic for an unknown magic number, UnsupportedVersion
 *         for anything other than version 2.4.
 */
GlobalHeader parse_global_header(const uint8_t* data, size_t len);

/**
 * Decode a 16 byte record header. Length invariants are not checked here,
 * see RecordHeader::plausible().
 *
 * @throws FormatError TruncatedRead if fewer than 16 bytes are available.
 */
RecordHeader parse_record_header(const uint8_t* data, size_t len, ByteOrder order);

// Encode helpers, used to build synthetic captures
std::array<uint8_t, GLOBAL_HEADER_SIZE> encode_global_header(ByteOrder order, TsResolution res,
                                                             uint32_t snaplen, uint32_t network);
std::array<uint8_t, RECORD_HEADER_SIZE> encode_record_header(const RecordHeader& rh, ByteOrder order);
