#include "include/pcap_header.hpp"

#include <cstring>
#include <string>

namespace {

constexpr uint32_t MAGIC_MICRO = 0xa1b2c3d4u;
constexpr uint32_t MAGIC_NANO  = 0xa1b23c4du;

uint16_t load16(const uint8_t* p, ByteOrder order) {
    if (order == ByteOrder::Little)
        return static_cast<uint16_t>(p[0] | (p[1] << 8));
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

uint32_t load32(const uint8_t* p, ByteOrder order) {
    if (order == ByteOrder::Little)
        return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
               (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

void store16(uint8_t* p, uint16_t v, ByteOrder order) {
    if (order == ByteOrder::Little) {
        p[0] = v & 0xff;
        p[1] = (v >> 8) & 0xff;
    } else {
        p[0] = (v >> 8) & 0xff;
        p[1] = v & 0xff;
    }
}

void store32(uint8_t* p, uint32_t v, ByteOrder order) {
    for (int i = 0; i < 4; ++i) {
        int shift = order == ByteOrder::Little ? 8 * i : 8 * (3 - i);
        p[i] = (v >> shift) & 0xff;
    }
}

std::string hex_bytes(const uint8_t* p, size_t n) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    for (size_t i = 0; i < n; ++i) {
        if (i) out += ' ';
        out += digits[p[i] >> 4];
        out += digits[p[i] & 0x0f];
    }
    return out;
}

} // namespace

GlobalHeader parse_global_header(const uint8_t* data, size_t len) {
    if (len < GLOBAL_HEADER_SIZE) {
        throw FormatError(FormatErrorKind::ShortFile,
                          "need " + std::to_string(GLOBAL_HEADER_SIZE) +
                          " bytes for the global header, got " + std::to_string(len));
    }

    GlobalHeader gh{};

    // The magic tells both the byte order of the whole file and the
    // timestamp resolution
    uint32_t as_big = load32(data, ByteOrder::Big);
    uint32_t as_little = load32(data, ByteOrder::Little);
    if (as_big == MAGIC_MICRO || as_big == MAGIC_NANO) {
        gh.order = ByteOrder::Big;
        gh.magic = as_big;
    } else if (as_little == MAGIC_MICRO || as_little == MAGIC_NANO) {
        gh.order = ByteOrder::Little;
        gh.magic = as_little;
    } else {
        throw FormatError(FormatErrorKind::InvalidMagic,
                          "unknown magic id in the pcap file header (" + hex_bytes(data, 4) + ")");
    }
    gh.resolution = gh.magic == MAGIC_NANO ? TsResolution::Nano : TsResolution::Micro;

    gh.version_major = load16(data + 4, gh.order);
    gh.version_minor = load16(data + 6, gh.order);
    gh.thiszone      = static_cast<int32_t>(load32(data + 8, gh.order));
    gh.sigfigs       = load32(data + 12, gh.order);
    gh.snaplen       = load32(data + 16, gh.order);
    gh.network       = load32(data + 20, gh.order);

    // Version 2.4 is the only version supported
    if (gh.version_major != 2 || gh.version_minor != 4) {
        throw FormatError(FormatErrorKind::UnsupportedVersion,
                          "pcap file version " + std::to_string(gh.version_major) + "." +
                          std::to_string(gh.version_minor) + " unsupported");
    }

    std::memcpy(gh.raw.data(), data, GLOBAL_HEADER_SIZE);
    return gh;
}

RecordHeader parse_record_header(const uint8_t* data, size_t len, ByteOrder order) {
    if (len < RECORD_HEADER_SIZE) {
        throw FormatError(FormatErrorKind::TruncatedRead,
                          "record header needs " + std::to_string(RECORD_HEADER_SIZE) +
                          " bytes, got " + std::to_string(len));
    }

    RecordHeader rh;
    rh.ts_sec  = load32(data, order);
    rh.ts_frac = load32(data + 4, order);
    rh.caplen  = load32(data + 8, order);
    rh.origlen = load32(data + 12, order);
    return rh;
}

std::array<uint8_t, GLOBAL_HEADER_SIZE> encode_global_header(ByteOrder order, TsResolution res,
                                                             uint32_t snaplen, uint32_t network) {
    std::array<uint8_t, GLOBAL_HEADER_SIZE> out{};
    store32(out.data(), res == TsResolution::Nano ? MAGIC_NANO : MAGIC_MICRO, order);
    store16(out.data() + 4, 2, order);
    store16(out.data() + 6, 4, order);
    store32(out.data() + 8, 0, order);   // thiszone
    store32(out.data() + 12, 0, order);  // sigfigs
    store32(out.data() + 16, snaplen, order);
    store32(out.data() + 20, network, order);
    return out;
}

std::array<uint8_t, RECORD_HEADER_SIZE> encode_record_header(const RecordHeader& rh, ByteOrder order) {
    std::array<uint8_t, RECORD_HEADER_SIZE> out{};
    store32(out.data(), rh.ts_sec, order);
    store32(out.data() + 4, rh.ts_frac, order);
    store32(out.data() + 8, rh.caplen, order);
    store32(out.data() + 12, rh.origlen, order);
    return out;
}
