#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

#include "include/errors.hpp"
#include "include/pcap_header.hpp"

namespace {

FormatErrorKind kind_of_global_failure(const std::vector<uint8_t>& bytes) {
    try {
        parse_global_header(bytes.data(), bytes.size());
    } catch (const FormatError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected a FormatError";
    return FormatErrorKind::CorruptRecord;
}

} // namespace

TEST(GlobalHeader, ParsesLittleEndianMicrosecondCapture) {
    // as written by tcpdump on x86
    std::vector<uint8_t> bytes = {
        0xd4, 0xc3, 0xb2, 0xa1, 0x02, 0x00, 0x04, 0x00,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0xff, 0xff, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00};

    GlobalHeader gh = parse_global_header(bytes.data(), bytes.size());
    EXPECT_EQ(gh.order, ByteOrder::Little);
    EXPECT_EQ(gh.resolution, TsResolution::Micro);
    EXPECT_EQ(gh.magic, 0xa1b2c3d4u);
    EXPECT_EQ(gh.version_major, 2);
    EXPECT_EQ(gh.version_minor, 4);
    EXPECT_EQ(gh.snaplen, 65535u);
    EXPECT_EQ(gh.network, 1u);
    EXPECT_TRUE(std::equal(bytes.begin(), bytes.end(), gh.raw.begin()));
}

TEST(GlobalHeader, ParsesBigEndianNanosecondCapture) {
    std::vector<uint8_t> bytes = {
        0xa1, 0xb2, 0x3c, 0x4d, 0x00, 0x02, 0x00, 0x04,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x00, 0x04, 0x00, 0x00, 0x00, 0x00, 0x00, 0x71};

    GlobalHeader gh = parse_global_header(bytes.data(), bytes.size());
    EXPECT_EQ(gh.order, ByteOrder::Big);
    EXPECT_EQ(gh.resolution, TsResolution::Nano);
    EXPECT_EQ(gh.snaplen, 262144u);
    EXPECT_EQ(gh.network, 113u);  // Linux cooked capture
}

TEST(GlobalHeader, AllFourMagicVariantsRoundTripThroughEncoder) {
    for (ByteOrder order : {ByteOrder::Little, ByteOrder::Big}) {
        for (TsResolution res : {TsResolution::Micro, TsResolution::Nano}) {
            auto raw = encode_global_header(order, res, 1500, 105);
            GlobalHeader gh = parse_global_header(raw.data(), raw.size());
            EXPECT_EQ(gh.order, order);
            EXPECT_EQ(gh.resolution, res);
            EXPECT_EQ(gh.snaplen, 1500u);
            EXPECT_EQ(gh.network, 105u);
            EXPECT_EQ(gh.raw, raw);
        }
    }
}

TEST(GlobalHeader, RejectsUnknownMagic) {
    auto raw = encode_global_header(ByteOrder::Little, TsResolution::Micro, 65535, 1);
    std::vector<uint8_t> bytes(raw.begin(), raw.end());
    bytes[0] = 0x0a; bytes[1] = 0x0d; bytes[2] = 0x0d; bytes[3] = 0x0a;  // pcapng section header
    EXPECT_EQ(kind_of_global_failure(bytes), FormatErrorKind::InvalidMagic);
}

TEST(GlobalHeader, RejectsShortInput) {
    std::vector<uint8_t> bytes = {0xd4, 0xc3, 0xb2, 0xa1, 0x02, 0x00};
    EXPECT_EQ(kind_of_global_failure(bytes), FormatErrorKind::ShortFile);
    EXPECT_EQ(kind_of_global_failure({}), FormatErrorKind::ShortFile);
}

TEST(GlobalHeader, RejectsVersionOtherThan24) {
    auto raw = encode_global_header(ByteOrder::Little, TsResolution::Micro, 65535, 1);
    std::vector<uint8_t> bytes(raw.begin(), raw.end());
    bytes[6] = 0x03;  // 2.3
    EXPECT_EQ(kind_of_global_failure(bytes), FormatErrorKind::UnsupportedVersion);
}

TEST(GlobalHeader, ZeroSnaplenFallsBackToDefaultForValidation) {
    auto raw = encode_global_header(ByteOrder::Little, TsResolution::Micro, 0, 1);
    GlobalHeader gh = parse_global_header(raw.data(), raw.size());
    EXPECT_EQ(gh.snaplen, 0u);
    EXPECT_EQ(gh.effective_snaplen(), DEFAULT_SNAPLEN);
    EXPECT_EQ(gh.raw[16], 0);  // emitted bytes are untouched
}

TEST(RecordHeader, DecodesBothByteOrders) {
    RecordHeader in{1700000123, 456789, 60, 1514};
    for (ByteOrder order : {ByteOrder::Little, ByteOrder::Big}) {
        auto raw = encode_record_header(in, order);
        RecordHeader out = parse_record_header(raw.data(), raw.size(), order);
        EXPECT_EQ(out.ts_sec, in.ts_sec);
        EXPECT_EQ(out.ts_frac, in.ts_frac);
        EXPECT_EQ(out.caplen, in.caplen);
        EXPECT_EQ(out.origlen, in.origlen);
    }

    std::vector<uint8_t> be = {0x65, 0x53, 0xf1, 0x00, 0x00, 0x00, 0x00, 0x01,
                               0x00, 0x00, 0x00, 0x40, 0x00, 0x00, 0x00, 0x40};
    RecordHeader rh = parse_record_header(be.data(), be.size(), ByteOrder::Big);
    EXPECT_EQ(rh.ts_sec, 1700000000u);
    EXPECT_EQ(rh.ts_frac, 1u);
    EXPECT_EQ(rh.caplen, 64u);
    EXPECT_EQ(rh.total_size(), 80u);
}

TEST(RecordHeader, TruncatedInputIsReported) {
    std::vector<uint8_t> bytes(15, 0);
    try {
        parse_record_header(bytes.data(), bytes.size(), ByteOrder::Little);
        FAIL() << "expected TruncatedRead";
    } catch (const FormatError& e) {
        EXPECT_EQ(e.kind(), FormatErrorKind::TruncatedRead);
    }
}

TEST(RecordHeader, TimestampResolution) {
    RecordHeader rh{10, 500, 1, 1};
    EXPECT_EQ(rh.timestamp_ns(TsResolution::Micro), 10000500000LL);
    EXPECT_EQ(rh.timestamp_ns(TsResolution::Nano), 10000000500LL);
}

TEST(RecordHeader, PlausibilityFollowsLengthAndTimestampInvariants) {
    auto raw = encode_global_header(ByteOrder::Little, TsResolution::Micro, 1500, 1);
    GlobalHeader gh = parse_global_header(raw.data(), raw.size());

    EXPECT_TRUE((RecordHeader{1, 0, 100, 100}.plausible(gh)));
    EXPECT_TRUE((RecordHeader{1, 999999, 1500, 9000}.plausible(gh)));   // snapped packet
    EXPECT_FALSE((RecordHeader{1, 0, 1501, 1501}.plausible(gh)));       // above snaplen
    EXPECT_FALSE((RecordHeader{1, 0, 200, 100}.plausible(gh)));         // caplen > len
    EXPECT_FALSE((RecordHeader{1, 1000000, 100, 100}.plausible(gh)));   // usec overflow
    EXPECT_FALSE((RecordHeader{0, 0, 0, 0}.plausible(gh)));             // zero fill
}
