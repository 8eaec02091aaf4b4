#include <gtest/gtest.h>

#include <algorithm>
#include <string>

#include "sep39/base91.hpp"
#include "sep39/slots.hpp"
#include "test_helpers.hpp"

namespace sep39::slots {
namespace {

// Header of exactly `length` characters for the current revision.
std::string HeaderOfLength(std::size_t length) {
    std::size_t metadata_length = length - 1;
    while (1 + std::to_string(metadata_length).size() + metadata_length > length) {
        --metadata_length;
    }
    std::string metadata = "a/b;n=" + std::string(metadata_length - 6, 'x');
    return frame::BuildHeader(metadata, frame::CurrentRevision());
}

// =============================================================================
// Slot index
// =============================================================================

TEST(SlotIndexTest, EncodesBase36) {
    EXPECT_EQ(EncodeIndex(0), "00");
    EXPECT_EQ(EncodeIndex(9), "09");
    EXPECT_EQ(EncodeIndex(35), "0z");
    EXPECT_EQ(EncodeIndex(36), "10");
    EXPECT_EQ(EncodeIndex(1295), "zz");
}

TEST(SlotIndexTest, RejectsIndexPastLastSlot) {
    EXPECT_SEP39_ERROR(EncodeIndex(1296), ErrorKind::PayloadTooLarge);
}

TEST(SlotIndexTest, DecodesPrefixOfKey) {
    EXPECT_EQ(DecodeIndex("0z...").value_or(0), 35u);
    EXPECT_EQ(DecodeIndex("zz").value_or(0), 1295u);
    EXPECT_FALSE(DecodeIndex("A0"));
    EXPECT_FALSE(DecodeIndex("0"));
}

// =============================================================================
// Near-fit encoding
// =============================================================================

TEST(FitNearestTest, ZeroOrTinyBudgetConsumesNothing) {
    Bytes data = testing::RandomBytes(100);
    for (std::size_t budget : {0u, 1u}) {
        FitResult fit = FitNearest(data, 0, budget);
        EXPECT_TRUE(fit.encoded.empty());
        EXPECT_EQ(fit.consumed, 0u);
    }
}

TEST(FitNearestTest, TwoCharactersHoldOneByte) {
    Bytes data = {'a', 'b', 'c'};
    FitResult fit = FitNearest(data, 0, 2);
    EXPECT_EQ(fit.consumed, 1u);
    EXPECT_EQ(fit.encoded, "GB");
}

TEST(FitNearestTest, FindsLongestFittingPrefix) {
    Bytes data = testing::RandomBytes(500, 11);
    for (std::size_t budget : {5u, 17u, 40u, 62u, 64u}) {
        for (std::size_t offset : {0u, 3u, 100u}) {
            FitResult fit = FitNearest(data, offset, budget);
            ASSERT_GT(fit.consumed, 0u);
            EXPECT_LE(fit.encoded.size(), budget);
            EXPECT_EQ(fit.encoded, base91::Encode(data.data() + offset, fit.consumed));
            EXPECT_GT(base91::Encode(data.data() + offset, fit.consumed + 1).size(), budget)
                << "budget " << budget << " offset " << offset;
        }
    }
}

TEST(FitNearestTest, ConsumesShortTailWhole) {
    Bytes data = testing::RandomBytes(20, 5);
    FitResult fit = FitNearest(data, 15, 62);
    EXPECT_EQ(fit.consumed, 5u);
    EXPECT_TRUE(FitNearest(data, 20, 62).encoded.empty());
}

// =============================================================================
// Packing layout
// =============================================================================

TEST(PackTest, TopsOffHeaderSlotWithEncodedPayload) {
    Bytes data(10, 0);
    auto slots = Pack("20", data);
    ASSERT_EQ(slots.size(), 1u);
    EXPECT_EQ(slots[0].key, "0020AAAAAAAAAAAA");
    EXPECT_TRUE(slots[0].value.empty());
}

TEST(PackTest, FillsValueWithRawBytesAfterKey) {
    Bytes data = testing::RandomBytes(200, 3);
    auto slots = Pack("20", data);
    ASSERT_GE(slots.size(), 2u);
    EXPECT_LE(slots[0].key.size(), 64u);
    ASSERT_EQ(slots[0].value.size(), 64u);
    std::size_t consumed = base91::Decode(slots[0].key.substr(4)).size();
    EXPECT_TRUE(std::equal(slots[0].value.begin(), slots[0].value.end(), data.begin() + consumed));
    EXPECT_EQ(slots[1].key.substr(0, 2), "01");
}

TEST(PackTest, SplitsHeaderAcrossKeyAndValue) {
    std::string header = HeaderOfLength(300);
    ASSERT_EQ(header.size(), 300u);
    auto slots = Pack(header, {});
    ASSERT_EQ(slots.size(), 3u);
    EXPECT_EQ(slots[0].key, "00" + header.substr(0, 62));
    EXPECT_EQ(std::string(slots[0].value.begin(), slots[0].value.end()), header.substr(62, 64));
    EXPECT_EQ(slots[1].key, "01" + header.substr(126, 62));
    EXPECT_EQ(slots[2].key, "02" + header.substr(252, 48));
    EXPECT_TRUE(slots[2].value.empty());
}

TEST(PackTest, FullHeaderSlotStartsPayloadOnFreshSlot) {
    std::string header = HeaderOfLength(126);
    ASSERT_EQ(header.size(), 126u);
    Bytes data(10, 0);
    auto slots = Pack(header, data);
    ASSERT_EQ(slots.size(), 2u);
    EXPECT_EQ(slots[0].key.size(), 64u);
    EXPECT_EQ(slots[0].value.size(), 64u);
    EXPECT_EQ(slots[1].key, "01AAAAAAAAAAAA");
}

// =============================================================================
// Unpacking
// =============================================================================

class UnpackBoundaryTest : public ::testing::TestWithParam<std::size_t> {};

TEST_P(UnpackBoundaryTest, RecoversPayloadForEveryPayloadSize) {
    std::string header = HeaderOfLength(GetParam());
    ASSERT_EQ(header.size(), GetParam());
    for (std::size_t size : {0u, 1u, 63u, 64u, 65u, 127u, 128u, 1000u, 5000u}) {
        Bytes data = testing::RandomBytes(size, static_cast<std::uint32_t>(size + GetParam()));
        auto slots = Pack(header, data);
        for (const auto& slot : slots) {
            EXPECT_LE(slot.key.size(), 64u);
            EXPECT_LE(slot.value.size(), 64u);
        }
        Unpacked unpacked = Unpack(slots, frame::CurrentRevision());
        EXPECT_EQ(unpacked.header_length, header.size());
        EXPECT_EQ(unpacked.metadata, header.substr(header.size() - unpacked.metadata.size()));
        EXPECT_EQ(unpacked.payload, data) << "header " << header.size() << " payload " << size;
    }
}

INSTANTIATE_TEST_SUITE_P(HeaderLengths, UnpackBoundaryTest,
                         ::testing::Values(9, 61, 62, 63, 64, 125, 126, 127, 188, 252, 300));

TEST(UnpackTest, RejectsEmptySequence) {
    EXPECT_SEP39_ERROR(Unpack({}, frame::CurrentRevision()), ErrorKind::InvalidFrame);
}

TEST(UnpackTest, RejectsWrongVersion) {
    auto slots = Pack("20", Bytes(5, 1));
    EXPECT_SEP39_ERROR(Unpack(slots, frame::LegacyRevision()), ErrorKind::InvalidFrame);
}

TEST(UnpackTest, RejectsOutOfOrderSlots) {
    auto slots = Pack("20", testing::RandomBytes(1000));
    std::swap(slots[1], slots[2]);
    EXPECT_SEP39_ERROR(Unpack(slots, frame::CurrentRevision()), ErrorKind::InvalidFrame);
}

TEST(UnpackTest, RejectsOverwideSlot) {
    auto slots = Pack("20", testing::RandomBytes(1000));
    slots[1].value.push_back(0);
    EXPECT_SEP39_ERROR(Unpack(slots, frame::CurrentRevision()), ErrorKind::InvalidFrame);
}

TEST(UnpackTest, RejectsMissingLength) {
    std::vector<Slot> slots = {Slot{"002x", {}}};
    EXPECT_SEP39_ERROR(Unpack(slots, frame::CurrentRevision()), ErrorKind::InvalidLength);
}

TEST(UnpackTest, RejectsTruncatedHeader) {
    auto slots = Pack(HeaderOfLength(300), {});
    slots.pop_back();
    EXPECT_SEP39_ERROR(Unpack(slots, frame::CurrentRevision()), ErrorKind::TruncatedMetadata);

    slots = Pack(HeaderOfLength(300), {});
    slots[1].value.resize(10);
    EXPECT_SEP39_ERROR(Unpack(slots, frame::CurrentRevision()), ErrorKind::TruncatedMetadata);
}

TEST(UnpackTest, RejectsCorruptEncodedKey) {
    auto slots = Pack("20", testing::RandomBytes(1000));
    slots[1].key[5] = ' ';
    EXPECT_SEP39_ERROR(Unpack(slots, frame::CurrentRevision()), ErrorKind::InvalidEncoding);
}

TEST(UnpackTest, LeadingZeroLengthLeavesDigitPayloadAlone) {
    // basE91 of these bytes starts with '0', right after the length digit.
    Bytes data = {0x8F, 0x00, 0x11, 0x22};
    auto slots = Pack("20", data);
    ASSERT_EQ(slots.size(), 1u);
    EXPECT_EQ(slots[0].key, "00200BuuI");
    Unpacked unpacked = Unpack(slots, frame::CurrentRevision());
    EXPECT_TRUE(unpacked.metadata.empty());
    EXPECT_EQ(unpacked.payload, data);
}

TEST(UnpackTest, ReadsLegacyFixedWidthFrame) {
    std::string text = "legacy!";
    Bytes data(text.begin(), text.end());
    auto slots = Pack("1000010text/plain", data);
    ASSERT_EQ(slots.size(), 1u);
    EXPECT_EQ(slots[0].key, "001000010text/plainXP2f[*aIC");
    Unpacked unpacked = Unpack(slots, frame::LegacyRevision());
    EXPECT_EQ(unpacked.metadata, "text/plain");
    EXPECT_EQ(unpacked.payload, data);
}

TEST(UnpackTest, AcceptsOffsetIndicesOnLegacyHeaderRowsOnly) {
    std::string header = "1000292a/b;n=" + std::string(286, 'x');
    ASSERT_EQ(header.size(), 300u);
    Bytes payload = testing::RandomBytes(1000);
    auto slots = Pack(header, payload);
    slots[1].key.replace(0, 2, "3i");
    slots[2].key.replace(0, 2, "70");

    Unpacked unpacked = Unpack(slots, frame::LegacyRevision());
    EXPECT_EQ(unpacked.metadata, header.substr(7));
    EXPECT_EQ(unpacked.payload, payload);

    // Rows after the header keep their position in every revision.
    slots[3].key.replace(0, 2, EncodeIndex(3 * constants::kHeaderCharsPerSlot));
    EXPECT_SEP39_ERROR(Unpack(slots, frame::LegacyRevision()), ErrorKind::InvalidFrame);
}

TEST(UnpackTest, RejectsOffsetIndicesInCurrentRevision) {
    auto slots = Pack(HeaderOfLength(300), testing::RandomBytes(1000));
    slots[1].key.replace(0, 2, "3i");
    EXPECT_SEP39_ERROR(Unpack(slots, frame::CurrentRevision()), ErrorKind::InvalidFrame);
}

}  // namespace
}  // namespace sep39::slots
