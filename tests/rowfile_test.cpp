#include <gtest/gtest.h>

#include <stdexcept>

#include "sep39/base64.hpp"
#include "sep39/rowfile.hpp"
#include "sep39/sep39.hpp"
#include "test_helpers.hpp"

namespace sep39::rowfile {
namespace {

TEST(RowFileTest, FormatsOneSlotPerLine) {
    std::vector<slots::Slot> rows = {
        slots::Slot{"0023a/b", {'h', 'i'}},
        slots::Slot{"01", {}},
    };
    EXPECT_EQ(Format(rows), "0023a/b\taGk=\n01\t\n");
}

TEST(RowFileTest, ParsesEncodedSlotsBack) {
    Bytes data = testing::RandomBytes(2000);
    auto rows = Encode(data, {MediaDescriptor("application/octet-stream", {{"n", "rows"}})});
    auto parsed = Parse(Format(rows));
    EXPECT_EQ(parsed, rows);
    EXPECT_EQ(Decode(parsed).attachments[0], data);
}

TEST(RowFileTest, AcceptsCrLfLineEndings) {
    auto parsed = Parse("0020\t\r\n01\tAAE=\r\n");
    ASSERT_EQ(parsed.size(), 2u);
    EXPECT_EQ(parsed[1].value, (Bytes{0x00, 0x01}));
}

TEST(RowFileTest, RejectsMalformedInput) {
    EXPECT_THROW(Parse(""), std::runtime_error);
    EXPECT_THROW(Parse("0020 no tab\n"), std::runtime_error);
    EXPECT_THROW(Parse("0020\tA@==\n"), std::runtime_error);
    EXPECT_THROW(Parse("0020\tAAE\n"), std::runtime_error);
}

TEST(Base64Test, RejectsDataAfterPadding) {
    bool ok = true;
    EXPECT_TRUE(base64::Decode("AA=A", &ok).empty());
    EXPECT_FALSE(ok);
    EXPECT_EQ(base64::Decode("aGk=", &ok), (Bytes{'h', 'i'}));
    EXPECT_TRUE(ok);
    EXPECT_EQ(base64::Encode(Bytes{'a', 'b', 'c', 'd'}), "YWJjZA==");
}

}  // namespace
}  // namespace sep39::rowfile
