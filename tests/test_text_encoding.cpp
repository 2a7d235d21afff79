#include <gtest/gtest.h>
#include "gridcsv/types.hpp"

using namespace gridcsv;

class TextEncodingTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}

    static ByteVector bytes(std::initializer_list<unsigned char> values) {
        return ByteVector(values);
    }
};

TEST_F(TextEncodingTest, Utf8WithByteOrderMark) {
    auto encoding = TextEncoding::utf8();
    EXPECT_EQ(encoding.name(), "UTF-8");
    EXPECT_EQ(encoding.preamble(), bytes({0xEF, 0xBB, 0xBF}));

    // UTF-8 output is the input unchanged
    EXPECT_EQ(encoding.encode("A\xC3\xA9"), bytes({0x41, 0xC3, 0xA9}));
}

TEST_F(TextEncodingTest, Utf8WithoutByteOrderMark) {
    auto encoding = TextEncoding::utf8NoBom();
    EXPECT_EQ(encoding.name(), "UTF-8");
    EXPECT_TRUE(encoding.preamble().empty());
    EXPECT_EQ(encoding.encode("abc"), bytes({'a', 'b', 'c'}));
}

TEST_F(TextEncodingTest, Utf16LittleEndian) {
    auto encoding = TextEncoding::utf16le();
    EXPECT_EQ(encoding.name(), "UTF-16LE");
    EXPECT_EQ(encoding.preamble(), bytes({0xFF, 0xFE}));
    EXPECT_EQ(encoding.encode("A,\xC3\xA9"), bytes({0x41, 0x00, 0x2C, 0x00, 0xE9, 0x00}));
}

TEST_F(TextEncodingTest, Utf16BigEndian) {
    auto encoding = TextEncoding::utf16be();
    EXPECT_EQ(encoding.name(), "UTF-16BE");
    EXPECT_EQ(encoding.preamble(), bytes({0xFE, 0xFF}));
    EXPECT_EQ(encoding.encode("A\r\n"), bytes({0x00, 0x41, 0x00, 0x0D, 0x00, 0x0A}));
}

TEST_F(TextEncodingTest, Latin1) {
    auto encoding = TextEncoding::latin1();
    EXPECT_EQ(encoding.name(), "ISO-8859-1");
    EXPECT_TRUE(encoding.preamble().empty());
    EXPECT_EQ(encoding.encode("caf\xC3\xA9"), bytes({'c', 'a', 'f', 0xE9}));

    // Euro sign and CJK have no Latin-1 representation
    EXPECT_THROW(encoding.encode("\xE2\x82\xAC"), EncodingError);
    EXPECT_THROW(encoding.encode("ok \xE4\xB8\xAD"), EncodingError);
}

TEST_F(TextEncodingTest, Ascii) {
    auto encoding = TextEncoding::ascii();
    EXPECT_EQ(encoding.encode("Sales,100"), bytes({'S', 'a', 'l', 'e', 's', ',', '1', '0', '0'}));
    EXPECT_THROW(encoding.encode("caf\xC3\xA9"), EncodingError);
}

TEST_F(TextEncodingTest, InvalidUtf8Rejected) {
    // Lone continuation byte and a truncated two-byte sequence
    EXPECT_THROW(TextEncoding::utf8().encode("bad\x80"), EncodingError);
    EXPECT_THROW(TextEncoding::utf8NoBom().encode("cut\xC3"), EncodingError);
    EXPECT_THROW(TextEncoding::utf16le().encode("cut\xC3"), EncodingError);
}

TEST_F(TextEncodingTest, NamesAndAliases) {
    EXPECT_EQ(TextEncoding::fromName("utf-8").name(), "UTF-8");
    EXPECT_EQ(TextEncoding::fromName("utf8").name(), "UTF-8");
    EXPECT_EQ(TextEncoding::fromName("utf-16").name(), "UTF-16LE");
    EXPECT_EQ(TextEncoding::fromName("Unicode").name(), "UTF-16LE");
    EXPECT_EQ(TextEncoding::fromName("latin1").name(), "ISO-8859-1");
    EXPECT_EQ(TextEncoding::fromName("us-ascii").name(), "ASCII");

    auto noPreamble = TextEncoding::fromName("UTF-16LE", false);
    EXPECT_TRUE(noPreamble.preamble().empty());
    EXPECT_EQ(noPreamble.encode("A"), bytes({0x41, 0x00}));
}

TEST_F(TextEncodingTest, UnknownNameRejected) {
    EXPECT_THROW(TextEncoding::fromName("not-a-real-encoding"), EncodingError);
    EXPECT_THROW(TextEncoding::fromName(""), EncodingError);
    EXPECT_THROW(TextEncoding::fromName("  "), EncodingError);
}

TEST_F(TextEncodingTest, EncodeAppendKeepsExistingBytes) {
    auto encoding = TextEncoding::utf16le();
    ByteVector out = encoding.preamble();
    encoding.encodeAppend("x", out);
    encoding.encodeAppend("y", out);

    EXPECT_EQ(out, bytes({0xFF, 0xFE, 'x', 0x00, 'y', 0x00}));
}

TEST_F(TextEncodingTest, LargeInputSpansChunks) {
    // The leading ASCII byte puts two-byte characters across chunk boundaries
    std::string text = "a";
    for (int i = 0; i < 20000; ++i) {
        text += "\xC3\xA9";
    }

    auto utf16 = TextEncoding::utf16le().encode(text);
    ASSERT_EQ(utf16.size(), 40002u);
    EXPECT_EQ(utf16[0], 'a');
    EXPECT_EQ(utf16[2], 0xE9);
    EXPECT_EQ(utf16[40000], 0xE9);
    EXPECT_EQ(utf16[40001], 0x00);

    auto latin = TextEncoding::latin1().encode(text);
    ASSERT_EQ(latin.size(), 20001u);
    EXPECT_EQ(latin.front(), 'a');
    EXPECT_EQ(ByteVector(latin.begin() + 1, latin.end()), ByteVector(20000, 0xE9));
}

TEST_F(TextEncodingTest, MovedEncodingStillWorks) {
    auto original = TextEncoding::latin1();
    TextEncoding moved = std::move(original);
    EXPECT_EQ(moved.encode("\xC3\xA9"), bytes({0xE9}));
}
