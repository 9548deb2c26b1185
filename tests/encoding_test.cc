#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "srtf.hpp"

namespace libsrtf {

namespace {

// Reverses \uN? escapes into code points, joining surrogate pairs.
std::vector<uint32_t> decodeEscapes(const std::string& encoded) {
    std::vector<uint32_t> units;
    size_t pos = 0;
    while (pos < encoded.size()) {
        if (encoded.compare(pos, 2, "\\u") == 0) {
            size_t end = encoded.find('?', pos);
            int value = std::stoi(encoded.substr(pos + 2, end - pos - 2));
            units.push_back(static_cast<uint32_t>(value < 0 ? value + 0x10000 : value));
            pos = end + 1;
        } else {
            units.push_back(static_cast<unsigned char>(encoded[pos++]));
        }
    }

    std::vector<uint32_t> code_points;
    for (size_t i = 0; i < units.size(); ++i) {
        if (units[i] >= 0xD800 && units[i] <= 0xDBFF && i + 1 < units.size()) {
            code_points.push_back(0x10000 + ((units[i] - 0xD800) << 10) + (units[i + 1] - 0xDC00));
            ++i;
        } else {
            code_points.push_back(units[i]);
        }
    }
    return code_points;
}

}  // namespace

TEST(EncodeTextTest, PrintableAsciiIsUnchanged) {
    std::string ascii;
    for (char c = 0x20; c < 0x7F; ++c) {
        if (c != '\\' && c != '{' && c != '}') {
            ascii += c;
        }
    }
    EXPECT_EQ(encodeText(ascii), ascii);
    EXPECT_EQ(encodeText(""), "");
}

TEST(EncodeTextTest, EscapesRtfSyntaxCharacters) {
    EXPECT_EQ(encodeText("\\"), "\\u92?");
    EXPECT_EQ(encodeText("{x}"), "\\u123?x\\u125?");
    EXPECT_EQ(encodeText("a\nb"), "a\\u10?b");
}

TEST(EncodeTextTest, EscapesNonAscii) {
    EXPECT_EQ(encodeText("caf\xC3\xA9"), "caf\\u233?");
    EXPECT_EQ(encodeText("\xD7\x90"), "\\u1488?");
}

TEST(EncodeTextTest, CodePointsFrom0x8000AreNegative) {
    // U+FB01 LATIN SMALL LIGATURE FI
    EXPECT_EQ(encodeText("\xEF\xAC\x81"), "\\u-1279?");
    EXPECT_EQ(encodeCodePoint(0x8000), "\\u-32768?");
    EXPECT_EQ(encodeCodePoint(0x7FFF), "\\u32767?");
}

TEST(EncodeTextTest, SupplementaryPlaneUsesSurrogatePair) {
    // U+1F600 -> D83D DE00
    EXPECT_EQ(encodeText("\xF0\x9F\x98\x80"), "\\u-10179?\\u-8704?");
}

TEST(EncodeTextTest, MalformedUtf8BecomesReplacementCharacter) {
    EXPECT_EQ(encodeText("\xFF"), "\\u-3?");
    EXPECT_EQ(encodeText("a\xC3"), "a\\u-3?");
    // overlong encoding of '/'
    EXPECT_EQ(encodeText("\xC0\xAF"), "\\u-3?\\u-3?");
}

TEST(EncodeTextTest, EscapesRecoverOriginalCodePoints) {
    const std::vector<uint32_t> expected = {'A', 0xE9, 0x5D0, 0x3B1, 0xFB01, '{', 0x1F600, 'z'};
    const std::string utf8 = "A\xC3\xA9\xD7\x90\xCE\xB1\xEF\xAC\x81{\xF0\x9F\x98\x80z";
    EXPECT_EQ(decodeEscapes(encodeText(utf8)), expected);
}

TEST(EncodeCodePointTest, PassesPlainCharacters) {
    EXPECT_EQ(encodeCodePoint('A'), "A");
    EXPECT_EQ(encodeCodePoint(' '), " ");
    EXPECT_EQ(encodeCodePoint('}'), "\\u125?");
}

}  // namespace libsrtf
