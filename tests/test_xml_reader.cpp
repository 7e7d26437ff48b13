#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "plist_error.hpp"
#include "xml_plist_reader.hpp"

using namespace plistkit;

namespace {

const char* const kHeader =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
    "<!DOCTYPE plist PUBLIC \"-//Apple Computer//DTD PLIST 1.0//EN\" "
    "\"http://www.apple.com/DTDs/PropertyList-1.0.dtd\">\n";

Value parseXml(const std::string& xml, const PlistOptions& options = {}) {
    XmlPlistReader reader(options);
    return reader.parse(xml);
}

std::string malformedMessage(const std::string& xml) {
    try {
        parseXml(xml);
    } catch (const MalformedPlistError& e) {
        return e.what();
    }
    return "";
}

struct WarningLog {
    std::vector<std::pair<std::string, std::string>> entries;

    PlistOptions options() {
        PlistOptions opts;
        opts.warning_callback = [this](const std::string& category, const std::string& message) {
            entries.emplace_back(category, message);
        };
        return opts;
    }
};

}  // namespace

// ============================================================================
// Values
// ============================================================================

TEST(XmlPlistReaderTest, ScalarTypes) {
    std::string xml = std::string(kHeader) +
                      "<plist version=\"1.0\">\n<dict>\n"
                      "  <key>s</key>\n  <string>hello</string>\n"
                      "  <key>i</key>\n  <integer>-42</integer>\n"
                      "  <key>r</key>\n  <real>2.5</real>\n"
                      "  <key>t</key>\n  <true/>\n"
                      "  <key>f</key>\n  <false/>\n"
                      "  <key>d</key>\n  <date>2010-05-01T12:30:00Z</date>\n"
                      "  <key>b</key>\n  <data>AQID</data>\n"
                      "</dict>\n</plist>\n";

    Value root = parseXml(xml);
    const Dict& dict = root.asDict();

    using namespace std::chrono;
    EXPECT_EQ(dict.size(), 7u);
    EXPECT_EQ(dict.at("s").asString(), "hello");
    EXPECT_EQ(dict.at("i").asInteger(), -42);
    EXPECT_DOUBLE_EQ(dict.at("r").asReal(), 2.5);
    EXPECT_TRUE(dict.at("t").asBool());
    EXPECT_FALSE(dict.at("f").asBool());
    EXPECT_EQ(dict.at("d").asDate(), Date(sys_days{year{2010} / 5 / 1} + hours{12} + minutes{30}));
    EXPECT_EQ(dict.at("b").asData(), (Data{1, 2, 3}));
}

TEST(XmlPlistReaderTest, NestedContainers) {
    Value root = parseXml(
        "<plist><array>"
        "<dict><key>list</key><array><integer>1</integer><integer>2</integer></array>"
        "<key>inner</key><dict><key>k</key><string>v</string></dict></dict>"
        "<string>tail</string>"
        "</array></plist>");

    Dict expected;
    expected.set("list", Array{1, 2});
    expected.set("inner", Dict{{"k", "v"}});
    EXPECT_EQ(root, Value(Array{Value(expected), Value("tail")}));
}

TEST(XmlPlistReaderTest, ScalarRoot) {
    EXPECT_EQ(parseXml("<plist><true/></plist>"), Value(true));
    EXPECT_EQ(parseXml("<plist><string>only</string></plist>"), Value("only"));
}

TEST(XmlPlistReaderTest, EmptyPlistIsEmptyDict) {
    EXPECT_EQ(parseXml("<plist/>"), Value(Dict()));
    EXPECT_EQ(parseXml("<plist version=\"1.0\">\n</plist>"), Value(Dict()));
}

TEST(XmlPlistReaderTest, EmptyElements) {
    Value root = parseXml(
        "<plist><array>"
        "<string></string><string/><data></data>"
        "<integer></integer><real/><date></date>"
        "</array></plist>");

    const Array& items = root.asArray();
    ASSERT_EQ(items.size(), 6u);
    EXPECT_EQ(items[0], Value(""));
    EXPECT_EQ(items[1], Value(""));
    EXPECT_EQ(items[2], Value(Data{}));
    EXPECT_TRUE(items[3].isNull());
    EXPECT_TRUE(items[4].isNull());
    EXPECT_TRUE(items[5].isNull());
}

TEST(XmlPlistReaderTest, BlankScalarBodiesAreNull) {
    Value root = parseXml(
        "<plist><array>\n"
        "  <integer>\n  </integer>\n"
        "  <real>  </real>\n"
        "  <date> \n </date>\n"
        "  <integer> 7 </integer>\n"
        "</array></plist>");

    const Array& items = root.asArray();
    ASSERT_EQ(items.size(), 4u);
    EXPECT_TRUE(items[0].isNull());
    EXPECT_TRUE(items[1].isNull());
    EXPECT_TRUE(items[2].isNull());
    EXPECT_EQ(items[3].asInteger(), 7);
}

TEST(XmlPlistReaderTest, EmptyKeyNamesAnEntry) {
    Value root = parseXml("<plist><dict><key></key><string>v</string><key/><integer>1</integer></dict></plist>");
    // the second empty key replaces the first
    EXPECT_EQ(root.asDict().size(), 1u);
    EXPECT_EQ(root.asDict().at("").asInteger(), 1);
}

TEST(XmlPlistReaderTest, StringWhitespaceIsKept) {
    Value root = parseXml("<plist><string>  a b  </string></plist>");
    EXPECT_EQ(root.asString(), "  a b  ");
}

TEST(XmlPlistReaderTest, EntitiesAndCdataJoin) {
    Value root = parseXml("<plist><string>a &amp; b <![CDATA[<c>]]> d</string></plist>");
    EXPECT_EQ(root.asString(), "a & b <c> d");
}

TEST(XmlPlistReaderTest, Utf8Text) {
    Value root = parseXml("<plist><dict><key>caf\xC3\xA9</key><string>\xE2\x9C\x93</string></dict></plist>");
    EXPECT_EQ(root.asDict().at("caf\xC3\xA9").asString(), "\xE2\x9C\x93");
}

TEST(XmlPlistReaderTest, WrappedBase64) {
    Value root = parseXml("<plist><data>\n  AQID\n  BAU=\n</data></plist>");
    EXPECT_EQ(root.asData(), (Data{1, 2, 3, 4, 5}));
}

TEST(XmlPlistReaderTest, NumbersAreTrimmed) {
    EXPECT_EQ(parseXml("<plist><integer> +7 </integer></plist>").asInteger(), 7);
    EXPECT_DOUBLE_EQ(parseXml("<plist><real>-1e3</real></plist>").asReal(), -1000.0);
    EXPECT_EQ(parseXml("<plist><integer>9223372036854775807</integer></plist>").asInteger(),
              INT64_MAX);
}

TEST(XmlPlistReaderTest, CommentsAreSkipped) {
    Value root = parseXml("<plist><!-- c --><array><!-- d --><integer>1</integer></array></plist>");
    EXPECT_EQ(root, Value(Array{1}));
}

// ============================================================================
// Declaration and version
// ============================================================================

TEST(XmlPlistReaderTest, CapturesEncodingAndVersion) {
    XmlPlistReader reader;
    reader.parse(std::string(kHeader) + "<plist version=\"1.0\"><array/></plist>");
    ASSERT_TRUE(reader.encoding().has_value());
    EXPECT_EQ(*reader.encoding(), "UTF-8");
    ASSERT_TRUE(reader.version().has_value());
    EXPECT_EQ(*reader.version(), "1.0");
}

TEST(XmlPlistReaderTest, NoDeclaration) {
    XmlPlistReader reader;
    reader.parse("<plist><array/></plist>");
    EXPECT_FALSE(reader.encoding().has_value());
    EXPECT_FALSE(reader.version().has_value());
}

TEST(XmlPlistReaderTest, ReaderIsReusable) {
    XmlPlistReader reader;
    reader.parse(std::string(kHeader) + "<plist><array/></plist>");
    Value second = reader.parse("<plist><string>b</string></plist>");
    EXPECT_EQ(second, Value("b"));
    EXPECT_FALSE(reader.encoding().has_value());
}

TEST(XmlPlistReaderTest, UnexpectedVersionWarns) {
    WarningLog log;
    Value root = parseXml("<plist version=\"2.0\"><array/></plist>", log.options());
    EXPECT_TRUE(root.isArray());
    ASSERT_EQ(log.entries.size(), 1u);
    EXPECT_EQ(log.entries[0].first, "Plist version");
}

// ============================================================================
// Warnings
// ============================================================================

TEST(XmlPlistReaderTest, DuplicateKeyWarnsAndLastWins) {
    WarningLog log;
    Value root = parseXml(
        "<plist><dict><key>k</key><integer>1</integer><key>k</key><integer>2</integer></dict></plist>",
        log.options());
    EXPECT_EQ(root.asDict().size(), 1u);
    EXPECT_EQ(root.asDict().at("k").asInteger(), 2);
    ASSERT_EQ(log.entries.size(), 1u);
    EXPECT_EQ(log.entries[0].first, "Duplicate key");
}

TEST(XmlPlistReaderTest, StrayTextInContainerWarns) {
    WarningLog log;
    Value root = parseXml("<plist><array>junk<string>a</string></array></plist>", log.options());
    EXPECT_EQ(root, Value(Array{"a"}));
    ASSERT_EQ(log.entries.size(), 1u);
    EXPECT_EQ(log.entries[0].first, "Ignored text");
}

TEST(XmlPlistReaderTest, WhitespaceBetweenElementsIsSilent) {
    WarningLog log;
    parseXml("<plist>\n  <array>\n    <string>a</string>\n  </array>\n</plist>\n", log.options());
    EXPECT_TRUE(log.entries.empty());
}

// ============================================================================
// Malformed documents
// ============================================================================

TEST(XmlPlistReaderTest, UnknownElement) {
    EXPECT_NE(malformedMessage("<plist><foo/></plist>").find("Element foo"), std::string::npos);
    EXPECT_NE(malformedMessage("<plist><string><b>x</b></string></plist>").find("Element b"),
              std::string::npos);
}

TEST(XmlPlistReaderTest, KeyPlacement) {
    EXPECT_THROW(parseXml("<plist><key>a</key></plist>"), MalformedPlistError);
    EXPECT_THROW(parseXml("<plist><array><key>a</key></array></plist>"), MalformedPlistError);
    EXPECT_THROW(parseXml("<plist><dict><key>a</key><key>b</key></dict></plist>"),
                 MalformedPlistError);
}

TEST(XmlPlistReaderTest, ValueWithoutKey) {
    EXPECT_THROW(parseXml("<plist><dict><string>x</string></dict></plist>"), MalformedPlistError);
    EXPECT_THROW(parseXml("<plist><dict><key>a</key><true/><false/></dict></plist>"),
                 MalformedPlistError);
}

TEST(XmlPlistReaderTest, KeyWithoutValue) {
    EXPECT_THROW(parseXml("<plist><dict><key>a</key></dict></plist>"), MalformedPlistError);
}

TEST(XmlPlistReaderTest, MoreThanOneRoot) {
    EXPECT_THROW(parseXml("<plist><string>a</string><string>b</string></plist>"),
                 MalformedPlistError);
}

TEST(XmlPlistReaderTest, NestedPlist) {
    EXPECT_THROW(parseXml("<plist><array><plist/></array></plist>"), MalformedPlistError);
}

TEST(XmlPlistReaderTest, ElementsOutsidePlist) {
    EXPECT_THROW(parseXml("<dict/>"), MalformedPlistError);
}

TEST(XmlPlistReaderTest, NotWellFormed) {
    EXPECT_THROW(parseXml("<plist><dict></plist>"), MalformedPlistError);
    EXPECT_THROW(parseXml("not-a-plist"), MalformedPlistError);
    EXPECT_THROW(parseXml(""), MalformedPlistError);
}

TEST(XmlPlistReaderTest, InvalidScalarText) {
    EXPECT_THROW(parseXml("<plist><integer>12abc</integer></plist>"), MalformedPlistError);
    EXPECT_THROW(parseXml("<plist><integer>99999999999999999999</integer></plist>"),
                 MalformedPlistError);
    EXPECT_THROW(parseXml("<plist><real>x</real></plist>"), MalformedPlistError);
    EXPECT_THROW(parseXml("<plist><date>2010-13-01T00:00:00Z</date></plist>"),
                 MalformedPlistError);
    EXPECT_THROW(parseXml("<plist><data>!!</data></plist>"), MalformedPlistError);
}

TEST(XmlPlistReaderTest, NestingLimit) {
    PlistOptions options;
    options.max_depth = 2;
    EXPECT_THROW(parseXml("<plist><array><array><array/></array></array></plist>", options),
                 MalformedPlistError);
    EXPECT_NO_THROW(parseXml("<plist><array><array/></array></plist>", options));
}

// ============================================================================
// Event interface
// ============================================================================

TEST(XmlPlistReaderTest, DrivenByEvents) {
    XmlPlistReader reader;
    reader.xmlDeclaration("utf-8");
    reader.startElement("plist", "1.0");
    reader.startElement("dict");
    reader.startElement("key");
    reader.characterData("na");
    reader.characterData("me");
    reader.endElement("key");
    reader.startElement("string");
    reader.characterData("x");
    reader.endElement("string");
    reader.endElement("dict");
    EXPECT_FALSE(reader.finished());
    reader.endElement("plist");

    EXPECT_TRUE(reader.finished());
    EXPECT_EQ(reader.root(), Value(Dict{{"name", "x"}}));
    EXPECT_EQ(*reader.encoding(), "utf-8");
}

TEST(XmlPlistReaderTest, MismatchedEndEvent) {
    XmlPlistReader reader;
    reader.startElement("plist");
    reader.startElement("string");
    EXPECT_THROW(reader.endElement("integer"), MalformedPlistError);
}

TEST(XmlPlistReaderTest, UnclosedElementAtEnd) {
    XmlPlistReader reader;
    reader.startElement("plist");
    reader.startElement("array");
    EXPECT_THROW(reader.endElement("plist"), MalformedPlistError);
}

TEST(XmlModeTest, Names) {
    EXPECT_STREQ(modeName(XmlMode::Dict), "dict");
    EXPECT_STREQ(modeName(XmlMode::Value), "value");
}
