#include <gtest/gtest.h>

#include <algorithm>

#include "srtf.hpp"
#include "test_common.h"

namespace libsrtf {

using test::countOccurrences;
using test::WarningLog;

namespace {

const char* const NOTE_APPLY = "\\s23\\qj\\f1\\fs18\\fi-227\\li227 ";

}  // namespace

class DocumentTest : public ::testing::Test {
   protected:
    WarningLog warnings;
    std::vector<std::string> trace;

    DocumentOptions options() {
        DocumentOptions opts;
        opts.title = "Test";
        opts.creation_time = test::fixedCreationTime();
        opts.warning_callback = warnings.callback();
        opts.log_callback = [this](const std::string& message) { trace.push_back(message); };
        return opts;
    }
};

// ============================================================================
// Paragraphs and text
// ============================================================================

TEST_F(DocumentTest, HelloBoldWorld) {
    Document doc(options());
    doc.openParagraph("Hello");
    doc.text("World", TextFormat::Bold);
    doc.closeParagraph();

    EXPECT_EQ(doc.body(), "{\\pard \\s0\\qj Hello{\\b World}\\par}\n");
    EXPECT_FALSE(doc.paragraphOpen());
    EXPECT_TRUE(warnings.entries.empty());
}

TEST_F(DocumentTest, InlineFormats) {
    Document doc(options());
    doc.openParagraph();
    doc.italic("i");
    doc.bold("b");
    doc.text("bi", TextFormat::BoldItalic);
    doc.subscript("2");
    doc.superscript("n");
    doc.smallCaps("Sc");
    doc.text("u", std::string("ul"));
    doc.text("big", std::string("fs48"));

    EXPECT_EQ(doc.body(),
              "{\\pard \\s0\\qj {\\i i}{\\b b}{\\i\\b bi}{\\sub 2}{\\super n}{\\scaps Sc}"
              "{\\ul u}{\\fs48 big}");
}

TEST_F(DocumentTest, RejectsInvalidControlWords) {
    Document doc(options());
    doc.openParagraph();
    EXPECT_THROW(doc.text("x", std::string("Bold")), ConfigError);
    EXPECT_THROW(doc.text("x", std::string("b c")), ConfigError);
    EXPECT_THROW(doc.text("x", std::string("\\b")), ConfigError);
    EXPECT_THROW(doc.text("x", std::string("24")), ConfigError);
    EXPECT_NO_THROW(doc.text("x", std::string("up-6")));
}

TEST_F(DocumentTest, TextIsEncoded) {
    Document doc(options());
    doc.openParagraph("{caf\xC3\xA9}");
    EXPECT_EQ(doc.body(), "{\\pard \\s0\\qj \\u123?caf\\u233?\\u125?");
}

TEST_F(DocumentTest, OpeningParagraphClosesCurrentOneOnce) {
    Document doc(options());
    doc.openParagraph("a");
    doc.openParagraph("b");
    EXPECT_EQ(countOccurrences(doc.body(), "\\par}"), 1u);
    EXPECT_TRUE(doc.paragraphOpen());
}

TEST_F(DocumentTest, ClosingWhenClosedDoesNothing) {
    Document doc(options());
    doc.closeFootnote();
    doc.closeParagraph();
    EXPECT_EQ(doc.body(), "");

    doc.openParagraph("a");
    doc.closeParagraph();
    const std::string once = doc.body();
    doc.closeParagraph();
    doc.closeFootnote();
    EXPECT_EQ(doc.body(), once);
}

// ============================================================================
// Footnotes
// ============================================================================

TEST_F(DocumentTest, SecondFootnoteClosesFirst) {
    Document doc(options());
    doc.openParagraph("x");
    doc.openFootnote("A");
    doc.openFootnote("B");

    const std::string body = doc.body();
    const size_t a = body.find("A");
    const size_t b = body.find("B");
    ASSERT_NE(a, std::string::npos);
    ASSERT_NE(b, std::string::npos);
    EXPECT_EQ(countOccurrences(body.substr(a, b - a), "}}\n"), 1u);

    const std::string expected_note = std::string("{\\super \\chftn{\\footnote \\chftn\\pard\\plain ") +
                                      NOTE_APPLY;
    EXPECT_EQ(body, "{\\pard \\s0\\qj x" + expected_note + "A}}\n" + expected_note + "B");

    doc.closeParagraph();
    EXPECT_TRUE(test::endsWith(doc.body(), "B}}\n\\par}\n"));
    EXPECT_EQ(countOccurrences(doc.body(), "}}\n"), 2u);
}

TEST_F(DocumentTest, CustomAnchorIsEncoded) {
    Document doc(options());
    doc.openParagraph("x");
    doc.openFootnote("n", "", std::string("{a}"));
    EXPECT_NE(doc.body().find("{\\super \\u123?a\\u125?{\\footnote \\u123?a\\u125?\\pard\\plain "),
              std::string::npos);
}

TEST_F(DocumentTest, FootnoteWithoutParagraphOpensOne) {
    Document doc(options());
    doc.openFootnote("n");

    EXPECT_TRUE(doc.paragraphOpen());
    EXPECT_TRUE(doc.footnoteOpen());
    ASSERT_EQ(warnings.entries.size(), 1u);
    EXPECT_EQ(warnings.entries[0].first, "Footnote without paragraph");
    EXPECT_EQ(doc.body().rfind("{\\pard \\s0\\qj {\\super \\chftn", 0), 0u);
}

TEST_F(DocumentTest, FootnoteImpliesParagraphOverCallSequences) {
    Document doc(options());
    auto check = [&doc]() {
        if (doc.footnoteOpen()) {
            EXPECT_TRUE(doc.paragraphOpen());
        }
    };

    for (int round = 0; round < 4; ++round) {
        for (int step = 0; step < 12; ++step) {
            switch ((step * 7 + round * 3) % 6) {
                case 0: doc.openParagraph("p"); break;
                case 1: doc.openFootnote("f"); break;
                case 2: doc.closeFootnote(); break;
                case 3: doc.closeParagraph(); break;
                case 4: doc.text("t"); break;
                case 5: doc.bold("b"); break;
            }
            check();
        }
    }
    doc.toString();
    EXPECT_FALSE(doc.paragraphOpen());
    EXPECT_FALSE(doc.footnoteOpen());
}

// ============================================================================
// Styles
// ============================================================================

TEST_F(DocumentTest, ResolveStyleNeverFails) {
    Document doc(options());

    EXPECT_EQ(doc.resolveStyle("s21").id(), "s21");
    EXPECT_EQ(doc.resolveStyle("").id(), "s0");
    EXPECT_EQ(doc.resolveStyle("", StyleKind::Footnote).id(), "s23");
    EXPECT_TRUE(warnings.entries.empty());

    EXPECT_EQ(doc.resolveStyle("nope").id(), "s0");
    EXPECT_EQ(doc.resolveStyle("nope", StyleKind::Footnote).id(), "s23");
    ASSERT_EQ(warnings.entries.size(), 2u);
    EXPECT_EQ(warnings.entries[0].first, "Style not found");
    EXPECT_EQ(warnings.entries[0].second, "Style \"nope\" not found. Defaulting to \"s0\".");
    EXPECT_EQ(warnings.entries[1].second, "Style \"nope\" not found. Defaulting to \"s23\".");
}

TEST_F(DocumentTest, UnknownParagraphStyleFallsBack) {
    Document doc(options());
    doc.openParagraph("x", "s99");
    EXPECT_EQ(doc.body(), "{\\pard \\s0\\qj x");
    EXPECT_EQ(warnings.entries.size(), 1u);
}

TEST_F(DocumentTest, SetDefaultStyle) {
    Document doc(options());
    doc.setDefaultStyle("s21");
    doc.setDefaultStyle("s26", StyleKind::Footnote);
    EXPECT_EQ(doc.paragraphStyle(), "s21");
    EXPECT_EQ(doc.footnoteStyle(), "s26");

    doc.openParagraph("x");
    EXPECT_EQ(doc.body(), "{\\pard \\s21\\qj\\f1\\fs24\\lang1024 x");

    doc.setDefaultStyle("missing");
    EXPECT_EQ(doc.paragraphStyle(), "s21");
}

// ============================================================================
// Layout
// ============================================================================

TEST_F(DocumentTest, DefaultLayoutIsA4) {
    Document doc(options());
    const PageLayout a4{16838, 11906, 1134, 1134, 1134, 1134};
    EXPECT_EQ(doc.layout(), a4);

    doc.setLayout("B5");
    doc.setLayout("A4");
    EXPECT_EQ(doc.layout().paper_height, 16838);
    EXPECT_EQ(doc.layout().paper_width, 11906);
    EXPECT_EQ(doc.layout().margin_top, 1134);
    EXPECT_EQ(doc.layout().margin_bottom, 1134);
    EXPECT_EQ(doc.layout().margin_left, 1134);
    EXPECT_EQ(doc.layout().margin_right, 1134);
}

TEST_F(DocumentTest, LayoutPresets) {
    ASSERT_EQ(layoutPresetNames(), (std::vector<std::string>{"A4", "B5", "A5", "royal", "digest", "LAS"}));
    EXPECT_EQ(*findLayoutPreset("B5"), (PageLayout{14173, 9978, 1701, 1417, 1134, 1134}));
    EXPECT_EQ(*findLayoutPreset("A5"), (PageLayout{11906, 8391, 1151, 720, 567, 862}));
    EXPECT_EQ(*findLayoutPreset("royal"), (PageLayout{13262, 8827, 1152, 720, 864, 864}));
    EXPECT_EQ(*findLayoutPreset("digest"), (PageLayout{12240, 7920, 1151, 720, 567, 862}));
    EXPECT_EQ(*findLayoutPreset("LAS"), (PageLayout{13606, 9638, 1587, 1417, 1134, 1134}));
    EXPECT_FALSE(findLayoutPreset("a4").has_value());
}

TEST_F(DocumentTest, LayoutOverridesWinOverPreset) {
    Document doc(options());
    LayoutOverrides overrides;
    overrides.margin_top = "3cm";
    overrides.margin_left = "720";
    doc.setLayout("A5", overrides);

    EXPECT_EQ(doc.layout(), (PageLayout{11906, 8391, 1701, 720, 720, 862}));

    LayoutOverrides width_only;
    width_only.paper_width = "1in";
    doc.setLayout("", width_only);
    EXPECT_EQ(doc.layout(), (PageLayout{11906, 1440, 1701, 720, 720, 862}));
}

TEST_F(DocumentTest, FailedLayoutLeavesGeometryUnchanged) {
    Document doc(options());
    doc.setLayout("B5");

    EXPECT_THROW(doc.setLayout("Letter"), ConfigError);
    LayoutOverrides bad;
    bad.margin_right = "2pt";
    EXPECT_THROW(doc.setLayout("A4", bad), ParseError);

    EXPECT_EQ(doc.layout(), *findLayoutPreset("B5"));
}

TEST_F(DocumentTest, UnknownPresetMessage) {
    Document doc(options());
    try {
        doc.setLayout("Letter");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_STREQ(e.what(), "Default layout 'Letter' does not exist.");
    }
}

TEST_F(DocumentTest, LayoutSummaryListsTopMargin) {
    Document doc(options());
    LayoutOverrides overrides;
    overrides.margin_top = "100";
    overrides.margin_bottom = "200";
    doc.setLayout("", overrides);

    const std::string summary = doc.layoutSummary();
    EXPECT_NE(summary.find(" Top margin: 100\n"), std::string::npos);
    EXPECT_NE(summary.find(" Bottom margin: 200\n"), std::string::npos);
}

// ============================================================================
// Construction and properties
// ============================================================================

TEST_F(DocumentTest, FilenameDefaultsToTitle) {
    Document doc(options());
    EXPECT_EQ(doc.filename(), "Test");
    doc.setFilename("out");
    EXPECT_EQ(doc.filename(), "out");
    EXPECT_EQ(doc.author(), "author");
    doc.setAuthor("Someone");
    EXPECT_EQ(doc.author(), "Someone");
}

TEST_F(DocumentTest, RejectsUnusableTemplates) {
    EXPECT_THROW(Document(std::shared_ptr<const DocumentTemplate>(), options()), ConfigError);
    EXPECT_THROW(Document(std::make_shared<DocumentTemplate>(), options()), ConfigError);

    auto tmpl = std::make_shared<DocumentTemplate>();
    tmpl->addStyle(Style("s1", "Body"));
    tmpl->setFootnoteStyle("s9");
    EXPECT_THROW(Document(tmpl, options()), ConfigError);
}

TEST_F(DocumentTest, EmptyDefaultsUseFirstStyle) {
    auto tmpl = std::make_shared<DocumentTemplate>();
    tmpl->addStyle(Style("s4", "Body"));
    Document doc(tmpl, options());
    EXPECT_EQ(doc.paragraphStyle(), "s4");
    EXPECT_EQ(doc.footnoteStyle(), "s4");
}

TEST_F(DocumentTest, TraceIsReported) {
    Document doc(options());
    doc.openParagraph("Hello");
    doc.closeParagraph();
    doc.setLayout("A5");

    EXPECT_EQ(trace.front(), "RTF document created with title \"Test\".");
    EXPECT_NE(std::find(trace.begin(), trace.end(), "Open paragraph: Hello"), trace.end());
    EXPECT_NE(std::find(trace.begin(), trace.end(), "Close paragraph."), trace.end());
    EXPECT_EQ(trace.back(), "Layout set to \"A5\".");
}

}  // namespace libsrtf
