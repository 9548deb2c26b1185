#include <gtest/gtest.h>

#include "srtf.hpp"
#include "test_common.h"

namespace libsrtf {

using test::WarningLog;

// ============================================================================
// Templates
// ============================================================================

namespace {

const char* const TEMPLATE_XML = R"(<?xml version="1.0" encoding="UTF-8"?>
<template deflang="1033" adeflang="1041" paragraph-style="s1" footnote-style="s2">
  <!-- fonts -->
  <font id="f0" family="roman" charset="0">Times New Roman</font>
  <font id="f1" name="Gentium" pitch="2"/>
  <color index="2" red="10" green="20" blue="30"/>
  <style id="s1" name="Body" font="f0" size="24" align="left"/>
  <style id="s2" name="Note" basedon="s1" size="18" left-indent="0.4cm" first-line-indent="-227" color="2"/>
  <style id="s3" name="Heading" basedon="s1" next="s1" align="center" bold="true" keep-with-next="1"
         space-before="1cm" space-after="283" widow-control="on" direction="ltr" lang="1033"/>
</template>
)";

}  // namespace

TEST(LoadTemplateTest, ReadsResources) {
    auto tmpl = loadTemplateString(TEMPLATE_XML);

    EXPECT_EQ(tmpl->defaultLanguage(), 1033);
    EXPECT_EQ(tmpl->asianLanguage(), 1041);
    EXPECT_EQ(tmpl->paragraphStyle(), "s1");
    EXPECT_EQ(tmpl->footnoteStyle(), "s2");

    ASSERT_EQ(tmpl->fonts().size(), 2u);
    EXPECT_EQ(tmpl->fonts()[0].render(), "{\\f0\\froman\\fcharset0 Times New Roman;}\n");
    EXPECT_EQ(tmpl->fonts()[1].render(), "{\\f1\\fnil\\fprq2 Gentium;}\n");

    ASSERT_NE(tmpl->findColor(2), nullptr);
    EXPECT_EQ(tmpl->findColor(2)->blue, 30);

    ASSERT_EQ(tmpl->styles().size(), 3u);
    EXPECT_EQ(tmpl->findStyle("s1")->renderApply(), "\\s1\\ql\\f0\\fs24 ");
    EXPECT_EQ(tmpl->findStyle("s2")->renderApply(), "\\s2\\qj\\fs18\\cf2\\fi-227\\li227 ");
    EXPECT_EQ(tmpl->findStyle("s3")->renderApply(),
              "\\s3\\qc\\sb567\\sa283\\keepn\\b\\widctlpar\\ltrpar\\lang1033 ");
    EXPECT_EQ(tmpl->findStyle("s3")->renderTableEntry().rfind("{\\s3\\sbasedon1\\snext1", 0), 0u);
}

TEST(LoadTemplateTest, DocumentUsesTemplateDefaults) {
    DocumentOptions opts;
    opts.creation_time = test::fixedCreationTime();
    Document doc(loadTemplateString(TEMPLATE_XML), opts);
    doc.openParagraph("x");
    doc.openFootnote("n");

    EXPECT_EQ(doc.body(),
              "{\\pard \\s1\\ql\\f0\\fs24 x"
              "{\\super \\chftn{\\footnote \\chftn\\pard\\plain \\s2\\qj\\fs18\\cf2\\fi-227\\li227 n");
}

TEST(LoadTemplateTest, AlignNoneOmitsAlignment) {
    auto tmpl = loadTemplateString(R"(<template><style id="s0" name="Raw" align="none"/></template>)");
    EXPECT_EQ(tmpl->findStyle("s0")->renderApply(), "\\s0 ");
}

TEST(LoadTemplateTest, RejectsInvalidTemplates) {
    // unknown attribute
    EXPECT_THROW(loadTemplateString(R"(<template><style id="s0" colour="1"/></template>)"), ConfigError);
    // unknown element
    EXPECT_THROW(loadTemplateString(R"(<template><paragraph id="s0"/></template>)"), ConfigError);
    // wrong root
    EXPECT_THROW(loadTemplateString(R"(<document/>)"), ConfigError);
    // syntax error
    EXPECT_THROW(loadTemplateString(R"(<template><style id="s0"></template>)"), ConfigError);
    // malformed values
    EXPECT_THROW(loadTemplateString(R"(<template><style id="s0" bold="yes"/></template>)"), ConfigError);
    EXPECT_THROW(loadTemplateString(R"(<template><style id="s0" size="big"/></template>)"), ConfigError);
    EXPECT_THROW(loadTemplateString(R"(<template><style id="s0" align="middle"/></template>)"), ConfigError);
    EXPECT_THROW(loadTemplateString(R"(<template><color red="1"/></template>)"), ConfigError);
    EXPECT_THROW(loadTemplateString(R"(<template><font id="f0"/></template>)"), ConfigError);
    // dangling references
    EXPECT_THROW(loadTemplateString(R"(<template><style id="s0" font="f3"/></template>)"), ConfigError);
    EXPECT_THROW(loadTemplateString(R"(<template paragraph-style="s9"><style id="s0"/></template>)"),
                 ConfigError);
}

TEST(LoadTemplateTest, MalformedLengthIsParseError) {
    EXPECT_THROW(loadTemplateString(R"(<template><style id="s0" left-indent="3pt"/></template>)"),
                 ParseError);
}

TEST(LoadTemplateTest, MissingFile) {
    EXPECT_THROW(loadTemplateFile("/nonexistent/template.xml"), ConfigError);
}

// ============================================================================
// Scripts
// ============================================================================

class BuildDocumentTest : public ::testing::Test {
   protected:
    WarningLog warnings;

    DocumentOptions options() {
        DocumentOptions opts;
        opts.creation_time = test::fixedCreationTime();
        opts.warning_callback = warnings.callback();
        return opts;
    }
};

TEST_F(BuildDocumentTest, ReplaysScript) {
    Document doc(options());
    buildDocumentFromString(R"(<?xml version="1.0"?>
<document title="Script" author="Tester" filename="script_out">
  <layout preset="A5" top="2cm"/>
  <footnotes position="below-text" numbering="upper-alpha" restart-per-page="true"/>
  <p>Hello <b>World</b></p>
  <p style="s21">See<note anchor="*">A <i>note</i>.</note> here.</p>
</document>
)",
                            doc);

    EXPECT_EQ(doc.title(), "Script");
    EXPECT_EQ(doc.author(), "Tester");
    EXPECT_EQ(doc.filename(), "script_out");
    EXPECT_EQ(doc.layout(), (PageLayout{11906, 8391, 1134, 720, 567, 862}));
    EXPECT_EQ(doc.footnoteOptions().position, FootnotePosition::BelowText);
    EXPECT_EQ(doc.footnoteOptions().numbering, FootnoteNumbering::UpperAlpha);
    EXPECT_TRUE(doc.footnoteOptions().restart_per_page);

    EXPECT_EQ(doc.body(),
              "{\\pard \\s0\\qj Hello {\\b World}\\par}\n"
              "{\\pard \\s21\\qj\\f1\\fs24\\lang1024 See"
              "{\\super *{\\footnote *\\pard\\plain \\s23\\qj\\f1\\fs18\\fi-227\\li227 A {\\i note}.}}\n"
              " here.\\par}\n");
    EXPECT_FALSE(doc.paragraphOpen());
    EXPECT_TRUE(warnings.entries.empty());
}

TEST_F(BuildDocumentTest, CollapsesWhitespace) {
    Document doc(options());
    buildDocumentFromString("<document><p>\n    Hello\n    world\n  </p></document>", doc);
    EXPECT_EQ(doc.body(), "{\\pard \\s0\\qj Hello world\\par}\n");
}

TEST_F(BuildDocumentTest, SpansAndDefaults) {
    Document doc(options());
    buildDocumentFromString(R"(<document paragraph-style="s21" footnote-style="s26">
  <p><span format="ul">under</span> <sup>2</sup><note style="s29">n</note></p>
</document>)",
                            doc);

    EXPECT_EQ(doc.paragraphStyle(), "s21");
    EXPECT_EQ(doc.footnoteStyle(), "s26");
    EXPECT_EQ(doc.body(),
              "{\\pard \\s21\\qj\\f1\\fs24\\lang1024 {\\ul under} {\\super 2}"
              "{\\super \\chftn{\\footnote \\chftn\\pard\\plain "
              "\\s29\\qj\\f1\\fs20\\hyphpar\\fi-227\\li227\\lang1040 n}}\n"
              "\\par}\n");
}

TEST_F(BuildDocumentTest, UnknownStyleWarns) {
    Document doc(options());
    buildDocumentFromString(R"(<document><p style="s99">x</p></document>)", doc);
    ASSERT_EQ(warnings.entries.size(), 1u);
    EXPECT_EQ(warnings.entries[0].first, "Style not found");
}

TEST_F(BuildDocumentTest, RejectsInvalidScripts) {
    Document doc(options());
    EXPECT_THROW(buildDocumentFromString("<document><b>x</b></document>", doc), ConfigError);
    EXPECT_THROW(buildDocumentFromString("<document>loose text</document>", doc), ConfigError);
    EXPECT_THROW(buildDocumentFromString("<document><p><b>a<i>b</i></b></p></document>", doc),
                 ConfigError);
    EXPECT_THROW(buildDocumentFromString("<document><p><note><note>x</note></note></p></document>", doc),
                 ConfigError);
    EXPECT_THROW(buildDocumentFromString(R"(<document><p colour="red">x</p></document>)", doc),
                 ConfigError);
    EXPECT_THROW(buildDocumentFromString(R"(<document><layout preset="Letter"/></document>)", doc),
                 ConfigError);
    EXPECT_THROW(buildDocumentFromString(R"(<document><footnotes numbering="greek"/></document>)", doc),
                 ConfigError);
    EXPECT_THROW(buildDocumentFromString(R"(<document><p><span format="Bad">x</span></p></document>)", doc),
                 ConfigError);
    EXPECT_THROW(buildDocumentFromString("<template/>", doc), ConfigError);
    EXPECT_THROW(buildDocumentFromString("<document><p></document>", doc), ConfigError);
}

TEST_F(BuildDocumentTest, MalformedLayoutLengthIsParseError) {
    Document doc(options());
    EXPECT_THROW(buildDocumentFromString(R"(<document><layout top="3pt"/></document>)", doc), ParseError);
    EXPECT_EQ(doc.layout(), PageLayout{});
}

TEST_F(BuildDocumentTest, MissingFile) {
    Document doc(options());
    EXPECT_THROW(buildDocumentFromFile("/nonexistent/script.xml", doc), ConfigError);
}

}  // namespace libsrtf
