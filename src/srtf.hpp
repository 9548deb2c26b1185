#ifndef LIBSRTF_H
#define LIBSRTF_H
#include <cstdint>
#include <ctime>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <pugixml.hpp>
#include <stdexcept>
#include <string>
#include <vector>

#define LIBSRTF_VERSION "0.1.0"

/**
 * @namespace libsrtf
 * @brief Small RTF writer: build a document paragraph by paragraph and
 *        serialize it to Rich Text Format.
 *
 * A Document is created from a DocumentTemplate (font table, color table and
 * stylesheet) and accumulates body markup while the caller opens paragraphs,
 * adds inline text and footnotes. Nothing is written until the document is
 * serialized, at which point any open paragraph or footnote is closed and the
 * whole RTF stream is produced in one pass.
 *
 * The library is write-only: it never reads RTF.
 *
 * ### Minimal document
 * @code
 * libsrtf::Document doc({"My Title"});
 * doc.setLayout("A4");
 * doc.openParagraph("This text starts a paragraph.");
 * doc.text(" More text,");
 * doc.bold(" bold text.");
 * doc.openFootnote("The text of a footnote.");
 * doc.create("my_title");   // writes my_title.rtf
 * @endcode
 *
 * ### Custom template
 * @code
 * auto tmpl = std::make_shared<libsrtf::DocumentTemplate>(*libsrtf::DocumentTemplate::builtin());
 * libsrtf::StyleAttributes quote;
 * quote.font = "f1";
 * quote.font_size = 20;
 * quote.italic = true;
 * quote.left_indent = 567;
 * tmpl->addStyle(libsrtf::Style("s30", "Quote", quote, "s21"));
 *
 * libsrtf::Document doc(tmpl);
 * doc.openParagraph("Quoted text", "s30");
 * std::cout << doc.toString();
 * @endcode
 *
 * ### Warnings and verbose trace
 * @code
 * libsrtf::DocumentOptions opts;
 * opts.title = "Report";
 * opts.warning_callback = [](const std::string& category, const std::string& msg) {
 *     std::cerr << "Warning [" << category << "]: " << msg << std::endl;
 * };
 * opts.log_callback = [](const std::string& msg) { std::cerr << msg << std::endl; };
 * libsrtf::Document doc(opts);
 * @endcode
 */
namespace libsrtf {

// ============================================================================
// ERRORS AND CALLBACKS
// ============================================================================

/**
 * @brief Base class of every error thrown by libsrtf.
 */
class Error : public std::runtime_error {
   public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief A length literal could not be parsed (see parseLength()).
 */
class ParseError : public Error {
   public:
    explicit ParseError(const std::string& msg) : Error(msg) {}
};

/**
 * @brief Invalid configuration: unknown layout preset, malformed template,
 *        dangling style reference or invalid authoring script.
 */
class ConfigError : public Error {
   public:
    explicit ConfigError(const std::string& msg) : Error(msg) {}
};

/**
 * @typedef WarningCallback
 * @brief Receives non-fatal diagnostics.
 *
 * - @param category Short category (e.g. "Style not found")
 * - @param message Human readable description
 */
using WarningCallback =
    std::function<void(const std::string& category, const std::string& message)>;

/**
 * @typedef LogCallback
 * @brief Receives the verbose authoring trace (paragraphs opened, layout
 *        changes, export progress).
 */
using LogCallback = std::function<void(const std::string& message)>;

// ============================================================================
// UNIT CONVERSION
// ============================================================================

/**
 * @defgroup Units Unit Conversion
 * @brief Length literals and twips (1/20 point, 1440 per inch).
 * @{
 */

static constexpr double CM_TO_TWIPS = 566.929133858;
static constexpr double MM_TO_TWIPS = CM_TO_TWIPS / 10.0;
static constexpr double IN_TO_TWIPS = 1440.0;

/// Returned by parseLength() for an empty literal.
static constexpr int32_t UNSET_LENGTH = -1;

/**
 * @brief Parse a length literal into twips.
 *
 * Accepted forms (suffixes are case sensitive):
 * - "" → UNSET_LENGTH
 * - "720" → 720 (plain digits are already twips)
 * - "2.5cm", "15mm", "0.5in" → converted and rounded to the nearest twip
 *
 * @param literal Length literal
 * @return Length in twips, or UNSET_LENGTH
 * @throws ParseError for any other suffix or a malformed number
 */
int32_t parseLength(const std::string& literal);

double twipsToCm(int32_t twips);
double twipsToMm(int32_t twips);
double twipsToInches(int32_t twips);

/** @} */

// ============================================================================
// TEXT ENCODING
// ============================================================================

/**
 * @defgroup Encoding Text Encoding
 * @{
 */

/**
 * @brief Escape a single Unicode code point for RTF.
 *
 * Backslash, braces, control characters and anything above 0x7F become
 * `\uN?`, where N is the signed 16-bit value of the code point (values from
 * 0x8000 are emitted as value - 0x10000). Code points above 0xFFFF are
 * written as an escaped UTF-16 surrogate pair.
 *
 * @param code_point Unicode scalar value
 * @return Escaped form, or the character itself when no escape is needed
 */
std::string encodeCodePoint(uint32_t code_point);

/**
 * @brief Escape UTF-8 text for RTF.
 *
 * Printable ASCII passes through unchanged. Malformed UTF-8 sequences are
 * replaced by U+FFFD.
 *
 * @param text UTF-8 text
 * @return RTF-safe text
 */
std::string encodeText(const std::string& text);

/** @} */

// ============================================================================
// RESOURCE TABLES
// ============================================================================

/**
 * @defgroup Resources Fonts, Colors and Styles
 * @{
 */

enum class FontFamily { Nil, Roman, Swiss, Modern, Script, Decor, Tech, Bidi };

/// RTF family keyword without backslash ("fnil", "froman", ...).
const char* fontFamilyKeyword(FontFamily family);

/**
 * @struct Font
 * @brief Font table entry. The id ("f0", "f1", ...) is also the control word
 *        used to select the font.
 */
struct Font {
    std::string id;
    std::string name;
    FontFamily family = FontFamily::Nil;
    std::optional<int> pitch;    ///< \fprqN
    std::optional<int> charset;  ///< \fcharsetN

    /// `{\f1\fnil Name;}` line for the font table.
    std::string render() const;
};

/**
 * @struct Color
 * @brief Color table entry. The index is the position in the color table and
 *        the number used by \cfN; index 0 is reserved for the auto color.
 */
struct Color {
    int index = 1;
    int red = 0;
    int green = 0;
    int blue = 0;

    /// `\redR\greenG\blueB;` line for the color table.
    std::string render() const;
};

enum class Alignment { Left, Center, Right, Justified };
enum class WidowControl { Enabled, Disabled };
enum class TextDirection { LeftToRight, RightToLeft };

/**
 * @struct StyleAttributes
 * @brief Formatting carried by a style. Unset fields emit nothing.
 *
 * Lengths are in twips, font_size in half points.
 */
struct StyleAttributes {
    std::optional<Alignment> alignment = Alignment::Justified;
    std::optional<std::string> font;  ///< font id, e.g. "f1"
    std::optional<int> font_size;
    std::optional<int> line_spacing;  ///< emitted with \slmult1
    std::optional<int> space_before;
    std::optional<int> space_after;
    bool keep_with_next = false;
    bool bold = false;
    bool italic = false;
    bool small_caps = false;
    bool caps = false;
    std::optional<WidowControl> widow_control;
    bool hyphenation = false;
    std::optional<TextDirection> direction;
    std::optional<int> color;  ///< color table index
    std::optional<int> first_line_indent;
    std::optional<int> left_indent;
    std::optional<int> right_indent;
    std::optional<int> language;
};

/**
 * @class Style
 * @brief Stylesheet entry.
 *
 * Base and next style default to the style itself. The numeric part of the
 * id ("21" for "s21") is what the stylesheet uses in \sbasedon and \snext.
 */
class Style {
   private:
    std::string mId;
    std::string mName;
    std::string mBasedOn;
    std::string mNext;
    StyleAttributes mAttributes;

   public:
    Style(std::string id, std::string name, StyleAttributes attributes = {},
          std::string based_on = "", std::string next = "");

    const std::string& id() const { return mId; }
    const std::string& name() const { return mName; }
    const std::string& basedOn() const { return mBasedOn; }
    const std::string& next() const { return mNext; }
    const StyleAttributes& attributes() const { return mAttributes; }

    /**
     * @brief Formatting emitted every time the style is applied.
     *
     * `\s21` followed by every set attribute in canonical order and a
     * trailing space.
     */
    std::string renderApply() const;

    /// `{\s21\sbasedon0\snext21...Name;}` line for the stylesheet.
    std::string renderTableEntry() const;
};

/**
 * @brief Numeric part of a resource id ("s21" → "21").
 *
 * @throws ConfigError if the id is not letters followed by digits
 */
std::string resourceNumber(const std::string& id);

/**
 * @class DocumentTemplate
 * @brief Font table, color table, stylesheet and document defaults.
 *
 * Build a template once, then share it read-only between documents through
 * std::shared_ptr<const DocumentTemplate>. Registering an id twice replaces
 * the earlier entry in place.
 */
class DocumentTemplate {
   private:
    std::vector<Font> mFonts;
    std::map<int, Color> mColors;
    std::vector<Style> mStyles;
    int mDefaultLanguage = 1027;
    int mAsianLanguage = 1037;
    std::string mParagraphStyle;
    std::string mFootnoteStyle;

    void checkBaseChain(const Style& style) const;

   public:
    DocumentTemplate() = default;

    /**
     * @brief Shared built-in template (4 fonts, 3 colors, 10 styles).
     *
     * Default paragraph style "s0", default footnote style "s23".
     */
    static std::shared_ptr<const DocumentTemplate> builtin();

    /// @throws ConfigError for a malformed id
    void addFont(Font font);

    /// @throws ConfigError for an index below 1 or a component outside 0-255
    void addColor(Color color);

    /**
     * @brief Register a style.
     *
     * @throws ConfigError if the id is malformed, base or next does not name a
     *         registered style, the base chain would loop, or the font or color
     *         reference is not registered
     */
    void addStyle(Style style);

    const Font* findFont(const std::string& id) const;
    const Color* findColor(int index) const;
    const Style* findStyle(const std::string& id) const;

    const std::vector<Font>& fonts() const { return mFonts; }
    const std::map<int, Color>& colors() const { return mColors; }
    const std::vector<Style>& styles() const { return mStyles; }

    int defaultLanguage() const { return mDefaultLanguage; }
    int asianLanguage() const { return mAsianLanguage; }
    void setDefaultLanguage(int language) { mDefaultLanguage = language; }
    void setAsianLanguage(int language) { mAsianLanguage = language; }

    /// Empty means "first registered style".
    const std::string& paragraphStyle() const { return mParagraphStyle; }
    const std::string& footnoteStyle() const { return mFootnoteStyle; }
    void setParagraphStyle(const std::string& id) { mParagraphStyle = id; }
    void setFootnoteStyle(const std::string& id) { mFootnoteStyle = id; }

    std::string renderFontTable() const;
    std::string renderColorTable() const;
    std::string renderStyleSheet() const;
};

/** @} */

// ============================================================================
// PAGE LAYOUT AND FOOTNOTE OPTIONS
// ============================================================================

/**
 * @defgroup Layout Page Layout
 * @{
 */

/**
 * @struct PageLayout
 * @brief Paper size and margins in twips. Defaults to A4 with 2cm margins.
 */
struct PageLayout {
    int32_t paper_height = 16838;
    int32_t paper_width = 11906;
    int32_t margin_top = 1134;
    int32_t margin_bottom = 1134;
    int32_t margin_left = 1134;
    int32_t margin_right = 1134;

    bool operator==(const PageLayout& other) const;
    bool operator!=(const PageLayout& other) const { return !(*this == other); }
};

/**
 * @struct LayoutOverrides
 * @brief Length literals (see parseLength()) overriding single layout fields.
 *        Empty strings keep the current value.
 */
struct LayoutOverrides {
    std::string paper_height;
    std::string paper_width;
    std::string margin_top;
    std::string margin_bottom;
    std::string margin_left;
    std::string margin_right;
};

/**
 * @brief Look up a named layout preset.
 *
 * Known names: "A4", "B5", "A5", "royal", "digest", "LAS".
 *
 * @return The preset, or std::nullopt for an unknown name
 */
std::optional<PageLayout> findLayoutPreset(const std::string& name);

/// Names accepted by findLayoutPreset(), in declaration order.
std::vector<std::string> layoutPresetNames();

enum class FootnotePosition { BelowText, BottomOfPage };
enum class FootnoteNumbering { Arabic, LowerAlpha, UpperAlpha, LowerRoman, UpperRoman };

/**
 * @struct FootnoteOptions
 * @brief Document-wide footnote placement and numbering.
 */
struct FootnoteOptions {
    FootnotePosition position = FootnotePosition::BottomOfPage;
    bool restart_per_page = false;
    bool restart_per_section = false;
    FootnoteNumbering numbering = FootnoteNumbering::Arabic;

    /// e.g. `\ftnbj\ftnnar`
    std::string render() const;
};

/** @} */

// ============================================================================
// DOCUMENT
// ============================================================================

/**
 * @defgroup DocumentAPI Document
 * @{
 */

enum class StyleKind { Paragraph, Footnote };

enum class TextFormat { Plain, Italic, Bold, BoldItalic, Subscript, Superscript, SmallCaps };

/**
 * @struct DocumentOptions
 * @brief Settings applied when a Document is created.
 */
struct DocumentOptions {
    std::string title = "Document Title";
    std::string author = "author";

    /// Output file name without extension; empty means "same as title".
    std::string filename;

    /// Value of \creatim; the current local time when unset.
    std::optional<std::tm> creation_time;

    /// Style fallbacks and other non-fatal issues. Default: nullptr (silent).
    WarningCallback warning_callback = nullptr;

    /// Verbose authoring trace. Default: nullptr (silent).
    LogCallback log_callback = nullptr;
};

/**
 * @class Document
 * @brief RTF document under construction.
 *
 * States: no paragraph, paragraph open, paragraph and footnote open.
 * Opening a paragraph closes the current one (and its footnote); opening a
 * footnote closes the current footnote. Closing something that is not open
 * does nothing.
 *
 * @note Not thread-safe. Use one Document per thread.
 */
class Document {
   private:
    std::shared_ptr<const DocumentTemplate> mTemplate;
    DocumentOptions mOptions;
    PageLayout mLayout;
    FootnoteOptions mFootnotes;
    std::string mParagraphStyle;
    std::string mFootnoteStyle;
    bool mParagraphOpen = false;
    bool mFootnoteOpen = false;
    std::vector<std::string> mBody;
    std::vector<std::string> mLines;

    void log(const std::string& message) const;
    void warn(const std::string& category, const std::string& message) const;
    void append(const std::string& markup);
    void appendEncoded(const std::string& text);
    void buildLines();

   public:
    /// Document using DocumentTemplate::builtin().
    explicit Document(DocumentOptions options = {});

    /**
     * @brief Document using a custom template.
     *
     * @throws ConfigError if the template has no styles or its default
     *         paragraph/footnote style is not registered
     */
    explicit Document(std::shared_ptr<const DocumentTemplate> document_template,
                      DocumentOptions options = {});

    // ------------------------------------------------------------------
    // Authoring
    // ------------------------------------------------------------------

    /**
     * @brief Open a new paragraph.
     *
     * Closes the current paragraph (and footnote) first.
     *
     * @param text Initial text, may be empty
     * @param style Style id; empty or unknown selects the default paragraph
     *              style
     */
    void openParagraph(const std::string& text = "", const std::string& style = "");

    /// Close the open footnote, then the open paragraph. No-op when closed.
    void closeParagraph();

    /**
     * @brief Append text to the open paragraph or footnote.
     *
     * @param text UTF-8 text
     * @param format Inline formatting group wrapped around the text
     */
    void text(const std::string& text, TextFormat format = TextFormat::Plain);

    /**
     * @brief Append text wrapped in an arbitrary control word group.
     *
     * "ul" produces `{\ul text}`; "bi" and "ib" mean bold italic; an empty
     * word appends plain text.
     *
     * @throws ConfigError if the word is not a valid RTF control word
     */
    void text(const std::string& text, const std::string& control_word);

    void italic(const std::string& text) { this->text(text, TextFormat::Italic); }
    void bold(const std::string& text) { this->text(text, TextFormat::Bold); }
    void subscript(const std::string& text) { this->text(text, TextFormat::Subscript); }
    void superscript(const std::string& text) { this->text(text, TextFormat::Superscript); }
    void smallCaps(const std::string& text) { this->text(text, TextFormat::SmallCaps); }

    /**
     * @brief Open a footnote anchored at the current position.
     *
     * Closes the current footnote first. Without an open paragraph a
     * "Footnote without paragraph" warning is reported and an empty paragraph
     * in the default paragraph style is opened to host the footnote.
     *
     * @param text Initial footnote text
     * @param style Style id; empty or unknown selects the default footnote
     *              style
     * @param anchor Literal anchor mark; std::nullopt for automatic numbering
     */
    void openFootnote(const std::string& text, const std::string& style = "",
                      const std::optional<std::string>& anchor = std::nullopt);

    /// Close the open footnote. No-op when closed.
    void closeFootnote();

    bool paragraphOpen() const { return mParagraphOpen; }
    bool footnoteOpen() const { return mFootnoteOpen; }

    /// Body markup accumulated so far.
    std::string body() const;

    // ------------------------------------------------------------------
    // Styles
    // ------------------------------------------------------------------

    /**
     * @brief Find a style by id, falling back to the default for @p kind.
     *
     * Never fails. An unknown non-empty id reports a "Style not found"
     * warning.
     */
    const Style& resolveStyle(const std::string& id, StyleKind kind = StyleKind::Paragraph) const;

    /// Change the default style for @p kind (unknown ids fall back as above).
    void setDefaultStyle(const std::string& id, StyleKind kind = StyleKind::Paragraph);

    const std::string& paragraphStyle() const { return mParagraphStyle; }
    const std::string& footnoteStyle() const { return mFootnoteStyle; }

    const DocumentTemplate& documentTemplate() const { return *mTemplate; }

    // ------------------------------------------------------------------
    // Document properties
    // ------------------------------------------------------------------

    /**
     * @brief Set paper size and margins.
     *
     * The preset (if any) replaces the whole geometry, then each non-empty
     * override replaces its field. All literals are validated before anything
     * changes.
     *
     * @param preset Preset name or empty to start from the current layout
     * @param overrides Per-field length literals
     * @throws ParseError for a malformed literal
     * @throws ConfigError for an unknown preset
     */
    void setLayout(const std::string& preset = "", const LayoutOverrides& overrides = {});

    const PageLayout& layout() const { return mLayout; }

    /// Multi-line description of the layout in twips.
    std::string layoutSummary() const;

    void setFootnoteOptions(const FootnoteOptions& options) { mFootnotes = options; }
    const FootnoteOptions& footnoteOptions() const { return mFootnotes; }

    const std::string& title() const { return mOptions.title; }
    const std::string& author() const { return mOptions.author; }
    const std::string& filename() const;
    void setTitle(const std::string& title) { mOptions.title = title; }
    void setAuthor(const std::string& author) { mOptions.author = author; }
    void setFilename(const std::string& filename) { mOptions.filename = filename; }

    // ------------------------------------------------------------------
    // Output
    // ------------------------------------------------------------------

    /**
     * @brief Close everything that is open and write the complete RTF.
     *
     * @param out Output stream
     * @throws std::runtime_error if the stream fails
     */
    void serialize(std::ostream& out);

    /// serialize() into a string.
    std::string toString();

    /**
     * @brief Write `<folder>/<filename>.rtf`.
     *
     * @param filename File name without extension; empty uses filename()
     * @param folder Directory; empty for the working directory
     * @return Path of the written file
     * @throws std::runtime_error if the file cannot be written
     */
    std::string create(const std::string& filename = "", const std::string& folder = "");
};

/** @} */

// ============================================================================
// XML TEMPLATES AND AUTHORING SCRIPTS
// ============================================================================

/**
 * @defgroup XmlInput XML Templates and Scripts
 * @brief pugixml readers for templates and document scripts.
 *
 * Template:
 * @code{.xml}
 * <template deflang="1027" adeflang="1037" paragraph-style="s0" footnote-style="s1">
 *   <font id="f0" family="roman" charset="0">Times New Roman</font>
 *   <color index="1" red="128" green="128" blue="128"/>
 *   <style id="s0" name="Normal" font="f0" size="24"/>
 *   <style id="s1" name="Note" basedon="s0" size="18" left-indent="227" first-line-indent="-227"/>
 * </template>
 * @endcode
 *
 * Script:
 * @code{.xml}
 * <document title="My Title" author="Me">
 *   <layout preset="A4" top="3cm"/>
 *   <footnotes position="bottom" numbering="lower-roman"/>
 *   <p style="s21">Hello <b>World</b><note anchor="*">A footnote.</note></p>
 * </document>
 * @endcode
 * @{
 */

/**
 * @brief Add the fonts, colors and styles of a <template> element.
 *
 * @throws ConfigError for unknown elements/attributes or invalid values
 */
void loadTemplate(const pugi::xml_node& node, DocumentTemplate& document_template);

/// @throws ConfigError if the file cannot be parsed or is invalid
std::shared_ptr<DocumentTemplate> loadTemplateFile(const std::string& path);

/// @throws ConfigError if the string cannot be parsed or is invalid
std::shared_ptr<DocumentTemplate> loadTemplateString(const std::string& xml);

/**
 * @brief Replay a <document> script onto @p document.
 *
 * @throws ConfigError for unknown elements/attributes or invalid values
 * @throws ParseError for malformed layout lengths
 */
void buildDocument(const pugi::xml_node& node, Document& document);

void buildDocumentFromFile(const std::string& path, Document& document);
void buildDocumentFromString(const std::string& xml, Document& document);

/** @} */

}  // namespace libsrtf

#endif  // LIBSRTF_H
