#include "srtf.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

namespace libsrtf {

// ============================================================================
// UNIT CONVERSION
// ============================================================================

namespace {

bool is_digits(const std::string &str) {
  return !str.empty() && std::all_of(str.begin(), str.end(), [](char c) {
    return std::isdigit(static_cast<unsigned char>(c));
  });
}

bool ends_with(const std::string &str, const std::string &suffix) {
  return str.size() >= suffix.size() &&
         str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

double parse_number(const std::string &body, const std::string &literal) {
  if (body.empty() || body.find_first_not_of("0123456789+-.eE") != std::string::npos) {
    throw ParseError("Measure impossible to parse: \"" + literal + "\"");
  }
  const char *begin = body.c_str();
  char *end = nullptr;
  double value = std::strtod(begin, &end);
  if (end != begin + body.size() || !std::isfinite(value)) {
    throw ParseError("Measure impossible to parse: \"" + literal + "\"");
  }
  return value;
}

int32_t to_twips(double twips, const std::string &literal) {
  // nearbyint keeps the default round-half-to-even mode
  double rounded = std::nearbyint(twips);
  if (rounded < std::numeric_limits<int32_t>::min() ||
      rounded > std::numeric_limits<int32_t>::max()) {
    throw ParseError("Measure out of range: \"" + literal + "\"");
  }
  return static_cast<int32_t>(rounded);
}

} // anonymous namespace

int32_t parseLength(const std::string &literal) {
  if (literal.empty()) {
    return UNSET_LENGTH;
  }
  if (is_digits(literal)) {
    return to_twips(parse_number(literal, literal), literal);
  }

  const std::string body = literal.substr(0, literal.size() >= 2 ? literal.size() - 2 : 0);
  if (ends_with(literal, "cm")) {
    return to_twips(parse_number(body, literal) * CM_TO_TWIPS, literal);
  }
  if (ends_with(literal, "mm")) {
    return to_twips(parse_number(body, literal) * MM_TO_TWIPS, literal);
  }
  if (ends_with(literal, "in")) {
    return to_twips(parse_number(body, literal) * IN_TO_TWIPS, literal);
  }
  throw ParseError("Measure impossible to parse: \"" + literal + "\"");
}

double twipsToCm(int32_t twips) { return twips / CM_TO_TWIPS; }

double twipsToMm(int32_t twips) { return twips / MM_TO_TWIPS; }

double twipsToInches(int32_t twips) { return twips / IN_TO_TWIPS; }

// ============================================================================
// TEXT ENCODING
// ============================================================================

namespace {

constexpr uint32_t REPLACEMENT_CHARACTER = 0xFFFD;

// Decodes one UTF-8 sequence starting at pos and advances pos past it.
// Invalid, overlong or truncated sequences consume one byte and yield U+FFFD.
uint32_t next_code_point(const std::string &text, size_t &pos) {
  const auto lead = static_cast<unsigned char>(text[pos]);
  if (lead < 0x80) {
    ++pos;
    return lead;
  }

  size_t length;
  uint32_t code_point;
  uint32_t minimum;
  if ((lead & 0xE0) == 0xC0) {
    length = 2;
    code_point = lead & 0x1F;
    minimum = 0x80;
  } else if ((lead & 0xF0) == 0xE0) {
    length = 3;
    code_point = lead & 0x0F;
    minimum = 0x800;
  } else if ((lead & 0xF8) == 0xF0) {
    length = 4;
    code_point = lead & 0x07;
    minimum = 0x10000;
  } else {
    ++pos;
    return REPLACEMENT_CHARACTER;
  }

  if (pos + length > text.size()) {
    ++pos;
    return REPLACEMENT_CHARACTER;
  }
  for (size_t i = 1; i < length; ++i) {
    const auto byte = static_cast<unsigned char>(text[pos + i]);
    if ((byte & 0xC0) != 0x80) {
      ++pos;
      return REPLACEMENT_CHARACTER;
    }
    code_point = (code_point << 6) | (byte & 0x3F);
  }

  if (code_point < minimum || code_point > 0x10FFFF ||
      (code_point >= 0xD800 && code_point <= 0xDFFF)) {
    ++pos;
    return REPLACEMENT_CHARACTER;
  }
  pos += length;
  return code_point;
}

} // anonymous namespace

std::string encodeCodePoint(uint32_t code_point) {
  if (code_point > 0x10FFFF) {
    code_point = REPLACEMENT_CHARACTER;
  }
  if (code_point > 0xFFFF) {
    uint32_t offset = code_point - 0x10000;
    return encodeCodePoint(0xD800 + (offset >> 10)) +
           encodeCodePoint(0xDC00 + (offset & 0x3FF));
  }
  if (code_point == '\\' || code_point == '{' || code_point == '}' ||
      code_point < 0x20 || code_point > 0x7F) {
    int32_t value = static_cast<int32_t>(code_point);
    if (code_point >= 0x8000) {
      value -= 0x10000;
    }
    return "\\u" + std::to_string(value) + "?";
  }
  return std::string(1, static_cast<char>(code_point));
}

std::string encodeText(const std::string &text) {
  std::string result;
  result.reserve(text.size());

  size_t pos = 0;
  while (pos < text.size()) {
    const auto c = static_cast<unsigned char>(text[pos]);
    // fast path for the common printable ASCII case
    if (c >= 0x20 && c < 0x80 && c != '\\' && c != '{' && c != '}') {
      result += static_cast<char>(c);
      ++pos;
      continue;
    }
    result += encodeCodePoint(next_code_point(text, pos));
  }
  return result;
}

// ============================================================================
// RESOURCE TABLES
// ============================================================================

const char *fontFamilyKeyword(FontFamily family) {
  switch (family) {
  case FontFamily::Nil:
    return "fnil";
  case FontFamily::Roman:
    return "froman";
  case FontFamily::Swiss:
    return "fswiss";
  case FontFamily::Modern:
    return "fmodern";
  case FontFamily::Script:
    return "fscript";
  case FontFamily::Decor:
    return "fdecor";
  case FontFamily::Tech:
    return "ftech";
  case FontFamily::Bidi:
    return "fbidi";
  }
  return "fnil";
}

std::string resourceNumber(const std::string &id) {
  size_t digits = 0;
  while (digits < id.size() && std::isalpha(static_cast<unsigned char>(id[digits]))) {
    ++digits;
  }
  std::string number = id.substr(digits);
  if (digits == 0 || !is_digits(number)) {
    throw ConfigError("Invalid resource id: \"" + id + "\"");
  }
  return number;
}

std::string Font::render() const {
  std::string out = "{\\" + id;
  out += "\\";
  out += fontFamilyKeyword(family);
  if (pitch) {
    out += "\\fprq" + std::to_string(*pitch);
  }
  if (charset) {
    out += "\\fcharset" + std::to_string(*charset);
  }
  out += " " + encodeText(name) + ";}\n";
  return out;
}

std::string Color::render() const {
  std::string out = "\\red" + std::to_string(red);
  out += "\\green" + std::to_string(green);
  out += "\\blue" + std::to_string(blue);
  out += ";\n";
  return out;
}

Style::Style(std::string id, std::string name, StyleAttributes attributes,
             std::string based_on, std::string next)
    : mId(std::move(id)), mName(std::move(name)),
      mBasedOn(based_on.empty() ? mId : std::move(based_on)),
      mNext(next.empty() ? mId : std::move(next)),
      mAttributes(std::move(attributes)) {}

std::string Style::renderApply() const {
  const StyleAttributes &a = mAttributes;
  std::ostringstream out;
  out << "\\" << mId;

  if (a.alignment) {
    switch (*a.alignment) {
    case Alignment::Left:
      out << "\\ql";
      break;
    case Alignment::Center:
      out << "\\qc";
      break;
    case Alignment::Right:
      out << "\\qr";
      break;
    case Alignment::Justified:
      out << "\\qj";
      break;
    }
  }
  if (a.font)
    out << "\\" << *a.font;
  if (a.font_size)
    out << "\\fs" << *a.font_size;
  if (a.line_spacing)
    out << "\\sl" << *a.line_spacing << "\\slmult1";
  if (a.space_before)
    out << "\\sb" << *a.space_before;
  if (a.space_after)
    out << "\\sa" << *a.space_after;
  if (a.keep_with_next)
    out << "\\keepn";
  if (a.bold)
    out << "\\b";
  if (a.italic)
    out << "\\i";
  if (a.small_caps)
    out << "\\scaps";
  if (a.caps)
    out << "\\caps";
  if (a.widow_control) {
    out << (*a.widow_control == WidowControl::Enabled ? "\\widctlpar" : "\\nowidctlpar");
  }
  if (a.hyphenation)
    out << "\\hyphpar";
  if (a.direction) {
    out << (*a.direction == TextDirection::RightToLeft ? "\\rtlpar" : "\\ltrpar");
  }
  if (a.color)
    out << "\\cf" << *a.color;
  if (a.first_line_indent)
    out << "\\fi" << *a.first_line_indent;
  if (a.left_indent)
    out << "\\li" << *a.left_indent;
  if (a.right_indent)
    out << "\\ri" << *a.right_indent;
  if (a.language)
    out << "\\lang" << *a.language;

  out << " ";
  return out.str();
}

std::string Style::renderTableEntry() const {
  std::string out = "{\\" + mId;
  out += "\\sbasedon" + resourceNumber(mBasedOn);
  out += "\\snext" + resourceNumber(mNext);
  out += renderApply();
  out += encodeText(mName) + ";}\n";
  return out;
}

// ============================================================================
// DOCUMENT TEMPLATE
// ============================================================================

std::shared_ptr<const DocumentTemplate> DocumentTemplate::builtin() {
  static const std::shared_ptr<const DocumentTemplate> instance = [] {
    auto t = std::make_shared<DocumentTemplate>();

    t->addFont({"f0", "Times New Roman", FontFamily::Nil});
    t->addFont({"f1", "Linux Libertine", FontFamily::Nil});
    t->addFont({"f2", "SBL BibLit", FontFamily::Nil});
    t->addFont({"f3", "Linux Biolinum", FontFamily::Swiss});

    t->addColor({1, 128, 128, 128}); // grey
    t->addColor({2, 128, 64, 0});    // orange
    t->addColor({3, 255, 255, 255}); // white

    t->addStyle(Style("s0", "Default"));

    StyleAttributes normal;
    normal.font = "f1";
    normal.font_size = 24;
    normal.language = 1024;
    t->addStyle(Style("s21", "Normal", normal, "s0"));

    StyleAttributes hebrew;
    hebrew.font = "f2";
    hebrew.font_size = 24;
    hebrew.direction = TextDirection::RightToLeft;
    hebrew.language = 1037;
    t->addStyle(Style("s22", "Normal hebreu", hebrew, "s21"));

    StyleAttributes note;
    note.font = "f1";
    note.font_size = 18;
    note.left_indent = 227;
    note.first_line_indent = -227;
    t->addStyle(Style("s23", "Nota", note, "s21"));

    StyleAttributes note_hebrew;
    note_hebrew.font = "f2";
    note_hebrew.font_size = 22;
    note_hebrew.language = 1307;
    t->addStyle(Style("s24", "Nota hebreu", note_hebrew, "s23"));

    StyleAttributes titles;
    titles.alignment = Alignment::Center;
    titles.keep_with_next = true;
    titles.bold = true;
    titles.font = "f1";
    titles.font_size = 28;
    titles.space_before = 1132;
    titles.space_after = 566;
    titles.language = 1609;
    t->addStyle(Style("s25", "Estil_Titols", titles, "s21"));

    StyleAttributes note_normal;
    note_normal.font = "f1";
    note_normal.font_size = 20;
    note_normal.left_indent = 227;
    note_normal.first_line_indent = -227;
    note_normal.language = 1027;
    t->addStyle(Style("s26", "Nota normal", note_normal, "s23"));

    StyleAttributes greek;
    greek.font = "f1";
    greek.font_size = 24;
    greek.line_spacing = 276;
    greek.hyphenation = true;
    greek.language = 1609;
    t->addStyle(Style("s27", "Normal grec", greek, "s21"));

    StyleAttributes hidden_titles;
    hidden_titles.alignment = Alignment::Left;
    hidden_titles.keep_with_next = true;
    hidden_titles.font = "f1";
    hidden_titles.font_size = 4;
    hidden_titles.color = 3;
    hidden_titles.language = 1609;
    t->addStyle(Style("s28", "Estil_Titols_Amagats", hidden_titles, "s0"));

    StyleAttributes note_italian;
    note_italian.font = "f1";
    note_italian.font_size = 20;
    note_italian.left_indent = 227;
    note_italian.first_line_indent = -227;
    note_italian.hyphenation = true;
    note_italian.language = 1040;
    t->addStyle(Style("s29", "Nota italia", note_italian, "s23"));

    t->setParagraphStyle("s0");
    t->setFootnoteStyle("s23");
    return std::shared_ptr<const DocumentTemplate>(t);
  }();
  return instance;
}

void DocumentTemplate::addFont(Font font) {
  resourceNumber(font.id);
  for (auto &existing : mFonts) {
    if (existing.id == font.id) {
      existing = std::move(font);
      return;
    }
  }
  mFonts.push_back(std::move(font));
}

void DocumentTemplate::addColor(Color color) {
  if (color.index < 1) {
    throw ConfigError("Color index must be 1 or greater, got " + std::to_string(color.index));
  }
  for (int component : {color.red, color.green, color.blue}) {
    if (component < 0 || component > 255) {
      throw ConfigError("Color component out of range in color " +
                        std::to_string(color.index) + ": " + std::to_string(component));
    }
  }
  mColors[color.index] = color;
}

void DocumentTemplate::checkBaseChain(const Style &style) const {
  // walk the chain as it would look after registration
  std::string current = style.basedOn();
  for (size_t steps = 0; current != style.id(); ++steps) {
    const Style *base = findStyle(current);
    if (!base || base->basedOn() == base->id()) {
      return;
    }
    if (steps > mStyles.size()) {
      break;
    }
    current = base->basedOn();
  }
  throw ConfigError("Style \"" + style.id() + "\" would be based on itself through \"" +
                    style.basedOn() + "\"");
}

void DocumentTemplate::addStyle(Style style) {
  resourceNumber(style.id());
  if (style.basedOn() != style.id()) {
    resourceNumber(style.basedOn());
    if (!findStyle(style.basedOn())) {
      throw ConfigError("Style \"" + style.id() + "\" is based on unknown style \"" +
                        style.basedOn() + "\"");
    }
    checkBaseChain(style);
  }
  if (style.next() != style.id()) {
    resourceNumber(style.next());
    if (!findStyle(style.next())) {
      throw ConfigError("Style \"" + style.id() + "\" has unknown next style \"" +
                        style.next() + "\"");
    }
  }

  const StyleAttributes &a = style.attributes();
  if (a.font && !findFont(*a.font)) {
    throw ConfigError("Style \"" + style.id() + "\" uses unknown font \"" + *a.font + "\"");
  }
  if (a.color && !findColor(*a.color)) {
    throw ConfigError("Style \"" + style.id() + "\" uses unknown color " +
                      std::to_string(*a.color));
  }

  for (auto &existing : mStyles) {
    if (existing.id() == style.id()) {
      existing = std::move(style);
      return;
    }
  }
  mStyles.push_back(std::move(style));
}

const Font *DocumentTemplate::findFont(const std::string &id) const {
  for (const auto &font : mFonts) {
    if (font.id == id)
      return &font;
  }
  return nullptr;
}

const Color *DocumentTemplate::findColor(int index) const {
  auto it = mColors.find(index);
  return it == mColors.end() ? nullptr : &it->second;
}

const Style *DocumentTemplate::findStyle(const std::string &id) const {
  for (const auto &style : mStyles) {
    if (style.id() == id)
      return &style;
  }
  return nullptr;
}

std::string DocumentTemplate::renderFontTable() const {
  std::string out = "{\\fonttbl\n";
  for (const auto &font : mFonts) {
    out += font.render();
  }
  out += "}\n";
  return out;
}

std::string DocumentTemplate::renderColorTable() const {
  // entry 0 is the auto color; gaps keep later indexes in place
  std::string out = "{\\colortbl\n";
  out += ";\n";
  int next_index = 1;
  for (const auto &entry : mColors) {
    for (; next_index < entry.first; ++next_index) {
      out += ";\n";
    }
    out += entry.second.render();
    ++next_index;
  }
  out += "}\n";
  return out;
}

std::string DocumentTemplate::renderStyleSheet() const {
  std::string out = "{\\stylesheet\n";
  for (const auto &style : mStyles) {
    out += style.renderTableEntry();
  }
  out += "}\n";
  return out;
}

// ============================================================================
// PAGE LAYOUT AND FOOTNOTE OPTIONS
// ============================================================================

namespace {

struct LayoutPreset {
  const char *name;
  PageLayout layout;
};

const std::vector<LayoutPreset> &layout_presets() {
  static const std::vector<LayoutPreset> presets = {
      // A4, 2cm margins
      {"A4", {16838, 11906, 1134, 1134, 1134, 1134}},
      // B5, margins 3cm, 2.5cm, 2cm, 2cm
      {"B5", {14173, 9978, 1701, 1417, 1134, 1134}},
      {"A5", {11906, 8391, 1151, 720, 567, 862}},
      // royal (15.57cm x 23.39cm)
      {"royal", {13262, 8827, 1152, 720, 864, 864}},
      // digest (5.5in x 8.5in)
      {"digest", {12240, 7920, 1151, 720, 567, 862}},
      // LAS (17cm x 24cm), margins 2.8cm, 2.5cm, 2cm, 2cm
      {"LAS",
       {parseLength("24cm"), parseLength("17cm"), parseLength("2.8cm"), parseLength("2.5cm"),
        parseLength("2cm"), parseLength("2cm")}},
  };
  return presets;
}

} // anonymous namespace

bool PageLayout::operator==(const PageLayout &other) const {
  return paper_height == other.paper_height && paper_width == other.paper_width &&
         margin_top == other.margin_top && margin_bottom == other.margin_bottom &&
         margin_left == other.margin_left && margin_right == other.margin_right;
}

std::optional<PageLayout> findLayoutPreset(const std::string &name) {
  for (const auto &preset : layout_presets()) {
    if (name == preset.name) {
      return preset.layout;
    }
  }
  return std::nullopt;
}

std::vector<std::string> layoutPresetNames() {
  std::vector<std::string> names;
  for (const auto &preset : layout_presets()) {
    names.emplace_back(preset.name);
  }
  return names;
}

std::string FootnoteOptions::render() const {
  std::string out =
      position == FootnotePosition::BelowText ? "\\ftntj" : "\\ftnbj";
  if (restart_per_page) {
    out += "\\ftnrstpg";
  }
  if (restart_per_section) {
    out += "\\ftnrestart";
  }
  switch (numbering) {
  case FootnoteNumbering::Arabic:
    out += "\\ftnnar";
    break;
  case FootnoteNumbering::LowerAlpha:
    out += "\\ftnnalc";
    break;
  case FootnoteNumbering::UpperAlpha:
    out += "\\ftnnauc";
    break;
  case FootnoteNumbering::LowerRoman:
    out += "\\ftnnrlc";
    break;
  case FootnoteNumbering::UpperRoman:
    out += "\\ftnnruc";
    break;
  }
  return out;
}

// ============================================================================
// DOCUMENT
// ============================================================================

Document::Document(DocumentOptions options)
    : Document(DocumentTemplate::builtin(), std::move(options)) {}

Document::Document(std::shared_ptr<const DocumentTemplate> document_template,
                   DocumentOptions options)
    : mTemplate(std::move(document_template)), mOptions(std::move(options)) {
  if (!mTemplate) {
    throw ConfigError("Document template is null");
  }
  if (mTemplate->styles().empty()) {
    throw ConfigError("Document template has no styles");
  }

  const std::string &first = mTemplate->styles().front().id();
  mParagraphStyle = mTemplate->paragraphStyle().empty() ? first : mTemplate->paragraphStyle();
  mFootnoteStyle = mTemplate->footnoteStyle().empty() ? first : mTemplate->footnoteStyle();
  if (!mTemplate->findStyle(mParagraphStyle)) {
    throw ConfigError("Default paragraph style \"" + mParagraphStyle + "\" is not registered");
  }
  if (!mTemplate->findStyle(mFootnoteStyle)) {
    throw ConfigError("Default footnote style \"" + mFootnoteStyle + "\" is not registered");
  }

  log("RTF document created with title \"" + mOptions.title + "\".");
}

void Document::log(const std::string &message) const {
  if (mOptions.log_callback) {
    mOptions.log_callback(message);
  }
}

void Document::warn(const std::string &category, const std::string &message) const {
  if (mOptions.warning_callback) {
    mOptions.warning_callback(category, message);
  }
}

void Document::append(const std::string &markup) { mBody.push_back(markup); }

void Document::appendEncoded(const std::string &text) {
  if (!text.empty()) {
    mBody.push_back(encodeText(text));
  }
}

std::string Document::body() const {
  std::string out;
  for (const auto &fragment : mBody) {
    out += fragment;
  }
  return out;
}

const std::string &Document::filename() const {
  return mOptions.filename.empty() ? mOptions.title : mOptions.filename;
}

void Document::openParagraph(const std::string &text, const std::string &style) {
  closeParagraph();

  const Style &resolved = resolveStyle(style, StyleKind::Paragraph);
  mParagraphOpen = true;

  append("{\\pard " + resolved.renderApply());
  appendEncoded(text);

  log(text.empty() ? "Open paragraph." : "Open paragraph: " + text);
}

void Document::closeParagraph() {
  closeFootnote();

  if (mParagraphOpen) {
    append("\\par}\n");
    mParagraphOpen = false;
    log("Close paragraph.");
  }
}

void Document::text(const std::string &text, TextFormat format) {
  switch (format) {
  case TextFormat::Plain:
    this->text(text, std::string());
    break;
  case TextFormat::Italic:
    this->text(text, std::string("i"));
    break;
  case TextFormat::Bold:
    this->text(text, std::string("b"));
    break;
  case TextFormat::BoldItalic:
    this->text(text, std::string("bi"));
    break;
  case TextFormat::Subscript:
    this->text(text, std::string("sub"));
    break;
  case TextFormat::Superscript:
    this->text(text, std::string("super"));
    break;
  case TextFormat::SmallCaps:
    this->text(text, std::string("scaps"));
    break;
  }
}

void Document::text(const std::string &text, const std::string &control_word) {
  if (control_word.empty()) {
    appendEncoded(text);
    log("Text: " + text);
    return;
  }

  if (control_word == "bi" || control_word == "ib") {
    append("{\\i\\b ");
  } else {
    // letters, then an optional signed number
    size_t letters = 0;
    while (letters < control_word.size() &&
           std::islower(static_cast<unsigned char>(control_word[letters]))) {
      ++letters;
    }
    std::string parameter = control_word.substr(letters);
    if (!parameter.empty() && parameter[0] == '-') {
      parameter.erase(0, 1);
    }
    if (letters == 0 || (letters < control_word.size() && !is_digits(parameter))) {
      throw ConfigError("Invalid control word: \"" + control_word + "\"");
    }
    append("{\\" + control_word + " ");
  }
  appendEncoded(text);
  append("}");

  log("Text (" + control_word + "): " + text);
}

void Document::openFootnote(const std::string &text, const std::string &style,
                            const std::optional<std::string> &anchor) {
  closeFootnote();

  if (!mParagraphOpen) {
    warn("Footnote without paragraph",
         "No paragraph is open; opening an empty paragraph to host the footnote.");
    openParagraph();
  }

  const Style &resolved = resolveStyle(style, StyleKind::Footnote);
  mFootnoteOpen = true;

  const std::string mark = anchor ? encodeText(*anchor) : "\\chftn";
  append("{\\super " + mark + "{\\footnote " + mark + "\\pard\\plain ");
  append(resolved.renderApply());
  appendEncoded(text);

  log("Open footnote: " + text);
}

void Document::closeFootnote() {
  if (mFootnoteOpen) {
    append("}}\n");
    mFootnoteOpen = false;
    log("Close footnote.");
  }
}

const Style &Document::resolveStyle(const std::string &id, StyleKind kind) const {
  const std::string &fallback = kind == StyleKind::Footnote ? mFootnoteStyle : mParagraphStyle;

  if (const Style *style = mTemplate->findStyle(id)) {
    return *style;
  }
  if (!id.empty()) {
    warn("Style not found",
         "Style \"" + id + "\" not found. Defaulting to \"" + fallback + "\".");
  }
  return *mTemplate->findStyle(fallback);
}

void Document::setDefaultStyle(const std::string &id, StyleKind kind) {
  const Style &resolved = resolveStyle(id, kind);
  if (kind == StyleKind::Footnote) {
    mFootnoteStyle = resolved.id();
    log("Style for footnotes set to \"" + resolved.id() + "\".");
  } else {
    mParagraphStyle = resolved.id();
    log("Style for paragraphs set to \"" + resolved.id() + "\".");
  }
}

void Document::setLayout(const std::string &preset, const LayoutOverrides &overrides) {
  const int32_t height = parseLength(overrides.paper_height);
  const int32_t width = parseLength(overrides.paper_width);
  const int32_t top = parseLength(overrides.margin_top);
  const int32_t bottom = parseLength(overrides.margin_bottom);
  const int32_t left = parseLength(overrides.margin_left);
  const int32_t right = parseLength(overrides.margin_right);

  PageLayout layout = mLayout;
  if (!preset.empty()) {
    auto found = findLayoutPreset(preset);
    if (!found) {
      throw ConfigError("Default layout '" + preset + "' does not exist.");
    }
    layout = *found;
  }

  if (height != UNSET_LENGTH)
    layout.paper_height = height;
  if (width != UNSET_LENGTH)
    layout.paper_width = width;
  if (top != UNSET_LENGTH)
    layout.margin_top = top;
  if (bottom != UNSET_LENGTH)
    layout.margin_bottom = bottom;
  if (left != UNSET_LENGTH)
    layout.margin_left = left;
  if (right != UNSET_LENGTH)
    layout.margin_right = right;

  mLayout = layout;

  log(preset.empty() ? "Layout set." : "Layout set to \"" + preset + "\".");
}

std::string Document::layoutSummary() const {
  std::ostringstream out;
  out << "Layout in twips:\n"
      << " Paper height: " << mLayout.paper_height << "\n"
      << " Paper width: " << mLayout.paper_width << "\n"
      << " Top margin: " << mLayout.margin_top << "\n"
      << " Bottom margin: " << mLayout.margin_bottom << "\n"
      << " Left margin: " << mLayout.margin_left << "\n"
      << " Right margin: " << mLayout.margin_right;
  return out.str();
}

// ============================================================================
// SERIALIZATION
// ============================================================================

namespace {

std::tm local_time_now() {
  std::time_t now = std::time(nullptr);
  std::tm result{};
#ifdef _WIN32
  localtime_s(&result, &now);
#else
  localtime_r(&now, &result);
#endif
  return result;
}

} // anonymous namespace

void Document::buildLines() {
  mLines.clear();

  // prolog
  mLines.push_back("{\\rtf1\\ansi\\deff0");
  mLines.push_back("\\deflang" + std::to_string(mTemplate->defaultLanguage()) + "\\adeflang" +
                   std::to_string(mTemplate->asianLanguage()) + "\n");

  mLines.push_back(mTemplate->renderFontTable());
  mLines.push_back(mTemplate->renderColorTable());
  mLines.push_back(mTemplate->renderStyleSheet());

  mLines.push_back("{\\*\\generator libsrtf_" LIBSRTF_VERSION "}\n");

  // info
  mLines.push_back("{\\info\n");
  mLines.push_back("{\\title " + encodeText(mOptions.title) + "}\n");
  mLines.push_back("{\\author " + encodeText(mOptions.author) + "}\n");
  std::tm created = mOptions.creation_time ? *mOptions.creation_time : local_time_now();
  char stamp[64];
  std::strftime(stamp, sizeof(stamp), "{\\creatim\\yr%Y\\mo%m\\dy%d\\hr%H\\min%M}\n", &created);
  mLines.push_back(stamp);
  mLines.push_back("}\n");

  // page information
  mLines.push_back("\\paperh" + std::to_string(mLayout.paper_height) + "\\paperw" +
                   std::to_string(mLayout.paper_width) + "\\margl" +
                   std::to_string(mLayout.margin_left) + "\\margr" +
                   std::to_string(mLayout.margin_right) + "\\margt" +
                   std::to_string(mLayout.margin_top) + "\\margb" +
                   std::to_string(mLayout.margin_bottom) + "\n");

  mLines.push_back(mFootnotes.render() + "\n");

  mLines.insert(mLines.end(), mBody.begin(), mBody.end());

  mLines.push_back("\\par }");
}

void Document::serialize(std::ostream &out) {
  closeParagraph();

  log("Creating RTF...");
  buildLines();
  for (const auto &line : mLines) {
    out << line;
  }
  out.flush();
  if (!out) {
    throw std::runtime_error("Failed to write RTF output for \"" + mOptions.title + "\"");
  }
  log("Done.");
}

std::string Document::toString() {
  std::ostringstream out;
  serialize(out);
  return out.str();
}

std::string Document::create(const std::string &filename, const std::string &folder) {
  if (!filename.empty()) {
    mOptions.filename = filename;
  }

  std::filesystem::path path(this->filename() + ".rtf");
  if (!folder.empty()) {
    path = std::filesystem::path(folder) / path;
  }

  log("Exporting \"" + mOptions.title + "\" as \"" + path.string() + "\"...");

  std::ofstream out(path, std::ios::binary);
  if (!out) {
    throw std::runtime_error("Failed to open output file: " + path.string());
  }
  serialize(out);
  return path.string();
}

} // namespace libsrtf
