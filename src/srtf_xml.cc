#include "srtf.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <initializer_list>

namespace libsrtf {

// ============================================================================
// ATTRIBUTE HELPERS
// ============================================================================

namespace {

constexpr unsigned int PARSE_FLAGS = pugi::parse_default | pugi::parse_ws_pcdata;

void check_attributes(const pugi::xml_node &node, std::initializer_list<const char *> allowed) {
  for (const auto &attr : node.attributes()) {
    bool known = std::any_of(allowed.begin(), allowed.end(), [&](const char *name) {
      return std::strcmp(attr.name(), name) == 0;
    });
    if (!known) {
      throw ConfigError("Unknown attribute '" + std::string(attr.name()) + "' on <" +
                        node.name() + ">");
    }
  }
}

std::string describe(const pugi::xml_attribute &attr) {
  return "attribute '" + std::string(attr.name()) + "' (\"" + attr.value() + "\")";
}

int parse_int(const pugi::xml_attribute &attr) {
  const std::string value = attr.value();
  size_t used = 0;
  int result = 0;
  try {
    result = std::stoi(value, &used);
  } catch (const std::logic_error &) {
    throw ConfigError("Invalid integer in " + describe(attr));
  }
  if (used != value.size()) {
    throw ConfigError("Invalid integer in " + describe(attr));
  }
  return result;
}

// Plain signed integers are twips; anything else goes through parseLength().
int parse_length(const pugi::xml_attribute &attr) {
  const std::string value = attr.value();
  const size_t start = (!value.empty() && value[0] == '-') ? 1 : 0;
  if (value.size() > start &&
      std::all_of(value.begin() + start, value.end(),
                  [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
    return parse_int(attr);
  }
  if (value.empty()) {
    throw ConfigError("Empty length in " + describe(attr));
  }
  return parseLength(value);
}

bool parse_bool(const pugi::xml_attribute &attr) {
  const std::string value = attr.value();
  if (value == "true" || value == "1") {
    return true;
  }
  if (value == "false" || value == "0") {
    return false;
  }
  throw ConfigError("Invalid boolean in " + describe(attr));
}

template <typename Enum>
Enum parse_enum(const pugi::xml_attribute &attr,
                std::initializer_list<std::pair<const char *, Enum>> values) {
  for (const auto &entry : values) {
    if (std::strcmp(attr.value(), entry.first) == 0) {
      return entry.second;
    }
  }
  throw ConfigError("Invalid value in " + describe(attr));
}

void expect_name(const pugi::xml_node &node, const char *name) {
  if (std::strcmp(node.name(), name) != 0) {
    throw ConfigError("Expected <" + std::string(name) + "> element, found <" + node.name() +
                      ">");
  }
}

// ============================================================================
// TEMPLATE ELEMENTS
// ============================================================================

Font read_font(const pugi::xml_node &node) {
  check_attributes(node, {"id", "name", "family", "pitch", "charset"});

  Font font;
  font.id = node.attribute("id").value();
  font.name = node.attribute("name") ? node.attribute("name").value() : node.child_value();
  if (font.name.empty()) {
    throw ConfigError("Font \"" + font.id + "\" has no name");
  }

  if (auto attr = node.attribute("family")) {
    font.family = parse_enum<FontFamily>(attr, {{"nil", FontFamily::Nil},
                                                {"roman", FontFamily::Roman},
                                                {"swiss", FontFamily::Swiss},
                                                {"modern", FontFamily::Modern},
                                                {"script", FontFamily::Script},
                                                {"decor", FontFamily::Decor},
                                                {"tech", FontFamily::Tech},
                                                {"bidi", FontFamily::Bidi}});
  }
  if (auto attr = node.attribute("pitch"))
    font.pitch = parse_int(attr);
  if (auto attr = node.attribute("charset"))
    font.charset = parse_int(attr);
  return font;
}

Color read_color(const pugi::xml_node &node) {
  check_attributes(node, {"index", "red", "green", "blue"});

  if (!node.attribute("index")) {
    throw ConfigError("<color> requires an index attribute");
  }
  Color color;
  color.index = parse_int(node.attribute("index"));
  if (auto attr = node.attribute("red"))
    color.red = parse_int(attr);
  if (auto attr = node.attribute("green"))
    color.green = parse_int(attr);
  if (auto attr = node.attribute("blue"))
    color.blue = parse_int(attr);
  return color;
}

Style read_style(const pugi::xml_node &node) {
  check_attributes(node, {"id", "name", "basedon", "next", "align", "font", "size",
                          "line-spacing", "space-before", "space-after", "keep-with-next",
                          "bold", "italic", "small-caps", "caps", "widow-control",
                          "hyphenation", "direction", "color", "first-line-indent",
                          "left-indent", "right-indent", "lang"});

  const std::string id = node.attribute("id").value();
  const std::string name = node.attribute("name") ? node.attribute("name").value() : id;

  StyleAttributes a;
  if (auto attr = node.attribute("align")) {
    if (std::strcmp(attr.value(), "none") == 0) {
      a.alignment.reset();
    } else {
      a.alignment = parse_enum<Alignment>(attr, {{"left", Alignment::Left},
                                                 {"center", Alignment::Center},
                                                 {"right", Alignment::Right},
                                                 {"justify", Alignment::Justified}});
    }
  }
  if (auto attr = node.attribute("font"))
    a.font = attr.value();
  if (auto attr = node.attribute("size"))
    a.font_size = parse_int(attr);
  if (auto attr = node.attribute("line-spacing"))
    a.line_spacing = parse_length(attr);
  if (auto attr = node.attribute("space-before"))
    a.space_before = parse_length(attr);
  if (auto attr = node.attribute("space-after"))
    a.space_after = parse_length(attr);
  if (auto attr = node.attribute("keep-with-next"))
    a.keep_with_next = parse_bool(attr);
  if (auto attr = node.attribute("bold"))
    a.bold = parse_bool(attr);
  if (auto attr = node.attribute("italic"))
    a.italic = parse_bool(attr);
  if (auto attr = node.attribute("small-caps"))
    a.small_caps = parse_bool(attr);
  if (auto attr = node.attribute("caps"))
    a.caps = parse_bool(attr);
  if (auto attr = node.attribute("widow-control")) {
    a.widow_control = parse_enum<WidowControl>(
        attr, {{"on", WidowControl::Enabled}, {"off", WidowControl::Disabled}});
  }
  if (auto attr = node.attribute("hyphenation"))
    a.hyphenation = parse_bool(attr);
  if (auto attr = node.attribute("direction")) {
    a.direction = parse_enum<TextDirection>(
        attr, {{"ltr", TextDirection::LeftToRight}, {"rtl", TextDirection::RightToLeft}});
  }
  if (auto attr = node.attribute("color"))
    a.color = parse_int(attr);
  if (auto attr = node.attribute("first-line-indent"))
    a.first_line_indent = parse_length(attr);
  if (auto attr = node.attribute("left-indent"))
    a.left_indent = parse_length(attr);
  if (auto attr = node.attribute("right-indent"))
    a.right_indent = parse_length(attr);
  if (auto attr = node.attribute("lang"))
    a.language = parse_int(attr);

  return Style(id, name, a, node.attribute("basedon").value(), node.attribute("next").value());
}

// ============================================================================
// SCRIPT ELEMENTS
// ============================================================================

bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

// Collapses every whitespace run into a single space.
std::string collapse_whitespace(const std::string &text) {
  std::string result;
  result.reserve(text.size());
  bool in_space = false;
  for (char c : text) {
    if (is_space(c)) {
      if (!in_space) {
        result += ' ';
      }
      in_space = true;
    } else {
      result += c;
      in_space = false;
    }
  }
  return result;
}

bool is_text(const pugi::xml_node &node) {
  return node.type() == pugi::node_pcdata || node.type() == pugi::node_cdata;
}

const char *inline_control_word(const pugi::xml_node &node) {
  static const std::pair<const char *, const char *> formats[] = {
      {"i", "i"},   {"b", "b"},       {"bi", "bi"},      {"sub", "sub"},
      {"sup", "super"}, {"scaps", "scaps"},
  };
  for (const auto &format : formats) {
    if (std::strcmp(node.name(), format.first) == 0) {
      return format.second;
    }
  }
  return nullptr;
}

std::string inline_text(const pugi::xml_node &node) {
  std::string text;
  for (const auto &child : node.children()) {
    if (is_text(child)) {
      text += child.value();
    } else if (child.type() == pugi::node_element) {
      throw ConfigError("Nested element <" + std::string(child.name()) + "> inside <" +
                        node.name() + "> is not supported");
    }
  }
  return collapse_whitespace(text);
}

void build_inline(const pugi::xml_node &parent, Document &document, bool allow_notes) {
  std::vector<pugi::xml_node> children;
  for (const auto &child : parent.children()) {
    if (is_text(child) || child.type() == pugi::node_element) {
      children.push_back(child);
    }
  }

  for (size_t i = 0; i < children.size(); ++i) {
    const pugi::xml_node &child = children[i];

    if (is_text(child)) {
      std::string text = collapse_whitespace(child.value());
      if (i == 0 && !text.empty() && text.front() == ' ') {
        text.erase(0, 1);
      }
      if (i + 1 == children.size() && !text.empty() && text.back() == ' ') {
        text.pop_back();
      }
      if (!text.empty()) {
        document.text(text);
      }
      continue;
    }

    if (const char *word = inline_control_word(child)) {
      check_attributes(child, {});
      document.text(inline_text(child), std::string(word));
    } else if (std::strcmp(child.name(), "span") == 0) {
      check_attributes(child, {"format"});
      document.text(inline_text(child), std::string(child.attribute("format").value()));
    } else if (allow_notes && std::strcmp(child.name(), "note") == 0) {
      check_attributes(child, {"style", "anchor"});
      std::optional<std::string> anchor;
      if (auto attr = child.attribute("anchor")) {
        anchor = attr.value();
      }
      document.openFootnote("", child.attribute("style").value(), anchor);
      build_inline(child, document, false);
      document.closeFootnote();
    } else {
      throw ConfigError("Unexpected element <" + std::string(child.name()) + "> inside <" +
                        parent.name() + ">");
    }
  }
}

void apply_layout(const pugi::xml_node &node, Document &document) {
  check_attributes(node, {"preset", "height", "width", "top", "bottom", "left", "right"});

  LayoutOverrides overrides;
  overrides.paper_height = node.attribute("height").value();
  overrides.paper_width = node.attribute("width").value();
  overrides.margin_top = node.attribute("top").value();
  overrides.margin_bottom = node.attribute("bottom").value();
  overrides.margin_left = node.attribute("left").value();
  overrides.margin_right = node.attribute("right").value();
  document.setLayout(node.attribute("preset").value(), overrides);
}

void apply_footnotes(const pugi::xml_node &node, Document &document) {
  check_attributes(node, {"position", "restart-per-page", "restart-per-section", "numbering"});

  FootnoteOptions options = document.footnoteOptions();
  if (auto attr = node.attribute("position")) {
    options.position = parse_enum<FootnotePosition>(
        attr, {{"below-text", FootnotePosition::BelowText},
               {"bottom", FootnotePosition::BottomOfPage},
               {"bottom-of-page", FootnotePosition::BottomOfPage}});
  }
  if (auto attr = node.attribute("restart-per-page"))
    options.restart_per_page = parse_bool(attr);
  if (auto attr = node.attribute("restart-per-section"))
    options.restart_per_section = parse_bool(attr);
  if (auto attr = node.attribute("numbering")) {
    options.numbering = parse_enum<FootnoteNumbering>(
        attr, {{"arabic", FootnoteNumbering::Arabic},
               {"lower-alpha", FootnoteNumbering::LowerAlpha},
               {"upper-alpha", FootnoteNumbering::UpperAlpha},
               {"lower-roman", FootnoteNumbering::LowerRoman},
               {"upper-roman", FootnoteNumbering::UpperRoman}});
  }
  document.setFootnoteOptions(options);
}

} // anonymous namespace

// ============================================================================
// TEMPLATES
// ============================================================================

void loadTemplate(const pugi::xml_node &node, DocumentTemplate &document_template) {
  expect_name(node, "template");
  check_attributes(node, {"deflang", "adeflang", "paragraph-style", "footnote-style"});

  if (auto attr = node.attribute("deflang"))
    document_template.setDefaultLanguage(parse_int(attr));
  if (auto attr = node.attribute("adeflang"))
    document_template.setAsianLanguage(parse_int(attr));

  for (const auto &child : node.children()) {
    if (child.type() != pugi::node_element) {
      continue;
    }
    if (std::strcmp(child.name(), "font") == 0) {
      document_template.addFont(read_font(child));
    } else if (std::strcmp(child.name(), "color") == 0) {
      document_template.addColor(read_color(child));
    } else if (std::strcmp(child.name(), "style") == 0) {
      document_template.addStyle(read_style(child));
    } else {
      throw ConfigError("Unexpected element <" + std::string(child.name()) + "> in <template>");
    }
  }

  // defaults are checked after all styles are known
  if (auto attr = node.attribute("paragraph-style")) {
    if (!document_template.findStyle(attr.value())) {
      throw ConfigError("Unknown paragraph style \"" + std::string(attr.value()) + "\"");
    }
    document_template.setParagraphStyle(attr.value());
  }
  if (auto attr = node.attribute("footnote-style")) {
    if (!document_template.findStyle(attr.value())) {
      throw ConfigError("Unknown footnote style \"" + std::string(attr.value()) + "\"");
    }
    document_template.setFootnoteStyle(attr.value());
  }
}

std::shared_ptr<DocumentTemplate> loadTemplateFile(const std::string &path) {
  pugi::xml_document doc;
  pugi::xml_parse_result result = doc.load_file(path.c_str());

  if (!result) {
    throw ConfigError("Failed to parse template file '" + path +
                      "': " + std::string(result.description()));
  }

  auto document_template = std::make_shared<DocumentTemplate>();
  loadTemplate(doc.document_element(), *document_template);
  return document_template;
}

std::shared_ptr<DocumentTemplate> loadTemplateString(const std::string &xml) {
  pugi::xml_document doc;
  pugi::xml_parse_result result = doc.load_string(xml.c_str());

  if (!result) {
    throw ConfigError("Failed to parse template string: " + std::string(result.description()));
  }

  auto document_template = std::make_shared<DocumentTemplate>();
  loadTemplate(doc.document_element(), *document_template);
  return document_template;
}

// ============================================================================
// SCRIPTS
// ============================================================================

void buildDocument(const pugi::xml_node &node, Document &document) {
  expect_name(node, "document");
  check_attributes(node, {"title", "author", "filename", "paragraph-style", "footnote-style"});

  if (auto attr = node.attribute("title"))
    document.setTitle(attr.value());
  if (auto attr = node.attribute("author"))
    document.setAuthor(attr.value());
  if (auto attr = node.attribute("filename"))
    document.setFilename(attr.value());
  if (auto attr = node.attribute("paragraph-style"))
    document.setDefaultStyle(attr.value(), StyleKind::Paragraph);
  if (auto attr = node.attribute("footnote-style"))
    document.setDefaultStyle(attr.value(), StyleKind::Footnote);

  for (const auto &child : node.children()) {
    if (is_text(child)) {
      const std::string text = collapse_whitespace(child.value());
      if (!text.empty() && text != " ") {
        throw ConfigError("Text outside of <p> in <document>");
      }
      continue;
    }
    if (child.type() != pugi::node_element) {
      continue;
    }

    if (std::strcmp(child.name(), "layout") == 0) {
      apply_layout(child, document);
    } else if (std::strcmp(child.name(), "footnotes") == 0) {
      apply_footnotes(child, document);
    } else if (std::strcmp(child.name(), "p") == 0) {
      check_attributes(child, {"style"});
      document.openParagraph("", child.attribute("style").value());
      build_inline(child, document, true);
      document.closeParagraph();
    } else {
      throw ConfigError("Unexpected element <" + std::string(child.name()) + "> in <document>");
    }
  }
}

void buildDocumentFromFile(const std::string &path, Document &document) {
  pugi::xml_document doc;
  pugi::xml_parse_result result = doc.load_file(path.c_str(), PARSE_FLAGS);

  if (!result) {
    throw ConfigError("Failed to parse script file '" + path +
                      "': " + std::string(result.description()));
  }

  buildDocument(doc.document_element(), document);
}

void buildDocumentFromString(const std::string &xml, Document &document) {
  pugi::xml_document doc;
  pugi::xml_parse_result result = doc.load_string(xml.c_str(), PARSE_FLAGS);

  if (!result) {
    throw ConfigError("Failed to parse script string: " + std::string(result.description()));
  }

  buildDocument(doc.document_element(), document);
}

} // namespace libsrtf
