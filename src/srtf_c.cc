#include "srtf.h"
#include "srtf.hpp"

#include <cstring>
#include <memory>
#include <string>


thread_local std::string g_last_error;


static srtf_error_t set_error(srtf_error_t code, const std::string& msg) {
    g_last_error = msg;
    return code;
}


static void clear_error() {
    g_last_error.clear();
}


static srtf_error_t handle_exception(const std::exception& e) {
    g_last_error = e.what();
    if (dynamic_cast<const libsrtf::ParseError*>(&e)) {
        return SRTF_ERROR_PARSE_FAILED;
    }
    if (dynamic_cast<const libsrtf::ConfigError*>(&e)) {
        return SRTF_ERROR_CONFIG_FAILED;
    }
    return SRTF_ERROR_UNKNOWN;
}

static std::string or_empty(const char* value) {
    return value ? std::string(value) : std::string();
}

// ============================================================================
// INTERNAL STRUCTURES
// ============================================================================

struct srtf_document {
    std::unique_ptr<libsrtf::Document> document;
    srtf_warning_callback_t warning_callback = nullptr;
    void* user_data = nullptr;
};

static libsrtf::DocumentOptions make_options(srtf_document* handle, const char* title) {
    libsrtf::DocumentOptions opts;
    if (title) {
        opts.title = title;
    }
    opts.warning_callback = [handle](const std::string& category, const std::string& message) {
        if (handle->warning_callback) {
            handle->warning_callback(category.c_str(), message.c_str(), handle->user_data);
        }
    };
    return opts;
}

// ============================================================================
// ERROR HANDLING
// ============================================================================

extern "C" const char* srtf_get_last_error(void) {
    return g_last_error.empty() ? nullptr : g_last_error.c_str();
}

// ============================================================================
// DOCUMENT LIFECYCLE
// ============================================================================

extern "C" srtf_document_t* srtf_document_create(const char* title, srtf_error_t* error) {
    try {
        clear_error();
        auto handle = std::make_unique<srtf_document>();
        handle->document = std::make_unique<libsrtf::Document>(make_options(handle.get(), title));

        if (error) *error = SRTF_OK;
        return handle.release();
    } catch (const std::exception& e) {
        if (error) *error = handle_exception(e);
        return nullptr;
    }
}

extern "C" srtf_document_t* srtf_document_create_from_template(const char* title, const char* template_path,
                                                               srtf_error_t* error) {
    if (!template_path) {
        if (error) *error = set_error(SRTF_ERROR_NULL_POINTER, "template_path is null");
        return nullptr;
    }

    try {
        clear_error();
        auto document_template = libsrtf::loadTemplateFile(template_path);
        auto handle = std::make_unique<srtf_document>();
        handle->document = std::make_unique<libsrtf::Document>(document_template,
                                                               make_options(handle.get(), title));

        if (error) *error = SRTF_OK;
        return handle.release();
    } catch (const std::exception& e) {
        if (error) *error = handle_exception(e);
        return nullptr;
    }
}

extern "C" void srtf_document_free(srtf_document_t* document) {
    delete document;
}

// ============================================================================
// DOCUMENT PROPERTIES
// ============================================================================

extern "C" srtf_error_t srtf_document_set_warning_callback(srtf_document_t* document,
                                                           srtf_warning_callback_t callback, void* user_data) {
    if (!document || !document->document) {
        return set_error(SRTF_ERROR_INVALID_HANDLE, "Invalid document handle");
    }

    clear_error();
    document->warning_callback = callback;
    document->user_data = user_data;
    return SRTF_OK;
}

extern "C" srtf_error_t srtf_document_set_author(srtf_document_t* document, const char* author) {
    if (!document || !document->document) {
        return set_error(SRTF_ERROR_INVALID_HANDLE, "Invalid document handle");
    }
    if (!author) {
        return set_error(SRTF_ERROR_NULL_POINTER, "author is null");
    }

    clear_error();
    document->document->setAuthor(author);
    return SRTF_OK;
}

extern "C" srtf_error_t srtf_document_set_layout(srtf_document_t* document, const char* preset,
                                                 const srtf_layout_overrides_t* overrides) {
    if (!document || !document->document) {
        return set_error(SRTF_ERROR_INVALID_HANDLE, "Invalid document handle");
    }

    try {
        clear_error();
        libsrtf::LayoutOverrides opts;
        if (overrides) {
            opts.paper_height = or_empty(overrides->paper_height);
            opts.paper_width = or_empty(overrides->paper_width);
            opts.margin_top = or_empty(overrides->margin_top);
            opts.margin_bottom = or_empty(overrides->margin_bottom);
            opts.margin_left = or_empty(overrides->margin_left);
            opts.margin_right = or_empty(overrides->margin_right);
        }

        document->document->setLayout(or_empty(preset), opts);
        return SRTF_OK;
    } catch (const std::exception& e) {
        return handle_exception(e);
    }
}

extern "C" srtf_error_t srtf_document_get_layout(const srtf_document_t* document, srtf_layout_t* out_layout) {
    if (!document || !document->document) {
        return set_error(SRTF_ERROR_INVALID_HANDLE, "Invalid document handle");
    }
    if (!out_layout) {
        return set_error(SRTF_ERROR_NULL_POINTER, "out_layout is null");
    }

    clear_error();
    const libsrtf::PageLayout& layout = document->document->layout();
    out_layout->paper_height = layout.paper_height;
    out_layout->paper_width = layout.paper_width;
    out_layout->margin_top = layout.margin_top;
    out_layout->margin_bottom = layout.margin_bottom;
    out_layout->margin_left = layout.margin_left;
    out_layout->margin_right = layout.margin_right;
    return SRTF_OK;
}

extern "C" srtf_error_t srtf_document_set_footnote_options(srtf_document_t* document,
                                                           const srtf_footnote_options_t* options) {
    if (!document || !document->document) {
        return set_error(SRTF_ERROR_INVALID_HANDLE, "Invalid document handle");
    }
    if (!options) {
        return set_error(SRTF_ERROR_NULL_POINTER, "options is null");
    }

    static const libsrtf::FootnoteNumbering numberings[] = {
        libsrtf::FootnoteNumbering::Arabic,     libsrtf::FootnoteNumbering::LowerAlpha,
        libsrtf::FootnoteNumbering::UpperAlpha, libsrtf::FootnoteNumbering::LowerRoman,
        libsrtf::FootnoteNumbering::UpperRoman,
    };
    if (options->numbering < 0 || options->numbering > 4) {
        return set_error(SRTF_ERROR_CONFIG_FAILED,
                         "Invalid footnote numbering " + std::to_string(options->numbering));
    }

    clear_error();
    libsrtf::FootnoteOptions opts;
    opts.position = options->below_text ? libsrtf::FootnotePosition::BelowText
                                        : libsrtf::FootnotePosition::BottomOfPage;
    opts.restart_per_page = options->restart_per_page != 0;
    opts.restart_per_section = options->restart_per_section != 0;
    opts.numbering = numberings[options->numbering];
    document->document->setFootnoteOptions(opts);
    return SRTF_OK;
}

extern "C" srtf_error_t srtf_document_set_default_style(srtf_document_t* document, const char* style,
                                                        int is_footnote) {
    if (!document || !document->document) {
        return set_error(SRTF_ERROR_INVALID_HANDLE, "Invalid document handle");
    }
    if (!style) {
        return set_error(SRTF_ERROR_NULL_POINTER, "style is null");
    }

    try {
        clear_error();
        document->document->setDefaultStyle(
            style, is_footnote ? libsrtf::StyleKind::Footnote : libsrtf::StyleKind::Paragraph);
        return SRTF_OK;
    } catch (const std::exception& e) {
        return handle_exception(e);
    }
}

// ============================================================================
// AUTHORING
// ============================================================================

extern "C" srtf_error_t srtf_document_paragraph_open(srtf_document_t* document, const char* text,
                                                     const char* style) {
    if (!document || !document->document) {
        return set_error(SRTF_ERROR_INVALID_HANDLE, "Invalid document handle");
    }

    try {
        clear_error();
        document->document->openParagraph(or_empty(text), or_empty(style));
        return SRTF_OK;
    } catch (const std::exception& e) {
        return handle_exception(e);
    }
}

extern "C" srtf_error_t srtf_document_paragraph_close(srtf_document_t* document) {
    if (!document || !document->document) {
        return set_error(SRTF_ERROR_INVALID_HANDLE, "Invalid document handle");
    }

    try {
        clear_error();
        document->document->closeParagraph();
        return SRTF_OK;
    } catch (const std::exception& e) {
        return handle_exception(e);
    }
}

extern "C" srtf_error_t srtf_document_text(srtf_document_t* document, const char* text,
                                           srtf_text_format_t format) {
    if (!document || !document->document) {
        return set_error(SRTF_ERROR_INVALID_HANDLE, "Invalid document handle");
    }
    if (!text) {
        return set_error(SRTF_ERROR_NULL_POINTER, "Text is null");
    }

    libsrtf::TextFormat text_format;
    switch (format) {
        case SRTF_FORMAT_PLAIN: text_format = libsrtf::TextFormat::Plain; break;
        case SRTF_FORMAT_ITALIC: text_format = libsrtf::TextFormat::Italic; break;
        case SRTF_FORMAT_BOLD: text_format = libsrtf::TextFormat::Bold; break;
        case SRTF_FORMAT_BOLD_ITALIC: text_format = libsrtf::TextFormat::BoldItalic; break;
        case SRTF_FORMAT_SUBSCRIPT: text_format = libsrtf::TextFormat::Subscript; break;
        case SRTF_FORMAT_SUPERSCRIPT: text_format = libsrtf::TextFormat::Superscript; break;
        case SRTF_FORMAT_SMALL_CAPS: text_format = libsrtf::TextFormat::SmallCaps; break;
        default:
            return set_error(SRTF_ERROR_CONFIG_FAILED, "Invalid text format " + std::to_string(format));
    }

    try {
        clear_error();
        document->document->text(text, text_format);
        return SRTF_OK;
    } catch (const std::exception& e) {
        return handle_exception(e);
    }
}

extern "C" srtf_error_t srtf_document_footnote_open(srtf_document_t* document, const char* text,
                                                    const char* style, const char* anchor) {
    if (!document || !document->document) {
        return set_error(SRTF_ERROR_INVALID_HANDLE, "Invalid document handle");
    }

    try {
        clear_error();
        std::optional<std::string> mark;
        if (anchor) {
            mark = anchor;
        }
        document->document->openFootnote(or_empty(text), or_empty(style), mark);
        return SRTF_OK;
    } catch (const std::exception& e) {
        return handle_exception(e);
    }
}

extern "C" srtf_error_t srtf_document_footnote_close(srtf_document_t* document) {
    if (!document || !document->document) {
        return set_error(SRTF_ERROR_INVALID_HANDLE, "Invalid document handle");
    }

    try {
        clear_error();
        document->document->closeFootnote();
        return SRTF_OK;
    } catch (const std::exception& e) {
        return handle_exception(e);
    }
}

extern "C" srtf_error_t srtf_document_run_script(srtf_document_t* document, const char* script_path) {
    if (!document || !document->document) {
        return set_error(SRTF_ERROR_INVALID_HANDLE, "Invalid document handle");
    }
    if (!script_path) {
        return set_error(SRTF_ERROR_NULL_POINTER, "script_path is null");
    }

    try {
        clear_error();
        libsrtf::buildDocumentFromFile(script_path, *document->document);
        return SRTF_OK;
    } catch (const std::exception& e) {
        return handle_exception(e);
    }
}

// ============================================================================
// OUTPUT
// ============================================================================

extern "C" srtf_error_t srtf_document_write_file(srtf_document_t* document, const char* filename,
                                                 const char* folder) {
    if (!document || !document->document) {
        return set_error(SRTF_ERROR_INVALID_HANDLE, "Invalid document handle");
    }

    try {
        clear_error();
        document->document->create(or_empty(filename), or_empty(folder));
        return SRTF_OK;
    } catch (const libsrtf::Error& e) {
        return handle_exception(e);
    } catch (const std::exception& e) {
        return set_error(SRTF_ERROR_WRITE_FAILED, e.what());
    }
}

extern "C" size_t srtf_document_to_string(srtf_document_t* document, char* out_buffer, size_t buffer_size,
                                          srtf_error_t* error) {
    if (!document || !document->document) {
        if (error) *error = set_error(SRTF_ERROR_INVALID_HANDLE, "Invalid document handle");
        return 0;
    }

    try {
        clear_error();
        std::string result = document->document->toString();
        size_t needed = result.size() + 1; // +1 for null terminator

        if (out_buffer && buffer_size < needed) {
            if (error) *error = set_error(SRTF_ERROR_BUFFER_TOO_SMALL, "Output buffer too small");
            return needed;
        }
        if (out_buffer) {
            std::memcpy(out_buffer, result.c_str(), needed);
        }

        if (error) *error = SRTF_OK;
        return needed;
    } catch (const std::exception& e) {
        if (error) *error = handle_exception(e);
        return 0;
    }
}

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

extern "C" srtf_error_t srtf_parse_length(const char* literal, int32_t* out_twips) {
    if (!literal || !out_twips) {
        return set_error(SRTF_ERROR_NULL_POINTER, "Parameter is null");
    }

    try {
        clear_error();
        *out_twips = libsrtf::parseLength(literal);
        return SRTF_OK;
    } catch (const std::exception& e) {
        return handle_exception(e);
    }
}

extern "C" size_t srtf_encode_text(const char* text, char* out, size_t out_size) {
    if (!text) {
        set_error(SRTF_ERROR_NULL_POINTER, "text is null");
        return 0;
    }

    try {
        clear_error();
        std::string encoded = libsrtf::encodeText(text);
        size_t needed = encoded.size() + 1;

        if (out && out_size >= needed) {
            std::memcpy(out, encoded.c_str(), needed);
        }

        return needed;
    } catch (const std::exception& e) {
        handle_exception(e);
        return 0;
    }
}
