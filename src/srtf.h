/**
 * @file srtf.h
 * @brief C language binding for libsrtf.
 *
 * This header provides a C API for building RTF documents. It's suitable for
 * use in C projects, C++ projects avoiding C++ exceptions, or language
 * bindings to other languages.
 *
 * @defgroup CBinding C Language Binding
 * @brief Complete C API for RTF document assembly.
 *
 * The C API provides:
 * - Opaque handle-based interface
 * - Error codes for all operations
 * - Thread-safe error reporting via thread-local storage
 * - Output to files or caller-provided buffers
 *
 * @section usage_overview Quick Start
 *
 * ### Build a document and write it to a file:
 * @code
 * srtf_error_t err = SRTF_OK;
 * srtf_document_t* doc = srtf_document_create("My Title", &err);
 * if (!doc) {
 *     fprintf(stderr, "Error: %s\n", srtf_get_last_error());
 *     return;
 * }
 *
 * srtf_document_set_layout(doc, "A4", NULL);
 * srtf_document_paragraph_open(doc, "Hello ", NULL);
 * srtf_document_text(doc, "World", SRTF_FORMAT_BOLD);
 * srtf_document_footnote_open(doc, "A footnote.", NULL, NULL);
 *
 * err = srtf_document_write_file(doc, "my_title", NULL);
 * if (err != SRTF_OK) {
 *     fprintf(stderr, "Error: %s\n", srtf_get_last_error());
 * }
 * srtf_document_free(doc);
 * @endcode
 *
 * ### Render into a buffer:
 * @code
 * size_t size = srtf_document_to_string(doc, NULL, 0, NULL);
 * char* rtf = malloc(size);
 * srtf_document_to_string(doc, rtf, size, NULL);
 * @endcode
 */

#ifndef LIBSRTF_C_API_H
#define LIBSRTF_C_API_H

/**
 *
 * THREAD SAFETY:
 * ==============
 * - Document handles are NOT thread-safe
 * - Each thread should create its own documents
 * - Error messages are stored in thread-local storage
 *
 * OUTPUT:
 * =======
 * Rendering (srtf_document_to_string, srtf_document_write_file) closes any
 * open paragraph and footnote. Further text starts a new paragraph.
 */

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @defgroup OpaqueTypes Opaque Types
 * @{
 */

/**
 * @typedef srtf_document_t
 * @brief Opaque handle to a document under construction.
 *
 * Created with srtf_document_create() or srtf_document_create_from_template().
 * Must be freed with srtf_document_free().
 */
typedef struct srtf_document srtf_document_t;

/** @} */

/**
 * @defgroup ErrorHandling Error Codes and Handling
 * @{
 */

/**
 * @enum srtf_error_t
 * @brief Error codes returned by libsrtf C functions.
 *
 * All functions that return srtf_error_t indicate success with SRTF_OK and
 * error conditions with negative values.
 */
typedef enum {
    SRTF_OK = 0,                          ///< Operation completed successfully
    SRTF_ERROR_NULL_POINTER = -1,         ///< NULL pointer passed as argument
    SRTF_ERROR_INVALID_HANDLE = -2,       ///< Invalid document handle
    SRTF_ERROR_PARSE_FAILED = -3,         ///< Malformed length literal
    SRTF_ERROR_CONFIG_FAILED = -4,        ///< Unknown preset, invalid template or script
    SRTF_ERROR_WRITE_FAILED = -5,         ///< Failed to write the output file
    SRTF_ERROR_BUFFER_TOO_SMALL = -6,     ///< Output buffer too small for result
    SRTF_ERROR_UNKNOWN = -100             ///< Unknown error (check srtf_get_last_error() for details)
} srtf_error_t;

/**
 * @brief Get the last error message.
 *
 * The message is stored in thread-local storage, so different threads
 * maintain separate error states.
 *
 * @return Pointer to error message string, or NULL if no error has occurred
 * @note The returned pointer is valid until the next libsrtf call on this thread
 */
const char* srtf_get_last_error(void);

/** @} */

/**
 * @defgroup DocumentOptions Document Options
 * @{
 */

/**
 * @typedef srtf_warning_callback_t
 * @brief Callback for non-fatal diagnostics such as style fallbacks.
 *
 * @param category Category of warning (e.g., "Style not found")
 * @param message Descriptive message about the warning
 * @param user_data Pointer given to srtf_document_set_warning_callback()
 */
typedef void (*srtf_warning_callback_t)(const char* category, const char* message, void* user_data);

/**
 * @enum srtf_text_format_t
 * @brief Inline formatting for srtf_document_text().
 */
typedef enum {
    SRTF_FORMAT_PLAIN = 0,
    SRTF_FORMAT_ITALIC,
    SRTF_FORMAT_BOLD,
    SRTF_FORMAT_BOLD_ITALIC,
    SRTF_FORMAT_SUBSCRIPT,
    SRTF_FORMAT_SUPERSCRIPT,
    SRTF_FORMAT_SMALL_CAPS
} srtf_text_format_t;

/**
 * @struct srtf_layout_t
 * @brief Paper size and margins in twips.
 */
typedef struct {
    int32_t paper_height;
    int32_t paper_width;
    int32_t margin_top;
    int32_t margin_bottom;
    int32_t margin_left;
    int32_t margin_right;
} srtf_layout_t;

/**
 * @struct srtf_layout_overrides_t
 * @brief Length literals ("720", "2.5cm", "15mm", "1in") overriding single
 *        layout fields. NULL or "" keeps the current value.
 */
typedef struct {
    const char* paper_height;
    const char* paper_width;
    const char* margin_top;
    const char* margin_bottom;
    const char* margin_left;
    const char* margin_right;
} srtf_layout_overrides_t;

/**
 * @struct srtf_footnote_options_t
 * @brief Document-wide footnote placement and numbering.
 */
typedef struct {
    int below_text;             ///< Non-zero: directly below the text (\ftntj)
    int restart_per_page;       ///< Non-zero: \ftnrstpg
    int restart_per_section;    ///< Non-zero: \ftnrestart
    /**
     * @brief 0 arabic, 1 lower alpha, 2 upper alpha, 3 lower roman,
     *        4 upper roman.
     */
    int numbering;
} srtf_footnote_options_t;

/** @} */

/**
 * @defgroup DocumentAPI Document API
 * @{
 */

/**
 * @brief Create a document using the built-in template.
 *
 * @param title Document title, also the default output file name (NULL for
 *              "Document Title")
 * @param error Optional pointer to receive error code
 * @return Document handle on success, NULL on failure
 * @note Must be freed with srtf_document_free()
 */
srtf_document_t* srtf_document_create(const char* title, srtf_error_t* error);

/**
 * @brief Create a document using an XML template file.
 *
 * @param title Document title (NULL for "Document Title")
 * @param template_path Path to a <template> XML file
 * @param error Optional pointer to receive error code
 * @return Document handle on success, NULL on failure
 */
srtf_document_t* srtf_document_create_from_template(const char* title, const char* template_path,
                                                    srtf_error_t* error);

/**
 * @brief Free document resources. The handle is invalid after this call.
 *
 * @param document Document handle (NULL is ignored)
 */
void srtf_document_free(srtf_document_t* document);

/**
 * @brief Install a warning callback. NULL removes it.
 */
srtf_error_t srtf_document_set_warning_callback(srtf_document_t* document,
                                                srtf_warning_callback_t callback, void* user_data);

srtf_error_t srtf_document_set_author(srtf_document_t* document, const char* author);

/**
 * @brief Set paper size and margins.
 *
 * @param document Document handle
 * @param preset "A4", "B5", "A5", "royal", "digest", "LAS", or NULL/"" to start
 *               from the current layout
 * @param overrides Optional per-field overrides (NULL for none)
 * @return SRTF_OK, SRTF_ERROR_PARSE_FAILED or SRTF_ERROR_CONFIG_FAILED. The
 *         layout is unchanged on failure.
 */
srtf_error_t srtf_document_set_layout(srtf_document_t* document, const char* preset,
                                      const srtf_layout_overrides_t* overrides);

/**
 * @brief Read the current layout.
 */
srtf_error_t srtf_document_get_layout(const srtf_document_t* document, srtf_layout_t* out_layout);

srtf_error_t srtf_document_set_footnote_options(srtf_document_t* document,
                                                const srtf_footnote_options_t* options);

/**
 * @brief Change the default paragraph (is_footnote == 0) or footnote style.
 */
srtf_error_t srtf_document_set_default_style(srtf_document_t* document, const char* style,
                                             int is_footnote);

/**
 * @brief Open a paragraph, closing the current one.
 *
 * @param document Document handle
 * @param text Initial text (NULL for none)
 * @param style Style id (NULL for the default paragraph style)
 */
srtf_error_t srtf_document_paragraph_open(srtf_document_t* document, const char* text,
                                          const char* style);

srtf_error_t srtf_document_paragraph_close(srtf_document_t* document);

/**
 * @brief Append UTF-8 text to the open paragraph or footnote.
 */
srtf_error_t srtf_document_text(srtf_document_t* document, const char* text,
                                srtf_text_format_t format);

/**
 * @brief Open a footnote at the current position.
 *
 * @param document Document handle
 * @param text Initial text (NULL for none)
 * @param style Style id (NULL for the default footnote style)
 * @param anchor Literal anchor mark (NULL for automatic numbering)
 */
srtf_error_t srtf_document_footnote_open(srtf_document_t* document, const char* text,
                                         const char* style, const char* anchor);

srtf_error_t srtf_document_footnote_close(srtf_document_t* document);

/**
 * @brief Replay an XML <document> script onto the document.
 */
srtf_error_t srtf_document_run_script(srtf_document_t* document, const char* script_path);

/**
 * @brief Write `<folder>/<filename>.rtf`.
 *
 * @param document Document handle
 * @param filename File name without extension (NULL for the title)
 * @param folder Directory (NULL for the working directory)
 * @return SRTF_OK on success, SRTF_ERROR_WRITE_FAILED if the file cannot be
 *         written
 */
srtf_error_t srtf_document_write_file(srtf_document_t* document, const char* filename,
                                      const char* folder);

/**
 * @brief Render the document as an RTF string.
 *
 * @param document Document handle
 * @param out_buffer Optional pointer to buffer where the RTF will be copied.
 *                   If NULL, only the size is returned
 * @param buffer_size Size of out_buffer in bytes
 * @param error Optional pointer to receive error code
 * @return Required size including null terminator. If out_buffer was provided
 *         and is too small, the data is not copied and error is set to
 *         SRTF_ERROR_BUFFER_TOO_SMALL.
 */
size_t srtf_document_to_string(srtf_document_t* document, char* out_buffer, size_t buffer_size,
                               srtf_error_t* error);

/** @} */

/**
 * @defgroup UtilityFunctions Utility Functions
 * @{
 */

/**
 * @brief Convert a length literal to twips.
 *
 * @param literal "720", "2.5cm", "15mm" or "1in"
 * @param out_twips Receives the length; -1 for an empty literal
 * @return SRTF_OK or SRTF_ERROR_PARSE_FAILED
 */
srtf_error_t srtf_parse_length(const char* literal, int32_t* out_twips);

/**
 * @brief Escape UTF-8 text for RTF.
 *
 * @return Required size including null terminator. If out was provided and
 *         is too small, the data is not copied.
 */
size_t srtf_encode_text(const char* text, char* out, size_t out_size);

/** @} */

#ifdef __cplusplus
}
#endif

#endif // LIBSRTF_C_API_H
