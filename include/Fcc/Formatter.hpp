// =================================================================
// include/Fcc/Formatter.hpp
// =================================================================
// Defines the output formatter interface and the built-in markdown
// and plain-text renderings of aggregated documents.

#pragma once

#include "Fcc/FileRecord.hpp"
#include <memory>
#include <string>
#include <vector>

namespace Fcc {

/**
 * @brief How documents map to rendered outputs
 */
enum class OutputMode {
    COMBINED,       ///< Everything in one output
    PER_SELECTION   ///< One output per document (top-level selection)
};

/**
 * @brief Presentation settings shared by all formatters
 */
struct FormatOptions {
    std::string project_name;        ///< Title in combined mode
    std::string project_description;
    bool include_metadata = true;
    bool include_line_numbers = false;
};

/**
 * @brief One finished artifact
 */
struct RenderedOutput {
    std::string name;   ///< File name including extension
    std::string text;
};

/**
 * @brief Abstract base for output formatters
 *
 * Rendering is deterministic: no timestamps or environment-dependent
 * values appear in the output.
 */
class Formatter {
public:
    virtual ~Formatter() = default;

    virtual std::string getName() const = 0;

    /**
     * @brief Extension including the leading dot
     */
    virtual std::string getExtension() const = 0;

    virtual std::string getDescription() const = 0;

    /**
     * @brief Render a single document
     * @param document Records to render, in order
     * @param title Heading for the output
     * @param options Presentation settings
     * @return Complete output text
     */
    virtual std::string render(const Document& document, const std::string& title,
                               const FormatOptions& options) const = 0;

    /**
     * @brief Render documents according to the output mode
     *
     * Combined mode merges every document into one output titled with the
     * project name. Per-selection mode renders each document on its own,
     * titled with its label, under a sanitized and de-duplicated name.
     */
    std::vector<RenderedOutput> format(const std::vector<Document>& documents, OutputMode mode,
                                       const FormatOptions& options) const;

    /**
     * @brief Turn a selection label into a file-name stem
     *
     * "/" becomes "_", "*" becomes "star", "." becomes "dot", anything else
     * outside [A-Za-z0-9_-] becomes "_". An empty label becomes "root".
     */
    static std::string sanitizeLabel(const std::string& label);

    /**
     * @brief Backtick fence longer than any backtick run in the content
     */
    static std::string fenceFor(const std::string& content);

    /**
     * @brief Inline code span whose delimiter outruns any backticks in the text
     */
    static std::string inlineCode(const std::string& text);

    static std::string addLineNumbers(const std::string& content);

    /**
     * @brief Human-readable size, e.g. "1.5 KB"
     */
    static std::string formatSize(size_t bytes);

    /**
     * @brief Look up a formatter by name
     * @return nullptr when the name is unknown
     */
    static std::unique_ptr<Formatter> create(const std::string& name);

    static std::vector<std::string> availableFormats();
};

/**
 * @brief Markdown with a title, optional metadata and fenced code blocks
 */
class MarkdownFormatter : public Formatter {
public:
    std::string getName() const override { return "markdown"; }
    std::string getExtension() const override { return ".md"; }
    std::string getDescription() const override { return "Markdown with fenced, language-tagged code blocks"; }

    std::string render(const Document& document, const std::string& title,
                       const FormatOptions& options) const override;

    static const char* const FILE_SEPARATOR;

private:
    std::string renderRecord(const FileRecord& record, const FormatOptions& options) const;
    std::string renderMetadata(const Document& document) const;
};

/**
 * @brief Plain text with a summary header and ruled file sections
 */
class TxtFormatter : public Formatter {
public:
    std::string getName() const override { return "txt"; }
    std::string getExtension() const override { return ".txt"; }
    std::string getDescription() const override { return "Plain text with ruled file sections"; }

    std::string render(const Document& document, const std::string& title,
                       const FormatOptions& options) const override;

    static constexpr size_t RULE_WIDTH = 50;
};

} // namespace Fcc
