// =================================================================
// src/Fcc/Formatter.cpp
// =================================================================
// Implementation for the markdown and plain-text formatters.

#include "Fcc/Formatter.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <map>
#include <set>
#include <sstream>

namespace Fcc {

const char* const MarkdownFormatter::FILE_SEPARATOR = "\n\n---\n\n";

namespace {

struct DocumentTotals {
    size_t readable = 0;
    size_t skipped = 0;
    size_t size = 0;
    size_t lines = 0;
};

DocumentTotals computeTotals(const Document& document) {
    DocumentTotals totals;
    for (const auto& record : document.records) {
        if (record.hasContent()) {
            totals.readable++;
            totals.size += record.size;
            totals.lines += record.lineCount();
        } else {
            totals.skipped++;
        }
    }
    return totals;
}

std::string joinBlocks(const std::vector<std::string>& parts, const std::string& separator) {
    std::string joined;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            joined += separator;
        }
        joined += parts[i];
    }
    return joined;
}

} // namespace

std::vector<RenderedOutput> Formatter::format(const std::vector<Document>& documents, OutputMode mode,
                                              const FormatOptions& options) const {
    std::vector<RenderedOutput> outputs;

    if (mode == OutputMode::COMBINED) {
        Document combined;
        combined.label = "combined";
        for (const auto& document : documents) {
            combined.records.insert(combined.records.end(), document.records.begin(), document.records.end());
        }

        RenderedOutput output;
        output.name = "combined" + getExtension();
        output.text = render(combined, options.project_name, options);
        outputs.push_back(std::move(output));
        return outputs;
    }

    std::set<std::string> used_names;
    for (const auto& document : documents) {
        std::string stem = sanitizeLabel(document.label);
        std::string candidate = stem;
        for (int suffix = 2; used_names.count(candidate) > 0; ++suffix) {
            candidate = stem + "-" + std::to_string(suffix);
        }
        used_names.insert(candidate);

        RenderedOutput output;
        output.name = candidate + getExtension();
        output.text = render(document, document.label, options);
        outputs.push_back(std::move(output));
    }

    return outputs;
}

std::string Formatter::sanitizeLabel(const std::string& label) {
    std::string name;
    for (char c : label) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (c == '/' || c == '\\') {
            name += '_';
        } else if (c == '*') {
            name += "star";
        } else if (c == '.') {
            name += "dot";
        } else if (std::isalnum(uc) || c == '-' || c == '_') {
            name += c;
        } else {
            name += '_';
        }
    }
    return name.empty() ? "root" : name;
}

static size_t longestBacktickRun(const std::string& text) {
    size_t longest = 0;
    size_t run = 0;
    for (char c : text) {
        if (c == '`') {
            run++;
            longest = std::max(longest, run);
        } else {
            run = 0;
        }
    }
    return longest;
}

std::string Formatter::fenceFor(const std::string& content) {
    return std::string(std::max<size_t>(3, longestBacktickRun(content) + 1), '`');
}

std::string Formatter::inlineCode(const std::string& text) {
    std::string delimiter(longestBacktickRun(text) + 1, '`');
    // A backtick at either edge would merge with the delimiter
    bool pad = !text.empty() && (text.front() == '`' || text.back() == '`');
    std::string padding = pad ? " " : "";
    return delimiter + padding + text + padding + delimiter;
}

std::string Formatter::addLineNumbers(const std::string& content) {
    if (content.empty()) {
        return content;
    }

    std::vector<std::string> lines;
    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }

    const size_t width = std::to_string(lines.size()).size();
    std::ostringstream numbered;
    for (size_t i = 0; i < lines.size(); ++i) {
        numbered << std::setw(static_cast<int>(width)) << (i + 1) << ": " << lines[i];
        if (i + 1 < lines.size() || content.back() == '\n') {
            numbered << "\n";
        }
    }
    return numbered.str();
}

std::string Formatter::formatSize(size_t bytes) {
    static const char* const units[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    size_t unit = 0;
    while (size >= 1024.0 && unit < 4) {
        size /= 1024.0;
        unit++;
    }

    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << size << " " << units[unit];
    return out.str();
}

std::unique_ptr<Formatter> Formatter::create(const std::string& name) {
    if (name == "markdown" || name == "md") {
        return std::make_unique<MarkdownFormatter>();
    }
    if (name == "txt" || name == "text") {
        return std::make_unique<TxtFormatter>();
    }
    return nullptr;
}

std::vector<std::string> Formatter::availableFormats() {
    return {"markdown", "txt"};
}

// --- MarkdownFormatter ---

std::string MarkdownFormatter::render(const Document& document, const std::string& title,
                                      const FormatOptions& options) const {
    std::vector<std::string> sections;

    sections.push_back("# " + (title.empty() ? std::string("Project") : title));

    if (!options.project_description.empty()) {
        sections.push_back(options.project_description);
    }

    if (options.include_metadata) {
        sections.push_back(renderMetadata(document));
    }

    DocumentTotals totals = computeTotals(document);
    sections.push_back("## Files Processed: " + std::to_string(totals.readable));

    std::vector<std::string> file_sections;
    for (const auto& record : document.records) {
        file_sections.push_back(renderRecord(record, options));
    }
    if (!file_sections.empty()) {
        sections.push_back(joinBlocks(file_sections, FILE_SEPARATOR));
    }

    return joinBlocks(sections, "\n\n") + "\n";
}

std::string MarkdownFormatter::renderRecord(const FileRecord& record, const FormatOptions& options) const {
    std::string section = "**" + inlineCode(record.path) + "**\n\n";

    if (!record.hasContent()) {
        section += "> Skipped: " + record.reason;
        return section;
    }

    std::vector<std::string> fenced;
    for (const auto& block : record.blocks) {
        std::string content = options.include_line_numbers ? addLineNumbers(block.content) : block.content;
        std::string fence = fenceFor(content);

        std::string text = fence + block.language + "\n" + content;
        if (!content.empty() && content.back() != '\n') {
            text += "\n";
        }
        text += fence;
        fenced.push_back(text);
    }

    section += joinBlocks(fenced, "\n\n");
    return section;
}

std::string MarkdownFormatter::renderMetadata(const Document& document) const {
    DocumentTotals totals = computeTotals(document);

    std::ostringstream metadata;
    metadata << "## Project Information\n";
    metadata << "- **Total Files:** " << totals.readable << "\n";
    metadata << "- **Total Size:** " << formatSize(totals.size) << "\n";
    metadata << "- **Total Lines:** " << totals.lines;
    if (totals.skipped > 0) {
        metadata << "\n- **Skipped Files:** " << totals.skipped;
    }

    std::map<std::string, size_t> language_counts;
    for (const auto& record : document.records) {
        if (record.hasContent()) {
            language_counts[record.language.empty() ? "unknown" : record.language]++;
        }
    }

    if (!language_counts.empty()) {
        metadata << "\n- **Languages:**";
        for (const auto& entry : language_counts) {
            metadata << "\n  - " << entry.first << ": " << entry.second
                     << (entry.second == 1 ? " file" : " files");
        }
    }

    return metadata.str();
}

// --- TxtFormatter ---

std::string TxtFormatter::render(const Document& document, const std::string& title,
                                 const FormatOptions& options) const {
    const std::string rule(RULE_WIDTH, '=');
    DocumentTotals totals = computeTotals(document);

    std::string upper_title = title.empty() ? std::string("PROJECT") : title;
    std::transform(upper_title.begin(), upper_title.end(), upper_title.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    std::ostringstream out;
    out << "PROJECT: " << upper_title << "\n";
    if (!options.project_description.empty()) {
        out << "DESCRIPTION: " << options.project_description << "\n";
    }
    out << "FILES: " << totals.readable << "\n";
    out << "SIZE: " << formatSize(totals.size) << "\n";
    out << "LINES: " << totals.lines << "\n";

    for (const auto& record : document.records) {
        out << "\n";
        if (!record.hasContent()) {
            out << record.path << " (skipped: " << record.reason << ")\n";
            out << rule << "\n";
            continue;
        }

        out << record.path << " (" << (record.language.empty() ? "unknown" : record.language)
            << ", " << record.size << " bytes)\n";
        out << rule << "\n";

        const bool tag_blocks = record.blocks.size() > 1;
        for (size_t i = 0; i < record.blocks.size(); ++i) {
            const auto& block = record.blocks[i];
            if (i > 0) {
                out << "\n";
            }
            if (tag_blocks) {
                out << "[" << block.language << "]\n";
            }
            std::string content = options.include_line_numbers ? addLineNumbers(block.content) : block.content;
            out << content;
            if (!content.empty() && content.back() != '\n') {
                out << "\n";
            }
        }
        out << rule << "\n";
    }

    return out.str();
}

} // namespace Fcc
