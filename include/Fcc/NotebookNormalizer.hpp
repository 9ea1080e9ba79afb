// =================================================================
// include/Fcc/NotebookNormalizer.hpp
// =================================================================
// Converts Jupyter notebooks into language-tagged content blocks.

#pragma once

#include "Fcc/FileRecord.hpp"
#include <string>
#include <vector>

namespace Fcc {

/**
 * @brief Flattens a notebook's cell list into ContentBlocks
 *
 * Markdown cells become "markdown" blocks; code, raw and unknown cells
 * are tagged with the notebook's kernel language. The result is used as
 * the file's content, so formatters need no notebook-specific handling.
 */
class NotebookNormalizer {
public:
    /// Tag used when the kernel language is missing or not recognized
    static const char* const GENERIC_LANGUAGE;

    /**
     * @brief Parse notebook JSON into blocks, in cell order
     * @param notebook_text Raw .ipynb file content
     * @return Blocks for every non-empty cell (empty for a notebook without content)
     * @throws MalformedNotebook when the text is not a notebook document
     */
    std::vector<ContentBlock> normalize(const std::string& notebook_text) const;

    /**
     * @brief Map a kernel language name onto a fence tag
     * @return Tag for known kernels, GENERIC_LANGUAGE otherwise
     */
    static std::string kernelTag(const std::string& kernel_language);

    static bool isNotebookPath(const std::string& path);
};

} // namespace Fcc
