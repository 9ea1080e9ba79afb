// =================================================================
// include/Fcc/InteractiveSelector.hpp
// =================================================================
// Header for the console file and folder picker.

#pragma once

#include "Fcc/IgnorePattern.hpp"
#include "Fcc/SelectionSet.hpp"
#include <filesystem>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace Fcc {

class Logger;

/**
 * @brief Actions available at the selector prompt
 */
enum class SelectorAction {
    TOGGLE,      ///< Toggle the numbered entries
    OPEN,        ///< Enter the numbered directory
    UP,          ///< Go to the parent directory (not above the base)
    SELECT_ALL,  ///< Select every listed entry
    CLEAR,       ///< Clear the selection
    SHOW,        ///< Print the current selection
    LIST,        ///< Redisplay the listing
    DONE,        ///< Finish and process the selection
    HELP,        ///< Show help
    QUIT,        ///< Leave without processing
    UNKNOWN
};

struct SelectorCommand {
    SelectorAction action = SelectorAction::UNKNOWN;
    std::vector<size_t> indices;   ///< 1-based entry numbers
};

struct SelectorResult {
    std::vector<std::string> selection;  ///< Entries relative to the base, insertion order
    bool completed = false;              ///< False when the user quit
};

/**
 * @brief Line-oriented browser over the non-ignored entries of a tree
 *
 * Reads commands from an input stream and writes the listing to an
 * output stream, so sessions can be scripted.
 */
class InteractiveSelector {
public:
    /**
     * @param base_dir Root of the browsable tree
     * @param ignore Rules hiding entries from the listing
     * @param logger Injected logger
     * @param in Command source
     * @param out Listing destination
     */
    InteractiveSelector(const std::filesystem::path& base_dir, const IgnorePatternSet& ignore,
                        Logger& logger, std::istream& in = std::cin, std::ostream& out = std::cout);

    /**
     * @brief Run until "done", "quit" or end of input
     */
    SelectorResult run();

    /**
     * @brief Visible entries of a directory: directories first, then files, each by name
     */
    std::vector<std::filesystem::path> listEntries(const std::filesystem::path& dir) const;

    static SelectorCommand parseCommand(const std::string& input);

    const SelectionSet& selection() const { return m_selection; }

    void setPrompt(const std::string& prompt);

private:
    std::filesystem::path m_base_dir;
    std::filesystem::path m_current_dir;
    const IgnorePatternSet& m_ignore;
    Logger& m_logger;
    std::istream& m_in;
    std::ostream& m_out;
    std::string m_prompt;
    SelectionSet m_selection;
    std::vector<std::filesystem::path> m_entries;

    void refresh();
    void displayListing() const;
    void displayHelp() const;
    void displaySelection() const;
    void toggleEntries(const std::vector<size_t>& indices);
    void openEntry(const std::vector<size_t>& indices);
    void goUp();
    std::string relativeLabel(const std::filesystem::path& path) const;
};

} // namespace Fcc
