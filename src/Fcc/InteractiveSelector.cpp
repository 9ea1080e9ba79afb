// =================================================================
// src/Fcc/InteractiveSelector.cpp
// =================================================================
// Implementation for the console file and folder picker.

#include "Fcc/InteractiveSelector.hpp"
#include "Fcc/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace Fcc {

namespace {

const std::unordered_map<std::string, SelectorAction>& keyBindings() {
    static const std::unordered_map<std::string, SelectorAction> bindings = {
        {"t", SelectorAction::TOGGLE},
        {"toggle", SelectorAction::TOGGLE},
        {"cd", SelectorAction::OPEN},
        {"o", SelectorAction::OPEN},
        {"open", SelectorAction::OPEN},
        {"..", SelectorAction::UP},
        {"u", SelectorAction::UP},
        {"up", SelectorAction::UP},
        {"a", SelectorAction::SELECT_ALL},
        {"all", SelectorAction::SELECT_ALL},
        {"c", SelectorAction::CLEAR},
        {"clear", SelectorAction::CLEAR},
        {"s", SelectorAction::SHOW},
        {"selected", SelectorAction::SHOW},
        {"l", SelectorAction::LIST},
        {"ls", SelectorAction::LIST},
        {"d", SelectorAction::DONE},
        {"done", SelectorAction::DONE},
        {"h", SelectorAction::HELP},
        {"help", SelectorAction::HELP},
        {"?", SelectorAction::HELP},
        {"q", SelectorAction::QUIT},
        {"quit", SelectorAction::QUIT}
    };
    return bindings;
}

bool parseIndex(const std::string& token, size_t& index) {
    if (token.empty() || !std::all_of(token.begin(), token.end(),
                                      [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return false;
    }
    try {
        index = static_cast<size_t>(std::stoul(token));
    } catch (const std::out_of_range&) {
        return false;
    }
    return index > 0;
}

} // namespace

InteractiveSelector::InteractiveSelector(const std::filesystem::path& base_dir, const IgnorePatternSet& ignore,
                                         Logger& logger, std::istream& in, std::ostream& out)
    : m_base_dir(std::filesystem::absolute(base_dir).lexically_normal()),
      m_ignore(ignore),
      m_logger(logger),
      m_in(in),
      m_out(out),
      m_prompt("fcc> ") {
    if (!m_base_dir.has_filename() && m_base_dir.has_parent_path() && m_base_dir != m_base_dir.root_path()) {
        m_base_dir = m_base_dir.parent_path();
    }
    m_current_dir = m_base_dir;
}

SelectorResult InteractiveSelector::run() {
    SelectorResult result;

    refresh();
    displayListing();

    std::string line;
    while (true) {
        m_out << m_prompt;
        m_out.flush();

        if (!std::getline(m_in, line)) {
            // End of input behaves like quit
            m_out << std::endl;
            break;
        }

        SelectorCommand command = parseCommand(line);
        switch (command.action) {
            case SelectorAction::TOGGLE:
                toggleEntries(command.indices);
                displayListing();
                break;
            case SelectorAction::OPEN:
                openEntry(command.indices);
                break;
            case SelectorAction::UP:
                goUp();
                break;
            case SelectorAction::SELECT_ALL:
                for (const auto& entry : m_entries) {
                    m_selection.add(entry);
                }
                displayListing();
                break;
            case SelectorAction::CLEAR:
                m_selection.clear();
                displayListing();
                break;
            case SelectorAction::SHOW:
                displaySelection();
                break;
            case SelectorAction::LIST:
                refresh();
                displayListing();
                break;
            case SelectorAction::HELP:
                displayHelp();
                break;
            case SelectorAction::DONE:
                if (m_selection.empty()) {
                    m_out << "Nothing selected. Toggle entries by number first, or 'q' to quit." << std::endl;
                    break;
                }
                result.selection = m_selection.entriesRelativeTo(m_base_dir);
                result.completed = true;
                m_logger.info("InteractiveSelector", "Selection completed",
                              std::to_string(result.selection.size()) + " entries");
                return result;
            case SelectorAction::QUIT:
                m_logger.info("InteractiveSelector", "Selection cancelled");
                return result;
            case SelectorAction::UNKNOWN:
                if (!line.empty()) {
                    m_out << "Unknown command '" << line << "'. Type 'h' for help." << std::endl;
                }
                break;
        }
    }

    return result;
}

std::vector<std::filesystem::path> InteractiveSelector::listEntries(const std::filesystem::path& dir) const {
    std::vector<std::filesystem::path> directories;
    std::vector<std::filesystem::path> files;

    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    std::filesystem::directory_iterator end;
    if (ec) {
        m_logger.warning("InteractiveSelector", "Cannot list directory", dir.string() + ": " + ec.message());
        return {};
    }

    for (; it != end; it.increment(ec)) {
        if (ec) {
            m_logger.warning("InteractiveSelector", "Directory listing interrupted", ec.message());
            break;
        }

        std::error_code status_ec;
        bool is_directory = it->is_directory(status_ec);
        std::string relative = it->path().lexically_relative(m_base_dir).generic_string();
        if (m_ignore.shouldIgnore(relative, is_directory)) {
            continue;
        }

        if (is_directory) {
            directories.push_back(it->path());
        } else {
            files.push_back(it->path());
        }
    }

    auto by_name = [](const std::filesystem::path& a, const std::filesystem::path& b) {
        return a.filename().string() < b.filename().string();
    };
    std::sort(directories.begin(), directories.end(), by_name);
    std::sort(files.begin(), files.end(), by_name);

    directories.insert(directories.end(), files.begin(), files.end());
    return directories;
}

SelectorCommand InteractiveSelector::parseCommand(const std::string& input) {
    SelectorCommand command;

    std::string lowered = input;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::istringstream stream(lowered);
    std::vector<std::string> tokens;
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    if (tokens.empty()) {
        return command;
    }

    // A bare list of numbers toggles those entries
    size_t index = 0;
    size_t first_argument = 1;
    auto binding = keyBindings().find(tokens[0]);
    if (binding != keyBindings().end()) {
        command.action = binding->second;
    } else if (parseIndex(tokens[0], index)) {
        command.action = SelectorAction::TOGGLE;
        first_argument = 0;
    } else {
        return command;
    }

    for (size_t i = first_argument; i < tokens.size(); ++i) {
        if (!parseIndex(tokens[i], index)) {
            command.action = SelectorAction::UNKNOWN;
            command.indices.clear();
            return command;
        }
        command.indices.push_back(index);
    }

    if ((command.action == SelectorAction::TOGGLE || command.action == SelectorAction::OPEN) &&
        command.indices.empty()) {
        command.action = SelectorAction::UNKNOWN;
    }

    return command;
}

void InteractiveSelector::setPrompt(const std::string& prompt) {
    m_prompt = prompt;
}

void InteractiveSelector::refresh() {
    m_entries = listEntries(m_current_dir);
}

void InteractiveSelector::displayListing() const {
    std::string location = relativeLabel(m_current_dir);
    m_out << "\n=== " << (location.empty() ? "." : location) << " ===" << std::endl;

    if (m_entries.empty()) {
        m_out << "  (no visible entries)" << std::endl;
    }

    for (size_t i = 0; i < m_entries.size(); ++i) {
        std::error_code ec;
        bool is_directory = std::filesystem::is_directory(m_entries[i], ec);
        m_out << (m_selection.contains(m_entries[i]) ? "[x] " : "[ ] ")
              << (i + 1) << ". " << m_entries[i].filename().string()
              << (is_directory ? "/" : "") << std::endl;
    }

    m_out << m_selection.size() << " selected. Type 'h' for help." << std::endl;
}

void InteractiveSelector::displayHelp() const {
    m_out << "\n=== FILE PICKER HELP ===" << std::endl;
    m_out << "  N [N...]     - Toggle the numbered entries" << std::endl;
    m_out << "  cd N / o N   - Open the numbered directory" << std::endl;
    m_out << "  .. / u       - Go to the parent directory" << std::endl;
    m_out << "  a/all        - Select every listed entry" << std::endl;
    m_out << "  c/clear      - Clear the selection" << std::endl;
    m_out << "  s/selected   - Show the current selection" << std::endl;
    m_out << "  l/ls         - Redisplay the listing" << std::endl;
    m_out << "  d/done       - Copy the selection and exit" << std::endl;
    m_out << "  q/quit       - Exit without copying" << std::endl;
    m_out << "  h/help/?     - Show this help" << std::endl;
}

void InteractiveSelector::displaySelection() const {
    if (m_selection.empty()) {
        m_out << "Nothing selected." << std::endl;
        return;
    }

    m_out << "Selected (" << m_selection.size() << "):" << std::endl;
    for (const auto& entry : m_selection.entriesRelativeTo(m_base_dir)) {
        m_out << "  " << entry << std::endl;
    }
}

void InteractiveSelector::toggleEntries(const std::vector<size_t>& indices) {
    for (size_t index : indices) {
        if (index == 0 || index > m_entries.size()) {
            m_out << "No entry " << index << "." << std::endl;
            continue;
        }
        const auto& entry = m_entries[index - 1];
        bool selected = m_selection.toggle(entry);
        m_logger.debug("InteractiveSelector", selected ? "Selected" : "Deselected", relativeLabel(entry));
    }
}

void InteractiveSelector::openEntry(const std::vector<size_t>& indices) {
    size_t index = indices.front();
    if (index == 0 || index > m_entries.size()) {
        m_out << "No entry " << index << "." << std::endl;
        return;
    }

    const auto& entry = m_entries[index - 1];
    std::error_code ec;
    if (!std::filesystem::is_directory(entry, ec)) {
        m_out << entry.filename().string() << " is not a directory." << std::endl;
        return;
    }

    m_current_dir = entry;
    refresh();
    displayListing();
}

void InteractiveSelector::goUp() {
    if (m_current_dir == m_base_dir) {
        m_out << "Already at the top of " << m_base_dir.string() << "." << std::endl;
        return;
    }

    m_current_dir = m_current_dir.parent_path();
    refresh();
    displayListing();
}

std::string InteractiveSelector::relativeLabel(const std::filesystem::path& path) const {
    std::string relative = path.lexically_relative(m_base_dir).generic_string();
    return relative == "." ? "" : relative;
}

} // namespace Fcc
