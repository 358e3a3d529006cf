#include "shell/CommandUsage.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include <fmt/format.h>

namespace pawup::shell {

namespace {

std::string trimRight(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
    return s;
}

std::vector<std::string> wrap(const std::string& s, int width) {
    const int W = std::max(20, width);
    std::vector<std::string> out;
    std::size_t i = 0;
    const std::size_t n = s.size();
    while (i < n) {
        while (i < n && s[i] == ' ') ++i;
        if (i >= n) break;

        const std::size_t end = std::min<std::size_t>(i + W, n);
        std::size_t break_pos = end;

        // prefer last space before end
        if (end < n && s[end] != ' ') {
            const auto sp = s.rfind(' ', end);
            if (sp != std::string::npos && sp > i) break_pos = sp;
        }

        out.push_back(trimRight(s.substr(i, break_pos - i)));
        i = break_pos;
    }
    if (out.empty()) out.emplace_back("");
    return out;
}

std::string keyOf(const Entry& e) {
    if (e.aliases.empty()) return e.label;
    return fmt::format("{} | {}", e.label, fmt::join(e.aliases, " | "));
}

std::string padRight(const std::string& s, std::size_t width) {
    if (s.size() >= width) return s;
    return s + std::string(width - s.size(), ' ');
}

void emitTwoColSection(std::ostringstream& out, const std::string& title, const std::vector<Entry>& items,
                       const int width, const std::size_t maxKeyCol) {
    if (items.empty()) return;
    out << title << "\n";

    std::size_t keyw = 0;
    for (const auto& it : items) keyw = std::max(keyw, keyOf(it).size());
    keyw = std::min(keyw, maxKeyCol);

    constexpr std::size_t indent = 2, gap = 2;
    const int rightw = width - static_cast<int>(indent + keyw + gap);
    for (const auto& it : items) {
        const auto lines = wrap(it.desc, rightw);
        out << std::string(indent, ' ') << padRight(keyOf(it), keyw) << std::string(gap, ' ') << lines[0] << "\n";
        for (std::size_t i = 1; i < lines.size(); ++i)
            out << std::string(indent + keyw + gap, ' ') << lines[i] << "\n";
    }
    out << "\n";
}

std::string stripDashes(const std::string& s) {
    std::size_t i = 0;
    while (i < s.size() && s[i] == '-') ++i;
    return s.substr(i);
}

}

std::vector<std::string> CommandUsage::switches() const {
    std::vector<std::string> out;
    for (const auto& e : optional) {
        if (!e.label.starts_with('-') || e.label.find('<') != std::string::npos) continue;
        out.push_back(stripDashes(e.label));
        for (const auto& a : e.aliases) out.push_back(stripDashes(a));
    }
    return out;
}

std::string CommandUsage::synopsisStr() const {
    if (synopsis) return *synopsis;
    std::string s = "pawup " + command;
    for (const auto& p : positionals) s += " " + p.label;
    if (!optional.empty()) s += " [options]";
    return s;
}

std::string CommandUsage::toText() const {
    std::ostringstream out;
    out << "Usage: " << synopsisStr() << "\n\n";
    for (const auto& line : wrap(description, term_width)) out << line << "\n";
    out << "\n";

    if (!aliases.empty()) out << "Aliases: " << fmt::format("{}", fmt::join(aliases, ", ")) << "\n\n";

    emitTwoColSection(out, "Arguments:", positionals, term_width, max_key_col);
    emitTwoColSection(out, "Options:", optional, term_width, max_key_col);

    if (!examples.empty()) {
        out << "Examples:\n";
        for (const auto& ex : examples) {
            out << "  " << ex.cmd << "\n";
            if (!ex.note.empty()) out << "      " << ex.note << "\n";
        }
    }
    return trimRight(out.str()) + "\n";
}

std::string CommandUsage::summaryLine(const std::size_t nameWidth) const {
    return fmt::format("  {}  {}", padRight(command, nameWidth), description.substr(0, description.find('\n')));
}

const CommandUsage* CommandBook::find(const std::string& nameOrAlias) const {
    for (const auto& c : commands) {
        if (c.command == nameOrAlias) return &c;
        if (std::ranges::find(c.aliases, nameOrAlias) != c.aliases.end()) return &c;
    }
    return nullptr;
}

std::string CommandBook::toText() const {
    std::size_t w = 0;
    for (const auto& c : commands) w = std::max(w, c.command.size());

    std::ostringstream out;
    out << title << "\n\nUsage: pawup <command> [args...]\n\nCommands:\n";
    for (const auto& c : commands) out << c.summaryLine(w) << "\n";
    out << "\nRun 'pawup help <command>' for details on a command.\n";
    return out.str();
}

}
