#include "ini_store.h"
#include "debug_utils.h"
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sys/stat.h>

namespace {
    inline std::string trim(const std::string& s) {
        size_t start = 0;
        while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
            ++start;
        }
        size_t end = s.size();
        while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
            --end;
        }
        return s.substr(start, end - start);
    }

    inline bool file_exists(const std::string& path) {
        struct stat st;
        return ::stat(path.c_str(), &st) == 0;
    }
}

IniFile::IniFile(const std::string& path)
    : m_path(path)
{}

bool IniFile::load() {
    m_sections.clear();
    std::ifstream in(m_path);
    if (!in.is_open()) {
        if (file_exists(m_path)) {
            PLOG("ini", "cannot open " << m_path);
            return false;
        }
        return true;
    }

    std::string line;
    std::string current_section;

    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line.front() == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string key   = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (!key.empty()) {
            m_sections[current_section].kv[key] = value;
        }
    }

    return true;
}

bool IniFile::save() const {
    std::ofstream out(m_path, std::ios::trunc);
    if (!out.is_open()) {
        PLOG("ini", "cannot write " << m_path);
        return false;
    }

    // Keys without a section go first so they are not captured by a header
    auto root = m_sections.find("");
    if (root != m_sections.end()) {
        for (const auto& kv : root->second.kv) {
            out << kv.first << " = " << kv.second << "\n";
        }
        out << "\n";
    }

    for (const auto& pair : m_sections) {
        if (pair.first.empty()) {
            continue;
        }
        out << "[" << pair.first << "]\n";
        for (const auto& kv : pair.second.kv) {
            out << kv.first << " = " << kv.second << "\n";
        }
        out << "\n";
    }

    return static_cast<bool>(out);
}

std::optional<std::string> IniFile::get(const std::string& section,
                                        const std::string& key) const {
    auto it = m_sections.find(section);
    if (it == m_sections.end()) {
        return std::nullopt;
    }
    auto it2 = it->second.kv.find(key);
    if (it2 == it->second.kv.end()) {
        return std::nullopt;
    }
    return it2->second;
}

std::string IniFile::get_or(const std::string& section,
                            const std::string& key,
                            const std::string& fallback) const {
    auto v = get(section, key);
    if (!v || v->empty()) {
        return fallback;
    }
    return *v;
}

long IniFile::get_int_or(const std::string& section,
                         const std::string& key,
                         long fallback) const {
    auto v = get(section, key);
    if (!v || v->empty()) {
        return fallback;
    }
    char* end = nullptr;
    long parsed = std::strtol(v->c_str(), &end, 10);
    if (end == v->c_str() || *end != '\0') {
        PLOG("ini", "[" << section << "] " << key << " is not a number: " << *v);
        return fallback;
    }
    return parsed;
}

void IniFile::set(const std::string& section,
                  const std::string& key,
                  const std::string& value) {
    m_sections[section].kv[key] = value;
}
