#pragma once
#include <map>
#include <optional>
#include <string>

struct IniSection {
    std::map<std::string, std::string> kv;
};

// Small INI store: [section] headers, key = value lines, '#'/';' comments.
class IniFile {
public:
    explicit IniFile(const std::string& path);

    // A missing file loads as empty; false only when the file exists but
    // cannot be read.
    bool load();
    bool save() const;

    const std::string& path() const { return m_path; }

    std::optional<std::string> get(const std::string& section,
                                   const std::string& key) const;

    std::string get_or(const std::string& section,
                       const std::string& key,
                       const std::string& fallback) const;

    // Falls back when the key is missing or not a number
    long get_int_or(const std::string& section,
                    const std::string& key,
                    long fallback) const;

    void set(const std::string& section,
             const std::string& key,
             const std::string& value);

private:
    std::string m_path;
    std::map<std::string, IniSection> m_sections;
};
