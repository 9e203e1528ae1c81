#include "trellis/inflector.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <regex>
#include <utility>
#include <vector>

namespace trellis::inflector {

namespace {

struct plural_rule {
    std::regex pattern;
    std::string replacement;
};

// Ordered most specific first; the first matching rule wins.
const std::vector<plural_rule>& plural_rules() {
    static const std::vector<plural_rule> rules = [] {
        const auto icase = std::regex::icase;
        std::vector<plural_rule> r;
        r.push_back({std::regex("(quiz)$", icase), "$1zes"});
        r.push_back({std::regex("^(oxen)$", icase), "$1"});
        r.push_back({std::regex("^(ox)$", icase), "$1en"});
        r.push_back({std::regex("^(m|l)ice$", icase), "$1ice"});
        r.push_back({std::regex("^(m|l)ouse$", icase), "$1ice"});
        r.push_back({std::regex("(matr|vert|ind)(ix|ex)$", icase), "$1ices"});
        r.push_back({std::regex("(x|ch|ss|sh)$", icase), "$1es"});
        r.push_back({std::regex("([^aeiouy]|qu)y$", icase), "$1ies"});
        r.push_back({std::regex("(hive)$", icase), "$1s"});
        r.push_back({std::regex("([^f])fe$", icase), "$1ves"});
        r.push_back({std::regex("([lr])f$", icase), "$1ves"});
        r.push_back({std::regex("sis$", icase), "ses"});
        r.push_back({std::regex("([ti])a$", icase), "$1a"});
        r.push_back({std::regex("([ti])um$", icase), "$1a"});
        r.push_back({std::regex("(buffal|tomat)o$", icase), "$1oes"});
        r.push_back({std::regex("(bu)s$", icase), "$1ses"});
        r.push_back({std::regex("(alias|status)$", icase), "$1es"});
        r.push_back({std::regex("(octop|vir)i$", icase), "$1i"});
        r.push_back({std::regex("(octop|vir)us$", icase), "$1i"});
        r.push_back({std::regex("^(ax|test)is$", icase), "$1es"});
        r.push_back({std::regex("s$", icase), "s"});
        r.push_back({std::regex("$", icase), "s"});
        return r;
    }();
    return rules;
}

const std::array<std::pair<const char*, const char*>, 7> irregulars = {{
    {"person", "people"},
    {"man", "men"},
    {"child", "children"},
    {"sex", "sexes"},
    {"move", "moves"},
    {"zombie", "zombies"},
    {"foot", "feet"},
}};

const std::array<const char*, 10> uncountables = {
    "equipment", "information", "rice", "money", "species",
    "series", "fish", "sheep", "jeans", "police",
};

std::string to_lower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

} // namespace

std::string underscore(const std::string& word) {
    std::string out;
    out.reserve(word.size() + 4);
    for (size_t i = 0; i < word.size(); ++i) {
        char c = word[i];
        if (c == '-' || c == ' ') {
            out += '_';
            continue;
        }
        if (std::isupper(static_cast<unsigned char>(c)) && i > 0) {
            char prev = word[i - 1];
            bool prev_lower_or_digit = std::islower(static_cast<unsigned char>(prev)) ||
                                       std::isdigit(static_cast<unsigned char>(prev));
            // "HTTPServer" -> "http_server": break before the last capital of a run
            bool acronym_end = std::isupper(static_cast<unsigned char>(prev)) &&
                               i + 1 < word.size() &&
                               std::islower(static_cast<unsigned char>(word[i + 1]));
            if ((prev_lower_or_digit || acronym_end) && out.back() != '_') {
                out += '_';
            }
        }
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::string pluralize(const std::string& word) {
    if (word.empty()) return word;

    auto split = word.find_last_of('_');
    std::string head = split == std::string::npos ? "" : word.substr(0, split + 1);
    std::string last = split == std::string::npos ? word : word.substr(split + 1);
    if (last.empty()) return word;

    std::string lower = to_lower(last);
    for (const char* u : uncountables) {
        if (lower == u) return word;
    }
    for (const auto& [singular, plural] : irregulars) {
        if (lower == singular) {
            std::string result = plural;
            if (std::isupper(static_cast<unsigned char>(last[0]))) {
                result[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(result[0])));
            }
            return head + result;
        }
        if (lower == plural) return word;
    }
    for (const auto& rule : plural_rules()) {
        if (std::regex_search(last, rule.pattern)) {
            return head + std::regex_replace(last, rule.pattern, rule.replacement,
                                             std::regex_constants::format_first_only);
        }
    }
    return word;
}

std::string tableize(const std::string& type_name) {
    return pluralize(underscore(type_name));
}

std::string foreign_key(const std::string& name) {
    return underscore(name) + "_id";
}

std::string join_table_name(const std::string& relationship, const std::string& inverse) {
    std::array<std::string, 2> names = {tableize(relationship), tableize(inverse)};
    std::sort(names.begin(), names.end());
    return names[0] + "_" + names[1];
}

} // namespace trellis::inflector
