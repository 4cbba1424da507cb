#include "pattern_list.hpp"
#include <util/string_utils.hpp>
#include <fmt/format.h>

Result<PatternList> PatternList::compile(const std::vector<std::string>& patterns) {
    PatternList list;

    for (const auto& raw : patterns) {
        std::string line = StringUtils::trim(raw);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        Rule rule;
        if (line[0] == '!') {
            rule.negation = true;
            line = line.substr(1);
        }
        rule.pattern = line;

        try {
            rule.re = std::regex(glob_to_regex(line));
        } catch (const std::regex_error& e) {
            return Result<PatternList>::Err(
                fmt::format("bad pattern '{}': {}", line, e.what()));
        }
        list.rules_.push_back(std::move(rule));
    }

    return Result<PatternList>::Ok(std::move(list));
}

bool PatternList::matches(const std::string& name) const {
    bool matched = false;

    // Process patterns in order (later patterns override earlier ones)
    for (const auto& rule : rules_) {
        if (std::regex_match(name, rule.re)) {
            matched = !rule.negation;
        }
    }

    return matched;
}

std::string PatternList::glob_to_regex(const std::string& glob) {
    std::string regex;
    bool escape = false;
    bool in_class = false;

    for (size_t i = 0; i < glob.length(); ++i) {
        char c = glob[i];

        if (escape) {
            if (std::string("\\^$.|?*+()[]{}").find(c) != std::string::npos) regex += '\\';
            regex += c;
            escape = false;
        } else if (c == '\\') {
            escape = true;
        } else if (in_class) {
            if (c == ']') in_class = false;
            if (c == '^') regex += '\\';
            regex += c;
        } else if (c == '*') {
            regex += "[^/]*";
        } else if (c == '?') {
            regex += "[^/]";
        } else if (c == '[') {
            in_class = true;
            regex += '[';
            if (i + 1 < glob.length() && glob[i + 1] == '!') {
                regex += '^';
                i++;
            }
        } else if (std::string("^$.|+(){}]").find(c) != std::string::npos) {
            regex += '\\';
            regex += c;
        } else {
            regex += c;
        }
    }

    if (escape) regex += "\\\\";

    return regex;
}
