#pragma once

#include <string>
#include <vector>
#include <regex>
#include <core/types.hpp>

// Ordered list of filename globs. Later patterns override earlier ones, and a
// leading "!" turns a pattern into a re-include, as in .gitignore:
//
//   *.tmp
//   !keep.tmp
//
// Supported glob syntax: "*", "?", "[abc]", "[!abc]", and "\" to escape.
// Patterns are matched against the whole basename.
class PatternList {
public:
    PatternList() = default;

    // Compile a list of glob patterns. Fails on a malformed pattern.
    static Result<PatternList> compile(const std::vector<std::string>& patterns);

    // True if the last pattern matching name is not a negation.
    bool matches(const std::string& name) const;

    bool empty() const { return rules_.empty(); }
    size_t size() const { return rules_.size(); }

    static std::string glob_to_regex(const std::string& glob);

private:
    struct Rule {
        std::string pattern;
        std::regex re;
        bool negation = false;
    };
    std::vector<Rule> rules_;
};
