/**
 * @file Tokenizer.cpp
 * @brief Implementation of escape-aware path splitting
 */

#include "treepath/Tokenizer.hpp"
#include "treepath/Errors.hpp"

namespace treepath {

PathTokenizer::PathTokenizer(std::string_view path, char separator,
                             int max_split, char escape)
    : input_(path)
    , separator_(separator)
    , escape_(escape)
    , splits_left_(max_split)
{}

bool PathTokenizer::next(std::string& token) {
    if (finished_) {
        return false;
    }

    // Split budget used up: hand back the rest untouched
    if (splits_left_ == 0) {
        token.assign(input_.substr(pos_));
        pos_ = input_.size();
        finished_ = true;
        return true;
    }

    std::string buf;
    while (pos_ < input_.size()) {
        const char c = input_[pos_++];

        if (c == escape_) {
            if (pos_ >= input_.size()) {
                buf += c;
                continue;
            }
            const char next_char = input_[pos_++];
            if (next_char == separator_) {
                buf += next_char;
            } else {
                buf += c;
                buf += next_char;
            }
        } else if (c == separator_) {
            token = std::move(buf);
            if (splits_left_ > 0) {
                --splits_left_;
            }
            return true;
        } else {
            buf += c;
        }
    }

    token = std::move(buf);
    finished_ = true;
    return true;
}

std::vector<std::string> split_path(std::string_view path, char separator, int max_split) {
    std::vector<std::string> segments;
    PathTokenizer tokenizer(path, separator, max_split);
    std::string token;
    while (tokenizer.next(token)) {
        segments.push_back(token);
    }
    return segments;
}

std::pair<std::string, std::optional<std::string>> split_head(std::string_view path,
                                                              char separator) {
    PathTokenizer tokenizer(path, separator, 1);
    std::string head;
    tokenizer.next(head);

    std::string rest;
    if (tokenizer.next(rest) && !rest.empty()) {
        return {std::move(head), std::move(rest)};
    }
    return {std::move(head), std::nullopt};
}

std::pair<std::string, std::string> split_last(std::string_view path, char separator) {
    if (path.empty() || (path.size() == 1 && path[0] == separator)) {
        throw SyntaxError(std::string(path), "Path cannot be empty");
    }

    std::size_t last_sep = std::string_view::npos;
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (path[i] == kEscape) {
            ++i;
        } else if (path[i] == separator) {
            last_sep = i;
        }
    }

    if (last_sep == std::string_view::npos) {
        return {std::string(), std::string(path)};
    }
    return {std::string(path.substr(0, last_sep)), std::string(path.substr(last_sep + 1))};
}

std::string unescape(std::string_view token, char escape) {
    std::string out;
    out.reserve(token.size());
    for (std::size_t i = 0; i < token.size(); ++i) {
        if (token[i] == escape) {
            if (i + 1 < token.size()) {
                out += token[++i];
            }
        } else {
            out += token[i];
        }
    }
    return out;
}

std::string escape_key(std::string_view key, char separator) {
    static constexpr std::string_view kSpecial = "@*$#%{}[]()";

    std::string out;
    out.reserve(key.size() * 2);
    for (char c : key) {
        if (c == separator || c == kEscape || kSpecial.find(c) != std::string_view::npos) {
            out += kEscape;
        }
        out += c;
    }
    return out;
}

std::string join_path(const std::vector<std::string>& segments, char separator) {
    std::string out;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) out += separator;
        out += segments[i];
    }
    return out;
}

} // namespace treepath
