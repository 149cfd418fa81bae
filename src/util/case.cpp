#include <scribe/case.hpp>
#include <algorithm>
#include <cctype>

namespace scribe {

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](char c) -> char {
                       return static_cast<char>(
                           std::tolower(static_cast<unsigned char>(c)));
                   });
    return s;
}

Result<std::vector<std::string>> split_words(const std::string& phrase) {
    if (phrase.empty()) {
        return ScribeError{ScribeError::InvalidArg,
            "cannot convert the case of an empty phrase",
            "pass at least one word"};
    }

    std::vector<std::string> words;
    size_t start = 0;
    while (true) {
        size_t pos = phrase.find(' ', start);
        std::string word = phrase.substr(
            start, pos == std::string::npos ? std::string::npos : pos - start);
        if (word.empty()) {
            return ScribeError{ScribeError::InvalidArg,
                "empty word at position " + std::to_string(words.size()) +
                " in phrase '" + phrase + "'",
                "words must be separated by exactly one space, "
                "with no leading or trailing space"};
        }
        words.push_back(std::move(word));
        if (pos == std::string::npos) break;
        start = pos + 1;
    }

    return Result<std::vector<std::string>>::ok(std::move(words));
}

std::string capitalize_first(const std::string& word) {
    if (word.empty()) return word;
    std::string out = word;
    out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    return out;
}

Result<std::string> to_camel_case(const std::string& phrase,
                                  bool preserve_word_casing) {
    return split_words(preserve_word_casing ? phrase : to_lower(phrase))
        .map([](std::vector<std::string>& words) {
            std::string out = words.front();
            for (size_t i = 1; i < words.size(); ++i) {
                out += capitalize_first(words[i]);
            }
            return out;
        });
}

Result<std::string> to_pascal_case(const std::string& phrase,
                                   bool preserve_word_casing) {
    return split_words(preserve_word_casing ? phrase : to_lower(phrase))
        .map([](std::vector<std::string>& words) {
            std::string out;
            for (const auto& w : words) {
                out += capitalize_first(w);
            }
            return out;
        });
}

} // namespace scribe
