#pragma once

#include <scribe/result.hpp>
#include <string>
#include <vector>

namespace scribe {

// Split a phrase on single spaces. Every word must be non-empty, so an empty
// phrase or a leading, trailing or doubled space is an InvalidArg error.
Result<std::vector<std::string>> split_words(const std::string& phrase);

// Uppercase the first character (ASCII), keep the rest. "" stays "".
std::string capitalize_first(const std::string& word);

// "device lost reason" -> "deviceLostReason"
// Unless preserve_word_casing is set the whole phrase is lowercased first,
// so "Device LOST" -> "deviceLost" but with preserving -> "DeviceLOST".
// Case changes are ASCII only: bytes of multi-byte UTF-8 characters pass
// through untouched, so "Été x" -> "ÉtéX".
Result<std::string> to_camel_case(const std::string& phrase,
                                  bool preserve_word_casing = false);

// "device lost reason" -> "DeviceLostReason"
Result<std::string> to_pascal_case(const std::string& phrase,
                                   bool preserve_word_casing = false);

} // namespace scribe
