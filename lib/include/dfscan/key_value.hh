//
// Key/value extraction for ARG, ENV and LABEL arguments
//
// Accepted shapes:
//   ARG name                     -> {name, nullopt}
//   ARG name=default             -> {name, "default"}
//   ENV k1=v1 k2="v 2"           -> {k1, "v1"}, {k2, "v 2"}
//   ENV key the rest of the line -> {key, "the rest of the line"}   (legacy form)
//   LABEL same as ENV
//
// Words are split on whitespace outside quotes. Quotes are removed from keys
// and values after splitting; inside double quotes \" and \\ are escapes,
// outside quotes a backslash escapes the next character (e.g. "\ " keeps a
// space inside a word). Other backslash sequences are preserved verbatim.
//

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dfscan {

using key_value = std::pair<std::string, std::optional<std::string>>;

/// Split argument text into words, keeping quotes and escapes intact.
/// Throws key_value_error on an unterminated quote.
std::vector<std::string> split_words(const std::string& text);

/// Remove quoting from a word ("a b" -> a b, 'x' -> x, a\ b -> a b).
/// Throws key_value_error on an unterminated quote.
std::string unquote(const std::string& word);

/// ARG: one or more "name" / "name=default" words.
/// Throws key_value_error for no words or an empty name.
std::vector<key_value> parse_arg_arguments(const std::string& raw_args);

/// ENV and LABEL: "k=v ..." or legacy "key value...". Every value is present.
/// Throws key_value_error for no words, an empty key, a missing '=' after the
/// first pair, or a legacy key without value.
std::vector<key_value> parse_assignment_arguments(const std::string& raw_args);

} // namespace dfscan
