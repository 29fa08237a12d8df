#ifndef MCPROXY_UTF8_SANITIZE_HPP
#define MCPROXY_UTF8_SANITIZE_HPP

#include <string>

namespace utf8_sanitize {

// Replaces every byte that does not start a well-formed UTF-8 sequence with
// U+FFFD. Overlong encodings, surrogates and code points above U+10FFFF count
// as malformed. In-place version.
void sanitize(std::string &text);

// Prepares one line read from a child's stdout for JSON parsing: drops a
// trailing '\r' and sanitizes the rest.
std::string clean_line(const std::string &raw_line);

} // namespace utf8_sanitize

#endif // MCPROXY_UTF8_SANITIZE_HPP
