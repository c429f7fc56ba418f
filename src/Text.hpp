#pragma once
#include <cstddef>
#include <string>

// UTF-8 helpers. Decoding goes through sf::Utf8; a truncated sequence decodes to U+FFFD.
namespace Text {
    // Strip leading/trailing characters <= U+0020
    std::string trim(const std::string& s);

    // Lowercase ASCII, Latin-1, Latin Extended-A, Greek and basic Cyrillic;
    // everything else untouched
    std::string toLower(const std::string& s);

    // trim + the composition subset the UI relies on:
    //   fullwidth ASCII (U+FF01..U+FF5E) -> ASCII
    //   Latin letter + combining grave/acute/circumflex/tilde/diaeresis/ring/cedilla
    //   -> precomposed letter
    std::string normalize(const std::string& s);

    // Number of code points
    std::size_t length(const std::string& s);

    // Primary-strength collation key: case folded, Latin accents stripped,
    // Greek tonos and final sigma folded, combining marks dropped,
    // ligatures expanded (ae, oe, ij, ss, th).
    std::u32string primaryKey(const std::string& s);

    std::u32string decode(const std::string& s);
    std::string encode(const std::u32string& s);
}
