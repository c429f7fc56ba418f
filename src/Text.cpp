#include "Text.hpp"
#include <SFML/System/Utf.hpp>
#include <iterator>

namespace {
    const sf::Uint32 kReplacement = 0xFFFD;

    // Base letters for U+00C0..U+00DF (and the lowercase block U+00E0..U+00FF).
    // 0 marks entries handled by hand: AE, multiplication/division sign, thorn, sharp s / y diaeresis.
    const char latin1Base[32] = {
        'a','a','a','a','a','a', 0 ,'c','e','e','e','e','i','i','i','i',
        'd','n','o','o','o','o','o', 0 ,'o','u','u','u','u','y', 0 , 0
    };

    // Base letters for U+0100..U+017F. '*' marks the IJ and OE ligatures.
    const char latinExtABase[] =
        "aaaaaa" "cccccccc" "dddd" "eeeeeeeeee" "gggggggg" "hhhh" "iiiiiiiiii" "**"
        "jj" "kkk" "llllllllll" "nnnnnnn" "nn" "oooooo" "**" "rrrrrr" "ssssssss"
        "tttttt" "uuuuuuuuuuuu" "ww" "yyy" "zzzzzz" "s";

    struct Composition {
        char32_t base;
        char32_t mark;
        char32_t composed;
    };

    const Composition compositions[] = {
        {U'A', 0x300, 0xC0}, {U'E', 0x300, 0xC8}, {U'I', 0x300, 0xCC}, {U'O', 0x300, 0xD2}, {U'U', 0x300, 0xD9},
        {U'a', 0x300, 0xE0}, {U'e', 0x300, 0xE8}, {U'i', 0x300, 0xEC}, {U'o', 0x300, 0xF2}, {U'u', 0x300, 0xF9},
        {U'A', 0x301, 0xC1}, {U'E', 0x301, 0xC9}, {U'I', 0x301, 0xCD}, {U'O', 0x301, 0xD3}, {U'U', 0x301, 0xDA},
        {U'Y', 0x301, 0xDD}, {U'a', 0x301, 0xE1}, {U'e', 0x301, 0xE9}, {U'i', 0x301, 0xED}, {U'o', 0x301, 0xF3},
        {U'u', 0x301, 0xFA}, {U'y', 0x301, 0xFD},
        {U'A', 0x302, 0xC2}, {U'E', 0x302, 0xCA}, {U'I', 0x302, 0xCE}, {U'O', 0x302, 0xD4}, {U'U', 0x302, 0xDB},
        {U'a', 0x302, 0xE2}, {U'e', 0x302, 0xEA}, {U'i', 0x302, 0xEE}, {U'o', 0x302, 0xF4}, {U'u', 0x302, 0xFB},
        {U'A', 0x303, 0xC3}, {U'N', 0x303, 0xD1}, {U'O', 0x303, 0xD5},
        {U'a', 0x303, 0xE3}, {U'n', 0x303, 0xF1}, {U'o', 0x303, 0xF5},
        {U'A', 0x308, 0xC4}, {U'E', 0x308, 0xCB}, {U'I', 0x308, 0xCF}, {U'O', 0x308, 0xD6}, {U'U', 0x308, 0xDC},
        {U'Y', 0x308, 0x178}, {U'a', 0x308, 0xE4}, {U'e', 0x308, 0xEB}, {U'i', 0x308, 0xEF}, {U'o', 0x308, 0xF6},
        {U'u', 0x308, 0xFC}, {U'y', 0x308, 0xFF},
        {U'A', 0x30A, 0xC5}, {U'a', 0x30A, 0xE5},
        {U'C', 0x327, 0xC7}, {U'c', 0x327, 0xE7},
    };

    bool isCombiningMark(char32_t cp) {
        return cp >= 0x300 && cp <= 0x36F;
    }

    char32_t lowerCodePoint(char32_t cp) {
        if (cp >= U'A' && cp <= U'Z') return cp + 32;
        if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) return cp + 0x20;
        if (cp == 0x130) return U'i';
        if (cp == 0x178) return 0xFF;
        if (cp >= 0x100 && cp <= 0x137) return (cp % 2 == 0) ? cp + 1 : cp;
        if (cp >= 0x139 && cp <= 0x148) return (cp % 2 == 1) ? cp + 1 : cp;
        if (cp >= 0x14A && cp <= 0x177) return (cp % 2 == 0) ? cp + 1 : cp;
        if (cp >= 0x179 && cp <= 0x17E) return (cp % 2 == 1) ? cp + 1 : cp;
        // Greek
        if (cp >= 0x391 && cp <= 0x3AB && cp != 0x3A2) return cp + 0x20;
        if (cp == 0x386) return 0x3AC;
        if (cp >= 0x388 && cp <= 0x38A) return cp + 0x25;
        if (cp == 0x38C) return 0x3CC;
        if (cp == 0x38E || cp == 0x38F) return cp + 0x3F;
        // Cyrillic
        if (cp >= 0x400 && cp <= 0x40F) return cp + 0x50;
        if (cp >= 0x410 && cp <= 0x42F) return cp + 0x20;
        return cp;
    }

    // Greek letters with tonos/dialytika, final sigma -> plain lowercase letter
    char32_t greekBase(char32_t cp) {
        switch (cp) {
            case 0x3AC: return 0x3B1;
            case 0x3AD: return 0x3B5;
            case 0x3AE: return 0x3B7;
            case 0x3AF: case 0x3CA: case 0x390: return 0x3B9;
            case 0x3CC: return 0x3BF;
            case 0x3CD: case 0x3CB: case 0x3B0: return 0x3C5;
            case 0x3CE: return 0x3C9;
            case 0x3C2: return 0x3C3;
            default: return cp;
        }
    }

    void appendPrimary(std::u32string& key, char32_t cp) {
        if (isCombiningMark(cp)) return;
        if (cp >= 0xC0 && cp <= 0xFF) {
            char base = latin1Base[(cp - 0xC0) & 0x1F];
            if (base != 0) { key.push_back(static_cast<char32_t>(base)); return; }
            switch (cp) {
                case 0xC6: case 0xE6: key += U"ae"; return;
                case 0xDE: case 0xFE: key += U"th"; return;
                case 0xDF: key += U"ss"; return;
                case 0xFF: key.push_back(U'y'); return;
                default: key.push_back(cp); return; // multiplication / division sign
            }
        }
        if (cp >= 0x100 && cp <= 0x17F) {
            char base = latinExtABase[cp - 0x100];
            if (base != '*') { key.push_back(static_cast<char32_t>(base)); return; }
            key += (cp == 0x132 || cp == 0x133) ? U"ij" : U"oe";
            return;
        }
        key.push_back(greekBase(lowerCodePoint(cp)));
    }

    char32_t compose(char32_t base, char32_t mark) {
        for (const auto& c : compositions) {
            if (c.base == base && c.mark == mark) return c.composed;
        }
        return 0;
    }
}

std::u32string Text::decode(const std::string& s) {
    std::u32string out;
    out.reserve(s.size());
    auto it = s.begin();
    while (it != s.end()) {
        sf::Uint32 cp = 0;
        it = sf::Utf8::decode(it, s.end(), cp, kReplacement);
        out.push_back(static_cast<char32_t>(cp));
    }
    return out;
}

std::string Text::encode(const std::u32string& s) {
    std::string out;
    out.reserve(s.size());
    for (char32_t cp : s) sf::Utf8::encode(static_cast<sf::Uint32>(cp), std::back_inserter(out));
    return out;
}

std::string Text::trim(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && (unsigned char)s[b] <= 0x20) ++b;
    while (e > b && (unsigned char)s[e - 1] <= 0x20) --e;
    return s.substr(b, e - b);
}

std::string Text::toLower(const std::string& s) {
    std::u32string cps = decode(s);
    for (auto& cp : cps) cp = lowerCodePoint(cp);
    return encode(cps);
}

std::string Text::normalize(const std::string& s) {
    std::u32string in = decode(trim(s));
    std::u32string out;
    out.reserve(in.size());
    for (char32_t cp : in) {
        if (cp >= 0xFF01 && cp <= 0xFF5E) cp -= 0xFEE0;
        else if (cp == 0x3000) cp = U' ';

        if (isCombiningMark(cp) && !out.empty()) {
            char32_t composed = compose(out.back(), cp);
            if (composed != 0) { out.back() = composed; continue; }
        }
        out.push_back(cp);
    }
    return encode(out);
}

std::size_t Text::length(const std::string& s) {
    return sf::Utf8::count(s.begin(), s.end());
}

std::u32string Text::primaryKey(const std::string& s) {
    std::u32string key;
    key.reserve(s.size());
    for (char32_t cp : decode(s)) appendPrimary(key, cp);
    return key;
}
