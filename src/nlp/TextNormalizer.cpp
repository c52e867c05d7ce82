#include "nlp/TextNormalizer.hpp"
#include "nlp/Utf8.hpp"
#include <cctype>
#include <cstdint>
#include <cstring>

namespace intentcluster {
namespace nlp {

namespace {

bool isAsciiAlnum(unsigned char c) {
    return c < 0x80 && std::isalnum(c);
}

bool isVowel(char c) {
    return std::strchr("aeiouy", c) != nullptr;
}

bool endsWith(const std::string& s, const char* suffix) {
    size_t n = std::strlen(suffix);
    return s.size() >= n && s.compare(s.size() - n, n, suffix) == 0;
}

bool hasVowel(const std::string& s) {
    for (char c : s) {
        if (isVowel(c)) return true;
    }
    return false;
}

bool isPlainAsciiWord(const std::string& s) {
    for (unsigned char c : s) {
        if (c < 'a' || c > 'z') return false;
    }
    return true;
}

// Stem endings that lost a silent 'e' when -ing/-ed was attached
struct SilentEPattern {
    const char* ending;
    size_t minLength;
    bool consonantBefore;
};

const SilentEPattern kSilentE[] = {
    {"at", 5, true},   // updat -> update
    {"iz", 4, false},  // organiz -> organize
    {"yz", 4, false},  // analyz -> analyze
    {"v", 3, false},   // sav -> save
    {"c", 4, false},   // pric -> price
    {"ang", 5, false}, // chang -> change
    {"dg", 4, false},  // judg -> judge
    {"ur", 5, false},  // secur -> secure
    {"bl", 4, false},  // enabl -> enable
    {"pl", 4, false},
    {"tl", 4, false},
    {"dl", 4, false},  // handl -> handle
    {"gl", 4, false},
    {"dul", 6, false}, // schedul -> schedule
    {"os", 3, false},  // clos -> close
    {"fus", 4, false}, // refus -> refuse
    {"uir", 5, false}, // requir -> require
    {"pir", 5, false}, // expir -> expire
    {"rs", 5, false},  // revers -> reverse
    {"ut", 6, true},   // comput -> compute
    {"in", 5, true},   // combin -> combine
    {"ar", 4, true},   // shar -> share
    {"ag", 5, false},  // manag -> manage
    {"ot", 3, true},   // vot -> vote
    {"cod", 5, false}, // decod -> decode
    {"am", 3, true},   // nam -> name
    {"ak", 3, true},   // bak -> bake
    {"id", 5, true},   // provid -> provide
    {"ud", 5, true},   // includ -> include
    {"let", 5, false}, // delet -> delete
    {"yp", 3, false},  // typ -> type
    {"yl", 4, false},  // styl -> style
};

void splitClitics(const std::string& word, std::vector<std::string>& out) {
    if (word.size() > 3 && endsWith(word, "n't")) {
        out.push_back(word.substr(0, word.size() - 3));
        out.push_back("n't");
        return;
    }

    size_t apos = word.rfind('\'');
    if (apos != std::string::npos && apos > 0) {
        std::string clitic = word.substr(apos);
        if (clitic == "'s" || clitic == "'re" || clitic == "'ve" ||
            clitic == "'ll" || clitic == "'m" || clitic == "'d") {
            out.push_back(word.substr(0, apos));
            out.push_back(clitic);
            return;
        }
    }

    out.push_back(word);
}

// Non-ASCII code points that separate words: Unicode spaces, punctuation and symbols
bool isSeparatorCodePoint(uint32_t cp) {
    if (cp <= 0xBF) {
        // C1 controls, no-break space and Latin-1 punctuation; ª µ º are letters
        return cp != 0xAA && cp != 0xB5 && cp != 0xBA;
    }
    return cp == 0xD7 || cp == 0xF7 ||                 // × ÷
           (cp >= 0x2000 && cp <= 0x206F) ||           // spaces, dashes, quotes, bullets
           (cp >= 0x20A0 && cp <= 0x20CF) ||           // currency
           (cp >= 0x2190 && cp <= 0x2BFF) ||           // arrows, math, box drawing, dingbats
           (cp >= 0x3000 && cp <= 0x303F) ||           // CJK spaces and punctuation
           cp == 0xFEFF ||
           (cp >= 0xFF01 && cp <= 0xFF0F) || (cp >= 0xFF1A && cp <= 0xFF20) ||
           (cp >= 0xFF3B && cp <= 0xFF40) || (cp >= 0xFF5B && cp <= 0xFF65) ||
           (cp >= 0x1F000 && cp <= 0x1FAFF);           // emoji and pictographs
}

enum class CharClass {
    Word,        // ASCII letter or digit, or a non-ASCII letter
    Apostrophe,  // ' or U+2019
    Joiner,      // - . _
    Separator,
};

// Class of the code point at text[pos]; length receives its size in bytes.
// Malformed bytes are single-byte separators.
CharClass classify(const std::string& text, size_t pos, size_t& length) {
    if (pos >= text.size()) {
        length = 0;
        return CharClass::Separator;
    }

    uint32_t cp = 0;
    length = decodeUtf8(text, pos, cp);
    if (length == 0) {
        length = 1;
        return CharClass::Separator;
    }

    if (cp < 0x80) {
        unsigned char c = static_cast<unsigned char>(cp);
        if (std::isalnum(c)) return CharClass::Word;
        if (c == '\'') return CharClass::Apostrophe;
        if (c == '-' || c == '.' || c == '_') return CharClass::Joiner;
        return CharClass::Separator;
    }
    if (cp == 0x2019) return CharClass::Apostrophe;

    return isSeparatorCodePoint(cp) ? CharClass::Separator : CharClass::Word;
}

} // namespace

std::vector<TokenSequence> ITextNormalizer::normalizeAll(const std::vector<std::string>& texts) const {
    std::vector<TokenSequence> sequences;
    sequences.reserve(texts.size());
    for (const auto& text : texts) {
        sequences.push_back(normalize(text));
    }
    return sequences;
}

EnglishNormalizer::EnglishNormalizer(const LanguageModel& model)
    : model_(model) {}

std::vector<std::string> EnglishNormalizer::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;

    // current always starts with a word character, so no token is pure punctuation
    auto flush = [&]() {
        if (!current.empty()) {
            splitClitics(current, tokens);
            current.clear();
        }
    };

    size_t length = 0;
    for (size_t i = 0; i < text.size(); i += length) {
        const CharClass cls = classify(text, i, length);

        size_t nextLength = 0;
        const CharClass next = classify(text, i + length, nextLength);
        const bool asciiWordFollows = next == CharClass::Word && nextLength == 1;

        switch (cls) {
            case CharClass::Word:
                if (length == 1) {
                    current.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(text[i]))));
                } else {
                    // Non-ASCII letters pass through untouched
                    current.append(text, i, length);
                }
                break;
            case CharClass::Apostrophe:
                if (!current.empty() && asciiWordFollows &&
                    std::isalpha(static_cast<unsigned char>(text[i + length]))) {
                    current.push_back('\'');
                } else {
                    flush();
                }
                break;
            case CharClass::Joiner:
                // e-mail, 3.5, wi_fi
                if (!current.empty() && isAsciiAlnum(static_cast<unsigned char>(current.back())) &&
                    asciiWordFollows) {
                    current.push_back(text[i]);
                } else {
                    flush();
                }
                break;
            case CharClass::Separator:
                flush();
                break;
        }
    }
    flush();

    return tokens;
}

std::string EnglishNormalizer::restoreStem(const std::string& stem) {
    const size_t m = stem.size();

    // stopp -> stop, runn -> run; keep call, miss, buzz
    if (m >= 4 && stem[m - 1] == stem[m - 2] && !isVowel(stem[m - 1]) &&
        std::strchr("lsz", stem[m - 1]) == nullptr) {
        return stem.substr(0, m - 1);
    }

    for (const auto& pattern : kSilentE) {
        if (m < pattern.minLength || !endsWith(stem, pattern.ending)) continue;
        if (pattern.consonantBefore) {
            size_t before = m - std::strlen(pattern.ending);
            if (before == 0 || isVowel(stem[before - 1])) continue;
        }
        return stem + "e";
    }

    return stem;
}

std::string EnglishNormalizer::stripSuffixRules(const std::string& word) {
    const size_t n = word.size();
    if (n <= 3) return word;

    if (endsWith(word, "ies") && n > 4) {
        return word.substr(0, n - 3) + "y";
    }
    if (endsWith(word, "sses") || endsWith(word, "xes") || endsWith(word, "ches") ||
        endsWith(word, "shes") || endsWith(word, "zzes")) {
        return word.substr(0, n - 2);
    }
    if (endsWith(word, "s")) {
        if (endsWith(word, "ss") || endsWith(word, "us") || endsWith(word, "is")) {
            return word;
        }
        return word.substr(0, n - 1);
    }

    if (endsWith(word, "ing") && n > 5) {
        std::string stem = word.substr(0, n - 3);
        return hasVowel(stem) ? restoreStem(stem) : word;
    }

    if (endsWith(word, "ied") && n > 4) {
        return word.substr(0, n - 3) + "y";
    }
    if (endsWith(word, "eed")) {
        return word;
    }
    if (endsWith(word, "ed") && n > 4) {
        std::string stem = word.substr(0, n - 2);
        return hasVowel(stem) ? restoreStem(stem) : word;
    }

    return word;
}

std::string EnglishNormalizer::lemmatize(const std::string& token) const {
    if (token.empty()) return token;

    if (token.front() == '\'' || token == "n't") {
        std::string expanded = model_.expandContraction(token);
        return expanded.empty() ? token : expanded;
    }

    std::string irregular = model_.irregularLemma(token);
    if (!irregular.empty()) return irregular;

    // Numbers, codes and non-English words are kept verbatim
    if (!isPlainAsciiWord(token)) return token;

    return stripSuffixRules(token);
}

TokenSequence EnglishNormalizer::normalize(const std::string& text) const {
    TokenSequence lemmas;

    for (const auto& token : tokenize(text)) {
        if (model_.isStopWord(token)) continue;

        std::string lemma = lemmatize(token);
        if (lemma.empty() || model_.isStopWord(lemma)) continue;

        lemmas.push_back(std::move(lemma));
    }

    return lemmas;
}

} // namespace nlp
} // namespace intentcluster
