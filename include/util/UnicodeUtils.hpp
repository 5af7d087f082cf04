#pragma once

#include <memory>
#include <string>
#include <unicode/unistr.h>
#include <unicode/translit.h>
#include <unicode/normlzr.h>

namespace reelcast::util {

/// Normalize text for Unicode-aware case-insensitive matching
/// Transliterates diacritics to ASCII equivalents (Wohnzimmer-Fernseher, Salón → salon)
/// and converts to lowercase
inline std::string normalize_for_search(const std::string& text) {
    if (text.empty()) {
        return text;
    }

    icu::UnicodeString unicode_text = icu::UnicodeString::fromUTF8(text);

    // NFD splits accented letters, the mark filter drops the combining
    // characters, Latin-ASCII folds the rest
    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::Transliterator> trans(
        icu::Transliterator::createInstance(
            "NFD; [:Nonspacing Mark:] Remove; NFC; Latin-ASCII",
            UTRANS_FORWARD,
            status
        )
    );

    if (U_FAILURE(status) || !trans) {
        // Fallback: just lowercase without transliteration
        std::string result;
        unicode_text.toLower().toUTF8String(result);
        return result;
    }

    trans->transliterate(unicode_text);

    std::string result;
    unicode_text.toLower().toUTF8String(result);
    return result;
}

/// Case-insensitive string comparison using ICU
/// Returns: <0 if a < b, 0 if a == b, >0 if a > b (like strcmp)
inline int case_insensitive_compare(const std::string& a, const std::string& b) {
    icu::UnicodeString ua = icu::UnicodeString::fromUTF8(a);
    icu::UnicodeString ub = icu::UnicodeString::fromUTF8(b);

    ua.foldCase();
    ub.foldCase();

    return ua.compare(ub);
}

/// Device names match when they are equal after case folding, or equal
/// after diacritic folding ("Salon TV" picks "Salón TV")
inline bool names_match(const std::string& a, const std::string& b) {
    if (case_insensitive_compare(a, b) == 0) return true;
    return normalize_for_search(a) == normalize_for_search(b);
}

} // namespace reelcast::util
