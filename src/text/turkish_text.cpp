/**
 * @file turkish_text.cpp
 * @brief Implementation of UTF-8 and Turkish text helpers
 */

#include <sgkdoc/text/turkish_text.hpp>

#include <cstdint>

namespace sgkdoc::text {

namespace {

constexpr wchar_t replacement_char = 0xFFFD;

constexpr wchar_t c_cedilla_upper = 0x00C7;   // Ç
constexpr wchar_t c_cedilla_lower = 0x00E7;   // ç
constexpr wchar_t g_breve_upper = 0x011E;     // Ğ
constexpr wchar_t g_breve_lower = 0x011F;     // ğ
constexpr wchar_t i_dotted_upper = 0x0130;    // İ
constexpr wchar_t i_dotless_lower = 0x0131;   // ı
constexpr wchar_t o_umlaut_upper = 0x00D6;    // Ö
constexpr wchar_t o_umlaut_lower = 0x00F6;    // ö
constexpr wchar_t s_cedilla_upper = 0x015E;   // Ş
constexpr wchar_t s_cedilla_lower = 0x015F;   // ş
constexpr wchar_t u_umlaut_upper = 0x00DC;    // Ü
constexpr wchar_t u_umlaut_lower = 0x00FC;    // ü
constexpr wchar_t a_circ_upper = 0x00C2;      // Â
constexpr wchar_t a_circ_lower = 0x00E2;      // â
constexpr wchar_t i_circ_upper = 0x00CE;      // Î
constexpr wchar_t i_circ_lower = 0x00EE;      // î
constexpr wchar_t u_circ_upper = 0x00DB;      // Û
constexpr wchar_t u_circ_lower = 0x00FB;      // û

auto fold_char(wchar_t c) noexcept -> wchar_t {
    switch (c) {
        case c_cedilla_lower: return L'c';
        case c_cedilla_upper: return L'C';
        case g_breve_lower: return L'g';
        case g_breve_upper: return L'G';
        case i_dotless_lower: return L'i';
        case i_dotted_upper: return L'I';
        case o_umlaut_lower: return L'o';
        case o_umlaut_upper: return L'O';
        case s_cedilla_lower: return L's';
        case s_cedilla_upper: return L'S';
        case u_umlaut_lower: return L'u';
        case u_umlaut_upper: return L'U';
        case a_circ_lower: return L'a';
        case a_circ_upper: return L'A';
        case i_circ_lower: return L'i';
        case i_circ_upper: return L'I';
        case u_circ_lower: return L'u';
        case u_circ_upper: return L'U';
        default: return c;
    }
}

auto is_space(char c) noexcept -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

auto is_ascii_alnum(char c) noexcept -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

}  // namespace

auto to_wide(std::string_view utf8) -> std::wstring {
    std::wstring out;
    out.reserve(utf8.size());

    std::size_t i = 0;
    while (i < utf8.size()) {
        auto lead = static_cast<std::uint8_t>(utf8[i]);
        std::uint32_t cp = 0;
        std::size_t extra = 0;

        if (lead < 0x80) {
            cp = lead;
        } else if ((lead & 0xE0) == 0xC0) {
            cp = lead & 0x1F;
            extra = 1;
        } else if ((lead & 0xF0) == 0xE0) {
            cp = lead & 0x0F;
            extra = 2;
        } else if ((lead & 0xF8) == 0xF0) {
            cp = lead & 0x07;
            extra = 3;
        } else {
            out.push_back(replacement_char);
            ++i;
            continue;
        }

        bool valid = true;
        for (std::size_t k = 1; k <= extra; ++k) {
            if (i + k >= utf8.size()) {
                valid = false;
                break;
            }
            auto cont = static_cast<std::uint8_t>(utf8[i + k]);
            if ((cont & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (cont & 0x3F);
        }

        if (!valid) {
            out.push_back(replacement_char);
            ++i;
            continue;
        }

        out.push_back(static_cast<wchar_t>(cp));
        i += extra + 1;
    }
    return out;
}

auto to_utf8(std::wstring_view wide) -> std::string {
    std::string out;
    out.reserve(wide.size());
    for (wchar_t wc : wide) {
        auto cp = static_cast<std::uint32_t>(wc);
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }
    return out;
}

auto is_turkish_letter(wchar_t c) noexcept -> bool {
    if ((c >= L'a' && c <= L'z') || (c >= L'A' && c <= L'Z')) {
        return true;
    }
    return fold_char(c) != c;
}

auto to_lower_tr(wchar_t c) noexcept -> wchar_t {
    if (c == L'I') return i_dotless_lower;
    if (c == i_dotted_upper) return L'i';
    if (c >= L'A' && c <= L'Z') return static_cast<wchar_t>(c + 32);
    switch (c) {
        case g_breve_upper: return g_breve_lower;
        case s_cedilla_upper: return s_cedilla_lower;
        default: break;
    }
    // Latin-1 upper-case block, excluding the multiplication sign
    if (c >= 0x00C0 && c <= 0x00DE && c != 0x00D7) return static_cast<wchar_t>(c + 0x20);
    return c;
}

auto to_upper_tr(wchar_t c) noexcept -> wchar_t {
    if (c == L'i') return i_dotted_upper;
    if (c == i_dotless_lower) return L'I';
    if (c >= L'a' && c <= L'z') return static_cast<wchar_t>(c - 32);
    switch (c) {
        case g_breve_lower: return g_breve_upper;
        case s_cedilla_lower: return s_cedilla_upper;
        default: break;
    }
    if (c >= 0x00E0 && c <= 0x00FE && c != 0x00F7) return static_cast<wchar_t>(c - 0x20);
    return c;
}

auto to_lower_tr(std::string_view utf8) -> std::string {
    auto wide = to_wide(utf8);
    for (auto& c : wide) {
        c = to_lower_tr(c);
    }
    return to_utf8(wide);
}

auto to_upper_tr(std::string_view utf8) -> std::string {
    auto wide = to_wide(utf8);
    for (auto& c : wide) {
        c = to_upper_tr(c);
    }
    return to_utf8(wide);
}

auto fold_diacritics(std::string_view utf8) -> std::string {
    auto wide = to_wide(utf8);
    for (auto& c : wide) {
        c = fold_char(c);
    }
    return to_utf8(wide);
}

auto fold_upper(std::string_view utf8) -> std::string {
    auto wide = to_wide(utf8);
    for (auto& c : wide) {
        c = fold_char(to_upper_tr(c));
    }
    return to_utf8(wide);
}

auto normalize_for_matching(std::string_view utf8) -> std::string {
    auto wide = to_wide(utf8);

    std::string out;
    out.reserve(wide.size());
    bool pending_space = false;

    for (wchar_t c : wide) {
        wchar_t folded = fold_char(to_lower_tr(c));
        switch (folded) {
            case L'0': folded = L'o'; break;
            case L'1': folded = L'i'; break;
            case L'5': folded = L's'; break;
            case L'8': folded = L'b'; break;
            case L'6': folded = L'g'; break;
            default: break;
        }

        bool keep = (folded >= L'a' && folded <= L'z') || (folded >= L'0' && folded <= L'9');
        if (keep) {
            if (pending_space && !out.empty()) {
                out.push_back(' ');
            }
            pending_space = false;
            out.push_back(static_cast<char>(folded));
        } else if (folded == L' ' || folded == L'\t' || folded == L'\n' || folded == L'\r') {
            pending_space = true;
        }
        // Other characters are dropped without splitting the word
    }
    return out;
}

auto to_proper_case(std::string_view utf8) -> std::string {
    auto wide = to_wide(utf8);
    bool word_start = true;
    for (auto& c : wide) {
        if (c == L' ' || c == L'\t' || c == L'\n' || c == L'-') {
            word_start = true;
            continue;
        }
        c = word_start ? to_upper_tr(c) : to_lower_tr(c);
        word_start = false;
    }
    return to_utf8(wide);
}

auto split_words(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> words;
    std::size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && is_space(text[i])) ++i;
        std::size_t start = i;
        while (i < text.size() && !is_space(text[i])) ++i;
        if (i > start) {
            words.emplace_back(text.substr(start, i - start));
        }
    }
    return words;
}

auto char_length(std::string_view utf8) -> std::size_t {
    std::size_t count = 0;
    for (char c : utf8) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

auto trim(std::string_view text) -> std::string {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && is_space(text[begin])) ++begin;
    while (end > begin && is_space(text[end - 1])) --end;
    return std::string(text.substr(begin, end - begin));
}

auto contains_word(std::string_view text, std::string_view word) noexcept -> bool {
    if (word.empty()) {
        return false;
    }
    std::size_t pos = text.find(word);
    while (pos != std::string_view::npos) {
        bool left_ok = pos == 0 || !is_ascii_alnum(text[pos - 1]);
        std::size_t after = pos + word.size();
        bool right_ok = after >= text.size() || !is_ascii_alnum(text[after]);
        if (left_ok && right_ok) {
            return true;
        }
        pos = text.find(word, pos + 1);
    }
    return false;
}

}  // namespace sgkdoc::text
