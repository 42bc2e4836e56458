#include "verses_types.h"

#include <climits>
#include <cstdint>
#include <string>
#include <string_view>

/* ── helpers ─────────────────────────────────────────────────────── */

static bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

static bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

/*
 * Find the first occurrence of key followed by n groups of
 * (whitespace, digits). Equivalent to `key(\s+(\d+)){n}`.
 */
static bool match_numbers(std::string_view s, std::string_view key,
                          int* out, int n) {
    size_t pos = 0;
    while ((pos = s.find(key, pos)) != std::string_view::npos) {
        size_t i = pos + key.size();
        int k = 0;
        for (; k < n; k++) {
            size_t ws = i;
            while (i < s.size() && is_space(s[i])) i++;
            if (i == ws) break;
            size_t ds = i;
            while (i < s.size() && is_digit(s[i])) i++;
            if (i == ds) break;
            out[k] = parse_int_lenient(s.substr(ds, i - ds));
        }
        if (k == n) return true;
        pos++;
    }
    return false;
}

/* ── numerals ────────────────────────────────────────────────────── */

int parse_int_lenient(std::string_view digits) {
    if (digits.empty()) return 0;
    long long v = 0;
    for (char c : digits) {
        if (!is_digit(c)) return 0;
        v = v * 10 + (c - '0');
        if (v > INT_MAX) return 0;
    }
    return static_cast<int>(v);
}

bool is_integer_literal(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s)
        if (!is_digit(c)) return false;
    return true;
}

/* non-ASCII White_Space code points (NEL, NBSP, ogham, en quad .. hair, ...) */
static bool is_unicode_space(uint32_t cp) {
    switch (cp) {
        case 0x0085: case 0x00A0: case 0x1680:
        case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
            return true;
        default:
            return cp >= 0x2000 && cp <= 0x200A;
    }
}

/* byte length of the whitespace character at s[i] (within [i, end)), 0 if none */
static size_t space_len(std::string_view s, size_t i, size_t end) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    if (c < 0x80)
        return (is_space(s[i]) || s[i] == '\v') ? 1 : 0;

    size_t   n;
    uint32_t cp;
    if ((c & 0xE0) == 0xC0)      { n = 2; cp = c & 0x1F; }
    else if ((c & 0xF0) == 0xE0) { n = 3; cp = c & 0x0F; }
    else return 0;
    if (i + n > end) return 0;

    for (size_t k = 1; k < n; k++) {
        unsigned char cc = static_cast<unsigned char>(s[i + k]);
        if ((cc & 0xC0) != 0x80) return 0;
        cp = (cp << 6) | (cc & 0x3F);
    }
    return is_unicode_space(cp) ? n : 0;
}

/* Unicode whitespace on both ends; OCR output pads with NBSP and wide spaces */
std::string trim_space(std::string_view s) {
    size_t b = 0, e = s.size();
    while (b < e) {
        size_t n = space_len(s, b, e);
        if (n == 0) break;
        b += n;
    }
    while (e > b) {
        size_t n = 0;
        for (size_t k = 1; k <= 3 && k <= e - b; k++) {
            if (space_len(s, e - k, e) == k) { n = k; break; }
        }
        if (n == 0) break;
        e -= n;
    }
    return std::string(s.substr(b, e - b));
}

/* ── title annotations ───────────────────────────────────────────── */

bool parse_bbox(std::string_view title, BBox& out) {
    int v[4];
    if (!match_numbers(title, "bbox", v, 4)) return false;
    out.x0 = v[0];
    out.y0 = v[1];
    out.x1 = v[2];
    out.y1 = v[3];
    return true;
}

bool parse_page_number(std::string_view title, int& out) {
    int v;
    if (!match_numbers(title, "ppageno", &v, 1)) return false;
    out = v;
    return true;
}

bool page_in_window(std::string_view title, int page_min, int page_max) {
    int pp;
    if (!parse_page_number(title, pp)) return true;
    if (page_min > 0 && pp < page_min) return false;
    if (page_max > 0 && pp > page_max) return false;
    return true;
}

/* ── cutoffs ─────────────────────────────────────────────────────── */

int footnote_cutoff(const BBox& page, double frac) {
    return page.y0 + static_cast<int>(static_cast<double>(page.height()) * frac);
}

int left_cutoff(const BBox& page, double frac) {
    return page.x0 + static_cast<int>(static_cast<double>(page.width()) * frac);
}
