#include "verses_types.h"

#include <algorithm>
#include <set>
#include <string>
#include <vector>

/* ── pair spec ───────────────────────────────────────────────────── */

/* positive decimal that fits in an int */
static bool parse_verse_number(const std::string& s, int& out) {
    if (!is_integer_literal(s)) return false;
    long long v = 0;
    for (char c : s) {
        v = v * 10 + (c - '0');
        if (v > 0x7fffffff) return false;
    }
    if (v == 0) return false;
    out = static_cast<int>(v);
    return true;
}

bool parse_pairs(std::string_view spec, std::vector<CompositePair>& out,
                 std::string& error) {
    out.clear();
    std::string s = trim_space(spec);
    if (s.empty()) return true;

    std::set<int> seen;
    size_t start = 0;
    while (start <= s.size()) {
        size_t comma = s.find(',', start);
        if (comma == std::string::npos) comma = s.size();
        std::string chunk = trim_space(std::string_view(s).substr(start, comma - start));
        start = comma + 1;
        if (chunk.empty()) continue;

        size_t dash = chunk.find('-');
        if (dash == std::string::npos || chunk.find('-', dash + 1) != std::string::npos) {
            error = "bad pair \"" + chunk + "\" (want A-B)";
            out.clear();
            return false;
        }

        CompositePair p;
        if (!parse_verse_number(trim_space(std::string_view(chunk).substr(0, dash)), p.a) ||
            !parse_verse_number(trim_space(std::string_view(chunk).substr(dash + 1)), p.b)) {
            error = "bad pair \"" + chunk + "\": sides must be positive verse numbers";
            out.clear();
            return false;
        }
        if (!seen.insert(p.a).second || !seen.insert(p.b).second) {
            error = "bad pair \"" + chunk + "\": verse already used by another pair";
            out.clear();
            return false;
        }
        out.push_back(p);
    }
    return true;
}

/* ── assembly ────────────────────────────────────────────────────── */

struct PendingText {
    int              key;      /* lowest verse number, for ByVerse order */
    std::string      label;
    std::string      body;
    std::vector<int> members;
};

TextSet assemble_texts(const VerseMap& verses,
                       const std::vector<CompositePair>& pairs,
                       EntityOrder order) {
    std::vector<PendingText> pending;
    std::set<int> consumed;

    /* composites first; a pair with one side present still consumes both */
    for (const auto& p : pairs) {
        const Verse* va = verses.find(p.a);
        const Verse* vb = verses.find(p.b);
        if (!va && !vb) continue;

        std::string body;
        for (const Verse* v : {va, vb}) {
            if (!v || trim_space(v->text).empty()) continue;
            if (!body.empty()) body += ' ';
            body += v->text;
        }

        PendingText e;
        e.key     = std::min(p.a, p.b);
        e.label   = std::to_string(p.a) + "\xE2\x80\x93" + std::to_string(p.b);
        e.body    = trim_space(body);
        e.members = {p.a, p.b};
        pending.push_back(std::move(e));

        consumed.insert(p.a);
        consumed.insert(p.b);
    }

    /* remaining singles, ascending */
    for (const auto& kv : verses.verses) {
        if (consumed.count(kv.first)) continue;
        pending.push_back({kv.first, std::to_string(kv.first), kv.second.text, {kv.first}});
    }

    if (order == EntityOrder::ByVerse) {
        std::stable_sort(pending.begin(), pending.end(),
                         [](const PendingText& a, const PendingText& b) { return a.key < b.key; });
    }

    TextSet out;
    out.texts.reserve(pending.size());
    for (auto& e : pending) {
        uint32_t id = static_cast<uint32_t>(out.texts.size() + 1);
        out.texts.push_back({id, std::move(e.label), std::move(e.body)});
        for (int n : e.members)
            out.mappings.push_back({id, n});
    }
    return out;
}
