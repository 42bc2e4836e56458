#include "verses_types.h"

#include <cstring>
#include <string>
#include <vector>

/* ── verse map ───────────────────────────────────────────────────── */

void VerseMap::append(int number, const std::string& text) {
    auto it = verses.find(number);
    if (it == verses.end()) {
        verses.emplace(number, Verse{number, text, 1});
        return;
    }
    /* same verse continued on a later page */
    Verse& v = it->second;
    v.text = trim_space(v.text + " " + text);
    v.fragments++;
}

const Verse* VerseMap::find(int number) const {
    auto it = verses.find(number);
    return it == verses.end() ? nullptr : &it->second;
}

int VerseMap::reopened() const {
    int n = 0;
    for (const auto& kv : verses)
        if (kv.second.fragments > 1) n++;
    return n;
}

/* ── punctuation spacing ─────────────────────────────────────────── */

static bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

/* drop whitespace runs directly before , . ; : ! ? */
std::string normalize_punct_spacing(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        if (!is_space(s[i])) {
            out += s[i++];
            continue;
        }
        size_t run = i;
        while (i < s.size() && is_space(s[i])) i++;
        if (i < s.size() && std::strchr(",.;:!?", s[i]) != nullptr)
            continue;
        out.append(s.substr(run, i - run));
    }
    return out;
}

/* ── stitcher ────────────────────────────────────────────────────── */

VerseStitcher::VerseStitcher(VerseMap& out, int left_cut)
    : out_(out), left_cut_(left_cut) {}

void VerseStitcher::feed(const Line& line) {
    if (line.words.empty()) return;

    const Word& first = line.words.front();
    if (first.x <= left_cut_ && is_integer_literal(first.text)) {
        flush();
        state_  = State::Open;
        number_ = parse_int_lenient(first.text);
        for (size_t i = 1; i < line.words.size(); i++)
            buf_.push_back(line.words[i].text);
        return;
    }

    /* orphan continuation with no verse open */
    if (state_ == State::Idle) return;

    for (const auto& w : line.words)
        buf_.push_back(w.text);
}

void VerseStitcher::flush() {
    if (state_ == State::Open && !buf_.empty()) {
        std::string joined;
        for (size_t i = 0; i < buf_.size(); i++) {
            if (i) joined += ' ';
            joined += buf_[i];
        }
        std::string text = trim_space(normalize_punct_spacing(joined));
        if (!text.empty())
            out_.append(number_, text);
    }
    state_  = State::Idle;
    number_ = 0;
    buf_.clear();
}

/* ── one page ────────────────────────────────────────────────────── */

bool stitch_page(const RawPage& page, const LineConfig& cfg, VerseMap& out) {
    BBox pb;
    if (!parse_bbox(page.title, pb)) return false;

    std::vector<Line> lines = build_lines(pb, page.lines, cfg);

    VerseStitcher stitcher(out, left_cutoff(pb, cfg.left_margin_frac));
    for (const auto& line : lines)
        stitcher.feed(line);
    stitcher.flush();
    return true;
}
