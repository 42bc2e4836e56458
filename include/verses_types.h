#ifndef VERSES_TYPES_H
#define VERSES_TYPES_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

/* ── Geometry (hOCR pixel space, top-down) ─────────────────────── */

struct BBox {
    int x0 = 0, y0 = 0, x1 = 0, y1 = 0;

    int width() const  { return x1 - x0; }
    int height() const { return y1 - y0; }
};

bool parse_bbox(std::string_view title, BBox& out);
bool parse_page_number(std::string_view title, int& out);

int  parse_int_lenient(std::string_view digits);
bool is_integer_literal(std::string_view s);
std::string trim_space(std::string_view s);

/* y at or below which a line is treated as footnote area */
int footnote_cutoff(const BBox& page, double frac);
/* x at or left of which a leading number marks a verse start */
int left_cutoff(const BBox& page, double frac);

/* ── Raw markup view ───────────────────────────────────────────── */
/*
 * What the markup parser hands the line builder: annotation strings and
 * text only, no DOM handles.
 */

struct RawWord {
    std::string title;
    std::string text;
};

struct RawLine {
    std::string title;
    std::vector<RawWord> words;
};

struct RawPage {
    std::string title;
    std::vector<RawLine> lines;
};

/* ── Cleaned lines ─────────────────────────────────────────────── */

struct Word {
    int         x;
    std::string text;
};

struct Line {
    BBox              box;
    std::vector<Word> words;
};

struct LineConfig {
    double footnote_frac    = 0.82;
    double left_margin_frac = 0.20;
    int    superscript_px   = 5;
};

std::vector<Line> build_lines(const BBox& page_box,
                              const std::vector<RawLine>& raw,
                              const LineConfig& cfg);

/* ── Verse accumulation ────────────────────────────────────────── */

struct Verse {
    int         number;
    std::string text;
    int         fragments;   /* flushes that contributed to text */
};

struct VerseMap {
    std::map<int, Verse> verses;

    void append(int number, const std::string& text);
    const Verse* find(int number) const;
    size_t size() const { return verses.size(); }
    int reopened() const;
};

std::string normalize_punct_spacing(std::string_view s);

/*
 * Idle / Open(n) state machine over the cleaned lines of one page.
 * Flushes into the VerseMap supplied by the caller.
 */
class VerseStitcher {
public:
    enum class State { Idle, Open };

    VerseStitcher(VerseMap& out, int left_cut);

    void feed(const Line& line);
    void flush();

    State state() const { return state_; }
    int   open_number() const { return number_; }

private:
    VerseMap&                out_;
    int                      left_cut_;
    State                    state_  = State::Idle;
    int                      number_ = 0;
    std::vector<std::string> buf_;
};

/* ── Text entities ─────────────────────────────────────────────── */

struct CompositePair {
    int a, b;
};

enum class EntityOrder {
    CompositesFirst,
    ByVerse,
};

struct TextEntity {
    uint32_t    id;
    std::string label;
    std::string body;
};

struct VerseMapping {
    uint32_t text_id;
    int      verse_number;
};

struct TextSet {
    std::vector<TextEntity>   texts;
    std::vector<VerseMapping> mappings;
};

bool parse_pairs(std::string_view spec, std::vector<CompositePair>& out,
                 std::string& error);

TextSet assemble_texts(const VerseMap& verses,
                       const std::vector<CompositePair>& pairs,
                       EntityOrder order);

/* ── Extraction result (produced by backends) ──────────────────── */

struct ExtractConfig {
    LineConfig                 lines;
    int                        page_min = 0;   /* 0 = unbounded */
    int                        page_max = 0;   /* 0 = unbounded */
    std::vector<CompositePair> pairs;
    EntityOrder                order = EntityOrder::CompositesFirst;
};

struct VerseResult {
    std::string source_type;   /* "hocr" */
    int         page_count;    /* ocr_page elements seen, -1 on error */
    int         pages_used;    /* pages that passed bbox + window checks */
    std::string error;
    VerseMap    verses;
    TextSet     entities;
};

/* true when the page has no ppageno or ppageno lies in [page_min, page_max] */
bool page_in_window(std::string_view title, int page_min, int page_max);

/* Returns false (and leaves out untouched) when the page has no bbox. */
bool stitch_page(const RawPage& page, const LineConfig& cfg, VerseMap& out);

/* ── Backend interface ─────────────────────────────────────────── */

VerseResult extract_hocr(const void* buf, size_t len, const ExtractConfig& cfg);

/* ── Writers ───────────────────────────────────────────────────── */

bool write_texts_csv(const char* path, const std::vector<TextEntity>& texts,
                     std::string& error);
bool write_mappings_csv(const char* path, const std::vector<VerseMapping>& maps,
                        std::string& error);
bool write_sqlite(const char* db_path, const TextSet& set, std::string& error);

#endif
