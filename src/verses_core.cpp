#include "verses.h"
#include "verses_types.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using json = nlohmann::json;

/* ── last error (per thread) ─────────────────────────────────────────── */

static thread_local std::string last_error;

static void set_error(const std::string& msg) { last_error = msg; }

/* OCR text is not guaranteed to be UTF-8; invalid bytes become U+FFFD */
static std::string dump_json(const json& obj) {
    return obj.dump(-1, ' ', false, json::error_handler_t::replace);
}

const char* verses_errmsg(void) {
    return last_error.c_str();
}

/* ── cursor implementation ──────────────────────────────────────────── */

struct verses_cursor {
    VerseResult result;

    /* doc (single row) */
    verses_doc  doc_view;
    std::string doc_json;

    /* verse iterator (flattened map, ascending) */
    std::vector<const Verse*> verse_rows;
    size_t       verse_index;
    verses_verse verse_view;
    std::string  verse_json;

    /* text iterator */
    size_t      text_index;
    verses_text text_view;
    std::string text_json;

    /* mapping iterator */
    size_t            mapping_index;
    verses_text_verse mapping_view;
    std::string       mapping_json;
};

/* ── configuration ──────────────────────────────────────────────────── */

void verses_config_init(verses_config* cfg) {
    if (!cfg) return;
    cfg->footnote_frac    = 0.82;
    cfg->left_margin_frac = 0.20;
    cfg->superscript_px   = 5;
    cfg->page_min         = 0;
    cfg->page_max         = 0;
    cfg->pairs            = nullptr;
    cfg->order            = VERSES_ORDER_COMPOSITES_FIRST;
}

int verses_check_pairs(const char* spec) {
    std::vector<CompositePair> pairs;
    std::string err;
    if (!parse_pairs(spec ? spec : "", pairs, err)) {
        set_error(err);
        return -1;
    }
    return 0;
}

static bool to_extract_config(const verses_config& c, ExtractConfig& out) {
    out.lines.footnote_frac    = c.footnote_frac;
    out.lines.left_margin_frac = c.left_margin_frac;
    out.lines.superscript_px   = c.superscript_px;
    out.page_min = c.page_min;
    out.page_max = c.page_max;
    out.order = (c.order == VERSES_ORDER_BY_VERSE) ? EntityOrder::ByVerse
                                                    : EntityOrder::CompositesFirst;
    std::string err;
    if (!parse_pairs(c.pairs ? c.pairs : "", out.pairs, err)) {
        set_error("pairs: " + err);
        return false;
    }
    return true;
}

/* ── open ───────────────────────────────────────────────────────────── */

verses_cursor* verses_open_hocr(const void* buf, size_t len,
                                const verses_config* cfg) {
    verses_config defaults;
    verses_config_init(&defaults);

    ExtractConfig ec;
    if (!to_extract_config(cfg ? *cfg : defaults, ec)) return nullptr;

    if (!buf || len == 0) {
        set_error("parse hOCR: empty document");
        return nullptr;
    }

    VerseResult r = extract_hocr(buf, len, ec);
    if (r.page_count < 0) {
        set_error(r.error);
        return nullptr;
    }

    auto* c = new verses_cursor{};
    c->result        = std::move(r);
    c->verse_index   = 0;
    c->text_index    = 0;
    c->mapping_index = 0;
    c->verse_rows.reserve(c->result.verses.size());
    for (const auto& kv : c->result.verses.verses)
        c->verse_rows.push_back(&kv.second);
    return c;
}

/* ── doc ────────────────────────────────────────────────────────────── */

const verses_doc* verses_get_doc(verses_cursor* c) {
    if (!c) return nullptr;
    const VerseResult& r = c->result;
    c->doc_view.source_type    = r.source_type.c_str();
    c->doc_view.page_count     = r.page_count;
    c->doc_view.pages_used     = r.pages_used;
    c->doc_view.verse_count    = static_cast<int>(r.verses.size());
    c->doc_view.text_count     = static_cast<int>(r.entities.texts.size());
    c->doc_view.reopened_count = r.verses.reopened();
    return &c->doc_view;
}

const char* verses_get_doc_json(verses_cursor* c) {
    if (!c) return nullptr;
    const VerseResult& r = c->result;
    json obj;
    obj["source_type"]    = r.source_type;
    obj["page_count"]     = r.page_count;
    obj["pages_used"]     = r.pages_used;
    obj["verse_count"]    = r.verses.size();
    obj["text_count"]     = r.entities.texts.size();
    obj["reopened_count"] = r.verses.reopened();
    c->doc_json = dump_json(obj);
    return c->doc_json.c_str();
}

/* ── verse iterator ─────────────────────────────────────────────────── */

const verses_verse* verses_next_verse(verses_cursor* c) {
    if (!c || c->verse_index >= c->verse_rows.size()) return nullptr;
    const Verse& v = *c->verse_rows[c->verse_index++];
    c->verse_view.verse_number = v.number;
    c->verse_view.fragments    = v.fragments;
    c->verse_view.text         = v.text.c_str();
    return &c->verse_view;
}

const char* verses_next_verse_json(verses_cursor* c) {
    if (!c || c->verse_index >= c->verse_rows.size()) return nullptr;
    const Verse& v = *c->verse_rows[c->verse_index++];
    json obj;
    obj["verse_number"] = v.number;
    obj["fragments"]    = v.fragments;
    obj["text"]         = v.text;
    c->verse_json = dump_json(obj);
    return c->verse_json.c_str();
}

/* ── text iterator ──────────────────────────────────────────────────── */

const verses_text* verses_next_text(verses_cursor* c) {
    if (!c || c->text_index >= c->result.entities.texts.size()) return nullptr;
    const TextEntity& t = c->result.entities.texts[c->text_index++];
    c->text_view.text_id = t.id;
    c->text_view.label   = t.label.c_str();
    c->text_view.body    = t.body.c_str();
    return &c->text_view;
}

const char* verses_next_text_json(verses_cursor* c) {
    if (!c || c->text_index >= c->result.entities.texts.size()) return nullptr;
    const TextEntity& t = c->result.entities.texts[c->text_index++];
    json obj;
    obj["id"]        = t.id;
    obj["label"]     = t.label;
    obj["text_body"] = t.body;
    c->text_json = dump_json(obj);
    return c->text_json.c_str();
}

/* ── mapping iterator ───────────────────────────────────────────────── */

const verses_text_verse* verses_next_mapping(verses_cursor* c) {
    if (!c || c->mapping_index >= c->result.entities.mappings.size()) return nullptr;
    const VerseMapping& m = c->result.entities.mappings[c->mapping_index++];
    c->mapping_view.text_id      = m.text_id;
    c->mapping_view.verse_number = m.verse_number;
    return &c->mapping_view;
}

const char* verses_next_mapping_json(verses_cursor* c) {
    if (!c || c->mapping_index >= c->result.entities.mappings.size()) return nullptr;
    const VerseMapping& m = c->result.entities.mappings[c->mapping_index++];
    json obj;
    obj["text_id"]      = m.text_id;
    obj["verse_number"] = m.verse_number;
    c->mapping_json = dump_json(obj);
    return c->mapping_json.c_str();
}

/* ── writers ────────────────────────────────────────────────────────── */

int verses_write_csv(verses_cursor* c, const char* texts_path,
                     const char* mappings_path) {
    if (!c || !texts_path || !mappings_path) {
        set_error("write csv: missing cursor or path");
        return -1;
    }
    std::string err;
    if (!write_texts_csv(texts_path, c->result.entities.texts, err) ||
        !write_mappings_csv(mappings_path, c->result.entities.mappings, err)) {
        set_error(err);
        return -1;
    }
    return 0;
}

int verses_write_sqlite(verses_cursor* c, const char* db_path) {
    if (!c || !db_path) {
        set_error("write sqlite: missing cursor or path");
        return -1;
    }
    std::string err;
    if (!write_sqlite(db_path, c->result.entities, err)) {
        set_error(err);
        return -1;
    }
    return 0;
}

/* ── close ──────────────────────────────────────────────────────────── */

void verses_close(verses_cursor* c) {
    delete c;
}
