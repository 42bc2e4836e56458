#ifndef VERSES_H
#define VERSES_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ── configuration ───────────────────────────────────────────────── */

enum {
    VERSES_ORDER_COMPOSITES_FIRST = 0,  /* composites, then ascending singles */
    VERSES_ORDER_BY_VERSE         = 1   /* interleaved by lowest verse number */
};

typedef struct {
    double      footnote_frac;     /* lines starting below this page fraction are dropped */
    double      left_margin_frac;  /* verse numbers must start left of this fraction */
    int         superscript_px;    /* words rising more than this above the line are dropped */
    int         page_min;          /* inclusive ppageno window, 0 = unbounded */
    int         page_max;
    const char* pairs;             /* "58-59,104-105" or NULL */
    int         order;             /* VERSES_ORDER_* */
} verses_config;

/* Fills cfg with defaults: 0.82, 0.20, 5, 0, 0, NULL, composites first. */
void verses_config_init(verses_config* cfg);

/* Returns 0 if spec is a well-formed pair list, -1 otherwise (see verses_errmsg). */
int verses_check_pairs(const char* spec);

/* Message for the last failure on this thread ("" if none). */
const char* verses_errmsg(void);

/* ── struct types ────────────────────────────────────────────────── */

typedef struct {
    const char* source_type;   /* "hocr" */
    int         page_count;    /* ocr_page elements in the document */
    int         pages_used;    /* pages inside the window with a bbox */
    int         verse_count;
    int         text_count;
    int         reopened_count; /* verses assembled from more than one fragment */
} verses_doc;

typedef struct {
    int         verse_number;
    int         fragments;
    const char* text;
} verses_verse;

typedef struct {
    uint32_t    text_id;       /* 1-based */
    const char* label;         /* "151" or "58–59" */
    const char* body;
} verses_text;

typedef struct {
    uint32_t    text_id;
    int         verse_number;
} verses_text_verse;

/* ── cursor ──────────────────────────────────────────────────────── */
/*
 * One cursor per extraction pass. Each object type has its own iterator;
 * iterators return NULL when exhausted. Pointers stay valid until the
 * next call on the same iterator or verses_close.
 *
 * verses_open_hocr: cfg may be NULL for defaults. Returns NULL when the
 * buffer is not parseable markup or cfg->pairs is malformed.
 */

typedef struct verses_cursor verses_cursor;

verses_cursor* verses_open_hocr(const void* buf, size_t len,
                                const verses_config* cfg);

/* doc (single row, not an iterator) */
const verses_doc*        verses_get_doc(verses_cursor* cursor);
const char*              verses_get_doc_json(verses_cursor* cursor);

/* verse iterator, ascending verse number */
const verses_verse*      verses_next_verse(verses_cursor* cursor);
const char*              verses_next_verse_json(verses_cursor* cursor);

/* text entity iterator, ascending id */
const verses_text*       verses_next_text(verses_cursor* cursor);
const char*              verses_next_text_json(verses_cursor* cursor);

/* text -> verse mapping iterator */
const verses_text_verse* verses_next_mapping(verses_cursor* cursor);
const char*              verses_next_mapping_json(verses_cursor* cursor);

/* ── writers ─────────────────────────────────────────────────────── */
/* 0 on success, -1 on failure (see verses_errmsg). */

int verses_write_csv(verses_cursor* cursor, const char* texts_path,
                     const char* mappings_path);

int verses_write_sqlite(verses_cursor* cursor, const char* db_path);

void verses_close(verses_cursor* cursor);

#ifdef __cplusplus
}
#endif

#endif
