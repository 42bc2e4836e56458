#include <sqlite3ext.h>
SQLITE_EXTENSION_INIT1

#include "verses.h"
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

/* ══════════════════════════════════════════════════════════════════════
 * Table kinds
 *
 * All four virtual tables share one sqlite3_module; the kind is passed
 * through pAux and stored on the vtab. Every table has two trailing
 * HIDDEN columns: file_path (required) and pairs (optional).
 * ══════════════════════════════════════════════════════════════════════ */

enum Kind { KIND_DOC, KIND_VERSES, KIND_TEXTS, KIND_TEXT_VERSES };

static const char* kSchemas[] = {
    "CREATE TABLE x(source_type TEXT, page_count INTEGER, pages_used INTEGER, "
    "verse_count INTEGER, text_count INTEGER, reopened_count INTEGER, "
    "file_path TEXT HIDDEN, pairs TEXT HIDDEN)",
    "CREATE TABLE x(verse_number INTEGER, fragments INTEGER, text TEXT, "
    "file_path TEXT HIDDEN, pairs TEXT HIDDEN)",
    "CREATE TABLE x(id INTEGER, label TEXT, text_body TEXT, "
    "file_path TEXT HIDDEN, pairs TEXT HIDDEN)",
    "CREATE TABLE x(text_id INTEGER, verse_number INTEGER, "
    "file_path TEXT HIDDEN, pairs TEXT HIDDEN)",
};

/* number of visible columns per kind; hidden ones follow */
static const int kDataColumns[] = { 6, 3, 3, 2 };

static Kind* make_kind(Kind k) {
    static Kind kinds[4] = { KIND_DOC, KIND_VERSES, KIND_TEXTS, KIND_TEXT_VERSES };
    return &kinds[k];
}

/* ── File I/O ────────────────────────────────────────────────────── */

static std::vector<char> read_file(const char* path) {
    FILE* f = fopen(path, "rb");
    if (!f) return {};
    fseek(f, 0, SEEK_END);
    long sz = ftell(f);
    rewind(f);
    if (sz <= 0) { fclose(f); return {}; }
    std::vector<char> buf(sz);
    if (fread(buf.data(), 1, sz, f) != static_cast<size_t>(sz))
        buf.clear();
    fclose(f);
    return buf;
}

/* Opens path with the given pair spec; on failure fills *err (sqlite3_malloc'd). */
static verses_cursor* open_path(const char* path, const char* pairs, char** err) {
    auto buf = read_file(path);
    if (buf.empty()) {
        *err = sqlite3_mprintf("verses: cannot read %s", path);
        return nullptr;
    }
    verses_config cfg;
    verses_config_init(&cfg);
    cfg.pairs = pairs;
    verses_cursor* cur = verses_open_hocr(buf.data(), buf.size(), &cfg);
    if (!cur)
        *err = sqlite3_mprintf("verses: %s", verses_errmsg());
    return cur;
}

/* ══════════════════════════════════════════════════════════════════════
 * verses_doc / verses_verses / verses_texts / verses_text_verses
 * ══════════════════════════════════════════════════════════════════════ */

struct KindVtab : sqlite3_vtab {
    Kind kind;
};

struct RowCursor : sqlite3_vtab_cursor {
    verses_cursor*           cur = nullptr;
    const verses_doc*        doc = nullptr;
    const verses_verse*      verse = nullptr;
    const verses_text*       text = nullptr;
    const verses_text_verse* mapping = nullptr;
    bool    eof = true;
    int64_t rowid = 0;
};

static Kind kind_of(sqlite3_vtab_cursor* pCursor) {
    return static_cast<KindVtab*>(pCursor->pVtab)->kind;
}

/* advance to the next row of this cursor's kind; sets eof */
static void step_row(RowCursor* c, Kind kind, bool first) {
    switch (kind) {
        case KIND_DOC:
            c->doc = first ? verses_get_doc(c->cur) : nullptr;
            c->eof = (c->doc == nullptr);
            break;
        case KIND_VERSES:
            c->verse = verses_next_verse(c->cur);
            c->eof = (c->verse == nullptr);
            break;
        case KIND_TEXTS:
            c->text = verses_next_text(c->cur);
            c->eof = (c->text == nullptr);
            break;
        case KIND_TEXT_VERSES:
            c->mapping = verses_next_mapping(c->cur);
            c->eof = (c->mapping == nullptr);
            break;
    }
}

static int rowsConnect(sqlite3* db, void* pAux, int, const char* const*,
                       sqlite3_vtab** ppVtab, char**) {
    Kind kind = *static_cast<Kind*>(pAux);
    int rc = sqlite3_declare_vtab(db, kSchemas[kind]);
    if (rc != SQLITE_OK) return rc;
    auto* v = new KindVtab{};
    v->kind = kind;
    *ppVtab = v;
    return SQLITE_OK;
}

/* idxNum bit 0: pairs argument present (argv[1]) */
static int rowsBestIndex(sqlite3_vtab* pVtab, sqlite3_index_info* info) {
    int path_col  = kDataColumns[static_cast<KindVtab*>(pVtab)->kind];
    int pairs_col = path_col + 1;
    int path_i = -1, pairs_i = -1;

    for (int i = 0; i < info->nConstraint; i++) {
        if (info->aConstraint[i].op != SQLITE_INDEX_CONSTRAINT_EQ ||
            !info->aConstraint[i].usable)
            continue;
        if (info->aConstraint[i].iColumn == path_col)  path_i  = i;
        if (info->aConstraint[i].iColumn == pairs_col) pairs_i = i;
    }
    if (path_i < 0) return SQLITE_CONSTRAINT;

    info->aConstraintUsage[path_i].argvIndex = 1;
    info->aConstraintUsage[path_i].omit = 1;
    info->idxNum = 0;
    if (pairs_i >= 0) {
        info->aConstraintUsage[pairs_i].argvIndex = 2;
        info->aConstraintUsage[pairs_i].omit = 1;
        info->idxNum = 1;
    }
    info->estimatedCost = 100.0;
    return SQLITE_OK;
}

static int rowsDisconnect(sqlite3_vtab* pVtab) { delete static_cast<KindVtab*>(pVtab); return SQLITE_OK; }
static int rowsOpen(sqlite3_vtab*, sqlite3_vtab_cursor** pp) { *pp = new RowCursor{}; return SQLITE_OK; }

static int rowsClose(sqlite3_vtab_cursor* pCursor) {
    auto* c = static_cast<RowCursor*>(pCursor);
    if (c->cur) verses_close(c->cur);
    delete c;
    return SQLITE_OK;
}

static int rowsFilter(sqlite3_vtab_cursor* pCursor, int idxNum, const char*,
                      int argc, sqlite3_value** argv) {
    auto* c = static_cast<RowCursor*>(pCursor);
    if (c->cur) { verses_close(c->cur); c->cur = nullptr; }
    c->eof = true;
    c->rowid = 0;
    if (argc < 1) return SQLITE_OK;

    const char* path = reinterpret_cast<const char*>(sqlite3_value_text(argv[0]));
    if (!path) return SQLITE_OK;
    const char* pairs = nullptr;
    if ((idxNum & 1) && argc >= 2)
        pairs = reinterpret_cast<const char*>(sqlite3_value_text(argv[1]));

    char* err = nullptr;
    c->cur = open_path(path, pairs, &err);
    if (!c->cur) {
        sqlite3_free(pCursor->pVtab->zErrMsg);
        pCursor->pVtab->zErrMsg = err;
        return SQLITE_ERROR;
    }
    step_row(c, kind_of(pCursor), true);
    return SQLITE_OK;
}

static int rowsNext(sqlite3_vtab_cursor* pCursor) {
    auto* c = static_cast<RowCursor*>(pCursor);
    c->rowid++;
    step_row(c, kind_of(pCursor), false);
    return SQLITE_OK;
}

static int rowsEof(sqlite3_vtab_cursor* pCursor) { return static_cast<RowCursor*>(pCursor)->eof ? 1 : 0; }

static int rowsColumn(sqlite3_vtab_cursor* pCursor, sqlite3_context* ctx, int col) {
    auto* c = static_cast<RowCursor*>(pCursor);
    switch (kind_of(pCursor)) {
        case KIND_DOC:
            switch (col) {
                case 0: sqlite3_result_text(ctx, c->doc->source_type, -1, SQLITE_TRANSIENT); break;
                case 1: sqlite3_result_int(ctx, c->doc->page_count); break;
                case 2: sqlite3_result_int(ctx, c->doc->pages_used); break;
                case 3: sqlite3_result_int(ctx, c->doc->verse_count); break;
                case 4: sqlite3_result_int(ctx, c->doc->text_count); break;
                case 5: sqlite3_result_int(ctx, c->doc->reopened_count); break;
                default: sqlite3_result_null(ctx); break;
            }
            break;
        case KIND_VERSES:
            switch (col) {
                case 0: sqlite3_result_int(ctx, c->verse->verse_number); break;
                case 1: sqlite3_result_int(ctx, c->verse->fragments); break;
                case 2: sqlite3_result_text(ctx, c->verse->text, -1, SQLITE_TRANSIENT); break;
                default: sqlite3_result_null(ctx); break;
            }
            break;
        case KIND_TEXTS:
            switch (col) {
                case 0: sqlite3_result_int64(ctx, c->text->text_id); break;
                case 1: sqlite3_result_text(ctx, c->text->label, -1, SQLITE_TRANSIENT); break;
                case 2: sqlite3_result_text(ctx, c->text->body, -1, SQLITE_TRANSIENT); break;
                default: sqlite3_result_null(ctx); break;
            }
            break;
        case KIND_TEXT_VERSES:
            switch (col) {
                case 0: sqlite3_result_int64(ctx, c->mapping->text_id); break;
                case 1: sqlite3_result_int(ctx, c->mapping->verse_number); break;
                default: sqlite3_result_null(ctx); break;
            }
            break;
    }
    return SQLITE_OK;
}

static int rowsRowid(sqlite3_vtab_cursor* pCursor, sqlite3_int64* pRowid) {
    *pRowid = static_cast<RowCursor*>(pCursor)->rowid; return SQLITE_OK;
}

static sqlite3_module rowsModule = {
    0, nullptr, rowsConnect, rowsBestIndex, rowsDisconnect,
    rowsDisconnect, rowsOpen, rowsClose, rowsFilter,
    rowsNext, rowsEof, rowsColumn, rowsRowid
};

/* ══════════════════════════════════════════════════════════════════════
 * Scalar JSON functions:  f(file_path [, pairs])
 * ══════════════════════════════════════════════════════════════════════ */

typedef const char* (*json_iter_fn)(verses_cursor*);

static verses_cursor* open_args(sqlite3_context* ctx, int argc, sqlite3_value** argv) {
    const char* path = reinterpret_cast<const char*>(sqlite3_value_text(argv[0]));
    if (!path) { sqlite3_result_null(ctx); return nullptr; }
    const char* pairs = argc >= 2
        ? reinterpret_cast<const char*>(sqlite3_value_text(argv[1])) : nullptr;

    char* err = nullptr;
    verses_cursor* cur = open_path(path, pairs, &err);
    if (!cur) {
        sqlite3_result_error(ctx, err, -1);
        sqlite3_free(err);
    }
    return cur;
}

static void json_array_func(sqlite3_context* ctx, int argc, sqlite3_value** argv,
                            json_iter_fn iter_fn) {
    verses_cursor* cur = open_args(ctx, argc, argv);
    if (!cur) return;

    std::string result = "[";
    bool first = true;
    while (const char* json = iter_fn(cur)) {
        if (!first) result += ',';
        result += json;
        first = false;
    }
    verses_close(cur);
    result += ']';
    sqlite3_result_text(ctx, result.c_str(), static_cast<int>(result.size()), SQLITE_TRANSIENT);
}

static void doc_json_func(sqlite3_context* ctx, int argc, sqlite3_value** argv) {
    verses_cursor* cur = open_args(ctx, argc, argv);
    if (!cur) return;

    const char* json = verses_get_doc_json(cur);
    if (json)
        sqlite3_result_text(ctx, json, -1, SQLITE_TRANSIENT);
    else
        sqlite3_result_null(ctx);
    verses_close(cur);
}

/* ── Per-table scalar wrappers ──────────────────────────────────── */

static void verses_json_func(sqlite3_context* ctx, int argc, sqlite3_value** argv) {
    json_array_func(ctx, argc, argv, verses_next_verse_json);
}
static void texts_json_func(sqlite3_context* ctx, int argc, sqlite3_value** argv) {
    json_array_func(ctx, argc, argv, verses_next_text_json);
}
static void text_verses_json_func(sqlite3_context* ctx, int argc, sqlite3_value** argv) {
    json_array_func(ctx, argc, argv, verses_next_mapping_json);
}

/* registers name(file_path) and name(file_path, pairs) */
static int register_func(sqlite3* db, const char* name,
                         void (*fn)(sqlite3_context*, int, sqlite3_value**)) {
    int rc = sqlite3_create_function(db, name, 1, SQLITE_UTF8, nullptr, fn, nullptr, nullptr);
    if (rc != SQLITE_OK) return rc;
    return sqlite3_create_function(db, name, 2, SQLITE_UTF8, nullptr, fn, nullptr, nullptr);
}

/* ══════════════════════════════════════════════════════════════════════
 * Extension entry point
 * ══════════════════════════════════════════════════════════════════════ */

extern "C" {
#ifdef _WIN32
__declspec(dllexport)
#endif
int sqlite3_verses_init(sqlite3* db, char** pzErrMsg,
                        const sqlite3_api_routines* pApi) {
    SQLITE_EXTENSION_INIT2(pApi);
    (void)pzErrMsg;

    int rc;

    /* ── virtual tables ───────────────────────────────────────────── */
    rc = sqlite3_create_module(db, "verses_doc",         &rowsModule, make_kind(KIND_DOC));
    if (rc != SQLITE_OK) return rc;
    rc = sqlite3_create_module(db, "verses_verses",      &rowsModule, make_kind(KIND_VERSES));
    if (rc != SQLITE_OK) return rc;
    rc = sqlite3_create_module(db, "verses_texts",       &rowsModule, make_kind(KIND_TEXTS));
    if (rc != SQLITE_OK) return rc;
    rc = sqlite3_create_module(db, "verses_text_verses", &rowsModule, make_kind(KIND_TEXT_VERSES));
    if (rc != SQLITE_OK) return rc;

    /* ── scalar JSON functions ────────────────────────────────────── */
    rc = register_func(db, "verses_doc_json", doc_json_func);
    if (rc != SQLITE_OK) return rc;
    rc = register_func(db, "verses_verses_json", verses_json_func);
    if (rc != SQLITE_OK) return rc;
    rc = register_func(db, "verses_texts_json", texts_json_func);
    if (rc != SQLITE_OK) return rc;
    return register_func(db, "verses_text_verses_json", text_verses_json_func);
}
}
