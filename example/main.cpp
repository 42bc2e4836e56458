#include "verses.h"
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

static void usage(const char* argv0) {
    fprintf(stderr,
        "usage: %s --in <file_hocr.html> [options]\n"
        "  --texts PATH             texts CSV (default texts.csv)\n"
        "  --text-verses PATH       text_verses CSV (default text_verses.csv)\n"
        "  --db PATH                also store both tables in a SQLite database\n"
        "  --page-min N             first ppageno to parse, inclusive (0 = first)\n"
        "  --page-max N             last ppageno to parse, inclusive (0 = last)\n"
        "  --pairs SPEC             composite pairs, e.g. 58-59,104-105\n"
        "  --footnote-frac F        drop lines starting below this page fraction (0.82)\n"
        "  --left-margin-frac F     verse numbers start left of this fraction (0.20)\n"
        "  --superscript-px N       superscript rise threshold in pixels (5)\n"
        "  --order composites|verse entity ordering (composites)\n"
        "  --json                   print entities as JSON on stdout, skip CSV\n"
        "  -v                       report verses assembled from several fragments\n",
        argv0);
}

static bool parse_int_arg(const char* s, int& out) {
    char* end = nullptr;
    long v = strtol(s, &end, 10);
    if (!*s || *end || v < 0 || v > 1000000000) return false;
    out = static_cast<int>(v);
    return true;
}

static bool parse_frac_arg(const char* s, double& out) {
    char* end = nullptr;
    double v = strtod(s, &end);
    if (!*s || *end || v < 0.0 || v > 1.0) return false;
    out = v;
    return true;
}

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

int main(int argc, char* argv[]) {
    const char* in_path      = nullptr;
    const char* texts_path   = "texts.csv";
    const char* mapping_path = "text_verses.csv";
    const char* db_path      = nullptr;
    bool        as_json      = false;
    bool        verbose      = false;

    verses_config cfg;
    verses_config_init(&cfg);

    for (int i = 1; i < argc; i++) {
        const char* a = argv[i];
        const char* val = (i + 1 < argc) ? argv[i + 1] : nullptr;
        bool ok = true;

        if (!strcmp(a, "-v")) { verbose = true; continue; }
        if (!strcmp(a, "--json")) { as_json = true; continue; }
        if (!strcmp(a, "-h") || !strcmp(a, "--help")) { usage(argv[0]); return 0; }
        if (!val) {
            fprintf(stderr, "%s: unknown or incomplete option %s\n", argv[0], a);
            usage(argv[0]);
            return 2;
        }

        if      (!strcmp(a, "--in"))               in_path = val;
        else if (!strcmp(a, "--texts"))            texts_path = val;
        else if (!strcmp(a, "--text-verses"))      mapping_path = val;
        else if (!strcmp(a, "--db"))               db_path = val;
        else if (!strcmp(a, "--pairs"))            cfg.pairs = val;
        else if (!strcmp(a, "--page-min"))         ok = parse_int_arg(val, cfg.page_min);
        else if (!strcmp(a, "--page-max"))         ok = parse_int_arg(val, cfg.page_max);
        else if (!strcmp(a, "--superscript-px"))   ok = parse_int_arg(val, cfg.superscript_px);
        else if (!strcmp(a, "--footnote-frac"))    ok = parse_frac_arg(val, cfg.footnote_frac);
        else if (!strcmp(a, "--left-margin-frac")) ok = parse_frac_arg(val, cfg.left_margin_frac);
        else if (!strcmp(a, "--order")) {
            if (!strcmp(val, "composites"))  cfg.order = VERSES_ORDER_COMPOSITES_FIRST;
            else if (!strcmp(val, "verse"))  cfg.order = VERSES_ORDER_BY_VERSE;
            else ok = false;
        } else {
            fprintf(stderr, "%s: unknown option %s\n", argv[0], a);
            usage(argv[0]);
            return 2;
        }

        if (!ok) {
            fprintf(stderr, "%s: bad value for %s: %s\n", argv[0], a, val);
            return 2;
        }
        i++;
    }

    if (!in_path) {
        usage(argv[0]);
        return 2;
    }

    /* operator-authored config: reject before touching the document */
    if (verses_check_pairs(cfg.pairs) != 0) {
        fprintf(stderr, "pairs: %s\n", verses_errmsg());
        return 2;
    }

    std::vector<char> buf = read_file(in_path);
    if (buf.empty()) {
        fprintf(stderr, "open %s: cannot read file\n", in_path);
        return 1;
    }

    verses_cursor* cur = verses_open_hocr(buf.data(), buf.size(), &cfg);
    if (!cur) {
        fprintf(stderr, "%s: %s\n", in_path, verses_errmsg());
        return 1;
    }

    const verses_doc* doc = verses_get_doc(cur);

    if (verbose && doc->reopened_count > 0) {
        while (auto* v = verses_next_verse(cur)) {
            if (v->fragments > 1)
                fprintf(stderr, "warning: verse %d assembled from %d fragments "
                                "(page break or repeated number)\n",
                        v->verse_number, v->fragments);
        }
    }

    int rc = 0;
    if (as_json) {
        std::string out = "[";
        bool first = true;
        while (const char* json = verses_next_text_json(cur)) {
            if (!first) out += ',';
            out += json;
            first = false;
        }
        out += "]\n";
        fputs(out.c_str(), stdout);
    } else if (verses_write_csv(cur, texts_path, mapping_path) != 0) {
        fprintf(stderr, "write csv: %s\n", verses_errmsg());
        rc = 1;
    }

    if (rc == 0 && db_path && verses_write_sqlite(cur, db_path) != 0) {
        fprintf(stderr, "write db: %s\n", verses_errmsg());
        rc = 1;
    }

    if (rc == 0) {
        fprintf(stderr, "extracted %d text entities (%d verses) from %d of %d pages",
                doc->text_count, doc->verse_count, doc->pages_used, doc->page_count);
        if (!as_json) fprintf(stderr, "; wrote %s and %s", texts_path, mapping_path);
        if (db_path)  fprintf(stderr, "; stored in %s", db_path);
        fputc('\n', stderr);
    }

    verses_close(cur);
    return rc;
}
