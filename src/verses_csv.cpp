#include "verses_types.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

/* ── helpers ─────────────────────────────────────────────────────── */

/* RFC 4180 field: always quoted, embedded quotes doubled */
static std::string csv_quote(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

static FILE* open_for_write(const char* path, std::string& error) {
    FILE* f = fopen(path, "wb");
    if (!f)
        error = std::string("create ") + path + ": " + strerror(errno);
    return f;
}

static bool finish(FILE* f, const char* path, std::string& error) {
    bool ok = !ferror(f);
    if (fclose(f) != 0) ok = false;
    if (!ok)
        error = std::string("write ") + path + ": " + strerror(errno);
    return ok;
}

/* ── writers ─────────────────────────────────────────────────────── */

bool write_texts_csv(const char* path, const std::vector<TextEntity>& texts,
                     std::string& error) {
    FILE* f = open_for_write(path, error);
    if (!f) return false;

    fputs("id,label,text_body\n", f);
    for (const auto& t : texts) {
        fprintf(f, "%u,%s,%s\n", t.id,
                csv_quote(t.label).c_str(), csv_quote(t.body).c_str());
    }
    return finish(f, path, error);
}

bool write_mappings_csv(const char* path, const std::vector<VerseMapping>& maps,
                        std::string& error) {
    FILE* f = open_for_write(path, error);
    if (!f) return false;

    fputs("text_id,verse_number\n", f);
    for (const auto& m : maps)
        fprintf(f, "%u,%d\n", m.text_id, m.verse_number);
    return finish(f, path, error);
}
