#include "verses_types.h"

#include <sqlite3.h>
#include <string>

static const char* kSchema =
    "CREATE TABLE IF NOT EXISTS texts ("
    "  id        INTEGER PRIMARY KEY,"
    "  label     TEXT NOT NULL,"
    "  text_body TEXT NOT NULL"
    ");"
    "CREATE TABLE IF NOT EXISTS text_verses ("
    "  text_id      INTEGER NOT NULL REFERENCES texts(id),"
    "  verse_number INTEGER NOT NULL,"
    "  PRIMARY KEY (text_id, verse_number)"
    ");";

static bool fail(sqlite3* db, const char* step, std::string& error) {
    error = std::string("sqlite ") + step + ": " + (db ? sqlite3_errmsg(db) : "out of memory");
    return false;
}

static bool insert_all(sqlite3* db, const TextSet& set, std::string& error) {
    sqlite3_stmt* ins_text = nullptr;
    sqlite3_stmt* ins_map  = nullptr;

    if (sqlite3_prepare_v2(db,
            "INSERT INTO texts (id, label, text_body) VALUES (?, ?, ?)",
            -1, &ins_text, nullptr) != SQLITE_OK)
        return fail(db, "prepare texts", error);

    if (sqlite3_prepare_v2(db,
            "INSERT INTO text_verses (text_id, verse_number) VALUES (?, ?)",
            -1, &ins_map, nullptr) != SQLITE_OK) {
        sqlite3_finalize(ins_text);
        return fail(db, "prepare text_verses", error);
    }

    bool ok = true;
    for (const auto& t : set.texts) {
        sqlite3_bind_int64(ins_text, 1, t.id);
        sqlite3_bind_text(ins_text, 2, t.label.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(ins_text, 3, t.body.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(ins_text) != SQLITE_DONE) { ok = fail(db, "insert texts", error); break; }
        sqlite3_reset(ins_text);
    }

    for (size_t i = 0; ok && i < set.mappings.size(); i++) {
        sqlite3_bind_int64(ins_map, 1, set.mappings[i].text_id);
        sqlite3_bind_int(ins_map, 2, set.mappings[i].verse_number);
        if (sqlite3_step(ins_map) != SQLITE_DONE) { ok = fail(db, "insert text_verses", error); break; }
        sqlite3_reset(ins_map);
    }

    sqlite3_finalize(ins_text);
    sqlite3_finalize(ins_map);
    return ok;
}

/* Replaces the contents of texts / text_verses in one transaction. */
bool write_sqlite(const char* db_path, const TextSet& set, std::string& error) {
    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(db_path, &db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        fail(db, "open", error);
        error += std::string(" (") + db_path + ")";
        sqlite3_close(db);
        return false;
    }

    bool ok = true;
    if (sqlite3_exec(db, kSchema, nullptr, nullptr, nullptr) != SQLITE_OK)
        ok = fail(db, "schema", error);
    else if (sqlite3_exec(db, "BEGIN", nullptr, nullptr, nullptr) != SQLITE_OK)
        ok = fail(db, "begin", error);
    else {
        if (sqlite3_exec(db, "DELETE FROM text_verses; DELETE FROM texts;",
                         nullptr, nullptr, nullptr) != SQLITE_OK)
            ok = fail(db, "clear", error);
        else
            ok = insert_all(db, set, error);

        if (ok && sqlite3_exec(db, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK)
            ok = fail(db, "commit", error);
        if (!ok)
            sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, nullptr);
    }

    sqlite3_close(db);
    return ok;
}
