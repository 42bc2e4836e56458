#include <gtest/gtest.h>
#include "verses.h"

#include <nlohmann/json.hpp>
#include <sqlite3.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

using json = nlohmann::json;

// C cursor API, JSON views and writers

static std::string word(int x0, int y0, const char* text) {
    char buf[256];
    snprintf(buf, sizeof(buf),
             "<span class='ocrx_word' title='bbox %d %d %d %d'>%s</span>",
             x0, y0, x0 + 40, y0 + 30, text);
    return buf;
}

static std::string line(int x0, int y0, const std::string& words) {
    char buf[128];
    snprintf(buf, sizeof(buf), "<span class='ocr_line' title='bbox %d %d 480 %d'>",
             x0, y0, y0 + 30);
    return buf + words + "</span>";
}

static std::string sample_doc() {
    return
        "<html><body>"
        "<div class='ocr_page' title='bbox 0 0 500 1000; ppageno 5'>" +
        line(10, 100, word(10, 100, "57") + word(60, 100, "Say") + word(110, 100, "\"no\"")) +
        line(10, 140, word(10, 140, "58") + word(60, 140, "Heap")) +
        line(150, 180, word(150, 180, "of") + word(200, 180, "rubbish") + word(250, 180, ";")) +
        line(10, 220, word(10, 220, "70") + word(60, 220, "Month")) +
        "</div>"
        "<div class='ocr_page' title='bbox 0 0 500 1000; ppageno 6'>" +
        line(10, 100, word(10, 100, "70") + word(60, 100, "after") + word(110, 100, "month.")) +
        "</div>"
        "</body></html>";
}

static verses_cursor* open_sample(const char* pairs) {
    std::string doc = sample_doc();
    verses_config cfg;
    verses_config_init(&cfg);
    cfg.pairs = pairs;
    return verses_open_hocr(doc.data(), doc.size(), &cfg);
}

static std::string temp_path(const char* suffix) {
    char tmpl[] = "/tmp/verses_test_XXXXXX";
    int fd = mkstemp(tmpl);
    if (fd >= 0) close(fd);
    std::string path = std::string(tmpl) + suffix;
    std::remove(tmpl);
    return path;
}

static std::string slurp(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

TEST(ApiTest, ConfigDefaults) {
    verses_config cfg;
    verses_config_init(&cfg);
    EXPECT_DOUBLE_EQ(cfg.footnote_frac, 0.82);
    EXPECT_DOUBLE_EQ(cfg.left_margin_frac, 0.20);
    EXPECT_EQ(cfg.superscript_px, 5);
    EXPECT_EQ(cfg.page_min, 0);
    EXPECT_EQ(cfg.page_max, 0);
    EXPECT_EQ(cfg.pairs, nullptr);
    EXPECT_EQ(cfg.order, VERSES_ORDER_COMPOSITES_FIRST);
}

TEST(ApiTest, CheckPairs) {
    EXPECT_EQ(verses_check_pairs(nullptr), 0);
    EXPECT_EQ(verses_check_pairs("58-59,104-105"), 0);
    EXPECT_EQ(verses_check_pairs("58-59-60"), -1);
    EXPECT_NE(std::string(verses_errmsg()).find("58-59-60"), std::string::npos);
}

TEST(ApiTest, IteratesDocVersesTextsMappings) {
    verses_cursor* cur = open_sample("58-59");
    ASSERT_NE(cur, nullptr) << verses_errmsg();

    const verses_doc* doc = verses_get_doc(cur);
    ASSERT_NE(doc, nullptr);
    EXPECT_STREQ(doc->source_type, "hocr");
    EXPECT_EQ(doc->page_count, 2);
    EXPECT_EQ(doc->pages_used, 2);
    EXPECT_EQ(doc->verse_count, 3);
    EXPECT_EQ(doc->text_count, 3);
    EXPECT_EQ(doc->reopened_count, 1);

    const verses_verse* v = verses_next_verse(cur);
    ASSERT_NE(v, nullptr);
    EXPECT_EQ(v->verse_number, 57);
    v = verses_next_verse(cur);
    ASSERT_NE(v, nullptr);
    EXPECT_EQ(v->verse_number, 58);
    EXPECT_STREQ(v->text, "Heap of rubbish;");
    v = verses_next_verse(cur);
    ASSERT_NE(v, nullptr);
    EXPECT_EQ(v->verse_number, 70);
    EXPECT_EQ(v->fragments, 2);
    EXPECT_STREQ(v->text, "Month after month.");
    EXPECT_EQ(verses_next_verse(cur), nullptr);

    const verses_text* t = verses_next_text(cur);
    ASSERT_NE(t, nullptr);
    EXPECT_EQ(t->text_id, 1u);
    EXPECT_STREQ(t->label, "58\xE2\x80\x93" "59");
    EXPECT_STREQ(t->body, "Heap of rubbish;");
    t = verses_next_text(cur);
    ASSERT_NE(t, nullptr);
    EXPECT_STREQ(t->label, "57");
    t = verses_next_text(cur);
    ASSERT_NE(t, nullptr);
    EXPECT_STREQ(t->label, "70");
    EXPECT_EQ(verses_next_text(cur), nullptr);

    int count = 0;
    while (const verses_text_verse* m = verses_next_mapping(cur)) {
        if (count < 2) EXPECT_EQ(m->text_id, 1u);
        count++;
    }
    EXPECT_EQ(count, 4);

    verses_close(cur);
}

TEST(ApiTest, JsonViews) {
    verses_cursor* cur = open_sample(nullptr);
    ASSERT_NE(cur, nullptr);

    json doc = json::parse(verses_get_doc_json(cur));
    EXPECT_EQ(doc["source_type"], "hocr");
    EXPECT_EQ(doc["verse_count"], 3);

    json first = json::parse(verses_next_text_json(cur));
    EXPECT_EQ(first["id"], 1);
    EXPECT_EQ(first["label"], "57");
    EXPECT_EQ(first["text_body"], "Say \"no\"");

    json verse = json::parse(verses_next_verse_json(cur));
    EXPECT_EQ(verse["verse_number"], 57);
    EXPECT_EQ(verse["fragments"], 1);

    json mapping = json::parse(verses_next_mapping_json(cur));
    EXPECT_EQ(mapping["text_id"], 1);
    EXPECT_EQ(mapping["verse_number"], 57);

    verses_close(cur);
}

TEST(ApiTest, ByVerseOrderOption) {
    std::string doc = sample_doc();
    verses_config cfg;
    verses_config_init(&cfg);
    cfg.pairs = "58-59";
    cfg.order = VERSES_ORDER_BY_VERSE;
    verses_cursor* cur = verses_open_hocr(doc.data(), doc.size(), &cfg);
    ASSERT_NE(cur, nullptr);
    EXPECT_STREQ(verses_next_text(cur)->label, "57");
    EXPECT_STREQ(verses_next_text(cur)->label, "58\xE2\x80\x93" "59");
    verses_close(cur);
}

TEST(ApiTest, MalformedPairsFailOpen) {
    verses_cursor* cur = open_sample("58/59");
    EXPECT_EQ(cur, nullptr);
    EXPECT_NE(std::string(verses_errmsg()).find("pairs"), std::string::npos);
}

TEST(ApiTest, UnparseableDocumentFailsOpen) {
    const char bad[] = "<html><body><div></p></body>";
    EXPECT_EQ(verses_open_hocr(bad, sizeof(bad) - 1, nullptr), nullptr);
    EXPECT_NE(std::string(verses_errmsg()).find("parse hOCR"), std::string::npos);
    EXPECT_EQ(verses_open_hocr(nullptr, 0, nullptr), nullptr);
}

TEST(ApiTest, NullCursorIsHarmless) {
    EXPECT_EQ(verses_get_doc(nullptr), nullptr);
    EXPECT_EQ(verses_next_text(nullptr), nullptr);
    EXPECT_EQ(verses_next_mapping_json(nullptr), nullptr);
    verses_close(nullptr);
}

TEST(ApiTest, WritesCsv) {
    verses_cursor* cur = open_sample("58-59");
    ASSERT_NE(cur, nullptr);
    std::string texts = temp_path(".texts.csv");
    std::string maps  = temp_path(".map.csv");

    ASSERT_EQ(verses_write_csv(cur, texts.c_str(), maps.c_str()), 0) << verses_errmsg();

    EXPECT_EQ(slurp(texts),
              "id,label,text_body\n"
              "1,\"58\xE2\x80\x93" "59\",\"Heap of rubbish;\"\n"
              "2,\"57\",\"Say \"\"no\"\"\"\n"
              "3,\"70\",\"Month after month.\"\n");
    EXPECT_EQ(slurp(maps),
              "text_id,verse_number\n"
              "1,58\n"
              "1,59\n"
              "2,57\n"
              "3,70\n");

    std::remove(texts.c_str());
    std::remove(maps.c_str());
    verses_close(cur);
}

TEST(ApiTest, CsvWriteFailureIsReported) {
    verses_cursor* cur = open_sample(nullptr);
    ASSERT_NE(cur, nullptr);
    EXPECT_EQ(verses_write_csv(cur, "/nonexistent-dir/texts.csv", "/nonexistent-dir/m.csv"), -1);
    EXPECT_NE(std::string(verses_errmsg()).find("/nonexistent-dir/texts.csv"), std::string::npos);
    verses_close(cur);
}

static int count_rows(sqlite3* db, const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) return -1;
    int n = -1;
    if (sqlite3_step(stmt) == SQLITE_ROW) n = sqlite3_column_int(stmt, 0);
    sqlite3_finalize(stmt);
    return n;
}

TEST(ApiTest, WritesSqliteAndReplacesPreviousRun) {
    std::string path = temp_path(".sqlite");

    verses_cursor* cur = open_sample("58-59");
    ASSERT_NE(cur, nullptr);
    ASSERT_EQ(verses_write_sqlite(cur, path.c_str()), 0) << verses_errmsg();
    ASSERT_EQ(verses_write_sqlite(cur, path.c_str()), 0) << verses_errmsg();
    verses_close(cur);

    sqlite3* db = nullptr;
    ASSERT_EQ(sqlite3_open(path.c_str(), &db), SQLITE_OK);
    EXPECT_EQ(count_rows(db, "SELECT COUNT(*) FROM texts"), 3);
    EXPECT_EQ(count_rows(db, "SELECT COUNT(*) FROM text_verses"), 4);
    EXPECT_EQ(count_rows(db, "SELECT text_id FROM text_verses WHERE verse_number = 59"), 1);

    sqlite3_stmt* stmt = nullptr;
    ASSERT_EQ(sqlite3_prepare_v2(db, "SELECT label, text_body FROM texts WHERE id = 2",
                                 -1, &stmt, nullptr), SQLITE_OK);
    ASSERT_EQ(sqlite3_step(stmt), SQLITE_ROW);
    EXPECT_STREQ(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)), "57");
    EXPECT_STREQ(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1)), "Say \"no\"");
    sqlite3_finalize(stmt);
    sqlite3_close(db);

    std::remove(path.c_str());
}

TEST(ApiTest, JsonViewsReplaceInvalidUtf8) {
    std::string doc =
        "<html><body>"
        "<div class='ocr_page' title='bbox 0 0 500 1000'>" +
        line(10, 100, word(10, 100, "4") + word(60, 100, "caf\xE9") + word(110, 100, "noir")) +
        "</div></body></html>";
    verses_cursor* cur = verses_open_hocr(doc.data(), doc.size(), nullptr);
    ASSERT_NE(cur, nullptr) << verses_errmsg();

    const verses_text* t = verses_next_text(cur);
    ASSERT_NE(t, nullptr);
    EXPECT_STREQ(t->body, "caf\xE9 noir");
    verses_close(cur);

    /* same bytes through the JSON views */
    cur = verses_open_hocr(doc.data(), doc.size(), nullptr);
    ASSERT_NE(cur, nullptr);
    const char* raw = verses_next_text_json(cur);
    ASSERT_NE(raw, nullptr);
    json obj = json::parse(raw);
    EXPECT_EQ(obj["label"], "4");
    EXPECT_EQ(obj["text_body"], "caf\xEF\xBF\xBD noir");

    raw = verses_next_verse_json(cur);
    ASSERT_NE(raw, nullptr);
    EXPECT_EQ(json::parse(raw)["text"], "caf\xEF\xBF\xBD noir");
    verses_close(cur);
}
