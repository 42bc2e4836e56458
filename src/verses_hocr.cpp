#include "verses_types.h"

#include <pugixml.hpp>

#include <string>
#include <vector>

/* ── helpers ─────────────────────────────────────────────────────── */

/* descendants whose class attribute contains the given token */
static std::string class_xpath(const char* cls) {
    return std::string(".//*[contains(concat(' ', normalize-space(@class), ' '), ' ") +
           cls + " ')]";
}

/* concatenated text of an element and all its descendants */
static void append_text(const pugi::xml_node& node, std::string& out) {
    for (auto& child : node.children()) {
        switch (child.type()) {
            case pugi::node_pcdata:
            case pugi::node_cdata:
                out += child.value();
                break;
            case pugi::node_element:
                append_text(child, out);
                break;
            default:
                break;
        }
    }
}

static RawLine read_line(const pugi::xml_node& line, const pugi::xpath_query& word_q) {
    RawLine rl;
    rl.title = line.attribute("title").value();

    pugi::xpath_node_set words = word_q.evaluate_node_set(line);
    rl.words.reserve(words.size());
    for (auto& xw : words) {
        RawWord rw;
        rw.title = xw.node().attribute("title").value();
        append_text(xw.node(), rw.text);
        rl.words.push_back(std::move(rw));
    }
    return rl;
}

/* ── extract ─────────────────────────────────────────────────────── */

VerseResult extract_hocr(const void* buf, size_t len, const ExtractConfig& cfg) {
    VerseResult result;
    result.source_type = "hocr";
    result.page_count  = 0;
    result.pages_used  = 0;

    /* keep whitespace-only text between inline children of a word */
    pugi::xml_document doc;
    pugi::xml_parse_result pr =
        doc.load_buffer(buf, len, pugi::parse_default | pugi::parse_ws_pcdata);
    if (!pr) {
        result.page_count = -1;
        result.error = std::string("parse hOCR: ") + pr.description() +
                       " at offset " + std::to_string(pr.offset);
        return result;
    }

    pugi::xpath_query page_q(class_xpath("ocr_page").c_str());
    pugi::xpath_query line_q(class_xpath("ocr_line").c_str());
    pugi::xpath_query word_q(class_xpath("ocrx_word").c_str());

    pugi::xpath_node_set pages = page_q.evaluate_node_set(doc);
    result.page_count = static_cast<int>(pages.size());

    for (auto& xp : pages) {
        RawPage page;
        page.title = xp.node().attribute("title").value();

        /* outside the window: no lines extracted, no effect on verses */
        if (!page_in_window(page.title, cfg.page_min, cfg.page_max)) continue;

        pugi::xpath_node_set lines = line_q.evaluate_node_set(xp.node());
        page.lines.reserve(lines.size());
        for (auto& xl : lines)
            page.lines.push_back(read_line(xl.node(), word_q));

        if (stitch_page(page, cfg.lines, result.verses))
            result.pages_used++;
    }

    result.entities = assemble_texts(result.verses, cfg.pairs, cfg.order);
    return result;
}
