#include "verses_types.h"

#include <algorithm>
#include <string>
#include <vector>

/* ── line builder ────────────────────────────────────────────────── */

std::vector<Line> build_lines(const BBox& page_box,
                              const std::vector<RawLine>& raw,
                              const LineConfig& cfg) {
    int foot_cut = footnote_cutoff(page_box, cfg.footnote_frac);

    std::vector<Line> lines;
    lines.reserve(raw.size());

    for (const auto& rl : raw) {
        Line line;
        if (!parse_bbox(rl.title, line.box)) continue;

        /* footnote region: the whole line goes */
        if (line.box.y0 >= foot_cut) continue;

        line.words.reserve(rl.words.size());
        for (const auto& rw : rl.words) {
            BBox wb;
            if (!parse_bbox(rw.title, wb)) continue;

            std::string text = trim_space(rw.text);
            if (text.empty()) continue;

            /* superscript: top sits above the line top by more than the threshold */
            if (wb.y0 < line.box.y0 - cfg.superscript_px) continue;

            line.words.push_back({wb.x0, std::move(text)});
        }
        if (line.words.empty()) continue;

        std::stable_sort(line.words.begin(), line.words.end(),
                         [](const Word& a, const Word& b) { return a.x < b.x; });
        lines.push_back(std::move(line));
    }

    return lines;
}
