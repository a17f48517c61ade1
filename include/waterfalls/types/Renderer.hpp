#pragma once
/**
 * @file Renderer.hpp
 * @brief Waterfall chart renderers: terminal text and SVG image.
 */

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

#include "Block.hpp"
#include "../namespaces/time_units.hpp"
#include "../namespaces/viewer.hpp"

namespace waterfalls {

struct RenderOptions {
    bool lines = false;     ///< Separator line between rows
    bool colorize = false;  ///< ANSI colors per thread (text renderer only)
};

/**
 * @brief Draws a prepared Chart: one row per group, one bar per record.
 */
class Renderer {
public:
    virtual ~Renderer() = default;

    /**
     * @return true when the chart was fully written
     */
    virtual bool render(const Chart& chart) = 0;
};

namespace render_utils {

/**
 * @brief Row label on one line: "name\nthread: 7" -> "name [thread: 7]".
 */
inline std::string single_line_label(const std::string& label) {
    size_t nl = label.find('\n');
    if (nl == std::string::npos) return label;
    return label.substr(0, nl) + " [" + label.substr(nl + 1) + "]";
}

inline std::vector<std::string> split_lines(const std::string& label) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t nl = label.find('\n', start);
        lines.push_back(label.substr(start, nl == std::string::npos ? std::string::npos : nl - start));
        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    return lines;
}

/**
 * @brief Whether the blocks of a row overlap, comparing in start order.
 */
inline bool row_has_overlap(const TimerGroup& group) {
    std::vector<ReportRecord> sorted = group.records;
    std::stable_sort(sorted.begin(), sorted.end(), [](const ReportRecord& a, const ReportRecord& b) {
        return a.start_time < b.start_time;
    });
    return viewer::detect_overlap(sorted);
}

inline std::string format_value(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4g", v);
    return buf;
}

inline std::string xml_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&':  out += "&amp;";  break;
            case '<':  out += "&lt;";   break;
            case '>':  out += "&gt;";   break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default:   out += c;        break;
        }
    }
    return out;
}

} // namespace render_utils

/**
 * @brief Draws the chart with characters, one line per row.
 *
 * Bars use '#' when the thread was on the CPU for at least half of the
 * block and '=' otherwise. Rows whose blocks overlap are marked with '*'.
 */
class TextRenderer : public Renderer {
public:
    explicit TextRenderer(FILE* out = stdout, RenderOptions options = {}, int width = 60)
        : out_(out ? out : stdout), options_(options), width_(width > 0 ? width : 60) {}

    inline bool render(const Chart& chart) override {
        size_t label_width = 5;
        for (const TimerGroup& g : chart.groups) {
            label_width = std::max(label_width, render_utils::single_line_label(g.label).size());
        }
        const std::string separator(label_width + (size_t)width_ + 5, '-');

        std::fprintf(out_, "%-*s  |%s|  total (%s)\n", (int)label_width, "timer",
                     std::string((size_t)width_, ' ').c_str(), time_units::symbol(chart.unit));

        for (size_t i = 0; i < chart.groups.size(); ++i) {
            const TimerGroup& g = chart.groups[i];
            if (options_.lines && i > 0) std::fprintf(out_, "%s\n", separator.c_str());

            int64_t busy = 0;
            for (const ReportRecord& r : g.records) busy += r.duration();

            std::fprintf(out_, "%-*s %c|", (int)label_width,
                         render_utils::single_line_label(g.label).c_str(),
                         render_utils::row_has_overlap(g) ? '*' : ' ');
            write_bar(chart, g);
            std::fprintf(out_, "|  %s\n", render_utils::format_value(time_units::convert(busy, chart.unit)).c_str());
        }

        const std::string end_value = render_utils::format_value(time_units::convert(chart.time_total, chart.unit));
        std::string axis((size_t)width_, ' ');
        axis[0] = '0';
        if (end_value.size() < axis.size()) {
            axis.replace(axis.size() - end_value.size(), end_value.size(), end_value);
        }
        std::fprintf(out_, "%-*s   %s %s\n", (int)label_width, "", axis.c_str(), time_units::name(chart.unit));
        std::fprintf(out_, "'#' cpu-bound  '=' waiting  '*' overlapping blocks\n");
        std::fflush(out_);
        return std::ferror(out_) == 0;
    }

private:
    inline void write_bar(const Chart& chart, const TimerGroup& g) {
        std::string cells((size_t)width_, ' ');
        for (const ReportRecord& r : g.records) {
            int from = column(chart, r.start_time);
            int to = column(chart, r.stop_time);
            if (to <= from) to = from + 1;
            const char fill = r.cpu_ratio() >= 0.5 ? '#' : '=';
            for (int c = from; c < to && c < width_; ++c) cells[(size_t)c] = fill;
        }

        if (options_.colorize && !g.records.empty()) {
            static const char* colors[] = {
                "\033[31m",  // Red
                "\033[32m",  // Green
                "\033[33m",  // Yellow
                "\033[34m",  // Blue
                "\033[35m",  // Magenta
                "\033[36m",  // Cyan
            };
            std::fprintf(out_, "%s%s\033[0m", colors[g.records.front().thread_id % 6], cells.c_str());
        } else {
            std::fprintf(out_, "%s", cells.c_str());
        }
    }

    inline int column(const Chart& chart, int64_t t) const {
        if (chart.time_total <= 0) return 0;
        double x = (double)(t - chart.time_min) * (double)width_ / (double)chart.time_total;
        return std::max(0, std::min(width_, (int)std::lround(x)));
    }

    FILE* out_;
    RenderOptions options_;
    int width_;
};

/**
 * @brief Writes the chart as a standalone SVG file.
 *
 * Bar shade follows the CPU ratio of the block: darker means more time on
 * the CPU. Each bar carries a tooltip with its text and duration.
 */
class SvgRenderer : public Renderer {
public:
    explicit SvgRenderer(std::string path, RenderOptions options = {})
        : path_(std::move(path)), options_(options) {}

    inline const std::string& path() const { return path_; }

    inline bool render(const Chart& chart) override {
        FILE* f = std::fopen(path_.c_str(), "w");
        if (!f) return false;

        const int rows = (int)chart.groups.size();
        const int height = kTop + rows * kRowHeight + kAxisHeight;
        const int chart_width = kWidth - kLabelWidth - kMargin;

        std::fprintf(f, "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n");
        std::fprintf(f, "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"%d\" height=\"%d\" "
                        "viewBox=\"0 0 %d %d\" font-family=\"sans-serif\" font-size=\"12\">\n",
                     kWidth, height, kWidth, height);
        std::fprintf(f, "<rect width=\"100%%\" height=\"100%%\" fill=\"white\"/>\n");
        std::fprintf(f, "<text x=\"%d\" y=\"20\" font-size=\"14\">waterfalls</text>\n", kMargin);

        for (int i = 0; i < rows; ++i) {
            const TimerGroup& g = chart.groups[(size_t)i];
            const int y = kTop + i * kRowHeight;

            std::vector<std::string> lines = render_utils::split_lines(g.label);
            std::fprintf(f, "<text x=\"%d\" y=\"%d\" text-anchor=\"end\">", kLabelWidth - 8,
                         y + kRowHeight / 2 - 6 * ((int)lines.size() - 1) + 4);
            for (size_t l = 0; l < lines.size(); ++l) {
                std::fprintf(f, "<tspan x=\"%d\" dy=\"%d\">%s</tspan>", kLabelWidth - 8, l == 0 ? 0 : 12,
                             render_utils::xml_escape(lines[l]).c_str());
            }
            std::fprintf(f, "</text>\n");

            for (const ReportRecord& r : g.records) {
                const double x0 = position(chart, r.start_time, chart_width);
                const double x1 = position(chart, r.stop_time, chart_width);
                const double w = std::max(1.0, x1 - x0);
                const double ratio = r.cpu_ratio();
                const int shade_r = (int)std::lround(174 - ratio * (174 - 31));
                const int shade_g = (int)std::lround(199 - ratio * (199 - 78));
                const int shade_b = (int)std::lround(232 - ratio * (232 - 121));

                std::string tip = r.text ? *r.text + ": " : std::string();
                tip += render_utils::format_value(time_units::convert(r.duration(), chart.unit)) + " " +
                       time_units::symbol(chart.unit) + ", cpu " +
                       render_utils::format_value(ratio * 100.0) + "%";

                std::fprintf(f, "<rect x=\"%.2f\" y=\"%d\" width=\"%.2f\" height=\"%d\" "
                                "fill=\"rgb(%d,%d,%d)\" stroke=\"#1f4e79\" stroke-width=\"0.5\">"
                                "<title>%s</title></rect>\n",
                             kLabelWidth + x0, y + (kRowHeight - kBarHeight) / 2, w, kBarHeight,
                             shade_r, shade_g, shade_b, render_utils::xml_escape(tip).c_str());
            }

            if (options_.lines) {
                std::fprintf(f, "<line x1=\"%d\" y1=\"%d\" x2=\"%d\" y2=\"%d\" stroke=\"#cccccc\"/>\n",
                             kMargin, y + kRowHeight, kWidth - kMargin, y + kRowHeight);
            }
        }

        const int axis_y = kTop + rows * kRowHeight + 4;
        std::fprintf(f, "<line x1=\"%d\" y1=\"%d\" x2=\"%d\" y2=\"%d\" stroke=\"black\"/>\n",
                     kLabelWidth, axis_y, kLabelWidth + chart_width, axis_y);
        for (int t = 0; t <= kTicks; ++t) {
            const double x = kLabelWidth + (double)chart_width * t / kTicks;
            const double value = time_units::convert(chart.time_total, chart.unit) * t / kTicks;
            std::fprintf(f, "<line x1=\"%.2f\" y1=\"%d\" x2=\"%.2f\" y2=\"%d\" stroke=\"black\"/>", x, axis_y, x, axis_y + 4);
            std::fprintf(f, "<text x=\"%.2f\" y=\"%d\" text-anchor=\"middle\">%s</text>\n", x, axis_y + 16,
                         render_utils::format_value(value).c_str());
        }
        std::fprintf(f, "<text x=\"%d\" y=\"%d\" text-anchor=\"middle\">time (%s)</text>\n",
                     kLabelWidth + chart_width / 2, axis_y + 32, time_units::name(chart.unit));
        std::fprintf(f, "</svg>\n");

        const bool ok = std::ferror(f) == 0;
        return std::fclose(f) == 0 && ok;
    }

private:
    static constexpr int kWidth = 1200;
    static constexpr int kLabelWidth = 220;
    static constexpr int kMargin = 20;
    static constexpr int kTop = 30;
    static constexpr int kRowHeight = 30;
    static constexpr int kBarHeight = 18;
    static constexpr int kAxisHeight = 50;
    static constexpr int kTicks = 5;

    inline double position(const Chart& chart, int64_t t, int chart_width) const {
        if (chart.time_total <= 0) return 0.0;
        return (double)(t - chart.time_min) * chart_width / (double)chart.time_total;
    }

    std::string path_;
    RenderOptions options_;
};

} // namespace waterfalls
