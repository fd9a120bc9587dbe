#pragma once

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <limits>
#include <string>
#include <vector>
#include <fmt/format.h>

namespace pw::shell {

enum class Align { Left, Right };

struct Column {
    std::string header;
    Align align = Align::Left;
    std::size_t min = 1;
    std::size_t max = std::numeric_limits<std::size_t>::max();
    bool ellipsize_middle = false;   // clamp with "..." in the middle (host names)
};

class Table {
public:
    explicit Table(std::vector<Column> cols, int term_width = 0)
        : cols_(std::move(cols)), term_width_(term_width) {}

    void add_row(std::vector<std::string> cells) { rows_.push_back(std::move(cells)); }

    [[nodiscard]] bool empty() const { return rows_.empty(); }

    [[nodiscard]] std::string render() const {
        if (cols_.empty()) return {};

        const std::size_t ncol = cols_.size();
        std::vector<std::size_t> width(ncol, 0);
        for (std::size_t i = 0; i < ncol; ++i) width[i] = std::max(cols_[i].min, cols_[i].header.size());
        for (const auto& r : rows_)
            for (std::size_t i = 0; i < ncol && i < r.size(); ++i)
                width[i] = std::max(width[i], std::min(cols_[i].max, r[i].size()));

        constexpr std::size_t pad_left = 2;
        constexpr std::size_t gap = 2;
        constexpr int fallback_term = 120;
        const auto tw = static_cast<std::size_t>(term_width_ > 0 ? term_width_ : fallback_term);

        auto total = [&] {
            std::size_t sum = pad_left + gap * (ncol - 1);
            for (const auto w : width) sum += w;
            return sum;
        };

        // shrink the widest ellipsizable column first
        for (std::size_t i = 0; i < ncol; ++i) width[i] = std::clamp(width[i], cols_[i].min, cols_[i].max);
        while (total() > tw) {
            std::size_t victim = ncol;
            for (std::size_t i = 0; i < ncol; ++i)
                if (cols_[i].ellipsize_middle && width[i] > cols_[i].min && (victim == ncol || width[i] > width[victim]))
                    victim = i;
            if (victim == ncol) break;
            --width[victim];
        }

        std::string out;
        out.reserve(128 + rows_.size() * 96);

        auto emitLine = [&](const std::vector<std::string>& cells, const bool clamp) {
            out += std::string(pad_left, ' ');
            for (std::size_t i = 0; i < ncol; ++i) {
                if (i) out += std::string(gap, ' ');
                std::string cell = i < cells.size() ? cells[i] : "";
                if (clamp && cell.size() > width[i])
                    cell = cols_[i].ellipsize_middle ? ellipsizeMiddle(cell, width[i]) : cell.substr(0, width[i]);
                if (cols_[i].align == Align::Left)
                    fmt::format_to(std::back_inserter(out), "{:<{}}", cell, width[i]);
                else
                    fmt::format_to(std::back_inserter(out), "{:>{}}", cell, width[i]);
            }
            out += '\n';
        };

        std::vector<std::string> headers;
        for (const auto& c : cols_) headers.push_back(c.header);
        emitLine(headers, false);

        out += std::string(pad_left, ' ');
        for (std::size_t i = 0; i < ncol; ++i) {
            if (i) out += std::string(gap, ' ');
            out += std::string(width[i], '-');
        }
        out += '\n';

        for (const auto& r : rows_) emitLine(r, true);
        return out;
    }

private:
    std::vector<Column> cols_;
    std::vector<std::vector<std::string>> rows_;
    int term_width_ = 0;

    static std::string ellipsizeMiddle(const std::string& s, const std::size_t width) {
        if (s.size() <= width) return s;
        if (width <= 3) return s.substr(0, width);
        const std::size_t keep = width - 3;
        const std::size_t left = keep / 2;
        return s.substr(0, left) + "..." + s.substr(s.size() - (keep - left));
    }
};

}
