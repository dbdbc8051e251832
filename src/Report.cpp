#include "../include/Report.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <cwchar>
#include <iomanip>
#include <ostream>
#include <sstream>

using namespace prefixrun;

namespace {
    const std::string kNA = "NA";

    bool is_number(const std::string &s) {
        if (s.empty()) return false;
        size_t i = (s[0] == '-' || s[0] == '+') ? 1 : 0;
        bool digit = false;
        bool dot = false;
        for (; i < s.size(); ++i) {
            if (std::isdigit(static_cast<unsigned char>(s[i]))) digit = true;
            else if (s[i] == '.' && !dot) dot = true;
            else return false;
        }
        return digit;
    }

    // Decodes one UTF-8 sequence at s[i]; malformed bytes count as one code point.
    char32_t next_code_point(const std::string &s, size_t &i) {
        const auto lead = static_cast<unsigned char>(s[i++]);
        int extra = 0;
        char32_t cp = lead;
        if (lead >= 0xF0 && lead < 0xF8) {
            extra = 3;
            cp = lead & 0x07;
        } else if (lead >= 0xE0) {
            extra = lead < 0xF0 ? 2 : 0;
            cp = extra ? lead & 0x0F : lead;
        } else if (lead >= 0xC0) {
            extra = 1;
            cp = lead & 0x1F;
        }
        for (; extra > 0 && i < s.size(); --extra) {
            const auto b = static_cast<unsigned char>(s[i]);
            if ((b & 0xC0) != 0x80) return 0xFFFD;
            cp = (cp << 6) | (b & 0x3F);
            ++i;
        }
        return extra ? 0xFFFD : cp;
    }

    std::string rule(const std::vector<size_t> &widths, const char edge, const char joint) {
        std::string out(1, edge);
        for (size_t c = 0; c < widths.size(); ++c) {
            if (c) out.push_back(joint);
            out.append(widths[c] + 2, '-');
        }
        out.push_back(edge);
        return out;
    }
} // namespace

bool RunReport::succeeded() const {
    return std::all_of(rows.begin(), rows.end(), [](const ReportRow &r) { return r.status == RunStatus::Success; });
}

RunReport prefixrun::make_report(const std::vector<OrderedFile> &files,
                                 const std::vector<std::optional<RunRecord> > &records) {
    RunReport report;
    report.rows.reserve(files.size());
    for (size_t i = 0; i < files.size(); ++i) {
        ReportRow row;
        row.order = files[i].order;
        row.name = files[i].name;
        if (i < records.size() && records[i].has_value()) {
            const auto &rec = *records[i];
            row.start_time = format_timestamp(rec.start_time);
            if (rec.state == RecordState::Finalized) {
                row.end_time = format_timestamp(rec.end_time);
                row.elapsed_minutes = format_minutes(rec.elapsed_minutes);
                row.status = rec.ran_successfully ? RunStatus::Success : RunStatus::Failure;
            } else {
                // only reachable when something other than an InvocationFailure escaped run()
                row.end_time = kNA;
                row.elapsed_minutes = kNA;
                row.status = RunStatus::Failure;
            }
        } else {
            row.start_time = kNA;
            row.end_time = kNA;
            row.elapsed_minutes = kNA;
            row.status = RunStatus::NotAttempted;
        }
        report.rows.push_back(std::move(row));
    }
    return report;
}

std::vector<std::string> prefixrun::report_headers() {
    return {_("Order"), _("File name"), _("Start time"), _("End time"), _("Time elapsed (mins)"), _("Status")};
}

std::string prefixrun::status_label(const RunStatus status) {
    switch (status) {
        case RunStatus::Success: return _("Success");
        case RunStatus::Failure: return _("Failure");
        case RunStatus::NotAttempted: return kNA;
    }
    return kNA;
}

std::string prefixrun::format_timestamp(const Clock::time_point tp) {
    const std::time_t t = Clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&t, &local);
    std::ostringstream os;
    os << std::put_time(&local, "%c");
    return os.str();
}

std::string prefixrun::format_minutes(const double minutes) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(4) << minutes;
    return os.str();
}

size_t prefixrun::display_width(const std::string &text) {
    size_t width = 0;
    for (size_t i = 0; i < text.size();) {
        const char32_t cp = next_code_point(text, i);
        // wcwidth knows double-width and combining glyphs under a UTF-8 locale, -1 otherwise
        const int w = ::wcwidth(static_cast<wchar_t>(cp));
        width += w >= 0 ? static_cast<size_t>(w) : 1;
    }
    return width;
}

std::string prefixrun::render_table(const std::vector<std::string> &headers,
                                    const std::vector<std::vector<std::string> > &rows) {
    const size_t cols = headers.size();
    std::vector<size_t> widths(cols, 0);
    std::vector<bool> numeric(cols, true);
    for (size_t c = 0; c < cols; ++c) widths[c] = display_width(headers[c]);
    for (const auto &row: rows) {
        for (size_t c = 0; c < cols; ++c) {
            const std::string &cell = c < row.size() ? row[c] : kNA;
            widths[c] = std::max(widths[c], display_width(cell));
            if (cell != kNA && !is_number(cell)) numeric[c] = false;
        }
    }

    std::ostringstream os;
    auto line = [&](const std::vector<std::string> &cells, const bool header) {
        os << "|";
        for (size_t c = 0; c < cols; ++c) {
            const std::string &cell = c < cells.size() ? cells[c] : kNA;
            const size_t pad = widths[c] - display_width(cell);
            os << " ";
            if (numeric[c] && !header) os << std::string(pad, ' ') << cell;
            else os << cell << std::string(pad, ' ');
            os << " |";
        }
        os << "\n";
    };

    os << rule(widths, '+', '+') << "\n";
    line(headers, true);
    os << rule(widths, '|', '+') << "\n";
    for (const auto &row: rows) line(row, false);
    os << rule(widths, '+', '+');
    return os.str();
}

std::string prefixrun::to_string(const RunReport &report) {
    std::vector<std::vector<std::string> > cells;
    cells.reserve(report.rows.size());
    for (const auto &r: report.rows) {
        cells.push_back({
            std::to_string(r.order), r.name, r.start_time, r.end_time, r.elapsed_minutes, status_label(r.status)
        });
    }
    return render_table(report_headers(), cells);
}

std::ostream &prefixrun::operator<<(std::ostream &os, const RunReport &report) {
    return os << to_string(report);
}
