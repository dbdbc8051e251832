#pragma once
#include <libintl.h>
#include <chrono>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "Discovery.hpp"

#ifndef PREFIXRUN_GETTEXT_DEFINED
#define _(String) gettext(String)
#define PREFIXRUN_GETTEXT_DEFINED
#endif

namespace prefixrun {
    using Clock = std::chrono::system_clock;

    enum class RecordState {
        InProgress, // start_time set
        Finalized // end_time, elapsed and status set
    };

    // Bookkeeping for one execution attempt. A file that was never started has no record.
    struct RunRecord {
        RecordState state = RecordState::InProgress;
        Clock::time_point start_time{};
        Clock::time_point end_time{};
        double elapsed_minutes = 0.0;
        bool ran_successfully = false;
        std::optional<int> exit_status;
        std::string error; // InvocationFailure message, empty on success
    };

    enum class RunStatus { NotAttempted, Success, Failure };

    struct ReportRow {
        long long order = 0;
        std::string name;
        std::string start_time;
        std::string end_time;
        std::string elapsed_minutes;
        RunStatus status = RunStatus::NotAttempted;
    };

    struct RunReport {
        std::vector<ReportRow> rows;

        [[nodiscard]] bool succeeded() const; // every file ran successfully
    };

    // records[i] belongs to files[i]; missing or empty slots are "not attempted".
    [[nodiscard]] RunReport make_report(const std::vector<OrderedFile> &files,
                                        const std::vector<std::optional<RunRecord> > &records);

    [[nodiscard]] std::vector<std::string> report_headers();

    [[nodiscard]] std::string status_label(RunStatus status);

    [[nodiscard]] std::string format_timestamp(Clock::time_point tp);

    [[nodiscard]] std::string format_minutes(double minutes);

    // Terminal columns taken by UTF-8 text.
    [[nodiscard]] size_t display_width(const std::string &text);

    // psql-style aligned table; numeric columns are right aligned.
    [[nodiscard]] std::string render_table(const std::vector<std::string> &headers,
                                           const std::vector<std::vector<std::string> > &rows);

    [[nodiscard]] std::string to_string(const RunReport &report);

    std::ostream &operator<<(std::ostream &os, const RunReport &report);
} // namespace prefixrun
