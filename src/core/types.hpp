#pragma once

#include "core/money.hpp"
#include "core/status.hpp"
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

namespace apwatch {

// Row identifiers assigned by storage or the ingestion collaborator
using TenantId = std::uint64_t;
using VendorId = std::uint64_t;
using BillId = std::uint64_t;
using BaselineId = std::uint64_t;
using AnomalyId = std::uint64_t;

// Calendar date (transaction dates, baseline windows)
using Date = std::chrono::sys_days;

// Wall clock time for creation timestamps
using WallTime = std::chrono::system_clock::time_point;

// Confidence score in [0, 1]
using Confidence = double;

namespace dates {

/// Build a date from year/month/day
[[nodiscard]] inline Date make(int year, unsigned month, unsigned day) {
    return Date{std::chrono::year{year} / std::chrono::month{month} / std::chrono::day{day}};
}

/// Current UTC calendar date
[[nodiscard]] inline Date today() {
    return std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now());
}

/// Signed number of days from `from` to `to`
[[nodiscard]] inline std::int64_t days_between(Date from, Date to) noexcept {
    return (to - from).count();
}

[[nodiscard]] inline Date minus_days(Date d, std::int64_t days) noexcept {
    return d - std::chrono::days{days};
}

/// Format as ISO 8601 "YYYY-MM-DD"
[[nodiscard]] inline std::string to_iso(Date d) {
    std::chrono::year_month_day ymd{d};
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()));
    return buf;
}

/// Parse ISO 8601 "YYYY-MM-DD"
[[nodiscard]] inline Result<Date> parse_iso(std::string_view s) {
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') {
        return fail<Date>(ErrorCode::ParseError, "Invalid date format (expected YYYY-MM-DD): " + std::string(s));
    }

    int year = 0;
    unsigned month = 0;
    unsigned day = 0;
    auto parse_part = [](std::string_view part, auto& out) {
        auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), out);
        return ec == std::errc{} && ptr == part.data() + part.size();
    };
    if (!parse_part(s.substr(0, 4), year) || !parse_part(s.substr(5, 2), month) ||
        !parse_part(s.substr(8, 2), day)) {
        return fail<Date>(ErrorCode::ParseError, "Invalid date digits: " + std::string(s));
    }

    std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{month},
                                    std::chrono::day{day}};
    if (!ymd.ok()) {
        return fail<Date>(ErrorCode::ParseError, "Date out of range: " + std::string(s));
    }
    return Result<Date>::Ok(Date{ymd});
}

}  // namespace dates

}  // namespace apwatch
