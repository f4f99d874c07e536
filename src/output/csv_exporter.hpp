#pragma once

#include "review/anomaly_review.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace apwatch::output {

/// Spreadsheet export of anomaly rows (RFC 4180 quoting, CRLF line endings)
class CsvExporter {
public:
    /// Write header and one line per row
    static void write(std::ostream& os, const std::vector<AnomalyRow>& rows);

    [[nodiscard]] static std::string to_string(const std::vector<AnomalyRow>& rows);

    [[nodiscard]] static std::vector<std::string> headers();

    /// Quote a field if it contains a comma, quote or line break
    [[nodiscard]] static std::string escape_field(const std::string& field);

private:
    static void write_row(std::ostream& os, const std::vector<std::string>& fields);
};

}  // namespace apwatch::output
