#include "output/csv_exporter.hpp"
#include <chrono>
#include <cmath>
#include <sstream>

namespace apwatch::output {

std::vector<std::string> CsvExporter::headers() {
    return {"Date", "Vendor", "Bill #", "Anomaly Type", "Severity",
            "Amount", "Confidence %", "Description", "Status"};
}

void CsvExporter::write(std::ostream& os, const std::vector<AnomalyRow>& rows) {
    write_row(os, headers());

    for (const auto& row : rows) {
        const Anomaly& a = row.anomaly;
        std::string created = a.created_at == WallTime{}
            ? std::string{}
            : dates::to_iso(std::chrono::floor<std::chrono::days>(a.created_at));

        write_row(os, {
            created,
            row.vendor_name,
            row.bill_number,
            std::string(apwatch::to_string(a.kind())),
            std::string(apwatch::to_string(a.severity)),
            a.amount.to_string(),
            std::to_string(std::lround(a.confidence * 100.0)),
            a.description,
            std::string(apwatch::to_string(a.status))
        });
    }
}

std::string CsvExporter::to_string(const std::vector<AnomalyRow>& rows) {
    std::ostringstream oss;
    write(oss, rows);
    return oss.str();
}

std::string CsvExporter::escape_field(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }

    std::string result;
    result.reserve(field.size() + 2);
    result.push_back('"');
    for (char c : field) {
        if (c == '"') {
            result += "\"\"";
        } else {
            result.push_back(c);
        }
    }
    result.push_back('"');
    return result;
}

void CsvExporter::write_row(std::ostream& os, const std::vector<std::string>& fields) {
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            os << ',';
        }
        os << escape_field(fields[i]);
    }
    os << "\r\n";
}

}  // namespace apwatch::output
