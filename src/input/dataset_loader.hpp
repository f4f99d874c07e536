#pragma once

#include "core/records.hpp"
#include "core/status.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace apwatch {

/// Canonical records for any number of tenants
struct Dataset {
    std::vector<TenantRecords> tenants;
};

/// Parser for canonical vendor/bill JSON documents
/// Converts raw JSON to typed records; field mapping from accounting systems happens upstream.
class DatasetLoader {
public:
    /// Parse a dataset document
    [[nodiscard]] static Result<Dataset> parse(std::string_view json);

    /// Read and parse a dataset file
    [[nodiscard]] static Result<Dataset> load_file(const std::string& path);
};

}  // namespace apwatch
