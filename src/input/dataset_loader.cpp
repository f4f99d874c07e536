#include "input/dataset_loader.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sstream>

namespace apwatch {

using json = nlohmann::json;

namespace {

/// Amount as JSON number or decimal string
Money parse_amount(const json& j) {
    if (j.is_string()) {
        return Money::parse(j.get<std::string>());
    }
    if (!j.is_number()) {
        throw std::invalid_argument("total_amount must be a number or decimal string");
    }
    return Money::from_double(j.get<double>());
}

Result<Vendor> parse_vendor(const json& j, TenantId tenant) {
    if (!j.is_object() || !j.contains("external_id") || !j.contains("name")) {
        return fail<Vendor>(ErrorCode::ParseError, "Vendor requires external_id and name");
    }
    Vendor vendor;
    vendor.id = j.value("id", VendorId{0});
    vendor.tenant_id = tenant;
    vendor.external_id = j["external_id"].get<std::string>();
    vendor.name = j["name"].get<std::string>();
    return Result<Vendor>::Ok(std::move(vendor));
}

Result<Bill> parse_bill(const json& j, TenantId tenant) {
    if (!j.is_object() || !j.contains("external_id") || !j.contains("vendor_id") ||
        !j.contains("total_amount") || !j.contains("txn_date")) {
        return fail<Bill>(ErrorCode::ParseError,
                          "Bill requires external_id, vendor_id, total_amount and txn_date");
    }

    Bill bill;
    bill.id = j.value("id", BillId{0});
    bill.tenant_id = tenant;
    bill.vendor_id = j["vendor_id"].get<VendorId>();
    bill.external_id = j["external_id"].get<std::string>();
    bill.bill_number = j.value("bill_number", std::string{});
    bill.has_line_items = j.value("has_line_items", false);
    bill.total_amount = parse_amount(j["total_amount"]);
    if (bill.total_amount.is_negative()) {
        return fail<Bill>(ErrorCode::ParseError,
                          "Bill " + bill.external_id + " has a negative total_amount");
    }

    auto date = dates::parse_iso(j["txn_date"].get<std::string>());
    if (date.is_err()) {
        return fail<Bill>(ErrorCode::ParseError,
                          "Bill " + bill.external_id + ": " + date.error().message);
    }
    bill.txn_date = date.value();
    return Result<Bill>::Ok(std::move(bill));
}

Result<TenantRecords> parse_tenant(const json& j) {
    if (!j.is_object() || !j.contains("id")) {
        return fail<TenantRecords>(ErrorCode::ParseError, "Tenant requires id");
    }

    TenantRecords records;
    records.tenant.id = j["id"].get<TenantId>();
    records.tenant.name = j.value("name", std::string{});
    if (records.tenant.id == 0) {
        return fail<TenantRecords>(ErrorCode::ParseError, "Tenant id must be non-zero");
    }

    if (j.contains("vendors")) {
        for (const auto& v : j["vendors"]) {
            auto vendor = parse_vendor(v, records.tenant.id);
            if (vendor.is_err()) {
                return Result<TenantRecords>::Err(vendor.error());
            }
            records.vendors.push_back(std::move(vendor).take_value());
        }
    }

    if (j.contains("bills")) {
        for (const auto& b : j["bills"]) {
            auto bill = parse_bill(b, records.tenant.id);
            if (bill.is_err()) {
                return Result<TenantRecords>::Err(bill.error());
            }
            records.bills.push_back(std::move(bill).take_value());
        }
    }

    return Result<TenantRecords>::Ok(std::move(records));
}

}  // namespace

Result<Dataset> DatasetLoader::parse(std::string_view json_str) {
    try {
        auto j = json::parse(json_str);

        if (!j.is_object() || !j.contains("tenants") || !j["tenants"].is_array()) {
            return fail<Dataset>(ErrorCode::ParseError, "Missing tenants array in dataset");
        }

        Dataset dataset;
        for (const auto& t : j["tenants"]) {
            auto tenant = parse_tenant(t);
            if (tenant.is_err()) {
                return Result<Dataset>::Err(tenant.error());
            }
            dataset.tenants.push_back(std::move(tenant).take_value());
        }
        return Result<Dataset>::Ok(std::move(dataset));

    } catch (const json::exception& e) {
        return fail<Dataset>(ErrorCode::ParseError, std::string("JSON parse error: ") + e.what());
    } catch (const std::exception& e) {
        return fail<Dataset>(ErrorCode::ParseError, std::string("Parse error: ") + e.what());
    }
}

Result<Dataset> DatasetLoader::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return fail<Dataset>(ErrorCode::NotFound, "Failed to open dataset file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = parse(buffer.str());
    if (result.is_ok()) {
        spdlog::debug("Loaded dataset {} ({} tenants)", path, result.value().tenants.size());
    }
    return result;
}

}  // namespace apwatch
