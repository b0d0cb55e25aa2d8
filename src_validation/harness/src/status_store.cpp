#include "valsim_harness/status_store.hpp"

#include <exception>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace {

using nlohmann::json;

constexpr const char* kFormat = "valsim-status";
constexpr int kVersion = 1;

json record_to_json(const valsim::harness::TestRecord& record) {
    json status = json::object();
    for (const auto phase : valsim::harness::tracked_phases()) {
        status[std::string{valsim::harness::phase_key(phase)}] =
            std::string{valsim::harness::status_key(record.status_of(phase))};
    }
    return json{
        {"format", kFormat},
        {"version", kVersion},
        {"status", std::move(status)},
        {"log", record.log},
    };
}

// Returns false (with a reason) when the document is not a status record we understand.
bool json_to_record(const json& doc, valsim::harness::TestRecord& out, std::string& reason) {
    if (!doc.is_object()) {
        reason = "document is not an object";
        return false;
    }
    const auto format = doc.find("format");
    if (format == doc.end() || !format->is_string() || format->get<std::string>() != kFormat) {
        reason = "unexpected format tag";
        return false;
    }
    const auto version = doc.find("version");
    if (version == doc.end() || !version->is_number_integer() || version->get<int>() != kVersion) {
        reason = "unsupported version";
        return false;
    }
    const auto status = doc.find("status");
    if (status == doc.end() || !status->is_object()) {
        reason = "missing status map";
        return false;
    }
    const auto log = doc.find("log");
    if (log == doc.end() || !log->is_string()) {
        reason = "missing log text";
        return false;
    }

    valsim::harness::TestRecord record;
    for (const auto phase : valsim::harness::tracked_phases()) {
        const auto key = std::string{valsim::harness::phase_key(phase)};
        const auto entry = status->find(key);
        if (entry == status->end() || !entry->is_string()) {
            reason = "missing status for phase '" + key + "'";
            return false;
        }
        const auto parsed = valsim::harness::parse_status_key(entry->get<std::string>());
        if (!parsed) {
            reason = "unknown status '" + entry->get<std::string>() + "' for phase '" + key + "'";
            return false;
        }
        record.status[phase] = *parsed;
    }
    record.log = log->get<std::string>();
    out = std::move(record);
    return true;
}

}  // namespace

namespace valsim::harness {

TestRecord StatusStore::load(const fs::path& path) const noexcept {
    std::string ignored;
    return load(path, ignored);
}

TestRecord StatusStore::load(const fs::path& path, std::string& diag) const noexcept {
    try {
        std::ifstream input(path, std::ios::binary);
        if (!input.is_open()) {
            diag += "status file not readable: " + path.string() + "\n";
            return {};
        }
        const json doc = json::parse(input, nullptr, /*allow_exceptions=*/false);
        if (doc.is_discarded()) {
            diag += "status file is not valid JSON: " + path.string() + "\n";
            return {};
        }
        TestRecord record;
        std::string reason;
        if (!json_to_record(doc, record, reason)) {
            diag += "status file ignored (" + reason + "): " + path.string() + "\n";
            return {};
        }
        return record;
    } catch (const std::exception& ex) {
        diag += "status file ignored (" + std::string{ex.what()} + "): " + path.string() + "\n";
        return {};
    }
}

bool StatusStore::save(const fs::path& path, const TestRecord& record, std::string& diag) const noexcept {
    try {
        std::error_code ec;
        if (auto parent = path.parent_path(); !parent.empty()) {
            fs::create_directories(parent, ec);
            if (ec) {
                diag += "Failed to create directory " + parent.string() + ": " + ec.message() + "\n";
                return false;
            }
        }

        // Log text comes from arbitrary tools; never let bad UTF-8 lose the status.
        const auto text = record_to_json(record).dump(2, ' ', false, json::error_handler_t::replace);

        fs::path staging = path;
        staging += ".tmp";
        {
            std::ofstream output(staging, std::ios::binary | std::ios::trunc);
            if (!output.is_open()) {
                diag += "Failed to open for write: " + staging.string() + "\n";
                return false;
            }
            output << text << '\n';
            output.flush();
            if (!output) {
                diag += "Short write: " + staging.string() + "\n";
                fs::remove(staging, ec);
                return false;
            }
        }

        fs::rename(staging, path, ec);
        if (ec) {
            diag += "Failed to move " + staging.string() + " into place: " + ec.message() + "\n";
            std::error_code ignored;
            fs::remove(staging, ignored);
            return false;
        }
        return true;
    } catch (const std::exception& ex) {
        diag += "Failed to save status " + path.string() + ": " + ex.what() + "\n";
        return false;
    }
}

}  // namespace valsim::harness
