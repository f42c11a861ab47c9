/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "nvs_parser.h"

#include "nvs/nvs_bytes.h"
#include "nvs/nvs_error.h"
#include "nvs/nvs_record_encoder.h"
#include "utils/fs_utils.h"
#include "utils/log.h"

#include <chrono>
#include <cstdio>
#include <limits>
#include <stdexcept>

namespace espnvs {

static std::string hex32(std::uint32_t v) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "0x%08X", static_cast<unsigned>(v));
    return buf;
}

static std::string_view page_status_name(nvs::PageStatus status) {
    switch (status) {
        case nvs::PageStatus::Decoded:
            return "decoded";
        case nvs::PageStatus::Empty:
            return "empty";
        case nvs::PageStatus::Skipped:
            return "skipped";
        case nvs::PageStatus::Corrupt:
            return "corrupt";
    }
    return "corrupt";
}

// Well-formed UTF-8 only: no overlongs, no surrogates, nothing above U+10FFFF.
static bool is_valid_utf8(std::string_view s) {
    std::size_t i = 0;
    while (i < s.size()) {
        const auto c = static_cast<unsigned char>(s[i]);
        std::size_t n = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (c < 0x80) {
            i++;
            continue;
        } else if (c >= 0xC2 && c <= 0xDF) {
            n = 1;
        } else if (c >= 0xE0 && c <= 0xEF) {
            n = 2;
            lo = c == 0xE0 ? 0xA0 : 0x80;
            hi = c == 0xED ? 0x9F : 0xBF;
        } else if (c >= 0xF0 && c <= 0xF4) {
            n = 3;
            lo = c == 0xF0 ? 0x90 : 0x80;
            hi = c == 0xF4 ? 0x8F : 0xBF;
        } else {
            return false;
        }
        if (s.size() - i <= n) {
            return false;
        }
        for (std::size_t k = 1; k <= n; k++) {
            const auto cc = static_cast<unsigned char>(s[i + k]);
            const unsigned char min = k == 1 ? lo : 0x80;
            const unsigned char max = k == 1 ? hi : 0xBF;
            if (cc < min || cc > max) {
                return false;
            }
        }
        i += n + 1;
    }
    return true;
}

static nlohmann::ordered_json record_to_json(const nvs::Record& rec) {
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    j["namespace"] = rec.ns;
    j["key"] = rec.key;
    j["type"] = std::string(nvs::item_type_name(rec.type));
    if (rec.is_integer()) {
        if (nvs::is_signed(rec.type)) {
            j["value"] = rec.int_value;
        } else {
            j["value"] = rec.uint_value;
        }
    } else if (rec.is_string()) {
        if (is_valid_utf8(rec.string_value)) {
            j["value"] = rec.string_value;
        } else {
            // Raw flash bytes that are not text keep every byte as hex.
            j["value"] = nvs::bytes_to_hex(std::vector<std::uint8_t>(
                rec.string_value.begin(), rec.string_value.end()
            ));
            j["encoding"] = "hex";
        }
    } else if (rec.blob_file.has_value()) {
        j["value"] = nlohmann::ordered_json{{"file", rec.blob_file->generic_string()}};
    } else {
        j["value"] = nvs::bytes_to_hex(rec.blob_value);
    }
    return j;
}

static nlohmann::ordered_json warning_to_json(const nvs::Warning& w) {
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    j["kind"] = std::string(nvs::warning_kind_name(w.kind));
    j["page"] = w.page_index;
    if (w.slot.has_value()) {
        j["slot"] = *w.slot;
    }
    if (w.ns.has_value()) {
        j["namespace"] = *w.ns;
    }
    if (w.key.has_value()) {
        j["key"] = *w.key;
    }
    j["detail"] = w.detail;
    return j;
}

static nlohmann::ordered_json page_to_json(const nvs::PageSummary& p) {
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    j["index"] = p.index;
    j["status"] = std::string(page_status_name(p.status));
    j["state"] = std::string(nvs::page_state_name(p.header.state));
    if (p.header.state == nvs::PageState::Invalid) {
        j["rawState"] = hex32(p.header.raw_state);
    }
    if (p.status == nvs::PageStatus::Empty) {
        return j;
    }
    j["seq"] = p.header.seq;
    j["version"] = p.header.version;
    if (p.status == nvs::PageStatus::Decoded) {
        j["written"] = p.written;
        j["erased"] = p.erased;
        j["empty"] = p.empty;
        j["illegal"] = p.illegal;
        j["items"] = p.items;
    }
    return j;
}

// Decimal, or hex with a 0x prefix. A leading zero never means octal.
static int integer_text_base(const std::string& s) {
    const std::size_t digits = !s.empty() && (s[0] == '-' || s[0] == '+') ? 1 : 0;
    if (s.size() > digits + 1 && s[digits] == '0' && (s[digits + 1] == 'x' || s[digits + 1] == 'X')) {
        return 16;
    }
    return 10;
}

static std::uint64_t parse_unsigned_text(const std::string& s, const std::string& label) {
    std::size_t used = 0;
    std::uint64_t v = 0;
    try {
        v = std::stoull(s, &used, integer_text_base(s));
    } catch (const std::exception&) {
        throw std::runtime_error("invalid integer '" + s + "' for " + label);
    }
    if (used != s.size() || (!s.empty() && s[0] == '-')) {
        throw std::runtime_error("invalid unsigned integer '" + s + "' for " + label);
    }
    return v;
}

static std::int64_t parse_signed_text(const std::string& s, const std::string& label) {
    std::size_t used = 0;
    std::int64_t v = 0;
    try {
        v = std::stoll(s, &used, integer_text_base(s));
    } catch (const std::exception&) {
        throw std::runtime_error("invalid integer '" + s + "' for " + label);
    }
    if (used != s.size()) {
        throw std::runtime_error("invalid integer '" + s + "' for " + label);
    }
    return v;
}

static nvs::Record record_from_json(
    const nlohmann::ordered_json& j,
    std::size_t index,
    const std::filesystem::path& base_dir
) {
    const std::string where = "entries[" + std::to_string(index) + "]";
    if (!j.is_object()) {
        throw std::runtime_error(where + " is not an object");
    }
    for (const char* field : {"namespace", "key", "type"}) {
        if (!j.contains(field) || !j.at(field).is_string()) {
            throw std::runtime_error(where + " is missing string field '" + field + "'");
        }
    }
    if (!j.contains("value")) {
        throw std::runtime_error(where + " is missing field 'value'");
    }

    const auto ns = j.at("namespace").get<std::string>();
    const auto key = j.at("key").get<std::string>();
    const auto type_name = j.at("type").get<std::string>();
    const std::string label = where + " ('" + ns + "/" + key + "')";
    const auto type = nvs::item_type_from_name(type_name);
    if (!type.has_value()) {
        throw std::runtime_error("unknown type '" + type_name + "' in " + label);
    }
    const auto& v = j.at("value");

    if (nvs::is_primitive(*type)) {
        if (nvs::is_signed(*type)) {
            std::int64_t value = 0;
            if (v.is_number_unsigned()) {
                const auto u = v.get<std::uint64_t>();
                if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                    throw std::runtime_error("value out of range for " + type_name + " in " + label);
                }
                value = static_cast<std::int64_t>(u);
            } else if (v.is_number_integer()) {
                value = v.get<std::int64_t>();
            } else if (v.is_string()) {
                value = parse_signed_text(v.get<std::string>(), label);
            } else {
                throw std::runtime_error("expected integer value in " + label);
            }
            return nvs::make_signed_record(ns, key, *type, value);
        }
        std::uint64_t value = 0;
        if (v.is_number_unsigned()) {
            value = v.get<std::uint64_t>();
        } else if (v.is_number_integer()) {
            const auto s = v.get<std::int64_t>();
            if (s < 0) {
                throw std::runtime_error("negative value for " + type_name + " in " + label);
            }
            value = static_cast<std::uint64_t>(s);
        } else if (v.is_string()) {
            value = parse_unsigned_text(v.get<std::string>(), label);
        } else {
            throw std::runtime_error("expected integer value in " + label);
        }
        return nvs::make_unsigned_record(ns, key, *type, value);
    }

    if (*type == nvs::ItemType::Str) {
        if (!v.is_string()) {
            throw std::runtime_error("expected string value in " + label);
        }
        if (j.contains("encoding") && !j.at("encoding").is_string()) {
            throw std::runtime_error("'encoding' must be a string in " + label);
        }
        const auto encoding = j.value("encoding", std::string{});
        if (encoding.empty()) {
            return nvs::make_string_record(ns, key, v.get<std::string>());
        }
        if (encoding != "hex") {
            throw std::runtime_error("unknown string encoding '" + encoding + "' in " + label);
        }
        try {
            const auto raw = nvs::hex_to_bytes(v.get<std::string>());
            return nvs::make_string_record(ns, key, std::string(raw.begin(), raw.end()));
        } catch (const std::runtime_error& e) {
            throw std::runtime_error(std::string(e.what()) + " in " + label);
        }
    }

    if (v.is_string()) {
        try {
            return nvs::make_blob_record(ns, key, nvs::hex_to_bytes(v.get<std::string>()));
        } catch (const std::runtime_error& e) {
            throw std::runtime_error(std::string(e.what()) + " in " + label);
        }
    }
    if (v.is_object() && v.contains("file") && v.at("file").is_string()) {
        std::filesystem::path file = v.at("file").get<std::string>();
        if (file.is_relative() && !base_dir.empty()) {
            file = base_dir / file;
        }
        auto rec = nvs::make_blob_record(ns, key, {});
        rec.blob_file = file;
        return rec;
    }
    throw std::runtime_error("expected hex string or {\"file\": ...} blob value in " + label);
}

nlohmann::ordered_json
NvsParser::PartitionToJson(const nvs::PartitionDecodeResult& partition, bool include_pages) {
    nlohmann::ordered_json doc = nlohmann::ordered_json::object();

    nlohmann::ordered_json namespaces = nlohmann::ordered_json::object();
    for (const auto& [index, name] : partition.namespaces) {
        namespaces[std::to_string(index)] = name;
    }
    doc["namespaces"] = std::move(namespaces);

    nlohmann::ordered_json entries = nlohmann::ordered_json::array();
    for (const auto& rec : partition.records) {
        entries.push_back(record_to_json(rec));
    }
    doc["entries"] = std::move(entries);

    nlohmann::ordered_json warnings = nlohmann::ordered_json::array();
    for (const auto& w : partition.warnings) {
        warnings.push_back(warning_to_json(w));
    }
    doc["warnings"] = std::move(warnings);

    if (!include_pages) {
        return doc;
    }
    nlohmann::ordered_json pages = nlohmann::ordered_json::array();
    for (const auto& p : partition.pages) {
        pages.push_back(page_to_json(p));
    }
    doc["pages"] = std::move(pages);

    nlohmann::ordered_json summary = nlohmann::ordered_json::object();
    summary["pages"] = partition.pages.size();
    summary["namespaces"] = partition.namespaces.size();
    summary["records"] = partition.records.size();
    summary["warnings"] = partition.warnings.size();
    doc["summary"] = std::move(summary);
    return doc;
}

std::string NvsParser::DumpDocument(const nlohmann::ordered_json& document, int indent) {
    return document.dump(indent, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

std::vector<nvs::Record> NvsParser::RecordsFromJson(
    const nlohmann::ordered_json& document,
    const std::filesystem::path& base_dir
) {
    if (!document.is_object()) {
        throw std::runtime_error("JSON root must be an object");
    }
    if (!document.contains("entries") || !document.at("entries").is_array()) {
        throw std::runtime_error("JSON document has no 'entries' array");
    }
    std::vector<nvs::Record> out;
    const auto& entries = document.at("entries");
    out.reserve(entries.size());
    for (std::size_t i = 0; i < entries.size(); i++) {
        out.push_back(record_from_json(entries.at(i), i, base_dir));
    }
    return out;
}

std::map<std::uint8_t, std::string>
NvsParser::NamespacesFromJson(const nlohmann::ordered_json& document) {
    std::map<std::uint8_t, std::string> out;
    if (!document.is_object() || !document.contains("namespaces")) {
        return out;
    }
    const auto& ns = document.at("namespaces");
    if (!ns.is_object()) {
        throw std::runtime_error("'namespaces' must be an object of index -> name");
    }
    for (const auto& item : ns.items()) {
        if (!item.value().is_string()) {
            throw std::runtime_error("namespace " + item.key() + " must map to a string");
        }
        const auto index = parse_unsigned_text(item.key(), "namespace index");
        if (index == nvs::kNamespaceTableIndex || index >= nvs::kNamespaceAny) {
            throw std::runtime_error("namespace index " + item.key() + " is reserved");
        }
        out[static_cast<std::uint8_t>(index)] = item.value().get<std::string>();
    }
    return out;
}

DecodeResult
NvsParser::DecodeNvsFile(const std::filesystem::path& path, const ParserDecodeOptions& opt) {
    const auto bytes = fs_utils::read_file(path);
    return DecodeNvsBytes(bytes, opt, path.filename().string());
}

DecodeResult NvsParser::DecodeNvsBytes(
    std::span<const std::uint8_t> bytes,
    const ParserDecodeOptions& opt,
    std::string_view label
) {
    const auto t0 = std::chrono::steady_clock::now();
    nvs::DecodeOptions dopt{};
    dopt.page_size = opt.page_size;

    DecodeResult result{};
    result.partition = nvs::decode_partition(bytes, dopt);
    result.document = PartitionToJson(result.partition, opt.include_pages);
    const auto t1 = std::chrono::steady_clock::now();

    if (opt.debug) {
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();
        ESPNVS_LOG_INFO(
            "Decode %s: bytes=%zu pages=%zu records=%zu warnings=%zu time=%lldms",
            std::string(label).c_str(), bytes.size(), result.partition.pages.size(),
            result.partition.records.size(), result.partition.warnings.size(),
            static_cast<long long>(ms)
        );
    }
    return result;
}

EncodeResult NvsParser::EncodeJsonToCsv(
    const nlohmann::ordered_json& document,
    const ParserEncodeOptions& opt,
    std::string_view label
) {
    const auto t0 = std::chrono::steady_clock::now();
    if (!document.is_object()) {
        throw std::runtime_error("JSON root must be an object for " + std::string(label));
    }

    const auto records = RecordsFromJson(document, opt.base_dir);
    const auto namespaces = NamespacesFromJson(document);

    nvs::EncodeOptions eopt{};
    eopt.inline_blobs = opt.inline_blobs;
    const auto rows = nvs::encode_records(records, namespaces, eopt);
    auto csv = nvs::write_csv(rows, opt.blob_dir);
    const auto t1 = std::chrono::steady_clock::now();

    EncodeResult result{};
    result.csv_text = std::move(csv.text);
    result.blob_files = std::move(csv.blob_files);
    result.record_count = records.size();
    if (opt.debug) {
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();
        ESPNVS_LOG_INFO(
            "Encode %s: records=%zu rows=%zu blobs=%zu time=%lldms", std::string(label).c_str(),
            records.size(), rows.size(), result.blob_files.size(), static_cast<long long>(ms)
        );
    }
    return result;
}

}  // namespace espnvs
