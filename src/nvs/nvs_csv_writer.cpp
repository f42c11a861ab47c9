/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "nvs/nvs_csv_writer.h"

#include <algorithm>

namespace espnvs::nvs {
std::string csv_escape(std::string_view field) {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(field);
    }
    std::string out;
    out.reserve(field.size() + 2);
    out.push_back('"');
    for (char c : field) {
        if (c == '"') {
            out.push_back('"');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

CsvDocument write_csv(const std::vector<CsvRow>& rows, const std::filesystem::path& blob_dir) {
    CsvDocument doc{};
    doc.text = "key,type,encoding,value\n";
    for (const auto& row : rows) {
        std::string value = row.value;
        if (row.kind == RowKind::File && row.blob_bytes.has_value()) {
            const auto path = blob_dir / row.value;
            value = path.generic_string();
            const bool known = std::any_of(
                doc.blob_files.begin(), doc.blob_files.end(),
                [&](const BlobFile& f) { return f.path == path; }
            );
            if (!known) {
                doc.blob_files.push_back(BlobFile{path, *row.blob_bytes});
            }
        }

        doc.text += csv_escape(row.key);
        doc.text += ',';
        doc.text += row_kind_name(row.kind);
        doc.text += ',';
        doc.text += csv_escape(row.encoding);
        doc.text += ',';
        doc.text += csv_escape(value);
        doc.text += '\n';
    }
    return doc;
}
}  // namespace espnvs::nvs
