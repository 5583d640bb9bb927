#include "layout/import/product_import.h"
#include "layout/core/id_generator.h"
#include "layout/core/layout_constants.h"
#include "layout/core/logging.h"
#include "layout/core/string_utils.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <unordered_map>
#include <utility>

namespace layout {

namespace {

const ImportValue* field(const ImportRecord& record, const char* key) {
    const auto it = record.find(key);
    if (it == record.end() || std::holds_alternative<std::monostate>(it->second)) return nullptr;
    return &it->second;
}

bool asNumber(const ImportValue& v, double& out) {
    if (const double* d = std::get_if<double>(&v)) {
        out = *d;
        return std::isfinite(out);
    }
    if (const std::int64_t* i = std::get_if<std::int64_t>(&v)) {
        out = static_cast<double>(*i);
        return true;
    }
    return false;
}

bool asCount(const ImportValue& v, std::uint32_t& out) {
    std::int64_t n = 0;
    if (const std::int64_t* i = std::get_if<std::int64_t>(&v)) {
        n = *i;
    } else if (const double* d = std::get_if<double>(&v)) {
        if (!std::isfinite(*d) || std::floor(*d) != *d) return false;
        if (*d < 0.0 || *d > static_cast<double>(std::numeric_limits<std::uint32_t>::max())) return false;
        n = static_cast<std::int64_t>(*d);
    } else {
        return false;
    }
    if (n < 0 || n > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max())) return false;
    out = static_cast<std::uint32_t>(n);
    return true;
}

LayoutError reject(std::string* reason, const char* message) {
    if (reason) *reason = message;
    return LayoutError::InvalidImportRecord;
}

std::vector<std::string_view> splitLine(std::string_view line) {
    std::vector<std::string_view> cells;
    std::size_t start = 0;
    while (true) {
        const std::size_t comma = line.find(',', start);
        if (comma == std::string_view::npos) {
            cells.push_back(line.substr(start));
            break;
        }
        cells.push_back(line.substr(start, comma - start));
        start = comma + 1;
    }
    return cells;
}

ImportValue typedCell(std::string_view raw) {
    const std::string cell = trimCopy(raw);
    if (cell.empty()) return std::monostate{};

    char* end = nullptr;
    errno = 0;
    const long long asInt = std::strtoll(cell.c_str(), &end, 10);
    if (errno == 0 && end && *end == '\0') return static_cast<std::int64_t>(asInt);

    errno = 0;
    const double asReal = std::strtod(cell.c_str(), &end);
    if (errno == 0 && end && *end == '\0' && std::isfinite(asReal)) return asReal;

    return cell;
}

std::string normalizeHeader(std::string_view raw) {
    std::string h = toLowerCopy(trimView(raw));
    for (char& c : h) {
        if (c == ' ') c = '_';
    }
    return h;
}

} // namespace

LayoutError parseProductRecord(const ImportRecord& record, ProductTemplate& out, std::string* reason) {
    ProductTemplate p;

    const ImportValue* name = field(record, "name");
    const std::string* nameStr = name ? std::get_if<std::string>(name) : nullptr;
    if (!nameStr || trimView(*nameStr).empty()) return reject(reason, "missing name");
    p.name = trimCopy(*nameStr);

    const ImportValue* width = field(record, "width_cm");
    if (!width || !asNumber(*width, p.widthCm) || p.widthCm <= 0.0) {
        return reject(reason, "width_cm must be a positive number");
    }
    const ImportValue* depth = field(record, "depth_cm");
    if (!depth || !asNumber(*depth, p.depthCm) || p.depthCm <= 0.0) {
        return reject(reason, "depth_cm must be a positive number");
    }

    if (const ImportValue* qty = field(record, "quantity")) {
        if (!asCount(*qty, p.quantity) || p.quantity < 1) return reject(reason, "quantity must be an integer >= 1");
        if (p.quantity > constants::MAX_IMPORT_QUANTITY) return reject(reason, "quantity exceeds the import limit");
    }
    if (const ImportValue* code = field(record, "product_code")) {
        const std::string* s = std::get_if<std::string>(code);
        if (s) {
            p.productCode = *s;
        } else if (const std::int64_t* i = std::get_if<std::int64_t>(code)) {
            // Numeric-only product codes are common in work orders.
            p.productCode = std::to_string(*i);
        } else {
            return reject(reason, "product_code must be text");
        }
    }
    if (const ImportValue* line = field(record, "line_number")) {
        std::uint32_t n = 0;
        if (!asCount(*line, n)) return reject(reason, "line_number must be a non-negative integer");
        p.lineNumber = n;
    }
    if (const ImportValue* zone = field(record, "room_zone")) {
        const std::string* s = std::get_if<std::string>(zone);
        if (!s) return reject(reason, "room_zone must be text");
        p.roomZone = trimCopy(*s);
    }

    out = std::move(p);
    return LayoutError::Ok;
}

ImportReport validateProductRecords(const std::vector<ImportRecord>& records) {
    ImportReport report;
    for (std::size_t i = 0; i < records.size(); ++i) {
        ProductTemplate p;
        std::string reason;
        if (parseProductRecord(records[i], p, &reason) == LayoutError::Ok) {
            report.accepted.push_back(std::move(p));
        } else {
            LAYOUT_LOG_WARN("import: record %zu rejected (%s)", i, reason.c_str());
            report.rejected.push_back(ImportIssue{i, std::move(reason)});
        }
    }
    return report;
}

LayoutError parseProductCsv(std::string_view text, std::vector<ImportRecord>& out, std::string* reason) {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t nl = text.find('\n', start);
        if (nl == std::string_view::npos) nl = text.size();
        std::string_view line = text.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        if (!trimView(line).empty()) lines.push_back(line);
        start = nl + 1;
    }

    out.clear();
    if (lines.size() < 2) return LayoutError::Ok;

    std::vector<std::string> header;
    for (const auto cell : splitLine(lines[0])) header.push_back(normalizeHeader(cell));

    const auto has = [&](const char* key) {
        for (const auto& h : header) {
            if (h == key) return true;
        }
        return false;
    };
    if (!has("name") || !has("width_cm") || !has("depth_cm")) {
        if (reason) *reason = "CSV must contain 'name', 'width_cm' and 'depth_cm' columns";
        return LayoutError::InvalidImportRecord;
    }

    out.reserve(lines.size() - 1);
    for (std::size_t i = 1; i < lines.size(); ++i) {
        const auto cells = splitLine(lines[i]);
        ImportRecord record;
        for (std::size_t c = 0; c < header.size() && c < cells.size(); ++c) {
            if (header[c].empty()) continue;
            // Names and codes stay text even when they look numeric.
            if (header[c] == "name" || header[c] == "product_code" || header[c] == "room_zone") {
                const std::string cell = trimCopy(cells[c]);
                record[header[c]] = cell.empty() ? ImportValue{} : ImportValue{cell};
            } else {
                record[header[c]] = typedCell(cells[c]);
            }
        }
        out.push_back(std::move(record));
    }
    return LayoutError::Ok;
}

std::string colorForName(std::string_view name) {
    const std::int32_t h = nameHash32(name) % 360;
    return "hsl(" + std::to_string(h) + ", 60%, 75%)";
}

std::vector<FurnitureItem> expandProducts(const std::vector<ProductTemplate>& products,
                                          const Project& existing, IdGenerator& ids) {
    std::unordered_map<std::string, std::string> colors;
    for (const auto& item : existing.furniture) {
        colors.emplace(item.name, item.color);
    }

    std::vector<FurnitureItem> out;
    for (const auto& p : products) {
        auto it = colors.find(p.name);
        if (it == colors.end()) it = colors.emplace(p.name, colorForName(p.name)).first;

        for (std::uint32_t i = 0; i < p.quantity; ++i) {
            FurnitureItem item;
            item.id = ids.next("furn");
            item.name = p.name;
            item.productCode = p.productCode;
            item.widthCm = p.widthCm;
            item.depthCm = p.depthCm;
            item.rotation = 0.0;
            item.roomZone = p.roomZone;
            item.color = it->second;
            item.lineNumber = p.lineNumber;
            out.push_back(std::move(item));
        }
    }
    return out;
}

} // namespace layout
