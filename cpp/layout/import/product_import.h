#pragma once

#include "layout/core/types.h"
#include "layout/model/project.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace layout {

class IdGenerator;

// One field of an import record as delivered by the importer. Numbers keep their
// tag: a numeric-looking string is still a string and fails numeric fields.
using ImportValue = std::variant<std::monostate, double, std::int64_t, std::string>;
using ImportRecord = std::map<std::string, ImportValue>;

// A validated product line. Required: name, width_cm, depth_cm.
struct ProductTemplate {
    std::string name;
    double widthCm{0.0};
    double depthCm{0.0};
    std::uint32_t quantity{1};
    std::optional<std::string> productCode;
    std::optional<std::uint32_t> lineNumber;
    std::string roomZone;
};

struct ImportIssue {
    std::size_t recordIndex;
    std::string reason;
};

struct ImportReport {
    std::vector<ProductTemplate> accepted;
    std::vector<ImportIssue> rejected;
};

// Checks required fields and types before anything is constructed.
LayoutError parseProductRecord(const ImportRecord& record, ProductTemplate& out, std::string* reason = nullptr);

// Validates every record; invalid ones are reported and skipped.
ImportReport validateProductRecords(const std::vector<ImportRecord>& records);

// CSV with a header row containing name, width_cm and depth_cm (quantity,
// product_code, line_number and room_zone are optional). Header names are trimmed,
// lower-cased, and spaces become underscores. Cells are typed strictly: integers,
// then decimals, otherwise strings; empty cells are absent.
LayoutError parseProductCsv(std::string_view text, std::vector<ImportRecord>& out, std::string* reason = nullptr);

// "hsl(h, 60%, 75%)" derived from the name hash.
std::string colorForName(std::string_view name);

// Expands quantities into unplaced items. An item name already in the project keeps
// that item's colour.
std::vector<FurnitureItem> expandProducts(const std::vector<ProductTemplate>& products,
                                          const Project& existing, IdGenerator& ids);

} // namespace layout
