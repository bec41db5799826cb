#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "ifra/core/json.hpp"
#include "ifra/refdata/reference_data.hpp"

namespace ifra {

/// Parse the standards file into `out->standards` and `out->cas_mapping`:
///   {"metadata":    {"<std_id>": {"name": str, "type": str, "limit_cat4": number|null}},
///    "cas_mapping": {"<cas>": ["<std_id>", ...]}}
/// - `name` defaults to the id; `limit_cat4` absent or null => specification only.
/// - Negative limits are rejected.
/// - Unknown keys are ignored (forward compatible).
bool parse_standards_json(std::string_view json,
                          ReferenceTables* out,
                          JsonParseError* err = nullptr);

/// Parse the contributions file into `out->contributions`:
///   {"<material key>": {"name": str, "constituents": {"<key>": number, ...}}}
/// - `name` defaults to the key; absent constituents => empty composition.
/// - Percentages must be finite and within [0,100].
bool parse_contributions_json(std::string_view json,
                              ReferenceTables* out,
                              JsonParseError* err = nullptr);

/// Read both files and freeze them into an immutable ReferenceData.
/// An empty `standards_path` loads the contributions table alone.
/// Throws Error(kIoError) when a file cannot be read and Error(kParseError)
/// (message includes path, line and column) when it does not match the schema.
std::shared_ptr<const ReferenceData> load_reference_data(const std::string& standards_path,
                                                         const std::string& contributions_path);

} // namespace ifra
