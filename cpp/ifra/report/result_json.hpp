#pragma once
/*
================================================================================
Report: Compliance Result JSON Serializer (Header)
FILE: cpp/ifra/report/result_json.hpp

Purpose:
  - Deterministic JSON export of ComplianceResult for UIs, auditing and diffs.
  - Non-finite numbers (an infinite ratio against a zero limit) serialize as
    null; a missing limit serializes as the string "specification only".
  - Stable key ordering so two runs on the same input are byte-identical.
================================================================================
*/

#include <string>

#include "ifra/compliance/compliance_types.hpp"

namespace ifra {

std::string result_to_json(const ComplianceResult& r, int indent_spaces = 2);

// Returns true on success, false if the file cannot be written.
bool write_result_json_file(const ComplianceResult& r,
                            const std::string& file_path,
                            int indent_spaces = 2);

} // namespace ifra
