#pragma once
/*
================================================================================
Report: Human-Readable Compliance Report
FILE: cpp/ifra/report/text_report.hpp

Layout:
  header, overall status, finished dosage, critical component,
  recommended (failing) or maximum (passing) safe dosage,
  unresolved / truncated / integrity warning blocks,
  per-standard table sorted by ratio descending,
  phototoxicity sum-of-ratios line.

Rows are shown when the standard fails or its concentration exceeds 1e-6 %.
================================================================================
*/

#include <iosfwd>
#include <string>

#include "ifra/compliance/compliance_types.hpp"

namespace ifra {

void write_text_report(std::ostream& os, const ComplianceResult& r);
std::string text_report(const ComplianceResult& r);

} // namespace ifra
