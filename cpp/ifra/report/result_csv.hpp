#pragma once
// ============================================================================
// Compliance Result CSV Writer
// File: cpp/ifra/report/result_csv.hpp
// ============================================================================
//
// One row per aggregated standard, in standard-id order:
//   standard_id,standard_name,type,concentration,limit,pass,ratio,exceedance_pct,sources
//
// `limit` is empty for specification-only standards; an infinite ratio is
// written as "inf". `sources` is "name=conc" pairs joined by ';'.
//
// ============================================================================

#include <iosfwd>

#include "ifra/compliance/compliance_types.hpp"

namespace ifra {

void write_result_csv(std::ostream& os, const ComplianceResult& r);

} // namespace ifra
