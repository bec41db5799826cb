#pragma once
/*
================================================================================
Core: Engine Settings
FILE: cpp/ifra/core/settings.hpp

Purpose:
  - Centralize every evaluation assumption (depth bound, tolerances, heuristic
    token lists) into a single validated object.
  - Identical settings + identical inputs => identical ComplianceResult.

Hardening:
  - validate_or_throw() catches nonsensical values early.
  - Defaults reproduce IFRA Category 4 practice.
================================================================================
*/

#include <string>
#include <string_view>
#include <vector>

#include "ifra/core/error.hpp"

namespace ifra {

// ----------------------------- Resolution ------------------------------------
struct ResolutionSettings {
  // Deepest level at which a compound material is still expanded. The formula
  // entry itself is level 0; anything nested deeper is truncated.
  int max_depth = 10;

  void validate_or_throw() const {
    IFRA_ENSURE(max_depth >= 0 && max_depth <= 64, ErrorCode::kInvalidArgument,
                "ResolutionSettings: max_depth must be in [0,64]");
  }
};

// ----------------------------- Evaluation ------------------------------------
struct EvaluationSettings {
  // A standard passes while concentration <= limit + pass_tolerance.
  double pass_tolerance = 1e-9;

  // Ratios at or below this are treated as zero for critical component and
  // max safe dosage.
  double ratio_floor = 1e-9;

  // Phototoxicity sum-of-ratios must not exceed this.
  double phototoxicity_sum_limit = 1.0;

  // Reported max safe dosage when nothing restricted is present (% concentrate).
  double fully_safe_dosage = 100.0;

  void validate_or_throw() const {
    IFRA_ENSURE(pass_tolerance >= 0.0 && pass_tolerance < 1e-3, ErrorCode::kInvalidArgument,
                "EvaluationSettings: pass_tolerance must be in [0,1e-3)");
    IFRA_ENSURE(ratio_floor > 0.0 && ratio_floor < 1e-3, ErrorCode::kInvalidArgument,
                "EvaluationSettings: ratio_floor must be in (0,1e-3)");
    IFRA_ENSURE(phototoxicity_sum_limit > 0.0 && phototoxicity_sum_limit <= 10.0, ErrorCode::kInvalidArgument,
                "EvaluationSettings: phototoxicity_sum_limit must be in (0,10]");
    IFRA_ENSURE(fully_safe_dosage > 0.0 && fully_safe_dosage <= 100.0, ErrorCode::kInvalidArgument,
                "EvaluationSettings: fully_safe_dosage must be in (0,100]");
  }
};

// ----------------------------- Integrity -------------------------------------
struct IntegritySettings {
  // Compositions documenting less than this (sum of constituent %) are flagged.
  double min_documented_pct = 90.0;

  // Names containing any of these are declared dilutions and never flagged.
  std::vector<std::string> dilution_tokens{"% in", "dilution", "(dil)"};

  void validate_or_throw() const {
    IFRA_ENSURE(min_documented_pct >= 0.0 && min_documented_pct <= 100.0, ErrorCode::kInvalidArgument,
                "IntegritySettings: min_documented_pct must be in [0,100]");
    for (const auto& t : dilution_tokens) {
      IFRA_ENSURE(!t.empty(), ErrorCode::kInvalidArgument, "IntegritySettings: empty dilution token");
    }
  }
};

// ----------------------------- Exemption -------------------------------------
struct ExemptionSettings {
  // Material names containing any of these (case-insensitive) are treated as
  // furocoumarin-free and excluded from phototoxicity aggregation.
  std::vector<std::string> phototoxicity_exempt_tokens{"FCF", "DISTILLED", "TERPENELESS"};

  void validate_or_throw() const {
    for (const auto& t : phototoxicity_exempt_tokens) {
      IFRA_ENSURE(!t.empty(), ErrorCode::kInvalidArgument, "ExemptionSettings: empty exemption token");
    }
  }
};

// ----------------------------- Top-level ------------------------------------
struct EngineSettings {
  ResolutionSettings resolution;
  EvaluationSettings evaluation;
  IntegritySettings integrity;
  ExemptionSettings exemption;

  void validate_or_throw() const {
    resolution.validate_or_throw();
    evaluation.validate_or_throw();
    integrity.validate_or_throw();
    exemption.validate_or_throw();
  }
};

/// Apply overrides from a JSON settings document onto `base`:
///   {"resolution": {"max_depth": 10},
///    "evaluation": {"pass_tolerance": 1e-9, "ratio_floor": 1e-9,
///                   "phototoxicity_sum_limit": 1.0, "fully_safe_dosage": 100},
///    "integrity":  {"min_documented_pct": 90, "dilution_tokens": ["% in"]},
///    "exemption":  {"phototoxicity_exempt_tokens": ["FCF"]}}
/// Absent keys keep their value; unknown keys are ignored.
/// Throws Error(kParseError) on malformed input, then validates the result.
EngineSettings settings_from_json(std::string_view json, const EngineSettings& base = {});

/// File convenience. Throws Error(kIoError) if the file cannot be read.
EngineSettings load_settings_file(const std::string& path, const EngineSettings& base = {});

} // namespace ifra
