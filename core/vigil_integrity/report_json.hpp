// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIGIL_REPORT_JSON_HPP
#define VIGIL_REPORT_JSON_HPP

#include <nlohmann/json.hpp>

#include "integrity_types.hpp"
#include "strategy_selector.hpp"

namespace vigil {
namespace integrity {

// nlohmann::json serializers, found by ADL.
// Checksums appear twice: "crc32" as an integer, "crc32_hex" as 8 hex digits.

void to_json(nlohmann::json& j, const ValidationReport& report);
void to_json(nlohmann::json& j, const FingerprintReport& report);
void to_json(nlohmann::json& j, const ValidationError& error);
void to_json(nlohmann::json& j, const StrategyResult& result);

}  // namespace integrity
}  // namespace vigil

#endif  // VIGIL_REPORT_JSON_HPP
