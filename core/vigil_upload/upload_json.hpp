// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIGIL_UPLOAD_JSON_HPP
#define VIGIL_UPLOAD_JSON_HPP

#include <nlohmann/json.hpp>

#include "report_json.hpp"
#include "upload_types.hpp"

namespace vigil {
namespace upload {

void to_json(nlohmann::json& j, const UploadResult& result);

// {"valid", "state", "result"} on success, {"valid", "state", "error"} otherwise
void to_json(nlohmann::json& j, const UploadOutcome& outcome);

}  // namespace upload
}  // namespace vigil

#endif  // VIGIL_UPLOAD_JSON_HPP
