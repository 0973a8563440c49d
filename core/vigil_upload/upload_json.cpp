// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_json.hpp"

#include "checksum_accumulator.hpp"

namespace vigil {
namespace upload {

void to_json(nlohmann::json& j, const UploadResult& result) {
  j = nlohmann::json{
    {"path", result.path},
    {"integrity",
     {
       {"algorithm", result.integrity.algorithm},
       {"crc32", result.integrity.crc32},
       {"crc32_hex", integrity::crc_to_hex(result.integrity.crc32)},
     }},
    {"throughput_mbps", result.throughput_mbps},
    {"bytes", result.bytes},
  };
}

void to_json(nlohmann::json& j, const UploadOutcome& outcome) {
  j = nlohmann::json{
    {"valid", outcome.valid},
    {"state", state_to_string(outcome.final_state)},
  };
  if (outcome.valid) {
    j["result"] = outcome.result;
  } else {
    j["error"] = outcome.error;
  }
}

}  // namespace upload
}  // namespace vigil
