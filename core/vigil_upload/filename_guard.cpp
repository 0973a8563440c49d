// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "filename_guard.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <functional>

namespace vigil {
namespace upload {

namespace {

std::string to_lower(const std::string& str) {
  std::string out = str;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

// Portion before the first dot, trailing spaces dropped, upper-cased
std::string to_upper_stem(const std::string& name) {
  std::string stem = name.substr(0, name.find('.'));
  while (!stem.empty() && stem.back() == ' ') {
    stem.pop_back();
  }
  std::transform(stem.begin(), stem.end(), stem.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return stem;
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool has_null_byte(const std::string& name) {
  return name.find('\0') != std::string::npos;
}

bool has_encoded_control(const std::string& name) {
  for (size_t i = 0; i + 2 < name.size(); ++i) {
    if (name[i] != '%') {
      continue;
    }
    int hi = hex_value(name[i + 1]);
    int lo = hex_value(name[i + 2]);
    if (hi < 0 || lo < 0) {
      continue;
    }
    int value = hi * 16 + lo;
    if (value < 0x20 || value == 0x7f) {
      return true;
    }
  }
  return false;
}

bool has_control_character(const std::string& name) {
  return std::any_of(name.begin(), name.end(), [](char c) {
    auto u = static_cast<unsigned char>(c);
    return (u > 0 && u < 0x20) || u == 0x7f;
  });
}

bool has_path_traversal(const std::string& name) {
  size_t start = 0;
  while (start <= name.size()) {
    size_t end = name.find_first_of("/\\", start);
    if (end == std::string::npos) {
      end = name.size();
    }
    if (name.compare(start, end - start, "..") == 0) {
      return true;
    }
    start = end + 1;
  }

  std::string lower = to_lower(name);
  return lower.find("%2e%2e") != std::string::npos || lower.find("%2e.") != std::string::npos ||
         lower.find(".%2e") != std::string::npos;
}

bool has_path_separator(const std::string& name) {
  if (name.find_first_of("/\\") != std::string::npos) {
    return true;
  }
  std::string lower = to_lower(name);
  return lower.find("%2f") != std::string::npos || lower.find("%5c") != std::string::npos;
}

bool is_reserved_device_name(const std::string& name) {
  std::string stem = to_upper_stem(name);
  static const std::array<const char*, 6> fixed = {"CON", "PRN", "AUX", "NUL", "CONIN$", "CONOUT$"};
  for (const char* reserved : fixed) {
    if (stem == reserved) {
      return true;
    }
  }
  if (stem.size() == 4 && (stem.compare(0, 3, "COM") == 0 || stem.compare(0, 3, "LPT") == 0)) {
    return stem[3] >= '1' && stem[3] <= '9';
  }
  return false;
}

bool has_shell_metacharacter(const std::string& name) {
  if (name.find_first_of("|;`><") != std::string::npos) {
    return true;
  }
  return name.find("$(") != std::string::npos || name.find("&&") != std::string::npos;
}

}  // namespace

std::string to_string(FilenameRule rule) {
  switch (rule) {
    case FilenameRule::Empty:
      return "empty";
    case FilenameRule::TooLong:
      return "too_long";
    case FilenameRule::NullByte:
      return "null_byte";
    case FilenameRule::EncodedControl:
      return "encoded_control";
    case FilenameRule::ControlCharacter:
      return "control_character";
    case FilenameRule::PathTraversal:
      return "path_traversal";
    case FilenameRule::PathSeparator:
      return "path_separator";
    case FilenameRule::ReservedDeviceName:
      return "reserved_device_name";
    case FilenameRule::ShellMetacharacter:
      return "shell_metacharacter";
  }
  return "unknown";
}

FilenameCheck FilenameGuard::validate(const std::string& filename) const {
  using Check = std::function<bool(const std::string&)>;
  const std::array<std::pair<FilenameRule, Check>, 9> rules = {{
    {FilenameRule::Empty, [](const std::string& n) { return n.empty(); }},
    {FilenameRule::TooLong, [this](const std::string& n) { return n.size() > max_length_; }},
    {FilenameRule::NullByte, has_null_byte},
    {FilenameRule::EncodedControl, has_encoded_control},
    {FilenameRule::ControlCharacter, has_control_character},
    {FilenameRule::PathTraversal, has_path_traversal},
    {FilenameRule::PathSeparator, has_path_separator},
    {FilenameRule::ReservedDeviceName, is_reserved_device_name},
    {FilenameRule::ShellMetacharacter, has_shell_metacharacter},
  }};

  // No short-circuit: every rule runs
  std::vector<FilenameRule> matched;
  for (const auto& entry : rules) {
    if (entry.second(filename)) {
      matched.push_back(entry.first);
    }
  }

  if (matched.empty()) {
    return FilenameCheck::success();
  }

  auto error = integrity::ValidationError::make(
    integrity::ErrorCode::FilenameRejected, filename,
    "Filename rejected by rule " + to_string(matched.front())
  );
  error.rule = to_string(matched.front());
  return FilenameCheck::failure(std::move(matched), std::move(error));
}

}  // namespace upload
}  // namespace vigil
