// Copyright (c) 2025 R.J. (kencube@hotmail.com)
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#pragma once
#include "devices/device-types.h"
#include <array>
#include <filesystem>
#include <string_view>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace db_transfer {

using device_query::DeviceType;

class transfer_error : public std::runtime_error {
public:
  enum error_code {
    local_file_missing = 1,
    local_file_empty,
    remote_command_failed,
    destination_missing,
    verification_failed,
    rollback_failed,
    unsupported_device,
  };

  transfer_error(const std::string& arg, error_code c): std::runtime_error(arg), code(c) {}

  const error_code code;
};

struct DatabaseFile {
  // scratch copy, the in-place path for simulators, or the remote path when the pull failed
  std::filesystem::path localPath;
  std::string remotePath;
  std::string packageId;
  DeviceType deviceType{DeviceType::AndroidDevice};
  std::string location;
  std::string filename;
};

inline void to_json(nlohmann::json &j, const DatabaseFile &f) {
  j = nlohmann::json{
    {"path", f.localPath.string()},
    {"remotePath", f.remotePath},
    {"packageName", f.packageId},
    {"deviceType", f.deviceType},
    {"location", f.location},
    {"filename", f.filename},
  };
}

constexpr std::array DATABASE_EXTENSIONS = {
  std::string_view{".db"},
  std::string_view{".sqlite"},
  std::string_view{".sqlite3"},
};

inline bool has_database_extension(std::string_view name) {
  for (auto ext : DATABASE_EXTENSIONS) {
    if (name.size() > ext.size() && name.ends_with(ext)) {
      return true;
    }
  }
  return false;
}

inline std::string remote_filename(std::string_view remote) {
  auto pos = remote.find_last_of('/');
  return std::string(pos == std::string_view::npos ? remote : remote.substr(pos + 1));
}

} // namespace db_transfer
