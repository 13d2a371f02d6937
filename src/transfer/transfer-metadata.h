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
#include "scratch/scratch-dir.h"
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace db_transfer {

// provenance of a pulled file, stored beside it as <file>.meta.json
struct TransferMetadata {
  std::string deviceId;
  std::string packageId;
  std::string remotePath;
  std::string pulledAtTimestamp;
};

void to_json(nlohmann::json &j, const TransferMetadata &m);
void from_json(const nlohmann::json &j, TransferMetadata &m);

std::filesystem::path metadataPathFor(const std::filesystem::path &localPath);

// UTC, YYYY-MM-DDTHH:MM:SSZ
std::string iso8601Now();

// failures are logged, the sidecar never decides whether a pull succeeded
void writeMetadata(const std::filesystem::path &localPath, const TransferMetadata &metadata);

// Scratch path for a pull of remote from device. The device filename is kept
// unless a file pulled from another remote (or device) already holds it, then
// the stem gets -2, -3 ... appended. A repeated pull of the same remote reuses
// its earlier path.
std::filesystem::path localPathFor(
    const scratch::ScratchDirectory &scratch,
    std::string_view device,
    std::string_view remote);

// diagnostics only, nullopt when absent or unreadable
std::optional<TransferMetadata> readMetadata(const std::filesystem::path &localPath);

} // namespace db_transfer
