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
#include <filesystem>
#include <string_view>

namespace db_transfer {

constexpr std::string_view SQLITE_SIGNATURE = "SQLite format ";
constexpr size_t SQLITE_MIN_CHECK_SIZE = 16;

// first 15 bytes read "SQLite format "; false for short or unreadable files
bool hasSqliteSignature(const std::filesystem::path &path);

// pulled copy must exist and be non-empty, a foreign signature only warns
void verifyPulledFile(const std::filesystem::path &path);

// verifyPulledFile, deleting the copy when it is rejected
void acceptPulledFile(const std::filesystem::path &path);

// file about to overwrite a device copy: non-empty, signature checked from 16 bytes on
void validatePushSource(const std::filesystem::path &path);

} // namespace db_transfer
