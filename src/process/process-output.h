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
#include "process.h"
#include <fstream>
#include <string>

namespace process_lib {

// Collects a stream into memory.
class StringOutputReader : public ProcessOutputReader {
  std::string data_;
  size_t used_{0};
  const size_t chunk_size_;

public:
  explicit StringOutputReader(size_t chunk_size = 16384);

  void *allocateReadBuffer(size_t &buffer_size) override;
  void commitReadBuffer(size_t bytes_transferred) override;

  std::string take();
};

// Streams straight into a file, the file is closed when the stream ends.
class FileOutputReader : public ProcessOutputReader {
  std::ofstream file_;
  std::unique_ptr<char[]> buffer_;
  const size_t buffer_size_;
  uint64_t written_{0};
  bool failed_{false};

public:
  explicit FileOutputReader(const std::filesystem::path &path, size_t buffer_size = 65536);

  bool isOpen() const { return file_.is_open(); }
  bool failed() const { return failed_; }
  uint64_t bytesWritten() const { return written_; }

  void *allocateReadBuffer(size_t &buffer_size) override;
  void commitReadBuffer(size_t bytes_transferred) override;
};

} // namespace process_lib
