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

#include "process-output.h"

namespace process_lib {

StringOutputReader::StringOutputReader(size_t chunk_size)
: chunk_size_(chunk_size)
{}

void *StringOutputReader::allocateReadBuffer(size_t &buffer_size) {
  if (data_.size() - used_ < chunk_size_) {
    data_.resize(used_ + chunk_size_);
  }
  buffer_size = data_.size() - used_;
  return data_.data() + used_;
}

void StringOutputReader::commitReadBuffer(size_t bytes_transferred) {
  used_ += bytes_transferred;
}

std::string StringOutputReader::take() {
  data_.resize(used_);
  used_ = 0;
  return std::move(data_);
}

FileOutputReader::FileOutputReader(const std::filesystem::path &path, size_t buffer_size)
: file_(path, std::ios::binary | std::ios::trunc),
  buffer_(new char[buffer_size]),
  buffer_size_(buffer_size)
{}

void *FileOutputReader::allocateReadBuffer(size_t &buffer_size) {
  // keep draining after a write failure so the child never blocks on a full pipe
  buffer_size = buffer_size_;
  return buffer_.get();
}

void FileOutputReader::commitReadBuffer(size_t bytes_transferred) {
  if (bytes_transferred == 0) {
    // end of stream
    if (file_.is_open()) {
      file_.close();
      if (file_.fail()) {
        failed_ = true;
      }
    }
    return;
  }

  if (!failed_ && file_.is_open()) {
    file_.write(buffer_.get(), static_cast<std::streamsize>(bytes_transferred));
    if (!file_) {
      failed_ = true;
    } else {
      written_ += bytes_transferred;
    }
  }
}

} // namespace process_lib
