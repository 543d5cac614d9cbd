// Copyright 2016 Google Inc. All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "chunk_source.h"

#include <stdlib.h>
#include <sys/types.h>

#include <glog/logging.h>

namespace flowtag {

ChunkSource::ChunkSource(size_t chunk_size)
    : chunk_size_(chunk_size),
      f_(nullptr),
      ok_(false),
      line_number_(0),
      next_index_(0),
      buffer_(nullptr),
      capacity_(0) {
  CHECK_GT(chunk_size_, 0u);
}

ChunkSource::~ChunkSource() {
  Close();
  free(buffer_);
}

void ChunkSource::Close() {
  if (f_ != nullptr) {
    fclose(f_);
    f_ = nullptr;
  }
}

bool ChunkSource::Open(const std::string& path) {
  Close();
  path_ = path;
  line_number_ = 0;
  next_index_ = 0;
  f_ = fopen(path.c_str(), "r");
  if (f_ == nullptr) {
    PLOG(ERROR) << "Failed to open " << path;
    ok_ = false;
    return false;
  }
  ok_ = true;
  LOG(INFO) << "Reading " << path << " in chunks of " << chunk_size_
            << " lines";
  return true;
}

bool ChunkSource::Next(Chunk* chunk) {
  chunk->lines.clear();
  if (!ok_ || f_ == nullptr) {
    return false;
  }
  ssize_t len;
  while (chunk->lines.size() < chunk_size_ &&
         (len = getline(&buffer_, &capacity_, f_)) >= 0) {
    while (len > 0 && (buffer_[len - 1] == '\n' || buffer_[len - 1] == '\r')) {
      len--;
    }
    chunk->lines.emplace_back();
    Chunk::Line* line = &chunk->lines.back();
    line->number = ++line_number_;
    line->text.assign(buffer_, len);
  }
  if (ferror(f_)) {
    PLOG(ERROR) << "Reading " << path_ << " failed after line "
                << line_number_;
    ok_ = false;
    Close();
    chunk->lines.clear();
    return false;
  }
  if (chunk->lines.empty()) {
    Close();
    return false;
  }
  chunk->index = next_index_++;
  VLOG(1) << "Chunk " << chunk->index << " covers lines " << chunk->first_line()
          << " to " << line_number_;
  return true;
}

}  // namespace flowtag
