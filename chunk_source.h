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

#ifndef FLOWTAG_CHUNK_SOURCE_H_
#define FLOWTAG_CHUNK_SOURCE_H_

#include <stdint.h>
#include <stdio.h>

#include <string>
#include <vector>

#include "util.h"

namespace flowtag {

const size_t kDefaultChunkSize = 100000;

// Chunk is a run of consecutive flow log lines, the unit of work handed to a
// single worker.
struct Chunk {
  Chunk() : index(0) {}

  struct Line {
    uint64_t number;  // 1-based line number within the file
    std::string text;  // without the line terminator
  };

  uint64_t index;  // 0-based position of this chunk within the file
  std::vector<Line> lines;

  uint64_t first_line() const { return lines.empty() ? 0 : lines[0].number; }
};

// ChunkSource reads a flow log and cuts it into chunks of at most chunk_size
// lines, in file order.  Chunks never overlap and together cover every line
// exactly once.  Only the last chunk may be short.  ChunkSource does not look
// at line contents.
//
// Typical use:
//   ChunkSource source(100000);
//   if (!source.Open(path)) { ... }
//   Chunk c;
//   while (source.Next(&c)) { ... }
//   if (!source.ok()) { ... }
class ChunkSource {
 public:
  explicit ChunkSource(size_t chunk_size);
  ~ChunkSource();

  // Open starts reading path from its first line, closing any file opened
  // earlier.  Returns false, after logging, if the file can't be opened.
  bool Open(const std::string& path);

  // Next replaces the contents of *chunk with the next chunk.  Returns false
  // when the file is exhausted or reading failed; ok() tells which.
  bool Next(Chunk* chunk);

  // False if a read error was hit.  Once false, Next always returns false.
  bool ok() const { return ok_; }

  uint64_t chunks() const { return next_index_; }
  uint64_t lines() const { return line_number_; }

 private:
  void Close();

  const size_t chunk_size_;
  std::string path_;
  FILE* f_;
  bool ok_;
  uint64_t line_number_;
  uint64_t next_index_;
  char* buffer_;
  size_t capacity_;
  DISALLOW_COPY_AND_ASSIGN(ChunkSource);
};

}  // namespace flowtag

#endif  // FLOWTAG_CHUNK_SOURCE_H_
