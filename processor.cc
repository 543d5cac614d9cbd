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

#include "processor.h"

#include <glog/logging.h>

namespace flowtag {

void ProcessLine(StringPiece line, const LookupTable& lookup, Record* record,
                 Counts* counts) {
  counts->lines++;
  if (!record->Parse(line)) {
    counts->malformed++;
    return;
  }
  PortProtocol key(Normalize(record->dst_port()),
                   ProtocolName(Trim(record->protocol())));
  AddToTable(&counts->port_protocols, key, 1);
  const std::string* tag = lookup.Tag(key);
  if (tag != nullptr && !tag->empty()) {
    AddToTable(&counts->tags, *tag, 1);
  } else {
    AddToTable(&counts->tags, kUntagged, 1);
  }
}

void ProcessChunk(const Chunk& chunk, const LookupTable& lookup,
                  Counts* counts) {
  Record record;
  for (const auto& line : chunk.lines) {
    ProcessLine(line.text, lookup, &record, counts);
  }
  VLOG(1) << "Chunk " << chunk.index << ": " << chunk.lines.size()
          << " lines, " << counts->malformed << " malformed";
}

}  // namespace flowtag
