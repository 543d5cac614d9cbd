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

#ifndef FLOWTAG_PROCESSOR_H_
#define FLOWTAG_PROCESSOR_H_

#include "chunk_source.h"
#include "counts.h"
#include "lookup_table.h"
#include "record.h"
#include "stringpiece.h"

namespace flowtag {

// ProcessLine counts a single flow log line into *counts.  A line with fewer
// than kMinFields fields only bumps counts->malformed; otherwise it adds one
// to its (port, protocol) bucket and one to its tag bucket, kUntagged if the
// lookup table has no entry.  'record' is scratch space reused across calls.
void ProcessLine(StringPiece line, const LookupTable& lookup, Record* record,
                 Counts* counts);

// ProcessChunk counts every line of chunk into *counts.  It touches nothing
// but its arguments, and reads lookup only, so disjoint chunks may be
// processed concurrently against one table.
void ProcessChunk(const Chunk& chunk, const LookupTable& lookup,
                  Counts* counts);

}  // namespace flowtag

#endif  // FLOWTAG_PROCESSOR_H_
