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

#ifndef FLOWTAG_LOOKUP_TABLE_H_
#define FLOWTAG_LOOKUP_TABLE_H_

#include <stdio.h>

#include <string>
#include <unordered_map>

#include "counts.h"
#include "stringpiece.h"
#include "util.h"

namespace flowtag {

// LookupTable maps a (destination port, protocol name) pair to a tag.  It is
// filled once before processing starts and only read afterwards, so any
// number of threads may call Tag concurrently without locking.
class LookupTable {
 public:
  LookupTable();
  ~LookupTable();

  // Add normalizes port and protocol (trimmed, lowercased) and trims tag.  A
  // later Add for the same port and protocol replaces the earlier tag.
  void Add(StringPiece port, StringPiece protocol, StringPiece tag);

  // key must already be normalized.  Returns nullptr if there is no entry.
  const std::string* Tag(const PortProtocol& key) const;

  size_t size() const { return tags_.size(); }

 private:
  std::unordered_map<PortProtocol, std::string> tags_;
  DISALLOW_COPY_AND_ASSIGN(LookupTable);
};

// Load a CSV lookup table.  Example file:
//   dstport,protocol,tag
//   25,tcp,sv_P1
//   68,udp,"sv_P2"
// The header names the columns; dstport, protocol and tag are required and may
// appear in any order, other columns are ignored.  Blank lines are skipped.
// Returns false, after logging why, if the file can't be read or is missing a
// required column.  'to' may then hold a prefix of the rows.
bool LoadFromCSV(LookupTable* to, FILE* f);

// Opens path and calls LoadFromCSV on it.
bool LoadLookupTable(const std::string& path, LookupTable* to);

namespace internal {  // exposed just for testing.

char* NextCSVValue(char** val);

}  // internal

}  // namespace flowtag

#endif  // FLOWTAG_LOOKUP_TABLE_H_
