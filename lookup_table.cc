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

#include "lookup_table.h"

#include <stdlib.h>
#include <sys/types.h>

#include <algorithm>
#include <vector>

#include <glog/logging.h>

namespace flowtag {

namespace {

const char kPortColumn[] = "dstport";
const char kProtocolColumn[] = "protocol";
const char kTagColumn[] = "tag";

int FindColumn(const std::vector<char*>& header, const char* name) {
  for (size_t i = 0; i < header.size(); i++) {
    if (Normalize(header[i]) == name) {
      return i;
    }
  }
  return -1;
}

}  // namespace

LookupTable::LookupTable() {}

LookupTable::~LookupTable() {}

void LookupTable::Add(StringPiece port, StringPiece protocol, StringPiece tag) {
  PortProtocol key(Normalize(port), Normalize(protocol));
  std::string value = Trim(tag).ToString();
  VLOG(1) << "Mapping " << key.port << "/" << key.protocol << " to tag "
          << value;
  tags_[key] = value;
}

const std::string* LookupTable::Tag(const PortProtocol& key) const {
  auto found = tags_.find(key);
  if (found == tags_.end()) {
    return nullptr;
  }
  return &found->second;
}

namespace internal {

// Pull out a CSV value from a line pointed to by *val.  Returns a
// null-terminated value string, and points *val past it so NextCSVValue may be
// called on it again.  Returns nullptr once every value has been returned.
// A value starting with a double quote runs to the closing quote, may contain
// commas, and uses "" for a literal quote; the quotes themselves are removed.
// The line is rewritten in place.
char* NextCSVValue(char** val) {
  if (*val == nullptr) {
    return nullptr;
  }
  char* out = *val;
  char* read = *val;
  char* write = *val;
  if (*read == '"') {
    read++;
    while (*read != '\0') {
      if (*read == '"') {
        if (read[1] != '"') {
          read++;
          break;
        }
        read++;  // "" is an escaped quote, keep one of them.
      }
      *write++ = *read++;
    }
  }
  while (*read != '\0' && *read != ',') {
    *write++ = *read++;
  }
  *val = (*read == ',') ? read + 1 : nullptr;
  *write = '\0';
  return out;
}

}  // namespace internal

bool LoadFromCSV(LookupTable* to, FILE* f) {
  char* line = nullptr;
  size_t capacity = 0;
  ssize_t len;
  int lines = 0;
  int rows = 0;
  bool have_header = false;
  int port_col = -1, protocol_col = -1, tag_col = -1;
  size_t needed = 0;
  bool ok = true;
  std::vector<char*> values;
  while ((len = getline(&line, &capacity, f)) >= 0) {
    lines++;
    while (len > 0 && (line[len - 1] == '\n' || line[len - 1] == '\r')) {
      line[--len] = '\0';
    }
    if (len == 0) {
      continue;
    }
    values.clear();
    char* next = line;
    char* value;
    while ((value = internal::NextCSVValue(&next)) != nullptr) {
      values.push_back(value);
    }
    if (!have_header) {
      port_col = FindColumn(values, kPortColumn);
      protocol_col = FindColumn(values, kProtocolColumn);
      tag_col = FindColumn(values, kTagColumn);
      if (port_col < 0 || protocol_col < 0 || tag_col < 0) {
        LOG(ERROR) << "Lookup table header on line " << lines
                   << " must name the columns " << kPortColumn << ", "
                   << kProtocolColumn << " and " << kTagColumn;
        ok = false;
        break;
      }
      needed = std::max(port_col, std::max(protocol_col, tag_col)) + 1;
      have_header = true;
      continue;
    }
    if (values.size() < needed) {
      LOG(ERROR) << "Lookup table line " << lines << " has " << values.size()
                 << " values, need at least " << needed;
      ok = false;
      break;
    }
    to->Add(values[port_col], values[protocol_col], values[tag_col]);
    rows++;
  }
  if (ok && ferror(f)) {
    PLOG(ERROR) << "Reading lookup table failed after line " << lines;
    ok = false;
  }
  free(line);
  if (!ok) {
    return false;
  }
  if (!have_header) {
    LOG(WARNING) << "Lookup table is empty, every record will be "
                 << kUntagged;
  }
  LOG(INFO) << "Read " << rows << " entries from lookup table CSV, "
            << to->size() << " distinct";
  return true;
}

bool LoadLookupTable(const std::string& path, LookupTable* to) {
  LOG(INFO) << "Reading lookup table from " << path;
  FILE* f = fopen(path.c_str(), "r");
  if (f == nullptr) {
    PLOG(ERROR) << "Failed to open " << path;
    return false;
  }
  bool ok = LoadFromCSV(to, f);
  fclose(f);
  return ok;
}

}  // namespace flowtag
