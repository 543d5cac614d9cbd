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

#include "record.h"

#include <ctype.h>

namespace flowtag {

const char kUnknownProtocol[] = "unknown";

namespace {

struct ProtocolNumber {
  const char* number;
  const char* name;
};

// From http://www.iana.org/assignments/protocol-numbers
const ProtocolNumber kProtocols[] = {
    {"6", "tcp"}, {"17", "udp"}, {"1", "icmp"},
};

inline bool IsSpace(char c) { return isspace(static_cast<unsigned char>(c)); }

}  // namespace

const char* ProtocolName(StringPiece number) {
  for (const auto& p : kProtocols) {
    if (number == p.number) {
      return p.name;
    }
  }
  return kUnknownProtocol;
}

Record::Record() { Reset(); }

void Record::Reset() {
  num_fields = 0;
  for (int i = 0; i < kMinFields; i++) {
    fields[i] = StringPiece();
  }
}

bool Record::Parse(StringPiece line) {
  Reset();
  const char* p = line.data();
  const char* limit = p + line.size();
  while (num_fields < kMinFields) {
    while (p < limit && IsSpace(*p)) p++;
    if (p == limit) break;
    const char* start = p;
    while (p < limit && !IsSpace(*p)) p++;
    fields[num_fields++] = StringPiece(start, p - start);
  }
  return num_fields == kMinFields;
}

}  // namespace flowtag
