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

#ifndef FLOWTAG_RECORD_H_
#define FLOWTAG_RECORD_H_

#include "stringpiece.h"

namespace flowtag {

// Positions of the fields we use in a flow log line, and the number of fields
// a line needs before we consider it a record at all.  Fields past kMinFields
// are ignored.
const int kDstPortField = 5;
const int kProtocolField = 6;
const int kMinFields = 14;

// Name reported for protocol numbers we don't know.
extern const char kUnknownProtocol[];

// ProtocolName maps an IANA protocol number, as it appears in the log, to the
// lowercase name used by lookup tables and reports.  The match is on the exact
// text, so "06" is unknown.
const char* ProtocolName(StringPiece number);

// Record is a view onto the fields of one flow log line.  It does not copy, so
// the line must outlive any pieces returned from it.
struct Record {
  Record();

  void Reset();

  // Parse splits line on runs of whitespace, keeping the first kMinFields
  // fields.  Returns true if the line has at least kMinFields fields; if not,
  // the line is not a record and the accessors below must not be used.
  bool Parse(StringPiece line);

  StringPiece field(int i) const { return fields[i]; }
  StringPiece dst_port() const { return fields[kDstPortField]; }
  StringPiece protocol() const { return fields[kProtocolField]; }

  // Number of fields seen by the last Parse, capped at kMinFields.
  int num_fields;
  StringPiece fields[kMinFields];
};

}  // namespace flowtag

#endif  // FLOWTAG_RECORD_H_
