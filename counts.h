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

#ifndef FLOWTAG_COUNTS_H_
#define FLOWTAG_COUNTS_H_

#include <stdint.h>

#include <string>
#include <unordered_map>

namespace flowtag {

// Tag given to records whose (port, protocol) has no lookup entry.
extern const char kUntagged[];

// PortProtocol identifies a destination port and protocol name, both already
// normalized (trimmed, lowercase).  Ports are kept as strings since flow logs
// may carry anything in that column.
struct PortProtocol {
  PortProtocol() {}
  PortProtocol(const std::string& port, const std::string& protocol)
      : port(port), protocol(protocol) {}

  std::string port;
  std::string protocol;

  bool operator==(const PortProtocol& b) const;
  inline bool operator!=(const PortProtocol& b) const {
    return !operator==(b);
  }
  // Orders by port, then protocol, comparing bytes.
  bool operator<(const PortProtocol& b) const;
  size_t hash() const;
};

}  // namespace flowtag

namespace std {

template <>
struct hash<flowtag::PortProtocol> {
  size_t operator()(const flowtag::PortProtocol& k) const { return k.hash(); }
};

}  // namespace std

namespace flowtag {

typedef std::unordered_map<std::string, uint64_t> TagTable;
typedef std::unordered_map<PortProtocol, uint64_t> PortProtocolTable;

uint64_t AddToTable(TagTable* t, const std::string& tag, uint64_t count);
uint64_t AddToTable(PortProtocolTable* t, const PortProtocol& key,
                    uint64_t count);
void CombineTable(TagTable* dst, const TagTable& src);
void CombineTable(PortProtocolTable* dst, const PortProtocolTable& src);

// Counts holds the two aggregate tables for some span of the flow log, either
// a single chunk or the whole run.
struct Counts {
  Counts();

  TagTable tags;
  PortProtocolTable port_protocols;

  // Run statistics, never rendered into the report.
  uint64_t lines;      // lines seen, well-formed or not
  uint64_t malformed;  // lines skipped for having too few fields

  // Adds every bucket of 'other' into this.  Absent buckets count as zero, so
  // the order partial counts are combined in never changes the result.
  const Counts& operator+=(const Counts& other);

  uint64_t TotalTagged() const;
  uint64_t TotalPortProtocol() const;
};

}  // namespace flowtag

#endif  // FLOWTAG_COUNTS_H_
