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
#include "counts.h"

#include <city.h>

namespace flowtag {

const char kUntagged[] = "Untagged";

bool PortProtocol::operator==(const PortProtocol& other) const {
  return port == other.port && protocol == other.protocol;
}

bool PortProtocol::operator<(const PortProtocol& other) const {
  int c = port.compare(other.port);
  if (c != 0) {
    return c < 0;
  }
  return protocol < other.protocol;
}

size_t PortProtocol::hash() const {
  // Seeding the protocol hash with the port's keeps ("1", "0tcp") and
  // ("10", "tcp") apart.
  return CityHash64WithSeed(protocol.data(), protocol.size(),
                            CityHash64(port.data(), port.size()));
}

uint64_t AddToTable(TagTable* t, const std::string& tag, uint64_t count) {
  auto finder = t->find(tag);
  if (finder == t->end()) {
    t->emplace(tag, count);
    return count;
  }
  finder->second += count;
  return finder->second;
}

uint64_t AddToTable(PortProtocolTable* t, const PortProtocol& key,
                    uint64_t count) {
  auto finder = t->find(key);
  if (finder == t->end()) {
    t->emplace(key, count);
    return count;
  }
  finder->second += count;
  return finder->second;
}

void CombineTable(TagTable* dst, const TagTable& src) {
  for (const auto& iter : src) {
    AddToTable(dst, iter.first, iter.second);
  }
}

void CombineTable(PortProtocolTable* dst, const PortProtocolTable& src) {
  for (const auto& iter : src) {
    AddToTable(dst, iter.first, iter.second);
  }
}

Counts::Counts() : lines(0), malformed(0) {}

const Counts& Counts::operator+=(const Counts& other) {
  CombineTable(&tags, other.tags);
  CombineTable(&port_protocols, other.port_protocols);
  lines += other.lines;
  malformed += other.malformed;
  return *this;
}

uint64_t Counts::TotalTagged() const {
  uint64_t total = 0;
  for (const auto& iter : tags) {
    total += iter.second;
  }
  return total;
}

uint64_t Counts::TotalPortProtocol() const {
  uint64_t total = 0;
  for (const auto& iter : port_protocols) {
    total += iter.second;
  }
  return total;
}

}  // namespace flowtag
