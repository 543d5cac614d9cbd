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

#include "report.h"

#include <stdio.h>
#include <unistd.h>

#include <algorithm>
#include <vector>

#include <glog/logging.h>

namespace flowtag {

namespace {

template <class Table>
std::vector<typename Table::const_iterator> Sorted(const Table& t) {
  std::vector<typename Table::const_iterator> out;
  out.reserve(t.size());
  for (auto iter = t.begin(); iter != t.end(); ++iter) {
    out.push_back(iter);
  }
  std::sort(out.begin(), out.end(),
            [](const typename Table::const_iterator& a,
               const typename Table::const_iterator& b) {
              return a->first < b->first;
            });
  return out;
}

}  // namespace

std::string RenderReport(const Counts& counts) {
  std::string out;
  out += "Tag Counts:\n";
  out += "Tag,Count\n";
  for (const auto& iter : Sorted(counts.tags)) {
    out += iter->first;
    out += ",";
    out += std::to_string(iter->second);
    out += "\n";
  }
  out += "\n";
  out += "Port/Protocol Combination Counts:\n";
  out += "Port,Protocol,Count\n";
  for (const auto& iter : Sorted(counts.port_protocols)) {
    out += iter->first.port;
    out += ",";
    out += iter->first.protocol;
    out += ",";
    out += std::to_string(iter->second);
    out += "\n";
  }
  return out;
}

bool WriteReport(const std::string& path, const Counts& counts) {
  std::string report = RenderReport(counts);
  std::string tmp = path + ".tmp";
  FILE* f = fopen(tmp.c_str(), "w");
  if (f == nullptr) {
    PLOG(ERROR) << "Failed to open " << tmp << " for writing";
    return false;
  }
  bool ok = fwrite(report.data(), 1, report.size(), f) == report.size();
  if (!ok) {
    PLOG(ERROR) << "Writing report to " << tmp << " failed";
  }
  if (fclose(f) != 0 && ok) {
    PLOG(ERROR) << "Closing " << tmp << " failed";
    ok = false;
  }
  if (ok && rename(tmp.c_str(), path.c_str()) != 0) {
    PLOG(ERROR) << "Failed to move " << tmp << " to " << path;
    ok = false;
  }
  if (!ok) {
    unlink(tmp.c_str());
    return false;
  }
  LOG(INFO) << "Wrote " << counts.tags.size() << " tags and "
            << counts.port_protocols.size() << " port/protocol rows to "
            << path;
  return true;
}

}  // namespace flowtag
