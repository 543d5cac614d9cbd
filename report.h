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

#ifndef FLOWTAG_REPORT_H_
#define FLOWTAG_REPORT_H_

#include <string>

#include "counts.h"

namespace flowtag {

// RenderReport formats counts as:
//   Tag Counts:
//   Tag,Count
//   <tag>,<count>
//   ...
//   <blank line>
//   Port/Protocol Combination Counts:
//   Port,Protocol,Count
//   <port>,<protocol>,<count>
//   ...
// Rows are sorted by key, so equal counts always render to identical bytes.
std::string RenderReport(const Counts& counts);

// WriteReport renders counts to path.  The report goes to a temporary file
// beside path first and is renamed into place, so path is either left alone
// or holds the whole report.  Returns false, after logging, on failure.
bool WriteReport(const std::string& path, const Counts& counts);

}  // namespace flowtag

#endif  // FLOWTAG_REPORT_H_
