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

#ifndef FLOWTAG_AGGREGATOR_H_
#define FLOWTAG_AGGREGATOR_H_

#include <stdint.h>

#include <memory>
#include <mutex>

#include "counts.h"
#include "util.h"

namespace flowtag {

// Aggregator owns the run-wide Counts.  Partial counts are merged one at a
// time under a lock, in whatever order they arrive.
class Aggregator {
 public:
  Aggregator();
  ~Aggregator();

  // Merge adds partial into the totals and discards it.
  void Merge(std::unique_ptr<Counts> partial);

  // Number of partials merged so far.
  uint64_t merged();

  // Release hands back the totals, leaving this aggregator empty.
  std::unique_ptr<Counts> Release();

 private:
  std::mutex mu_;
  std::unique_ptr<Counts> total_;
  uint64_t merged_;
  DISALLOW_COPY_AND_ASSIGN(Aggregator);
};

}  // namespace flowtag

#endif  // FLOWTAG_AGGREGATOR_H_
