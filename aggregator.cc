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

#include "aggregator.h"

#include <glog/logging.h>

namespace flowtag {

Aggregator::Aggregator() : total_(new Counts()), merged_(0) {}

Aggregator::~Aggregator() {}

void Aggregator::Merge(std::unique_ptr<Counts> partial) {
  CHECK(partial != nullptr);
  std::unique_lock<std::mutex> ml(mu_);
  // The first partial can simply become the total.
  if (merged_ == 0) {
    total_.swap(partial);
  } else {
    *total_ += *partial;
  }
  merged_++;
  VLOG(2) << "Merged " << merged_ << " partial counts";
}

uint64_t Aggregator::merged() {
  std::unique_lock<std::mutex> ml(mu_);
  return merged_;
}

std::unique_ptr<Counts> Aggregator::Release() {
  std::unique_lock<std::mutex> ml(mu_);
  std::unique_ptr<Counts> out(new Counts());
  out.swap(total_);
  merged_ = 0;
  return out;
}

}  // namespace flowtag
