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

#ifndef FLOWTAG_UTIL_H_
#define FLOWTAG_UTIL_H_

#include <stdint.h>
#include <time.h>

#include <mutex>

#define DISALLOW_COPY_AND_ASSIGN(Type) \
  Type(const Type&) = delete;          \
  void operator=(const Type&) = delete

namespace flowtag {

class Notification {
 public:
  Notification() : done_(false) {}
  bool HasBeenNotified() {
    std::unique_lock<std::mutex> ml(mu_);
    return done_;
  }
  void Notify() {
    std::unique_lock<std::mutex> ml(mu_);
    done_ = true;
  }

 private:
  bool done_;
  std::mutex mu_;
  DISALLOW_COPY_AND_ASSIGN(Notification);
};

const int64_t kNumNanosPerSecond = 1000000000LL;

// Monotonic clock, only meaningful for measuring intervals.
inline int64_t GetMonotonicNanos() {
  struct timespec tv;
#ifdef CLOCK_MONOTONIC_RAW
  // If monotonic raw clock is supported and available, let's use that.
  if (!clock_gettime(CLOCK_MONOTONIC_RAW, &tv)) {
    return tv.tv_sec * kNumNanosPerSecond + tv.tv_nsec;
  }
#endif
  clock_gettime(CLOCK_MONOTONIC, &tv);
  return tv.tv_sec * kNumNanosPerSecond + tv.tv_nsec;
}
inline double GetMonotonicSeconds() {
  return GetMonotonicNanos() * 1.0L / kNumNanosPerSecond;
}

}  // namespace flowtag

#endif  // FLOWTAG_UTIL_H_
