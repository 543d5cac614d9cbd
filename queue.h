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

#ifndef FLOWTAG_QUEUE_H_
#define FLOWTAG_QUEUE_H_

#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>

#include <glog/logging.h>

#include "util.h"

namespace flowtag {

// BoundedQueue is a blocking FIFO holding at most 'capacity' items.  Push
// blocks while the queue is full, Pop while it is empty.  Once Close is
// called, Push fails and Pop drains what is left, then fails.
template <class T>
class BoundedQueue {
 public:
  explicit BoundedQueue(size_t capacity) : capacity_(capacity), closed_(false) {
    CHECK_GT(capacity_, 0u);
  }

  // Returns false, leaving item untouched, if the queue was closed.
  bool Push(T* item) {
    std::unique_lock<std::mutex> ml(mu_);
    not_full_.wait(ml,
                   [this]() { return closed_ || items_.size() < capacity_; });
    if (closed_) {
      return false;
    }
    items_.push_back(std::move(*item));
    not_empty_.notify_one();
    return true;
  }

  // Returns false once the queue is closed and empty.
  bool Pop(T* item) {
    std::unique_lock<std::mutex> ml(mu_);
    not_empty_.wait(ml, [this]() { return closed_ || !items_.empty(); });
    if (items_.empty()) {
      return false;
    }
    *item = std::move(items_.front());
    items_.pop_front();
    not_full_.notify_one();
    return true;
  }

  void Close() {
    std::unique_lock<std::mutex> ml(mu_);
    closed_ = true;
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  size_t size() {
    std::unique_lock<std::mutex> ml(mu_);
    return items_.size();
  }

 private:
  const size_t capacity_;
  bool closed_;
  std::deque<T> items_;
  std::mutex mu_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  DISALLOW_COPY_AND_ASSIGN(BoundedQueue);
};

}  // namespace flowtag

#endif  // FLOWTAG_QUEUE_H_
