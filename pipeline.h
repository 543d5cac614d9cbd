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

#ifndef FLOWTAG_PIPELINE_H_
#define FLOWTAG_PIPELINE_H_

// Runs a whole flow log through the lookup table: a reader thread cuts the log
// into chunks, a pool of worker threads counts them, and the calling thread
// merges the partial counts and finally writes the report.

#include <stdint.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "aggregator.h"
#include "chunk_source.h"
#include "counts.h"
#include "lookup_table.h"
#include "queue.h"
#include "util.h"

namespace flowtag {

typedef BoundedQueue<std::unique_ptr<Chunk>> ChunkQueue;
typedef BoundedQueue<std::unique_ptr<Counts>> CountsQueue;

class ChunkWorker;

class Pipeline {
 public:
  enum State {
    INIT,
    LOADING_LOOKUP,
    STREAMING,
    AGGREGATING,
    WRITING,
    DONE,
    FAILED,
  };

  struct Options {
    Options();

    std::string flow_log_path;
    std::string lookup_path;
    std::string output_path;
    size_t chunk_size;  // lines per chunk
    int workers;        // <= 0 means one per available CPU
    int max_pending;    // bound on queued chunks and results, <= 0 means
                        // twice the worker count
  };

  struct Stats {
    Stats();

    uint64_t chunks;
    uint64_t lines;
    uint64_t malformed;
    uint64_t records;
    double elapsed_secs;
  };

  explicit Pipeline(const Options& options);
  ~Pipeline();

  // Run goes through every state once.  Returns true if the report was
  // written, false (with state() == FAILED and the cause logged) otherwise.
  // Run may only be called once.
  bool Run();

  State state() const { return state_; }
  const Stats& stats() const { return stats_; }
  // Totals of the run, valid once Run returned true.
  const Counts& counts() const { return *counts_; }

  static const char* StateName(State s);

 private:
  void SetState(State s);
  bool Fail();
  bool CheckInputs();
  bool Stream();

  const Options options_;
  int workers_;
  size_t max_pending_;
  State state_;
  Stats stats_;
  LookupTable lookup_;
  std::unique_ptr<Counts> counts_;
  double start_secs_;
  DISALLOW_COPY_AND_ASSIGN(Pipeline);
};

// ChunkWorker is internal to Pipeline.  It counts chunks from one queue into
// fresh Counts pushed onto another, until the chunk queue is closed and
// drained.  The last worker of a pool to finish closes the results queue.
class ChunkWorker {
 public:
  ChunkWorker(int id, const LookupTable* lookup, ChunkQueue* chunks,
              CountsQueue* results, std::atomic<int>* running);
  ~ChunkWorker();
  void Join();

 private:
  void Run();

  const int id_;
  const LookupTable* lookup_;
  ChunkQueue* chunks_;
  CountsQueue* results_;
  std::atomic<int>* running_;
  std::unique_ptr<std::thread> thread_;
  DISALLOW_COPY_AND_ASSIGN(ChunkWorker);
};

}  // namespace flowtag

#endif  // FLOWTAG_PIPELINE_H_
