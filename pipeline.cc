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

#include "pipeline.h"

#include <sys/stat.h>

#include <glog/logging.h>

#include "processor.h"
#include "report.h"

namespace flowtag {

namespace {

bool IsRegularFile(const std::string& path, const char* what) {
  struct stat st;
  if (stat(path.c_str(), &st) != 0) {
    PLOG(ERROR) << what << " '" << path << "' does not exist";
    return false;
  }
  if (!S_ISREG(st.st_mode)) {
    LOG(ERROR) << what << " '" << path << "' is not a regular file";
    return false;
  }
  return true;
}

}  // namespace

Pipeline::Options::Options()
    : chunk_size(kDefaultChunkSize), workers(0), max_pending(0) {}

Pipeline::Stats::Stats()
    : chunks(0), lines(0), malformed(0), records(0), elapsed_secs(0) {}

Pipeline::Pipeline(const Options& options)
    : options_(options),
      workers_(options.workers),
      max_pending_(0),
      state_(INIT),
      counts_(new Counts()),
      start_secs_(0) {
  CHECK_GT(options_.chunk_size, 0u);
  if (workers_ <= 0) {
    workers_ = std::thread::hardware_concurrency();
    if (workers_ <= 0) {
      workers_ = 1;
    }
  }
  max_pending_ = options_.max_pending > 0 ? options_.max_pending : 2 * workers_;
}

Pipeline::~Pipeline() {}

const char* Pipeline::StateName(State s) {
  switch (s) {
    case INIT:
      return "INIT";
    case LOADING_LOOKUP:
      return "LOADING_LOOKUP";
    case STREAMING:
      return "STREAMING";
    case AGGREGATING:
      return "AGGREGATING";
    case WRITING:
      return "WRITING";
    case DONE:
      return "DONE";
    case FAILED:
      return "FAILED";
  }
  return "UNKNOWN";
}

void Pipeline::SetState(State s) {
  LOG(INFO) << "Pipeline " << StateName(state_) << " -> " << StateName(s);
  state_ = s;
}

bool Pipeline::Fail() {
  SetState(FAILED);
  stats_.elapsed_secs = GetMonotonicSeconds() - start_secs_;
  return false;
}

bool Pipeline::CheckInputs() {
  return IsRegularFile(options_.flow_log_path, "Flow log file") &&
         IsRegularFile(options_.lookup_path, "Lookup table file");
}

bool Pipeline::Run() {
  CHECK_EQ(state_, INIT) << "Run called twice";
  start_secs_ = GetMonotonicSeconds();
  if (!CheckInputs()) {
    return Fail();
  }

  SetState(LOADING_LOOKUP);
  if (!LoadLookupTable(options_.lookup_path, &lookup_)) {
    return Fail();
  }

  SetState(STREAMING);
  if (!Stream()) {
    return Fail();
  }

  SetState(WRITING);
  if (!WriteReport(options_.output_path, *counts_)) {
    return Fail();
  }

  SetState(DONE);
  stats_.elapsed_secs = GetMonotonicSeconds() - start_secs_;
  LOG(INFO) << "Counted " << stats_.records << " records from "
            << stats_.lines << " lines in " << stats_.chunks << " chunks, "
            << stats_.malformed << " malformed lines skipped, in "
            << stats_.elapsed_secs << "s";
  return true;
}

bool Pipeline::Stream() {
  ChunkSource source(options_.chunk_size);
  if (!source.Open(options_.flow_log_path)) {
    return false;
  }

  ChunkQueue chunks(max_pending_);
  CountsQueue results(max_pending_);
  Aggregator aggregator;

  LOG(INFO) << "Starting " << workers_ << " workers, at most " << max_pending_
            << " chunks queued";
  std::atomic<int> running(workers_);
  std::vector<std::unique_ptr<ChunkWorker>> workers;
  for (int i = 0; i < workers_; i++) {
    workers.emplace_back(std::unique_ptr<ChunkWorker>(
        new ChunkWorker(i, &lookup_, &chunks, &results, &running)));
  }

  // The reader blocks on a full chunk queue, which holds it back whenever the
  // workers fall behind.
  uint64_t dispatched = 0;
  Notification dispatched_all;
  std::thread reader([&source, &chunks, &dispatched, &dispatched_all]() {
    std::unique_ptr<Chunk> chunk(new Chunk());
    while (source.Next(chunk.get())) {
      CHECK(chunks.Push(&chunk)) << "Chunk queue closed while reading";
      dispatched++;
      chunk.reset(new Chunk());
    }
    chunks.Close();
    dispatched_all.Notify();
  });

  // Results come back in whatever order workers finish; addition doesn't
  // care.
  std::unique_ptr<Counts> partial;
  while (results.Pop(&partial)) {
    if (state_ == STREAMING && dispatched_all.HasBeenNotified()) {
      SetState(AGGREGATING);
    }
    aggregator.Merge(std::move(partial));
  }

  reader.join();
  for (size_t i = 0; i < workers.size(); i++) {
    workers[i]->Join();
  }
  if (state_ == STREAMING) {
    SetState(AGGREGATING);
  }

  if (!source.ok()) {
    LOG(ERROR) << "Stopped after " << dispatched << " chunks, "
               << source.lines() << " lines of " << options_.flow_log_path;
    return false;
  }
  CHECK_EQ(aggregator.merged(), dispatched)
      << "Each chunk must be merged exactly once";

  counts_ = aggregator.Release();
  stats_.chunks = dispatched;
  stats_.lines = counts_->lines;
  stats_.malformed = counts_->malformed;
  stats_.records = counts_->TotalPortProtocol();
  DCHECK_EQ(stats_.records, counts_->TotalTagged());
  DCHECK_EQ(stats_.records + stats_.malformed, stats_.lines);
  return true;
}

ChunkWorker::ChunkWorker(int id, const LookupTable* lookup, ChunkQueue* chunks,
                         CountsQueue* results, std::atomic<int>* running)
    : id_(id),
      lookup_(lookup),
      chunks_(chunks),
      results_(results),
      running_(running) {
  thread_.reset(new std::thread([this]() { Run(); }));
}

ChunkWorker::~ChunkWorker() { Join(); }

void ChunkWorker::Join() {
  if (thread_->joinable()) {
    thread_->join();
  }
}

void ChunkWorker::Run() {
  VLOG(1) << "Worker " << id_ << " started";
  int processed = 0;
  std::unique_ptr<Chunk> chunk;
  while (chunks_->Pop(&chunk)) {
    std::unique_ptr<Counts> counts(new Counts());
    ProcessChunk(*chunk, *lookup_, counts.get());
    chunk.reset();
    CHECK(results_->Push(&counts)) << "Results queue closed while counting";
    processed++;
  }
  VLOG(1) << "Worker " << id_ << " done after " << processed << " chunks";
  if (--(*running_) == 0) {
    results_->Close();
  }
}

}  // namespace flowtag
