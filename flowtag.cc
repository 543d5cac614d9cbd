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

#include <stdio.h>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include "chunk_source.h"
#include "pipeline.h"

using google::ParseCommandLineFlags;

DEFINE_int32(chunk_size, flowtag::kDefaultChunkSize,
             "Number of flow log lines handed to a worker at a time");
DEFINE_int32(workers, 0,
             "Number of worker threads counting chunks.  0 uses one per "
             "available CPU.");
DEFINE_int32(max_pending_chunks, 0,
             "Most chunks waiting for a worker, and most counted chunks "
             "waiting to be merged.  0 uses twice the number of workers.");

static bool ValidatePositive(const char* flagname, int32_t value) {
  if (value > 0) {
    return true;
  }
  fprintf(stderr, "--%s must be positive, got %d\n", flagname, value);
  return false;
}
static bool ValidateNonNegative(const char* flagname, int32_t value) {
  if (value >= 0) {
    return true;
  }
  fprintf(stderr, "--%s must not be negative, got %d\n", flagname, value);
  return false;
}
DEFINE_validator(chunk_size, &ValidatePositive);
DEFINE_validator(workers, &ValidateNonNegative);
DEFINE_validator(max_pending_chunks, &ValidateNonNegative);

int main(int argc, char** argv) {
  google::SetUsageMessage(
      "Counts flow log records by tag and by port/protocol.\n"
      "Usage: flowtag [flags] <flow_log_file> <lookup_csv_file> "
      "<output_file>");
  ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  if (argc != 4) {
    fprintf(stderr,
            "Usage: %s [flags] <flow_log_file> <lookup_csv_file> "
            "<output_file>\n",
            argv[0]);
    return 1;
  }

  flowtag::Pipeline::Options options;
  options.flow_log_path = argv[1];
  options.lookup_path = argv[2];
  options.output_path = argv[3];
  options.chunk_size = FLAGS_chunk_size;
  options.workers = FLAGS_workers;
  options.max_pending = FLAGS_max_pending_chunks;

  flowtag::Pipeline pipeline(options);
  if (!pipeline.Run()) {
    fprintf(stderr, "Error: processing failed, no report written to '%s'.\n",
            options.output_path.c_str());
    return 1;
  }
  printf("Processing complete. Output written to '%s'. Time taken: %.2f "
         "seconds.\n",
         options.output_path.c_str(), pipeline.stats().elapsed_secs);
  return 0;
}
