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

#include <string>

#include <gtest/gtest.h>

#include "pipeline.h"
#include "test_util.h"

namespace flowtag {

const char kLookup[] =
    "dstport,protocol,tag\n"
    "25,tcp,sv_P1\n"
    "68,udp,sv_P2\n";

class PipelineTest : public ::testing::Test {
 protected:
  PipelineTest() : output_(tmp_.Path("report.txt")) {
    tmp_.Path("report.txt.tmp");
  }

  Pipeline::Options Options(const std::string& log, const std::string& lookup) {
    Pipeline::Options o;
    o.flow_log_path = tmp_.Write("flow.log", log);
    o.lookup_path = tmp_.Write("lookup.csv", lookup);
    o.output_path = output_;
    return o;
  }

  // A log with a mix of tagged, untagged, unknown protocol and malformed
  // lines.
  static std::string MixedLog(int lines, int* well_formed) {
    const char* ports[] = {"25", "68", "80", "443", "23", "110"};
    const char* protocols[] = {"6", "17", "1", "999"};
    std::string log;
    *well_formed = 0;
    for (int i = 0; i < lines; i++) {
      if (i % 13 == 0) {
        log += "2024-09-01T10:00:00Z 10.0.0.1 1024 10.0.0.2 0 25\n";
        continue;
      }
      log += testing::FlowLine(ports[(i / 4) % 6], protocols[i % 4]);
      (*well_formed)++;
    }
    return log;
  }

  testing::TempDir tmp_;
  std::string output_;
};

TEST_F(PipelineTest, TestExample) {
  std::string log = testing::FlowLine("25", "6") +
                    "2024-09-01T10:00:00Z 10.0.0.1 1024 10.0.0.2 0 25\n" +
                    testing::FlowLine("68", "17");
  Pipeline p(Options(log, kLookup));
  ASSERT_TRUE(p.Run());
  EXPECT_EQ(p.state(), Pipeline::DONE);
  EXPECT_EQ(testing::ReadFile(output_),
            "Tag Counts:\n"
            "Tag,Count\n"
            "sv_P1,1\n"
            "sv_P2,1\n"
            "\n"
            "Port/Protocol Combination Counts:\n"
            "Port,Protocol,Count\n"
            "25,tcp,1\n"
            "68,udp,1\n");
  EXPECT_EQ(p.stats().lines, 3);
  EXPECT_EQ(p.stats().malformed, 1);
  EXPECT_EQ(p.stats().records, 2);
  EXPECT_EQ(p.stats().chunks, 1);
  EXPECT_FALSE(testing::FileExists(output_ + ".tmp"));
}

TEST_F(PipelineTest, TestEmptyLog) {
  Pipeline p(Options("", kLookup));
  ASSERT_TRUE(p.Run());
  EXPECT_EQ(testing::ReadFile(output_),
            "Tag Counts:\n"
            "Tag,Count\n"
            "\n"
            "Port/Protocol Combination Counts:\n"
            "Port,Protocol,Count\n");
  EXPECT_EQ(p.stats().chunks, 0);
}

TEST_F(PipelineTest, TestUnknownProtocol) {
  Pipeline p(Options(testing::FlowLine("25", "999"), kLookup));
  ASSERT_TRUE(p.Run());
  EXPECT_EQ(testing::ReadFile(output_),
            "Tag Counts:\n"
            "Tag,Count\n"
            "Untagged,1\n"
            "\n"
            "Port/Protocol Combination Counts:\n"
            "Port,Protocol,Count\n"
            "25,unknown,1\n");
}

TEST_F(PipelineTest, TestLookupNormalization) {
  std::string log = testing::FlowLine("80", "6") + testing::FlowLine("80", "6");
  Pipeline lower(Options(log, "dstport,protocol,tag\n80,tcp,web\n"));
  ASSERT_TRUE(lower.Run());
  std::string want = testing::ReadFile(output_);
  Pipeline upper(Options(log, "DstPort,Protocol,tag\n80,TCP,web\n"));
  ASSERT_TRUE(upper.Run());
  EXPECT_EQ(testing::ReadFile(output_), want);
  EXPECT_NE(want.find("web,2\n"), std::string::npos);
}

TEST_F(PipelineTest, TestDuplicateLookupRows) {
  Pipeline p(Options(testing::FlowLine("25", "6"),
                     "dstport,protocol,tag\n25,tcp,old\n25,tcp,new\n"));
  ASSERT_TRUE(p.Run());
  std::string report = testing::ReadFile(output_);
  EXPECT_NE(report.find("new,1\n"), std::string::npos);
  EXPECT_EQ(report.find("old"), std::string::npos);
}

TEST_F(PipelineTest, TestTotalsMatchWellFormedLines) {
  int well_formed;
  std::string log = MixedLog(2000, &well_formed);
  Pipeline::Options o = Options(log, kLookup);
  o.chunk_size = 37;
  o.workers = 4;
  Pipeline p(o);
  ASSERT_TRUE(p.Run());
  EXPECT_EQ(p.counts().TotalTagged(), well_formed);
  EXPECT_EQ(p.counts().TotalPortProtocol(), well_formed);
  EXPECT_EQ(p.stats().records, well_formed);
  EXPECT_EQ(p.stats().lines, 2000);
  EXPECT_EQ(p.stats().malformed, 2000 - well_formed);
  EXPECT_EQ(p.stats().chunks, (2000 + 36) / 37);
}

TEST_F(PipelineTest, TestReportIndependentOfScheduling) {
  int well_formed;
  std::string log = MixedLog(5000, &well_formed);
  std::string want;
  const size_t chunk_sizes[] = {1, 7, 1000, 100000};
  const int workers[] = {1, 3, 8};
  const int pending[] = {1, 0};
  for (size_t chunk_size : chunk_sizes) {
    for (int w : workers) {
      for (int max_pending : pending) {
        Pipeline::Options o = Options(log, kLookup);
        o.chunk_size = chunk_size;
        o.workers = w;
        o.max_pending = max_pending;
        Pipeline p(o);
        ASSERT_TRUE(p.Run()) << chunk_size << "/" << w << "/" << max_pending;
        std::string got = testing::ReadFile(output_);
        if (want.empty()) {
          want = got;
        }
        EXPECT_EQ(got, want) << chunk_size << "/" << w << "/" << max_pending;
      }
    }
  }
  EXPECT_NE(want.find("Untagged,"), std::string::npos);
  EXPECT_NE(want.find("25,unknown,"), std::string::npos);
}

TEST_F(PipelineTest, TestMissingFlowLog) {
  Pipeline::Options o = Options("", kLookup);
  o.flow_log_path = tmp_.dir() + "/missing.log";
  Pipeline p(o);
  EXPECT_FALSE(p.Run());
  EXPECT_EQ(p.state(), Pipeline::FAILED);
  EXPECT_FALSE(testing::FileExists(output_));
}

TEST_F(PipelineTest, TestMissingLookup) {
  Pipeline::Options o = Options(testing::FlowLine("25", "6"), kLookup);
  o.lookup_path = tmp_.dir();  // a directory, not a file
  Pipeline p(o);
  EXPECT_FALSE(p.Run());
  EXPECT_EQ(p.state(), Pipeline::FAILED);
  EXPECT_FALSE(testing::FileExists(output_));
}

TEST_F(PipelineTest, TestBadLookupHeader) {
  Pipeline p(Options(testing::FlowLine("25", "6"), "port,proto,tag\n"));
  EXPECT_FALSE(p.Run());
  EXPECT_EQ(p.state(), Pipeline::FAILED);
  EXPECT_FALSE(testing::FileExists(output_));
}

TEST_F(PipelineTest, TestUnwritableOutput) {
  Pipeline::Options o = Options(testing::FlowLine("25", "6"), kLookup);
  o.output_path = tmp_.dir() + "/no/such/dir/report.txt";
  Pipeline p(o);
  EXPECT_FALSE(p.Run());
  EXPECT_EQ(p.state(), Pipeline::FAILED);
}

TEST_F(PipelineTest, TestStateNames) {
  EXPECT_STREQ(Pipeline::StateName(Pipeline::INIT), "INIT");
  EXPECT_STREQ(Pipeline::StateName(Pipeline::AGGREGATING), "AGGREGATING");
  EXPECT_STREQ(Pipeline::StateName(Pipeline::FAILED), "FAILED");
}

}  // namespace flowtag
