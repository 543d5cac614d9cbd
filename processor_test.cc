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

#include "processor.h"
#include "test_util.h"

namespace flowtag {

class ProcessorTest : public ::testing::Test {
 protected:
  ProcessorTest() {
    lookup_.Add("25", "tcp", "sv_P1");
    lookup_.Add("68", "udp", "sv_P2");
    lookup_.Add("23", "tcp", "sv_P1");
    lookup_.Add("7", "unknown", "odd");
  }

  void AddLine(const std::string& text) {
    Chunk::Line line;
    line.number = chunk_.lines.size() + 1;
    line.text = text;
    chunk_.lines.push_back(line);
  }

  uint64_t PortProtocolCount(const std::string& port,
                             const std::string& protocol) {
    auto found = counts_.port_protocols.find(PortProtocol(port, protocol));
    return found == counts_.port_protocols.end() ? 0 : found->second;
  }
  uint64_t TagCount(const std::string& tag) {
    auto found = counts_.tags.find(tag);
    return found == counts_.tags.end() ? 0 : found->second;
  }

  LookupTable lookup_;
  Chunk chunk_;
  Counts counts_;
};

TEST_F(ProcessorTest, TestEmptyChunk) {
  ProcessChunk(chunk_, lookup_, &counts_);
  EXPECT_TRUE(counts_.tags.empty());
  EXPECT_TRUE(counts_.port_protocols.empty());
  EXPECT_EQ(counts_.lines, 0);
}

TEST_F(ProcessorTest, TestTagged) {
  AddLine(testing::FlowLine("25", "6"));
  AddLine(testing::FlowLine("68", "17"));
  AddLine(testing::FlowLine("23", "6"));
  ProcessChunk(chunk_, lookup_, &counts_);
  EXPECT_EQ(TagCount("sv_P1"), 2);
  EXPECT_EQ(TagCount("sv_P2"), 1);
  EXPECT_EQ(TagCount(kUntagged), 0);
  EXPECT_EQ(PortProtocolCount("25", "tcp"), 1);
  EXPECT_EQ(PortProtocolCount("68", "udp"), 1);
  EXPECT_EQ(PortProtocolCount("23", "tcp"), 1);
  EXPECT_EQ(counts_.port_protocols.size(), 3);
}

TEST_F(ProcessorTest, TestUntagged) {
  AddLine(testing::FlowLine("25", "17"));  // 25/udp isn't in the table
  AddLine(testing::FlowLine("443", "6"));
  AddLine(testing::FlowLine("0", "1"));
  ProcessChunk(chunk_, lookup_, &counts_);
  EXPECT_EQ(TagCount(kUntagged), 3);
  EXPECT_EQ(counts_.tags.size(), 1);
  EXPECT_EQ(PortProtocolCount("25", "udp"), 1);
  EXPECT_EQ(PortProtocolCount("443", "tcp"), 1);
  EXPECT_EQ(PortProtocolCount("0", "icmp"), 1);
}

TEST_F(ProcessorTest, TestMalformedLinesSkipped) {
  AddLine(testing::FlowLine("25", "6"));
  AddLine("a b c d e");
  AddLine("");
  AddLine(testing::FlowLine("68", "17"));
  ProcessChunk(chunk_, lookup_, &counts_);
  EXPECT_EQ(counts_.lines, 4);
  EXPECT_EQ(counts_.malformed, 2);
  EXPECT_EQ(TagCount("sv_P1"), 1);
  EXPECT_EQ(TagCount("sv_P2"), 1);
  EXPECT_EQ(counts_.TotalTagged(), 2);
  EXPECT_EQ(counts_.TotalPortProtocol(), 2);
}

TEST_F(ProcessorTest, TestUnknownProtocol) {
  AddLine(testing::FlowLine("25", "999"));
  AddLine(testing::FlowLine("7", "47"));
  ProcessChunk(chunk_, lookup_, &counts_);
  EXPECT_EQ(PortProtocolCount("25", "unknown"), 1);
  EXPECT_EQ(PortProtocolCount("7", "unknown"), 1);
  EXPECT_EQ(TagCount(kUntagged), 1);
  // Unknown protocols still take part in lookups.
  EXPECT_EQ(TagCount("odd"), 1);
}

TEST_F(ProcessorTest, TestPortIsNormalized) {
  LookupTable lookup;
  lookup.Add("HTTP", "tcp", "web");
  AddLine(testing::FlowLine("Http", "6"));
  AddLine(testing::FlowLine("http", "6"));
  ProcessChunk(chunk_, lookup, &counts_);
  EXPECT_EQ(PortProtocolCount("http", "tcp"), 2);
  EXPECT_EQ(TagCount("web"), 2);
}

TEST_F(ProcessorTest, TestEmptyTagCountsAsUntagged) {
  LookupTable lookup;
  lookup.Add("25", "tcp", "  ");
  AddLine(testing::FlowLine("25", "6"));
  ProcessChunk(chunk_, lookup, &counts_);
  EXPECT_EQ(TagCount(kUntagged), 1);
  EXPECT_EQ(counts_.tags.size(), 1);
}

}  // namespace flowtag
