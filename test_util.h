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

#ifndef FLOWTAG_TEST_UTIL_H_
#define FLOWTAG_TEST_UTIL_H_

#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace flowtag {
namespace testing {

// TempDir creates a fresh directory and removes the files created through it
// when destroyed.
class TempDir {
 public:
  TempDir() {
    const char* base = getenv("TEST_TMPDIR");
    std::string templ = std::string(base ? base : "/tmp") + "/flowtag.XXXXXX";
    std::vector<char> buf(templ.begin(), templ.end());
    buf.push_back('\0');
    EXPECT_NE(mkdtemp(buf.data()), nullptr);
    dir_ = buf.data();
  }
  ~TempDir() {
    for (const auto& f : files_) {
      unlink(f.c_str());
    }
    rmdir(dir_.c_str());
  }

  const std::string& dir() const { return dir_; }

  // Path of name inside the directory, removed along with it.
  std::string Path(const std::string& name) {
    std::string path = dir_ + "/" + name;
    files_.push_back(path);
    return path;
  }

  std::string Write(const std::string& name, const std::string& contents) {
    std::string path = Path(name);
    std::ofstream out(path.c_str(), std::ios::binary);
    out << contents;
    return path;
  }

 private:
  std::string dir_;
  std::vector<std::string> files_;
};

inline bool FileExists(const std::string& path) {
  return access(path.c_str(), F_OK) == 0;
}

inline std::string ReadFile(const std::string& path) {
  std::ifstream in(path.c_str(), std::ios::binary);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

// FlowLine builds a 14 field flow log line with the given destination port
// and protocol number in fields 5 and 6.
inline std::string FlowLine(const std::string& dst_port,
                            const std::string& protocol) {
  return "2024-09-01T10:00:00Z 10.0.1.201 49153 198.51.100.2 0 " + dst_port +
         " " + protocol + " allow value1 value2 value3 value4 value5 value6\n";
}

}  // namespace testing
}  // namespace flowtag

#endif  // FLOWTAG_TEST_UTIL_H_
