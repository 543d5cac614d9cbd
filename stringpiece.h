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

#ifndef FLOWTAG_STRINGPIECE_H_
#define FLOWTAG_STRINGPIECE_H_

#include <ctype.h>
#include <string.h>

#include <string>

namespace flowtag {

// StringPiece is a non-owning view into a char buffer.  The buffer must
// outlive the piece.
class StringPiece {
 public:
  StringPiece() : data_(nullptr), size_(0) {}
  StringPiece(const char* data, size_t size) : data_(data), size_(size) {}
  StringPiece(const char* str) : data_(str), size_(strlen(str)) {}
  StringPiece(const std::string& s) : data_(s.data()), size_(s.size()) {}
  const char* data() const { return data_; }
  size_t size() const { return size_; }
  char operator[](size_t i) const { return data_[i]; }
  bool operator==(const StringPiece& s) const {
    return s.size_ == size_ && memcmp(s.data_, data_, size_) == 0;
  }
  bool operator!=(const StringPiece& s) const { return !operator==(s); }
  std::string ToString() const { return std::string(data_, size_); }

 private:
  const char* data_;
  size_t size_;
};

// Trim strips leading and trailing ASCII whitespace.
inline StringPiece Trim(StringPiece s) {
  const char* start = s.data();
  const char* limit = start + s.size();
  while (start < limit && isspace(static_cast<unsigned char>(*start))) {
    start++;
  }
  while (limit > start && isspace(static_cast<unsigned char>(limit[-1]))) {
    limit--;
  }
  return StringPiece(start, limit - start);
}

inline std::string ToLower(StringPiece s) {
  std::string out(s.data(), s.size());
  for (size_t i = 0; i < out.size(); i++) {
    out[i] = tolower(static_cast<unsigned char>(out[i]));
  }
  return out;
}

// Normalize is Trim followed by ToLower, which is how ports and protocol
// names are compared everywhere.
inline std::string Normalize(StringPiece s) { return ToLower(Trim(s)); }

}  // namespace flowtag

#endif  // FLOWTAG_STRINGPIECE_H_
