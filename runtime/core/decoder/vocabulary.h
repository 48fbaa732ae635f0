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

#ifndef DECODER_VOCABULARY_H_
#define DECODER_VOCABULARY_H_

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "utils/utils.h"

namespace kospeech {

const char kSosSymbol[] = "<sos>";
const char kEosSymbol[] = "<eos>";
const char kPadSymbol[] = "<pad>";

// Immutable mapping from label id to output unit. Ids are contiguous and
// start from 0. The CTC blank label is not part of the table, its id is
// size().
class Vocabulary {
 public:
  explicit Vocabulary(const std::vector<std::string>& units);

  // Number of units, blank excluded.
  int size() const { return static_cast<int>(units_.size()); }
  int blank_id() const { return size(); }
  int sos_id() const { return sos_id_; }
  int eos_id() const { return eos_id_; }
  int pad_id() const { return pad_id_; }

  const std::string& unit(int id) const;
  // Returns -1 if the unit is unknown.
  int id(const std::string& unit) const;

  // Stops at the first <eos>, and skips <sos>, <pad> and blank.
  std::string LabelsToText(const std::vector<int>& labels) const;

 private:
  std::vector<std::string> units_;
  std::unordered_map<std::string, int> unit_to_id_;
  int sos_id_ = -1;
  int eos_id_ = -1;
  int pad_id_ = -1;

 public:
  KOSPEECH_DISALLOW_COPY_AND_ASSIGN(Vocabulary);
};

// Read the label csv, "id,char,freq" per line after a header line.
std::shared_ptr<Vocabulary> ReadVocabulary(const std::string& path);

}  // namespace kospeech

#endif  // DECODER_VOCABULARY_H_
