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

#include "decoder/vocabulary.h"

#include <climits>
#include <cstdlib>
#include <fstream>
#include <map>
#include <utility>

#include "utils/log.h"
#include "utils/string.h"

namespace kospeech {

Vocabulary::Vocabulary(const std::vector<std::string>& units)
    : units_(units) {
  for (int i = 0; i < units_.size(); ++i) {
    // 字符错误率按UTF-8切分字符，其他编码的词表在这里就报错
    CHECK(IsValidUTF8(units_[i])) << "Unit " << i << " is not valid UTF-8";
    CHECK(unit_to_id_.emplace(units_[i], i).second)
        << "Duplicated unit " << units_[i];
  }
  sos_id_ = id(kSosSymbol);
  eos_id_ = id(kEosSymbol);
  pad_id_ = id(kPadSymbol);
}

const std::string& Vocabulary::unit(int id) const {
  CHECK_GE(id, 0);
  CHECK_LT(id, size());
  return units_[id];
}

int Vocabulary::id(const std::string& unit) const {
  auto it = unit_to_id_.find(unit);
  return it == unit_to_id_.end() ? -1 : it->second;
}

std::string Vocabulary::LabelsToText(const std::vector<int>& labels) const {
  std::string text;
  for (int label : labels) {
    if (label == eos_id_) break;
    if (label == sos_id_ || label == pad_id_ || label == blank_id()) {
      continue;
    }
    if (label < 0 || label >= size()) {
      LOG(WARNING) << "Label " << label << " out of vocabulary, skip it";
      continue;
    }
    text += units_[label];
  }
  return text;
}

std::shared_ptr<Vocabulary> ReadVocabulary(const std::string& path) {
  std::ifstream is(path);
  CHECK(is.good()) << "Failed to open vocabulary " << path;
  std::string line;
  // Skip header, id,char,freq
  CHECK(std::getline(is, line)) << "Empty vocabulary " << path;
  std::map<int, std::string> id_to_unit;
  int line_no = 1;
  while (std::getline(is, line)) {
    ++line_no;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) continue;
    // The unit itself may be a comma, so take everything between the first
    // and the last comma.
    size_t first = line.find(',');
    CHECK_NE(first, std::string::npos)
        << "Bad vocabulary line " << line_no << ": " << line;
    size_t last = line.rfind(',');
    std::string unit = last > first ? line.substr(first + 1, last - first - 1)
                                    : line.substr(first + 1);
    CHECK(IsValidUTF8(unit)) << "Unit at vocabulary line " << line_no
                             << " is not valid UTF-8, convert " << path
                             << " to UTF-8 first";
    std::string id_str = Trim(line.substr(0, first));
    char* end = nullptr;
    long parsed = std::strtol(id_str.c_str(), &end, 10);  // NOLINT
    CHECK(!id_str.empty() && *end == '\0' && parsed >= 0 && parsed <= INT_MAX)
        << "Bad id at vocabulary line " << line_no << ": " << line;
    int id = static_cast<int>(parsed);
    CHECK(id_to_unit.emplace(id, unit).second)
        << "Duplicated id " << id << " in " << path;
  }
  std::vector<std::string> units;
  for (const auto& item : id_to_unit) {
    CHECK_EQ(item.first, static_cast<int>(units.size()))
        << "Vocabulary ids must be contiguous";
    units.emplace_back(item.second);
  }
  LOG(INFO) << "Read " << units.size() << " units from " << path;
  return std::make_shared<Vocabulary>(units);
}

}  // namespace kospeech
