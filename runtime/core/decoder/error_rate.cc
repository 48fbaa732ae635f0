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

#include "decoder/error_rate.h"

#include <algorithm>
#include <utility>

#include "utils/log.h"
#include "utils/string.h"

namespace kospeech {

int EditDistance(const std::vector<std::string>& ref,
                 const std::vector<std::string>& hyp) {
  // 只保留一行的动态规划表
  std::vector<int> dp(hyp.size() + 1);
  for (size_t j = 0; j <= hyp.size(); ++j) dp[j] = j;
  for (size_t i = 1; i <= ref.size(); ++i) {
    int prev = dp[0];
    dp[0] = i;
    for (size_t j = 1; j <= hyp.size(); ++j) {
      int cur = dp[j];
      int cost = ref[i - 1] == hyp[j - 1] ? 0 : 1;
      dp[j] = std::min({dp[j] + 1, dp[j - 1] + 1, prev + cost});
      prev = cur;
    }
  }
  return dp[hyp.size()];
}

float ErrorRate::Compute(const std::vector<std::vector<int>>& targets,
                         const std::vector<std::vector<int>>& hypotheses) {
  CHECK_EQ(targets.size(), hypotheses.size());
  for (size_t i = 0; i < targets.size(); ++i) {
    int distance = 0, length = 0;
    Distance(vocab_->LabelsToText(targets[i]),
             vocab_->LabelsToText(hypotheses[i]), &distance, &length);
    total_distance_ += distance;
    total_length_ += length;
  }
  return value();
}

float ErrorRate::value() const {
  if (total_length_ == 0) return 0.0f;
  return static_cast<float>(total_distance_) / total_length_;
}

void ErrorRate::Reset() {
  total_distance_ = 0;
  total_length_ = 0;
}

static std::vector<std::string> ToChars(const std::string& sentence) {
  std::vector<std::string> chars;
  SplitUTF8StringToChars(sentence, &chars);
  chars.erase(std::remove_if(chars.begin(), chars.end(),
                             [](const std::string& c) {
                               return c == " " || c == "_";
                             }),
              chars.end());
  return chars;
}

void CharacterErrorRate::Distance(const std::string& ref,
                                  const std::string& hyp, int* distance,
                                  int* length) const {
  std::vector<std::string> ref_chars = ToChars(ref);
  *distance = EditDistance(ref_chars, ToChars(hyp));
  *length = ref_chars.size();
}

void WordErrorRate::Distance(const std::string& ref, const std::string& hyp,
                             int* distance, int* length) const {
  std::vector<std::string> ref_words, hyp_words;
  SplitString(ref, &ref_words);
  SplitString(hyp, &hyp_words);
  *distance = EditDistance(ref_words, hyp_words);
  *length = ref_words.size();
}

std::unique_ptr<ErrorRate> CreateErrorRate(
    const std::string& metric, std::shared_ptr<const Vocabulary> vocab) {
  CHECK(vocab != nullptr);
  if (metric == "char") {
    return std::unique_ptr<ErrorRate>(
        new CharacterErrorRate(std::move(vocab)));
  } else if (metric == "word") {
    return std::unique_ptr<ErrorRate>(new WordErrorRate(std::move(vocab)));
  }
  LOG(FATAL) << "Unsupported metric : " << metric;
  return nullptr;
}

}  // namespace kospeech
