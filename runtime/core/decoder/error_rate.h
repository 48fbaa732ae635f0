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

#ifndef DECODER_ERROR_RATE_H_
#define DECODER_ERROR_RATE_H_

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "decoder/vocabulary.h"
#include "utils/utils.h"

namespace kospeech {

// Levenshtein distance between two token sequences.
int EditDistance(const std::vector<std::string>& ref,
                 const std::vector<std::string>& hyp);

// Accumulates edit distance and reference length over every batch it has
// seen, Compute() returns the error rate of everything so far.
class ErrorRate {
 public:
  explicit ErrorRate(std::shared_ptr<const Vocabulary> vocab)
      : vocab_(std::move(vocab)) {}
  virtual ~ErrorRate() {}

  float Compute(const std::vector<std::vector<int>>& targets,
                const std::vector<std::vector<int>>& hypotheses);

  virtual std::string name() const = 0;
  // Distance and reference length of a single pair of sentences.
  virtual void Distance(const std::string& ref, const std::string& hyp,
                        int* distance, int* length) const = 0;

  float value() const;
  int64_t total_distance() const { return total_distance_; }
  int64_t total_length() const { return total_length_; }
  void Reset();

 protected:
  std::shared_ptr<const Vocabulary> vocab_;

 private:
  int64_t total_distance_ = 0;
  int64_t total_length_ = 0;
};

// Spaces and word piece markers are ignored, compared char by char.
class CharacterErrorRate : public ErrorRate {
 public:
  explicit CharacterErrorRate(std::shared_ptr<const Vocabulary> vocab)
      : ErrorRate(std::move(vocab)) {}
  std::string name() const override { return "cer"; }
  void Distance(const std::string& ref, const std::string& hyp, int* distance,
                int* length) const override;
};

class WordErrorRate : public ErrorRate {
 public:
  explicit WordErrorRate(std::shared_ptr<const Vocabulary> vocab)
      : ErrorRate(std::move(vocab)) {}
  std::string name() const override { return "wer"; }
  void Distance(const std::string& ref, const std::string& hyp, int* distance,
                int* length) const override;
};

// metric is "char" or "word", anything else is fatal.
std::unique_ptr<ErrorRate> CreateErrorRate(
    const std::string& metric, std::shared_ptr<const Vocabulary> vocab);

}  // namespace kospeech

#endif  // DECODER_ERROR_RATE_H_
