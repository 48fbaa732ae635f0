// Copyright (c) 2020 Mobvoi Inc (Binbin Zhang)
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

#ifndef DECODER_CTC_PREFIX_BEAM_SEARCH_H_
#define DECODER_CTC_PREFIX_BEAM_SEARCH_H_

#include <cstddef>
#include <unordered_map>
#include <utility>
#include <vector>

#include "decoder/search_interface.h"
#include "utils/utils.h"

namespace kospeech {

struct CtcPrefixBeamSearchOptions {
  int blank = 0;  // blank id
  int first_beam_size = 10;
  int second_beam_size = 10;
};

struct PrefixScore {
  float s = -kFloatMax;   // blank ending score
  float ns = -kFloatMax;  // none blank ending score

  // 前缀总得分，两种结尾路径的概率之和
  float score() const { return LogAdd(s, ns); }
};

struct PrefixHash {
  size_t operator()(const std::vector<int>& prefix) const {
    size_t hash_code = 0;
    // here we use KB&DR hash code
    for (int id : prefix) {
      hash_code = id + 31 * hash_code;
    }
    return hash_code;
  }
};

class CtcPrefixBeamSearch : public SearchInterface {
 public:
  explicit CtcPrefixBeamSearch(const CtcPrefixBeamSearchOptions& opts);

  // logp: [num_frames][blank + 1] log posteriors of one utterance.
  // Returns the best prefix.
  std::vector<int> Search(const std::vector<std::vector<float>>& logp) override;
  SearchType Type() const override { return kBeamSearch; }
  void Reset();

  // N-best prefixes of the last search, in sorted order
  const std::vector<std::vector<int>>& Outputs() const { return hypotheses_; }
  const std::vector<float>& Likelihood() const { return likelihood_; }

 private:
  void UpdateHypotheses(
      const std::vector<std::pair<std::vector<int>, PrefixScore>>& hyps);

  std::vector<std::vector<int>> hypotheses_;
  std::vector<float> likelihood_;
  std::unordered_map<std::vector<int>, PrefixScore, PrefixHash> cur_hyps_;
  const CtcPrefixBeamSearchOptions opts_;

 public:
  KOSPEECH_DISALLOW_COPY_AND_ASSIGN(CtcPrefixBeamSearch);
};

}  // namespace kospeech

#endif  // DECODER_CTC_PREFIX_BEAM_SEARCH_H_
