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

#ifndef DECODER_ATTENTION_SEARCH_H_
#define DECODER_ATTENTION_SEARCH_H_

#include <memory>
#include <vector>

#include "decoder/attention_decoder.h"
#include "decoder/search_interface.h"
#include "utils/utils.h"

namespace kospeech {

// Always take the most likely next token.
class GreedyDecoder : public SearchInterface {
 public:
  explicit GreedyDecoder(std::shared_ptr<AttentionDecoder> decoder);

  std::vector<int> Search(
      const std::vector<std::vector<float>>& encoder_out) override;
  SearchType Type() const override { return kGreedySearch; }

 private:
  std::shared_ptr<AttentionDecoder> decoder_;

 public:
  KOSPEECH_DISALLOW_COPY_AND_ASSIGN(GreedyDecoder);
};

struct BeamHypothesis {
  std::vector<int> tokens;  // starts with <sos>
  float score = 0.0f;       // sum of token log probabilities
  bool finished = false;    // <eos> emitted
};

// Beam search over the wrapped decoder, keeping the k best hypotheses of the
// utterance after every step. Scores are not length normalized.
class TopKDecoder : public SearchInterface {
 public:
  TopKDecoder(std::shared_ptr<AttentionDecoder> decoder, int k);

  // Returns the best finished hypothesis, or the best one of any status if
  // none finished before max_length. <sos> is stripped, <eos> is kept.
  std::vector<int> Search(
      const std::vector<std::vector<float>>& encoder_out) override;
  SearchType Type() const override { return kBeamSearch; }
  int k() const { return k_; }

  // Final beam of the last search, in rank order
  const std::vector<std::vector<int>>& Outputs() const { return outputs_; }
  const std::vector<float>& Likelihood() const { return likelihood_; }
  const std::vector<bool>& Finished() const { return finished_; }

 private:
  // One step of the search, returns false when nothing is left to expand.
  bool Advance(const std::vector<std::vector<float>>& encoder_out,
               std::vector<BeamHypothesis>* beam);
  void UpdateOutputs(const std::vector<BeamHypothesis>& beam);

  std::shared_ptr<AttentionDecoder> decoder_;
  int k_;

  std::vector<std::vector<int>> outputs_;
  std::vector<float> likelihood_;
  std::vector<bool> finished_;

 public:
  KOSPEECH_DISALLOW_COPY_AND_ASSIGN(TopKDecoder);
};

}  // namespace kospeech

#endif  // DECODER_ATTENTION_SEARCH_H_
