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

#ifndef DECODER_ATTENTION_DECODER_H_
#define DECODER_ATTENTION_DECODER_H_

#include <vector>

namespace kospeech {

// The autoregressive decoder shared by LAS and Speech Transformer, it is the
// per step distribution function that greedy and beam search drive.
class AttentionDecoder {
 public:
  virtual ~AttentionDecoder() {}

  virtual int sos() const = 0;
  virtual int eos() const = 0;
  // Max number of tokens generated for one utterance, <eos> included.
  virtual int max_length() const = 0;

  // Log probabilities of the next token for one utterance, given its encoder
  // output and the tokens decoded so far. prefix always starts with sos().
  virtual void ForwardStep(const std::vector<std::vector<float>>& encoder_out,
                           const std::vector<int>& prefix,
                           std::vector<float>* logp) = 0;
};

}  // namespace kospeech

#endif  // DECODER_ATTENTION_DECODER_H_
