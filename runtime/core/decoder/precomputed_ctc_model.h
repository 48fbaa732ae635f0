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

#ifndef DECODER_PRECOMPUTED_CTC_MODEL_H_
#define DECODER_PRECOMPUTED_CTC_MODEL_H_

#include <vector>

#include "decoder/asr_model.h"

namespace kospeech {

// A DeepSpeech2 model whose network has already been run offline: the input
// features are its per-frame CTC log posteriors.
class PrecomputedCtcModel : public DeepSpeech2Model {
 public:
  PrecomputedCtcModel() = default;

 protected:
  void ForwardEncoder(const Feature& feats, int length,
                      std::vector<std::vector<float>>* ctc_logp) override;
};

}  // namespace kospeech

#endif  // DECODER_PRECOMPUTED_CTC_MODEL_H_
