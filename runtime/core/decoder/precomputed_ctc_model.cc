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

#include "decoder/precomputed_ctc_model.h"

#include "utils/log.h"

namespace kospeech {

void PrecomputedCtcModel::ForwardEncoder(
    const Feature& feats, int length,
    std::vector<std::vector<float>>* ctc_logp) {
  CHECK_LE(length, static_cast<int>(feats.size()));
  ctc_logp->assign(feats.begin(), feats.begin() + length);
}

}  // namespace kospeech
