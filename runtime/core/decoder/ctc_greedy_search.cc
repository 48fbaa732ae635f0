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

#include "decoder/ctc_greedy_search.h"

#include "utils/log.h"
#include "utils/utils.h"

namespace kospeech {

std::vector<int> CtcGreedySearch::Search(
    const std::vector<std::vector<float>>& logp) {
  std::vector<int> result;
  int prev = blank_;
  for (const auto& logp_t : logp) {
    CHECK_GT(static_cast<int>(logp_t.size()), blank_);
    int id = ArgMax(logp_t);
    if (id != blank_ && id != prev) {
      result.emplace_back(id);
    }
    prev = id;
  }
  return result;
}

}  // namespace kospeech
