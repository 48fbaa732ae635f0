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

#ifndef DECODER_CTC_GREEDY_SEARCH_H_
#define DECODER_CTC_GREEDY_SEARCH_H_

#include <vector>

#include "decoder/search_interface.h"

namespace kospeech {

// Best path decoding: argmax of every frame, then merge repeated labels and
// drop blanks.
class CtcGreedySearch : public SearchInterface {
 public:
  explicit CtcGreedySearch(int blank) : blank_(blank) {}

  std::vector<int> Search(const std::vector<std::vector<float>>& logp) override;
  SearchType Type() const override { return kGreedySearch; }

 private:
  int blank_;
};

}  // namespace kospeech

#endif  // DECODER_CTC_GREEDY_SEARCH_H_
