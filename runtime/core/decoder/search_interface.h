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

#ifndef DECODER_SEARCH_INTERFACE_H_
#define DECODER_SEARCH_INTERFACE_H_

#include <vector>

namespace kospeech {

enum SearchType {
  kGreedySearch = 0x00,
  kBeamSearch = 0x01,
};

// How the terminal decoding step of a model turns distributions into tokens.
// Passed into each inference call, models keep no search state.
struct SearchOptions {
  SearchType type = kGreedySearch;
  int beam_size = 1;
};

// Decodes one utterance. The input is the encoder output for attention
// decoders and the per-frame log posteriors for CTC searches.
class SearchInterface {
 public:
  virtual ~SearchInterface() {}
  virtual std::vector<int> Search(
      const std::vector<std::vector<float>>& input) = 0;
  virtual SearchType Type() const = 0;
};

}  // namespace kospeech

#endif  // DECODER_SEARCH_INTERFACE_H_
