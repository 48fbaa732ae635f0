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

#ifndef DECODER_BATCH_H_
#define DECODER_BATCH_H_

#include <vector>

namespace kospeech {

// One utterance of features, [num_frames][feature_dim]
using Feature = std::vector<std::vector<float>>;

// A mini batch produced by the data loader. Targets start with <sos> and
// may be padded after <eos>; target_lengths holds the unpadded lengths.
struct Batch {
  std::vector<Feature> inputs;
  std::vector<std::vector<int>> targets;
  std::vector<int> input_lengths;
  std::vector<int> target_lengths;

  int size() const { return static_cast<int>(inputs.size()); }
  // 没有任何输入的batch表示数据流结束
  bool empty() const { return inputs.empty(); }
};

}  // namespace kospeech

#endif  // DECODER_BATCH_H_
