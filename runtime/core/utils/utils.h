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

#ifndef UTILS_UTILS_H_
#define UTILS_UTILS_H_

#include <cstdint>
#include <limits>
#include <vector>

namespace kospeech {

#define KOSPEECH_DISALLOW_COPY_AND_ASSIGN(Type) \
  Type(const Type&) = delete;                   \
  Type& operator=(const Type&) = delete;

const float kFloatMax = std::numeric_limits<float>::max();

// Return the sum of two probabilities in log scale
float LogAdd(float x, float y);

// 取最大的k个值及其下标，按值从大到小排列，值相同时下标小的在前
template <typename T>
void TopK(const std::vector<T>& data, int32_t k, std::vector<T>* values,
          std::vector<int>* indices);

// Index of the largest element, the lowest index wins on ties.
int ArgMax(const std::vector<float>& data);

}  // namespace kospeech

#endif  // UTILS_UTILS_H_
