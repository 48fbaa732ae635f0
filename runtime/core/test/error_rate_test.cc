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

#include "decoder/error_rate.h"

#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "test/test_models.h"

namespace kospeech {

using test::kDa;
using test::kGa;
using test::kNa;
using test::kSpace;

TEST(ErrorRateTest, EditDistance) {
  EXPECT_EQ(EditDistance({}, {}), 0);
  EXPECT_EQ(EditDistance({"a", "b"}, {}), 2);
  EXPECT_EQ(EditDistance({}, {"a"}), 1);
  EXPECT_EQ(EditDistance({"k", "i", "t", "t", "e", "n"},
                         {"s", "i", "t", "t", "i", "n", "g"}),
            3);
}

TEST(ErrorRateTest, CharacterErrorRateIgnoresSpaces) {
  CharacterErrorRate cer(test::MakeVocabulary());
  int distance = 0, length = 0;
  cer.Distance("가 나다", "가나 다", &distance, &length);
  EXPECT_EQ(distance, 0);
  EXPECT_EQ(length, 3);
  cer.Distance("가_나", "나", &distance, &length);
  EXPECT_EQ(distance, 1);
  EXPECT_EQ(length, 2);
}

TEST(ErrorRateTest, WordErrorRate) {
  WordErrorRate wer(test::MakeVocabulary());
  int distance = 0, length = 0;
  wer.Distance("가나 다 가", "가나 가", &distance, &length);
  EXPECT_EQ(distance, 1);
  EXPECT_EQ(length, 3);
}

TEST(ErrorRateTest, AccumulatesOverBatches) {
  auto cer = CreateErrorRate("char", test::MakeVocabulary());
  EXPECT_EQ(cer->name(), "cer");
  // 1 error over 3 chars
  EXPECT_FLOAT_EQ(cer->Compute({{kGa, kNa, kDa, test::kEos}},
                               {{kGa, kNa, test::kEos}}),
                  1.0f / 3);
  // 0 error over 2 chars, accumulated to 1 / 5
  EXPECT_FLOAT_EQ(cer->Compute({{kNa, kDa}}, {{kNa, kDa}}), 1.0f / 5);
  EXPECT_EQ(cer->total_distance(), 1);
  EXPECT_EQ(cer->total_length(), 5);
  cer->Reset();
  EXPECT_FLOAT_EQ(cer->value(), 0.0f);
}

TEST(ErrorRateTest, WordMetric) {
  auto wer = CreateErrorRate("word", test::MakeVocabulary());
  EXPECT_EQ(wer->name(), "wer");
  EXPECT_FLOAT_EQ(
      wer->Compute({{kGa, kNa, kSpace, kDa}}, {{kGa, kNa, kSpace, kGa}}),
      0.5f);
}

TEST(ErrorRateTest, EmptyReference) {
  auto cer = CreateErrorRate("char", test::MakeVocabulary());
  EXPECT_FLOAT_EQ(cer->Compute({{}}, {{}}), 0.0f);
}

TEST(ErrorRateDeathTest, UnsupportedMetric) {
  EXPECT_DEATH(CreateErrorRate("phone", test::MakeVocabulary()),
               "Unsupported metric : phone");
}

}  // namespace kospeech
