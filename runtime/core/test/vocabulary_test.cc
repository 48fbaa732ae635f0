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

#include "decoder/vocabulary.h"

#include <fstream>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "test/test_models.h"

namespace kospeech {

TEST(VocabularyTest, SpecialIds) {
  auto vocab = test::MakeVocabulary();
  EXPECT_EQ(vocab->size(), test::kVocabSize);
  EXPECT_EQ(vocab->blank_id(), test::kVocabSize);
  EXPECT_EQ(vocab->sos_id(), test::kSos);
  EXPECT_EQ(vocab->eos_id(), test::kEos);
  EXPECT_EQ(vocab->pad_id(), test::kPad);
  EXPECT_EQ(vocab->id("나"), test::kNa);
  EXPECT_EQ(vocab->id("라"), -1);
  EXPECT_EQ(vocab->unit(test::kDa), "다");
}

TEST(VocabularyTest, LabelsToText) {
  auto vocab = test::MakeVocabulary();
  EXPECT_EQ(vocab->LabelsToText({test::kSos, test::kGa, test::kSpace,
                                 test::kNa, test::kEos, test::kDa,
                                 test::kPad}),
            "가 나");
  // blank and pad are skipped, unknown ids too
  EXPECT_EQ(vocab->LabelsToText({test::kGa, test::kBlank, test::kGa,
                                 test::kPad, 42, test::kDa}),
            "가가다");
  EXPECT_EQ(vocab->LabelsToText({}), "");
}

TEST(VocabularyTest, ReadVocabulary) {
  std::string path = ::testing::TempDir() + "vocabulary_test.csv";
  {
    std::ofstream os(path);
    os << "id,char,freq\n"
       << "0,<pad>,0\n"
       << "1,<sos>,0\n"
       << "2,<eos>,0\n"
       << "4,,,7\n"
       << "3,가,100\r\n";
  }
  auto vocab = ReadVocabulary(path);
  ASSERT_EQ(vocab->size(), 5);
  EXPECT_EQ(vocab->unit(3), "가");
  EXPECT_EQ(vocab->unit(4), ",");
  EXPECT_EQ(vocab->eos_id(), 2);
  EXPECT_EQ(vocab->LabelsToText({1, 3, 4, 3, 2}), "가,가");
}

TEST(VocabularyDeathTest, MissingFile) {
  EXPECT_DEATH(ReadVocabulary("/nonexistent/vocab.csv"),
               "Failed to open vocabulary");
}

TEST(VocabularyDeathTest, NonContiguousIds) {
  std::string path = ::testing::TempDir() + "vocabulary_gap_test.csv";
  {
    std::ofstream os(path);
    os << "id,char,freq\n0,a,1\n2,b,1\n";
  }
  EXPECT_DEATH(ReadVocabulary(path), "contiguous");
}

TEST(VocabularyDeathTest, NonNumericId) {
  std::string path = ::testing::TempDir() + "vocabulary_bad_id_test.csv";
  {
    std::ofstream os(path);
    os << "id,char,freq\n0,a,1\none,b,1\n";
  }
  EXPECT_DEATH(ReadVocabulary(path), "Bad id at vocabulary line 3");
}

TEST(VocabularyDeathTest, NotUTF8) {
  // 가 in cp949, then a byte that can't lead any UTF-8 sequence
  std::string path = ::testing::TempDir() + "vocabulary_cp949_test.csv";
  {
    std::ofstream os(path, std::ios::binary);
    os << "id,char,freq\n0,<pad>,0\n1,\xB0\xA1,5\n2,\xFD\xA1,1\n";
  }
  EXPECT_DEATH(ReadVocabulary(path), "vocabulary line 3 is not valid UTF-8");
  std::vector<std::string> units = {"<pad>", "\xFD\xA1"};
  EXPECT_DEATH(Vocabulary vocab(units), "Unit 1 is not valid UTF-8");
}

}  // namespace kospeech
