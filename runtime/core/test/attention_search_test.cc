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

#include "decoder/attention_search.h"

#include <algorithm>
#include <cmath>
#include <memory>
#include <random>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/test_models.h"

namespace kospeech {

using ::testing::ElementsAre;
using test::FunctionDecoder;
using test::kDa;
using test::kEos;
using test::kGa;
using test::kNa;
using test::kSos;
using test::kVocabSize;
using test::LogProbs;

// A fixed but arbitrary distribution for every prefix
static std::vector<float> RandomStep(const Feature& encoder_out,
                                     const std::vector<int>& prefix) {
  size_t seed = encoder_out.size();
  for (int id : prefix) seed = seed * 31 + id;
  std::mt19937 gen(seed);
  std::uniform_real_distribution<float> dist(0.0f, 4.0f);
  std::vector<float> logits(kVocabSize);
  for (auto& x : logits) x = dist(gen);
  float max = *std::max_element(logits.begin(), logits.end());
  float sum = 0.0f;
  for (float x : logits) sum += std::exp(x - max);
  for (auto& x : logits) x = x - max - std::log(sum);
  return logits;
}

TEST(GreedyDecoderTest, StopsAtEos) {
  auto decoder = test::MakeEchoDecoder();
  GreedyDecoder searcher(decoder);
  Feature encoder_out = test::PeakedFeature({kGa, kNa}, kVocabSize);
  EXPECT_THAT(searcher.Search(encoder_out), ElementsAre(kGa, kNa, kEos));
  EXPECT_EQ(searcher.Type(), kGreedySearch);
}

TEST(GreedyDecoderTest, StopsAtMaxLength) {
  auto decoder = std::make_shared<FunctionDecoder>(
      [](const Feature&, const std::vector<int>&) {
        return test::PeakedLogProbs(kVocabSize, kDa);
      },
      4);
  GreedyDecoder searcher(decoder);
  EXPECT_THAT(searcher.Search(Feature()), ElementsAre(kDa, kDa, kDa, kDa));
}

TEST(TopKDecoderTest, BeamOfOneEqualsGreedy) {
  for (int frames = 0; frames < 20; ++frames) {
    auto decoder = std::make_shared<FunctionDecoder>(RandomStep, 8);
    Feature encoder_out(frames, std::vector<float>(1));
    GreedyDecoder greedy(decoder);
    TopKDecoder beam(decoder, 1);
    EXPECT_EQ(beam.Search(encoder_out), greedy.Search(encoder_out))
        << "frames " << frames;
  }
}

TEST(TopKDecoderTest, BeamOfOneEqualsGreedyWhenSumsRound) {
  // After a prefix score of -1000 the two continuations round to the same
  // float sum, greedy still picks 다 by its step log-prob.
  auto decoder = std::make_shared<FunctionDecoder>(
      [](const Feature&, const std::vector<int>& prefix) {
        std::vector<float> logp(kVocabSize, -5000.0f);
        if (prefix.size() == 1) {
          logp[kGa] = -1000.0f;
        } else {
          logp[kNa] = -0.693147f;
          logp[kDa] = -0.693146f;
        }
        return logp;
      },
      2);
  GreedyDecoder greedy(decoder);
  TopKDecoder beam(decoder, 1);
  EXPECT_THAT(greedy.Search(Feature()), ElementsAre(kGa, kDa));
  EXPECT_THAT(beam.Search(Feature()), ElementsAre(kGa, kDa));
}

TEST(TopKDecoderTest, DominantPathWins) {
  // Whatever the prefix, the next token on the path 가 나 다 <eos> takes
  // most of the mass.
  const std::vector<int> path = {kGa, kNa, kDa, kEos};
  auto decoder = std::make_shared<FunctionDecoder>(
      [&path](const Feature&, const std::vector<int>& prefix) {
        size_t step = std::min(prefix.size() - 1, path.size() - 1);
        return test::PeakedLogProbs(kVocabSize, path[step], 0.8f);
      });
  TopKDecoder beam(decoder, 3);
  EXPECT_THAT(beam.Search(Feature()), ElementsAre(kGa, kNa, kDa, kEos));
  EXPECT_EQ(beam.Type(), kBeamSearch);
}

TEST(TopKDecoderTest, FindsPathGreedyMisses) {
  // 가 is the better first token, but every continuation of 나 is better.
  auto decoder = std::make_shared<FunctionDecoder>(
      [](const Feature&, const std::vector<int>& prefix) {
        if (prefix.size() == 1) {
          return LogProbs(kVocabSize, {{kGa, 0.55f}, {kNa, 0.45f}});
        } else if (prefix.back() == kGa) {
          return LogProbs(kVocabSize, {{kEos, 0.4f}, {kGa, 0.3f}, {kNa, 0.3f}});
        }
        return LogProbs(kVocabSize, {{kEos, 0.9f}});
      });
  GreedyDecoder greedy(decoder);
  EXPECT_THAT(greedy.Search(Feature()), ElementsAre(kGa, kEos));
  TopKDecoder beam(decoder, 2);
  EXPECT_THAT(beam.Search(Feature()), ElementsAre(kNa, kEos));
  EXPECT_NEAR(beam.Likelihood()[0], std::log(0.45f * 0.9f), 1e-5);
}

TEST(TopKDecoderTest, BeamNeverExceedsK) {
  auto decoder = std::make_shared<FunctionDecoder>(RandomStep, 6);
  for (int k = 1; k <= 5; ++k) {
    TopKDecoder beam(decoder, k);
    beam.Search(Feature(3, std::vector<float>(1)));
    EXPECT_LE(static_cast<int>(beam.Outputs().size()), k);
    EXPECT_TRUE(std::is_sorted(beam.Likelihood().rbegin(),
                               beam.Likelihood().rend()));
  }
}

TEST(TopKDecoderTest, FinishedHypothesesAreNotExtended) {
  auto decoder = std::make_shared<FunctionDecoder>(
      [](const Feature&, const std::vector<int>& prefix) {
        if (prefix.size() == 1) {
          return LogProbs(kVocabSize, {{kEos, 0.6f}, {kGa, 0.4f}});
        }
        return LogProbs(kVocabSize, {{kGa, 0.5f}, {kNa, 0.5f}});
      },
      3);
  TopKDecoder beam(decoder, 2);
  EXPECT_THAT(beam.Search(Feature()), ElementsAre(kEos));
  for (const auto& prefix : decoder->prefixes()) {
    EXPECT_EQ(std::count(prefix.begin(), prefix.end(), kEos), 0);
  }
  // The finished hypothesis is still in the beam
  ASSERT_EQ(beam.Outputs().size(), 2u);
  EXPECT_THAT(beam.Outputs()[0], ElementsAre(kEos));
  EXPECT_TRUE(beam.Finished()[0]);
  EXPECT_FALSE(beam.Finished()[1]);
}

TEST(TopKDecoderTest, BestUnfinishedWhenNothingFinished) {
  auto decoder = std::make_shared<FunctionDecoder>(
      [](const Feature&, const std::vector<int>& prefix) {
        if (prefix.back() == kGa) {
          return LogProbs(kVocabSize, {{kNa, 0.7f}, {kDa, 0.29f}}, 1e-6f);
        }
        return LogProbs(kVocabSize, {{kGa, 0.6f}, {kDa, 0.39f}}, 1e-6f);
      },
      3);
  TopKDecoder beam(decoder, 3);
  EXPECT_THAT(beam.Search(Feature()), ElementsAre(kGa, kNa, kGa));
  for (bool finished : beam.Finished()) EXPECT_FALSE(finished);
}

TEST(TopKDecoderTest, FinishedBeatsHigherUnfinished) {
  // 가 <eos> finishes with 0.3 * 0.5, while 나 다 keeps a higher score but
  // never finishes before the max length.
  auto decoder = std::make_shared<FunctionDecoder>(
      [](const Feature&, const std::vector<int>& prefix) {
        if (prefix.size() == 1) {
          return LogProbs(kVocabSize, {{kNa, 0.7f}, {kGa, 0.3f}}, 1e-6f);
        } else if (prefix.back() == kGa) {
          return LogProbs(kVocabSize, {{kEos, 0.5f}}, 1e-6f);
        }
        return LogProbs(kVocabSize, {{kDa, 0.99f}}, 1e-6f);
      },
      2);
  TopKDecoder beam(decoder, 2);
  EXPECT_THAT(beam.Search(Feature()), ElementsAre(kGa, kEos));
  EXPECT_THAT(beam.Outputs()[0], ElementsAre(kNa, kDa));
}

TEST(TopKDecoderTest, TiesPreferLowerTokenId) {
  auto decoder = std::make_shared<FunctionDecoder>(
      [](const Feature&, const std::vector<int>& prefix) {
        if (prefix.size() == 1) {
          return LogProbs(kVocabSize, {{kDa, 0.4f}, {kNa, 0.4f}});
        }
        return LogProbs(kVocabSize, {{kEos, 0.9f}});
      });
  TopKDecoder beam(decoder, 2);
  EXPECT_THAT(beam.Search(Feature()), ElementsAre(kNa, kEos));
  EXPECT_THAT(beam.Outputs()[1], ElementsAre(kDa, kEos));
}

TEST(TopKDecoderDeathTest, NonPositiveBeam) {
  EXPECT_DEATH(TopKDecoder(test::MakeEchoDecoder(), 0), "k_ > 0");
}

}  // namespace kospeech
