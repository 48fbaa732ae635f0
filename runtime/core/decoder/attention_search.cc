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
#include <utility>

#include "utils/log.h"

namespace kospeech {

GreedyDecoder::GreedyDecoder(std::shared_ptr<AttentionDecoder> decoder)
    : decoder_(std::move(decoder)) {
  CHECK(decoder_ != nullptr);
}

std::vector<int> GreedyDecoder::Search(
    const std::vector<std::vector<float>>& encoder_out) {
  std::vector<int> prefix{decoder_->sos()};
  std::vector<float> logp;
  for (int step = 0; step < decoder_->max_length(); ++step) {
    decoder_->ForwardStep(encoder_out, prefix, &logp);
    int token = ArgMax(logp);
    prefix.emplace_back(token);
    if (token == decoder_->eos()) break;
  }
  return std::vector<int>(prefix.begin() + 1, prefix.end());
}

TopKDecoder::TopKDecoder(std::shared_ptr<AttentionDecoder> decoder, int k)
    : decoder_(std::move(decoder)), k_(k) {
  CHECK(decoder_ != nullptr);
  CHECK_GT(k_, 0);
}

namespace {

// An extension of beam slot `source` by `token`, token is -1 when a finished
// hypothesis is carried over unchanged. logp is the step log-prob of token.
struct Candidate {
  int source;
  int token;
  float logp;
  float score;
};

// Higher score first. On ties the lower source slot wins. Within one slot the
// sums may round to the same float although the step log-probs differ, so the
// higher step log-prob goes first, then the lower token id as ArgMax does.
bool CandidateCompare(const Candidate& a, const Candidate& b) {
  if (a.score != b.score) return a.score > b.score;
  if (a.source != b.source) return a.source < b.source;
  if (a.logp != b.logp) return a.logp > b.logp;
  return a.token < b.token;
}

}  // namespace

bool TopKDecoder::Advance(const std::vector<std::vector<float>>& encoder_out,
                          std::vector<BeamHypothesis>* beam) {
  std::vector<Candidate> candidates;
  std::vector<float> logp;
  bool expanded = false;
  for (int b = 0; b < beam->size(); ++b) {
    const BeamHypothesis& hyp = (*beam)[b];
    if (hyp.finished) {
      candidates.push_back({b, -1, 0.0f, hyp.score});
      continue;
    }
    decoder_->ForwardStep(encoder_out, hyp.tokens, &logp);
    for (int token = 0; token < logp.size(); ++token) {
      candidates.push_back({b, token, logp[token], hyp.score + logp[token]});
    }
    expanded = true;
  }
  if (!expanded) return false;

  // 所有beam的扩展放在一起剪枝，只保留前k个
  int n = std::min(k_, static_cast<int>(candidates.size()));
  std::partial_sort(candidates.begin(), candidates.begin() + n,
                    candidates.end(), CandidateCompare);
  std::vector<BeamHypothesis> next(n);
  for (int i = 0; i < n; ++i) {
    const Candidate& c = candidates[i];
    next[i] = (*beam)[c.source];
    if (c.token >= 0) {
      next[i].tokens.emplace_back(c.token);
      next[i].score = c.score;
      next[i].finished = c.token == decoder_->eos();
    }
  }
  beam->swap(next);
  return true;
}

void TopKDecoder::UpdateOutputs(const std::vector<BeamHypothesis>& beam) {
  outputs_.clear();
  likelihood_.clear();
  finished_.clear();
  for (const auto& hyp : beam) {
    outputs_.emplace_back(hyp.tokens.begin() + 1, hyp.tokens.end());
    likelihood_.emplace_back(hyp.score);
    finished_.emplace_back(hyp.finished);
  }
}

std::vector<int> TopKDecoder::Search(
    const std::vector<std::vector<float>>& encoder_out) {
  std::vector<BeamHypothesis> beam(1);
  beam[0].tokens.emplace_back(decoder_->sos());
  for (int step = 0; step < decoder_->max_length(); ++step) {
    if (!Advance(encoder_out, &beam)) break;
    VLOG(3) << "step " << step << " best score " << beam[0].score;
  }
  UpdateOutputs(beam);

  // beam is sorted, so the first finished one is the best finished one
  int best = 0;
  for (int i = 0; i < beam.size(); ++i) {
    if (beam[i].finished) {
      best = i;
      break;
    }
  }
  return outputs_[best];
}

}  // namespace kospeech
