// Copyright 2022 Binbin Zhang (binbzha@qq.com)
//
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

#include "decoder/asr_model.h"

#include <memory>
#include <utility>

#include "decoder/attention_search.h"
#include "decoder/ctc_greedy_search.h"
#include "decoder/ctc_prefix_beam_search.h"
#include "utils/log.h"

namespace kospeech {

static void CheckBatch(const std::vector<Feature>& inputs,
                       const std::vector<int>& lengths) {
  CHECK_EQ(inputs.size(), lengths.size());
  for (size_t i = 0; i < inputs.size(); ++i) {
    CHECK_GE(lengths[i], 0);
    CHECK_LE(lengths[i], static_cast<int>(inputs[i].size()));
  }
}

AttentionAsrModel::AttentionAsrModel(const std::string& architecture,
                                     std::shared_ptr<AttentionDecoder> decoder)
    : AsrModel(architecture), decoder_(std::move(decoder)) {
  CHECK(decoder_ != nullptr);
}

std::vector<std::vector<int>> AttentionAsrModel::Recognize(
    const std::vector<Feature>& inputs, const std::vector<int>& lengths,
    const SearchOptions& opts) {
  CheckBatch(inputs, lengths);
  // 解码策略只在本次调用内有效，不修改模型本身的decoder
  std::unique_ptr<SearchInterface> searcher;
  if (opts.type == kBeamSearch) {
    searcher.reset(new TopKDecoder(decoder_, opts.beam_size));
  } else {
    searcher.reset(new GreedyDecoder(decoder_));
  }
  std::vector<std::vector<int>> hypotheses;
  Feature encoder_out;
  for (size_t i = 0; i < inputs.size(); ++i) {
    ForwardEncoder(inputs[i], lengths[i], &encoder_out);
    hypotheses.emplace_back(searcher->Search(encoder_out));
  }
  return hypotheses;
}

std::vector<std::vector<int>> LasModel::Inference(
    const std::vector<Feature>& inputs, const std::vector<int>& lengths,
    const std::string& device, const SearchOptions& opts) {
  CHECK_EQ(device, this->device())
      << "Attention states are allocated on the model's device";
  return Recognize(inputs, lengths, opts);
}

std::vector<std::vector<int>> SpeechTransformerModel::Inference(
    const std::vector<Feature>& inputs, const std::vector<int>& lengths,
    const SearchOptions& opts) {
  return Recognize(inputs, lengths, opts);
}

std::vector<std::vector<int>> DeepSpeech2Model::Inference(
    const std::vector<Feature>& inputs, const std::vector<int>& lengths,
    int blank_label, const SearchOptions& opts) {
  CheckBatch(inputs, lengths);
  CHECK_GE(blank_label, 0);
  std::unique_ptr<SearchInterface> searcher;
  if (opts.type == kBeamSearch) {
    CtcPrefixBeamSearchOptions ctc_opts;
    ctc_opts.blank = blank_label;
    ctc_opts.first_beam_size = opts.beam_size;
    ctc_opts.second_beam_size = opts.beam_size;
    searcher.reset(new CtcPrefixBeamSearch(ctc_opts));
  } else {
    searcher.reset(new CtcGreedySearch(blank_label));
  }
  std::vector<std::vector<int>> hypotheses;
  std::vector<std::vector<float>> ctc_logp;
  for (size_t i = 0; i < inputs.size(); ++i) {
    ForwardEncoder(inputs[i], lengths[i], &ctc_logp);
    hypotheses.emplace_back(searcher->Search(ctc_logp));
  }
  return hypotheses;
}

DataParallelModel::DataParallelModel(std::shared_ptr<AsrModel> module,
                                     const std::vector<std::string>& devices)
    : AsrModel("data_parallel"), module_(std::move(module)), devices_(devices) {
  CHECK(module_ != nullptr);
}

void DataParallelModel::Eval() {
  AsrModel::Eval();
  module_->Eval();
}

void DataParallelModel::To(const std::string& device) {
  AsrModel::To(device);
  module_->To(device);
}

}  // namespace kospeech
