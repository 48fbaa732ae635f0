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

#include "decoder/search.h"

#include <iomanip>
#include <utility>
#include <vector>

#include "decoder/architecture.h"
#include "utils/log.h"

namespace kospeech {

GreedySearch::GreedySearch(std::shared_ptr<const Vocabulary> vocab,
                           const std::string& metric)
    : vocab_(std::move(vocab)) {
  CHECK(vocab_ != nullptr);
  metric_ = CreateErrorRate(metric, vocab_);
}

float GreedySearch::Search(const std::shared_ptr<AsrModel>& model,
                           BatchQueue* queue, const std::string& device,
                           int print_every) {
  CHECK(queue != nullptr);
  CHECK_GT(print_every, 0);
  // 先确定模型结构，不支持的模型在读取任何数据之前就报错
  const ArchitectureType architecture = IdentifyArchitecture(model.get());
  AsrModel* module = model->module();
  const SearchOptions opts = search_options();
  LOG(INFO) << "Decoding " << ArchitectureName(architecture) << " model with "
            << (opts.type == kBeamSearch ? "beam" : "greedy") << " search";

  model->Eval();
  model->To(device);

  float error_rate = 0.0f;
  int timestep = 0;
  Batch batch;
  while (queue->Pop(&batch)) {
    CHECK_EQ(static_cast<int>(batch.targets.size()), batch.size());
    std::vector<std::vector<int>> hypotheses;
    switch (architecture) {
      case ArchitectureType::kLas: {
        auto* las = dynamic_cast<LasModel*>(module);
        CHECK(las != nullptr) << "Model declares las but is not a LasModel";
        hypotheses = las->Inference(batch.inputs, batch.input_lengths, device,
                                    opts);
        break;
      }
      case ArchitectureType::kTransformer: {
        auto* transformer = dynamic_cast<SpeechTransformerModel*>(module);
        CHECK(transformer != nullptr)
            << "Model declares transformer but is not a SpeechTransformerModel";
        hypotheses =
            transformer->Inference(batch.inputs, batch.input_lengths, opts);
        break;
      }
      case ArchitectureType::kDeepSpeech2: {
        auto* ds2 = dynamic_cast<DeepSpeech2Model*>(module);
        CHECK(ds2 != nullptr)
            << "Model declares deepspeech2 but is not a DeepSpeech2Model";
        hypotheses = ds2->Inference(batch.inputs, batch.input_lengths,
                                    vocab_->blank_id(), opts);
        break;
      }
    }
    CHECK_EQ(static_cast<int>(hypotheses.size()), batch.size());

    // Targets start with <sos>, which the hypotheses don't have
    std::vector<std::vector<int>> targets;
    targets.reserve(batch.size());
    for (int i = 0; i < batch.size(); ++i) {
      const std::vector<int>& target = batch.targets[i];
      result_.Record(vocab_->LabelsToText(target),
                     vocab_->LabelsToText(hypotheses[i]));
      targets.emplace_back(target.empty() ? target.begin()
                                          : target.begin() + 1,
                           target.end());
    }
    error_rate = metric_->Compute(targets, hypotheses);

    if (timestep % print_every == 0) {
      ReportProgress(timestep, error_rate);
    }
    ++timestep;
  }
  LOG(INFO) << "Decoded " << timestep << " batches, " << result_.size()
            << " utterances in total";
  return error_rate;
}

void GreedySearch::ReportProgress(int timestep, float error_rate) {
  LOG(INFO) << metric_->name() << ": " << std::fixed << std::setprecision(2)
            << error_rate;
}

BeamSearch::BeamSearch(std::shared_ptr<const Vocabulary> vocab, int k,
                       const std::string& metric)
    : GreedySearch(std::move(vocab), metric), k_(k) {
  CHECK_GT(k_, 0);
}

SearchOptions BeamSearch::search_options() const {
  SearchOptions opts;
  opts.type = kBeamSearch;
  opts.beam_size = k_;
  return opts;
}

}  // namespace kospeech
