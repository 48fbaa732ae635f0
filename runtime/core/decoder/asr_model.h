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

#ifndef DECODER_ASR_MODEL_H_
#define DECODER_ASR_MODEL_H_

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "decoder/attention_decoder.h"
#include "decoder/batch.h"
#include "decoder/search_interface.h"
#include "utils/utils.h"

namespace kospeech {

class AsrModel {
 public:
  virtual ~AsrModel() {}

  // Declared once by the concrete model family at construction,
  // "las", "transformer" or "deepspeech2".
  const std::string& architecture() const { return architecture_; }

  // 多卡包装的模型返回内部真正的模型，其他模型返回自己
  virtual AsrModel* module() { return this; }

  virtual void Eval() { training_ = false; }
  virtual void To(const std::string& device) { device_ = device; }
  bool is_training() const { return training_; }
  const std::string& device() const { return device_; }

 protected:
  explicit AsrModel(const std::string& architecture)
      : architecture_(architecture) {}

 private:
  std::string architecture_;
  bool training_ = true;
  std::string device_ = "cpu";
};

// Encoder-decoder models sharing an autoregressive attention decoder. The
// search over the decoder is chosen per call by SearchOptions.
class AttentionAsrModel : public AsrModel {
 public:
  const std::shared_ptr<AttentionDecoder>& decoder() const { return decoder_; }

 protected:
  AttentionAsrModel(const std::string& architecture,
                    std::shared_ptr<AttentionDecoder> decoder);

  // encoder_out: [num_encoder_frames][encoder_dim] of one utterance, only the
  // first `length` frames of feats are valid.
  virtual void ForwardEncoder(const Feature& feats, int length,
                              Feature* encoder_out) = 0;

  std::vector<std::vector<int>> Recognize(const std::vector<Feature>& inputs,
                                          const std::vector<int>& lengths,
                                          const SearchOptions& opts);

 private:
  std::shared_ptr<AttentionDecoder> decoder_;
};

// Listen, Attend and Spell
class LasModel : public AttentionAsrModel {
 public:
  virtual std::vector<std::vector<int>> Inference(
      const std::vector<Feature>& inputs, const std::vector<int>& lengths,
      const std::string& device, const SearchOptions& opts = SearchOptions());

 protected:
  explicit LasModel(std::shared_ptr<AttentionDecoder> decoder)
      : AttentionAsrModel("las", std::move(decoder)) {}
};

class SpeechTransformerModel : public AttentionAsrModel {
 public:
  virtual std::vector<std::vector<int>> Inference(
      const std::vector<Feature>& inputs, const std::vector<int>& lengths,
      const SearchOptions& opts = SearchOptions());

 protected:
  explicit SpeechTransformerModel(std::shared_ptr<AttentionDecoder> decoder)
      : AttentionAsrModel("transformer", std::move(decoder)) {}
};

// CTC model, hypotheses are collapsed label sequences without blank.
class DeepSpeech2Model : public AsrModel {
 public:
  virtual std::vector<std::vector<int>> Inference(
      const std::vector<Feature>& inputs, const std::vector<int>& lengths,
      int blank_label, const SearchOptions& opts = SearchOptions());

 protected:
  DeepSpeech2Model() : AsrModel("deepspeech2") {}

  // ctc_logp: [num_output_frames][blank_label + 1]
  virtual void ForwardEncoder(const Feature& feats, int length,
                              std::vector<std::vector<float>>* ctc_logp) = 0;
};

// Replicates a model over several devices. Device scheduling belongs to the
// wrapped model, callers unwrap it with module().
class DataParallelModel : public AsrModel {
 public:
  DataParallelModel(std::shared_ptr<AsrModel> module,
                    const std::vector<std::string>& devices);

  AsrModel* module() override { return module_->module(); }
  void Eval() override;
  void To(const std::string& device) override;
  const std::vector<std::string>& devices() const { return devices_; }

 private:
  std::shared_ptr<AsrModel> module_;
  std::vector<std::string> devices_;

 public:
  KOSPEECH_DISALLOW_COPY_AND_ASSIGN(DataParallelModel);
};

}  // namespace kospeech

#endif  // DECODER_ASR_MODEL_H_
