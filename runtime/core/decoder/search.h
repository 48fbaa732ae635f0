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

#ifndef DECODER_SEARCH_H_
#define DECODER_SEARCH_H_

#include <memory>
#include <string>

#include "decoder/asr_model.h"
#include "decoder/batch_queue.h"
#include "decoder/error_rate.h"
#include "decoder/result_sink.h"
#include "decoder/search_interface.h"
#include "decoder/vocabulary.h"
#include "utils/utils.h"

namespace kospeech {

// Decodes every batch of a queue with a trained model, keeps the decoded
// text and scores it against the targets.
class GreedySearch {
 public:
  // metric: "char" or "word"
  explicit GreedySearch(std::shared_ptr<const Vocabulary> vocab,
                        const std::string& metric = "char");
  virtual ~GreedySearch() {}

  // Consumes the queue until its end of stream and returns the error rate
  // computed on the last batch, 0 if there was none. The error rate itself
  // accumulates over every batch decoded by this object.
  float Search(const std::shared_ptr<AsrModel>& model, BatchQueue* queue,
               const std::string& device, int print_every);

  bool SaveResult(const std::string& path,
                  const std::string& encoding = "UTF-8") const {
    return result_.Flush(path, encoding);
  }

  const ResultSink& result() const { return result_; }
  const ErrorRate& metric() const { return *metric_; }

  // Passed to the model with every inference call
  virtual SearchOptions search_options() const { return SearchOptions(); }

 protected:
  // Called on batch 0, print_every, 2 * print_every ...
  virtual void ReportProgress(int timestep, float error_rate);

  std::shared_ptr<const Vocabulary> vocab_;

 private:
  std::unique_ptr<ErrorRate> metric_;
  ResultSink result_;

 public:
  KOSPEECH_DISALLOW_COPY_AND_ASSIGN(GreedySearch);
};

// Same loop as GreedySearch, but the model searches with a beam of k.
class BeamSearch : public GreedySearch {
 public:
  BeamSearch(std::shared_ptr<const Vocabulary> vocab, int k,
             const std::string& metric = "char");

  SearchOptions search_options() const override;
  int k() const { return k_; }

 private:
  int k_;
};

}  // namespace kospeech

#endif  // DECODER_SEARCH_H_
