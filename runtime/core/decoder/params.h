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

#ifndef DECODER_PARAMS_H_
#define DECODER_PARAMS_H_

#include <memory>
#include <string>

#include "decoder/search.h"
#include "decoder/vocabulary.h"
#include "utils/flags.h"
#include "utils/log.h"

// Vocabulary flags
DEFINE_string(vocab_path, "", "label csv, id,char,freq per line");

// Search flags
DEFINE_string(mode, "greedy", "search mode, greedy or beam");
DEFINE_int32(beam_size, 3, "beam size of beam search");
DEFINE_string(metric, "char", "error rate metric, char or word");
DEFINE_string(device, "cpu", "device to run the model on");
DEFINE_int32(print_every, 20, "log the error rate every n batches");

// Data flags
DEFINE_int32(batch_size, 32, "utterances per batch");
DEFINE_int32(queue_size, 16, "max batches waiting in the queue");

namespace kospeech {

std::shared_ptr<Vocabulary> InitVocabularyFromFlags() {
  CHECK(!FLAGS_vocab_path.empty()) << "Please provide --vocab_path";
  return ReadVocabulary(FLAGS_vocab_path);
}

std::shared_ptr<GreedySearch> InitSearchFromFlags(
    std::shared_ptr<const Vocabulary> vocab) {
  CHECK_GT(FLAGS_print_every, 0);
  if (FLAGS_mode == "greedy") {
    return std::make_shared<GreedySearch>(vocab, FLAGS_metric);
  } else if (FLAGS_mode == "beam") {
    LOG(INFO) << "Beam search with beam size " << FLAGS_beam_size;
    return std::make_shared<BeamSearch>(vocab, FLAGS_beam_size, FLAGS_metric);
  }
  LOG(FATAL) << "Unsupported search mode : " << FLAGS_mode;
  return nullptr;
}

}  // namespace kospeech

#endif  // DECODER_PARAMS_H_
