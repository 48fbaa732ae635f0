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

#ifndef DECODER_BATCH_READER_H_
#define DECODER_BATCH_READER_H_

#include <istream>
#include <string>

#include "decoder/batch.h"
#include "decoder/batch_queue.h"

namespace kospeech {

// Reads utterances from a text dump, each of them is
//   <key> <num_frames> <dim>
//   <target ids, starting with <sos>>
//   <num_frames lines of dim floats>
class BatchReader {
 public:
  explicit BatchReader(std::istream* is) : is_(is) {}

  // Reads up to batch_size utterances. Returns false if nothing was read,
  // check error() to tell the end of file from a malformed input.
  bool Read(int batch_size, Batch* batch);
  bool error() const { return error_; }
  int num_utterances() const { return num_utterances_; }

 private:
  bool ReadUtterance(Batch* batch);

  std::istream* is_;
  bool error_ = false;
  int num_utterances_ = 0;
};

// Pushes every batch of the file into the queue and closes it. The queue is
// closed even on failure, so that the consumer never waits forever.
bool ReadBatches(const std::string& path, int batch_size, BatchQueue* queue);

}  // namespace kospeech

#endif  // DECODER_BATCH_READER_H_
