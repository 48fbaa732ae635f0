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

#ifndef DECODER_BATCH_QUEUE_H_
#define DECODER_BATCH_QUEUE_H_

#include <atomic>

#include "decoder/batch.h"
#include "utils/blocking_queue.h"
#include "utils/utils.h"

namespace kospeech {

// Bounded channel between the data loader (producer) and the decode loop
// (consumer). The producer must call Close() once it has pushed its last
// batch, otherwise the consumer blocks forever in Pop().
class BatchQueue {
 public:
  explicit BatchQueue(size_t capacity = 64) : queue_(capacity) {}

  // Blocks while the queue is full.
  void Push(Batch batch);
  // Enqueue the end of stream marker.
  void Close();

  // Blocks until a batch or the end of stream is available. Returns false at
  // the end of stream, and keeps returning false without blocking afterwards.
  // A batch without any utterance is also an end of stream marker.
  bool Pop(Batch* batch);

  // Discards batches until the end of stream and returns how many were
  // dropped. A consumer that stops early calls it so that a producer blocked
  // in Push() can finish.
  int Drain();

  bool finished() const { return finished_; }

 private:
  BlockingQueue<Batch> queue_;
  std::atomic<bool> finished_{false};

 public:
  KOSPEECH_DISALLOW_COPY_AND_ASSIGN(BatchQueue);
};

}  // namespace kospeech

#endif  // DECODER_BATCH_QUEUE_H_
