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

#include "decoder/batch_queue.h"

#include <utility>

#include "utils/log.h"

namespace kospeech {

void BatchQueue::Push(Batch batch) {
  CHECK(!batch.empty()) << "Use Close() to signal the end of stream";
  CHECK_EQ(batch.input_lengths.size(), batch.inputs.size());
  CHECK_EQ(batch.targets.size(), batch.inputs.size());
  queue_.Push(std::move(batch));
}

void BatchQueue::Close() { queue_.Push(Batch()); }

bool BatchQueue::Pop(Batch* batch) {
  if (finished_) return false;
  Batch next = queue_.Pop();
  // 只看输入个数即可判断结束标记，不需要检查targets和lengths
  if (next.empty()) {
    finished_ = true;
    return false;
  }
  *batch = std::move(next);
  return true;
}

int BatchQueue::Drain() {
  int num_dropped = 0;
  Batch batch;
  while (Pop(&batch)) ++num_dropped;
  if (num_dropped > 0) VLOG(1) << "Dropped " << num_dropped << " batches";
  return num_dropped;
}

}  // namespace kospeech
