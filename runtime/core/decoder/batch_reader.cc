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

#include "decoder/batch_reader.h"

#include <exception>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "utils/log.h"
#include "utils/string.h"

namespace kospeech {

bool BatchReader::ReadUtterance(Batch* batch) {
  std::string line;
  // Skip blank lines between utterances
  do {
    if (!std::getline(*is_, line)) return false;
  } while (Trim(line).empty());

  std::vector<std::string> strs;
  SplitString(line, &strs);
  if (strs.size() != 3) {
    LOG(ERROR) << "Bad utterance header: " << line;
    error_ = true;
    return false;
  }
  const std::string& key = strs[0];
  int num_frames = 0, dim = 0;
  try {
    num_frames = std::stoi(strs[1]);
    dim = std::stoi(strs[2]);
  } catch (const std::exception&) {
    LOG(ERROR) << "Bad utterance header: " << line;
    error_ = true;
    return false;
  }
  if (num_frames < 0 || dim <= 0) {
    LOG(ERROR) << key << ": bad shape " << num_frames << "x" << dim;
    error_ = true;
    return false;
  }

  std::vector<int> target;
  if (!std::getline(*is_, line)) {
    LOG(ERROR) << key << ": missing targets";
    error_ = true;
    return false;
  }
  std::istringstream target_stream(line);
  int id = 0;
  while (target_stream >> id) target.emplace_back(id);

  Feature feats(num_frames, std::vector<float>(dim));
  for (int t = 0; t < num_frames; ++t) {
    if (!std::getline(*is_, line)) {
      LOG(ERROR) << key << ": expect " << num_frames << " frames, got " << t;
      error_ = true;
      return false;
    }
    std::istringstream frame_stream(line);
    for (int d = 0; d < dim; ++d) {
      if (!(frame_stream >> feats[t][d])) {
        LOG(ERROR) << key << ": frame " << t << " has less than " << dim
                   << " values";
        error_ = true;
        return false;
      }
    }
  }
  VLOG(2) << "Read " << key << " with " << num_frames << " frames";

  batch->inputs.emplace_back(std::move(feats));
  batch->input_lengths.emplace_back(num_frames);
  batch->target_lengths.emplace_back(target.size());
  batch->targets.emplace_back(std::move(target));
  ++num_utterances_;
  return true;
}

bool BatchReader::Read(int batch_size, Batch* batch) {
  CHECK_GT(batch_size, 0);
  *batch = Batch();
  while (batch->size() < batch_size && ReadUtterance(batch)) {
  }
  if (error_) return false;
  return !batch->empty();
}

bool ReadBatches(const std::string& path, int batch_size, BatchQueue* queue) {
  std::ifstream is(path);
  if (!is.is_open()) {
    LOG(ERROR) << "Failed to open " << path;
    queue->Close();
    return false;
  }
  BatchReader reader(&is);
  Batch batch;
  while (reader.Read(batch_size, &batch)) {
    queue->Push(std::move(batch));
  }
  queue->Close();
  if (reader.error()) return false;
  LOG(INFO) << "Read " << reader.num_utterances() << " utterances from "
            << path;
  return true;
}

}  // namespace kospeech
