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

#ifndef DECODER_RESULT_SINK_H_
#define DECODER_RESULT_SINK_H_

#include <string>
#include <vector>

namespace kospeech {

// Decoded (target, prediction) text pairs in arrival order, saved as a two
// column csv: targets,predictions
class ResultSink {
 public:
  void Record(const std::string& target, const std::string& prediction);

  // Recorded text is UTF-8. With another `encoding` (an iconv name such as
  // "CP949") the whole file is converted before writing. Returns false if the
  // file can't be written, the encoding is unknown or some text has no
  // representation in it.
  bool Flush(const std::string& path,
             const std::string& encoding = "UTF-8") const;
  // Append the rows of a UTF-8 file written by Flush(), returns false on a
  // missing or malformed file.
  bool Load(const std::string& path);

  int size() const { return static_cast<int>(targets_.size()); }
  const std::vector<std::string>& targets() const { return targets_; }
  const std::vector<std::string>& predictions() const { return predictions_; }

 private:
  std::vector<std::string> targets_;
  std::vector<std::string> predictions_;
};

}  // namespace kospeech

#endif  // DECODER_RESULT_SINK_H_
