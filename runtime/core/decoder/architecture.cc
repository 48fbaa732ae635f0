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

#include "decoder/architecture.h"

#include "utils/log.h"

namespace kospeech {

ArchitectureType IdentifyArchitecture(AsrModel* model) {
  CHECK(model != nullptr);
  const std::string& name = model->module()->architecture();
  if (name == "las") {
    return ArchitectureType::kLas;
  } else if (name == "transformer") {
    return ArchitectureType::kTransformer;
  } else if (name == "deepspeech2") {
    return ArchitectureType::kDeepSpeech2;
  }
  LOG(FATAL) << "Unsupported architecture : " << name;
  return ArchitectureType::kLas;
}

std::string ArchitectureName(ArchitectureType type) {
  switch (type) {
    case ArchitectureType::kLas:
      return "las";
    case ArchitectureType::kTransformer:
      return "transformer";
    case ArchitectureType::kDeepSpeech2:
      return "deepspeech2";
  }
  return "unknown";
}

}  // namespace kospeech
