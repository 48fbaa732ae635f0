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

#ifndef DECODER_ARCHITECTURE_H_
#define DECODER_ARCHITECTURE_H_

#include <string>

#include "decoder/asr_model.h"

namespace kospeech {

// Inference call conventions known to the decode loop
enum class ArchitectureType {
  kLas,          // Inference(inputs, lengths, device)
  kTransformer,  // Inference(inputs, lengths)
  kDeepSpeech2,  // Inference(inputs, lengths, blank_label)
};

// Maps the architecture declared by the model to its call convention,
// looking through DataParallelModel. An unknown architecture is fatal.
ArchitectureType IdentifyArchitecture(AsrModel* model);

std::string ArchitectureName(ArchitectureType type);

}  // namespace kospeech

#endif  // DECODER_ARCHITECTURE_H_
