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

#ifndef UTILS_STRING_H_
#define UTILS_STRING_H_

#include <string>
#include <vector>

namespace kospeech {

// Split the string with space or tab, empty pieces are dropped.
void SplitString(const std::string& str, std::vector<std::string>* strs);

void SplitStringToVector(const std::string& full, const char* delim,
                         bool omit_empty_strings,
                         std::vector<std::string>* out);

// Split the UTF-8 string into chars, e.g. "안녕" -> {"안", "녕"}
void SplitUTF8StringToChars(const std::string& str,
                            std::vector<std::string>* chars);

int UTF8StringLength(const std::string& str);

// False for stray continuation bytes, truncated sequences and lead bytes
// above 0xF4. Other encodings such as cp949 are rejected here.
bool IsValidUTF8(const std::string& str);

std::string Ltrim(const std::string& str);
std::string Rtrim(const std::string& str);
std::string Trim(const std::string& str);

}  // namespace kospeech

#endif  // UTILS_STRING_H_
