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

#include "decoder/result_sink.h"

#include <iconv.h>

#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include "utils/log.h"

namespace kospeech {

static const char kHeader[] = "targets,predictions";

// Quote the field only when needed, and double the quotes inside
static std::string EscapeField(const std::string& field) {
  if (field.find_first_of(",\"\r\n") == std::string::npos) return field;
  std::string escaped = "\"";
  for (char c : field) {
    if (c == '"') escaped += '"';
    escaped += c;
  }
  escaped += '"';
  return escaped;
}

// Parse one csv record starting at *pos, which may span several lines when a
// quoted field holds a newline.
static bool ParseRecord(const std::string& text, size_t* pos,
                        std::vector<std::string>* fields) {
  fields->clear();
  std::string field;
  bool quoted = false;
  size_t i = *pos;
  while (i < text.size()) {
    char c = text[i];
    if (quoted) {
      if (c == '"') {
        if (i + 1 < text.size() && text[i + 1] == '"') {
          field += '"';
          ++i;
        } else {
          quoted = false;
        }
      } else {
        field += c;
      }
    } else if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      fields->push_back(field);
      field.clear();
    } else if (c == '\n' || c == '\r') {
      if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') ++i;
      ++i;
      break;
    } else {
      field += c;
    }
    ++i;
  }
  if (quoted) return false;
  fields->push_back(field);
  *pos = i;
  return true;
}

// Convert UTF-8 text to `encoding` with iconv
static bool ConvertEncoding(const std::string& text,
                            const std::string& encoding, std::string* out) {
  iconv_t cd = iconv_open(encoding.c_str(), "UTF-8");
  if (cd == reinterpret_cast<iconv_t>(-1)) {
    LOG(ERROR) << "Unsupported encoding " << encoding;
    return false;
  }
  // 4 bytes per input byte covers every target encoding, plus room for a BOM
  std::vector<char> buffer(text.size() * 4 + 16);
  char* in = const_cast<char*>(text.data());
  size_t in_left = text.size();
  char* out_ptr = buffer.data();
  size_t out_left = buffer.size();
  size_t ret = iconv(cd, &in, &in_left, &out_ptr, &out_left);
  if (ret != static_cast<size_t>(-1)) {
    // Flush the shift state of stateful encodings
    ret = iconv(cd, nullptr, nullptr, &out_ptr, &out_left);
  }
  iconv_close(cd);
  if (ret == static_cast<size_t>(-1)) {
    LOG(ERROR) << "Can't convert result to " << encoding << " at byte "
               << text.size() - in_left;
    return false;
  }
  out->assign(buffer.data(), buffer.size() - out_left);
  return true;
}

void ResultSink::Record(const std::string& target,
                        const std::string& prediction) {
  targets_.emplace_back(target);
  predictions_.emplace_back(prediction);
}

bool ResultSink::Flush(const std::string& path,
                       const std::string& encoding) const {
  std::ostringstream ss;
  ss << kHeader << "\n";
  for (size_t i = 0; i < targets_.size(); ++i) {
    ss << EscapeField(targets_[i]) << "," << EscapeField(predictions_[i])
       << "\n";
  }
  std::string content = ss.str();
  if (encoding != "UTF-8" && !ConvertEncoding(ss.str(), encoding, &content)) {
    return false;
  }

  std::ofstream os(path, std::ios::out | std::ios::binary);
  if (!os.is_open()) {
    LOG(ERROR) << "Failed to open result file " << path;
    return false;
  }
  os << content;
  os.flush();
  if (!os.good()) {
    LOG(ERROR) << "Failed to write result file " << path;
    return false;
  }
  LOG(INFO) << "Saved " << targets_.size() << " results to " << path;
  return true;
}

bool ResultSink::Load(const std::string& path) {
  std::ifstream is(path, std::ios::in | std::ios::binary);
  if (!is.is_open()) {
    LOG(ERROR) << "Failed to open result file " << path;
    return false;
  }
  std::string text((std::istreambuf_iterator<char>(is)),
                   std::istreambuf_iterator<char>());
  size_t pos = 0;
  std::vector<std::string> fields;
  if (!ParseRecord(text, &pos, &fields) || fields.size() != 2 ||
      fields[0] != "targets" || fields[1] != "predictions") {
    LOG(ERROR) << "Bad header in " << path;
    return false;
  }
  while (pos < text.size()) {
    if (!ParseRecord(text, &pos, &fields) || fields.size() != 2) {
      LOG(ERROR) << "Malformed row in " << path;
      return false;
    }
    Record(fields[0], fields[1]);
  }
  return true;
}

}  // namespace kospeech
