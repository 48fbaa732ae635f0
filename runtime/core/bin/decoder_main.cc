// Copyright (c) 2020 Mobvoi Inc (Binbin Zhang, Di Wu)
//
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

#include <exception>
#include <iomanip>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "decoder/batch_queue.h"
#include "decoder/batch_reader.h"
#include "decoder/params.h"
#include "decoder/precomputed_ctc_model.h"
#include "utils/flags.h"
#include "utils/string.h"
#include "utils/timer.h"

DEFINE_string(posterior_path, "", "dump of ctc log posteriors and targets");
DEFINE_string(result, "", "result csv file, targets,predictions");
DEFINE_string(result_encoding, "UTF-8",
              "text encoding of the result csv, e.g. CP949");
DEFINE_string(data_parallel_devices, "",
              "comma separated devices, wrap the model for multi device "
              "decoding when more than one is given");

int main(int argc, char* argv[]) {
  // 解析输入参数，初始化日志
  gflags::ParseCommandLineFlags(&argc, &argv, false);
  google::InitGoogleLogging(argv[0]);

  if (FLAGS_posterior_path.empty()) {
    LOG(FATAL) << "Please provide the posterior path.";
  }

  auto vocab = kospeech::InitVocabularyFromFlags();
  auto search = kospeech::InitSearchFromFlags(vocab);

  std::shared_ptr<kospeech::AsrModel> model =
      std::make_shared<kospeech::PrecomputedCtcModel>();
  std::vector<std::string> devices;
  kospeech::SplitStringToVector(FLAGS_data_parallel_devices, ",", true,
                                &devices);
  if (devices.size() > 1) {
    model = std::make_shared<kospeech::DataParallelModel>(model, devices);
  }

  // 生产者线程读取数据放入队列，主线程解码
  kospeech::BatchQueue queue(FLAGS_queue_size);
  bool read_ok = true;
  std::thread producer([&]() {
    read_ok = kospeech::ReadBatches(FLAGS_posterior_path, FLAGS_batch_size,
                                    &queue);
  });

  kospeech::Timer timer;
  float error_rate = 0.0f;
  try {
    error_rate = search->Search(model, &queue, FLAGS_device, FLAGS_print_every);
  } catch (const std::exception& e) {
    LOG(ERROR) << "Decoding failed: " << e.what();
    // 生产者可能阻塞在满队列上，先取空队列再等待线程结束
    queue.Drain();
    producer.join();
    return 1;
  }
  int decode_time = timer.Elapsed();
  producer.join();
  if (!read_ok) {
    LOG(ERROR) << "Failed to read all of " << FLAGS_posterior_path
               << ", the result only covers the utterances read before";
  }

  LOG(INFO) << "Final " << search->metric().name() << ": " << std::fixed
            << std::setprecision(4) << error_rate;
  LOG(INFO) << "Decoded " << search->result().size() << " utterances taken "
            << decode_time << "ms.";

  if (!FLAGS_result.empty() &&
      !search->SaveResult(FLAGS_result, FLAGS_result_encoding)) {
    return 1;
  }
  return read_ok ? 0 : 1;
}
