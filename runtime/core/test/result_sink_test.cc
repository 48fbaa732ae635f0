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

#include <fstream>
#include <sstream>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace kospeech {

using ::testing::ElementsAre;

static std::string ReadFile(const std::string& path) {
  std::ifstream is(path);
  std::stringstream ss;
  ss << is.rdbuf();
  return ss.str();
}

TEST(ResultSinkTest, FlushWritesTwoColumns) {
  ResultSink sink;
  sink.Record("가나다", "가나");
  sink.Record("a b", "a, b");
  std::string path = ::testing::TempDir() + "result_sink_columns.csv";
  ASSERT_TRUE(sink.Flush(path));
  EXPECT_EQ(ReadFile(path),
            "targets,predictions\n"
            "가나다,가나\n"
            "a b,\"a, b\"\n");
}

TEST(ResultSinkTest, RoundTrip) {
  ResultSink sink;
  sink.Record("안녕하세요", "안녕하세오");
  sink.Record("say \"hi\"", "say, hi");
  sink.Record("two\nlines", "");
  sink.Record("", "only prediction");
  std::string path = ::testing::TempDir() + "result_sink_round_trip.csv";
  ASSERT_TRUE(sink.Flush(path));

  ResultSink loaded;
  ASSERT_TRUE(loaded.Load(path));
  EXPECT_EQ(loaded.size(), sink.size());
  EXPECT_EQ(loaded.targets(), sink.targets());
  EXPECT_EQ(loaded.predictions(), sink.predictions());
}

TEST(ResultSinkTest, EmptySink) {
  ResultSink sink;
  std::string path = ::testing::TempDir() + "result_sink_empty.csv";
  ASSERT_TRUE(sink.Flush(path));
  EXPECT_EQ(ReadFile(path), "targets,predictions\n");
  ResultSink loaded;
  ASSERT_TRUE(loaded.Load(path));
  EXPECT_EQ(loaded.size(), 0);
}

TEST(ResultSinkTest, UnwritablePath) {
  ResultSink sink;
  sink.Record("a", "b");
  EXPECT_FALSE(sink.Flush("/nonexistent/dir/result.csv"));
}

TEST(ResultSinkTest, FlushInOtherEncoding) {
  ResultSink sink;
  sink.Record("가", "나");
  std::string path = ::testing::TempDir() + "result_sink_cp949.csv";
  ASSERT_TRUE(sink.Flush(path, "CP949"));
  // 가 and 나 in cp949
  EXPECT_EQ(ReadFile(path), "targets,predictions\n\xB0\xA1,\xB3\xAA\n");
}

TEST(ResultSinkTest, FlushRejectsBadEncoding) {
  ResultSink sink;
  sink.Record("가", "\xF0\x9F\x98\x80");  // no emoji in cp949
  std::string path = ::testing::TempDir() + "result_sink_bad_encoding.csv";
  EXPECT_FALSE(sink.Flush(path, "NO-SUCH-ENCODING"));
  EXPECT_FALSE(sink.Flush(path, "CP949"));
}

TEST(ResultSinkTest, LoadRejectsBadFiles) {
  ResultSink sink;
  EXPECT_FALSE(sink.Load("/nonexistent/dir/result.csv"));

  std::string path = ::testing::TempDir() + "result_sink_bad.csv";
  {
    std::ofstream os(path);
    os << "target,prediction\na,b\n";
  }
  EXPECT_FALSE(sink.Load(path));
  {
    std::ofstream os(path);
    os << "targets,predictions\na,b,c\n";
  }
  EXPECT_FALSE(sink.Load(path));
  {
    std::ofstream os(path);
    os << "targets,predictions\n\"a,b\n";
  }
  EXPECT_FALSE(sink.Load(path));
}

TEST(ResultSinkTest, LoadAppendsInOrder) {
  std::string path = ::testing::TempDir() + "result_sink_append.csv";
  {
    std::ofstream os(path);
    os << "targets,predictions\r\nx,y\r\n\"p\"\"q\",z";
  }
  ResultSink sink;
  sink.Record("first", "first");
  ASSERT_TRUE(sink.Load(path));
  EXPECT_THAT(sink.targets(), ElementsAre("first", "x", "p\"q"));
  EXPECT_THAT(sink.predictions(), ElementsAre("first", "y", "z"));
}

}  // namespace kospeech
