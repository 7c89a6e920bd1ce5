#include <gtest/gtest.h>

#include <algorithm>
#include <random>
#include <string>
#include <vector>

#include "docchat_core/services/compression_service.hpp"

namespace docchat_tests {

using namespace docchat_core;

class CompressionServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    rng_.seed(1234);
  }

  std::string generate_binary_data(size_t size) {
    std::string data(size, '\0');
    std::uniform_int_distribution<int> dist(0, 255);
    std::generate(data.begin(), data.end(), [this, &dist]() { return static_cast<char>(dist(rng_)); });
    return data;
  }

  // Chunk-sized prose, the kind of text the document store keeps
  static std::string generate_repetitive_data(size_t size) {
    std::string pattern = "The sky is blue. Grass is green. ";
    std::string data;
    while (data.size() < size) {
      data += pattern;
    }
    return data.substr(0, size);
  }

  static void verify_round_trip(const std::string& original, int level = CompressionService::DEFAULT_LEVEL) {
    std::vector<char> compressed = CompressionService::compress(original, level);
    EXPECT_EQ(CompressionService::decompress(compressed), original);
  }

  std::mt19937 rng_;
};

TEST_F(CompressionServiceTest, EmptyInputStaysEmpty) {
  EXPECT_TRUE(CompressionService::compress("").empty());
  EXPECT_EQ(CompressionService::decompress({}), "");
}

TEST_F(CompressionServiceTest, RoundTripsTextAndBinary) {
  verify_round_trip("A");
  verify_round_trip("Hello, \xE4\xB8\x96\xE7\x95\x8C! Line\r\nTab\tEnd");
  verify_round_trip(generate_binary_data(10000));
  verify_round_trip(std::string(1000, '\0'));
}

TEST_F(CompressionServiceTest, RepetitiveTextCompressesWell) {
  const std::string data = generate_repetitive_data(10000);
  std::vector<char> compressed = CompressionService::compress(data);
  EXPECT_LT(static_cast<double>(compressed.size()) / data.size(), 0.5);
}

TEST_F(CompressionServiceTest, DefaultLevelIsThree) {
  const std::string data = generate_repetitive_data(3000);
  EXPECT_EQ(CompressionService::compress(data), CompressionService::compress(data, 3));
}

TEST_F(CompressionServiceTest, AllSupportedLevelsRoundTrip) {
  const std::string data = generate_repetitive_data(5000);
  for (int level = 1; level <= 21; level += 5) {
    verify_round_trip(data, level);
  }
}

TEST_F(CompressionServiceTest, RejectsOutOfRangeLevel) {
  EXPECT_THROW(CompressionService::compress("data", 0), CompressionError);
  EXPECT_THROW(CompressionService::compress("data", 1000), CompressionError);
}

TEST_F(CompressionServiceTest, CorruptInputThrows) {
  std::vector<char> garbage = {'n', 'o', 't', ' ', 'z', 's', 't', 'd'};
  EXPECT_THROW(CompressionService::decompress(garbage), CompressionError);

  std::vector<char> truncated = CompressionService::compress(generate_repetitive_data(2000));
  truncated.resize(truncated.size() / 2);
  EXPECT_THROW(CompressionService::decompress(truncated), CompressionError);
}

}  // namespace docchat_tests
