#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <set>
#include <vector>

#include "MockPortProber.hpp"
#include "TestListener.hpp"
#include "webctl/PortAllocator.hpp"

using ::testing::_;
using ::testing::InSequence;
using ::testing::Return;

TEST(PortRangeTest, RejectsInvalidBounds) {
  EXPECT_THROW(webctl::PortRange(0, 10), std::invalid_argument);
  EXPECT_THROW(webctl::PortRange(5000, 4000), std::invalid_argument);
  EXPECT_THROW(webctl::PortRange(65000, 70000), std::invalid_argument);

  webctl::PortRange range(41000, 41002);
  EXPECT_EQ(range.size(), 3u);
  EXPECT_TRUE(range.contains(41002));
  EXPECT_FALSE(range.contains(41003));
}

TEST(PortAllocatorTest, SkipsOccupiedPortsInScanOrder) {
  MockPortProber prober;
  {
    InSequence seq;
    EXPECT_CALL(prober, isAvailable(41000)).WillOnce(Return(false));
    EXPECT_CALL(prober, isAvailable(41001)).WillOnce(Return(false));
    EXPECT_CALL(prober, isAvailable(41002)).WillOnce(Return(true));
  }

  webctl::PortAllocator allocator({41000, 41002}, prober);
  EXPECT_EQ(allocator.allocate(), 41002);
}

TEST(PortAllocatorTest, ReturnsLowestAvailablePort) {
  MockPortProber prober;
  EXPECT_CALL(prober, isAvailable(41000)).WillOnce(Return(true));
  EXPECT_CALL(prober, isAvailable(41001)).Times(0);

  webctl::PortAllocator allocator({41000, 41999}, prober);
  EXPECT_EQ(allocator.allocate(), 41000);
}

TEST(PortAllocatorTest, FullRangeFailsAfterExactlyRangeSizeProbes) {
  MockPortProber prober;
  EXPECT_CALL(prober, isAvailable(_)).Times(5).WillRepeatedly(Return(false));

  webctl::PortAllocator allocator({41000, 41004}, prober);
  EXPECT_THROW(allocator.allocate(), webctl::ExhaustedRangeError);
}

TEST(PortAllocatorTest, SinglePortRange) {
  MockPortProber prober;
  EXPECT_CALL(prober, isAvailable(41500)).WillOnce(Return(false));

  webctl::PortAllocator allocator({41500, 41500}, prober);
  try {
    allocator.allocate();
    FAIL() << "ExhaustedRangeError expected";
  } catch (const webctl::ExhaustedRangeError& e) {
    EXPECT_EQ(e.range().start, 41500);
    EXPECT_NE(std::string(e.what()).find("[41500, 41500]"), std::string::npos);
  }
}

TEST(PortAllocatorTest, NeverReturnsPortHeldByRealListener) {
  const webctl::PortRange range(42300, 42309);
  std::vector<std::unique_ptr<TestListener>> listeners;
  std::set<int> held;
  for (int port = range.start; port < range.start + 5; ++port) {
    listeners.push_back(std::make_unique<TestListener>(port));
    if (listeners.back()->listening()) held.insert(port);
  }
  ASSERT_FALSE(held.empty());

  webctl::TcpPortProber prober;
  webctl::PortAllocator allocator(range, prober);
  const int port = allocator.allocate();

  EXPECT_TRUE(range.contains(port));
  EXPECT_EQ(held.count(port), 0u);
}
