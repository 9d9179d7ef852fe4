#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include "TestListener.hpp"
#include "webctl/PortProber.hpp"

namespace {

// Порт, который ядро считает свободным в момент вызова
int ephemeralPort() {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = 0;
  ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
  socklen_t len = sizeof(addr);
  ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
  ::close(fd);
  return ntohs(addr.sin_port);
}

// Свободный порт ниже диапазона эфемерных портов: исходящие connect()
// не займут его как локальный
int lowPort(const webctl::TcpPortProber& prober) {
  for (int port = 20000; port < 20200; ++port) {
    if (prober.isAvailable(port)) return port;
  }
  return -1;
}

}  // namespace

TEST(TcpPortProberTest, InvalidPortNumbersAreUnavailable) {
  webctl::TcpPortProber prober;
  EXPECT_FALSE(prober.isAvailable(0));
  EXPECT_FALSE(prober.isAvailable(-1));
  EXPECT_FALSE(prober.isAvailable(65536));
}

TEST(TcpPortProberTest, ListeningPortIsUnavailableUntilReleased) {
  webctl::TcpPortProber prober;
  const int port = ephemeralPort();
  ASSERT_GT(port, 0);

  TestListener listener(port);
  ASSERT_TRUE(listener.listening());
  EXPECT_FALSE(prober.isAvailable(port));

  listener.close();
  EXPECT_TRUE(prober.isAvailable(port));
}

TEST(TcpPortProberTest, ProbeDoesNotHoldThePort) {
  webctl::TcpPortProber prober;
  const int port = ephemeralPort();
  ASSERT_TRUE(prober.isAvailable(port));

  TestListener listener(port);
  EXPECT_TRUE(listener.listening());
}

TEST(TcpPortProberTest, ListeningIsDetectedByConnect) {
  webctl::TcpPortProber prober;
  const int port = ephemeralPort();
  EXPECT_FALSE(prober.isListening(0));
  EXPECT_FALSE(prober.isListening(port));

  TestListener listener(port);
  ASSERT_TRUE(listener.listening());
  EXPECT_TRUE(prober.isListening(port));

  listener.close();
  EXPECT_FALSE(prober.isListening(port));
}

// Сервер, делающий bind() во время проверок готовности, не должен получать
// EADDRINUSE из-за проверяющего
TEST(TcpPortProberTest, ListeningCheckDoesNotBlockServerBind) {
  webctl::TcpPortProber prober;
  const int port = lowPort(prober);
  ASSERT_GT(port, 0);

  std::atomic<bool> done{false};
  std::thread checker([&] {
    while (!done.load()) prober.isListening(port);
  });

  int failures = 0;
  for (int i = 0; i < 2000; ++i) {
    TestListener listener(port);
    if (!listener.listening()) ++failures;
  }
  done.store(true);
  checker.join();

  EXPECT_EQ(failures, 0);
}
