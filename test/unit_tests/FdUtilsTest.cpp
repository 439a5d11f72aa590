#ifndef WIN32
#include "FdUtils.hpp"

#include "TestHeaders.hpp"

using namespace ptyhost;

TEST_CASE("writeAll writes everything through a small pipe", "[FdUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);
  FdUtils::setNonBlocking(fds[1]);

  // Larger than a pipe buffer, so the writer has to wait on EAGAIN
  string payload(256 * 1024, 'x');
  for (size_t a = 0; a < payload.size(); a += 997) {
    payload[a] = (char)('a' + (a % 26));
  }
  std::thread writer([&]() {
    FdUtils::writeAll(fds[1], payload.data(), payload.size());
    ::close(fds[1]);
  });

  string received;
  char b[4096];
  while (true) {
    ssize_t rc = ::read(fds[0], b, sizeof(b));
    if (rc <= 0) {
      break;
    }
    received.append(b, rc);
  }
  writer.join();
  REQUIRE(received == payload);
  ::close(fds[0]);
}

TEST_CASE("writeAll throws when the reader is gone", "[FdUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);
  ::close(fds[0]);
  const string payload = "test data";
  REQUIRE_THROWS(FdUtils::writeAll(fds[1], payload.data(), payload.size()));
  ::close(fds[1]);

  REQUIRE_THROWS(FdUtils::writeAll(-1, payload.data(), payload.size()));
}

TEST_CASE("waitForData", "[FdUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);
  REQUIRE_FALSE(FdUtils::waitForData(fds[0], 10));
  REQUIRE(::write(fds[1], "z", 1) == 1);
  REQUIRE(FdUtils::waitForData(fds[0], 10));
  char c;
  REQUIRE(::read(fds[0], &c, 1) == 1);
  REQUIRE_FALSE(FdUtils::waitForData(fds[0], 0));
  // End-of-stream counts as readable
  ::close(fds[1]);
  REQUIRE(FdUtils::waitForData(fds[0], 10));
  ::close(fds[0]);
}

TEST_CASE("setNonBlocking", "[FdUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);
  FdUtils::setNonBlocking(fds[0]);
  REQUIRE((fcntl(fds[0], F_GETFL) & O_NONBLOCK) != 0);
  char c;
  REQUIRE(::read(fds[0], &c, 1) == -1);
  REQUIRE(errno == EAGAIN);
  ::close(fds[0]);
  ::close(fds[1]);
}
#endif
