#include "ChildInputQueue.hpp"
#include "TestHeaders.hpp"

using namespace ptyhost;

TEST_CASE("Partial writes keep the order", "[ChildInputQueue]") {
  ChildInputQueue queue;
  REQUIRE(queue.empty());
  queue.push(InputEvent::makeData("hello"));
  queue.push(InputEvent::makeResize(TerminalSize(100, 30)));
  queue.push(InputEvent::makeData("world"));
  queue.push(InputEvent::makeData(""));
  queue.push(InputEvent::makeDecodeError("ignored"));
  REQUIRE(queue.size() == 10);

  size_t count;
  const char* data = queue.peekData(&count);
  REQUIRE(string(data, count) == "hello");
  queue.consume(2);
  data = queue.peekData(&count);
  REQUIRE(string(data, count) == "llo");
  REQUIRE(queue.size() == 8);
  queue.consume(3);

  REQUIRE(queue.front().type == InputEvent::RESIZE);
  REQUIRE(queue.front().size == TerminalSize(100, 30));
  REQUIRE(queue.peekData(&count) == nullptr);
  REQUIRE(count == 0);
  queue.pop();

  data = queue.peekData(&count);
  REQUIRE(string(data, count) == "world");
  queue.consume(100);
  REQUIRE(queue.empty());
  REQUIRE(queue.size() == 0);
}

TEST_CASE("Queue reports when it is full", "[ChildInputQueue]") {
  ChildInputQueue queue;
  string chunk(64 * 1024, 'x');
  while (queue.canAcceptMore()) {
    queue.push(InputEvent::makeData(chunk));
  }
  REQUIRE(queue.size() >= ChildInputQueue::MAX_QUEUED_BYTES);
  queue.consume(1);
  queue.pop();
  REQUIRE(queue.canAcceptMore());
  queue.clear();
  REQUIRE(queue.empty());
  REQUIRE(queue.size() == 0);
}
