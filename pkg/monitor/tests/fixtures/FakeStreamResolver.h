#ifndef LIVEWATCH_TESTS_FIXTURES_FAKE_STREAM_RESOLVER_H_
#define LIVEWATCH_TESTS_FIXTURES_FAKE_STREAM_RESOLVER_H_

#include <atomic>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <string>

#include "livewatch/io/IStreamResolver.hpp"

namespace livewatch::tests::fixtures
{

// Returns scripted results in order, then repeats the default result.
class FakeStreamResolver : public io::IStreamResolver
{
public:
  static io::StreamInfo Live(const std::string& anchor = "Anchor",
                             const std::string& title = "Title")
  {
    io::StreamInfo info;
    info.is_live = true;
    info.anchor_name = anchor;
    info.title = title;
    info.record_url = "https://cdn.example/stream.flv";
    return info;
  }

  static io::StreamInfo Offline(const std::string& anchor = "Anchor")
  {
    io::StreamInfo info;
    info.anchor_name = anchor;
    return info;
  }

  static io::StreamInfo Failure(const std::string& error)
  {
    io::StreamInfo info;
    info.error = error;
    return info;
  }

  io::StreamInfo Resolve(const std::string& url, const std::string& platform_key) override
  {
    calls_.fetch_add(1);
    std::lock_guard<std::mutex> lock(mutex_);
    last_url_ = url;
    last_platform_key_ = platform_key;
    if (throw_next_)
    {
      throw_next_ = false;
      throw std::runtime_error("resolver exploded");
    }
    if (throw_foreign_next_)
    {
      throw_foreign_next_ = false;
      throw ForeignError{};
    }
    if (!script_.empty())
    {
      io::StreamInfo next = script_.front();
      script_.pop_front();
      return next;
    }
    return default_result_;
  }

  void Enqueue(const io::StreamInfo& info)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    script_.push_back(info);
  }

  void SetDefault(const io::StreamInfo& info)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    default_result_ = info;
  }

  void ThrowNext()
  {
    std::lock_guard<std::mutex> lock(mutex_);
    throw_next_ = true;
  }

  // Next call throws a type outside the std::exception hierarchy.
  void ThrowForeignNext()
  {
    std::lock_guard<std::mutex> lock(mutex_);
    throw_foreign_next_ = true;
  }

  int Calls() const { return calls_.load(); }

  std::string LastPlatformKey() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_platform_key_;
  }

private:
  mutable std::mutex mutex_;
  std::deque<io::StreamInfo> script_;
  io::StreamInfo default_result_ = Offline();
  struct ForeignError
  {
  };

  bool throw_next_ = false;
  bool throw_foreign_next_ = false;
  std::string last_url_;
  std::string last_platform_key_;
  std::atomic<int> calls_{0};
};

}  // namespace livewatch::tests::fixtures

#endif  // LIVEWATCH_TESTS_FIXTURES_FAKE_STREAM_RESOLVER_H_
