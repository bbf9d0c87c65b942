#pragma once
#include <boost/thread.hpp>
#include <optional>
#include <vector>

namespace endon {

// Набор свободных ресурсов (клиентов БД). acquire() ждёт, пока кто-нибудь
// вернёт ресурс через release(). После close() ресурсы не выдаются,
// а возвращаемые уничтожаются.
template <class T>
class BlockingPool {
public:
  BlockingPool() = default;
  BlockingPool(const BlockingPool &) = delete;
  BlockingPool &operator=(const BlockingPool &) = delete;

  bool release(T item) {
    {
      boost::lock_guard<boost::mutex> lk(m_);
      if (closed_)
        return false;
      free_.push_back(std::move(item));
    }
    cv_.notify_one();
    return true;
  }

  // nullopt — пул закрыт
  std::optional<T> acquire() {
    boost::unique_lock<boost::mutex> lk(m_);
    cv_.wait(lk, [&] { return closed_ || !free_.empty(); });
    if (closed_)
      return std::nullopt;
    std::optional<T> item(std::move(free_.back()));
    free_.pop_back();
    return item;
  }

  void close() {
    std::vector<T> dropped;
    {
      boost::lock_guard<boost::mutex> lk(m_);
      closed_ = true;
      dropped.swap(free_);
    }
    cv_.notify_all();
  }

private:
  boost::mutex m_;
  boost::condition_variable_any cv_;
  std::vector<T> free_;
  bool closed_{false};
};

} // namespace endon
