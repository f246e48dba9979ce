#include "movecount/quiz/tick_scheduler.hpp"

#include <algorithm>

namespace movecount::quiz
{
  void TickHandle::cancel() noexcept
  {
    if (!m_slot)
      return;
    {
      std::lock_guard<std::mutex> lk(m_slot->m);
      m_slot->cancelled.store(true);
    }
    m_slot->cv.notify_all();
    m_slot.reset();
  }

  // ---------------- ManualTickScheduler ----------------

  TickHandle ManualTickScheduler::schedule(std::chrono::milliseconds /*interval*/,
                                           std::function<void()> callback)
  {
    auto slot = std::make_shared<detail::TickSlot>();
    slot->callback = std::move(callback);
    m_slots.push_back(slot);
    return TickHandle(std::move(slot));
  }

  void ManualTickScheduler::advance(int n)
  {
    for (int i = 0; i < n; ++i)
    {
      // callbacks may schedule or cancel; iterate over a snapshot
      std::vector<std::shared_ptr<detail::TickSlot>> live;
      for (auto &w : m_slots)
        if (auto s = w.lock())
          live.push_back(std::move(s));
      for (auto &s : live)
        if (!s->cancelled.load())
          s->callback();
    }
    m_slots.erase(std::remove_if(m_slots.begin(), m_slots.end(),
                                 [](const std::weak_ptr<detail::TickSlot> &w)
                                 {
                                   auto s = w.lock();
                                   return !s || s->cancelled.load();
                                 }),
                  m_slots.end());
  }

  int ManualTickScheduler::liveCount() const
  {
    int n = 0;
    for (const auto &w : m_slots)
      if (auto s = w.lock(); s && !s->cancelled.load())
        ++n;
    return n;
  }

  // ---------------- ThreadTickScheduler ----------------

  ThreadTickScheduler::~ThreadTickScheduler()
  {
    for (auto &s : m_slots)
    {
      {
        std::lock_guard<std::mutex> lk(s->m);
        s->cancelled.store(true);
      }
      s->cv.notify_all();
    }
    for (auto &t : m_workers)
      if (t.joinable())
        t.join();
  }

  TickHandle ThreadTickScheduler::schedule(std::chrono::milliseconds interval,
                                           std::function<void()> callback)
  {
    auto slot = std::make_shared<detail::TickSlot>();
    slot->callback = std::move(callback);

    // reap finished workers
    for (std::size_t i = 0; i < m_slots.size();)
    {
      if (m_slots[i]->cancelled.load() && m_slots[i].use_count() == 1)
      {
        if (m_workers[i].joinable())
          m_workers[i].join();
        m_workers.erase(m_workers.begin() + static_cast<std::ptrdiff_t>(i));
        m_slots.erase(m_slots.begin() + static_cast<std::ptrdiff_t>(i));
      }
      else
      {
        ++i;
      }
    }

    m_slots.push_back(slot);
    m_workers.emplace_back(
        [slot, interval, &serial = m_serial]
        {
          auto next = std::chrono::steady_clock::now() + interval;
          for (;;)
          {
            {
              std::unique_lock<std::mutex> lk(slot->m);
              if (slot->cv.wait_until(lk, next, [&]
                                      { return slot->cancelled.load(); }))
                return;
            }
            next += interval;

            std::lock_guard<std::mutex> lk(serial);
            if (slot->cancelled.load())
              return;
            slot->callback();
          }
        });
    return TickHandle(std::move(slot));
  }
} // namespace movecount::quiz
