#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace movecount::quiz
{
  namespace detail
  {
    struct TickSlot
    {
      std::atomic<bool> cancelled{false};
      std::function<void()> callback;
      // wakes a sleeping worker on cancel
      std::mutex m;
      std::condition_variable cv;
    };
  } // namespace detail

  // Live registration of a periodic callback. Move-only; cancels on destruction.
  class TickHandle
  {
  public:
    TickHandle() = default;
    explicit TickHandle(std::shared_ptr<detail::TickSlot> slot) : m_slot(std::move(slot)) {}
    ~TickHandle() { cancel(); }

    TickHandle(const TickHandle &) = delete;
    TickHandle &operator=(const TickHandle &) = delete;
    TickHandle(TickHandle &&other) noexcept = default;
    TickHandle &operator=(TickHandle &&other) noexcept
    {
      if (this != &other)
      {
        cancel();
        m_slot = std::move(other.m_slot);
      }
      return *this;
    }

    // Idempotent.
    void cancel() noexcept;
    bool active() const noexcept { return m_slot && !m_slot->cancelled.load(); }

  private:
    std::shared_ptr<detail::TickSlot> m_slot;
  };

  class TickScheduler
  {
  public:
    virtual ~TickScheduler() = default;
    virtual TickHandle schedule(std::chrono::milliseconds interval, std::function<void()> callback) = 0;
  };

  // Deterministic scheduler: ticks only fire from advance().
  class ManualTickScheduler : public TickScheduler
  {
  public:
    TickHandle schedule(std::chrono::milliseconds interval, std::function<void()> callback) override;

    // Fires every live callback n times.
    void advance(int n = 1);
    // Registrations that have not been cancelled.
    int liveCount() const;

  private:
    std::vector<std::weak_ptr<detail::TickSlot>> m_slots;
  };

  // One worker thread per registration. Each tick takes 'serial' before running the
  // callback, so ticks are serialized with whatever else holds that mutex. cancel() never
  // joins; workers are joined when the scheduler is destroyed.
  class ThreadTickScheduler : public TickScheduler
  {
  public:
    explicit ThreadTickScheduler(std::mutex &serial) : m_serial(serial) {}
    ~ThreadTickScheduler() override;

    ThreadTickScheduler(const ThreadTickScheduler &) = delete;
    ThreadTickScheduler &operator=(const ThreadTickScheduler &) = delete;

    TickHandle schedule(std::chrono::milliseconds interval, std::function<void()> callback) override;

  private:
    std::mutex &m_serial;
    std::vector<std::thread> m_workers;
    std::vector<std::shared_ptr<detail::TickSlot>> m_slots;
  };
} // namespace movecount::quiz
