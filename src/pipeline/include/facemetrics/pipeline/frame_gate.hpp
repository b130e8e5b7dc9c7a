#pragma once

#include <facemetrics/pch.hpp>

#include <atomic>
#include <optional>

namespace facemetrics {

/**
 * @brief Admits at most one in-flight frame and drops the rest.
 * @details Newer frames are never queued: a caller that fails to enter skips its frame.
 */
class FrameGate {
public:
  /**
   * @brief Proof of admission. Releases the gate when destroyed.
   */
  class Ticket {
  public:
    Ticket(const Ticket&) = delete;
    Ticket(Ticket&& other) noexcept : gate_(other.gate_) { other.gate_ = nullptr; }
    ~Ticket() noexcept { Release(); }

    Ticket& operator=(const Ticket&) = delete;
    Ticket& operator=(Ticket&& other) noexcept {
      if (this != &other) {
        Release();
        gate_ = other.gate_;
        other.gate_ = nullptr;
      }
      return *this;
    }

  private:
    friend class FrameGate;

    explicit Ticket(FrameGate& gate) noexcept : gate_(&gate) {}

    void Release() noexcept {
      if (gate_ != nullptr) {
        gate_->busy_.store(false, std::memory_order_release);
        gate_ = nullptr;
      }
    }

    FrameGate* gate_ = nullptr;
  };

  FrameGate() noexcept = default;
  FrameGate(const FrameGate&) = delete;
  FrameGate(FrameGate&&) = delete;
  ~FrameGate() noexcept = default;

  FrameGate& operator=(const FrameGate&) = delete;
  FrameGate& operator=(FrameGate&&) = delete;

  /**
   * @brief Tries to admit a frame.
   * @return A ticket, or nullopt if another frame holds the gate.
   */
  [[nodiscard]] std::optional<Ticket> TryEnter() noexcept {
    bool expected = false;
    if (!busy_.compare_exchange_strong(expected, true, std::memory_order_acquire, std::memory_order_relaxed)) {
      return std::nullopt;
    }
    return Ticket(*this);
  }

  [[nodiscard]] bool Busy() const noexcept { return busy_.load(std::memory_order_acquire); }

  /**
   * @brief Checks whether the ticket currently holds this gate.
   */
  [[nodiscard]] bool Holds(const Ticket& ticket) const noexcept { return ticket.gate_ == this; }

private:
  std::atomic<bool> busy_{false};
};

}  // namespace facemetrics
