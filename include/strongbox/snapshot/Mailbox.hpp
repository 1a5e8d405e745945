#ifndef INCLUDE_STRONGBOX_SNAPSHOT_MAILBOX_HPP
#define INCLUDE_STRONGBOX_SNAPSHOT_MAILBOX_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace strongbox::snapshot
{

// Unbounded FIFO shared by any number of producers and one consumer.
template <class Message> class Mailbox final
{
public:
    Mailbox() = default;
    Mailbox(const Mailbox&) = delete;
    Mailbox& operator=(const Mailbox&) = delete;
    Mailbox(Mailbox&&) = delete;
    Mailbox& operator=(Mailbox&&) = delete;
    ~Mailbox() = default;

    // False once the mailbox is closed; the message is not queued.
    [[nodiscard]] bool push(Message message)
    {
        {
            const std::lock_guard lock{ m_mutex };
            if (m_closed)
            {
                return false;
            }
            m_queue.push_back(std::move(message));
        }
        m_cv.notify_one();
        return true;
    }

    // Blocks until a message arrives. Returns std::nullopt only when closed and drained.
    [[nodiscard]] std::optional<Message> pop()
    {
        std::unique_lock lock{ m_mutex };
        m_cv.wait(lock, [this]() { return !m_queue.empty() || m_closed; });
        if (m_queue.empty())
        {
            return std::nullopt;
        }
        auto message{ std::move(m_queue.front()) };
        m_queue.pop_front();
        return message;
    }

    void close()
    {
        {
            const std::lock_guard lock{ m_mutex };
            m_closed = true;
        }
        m_cv.notify_all();
    }

    [[nodiscard]] std::size_t depth() const
    {
        const std::lock_guard lock{ m_mutex };
        return m_queue.size();
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<Message> m_queue;
    bool m_closed{ false };
};

} // namespace strongbox::snapshot

#endif // INCLUDE_STRONGBOX_SNAPSHOT_MAILBOX_HPP
