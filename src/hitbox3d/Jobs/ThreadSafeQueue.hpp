#ifndef hitbox3d_ThreadSafeQueue_hpp_
#define hitbox3d_ThreadSafeQueue_hpp_

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <type_traits>
#include <utility>

namespace Hitbox3D {

// Timeout of a blocking pop, 0 waits forever.
struct BlockingWait
{
    unsigned timeout_ms = 0;
};

// Queue between one producer and one consumer thread. Elements are handed
// to a consumer functor outside of the lock.
template<class T, class Container = std::deque<T>>
class ThreadSafeQueueSPSC
{
public:
    // Consume one element, block until one arrives or the timeout expires.
    // Returns false on timeout.
    template<class Fn>
    bool consume_one(const BlockingWait &wait, Fn &&fn)
    {
        T el;
        {
            std::unique_lock<std::mutex> lk(m_mutex);
            auto not_empty = [this] { return ! m_queue.empty(); };
            if (wait.timeout_ms > 0) {
                if (! m_cond_var.wait_for(lk, std::chrono::milliseconds(wait.timeout_ms), not_empty))
                    return false;
            } else
                m_cond_var.wait(lk, not_empty);
            this->pop(el);
        }
        fn(el);
        return true;
    }

    // Consume one element if there is any, never blocks.
    template<class Fn>
    bool consume_one(Fn &&fn)
    {
        T el;
        {
            std::lock_guard<std::mutex> lk(m_mutex);
            if (m_queue.empty())
                return false;
            this->pop(el);
        }
        fn(el);
        return true;
    }

    // Construct an element in place at the back of the queue.
    template<class... Args>
    void push(Args &&... args)
    {
        {
            std::lock_guard<std::mutex> lk(m_mutex);
            m_queue.emplace_back(std::forward<Args>(args)...);
        }
        m_cond_var.notify_one();
    }

    bool empty() const
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        return m_queue.empty();
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        return m_queue.size();
    }

    // Drops the pending elements, returns how many were dropped.
    size_t clear()
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        size_t cnt = m_queue.size();
        m_queue.clear();
        return cnt;
    }

private:
    void pop(T &el)
    {
    static_assert(std::is_default_constructible<T>::value, "queue elements are popped into a default constructed value");
    static_assert(std::is_move_assignable<T>::value, "queue elements are moved out of the queue");
        el = std::move(m_queue.front());
        m_queue.pop_front();
    }

    Container               m_queue;
    mutable std::mutex      m_mutex;
    std::condition_variable m_cond_var;
};

} // namespace Hitbox3D

#endif // hitbox3d_ThreadSafeQueue_hpp_
