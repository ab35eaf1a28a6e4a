/**
 * @file ready_queue.hpp
 * @brief ReadyQueue: selection of the next ready task.
 */
#pragma once
#include "rwdagt/common/common.hpp"
#include "rwdagt/common/graph_core_enums.hpp"
#include <deque>
#include <random>

namespace rwdagt
{

/**
 * @brief Which ready task is dispatched next.
 */
enum class ReadyPolicy
{
    Fifo,              ///< In the order tasks became ready.
    DeclarationOrder,  ///< Lowest task index first.
    Random             ///< Uniformly at random, from a seeded generator.
};

inline const char* to_string(ReadyPolicy policy) noexcept
{
    switch (policy)
    {
    case ReadyPolicy::Fifo:
        return "fifo";
    case ReadyPolicy::DeclarationOrder:
        return "declaration-order";
    case ReadyPolicy::Random:
        return "random";
    }
    return "unknown";
}

/**
 * @brief Container of ready task indices with a pluggable pop order.
 *
 * @details
 * The Random policy makes schedules reproducible from a seed, which is how
 * the determinism verifier explores different interleavings.
 *
 * @par Thread Safety
 * - No internal synchronization; executors guard it with their own mutex.
 */
class ReadyQueue
{
public:
    explicit ReadyQueue(ReadyPolicy policy = ReadyPolicy::Fifo, uint64_t seed = 0);

    void push(TaskIdx tidx);

    /**
     * @brief Remove and return the next task according to the policy.
     * @throws std::out_of_range if the queue is empty.
     */
    TaskIdx pop();

    bool empty() const noexcept { return m_items.empty(); }
    size_t size() const noexcept { return m_items.size(); }
    void clear() noexcept { m_items.clear(); }
    ReadyPolicy policy() const noexcept { return m_policy; }

private:
    ReadyPolicy m_policy;
    std::deque<TaskIdx> m_items;
    std::mt19937_64 m_rng;
};

} // namespace rwdagt
