#include "rwdagt/execution/ready_queue.hpp"

namespace rwdagt
{

ReadyQueue::ReadyQueue(ReadyPolicy policy, uint64_t seed)
    : m_policy{policy}
    , m_items{}
    , m_rng{seed}
{}

void ReadyQueue::push(TaskIdx tidx)
{
    m_items.push_back(tidx);
    if (m_policy == ReadyPolicy::DeclarationOrder)
    {
        std::push_heap(m_items.begin(), m_items.end(), std::greater<TaskIdx>());
    }
}

TaskIdx ReadyQueue::pop()
{
    if (m_items.empty())
    {
        throw std::out_of_range("ReadyQueue::pop: queue is empty");
    }

    TaskIdx result;
    switch (m_policy)
    {
    case ReadyPolicy::Fifo:
        result = m_items.front();
        m_items.pop_front();
        return result;

    case ReadyPolicy::DeclarationOrder:
        std::pop_heap(m_items.begin(), m_items.end(), std::greater<TaskIdx>());
        result = m_items.back();
        m_items.pop_back();
        return result;

    case ReadyPolicy::Random:
    {
        std::uniform_int_distribution<size_t> dist(0, m_items.size() - 1);
        size_t pick = dist(m_rng);
        std::swap(m_items[pick], m_items.back());
        result = m_items.back();
        m_items.pop_back();
        return result;
    }
    }
    throw std::logic_error("ReadyQueue::pop: invalid policy");
}

} // namespace rwdagt
