#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace coop_scheduler {

/**
 * Array backed binary min-heap.
 *
 * `Compare(a, b)` must return true when `a` has to leave the heap before `b`.
 * For tasks that is `sortIndex` ascending and `id` ascending on ties, so the
 * comparator is a strict weak ordering and the pop order is fully deterministic.
 */
template <typename T, typename Compare = std::less<T>>
class PriorityHeap
{
public:
    PriorityHeap() = default;
    explicit PriorityHeap(Compare compare)
        : m_compare(std::move(compare))
    {}

    /**
     * @brief push Appends the node and sifts it up, O(log n)
     * @param node The node
     */
    void push(T node)
    {
        m_nodes.push_back(std::move(node));
        siftUp(m_nodes.size() - 1);
    }

    /**
     * @brief peek Returns the root without removing it, O(1)
     * @return nullptr when the heap is empty
     */
    [[nodiscard]] const T *peek() const noexcept
    {
        return m_nodes.empty() ? nullptr : &m_nodes.front();
    }

    /**
     * @brief pop Removes the root, moves the last node into its place and sifts it down, O(log n)
     * @return std::nullopt when the heap is empty
     */
    std::optional<T> pop()
    {
        if (m_nodes.empty()) {
            return std::nullopt;
        }

        T first = std::move(m_nodes.front());
        T last = std::move(m_nodes.back());
        m_nodes.pop_back();

        if (not m_nodes.empty()) {
            m_nodes.front() = std::move(last);
            siftDown(0);
        }
        return first;
    }

    [[nodiscard]] std::size_t size() const noexcept { return m_nodes.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_nodes.empty(); }
    void clear() noexcept { m_nodes.clear(); }

    /**
     * @brief isValid Checks that no child orders before its parent
     * @return 
     */
    [[nodiscard]] bool isValid() const
    {
        for (std::size_t child = 1; child < m_nodes.size(); ++child) {
            const std::size_t parent = (child - 1) / 2;
            if (m_compare(m_nodes[child], m_nodes[parent])) {
                return false;
            }
        }
        return true;
    }

private:
    void siftUp(std::size_t index)
    {
        while (index > 0) {
            const std::size_t parent = (index - 1) / 2;
            if (not m_compare(m_nodes[index], m_nodes[parent])) {
                return;
            }
            std::swap(m_nodes[index], m_nodes[parent]);
            index = parent;
        }
    }

    void siftDown(std::size_t index)
    {
        const std::size_t length = m_nodes.size();
        const std::size_t half_length = length / 2;

        // Only nodes in the first half have children
        while (index < half_length) {
            const std::size_t left = 2 * index + 1;
            const std::size_t right = left + 1;

            std::size_t smallest = left;
            if (right < length && m_compare(m_nodes[right], m_nodes[left])) {
                smallest = right;
            }

            if (not m_compare(m_nodes[smallest], m_nodes[index])) {
                return;
            }
            std::swap(m_nodes[index], m_nodes[smallest]);
            index = smallest;
        }
    }

    std::vector<T> m_nodes;
    Compare m_compare;
};

} // namespace coop_scheduler
