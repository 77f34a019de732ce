#ifndef CACHET_POLICY_DETAIL_INDEX_LIST_H
#define CACHET_POLICY_DETAIL_INDEX_LIST_H

#include <cstddef>
#include <limits>
#include <vector>

namespace cachet::policy::detail {

/// @brief Doubly-linked list stored in a contiguous arena.
/// @details Nodes are linked by their position in the arena instead of by pointers. Slots freed by
///          `erase()` are recycled by later insertions, so an index stays valid until the value it
///          designates is erased.
/// @tparam T The type of the values held in the list. Must be copy or move assignable.
template<typename T> class IndexList
{
public:
    using Index = size_t;

    /// @brief Sentinel index returned when there is no such node.
    static constexpr Index npos = std::numeric_limits<Index>::max();

    /// @brief Append a value to the back of the list.
    /// @return The index of the new node.
    Index push_back(T value);

    /// @brief Prepend a value to the front of the list.
    /// @return The index of the new node.
    Index push_front(T value);

    /// @brief Unlink a node and recycle its slot.
    void erase(Index index);

    /// @brief Relink a node at the front of the list.
    void move_to_front(Index index);

    /// @brief Relink a node at the back of the list.
    void move_to_back(Index index);

    [[nodiscard]] Index front() const;
    [[nodiscard]] Index back() const;
    [[nodiscard]] Index next(Index index) const;
    [[nodiscard]] Index prev(Index index) const;

    [[nodiscard]] const T& at(Index index) const;

    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool   empty() const;

    void clear();

private:
    struct Node {
        T     m_value;
        Index m_prev;
        Index m_next;
    };

    std::vector<Node>  m_nodes;
    std::vector<Index> m_free_slots;

    Index  m_head = npos;
    Index  m_tail = npos;
    size_t m_size = 0;

    Index allocate(T&& value);
    void  unlink(Index index);
    void  link_front(Index index);
    void  link_back(Index index);
};

}  // namespace cachet::policy::detail

#include "index_list.hpp"

#endif
