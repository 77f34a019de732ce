#include <cassert>
#include <utility>

namespace cachet::policy::detail {

template<typename T> auto IndexList<T>::push_back(T value) -> Index
{
    const Index index = allocate(std::move(value));
    link_back(index);
    return index;
}

template<typename T> auto IndexList<T>::push_front(T value) -> Index
{
    const Index index = allocate(std::move(value));
    link_front(index);
    return index;
}

template<typename T> void IndexList<T>::erase(Index index)
{
    assert(index < m_nodes.size());

    unlink(index);
    m_free_slots.push_back(index);
    --m_size;
}

template<typename T> void IndexList<T>::move_to_front(Index index)
{
    if (index == m_head) {
        return;
    }
    unlink(index);
    link_front(index);
}

template<typename T> void IndexList<T>::move_to_back(Index index)
{
    if (index == m_tail) {
        return;
    }
    unlink(index);
    link_back(index);
}

template<typename T> auto IndexList<T>::front() const -> Index
{
    return m_head;
}

template<typename T> auto IndexList<T>::back() const -> Index
{
    return m_tail;
}

template<typename T> auto IndexList<T>::next(Index index) const -> Index
{
    return m_nodes[index].m_next;
}

template<typename T> auto IndexList<T>::prev(Index index) const -> Index
{
    return m_nodes[index].m_prev;
}

template<typename T> const T& IndexList<T>::at(Index index) const
{
    assert(index < m_nodes.size());
    return m_nodes[index].m_value;
}

template<typename T> size_t IndexList<T>::size() const
{
    return m_size;
}

template<typename T> bool IndexList<T>::empty() const
{
    return m_size == 0;
}

template<typename T> void IndexList<T>::clear()
{
    m_nodes.clear();
    m_free_slots.clear();
    m_head = npos;
    m_tail = npos;
    m_size = 0;
}

template<typename T> auto IndexList<T>::allocate(T&& value) -> Index
{
    ++m_size;

    if (!m_free_slots.empty()) {
        const Index index = m_free_slots.back();
        m_free_slots.pop_back();
        m_nodes[index].m_value = std::move(value);
        return index;
    }

    m_nodes.push_back(Node{std::move(value), npos, npos});
    return m_nodes.size() - 1;
}

template<typename T> void IndexList<T>::unlink(Index index)
{
    Node& node = m_nodes[index];

    if (node.m_prev != npos) {
        m_nodes[node.m_prev].m_next = node.m_next;
    } else {
        m_head = node.m_next;
    }

    if (node.m_next != npos) {
        m_nodes[node.m_next].m_prev = node.m_prev;
    } else {
        m_tail = node.m_prev;
    }

    node.m_prev = npos;
    node.m_next = npos;
}

template<typename T> void IndexList<T>::link_front(Index index)
{
    Node& node  = m_nodes[index];
    node.m_prev = npos;
    node.m_next = m_head;

    if (m_head != npos) {
        m_nodes[m_head].m_prev = index;
    } else {
        m_tail = index;
    }
    m_head = index;
}

template<typename T> void IndexList<T>::link_back(Index index)
{
    Node& node  = m_nodes[index];
    node.m_prev = m_tail;
    node.m_next = npos;

    if (m_tail != npos) {
        m_nodes[m_tail].m_next = index;
    } else {
        m_head = index;
    }
    m_tail = index;
}

}  // namespace cachet::policy::detail
