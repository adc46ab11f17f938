#ifndef SRC_STRATA_SCOPED_TABLE_HPP_
#define SRC_STRATA_SCOPED_TABLE_HPP_

#include <memory>
#include <string>

namespace strata {

template <typename V>
struct ScopedFrame;

// Persistent name table. extend() returns a new table whose innermost frame holds the new binding and whose parent is
// this table, so the table being extended, and any table sharing its frames, never observes the addition. Lookups
// walk from the innermost frame outward, so newer bindings shadow older ones.
template <typename V>
class ScopedTable {
public:
    ScopedTable() = default;
    ~ScopedTable() = default;

    ScopedTable extend(std::string name, V value) const {
        return ScopedTable(std::make_shared<const ScopedFrame<V>>(std::move(name), std::move(value), m_frame));
    }

    // Returns nullptr if |name| is not bound.
    const V* find(const std::string& name) const {
        for (auto frame = m_frame.get(); frame != nullptr; frame = frame->parent.get()) {
            if (frame->name == name) { return &frame->value; }
        }
        return nullptr;
    }

    bool contains(const std::string& name) const { return find(name) != nullptr; }
    bool empty() const { return m_frame == nullptr; }

private:
    explicit ScopedTable(std::shared_ptr<const ScopedFrame<V>> frame): m_frame(std::move(frame)) {}

    std::shared_ptr<const ScopedFrame<V>> m_frame;
};

template <typename V>
struct ScopedFrame {
    ScopedFrame(std::string n, V v, std::shared_ptr<const ScopedFrame<V>> p):
        name(std::move(n)), value(std::move(v)), parent(std::move(p)) {}

    std::string name;
    V value;
    std::shared_ptr<const ScopedFrame<V>> parent;
};

} // namespace strata

#endif // SRC_STRATA_SCOPED_TABLE_HPP_
