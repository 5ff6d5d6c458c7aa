#pragma once
#include "core/rect.hpp"
#include "timeline/project.hpp"

#include <variant>

namespace tg::geometry {

enum class ItemKind { Clip, Transition };

inline const char* to_string(ItemKind kind) {
    return kind == ItemKind::Clip ? "clip" : "transition";
}

// Cached rectangle for one clip or transition. The item pointer is non-owning:
// the project keeps the element alive and must call mark_dirty() on the cache
// before removing it.
template <typename T>
struct GeometryEntry {
    RectF rect;
    const T* item = nullptr;
    bool selected = false;

    double left() const { return rect.left(); }
    double right() const { return rect.right(); }
    double top() const { return rect.top(); }
    double bottom() const { return rect.bottom(); }
};

using ClipEntry = GeometryEntry<timeline::Clip>;
using TransitionEntry = GeometryEntry<timeline::Transition>;

using ItemRef = std::variant<const timeline::Clip*, const timeline::Transition*>;

inline ItemKind kind_of(const ItemRef& ref) {
    return std::holds_alternative<const timeline::Clip*>(ref) ? ItemKind::Clip : ItemKind::Transition;
}

inline const timeline::ItemId& id_of(const ItemRef& ref) {
    return std::visit([](auto* item) -> const timeline::ItemId& { return item->id; }, ref);
}

// Clip or transition as yielded by the combined item iteration
struct ItemView {
    RectF rect;
    ItemRef item;
    bool selected = false;

    ItemKind kind() const { return kind_of(item); }
    const timeline::ItemId& id() const { return id_of(item); }
};

} // namespace tg::geometry
