#pragma once
#include "geometry/geometry_entry.hpp"

#include <algorithm>
#include <limits>
#include <tuple>
#include <vector>

namespace tg::geometry {

// Closed-interval overlap test shared by the indexed query and its callers.
// Empty rects never intersect anything.
inline bool intersects_window(const RectF& rect, double left, double right, double top, double bottom) {
    if (rect.is_empty()) return false;
    return rect.right() >= left && rect.left() <= right &&
           rect.bottom() >= top && rect.top() <= bottom;
}

/**
 * @brief Left-sorted entries with a running maximum of right edges.
 *
 * Entries are kept sorted by (left, top, id). starts_[i] mirrors entries_[i].left
 * for binary search and max_rights_[i] is the largest right edge among entries
 * 0..i, which is non-decreasing and lets a backward scan stop as soon as nothing
 * at or before i can reach the window. Every mutation goes through resort(), so
 * both arrays always match entries_ in length and order.
 */
template <typename T>
class IntervalIndex {
public:
    using Entry = GeometryEntry<T>;

    void clear() {
        entries_.clear();
        starts_.clear();
        max_rights_.clear();
    }

    void assign(std::vector<Entry> entries) {
        entries_ = std::move(entries);
        resort();
    }

    // Replace one cached rect (interactive drag). Always re-sorts the whole
    // index: an in-place splice could leave max_rights_ stale for entries the
    // dragged one crossed.
    bool update_rect(const timeline::ItemId& id, const RectF& rect) {
        for (auto& entry : entries_) {
            if (entry.item && entry.item->id == id) {
                entry.rect = rect;
                resort();
                return true;
            }
        }
        return false;
    }

    const Entry* find(const timeline::ItemId& id) const {
        for (const auto& entry : entries_) {
            if (entry.item && entry.item->id == id) return &entry;
        }
        return nullptr;
    }

    /**
     * Entries intersecting [search_left, search_right] x [view_top, view_bottom],
     * left-to-right in index order. Degenerate rects are never returned.
     */
    std::vector<const Entry*> iter_in_range(double search_left, double search_right,
                                            double view_top, double view_bottom) const {
        std::vector<const Entry*> result;
        if (entries_.empty() || search_right < search_left) {
            return result;
        }

        const size_t total = entries_.size();
        const size_t start_idx = static_cast<size_t>(
            std::lower_bound(starts_.begin(), starts_.end(), search_left) - starts_.begin());

        std::vector<const Entry*> backward;
        for (size_t idx = start_idx; idx-- > 0;) {
            if (max_rights_[idx] < search_left) break;
            const Entry& entry = entries_[idx];
            if (intersects_window(entry.rect, search_left, search_right, view_top, view_bottom)) {
                backward.push_back(&entry);
            }
        }

        result.reserve(backward.size() + 16);
        result.assign(backward.rbegin(), backward.rend());

        for (size_t idx = start_idx; idx < total; ++idx) {
            const Entry& entry = entries_[idx];
            if (entry.rect.left() > search_right) break;
            if (intersects_window(entry.rect, search_left, search_right, view_top, view_bottom)) {
                result.push_back(&entry);
            }
        }
        return result;
    }

    const std::vector<Entry>& entries() const { return entries_; }
    const std::vector<double>& starts() const { return starts_; }
    const std::vector<double>& max_rights() const { return max_rights_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    static bool entry_less(const Entry& a, const Entry& b) {
        static const timeline::ItemId none;
        const auto& id_a = a.item ? a.item->id : none;
        const auto& id_b = b.item ? b.item->id : none;
        return std::tie(a.rect.x, a.rect.y, id_a) < std::tie(b.rect.x, b.rect.y, id_b);
    }

    void resort() {
        std::sort(entries_.begin(), entries_.end(), &IntervalIndex::entry_less);
        starts_.clear();
        max_rights_.clear();
        starts_.reserve(entries_.size());
        max_rights_.reserve(entries_.size());
        double max_right = -std::numeric_limits<double>::infinity();
        for (const auto& entry : entries_) {
            starts_.push_back(entry.rect.left());
            max_right = std::max(max_right, entry.rect.right());
            max_rights_.push_back(max_right);
        }
    }

    std::vector<Entry> entries_;
    std::vector<double> starts_;
    std::vector<double> max_rights_;
};

/**
 * Paint order for a left-to-right visible sequence: unselected entries first,
 * selected last (drawn on top). With reverse the sequence is walked
 * right-to-left and selected entries come first, which is the order hit
 * testing wants. Relative order inside each group is never changed.
 */
template <typename Entry>
std::vector<const Entry*> paint_order(std::vector<const Entry*> seq, bool reverse) {
    if (reverse) {
        std::reverse(seq.begin(), seq.end());
    }
    const bool first_group = reverse;
    std::stable_partition(seq.begin(), seq.end(),
                          [first_group](const Entry* e) { return e->selected == first_group; });
    return seq;
}

} // namespace tg::geometry
