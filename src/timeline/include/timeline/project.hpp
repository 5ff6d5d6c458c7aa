#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tg::timeline {

// Track numbers come from project data and may be sparse (e.g. 1000000, 2000000)
using TrackNumber = int64_t;
using ItemId = std::string;

struct Track {
    TrackNumber number = 0;
    std::string label;
    bool locked = false;
    bool panel_expanded = false;  // keyframe/property panel below the track row
    double panel_height = 0.0;    // extra height while expanded
};

// Times are seconds. start/end are the trim window into the source media, so the
// on-timeline length is end - start. Values are kept as loaded; the geometry cache
// coerces NaN/inf and end < start when it builds rectangles.
struct Clip {
    ItemId id;
    double position = 0.0;
    double start = 0.0;
    double end = 0.0;
    TrackNumber layer = 0;
    std::string name;
};

struct Transition {
    ItemId id;
    double position = 0.0;
    double start = 0.0;
    double end = 0.0;
    TrackNumber layer = 0;
    bool reversed = false;
};

struct Marker {
    std::string id;
    double position = 0.0;
    std::string label;
};

class Project {
public:
    Project() = default;
    ~Project() = default;
    Project(const Project&) = delete;
    Project& operator=(const Project&) = delete;

    // Tracks
    Track* add_track(TrackNumber number, const std::string& label = "");
    bool remove_track(TrackNumber number);
    Track* find_track(TrackNumber number);
    const Track* find_track(TrackNumber number) const;
    // Display order: highest track number is the top row
    std::vector<const Track*> tracks() const;
    size_t track_count() const { return tracks_.size(); }

    // Clips & transitions. Adding an existing id replaces the stored element.
    Clip* add_clip(const Clip& clip);
    bool remove_clip(const ItemId& id);
    Clip* find_clip(const ItemId& id);
    const Clip* find_clip(const ItemId& id) const;
    std::vector<const Clip*> clips() const;

    Transition* add_transition(const Transition& transition);
    bool remove_transition(const ItemId& id);
    Transition* find_transition(const ItemId& id);
    const Transition* find_transition(const ItemId& id) const;
    std::vector<const Transition*> transitions() const;

    Marker* add_marker(const Marker& marker);
    bool remove_marker(const std::string& id);
    std::vector<const Marker*> markers() const;

    void clear();

    // Selection consulted by the geometry cache for paint order
    struct Selection {
        std::unordered_set<ItemId> clips;
        std::unordered_set<ItemId> transitions;
        bool empty() const { return clips.empty() && transitions.empty(); }
    };
    const Selection& selection() const { return selection_; }
    Selection& selection() { return selection_; }

    // Explicit duration when set, otherwise the furthest item edge
    double duration() const;
    void set_duration(std::optional<double> seconds) { duration_ = seconds; }
    double furthest_edge() const;

    // Pixels drawn for one second at zoom factor 1
    double tick_pixels() const { return tick_pixels_; }
    void set_tick_pixels(double px) { tick_pixels_ = px; }

    // Versioning: every structural change bumps the version and notifies the owner
    uint64_t version() const { return version_; }
    void mark_modified() { ++version_; if(modified_callback_) modified_callback_(); }

    using ModifiedCallback = std::function<void()>;
    void set_modified_callback(ModifiedCallback cb) { modified_callback_ = std::move(cb); }

private:
    std::vector<std::unique_ptr<Track>> tracks_;
    std::unordered_map<ItemId, std::unique_ptr<Clip>> clips_;
    std::unordered_map<ItemId, std::unique_ptr<Transition>> transitions_;
    std::vector<std::unique_ptr<Marker>> markers_;

    Selection selection_;
    std::optional<double> duration_;
    double tick_pixels_ = 100.0;
    uint64_t version_ = 1;

    size_t find_track_index(TrackNumber number) const;

    ModifiedCallback modified_callback_{};
};

} // namespace tg::timeline
