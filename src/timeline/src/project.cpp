#include "timeline/project.hpp"
#include "core/log.hpp"
#include <algorithm>
#include <cmath>

namespace tg::timeline {

Track* Project::add_track(TrackNumber number, const std::string& label) {
    if (find_track(number)) {
        tg::log::warn("Project::add_track: track " + std::to_string(number) + " already exists");
        return nullptr;
    }
    auto track = std::make_unique<Track>();
    track->number = number;
    track->label = label.empty() ? "Track " + std::to_string(number) : label;
    Track* raw = track.get();
    tracks_.push_back(std::move(track));
    mark_modified();
    return raw;
}

bool Project::remove_track(TrackNumber number) {
    size_t index = find_track_index(number);
    if (index >= tracks_.size()) {
        return false;
    }
    tracks_.erase(tracks_.begin() + static_cast<std::ptrdiff_t>(index));
    mark_modified();
    return true;
}

Track* Project::find_track(TrackNumber number) {
    size_t index = find_track_index(number);
    return index < tracks_.size() ? tracks_[index].get() : nullptr;
}

const Track* Project::find_track(TrackNumber number) const {
    size_t index = find_track_index(number);
    return index < tracks_.size() ? tracks_[index].get() : nullptr;
}

std::vector<const Track*> Project::tracks() const {
    std::vector<const Track*> result;
    result.reserve(tracks_.size());
    for (const auto& t : tracks_) {
        result.push_back(t.get());
    }
    std::sort(result.begin(), result.end(), [](const Track* a, const Track* b) {
        return a->number > b->number;
    });
    return result;
}

Clip* Project::add_clip(const Clip& clip) {
    if (clip.id.empty()) {
        tg::log::warn("Project::add_clip: refusing clip without id");
        return nullptr;
    }
    auto& slot = clips_[clip.id];
    slot = std::make_unique<Clip>(clip);
    mark_modified();
    return slot.get();
}

bool Project::remove_clip(const ItemId& id) {
    if (clips_.erase(id) == 0) return false;
    selection_.clips.erase(id);
    mark_modified();
    return true;
}

Clip* Project::find_clip(const ItemId& id) {
    auto it = clips_.find(id);
    return it != clips_.end() ? it->second.get() : nullptr;
}

const Clip* Project::find_clip(const ItemId& id) const {
    auto it = clips_.find(id);
    return it != clips_.end() ? it->second.get() : nullptr;
}

std::vector<const Clip*> Project::clips() const {
    std::vector<const Clip*> result;
    result.reserve(clips_.size());
    for (const auto& [id, clip] : clips_) {
        result.push_back(clip.get());
    }
    return result;
}

Transition* Project::add_transition(const Transition& transition) {
    if (transition.id.empty()) {
        tg::log::warn("Project::add_transition: refusing transition without id");
        return nullptr;
    }
    auto& slot = transitions_[transition.id];
    slot = std::make_unique<Transition>(transition);
    mark_modified();
    return slot.get();
}

bool Project::remove_transition(const ItemId& id) {
    if (transitions_.erase(id) == 0) return false;
    selection_.transitions.erase(id);
    mark_modified();
    return true;
}

Transition* Project::find_transition(const ItemId& id) {
    auto it = transitions_.find(id);
    return it != transitions_.end() ? it->second.get() : nullptr;
}

const Transition* Project::find_transition(const ItemId& id) const {
    auto it = transitions_.find(id);
    return it != transitions_.end() ? it->second.get() : nullptr;
}

std::vector<const Transition*> Project::transitions() const {
    std::vector<const Transition*> result;
    result.reserve(transitions_.size());
    for (const auto& [id, tran] : transitions_) {
        result.push_back(tran.get());
    }
    return result;
}

Marker* Project::add_marker(const Marker& marker) {
    markers_.push_back(std::make_unique<Marker>(marker));
    mark_modified();
    return markers_.back().get();
}

bool Project::remove_marker(const std::string& id) {
    auto it = std::find_if(markers_.begin(), markers_.end(),
                           [&](const std::unique_ptr<Marker>& m) { return m->id == id; });
    if (it == markers_.end()) return false;
    markers_.erase(it);
    mark_modified();
    return true;
}

std::vector<const Marker*> Project::markers() const {
    std::vector<const Marker*> result;
    result.reserve(markers_.size());
    for (const auto& m : markers_) {
        result.push_back(m.get());
    }
    return result;
}

void Project::clear() {
    tracks_.clear();
    clips_.clear();
    transitions_.clear();
    markers_.clear();
    selection_.clips.clear();
    selection_.transitions.clear();
    duration_.reset();
    mark_modified();
}

double Project::furthest_edge() const {
    double edge = 0.0;
    auto consider = [&edge](double position, double start, double end) {
        double length = end - start;
        double right = position + (length > 0.0 ? length : 0.0);
        if (std::isfinite(right)) edge = std::max(edge, right);
    };
    for (const auto& [id, clip] : clips_) consider(clip->position, clip->start, clip->end);
    for (const auto& [id, tran] : transitions_) consider(tran->position, tran->start, tran->end);
    return edge;
}

double Project::duration() const {
    if (duration_ && std::isfinite(*duration_) && *duration_ >= 0.0) {
        return *duration_;
    }
    return furthest_edge();
}

size_t Project::find_track_index(TrackNumber number) const {
    for (size_t i = 0; i < tracks_.size(); ++i) {
        if (tracks_[i]->number == number) {
            return i;
        }
    }
    return tracks_.size();
}

} // namespace tg::timeline
