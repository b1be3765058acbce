#include "moiplink/controller/IdentifierMapper.h"

#include "moiplink/common/Errors.h"

#include <spdlog/spdlog.h>

namespace moiplink::controller {

namespace {

std::string suffix(DeviceKind kind) {
    return kind == DeviceKind::Transmitter ? "_tx" : "_rx";
}

}  // namespace

IdentifierMapper::IdentifierMapper(GroupSource source) : source_(std::move(source)) {}

IdentifierCorrelation IdentifierMapper::correlation(DeviceKind kind, int index) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& table = tables_[kind];
    if (auto it = table.entries.find(index); it != table.entries.end()) {
        return it->second;
    }

    rebuildLocked(kind, source_(kind));
    ++enumerations_;

    if (table.conflicts.count(index) != 0) {
        throw CorrelationConflict(kind, index);
    }
    if (auto it = table.entries.find(index); it != table.entries.end()) {
        return it->second;
    }
    throw UnknownDevice("No " + std::string(rest::groupResource(kind)) + " group has index " + std::to_string(index));
}

void IdentifierMapper::rebuildLocked(DeviceKind kind, const std::vector<rest::GroupRecord>& groups) {
    std::map<int, std::vector<const rest::GroupRecord*>> byIndex;
    for (const auto& group : groups) {
        if (group.index) {
            byIndex[*group.index].push_back(&group);
        }
    }

    KindTable rebuilt;
    const auto tail = suffix(kind);
    for (const auto& [index, claimants] : byIndex) {
        if (claimants.size() > 1) {
            spdlog::warn("{} groups claim {} index {}; leaving it uncorrelated",
                         claimants.size(),
                         toString(kind),
                         index);
            rebuilt.conflicts.insert(index);
            continue;
        }
        const auto& group = *claimants.front();
        IdentifierCorrelation entry;
        entry.index = index;
        entry.kind = kind;
        entry.groupId = group.id;
        entry.unitId = group.association("unit");
        entry.videoId = group.association("video" + tail);
        entry.audioId = group.association("audio" + tail);
        entry.irId = group.association("ir" + tail);
        entry.serialId = group.association("serial" + tail);
        rebuilt.entries.emplace(index, entry);
    }

    auto& current = tables_[kind];
    for (const auto& [index, entry] : current.entries) {
        auto it = rebuilt.entries.find(index);
        if (it == rebuilt.entries.end() || it->second.groupId != entry.groupId) {
            spdlog::info("Correlation for {} {} changed; dropping cached group {}", toString(kind), index, entry.groupId);
        }
    }
    current = std::move(rebuilt);
}

int IdentifierMapper::required(const std::optional<int>& id, const char* resource, DeviceKind kind, int index) const {
    if (!id) {
        throw UnknownDevice(std::string(toString(kind)) + " " + std::to_string(index) + " has no " + resource +
                            suffix(kind) + " resource");
    }
    return *id;
}

int IdentifierMapper::restGroupFor(int index, DeviceKind kind) {
    return correlation(kind, index).groupId;
}

int IdentifierMapper::restUnitFor(int index, DeviceKind kind) {
    const auto entry = correlation(kind, index);
    if (!entry.unitId) {
        throw UnknownDevice(std::string(toString(kind)) + " " + std::to_string(index) + " has no unit");
    }
    return *entry.unitId;
}

int IdentifierMapper::restVideoFor(int index, DeviceKind kind) {
    return required(correlation(kind, index).videoId, "video", kind, index);
}

int IdentifierMapper::restAudioFor(int index, DeviceKind kind) {
    return required(correlation(kind, index).audioId, "audio", kind, index);
}

int IdentifierMapper::restIrFor(int index, DeviceKind kind) {
    return required(correlation(kind, index).irId, "ir", kind, index);
}

int IdentifierMapper::restSerialFor(int index, DeviceKind kind) {
    return required(correlation(kind, index).serialId, "serial", kind, index);
}

void IdentifierMapper::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    tables_.clear();
}

void IdentifierMapper::invalidate(DeviceKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    tables_.erase(kind);
}

void IdentifierMapper::reconcile(DeviceKind kind, const std::vector<rest::GroupRecord>& groups) {
    std::lock_guard<std::mutex> lock(mutex_);
    rebuildLocked(kind, groups);
}

std::uint64_t IdentifierMapper::enumerationCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return enumerations_;
}

std::optional<IdentifierCorrelation> IdentifierMapper::cached(DeviceKind kind, int index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto table = tables_.find(kind);
    if (table == tables_.end()) {
        return std::nullopt;
    }
    if (auto it = table->second.entries.find(index); it != table->second.entries.end()) {
        return it->second;
    }
    return std::nullopt;
}

}  // namespace moiplink::controller
