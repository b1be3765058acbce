#pragma once

#include "moiplink/common/Types.h"
#include "moiplink/rest/RestApiClient.h"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace moiplink::controller {

// Correspondence between a line-protocol index and the management-plane
// resources that make up the same endpoint.
struct IdentifierCorrelation {
    int index{0};
    DeviceKind kind{DeviceKind::Transmitter};
    int groupId{0};
    std::optional<int> unitId;
    std::optional<int> videoId;
    std::optional<int> audioId;
    std::optional<int> irId;
    std::optional<int> serialId;
};

// Lazily built (kind, index) -> correlation table. A miss rebuilds the whole
// table for that kind from a fresh group listing. Indices claimed by more
// than one group are never cached and fail with CorrelationConflict.
class IdentifierMapper {
public:
    using GroupSource = std::function<std::vector<rest::GroupRecord>(DeviceKind)>;

    explicit IdentifierMapper(GroupSource source);

    IdentifierCorrelation correlation(DeviceKind kind, int index);

    int restGroupFor(int index, DeviceKind kind);
    int restUnitFor(int index, DeviceKind kind);
    int restVideoFor(int index, DeviceKind kind);
    int restAudioFor(int index, DeviceKind kind);
    int restIrFor(int index, DeviceKind kind);
    int restSerialFor(int index, DeviceKind kind);

    void invalidate();
    void invalidate(DeviceKind kind);
    // Replaces the table for `kind` with one built from a listing obtained
    // elsewhere, dropping cached entries the listing contradicts.
    void reconcile(DeviceKind kind, const std::vector<rest::GroupRecord>& groups);

    std::uint64_t enumerationCount() const;
    std::optional<IdentifierCorrelation> cached(DeviceKind kind, int index) const;

private:
    struct KindTable {
        std::map<int, IdentifierCorrelation> entries;
        std::set<int> conflicts;
    };

    void rebuildLocked(DeviceKind kind, const std::vector<rest::GroupRecord>& groups);
    int required(const std::optional<int>& id, const char* resource, DeviceKind kind, int index) const;

    GroupSource source_;
    mutable std::mutex mutex_;
    std::map<DeviceKind, KindTable> tables_;
    std::uint64_t enumerations_{0};
};

}  // namespace moiplink::controller
